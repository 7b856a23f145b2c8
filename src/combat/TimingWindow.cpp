/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "combat/TimingWindow.hpp"
#include "core/Logger.hpp"

#include <cmath>
#include <format>

const char* toString(TimingQuality quality) {
    switch (quality) {
    case TimingQuality::Perfect: return "Perfect";
    case TimingQuality::Partial: return "Partial";
    case TimingQuality::Expired: return "Expired";
    default: return "Unknown";
    }
}

std::optional<TimingWindow> TimingWindow::create(double start, float duration,
                                                 float perfectDuration) {
    if (!std::isfinite(start) || !std::isfinite(duration) ||
        !std::isfinite(perfectDuration) || duration < 0.0f ||
        perfectDuration < 0.0f) {
        COMBAT_WARN(std::format("Rejected timing window (start {}, duration {}, perfect {})",
                                start, duration, perfectDuration));
        return std::nullopt;
    }

    if (perfectDuration > duration) {
        COMBAT_WARN(std::format("Perfect phase {} exceeds window {}, clamping",
                                perfectDuration, duration));
        perfectDuration = duration;
    }

    return TimingWindow(start, duration, perfectDuration);
}

float TimingWindow::normalized(double now) const {
    if (m_duration <= 0.0f) {
        return elapsed(now) >= 0.0 ? 1.0f : 0.0f;
    }
    return static_cast<float>(elapsed(now) / static_cast<double>(m_duration));
}
