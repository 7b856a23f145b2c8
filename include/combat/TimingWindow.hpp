/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TIMING_WINDOW_HPP
#define TIMING_WINDOW_HPP

#include <cstdint>
#include <optional>
#include <ostream>

enum class TimingQuality : uint8_t {
    Perfect,
    Partial,
    Expired
};

const char* toString(TimingQuality quality);

// Stream operator for Boost.Test
inline std::ostream& operator<<(std::ostream& os, TimingQuality quality) {
    return os << toString(quality);
}

/**
 * @brief Grades an action against a window opened at windowStart.
 *
 * Perfect while elapsed <= perfectDuration, Partial while elapsed <= duration,
 * Expired afterwards. A window that has not opened yet is Expired.
 * Pure function: no state, safe to call any number of times per frame.
 */
constexpr TimingQuality evaluateTiming(double windowStart, float duration,
                                       float perfectDuration, double now) noexcept {
    const double elapsed = now - windowStart;
    if (elapsed < 0.0) {
        return TimingQuality::Expired;
    }
    if (elapsed <= static_cast<double>(perfectDuration)) {
        return TimingQuality::Perfect;
    }
    if (elapsed <= static_cast<double>(duration)) {
        return TimingQuality::Partial;
    }
    return TimingQuality::Expired;
}

/**
 * @brief Parry/deflect window: start, total duration and perfect phase.
 *
 * Only the three inputs are stored; elapsed, normalized position and quality
 * are always derived from the current time.
 */
class TimingWindow {
public:
    /**
     * @brief Validated construction.
     *
     * Rejects non-finite or negative values. A perfect phase longer than the
     * window is clamped to the window duration.
     */
    static std::optional<TimingWindow> create(double start, float duration,
                                              float perfectDuration);

    [[nodiscard]] double getStart() const { return m_start; }
    [[nodiscard]] float getDuration() const { return m_duration; }
    [[nodiscard]] float getPerfectDuration() const { return m_perfectDuration; }

    [[nodiscard]] double elapsed(double now) const { return now - m_start; }

    // 0 at open, 1 at close; not clamped
    [[nodiscard]] float normalized(double now) const;

    [[nodiscard]] TimingQuality evaluate(double now) const {
        return evaluateTiming(m_start, m_duration, m_perfectDuration, now);
    }

    [[nodiscard]] bool isExpired(double now) const {
        return evaluate(now) == TimingQuality::Expired;
    }

private:
    TimingWindow(double start, float duration, float perfectDuration)
        : m_start(start), m_duration(duration), m_perfectDuration(perfectDuration) {}

    double m_start;
    float m_duration;
    float m_perfectDuration;
};

#endif // TIMING_WINDOW_HPP
