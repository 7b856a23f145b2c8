/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "combat/DecayCurve.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <span>

namespace {

struct Keyframe {
    float time;
    float value;
};

constexpr std::array<Keyframe, 3> IMPULSE_KEYS{{{0.0f, 1.0f}, {0.5f, 0.3f}, {1.0f, 0.0f}}};
constexpr std::array<Keyframe, 4> KNOCKBACK_KEYS{
    {{0.0f, 1.0f}, {0.2f, 0.8f}, {0.5f, 0.2f}, {1.0f, 0.0f}}};

float sampleKeys(std::span<const Keyframe> keys, float t) {
    if (t <= keys.front().time) {
        return keys.front().value;
    }
    for (size_t i = 1; i < keys.size(); ++i) {
        const Keyframe& a = keys[i - 1];
        const Keyframe& b = keys[i];
        if (t <= b.time) {
            const float span = b.time - a.time;
            const float alpha = span > 0.0f ? (t - a.time) / span : 1.0f;
            return a.value + (b.value - a.value) * alpha;
        }
    }
    return keys.back().value;
}

} // anonymous namespace

float evaluateDecay(DecayCurve curve, float normalizedTime) {
    const float t = std::isfinite(normalizedTime) ? std::clamp(normalizedTime, 0.0f, 1.0f)
                                                  : 1.0f;
    switch (curve) {
    case DecayCurve::Constant:
        return 1.0f;
    case DecayCurve::Linear:
        return 1.0f - t;
    case DecayCurve::DefaultImpulse:
        return sampleKeys(IMPULSE_KEYS, t);
    case DecayCurve::Knockback:
        return sampleKeys(KNOCKBACK_KEYS, t);
    default:
        return 1.0f;
    }
}
