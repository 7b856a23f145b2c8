/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef DECAY_CURVE_HPP
#define DECAY_CURVE_HPP

#include <cstdint>

// Magnitude multipliers over a force's normalized lifetime
enum class DecayCurve : uint8_t {
    Constant,        // 1 for the whole lifetime
    Linear,          // 1 -> 0
    DefaultImpulse,  // 1 -> 0.3 at 50% -> 0
    Knockback        // 1 -> 0.8 at 20% -> 0.2 at 50% -> 0
};

/**
 * @brief Samples a curve with piecewise-linear interpolation.
 * @param normalizedTime clamped to [0, 1]
 */
float evaluateDecay(DecayCurve curve, float normalizedTime);

#endif // DECAY_CURVE_HPP
