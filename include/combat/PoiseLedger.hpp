/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef POISE_LEDGER_HPP
#define POISE_LEDGER_HPP

#include <cstdint>
#include <optional>

namespace Riposte { class SimClock; }

struct PoiseHitResult {
    float applied{0.0f};   // amount actually added after clamping
    bool broke{false};     // running total reached max; ledger already reset
};

/**
 * @brief Per-actor poise damage accumulator.
 *
 * Damage accumulates toward max poise. Reaching max breaks poise and resets
 * the total to zero inside the same call, so callers never see a post-break
 * value above zero. Without hits for the grace window, accumulated damage
 * decays at a fixed rate per second.
 */
class PoiseLedger {
public:
    static constexpr float DANGER_ZONE_THRESHOLD{0.7f};

    /**
     * @throws std::invalid_argument if maxPoise is not positive or rates are
     *         negative/non-finite
     */
    PoiseLedger(const Riposte::SimClock& clock, float maxPoise, float decayRate,
                float graceWindow);

    PoiseHitResult applyPoiseDamage(float amount);

    // Stagger-recovery completion. Idempotent.
    void resetPoise();

    // Breaks regardless of the current total (special attacks). Always resets.
    void forceBreak();

    void tick(float deltaTime);

    [[nodiscard]] bool wouldBreak(float amount) const;
    [[nodiscard]] bool isInDangerZone() const;

    [[nodiscard]] float getCurrent() const { return m_current; }
    [[nodiscard]] float getMax() const { return m_max; }
    [[nodiscard]] float getNormalized() const { return m_current / m_max; }
    [[nodiscard]] std::optional<double> getLastHitTime() const { return m_lastHitTime; }
    [[nodiscard]] uint32_t getBreakCount() const { return m_breakCount; }

private:
    const Riposte::SimClock& m_clock;
    float m_current{0.0f};
    float m_max;
    float m_decayRate;
    float m_graceWindow;
    std::optional<double> m_lastHitTime;
    uint32_t m_breakCount{0};
};

#endif // POISE_LEDGER_HPP
