/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef STAMINA_LEDGER_HPP
#define STAMINA_LEDGER_HPP

/**
 * @brief Per-actor stamina pool with a regeneration delay.
 *
 * Every spend resets the delay timer; regeneration resumes only once the
 * timer has run out, at regenRate per second, clamped at max.
 */
class StaminaLedger {
public:
    /**
     * @throws std::invalid_argument if maxStamina is not positive or rates are
     *         negative/non-finite
     */
    StaminaLedger(float maxStamina, float regenRate, float regenDelay);

    /**
     * @brief Gated spend: deducts only if current >= amount.
     *
     * Zero cost always succeeds without deducting or touching the regen delay.
     * Negative or non-finite amounts are rejected.
     */
    bool tryConsume(float amount);

    /**
     * @brief Forced spend (block impact, failed parry). Clamps at zero.
     * @return amount actually removed
     */
    float drain(float amount);

    // Per-second drain for sustained actions (sprint, held guard)
    float drainContinuous(float ratePerSecond, float deltaTime);

    void restore(float amount);
    void reset();

    void tick(float deltaTime);

    void setRegenRateMultiplier(float multiplier);

    [[nodiscard]] bool canAfford(float amount) const { return m_current >= amount; }
    [[nodiscard]] bool isEmpty() const { return m_current <= 0.0f; }
    [[nodiscard]] float getCurrent() const { return m_current; }
    [[nodiscard]] float getMax() const { return m_max; }
    [[nodiscard]] float getNormalized() const { return m_current / m_max; }
    [[nodiscard]] float getRegenDelayRemaining() const { return m_delayRemaining; }

private:
    float m_current;
    float m_max;
    float m_regenRate;
    float m_regenDelay;
    float m_delayRemaining{0.0f};
    float m_regenMultiplier{1.0f};
};

#endif // STAMINA_LEDGER_HPP
