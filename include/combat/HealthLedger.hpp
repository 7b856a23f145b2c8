/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef HEALTH_LEDGER_HPP
#define HEALTH_LEDGER_HPP

// Integer hit points, clamped to [0, max]
class HealthLedger {
public:
    // @throws std::invalid_argument if maxHealth <= 0
    explicit HealthLedger(int maxHealth);

    // @return negative delta actually applied (0 when already depleted)
    int applyDamage(int amount);

    // @return positive delta actually applied
    int heal(int amount);

    // Test and respawn hook; does not emit anything
    void setCurrent(int current);

    [[nodiscard]] int getCurrent() const { return m_current; }
    [[nodiscard]] int getMax() const { return m_max; }
    [[nodiscard]] bool isDepleted() const { return m_current <= 0; }
    [[nodiscard]] float getNormalized() const {
        return static_cast<float>(m_current) / static_cast<float>(m_max);
    }

private:
    int m_current;
    int m_max;
};

#endif // HEALTH_LEDGER_HPP
