/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SIM_CLOCK_HPP
#define SIM_CLOCK_HPP

namespace Riposte {

/**
 * @brief Simulation time source shared by one actor collection.
 *
 * The driver advances the clock once per frame before any actor updates.
 * Components that timestamp (intent buffer, poise ledger, parry windows) hold
 * a const reference to it, so all of them agree on "now" within a frame.
 */
class SimClock {
public:
    SimClock() = default;
    explicit SimClock(double startTime);

    SimClock(const SimClock&) = delete;
    SimClock& operator=(const SimClock&) = delete;

    /**
     * @brief Advances simulation time.
     * @param deltaTime seconds, must be finite and non-negative
     * @return false when deltaTime is rejected
     */
    bool advance(float deltaTime);

    [[nodiscard]] double now() const { return m_now; }
    [[nodiscard]] float getLastDeltaTime() const { return m_lastDelta; }
    [[nodiscard]] unsigned long long getFrameCount() const { return m_frameCount; }

    void reset(double startTime = 0.0);

private:
    double m_now{0.0};
    float m_lastDelta{0.0f};
    unsigned long long m_frameCount{0};
};

} // namespace Riposte

#endif // SIM_CLOCK_HPP
