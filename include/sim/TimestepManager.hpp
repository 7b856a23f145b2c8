/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TIMESTEP_MANAGER_HPP
#define TIMESTEP_MANAGER_HPP

#include <cstdint>

/**
 * TimestepManager paces the duel: one variable frame step per frame and a
 * fixed physics step drained from an accumulator.
 *
 * In realtime mode frame time is measured with SDL high resolution ticks and
 * frames are paced with SDL_DelayPrecise. Otherwise every frame advances by
 * exactly 1/frameRate, so runs are reproducible.
 */
class TimestepManager {
public:
    /**
     * @param frameRate frame steps per second (e.g., 60.0f)
     * @param physicsRate physics steps per second (e.g., 50.0f)
     */
    TimestepManager(float frameRate, float physicsRate, bool realtime);

    /**
     * Call at the start of each frame.
     * @return frame delta in seconds for this frame
     */
    float startFrame();

    /**
     * Returns true while a physics step is owed for this frame.
     * May return true several times per frame, or not at all.
     */
    bool shouldPhysicsStep();

    float getPhysicsDeltaTime() const { return m_physicsStep; }

    // Fraction of the next physics step already accumulated, 0..1
    double getInterpolationAlpha() const;

    // Paces realtime runs; no-op otherwise
    void endFrame() const;

    bool isRealtime() const { return m_realtime; }
    uint64_t getFrameCount() const { return m_frameCount; }

private:
    // Spiral of death guard for slow realtime frames
    static constexpr double MAX_FRAME_DELTA{0.25};

    float m_frameStep;
    float m_physicsStep;
    bool m_realtime;

    uint64_t m_frameStartNs{0};
    uint64_t m_lastFrameNs{0};
    double m_accumulator{0.0};
    uint64_t m_frameCount{0};
};

#endif // TIMESTEP_MANAGER_HPP
