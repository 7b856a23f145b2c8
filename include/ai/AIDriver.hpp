/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef AI_DRIVER_HPP
#define AI_DRIVER_HPP

#include "utils/Vector3D.hpp"

#include <string>

class NPC;

/**
 * @brief What an NPC knows about its target this frame.
 *
 * Filled in by whoever owns perception (the sim, a game's sensing layer) and
 * read by NPC states; the core never computes it.
 */
struct AIPerception {
    bool targetDetected{false};
    float distanceToTarget{0.0f};
    Vector3D directionToTarget;   // unit, planar; zero when undetected
};

/**
 * @brief Contract an AI decision layer must satisfy to drive an NPC.
 *
 * A driver only talks to the NPC through its public surface: requestAction()
 * to buffer intents and setControlInput() for held input (block). It never
 * forces transitions; the NPC's states decide what the intents turn into.
 */
class IAIDriver {
public:
    virtual ~IAIDriver() = default;

    // Called once per frame, before the NPC's update()
    virtual void think(NPC& npc, const AIPerception& perception, float deltaTime) = 0;

    [[nodiscard]] virtual std::string getName() const = 0;
};

#endif // AI_DRIVER_HPP
