/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef DUEL_RUNNER_HPP
#define DUEL_RUNNER_HPP

#include "combat/CombatStats.hpp"
#include "core/SimClock.hpp"
#include "entities/NPC.hpp"
#include "entities/Player.hpp"
#include "events/CombatEventHub.hpp"
#include "sim/Duelist.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

struct DuelConfig {
    CombatStats playerStats{CombatStats::createDefaultPlayer()};
    CombatStats enemyStats{CombatStats::createDefaultEnemy()};
    float durationSeconds{30.0f};
    float frameRate{60.0f};
    float physicsRate{50.0f};
    float startDistance{4.0f};
    bool realtime{false};
};

struct DuelistTally {
    uint32_t hitsTaken{0};
    uint32_t hitsParried{0};
    uint32_t hitsDodged{0};
    uint32_t hitsBlocked{0};
    uint32_t poiseBreaks{0};
    int damageTaken{0};
    int finalHealth{0};
    bool died{false};
};

struct DuelSummary {
    DuelistTally player;
    DuelistTally enemy;
    double elapsed{0.0};
    std::string winner{"none"};
};

/**
 * @brief Runs a scripted player against a scripted NPC.
 *
 * Owns the shared clock and both combatants. The driver calls frameUpdate()
 * once per frame and physicsUpdate() for every owed physics step. Hit
 * detection is a range and facing test against the attacker's active frames,
 * one hit per swing.
 */
class DuelRunner {
public:
    static constexpr ActorId PLAYER_ID{1};
    static constexpr ActorId ENEMY_ID{2};
    // cos(60 deg): targets must sit inside the front cone
    static constexpr float HIT_CONE_DOT{0.5f};
    static constexpr float DETECTION_RANGE{12.0f};

    explicit DuelRunner(const DuelConfig& config);

    DuelRunner(const DuelRunner&) = delete;
    DuelRunner& operator=(const DuelRunner&) = delete;

    // Advances the clock, refreshes perception and input, then updates both actors
    bool frameUpdate(float deltaTime);
    void physicsUpdate(float fixedDeltaTime);

    [[nodiscard]] bool isFinished() const;
    [[nodiscard]] DuelSummary getSummary() const;

    [[nodiscard]] const Riposte::SimClock& getClock() const { return m_clock; }
    Player& getPlayer() { return m_player; }
    NPC& getNPC() { return m_npc; }

private:
    void subscribe(Combatant& combatant, DuelistTally& tally);
    void detectHit(Combatant& attacker, Combatant& defender, uint32_t& lastHitSwing);
    void updatePerception();

    DuelConfig m_config;
    Riposte::SimClock m_clock;
    Player m_player;
    NPC m_npc;
    Duelist m_playerBrain;

    DuelistTally m_playerTally;
    DuelistTally m_enemyTally;
    std::vector<ScopedCombatSubscription> m_subscriptions;

    uint32_t m_playerLastHitSwing{0};
    uint32_t m_enemyLastHitSwing{0};
};

#endif // DUEL_RUNNER_HPP
