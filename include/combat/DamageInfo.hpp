/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef DAMAGE_INFO_HPP
#define DAMAGE_INFO_HPP

#include "combat/CombatTypes.hpp"
#include "utils/Vector3D.hpp"

#include <cstdint>
#include <optional>

enum class DamageType : uint8_t {
    Physical = 0
};

/**
 * @brief Immutable description of one incoming hit.
 *
 * Only obtainable through the validating factories, so every instance holds
 * a positive finite amount, non-negative poise damage and finite vectors with
 * a unit (or zero) hit direction.
 */
class DamageInfo {
public:
    static std::optional<DamageInfo> create(float amount, float poiseDamage,
                                            DamageType type,
                                            std::optional<ActorId> source,
                                            const Vector3D& hitPoint,
                                            const Vector3D& hitDirection,
                                            bool canBeParried, double timestamp);

    static std::optional<DamageInfo> physical(float amount, float poiseDamage,
                                              std::optional<ActorId> source,
                                              const Vector3D& hitPoint,
                                              const Vector3D& hitDirection,
                                              double timestamp);

    // Cannot be parried or blocked; i-frames still apply
    static std::optional<DamageInfo> unblockable(float amount, float poiseDamage,
                                                 std::optional<ActorId> source,
                                                 const Vector3D& hitPoint,
                                                 const Vector3D& hitDirection,
                                                 double timestamp);

    [[nodiscard]] float getAmount() const { return m_amount; }
    [[nodiscard]] float getPoiseDamage() const { return m_poiseDamage; }
    [[nodiscard]] DamageType getType() const { return m_type; }
    [[nodiscard]] std::optional<ActorId> getSource() const { return m_source; }
    [[nodiscard]] const Vector3D& getHitPoint() const { return m_hitPoint; }
    [[nodiscard]] const Vector3D& getHitDirection() const { return m_hitDirection; }
    [[nodiscard]] bool canBeParried() const { return m_canBeParried; }
    [[nodiscard]] bool canBeBlocked() const { return m_canBeBlocked; }
    [[nodiscard]] double getTimestamp() const { return m_timestamp; }

private:
    DamageInfo() = default;

    float m_amount{0.0f};
    float m_poiseDamage{0.0f};
    DamageType m_type{DamageType::Physical};
    std::optional<ActorId> m_source;
    Vector3D m_hitPoint;
    Vector3D m_hitDirection;
    bool m_canBeParried{true};
    bool m_canBeBlocked{true};
    double m_timestamp{0.0};
};

struct DamageResult {
    int finalDamage{0};
    float finalPoiseDamage{0.0f};
    bool parried{false};
    bool partiallyParried{false};
    bool dodged{false};
    bool blocked{false};
    bool poiseBroken{false};
    bool causedDeath{false};

    [[nodiscard]] bool wasDefended() const { return parried || dodged || blocked; }
    [[nodiscard]] bool noDamageTaken() const { return finalDamage <= 0; }
};

#endif // DAMAGE_INFO_HPP
