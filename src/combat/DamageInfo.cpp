/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "combat/DamageInfo.hpp"
#include "core/Logger.hpp"

#include <cmath>
#include <format>

std::optional<DamageInfo> DamageInfo::create(float amount, float poiseDamage,
                                             DamageType type,
                                             std::optional<ActorId> source,
                                             const Vector3D& hitPoint,
                                             const Vector3D& hitDirection,
                                             bool canBeParried, double timestamp) {
    if (!std::isfinite(amount) || amount <= 0.0f) {
        COMBAT_WARN(std::format("Rejected damage amount {}", amount));
        return std::nullopt;
    }
    if (!std::isfinite(poiseDamage) || poiseDamage < 0.0f) {
        COMBAT_WARN(std::format("Rejected poise damage {}", poiseDamage));
        return std::nullopt;
    }
    if (!hitPoint.isFinite() || !hitDirection.isFinite() || !std::isfinite(timestamp)) {
        COMBAT_WARN("Rejected damage with non-finite hit point, direction or timestamp");
        return std::nullopt;
    }

    DamageInfo info;
    info.m_amount = amount;
    info.m_poiseDamage = poiseDamage;
    info.m_type = type;
    info.m_source = source;
    info.m_hitPoint = hitPoint;
    info.m_hitDirection = hitDirection.normalized();
    info.m_canBeParried = canBeParried;
    info.m_timestamp = timestamp;
    return info;
}

std::optional<DamageInfo> DamageInfo::physical(float amount, float poiseDamage,
                                               std::optional<ActorId> source,
                                               const Vector3D& hitPoint,
                                               const Vector3D& hitDirection,
                                               double timestamp) {
    return create(amount, poiseDamage, DamageType::Physical, source, hitPoint,
                  hitDirection, true, timestamp);
}

std::optional<DamageInfo> DamageInfo::unblockable(float amount, float poiseDamage,
                                                  std::optional<ActorId> source,
                                                  const Vector3D& hitPoint,
                                                  const Vector3D& hitDirection,
                                                  double timestamp) {
    auto info = create(amount, poiseDamage, DamageType::Physical, source, hitPoint,
                       hitDirection, false, timestamp);
    if (info) {
        info->m_canBeBlocked = false;
    }
    return info;
}
