/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "combat/CombatStatsLoader.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <format>
#include <limits>

namespace {

using Riposte::JsonValue;

constexpr float UNBOUNDED{std::numeric_limits<float>::max()};

struct FloatField {
    const char* name;
    float CombatStats::*member;
    float min;
    float max;
};

// Every float tunable, with the range a loaded value must fall in
constexpr std::array<FloatField, 37> FLOAT_FIELDS{{
    {"maxStamina", &CombatStats::maxStamina, 0.001f, UNBOUNDED},
    {"staminaRegenRate", &CombatStats::staminaRegenRate, 0.0f, UNBOUNDED},
    {"staminaRegenDelay", &CombatStats::staminaRegenDelay, 0.0f, UNBOUNDED},
    {"maxPoise", &CombatStats::maxPoise, 0.001f, UNBOUNDED},
    {"poiseRegenRate", &CombatStats::poiseRegenRate, 0.0f, UNBOUNDED},
    {"poiseRegenDelay", &CombatStats::poiseRegenDelay, 0.0f, UNBOUNDED},
    {"baseDamage", &CombatStats::baseDamage, 0.0f, UNBOUNDED},
    {"lightAttackMultiplier", &CombatStats::lightAttackMultiplier, 0.0f, UNBOUNDED},
    {"heavyAttackMultiplier", &CombatStats::heavyAttackMultiplier, 0.0f, UNBOUNDED},
    {"physicalDefense", &CombatStats::physicalDefense, 0.0f, 1.0f},
    {"partialParryDamageFactor", &CombatStats::partialParryDamageFactor, 0.0f, 1.0f},
    {"partialParryPoiseFactor", &CombatStats::partialParryPoiseFactor, 0.0f, 1.0f},
    {"blockDamageFactor", &CombatStats::blockDamageFactor, 0.0f, 1.0f},
    {"blockStaminaCostOnHit", &CombatStats::blockStaminaCostOnHit, 0.0f, UNBOUNDED},
    {"blockStaminaDrainPerSecond", &CombatStats::blockStaminaDrainPerSecond, 0.0f, UNBOUNDED},
    {"blockParryWindow", &CombatStats::blockParryWindow, 0.0f, UNBOUNDED},
    {"blockPerfectParryWindow", &CombatStats::blockPerfectParryWindow, 0.0f, UNBOUNDED},
    {"parryWindowDuration", &CombatStats::parryWindowDuration, 0.0f, UNBOUNDED},
    {"perfectParryWindow", &CombatStats::perfectParryWindow, 0.0f, UNBOUNDED},
    {"parryStateDuration", &CombatStats::parryStateDuration, 0.001f, UNBOUNDED},
    {"parryFailStaminaCost", &CombatStats::parryFailStaminaCost, 0.0f, UNBOUNDED},
    {"sprintStaminaPerSecond", &CombatStats::sprintStaminaPerSecond, 0.0f, UNBOUNDED},
    {"dodgeStaminaCost", &CombatStats::dodgeStaminaCost, 0.0f, UNBOUNDED},
    {"lightAttackStaminaCost", &CombatStats::lightAttackStaminaCost, 0.0f, UNBOUNDED},
    {"heavyAttackStaminaCost", &CombatStats::heavyAttackStaminaCost, 0.0f, UNBOUNDED},
    {"dodgeDuration", &CombatStats::dodgeDuration, 0.001f, UNBOUNDED},
    {"dodgeIFrameStart", &CombatStats::dodgeIFrameStart, 0.0f, 1.0f},
    {"dodgeIFrameEnd", &CombatStats::dodgeIFrameEnd, 0.0f, 1.0f},
    {"dodgeDistance", &CombatStats::dodgeDistance, 0.0f, UNBOUNDED},
    {"staggerRecoveryTime", &CombatStats::staggerRecoveryTime, 0.001f, UNBOUNDED},
    {"staggerKnockbackDistance", &CombatStats::staggerKnockbackDistance, 0.0f, UNBOUNDED},
    {"walkSpeed", &CombatStats::walkSpeed, 0.0f, UNBOUNDED},
    {"moveSpeed", &CombatStats::moveSpeed, 0.0f, UNBOUNDED},
    {"sprintMultiplier", &CombatStats::sprintMultiplier, 1.0f, UNBOUNDED},
    {"inputBufferWindow", &CombatStats::inputBufferWindow, 0.0f, 1.0f},
    {"alertDuration", &CombatStats::alertDuration, 0.0f, UNBOUNDED},
    {"attackRange", &CombatStats::attackRange, 0.0f, UNBOUNDED},
}};

std::string checkRange(const FloatField& field, float value) {
    if (!std::isfinite(value)) {
        return std::format("{} is not finite", field.name);
    }
    if (value < field.min || value > field.max) {
        if (field.max == UNBOUNDED) {
            return std::format("{} = {} is below {}", field.name, value, field.min);
        }
        return std::format("{} = {} is outside [{}, {}]", field.name, value, field.min,
                           field.max);
    }
    return {};
}

} // namespace

bool CombatStatsLoader::loadFromFile(const std::string& path) {
    Riposte::JsonReader reader;
    if (!reader.loadFromFile(path)) {
        return fail(reader.getLastError());
    }
    if (!loadFromRoot(reader.getRoot())) {
        m_lastError = path + ": " + m_lastError;
        return false;
    }
    CONFIG_INFO(std::format("Loaded {} combat profiles from {}", m_profiles.size(), path));
    return true;
}

bool CombatStatsLoader::loadFromString(std::string_view json) {
    Riposte::JsonReader reader;
    if (!reader.parse(json)) {
        return fail(reader.getLastError());
    }
    return loadFromRoot(reader.getRoot());
}

std::optional<CombatStats> CombatStatsLoader::getProfile(const std::string& name) const {
    auto it = m_profiles.find(name);
    if (it == m_profiles.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool CombatStatsLoader::hasProfile(const std::string& name) const {
    return m_profiles.find(name) != m_profiles.end();
}

std::vector<std::string> CombatStatsLoader::getProfileNames() const {
    std::vector<std::string> names;
    names.reserve(m_profiles.size());
    for (const auto& [name, stats] : m_profiles) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::string CombatStatsLoader::validate(const CombatStats& stats) {
    if (stats.maxHealth <= 0) {
        return std::format("maxHealth = {} must be positive", stats.maxHealth);
    }
    for (const FloatField& field : FLOAT_FIELDS) {
        std::string problem = checkRange(field, stats.*field.member);
        if (!problem.empty()) {
            return problem;
        }
    }
    if (stats.perfectParryWindow > stats.parryWindowDuration) {
        return "perfectParryWindow exceeds parryWindowDuration";
    }
    if (stats.blockPerfectParryWindow > stats.blockParryWindow) {
        return "blockPerfectParryWindow exceeds blockParryWindow";
    }
    if (stats.dodgeIFrameStart > stats.dodgeIFrameEnd) {
        return "dodgeIFrameStart is after dodgeIFrameEnd";
    }
    return {};
}

bool CombatStatsLoader::loadFromRoot(const JsonValue& root) {
    const JsonValue* profilesNode = root.find("profiles");
    if (profilesNode == nullptr || !profilesNode->isObject()) {
        return fail("missing \"profiles\" object");
    }

    std::unordered_map<std::string, CombatStats> loaded;
    for (const auto& [name, node] : *profilesNode->tryAsObject()) {
        CombatStats stats;
        if (!parseProfile(name, node, stats)) {
            return false;
        }
        loaded.emplace(name, stats);
    }

    m_profiles = std::move(loaded);
    m_lastError.clear();
    return true;
}

bool CombatStatsLoader::parseProfile(const std::string& name, const JsonValue& node,
                                     CombatStats& out) {
    const Riposte::JsonObject* object = node.tryAsObject();
    if (object == nullptr) {
        return fail(std::format("profile \"{}\" is not an object", name));
    }

    out = CombatStats::createDefaultPlayer();
    if (const JsonValue* base = node.find("base")) {
        const auto baseName = base->tryAsString();
        if (baseName == "enemy") {
            out = CombatStats::createDefaultEnemy();
        } else if (baseName != "player") {
            return fail(std::format("profile \"{}\": base must be \"player\" or \"enemy\"", name));
        }
    }

    for (const auto& [key, value] : *object) {
        if (key == "base") {
            continue;
        }
        if (key == "maxHealth") {
            const auto health = value.tryAsInt();
            if (!health) {
                return fail(std::format("profile \"{}\": maxHealth must be an integer", name));
            }
            out.maxHealth = *health;
            continue;
        }

        auto field = std::find_if(FLOAT_FIELDS.begin(), FLOAT_FIELDS.end(),
                                  [&key](const FloatField& f) { return key == f.name; });
        if (field == FLOAT_FIELDS.end()) {
            CONFIG_WARN(std::format("profile \"{}\": unknown field \"{}\" ignored", name, key));
            continue;
        }
        const auto number = value.tryAsNumber();
        if (!number) {
            return fail(std::format("profile \"{}\": {} must be a number, got {}", name, key,
                                    Riposte::toString(value.getType())));
        }
        out.*field->member = static_cast<float>(*number);
    }

    const std::string problem = validate(out);
    if (!problem.empty()) {
        return fail(std::format("profile \"{}\": {}", name, problem));
    }
    return true;
}

bool CombatStatsLoader::fail(std::string message) {
    m_lastError = std::move(message);
    CONFIG_ERROR(m_lastError);
    return false;
}
