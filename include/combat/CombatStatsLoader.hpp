/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef COMBAT_STATS_LOADER_HPP
#define COMBAT_STATS_LOADER_HPP

#include "combat/CombatStats.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace Riposte { class JsonValue; }

/**
 * @brief Reads named CombatStats profiles from JSON.
 *
 * Format:
 * @code
 * {
 *   "profiles": {
 *     "player": { "maxHealth": 120, "dodgeDistance": 4.5 },
 *     "brute":  { "base": "enemy", "maxPoise": 60 }
 *   }
 * }
 * @endcode
 *
 * Each profile starts from the player defaults, or the enemy defaults when
 * "base" is "enemy", and overrides the fields it lists. Loading is all or
 * nothing: on any error the previously loaded profiles are kept and
 * getLastError() names the offending profile and field.
 */
class CombatStatsLoader {
public:
    bool loadFromFile(const std::string& path);
    bool loadFromString(std::string_view json);

    [[nodiscard]] std::optional<CombatStats> getProfile(const std::string& name) const;
    [[nodiscard]] bool hasProfile(const std::string& name) const;
    [[nodiscard]] std::vector<std::string> getProfileNames() const;
    [[nodiscard]] size_t getProfileCount() const { return m_profiles.size(); }

    const std::string& getLastError() const { return m_lastError; }

    /**
     * @brief Range and consistency checks shared with hand-built profiles.
     * @return empty string when valid, otherwise the first problem found
     */
    static std::string validate(const CombatStats& stats);

private:
    bool loadFromRoot(const Riposte::JsonValue& root);
    bool parseProfile(const std::string& name, const Riposte::JsonValue& node,
                      CombatStats& out);
    bool fail(std::string message);

    std::unordered_map<std::string, CombatStats> m_profiles;
    std::string m_lastError;
};

#endif // COMBAT_STATS_LOADER_HPP
