/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "combat/CombatStatsLoader.hpp"
#include "core/Logger.hpp"
#include "sim/DuelRunner.hpp"
#include "sim/TimestepManager.hpp"

#include <SDL3/SDL.h>

#include <charconv>
#include <cmath>
#include <cstdio>
#include <format>
#include <string>
#include <string_view>

namespace {

const std::string APP_NAME{"Riposte Duel"};
const std::string DEFAULT_CONFIG{"res/data/combat_stats.json"};

struct Options {
    std::string configPath{DEFAULT_CONFIG};
    std::string playerProfile{"player"};
    std::string enemyProfile{"enemy"};
    float seconds{30.0f};
    bool realtime{false};
    bool quiet{false};
};

void printUsage(const char* program) {
    std::printf("Usage: %s [--config <file>] [--player <profile>] [--enemy <profile>]\n"
                "          [--seconds <n>] [--realtime] [--quiet]\n",
                program);
}

bool parseSeconds(std::string_view text, float& out) {
    float value = 0.0f;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || !std::isfinite(value) ||
        value <= 0.0f) {
        return false;
    }
    out = value;
    return true;
}

bool parseOptions(int argc, char* argv[], Options& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg{argv[i]};
        const bool hasValue = i + 1 < argc;

        if (arg == "--realtime") {
            options.realtime = true;
        } else if (arg == "--quiet") {
            options.quiet = true;
        } else if (arg == "--config" && hasValue) {
            options.configPath = argv[++i];
        } else if (arg == "--player" && hasValue) {
            options.playerProfile = argv[++i];
        } else if (arg == "--enemy" && hasValue) {
            options.enemyProfile = argv[++i];
        } else if (arg == "--seconds" && hasValue) {
            if (!parseSeconds(argv[++i], options.seconds)) {
                SIM_CRITICAL(std::format("Invalid --seconds value '{}'", argv[i]));
                return false;
            }
        } else {
            SIM_CRITICAL(std::format("Unknown or incomplete argument '{}'", arg));
            return false;
        }
    }
    return true;
}

void printTally(const char* label, const DuelistTally& tally) {
    std::printf("  %-7s health %4d  taken %3u hits / %4d dmg  parried %u  dodged %u  "
                "blocked %u  poise breaks %u%s\n",
                label, tally.finalHealth, tally.hitsTaken, tally.damageTaken, tally.hitsParried,
                tally.hitsDodged, tally.hitsBlocked, tally.poiseBreaks,
                tally.died ? "  (dead)" : "");
}

} // namespace

int main(int argc, char* argv[]) {
    Options options;
    if (!parseOptions(argc, argv, options)) {
        printUsage(argv[0]);
        return 1;
    }

    // Timer only: the duel is headless
    if (!SDL_Init(0)) {
        SIM_CRITICAL(std::format("SDL_Init failed: {}", SDL_GetError()));
        return 1;
    }

    if (char* prefPath = SDL_GetPrefPath("HammerForgedGames", "Riposte")) {
        Riposte::Logger::SetLogDirectory(prefPath);
        SDL_free(prefPath);
    }
    Riposte::Logger::SetQuiet(options.quiet);

    SIM_INFO(std::format("Initializing {}", APP_NAME));

    CombatStatsLoader loader;
    if (!loader.loadFromFile(options.configPath)) {
        SIM_CRITICAL(std::format("Failed to load combat stats: {}", loader.getLastError()));
        SDL_Quit();
        return 1;
    }

    auto playerStats = loader.getProfile(options.playerProfile);
    auto enemyStats = loader.getProfile(options.enemyProfile);
    if (!playerStats || !enemyStats) {
        SIM_CRITICAL(std::format("Missing profile '{}' or '{}' in {}", options.playerProfile,
                                 options.enemyProfile, options.configPath));
        SDL_Quit();
        return 1;
    }

    DuelConfig config;
    config.playerStats = *playerStats;
    config.enemyStats = *enemyStats;
    config.durationSeconds = options.seconds;
    config.realtime = options.realtime;

    DuelRunner duel(config);
    TimestepManager ts(config.frameRate, config.physicsRate, config.realtime);
    Riposte::Logger::SetTimeSource(&duel.getClock());

    SIM_INFO("Starting duel loop");

    // Frame update first, then drain owed physics steps
    while (!duel.isFinished()) {
        const float deltaTime = ts.startFrame();
        if (!duel.frameUpdate(deltaTime)) {
            SIM_CRITICAL("Duel aborted on an invalid frame step");
            Riposte::Logger::SetTimeSource(nullptr);
            SDL_Quit();
            return 1;
        }
        while (ts.shouldPhysicsStep()) {
            duel.physicsUpdate(ts.getPhysicsDeltaTime());
        }
        ts.endFrame();
    }
    Riposte::Logger::SetTimeSource(nullptr);

    const DuelSummary summary = duel.getSummary();
    std::printf("%s: %.2fs over %llu frames, winner: %s\n", APP_NAME.c_str(), summary.elapsed,
                static_cast<unsigned long long>(ts.getFrameCount()), summary.winner.c_str());
    printTally("player", summary.player);
    printTally("enemy", summary.enemy);

    SIM_INFO(std::format("{} shutting down", APP_NAME));
    SDL_Quit();
    return 0;
}
