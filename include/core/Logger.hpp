/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include "core/SimClock.hpp"

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <format>
#include <mutex>
#include <string>

namespace Riposte {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs (even in release)
  ERROR_LEVEL = 1,  // Always logs (renamed to avoid macro conflicts)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

namespace detail {

inline std::atomic<bool> g_logQuiet{false};
inline std::atomic<const SimClock *> g_logTimeSource{nullptr};

/**
 * @brief Builds one log line, prefixed with simulation time when a clock is
 * registered.
 *
 * "Riposte - [t=12.350 f=741] [CombatResolver] DEBUG: ..." lets a combat log
 * be lined up against the frame that produced it.
 */
inline std::string formatLogLine(const char *level, const char *system,
                                 const char *message) {
  const SimClock *clock = g_logTimeSource.load(std::memory_order_acquire);
  if (clock == nullptr) {
    return std::format("Riposte - [{}] {}: {}", system, level, message);
  }
  return std::format("Riposte - [t={:.3f} f={}] [{}] {}: {}", clock->now(),
                     clock->getFrameCount(), system, level, message);
}

constexpr const char *levelName(LogLevel level) {
  switch (level) {
  case LogLevel::CRITICAL:
    return "CRITICAL";
  case LogLevel::ERROR_LEVEL:
    return "ERROR";
  case LogLevel::WARNING:
    return "WARNING";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::DEBUG_LEVEL:
    return "DEBUG";
  default:
    return "UNKNOWN";
  }
}

} // namespace detail

class Logger {
public:
  // Silences every level, CRITICAL included (batch runs, benchmarks)
  static void SetQuiet(bool enabled) {
    detail::g_logQuiet.store(enabled, std::memory_order_relaxed);
  }

  static bool IsQuiet() {
    return detail::g_logQuiet.load(std::memory_order_relaxed);
  }

  /**
   * @brief Registers the clock whose time stamps each line.
   *
   * The clock must outlive the registration; pass nullptr before destroying
   * it. Only one clock is stamped even when several duels run.
   */
  static void SetTimeSource(const SimClock *clock) {
    detail::g_logTimeSource.store(clock, std::memory_order_release);
  }

#ifdef DEBUG
  // Debug builds always log to the console; the directory is ignored
  static void SetLogDirectory(const std::string &) {}

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (IsQuiet()) {
      return;
    }
    const std::string line =
        detail::formatLogLine(detail::levelName(level), system, message);

    std::lock_guard<std::mutex> lock(s_consoleMutex);
    std::fputs(line.c_str(), stdout);
    std::fputc('\n', stdout);
    std::fflush(stdout);
  }

private:
  static inline std::mutex s_consoleMutex{};
#else
  /**
   * @brief Directory that receives riposte_*.log session files.
   *
   * Must be set before the first message is logged. Without a directory,
   * release messages go to stderr.
   */
  static void SetLogDirectory(const std::string &directory);

  // Defined in Logger.cpp
  static void Log(LogLevel level, const char *system,
                  const std::string &message);
  static void Log(LogLevel level, const char *system, const char *message);
#endif
};

#define RIPOSTE_CRITICAL(system, msg)                                          \
  Riposte::Logger::Log(Riposte::LogLevel::CRITICAL, system, msg)
#define RIPOSTE_ERROR(system, msg)                                             \
  Riposte::Logger::Log(Riposte::LogLevel::ERROR_LEVEL, system, msg)

#ifdef DEBUG
#define RIPOSTE_WARN(system, msg)                                              \
  Riposte::Logger::Log(Riposte::LogLevel::WARNING, system, msg)
#define RIPOSTE_INFO(system, msg)                                              \
  Riposte::Logger::Log(Riposte::LogLevel::INFO, system, msg)
#define RIPOSTE_DEBUG(system, msg)                                             \
  Riposte::Logger::Log(Riposte::LogLevel::DEBUG_LEVEL, system, msg)
#else
// Release builds keep CRITICAL and ERROR only
#define RIPOSTE_WARN(system, msg) ((void)0)
#define RIPOSTE_INFO(system, msg) ((void)0)
#define RIPOSTE_DEBUG(system, msg) ((void)0)
#endif

// Convenience macros for each combat system

#define STATEMACHINE_CRITICAL(msg) RIPOSTE_CRITICAL("StateMachine", msg)
#define STATEMACHINE_ERROR(msg) RIPOSTE_ERROR("StateMachine", msg)
#define STATEMACHINE_WARN(msg) RIPOSTE_WARN("StateMachine", msg)
#define STATEMACHINE_INFO(msg) RIPOSTE_INFO("StateMachine", msg)
#define STATEMACHINE_DEBUG(msg) RIPOSTE_DEBUG("StateMachine", msg)

#define COMBAT_CRITICAL(msg) RIPOSTE_CRITICAL("CombatResolver", msg)
#define COMBAT_ERROR(msg) RIPOSTE_ERROR("CombatResolver", msg)
#define COMBAT_WARN(msg) RIPOSTE_WARN("CombatResolver", msg)
#define COMBAT_INFO(msg) RIPOSTE_INFO("CombatResolver", msg)
#define COMBAT_DEBUG(msg) RIPOSTE_DEBUG("CombatResolver", msg)

#define INTENT_CRITICAL(msg) RIPOSTE_CRITICAL("IntentBuffer", msg)
#define INTENT_ERROR(msg) RIPOSTE_ERROR("IntentBuffer", msg)
#define INTENT_WARN(msg) RIPOSTE_WARN("IntentBuffer", msg)
#define INTENT_INFO(msg) RIPOSTE_INFO("IntentBuffer", msg)
#define INTENT_DEBUG(msg) RIPOSTE_DEBUG("IntentBuffer", msg)

#define POISE_CRITICAL(msg) RIPOSTE_CRITICAL("PoiseLedger", msg)
#define POISE_ERROR(msg) RIPOSTE_ERROR("PoiseLedger", msg)
#define POISE_WARN(msg) RIPOSTE_WARN("PoiseLedger", msg)
#define POISE_INFO(msg) RIPOSTE_INFO("PoiseLedger", msg)
#define POISE_DEBUG(msg) RIPOSTE_DEBUG("PoiseLedger", msg)

#define STAMINA_CRITICAL(msg) RIPOSTE_CRITICAL("StaminaLedger", msg)
#define STAMINA_ERROR(msg) RIPOSTE_ERROR("StaminaLedger", msg)
#define STAMINA_WARN(msg) RIPOSTE_WARN("StaminaLedger", msg)
#define STAMINA_INFO(msg) RIPOSTE_INFO("StaminaLedger", msg)
#define STAMINA_DEBUG(msg) RIPOSTE_DEBUG("StaminaLedger", msg)

#define HEALTH_CRITICAL(msg) RIPOSTE_CRITICAL("HealthLedger", msg)
#define HEALTH_ERROR(msg) RIPOSTE_ERROR("HealthLedger", msg)
#define HEALTH_WARN(msg) RIPOSTE_WARN("HealthLedger", msg)
#define HEALTH_INFO(msg) RIPOSTE_INFO("HealthLedger", msg)
#define HEALTH_DEBUG(msg) RIPOSTE_DEBUG("HealthLedger", msg)

#define FORCES_CRITICAL(msg) RIPOSTE_CRITICAL("ExternalForces", msg)
#define FORCES_ERROR(msg) RIPOSTE_ERROR("ExternalForces", msg)
#define FORCES_WARN(msg) RIPOSTE_WARN("ExternalForces", msg)
#define FORCES_INFO(msg) RIPOSTE_INFO("ExternalForces", msg)
#define FORCES_DEBUG(msg) RIPOSTE_DEBUG("ExternalForces", msg)

#define EVENTS_CRITICAL(msg) RIPOSTE_CRITICAL("CombatEventHub", msg)
#define EVENTS_ERROR(msg) RIPOSTE_ERROR("CombatEventHub", msg)
#define EVENTS_WARN(msg) RIPOSTE_WARN("CombatEventHub", msg)
#define EVENTS_INFO(msg) RIPOSTE_INFO("CombatEventHub", msg)
#define EVENTS_DEBUG(msg) RIPOSTE_DEBUG("CombatEventHub", msg)

#define CONFIG_CRITICAL(msg) RIPOSTE_CRITICAL("CombatConfig", msg)
#define CONFIG_ERROR(msg) RIPOSTE_ERROR("CombatConfig", msg)
#define CONFIG_WARN(msg) RIPOSTE_WARN("CombatConfig", msg)
#define CONFIG_INFO(msg) RIPOSTE_INFO("CombatConfig", msg)
#define CONFIG_DEBUG(msg) RIPOSTE_DEBUG("CombatConfig", msg)

#define ACTOR_CRITICAL(msg) RIPOSTE_CRITICAL("CombatActor", msg)
#define ACTOR_ERROR(msg) RIPOSTE_ERROR("CombatActor", msg)
#define ACTOR_WARN(msg) RIPOSTE_WARN("CombatActor", msg)
#define ACTOR_INFO(msg) RIPOSTE_INFO("CombatActor", msg)
#define ACTOR_DEBUG(msg) RIPOSTE_DEBUG("CombatActor", msg)

#define AI_CRITICAL(msg) RIPOSTE_CRITICAL("AI", msg)
#define AI_ERROR(msg) RIPOSTE_ERROR("AI", msg)
#define AI_WARN(msg) RIPOSTE_WARN("AI", msg)
#define AI_INFO(msg) RIPOSTE_INFO("AI", msg)
#define AI_DEBUG(msg) RIPOSTE_DEBUG("AI", msg)

#define SIM_CRITICAL(msg) RIPOSTE_CRITICAL("DuelSim", msg)
#define SIM_ERROR(msg) RIPOSTE_ERROR("DuelSim", msg)
#define SIM_WARN(msg) RIPOSTE_WARN("DuelSim", msg)
#define SIM_INFO(msg) RIPOSTE_INFO("DuelSim", msg)
#define SIM_DEBUG(msg) RIPOSTE_DEBUG("DuelSim", msg)

} // namespace Riposte

#endif // LOGGER_HPP
