/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

// - cstdio: printf() and fflush()
// - mutex: serialises output when tests and the demo log from helpers
// - atomic: benchmark mode flag
#include <atomic> // IWYU pragma: keep
#include <cstdint> // IWYU pragma: keep
#include <cstdio> // IWYU pragma: keep
#include <mutex> // IWYU pragma: keep
#include <string> // IWYU pragma: keep

namespace BurrowSim {
enum class LogLevel : uint8_t {
  CRITICAL = 0,    // Always logs
  ERROR_LEVEL = 1, // Renamed to avoid macro conflicts
  WARNING = 2,     // Debug only
  INFO = 3,        // Debug only
  DEBUG_LEVEL = 4  // Debug only
};

#ifdef DEBUG
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;
  static std::mutex s_logMutex;

public:
  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
      return;
    }
    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("BurrowSim - [%s] %s: %s\n", system, getLevelString(level),
           message);
    fflush(stdout);
  }

private:
  static const char *getLevelString(LogLevel level) {
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
};

#define BURROW_CRITICAL(system, msg)                                           \
  BurrowSim::Logger::Log(BurrowSim::LogLevel::CRITICAL, system, msg)
#define BURROW_ERROR(system, msg)                                              \
  BurrowSim::Logger::Log(BurrowSim::LogLevel::ERROR_LEVEL, system, msg)
#define BURROW_WARN(system, msg)                                               \
  BurrowSim::Logger::Log(BurrowSim::LogLevel::WARNING, system, msg)
#define BURROW_INFO(system, msg)                                               \
  BurrowSim::Logger::Log(BurrowSim::LogLevel::INFO, system, msg)
#define BURROW_DEBUG(system, msg)                                              \
  BurrowSim::Logger::Log(BurrowSim::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds keep CRITICAL and ERROR only
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;

public:
  static std::mutex s_logMutex;

  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void Log(const char *level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(const char *level, const char *system, const char *message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
      return;
    }
    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("BurrowSim - [%s] %s: %s\n", system, level, message);
    fflush(stdout);
  }
};

#define BURROW_CRITICAL(system, msg)                                           \
  BurrowSim::Logger::Log("CRITICAL", system, msg)
#define BURROW_ERROR(system, msg) BurrowSim::Logger::Log("ERROR", system, msg)
#define BURROW_WARN(system, msg) ((void)0)
#define BURROW_INFO(system, msg) ((void)0)
#define BURROW_DEBUG(system, msg) ((void)0)
#endif

inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Per-subsystem convenience macros

#define SCHEDULER_CRITICAL(msg) BURROW_CRITICAL("TurnScheduler", msg)
#define SCHEDULER_ERROR(msg) BURROW_ERROR("TurnScheduler", msg)
#define SCHEDULER_WARN(msg) BURROW_WARN("TurnScheduler", msg)
#define SCHEDULER_INFO(msg) BURROW_INFO("TurnScheduler", msg)
#define SCHEDULER_DEBUG(msg) BURROW_DEBUG("TurnScheduler", msg)

#define REGISTRY_CRITICAL(msg) BURROW_CRITICAL("AgentRegistry", msg)
#define REGISTRY_ERROR(msg) BURROW_ERROR("AgentRegistry", msg)
#define REGISTRY_WARN(msg) BURROW_WARN("AgentRegistry", msg)
#define REGISTRY_INFO(msg) BURROW_INFO("AgentRegistry", msg)
#define REGISTRY_DEBUG(msg) BURROW_DEBUG("AgentRegistry", msg)

#define BEHAVIOR_CRITICAL(msg) BURROW_CRITICAL("Behavior", msg)
#define BEHAVIOR_ERROR(msg) BURROW_ERROR("Behavior", msg)
#define BEHAVIOR_WARN(msg) BURROW_WARN("Behavior", msg)
#define BEHAVIOR_INFO(msg) BURROW_INFO("Behavior", msg)
#define BEHAVIOR_DEBUG(msg) BURROW_DEBUG("Behavior", msg)

#define PATHFIND_CRITICAL(msg) BURROW_CRITICAL("Pathfinding", msg)
#define PATHFIND_ERROR(msg) BURROW_ERROR("Pathfinding", msg)
#define PATHFIND_WARN(msg) BURROW_WARN("Pathfinding", msg)
#define PATHFIND_INFO(msg) BURROW_INFO("Pathfinding", msg)
#define PATHFIND_DEBUG(msg) BURROW_DEBUG("Pathfinding", msg)

#define WORLD_CRITICAL(msg) BURROW_CRITICAL("World", msg)
#define WORLD_ERROR(msg) BURROW_ERROR("World", msg)
#define WORLD_WARN(msg) BURROW_WARN("World", msg)
#define WORLD_INFO(msg) BURROW_INFO("World", msg)
#define WORLD_DEBUG(msg) BURROW_DEBUG("World", msg)

#define DEN_CRITICAL(msg) BURROW_CRITICAL("Den", msg)
#define DEN_ERROR(msg) BURROW_ERROR("Den", msg)
#define DEN_WARN(msg) BURROW_WARN("Den", msg)
#define DEN_INFO(msg) BURROW_INFO("Den", msg)
#define DEN_DEBUG(msg) BURROW_DEBUG("Den", msg)

#define CONFIG_CRITICAL(msg) BURROW_CRITICAL("Config", msg)
#define CONFIG_ERROR(msg) BURROW_ERROR("Config", msg)
#define CONFIG_WARN(msg) BURROW_WARN("Config", msg)
#define CONFIG_INFO(msg) BURROW_INFO("Config", msg)
#define CONFIG_DEBUG(msg) BURROW_DEBUG("Config", msg)

#define SPAWNER_CRITICAL(msg) BURROW_CRITICAL("Spawner", msg)
#define SPAWNER_ERROR(msg) BURROW_ERROR("Spawner", msg)
#define SPAWNER_WARN(msg) BURROW_WARN("Spawner", msg)
#define SPAWNER_INFO(msg) BURROW_INFO("Spawner", msg)
#define SPAWNER_DEBUG(msg) BURROW_DEBUG("Spawner", msg)

#define PLAYER_CRITICAL(msg) BURROW_CRITICAL("PlayerController", msg)
#define PLAYER_ERROR(msg) BURROW_ERROR("PlayerController", msg)
#define PLAYER_WARN(msg) BURROW_WARN("PlayerController", msg)
#define PLAYER_INFO(msg) BURROW_INFO("PlayerController", msg)
#define PLAYER_DEBUG(msg) BURROW_DEBUG("PlayerController", msg)

#define DEMO_CRITICAL(msg) BURROW_CRITICAL("Demo", msg)
#define DEMO_ERROR(msg) BURROW_ERROR("Demo", msg)
#define DEMO_WARN(msg) BURROW_WARN("Demo", msg)
#define DEMO_INFO(msg) BURROW_INFO("Demo", msg)
#define DEMO_DEBUG(msg) BURROW_DEBUG("Demo", msg)

#define BURROW_ENABLE_BENCHMARK_MODE() BurrowSim::Logger::SetBenchmarkMode(true)
#define BURROW_DISABLE_BENCHMARK_MODE()                                        \
  BurrowSim::Logger::SetBenchmarkMode(false)

} // namespace BurrowSim

#endif // LOGGER_HPP
