/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

// Required includes for logging system:
// - string: Used in macro expansions for std::string() conversions
// - cstdio: Required for printf() and fflush() functions
// - cstdint: Required for uint8_t type
// - mutex: Required for thread-safe logging
// - atomic: Required for std::atomic<bool> benchmark mode flag
#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> benchmark mode flag
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for thread-safe logging
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace TrekEngine {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs (even in release for crashes)
  ERROR_LEVEL = 1,  // Renamed to avoid macro conflicts
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

#ifdef DEBUG
// Full console logging in debug builds
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
    printf("TrekEngine - [%s] %s: %s\n", system, getLevelString(level),
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

#define TREK_CRITICAL(system, msg)                                             \
  TrekEngine::Logger::Log(TrekEngine::LogLevel::CRITICAL, system, msg)
#define TREK_ERROR(system, msg)                                                \
  TrekEngine::Logger::Log(TrekEngine::LogLevel::ERROR_LEVEL, system, msg)
#define TREK_WARN(system, msg)                                                 \
  TrekEngine::Logger::Log(TrekEngine::LogLevel::WARNING, system, msg)
#define TREK_INFO(system, msg)                                                 \
  TrekEngine::Logger::Log(TrekEngine::LogLevel::INFO, system, msg)
#define TREK_DEBUG(system, msg)                                                \
  TrekEngine::Logger::Log(TrekEngine::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds - CRITICAL and ERROR go to a log file (see Logger.cpp)
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

  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define TREK_CRITICAL(system, msg)                                             \
  TrekEngine::Logger::Log("CRITICAL", system, msg)

#define TREK_ERROR(system, msg) TrekEngine::Logger::Log("ERROR", system, msg)

#define TREK_WARN(system, msg) ((void)0)  // Zero overhead
#define TREK_INFO(system, msg) ((void)0)  // Zero overhead
#define TREK_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Static member definitions - shared by both DEBUG and RELEASE builds
inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Convenience macros for each system

// Core Systems
#define TREKMAIN_CRITICAL(msg) TREK_CRITICAL("TrekMain", msg)
#define TREKMAIN_ERROR(msg) TREK_ERROR("TrekMain", msg)
#define TREKMAIN_WARN(msg) TREK_WARN("TrekMain", msg)
#define TREKMAIN_INFO(msg) TREK_INFO("TrekMain", msg)
#define TREKMAIN_DEBUG(msg) TREK_DEBUG("TrekMain", msg)

#define GAMESTATE_CRITICAL(msg) TREK_CRITICAL("GameState", msg)
#define GAMESTATE_ERROR(msg) TREK_ERROR("GameState", msg)
#define GAMESTATE_WARN(msg) TREK_WARN("GameState", msg)
#define GAMESTATE_INFO(msg) TREK_INFO("GameState", msg)
#define GAMESTATE_DEBUG(msg) TREK_DEBUG("GameState", msg)

// Character Systems
#define LOADER_CRITICAL(msg) TREK_CRITICAL("CharacterLoader", msg)
#define LOADER_ERROR(msg) TREK_ERROR("CharacterLoader", msg)
#define LOADER_WARN(msg) TREK_WARN("CharacterLoader", msg)
#define LOADER_INFO(msg) TREK_INFO("CharacterLoader", msg)
#define LOADER_DEBUG(msg) TREK_DEBUG("CharacterLoader", msg)

#define REGISTRY_CRITICAL(msg) TREK_CRITICAL("CharacterRegistry", msg)
#define REGISTRY_ERROR(msg) TREK_ERROR("CharacterRegistry", msg)
#define REGISTRY_WARN(msg) TREK_WARN("CharacterRegistry", msg)
#define REGISTRY_INFO(msg) TREK_INFO("CharacterRegistry", msg)
#define REGISTRY_DEBUG(msg) TREK_DEBUG("CharacterRegistry", msg)

#define RECORDSOURCE_CRITICAL(msg) TREK_CRITICAL("CharacterRecordSource", msg)
#define RECORDSOURCE_ERROR(msg) TREK_ERROR("CharacterRecordSource", msg)
#define RECORDSOURCE_WARN(msg) TREK_WARN("CharacterRecordSource", msg)
#define RECORDSOURCE_INFO(msg) TREK_INFO("CharacterRecordSource", msg)
#define RECORDSOURCE_DEBUG(msg) TREK_DEBUG("CharacterRecordSource", msg)

// Infrastructure
#define SETTINGS_CRITICAL(msg) TREK_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) TREK_ERROR("SettingsManager", msg)
#define SETTINGS_WARNING(msg) TREK_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) TREK_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) TREK_DEBUG("SettingsManager", msg)

#define RESOURCEPATH_CRITICAL(msg) TREK_CRITICAL("ResourcePath", msg)
#define RESOURCEPATH_ERROR(msg) TREK_ERROR("ResourcePath", msg)
#define RESOURCEPATH_WARN(msg) TREK_WARN("ResourcePath", msg)
#define RESOURCEPATH_INFO(msg) TREK_INFO("ResourcePath", msg)
#define RESOURCEPATH_DEBUG(msg) TREK_DEBUG("ResourcePath", msg)

#define JSON_CRITICAL(msg) TREK_CRITICAL("JsonReader", msg)
#define JSON_ERROR(msg) TREK_ERROR("JsonReader", msg)
#define JSON_WARN(msg) TREK_WARN("JsonReader", msg)
#define JSON_INFO(msg) TREK_INFO("JsonReader", msg)
#define JSON_DEBUG(msg) TREK_DEBUG("JsonReader", msg)

// Benchmark mode convenience macros
#define TREK_ENABLE_BENCHMARK_MODE() TrekEngine::Logger::SetBenchmarkMode(true)
#define TREK_DISABLE_BENCHMARK_MODE()                                          \
  TrekEngine::Logger::SetBenchmarkMode(false)

} // namespace TrekEngine

#endif // LOGGER_HPP
