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
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for thread-safe logging
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace TinselEngine {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs (even in release for crashes)
  ERROR_LEVEL = 1,  // Kept in release builds, written to the log file
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

#ifdef DEBUG
// Full console logging in debug builds
class Logger {
private:
  static std::mutex s_logMutex;

public:
  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("TinselEngine - [%s] %s: %s\n", system, getLevelString(level),
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

#define TINSEL_CRITICAL(system, msg)                                           \
  TinselEngine::Logger::Log(TinselEngine::LogLevel::CRITICAL, system, msg)
#define TINSEL_ERROR(system, msg)                                              \
  TinselEngine::Logger::Log(TinselEngine::LogLevel::ERROR_LEVEL, system, msg)
#define TINSEL_WARN(system, msg)                                               \
  TinselEngine::Logger::Log(TinselEngine::LogLevel::WARNING, system, msg)
#define TINSEL_INFO(system, msg)                                               \
  TinselEngine::Logger::Log(TinselEngine::LogLevel::INFO, system, msg)
#define TINSEL_DEBUG(system, msg)                                              \
  TinselEngine::Logger::Log(TinselEngine::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds - CRITICAL and ERROR go to a log file, the rest compiles out
class Logger {
public:
  static std::mutex s_logMutex; // Public for macro access

  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define TINSEL_CRITICAL(system, msg)                                           \
  TinselEngine::Logger::Log("CRITICAL", system, msg)

#define TINSEL_ERROR(system, msg)                                              \
  TinselEngine::Logger::Log("ERROR", system, msg)

#define TINSEL_WARN(system, msg) ((void)0)  // Zero overhead
#define TINSEL_INFO(system, msg) ((void)0)  // Zero overhead
#define TINSEL_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

inline std::mutex Logger::s_logMutex{};

// Core Systems
#define GAMELOOP_CRITICAL(msg) TINSEL_CRITICAL("GameLoop", msg)
#define GAMELOOP_ERROR(msg) TINSEL_ERROR("GameLoop", msg)
#define GAMELOOP_WARN(msg) TINSEL_WARN("GameLoop", msg)
#define GAMELOOP_INFO(msg) TINSEL_INFO("GameLoop", msg)
#define GAMELOOP_DEBUG(msg) TINSEL_DEBUG("GameLoop", msg)

#define GAMEENGINE_CRITICAL(msg) TINSEL_CRITICAL("GameEngine", msg)
#define GAMEENGINE_ERROR(msg) TINSEL_ERROR("GameEngine", msg)
#define GAMEENGINE_WARN(msg) TINSEL_WARN("GameEngine", msg)
#define GAMEENGINE_INFO(msg) TINSEL_INFO("GameEngine", msg)
#define GAMEENGINE_DEBUG(msg) TINSEL_DEBUG("GameEngine", msg)

#define GAMESTATE_CRITICAL(msg) TINSEL_CRITICAL("GameStateManager", msg)
#define GAMESTATE_ERROR(msg) TINSEL_ERROR("GameStateManager", msg)
#define GAMESTATE_WARN(msg) TINSEL_WARN("GameStateManager", msg)
#define GAMESTATE_INFO(msg) TINSEL_INFO("GameStateManager", msg)
#define GAMESTATE_DEBUG(msg) TINSEL_DEBUG("GameStateManager", msg)

// Manager Systems
#define PARTICLE_CRITICAL(msg) TINSEL_CRITICAL("ParticleManager", msg)
#define PARTICLE_ERROR(msg) TINSEL_ERROR("ParticleManager", msg)
#define PARTICLE_WARN(msg) TINSEL_WARN("ParticleManager", msg)
#define PARTICLE_INFO(msg) TINSEL_INFO("ParticleManager", msg)
#define PARTICLE_DEBUG(msg) TINSEL_DEBUG("ParticleManager", msg)

#define INPUT_CRITICAL(msg) TINSEL_CRITICAL("InputManager", msg)
#define INPUT_ERROR(msg) TINSEL_ERROR("InputManager", msg)
#define INPUT_WARN(msg) TINSEL_WARN("InputManager", msg)
#define INPUT_INFO(msg) TINSEL_INFO("InputManager", msg)
#define INPUT_DEBUG(msg) TINSEL_DEBUG("InputManager", msg)

#define SETTINGS_CRITICAL(msg) TINSEL_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) TINSEL_ERROR("SettingsManager", msg)
#define SETTINGS_WARNING(msg) TINSEL_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) TINSEL_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) TINSEL_DEBUG("SettingsManager", msg)

#define TEXTURE_CRITICAL(msg) TINSEL_CRITICAL("TextureLoader", msg)
#define TEXTURE_ERROR(msg) TINSEL_ERROR("TextureLoader", msg)
#define TEXTURE_WARN(msg) TINSEL_WARN("TextureLoader", msg)
#define TEXTURE_INFO(msg) TINSEL_INFO("TextureLoader", msg)
#define TEXTURE_DEBUG(msg) TINSEL_DEBUG("TextureLoader", msg)

#define CAMERA_CRITICAL(msg) TINSEL_CRITICAL("Camera", msg)
#define CAMERA_ERROR(msg) TINSEL_ERROR("Camera", msg)
#define CAMERA_WARN(msg) TINSEL_WARN("Camera", msg)
#define CAMERA_INFO(msg) TINSEL_INFO("Camera", msg)
#define CAMERA_DEBUG(msg) TINSEL_DEBUG("Camera", msg)

// World and Scene Systems
#define LAYOUT_CRITICAL(msg) TINSEL_CRITICAL("TreeLayoutGenerator", msg)
#define LAYOUT_ERROR(msg) TINSEL_ERROR("TreeLayoutGenerator", msg)
#define LAYOUT_WARN(msg) TINSEL_WARN("TreeLayoutGenerator", msg)
#define LAYOUT_INFO(msg) TINSEL_INFO("TreeLayoutGenerator", msg)
#define LAYOUT_DEBUG(msg) TINSEL_DEBUG("TreeLayoutGenerator", msg)

#define SCENE_CRITICAL(msg) TINSEL_CRITICAL("TreeSceneState", msg)
#define SCENE_ERROR(msg) TINSEL_ERROR("TreeSceneState", msg)
#define SCENE_WARN(msg) TINSEL_WARN("TreeSceneState", msg)
#define SCENE_INFO(msg) TINSEL_INFO("TreeSceneState", msg)
#define SCENE_DEBUG(msg) TINSEL_DEBUG("TreeSceneState", msg)

} // namespace TinselEngine

#endif // LOGGER_HPP
