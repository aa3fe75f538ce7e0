#pragma once

#include <string>
#include <string_view>

namespace polyvid::log {

enum class Level {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3
};

Level CurrentLevel();
void SetLevel(Level level);
Level LevelFromName(std::string_view name);

// Reads POLYVID_LOG_LEVEL; unknown names keep the default.
void InitFromEnv();

void Error(const std::string& message);
void Warn(const std::string& message);
void Info(const std::string& message);
void Debug(const std::string& message);

}  // namespace polyvid::log
