#include "polyvid/log.hpp"

#include "polyvid/cli_colors.hpp"
#include "polyvid/env.hpp"
#include "polyvid/errors.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace polyvid::log {

namespace {

Level g_level = Level::Info;

bool Enabled(Level level) {
    return static_cast<int>(level) <= static_cast<int>(g_level);
}

}  // namespace

Level CurrentLevel() {
    return g_level;
}

void SetLevel(Level level) {
    g_level = level;
}

Level LevelFromName(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (lower == "error") {
        return Level::Error;
    }
    if (lower == "warn" || lower == "warning") {
        return Level::Warn;
    }
    if (lower == "info") {
        return Level::Info;
    }
    if (lower == "debug") {
        return Level::Debug;
    }
    throw InputError("Unknown log level: " + std::string(name));
}

void InitFromEnv() {
    std::string value = env::Get("POLYVID_LOG_LEVEL");
    if (value.empty()) {
        return;
    }
    try {
        g_level = LevelFromName(value);
    } catch (const InputError& exc) {
        Warn(exc.what());
    }
}

void Error(const std::string& message) {
    std::cerr << cli::Paint("ERROR: ", cli::Style::BoldRed, std::cerr) << message << "\n";
}

void Warn(const std::string& message) {
    if (!Enabled(Level::Warn)) {
        return;
    }
    std::cerr << cli::Paint("WARN: ", cli::Style::BoldYellow, std::cerr) << message << "\n";
}

void Info(const std::string& message) {
    if (!Enabled(Level::Info)) {
        return;
    }
    std::cerr << message << "\n";
}

void Debug(const std::string& message) {
    if (!Enabled(Level::Debug)) {
        return;
    }
    std::cerr << cli::Paint("debug: " + message, cli::Style::Dim, std::cerr) << "\n";
}

}  // namespace polyvid::log
