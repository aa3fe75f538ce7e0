#include "polyvid/env.hpp"

#include <array>
#include <cctype>
#include <cstdlib>

namespace polyvid::env {

namespace {

constexpr std::array<std::string_view, 4> kTrue = {"1", "true", "yes", "on"};
constexpr std::array<std::string_view, 4> kFalse = {"0", "false", "no", "off"};

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

template <typename Words>
bool OneOf(std::string_view value, const Words& words) {
    for (std::string_view word : words) {
        if (EqualsIgnoreCase(value, word)) {
            return true;
        }
    }
    return false;
}

}  // namespace

std::string Get(std::string_view name) {
    const char* value = std::getenv(std::string(name).c_str());
    return value ? std::string(value) : std::string();
}

std::optional<bool> Flag(std::string_view name) {
    std::string value = Get(name);
    if (OneOf(value, kTrue)) {
        return true;
    }
    if (OneOf(value, kFalse)) {
        return false;
    }
    return std::nullopt;
}

bool IsEnabled(std::string_view name, bool default_value) {
    return Flag(name).value_or(default_value);
}

}  // namespace polyvid::env
