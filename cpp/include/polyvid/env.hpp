#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace polyvid::env {

// Empty when unset.
std::string Get(std::string_view name);

// "1/true/yes/on" and "0/false/no/off", any case. nullopt when unset or unrecognised.
std::optional<bool> Flag(std::string_view name);

bool IsEnabled(std::string_view name, bool default_value = false);

}  // namespace polyvid::env
