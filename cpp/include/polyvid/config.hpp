#pragma once

#include "polyvid/digest.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace polyvid::config {

// Defaults that may be overridden through the environment before flags apply.
struct Settings {
    std::size_t chunk_size = 0;
    digest::HashAlgorithm hash = digest::HashAlgorithm::Sha256;
    bool show_progress = true;
    bool color = true;
};

// Parses "1048576", "512K", "16M", "4.5G", "1TiB". Zero and garbage raise InputError.
std::uint64_t ParseSize(std::string_view text);

std::size_t ClampChunkSize(std::uint64_t requested);

Settings LoadSettings();

}  // namespace polyvid::config
