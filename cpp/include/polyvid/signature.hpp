#pragma once

#include "polyvid/constants.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string_view>
#include <vector>

namespace polyvid::signature {

using Bytes = std::vector<std::uint8_t>;

struct ScanResult {
    bool found = false;
    std::uint64_t offset = 0;  // meaningful only when found
};

Bytes FromString(std::string_view text);

// First occurrence of signature in data. An empty signature is never found.
ScanResult Scan(const std::uint8_t* data, std::size_t size, const Bytes& signature);
ScanResult Scan(const Bytes& data, const Bytes& signature);

// Streaming variant: searches the file from start_offset without loading it whole.
// Matches that straddle chunk boundaries are found.
ScanResult ScanFile(const std::filesystem::path& path,
                    const Bytes& signature,
                    std::uint64_t start_offset = 0,
                    std::size_t chunk_size = constants::kScanChunkSize);

bool MatchesAt(const std::filesystem::path& path, const Bytes& signature, std::uint64_t offset);

// Best-effort payload offset when no signature is present: data_length / divisor.
// The result is a guess and callers must treat it as degraded.
std::uint64_t EstimateOffset(std::uint64_t data_length,
                             std::uint64_t divisor = constants::kFallbackDivisor);

}  // namespace polyvid::signature
