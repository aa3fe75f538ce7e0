#pragma once

#include "polyvid/constants.hpp"
#include "polyvid/digest.hpp"
#include "polyvid/progress.hpp"
#include "polyvid/signature.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace polyvid::reader {

// How a payload offset was obtained. Only Estimated is a guess.
enum class OffsetSource {
    Signature,
    Recorded,
    SharedPrefix,
    Estimated
};

std::string OffsetSourceName(OffsetSource source);

struct PayloadLocation {
    std::filesystem::path path;
    OffsetSource source = OffsetSource::Signature;
    std::uint64_t offset = 0;
    std::uint64_t file_size = 0;

    std::uint64_t PayloadLength() const noexcept { return file_size > offset ? file_size - offset : 0; }
    bool Degraded() const noexcept { return source == OffsetSource::Estimated; }
};

struct ReadOptions {
    signature::Bytes signature = signature::FromString(constants::kZipSignature);
    // Container prefix length from recovery metadata; overrides scanning when it fits the file.
    std::optional<std::uint64_t> container_size;
    // When false a missing signature raises SignatureNotFoundError instead of estimating.
    bool allow_estimate = true;
    std::size_t chunk_size = constants::kDefaultChunkSize;
    digest::HashAlgorithm hash = digest::HashAlgorithm::Sha256;
    progress::ProgressReporter* progress = nullptr;
};

struct ExtractResult {
    std::vector<PayloadLocation> locations;  // one per input, in input order
    std::vector<digest::Hash> slice_checksums;  // parallel to locations
    std::uint64_t bytes_written = 0;
    digest::Hash checksum;
    bool degraded = false;
};

PayloadLocation LocatePayload(const std::filesystem::path& path, const ReadOptions& options);

// Locates every part's payload. Parts after the first reuse the first part's offset when
// their leading bytes are identical up to it. When the first part is too short to hold the
// whole signature, the signature is matched across the payload slices of the following parts.
std::vector<PayloadLocation> LocateParts(const std::vector<std::filesystem::path>& parts,
                                         const ReadOptions& options);

// Writes the bytes after the payload offset to output (atomically).
ExtractResult ExtractSingle(const std::filesystem::path& polyglot,
                            const std::filesystem::path& output,
                            const ReadOptions& options = {});

// Concatenates every part's payload slice, in the order given, into output (atomically).
// The order is never re-derived from content.
ExtractResult ExtractAndCombine(const std::vector<std::filesystem::path>& parts,
                                const std::filesystem::path& output,
                                const ReadOptions& options = {});

struct Discovery {
    std::vector<std::filesystem::path> parts;  // ascending part number
    std::vector<std::size_t> missing;          // gaps in 1..highest found
    std::vector<std::string> warnings;         // signs of parts left over from another run
};

// Finds siblings of a "<base>_partN.<ext>" file across the known container extensions.
// A path without a part marker is returned alone. Mixed number widths, duplicate numbers and
// part sizes no single split could produce are reported as warnings and logged.
Discovery DiscoverParts(const std::filesystem::path& any_part);

}  // namespace polyvid::reader
