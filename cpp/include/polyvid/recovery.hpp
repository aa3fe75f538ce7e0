#pragma once

#include "polyvid/archive.hpp"
#include "polyvid/digest.hpp"
#include "polyvid/signature.hpp"
#include "polyvid/temp_path.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace polyvid::recovery {

using MetadataMap = std::unordered_map<std::string, std::string>;

struct PartRecord {
    std::string file;       // file name relative to the metadata file
    std::uint64_t length = 0;  // payload bytes carried
    digest::Hash checksum;  // empty for single outputs
};

// Everything needed to rebuild the payload on another machine.
struct RecoveryMetadata {
    std::uint32_t version = 0;
    std::string created;
    digest::HashAlgorithm hash = digest::HashAlgorithm::Sha256;
    digest::Hash payload_checksum;
    std::uint64_t payload_length = 0;
    bool direct_embed = false;
    std::string embedded_name;
    std::optional<archive::Format> archive_format;
    signature::Bytes signature;
    std::uint64_t container_size = 0;
    std::uint64_t part_size = 0;  // 0 for single outputs
    std::vector<PartRecord> parts;  // ascending part order

    bool IsSplit() const noexcept { return part_size > 0; }
    std::vector<digest::Hash> PartChecksums() const;
    std::vector<std::string> PartFileNames() const;
};

std::string Serialize(const RecoveryMetadata& metadata);

MetadataMap Decode(const std::string& text);
std::string GetValue(const MetadataMap& meta, std::string_view key);

// Throws InputError naming the offending key when a required field is missing or inconsistent.
RecoveryMetadata Parse(const std::string& text);

// Writes the metadata under a temporary sibling of path; the caller commits it.
temp::AtomicFile Stage(const RecoveryMetadata& metadata, const std::filesystem::path& path);
void Save(const RecoveryMetadata& metadata, const std::filesystem::path& path);
RecoveryMetadata Load(const std::filesystem::path& path);

// "dir/video.mp4" -> "dir/video_recovery.txt"
std::filesystem::path MetadataPathFor(const std::filesystem::path& output_base);

// Part files resolved against the directory holding the metadata file.
std::vector<std::filesystem::path> PartPaths(const RecoveryMetadata& metadata,
                                             const std::filesystem::path& metadata_path);

}  // namespace polyvid::recovery
