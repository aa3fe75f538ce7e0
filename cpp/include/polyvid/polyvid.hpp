#pragma once

#include "polyvid/archive.hpp"
#include "polyvid/constants.hpp"
#include "polyvid/digest.hpp"
#include "polyvid/payload.hpp"
#include "polyvid/polyglot_reader.hpp"
#include "polyvid/polyglot_writer.hpp"
#include "polyvid/progress.hpp"
#include "polyvid/recovery.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace polyvid {

struct CreateOptions {
    std::filesystem::path container;
    payload::PayloadRequest payload;
    std::filesystem::path output;  // empty: "hidden_data" with the container's extension
    std::uint64_t split_size = 0;  // 0 writes a single output
    bool write_metadata = true;
    std::size_t chunk_size = constants::kDefaultChunkSize;
    digest::HashAlgorithm hash = digest::HashAlgorithm::Sha256;
    progress::ProgressReporter* progress = nullptr;
};

struct CreateResult {
    std::vector<writer::PolyglotFile> files;
    recovery::RecoveryMetadata metadata;
    std::filesystem::path metadata_path;  // empty when metadata was not written
    std::vector<std::string> entries;     // packed entry names; empty for direct payloads
};

CreateResult CreatePolyglot(const CreateOptions& options);

enum class IntegrityStatus {
    Verified,
    Mismatch,
    Unchecked
};

std::string IntegrityStatusName(IntegrityStatus status);

struct PartCheck {
    std::filesystem::path path;
    bool size_matches = true;
    IntegrityStatus status = IntegrityStatus::Unchecked;
};

struct ExtractOptions {
    // One polyglot, or every part in ascending order. May be empty when metadata names the parts.
    std::vector<std::filesystem::path> inputs;
    std::filesystem::path metadata;
    std::filesystem::path output;      // empty: derived from the input name
    std::filesystem::path unpack_dir;  // empty: keep the payload file only
    // Expand a single "<base>_partN" input to all of its siblings.
    bool discover = false;
    // Required to combine a discovered set of more than one part.
    bool confirm_parts = false;
    signature::Bytes signature;  // empty: from metadata, else the zip signature
    bool allow_estimate = true;
    std::size_t chunk_size = constants::kDefaultChunkSize;
    digest::HashAlgorithm hash = digest::HashAlgorithm::Sha256;
    progress::ProgressReporter* progress = nullptr;
};

struct ExtractReport {
    reader::ExtractResult result;
    std::filesystem::path output;
    IntegrityStatus integrity = IntegrityStatus::Unchecked;
    std::vector<PartCheck> part_checks;
    std::optional<archive::Format> format;
    std::vector<std::string> entries;
    std::string list_error;  // why entries could not be listed
    std::filesystem::path unpacked_root;

    bool Degraded() const noexcept { return result.degraded; }
    // Completed, but the result cannot be trusted as-is.
    bool IntegrityUnconfirmed() const noexcept {
        if (Degraded() || integrity == IntegrityStatus::Mismatch) {
            return true;
        }
        for (const auto& check : part_checks) {
            if (check.status == IntegrityStatus::Mismatch || !check.size_matches) {
                return true;
            }
        }
        return false;
    }
};

ExtractReport ExtractPolyglot(const ExtractOptions& options);

struct InspectOptions {
    std::filesystem::path file;
    std::filesystem::path metadata;
    signature::Bytes signature;
    std::size_t chunk_size = constants::kDefaultChunkSize;
    digest::HashAlgorithm hash = digest::HashAlgorithm::Sha256;
};

struct InspectReport {
    std::filesystem::path file;
    std::uint64_t file_size = 0;
    digest::Hash file_checksum;
    digest::HashAlgorithm hash = digest::HashAlgorithm::Sha256;
    reader::PayloadLocation location;
    std::optional<archive::Format> format;
    std::vector<std::string> entries;
    std::string list_error;
    std::optional<PartCheck> part_check;  // set when the metadata lists this file
};

// Reports where the payload sits in one polyglot file and what it contains.
InspectReport InspectPolyglot(const InspectOptions& options);

}  // namespace polyvid
