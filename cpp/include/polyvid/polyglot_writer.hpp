#pragma once

#include "polyvid/constants.hpp"
#include "polyvid/digest.hpp"
#include "polyvid/payload.hpp"
#include "polyvid/progress.hpp"
#include "polyvid/temp_path.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace polyvid::writer {

// Media file whose bytes prefix every output. Never modified.
class ContainerTemplate {
public:
    // Throws InputError when the file is missing, not a regular file, or empty.
    explicit ContainerTemplate(std::filesystem::path path);

    const std::filesystem::path& Path() const noexcept { return path_; }
    std::uint64_t Size() const noexcept { return size_; }

private:
    std::filesystem::path path_;
    std::uint64_t size_ = 0;
};

// One output: the container followed by payload bytes [range_begin, range_begin + range_length).
struct PolyglotFile {
    std::filesystem::path path;
    std::uint64_t container_size = 0;
    std::uint64_t range_begin = 0;
    std::uint64_t range_length = 0;
    digest::Hash slice_checksum;  // over the payload slice only

    std::uint64_t FileSize() const noexcept { return container_size + range_length; }
};

struct WriteOptions {
    std::size_t chunk_size = constants::kDefaultChunkSize;
    digest::HashAlgorithm hash = digest::HashAlgorithm::Sha256;
    progress::ProgressReporter* progress = nullptr;
};

struct WriteResult {
    std::vector<PolyglotFile> files;  // ascending part order
    digest::Hash payload_checksum;
};

// Outputs fully written under their temporary names, not yet renamed into place.
struct StagedWrite {
    WriteResult result;
    std::vector<temp::AtomicFile> outputs;  // parallel to result.files
};

// Empty requests become "hidden_data" beside the working directory; a missing extension
// is taken from the container.
std::filesystem::path ResolveOutputPath(const std::filesystem::path& requested,
                                        const ContainerTemplate& container);

StagedWrite StageSingle(const ContainerTemplate& container,
                        const payload::PayloadSource& payload,
                        const std::filesystem::path& output,
                        const WriteOptions& options = {});

StagedWrite StageSplit(const ContainerTemplate& container,
                       const payload::PayloadSource& payload,
                       const std::filesystem::path& output_base,
                       std::uint64_t part_size,
                       const WriteOptions& options = {});

// Writes container + whole payload. The output appears under its final name only on success.
WriteResult WriteSingle(const ContainerTemplate& container,
                        const payload::PayloadSource& payload,
                        const std::filesystem::path& output,
                        const WriteOptions& options = {});

// Writes one output per SplitPlan range, in ascending order, named with zero-padded part
// numbers. No part is renamed into place until every part has been written, and a failed
// rename removes the parts already renamed.
WriteResult WriteSplit(const ContainerTemplate& container,
                       const payload::PayloadSource& payload,
                       const std::filesystem::path& output_base,
                       std::uint64_t part_size,
                       const WriteOptions& options = {});

}  // namespace polyvid::writer
