#pragma once

#include "polyvid/archive.hpp"
#include "polyvid/signature.hpp"
#include "polyvid/temp_path.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace polyvid::payload {

enum class PayloadMode {
    SingleFile,
    FolderOrMultiple,
    ExistingArchive,
    DirectEmbedArchive
};

PayloadMode ModeFromName(const std::string& name);
std::string ModeName(PayloadMode mode);

struct PayloadInput {
    std::filesystem::path source;
    std::string entry_name;  // empty: file name of source
};

struct PayloadRequest {
    PayloadMode mode = PayloadMode::SingleFile;
    std::vector<PayloadInput> inputs;
    // SingleFile only: embed a file with a known archive extension as-is.
    bool bypass_wrapping = false;
    archive::Format format = archive::Format::Zip;
    int level = -1;
    // Parent for the temporary packed archive; empty uses the system temp directory.
    std::filesystem::path work_dir;
};

// The bytes to hide: either an existing file used verbatim or an archive packed into a
// scoped temporary directory that lives as long as this object.
class PayloadSource {
public:
    static PayloadSource FromFile(const std::filesystem::path& file, std::string embedded_name = {});

    PayloadSource(PayloadSource&&) noexcept = default;
    PayloadSource& operator=(PayloadSource&&) noexcept = default;
    PayloadSource(const PayloadSource&) = delete;
    PayloadSource& operator=(const PayloadSource&) = delete;

    const std::filesystem::path& Path() const noexcept { return path_; }
    std::uint64_t TotalLength() const noexcept { return length_; }
    bool IsDirect() const noexcept { return direct_; }
    const std::string& EmbeddedName() const noexcept { return embedded_name_; }
    const std::optional<archive::Format>& ArchiveFormat() const noexcept { return format_; }
    const std::vector<std::string>& Entries() const noexcept { return entries_; }

    // Leading magic of the payload when its format is known, otherwise empty.
    signature::Bytes Signature() const;

private:
    friend PayloadSource BuildPayload(const PayloadRequest& request);

    PayloadSource() = default;

    std::filesystem::path path_;
    std::uint64_t length_ = 0;
    bool direct_ = true;
    std::string embedded_name_;
    std::optional<archive::Format> format_;
    std::vector<std::string> entries_;
    std::optional<temp::TempDir> work_;
};

// Collects archive entries for the request. Directories are walked recursively in sorted
// order with forward-slash names; symlinks are skipped. Throws InputError for missing
// paths, empty directories and duplicate names.
std::vector<archive::Entry> CollectEntries(const PayloadRequest& request);

// Validates every input before anything is written, then packs or wraps the payload.
PayloadSource BuildPayload(const PayloadRequest& request);

}  // namespace polyvid::payload
