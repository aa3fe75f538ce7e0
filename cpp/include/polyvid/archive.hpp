#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace polyvid::archive {

enum class Format {
    Zip,
    Tgz,
    Txz
};

struct Entry {
    std::filesystem::path source;
    std::string name;  // forward-slash relative name inside the archive
};

Format FormatFromName(const std::string& name);
std::string FormatName(Format format);
std::string FormatExtension(Format format);
std::vector<std::uint8_t> Signature(Format format);

// Identifies an archive by its leading bytes.
std::optional<Format> DetectFormat(const std::filesystem::path& path);

bool LooksLikeArchiveName(const std::filesystem::path& path);

bool Available(Format format);

// Streams every entry's source into a new archive at destination.
// Entry names must be unique and relative; level 0 stores zip entries uncompressed.
void Pack(const std::vector<Entry>& entries,
          Format format,
          const std::filesystem::path& destination,
          int level = -1);

std::vector<std::string> ListEntries(const std::filesystem::path& archive);
std::vector<std::string> ListEntries(const std::filesystem::path& archive, Format format);

// Extracts into dest_dir and returns the single top-level entry when there is exactly one,
// otherwise dest_dir itself.
std::filesystem::path Unpack(const std::filesystem::path& archive, const std::filesystem::path& dest_dir);
std::filesystem::path Unpack(const std::filesystem::path& archive,
                             Format format,
                             const std::filesystem::path& dest_dir);

}  // namespace polyvid::archive
