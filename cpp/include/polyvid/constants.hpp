#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace polyvid::constants {

inline constexpr std::size_t kDefaultChunkSize = 16u * 1024u * 1024u;
inline constexpr std::size_t kMinChunkSize = 4u * 1024u;
inline constexpr std::size_t kMaxChunkSize = 256u * 1024u * 1024u;
inline constexpr std::size_t kScanChunkSize = 1u << 20;

// Estimated payload offset is file_length / kFallbackDivisor at every call site.
inline constexpr std::uint64_t kFallbackDivisor = 2;

// The CLI suggests splitting above this size.
inline constexpr std::uint64_t kSplitAdviceThreshold = 10ull * 1024ull * 1024ull * 1024ull;

inline constexpr std::string_view kZipSignature("PK\x03\x04", 4);
inline constexpr std::string_view kGzipSignature("\x1f\x8b\x08", 3);
inline constexpr std::string_view kXzSignature("\xfd" "7zXZ\x00", 6);

inline constexpr std::string_view kZipExt = ".zip";
inline constexpr std::string_view kPackTgzExt = ".tgz";
inline constexpr std::string_view kPackTxzExt = ".txz";

inline constexpr std::string_view kPartMarker = "_part";
inline constexpr std::string_view kRecoverySuffix = "_recovery.txt";
inline constexpr std::string_view kPartialMarker = ".partial-";
inline constexpr std::string_view kDefaultOutputBase = "hidden_data";
inline constexpr std::string_view kDefaultArchiveStem = "hidden_archive";

inline constexpr std::array<std::string_view, 4> kContainerExts = {
    ".mp4", ".mov", ".avi", ".mkv",
};

// Files with these extensions may be embedded without re-wrapping.
inline constexpr std::array<std::string_view, 11> kArchiveExts = {
    ".zip", ".7z", ".rar", ".tar", ".gz", ".tgz", ".xz", ".txz", ".bz2", ".tbz2", ".zst",
};

inline constexpr int kDefaultDeflateLevel = 6;
inline constexpr std::uint32_t kMetadataVersion = 1;
inline constexpr std::string_view kEngineVersion = "1.2.0";

}  // namespace polyvid::constants
