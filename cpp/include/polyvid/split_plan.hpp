#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace polyvid::split {

// Half-open byte range [begin, end) of the payload carried by one part.
struct PartRange {
    std::size_t index = 0;
    std::uint64_t begin = 0;
    std::uint64_t end = 0;

    std::uint64_t Length() const noexcept { return end - begin; }
    std::size_t Number() const noexcept { return index + 1; }
};

// Partition of [0, payload_length) into ceil(payload_length / part_size) contiguous ranges.
// Every range but the last is exactly part_size long; the last is never empty.
class SplitPlan {
public:
    SplitPlan(std::uint64_t payload_length, std::uint64_t part_size);

    std::size_t PartCount() const noexcept { return part_count_; }
    std::uint64_t PayloadLength() const noexcept { return payload_length_; }
    std::uint64_t PartSize() const noexcept { return part_size_; }

    PartRange Part(std::size_t index) const;
    std::vector<PartRange> Parts() const;

private:
    std::uint64_t payload_length_ = 0;
    std::uint64_t part_size_ = 0;
    std::size_t part_count_ = 0;
};

// Digits used for part numbers so that names sort lexicographically in part order.
std::size_t PartNumberWidth(std::size_t part_count);

// "dir/video.mp4", 3 of 12 -> "dir/video_part03.mp4"
std::filesystem::path PartPath(const std::filesystem::path& base,
                               std::size_t part_number,
                               std::size_t part_count);

struct PartName {
    std::string base_stem;  // text before the part marker
    std::size_t number = 0;
    std::size_t width = 0;  // digits as written, leading zeros included
    std::string extension;
};

std::optional<PartName> ParsePartName(const std::filesystem::path& path);

}  // namespace polyvid::split
