#include "polyvid/split_plan.hpp"

#include "polyvid/constants.hpp"
#include "polyvid/errors.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>

namespace polyvid::split {

SplitPlan::SplitPlan(std::uint64_t payload_length, std::uint64_t part_size)
    : payload_length_(payload_length), part_size_(part_size) {
    if (part_size == 0) {
        throw InputError("Part size must be at least one byte");
    }
    if (payload_length == 0) {
        throw InputError("Cannot split an empty payload");
    }
    std::uint64_t count = payload_length / part_size + (payload_length % part_size != 0 ? 1 : 0);
    if (count > std::numeric_limits<std::size_t>::max()) {
        throw InputError("Part size too small for payload");
    }
    part_count_ = static_cast<std::size_t>(count);
}

PartRange SplitPlan::Part(std::size_t index) const {
    if (index >= part_count_) {
        throw std::out_of_range("Part index out of range");
    }
    PartRange range;
    range.index = index;
    range.begin = static_cast<std::uint64_t>(index) * part_size_;
    range.end = std::min(range.begin + part_size_, payload_length_);
    return range;
}

std::vector<PartRange> SplitPlan::Parts() const {
    std::vector<PartRange> parts;
    parts.reserve(part_count_);
    for (std::size_t i = 0; i < part_count_; ++i) {
        parts.push_back(Part(i));
    }
    return parts;
}

std::size_t PartNumberWidth(std::size_t part_count) {
    std::size_t width = 1;
    while (part_count >= 10) {
        part_count /= 10;
        ++width;
    }
    return width;
}

std::filesystem::path PartPath(const std::filesystem::path& base,
                               std::size_t part_number,
                               std::size_t part_count) {
    std::string digits = std::to_string(part_number);
    std::size_t width = PartNumberWidth(part_count);
    if (digits.size() < width) {
        digits.insert(0, width - digits.size(), '0');
    }
    std::string name = base.stem().string() + std::string(constants::kPartMarker) + digits
                       + base.extension().string();
    return base.parent_path() / name;
}

std::optional<PartName> ParsePartName(const std::filesystem::path& path) {
    std::string stem = path.stem().string();
    std::string marker(constants::kPartMarker);
    auto pos = stem.rfind(marker);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    std::string digits = stem.substr(pos + marker.size());
    if (digits.empty() || digits.size() > 9
        || !std::all_of(digits.begin(), digits.end(),
                        [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
        return std::nullopt;
    }
    PartName parsed;
    parsed.base_stem = stem.substr(0, pos);
    parsed.number = static_cast<std::size_t>(std::stoul(digits));
    parsed.width = digits.size();
    parsed.extension = path.extension().string();
    if (parsed.number == 0) {
        return std::nullopt;
    }
    return parsed;
}

}  // namespace polyvid::split
