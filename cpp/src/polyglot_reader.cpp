#include "polyvid/polyglot_reader.hpp"

#include "polyvid/errors.hpp"
#include "polyvid/file_stream.hpp"
#include "polyvid/log.hpp"
#include "polyvid/split_plan.hpp"
#include "polyvid/temp_path.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <map>
#include <optional>
#include <system_error>
#include <utility>

namespace polyvid::reader {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

bool IsContainerExtension(const std::string& ext) {
    std::string lower = ToLower(ext);
    for (std::string_view known : constants::kContainerExts) {
        if (lower == known) {
            return true;
        }
    }
    return false;
}

// True when both files hold identical bytes in [0, length).
bool SamePrefix(const std::filesystem::path& a,
                const std::filesystem::path& b,
                std::uint64_t length,
                std::size_t chunk_size) {
    filestream::FileReader left(a);
    filestream::FileReader right(b);
    if (left.TotalSize() < length || right.TotalSize() < length) {
        return false;
    }
    std::size_t chunk = static_cast<std::size_t>(
        std::min<std::uint64_t>(std::max<std::size_t>(chunk_size, 1), std::max<std::uint64_t>(length, 1)));
    std::vector<std::uint8_t> lbuf(chunk);
    std::vector<std::uint8_t> rbuf(chunk);
    std::uint64_t remaining = length;
    while (remaining > 0) {
        std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, chunk));
        left.ReadExact(lbuf.data(), want);
        right.ReadExact(rbuf.data(), want);
        if (!std::equal(lbuf.begin(), lbuf.begin() + static_cast<std::ptrdiff_t>(want), rbuf.begin())) {
            return false;
        }
        remaining -= want;
    }
    return true;
}

PayloadLocation Estimate(const std::filesystem::path& path, std::uint64_t file_size, const ReadOptions& options) {
    if (!options.allow_estimate) {
        throw SignatureNotFoundError(path);
    }
    PayloadLocation location;
    location.path = path;
    location.file_size = file_size;
    location.source = OffsetSource::Estimated;
    location.offset = signature::EstimateOffset(file_size);
    log::Warn("No payload signature in " + path.string() + "; guessing offset "
              + std::to_string(location.offset) + ", result is unreliable");
    return location;
}

PayloadLocation Scan(const std::filesystem::path& path, std::uint64_t file_size, const ReadOptions& options) {
    auto hit = signature::ScanFile(path, options.signature);
    if (!hit.found) {
        return Estimate(path, file_size, options);
    }
    PayloadLocation location;
    location.path = path;
    location.file_size = file_size;
    location.source = OffsetSource::Signature;
    location.offset = hit.offset;
    return location;
}

std::optional<PayloadLocation> RecordedLocation(const std::filesystem::path& path,
                                                std::uint64_t file_size,
                                                const ReadOptions& options) {
    if (!options.container_size) {
        return std::nullopt;
    }
    if (*options.container_size >= file_size) {
        log::Warn("Recorded container size " + std::to_string(*options.container_size) + " does not fit "
                  + path.string() + "; scanning for the signature instead");
        return std::nullopt;
    }
    PayloadLocation location;
    location.path = path;
    location.source = OffsetSource::Recorded;
    location.offset = *options.container_size;
    location.file_size = file_size;
    return location;
}

// Offset at which the signature starts in the first part and continues through the payload
// slices of the following parts at the same offset. Only the tail of the first part shorter
// than the signature is tried, since a whole match inside it would have been scanned already.
std::optional<std::uint64_t> StraddlingOffset(const std::vector<std::filesystem::path>& parts,
                                              std::uint64_t first_size,
                                              const ReadOptions& options) {
    const signature::Bytes& sig = options.signature;
    if (sig.empty() || parts.size() < 2 || first_size == 0) {
        return std::nullopt;
    }
    std::uint64_t lowest = first_size >= sig.size() ? first_size - sig.size() + 1 : 0;
    for (std::uint64_t offset = lowest; offset < first_size; ++offset) {
        signature::Bytes window;
        for (std::size_t i = 0; i < parts.size() && window.size() < sig.size(); ++i) {
            filestream::FileReader reader(parts[i]);
            if (reader.TotalSize() <= offset) {
                break;
            }
            reader.Seek(offset);
            std::size_t want = static_cast<std::size_t>(
                std::min<std::uint64_t>(sig.size() - window.size(), reader.Remaining()));
            std::size_t start = window.size();
            window.resize(start + want);
            reader.ReadExact(window.data() + start, want);
        }
        if (window == sig && SamePrefix(parts[0], parts[1], offset, options.chunk_size)) {
            return offset;
        }
    }
    return std::nullopt;
}

PayloadLocation LocateFirstPart(const std::vector<std::filesystem::path>& parts, const ReadOptions& options) {
    const std::filesystem::path& path = parts.front();
    std::uint64_t file_size = filestream::FileSize(path);
    if (auto recorded = RecordedLocation(path, file_size, options)) {
        return *recorded;
    }
    auto hit = signature::ScanFile(path, options.signature);
    std::optional<std::uint64_t> offset;
    if (hit.found) {
        offset = hit.offset;
    } else {
        offset = StraddlingOffset(parts, file_size, options);
    }
    if (!offset) {
        return Estimate(path, file_size, options);
    }
    PayloadLocation location;
    location.path = path;
    location.file_size = file_size;
    location.source = OffsetSource::Signature;
    location.offset = *offset;
    return location;
}

void RejectSameAsInput(const std::filesystem::path& output, const std::vector<std::filesystem::path>& inputs) {
    std::error_code ec;
    for (const auto& input : inputs) {
        if (std::filesystem::exists(output, ec) && std::filesystem::equivalent(output, input, ec)) {
            throw InputError("Output would overwrite input: " + output.string());
        }
    }
}

ExtractResult WriteLocations(std::vector<PayloadLocation> locations,
                             const std::filesystem::path& output,
                             const ReadOptions& options) {
    ExtractResult result;
    std::uint64_t total = 0;
    for (const auto& location : locations) {
        total += location.PayloadLength();
    }
    auto parent = output.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw IoError("create directory", parent, ec.message());
        }
    }

    temp::AtomicFile out(output);
    filestream::FileWriter writer(out.TempPath());
    digest::Digest hasher(options.hash);
    for (std::size_t i = 0; i < locations.size(); ++i) {
        const auto& location = locations[i];
        filestream::CopyOptions copy;
        copy.chunk_size = options.chunk_size;
        copy.start_offset = location.offset;
        digest::Digest slice(options.hash);
        copy.observer = [&hasher, &slice](const std::uint8_t* data, std::size_t size) {
            hasher.Update(data, size);
            slice.Update(data, size);
        };
        if (options.progress) {
            std::string label = locations.size() == 1
                                    ? "extract"
                                    : "part " + std::to_string(i + 1) + "/" + std::to_string(locations.size());
            copy.progress = options.progress->Callback(label, result.bytes_written, total);
        }
        std::uint64_t copied = filestream::CopyFile(location.path, writer, copy);
        if (copied != location.PayloadLength()) {
            throw IoError("read", location.path, "file changed size while extracting");
        }
        result.slice_checksums.push_back(slice.Finish());
        result.bytes_written += copied;
        result.degraded = result.degraded || location.Degraded();
    }
    writer.Close();
    out.Commit();
    if (options.progress) {
        options.progress->Finish();
    }
    result.checksum = hasher.Finish();
    result.locations = std::move(locations);
    return result;
}

}  // namespace

std::string OffsetSourceName(OffsetSource source) {
    switch (source) {
        case OffsetSource::Signature:
            return "signature";
        case OffsetSource::Recorded:
            return "recorded";
        case OffsetSource::SharedPrefix:
            return "shared-prefix";
        case OffsetSource::Estimated:
            return "estimated";
    }
    return "unknown";
}

PayloadLocation LocatePayload(const std::filesystem::path& path, const ReadOptions& options) {
    std::uint64_t file_size = filestream::FileSize(path);
    if (auto recorded = RecordedLocation(path, file_size, options)) {
        return *recorded;
    }
    return Scan(path, file_size, options);
}

std::vector<PayloadLocation> LocateParts(const std::vector<std::filesystem::path>& parts,
                                         const ReadOptions& options) {
    std::vector<PayloadLocation> locations;
    if (parts.empty()) {
        return locations;
    }
    locations.push_back(LocateFirstPart(parts, options));
    const PayloadLocation first = locations.front();
    for (std::size_t i = 1; i < parts.size(); ++i) {
        std::uint64_t file_size = filestream::FileSize(parts[i]);
        if (first.source == OffsetSource::Recorded) {
            locations.push_back(LocatePayload(parts[i], options));
            continue;
        }
        if (!first.Degraded() && file_size > first.offset
            && SamePrefix(parts.front(), parts[i], first.offset, options.chunk_size)) {
            PayloadLocation location;
            location.path = parts[i];
            location.source = OffsetSource::SharedPrefix;
            location.offset = first.offset;
            location.file_size = file_size;
            locations.push_back(location);
            continue;
        }
        log::Warn("Container prefix of " + parts[i].string() + " differs from the first part; scanning it");
        locations.push_back(Scan(parts[i], file_size, options));
    }
    return locations;
}

ExtractResult ExtractSingle(const std::filesystem::path& polyglot,
                            const std::filesystem::path& output,
                            const ReadOptions& options) {
    RejectSameAsInput(output, {polyglot});
    std::vector<PayloadLocation> locations;
    locations.push_back(LocatePayload(polyglot, options));
    return WriteLocations(std::move(locations), output, options);
}

ExtractResult ExtractAndCombine(const std::vector<std::filesystem::path>& parts,
                                const std::filesystem::path& output,
                                const ReadOptions& options) {
    if (parts.empty()) {
        throw InputError("No parts to combine");
    }
    RejectSameAsInput(output, parts);
    return WriteLocations(LocateParts(parts, options), output, options);
}

Discovery DiscoverParts(const std::filesystem::path& any_part) {
    Discovery discovery;
    auto parsed = split::ParsePartName(any_part);
    if (!parsed) {
        discovery.parts.push_back(any_part);
        return discovery;
    }
    std::filesystem::path dir = any_part.parent_path();
    std::filesystem::path scan_dir = dir.empty() ? std::filesystem::path(".") : dir;
    std::string preferred_ext = ToLower(parsed->extension);

    struct Found {
        std::filesystem::path path;
        std::size_t width = 0;
    };
    std::map<std::size_t, Found> by_number;
    std::vector<std::size_t> duplicates;
    std::error_code ec;
    std::filesystem::directory_iterator it(scan_dir, ec);
    if (ec) {
        throw IoError("list directory", scan_dir, ec.message());
    }
    for (const auto& item : it) {
        if (!item.is_regular_file(ec)) {
            continue;
        }
        auto name = split::ParsePartName(item.path());
        if (!name || name->base_stem != parsed->base_stem || !IsContainerExtension(name->extension)) {
            continue;
        }
        Found found{dir / item.path().filename(), name->width};
        auto existing = by_number.find(name->number);
        if (existing == by_number.end()) {
            by_number.emplace(name->number, found);
            continue;
        }
        if (ToLower(name->extension) == ToLower(existing->second.path.extension().string())) {
            duplicates.push_back(name->number);
        }
        if (ToLower(name->extension) == preferred_ext) {
            existing->second = found;
        }
    }
    if (by_number.empty()) {
        discovery.parts.push_back(any_part);
        return discovery;
    }
    std::size_t highest = by_number.rbegin()->first;
    std::size_t expected_width = split::PartNumberWidth(highest);
    bool mixed_width = false;
    for (std::size_t number = 1; number <= highest; ++number) {
        auto hit = by_number.find(number);
        if (hit == by_number.end()) {
            discovery.missing.push_back(number);
            continue;
        }
        discovery.parts.push_back(hit->second.path);
        mixed_width = mixed_width || hit->second.width != expected_width;
    }

    if (mixed_width) {
        discovery.warnings.push_back("Part numbers next to " + any_part.string()
                                     + " are not all padded to " + std::to_string(expected_width)
                                     + " digit(s); some parts may come from another run");
    }
    std::sort(duplicates.begin(), duplicates.end());
    duplicates.erase(std::unique(duplicates.begin(), duplicates.end()), duplicates.end());
    for (std::size_t number : duplicates) {
        discovery.warnings.push_back("Part " + std::to_string(number) + " appears under more than one name next to "
                                     + any_part.string());
    }
    // Every part but the last has the same size, and the last is never larger.
    if (discovery.missing.empty() && discovery.parts.size() > 1) {
        std::uint64_t full_size = filestream::FileSize(discovery.parts.front());
        for (std::size_t i = 1; i < discovery.parts.size(); ++i) {
            std::uint64_t size = filestream::FileSize(discovery.parts[i]);
            bool last = i + 1 == discovery.parts.size();
            if (last ? size > full_size : size != full_size) {
                discovery.warnings.push_back("Size of " + discovery.parts[i].string()
                                             + " does not fit a single split; parts may be left over from another run");
                break;
            }
        }
    }
    for (const auto& warning : discovery.warnings) {
        log::Warn(warning);
    }
    return discovery;
}

}  // namespace polyvid::reader
