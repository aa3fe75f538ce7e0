#include "polyvid/signature.hpp"

#include "polyvid/file_stream.hpp"

#include <algorithm>

namespace polyvid::signature {

Bytes FromString(std::string_view text) {
    return Bytes(text.begin(), text.end());
}

ScanResult Scan(const std::uint8_t* data, std::size_t size, const Bytes& signature) {
    ScanResult result;
    if (signature.empty() || size < signature.size()) {
        return result;
    }
    const std::uint8_t* end = data + size;
    const std::uint8_t* hit = std::search(data, end, signature.begin(), signature.end());
    if (hit != end) {
        result.found = true;
        result.offset = static_cast<std::uint64_t>(hit - data);
    }
    return result;
}

ScanResult Scan(const Bytes& data, const Bytes& signature) {
    return Scan(data.data(), data.size(), signature);
}

ScanResult ScanFile(const std::filesystem::path& path,
                    const Bytes& signature,
                    std::uint64_t start_offset,
                    std::size_t chunk_size) {
    ScanResult result;
    if (signature.empty()) {
        return result;
    }
    filestream::FileReader reader(path);
    if (start_offset >= reader.TotalSize()) {
        return result;
    }
    reader.Seek(start_offset);

    // Keep the last signature.size() - 1 bytes of each window so straddling matches are seen.
    std::size_t overlap = signature.size() - 1;
    chunk_size = std::max(chunk_size, signature.size());
    std::vector<std::uint8_t> window(overlap + chunk_size);
    std::size_t carried = 0;
    std::uint64_t window_start = start_offset;
    while (true) {
        std::size_t got = reader.ReadChunk(window.data() + carried, chunk_size);
        if (got == 0) {
            break;
        }
        std::size_t filled = carried + got;
        ScanResult local = Scan(window.data(), filled, signature);
        if (local.found) {
            result.found = true;
            result.offset = window_start + local.offset;
            return result;
        }
        std::size_t keep = std::min(overlap, filled);
        std::copy(window.begin() + static_cast<std::ptrdiff_t>(filled - keep),
                  window.begin() + static_cast<std::ptrdiff_t>(filled),
                  window.begin());
        window_start += filled - keep;
        carried = keep;
    }
    return result;
}

bool MatchesAt(const std::filesystem::path& path, const Bytes& signature, std::uint64_t offset) {
    if (signature.empty()) {
        return false;
    }
    filestream::FileReader reader(path);
    if (offset > reader.TotalSize() || reader.TotalSize() - offset < signature.size()) {
        return false;
    }
    reader.Seek(offset);
    Bytes head(signature.size());
    reader.ReadExact(head.data(), head.size());
    return head == signature;
}

std::uint64_t EstimateOffset(std::uint64_t data_length, std::uint64_t divisor) {
    if (divisor == 0) {
        divisor = constants::kFallbackDivisor;
    }
    return data_length / divisor;
}

}  // namespace polyvid::signature
