#pragma once

#include "polyvid/constants.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <limits>

namespace polyvid::filestream {

inline constexpr std::uint64_t kUnbounded = std::numeric_limits<std::uint64_t>::max();

// Sequential binary reader with an explicit position; reports failures as IoError.
class FileReader {
public:
    explicit FileReader(const std::filesystem::path& path);

    // Reads up to max_size bytes, returns bytes read (0 at end of file).
    std::size_t ReadChunk(std::uint8_t* buffer, std::size_t max_size);
    // Reads exactly size bytes or throws IoError.
    void ReadExact(std::uint8_t* buffer, std::size_t size);
    void Seek(std::uint64_t offset);

    std::uint64_t TotalSize() const noexcept { return total_size_; }
    std::uint64_t Remaining() const noexcept {
        return position_ < total_size_ ? total_size_ - position_ : 0;
    }
    bool HasMore() const noexcept { return position_ < total_size_; }
    const std::filesystem::path& Path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    std::ifstream input_;
    std::uint64_t total_size_ = 0;
    std::uint64_t position_ = 0;
};

class FileWriter {
public:
    // Truncates unless append is set.
    explicit FileWriter(const std::filesystem::path& path, bool append = false);
    ~FileWriter();

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;

    void Write(const std::uint8_t* data, std::size_t size);
    // Flushes and closes, surfacing any deferred write error.
    void Close();

    std::uint64_t BytesWritten() const noexcept { return bytes_written_; }
    const std::filesystem::path& Path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    std::ofstream output_;
    std::uint64_t bytes_written_ = 0;
};

struct CopyProgress {
    std::uint64_t bytes_copied = 0;
    std::uint64_t total_expected = 0;
    std::chrono::steady_clock::duration elapsed{};

    double BytesPerSecond() const noexcept {
        double seconds = std::chrono::duration<double>(elapsed).count();
        return seconds > 0.0 ? static_cast<double>(bytes_copied) / seconds : 0.0;
    }
};

using ProgressCallback = std::function<void(const CopyProgress&)>;
// Sees every chunk after it has been written.
using ChunkObserver = std::function<void(const std::uint8_t*, std::size_t)>;

struct CopyOptions {
    std::size_t chunk_size = constants::kDefaultChunkSize;
    std::uint64_t start_offset = 0;
    std::uint64_t max_bytes = kUnbounded;
    ProgressCallback progress;
    ChunkObserver observer;
};

// Copies from source (starting at start_offset) to the writer's current end, one chunk at a
// time, until max_bytes were copied or the source is exhausted. Checks for cancellation
// between chunks. Returns the number of bytes copied.
std::uint64_t Copy(FileReader& source, FileWriter& destination, const CopyOptions& options);

std::uint64_t CopyFile(const std::filesystem::path& source,
                       FileWriter& destination,
                       const CopyOptions& options);

std::uint64_t FileSize(const std::filesystem::path& path);

}  // namespace polyvid::filestream
