#include "polyvid/file_stream.hpp"

#include "polyvid/cancel.hpp"
#include "polyvid/errors.hpp"

#include <algorithm>
#include <system_error>
#include <vector>

namespace polyvid::filestream {

FileReader::FileReader(const std::filesystem::path& path)
    : path_(path), input_(path, std::ios::binary) {
    if (!input_) {
        throw IoError("open for reading", path);
    }
    input_.seekg(0, std::ios::end);
    auto end = input_.tellg();
    if (end < 0) {
        throw IoError("seek", path);
    }
    total_size_ = static_cast<std::uint64_t>(end);
    input_.seekg(0, std::ios::beg);
}

std::size_t FileReader::ReadChunk(std::uint8_t* buffer, std::size_t max_size) {
    if (max_size == 0 || position_ >= total_size_) {
        return 0;
    }
    input_.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(max_size));
    if (input_.bad()) {
        throw IoError("read", path_);
    }
    std::size_t bytes_read = static_cast<std::size_t>(input_.gcount());
    if (input_.eof()) {
        input_.clear();
    }
    position_ += bytes_read;
    return bytes_read;
}

void FileReader::ReadExact(std::uint8_t* buffer, std::size_t size) {
    std::size_t done = 0;
    while (done < size) {
        std::size_t got = ReadChunk(buffer + done, size - done);
        if (got == 0) {
            throw IoError("read", path_, "unexpected end of file");
        }
        done += got;
    }
}

void FileReader::Seek(std::uint64_t offset) {
    input_.clear();
    input_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!input_) {
        throw IoError("seek", path_);
    }
    position_ = offset;
}

FileWriter::FileWriter(const std::filesystem::path& path, bool append)
    : path_(path),
      output_(path, append ? (std::ios::binary | std::ios::app) : (std::ios::binary | std::ios::trunc)) {
    if (!output_) {
        throw IoError("open for writing", path);
    }
}

FileWriter::~FileWriter() {
    if (output_.is_open()) {
        output_.close();
    }
}

void FileWriter::Write(const std::uint8_t* data, std::size_t size) {
    if (size == 0) {
        return;
    }
    output_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    if (!output_) {
        throw IoError("write", path_);
    }
    bytes_written_ += size;
}

void FileWriter::Close() {
    if (!output_.is_open()) {
        return;
    }
    output_.flush();
    if (!output_) {
        throw IoError("flush", path_);
    }
    output_.close();
    if (output_.fail()) {
        throw IoError("close", path_);
    }
}

std::uint64_t Copy(FileReader& source, FileWriter& destination, const CopyOptions& options) {
    if (options.start_offset >= source.TotalSize() || options.max_bytes == 0) {
        return 0;
    }
    source.Seek(options.start_offset);
    std::uint64_t expected = std::min<std::uint64_t>(source.Remaining(), options.max_bytes);
    std::size_t chunk_size = std::max<std::size_t>(options.chunk_size, 1);
    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(std::min<std::uint64_t>(chunk_size, expected)));

    auto started = std::chrono::steady_clock::now();
    std::uint64_t copied = 0;
    while (copied < expected) {
        cancel::ThrowIfRequested();
        std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(expected - copied, buffer.size()));
        std::size_t got = source.ReadChunk(buffer.data(), want);
        if (got == 0) {
            break;
        }
        destination.Write(buffer.data(), got);
        if (options.observer) {
            options.observer(buffer.data(), got);
        }
        copied += got;
        if (options.progress) {
            CopyProgress progress;
            progress.bytes_copied = copied;
            progress.total_expected = expected;
            progress.elapsed = std::chrono::steady_clock::now() - started;
            options.progress(progress);
        }
    }
    return copied;
}

std::uint64_t CopyFile(const std::filesystem::path& source,
                       FileWriter& destination,
                       const CopyOptions& options) {
    FileReader reader(source);
    return Copy(reader, destination, options);
}

std::uint64_t FileSize(const std::filesystem::path& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw IoError("stat", path, ec.message());
    }
    return static_cast<std::uint64_t>(size);
}

}  // namespace polyvid::filestream
