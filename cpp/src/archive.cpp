#include "polyvid/archive.hpp"

#include "polyvid/cancel.hpp"
#include "polyvid/constants.hpp"
#include "polyvid/errors.hpp"
#include "polyvid/file_stream.hpp"
#include "polyvid/temp_path.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <cstdint>
#include <cstring>
#include <ctime>
#include <fstream>
#include <set>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include <zlib.h>

#if POLYVID_HAS_LZMA
#include <lzma.h>
#endif

namespace polyvid::archive {

namespace {

using Bytes = std::vector<std::uint8_t>;

constexpr std::size_t kIoChunk = 1 << 16;

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

int ResolveLevel(int level) {
    if (level < 0) {
        return constants::kDefaultDeflateLevel;
    }
    return std::min(level, 9);
}

bool IsSafePath(const std::filesystem::path& dest_dir, const std::string& name) {
    std::filesystem::path rel(name);
    if (rel.is_absolute() || rel.has_root_name() || rel.has_root_directory()) {
        return false;
    }
    for (const auto& part : rel) {
        if (part == "..") {
            return false;
        }
    }
    auto base = dest_dir.lexically_normal();
    auto full = (dest_dir / rel).lexically_normal();
    auto mismatch = std::mismatch(base.begin(), base.end(), full.begin());
    return mismatch.first == base.end();
}

void CheckWritten(const std::ofstream& out, const std::filesystem::path& path) {
    if (!out) {
        throw IoError("write", path);
    }
}

// ---------------------------------------------------------------------------
// ZIP

constexpr std::uint32_t kLocalHeaderSig = 0x04034b50;
constexpr std::uint32_t kCentralHeaderSig = 0x02014b50;
constexpr std::uint32_t kEndOfCentralSig = 0x06054b50;
constexpr std::uint32_t kZip64EndSig = 0x06064b50;
constexpr std::uint32_t kZip64LocatorSig = 0x07064b50;
constexpr std::uint16_t kZip64ExtraId = 0x0001;
constexpr std::uint16_t kFlagEncrypted = 0x0001;
constexpr std::uint16_t kFlagUtf8 = 0x0800;
constexpr std::uint16_t kMethodStored = 0;
constexpr std::uint16_t kMethodDeflate = 8;
constexpr std::uint16_t kVersionDefault = 20;
constexpr std::uint16_t kVersionZip64 = 45;
constexpr std::uint16_t kVersionMadeBy = (3u << 8) | kVersionZip64;
constexpr std::uint32_t kMax32 = 0xFFFFFFFFu;
constexpr std::uint16_t kMax16 = 0xFFFFu;
constexpr std::size_t kLocalHeaderSize = 30;
constexpr std::size_t kCentralHeaderSize = 46;
constexpr std::size_t kEndOfCentralSize = 22;
constexpr std::size_t kZip64EndSize = 56;
constexpr std::size_t kZip64LocatorSize = 20;
constexpr std::size_t kMaxCommentSize = 0xFFFF;
constexpr std::uint64_t kMaxCentralDirectory = 1ull << 30;
// Entries this large reserve ZIP64 size fields up front; deflate may expand data slightly.
constexpr std::uint64_t kZip64Threshold = 0xFFFF0000ull;

struct ZipRecord {
    std::string name;
    std::uint16_t method = kMethodDeflate;
    std::uint16_t flags = kFlagUtf8;
    std::uint32_t crc = 0;
    std::uint64_t compressed = 0;
    std::uint64_t uncompressed = 0;
    std::uint64_t header_offset = 0;
    std::uint16_t dos_time = 0;
    std::uint16_t dos_date = 0;
    bool zip64_local = false;
};

void PutU16(Bytes& out, std::uint16_t value) {
    out.push_back(static_cast<std::uint8_t>(value & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
}

void PutU32(Bytes& out, std::uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<std::uint8_t>((value >> (8 * i)) & 0xFF));
    }
}

void PutU64(Bytes& out, std::uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<std::uint8_t>((value >> (8 * i)) & 0xFF));
    }
}

std::uint16_t GetU16(const std::uint8_t* p) {
    return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}

std::uint32_t GetU32(const std::uint8_t* p) {
    return static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8)
           | (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
}

std::uint64_t GetU64(const std::uint8_t* p) {
    return static_cast<std::uint64_t>(GetU32(p)) | (static_cast<std::uint64_t>(GetU32(p + 4)) << 32);
}

void DosTimestamp(std::uint16_t& dos_time, std::uint16_t& dos_date) {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &now);
#else
    localtime_r(&now, &tm);
#endif
    int year = std::max(tm.tm_year + 1900, 1980);
    dos_time = static_cast<std::uint16_t>((tm.tm_hour << 11) | (tm.tm_min << 5) | (tm.tm_sec / 2));
    dos_date = static_cast<std::uint16_t>(((year - 1980) << 9) | ((tm.tm_mon + 1) << 5) | tm.tm_mday);
}

void WriteBytes(std::ofstream& out, const Bytes& data, const std::filesystem::path& path) {
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    CheckWritten(out, path);
}

void PatchBytes(std::ofstream& out, std::uint64_t offset, const Bytes& data, const std::filesystem::path& path) {
    out.seekp(static_cast<std::streamoff>(offset), std::ios::beg);
    WriteBytes(out, data, path);
}

struct DeflateStream {
    z_stream strm{};
    bool active = false;

    ~DeflateStream() {
        if (active) {
            deflateEnd(&strm);
        }
    }
};

struct InflateStream {
    z_stream strm{};
    bool active = false;

    ~InflateStream() {
        if (active) {
            inflateEnd(&strm);
        }
    }
};

void WriteZipEntryData(std::ofstream& out,
                       const std::filesystem::path& archive_path,
                       const Entry& entry,
                       int level,
                       ZipRecord& record) {
    filestream::FileReader reader(entry.source);
    Bytes in_buf(kIoChunk);
    Bytes out_buf(kIoChunk);
    std::uint32_t crc = static_cast<std::uint32_t>(crc32(0L, Z_NULL, 0));

    if (record.method == kMethodStored) {
        while (true) {
            cancel::ThrowIfRequested();
            std::size_t got = reader.ReadChunk(in_buf.data(), in_buf.size());
            if (got == 0) {
                break;
            }
            crc = static_cast<std::uint32_t>(crc32(crc, in_buf.data(), static_cast<uInt>(got)));
            out.write(reinterpret_cast<const char*>(in_buf.data()), static_cast<std::streamsize>(got));
            CheckWritten(out, archive_path);
            record.uncompressed += got;
        }
        record.compressed = record.uncompressed;
        record.crc = crc;
        return;
    }

    DeflateStream deflater;
    if (deflateInit2(&deflater.strm, level, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("Failed to initialize deflate");
    }
    deflater.active = true;
    int flush = Z_NO_FLUSH;
    do {
        cancel::ThrowIfRequested();
        std::size_t got = reader.ReadChunk(in_buf.data(), in_buf.size());
        crc = static_cast<std::uint32_t>(crc32(crc, in_buf.data(), static_cast<uInt>(got)));
        record.uncompressed += got;
        flush = (got == 0 || !reader.HasMore()) ? Z_FINISH : Z_NO_FLUSH;
        deflater.strm.next_in = in_buf.data();
        deflater.strm.avail_in = static_cast<uInt>(got);
        do {
            deflater.strm.next_out = out_buf.data();
            deflater.strm.avail_out = static_cast<uInt>(out_buf.size());
            int ret = deflate(&deflater.strm, flush);
            if (ret == Z_STREAM_ERROR) {
                throw std::runtime_error("Deflate failed for " + entry.source.string());
            }
            std::size_t have = out_buf.size() - deflater.strm.avail_out;
            if (have > 0) {
                out.write(reinterpret_cast<const char*>(out_buf.data()), static_cast<std::streamsize>(have));
                CheckWritten(out, archive_path);
                record.compressed += have;
            }
        } while (deflater.strm.avail_out == 0);
    } while (flush != Z_FINISH);
    record.crc = crc;
}

ZipRecord WriteZipEntry(std::ofstream& out,
                        const std::filesystem::path& archive_path,
                        const Entry& entry,
                        int level,
                        std::uint64_t offset) {
    ZipRecord record;
    record.name = entry.name;
    record.header_offset = offset;
    record.method = level == 0 ? kMethodStored : kMethodDeflate;
    record.zip64_local = filestream::FileSize(entry.source) >= kZip64Threshold;
    if (record.name.size() > kMax16) {
        throw InputError("Archive entry name too long: " + entry.name);
    }

    DosTimestamp(record.dos_time, record.dos_date);

    Bytes header;
    header.reserve(kLocalHeaderSize + record.name.size() + 20);
    PutU32(header, kLocalHeaderSig);
    PutU16(header, record.zip64_local ? kVersionZip64 : kVersionDefault);
    PutU16(header, record.flags);
    PutU16(header, record.method);
    PutU16(header, record.dos_time);
    PutU16(header, record.dos_date);
    PutU32(header, 0);
    PutU32(header, record.zip64_local ? kMax32 : 0);
    PutU32(header, record.zip64_local ? kMax32 : 0);
    PutU16(header, static_cast<std::uint16_t>(record.name.size()));
    PutU16(header, static_cast<std::uint16_t>(record.zip64_local ? 20 : 0));
    header.insert(header.end(), record.name.begin(), record.name.end());
    if (record.zip64_local) {
        PutU16(header, kZip64ExtraId);
        PutU16(header, 16);
        PutU64(header, 0);
        PutU64(header, 0);
    }
    WriteBytes(out, header, archive_path);

    WriteZipEntryData(out, archive_path, entry, level, record);
    std::uint64_t end = offset + header.size() + record.compressed;

    if (!record.zip64_local && (record.compressed >= kMax32 || record.uncompressed >= kMax32)) {
        throw std::runtime_error("Entry changed size while packing: " + entry.source.string());
    }
    Bytes fields;
    PutU32(fields, record.crc);
    if (!record.zip64_local) {
        PutU32(fields, static_cast<std::uint32_t>(record.compressed));
        PutU32(fields, static_cast<std::uint32_t>(record.uncompressed));
    }
    PatchBytes(out, offset + 14, fields, archive_path);
    if (record.zip64_local) {
        Bytes sizes;
        PutU64(sizes, record.uncompressed);
        PutU64(sizes, record.compressed);
        PatchBytes(out, offset + kLocalHeaderSize + record.name.size() + 4, sizes, archive_path);
    }
    out.seekp(static_cast<std::streamoff>(end), std::ios::beg);
    return record;
}

Bytes BuildCentralHeader(const ZipRecord& record) {
    bool big_uncompressed = record.uncompressed >= kMax32;
    bool big_compressed = record.compressed >= kMax32;
    bool big_offset = record.header_offset >= kMax32;
    bool zip64 = big_uncompressed || big_compressed || big_offset;

    Bytes extra;
    if (zip64) {
        Bytes values;
        if (big_uncompressed) {
            PutU64(values, record.uncompressed);
        }
        if (big_compressed) {
            PutU64(values, record.compressed);
        }
        if (big_offset) {
            PutU64(values, record.header_offset);
        }
        PutU16(extra, kZip64ExtraId);
        PutU16(extra, static_cast<std::uint16_t>(values.size()));
        extra.insert(extra.end(), values.begin(), values.end());
    }

    Bytes header;
    PutU32(header, kCentralHeaderSig);
    PutU16(header, kVersionMadeBy);
    PutU16(header, (zip64 || record.zip64_local) ? kVersionZip64 : kVersionDefault);
    PutU16(header, record.flags);
    PutU16(header, record.method);
    PutU16(header, record.dos_time);
    PutU16(header, record.dos_date);
    PutU32(header, record.crc);
    PutU32(header, big_compressed ? kMax32 : static_cast<std::uint32_t>(record.compressed));
    PutU32(header, big_uncompressed ? kMax32 : static_cast<std::uint32_t>(record.uncompressed));
    PutU16(header, static_cast<std::uint16_t>(record.name.size()));
    PutU16(header, static_cast<std::uint16_t>(extra.size()));
    PutU16(header, 0);
    PutU16(header, 0);
    PutU16(header, 0);
    PutU32(header, 0100644u << 16);
    PutU32(header, big_offset ? kMax32 : static_cast<std::uint32_t>(record.header_offset));
    header.insert(header.end(), record.name.begin(), record.name.end());
    header.insert(header.end(), extra.begin(), extra.end());
    return header;
}

Bytes BuildEndRecords(std::uint64_t entry_count, std::uint64_t cd_offset, std::uint64_t cd_size) {
    Bytes out;
    bool zip64 = entry_count >= kMax16 || cd_offset >= kMax32 || cd_size >= kMax32;
    if (zip64) {
        std::uint64_t zip64_end_offset = cd_offset + cd_size;
        PutU32(out, kZip64EndSig);
        PutU64(out, kZip64EndSize - 12);
        PutU16(out, kVersionMadeBy);
        PutU16(out, kVersionZip64);
        PutU32(out, 0);
        PutU32(out, 0);
        PutU64(out, entry_count);
        PutU64(out, entry_count);
        PutU64(out, cd_size);
        PutU64(out, cd_offset);

        PutU32(out, kZip64LocatorSig);
        PutU32(out, 0);
        PutU64(out, zip64_end_offset);
        PutU32(out, 1);
    }
    PutU32(out, kEndOfCentralSig);
    PutU16(out, 0);
    PutU16(out, 0);
    PutU16(out, static_cast<std::uint16_t>(std::min<std::uint64_t>(entry_count, kMax16)));
    PutU16(out, static_cast<std::uint16_t>(std::min<std::uint64_t>(entry_count, kMax16)));
    PutU32(out, static_cast<std::uint32_t>(std::min<std::uint64_t>(cd_size, kMax32)));
    PutU32(out, static_cast<std::uint32_t>(std::min<std::uint64_t>(cd_offset, kMax32)));
    PutU16(out, 0);
    return out;
}

void WriteZipArchive(const std::vector<Entry>& entries, const std::filesystem::path& zip_path, int level) {
    std::ofstream out(zip_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw IoError("open for writing", zip_path);
    }
    std::vector<ZipRecord> records;
    records.reserve(entries.size());
    std::uint64_t offset = 0;
    for (const auto& entry : entries) {
        ZipRecord record = WriteZipEntry(out, zip_path, entry, level, offset);
        offset = record.header_offset + kLocalHeaderSize + record.name.size()
                 + (record.zip64_local ? 20 : 0) + record.compressed;
        records.push_back(std::move(record));
    }

    std::uint64_t cd_offset = offset;
    std::uint64_t cd_size = 0;
    for (const auto& record : records) {
        Bytes header = BuildCentralHeader(record);
        WriteBytes(out, header, zip_path);
        cd_size += header.size();
    }
    WriteBytes(out, BuildEndRecords(records.size(), cd_offset, cd_size), zip_path);
    out.close();
    if (out.fail()) {
        throw IoError("close", zip_path);
    }
}

struct ZipEntryInfo {
    std::string name;
    std::uint16_t flags = 0;
    std::uint16_t method = 0;
    std::uint32_t crc = 0;
    std::uint64_t compressed = 0;
    std::uint64_t uncompressed = 0;
    std::uint64_t local_offset = 0;
};

void ApplyZip64Extra(const std::uint8_t* extra, std::size_t extra_len, ZipEntryInfo& info,
                     bool need_uncompressed, bool need_compressed, bool need_offset) {
    std::size_t pos = 0;
    while (pos + 4 <= extra_len) {
        std::uint16_t id = GetU16(extra + pos);
        std::uint16_t size = GetU16(extra + pos + 2);
        if (pos + 4 + size > extra_len) {
            break;
        }
        if (id == kZip64ExtraId) {
            const std::uint8_t* field = extra + pos + 4;
            std::size_t used = 0;
            auto take = [&](std::uint64_t& target) {
                if (used + 8 > size) {
                    throw MalformedPayloadError("Truncated ZIP64 extra field for " + info.name);
                }
                target = GetU64(field + used);
                used += 8;
            };
            if (need_uncompressed) {
                take(info.uncompressed);
            }
            if (need_compressed) {
                take(info.compressed);
            }
            if (need_offset) {
                take(info.local_offset);
            }
            return;
        }
        pos += 4 + size;
    }
    if (need_uncompressed || need_compressed || need_offset) {
        throw MalformedPayloadError("Missing ZIP64 extra field for " + info.name);
    }
}

std::vector<ZipEntryInfo> ReadCentralDirectory(filestream::FileReader& reader) {
    const auto& path = reader.Path();
    std::uint64_t file_size = reader.TotalSize();
    if (file_size < kEndOfCentralSize) {
        throw MalformedPayloadError("Not a ZIP archive (too short): " + path.string());
    }
    std::size_t tail_len = static_cast<std::size_t>(
        std::min<std::uint64_t>(file_size, kEndOfCentralSize + kMaxCommentSize));
    std::uint64_t tail_start = file_size - tail_len;
    Bytes tail(tail_len);
    reader.Seek(tail_start);
    reader.ReadExact(tail.data(), tail.size());

    std::size_t eocd = tail_len;
    for (std::size_t i = tail_len - kEndOfCentralSize + 1; i-- > 0;) {
        if (GetU32(tail.data() + i) == kEndOfCentralSig
            && i + kEndOfCentralSize + GetU16(tail.data() + i + 20) <= tail_len) {
            eocd = i;
            break;
        }
    }
    if (eocd == tail_len) {
        throw MalformedPayloadError("ZIP end of central directory not found: " + path.string());
    }
    std::uint64_t eocd_pos = tail_start + eocd;
    const std::uint8_t* rec = tail.data() + eocd;
    std::uint64_t entry_count = GetU16(rec + 10);
    std::uint64_t cd_size = GetU32(rec + 12);
    std::uint64_t cd_offset = GetU32(rec + 16);

    // Data may sit behind a prefix (for example a media container), so all recorded
    // offsets are shifted by the distance between where the directory is and where it claims to be.
    std::int64_t bias = 0;
    std::uint64_t cd_start = 0;
    bool located = false;
    bool wants_zip64 = entry_count == kMax16 || cd_size == kMax32 || cd_offset == kMax32;
    if (wants_zip64 && eocd_pos >= kZip64LocatorSize + kZip64EndSize) {
        std::uint8_t locator[kZip64LocatorSize];
        reader.Seek(eocd_pos - kZip64LocatorSize);
        reader.ReadExact(locator, sizeof(locator));
        if (GetU32(locator) == kZip64LocatorSig) {
            std::uint64_t recorded = GetU64(locator + 8);
            std::uint64_t actual = eocd_pos - kZip64LocatorSize - kZip64EndSize;
            std::uint8_t end64[kZip64EndSize];
            reader.Seek(actual);
            reader.ReadExact(end64, sizeof(end64));
            if (GetU32(end64) != kZip64EndSig) {
                throw MalformedPayloadError("Corrupt ZIP64 end record: " + path.string());
            }
            bias = static_cast<std::int64_t>(actual) - static_cast<std::int64_t>(recorded);
            entry_count = GetU64(end64 + 32);
            cd_size = GetU64(end64 + 40);
            cd_offset = GetU64(end64 + 48);
            cd_start = static_cast<std::uint64_t>(static_cast<std::int64_t>(cd_offset) + bias);
            located = true;
        }
    }
    if (!located) {
        if (cd_size > eocd_pos) {
            throw MalformedPayloadError("Corrupt ZIP central directory size: " + path.string());
        }
        cd_start = eocd_pos - cd_size;
        bias = static_cast<std::int64_t>(cd_start) - static_cast<std::int64_t>(cd_offset);
    }
    if (bias < 0 || cd_size > kMaxCentralDirectory || cd_start + cd_size > file_size) {
        throw MalformedPayloadError("Corrupt ZIP central directory: " + path.string());
    }

    Bytes cd(static_cast<std::size_t>(cd_size));
    reader.Seek(cd_start);
    reader.ReadExact(cd.data(), cd.size());

    std::vector<ZipEntryInfo> entries;
    std::size_t pos = 0;
    for (std::uint64_t i = 0; i < entry_count; ++i) {
        if (pos + kCentralHeaderSize > cd.size() || GetU32(cd.data() + pos) != kCentralHeaderSig) {
            throw MalformedPayloadError("Corrupt ZIP central directory entry: " + path.string());
        }
        const std::uint8_t* h = cd.data() + pos;
        ZipEntryInfo info;
        info.flags = GetU16(h + 8);
        info.method = GetU16(h + 10);
        info.crc = GetU32(h + 16);
        info.compressed = GetU32(h + 20);
        info.uncompressed = GetU32(h + 24);
        std::size_t name_len = GetU16(h + 28);
        std::size_t extra_len = GetU16(h + 30);
        std::size_t comment_len = GetU16(h + 32);
        info.local_offset = GetU32(h + 42);
        if (pos + kCentralHeaderSize + name_len + extra_len + comment_len > cd.size()) {
            throw MalformedPayloadError("Corrupt ZIP central directory entry: " + path.string());
        }
        info.name.assign(reinterpret_cast<const char*>(h + kCentralHeaderSize), name_len);
        ApplyZip64Extra(h + kCentralHeaderSize + name_len, extra_len, info,
                        info.uncompressed == kMax32, info.compressed == kMax32, info.local_offset == kMax32);
        info.local_offset += static_cast<std::uint64_t>(bias);
        entries.push_back(std::move(info));
        pos += kCentralHeaderSize + name_len + extra_len + comment_len;
    }
    return entries;
}

void ExtractZipEntry(filestream::FileReader& reader,
                     const ZipEntryInfo& info,
                     const std::filesystem::path& out_path) {
    if (info.flags & kFlagEncrypted) {
        throw MalformedPayloadError("Encrypted ZIP entries are not supported: " + info.name);
    }
    if (info.method != kMethodStored && info.method != kMethodDeflate) {
        throw MalformedPayloadError("Unsupported ZIP compression method " + std::to_string(info.method)
                                    + " for " + info.name);
    }
    std::uint8_t local[kLocalHeaderSize];
    reader.Seek(info.local_offset);
    reader.ReadExact(local, sizeof(local));
    if (GetU32(local) != kLocalHeaderSig) {
        throw MalformedPayloadError("Corrupt ZIP local header for " + info.name);
    }
    std::uint64_t data_offset = info.local_offset + kLocalHeaderSize + GetU16(local + 26) + GetU16(local + 28);
    if (data_offset + info.compressed > reader.TotalSize()) {
        throw MalformedPayloadError("Truncated ZIP entry: " + info.name);
    }
    reader.Seek(data_offset);

    filestream::FileWriter writer(out_path);
    Bytes in_buf(kIoChunk);
    Bytes out_buf(kIoChunk);
    std::uint32_t crc = static_cast<std::uint32_t>(crc32(0L, Z_NULL, 0));
    std::uint64_t produced = 0;
    std::uint64_t remaining = info.compressed;

    if (info.method == kMethodStored) {
        while (remaining > 0) {
            cancel::ThrowIfRequested();
            std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, in_buf.size()));
            reader.ReadExact(in_buf.data(), want);
            crc = static_cast<std::uint32_t>(crc32(crc, in_buf.data(), static_cast<uInt>(want)));
            writer.Write(in_buf.data(), want);
            produced += want;
            remaining -= want;
        }
    } else {
        InflateStream inflater;
        if (inflateInit2(&inflater.strm, -MAX_WBITS) != Z_OK) {
            throw std::runtime_error("Failed to initialize inflate");
        }
        inflater.active = true;
        int ret = Z_OK;
        while (ret != Z_STREAM_END) {
            cancel::ThrowIfRequested();
            if (inflater.strm.avail_in == 0) {
                if (remaining == 0) {
                    throw MalformedPayloadError("Truncated deflate stream for " + info.name);
                }
                std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, in_buf.size()));
                reader.ReadExact(in_buf.data(), want);
                remaining -= want;
                inflater.strm.next_in = in_buf.data();
                inflater.strm.avail_in = static_cast<uInt>(want);
            }
            inflater.strm.next_out = out_buf.data();
            inflater.strm.avail_out = static_cast<uInt>(out_buf.size());
            ret = inflate(&inflater.strm, Z_NO_FLUSH);
            if (ret != Z_OK && ret != Z_STREAM_END) {
                throw MalformedPayloadError("Corrupt deflate stream for " + info.name);
            }
            std::size_t have = out_buf.size() - inflater.strm.avail_out;
            crc = static_cast<std::uint32_t>(crc32(crc, out_buf.data(), static_cast<uInt>(have)));
            writer.Write(out_buf.data(), have);
            produced += have;
        }
    }
    writer.Close();
    if (produced != info.uncompressed || crc != info.crc) {
        throw MalformedPayloadError("CRC or size mismatch in ZIP entry: " + info.name);
    }
}

std::filesystem::path ExtractZip(const std::filesystem::path& zip_path, const std::filesystem::path& dest_dir) {
    filestream::FileReader reader(zip_path);
    auto entries = ReadCentralDirectory(reader);
    std::set<std::string> roots;
    for (const auto& info : entries) {
        if (info.name.empty()) {
            continue;
        }
        if (!IsSafePath(dest_dir, info.name)) {
            throw MalformedPayloadError("Unsafe ZIP entry detected: " + info.name);
        }
        std::filesystem::path rel(info.name);
        roots.insert((*rel.begin()).string());
        std::filesystem::path out_path = dest_dir / rel;
        std::error_code ec;
        if (info.name.back() == '/') {
            std::filesystem::create_directories(out_path, ec);
            continue;
        }
        std::filesystem::create_directories(out_path.parent_path(), ec);
        if (ec) {
            throw IoError("create directory", out_path.parent_path(), ec.message());
        }
        ExtractZipEntry(reader, info, out_path);
    }
    if (roots.size() == 1) {
        return dest_dir / *roots.begin();
    }
    return dest_dir;
}

// ---------------------------------------------------------------------------
// TAR (+ gzip / xz)

constexpr std::size_t kTarBlockSize = 512;

struct TarHeader {
    char name[100];
    char mode[8];
    char uid[8];
    char gid[8];
    char size[12];
    char mtime[12];
    char chksum[8];
    char typeflag;
    char linkname[100];
    char magic[6];
    char version[2];
    char uname[32];
    char gname[32];
    char devmajor[8];
    char devminor[8];
    char prefix[155];
    char pad[12];
};

static_assert(sizeof(TarHeader) == kTarBlockSize, "Tar header must be 512 bytes");

void WriteOctal(char* dest, std::size_t size, std::uint64_t value) {
    std::snprintf(dest, size, "%0*llo", static_cast<int>(size - 1),
                  static_cast<unsigned long long>(value));
}

std::uint64_t ParseOctal(const char* data, std::size_t size) {
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < size; ++i) {
        char ch = data[i];
        if (ch == '\0' || ch == ' ') {
            continue;
        }
        if (ch < '0' || ch > '7') {
            break;
        }
        value = (value << 3) + static_cast<std::uint64_t>(ch - '0');
    }
    return value;
}

bool SplitTarName(const std::string& full, std::string& name, std::string& prefix) {
    if (full.size() <= sizeof(TarHeader::name)) {
        name = full;
        prefix.clear();
        return true;
    }
    if (full.size() > sizeof(TarHeader::name) + sizeof(TarHeader::prefix)) {
        return false;
    }
    auto pos = full.rfind('/');
    while (pos != std::string::npos) {
        std::string candidate_prefix = full.substr(0, pos);
        std::string candidate_name = full.substr(pos + 1);
        if (candidate_name.size() <= sizeof(TarHeader::name)
            && candidate_prefix.size() <= sizeof(TarHeader::prefix)) {
            name = candidate_name;
            prefix = candidate_prefix;
            return true;
        }
        if (pos == 0) {
            break;
        }
        pos = full.rfind('/', pos - 1);
    }
    return false;
}

void WriteTarHeader(std::ofstream& out, const std::string& entry_name, std::uint64_t size) {
    TarHeader header{};
    std::string name_field;
    std::string prefix_field;
    if (!SplitTarName(entry_name, name_field, prefix_field)) {
        throw InputError("Tar entry name too long: " + entry_name);
    }
    std::memcpy(header.name, name_field.c_str(), name_field.size());
    std::memcpy(header.prefix, prefix_field.c_str(), prefix_field.size());
    WriteOctal(header.mode, sizeof(header.mode), 0644);
    WriteOctal(header.uid, sizeof(header.uid), 0);
    WriteOctal(header.gid, sizeof(header.gid), 0);
    WriteOctal(header.size, sizeof(header.size), size);
    WriteOctal(header.mtime, sizeof(header.mtime),
               static_cast<std::uint64_t>(std::time(nullptr)));
    header.typeflag = '0';
    std::memcpy(header.magic, "ustar", 5);
    std::memcpy(header.version, "00", 2);

    std::memset(header.chksum, ' ', sizeof(header.chksum));
    unsigned int sum = 0;
    const unsigned char* bytes = reinterpret_cast<const unsigned char*>(&header);
    for (std::size_t i = 0; i < sizeof(TarHeader); ++i) {
        sum += bytes[i];
    }
    std::snprintf(header.chksum, sizeof(header.chksum), "%06o", sum);
    header.chksum[6] = '\0';
    header.chksum[7] = ' ';

    out.write(reinterpret_cast<const char*>(&header), sizeof(TarHeader));
}

void WriteTarArchive(const std::vector<Entry>& entries, const std::filesystem::path& tar_path) {
    std::ofstream out(tar_path, std::ios::binary);
    if (!out) {
        throw IoError("open for writing", tar_path);
    }
    std::array<char, 1 << 16> buffer{};
    for (const auto& entry : entries) {
        std::uint64_t size = filestream::FileSize(entry.source);
        WriteTarHeader(out, entry.name, size);
        std::ifstream input(entry.source, std::ios::binary);
        if (!input) {
            throw IoError("open for reading", entry.source);
        }
        std::uint64_t remaining = size;
        while (remaining > 0) {
            cancel::ThrowIfRequested();
            std::size_t chunk = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, buffer.size()));
            input.read(buffer.data(), static_cast<std::streamsize>(chunk));
            if (input.gcount() != static_cast<std::streamsize>(chunk)) {
                throw IoError("read", entry.source);
            }
            out.write(buffer.data(), static_cast<std::streamsize>(chunk));
            remaining -= chunk;
        }
        std::size_t pad = static_cast<std::size_t>((kTarBlockSize - (size % kTarBlockSize)) % kTarBlockSize);
        if (pad) {
            std::array<char, kTarBlockSize> zeros{};
            out.write(zeros.data(), static_cast<std::streamsize>(pad));
        }
        CheckWritten(out, tar_path);
    }
    std::array<char, kTarBlockSize> zeros{};
    out.write(zeros.data(), static_cast<std::streamsize>(zeros.size()));
    out.write(zeros.data(), static_cast<std::streamsize>(zeros.size()));
    CheckWritten(out, tar_path);
}

bool IsAllZero(const TarHeader& header) {
    const unsigned char* bytes = reinterpret_cast<const unsigned char*>(&header);
    for (std::size_t i = 0; i < sizeof(TarHeader); ++i) {
        if (bytes[i] != 0) {
            return false;
        }
    }
    return true;
}

std::string ExtractName(const TarHeader& header) {
    std::string name(header.name, header.name + sizeof(header.name));
    name = name.c_str();
    std::string prefix(header.prefix, header.prefix + sizeof(header.prefix));
    prefix = prefix.c_str();
    if (!prefix.empty()) {
        return prefix + "/" + name;
    }
    return name;
}

void SkipOrCopy(std::ifstream& input, std::uint64_t size, std::ofstream* output, const std::filesystem::path& out_path) {
    std::array<char, 1 << 16> buffer{};
    std::uint64_t remaining = size;
    while (remaining > 0) {
        std::size_t chunk = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, buffer.size()));
        input.read(buffer.data(), static_cast<std::streamsize>(chunk));
        if (input.gcount() != static_cast<std::streamsize>(chunk)) {
            throw MalformedPayloadError("Truncated tar archive");
        }
        if (output) {
            output->write(buffer.data(), static_cast<std::streamsize>(chunk));
            CheckWritten(*output, out_path);
        }
        remaining -= chunk;
    }
    std::size_t pad = static_cast<std::size_t>((kTarBlockSize - (size % kTarBlockSize)) % kTarBlockSize);
    if (pad) {
        input.seekg(static_cast<std::streamoff>(pad), std::ios::cur);
    }
}

// Walks the tar; with an empty dest_dir only names are collected.
std::vector<std::string> WalkTar(const std::filesystem::path& tar_path,
                                 const std::filesystem::path& dest_dir,
                                 std::set<std::string>* roots) {
    std::ifstream input(tar_path, std::ios::binary);
    if (!input) {
        throw IoError("open for reading", tar_path);
    }
    std::vector<std::string> names;
    bool saw_end = false;
    while (true) {
        TarHeader header{};
        input.read(reinterpret_cast<char*>(&header), sizeof(header));
        if (input.gcount() == 0) {
            break;
        }
        if (input.gcount() != static_cast<std::streamsize>(sizeof(header))) {
            throw MalformedPayloadError("Truncated tar archive");
        }
        if (IsAllZero(header)) {
            saw_end = true;
            break;
        }
        if (std::memcmp(header.magic, "ustar", 5) != 0) {
            throw MalformedPayloadError("Not a ustar archive");
        }
        cancel::ThrowIfRequested();
        std::string name = ExtractName(header);
        std::uint64_t size = ParseOctal(header.size, sizeof(header.size));
        char type = header.typeflag;
        if (name.empty()) {
            SkipOrCopy(input, size, nullptr, {});
            continue;
        }
        names.push_back(name);
        if (dest_dir.empty()) {
            SkipOrCopy(input, type == '5' ? 0 : size, nullptr, {});
            continue;
        }
        if (!IsSafePath(dest_dir, name)) {
            throw MalformedPayloadError("Unsafe tar entry detected: " + name);
        }
        std::filesystem::path rel(name);
        if (roots) {
            roots->insert((*rel.begin()).string());
        }
        std::filesystem::path out_path = dest_dir / rel;
        std::error_code ec;
        if (type == '5') {
            std::filesystem::create_directories(out_path, ec);
        } else if (type == '0' || type == '\0') {
            std::filesystem::create_directories(out_path.parent_path(), ec);
            std::ofstream output(out_path, std::ios::binary);
            if (!output) {
                throw IoError("open for writing", out_path);
            }
            SkipOrCopy(input, size, &output, out_path);
        } else {
            SkipOrCopy(input, size, nullptr, {});
        }
    }
    if (!saw_end && names.empty()) {
        throw MalformedPayloadError("Empty or invalid tar archive: " + tar_path.string());
    }
    return names;
}

void CompressGzip(const std::filesystem::path& input,
                  const std::filesystem::path& output,
                  int level) {
    std::ifstream in(input, std::ios::binary);
    if (!in) {
        throw IoError("open for reading", input);
    }
    std::string mode = "wb" + std::to_string(level);
    gzFile gz = gzopen(output.string().c_str(), mode.c_str());
    if (!gz) {
        throw IoError("open for writing", output);
    }
    std::array<char, 1 << 16> buffer{};
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = in.gcount();
        if (got > 0) {
            int written = gzwrite(gz, buffer.data(), static_cast<unsigned int>(got));
            if (written == 0) {
                gzclose(gz);
                throw IoError("write", output, "gzip");
            }
        }
    }
    if (gzclose(gz) != Z_OK) {
        throw IoError("close", output, "gzip");
    }
}

void DecompressGzip(const std::filesystem::path& input,
                    const std::filesystem::path& output) {
    gzFile gz = gzopen(input.string().c_str(), "rb");
    if (!gz) {
        throw IoError("open for reading", input);
    }
    std::ofstream out(output, std::ios::binary);
    if (!out) {
        gzclose(gz);
        throw IoError("open for writing", output);
    }
    std::array<char, 1 << 16> buffer{};
    int read_bytes = 0;
    while ((read_bytes = gzread(gz, buffer.data(), static_cast<unsigned int>(buffer.size()))) > 0) {
        out.write(buffer.data(), read_bytes);
    }
    if (read_bytes < 0) {
        gzclose(gz);
        throw MalformedPayloadError("Corrupt gzip stream: " + input.string());
    }
    gzclose(gz);
}

#if POLYVID_HAS_LZMA
void CompressXz(const std::filesystem::path& input, const std::filesystem::path& output, int level) {
    std::ifstream in(input, std::ios::binary);
    if (!in) {
        throw IoError("open for reading", input);
    }
    std::ofstream out(output, std::ios::binary);
    if (!out) {
        throw IoError("open for writing", output);
    }
    lzma_stream strm = LZMA_STREAM_INIT;
    lzma_ret ret = lzma_easy_encoder(&strm, static_cast<std::uint32_t>(level), LZMA_CHECK_CRC64);
    if (ret != LZMA_OK) {
        throw std::runtime_error("Failed to initialize xz encoder");
    }
    std::array<std::uint8_t, 1 << 16> in_buf{};
    std::array<std::uint8_t, 1 << 16> out_buf{};
    while (true) {
        in.read(reinterpret_cast<char*>(in_buf.data()), static_cast<std::streamsize>(in_buf.size()));
        std::streamsize got = in.gcount();
        strm.next_in = in_buf.data();
        strm.avail_in = static_cast<std::size_t>(got);
        lzma_action action = in.eof() ? LZMA_FINISH : LZMA_RUN;
        do {
            strm.next_out = out_buf.data();
            strm.avail_out = out_buf.size();
            ret = lzma_code(&strm, action);
            if (ret != LZMA_OK && ret != LZMA_STREAM_END) {
                lzma_end(&strm);
                throw std::runtime_error("XZ compression failed");
            }
            std::size_t write_size = out_buf.size() - strm.avail_out;
            if (write_size > 0) {
                out.write(reinterpret_cast<char*>(out_buf.data()),
                          static_cast<std::streamsize>(write_size));
            }
        } while (strm.avail_out == 0);
        if (ret == LZMA_STREAM_END) {
            break;
        }
    }
    lzma_end(&strm);
    CheckWritten(out, output);
}

void DecompressXz(const std::filesystem::path& input, const std::filesystem::path& output) {
    std::ifstream in(input, std::ios::binary);
    if (!in) {
        throw IoError("open for reading", input);
    }
    std::ofstream out(output, std::ios::binary);
    if (!out) {
        throw IoError("open for writing", output);
    }
    lzma_stream strm = LZMA_STREAM_INIT;
    lzma_ret ret = lzma_stream_decoder(&strm, UINT64_MAX, 0);
    if (ret != LZMA_OK) {
        throw std::runtime_error("Failed to initialize xz decoder");
    }
    std::array<std::uint8_t, 1 << 16> in_buf{};
    std::array<std::uint8_t, 1 << 16> out_buf{};
    bool eof = false;
    while (true) {
        if (strm.avail_in == 0 && !eof) {
            in.read(reinterpret_cast<char*>(in_buf.data()), static_cast<std::streamsize>(in_buf.size()));
            std::streamsize got = in.gcount();
            if (got == 0) {
                eof = true;
            } else {
                strm.next_in = in_buf.data();
                strm.avail_in = static_cast<std::size_t>(got);
            }
        }
        strm.next_out = out_buf.data();
        strm.avail_out = out_buf.size();
        ret = lzma_code(&strm, eof ? LZMA_FINISH : LZMA_RUN);
        if (ret != LZMA_OK && ret != LZMA_STREAM_END) {
            lzma_end(&strm);
            throw MalformedPayloadError("Corrupt xz stream: " + input.string());
        }
        std::size_t write_size = out_buf.size() - strm.avail_out;
        if (write_size > 0) {
            out.write(reinterpret_cast<char*>(out_buf.data()),
                      static_cast<std::streamsize>(write_size));
        }
        if (ret == LZMA_STREAM_END) {
            break;
        }
        if (eof && strm.avail_in == 0 && write_size == 0) {
            lzma_end(&strm);
            throw MalformedPayloadError("Truncated xz stream: " + input.string());
        }
    }
    lzma_end(&strm);
}
#endif

void CompressTar(const std::filesystem::path& tar_path,
                 const std::filesystem::path& archive_path,
                 Format format,
                 int level) {
    if (format == Format::Tgz) {
        CompressGzip(tar_path, archive_path, ResolveLevel(level));
        return;
    }
#if POLYVID_HAS_LZMA
    CompressXz(tar_path, archive_path, ResolveLevel(level));
#else
    (void)level;
    throw InputError("XZ support unavailable (liblzma missing)");
#endif
}

void DecompressTar(const std::filesystem::path& archive_path,
                   const std::filesystem::path& tar_path,
                   Format format) {
    if (format == Format::Tgz) {
        DecompressGzip(archive_path, tar_path);
        return;
    }
#if POLYVID_HAS_LZMA
    DecompressXz(archive_path, tar_path);
#else
    throw InputError("XZ support unavailable (liblzma missing)");
#endif
}

void ValidateEntries(const std::vector<Entry>& entries) {
    if (entries.empty()) {
        throw InputError("Nothing to pack");
    }
    std::set<std::string> seen;
    for (const auto& entry : entries) {
        if (entry.name.empty()) {
            throw InputError("Empty archive entry name for " + entry.source.string());
        }
        if (!IsSafePath("root", entry.name)) {
            throw InputError("Archive entry name escapes the archive: " + entry.name);
        }
        if (!seen.insert(entry.name).second) {
            throw InputError("Duplicate archive entry name: " + entry.name);
        }
    }
}

Format RequireFormat(const std::filesystem::path& archive) {
    auto format = DetectFormat(archive);
    if (!format) {
        throw MalformedPayloadError("Unrecognized archive format: " + archive.string());
    }
    return *format;
}

}  // namespace

Format FormatFromName(const std::string& name) {
    std::string lower = ToLower(name);
    if (!lower.empty() && lower[0] == '.') {
        lower.erase(0, 1);
    }
    if (lower == "zip") {
        return Format::Zip;
    }
    if (lower == "tgz" || lower == "tar.gz" || lower == "gzip") {
        return Format::Tgz;
    }
    if (lower == "txz" || lower == "tar.xz" || lower == "xz") {
        return Format::Txz;
    }
    throw InputError("Unknown archive format: " + name);
}

std::string FormatName(Format format) {
    switch (format) {
        case Format::Zip:
            return "zip";
        case Format::Tgz:
            return "tgz";
        case Format::Txz:
            return "txz";
    }
    return "unknown";
}

std::string FormatExtension(Format format) {
    switch (format) {
        case Format::Zip:
            return std::string(constants::kZipExt);
        case Format::Tgz:
            return std::string(constants::kPackTgzExt);
        case Format::Txz:
            return std::string(constants::kPackTxzExt);
    }
    return {};
}

std::vector<std::uint8_t> Signature(Format format) {
    std::string_view sig;
    switch (format) {
        case Format::Zip:
            sig = constants::kZipSignature;
            break;
        case Format::Tgz:
            sig = constants::kGzipSignature;
            break;
        case Format::Txz:
            sig = constants::kXzSignature;
            break;
    }
    return std::vector<std::uint8_t>(sig.begin(), sig.end());
}

std::optional<Format> DetectFormat(const std::filesystem::path& path) {
    filestream::FileReader reader(path);
    std::array<std::uint8_t, 8> head{};
    std::size_t got = 0;
    while (got < head.size()) {
        std::size_t n = reader.ReadChunk(head.data() + got, head.size() - got);
        if (n == 0) {
            break;
        }
        got += n;
    }
    for (Format format : {Format::Zip, Format::Tgz, Format::Txz}) {
        auto sig = Signature(format);
        if (got >= sig.size() && std::equal(sig.begin(), sig.end(), head.begin())) {
            return format;
        }
    }
    return std::nullopt;
}

bool LooksLikeArchiveName(const std::filesystem::path& path) {
    std::string ext = ToLower(path.extension().string());
    for (std::string_view known : constants::kArchiveExts) {
        if (ext == known) {
            return true;
        }
    }
    return false;
}

bool Available(Format format) {
    if (format == Format::Txz) {
        return POLYVID_HAS_LZMA != 0;
    }
    return true;
}

void Pack(const std::vector<Entry>& entries,
          Format format,
          const std::filesystem::path& destination,
          int level) {
    ValidateEntries(entries);
    if (format == Format::Zip) {
        WriteZipArchive(entries, destination, ResolveLevel(level));
        return;
    }
    temp::TempDir work("polyvid-tar", destination.parent_path());
    auto tar_path = work / "payload.tar";
    WriteTarArchive(entries, tar_path);
    CompressTar(tar_path, destination, format, level);
}

std::vector<std::string> ListEntries(const std::filesystem::path& archive) {
    return ListEntries(archive, RequireFormat(archive));
}

std::vector<std::string> ListEntries(const std::filesystem::path& archive, Format format) {
    if (format == Format::Zip) {
        filestream::FileReader reader(archive);
        std::vector<std::string> names;
        for (auto& info : ReadCentralDirectory(reader)) {
            names.push_back(std::move(info.name));
        }
        return names;
    }
    temp::TempDir work("polyvid-list");
    auto tar_path = work / "payload.tar";
    DecompressTar(archive, tar_path, format);
    return WalkTar(tar_path, {}, nullptr);
}

std::filesystem::path Unpack(const std::filesystem::path& archive, const std::filesystem::path& dest_dir) {
    return Unpack(archive, RequireFormat(archive), dest_dir);
}

std::filesystem::path Unpack(const std::filesystem::path& archive,
                             Format format,
                             const std::filesystem::path& dest_dir) {
    std::error_code ec;
    std::filesystem::create_directories(dest_dir, ec);
    if (ec) {
        throw IoError("create directory", dest_dir, ec.message());
    }
    if (format == Format::Zip) {
        return ExtractZip(archive, dest_dir);
    }
    temp::TempDir work("polyvid-unpack");
    auto tar_path = work / "payload.tar";
    DecompressTar(archive, tar_path, format);
    std::set<std::string> roots;
    WalkTar(tar_path, dest_dir, &roots);
    if (roots.size() == 1) {
        return dest_dir / *roots.begin();
    }
    return dest_dir;
}

}  // namespace polyvid::archive
