#include "polyvid/recovery.hpp"

#include "polyvid/constants.hpp"
#include "polyvid/errors.hpp"
#include "polyvid/split_plan.hpp"
#include "polyvid/temp_path.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <limits>
#include <sstream>
#include <utility>

namespace polyvid::recovery {

namespace {

std::string UtcTimestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t tt = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    char buffer[32];
    if (std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm) == 0) {
        return {};
    }
    return std::string(buffer);
}

std::string Trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r");
    if (begin == std::string::npos) {
        return {};
    }
    auto end = value.find_last_not_of(" \t\r");
    return value.substr(begin, end - begin + 1);
}

std::string PartKey(std::size_t number, const char* field) {
    return "part." + std::to_string(number) + "." + field;
}

const std::string& Require(const MetadataMap& meta, const std::string& key) {
    auto it = meta.find(key);
    if (it == meta.end() || it->second.empty()) {
        throw InputError("Recovery metadata is missing '" + key + "'");
    }
    return it->second;
}

std::uint64_t ParseUnsigned(const MetadataMap& meta, const std::string& key) {
    const std::string& text = Require(meta, key);
    std::uint64_t value = 0;
    for (char ch : text) {
        if (ch < '0' || ch > '9') {
            throw InputError("Recovery metadata '" + key + "' is not a number: " + text);
        }
        auto digit = static_cast<std::uint64_t>(ch - '0');
        if (value > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
            throw InputError("Recovery metadata '" + key + "' is out of range: " + text);
        }
        value = value * 10 + digit;
    }
    return value;
}

digest::Hash ParseHash(const MetadataMap& meta, const std::string& key, digest::HashAlgorithm algorithm) {
    digest::Hash hash = digest::FromHex(Require(meta, key));
    if (hash.size() != digest::DigestSize(algorithm)) {
        throw InputError("Recovery metadata '" + key + "' has the wrong length for "
                         + digest::AlgorithmName(algorithm));
    }
    return hash;
}

void CheckSingleLine(const std::string& key, const std::string& value) {
    if (value.find_first_of("\r\n") != std::string::npos) {
        throw InputError("Recovery metadata value for '" + key + "' contains a line break");
    }
}

void CheckPlainFileName(const std::string& key, const std::string& name) {
    std::filesystem::path path(name);
    if (name == "." || name == ".." || path.has_parent_path() || path.is_absolute()
        || name.find('\\') != std::string::npos) {
        throw InputError("Recovery metadata '" + key + "' must be a plain file name: " + name);
    }
}

}  // namespace

std::vector<digest::Hash> RecoveryMetadata::PartChecksums() const {
    std::vector<digest::Hash> out;
    if (!IsSplit()) {
        return out;
    }
    for (const auto& part : parts) {
        out.push_back(part.checksum);
    }
    return out;
}

std::vector<std::string> RecoveryMetadata::PartFileNames() const {
    std::vector<std::string> out;
    for (const auto& part : parts) {
        out.push_back(part.file);
    }
    return out;
}

std::string Serialize(const RecoveryMetadata& metadata) {
    std::vector<std::pair<std::string, std::string>> fields;
    fields.emplace_back("version", std::to_string(metadata.version ? metadata.version : constants::kMetadataVersion));
    fields.emplace_back("engine", std::string(constants::kEngineVersion));
    fields.emplace_back("created", metadata.created.empty() ? UtcTimestamp() : metadata.created);
    fields.emplace_back("hash", digest::AlgorithmName(metadata.hash));
    fields.emplace_back("payload_checksum", digest::ToHex(metadata.payload_checksum));
    fields.emplace_back("payload_length", std::to_string(metadata.payload_length));
    fields.emplace_back("direct_embed", metadata.direct_embed ? "yes" : "no");
    fields.emplace_back("embedded_name", metadata.embedded_name);
    fields.emplace_back("archive_format",
                        metadata.archive_format ? archive::FormatName(*metadata.archive_format) : "none");
    fields.emplace_back("signature", digest::ToHex(metadata.signature));
    fields.emplace_back("container_size", std::to_string(metadata.container_size));
    fields.emplace_back("part_size", std::to_string(metadata.part_size));
    fields.emplace_back("part_count", std::to_string(metadata.parts.size()));
    for (std::size_t i = 0; i < metadata.parts.size(); ++i) {
        const auto& part = metadata.parts[i];
        CheckPlainFileName(PartKey(i + 1, "file"), part.file);
        fields.emplace_back(PartKey(i + 1, "file"), part.file);
        fields.emplace_back(PartKey(i + 1, "length"), std::to_string(part.length));
        if (metadata.IsSplit()) {
            fields.emplace_back(PartKey(i + 1, "checksum"), digest::ToHex(part.checksum));
        }
    }

    std::string out = "# polyvid recovery metadata\n";
    for (const auto& [key, value] : fields) {
        CheckSingleLine(key, value);
        out += key;
        out.push_back('=');
        out += value;
        out.push_back('\n');
    }
    return out;
}

MetadataMap Decode(const std::string& text) {
    MetadataMap result;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        std::string trimmed = Trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }
        auto eq = trimmed.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        result[Trim(trimmed.substr(0, eq))] = Trim(trimmed.substr(eq + 1));
    }
    return result;
}

std::string GetValue(const MetadataMap& meta, std::string_view key) {
    auto it = meta.find(std::string(key));
    if (it == meta.end()) {
        return {};
    }
    return it->second;
}

RecoveryMetadata Parse(const std::string& text) {
    MetadataMap meta = Decode(text);
    RecoveryMetadata metadata;

    std::uint64_t version = ParseUnsigned(meta, "version");
    if (version == 0 || version > constants::kMetadataVersion) {
        throw InputError("Unsupported recovery metadata version " + std::to_string(version));
    }
    metadata.version = static_cast<std::uint32_t>(version);
    metadata.created = GetValue(meta, "created");
    metadata.hash = digest::AlgorithmFromName(Require(meta, "hash"));
    metadata.payload_checksum = ParseHash(meta, "payload_checksum", metadata.hash);
    metadata.payload_length = ParseUnsigned(meta, "payload_length");
    if (metadata.payload_length == 0) {
        throw InputError("Recovery metadata 'payload_length' must be positive");
    }

    const std::string& direct = Require(meta, "direct_embed");
    if (direct != "yes" && direct != "no") {
        throw InputError("Recovery metadata 'direct_embed' must be yes or no: " + direct);
    }
    metadata.direct_embed = direct == "yes";
    metadata.embedded_name = GetValue(meta, "embedded_name");

    std::string format = GetValue(meta, "archive_format");
    if (!format.empty() && format != "none") {
        metadata.archive_format = archive::FormatFromName(format);
    }
    metadata.signature = digest::FromHex(GetValue(meta, "signature"));

    metadata.container_size = ParseUnsigned(meta, "container_size");
    if (metadata.container_size == 0) {
        throw InputError("Recovery metadata 'container_size' must be positive");
    }
    metadata.part_size = ParseUnsigned(meta, "part_size");
    std::uint64_t part_count = ParseUnsigned(meta, "part_count");
    if (part_count == 0) {
        throw InputError("Recovery metadata 'part_count' must be positive");
    }
    if (!metadata.IsSplit() && part_count != 1) {
        throw InputError("Recovery metadata without 'part_size' must list exactly one file");
    }
    if (metadata.IsSplit()) {
        split::SplitPlan plan(metadata.payload_length, metadata.part_size);
        if (plan.PartCount() != part_count) {
            throw InputError("Recovery metadata 'part_count' disagrees with payload_length / part_size");
        }
    }

    std::uint64_t total = 0;
    for (std::size_t number = 1; number <= part_count; ++number) {
        PartRecord part;
        part.file = Require(meta, PartKey(number, "file"));
        CheckPlainFileName(PartKey(number, "file"), part.file);
        part.length = ParseUnsigned(meta, PartKey(number, "length"));
        if (metadata.IsSplit()) {
            part.checksum = ParseHash(meta, PartKey(number, "checksum"), metadata.hash);
        }
        total += part.length;
        metadata.parts.push_back(std::move(part));
    }
    if (total != metadata.payload_length) {
        throw InputError("Recovery metadata part lengths do not add up to payload_length");
    }
    return metadata;
}

temp::AtomicFile Stage(const RecoveryMetadata& metadata, const std::filesystem::path& path) {
    std::string text = Serialize(metadata);
    temp::AtomicFile out(path);
    {
        std::ofstream file(out.TempPath(), std::ios::binary | std::ios::trunc);
        if (!file) {
            throw IoError("open for writing", out.TempPath());
        }
        file.write(text.data(), static_cast<std::streamsize>(text.size()));
        file.close();
        if (file.fail()) {
            throw IoError("write", out.TempPath());
        }
    }
    return out;
}

void Save(const RecoveryMetadata& metadata, const std::filesystem::path& path) {
    Stage(metadata, path).Commit();
}

RecoveryMetadata Load(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw InputError("Cannot open recovery metadata: " + path.string());
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw IoError("read", path);
    }
    return Parse(buffer.str());
}

std::filesystem::path MetadataPathFor(const std::filesystem::path& output_base) {
    return output_base.parent_path() / (output_base.stem().string() + std::string(constants::kRecoverySuffix));
}

std::vector<std::filesystem::path> PartPaths(const RecoveryMetadata& metadata,
                                             const std::filesystem::path& metadata_path) {
    std::vector<std::filesystem::path> out;
    auto dir = metadata_path.parent_path();
    for (const auto& part : metadata.parts) {
        out.push_back(dir / part.file);
    }
    return out;
}

}  // namespace polyvid::recovery
