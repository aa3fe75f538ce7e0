#include "polyvid/payload.hpp"

#include "polyvid/constants.hpp"
#include "polyvid/errors.hpp"
#include "polyvid/file_stream.hpp"
#include "polyvid/log.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <system_error>
#include <utility>

namespace polyvid::payload {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

void RequireExists(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        throw InputError("Input not found: " + path.string());
    }
}

void RequireRegularFile(const std::filesystem::path& path) {
    RequireExists(path);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw InputError("Not a regular file: " + path.string());
    }
}

const PayloadInput& RequireSingleInput(const PayloadRequest& request) {
    if (request.inputs.size() != 1) {
        throw InputError(ModeName(request.mode) + " mode takes exactly one input, got "
                         + std::to_string(request.inputs.size()));
    }
    return request.inputs.front();
}

std::string EntryNameFor(const PayloadInput& input) {
    if (!input.entry_name.empty()) {
        return std::filesystem::path(input.entry_name).generic_string();
    }
    auto normal = input.source.lexically_normal();
    if (normal.filename().empty()) {
        normal = normal.parent_path();
    }
    return normal.filename().string();
}

void AppendDirectory(const std::filesystem::path& root,
                     const std::string& prefix,
                     std::vector<archive::Entry>& entries) {
    std::vector<archive::Entry> found;
    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(root, ec);
    if (ec) {
        throw IoError("list directory", root, ec.message());
    }
    for (const auto& item : it) {
        if (item.is_symlink(ec)) {
            log::Debug("Skipping symlink " + item.path().string());
            continue;
        }
        if (!item.is_regular_file(ec)) {
            continue;
        }
        std::string rel = item.path().lexically_relative(root).generic_string();
        found.push_back({item.path(), prefix.empty() ? rel : prefix + "/" + rel});
    }
    if (found.empty()) {
        throw InputError("Directory contains no files: " + root.string());
    }
    std::sort(found.begin(), found.end(), [](const archive::Entry& a, const archive::Entry& b) {
        return a.name < b.name;
    });
    entries.insert(entries.end(), found.begin(), found.end());
}

PayloadSource DirectPayload(const std::filesystem::path& file, std::string embedded_name) {
    if (filestream::FileSize(file) == 0) {
        throw InputError("Payload file is empty: " + file.string());
    }
    return PayloadSource::FromFile(file, std::move(embedded_name));
}

}  // namespace

PayloadMode ModeFromName(const std::string& name) {
    std::string lower = ToLower(name);
    if (lower == "single" || lower == "file") {
        return PayloadMode::SingleFile;
    }
    if (lower == "folder" || lower == "multiple" || lower == "dir") {
        return PayloadMode::FolderOrMultiple;
    }
    if (lower == "archive" || lower == "existing") {
        return PayloadMode::ExistingArchive;
    }
    if (lower == "direct" || lower == "embed") {
        return PayloadMode::DirectEmbedArchive;
    }
    throw InputError("Unknown payload mode: " + name);
}

std::string ModeName(PayloadMode mode) {
    switch (mode) {
        case PayloadMode::SingleFile:
            return "single";
        case PayloadMode::FolderOrMultiple:
            return "folder";
        case PayloadMode::ExistingArchive:
            return "archive";
        case PayloadMode::DirectEmbedArchive:
            return "direct";
    }
    return "unknown";
}

PayloadSource PayloadSource::FromFile(const std::filesystem::path& file, std::string embedded_name) {
    PayloadSource source;
    source.path_ = file;
    source.length_ = filestream::FileSize(file);
    source.direct_ = true;
    source.embedded_name_ = embedded_name.empty() ? file.filename().string() : std::move(embedded_name);
    source.format_ = archive::DetectFormat(file);
    return source;
}

signature::Bytes PayloadSource::Signature() const {
    if (!format_) {
        return {};
    }
    return archive::Signature(*format_);
}

std::vector<archive::Entry> CollectEntries(const PayloadRequest& request) {
    if (request.inputs.empty()) {
        throw InputError("No inputs given");
    }
    std::vector<archive::Entry> entries;
    if (request.mode == PayloadMode::SingleFile) {
        const auto& input = RequireSingleInput(request);
        RequireRegularFile(input.source);
        entries.push_back({input.source, EntryNameFor(input)});
    } else {
        // A lone directory is rooted at itself; with several inputs each keeps its own name.
        bool lone = request.inputs.size() == 1;
        for (const auto& input : request.inputs) {
            RequireExists(input.source);
            std::error_code ec;
            if (std::filesystem::is_directory(input.source, ec)) {
                std::string prefix = lone && input.entry_name.empty() ? std::string() : EntryNameFor(input);
                AppendDirectory(input.source, prefix, entries);
            } else if (std::filesystem::is_regular_file(input.source, ec)) {
                entries.push_back({input.source, EntryNameFor(input)});
            } else {
                throw InputError("Unsupported input type: " + input.source.string());
            }
        }
    }
    std::set<std::string> seen;
    for (const auto& entry : entries) {
        if (!seen.insert(entry.name).second) {
            throw InputError("Duplicate archive entry name: " + entry.name);
        }
    }
    return entries;
}

PayloadSource BuildPayload(const PayloadRequest& request) {
    switch (request.mode) {
        case PayloadMode::ExistingArchive: {
            const auto& input = RequireSingleInput(request);
            RequireRegularFile(input.source);
            auto format = archive::DetectFormat(input.source);
            if (!format) {
                throw InputError("Not a recognized archive (zip, gzip or xz): " + input.source.string());
            }
            return DirectPayload(input.source, EntryNameFor(input));
        }
        case PayloadMode::DirectEmbedArchive: {
            const auto& input = RequireSingleInput(request);
            RequireRegularFile(input.source);
            return DirectPayload(input.source, EntryNameFor(input));
        }
        case PayloadMode::SingleFile: {
            const auto& input = RequireSingleInput(request);
            RequireRegularFile(input.source);
            if (request.bypass_wrapping && archive::LooksLikeArchiveName(input.source)) {
                log::Info("Embedding " + input.source.filename().string() + " without re-wrapping");
                return DirectPayload(input.source, EntryNameFor(input));
            }
            break;
        }
        case PayloadMode::FolderOrMultiple:
            break;
    }

    if (!archive::Available(request.format)) {
        throw InputError("Archive format unavailable in this build: " + archive::FormatName(request.format));
    }
    std::vector<archive::Entry> entries = CollectEntries(request);
    for (const auto& entry : entries) {
        log::Debug("Adding " + entry.name);
    }

    PayloadSource source;
    source.work_.emplace("polyvid-payload", request.work_dir);
    source.embedded_name_ = std::string(constants::kDefaultArchiveStem) + archive::FormatExtension(request.format);
    source.path_ = *source.work_ / source.embedded_name_;
    archive::Pack(entries, request.format, source.path_, request.level);
    source.length_ = filestream::FileSize(source.path_);
    source.direct_ = false;
    source.format_ = request.format;
    for (const auto& entry : entries) {
        source.entries_.push_back(entry.name);
    }
    log::Info("Packed " + std::to_string(entries.size()) + " file(s) into " + source.embedded_name_);
    return source;
}

}  // namespace polyvid::payload
