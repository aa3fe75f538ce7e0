#include "polyvid/polyvid.hpp"

#include "polyvid/errors.hpp"
#include "polyvid/file_stream.hpp"
#include "polyvid/log.hpp"
#include "polyvid/temp_path.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

namespace polyvid {

namespace {

std::optional<archive::Format> FormatAt(const std::filesystem::path& path, std::uint64_t offset) {
    for (archive::Format format : {archive::Format::Zip, archive::Format::Tgz, archive::Format::Txz}) {
        if (signature::MatchesAt(path, archive::Signature(format), offset)) {
            return format;
        }
    }
    return std::nullopt;
}

std::optional<archive::Format> FormatForSignature(const signature::Bytes& sig) {
    for (archive::Format format : {archive::Format::Zip, archive::Format::Tgz, archive::Format::Txz}) {
        if (archive::Signature(format) == sig) {
            return format;
        }
    }
    return std::nullopt;
}

std::string PayloadExtension(const std::optional<recovery::RecoveryMetadata>& metadata,
                             const signature::Bytes& sig) {
    if (metadata) {
        std::string ext = std::filesystem::path(metadata->embedded_name).extension().string();
        if (!ext.empty()) {
            return ext;
        }
        if (metadata->archive_format) {
            return archive::FormatExtension(*metadata->archive_format);
        }
        return ".bin";
    }
    auto format = FormatForSignature(sig);
    return format ? archive::FormatExtension(*format) : ".bin";
}

std::vector<std::string> ListPayload(const std::filesystem::path& path,
                                     archive::Format format,
                                     std::string& list_error) {
    try {
        return archive::ListEntries(path, format);
    } catch (const MalformedPayloadError& e) {
        list_error = e.what();
        log::Warn("Cannot list payload entries: " + list_error);
        return {};
    }
}

std::string JoinNumbers(const std::vector<std::size_t>& numbers) {
    std::string out;
    for (std::size_t number : numbers) {
        if (!out.empty()) {
            out += ", ";
        }
        out += std::to_string(number);
    }
    return out;
}

void EnsureDirectory(const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw IoError("create directory", dir, ec.message());
    }
}

signature::Bytes ChooseSignature(const signature::Bytes& requested,
                                 const std::optional<recovery::RecoveryMetadata>& metadata) {
    if (!requested.empty()) {
        return requested;
    }
    if (metadata && !metadata->signature.empty()) {
        return metadata->signature;
    }
    return signature::FromString(constants::kZipSignature);
}

}  // namespace

std::string IntegrityStatusName(IntegrityStatus status) {
    switch (status) {
        case IntegrityStatus::Verified:
            return "verified";
        case IntegrityStatus::Mismatch:
            return "MISMATCH";
        case IntegrityStatus::Unchecked:
            return "unchecked";
    }
    return "unknown";
}

CreateResult CreatePolyglot(const CreateOptions& options) {
    writer::ContainerTemplate container(options.container);
    std::filesystem::path output = writer::ResolveOutputPath(options.output, container);

    payload::PayloadRequest request = options.payload;
    if (request.work_dir.empty()) {
        request.work_dir = output.parent_path().empty() ? std::filesystem::path(".") : output.parent_path();
    }
    for (const auto& input : request.inputs) {
        std::error_code ec;
        if (!std::filesystem::exists(input.source, ec)) {
            throw InputError("Input not found: " + input.source.string());
        }
    }
    EnsureDirectory(request.work_dir);
    payload::PayloadSource payload = payload::BuildPayload(request);
    log::Info("Payload " + payload.EmbeddedName() + ": " + progress::FormatBytes(payload.TotalLength())
              + (payload.IsDirect() ? " (embedded as-is)" : ""));

    writer::WriteOptions write_options;
    write_options.chunk_size = options.chunk_size;
    write_options.hash = options.hash;
    write_options.progress = options.progress;
    writer::StagedWrite staged =
        options.split_size > 0
            ? writer::StageSplit(container, payload, output, options.split_size, write_options)
            : writer::StageSingle(container, payload, output, write_options);
    writer::WriteResult& written = staged.result;

    CreateResult result;
    auto& metadata = result.metadata;
    metadata.version = constants::kMetadataVersion;
    metadata.hash = options.hash;
    metadata.payload_checksum = written.payload_checksum;
    metadata.payload_length = payload.TotalLength();
    metadata.direct_embed = payload.IsDirect();
    metadata.embedded_name = payload.EmbeddedName();
    metadata.archive_format = payload.ArchiveFormat();
    metadata.signature = payload.Signature();
    metadata.container_size = container.Size();
    metadata.part_size = options.split_size;
    for (const auto& file : written.files) {
        recovery::PartRecord part;
        part.file = file.path.filename().string();
        part.length = file.range_length;
        if (metadata.IsSplit()) {
            part.checksum = file.slice_checksum;
        }
        metadata.parts.push_back(std::move(part));
    }
    if (options.write_metadata) {
        result.metadata_path = recovery::MetadataPathFor(output);
        staged.outputs.push_back(recovery::Stage(metadata, result.metadata_path));
    }
    // The metadata goes last so that a failure anywhere removes every output.
    temp::CommitAll(staged.outputs);
    if (options.write_metadata) {
        log::Debug("Recovery metadata written to " + result.metadata_path.string());
    }
    result.files = std::move(written.files);
    result.entries = payload.Entries();
    return result;
}

ExtractReport ExtractPolyglot(const ExtractOptions& options) {
    std::optional<recovery::RecoveryMetadata> metadata;
    if (!options.metadata.empty()) {
        metadata = recovery::Load(options.metadata);
    }

    std::vector<std::filesystem::path> parts = options.inputs;
    if (parts.empty()) {
        if (!metadata) {
            throw InputError("Nothing to extract: give a polyglot file or recovery metadata");
        }
        parts = recovery::PartPaths(*metadata, options.metadata);
    } else if (options.discover && parts.size() == 1) {
        reader::Discovery discovery = reader::DiscoverParts(parts.front());
        if (!discovery.missing.empty()) {
            throw InputError("Missing part(s) " + JoinNumbers(discovery.missing) + " next to "
                             + parts.front().string());
        }
        if (discovery.parts.size() > 1) {
            if (!options.confirm_parts) {
                throw InputError("Found " + std::to_string(discovery.parts.size()) + " parts next to "
                                 + parts.front().string() + "; confirm to combine them");
            }
            parts = std::move(discovery.parts);
        }
    }
    for (const auto& part : parts) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(part, ec)) {
            throw InputError("Input not found: " + part.string());
        }
    }
    if (metadata && parts.size() != metadata->parts.size()) {
        throw InputError("Recovery metadata lists " + std::to_string(metadata->parts.size()) + " part(s), got "
                         + std::to_string(parts.size()));
    }

    reader::ReadOptions read_options;
    read_options.signature = ChooseSignature(options.signature, metadata);
    if (metadata) {
        read_options.container_size = metadata->container_size;
    }
    read_options.allow_estimate = options.allow_estimate;
    read_options.chunk_size = options.chunk_size;
    read_options.hash = metadata ? metadata->hash : options.hash;
    read_options.progress = options.progress;

    ExtractReport report;
    report.output = options.output;
    if (report.output.empty()) {
        std::string ext = PayloadExtension(metadata, read_options.signature);
        std::string name = parts.size() == 1 ? "extracted_from_" + parts.front().stem().string() + ext
                                             : "combined_extracted" + ext;
        report.output = parts.front().parent_path() / name;
    }

    report.result = parts.size() == 1 ? reader::ExtractSingle(parts.front(), report.output, read_options)
                                      : reader::ExtractAndCombine(parts, report.output, read_options);
    if (report.Degraded()) {
        log::Warn("Payload offset was estimated; the extracted data may be corrupt");
    }

    if (metadata) {
        bool same = report.result.bytes_written == metadata->payload_length
                    && digest::Verify(metadata->payload_checksum, report.result.checksum);
        report.integrity = same ? IntegrityStatus::Verified : IntegrityStatus::Mismatch;
        if (metadata->IsSplit()) {
            for (std::size_t i = 0; i < parts.size(); ++i) {
                PartCheck check;
                check.path = parts[i];
                check.size_matches = report.result.locations[i].PayloadLength() == metadata->parts[i].length;
                check.status = digest::Verify(metadata->parts[i].checksum, report.result.slice_checksums[i])
                                   ? IntegrityStatus::Verified
                                   : IntegrityStatus::Mismatch;
                report.part_checks.push_back(std::move(check));
            }
        }
        if (report.integrity == IntegrityStatus::Mismatch) {
            log::Warn("Checksum mismatch for " + report.output.string() + ": expected "
                      + digest::ToHex(metadata->payload_checksum) + ", got " + digest::ToHex(report.result.checksum));
        }
    }

    report.format = archive::DetectFormat(report.output);
    if (report.format) {
        report.entries = ListPayload(report.output, *report.format, report.list_error);
    }
    if (!options.unpack_dir.empty()) {
        if (!report.format) {
            throw MalformedPayloadError("Extracted payload " + report.output.string()
                                        + " is not a zip, tgz or txz archive; nothing to unpack");
        }
        report.unpacked_root = archive::Unpack(report.output, *report.format, options.unpack_dir);
    }
    return report;
}

InspectReport InspectPolyglot(const InspectOptions& options) {
    std::optional<recovery::RecoveryMetadata> metadata;
    if (!options.metadata.empty()) {
        metadata = recovery::Load(options.metadata);
    }

    InspectReport report;
    report.file = options.file;
    report.file_size = filestream::FileSize(options.file);
    report.hash = metadata ? metadata->hash : options.hash;
    report.file_checksum = digest::DigestFile(options.file, report.hash, options.chunk_size);

    std::optional<recovery::PartRecord> record;
    if (metadata) {
        std::string name = options.file.filename().string();
        auto it = std::find_if(metadata->parts.begin(), metadata->parts.end(),
                               [&](const recovery::PartRecord& part) { return part.file == name; });
        if (it != metadata->parts.end()) {
            record = *it;
        } else {
            log::Warn(name + " is not listed in " + options.metadata.string());
        }
    }

    reader::ReadOptions read_options;
    read_options.signature = ChooseSignature(options.signature, metadata);
    if (record) {
        read_options.container_size = metadata->container_size;
    }
    read_options.chunk_size = options.chunk_size;
    read_options.hash = report.hash;
    report.location = reader::LocatePayload(options.file, read_options);
    report.format = FormatAt(options.file, report.location.offset);

    if (report.format) {
        if (metadata && metadata->IsSplit()) {
            report.list_error = "payload is split across parts";
        } else if (*report.format == archive::Format::Zip) {
            report.entries = ListPayload(options.file, archive::Format::Zip, report.list_error);
        } else {
            temp::TempDir work("polyvid-inspect");
            auto payload_path = work / ("payload" + archive::FormatExtension(*report.format));
            reader::ExtractSingle(options.file, payload_path, read_options);
            report.entries = ListPayload(payload_path, *report.format, report.list_error);
        }
    }

    if (record) {
        PartCheck check;
        check.path = options.file;
        check.size_matches = report.file_size == metadata->container_size + record->length;
        if (report.file_size >= metadata->container_size + record->length) {
            digest::Hash slice = digest::DigestRange(options.file, metadata->container_size, record->length,
                                                     report.hash, options.chunk_size);
            const digest::Hash& expected = metadata->IsSplit() ? record->checksum : metadata->payload_checksum;
            check.status = digest::Verify(expected, slice) ? IntegrityStatus::Verified : IntegrityStatus::Mismatch;
        } else {
            check.status = IntegrityStatus::Mismatch;
        }
        report.part_check = check;
    }
    return report;
}

}  // namespace polyvid
