#include "polyvid/archive.hpp"
#include "polyvid/cancel.hpp"
#include "polyvid/cli_colors.hpp"
#include "polyvid/config.hpp"
#include "polyvid/constants.hpp"
#include "polyvid/digest.hpp"
#include "polyvid/errors.hpp"
#include "polyvid/log.hpp"
#include "polyvid/payload.hpp"
#include "polyvid/polyvid.hpp"
#include "polyvid/progress.hpp"

#include <cctype>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;
constexpr int kExitUnconfirmed = 3;
constexpr std::size_t kListedEntries = 10;

class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

void PrintUsage() {
    std::cout << "Usage:\n";
    std::cout << "  polyvid create <container> <input>... [--mode single|folder|archive|direct] [--name <entry>]\n"
                 "                 [--out <path>] [--split-size <size>] [--format zip|tgz|txz] [--level <0-9>]\n"
                 "                 [--bypass-archive] [--no-metadata] [--hash <alg>] [--chunk-size <size>]\n";
    std::cout << "  polyvid extract <polyglot|part>... [--metadata <file>] [--out <path>] [--unpack <dir>]\n"
                 "                  [--combine] [--strict] [--signature <zip|tgz|txz|hex>] [--hash <alg>]\n";
    std::cout << "  polyvid verify [<polyglot>...] [--metadata <file>] [--signature <zip|tgz|txz|hex>] [--hash <alg>]\n";
    std::cout << "  polyvid digest <file> [--hash md5|sha1|sha256|sha512|sha3-512]\n";
    std::cout << "Common flags: [--no-progress] [--no-color] [--quiet] [--verbose]\n";
    std::cout << "Sizes accept K, M, G, T suffixes (\"4G\", \"1.5GiB\").\n";
    std::cout << "Exit codes: 0 ok, 1 error, 2 usage, 3 completed but integrity unconfirmed.\n";
}

struct CommonArgs {
    polyvid::config::Settings settings;
    bool quiet = false;
    bool verbose = false;
};

struct CreateArgs {
    std::string container;
    std::vector<std::string> inputs;
    std::string mode;
    std::string name;
    std::string output;
    std::uint64_t split_size = 0;
    polyvid::archive::Format format = polyvid::archive::Format::Zip;
    int level = -1;
    bool bypass_archive = false;
    bool write_metadata = true;
};

struct ExtractArgs {
    std::vector<std::string> inputs;
    std::string metadata;
    std::string output;
    std::string unpack_dir;
    std::string signature;
    bool combine = false;
    bool strict = false;
};

struct VerifyArgs {
    std::vector<std::string> inputs;
    std::string metadata;
    std::string signature;
};

std::string RequireValue(int argc, char** argv, int idx, const std::string& flag) {
    if (idx + 1 >= argc) {
        throw UsageError("Missing value for " + flag);
    }
    return argv[idx + 1];
}

// Consumes flags shared by every command; returns the number of arguments used (0 if none).
int ParseCommonFlag(int argc, char** argv, int idx, CommonArgs& common) {
    std::string flag(argv[idx]);
    if (flag == "--no-progress") {
        common.settings.show_progress = false;
        return 1;
    }
    if (flag == "--no-color") {
        common.settings.color = false;
        return 1;
    }
    if (flag == "-q" || flag == "--quiet") {
        common.quiet = true;
        return 1;
    }
    if (flag == "-v" || flag == "--verbose") {
        common.verbose = true;
        return 1;
    }
    if (flag == "--hash") {
        common.settings.hash = polyvid::digest::AlgorithmFromName(RequireValue(argc, argv, idx, flag));
        return 2;
    }
    if (flag == "--chunk-size") {
        common.settings.chunk_size =
            polyvid::config::ClampChunkSize(polyvid::config::ParseSize(RequireValue(argc, argv, idx, flag)));
        return 2;
    }
    return 0;
}

bool IsFlag(const std::string& arg) {
    return arg.size() > 1 && arg[0] == '-';
}

CreateArgs ParseCreateArgs(int argc, char** argv, int start_index, CommonArgs& common) {
    CreateArgs opts;
    int idx = start_index;
    std::vector<std::string> positional;
    while (idx < argc) {
        std::string flag(argv[idx]);
        if (int used = ParseCommonFlag(argc, argv, idx, common)) {
            idx += used;
        } else if (flag == "--mode") {
            opts.mode = RequireValue(argc, argv, idx, flag);
            idx += 2;
        } else if (flag == "--name") {
            opts.name = RequireValue(argc, argv, idx, flag);
            idx += 2;
        } else if (flag == "-o" || flag == "--out") {
            opts.output = RequireValue(argc, argv, idx, flag);
            idx += 2;
        } else if (flag == "--split-size") {
            opts.split_size = polyvid::config::ParseSize(RequireValue(argc, argv, idx, flag));
            idx += 2;
        } else if (flag == "--format") {
            opts.format = polyvid::archive::FormatFromName(RequireValue(argc, argv, idx, flag));
            idx += 2;
        } else if (flag == "--level") {
            std::string value = RequireValue(argc, argv, idx, flag);
            if (value.size() != 1 || !std::isdigit(static_cast<unsigned char>(value[0]))) {
                throw UsageError("--level expects a digit 0-9");
            }
            opts.level = value[0] - '0';
            idx += 2;
        } else if (flag == "--bypass-archive") {
            opts.bypass_archive = true;
            idx += 1;
        } else if (flag == "--no-metadata") {
            opts.write_metadata = false;
            idx += 1;
        } else if (IsFlag(flag)) {
            throw UsageError("Unknown flag: " + flag);
        } else {
            positional.push_back(flag);
            idx += 1;
        }
    }
    if (positional.size() < 2) {
        throw UsageError("create needs a container and at least one input");
    }
    opts.container = positional.front();
    opts.inputs.assign(positional.begin() + 1, positional.end());
    return opts;
}

ExtractArgs ParseExtractArgs(int argc, char** argv, int start_index, CommonArgs& common) {
    ExtractArgs opts;
    int idx = start_index;
    while (idx < argc) {
        std::string flag(argv[idx]);
        if (int used = ParseCommonFlag(argc, argv, idx, common)) {
            idx += used;
        } else if (flag == "--metadata") {
            opts.metadata = RequireValue(argc, argv, idx, flag);
            idx += 2;
        } else if (flag == "-o" || flag == "--out") {
            opts.output = RequireValue(argc, argv, idx, flag);
            idx += 2;
        } else if (flag == "--unpack") {
            opts.unpack_dir = RequireValue(argc, argv, idx, flag);
            idx += 2;
        } else if (flag == "--signature") {
            opts.signature = RequireValue(argc, argv, idx, flag);
            idx += 2;
        } else if (flag == "--combine") {
            opts.combine = true;
            idx += 1;
        } else if (flag == "--strict") {
            opts.strict = true;
            idx += 1;
        } else if (IsFlag(flag)) {
            throw UsageError("Unknown flag: " + flag);
        } else {
            opts.inputs.push_back(flag);
            idx += 1;
        }
    }
    if (opts.inputs.empty() && opts.metadata.empty()) {
        throw UsageError("extract needs a polyglot file or --metadata");
    }
    return opts;
}

VerifyArgs ParseVerifyArgs(int argc, char** argv, int start_index, CommonArgs& common) {
    VerifyArgs opts;
    int idx = start_index;
    while (idx < argc) {
        std::string flag(argv[idx]);
        if (int used = ParseCommonFlag(argc, argv, idx, common)) {
            idx += used;
        } else if (flag == "--metadata") {
            opts.metadata = RequireValue(argc, argv, idx, flag);
            idx += 2;
        } else if (flag == "--signature") {
            opts.signature = RequireValue(argc, argv, idx, flag);
            idx += 2;
        } else if (IsFlag(flag)) {
            throw UsageError("Unknown flag: " + flag);
        } else {
            opts.inputs.push_back(flag);
            idx += 1;
        }
    }
    if (opts.inputs.empty() && opts.metadata.empty()) {
        throw UsageError("verify needs a polyglot file or --metadata");
    }
    return opts;
}

void ApplyCommon(const CommonArgs& common) {
    polyvid::cli::SetColorsEnabled(common.settings.color);
    if (common.quiet) {
        polyvid::log::SetLevel(polyvid::log::Level::Warn);
    } else if (common.verbose) {
        polyvid::log::SetLevel(polyvid::log::Level::Debug);
    }
}

polyvid::signature::Bytes ParseSignature(const std::string& text) {
    if (text.empty()) {
        return {};
    }
    std::string lower;
    for (char ch : text) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    if (lower == "zip" || lower == "tgz" || lower == "gzip" || lower == "txz" || lower == "xz") {
        return polyvid::archive::Signature(polyvid::archive::FormatFromName(lower));
    }
    auto bytes = polyvid::digest::FromHex(text);
    if (bytes.empty()) {
        throw UsageError("Empty signature");
    }
    return bytes;
}

polyvid::payload::PayloadMode DefaultMode(const std::vector<std::string>& inputs) {
    std::error_code ec;
    if (inputs.size() > 1 || std::filesystem::is_directory(inputs.front(), ec)) {
        return polyvid::payload::PayloadMode::FolderOrMultiple;
    }
    return polyvid::payload::PayloadMode::SingleFile;
}

std::uint64_t InputBytes(const std::vector<std::string>& inputs) {
    std::uint64_t total = 0;
    for (const auto& input : inputs) {
        std::error_code ec;
        if (std::filesystem::is_directory(input, ec)) {
            for (std::filesystem::recursive_directory_iterator it(input, ec), end; !ec && it != end; it.increment(ec)) {
                if (it->is_regular_file(ec)) {
                    total += it->file_size(ec);
                }
            }
        } else if (std::filesystem::is_regular_file(input, ec)) {
            total += std::filesystem::file_size(input, ec);
        }
    }
    return total;
}

void PrintEntries(const std::vector<std::string>& entries) {
    if (entries.empty()) {
        return;
    }
    std::cout << "entries: " << entries.size() << "\n";
    for (std::size_t i = 0; i < entries.size() && i < kListedEntries; ++i) {
        std::cout << "  " << entries[i] << "\n";
    }
    if (entries.size() > kListedEntries) {
        std::cout << "  " << polyvid::cli::Dim("... and " + std::to_string(entries.size() - kListedEntries) + " more")
                  << "\n";
    }
}

std::string StatusText(polyvid::IntegrityStatus status) {
    std::string name = polyvid::IntegrityStatusName(status);
    switch (status) {
        case polyvid::IntegrityStatus::Verified:
            return polyvid::cli::Green(name);
        case polyvid::IntegrityStatus::Mismatch:
            return polyvid::cli::BoldRed(name);
        case polyvid::IntegrityStatus::Unchecked:
            return polyvid::cli::Yellow(name);
    }
    return name;
}

int RunCreate(int argc, char** argv, CommonArgs& common) {
    CreateArgs args = ParseCreateArgs(argc, argv, 2, common);
    ApplyCommon(common);

    polyvid::CreateOptions options;
    options.container = args.container;
    options.output = args.output;
    options.split_size = args.split_size;
    options.write_metadata = args.write_metadata;
    options.chunk_size = common.settings.chunk_size;
    options.hash = common.settings.hash;
    options.payload.mode = args.mode.empty() ? DefaultMode(args.inputs) : polyvid::payload::ModeFromName(args.mode);
    options.payload.bypass_wrapping = args.bypass_archive;
    options.payload.format = args.format;
    options.payload.level = args.level;
    for (const auto& input : args.inputs) {
        options.payload.inputs.push_back({input, {}});
    }
    if (!args.name.empty()) {
        if (options.payload.inputs.size() != 1) {
            throw UsageError("--name applies to a single input");
        }
        options.payload.inputs.front().entry_name = args.name;
    }
    if (args.split_size == 0) {
        std::uint64_t input_bytes = InputBytes(args.inputs);
        if (input_bytes > polyvid::constants::kSplitAdviceThreshold) {
            polyvid::log::Warn("Payload is " + polyvid::progress::FormatBytes(input_bytes)
                               + "; consider --split-size to stay under file size limits");
        }
    }

    polyvid::progress::ProgressReporter reporter(common.settings.show_progress);
    options.progress = &reporter;
    polyvid::CreateResult result = polyvid::CreatePolyglot(options);

    for (const auto& file : result.files) {
        std::cout << polyvid::cli::Green("created: ") << file.path.string() << " ("
                  << polyvid::progress::FormatBytes(file.FileSize()) << ")\n";
    }
    std::cout << "payload: " << result.metadata.embedded_name << ", "
              << polyvid::progress::FormatBytes(result.metadata.payload_length)
              << (result.metadata.direct_embed ? ", direct embed" : "") << "\n";
    std::cout << polyvid::digest::AlgorithmName(result.metadata.hash) << ": "
              << polyvid::digest::ToHex(result.metadata.payload_checksum) << "\n";
    PrintEntries(result.entries);
    if (!result.metadata_path.empty()) {
        std::cout << "metadata: " << result.metadata_path.string() << "\n";
    }
    return kExitOk;
}

int RunExtract(int argc, char** argv, CommonArgs& common) {
    ExtractArgs args = ParseExtractArgs(argc, argv, 2, common);
    ApplyCommon(common);

    polyvid::ExtractOptions options;
    for (const auto& input : args.inputs) {
        options.inputs.emplace_back(input);
    }
    options.metadata = args.metadata;
    options.output = args.output;
    options.unpack_dir = args.unpack_dir;
    options.discover = options.inputs.size() == 1;
    options.confirm_parts = args.combine;
    options.signature = ParseSignature(args.signature);
    options.allow_estimate = !args.strict;
    options.chunk_size = common.settings.chunk_size;
    options.hash = common.settings.hash;

    polyvid::progress::ProgressReporter reporter(common.settings.show_progress);
    options.progress = &reporter;
    polyvid::ExtractReport report = polyvid::ExtractPolyglot(options);

    for (const auto& location : report.result.locations) {
        std::string how = polyvid::reader::OffsetSourceName(location.source);
        std::cout << location.path.string() << ": payload at " << location.offset << " ("
                  << (location.Degraded() ? polyvid::cli::BoldYellow(how) : how) << ")\n";
    }
    std::cout << polyvid::cli::Green("extracted: ") << report.output.string() << " ("
              << polyvid::progress::FormatBytes(report.result.bytes_written) << ")\n";
    std::cout << "checksum: " << polyvid::digest::ToHex(report.result.checksum) << "\n";
    std::cout << "integrity: " << StatusText(report.integrity) << "\n";
    for (const auto& check : report.part_checks) {
        std::cout << "  " << check.path.filename().string() << ": " << StatusText(check.status)
                  << (check.size_matches ? "" : ", size differs") << "\n";
    }
    if (report.format) {
        std::cout << "format: " << polyvid::archive::FormatName(*report.format) << "\n";
    }
    PrintEntries(report.entries);
    if (!report.unpacked_root.empty()) {
        std::cout << polyvid::cli::Green("unpacked: ") << report.unpacked_root.string() << "\n";
    }
    if (report.IntegrityUnconfirmed()) {
        polyvid::log::Warn("Extraction completed but integrity is unconfirmed");
        return kExitUnconfirmed;
    }
    return kExitOk;
}

int RunVerify(int argc, char** argv, CommonArgs& common) {
    VerifyArgs args = ParseVerifyArgs(argc, argv, 2, common);
    ApplyCommon(common);

    std::vector<std::filesystem::path> files(args.inputs.begin(), args.inputs.end());
    if (files.empty()) {
        auto metadata = polyvid::recovery::Load(args.metadata);
        files = polyvid::recovery::PartPaths(metadata, args.metadata);
    }
    bool unconfirmed = false;
    for (const auto& file : files) {
        polyvid::InspectOptions options;
        options.file = file;
        options.metadata = args.metadata;
        options.signature = ParseSignature(args.signature);
        options.chunk_size = common.settings.chunk_size;
        options.hash = common.settings.hash;
        polyvid::InspectReport report = polyvid::InspectPolyglot(options);

        std::cout << polyvid::cli::Cyan(report.file.string()) << "\n";
        std::cout << "  size: " << report.file_size << " bytes ("
                  << polyvid::progress::FormatBytes(report.file_size) << ")\n";
        std::cout << "  " << polyvid::digest::AlgorithmName(report.hash) << ": "
                  << polyvid::digest::ToHex(report.file_checksum) << "\n";
        std::string how = polyvid::reader::OffsetSourceName(report.location.source);
        std::cout << "  payload: offset " << report.location.offset << ", "
                  << report.location.PayloadLength() << " bytes ("
                  << (report.location.Degraded() ? polyvid::cli::BoldYellow(how) : how) << ")\n";
        if (report.format) {
            std::cout << "  format: " << polyvid::archive::FormatName(*report.format) << "\n";
        }
        for (std::size_t i = 0; i < report.entries.size() && i < kListedEntries; ++i) {
            std::cout << "    " << report.entries[i] << "\n";
        }
        if (report.entries.size() > kListedEntries) {
            std::cout << "    ... " << report.entries.size() - kListedEntries << " more\n";
        }
        if (!report.list_error.empty()) {
            std::cout << "  entries: " << polyvid::cli::Dim(report.list_error) << "\n";
        }
        if (report.part_check) {
            std::cout << "  slice: " << StatusText(report.part_check->status)
                      << (report.part_check->size_matches ? "" : ", size differs") << "\n";
            if (report.part_check->status != polyvid::IntegrityStatus::Verified || !report.part_check->size_matches) {
                unconfirmed = true;
            }
        }
        if (report.location.Degraded()) {
            unconfirmed = true;
        }
    }
    return unconfirmed ? kExitUnconfirmed : kExitOk;
}

int RunDigest(int argc, char** argv, CommonArgs& common) {
    std::string input;
    int idx = 2;
    while (idx < argc) {
        std::string flag(argv[idx]);
        if (int used = ParseCommonFlag(argc, argv, idx, common)) {
            idx += used;
        } else if (IsFlag(flag)) {
            throw UsageError("Unknown flag: " + flag);
        } else if (input.empty()) {
            input = flag;
            idx += 1;
        } else {
            throw UsageError("digest takes one file");
        }
    }
    if (input.empty()) {
        throw UsageError("digest needs a file");
    }
    ApplyCommon(common);
    auto hash = polyvid::digest::DigestFile(input, common.settings.hash, common.settings.chunk_size);
    std::cout << polyvid::digest::ToHex(hash) << "  " << input << "\n";
    return kExitOk;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return kExitUsage;
    }
    std::string command(argv[1]);
    if (command == "-h" || command == "--help" || command == "help") {
        PrintUsage();
        return kExitOk;
    }
    if (command == "--version") {
        std::cout << "polyvid " << polyvid::constants::kEngineVersion << "\n";
        return kExitOk;
    }
    polyvid::log::InitFromEnv();
    polyvid::cancel::InstallSignalHandlers();
    try {
        CommonArgs common;
        common.settings = polyvid::config::LoadSettings();
        polyvid::cli::SetColorsEnabled(common.settings.color);
        if (command == "create") {
            return RunCreate(argc, argv, common);
        }
        if (command == "extract") {
            return RunExtract(argc, argv, common);
        }
        if (command == "verify") {
            return RunVerify(argc, argv, common);
        }
        if (command == "digest") {
            return RunDigest(argc, argv, common);
        }
        PrintUsage();
        return kExitUsage;
    } catch (const UsageError& exc) {
        polyvid::log::Error(exc.what());
        PrintUsage();
        return kExitUsage;
    } catch (const std::exception& exc) {
        polyvid::log::Error(exc.what());
        return kExitError;
    }
}
