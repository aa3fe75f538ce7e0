#include "polyvid/polyglot_writer.hpp"

#include "polyvid/errors.hpp"
#include "polyvid/file_stream.hpp"
#include "polyvid/log.hpp"
#include "polyvid/split_plan.hpp"
#include "polyvid/temp_path.hpp"

#include <system_error>
#include <utility>

namespace polyvid::writer {

namespace {

bool SameFile(const std::filesystem::path& a, const std::filesystem::path& b) {
    std::error_code ec;
    if (std::filesystem::exists(a, ec) && std::filesystem::exists(b, ec)) {
        return std::filesystem::equivalent(a, b, ec);
    }
    return std::filesystem::absolute(a, ec).lexically_normal() == std::filesystem::absolute(b, ec).lexically_normal();
}

void RejectOverwritingInputs(const std::filesystem::path& output,
                             const ContainerTemplate& container,
                             const payload::PayloadSource& payload) {
    if (SameFile(output, container.Path())) {
        throw InputError("Output would overwrite the container: " + output.string());
    }
    if (SameFile(output, payload.Path())) {
        throw InputError("Output would overwrite the payload: " + output.string());
    }
}

void EnsureParent(const std::filesystem::path& output) {
    auto parent = output.parent_path();
    if (parent.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        throw IoError("create directory", parent, ec.message());
    }
}

struct PartContext {
    const ContainerTemplate& container;
    filestream::FileReader& payload;
    const WriteOptions& options;
    digest::Digest& whole;
    std::uint64_t grand_total;
};

PolyglotFile WritePart(PartContext& ctx,
                       const split::PartRange& range,
                       const temp::AtomicFile& output,
                       std::uint64_t done_before,
                       const std::string& label) {
    filestream::FileWriter writer(output.TempPath());
    filestream::CopyOptions copy;
    copy.chunk_size = ctx.options.chunk_size;
    if (ctx.options.progress) {
        copy.progress = ctx.options.progress->Callback(label, done_before, ctx.grand_total);
    }
    std::uint64_t copied = filestream::CopyFile(ctx.container.Path(), writer, copy);
    if (copied != ctx.container.Size()) {
        throw IoError("read", ctx.container.Path(), "container changed size while writing");
    }

    digest::Digest slice(ctx.options.hash);
    copy.start_offset = range.begin;
    copy.max_bytes = range.Length();
    copy.observer = [&](const std::uint8_t* data, std::size_t size) {
        slice.Update(data, size);
        ctx.whole.Update(data, size);
    };
    if (ctx.options.progress) {
        copy.progress = ctx.options.progress->Callback(label, done_before + copied, ctx.grand_total);
    }
    copied = filestream::Copy(ctx.payload, writer, copy);
    if (copied != range.Length()) {
        throw IoError("read", ctx.payload.Path(), "payload shorter than planned");
    }
    writer.Close();

    PolyglotFile file;
    file.path = output.FinalPath();
    file.container_size = ctx.container.Size();
    file.range_begin = range.begin;
    file.range_length = range.Length();
    file.slice_checksum = slice.Finish();
    return file;
}

}  // namespace

ContainerTemplate::ContainerTemplate(std::filesystem::path path) : path_(std::move(path)) {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        throw InputError("Container not found: " + path_.string());
    }
    if (!std::filesystem::is_regular_file(path_, ec)) {
        throw InputError("Container is not a regular file: " + path_.string());
    }
    size_ = filestream::FileSize(path_);
    if (size_ == 0) {
        throw InputError("Container is empty: " + path_.string());
    }
}

std::filesystem::path ResolveOutputPath(const std::filesystem::path& requested,
                                        const ContainerTemplate& container) {
    std::filesystem::path out = requested.empty() ? std::filesystem::path(constants::kDefaultOutputBase) : requested;
    if (!out.has_extension()) {
        out += container.Path().extension();
    }
    return out;
}

StagedWrite StageSingle(const ContainerTemplate& container,
                        const payload::PayloadSource& payload,
                        const std::filesystem::path& output,
                        const WriteOptions& options) {
    if (payload.TotalLength() == 0) {
        throw InputError("Payload is empty");
    }
    RejectOverwritingInputs(output, container, payload);
    EnsureParent(output);

    split::SplitPlan plan(payload.TotalLength(), payload.TotalLength());
    filestream::FileReader reader(payload.Path());
    digest::Digest whole(options.hash);
    PartContext ctx{container, reader, options, whole, container.Size() + payload.TotalLength()};

    StagedWrite staged;
    staged.outputs.emplace_back(output);
    staged.result.files.push_back(WritePart(ctx, plan.Part(0), staged.outputs.back(), 0, output.filename().string()));
    if (options.progress) {
        options.progress->Finish();
    }
    log::Debug("Wrote " + output.string() + " (" + std::to_string(staged.result.files.back().FileSize()) + " bytes)");
    staged.result.payload_checksum = whole.Finish();
    return staged;
}

StagedWrite StageSplit(const ContainerTemplate& container,
                       const payload::PayloadSource& payload,
                       const std::filesystem::path& output_base,
                       std::uint64_t part_size,
                       const WriteOptions& options) {
    if (payload.TotalLength() == 0) {
        throw InputError("Payload is empty");
    }
    if (part_size == 0) {
        throw InputError("Split size must be at least one byte");
    }
    split::SplitPlan plan(payload.TotalLength(), part_size);
    std::vector<std::filesystem::path> names;
    for (const auto& range : plan.Parts()) {
        names.push_back(split::PartPath(output_base, range.Number(), plan.PartCount()));
        RejectOverwritingInputs(names.back(), container, payload);
    }
    EnsureParent(output_base);

    filestream::FileReader reader(payload.Path());
    digest::Digest whole(options.hash);
    std::uint64_t grand_total = container.Size() * plan.PartCount() + payload.TotalLength();
    PartContext ctx{container, reader, options, whole, grand_total};

    StagedWrite staged;
    staged.outputs.reserve(plan.PartCount());
    std::uint64_t done = 0;
    for (const auto& range : plan.Parts()) {
        staged.outputs.emplace_back(names[range.index]);
        std::string label = "part " + std::to_string(range.Number()) + "/" + std::to_string(plan.PartCount());
        staged.result.files.push_back(WritePart(ctx, range, staged.outputs.back(), done, label));
        done += staged.result.files.back().FileSize();
        log::Debug("Wrote " + names[range.index].string() + " (" + std::to_string(range.Length())
                   + " payload bytes)");
    }
    if (options.progress) {
        options.progress->Finish();
    }
    staged.result.payload_checksum = whole.Finish();
    return staged;
}

WriteResult WriteSingle(const ContainerTemplate& container,
                        const payload::PayloadSource& payload,
                        const std::filesystem::path& output,
                        const WriteOptions& options) {
    StagedWrite staged = StageSingle(container, payload, output, options);
    temp::CommitAll(staged.outputs);
    return std::move(staged.result);
}

WriteResult WriteSplit(const ContainerTemplate& container,
                       const payload::PayloadSource& payload,
                       const std::filesystem::path& output_base,
                       std::uint64_t part_size,
                       const WriteOptions& options) {
    StagedWrite staged = StageSplit(container, payload, output_base, part_size, options);
    temp::CommitAll(staged.outputs);
    return std::move(staged.result);
}

}  // namespace polyvid::writer
