#include "polyvid/polyglot_reader.hpp"
#include "polyvid/polyglot_writer.hpp"
#include "polyvid/polyvid.hpp"

#include "polyvid/cancel.hpp"
#include "polyvid/errors.hpp"
#include "polyvid/temp_path.hpp"

#include "test_util.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace polyvid {
namespace {

using test::Bytes;

const Bytes kZipMagic = {'P', 'K', 0x03, 0x04};

class PolyglotTest : public test::TempDirTest {
protected:
    void TearDown() override { cancel::Reset(); }

    std::filesystem::path Container(const std::string& name, std::size_t size, std::uint8_t fill = 0xAA) {
        auto path = Path(name);
        test::WriteFile(path, Bytes(size, fill));
        return path;
    }

    std::filesystem::path Payload(const std::string& name, const Bytes& data) {
        auto path = Path(name);
        test::WriteFile(path, data);
        return path;
    }

    static Bytes Slice(const Bytes& data, std::size_t begin, std::size_t length) {
        return Bytes(data.begin() + static_cast<std::ptrdiff_t>(begin),
                     data.begin() + static_cast<std::ptrdiff_t>(begin + length));
    }
};

TEST_F(PolyglotTest, SingleOutputIsContainerThenPayload) {
    Bytes payload_bytes = {'P', 'K', 'x', 'x', 'x', 'x', 'x', 'x', 'x', 'x'};
    writer::ContainerTemplate container(Container("clip.mp4", 100));
    auto source = payload::PayloadSource::FromFile(Payload("data.bin", payload_bytes));

    auto written = writer::WriteSingle(container, source, Path("out.mp4"));
    ASSERT_EQ(written.files.size(), 1u);
    EXPECT_EQ(written.files[0].FileSize(), 110u);
    EXPECT_EQ(written.payload_checksum, digest::DigestBytes(payload_bytes, digest::HashAlgorithm::Sha256));
    EXPECT_EQ(test::ReadFile(Path("out.mp4")), test::Concat(Bytes(100, 0xAA), payload_bytes));
    EXPECT_EQ(test::ReadFile(Path("clip.mp4")), Bytes(100, 0xAA));

    reader::ReadOptions options;
    options.signature = signature::FromString("PK");
    auto location = reader::LocatePayload(Path("out.mp4"), options);
    EXPECT_EQ(location.source, reader::OffsetSource::Signature);
    EXPECT_EQ(location.offset, 100u);

    auto extracted = reader::ExtractSingle(Path("out.mp4"), Path("back.bin"), options);
    EXPECT_EQ(test::ReadFile(Path("back.bin")), payload_bytes);
    EXPECT_EQ(extracted.bytes_written, 10u);
    EXPECT_EQ(extracted.checksum, written.payload_checksum);
    EXPECT_FALSE(extracted.degraded);
}

TEST_F(PolyglotTest, SplitPartsCombineBackInOrder) {
    Bytes payload_bytes = test::Concat(kZipMagic, test::Letters(21));
    writer::ContainerTemplate container(Container("clip.mp4", 64));
    auto source = payload::PayloadSource::FromFile(Payload("data.bin", payload_bytes));

    auto written = writer::WriteSplit(container, source, Path("out.mp4"), 10);
    ASSERT_EQ(written.files.size(), 3u);
    EXPECT_EQ(written.files[0].path, Path("out_part1.mp4"));
    EXPECT_EQ(written.files[2].path, Path("out_part3.mp4"));
    EXPECT_EQ(written.files[0].range_length, 10u);
    EXPECT_EQ(written.files[1].range_length, 10u);
    EXPECT_EQ(written.files[2].range_length, 5u);
    EXPECT_EQ(test::ReadFile(Path("out_part2.mp4")), test::Concat(Bytes(64, 0xAA), Slice(payload_bytes, 10, 10)));
    EXPECT_EQ(written.files[1].slice_checksum,
              digest::DigestBytes(Slice(payload_bytes, 10, 10), digest::HashAlgorithm::Sha256));
    EXPECT_EQ(test::CountPartialFiles(Root()), 0u);

    std::vector<std::filesystem::path> parts = {Path("out_part1.mp4"), Path("out_part2.mp4"), Path("out_part3.mp4")};
    auto combined = reader::ExtractAndCombine(parts, Path("combined.bin"));
    EXPECT_EQ(test::ReadFile(Path("combined.bin")), payload_bytes);
    EXPECT_EQ(combined.checksum, written.payload_checksum);
    ASSERT_EQ(combined.locations.size(), 3u);
    EXPECT_EQ(combined.locations[0].source, reader::OffsetSource::Signature);
    EXPECT_EQ(combined.locations[1].source, reader::OffsetSource::SharedPrefix);
    EXPECT_EQ(combined.locations[2].source, reader::OffsetSource::SharedPrefix);
    EXPECT_EQ(combined.locations[2].offset, 64u);
    ASSERT_EQ(combined.slice_checksums.size(), 3u);
    for (std::size_t i = 0; i < 3; ++i) {
        EXPECT_EQ(combined.slice_checksums[i], written.files[i].slice_checksum);
    }
}

TEST_F(PolyglotTest, SwappedPartsChangeTheChecksum) {
    Bytes payload_bytes = test::Concat(kZipMagic, test::Letters(21, 7));
    writer::ContainerTemplate container(Container("clip.mp4", 64));
    auto source = payload::PayloadSource::FromFile(Payload("data.bin", payload_bytes));
    auto written = writer::WriteSplit(container, source, Path("out.mp4"), 10);

    std::vector<std::filesystem::path> swapped = {Path("out_part1.mp4"), Path("out_part3.mp4"), Path("out_part2.mp4")};
    auto combined = reader::ExtractAndCombine(swapped, Path("combined.bin"));
    EXPECT_EQ(combined.bytes_written, 25u);
    EXPECT_NE(combined.checksum, written.payload_checksum);
    EXPECT_NE(test::ReadFile(Path("combined.bin")), payload_bytes);
}

TEST_F(PolyglotTest, MissingSignatureFallsBackToEstimate) {
    test::WriteFile(Path("plain.mp4"), test::Letters(101, 3));

    reader::ReadOptions options;
    auto location = reader::LocatePayload(Path("plain.mp4"), options);
    EXPECT_EQ(location.source, reader::OffsetSource::Estimated);
    EXPECT_EQ(location.offset, 50u);
    EXPECT_TRUE(location.Degraded());

    auto extracted = reader::ExtractSingle(Path("plain.mp4"), Path("guess.bin"), options);
    EXPECT_TRUE(extracted.degraded);
    EXPECT_EQ(extracted.bytes_written, 51u);

    options.allow_estimate = false;
    EXPECT_THROW(reader::LocatePayload(Path("plain.mp4"), options), SignatureNotFoundError);
    EXPECT_THROW(reader::ExtractSingle(Path("plain.mp4"), Path("strict.bin"), options), SignatureNotFoundError);
    EXPECT_FALSE(std::filesystem::exists(Path("strict.bin")));
    EXPECT_EQ(test::CountPartialFiles(Root()), 0u);
}

TEST_F(PolyglotTest, RecordedContainerSizeAcrossPayloadSizes) {
    writer::ContainerTemplate container(Container("clip.mkv", 50));
    for (std::size_t size : {1u, 7u, 64u, 256u, 257u, 1000u}) {
        SCOPED_TRACE(size);
        Bytes payload_bytes = test::Letters(size, static_cast<std::uint32_t>(size));
        auto source = payload::PayloadSource::FromFile(Payload("data.bin", payload_bytes));
        auto out = Path("out_" + std::to_string(size) + ".mkv");
        writer::WriteOptions write_options;
        write_options.chunk_size = 16;
        auto written = writer::WriteSingle(container, source, out, write_options);

        reader::ReadOptions options;
        options.container_size = 50;
        options.chunk_size = 16;
        auto location = reader::LocatePayload(out, options);
        EXPECT_EQ(location.source, reader::OffsetSource::Recorded);
        EXPECT_EQ(location.PayloadLength(), size);

        auto back = Path("back_" + std::to_string(size) + ".bin");
        auto extracted = reader::ExtractSingle(out, back, options);
        EXPECT_EQ(test::ReadFile(back), payload_bytes);
        EXPECT_EQ(extracted.checksum, written.payload_checksum);
    }
}

TEST_F(PolyglotTest, RecordedSizeThatDoesNotFitIsIgnored) {
    Bytes payload_bytes = test::Concat(kZipMagic, test::Letters(12));
    writer::ContainerTemplate container(Container("clip.mp4", 30));
    auto source = payload::PayloadSource::FromFile(Payload("data.bin", payload_bytes));
    writer::WriteSingle(container, source, Path("out.mp4"));

    reader::ReadOptions options;
    options.container_size = 4096;
    auto location = reader::LocatePayload(Path("out.mp4"), options);
    EXPECT_EQ(location.source, reader::OffsetSource::Signature);
    EXPECT_EQ(location.offset, 30u);
}

TEST_F(PolyglotTest, SplitWithSmallChunksMatchesWhole) {
    Bytes payload_bytes = test::Concat(kZipMagic, test::Letters(997, 11));
    writer::ContainerTemplate container(Container("clip.avi", 40));
    auto source = payload::PayloadSource::FromFile(Payload("data.bin", payload_bytes));
    writer::WriteOptions write_options;
    write_options.chunk_size = 33;
    auto written = writer::WriteSplit(container, source, Path("out.avi"), 100, write_options);
    ASSERT_EQ(written.files.size(), 11u);
    EXPECT_EQ(written.files[0].path, Path("out_part01.avi"));
    EXPECT_EQ(written.files[10].range_length, 1u);

    std::vector<std::filesystem::path> parts;
    for (const auto& file : written.files) {
        parts.push_back(file.path);
    }
    reader::ReadOptions options;
    options.chunk_size = 33;
    auto combined = reader::ExtractAndCombine(parts, Path("combined.bin"), options);
    EXPECT_EQ(combined.checksum, digest::DigestBytes(payload_bytes, digest::HashAlgorithm::Sha256));
    EXPECT_EQ(test::ReadFile(Path("combined.bin")), payload_bytes);
}

TEST_F(PolyglotTest, CancelledSplitLeavesNothingBehind) {
    writer::ContainerTemplate container(Container("clip.mp4", 64));
    auto source = payload::PayloadSource::FromFile(Payload("data.bin", test::Concat(kZipMagic, test::Letters(60))));
    cancel::Request();
    EXPECT_THROW(writer::WriteSplit(container, source, Path("out.mp4"), 16), CancelledError);
    EXPECT_TRUE(cancel::Requested());
    cancel::Reset();
    EXPECT_FALSE(cancel::Requested());

    EXPECT_FALSE(std::filesystem::exists(Path("out_part1.mp4")));
    EXPECT_FALSE(std::filesystem::exists(Path("out_part4.mp4")));
    EXPECT_EQ(test::CountPartialFiles(Root()), 0u);
}

TEST_F(PolyglotTest, RejectsBadInputs) {
    EXPECT_THROW({ writer::ContainerTemplate missing(Path("missing.mp4")); }, InputError);
    test::WriteFile(Path("empty.mp4"), {});
    EXPECT_THROW({ writer::ContainerTemplate empty(Path("empty.mp4")); }, InputError);

    writer::ContainerTemplate container(Container("clip.mp4", 16));
    auto source = payload::PayloadSource::FromFile(Payload("data.bin", kZipMagic));
    EXPECT_THROW(writer::WriteSingle(container, source, Path("clip.mp4")), InputError);
    EXPECT_THROW(writer::WriteSingle(container, source, Path("data.bin")), InputError);
    EXPECT_THROW(writer::WriteSplit(container, source, Path("out.mp4"), 0), InputError);
    EXPECT_EQ(test::ReadFile(Path("clip.mp4")), Bytes(16, 0xAA));

    EXPECT_THROW(reader::ExtractAndCombine({}, Path("x.bin")), InputError);
}

TEST_F(PolyglotTest, ResolveOutputPath) {
    writer::ContainerTemplate container(Container("clip.mov", 8));
    EXPECT_EQ(writer::ResolveOutputPath({}, container), std::filesystem::path("hidden_data.mov"));
    EXPECT_EQ(writer::ResolveOutputPath("dir/result", container), std::filesystem::path("dir/result.mov"));
    EXPECT_EQ(writer::ResolveOutputPath("result.mp4", container), std::filesystem::path("result.mp4"));
}

TEST_F(PolyglotTest, DiscoverPartsInNumericOrder) {
    for (int number : {1, 2, 3, 10, 11, 4, 5, 6, 7, 8, 9}) {
        test::WriteText(Path("movie_part" + std::to_string(number) + ".mp4"), "x");
    }
    test::WriteText(Path("movie_part3.txt"), "not a container");
    test::WriteText(Path("other_part1.mp4"), "x");

    auto discovery = reader::DiscoverParts(Path("movie_part3.mp4"));
    EXPECT_TRUE(discovery.missing.empty());
    ASSERT_EQ(discovery.parts.size(), 11u);
    EXPECT_EQ(discovery.parts[0], Path("movie_part1.mp4"));
    EXPECT_EQ(discovery.parts[9], Path("movie_part10.mp4"));
    EXPECT_EQ(discovery.parts[10], Path("movie_part11.mp4"));
}

TEST_F(PolyglotTest, DiscoverReportsGaps) {
    test::WriteText(Path("movie_part1.mp4"), "x");
    test::WriteText(Path("movie_part4.mp4"), "x");
    auto discovery = reader::DiscoverParts(Path("movie_part1.mp4"));
    EXPECT_EQ(discovery.missing, (std::vector<std::size_t>{2, 3}));

    auto lone = reader::DiscoverParts(Path("standalone.mp4"));
    ASSERT_EQ(lone.parts.size(), 1u);
    EXPECT_EQ(lone.parts[0], Path("standalone.mp4"));
}

TEST_F(PolyglotTest, SplitRoundTripAtEdgePartSizes) {
    Bytes payload_bytes = test::Concat(kZipMagic, test::Letters(21, 9));
    writer::ContainerTemplate container(Container("clip.mp4", 64));
    auto source = payload::PayloadSource::FromFile(Payload("data.bin", payload_bytes));

    for (std::uint64_t part_size : {1u, 2u, 3u, 24u, 25u, 40u}) {
        SCOPED_TRACE(part_size);
        auto base = Path("s" + std::to_string(part_size) + "/out.mp4");
        auto written = writer::WriteSplit(container, source, base, part_size);
        EXPECT_EQ(written.files.size(), (payload_bytes.size() + part_size - 1) / part_size);

        std::vector<std::filesystem::path> parts;
        for (const auto& file : written.files) {
            parts.push_back(file.path);
        }
        reader::ReadOptions options;
        options.allow_estimate = false;
        auto back = Path("back_" + std::to_string(part_size) + ".bin");
        auto combined = reader::ExtractAndCombine(parts, back, options);
        EXPECT_EQ(test::ReadFile(back), payload_bytes);
        EXPECT_EQ(combined.checksum, written.payload_checksum);
        EXPECT_FALSE(combined.degraded);
        for (const auto& location : combined.locations) {
            EXPECT_EQ(location.offset, 64u);
        }
        if (parts.size() == 1) {
            auto single = reader::ExtractSingle(parts.front(), Path("single_" + std::to_string(part_size) + ".bin"),
                                                options);
            EXPECT_EQ(single.checksum, written.payload_checksum);
        }
    }
}

TEST_F(PolyglotTest, SignatureSpreadOverPartsNeedsTheSamePrefix) {
    Bytes payload_bytes = test::Concat(kZipMagic, test::Letters(4, 2));
    writer::ContainerTemplate container(Container("clip.mp4", 32));
    auto source = payload::PayloadSource::FromFile(Payload("data.bin", payload_bytes));
    auto written = writer::WriteSplit(container, source, Path("out.mp4"), 2);
    ASSERT_EQ(written.files.size(), 4u);

    // Same payload bytes behind a different container.
    Bytes other = test::ReadFile(written.files[1].path);
    other[0] = 0x55;
    test::WriteFile(written.files[1].path, other);

    std::vector<std::filesystem::path> parts;
    for (const auto& file : written.files) {
        parts.push_back(file.path);
    }
    reader::ReadOptions options;
    options.allow_estimate = false;
    EXPECT_THROW(reader::LocateParts(parts, options), SignatureNotFoundError);
}

TEST_F(PolyglotTest, FailedRenameLeavesNoFinalNames) {
    writer::ContainerTemplate container(Container("clip.mp4", 64));
    auto source = payload::PayloadSource::FromFile(Payload("data.bin", test::Concat(kZipMagic, test::Letters(21))));
    test::WriteText(Path("out_part2.mp4/keep.txt"), "in the way");

    EXPECT_THROW(writer::WriteSplit(container, source, Path("out.mp4"), 10), IoError);
    EXPECT_FALSE(std::filesystem::exists(Path("out_part1.mp4")));
    EXPECT_FALSE(std::filesystem::exists(Path("out_part3.mp4")));
    EXPECT_TRUE(std::filesystem::is_directory(Path("out_part2.mp4")));
    EXPECT_EQ(test::ReadText(Path("out_part2.mp4/keep.txt")), "in the way");
    EXPECT_EQ(test::CountPartialFiles(Root()), 0u);
}

TEST_F(PolyglotTest, CommitAllRemovesRenamedFilesWhenOneFails) {
    std::vector<temp::AtomicFile> files;
    files.emplace_back(Path("a.bin"));
    files.emplace_back(Path("b.bin"));
    test::WriteText(files[0].TempPath(), "first");
    // The second temporary file is never written, so its rename fails.

    EXPECT_THROW(temp::CommitAll(files), IoError);
    EXPECT_FALSE(std::filesystem::exists(Path("a.bin")));
    EXPECT_FALSE(std::filesystem::exists(Path("b.bin")));
    files.clear();
    EXPECT_EQ(test::CountPartialFiles(Root()), 0u);
}

TEST_F(PolyglotTest, DiscoverWarnsAboutLeftoverParts) {
    writer::ContainerTemplate container(Container("clip.mp4", 64));
    auto source = payload::PayloadSource::FromFile(Payload("data.bin", test::Concat(kZipMagic, test::Letters(21))));
    writer::WriteSplit(container, source, Path("out.mp4"), 10);

    auto clean = reader::DiscoverParts(Path("out_part1.mp4"));
    EXPECT_EQ(clean.parts.size(), 3u);
    EXPECT_TRUE(clean.warnings.empty());

    // A fourth part from an earlier run with the same split size.
    std::filesystem::copy_file(Path("out_part2.mp4"), Path("out_part4.mp4"));
    auto stale = reader::DiscoverParts(Path("out_part1.mp4"));
    EXPECT_EQ(stale.parts.size(), 4u);
    ASSERT_EQ(stale.warnings.size(), 1u);
    EXPECT_NE(stale.warnings[0].find("out_part3.mp4"), std::string::npos);

    test::WriteText(Path("movie_part01.mp4"), "x");
    test::WriteText(Path("movie_part2.mp4"), "x");
    auto mixed = reader::DiscoverParts(Path("movie_part2.mp4"));
    EXPECT_EQ(mixed.parts.size(), 2u);
    EXPECT_FALSE(mixed.warnings.empty());

    test::WriteText(Path("movie_part1.mp4"), "x");
    auto duplicated = reader::DiscoverParts(Path("movie_part2.mp4"));
    EXPECT_EQ(duplicated.parts.size(), 2u);
    EXPECT_GE(duplicated.warnings.size(), 1u);
}

class FacadeTest : public PolyglotTest {
protected:
    CreateOptions FolderCreate(const std::string& output) {
        test::WriteText(Path("docs/readme.txt"), "read me first");
        test::WriteFile(Path("docs/img/raw.bin"), test::Letters(3000, 5));
        CreateOptions options;
        options.container = Container("clip.mp4", 256);
        options.payload.mode = payload::PayloadMode::FolderOrMultiple;
        options.payload.inputs = {{Path("docs"), {}}};
        options.output = Path(output);
        return options;
    }
};

TEST_F(FacadeTest, CreateAndExtractWithMetadata) {
    CreateOptions create = FolderCreate("out.mp4");
    auto created = CreatePolyglot(create);
    ASSERT_EQ(created.files.size(), 1u);
    EXPECT_EQ(created.metadata_path, Path("out_recovery.txt"));
    EXPECT_TRUE(std::filesystem::exists(created.metadata_path));
    EXPECT_EQ(created.entries, (std::vector<std::string>{"img/raw.bin", "readme.txt"}));
    EXPECT_EQ(created.metadata.container_size, 256u);
    EXPECT_FALSE(created.metadata.direct_embed);

    ExtractOptions extract;
    extract.inputs = {Path("out.mp4")};
    extract.metadata = created.metadata_path;
    extract.unpack_dir = Path("unpacked");
    auto report = ExtractPolyglot(extract);
    EXPECT_EQ(report.output, Path("extracted_from_out.zip"));
    EXPECT_EQ(report.integrity, IntegrityStatus::Verified);
    EXPECT_FALSE(report.IntegrityUnconfirmed());
    ASSERT_TRUE(report.format == archive::Format::Zip);
    EXPECT_EQ(report.entries, created.entries);
    EXPECT_EQ(test::ReadText(Path("unpacked/readme.txt")), "read me first");
    EXPECT_EQ(test::ReadFile(Path("unpacked/img/raw.bin")), test::Letters(3000, 5));
}

TEST_F(FacadeTest, SplitExtractFromMetadataOnly) {
    CreateOptions create = FolderCreate("movie.mp4");
    create.split_size = 500;
    auto created = CreatePolyglot(create);
    ASSERT_GT(created.files.size(), 1u);
    EXPECT_EQ(created.metadata.parts.size(), created.files.size());

    ExtractOptions extract;
    extract.metadata = created.metadata_path;
    extract.output = Path("payload.zip");
    auto report = ExtractPolyglot(extract);
    EXPECT_EQ(report.integrity, IntegrityStatus::Verified);
    ASSERT_EQ(report.part_checks.size(), created.files.size());
    for (const auto& check : report.part_checks) {
        EXPECT_EQ(check.status, IntegrityStatus::Verified);
        EXPECT_TRUE(check.size_matches);
    }
    EXPECT_EQ(report.entries, created.entries);
}

TEST_F(FacadeTest, SwappedPartsAreFlagged) {
    CreateOptions create = FolderCreate("movie.mp4");
    create.split_size = 600;
    auto created = CreatePolyglot(create);
    ASSERT_GE(created.files.size(), 2u);

    ExtractOptions extract;
    extract.inputs.clear();
    for (const auto& file : created.files) {
        extract.inputs.push_back(file.path);
    }
    std::swap(extract.inputs[0], extract.inputs[1]);
    extract.metadata = created.metadata_path;
    extract.output = Path("payload.zip");
    auto report = ExtractPolyglot(extract);
    EXPECT_EQ(report.integrity, IntegrityStatus::Mismatch);
    EXPECT_TRUE(report.IntegrityUnconfirmed());
    EXPECT_EQ(report.part_checks[0].status, IntegrityStatus::Mismatch);
}

TEST_F(FacadeTest, DiscoveredPartsNeedConfirmation) {
    CreateOptions create = FolderCreate("movie.mp4");
    create.split_size = 1000;
    create.write_metadata = false;
    auto created = CreatePolyglot(create);
    EXPECT_TRUE(created.metadata_path.empty());
    EXPECT_FALSE(std::filesystem::exists(Path("movie_recovery.txt")));

    ExtractOptions extract;
    extract.inputs = {created.files.back().path};
    extract.discover = true;
    extract.output = Path("payload.zip");
    EXPECT_THROW(ExtractPolyglot(extract), InputError);
    EXPECT_FALSE(std::filesystem::exists(Path("payload.zip")));

    extract.confirm_parts = true;
    auto report = ExtractPolyglot(extract);
    EXPECT_EQ(report.integrity, IntegrityStatus::Unchecked);
    EXPECT_EQ(report.result.locations.size(), created.files.size());
    EXPECT_EQ(report.entries, created.entries);
}

TEST_F(FacadeTest, UnpackRequiresAnArchive) {
    CreateOptions create;
    create.container = Container("clip.mp4", 32);
    create.payload.mode = payload::PayloadMode::DirectEmbedArchive;
    create.payload.inputs = {{Payload("blob.bin", test::Letters(40)), {}}};
    create.output = Path("out.mp4");
    auto created = CreatePolyglot(create);
    EXPECT_TRUE(created.metadata.direct_embed);
    EXPECT_TRUE(created.metadata.signature.empty());

    ExtractOptions extract;
    extract.inputs = {Path("out.mp4")};
    extract.metadata = created.metadata_path;
    extract.unpack_dir = Path("unpacked");
    EXPECT_THROW(ExtractPolyglot(extract), MalformedPayloadError);
    EXPECT_EQ(test::ReadFile(Path("extracted_from_out.bin")), test::Letters(40));
}

TEST_F(FacadeTest, InspectReportsOffsetAndEntries) {
    auto created = CreatePolyglot(FolderCreate("out.mp4"));

    InspectOptions inspect;
    inspect.file = Path("out.mp4");
    inspect.metadata = created.metadata_path;
    auto report = InspectPolyglot(inspect);
    EXPECT_EQ(report.location.offset, 256u);
    EXPECT_EQ(report.location.source, reader::OffsetSource::Recorded);
    EXPECT_EQ(report.file_size, created.files[0].FileSize());
    ASSERT_TRUE(report.format == archive::Format::Zip);
    EXPECT_EQ(report.entries, created.entries);
    ASSERT_TRUE(report.part_check.has_value());
    EXPECT_EQ(report.part_check->status, IntegrityStatus::Verified);
    EXPECT_TRUE(report.part_check->size_matches);

    InspectOptions bare;
    bare.file = Path("out.mp4");
    auto scanned = InspectPolyglot(bare);
    EXPECT_EQ(scanned.location.source, reader::OffsetSource::Signature);
    EXPECT_EQ(scanned.location.offset, 256u);
    EXPECT_FALSE(scanned.part_check.has_value());
}

TEST_F(FacadeTest, SplitRoundTripWithMetadataAtEdgePartSizes) {
    Bytes payload_bytes = test::Concat(kZipMagic, test::Letters(21, 4));
    auto blob = Payload("blob.bin", payload_bytes);
    for (std::uint64_t part_size : {1u, 24u, 25u, 30u}) {
        SCOPED_TRACE(part_size);
        CreateOptions create;
        create.container = Container("clip.mp4", 48);
        create.payload.mode = payload::PayloadMode::DirectEmbedArchive;
        create.payload.inputs = {{blob, {}}};
        create.output = Path("s" + std::to_string(part_size) + "/movie.mp4");
        create.split_size = part_size;
        auto created = CreatePolyglot(create);
        EXPECT_EQ(created.metadata.parts.size(), (payload_bytes.size() + part_size - 1) / part_size);

        ExtractOptions extract;
        extract.metadata = created.metadata_path;
        extract.output = Path("back_" + std::to_string(part_size) + ".bin");
        auto report = ExtractPolyglot(extract);
        EXPECT_EQ(report.integrity, IntegrityStatus::Verified);
        EXPECT_FALSE(report.Degraded());
        EXPECT_EQ(test::ReadFile(extract.output), payload_bytes);
        for (const auto& check : report.part_checks) {
            EXPECT_EQ(check.status, IntegrityStatus::Verified);
        }
    }
}

TEST_F(FacadeTest, MetadataNameTakenLeavesNoOutputs) {
    CreateOptions create = FolderCreate("movie.mp4");
    create.split_size = 500;
    test::WriteText(Path("movie_recovery.txt/keep.txt"), "in the way");

    EXPECT_THROW(CreatePolyglot(create), IoError);
    EXPECT_FALSE(std::filesystem::exists(Path("movie_part1.mp4")));
    EXPECT_FALSE(std::filesystem::exists(Path("movie_part01.mp4")));
    EXPECT_EQ(test::CountPartialFiles(Root()), 0u);
}

}  // namespace
}  // namespace polyvid
