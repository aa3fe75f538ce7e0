#include "polyvid/payload.hpp"

#include "polyvid/errors.hpp"

#include "test_util.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

namespace polyvid::payload {
namespace {

class PayloadTest : public test::TempDirTest {
protected:
    PayloadRequest Request(PayloadMode mode, std::vector<PayloadInput> inputs) const {
        PayloadRequest request;
        request.mode = mode;
        request.inputs = std::move(inputs);
        request.work_dir = Root();
        return request;
    }

    std::size_t WorkDirs() const {
        std::size_t count = 0;
        for (const auto& item : std::filesystem::directory_iterator(Root())) {
            if (item.path().filename().string().rfind("polyvid-payload", 0) == 0) {
                ++count;
            }
        }
        return count;
    }
};

TEST_F(PayloadTest, SingleFileIsWrapped) {
    test::WriteText(Path("notes.txt"), "secret notes");
    PayloadSource source = BuildPayload(Request(PayloadMode::SingleFile, {{Path("notes.txt"), {}}}));

    EXPECT_FALSE(source.IsDirect());
    ASSERT_TRUE(source.ArchiveFormat() == archive::Format::Zip);
    EXPECT_EQ(source.EmbeddedName(), "hidden_archive.zip");
    EXPECT_EQ(source.Entries(), std::vector<std::string>{"notes.txt"});
    EXPECT_EQ(source.TotalLength(), std::filesystem::file_size(source.Path()));
    EXPECT_EQ(source.Signature(), archive::Signature(archive::Format::Zip));
    EXPECT_EQ(archive::ListEntries(source.Path()), std::vector<std::string>{"notes.txt"});
}

TEST_F(PayloadTest, EntryNameOverride) {
    test::WriteText(Path("notes.txt"), "secret notes");
    PayloadSource source = BuildPayload(Request(PayloadMode::SingleFile, {{Path("notes.txt"), "docs/renamed.txt"}}));
    EXPECT_EQ(archive::ListEntries(source.Path()), std::vector<std::string>{"docs/renamed.txt"});
}

TEST_F(PayloadTest, BypassEmbedsKnownArchiveVerbatim) {
    test::WriteText(Path("a.txt"), "alpha");
    archive::Pack({{Path("a.txt"), "a.txt"}}, archive::Format::Zip, Path("ready.zip"));
    PayloadRequest request = Request(PayloadMode::SingleFile, {{Path("ready.zip"), {}}});
    request.bypass_wrapping = true;

    PayloadSource source = BuildPayload(request);
    EXPECT_TRUE(source.IsDirect());
    EXPECT_EQ(source.Path(), Path("ready.zip"));
    EXPECT_EQ(source.EmbeddedName(), "ready.zip");
    EXPECT_EQ(source.TotalLength(), std::filesystem::file_size(Path("ready.zip")));
    EXPECT_EQ(source.Signature(), archive::Signature(archive::Format::Zip));
}

TEST_F(PayloadTest, BypassIgnoredForOtherExtensions) {
    test::WriteText(Path("notes.txt"), "plain");
    PayloadRequest request = Request(PayloadMode::SingleFile, {{Path("notes.txt"), {}}});
    request.bypass_wrapping = true;
    EXPECT_FALSE(BuildPayload(request).IsDirect());
}

TEST_F(PayloadTest, FolderEntriesAreRelativeAndSorted) {
    test::WriteText(Path("tree/b.txt"), "b");
    test::WriteText(Path("tree/a/c.txt"), "c");
    test::WriteText(Path("tree/a/d/e.txt"), "e");
    PayloadSource source = BuildPayload(Request(PayloadMode::FolderOrMultiple, {{Path("tree"), {}}}));

    std::vector<std::string> expected = {"a/c.txt", "a/d/e.txt", "b.txt"};
    EXPECT_EQ(source.Entries(), expected);
    EXPECT_EQ(archive::ListEntries(source.Path()), expected);
}

TEST_F(PayloadTest, MultipleInputsKeepTheirNames) {
    test::WriteText(Path("one.txt"), "1");
    test::WriteText(Path("docs/x.txt"), "x");
    PayloadSource source =
        BuildPayload(Request(PayloadMode::FolderOrMultiple, {{Path("one.txt"), {}}, {Path("docs"), {}}}));
    std::vector<std::string> expected = {"one.txt", "docs/x.txt"};
    EXPECT_EQ(source.Entries(), expected);
}

TEST_F(PayloadTest, TgzFormat) {
    test::WriteText(Path("tree/a.txt"), "a");
    PayloadRequest request = Request(PayloadMode::FolderOrMultiple, {{Path("tree"), {}}});
    request.format = archive::Format::Tgz;
    PayloadSource source = BuildPayload(request);
    EXPECT_EQ(source.EmbeddedName(), "hidden_archive.tgz");
    EXPECT_EQ(source.Signature(), archive::Signature(archive::Format::Tgz));
}

TEST_F(PayloadTest, InputErrorsBeforeAnyOutput) {
    std::filesystem::create_directories(Path("empty"));
    test::WriteText(Path("d1/same.txt"), "1");
    test::WriteText(Path("d2/same.txt"), "2");

    EXPECT_THROW(BuildPayload(Request(PayloadMode::SingleFile, {{Path("missing.txt"), {}}})), InputError);
    EXPECT_THROW(BuildPayload(Request(PayloadMode::FolderOrMultiple, {{Path("empty"), {}}})), InputError);
    EXPECT_THROW(BuildPayload(Request(PayloadMode::FolderOrMultiple, {})), InputError);
    EXPECT_THROW(BuildPayload(Request(PayloadMode::FolderOrMultiple,
                                      {{Path("d1/same.txt"), {}}, {Path("d2/same.txt"), {}}})),
                 InputError);
    EXPECT_EQ(WorkDirs(), 0u);
}

TEST_F(PayloadTest, ExistingArchiveMustLookLikeOne) {
    test::WriteText(Path("fake.zip"), "not really a zip");
    EXPECT_THROW(BuildPayload(Request(PayloadMode::ExistingArchive, {{Path("fake.zip"), {}}})), InputError);

    test::WriteText(Path("a.txt"), "alpha");
    archive::Pack({{Path("a.txt"), "a.txt"}}, archive::Format::Tgz, Path("real.tgz"));
    PayloadSource source = BuildPayload(Request(PayloadMode::ExistingArchive, {{Path("real.tgz"), {}}}));
    EXPECT_TRUE(source.IsDirect());
    EXPECT_TRUE(source.ArchiveFormat() == archive::Format::Tgz);
}

TEST_F(PayloadTest, DirectEmbedAcceptsAnyFile) {
    test::WriteFile(Path("blob.bin"), test::Letters(64));
    PayloadSource source = BuildPayload(Request(PayloadMode::DirectEmbedArchive, {{Path("blob.bin"), {}}}));
    EXPECT_TRUE(source.IsDirect());
    EXPECT_FALSE(source.ArchiveFormat().has_value());
    EXPECT_TRUE(source.Signature().empty());
    EXPECT_EQ(source.TotalLength(), 64u);
}

TEST_F(PayloadTest, EmptyDirectPayloadRejected) {
    test::WriteText(Path("empty.bin"), "");
    EXPECT_THROW(BuildPayload(Request(PayloadMode::DirectEmbedArchive, {{Path("empty.bin"), {}}})), InputError);
}

TEST_F(PayloadTest, PackedArchiveRemovedWithSource) {
    test::WriteText(Path("notes.txt"), "secret notes");
    std::filesystem::path packed;
    {
        PayloadSource source = BuildPayload(Request(PayloadMode::SingleFile, {{Path("notes.txt"), {}}}));
        packed = source.Path();
        EXPECT_TRUE(std::filesystem::exists(packed));
        EXPECT_EQ(WorkDirs(), 1u);
    }
    EXPECT_FALSE(std::filesystem::exists(packed));
    EXPECT_EQ(WorkDirs(), 0u);
}

TEST(PayloadMode, Names) {
    EXPECT_EQ(ModeFromName("Folder"), PayloadMode::FolderOrMultiple);
    EXPECT_EQ(ModeFromName(ModeName(PayloadMode::DirectEmbedArchive)), PayloadMode::DirectEmbedArchive);
    EXPECT_THROW(ModeFromName("zipit"), InputError);
}

}  // namespace
}  // namespace polyvid::payload
