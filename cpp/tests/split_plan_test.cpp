#include "polyvid/split_plan.hpp"

#include "polyvid/errors.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace polyvid::split {
namespace {

TEST(SplitPlan, TwentyFiveBytesInTens) {
    SplitPlan plan(25, 10);
    ASSERT_EQ(plan.PartCount(), 3u);
    EXPECT_EQ(plan.Part(0).begin, 0u);
    EXPECT_EQ(plan.Part(0).end, 10u);
    EXPECT_EQ(plan.Part(1).begin, 10u);
    EXPECT_EQ(plan.Part(1).end, 20u);
    EXPECT_EQ(plan.Part(2).begin, 20u);
    EXPECT_EQ(plan.Part(2).Length(), 5u);
    EXPECT_EQ(plan.Part(2).Number(), 3u);
}

TEST(SplitPlan, PartSizeAtLeastPayloadGivesOnePart) {
    SplitPlan exact(10, 10);
    EXPECT_EQ(exact.PartCount(), 1u);
    SplitPlan larger(10, 1000);
    ASSERT_EQ(larger.PartCount(), 1u);
    EXPECT_EQ(larger.Part(0).Length(), 10u);
}

TEST(SplitPlan, RangesAreContiguousAndCoverPayload) {
    for (std::uint64_t length = 1; length <= 40; ++length) {
        for (std::uint64_t size = 1; size <= 45; ++size) {
            SplitPlan plan(length, size);
            EXPECT_EQ(plan.PartCount(), (length + size - 1) / size);
            std::uint64_t expected_begin = 0;
            for (const auto& range : plan.Parts()) {
                EXPECT_EQ(range.begin, expected_begin);
                EXPECT_GT(range.Length(), 0u);
                EXPECT_LE(range.Length(), size);
                expected_begin = range.end;
            }
            EXPECT_EQ(expected_begin, length);
        }
    }
}

TEST(SplitPlan, RejectsZeroSizes) {
    EXPECT_THROW(SplitPlan(0, 10), InputError);
    EXPECT_THROW(SplitPlan(10, 0), InputError);
}

TEST(SplitPlan, PartIndexOutOfRange) {
    SplitPlan plan(25, 10);
    EXPECT_THROW(plan.Part(3), std::out_of_range);
}

TEST(PartNaming, ZeroPadsToPartCountWidth) {
    EXPECT_EQ(PartPath("dir/video.mp4", 3, 12), std::filesystem::path("dir/video_part03.mp4"));
    EXPECT_EQ(PartPath("video.mp4", 1, 9), std::filesystem::path("video_part1.mp4"));
    EXPECT_EQ(PartPath("video.mkv", 7, 100), std::filesystem::path("video_part007.mkv"));
}

TEST(PartNaming, PaddedNamesSortLexicographically) {
    std::string previous;
    for (std::size_t i = 1; i <= 12; ++i) {
        std::string name = PartPath("v.mp4", i, 12).string();
        EXPECT_LT(previous, name);
        previous = name;
    }
}

TEST(PartNaming, ParsesPartNumber) {
    auto parsed = ParsePartName("clips/holiday_part07.mkv");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->base_stem, "holiday");
    EXPECT_EQ(parsed->number, 7u);
    EXPECT_EQ(parsed->width, 2u);
    EXPECT_EQ(parsed->extension, ".mkv");
    EXPECT_EQ(ParsePartName("holiday_part7.mkv")->width, 1u);
}

TEST(PartNaming, RejectsNamesWithoutValidNumber) {
    EXPECT_FALSE(ParsePartName("holiday.mp4").has_value());
    EXPECT_FALSE(ParsePartName("holiday_part.mp4").has_value());
    EXPECT_FALSE(ParsePartName("holiday_partx.mp4").has_value());
    EXPECT_FALSE(ParsePartName("holiday_part0.mp4").has_value());
}

}  // namespace
}  // namespace polyvid::split
