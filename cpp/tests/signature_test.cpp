#include "polyvid/signature.hpp"

#include "test_util.hpp"

#include <gtest/gtest.h>

#include <algorithm>

namespace polyvid::signature {
namespace {

using test::Bytes;

TEST(SignatureScan, FindsFirstOccurrence) {
    Bytes data = FromString("xxPKyyPKzz");
    ScanResult hit = Scan(data, FromString("PK"));
    EXPECT_TRUE(hit.found);
    EXPECT_EQ(hit.offset, 2u);
}

TEST(SignatureScan, ReportsAbsence) {
    Bytes data = test::Letters(256);
    EXPECT_FALSE(Scan(data, FromString("PK\x03\x04")).found);
}

TEST(SignatureScan, EmptySignatureIsNeverFound) {
    EXPECT_FALSE(Scan(FromString("abc"), Bytes{}).found);
}

TEST(SignatureScan, SignatureLongerThanData) {
    EXPECT_FALSE(Scan(FromString("PK"), FromString("PK\x03\x04")).found);
}

TEST(SignatureScan, MatchAtEndOfBuffer) {
    ScanResult hit = Scan(FromString("aaaaPK"), FromString("PK"));
    EXPECT_TRUE(hit.found);
    EXPECT_EQ(hit.offset, 4u);
}

class SignatureFileTest : public test::TempDirTest {};

TEST_F(SignatureFileTest, FindsMatchStraddlingChunkBoundary) {
    Bytes data = test::Letters(100);
    Bytes sig = FromString("PK\x03\x04");
    std::copy(sig.begin(), sig.end(), data.begin() + 30);
    test::WriteFile(Path("f.bin"), data);

    ScanResult hit = ScanFile(Path("f.bin"), sig, 0, 32);
    EXPECT_TRUE(hit.found);
    EXPECT_EQ(hit.offset, 30u);
}

TEST_F(SignatureFileTest, HonoursStartOffset) {
    Bytes data = test::Letters(200);
    Bytes sig = FromString("PK");
    std::copy(sig.begin(), sig.end(), data.begin() + 10);
    std::copy(sig.begin(), sig.end(), data.begin() + 150);
    test::WriteFile(Path("f.bin"), data);

    EXPECT_EQ(ScanFile(Path("f.bin"), sig, 0, 16).offset, 10u);
    ScanResult later = ScanFile(Path("f.bin"), sig, 11, 16);
    EXPECT_TRUE(later.found);
    EXPECT_EQ(later.offset, 150u);
    EXPECT_FALSE(ScanFile(Path("f.bin"), sig, 151, 16).found);
}

TEST_F(SignatureFileTest, MissingSignatureInFile) {
    test::WriteFile(Path("f.bin"), test::Letters(5000));
    EXPECT_FALSE(ScanFile(Path("f.bin"), FromString("PK\x03\x04"), 0, 64).found);
}

TEST_F(SignatureFileTest, MatchesAtChecksExactOffset) {
    test::WriteText(Path("f.bin"), "....PK\x03\x04....");
    Bytes sig = FromString("PK\x03\x04");
    EXPECT_TRUE(MatchesAt(Path("f.bin"), sig, 4));
    EXPECT_FALSE(MatchesAt(Path("f.bin"), sig, 3));
    EXPECT_FALSE(MatchesAt(Path("f.bin"), sig, 10));
}

TEST(SignatureEstimate, HalvesLengthByDefault) {
    EXPECT_EQ(EstimateOffset(101), 50u);
    EXPECT_EQ(EstimateOffset(0), 0u);
    EXPECT_EQ(EstimateOffset(100, 10), 10u);
}

}  // namespace
}  // namespace polyvid::signature
