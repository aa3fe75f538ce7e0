#include "polyvid/digest.hpp"

#include "polyvid/errors.hpp"

#include "test_util.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

namespace polyvid::digest {
namespace {

Hash Of(const std::string& text, HashAlgorithm algorithm) {
    return DigestBytes(reinterpret_cast<const std::uint8_t*>(text.data()), text.size(), algorithm);
}

TEST(Digest, KnownVectors) {
    EXPECT_EQ(ToHex(Of("abc", HashAlgorithm::Sha256)),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(ToHex(Of("", HashAlgorithm::Md5)), "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_EQ(ToHex(Of("abc", HashAlgorithm::Sha1)), "a9993e364706816aba3e25717850c26c9cd0d89d");
}

TEST(Digest, SizesMatchAlgorithm) {
    EXPECT_EQ(DigestSize(HashAlgorithm::Md5), 16u);
    EXPECT_EQ(DigestSize(HashAlgorithm::Sha256), 32u);
    EXPECT_EQ(DigestSize(HashAlgorithm::Sha512), 64u);
    EXPECT_EQ(DigestSize(HashAlgorithm::Sha3_512), 64u);
    EXPECT_EQ(Of("x", HashAlgorithm::Sha3_512).size(), 64u);
}

TEST(Digest, IncrementalEqualsOneShot) {
    Digest digest(HashAlgorithm::Sha256);
    std::string a = "hello ";
    std::string b = "world";
    digest.Update(reinterpret_cast<const std::uint8_t*>(a.data()), a.size());
    digest.Update(reinterpret_cast<const std::uint8_t*>(b.data()), b.size());
    EXPECT_EQ(digest.Finish(), Of("hello world", HashAlgorithm::Sha256));
}

TEST(Digest, CannotUpdateAfterFinish) {
    Digest digest(HashAlgorithm::Md5);
    digest.Finish();
    EXPECT_THROW(digest.Finish(), std::logic_error);
    std::uint8_t byte = 1;
    EXPECT_THROW(digest.Update(&byte, 1), std::logic_error);
}

TEST(Digest, VerifyIsReflexiveAndDetectsDifference) {
    Hash h1 = Of("one", HashAlgorithm::Sha256);
    Hash h2 = Of("two", HashAlgorithm::Sha256);
    EXPECT_TRUE(Verify(h1, h1));
    EXPECT_TRUE(Verify(Hash{}, Hash{}));
    EXPECT_FALSE(Verify(h1, h2));
    EXPECT_FALSE(Verify(h1, Hash(h1.begin(), h1.end() - 1)));
}

TEST(Digest, HexRoundTripAndRejects) {
    Hash h = Of("abc", HashAlgorithm::Md5);
    EXPECT_EQ(FromHex(ToHex(h)), h);
    EXPECT_EQ(FromHex("ABcd"), (Hash{0xab, 0xcd}));
    EXPECT_TRUE(FromHex("").empty());
    EXPECT_THROW(FromHex("abc"), InputError);
    EXPECT_THROW(FromHex("zz"), InputError);
}

TEST(Digest, AlgorithmNames) {
    EXPECT_EQ(AlgorithmFromName("SHA-256"), HashAlgorithm::Sha256);
    EXPECT_EQ(AlgorithmFromName("sha3_512"), HashAlgorithm::Sha3_512);
    EXPECT_EQ(AlgorithmFromName(AlgorithmName(HashAlgorithm::Sha512)), HashAlgorithm::Sha512);
    EXPECT_THROW(AlgorithmFromName("crc32"), InputError);
}

class DigestFileTest : public test::TempDirTest {};

TEST_F(DigestFileTest, StreamedFileMatchesBuffer) {
    test::Bytes data = test::Letters(10000, 5);
    test::WriteFile(Path("data.bin"), data);
    EXPECT_EQ(DigestFile(Path("data.bin"), HashAlgorithm::Sha256, 7), DigestBytes(data, HashAlgorithm::Sha256));
    EXPECT_EQ(DigestFile(Path("data.bin"), HashAlgorithm::Md5), DigestBytes(data, HashAlgorithm::Md5));
}

TEST_F(DigestFileTest, RangeHashesOnlySlice) {
    test::Bytes data = test::Letters(500, 9);
    test::WriteFile(Path("data.bin"), data);
    test::Bytes slice(data.begin() + 120, data.begin() + 320);
    EXPECT_EQ(DigestRange(Path("data.bin"), 120, 200, HashAlgorithm::Sha1, 33),
              DigestBytes(slice, HashAlgorithm::Sha1));
}

TEST_F(DigestFileTest, RangePastEndIsIoError) {
    test::WriteFile(Path("data.bin"), test::Letters(50));
    EXPECT_THROW(DigestRange(Path("data.bin"), 40, 20, HashAlgorithm::Sha256), IoError);
}

}  // namespace
}  // namespace polyvid::digest
