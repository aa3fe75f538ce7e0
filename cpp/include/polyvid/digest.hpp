#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace polyvid::digest {

using Bytes = std::vector<std::uint8_t>;
using Hash = std::vector<std::uint8_t>;

enum class HashAlgorithm {
    Md5,
    Sha1,
    Sha256,
    Sha512,
    Sha3_512
};

HashAlgorithm AlgorithmFromName(std::string_view name);
std::string AlgorithmName(HashAlgorithm algorithm);
std::size_t DigestSize(HashAlgorithm algorithm);

// Incremental hasher over OpenSSL EVP.
class Digest {
public:
    explicit Digest(HashAlgorithm algorithm);
    ~Digest();

    Digest(Digest&&) noexcept;
    Digest& operator=(Digest&&) noexcept;
    Digest(const Digest&) = delete;
    Digest& operator=(const Digest&) = delete;

    void Update(const std::uint8_t* data, std::size_t size);
    void Update(const Bytes& data) { Update(data.data(), data.size()); }

    // Produces the hash; the object cannot be updated afterwards.
    Hash Finish();

    HashAlgorithm Algorithm() const noexcept { return algorithm_; }

private:
    struct Context;
    std::unique_ptr<Context> ctx_;
    HashAlgorithm algorithm_;
    bool finished_ = false;
};

Hash DigestBytes(const std::uint8_t* data, std::size_t size, HashAlgorithm algorithm);
Hash DigestBytes(const Bytes& data, HashAlgorithm algorithm);

// Streams the whole file through the hash in chunks of at most chunk_size bytes.
Hash DigestFile(const std::filesystem::path& path,
                HashAlgorithm algorithm,
                std::size_t chunk_size = 0);

// Hashes length bytes starting at offset. Throws IoError when the file is shorter.
Hash DigestRange(const std::filesystem::path& path,
                 std::uint64_t offset,
                 std::uint64_t length,
                 HashAlgorithm algorithm,
                 std::size_t chunk_size = 0);

bool Verify(const Hash& expected, const Hash& actual);

std::string ToHex(const Hash& hash);
// Throws InputError on odd length or non-hex characters.
Hash FromHex(std::string_view hex);

}  // namespace polyvid::digest
