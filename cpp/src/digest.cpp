#include "polyvid/digest.hpp"

#include "polyvid/constants.hpp"
#include "polyvid/errors.hpp"
#include "polyvid/file_stream.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace polyvid::digest {

namespace {

void Ensure(bool ok, const char* message) {
    if (!ok) {
        throw std::runtime_error(message);
    }
}

const EVP_MD* ToEvp(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::Md5:
            return EVP_md5();
        case HashAlgorithm::Sha1:
            return EVP_sha1();
        case HashAlgorithm::Sha256:
            return EVP_sha256();
        case HashAlgorithm::Sha512:
            return EVP_sha512();
        case HashAlgorithm::Sha3_512:
            return EVP_sha3_512();
    }
    throw std::runtime_error("Unsupported hash algorithm");
}

int HexValue(char ch) {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
        return ch - 'a' + 10;
    }
    if (ch >= 'A' && ch <= 'F') {
        return ch - 'A' + 10;
    }
    return -1;
}

}  // namespace

struct Digest::Context {
    EVP_MD_CTX* md_ctx = nullptr;

    ~Context() {
        if (md_ctx) {
            EVP_MD_CTX_free(md_ctx);
        }
    }
};

HashAlgorithm AlgorithmFromName(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    lower.erase(std::remove(lower.begin(), lower.end(), '_'), lower.end());
    if (lower == "md5") {
        return HashAlgorithm::Md5;
    }
    if (lower == "sha1" || lower == "sha-1") {
        return HashAlgorithm::Sha1;
    }
    if (lower == "sha256" || lower == "sha-256") {
        return HashAlgorithm::Sha256;
    }
    if (lower == "sha512" || lower == "sha-512") {
        return HashAlgorithm::Sha512;
    }
    if (lower == "sha3-512" || lower == "sha3512") {
        return HashAlgorithm::Sha3_512;
    }
    throw InputError("Unknown hash algorithm: " + std::string(name));
}

std::string AlgorithmName(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::Md5:
            return "md5";
        case HashAlgorithm::Sha1:
            return "sha1";
        case HashAlgorithm::Sha256:
            return "sha256";
        case HashAlgorithm::Sha512:
            return "sha512";
        case HashAlgorithm::Sha3_512:
            return "sha3-512";
    }
    return "unknown";
}

std::size_t DigestSize(HashAlgorithm algorithm) {
    return static_cast<std::size_t>(EVP_MD_size(ToEvp(algorithm)));
}

Digest::Digest(HashAlgorithm algorithm) : ctx_(std::make_unique<Context>()), algorithm_(algorithm) {
    ctx_->md_ctx = EVP_MD_CTX_new();
    if (!ctx_->md_ctx) {
        throw std::runtime_error("Digest context allocation failed");
    }
    Ensure(EVP_DigestInit_ex(ctx_->md_ctx, ToEvp(algorithm), nullptr) == 1, "Digest init failed");
}

Digest::~Digest() = default;
Digest::Digest(Digest&&) noexcept = default;
Digest& Digest::operator=(Digest&&) noexcept = default;

void Digest::Update(const std::uint8_t* data, std::size_t size) {
    if (finished_) {
        throw std::logic_error("Digest already finished");
    }
    if (size == 0) {
        return;
    }
    Ensure(EVP_DigestUpdate(ctx_->md_ctx, data, size) == 1, "Digest update failed");
}

Hash Digest::Finish() {
    if (finished_) {
        throw std::logic_error("Digest already finished");
    }
    Hash out(static_cast<std::size_t>(EVP_MAX_MD_SIZE));
    unsigned int out_len = 0;
    Ensure(EVP_DigestFinal_ex(ctx_->md_ctx, out.data(), &out_len) == 1, "Digest final failed");
    finished_ = true;
    out.resize(out_len);
    return out;
}

Hash DigestBytes(const std::uint8_t* data, std::size_t size, HashAlgorithm algorithm) {
    Digest digest(algorithm);
    digest.Update(data, size);
    return digest.Finish();
}

Hash DigestBytes(const Bytes& data, HashAlgorithm algorithm) {
    return DigestBytes(data.data(), data.size(), algorithm);
}

Hash DigestFile(const std::filesystem::path& path, HashAlgorithm algorithm, std::size_t chunk_size) {
    return DigestRange(path, 0, filestream::FileSize(path), algorithm, chunk_size);
}

Hash DigestRange(const std::filesystem::path& path,
                 std::uint64_t offset,
                 std::uint64_t length,
                 HashAlgorithm algorithm,
                 std::size_t chunk_size) {
    if (chunk_size == 0) {
        chunk_size = constants::kScanChunkSize;
    }
    filestream::FileReader reader(path);
    if (offset > reader.TotalSize() || length > reader.TotalSize() - offset) {
        throw IoError("read", path, "range past end of file");
    }
    reader.Seek(offset);
    Digest digest(algorithm);
    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(
        std::min<std::uint64_t>(chunk_size, std::max<std::uint64_t>(length, 1))));
    std::uint64_t remaining = length;
    while (remaining > 0) {
        std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, buffer.size()));
        std::size_t got = reader.ReadChunk(buffer.data(), want);
        if (got != want) {
            throw IoError("read", path, "unexpected end of file");
        }
        digest.Update(buffer.data(), got);
        remaining -= got;
    }
    return digest.Finish();
}

bool Verify(const Hash& expected, const Hash& actual) {
    return expected == actual;
}

std::string ToHex(const Hash& hash) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(hash.size() * 2);
    for (std::uint8_t byte : hash) {
        out.push_back(kDigits[byte >> 4]);
        out.push_back(kDigits[byte & 0x0F]);
    }
    return out;
}

Hash FromHex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        throw InputError("Hex string has odd length");
    }
    Hash out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int hi = HexValue(hex[i]);
        int lo = HexValue(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw InputError("Invalid hex string: " + std::string(hex));
        }
        out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return out;
}

}  // namespace polyvid::digest
