#include "polyvid/temp_path.hpp"

#include "polyvid/constants.hpp"
#include "polyvid/errors.hpp"

#include <random>
#include <system_error>
#include <utility>

namespace polyvid::temp {

std::string RandomToken() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    return std::to_string(gen());
}

TempDir::TempDir(const std::string& prefix, const std::filesystem::path& parent) {
    auto base = parent.empty() ? std::filesystem::temp_directory_path() : parent;
    for (int i = 0; i < 64; ++i) {
        auto candidate = base / (prefix + "-" + RandomToken());
        std::error_code ec;
        if (std::filesystem::create_directory(candidate, ec)) {
            path_ = candidate;
            return;
        }
    }
    throw IoError("create temporary directory", base);
}

TempDir::~TempDir() {
    Remove();
}

TempDir::TempDir(TempDir&& other) noexcept : path_(std::move(other.path_)) {
    other.path_.clear();
}

TempDir& TempDir::operator=(TempDir&& other) noexcept {
    if (this != &other) {
        Remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

void TempDir::Remove() noexcept {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    path_.clear();
}

AtomicFile::AtomicFile(std::filesystem::path final_path) : final_path_(std::move(final_path)) {
    auto name = "." + final_path_.filename().string() + std::string(constants::kPartialMarker)
                + RandomToken();
    temp_path_ = final_path_.parent_path() / name;
}

AtomicFile::~AtomicFile() {
    Discard();
}

AtomicFile::AtomicFile(AtomicFile&& other) noexcept
    : final_path_(std::move(other.final_path_)),
      temp_path_(std::move(other.temp_path_)),
      committed_(other.committed_) {
    other.temp_path_.clear();
    other.committed_ = true;
}

AtomicFile& AtomicFile::operator=(AtomicFile&& other) noexcept {
    if (this != &other) {
        Discard();
        final_path_ = std::move(other.final_path_);
        temp_path_ = std::move(other.temp_path_);
        committed_ = other.committed_;
        other.temp_path_.clear();
        other.committed_ = true;
    }
    return *this;
}

void AtomicFile::Commit() {
    if (committed_) {
        return;
    }
    std::error_code ec;
    std::filesystem::rename(temp_path_, final_path_, ec);
    if (ec) {
        throw IoError("rename", final_path_, ec.message());
    }
    committed_ = true;
}

void CommitAll(std::vector<AtomicFile>& files) {
    for (const auto& file : files) {
        std::error_code ec;
        auto status = std::filesystem::symlink_status(file.FinalPath(), ec);
        if (std::filesystem::exists(status) && !std::filesystem::is_regular_file(status)) {
            throw IoError("rename", file.FinalPath(), "name is taken by something other than a regular file");
        }
    }
    std::size_t done = 0;
    try {
        for (; done < files.size(); ++done) {
            files[done].Commit();
        }
    } catch (const IoError&) {
        for (std::size_t i = 0; i < done; ++i) {
            std::error_code ec;
            std::filesystem::remove(files[i].FinalPath(), ec);
        }
        throw;
    }
}

void AtomicFile::Discard() noexcept {
    if (committed_ || temp_path_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove(temp_path_, ec);
}

}  // namespace polyvid::temp
