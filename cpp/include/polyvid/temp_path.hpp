#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace polyvid::temp {

// Owns a freshly created directory and removes it recursively on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& prefix,
                     const std::filesystem::path& parent = {});
    ~TempDir();

    TempDir(TempDir&& other) noexcept;
    TempDir& operator=(TempDir&& other) noexcept;
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& Path() const noexcept { return path_; }
    std::filesystem::path operator/(const std::filesystem::path& child) const { return path_ / child; }

private:
    void Remove() noexcept;

    std::filesystem::path path_;
};

// An output file written under a hidden sibling name and renamed into place by Commit().
// Destroying an uncommitted AtomicFile deletes the partial file.
class AtomicFile {
public:
    explicit AtomicFile(std::filesystem::path final_path);
    ~AtomicFile();

    AtomicFile(AtomicFile&& other) noexcept;
    AtomicFile& operator=(AtomicFile&& other) noexcept;
    AtomicFile(const AtomicFile&) = delete;
    AtomicFile& operator=(const AtomicFile&) = delete;

    const std::filesystem::path& TempPath() const noexcept { return temp_path_; }
    const std::filesystem::path& FinalPath() const noexcept { return final_path_; }

    void Commit();

private:
    void Discard() noexcept;

    std::filesystem::path final_path_;
    std::filesystem::path temp_path_;
    bool committed_ = false;
};

// Renames every file into place, in order. Fails before renaming anything when a final name
// is taken by something other than a regular file. When a later rename fails, the files
// already renamed are removed again and the error is rethrown.
void CommitAll(std::vector<AtomicFile>& files);

std::string RandomToken();

}  // namespace polyvid::temp
