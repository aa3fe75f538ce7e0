#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>

namespace polyvid {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// Caller-correctable problem detected before any output is produced.
class InputError : public Error {
public:
    explicit InputError(const std::string& message) : Error(message) {}
};

class IoError : public Error {
public:
    IoError(std::string operation, std::filesystem::path path, const std::string& detail = {})
        : Error(BuildMessage(operation, path, detail)),
          operation_(std::move(operation)),
          path_(std::move(path)) {}

    const std::string& Operation() const noexcept { return operation_; }
    const std::filesystem::path& Path() const noexcept { return path_; }

private:
    static std::string BuildMessage(const std::string& operation,
                                    const std::filesystem::path& path,
                                    const std::string& detail) {
        std::string message = operation + " failed: " + path.string();
        if (!detail.empty()) {
            message += " (" + detail + ")";
        }
        return message;
    }

    std::string operation_;
    std::filesystem::path path_;
};

class SignatureNotFoundError : public Error {
public:
    explicit SignatureNotFoundError(const std::filesystem::path& path)
        : Error("No payload signature found in " + path.string()), path_(path) {}

    const std::filesystem::path& Path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

// The bytes handed to the archive reader do not parse as that format.
class MalformedPayloadError : public Error {
public:
    explicit MalformedPayloadError(const std::string& message) : Error(message) {}
};

class CancelledError : public Error {
public:
    CancelledError() : Error("Operation cancelled") {}
};

}  // namespace polyvid
