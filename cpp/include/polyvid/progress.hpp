#pragma once

#include "polyvid/file_stream.hpp"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <ostream>
#include <string>

namespace polyvid::progress {

// Format bytes to human-readable string (e.g., "16.0 MiB")
std::string FormatBytes(std::uint64_t bytes);
std::string FormatRate(double bytes_per_second);
std::string RenderBar(double fraction, int width = 30);

// Single-line byte progress on a console stream, throttled to a few redraws per second.
class ProgressReporter {
public:
    explicit ProgressReporter(bool enabled, std::ostream& os = std::cerr);
    ~ProgressReporter();

    ProgressReporter(const ProgressReporter&) = delete;
    ProgressReporter& operator=(const ProgressReporter&) = delete;

    void Update(std::uint64_t done, std::uint64_t total, double bytes_per_second, const std::string& label);
    void Finish();

    // Adapts a copy's local progress into overall progress; base is the number of bytes
    // already accounted for by earlier copies of the same operation.
    filestream::ProgressCallback Callback(std::string label, std::uint64_t base, std::uint64_t total);

    bool Enabled() const noexcept { return enabled_; }

private:
    bool enabled_ = true;
    bool printed_ = false;
    bool use_ansi_ = false;
    std::ostream& os_;
    std::chrono::steady_clock::time_point last_tick_{};
    double last_fraction_ = -1.0;
};

}  // namespace polyvid::progress
