#include "polyvid/progress.hpp"

#include "polyvid/cli_colors.hpp"

#include <cmath>
#include <cstdio>
#include <utility>

namespace polyvid::progress {

std::string FormatBytes(std::uint64_t bytes) {
    static const char* kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    char buffer[32];
    if (unit == 0) {
        std::snprintf(buffer, sizeof(buffer), "%llu B", static_cast<unsigned long long>(bytes));
    } else {
        std::snprintf(buffer, sizeof(buffer), "%.2f %s", value, kUnits[unit]);
    }
    return std::string(buffer);
}

std::string FormatRate(double bytes_per_second) {
    if (bytes_per_second <= 0.0) {
        return "-";
    }
    return FormatBytes(static_cast<std::uint64_t>(bytes_per_second)) + "/s";
}

std::string RenderBar(double fraction, int width) {
    if (fraction < 0.0) {
        fraction = 0.0;
    } else if (fraction > 1.0) {
        fraction = 1.0;
    }
    int filled = static_cast<int>(std::round(fraction * width));
    if (filled > width) {
        filled = width;
    }
    std::string bar;
    bar.reserve(static_cast<std::size_t>(width + 2));
    bar.push_back('(');
    bar.append(static_cast<std::size_t>(filled), '#');
    bar.append(static_cast<std::size_t>(width - filled), ' ');
    bar.push_back(')');
    return bar;
}

ProgressReporter::ProgressReporter(bool enabled, std::ostream& os) : enabled_(enabled), os_(os) {
    use_ansi_ = cli::ColorsEnabled(os_);
    last_tick_ = std::chrono::steady_clock::now();
}

ProgressReporter::~ProgressReporter() {
    Finish();
}

void ProgressReporter::Update(std::uint64_t done,
                              std::uint64_t total,
                              double bytes_per_second,
                              const std::string& label) {
    if (!enabled_) {
        return;
    }
    double fraction = total > 0 ? static_cast<double>(done) / static_cast<double>(total) : 1.0;
    auto now = std::chrono::steady_clock::now();
    auto delta = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_tick_);
    if (printed_ && delta.count() < 120 && fraction < 1.0 && std::abs(fraction - last_fraction_) < 0.005) {
        return;
    }
    last_tick_ = now;
    last_fraction_ = fraction;
    int pct = static_cast<int>(std::round(fraction * 100.0));
    std::string line = label + " " + RenderBar(fraction) + " " + std::to_string(pct) + "% "
                       + FormatBytes(done) + " / " + FormatBytes(total) + "  " + FormatRate(bytes_per_second);
    if (use_ansi_) {
        os_ << "\r\033[2K" << line << std::flush;
    } else if (fraction >= 1.0 || !printed_) {
        os_ << line << "\n";
    }
    printed_ = true;
}

void ProgressReporter::Finish() {
    if (printed_ && use_ansi_) {
        os_ << std::endl;
    }
    printed_ = false;
    last_fraction_ = -1.0;
}

filestream::ProgressCallback ProgressReporter::Callback(std::string label,
                                                        std::uint64_t base,
                                                        std::uint64_t total) {
    if (!enabled_) {
        return {};
    }
    return [this, label = std::move(label), base, total](const filestream::CopyProgress& p) {
        Update(base + p.bytes_copied, total, p.BytesPerSecond(), label);
    };
}

}  // namespace polyvid::progress
