#include "polyvid/config.hpp"

#include "polyvid/constants.hpp"
#include "polyvid/env.hpp"
#include "polyvid/errors.hpp"
#include "polyvid/log.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <string>

namespace polyvid::config {

namespace {

std::string ToUpper(std::string_view value) {
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    return out;
}

std::uint64_t SuffixMultiplier(const std::string& suffix) {
    if (suffix.empty() || suffix == "B") {
        return 1;
    }
    static const char kUnits[] = {'K', 'M', 'G', 'T'};
    std::uint64_t multiplier = 1;
    for (char unit : kUnits) {
        multiplier *= 1024ull;
        if (suffix[0] != unit) {
            continue;
        }
        std::string rest = suffix.substr(1);
        if (rest.empty() || rest == "B" || rest == "IB") {
            return multiplier;
        }
        break;
    }
    return 0;
}

}  // namespace

std::uint64_t ParseSize(std::string_view text) {
    std::string raw = ToUpper(text);
    raw.erase(std::remove_if(raw.begin(), raw.end(),
                             [](unsigned char ch) { return std::isspace(ch) != 0; }),
              raw.end());
    if (raw.empty()) {
        throw InputError("Empty size value");
    }
    std::size_t split = 0;
    bool seen_dot = false;
    while (split < raw.size()) {
        char ch = raw[split];
        if (ch == '.' && !seen_dot) {
            seen_dot = true;
        } else if (!std::isdigit(static_cast<unsigned char>(ch))) {
            break;
        }
        ++split;
    }
    std::string number = raw.substr(0, split);
    if (number.empty() || number == ".") {
        throw InputError("Invalid size: " + std::string(text));
    }
    std::uint64_t multiplier = SuffixMultiplier(raw.substr(split));
    if (multiplier == 0) {
        throw InputError("Invalid size suffix: " + std::string(text));
    }

    std::uint64_t bytes = 0;
    if (!seen_dot) {
        std::uint64_t value = 0;
        try {
            value = std::stoull(number);
        } catch (const std::exception&) {
            throw InputError("Invalid size: " + std::string(text));
        }
        if (value > std::numeric_limits<std::uint64_t>::max() / multiplier) {
            throw InputError("Size out of range: " + std::string(text));
        }
        bytes = value * multiplier;
    } else {
        long double value = std::stold(number) * static_cast<long double>(multiplier);
        if (value >= static_cast<long double>(std::numeric_limits<std::uint64_t>::max())) {
            throw InputError("Size out of range: " + std::string(text));
        }
        bytes = static_cast<std::uint64_t>(std::floor(value));
    }
    if (bytes == 0) {
        throw InputError("Size must be at least one byte: " + std::string(text));
    }
    return bytes;
}

std::size_t ClampChunkSize(std::uint64_t requested) {
    if (requested < constants::kMinChunkSize) {
        return constants::kMinChunkSize;
    }
    if (requested > constants::kMaxChunkSize) {
        return constants::kMaxChunkSize;
    }
    return static_cast<std::size_t>(requested);
}

Settings LoadSettings() {
    Settings settings;
    settings.chunk_size = constants::kDefaultChunkSize;
    std::string chunk = env::Get("POLYVID_CHUNK_SIZE");
    if (!chunk.empty()) {
        try {
            settings.chunk_size = ClampChunkSize(ParseSize(chunk));
        } catch (const InputError& exc) {
            log::Warn(std::string("Ignoring POLYVID_CHUNK_SIZE: ") + exc.what());
        }
    }
    std::string hash = env::Get("POLYVID_HASH");
    if (!hash.empty()) {
        try {
            settings.hash = digest::AlgorithmFromName(hash);
        } catch (const InputError& exc) {
            log::Warn(std::string("Ignoring POLYVID_HASH: ") + exc.what());
        }
    }
    settings.show_progress = !env::IsEnabled("POLYVID_NO_PROGRESS");
    settings.color = env::Get("NO_COLOR").empty();
    return settings;
}

}  // namespace polyvid::config
