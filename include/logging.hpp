//
//  logging.hpp
//  FourCC
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace fourcc {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Set/get global logging verbosity.
void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

// Parse a verbosity name as given on the command line ("error", "warn"/"warning", "info",
// "debug"). Empty for anything else.
std::optional<LogVerbosity> parse_log_verbosity(std::string_view name);

// Hex-preview helper used in debug logs to dump a short prefix of binary blobs.
inline constexpr size_t kHexPreviewBytes = 8;
inline std::string hex_prefix(const std::vector<uint8_t> &data,
                              size_t max_len = kHexPreviewBytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    const size_t limit = std::min(max_len, data.size());
    for (size_t i = 0; i < limit; ++i) {
        oss << std::setw(2) << static_cast<unsigned int>(data[i]);
        if (i + 1 != limit) {
            oss << ' ';
        }
    }
    return oss.str();
}

inline constexpr LogVerbosity severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return LogVerbosity::Warn;
    }
    if (tag == "info") {
        return LogVerbosity::Info;
    }
    // Component tags (io/text/json/...) are debug-level.
    return LogVerbosity::Debug;
}

}  // namespace fourcc

inline bool fc_should_log(const char *level) {
    const auto current = fourcc::get_log_verbosity();
    const auto sev = fourcc::severity_for_tag(level ? level : "");
    return static_cast<int>(sev) <= static_cast<int>(current);
}

inline void fc_log_impl(const char *level, const std::string &msg, const char *file, int line,
                        const char *func) {
    std::string lvl(level ? level : "");
    if (lvl == "error") {
        std::cerr << "[FourCC][" << lvl << "][" << file << ":" << line << " " << func << "] "
                  << msg << std::endl;
    } else {
        std::cerr << "[FourCC][" << lvl << "] " << msg << std::endl;
    }
}

#define FC_LOG(level, message)                                              \
    do {                                                                    \
        if (fc_should_log(level)) {                                         \
            std::ostringstream _fc_log_ss;                                  \
            _fc_log_ss << message;                                          \
            fc_log_impl(level, _fc_log_ss.str(), __FILE__, __LINE__,        \
                        __func__);                                          \
        }                                                                   \
    } while (0)
