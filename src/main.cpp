//
//  main.cpp
//  FourCC
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "fourcc.hpp"
#include "fourcc_json.hpp"
#include "logging.hpp"
#include <nlohmann/json.hpp>

namespace {

enum class InputMode { Text, U32, Hex };

std::optional<InputMode> parse_mode(const std::string &s) {
    if (s == "text") return InputMode::Text;
    if (s == "u32") return InputMode::U32;
    if (s == "hex") return InputMode::Hex;
    return std::nullopt;
}

std::optional<fourcc::ByteOrder> parse_byte_order(const std::string &s) {
    if (s == "be" || s == "big") return fourcc::ByteOrder::BigEndian;
    if (s == "le" || s == "little") return fourcc::ByteOrder::LittleEndian;
    return std::nullopt;
}

// Strict unsigned parse: only digits of the base (hex allows a single 0x prefix), and the value
// must fit 32 bits.
std::optional<uint32_t> parse_u32(std::string s, int base) {
    if (base == 16 && s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
        s.erase(0, 2);
    }
    const bool digits_only = std::all_of(s.begin(), s.end(), [base](char c) {
        const auto u = static_cast<unsigned char>(c);
        return base == 16 ? std::isxdigit(u) != 0 : std::isdigit(u) != 0;
    });
    if (s.empty() || !digits_only) {
        return std::nullopt;
    }
    size_t pos = 0;
    unsigned long long v = 0;
    try {
        v = std::stoull(s, &pos, base);
    } catch (const std::out_of_range &) {
        return std::nullopt;
    }
    if (pos != s.size() || v > std::numeric_limits<uint32_t>::max()) {
        return std::nullopt;
    }
    return static_cast<uint32_t>(v);
}

std::optional<fourcc::FourCC> convert(const std::string &value, InputMode mode,
                                      fourcc::ByteOrder order) {
    if (mode == InputMode::Text) {
        try {
            return fourcc::FourCC::from_text(value);
        } catch (const fourcc::InvalidLength &e) {
            FC_LOG("error", "fourcc: '" << value << "': " << e.what());
            return std::nullopt;
        }
    }
    auto number = parse_u32(value, mode == InputMode::Hex ? 16 : 10);
    if (!number) {
        FC_LOG("error", "fourcc: '" << value << "' is not an unsigned 32-bit "
                                    << (mode == InputMode::Hex ? "hex" : "decimal") << " value");
        return std::nullopt;
    }
    return fourcc::FourCC::from_u32(*number, order);
}

nlohmann::json describe(const std::string &input, const fourcc::FourCC &code,
                        fourcc::ByteOrder order) {
    nlohmann::json c;
    c["input"] = input;
    if (code.is_printable()) {
        c["text"] = code.to_string();
    }
    c["display"] = code.to_display_string();
    const uint32_t value = code.to_u32(order);
    c["u32"] = value;
    std::ostringstream hex;
    hex << "0x" << std::hex << std::setfill('0') << std::setw(8) << value;
    c["hex"] = hex.str();
    nlohmann::json bytes = nlohmann::json::array();
    for (uint8_t b : code.bytes()) {
        bytes.push_back(b);
    }
    c["bytes"] = bytes;
    c["valid"] = code.is_valid();
    return c;
}

void print_usage() {
    std::cerr << "FourCC " << fourcc::version_string() << "\n"
              << "Copyright (c) 2025 Till Toenshoff\n\n"
              << "usage:\n"
              << "  fourcc <value>... [--from text|u32|hex] [--byte-order be|le] "
              << "[--log-level error|warn|info|debug] [--version]\n"
              << "Options:\n"
              << "  --from MODE         Interpret values as 4-byte text (default), decimal or hex.\n"
              << "  --byte-order ORDER  Integer byte order, be (default) or le.\n"
              << "  --log-level LEVEL   Set logging verbosity (default: info).\n"
              << "  --version, -v       Print the version and exit.\n"
              << "A JSON report is written to stdout.\n";
}

}  // namespace

int main(int argc, char **argv) {
    // Gather positional arguments (non-option).
    std::vector<std::string> positional;
    InputMode mode = InputMode::Text;
    fourcc::ByteOrder order = fourcc::kDefaultByteOrder;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--version" || arg == "-v") {
            std::cout << "FourCC " << fourcc::version_string() << "\n";
            return 0;
        } else if (arg == "--log-level" && i + 1 < argc) {
            auto level = fourcc::parse_log_verbosity(argv[++i]);
            if (!level) {
                std::cerr << "Unknown log level: " << argv[i] << "\n";
                return 2;
            }
            fourcc::set_log_verbosity(*level);
        } else if (arg == "--from" && i + 1 < argc) {
            auto m = parse_mode(argv[++i]);
            if (!m) {
                std::cerr << "Unknown input mode: " << argv[i] << "\n";
                return 2;
            }
            mode = *m;
        } else if (arg == "--byte-order" && i + 1 < argc) {
            auto o = parse_byte_order(argv[++i]);
            if (!o) {
                std::cerr << "Unknown byte order: " << argv[i] << "\n";
                return 2;
            }
            order = *o;
        } else if (arg == "--") {
            // Everything after "--" is a value, even when it starts with '-'.
            for (++i; i < argc; ++i) {
                positional.emplace_back(argv[i]);
            }
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return 2;
        } else {
            positional.emplace_back(std::move(arg));
        }
    }

    if (positional.empty()) {
        print_usage();
        return 2;
    }

    nlohmann::json report;
    report["byte_order"] = order == fourcc::ByteOrder::BigEndian ? "be" : "le";
    nlohmann::json codes = nlohmann::json::array();
    bool ok = true;
    for (const auto &value : positional) {
        auto code = convert(value, mode, order);
        if (!code) {
            ok = false;
            continue;
        }
        FC_LOG("debug", "converted '" << value << "' to " << *code);
        codes.push_back(describe(value, *code, order));
    }
    report["codes"] = codes;

    // Non-printable text input may not be valid UTF-8; replace rather than throw.
    std::cout << report.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    return ok ? 0 : 1;
}
