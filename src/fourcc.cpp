//
//  fourcc.cpp
//  FourCC
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "fourcc.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

#include "fourcc_version.hpp"
#include "logging.hpp"

namespace fourcc {

namespace {

constexpr size_t kTagSize = 4;

bool graphic_byte(uint8_t c) { return c > 0x20 && c < 0x7F; }

bool printable_byte(uint8_t c) { return c >= 0x20 && c < 0x7F; }

std::string length_message(size_t length) {
    std::ostringstream oss;
    oss << "fourcc text must be " << kTagSize << " bytes, got " << length;
    return oss.str();
}

}  // namespace

InvalidLength::InvalidLength(size_t length) : std::length_error(length_message(length)),
                                              length_(length) {}

FourCC::FourCC(std::string_view text) {
    if (text.size() != kTagSize) {
        throw InvalidLength(text.size());
    }
    std::transform(text.begin(), text.end(), bytes_.begin(),
                   [](char c) { return static_cast<uint8_t>(c); });
}

std::optional<FourCC> FourCC::try_from_text(std::string_view text) {
    if (text.size() != kTagSize) {
        FC_LOG("text", "rejecting fourcc text of " << text.size() << " bytes");
        return std::nullopt;
    }
    return FourCC(text);
}

std::string FourCC::to_string() const {
    return std::string(reinterpret_cast<const char *>(bytes_.data()), bytes_.size());
}

std::string FourCC::to_display_string() const {
    std::ostringstream oss;
    oss << '\'';
    for (uint8_t c : bytes_) {
        if (printable_byte(c) && c != '\'' && c != '\\') {
            oss << static_cast<char>(c);
        } else {
            oss << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                << static_cast<unsigned int>(c) << std::dec;
        }
    }
    oss << '\'';
    return oss.str();
}

bool FourCC::is_valid() const { return std::all_of(bytes_.begin(), bytes_.end(), graphic_byte); }

bool FourCC::is_printable() const {
    return std::all_of(bytes_.begin(), bytes_.end(), printable_byte);
}

int FourCC::compare(std::string_view text) const {
    const size_t limit = std::min(kTagSize, text.size());
    for (size_t i = 0; i < limit; ++i) {
        const uint8_t other = static_cast<uint8_t>(text[i]);
        if (bytes_[i] != other) {
            return bytes_[i] < other ? -1 : 1;
        }
    }
    if (text.size() == kTagSize) {
        return 0;
    }
    return text.size() < kTagSize ? 1 : -1;
}

std::ostream &operator<<(std::ostream &os, const FourCC &code) {
    return os << code.to_display_string();
}

std::string version_string() { return FOURCC_VERSION_DISPLAY; }

}  // namespace fourcc
