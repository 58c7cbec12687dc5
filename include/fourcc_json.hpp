//
//  fourcc_json.hpp
//  FourCC
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "fourcc.hpp"

namespace fourcc {

// Printable codes serialize as their 4-character string, everything else as the big-endian
// integer so the output stays valid UTF-8.
inline void to_json(nlohmann::json &j, const FourCC &code) {
    if (code.is_printable()) {
        j = code.to_string();
    } else {
        j = code.to_u32(ByteOrder::BigEndian);
    }
}

// Accepts either form written by to_json(). Strings must be 4 bytes (InvalidLength), integers
// must fit 32 bits (std::out_of_range); other JSON types raise nlohmann::json::type_error.
inline void from_json(const nlohmann::json &j, FourCC &code) {
    if (j.is_number_unsigned()) {
        const auto v = j.get<uint64_t>();
        if (v > std::numeric_limits<uint32_t>::max()) {
            throw std::out_of_range("fourcc integer exceeds 32 bits: " + std::to_string(v));
        }
        code = FourCC(static_cast<uint32_t>(v), ByteOrder::BigEndian);
        return;
    }
    if (j.is_number_integer()) {
        throw std::out_of_range("fourcc integer must not be negative: " + j.dump());
    }
    code = FourCC(j.get<std::string>());
}

}  // namespace fourcc
