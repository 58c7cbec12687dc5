//
//  fourcc_io.hpp
//  FourCC
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <ostream>
#include <vector>

#include "fourcc.hpp"

namespace fourcc {

// ------------- Helper write functions ---------------------------------------
// Tags are written in stored byte order; ByteOrder only matters for integer conversion.

inline void write_fourcc(std::vector<uint8_t> &p, const FourCC &code) {
    const auto &b = code.bytes();
    p.insert(p.end(), b.begin(), b.end());
}

// Returns false when the stream went bad.
bool write_fourcc(std::ostream &out, const FourCC &code);

// ------------- Helper read functions ----------------------------------------

// Read the next four bytes. Empty on short read; the stream keeps its fail state.
std::optional<FourCC> read_fourcc(std::istream &in);

// Read four bytes at offset. Empty when fewer than four bytes remain.
std::optional<FourCC> read_fourcc(const std::vector<uint8_t> &data, size_t offset = 0);

}  // namespace fourcc
