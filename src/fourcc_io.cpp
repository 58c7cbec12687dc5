//
//  fourcc_io.cpp
//  FourCC
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "fourcc_io.hpp"

#include <algorithm>

#include "logging.hpp"

namespace fourcc {

bool write_fourcc(std::ostream &out, const FourCC &code) {
    out.write(reinterpret_cast<const char *>(code.bytes().data()), code.bytes().size());
    if (!out.good()) {
        FC_LOG("io", "failed to write fourcc " << code);
        return false;
    }
    return true;
}

std::optional<FourCC> read_fourcc(std::istream &in) {
    TypeId b{};
    in.read(reinterpret_cast<char *>(b.data()), b.size());
    const auto got = in.gcount();
    if (got != static_cast<std::streamsize>(b.size())) {
        const std::vector<uint8_t> partial(b.begin(), b.begin() + got);
        FC_LOG("io", "short fourcc read: got " << got << " of " << b.size() << " bytes ["
                                               << hex_prefix(partial) << "]");
        return std::nullopt;
    }
    return FourCC(b);
}

std::optional<FourCC> read_fourcc(const std::vector<uint8_t> &data, size_t offset) {
    TypeId b{};
    if (offset > data.size() || data.size() - offset < b.size()) {
        const size_t start = std::min(offset, data.size());
        const std::vector<uint8_t> tail(data.begin() + start, data.end());
        FC_LOG("io", "fourcc at offset " << offset << " exceeds buffer of " << data.size()
                                         << " bytes, tail [" << hex_prefix(tail) << "]");
        return std::nullopt;
    }
    for (size_t i = 0; i < b.size(); ++i) {
        b[i] = data[offset + i];
    }
    return FourCC(b);
}

}  // namespace fourcc
