//
//  fourcc.hpp
//  FourCC
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace fourcc {

/// @defgroup api FourCC Public API
/// Four character code value type and its conversions.
/// @{

/// Raw four byte tag as found in a file header.
using TypeId = std::array<uint8_t, 4>;

/// Mapping between the four tag bytes and a 32-bit integer.
enum class ByteOrder {
    BigEndian,     ///< First tag byte is the most significant (MP4, QuickTime, IFF).
    LittleEndian,  ///< First tag byte is the least significant (in-memory RIFF/AVI dwords).
};

/// Byte order used whenever none is given: "RGBA" <-> 0x52474241.
inline constexpr ByteOrder kDefaultByteOrder = ByteOrder::BigEndian;

/// Thrown when text of a byte length other than 4 is turned into a FourCC.
class InvalidLength : public std::length_error {
   public:
    explicit InvalidLength(size_t length);

    size_t length() const noexcept { return length_; }

   private:
    size_t length_;
};

/**
 * @brief Four character code.
 *
 * Wraps exactly four bytes. The bytes are kept verbatim; no printable or ASCII restriction
 * applies, use `is_valid()` / `is_printable()` to check. Integer conversions take an explicit
 * `ByteOrder` and default to `kDefaultByteOrder`.
 */
class FourCC {
   public:
    /// Four zero bytes.
    constexpr FourCC() = default;

    constexpr explicit FourCC(const TypeId &bytes) : bytes_(bytes) {}

    constexpr FourCC(char a, char b, char c, char d)
        : bytes_{static_cast<uint8_t>(a), static_cast<uint8_t>(b), static_cast<uint8_t>(c),
                 static_cast<uint8_t>(d)} {}

    /// From a four character literal, e.g. `FourCC("moov")`. Other lengths do not compile.
    template <size_t N>
    constexpr explicit FourCC(const char (&literal)[N])
        : FourCC(literal[0], literal[1], literal[2], literal[3]) {
        static_assert(N == 5, "FourCC literal must have exactly 4 characters");
    }

    constexpr explicit FourCC(uint32_t value, ByteOrder order = kDefaultByteOrder)
        : bytes_(order == ByteOrder::BigEndian
                     ? TypeId{static_cast<uint8_t>(value >> 24), static_cast<uint8_t>(value >> 16),
                              static_cast<uint8_t>(value >> 8), static_cast<uint8_t>(value)}
                     : TypeId{static_cast<uint8_t>(value), static_cast<uint8_t>(value >> 8),
                              static_cast<uint8_t>(value >> 16),
                              static_cast<uint8_t>(value >> 24)}) {}

    /// From text; throws InvalidLength unless `text.size() == 4`.
    explicit FourCC(std::string_view text);

    // Factories.
    static constexpr FourCC from_bytes(const TypeId &bytes) { return FourCC(bytes); }
    static constexpr FourCC from_u32(uint32_t value, ByteOrder order = kDefaultByteOrder) {
        return FourCC(value, order);
    }
    static FourCC from_text(std::string_view text) { return FourCC(text); }

    /// Non-throwing variant of from_text(); empty when the length is not 4.
    static std::optional<FourCC> try_from_text(std::string_view text);

    constexpr const TypeId &bytes() const { return bytes_; }
    constexpr TypeId to_bytes() const { return bytes_; }

    constexpr uint32_t to_u32(ByteOrder order = kDefaultByteOrder) const {
        if (order == ByteOrder::BigEndian) {
            return (uint32_t(bytes_[0]) << 24) | (uint32_t(bytes_[1]) << 16) |
                   (uint32_t(bytes_[2]) << 8) | uint32_t(bytes_[3]);
        }
        return (uint32_t(bytes_[3]) << 24) | (uint32_t(bytes_[2]) << 16) |
               (uint32_t(bytes_[1]) << 8) | uint32_t(bytes_[0]);
    }

    /// The four bytes as-is, including NULs and non-ASCII values.
    std::string to_string() const;

    /// Quoted form for diagnostics, non-printable bytes escaped as \xNN: 'mp4a', 'ab\x00\x01'.
    std::string to_display_string() const;

    /// True if every byte is an ASCII graphic character (0x21..0x7E).
    bool is_valid() const;

    /// True if every byte is in 0x20..0x7E; space padded tags like "mp4 " qualify.
    bool is_printable() const;

    constexpr uint8_t operator[](size_t i) const { return bytes_[i]; }

    friend bool operator==(const FourCC &a, const FourCC &b) { return a.bytes_ == b.bytes_; }
    friend bool operator!=(const FourCC &a, const FourCC &b) { return !(a == b); }
    friend bool operator<(const FourCC &a, const FourCC &b) { return a.bytes_ < b.bytes_; }
    friend bool operator<=(const FourCC &a, const FourCC &b) { return !(b < a); }
    friend bool operator>(const FourCC &a, const FourCC &b) { return b < a; }
    friend bool operator>=(const FourCC &a, const FourCC &b) { return !(a < b); }

    // Mixed comparisons. Integers use kDefaultByteOrder.
    friend bool operator==(const FourCC &a, const TypeId &b) { return a.bytes_ == b; }
    friend bool operator!=(const FourCC &a, const TypeId &b) { return !(a == b); }
    friend bool operator<(const FourCC &a, const TypeId &b) { return a.bytes_ < b; }
    friend bool operator>(const FourCC &a, const TypeId &b) { return a.bytes_ > b; }
    friend bool operator<=(const FourCC &a, const TypeId &b) { return a.bytes_ <= b; }
    friend bool operator>=(const FourCC &a, const TypeId &b) { return a.bytes_ >= b; }

    friend bool operator==(const FourCC &a, uint32_t b) { return a == FourCC(b); }
    friend bool operator!=(const FourCC &a, uint32_t b) { return !(a == b); }
    friend bool operator<(const FourCC &a, uint32_t b) { return a < FourCC(b); }
    friend bool operator>(const FourCC &a, uint32_t b) { return a > FourCC(b); }
    friend bool operator<=(const FourCC &a, uint32_t b) { return a <= FourCC(b); }
    friend bool operator>=(const FourCC &a, uint32_t b) { return a >= FourCC(b); }

    // Text of a length other than 4 is unequal, never an error. Ordering against such text
    // compares the raw bytes lexicographically.
    friend bool operator==(const FourCC &a, std::string_view b) { return a.compare(b) == 0; }
    friend bool operator!=(const FourCC &a, std::string_view b) { return a.compare(b) != 0; }
    friend bool operator<(const FourCC &a, std::string_view b) { return a.compare(b) < 0; }
    friend bool operator>(const FourCC &a, std::string_view b) { return a.compare(b) > 0; }
    friend bool operator<=(const FourCC &a, std::string_view b) { return a.compare(b) <= 0; }
    friend bool operator>=(const FourCC &a, std::string_view b) { return a.compare(b) >= 0; }

   private:
    // Unsigned lexicographic comparison of the tag bytes against raw text.
    int compare(std::string_view text) const;

    TypeId bytes_{};
};

static_assert(sizeof(FourCC) == 4, "FourCC must stay exactly four bytes");

/// Writes the display form, see FourCC::to_display_string().
std::ostream &operator<<(std::ostream &os, const FourCC &code);

/// Library version string, e.g. `v0.3` or `v0.3+abcd123`.
std::string version_string();

/// @}

}  // namespace fourcc

namespace std {

template <>
struct hash<fourcc::FourCC> {
    size_t operator()(const fourcc::FourCC &code) const noexcept {
        return std::hash<uint32_t>{}(code.to_u32());
    }
};

}  // namespace std
