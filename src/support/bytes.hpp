//===----------------------------------------------------------------------===//
//
// Part of the Ciphel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/bytes.hpp
// Purpose: Alignment arithmetic and fixed-width integer codecs over raw byte
//          buffers.
//
// Heap bookkeeping words are stored big-endian while values manipulated by
// bytecode (numbers, Tids, vector headers) are little-endian. Both encodings
// are spelled out byte by byte so the layout does not depend on the host.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace ciphel::support
{

/// @brief Round a value up to the next multiple of alignment.
/// @tparam T Integral type of the value being aligned.
/// @param n Value to align.
/// @param alignment Alignment boundary (must be power of two).
/// @return Smallest value >= n that is a multiple of alignment.
template <typename T> [[nodiscard]] constexpr T alignUp(T n, T alignment) noexcept
{
    static_assert(std::is_integral_v<T>, "alignUp requires an integral type");
    return (n + alignment - 1) & ~(alignment - 1);
}

/// @brief Check if a value is aligned to a given boundary.
template <typename T> [[nodiscard]] constexpr bool isAligned(T n, T alignment) noexcept
{
    static_assert(std::is_integral_v<T>, "isAligned requires an integral type");
    return (n & (alignment - 1)) == 0;
}

/// @brief Decode a big-endian 64-bit word starting at @p p.
[[nodiscard]] inline uint64_t loadBE64(const uint8_t *p) noexcept
{
    uint64_t v = 0;
    for (std::size_t i = 0; i < 8; ++i)
        v = (v << 8) | p[i];
    return v;
}

/// @brief Encode @p v as a big-endian 64-bit word at @p p.
inline void storeBE64(uint8_t *p, uint64_t v) noexcept
{
    for (std::size_t i = 0; i < 8; ++i)
        p[7 - i] = static_cast<uint8_t>(v >> (8 * i));
}

/// @brief Decode a little-endian 64-bit word starting at @p p.
[[nodiscard]] inline uint64_t loadLE64(const uint8_t *p) noexcept
{
    uint64_t v = 0;
    for (std::size_t i = 0; i < 8; ++i)
        v |= static_cast<uint64_t>(p[i]) << (8 * i);
    return v;
}

/// @brief Encode @p v as a little-endian 64-bit word at @p p.
inline void storeLE64(uint8_t *p, uint64_t v) noexcept
{
    for (std::size_t i = 0; i < 8; ++i)
        p[i] = static_cast<uint8_t>(v >> (8 * i));
}

/// @brief Little-endian encoding of @p v as an owned 8-byte array.
[[nodiscard]] inline std::array<uint8_t, 8> toLE64(uint64_t v) noexcept
{
    std::array<uint8_t, 8> out{};
    storeLE64(out.data(), v);
    return out;
}

} // namespace ciphel::support
