//===----------------------------------------------------------------------===//
//
// Part of the Ciphel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/HeapObjects.hpp
// Purpose: Growable vectors and strings stored in heap blocks.
// Key invariants: An object's data region starts with capacity (u64 LE, in
//                 items) then length (u64 LE, in items); length <= capacity and
//                 the block holds 16 + capacity * itemSize bytes.
// Ownership/Lifetime: Objects are plain heap blocks; whoever holds the pointer
//                     frees it. pushItem may move the object.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "vm/Heap.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ciphel::vm
{

inline constexpr std::size_t kObjectHeaderSize = 16;

/// @brief Allocate a vector of @p length zeroed items.
/// @details Capacity starts at twice the length, and never below one item.
VmResult<Heap::Pointer> createVector(Heap &heap, std::size_t itemSize, std::size_t length);

VmResult<uint64_t> vectorLength(const Heap &heap, Heap::Pointer object);
VmResult<uint64_t> vectorCapacity(const Heap &heap, Heap::Pointer object);

/// @brief Append one item, doubling the capacity through Heap::realloc when
///        the vector is full.
/// @return Pointer of the (possibly moved) object.
VmResult<Heap::Pointer> pushItem(Heap &heap,
                                 Heap::Pointer object,
                                 std::size_t itemSize,
                                 std::span<const uint8_t> item);

/// @brief Remove and return the last item; IndexOutOfBound when empty.
VmResult<std::vector<uint8_t>> popItem(Heap &heap, Heap::Pointer object, std::size_t itemSize);

/// @brief Copy item @p index; IndexOutOfBound past the length.
VmResult<std::vector<uint8_t>> itemAt(const Heap &heap,
                                      Heap::Pointer object,
                                      std::size_t itemSize,
                                      uint64_t index);

VmResult<void> setItem(Heap &heap,
                       Heap::Pointer object,
                       std::size_t itemSize,
                       uint64_t index,
                       std::span<const uint8_t> item);

/// @brief Allocate a byte vector holding @p text.
VmResult<Heap::Pointer> createString(Heap &heap, std::string_view text);

VmResult<std::string> readString(const Heap &heap, Heap::Pointer object);

/// @brief One UTF-8 encoded scalar value.
struct Utf8Char
{
    std::array<uint8_t, 4> bytes{};
    std::size_t size = 0;   ///< Encoded length, 1 to 4.
    std::size_t offset = 0; ///< Byte offset of the scalar within the string.
};

/// @brief Decode the @p index-th scalar of a string object.
/// @return ReadError for malformed sequences, IndexOutOfBound when the string
///         has fewer scalars.
VmResult<Utf8Char> utf8CharAt(const Heap &heap, Heap::Pointer object, std::size_t index);

} // namespace ciphel::vm
