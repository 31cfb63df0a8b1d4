//===----------------------------------------------------------------------===//
//
// Part of the Ciphel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Heap.hpp
// Purpose: Best-fit free-list allocator over a fixed byte array.
// Key invariants: Blocks tile the whole buffer; every block carries identical
//                 8-byte big-endian header and footer words (size | allocated
//                 bit); free blocks are threaded through one doubly-linked list
//                 kept in ascending address order; no two free blocks are
//                 adjacent after free() returns.
// Ownership/Lifetime: The Runtime owns the single Heap; threads refer to blocks
//                     only by offset.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "vm/Fault.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace ciphel::vm
{

/// @brief Manual allocate/free heap.
/// @details Block layout, all words big-endian u64:
///          - [0, 8)   header, size | 1 when allocated, size when free;
///          - [8, 16)  previous free offset (free blocks only, 1 = none);
///          - [16, 24) next free offset (free blocks only, 1 = none);
///          - [size - 8, size) footer, equal to the header.
///          The data region of an allocated block is [8, size - 8). Block
///          sizes and offsets are multiples of the heap alignment, which is
///          a power of two no smaller than the 8-byte tag word.
class Heap
{
  public:
    using Pointer = uint64_t;

    static constexpr std::size_t kWordSize = 8;
    static constexpr std::size_t kOverhead = 2 * kWordSize; ///< Header plus footer.
    static constexpr std::size_t kMinPayload = 2 * kWordSize;
    static constexpr std::size_t kMinBlock = kOverhead + kMinPayload;
    static constexpr uint64_t kNull = 1; ///< Free-list sentinel; never a valid offset.

    /// @brief Parsed view of one block.
    struct BlockInfo
    {
        Pointer pointer = 0;
        std::size_t size = 0;
        bool allocated = false;

        bool operator==(const BlockInfo &) const = default;
    };

    /// @brief Create a heap of @p size bytes holding a single free block.
    /// @throws std::invalid_argument when @p alignment is not a power of two
    ///         of at least kWordSize, or @p size is not a multiple of it.
    explicit Heap(std::size_t size, std::size_t alignment = kWordSize);

    /// @brief Allocate a block whose data region holds at least @p size bytes.
    /// @return Offset of the block header, or AllocationError.
    VmResult<Pointer> alloc(std::size_t size);

    /// @brief Release the block at @p pointer, coalescing with free neighbours.
    /// @return FreeError for a block that is already free, InvalidPointer for a
    ///         malformed one.
    VmResult<void> free(Pointer pointer);

    /// @brief Move the block at @p pointer into a block of @p size data bytes.
    /// @details The old block stays valid when the new allocation fails.
    VmResult<Pointer> realloc(Pointer pointer, std::size_t size);

    /// @brief Copy @p size bytes from the data region of block @p pointer,
    ///        starting @p offset bytes into it.
    VmResult<std::vector<uint8_t>> read(Pointer pointer, std::size_t size, std::size_t offset = 0) const;

    /// @brief Overwrite bytes inside the data region of block @p pointer.
    /// @return InvalidPointer for a bad block, WriteError when the bytes would
    ///         leave the data region.
    VmResult<void> write(Pointer pointer, std::span<const uint8_t> bytes, std::size_t offset = 0);

    /// @brief Range-checked access by raw heap offset, used for interior
    ///        pointers produced by address arithmetic.
    VmResult<std::vector<uint8_t>> readRaw(uint64_t offset, std::size_t size) const;
    VmResult<void> writeRaw(uint64_t offset, std::span<const uint8_t> bytes);

    /// @brief Parse the block at @p pointer.
    VmResult<BlockInfo> block(Pointer pointer) const;

    /// @brief Walk every block from offset 0 to the end of the heap.
    std::vector<BlockInfo> blocks() const;

    /// @brief Offsets on the free list in list order.
    std::vector<Pointer> freeList() const;

    /// @brief Verify the structural invariants listed in the file header.
    /// @return InvalidPointer describing the first offset found inconsistent.
    VmResult<void> checkIntegrity() const;

    /// @brief Bytes of data region currently handed out.
    std::size_t allocatedSize() const
    {
        return allocatedSize_;
    }

    std::size_t size() const
    {
        return bytes_.size();
    }

    std::size_t alignment() const
    {
        return alignment_;
    }

    /// @brief Head of the free list, or kNull when the heap is full.
    uint64_t firstFree() const
    {
        return firstFree_;
    }

  private:
    uint64_t word(uint64_t offset) const;
    void setWord(uint64_t offset, uint64_t value);
    void writeTags(Pointer pointer, std::size_t size, bool allocated);
    uint64_t prevOf(Pointer pointer) const;
    uint64_t nextOf(Pointer pointer) const;
    void setPrev(Pointer pointer, uint64_t prev);
    void setNext(Pointer pointer, uint64_t next);

    void unlink(Pointer pointer);
    void replaceInList(Pointer old, Pointer replacement);
    void insertOrdered(Pointer pointer);

    std::size_t blockSizeFor(std::size_t size) const;

    std::vector<uint8_t> bytes_;
    std::size_t alignment_;
    uint64_t firstFree_ = kNull;
    std::size_t allocatedSize_ = 0;
};

} // namespace ciphel::vm
