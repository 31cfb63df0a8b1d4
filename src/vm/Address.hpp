//===----------------------------------------------------------------------===//
//
// Part of the Ciphel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Address.hpp
// Purpose: Zone-tagged memory addresses and their flat 64-bit encoding.
// Key invariants: The flat space is Global [0, G), Stack [G, G+S), Heap
//                 [G+S, G+S+H). Frame addresses are never encoded without first
//                 resolving them against a stack's frame pointer.
// Ownership/Lifetime: Value types; AddressSpace only records the zone sizes.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "vm/Fault.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace ciphel::vm
{

class Stack;

/// @brief Address tagged with the zone it lives in.
struct MemoryAddress
{
    enum class Zone : uint8_t
    {
        Global,
        Stack,
        Heap,
        Frame, ///< Offset from the owning stack's current frame pointer.
    };

    Zone zone = Zone::Global;
    uint64_t offset = 0;

    static constexpr MemoryAddress global(uint64_t offset)
    {
        return {Zone::Global, offset};
    }

    static constexpr MemoryAddress stack(uint64_t offset)
    {
        return {Zone::Stack, offset};
    }

    static constexpr MemoryAddress heap(uint64_t offset)
    {
        return {Zone::Heap, offset};
    }

    static constexpr MemoryAddress frame(uint64_t offset)
    {
        return {Zone::Frame, offset};
    }

    /// @brief Same zone, offset advanced by @p n, saturating at UINT64_MAX.
    constexpr MemoryAddress add(uint64_t n) const
    {
        return {zone, n > UINT64_MAX - offset ? UINT64_MAX : offset + n};
    }

    /// @brief Same zone, offset moved back by @p n, saturating at zero.
    constexpr MemoryAddress sub(uint64_t n) const
    {
        return {zone, n > offset ? 0 : offset - n};
    }

    bool operator==(const MemoryAddress &) const = default;
};

/// @brief Render an address as "<zone>+offset" for traces.
std::string toString(const MemoryAddress &address);

/// @brief Partition of the flat address space.
class AddressSpace
{
  public:
    AddressSpace(std::size_t globalSize, std::size_t stackSize, std::size_t heapSize)
        : globalSize_(globalSize), stackSize_(stackSize), heapSize_(heapSize)
    {
    }

    /// @brief Decode a flat value into exactly one zone.
    /// @return MemoryViolation when @p flat lies past the heap range.
    VmResult<MemoryAddress> decode(uint64_t flat) const;

    /// @brief Encode @p address into its flat value.
    /// @param address Address to encode; Frame addresses resolve against
    ///        @p owner's frame pointer.
    /// @param owner Stack of the executing thread.
    /// @return MemoryViolation when the offset lies outside its zone.
    VmResult<uint64_t> encode(const MemoryAddress &address, const Stack &owner) const;

    /// @brief Rewrite a Frame address as the Stack address it denotes.
    MemoryAddress resolve(const MemoryAddress &address, const Stack &owner) const;

    std::size_t stackBase() const
    {
        return globalSize_;
    }

    std::size_t heapBase() const
    {
        return globalSize_ + stackSize_;
    }

    std::size_t end() const
    {
        return globalSize_ + stackSize_ + heapSize_;
    }

  private:
    std::size_t globalSize_;
    std::size_t stackSize_;
    std::size_t heapSize_;
};

} // namespace ciphel::vm
