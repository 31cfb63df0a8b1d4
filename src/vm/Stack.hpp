//===----------------------------------------------------------------------===//
//
// Part of the Ciphel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Stack.hpp
// Purpose: Per-thread bump stack with frame checkpoints and call records, plus
//          the runtime-wide global segment.
// Key invariants: 0 <= top <= capacity; for a live Frame,
//                 bottom <= zero <= top; bytes at or above top are never read.
// Ownership/Lifetime: Each Thread exclusively owns one Stack. Globals are owned
//                     by the Runtime and shared by every thread.
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

class Stack;

/// @brief Checkpoint separating a call's parameter/return area from its locals.
struct Frame
{
    std::size_t bottom = 0; ///< Stack top when the frame was created.
    std::size_t zero = 0;   ///< First byte of locals (bottom + reserved).

    /// @brief Discard every byte pushed since @ref zero.
    /// @details The [bottom, zero) area stays on the stack so the caller can
    ///          read a return value out of it before popping it explicitly.
    /// @return StackUnderflow if the stack was already popped below @ref zero.
    VmResult<void> clean(Stack &stack) const;
};

/// @brief Fixed-capacity byte stack owned by one thread.
class Stack
{
  public:
    /// @brief Size of the record saved by openFrame: previous frame pointer and
    ///        previous return cursor, little-endian u64 each.
    static constexpr std::size_t kCallRecordSize = 16;

    explicit Stack(std::size_t capacity);

    /// @brief Reserve @p size zeroed bytes on top of the stack.
    VmResult<void> push(std::size_t size);

    /// @brief Drop @p size bytes from the top of the stack.
    VmResult<void> pop(std::size_t size);

    VmResult<void> pushBytes(std::span<const uint8_t> bytes);

    /// @brief Pop @p size bytes, returning them in stack order.
    VmResult<std::vector<uint8_t>> popBytes(std::size_t size);

    VmResult<void> pushU64(uint64_t value);
    VmResult<uint64_t> popU64();
    VmResult<void> pushBool(bool value);
    VmResult<bool> popBool();

    /// @brief Copy @p size bytes starting at absolute stack @p offset.
    /// @return StackReadError when the range extends beyond top.
    VmResult<std::vector<uint8_t>> read(std::size_t offset, std::size_t size) const;

    /// @brief Overwrite bytes starting at absolute stack @p offset.
    /// @return StackWriteError when the range extends beyond top.
    VmResult<void> write(std::size_t offset, std::span<const uint8_t> bytes);

    /// @brief Create a frame reserving @p reserved bytes for parameters/return.
    VmResult<Frame> frame(std::size_t reserved);

    /// @brief Frame with an empty parameter/return area at the current top.
    Frame noReturnFrame() const;

    /// @brief Enter a call.
    /// @details Moves the top @p paramSize bytes above a saved call record and
    ///          makes the first parameter byte the new frame pointer.
    /// @param paramSize Bytes of arguments already pushed by the caller.
    /// @param returnCursor Instruction index the matching closeFrame returns.
    VmResult<void> openFrame(std::size_t paramSize, uint64_t returnCursor);

    /// @brief Leave the innermost call.
    /// @details Keeps the top @p returnSize bytes, truncates the stack to the
    ///          call record, restores the caller's frame pointer and pushes the
    ///          return bytes back.
    /// @return Instruction index registered by the matching openFrame.
    VmResult<uint64_t> closeFrame(std::size_t returnSize);

    std::size_t top() const
    {
        return top_;
    }

    std::size_t capacity() const
    {
        return bytes_.size();
    }

    /// @brief Base used to resolve Frame-relative addresses.
    std::size_t framePointer() const
    {
        return framePointer_;
    }

    std::size_t callDepth() const
    {
        return callDepth_;
    }

  private:
    std::vector<uint8_t> bytes_;
    std::size_t top_ = 0;
    std::size_t framePointer_ = 0;
    uint64_t returnCursor_ = 0;
    std::size_t callDepth_ = 0;
};

/// @brief Global data segment shared by every thread of a runtime.
class Globals
{
  public:
    explicit Globals(std::size_t size) : bytes_(size, 0) {}

    /// @return ReadError when the range leaves the segment.
    VmResult<std::vector<uint8_t>> read(std::size_t offset, std::size_t size) const;

    /// @return WriteError when the range leaves the segment.
    VmResult<void> write(std::size_t offset, std::span<const uint8_t> bytes);

    std::size_t size() const
    {
        return bytes_.size();
    }

  private:
    std::vector<uint8_t> bytes_;
};

} // namespace ciphel::vm
