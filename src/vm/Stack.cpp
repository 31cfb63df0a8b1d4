//===----------------------------------------------------------------------===//
//
// Part of the Ciphel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Stack.cpp
// Purpose: Implement the bump stack, frame checkpoints, call records and the
//          global segment.
// Key invariants: Every failing operation leaves the stack unchanged.
// Ownership/Lifetime: See Stack.hpp.
//
//===----------------------------------------------------------------------===//

#include "vm/Stack.hpp"

#include "support/bytes.hpp"

#include <algorithm>

namespace ciphel::vm
{

VmResult<void> Frame::clean(Stack &stack) const
{
    if (stack.top() < zero)
        return fault(FaultKind::StackUnderflow);
    return stack.pop(stack.top() - zero);
}

Stack::Stack(std::size_t capacity) : bytes_(capacity, 0) {}

VmResult<void> Stack::push(std::size_t size)
{
    if (size > bytes_.size() - top_)
        return fault(FaultKind::StackOverflow);
    std::fill_n(bytes_.begin() + static_cast<std::ptrdiff_t>(top_), size, uint8_t{0});
    top_ += size;
    return {};
}

VmResult<void> Stack::pop(std::size_t size)
{
    if (top_ < size)
        return fault(FaultKind::StackUnderflow);
    top_ -= size;
    return {};
}

VmResult<void> Stack::pushBytes(std::span<const uint8_t> bytes)
{
    if (bytes.size() > bytes_.size() - top_)
        return fault(FaultKind::StackOverflow);
    std::copy(bytes.begin(), bytes.end(), bytes_.begin() + static_cast<std::ptrdiff_t>(top_));
    top_ += bytes.size();
    return {};
}

VmResult<std::vector<uint8_t>> Stack::popBytes(std::size_t size)
{
    if (top_ < size)
        return fault(FaultKind::StackUnderflow);
    const auto first = bytes_.begin() + static_cast<std::ptrdiff_t>(top_ - size);
    std::vector<uint8_t> out(first, first + static_cast<std::ptrdiff_t>(size));
    top_ -= size;
    return out;
}

VmResult<void> Stack::pushU64(uint64_t value)
{
    const auto bytes = support::toLE64(value);
    return pushBytes(bytes);
}

VmResult<uint64_t> Stack::popU64()
{
    if (top_ < 8)
        return fault(FaultKind::StackUnderflow);
    top_ -= 8;
    return support::loadLE64(bytes_.data() + top_);
}

VmResult<void> Stack::pushBool(bool value)
{
    const uint8_t byte = value ? 1 : 0;
    return pushBytes(std::span<const uint8_t>(&byte, 1));
}

VmResult<bool> Stack::popBool()
{
    if (top_ < 1)
        return fault(FaultKind::StackUnderflow);
    top_ -= 1;
    return bytes_[top_] != 0;
}

VmResult<std::vector<uint8_t>> Stack::read(std::size_t offset, std::size_t size) const
{
    if (offset > top_ || size > top_ - offset)
        return fault(FaultKind::StackReadError);
    const auto first = bytes_.begin() + static_cast<std::ptrdiff_t>(offset);
    return std::vector<uint8_t>(first, first + static_cast<std::ptrdiff_t>(size));
}

VmResult<void> Stack::write(std::size_t offset, std::span<const uint8_t> bytes)
{
    if (offset > top_ || bytes.size() > top_ - offset)
        return fault(FaultKind::StackWriteError);
    std::copy(bytes.begin(), bytes.end(), bytes_.begin() + static_cast<std::ptrdiff_t>(offset));
    return {};
}

VmResult<Frame> Stack::frame(std::size_t reserved)
{
    Frame frame{top_, top_ + reserved};
    auto pushed = push(reserved);
    if (!pushed)
        return pushed.failure();
    return frame;
}

Frame Stack::noReturnFrame() const
{
    return Frame{top_, top_};
}

VmResult<void> Stack::openFrame(std::size_t paramSize, uint64_t returnCursor)
{
    if (top_ < paramSize)
        return fault(FaultKind::StackUnderflow);
    if (kCallRecordSize > bytes_.size() - top_)
        return fault(FaultKind::StackOverflow);

    const std::size_t recordStart = top_ - paramSize;
    // Shift the arguments up to make room for the record below them.
    std::copy_backward(bytes_.begin() + static_cast<std::ptrdiff_t>(recordStart),
                       bytes_.begin() + static_cast<std::ptrdiff_t>(top_),
                       bytes_.begin() + static_cast<std::ptrdiff_t>(top_ + kCallRecordSize));
    support::storeLE64(bytes_.data() + recordStart, framePointer_);
    support::storeLE64(bytes_.data() + recordStart + 8, returnCursor_);

    top_ += kCallRecordSize;
    framePointer_ = recordStart + kCallRecordSize;
    returnCursor_ = returnCursor;
    ++callDepth_;
    return {};
}

VmResult<uint64_t> Stack::closeFrame(std::size_t returnSize)
{
    if (callDepth_ == 0 || top_ < framePointer_ || top_ - framePointer_ < returnSize)
        return fault(FaultKind::StackUnderflow);

    const std::size_t recordStart = framePointer_ - kCallRecordSize;
    const uint64_t resumeAt = returnCursor_;
    const uint64_t savedFramePointer = support::loadLE64(bytes_.data() + recordStart);
    const uint64_t savedReturnCursor = support::loadLE64(bytes_.data() + recordStart + 8);

    std::copy(bytes_.begin() + static_cast<std::ptrdiff_t>(top_ - returnSize),
              bytes_.begin() + static_cast<std::ptrdiff_t>(top_),
              bytes_.begin() + static_cast<std::ptrdiff_t>(recordStart));

    top_ = recordStart + returnSize;
    framePointer_ = static_cast<std::size_t>(savedFramePointer);
    returnCursor_ = savedReturnCursor;
    --callDepth_;
    return resumeAt;
}

VmResult<std::vector<uint8_t>> Globals::read(std::size_t offset, std::size_t size) const
{
    if (offset > bytes_.size() || size > bytes_.size() - offset)
        return fault(FaultKind::ReadError);
    const auto first = bytes_.begin() + static_cast<std::ptrdiff_t>(offset);
    return std::vector<uint8_t>(first, first + static_cast<std::ptrdiff_t>(size));
}

VmResult<void> Globals::write(std::size_t offset, std::span<const uint8_t> bytes)
{
    if (offset > bytes_.size() || bytes.size() > bytes_.size() - offset)
        return fault(FaultKind::WriteError);
    std::copy(bytes.begin(), bytes.end(), bytes_.begin() + static_cast<std::ptrdiff_t>(offset));
    return {};
}

} // namespace ciphel::vm
