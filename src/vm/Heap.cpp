//===----------------------------------------------------------------------===//
//
// Part of the Ciphel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Heap.cpp
// Purpose: Implement block parsing, best-fit allocation, splitting, and
//          coalescing for the runtime heap.
// Key invariants: See Heap.hpp. Every public operation validates before it
//                 mutates, so a failed call leaves the heap untouched.
// Ownership/Lifetime: The heap owns its byte buffer.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Free-list heap allocator.
/// @details Blocks are never represented as objects: each operation parses the
///          header and footer words it needs straight out of the byte buffer.
///          The free list is kept sorted by address, which lets free() merge
///          with a left neighbour without touching the list and lets best-fit
///          break ties toward the lowest address.

#include "vm/Heap.hpp"

#include "support/bytes.hpp"

#include <algorithm>
#include <stdexcept>

namespace ciphel::vm
{

namespace
{

constexpr uint64_t kAllocatedBit = 1;
constexpr uint64_t kSizeMask = ~uint64_t{Heap::kWordSize - 1};

} // namespace

Heap::Heap(std::size_t size, std::size_t alignment) : bytes_(size, 0), alignment_(alignment)
{
    if (alignment < kWordSize || (alignment & (alignment - 1)) != 0)
        throw std::invalid_argument("heap alignment must be a power of two of at least 8");
    if (size < blockSizeFor(0) || !support::isAligned(size, alignment))
        throw std::invalid_argument("heap size must be an aligned multiple of the minimum block");
    writeTags(0, size, false);
    setPrev(0, kNull);
    setNext(0, kNull);
    firstFree_ = 0;
}

uint64_t Heap::word(uint64_t offset) const
{
    return support::loadBE64(bytes_.data() + offset);
}

void Heap::setWord(uint64_t offset, uint64_t value)
{
    support::storeBE64(bytes_.data() + offset, value);
}

void Heap::writeTags(Pointer pointer, std::size_t size, bool allocated)
{
    const uint64_t tag = allocated ? (size | kAllocatedBit) : (size & ~kAllocatedBit);
    setWord(pointer, tag);
    setWord(pointer + size - kWordSize, tag);
}

uint64_t Heap::prevOf(Pointer pointer) const
{
    return word(pointer + kWordSize);
}

uint64_t Heap::nextOf(Pointer pointer) const
{
    return word(pointer + 2 * kWordSize);
}

void Heap::setPrev(Pointer pointer, uint64_t prev)
{
    setWord(pointer + kWordSize, prev);
}

void Heap::setNext(Pointer pointer, uint64_t next)
{
    setWord(pointer + 2 * kWordSize, next);
}

VmResult<Heap::BlockInfo> Heap::block(Pointer pointer) const
{
    const std::size_t total = bytes_.size();
    if (!support::isAligned<uint64_t>(pointer, alignment_) || pointer > total ||
        total - pointer < kMinBlock)
        return fault(FaultKind::InvalidPointer, static_cast<int64_t>(pointer));

    const uint64_t header = word(pointer);
    const uint64_t size = header & kSizeMask;
    if (size < kMinBlock || size > total - pointer || !support::isAligned<uint64_t>(size, alignment_))
        return fault(FaultKind::InvalidPointer, static_cast<int64_t>(pointer));
    if (word(pointer + size - kWordSize) != header)
        return fault(FaultKind::InvalidPointer, static_cast<int64_t>(pointer));

    return BlockInfo{pointer, static_cast<std::size_t>(size), (header & kAllocatedBit) != 0};
}

void Heap::unlink(Pointer pointer)
{
    const uint64_t prev = prevOf(pointer);
    const uint64_t next = nextOf(pointer);
    if (prev == kNull)
        firstFree_ = next;
    else
        setNext(prev, next);
    if (next != kNull)
        setPrev(next, prev);
}

void Heap::replaceInList(Pointer old, Pointer replacement)
{
    const uint64_t prev = prevOf(old);
    const uint64_t next = nextOf(old);
    setPrev(replacement, prev);
    setNext(replacement, next);
    if (prev == kNull)
        firstFree_ = replacement;
    else
        setNext(prev, replacement);
    if (next != kNull)
        setPrev(next, replacement);
}

void Heap::insertOrdered(Pointer pointer)
{
    uint64_t prev = kNull;
    uint64_t cur = firstFree_;
    while (cur != kNull && cur < pointer)
    {
        prev = cur;
        cur = nextOf(cur);
    }
    setPrev(pointer, prev);
    setNext(pointer, cur);
    if (prev == kNull)
        firstFree_ = pointer;
    else
        setNext(prev, pointer);
    if (cur != kNull)
        setPrev(cur, pointer);
}

std::size_t Heap::blockSizeFor(std::size_t size) const
{
    const std::size_t payload = std::max(support::alignUp(size, kWordSize), kMinPayload);
    return support::alignUp(payload + kOverhead, alignment_);
}

VmResult<Heap::Pointer> Heap::alloc(std::size_t size)
{
    if (size > bytes_.size())
        return fault(FaultKind::AllocationError, static_cast<int64_t>(size));

    const std::size_t need = blockSizeFor(size);
    const std::size_t payload = need - kOverhead;

    // Best fit: the smallest sufficient block, lowest address on ties.
    uint64_t best = kNull;
    std::size_t bestSize = 0;
    std::size_t steps = 0;
    const std::size_t maxSteps = bytes_.size() / kMinBlock;
    for (uint64_t cur = firstFree_; cur != kNull; cur = nextOf(cur))
    {
        if (++steps > maxSteps)
            return fault(FaultKind::InvalidPointer, static_cast<int64_t>(cur));
        auto info = block(cur);
        if (!info)
            return info.failure();
        if (info.value().allocated)
            return fault(FaultKind::InvalidPointer, static_cast<int64_t>(cur));
        const std::size_t blockSize = info.value().size;
        if (blockSize >= need && (best == kNull || blockSize < bestSize))
        {
            best = cur;
            bestSize = blockSize;
        }
    }
    if (best == kNull)
        return fault(FaultKind::AllocationError, static_cast<int64_t>(size));

    if (bestSize - need >= kMinBlock)
    {
        const Pointer rest = best + need;
        replaceInList(best, rest);
        writeTags(rest, bestSize - need, false);
        writeTags(best, need, true);
        allocatedSize_ += payload;
    }
    else
    {
        unlink(best);
        writeTags(best, bestSize, true);
        allocatedSize_ += bestSize - kOverhead;
    }
    return best;
}

VmResult<void> Heap::free(Pointer pointer)
{
    auto info = block(pointer);
    if (!info)
        return info.failure();
    if (!info.value().allocated)
        return fault(FaultKind::FreeError, static_cast<int64_t>(pointer));
    const std::size_t size = info.value().size;

    // Left neighbour: its footer sits just before our header.
    uint64_t left = kNull;
    std::size_t leftSize = 0;
    if (pointer >= kMinBlock)
    {
        const uint64_t footer = word(pointer - kWordSize);
        const uint64_t candidate = footer & kSizeMask;
        if ((footer & kAllocatedBit) == 0 && candidate >= kMinBlock && candidate <= pointer)
        {
            auto neighbour = block(pointer - candidate);
            if (neighbour && !neighbour.value().allocated)
            {
                left = pointer - candidate;
                leftSize = candidate;
            }
        }
    }

    // Right neighbour: its header sits just past our footer.
    uint64_t right = kNull;
    std::size_t rightSize = 0;
    const uint64_t after = pointer + size;
    if (after < bytes_.size())
    {
        auto neighbour = block(after);
        if (neighbour && !neighbour.value().allocated)
        {
            right = after;
            rightSize = neighbour.value().size;
        }
    }

    allocatedSize_ -= size - kOverhead;

    if (left != kNull)
    {
        // The list is address-ordered, so a free right neighbour is the left
        // block's successor and the left block keeps its list position.
        if (right != kNull)
            unlink(right);
        writeTags(left, leftSize + size + rightSize, false);
        return {};
    }
    if (right != kNull)
    {
        replaceInList(right, pointer);
        writeTags(pointer, size + rightSize, false);
        return {};
    }
    writeTags(pointer, size, false);
    insertOrdered(pointer);
    return {};
}

VmResult<Heap::Pointer> Heap::realloc(Pointer pointer, std::size_t size)
{
    auto info = block(pointer);
    if (!info)
        return info.failure();
    if (!info.value().allocated)
        return fault(FaultKind::InvalidPointer, static_cast<int64_t>(pointer));
    const std::size_t oldPayload = info.value().size - kOverhead;

    auto moved = alloc(size);
    if (!moved)
        return moved.failure();
    const Pointer target = moved.value();
    const std::size_t count = std::min(oldPayload, size);

    const auto first = bytes_.begin() + static_cast<std::ptrdiff_t>(pointer + kWordSize);
    std::copy(first,
              first + static_cast<std::ptrdiff_t>(count),
              bytes_.begin() + static_cast<std::ptrdiff_t>(target + kWordSize));

    auto released = free(pointer);
    if (!released)
        return released.failure();
    return target;
}

VmResult<std::vector<uint8_t>> Heap::read(Pointer pointer, std::size_t size, std::size_t offset) const
{
    auto info = block(pointer);
    if (!info)
        return info.failure();
    if (!info.value().allocated)
        return fault(FaultKind::InvalidPointer, static_cast<int64_t>(pointer));
    const std::size_t data = info.value().size - kOverhead;
    if (offset > data || size > data - offset)
        return fault(FaultKind::InvalidPointer, static_cast<int64_t>(pointer));

    const auto first = bytes_.begin() + static_cast<std::ptrdiff_t>(pointer + kWordSize + offset);
    return std::vector<uint8_t>(first, first + static_cast<std::ptrdiff_t>(size));
}

VmResult<void> Heap::write(Pointer pointer, std::span<const uint8_t> bytes, std::size_t offset)
{
    auto info = block(pointer);
    if (!info)
        return info.failure();
    if (!info.value().allocated)
        return fault(FaultKind::InvalidPointer, static_cast<int64_t>(pointer));
    const std::size_t data = info.value().size - kOverhead;
    if (offset > data || bytes.size() > data - offset)
        return fault(FaultKind::WriteError, static_cast<int64_t>(pointer));

    std::copy(bytes.begin(),
              bytes.end(),
              bytes_.begin() + static_cast<std::ptrdiff_t>(pointer + kWordSize + offset));
    return {};
}

VmResult<std::vector<uint8_t>> Heap::readRaw(uint64_t offset, std::size_t size) const
{
    if (offset > bytes_.size() || size > bytes_.size() - offset)
        return fault(FaultKind::ReadError, static_cast<int64_t>(offset));
    const auto first = bytes_.begin() + static_cast<std::ptrdiff_t>(offset);
    return std::vector<uint8_t>(first, first + static_cast<std::ptrdiff_t>(size));
}

VmResult<void> Heap::writeRaw(uint64_t offset, std::span<const uint8_t> bytes)
{
    if (offset > bytes_.size() || bytes.size() > bytes_.size() - offset)
        return fault(FaultKind::WriteError, static_cast<int64_t>(offset));
    std::copy(bytes.begin(), bytes.end(), bytes_.begin() + static_cast<std::ptrdiff_t>(offset));
    return {};
}

std::vector<Heap::BlockInfo> Heap::blocks() const
{
    std::vector<BlockInfo> out;
    uint64_t cur = 0;
    while (cur < bytes_.size())
    {
        auto info = block(cur);
        if (!info)
            break;
        out.push_back(info.value());
        cur += info.value().size;
    }
    return out;
}

std::vector<Heap::Pointer> Heap::freeList() const
{
    std::vector<Pointer> out;
    const std::size_t maxSteps = bytes_.size() / kMinBlock;
    for (uint64_t cur = firstFree_; cur != kNull && out.size() <= maxSteps; cur = nextOf(cur))
        out.push_back(cur);
    return out;
}

VmResult<void> Heap::checkIntegrity() const
{
    std::size_t freeCount = 0;
    bool previousFree = false;
    uint64_t cur = 0;
    while (cur < bytes_.size())
    {
        auto info = block(cur);
        if (!info)
            return info.failure();
        const bool isFree = !info.value().allocated;
        if (isFree && previousFree)
            return fault(FaultKind::InvalidPointer, static_cast<int64_t>(cur));
        if (isFree)
            ++freeCount;
        previousFree = isFree;
        cur += info.value().size;
    }
    if (cur != bytes_.size())
        return fault(FaultKind::InvalidPointer, static_cast<int64_t>(cur));

    std::size_t steps = 0;
    uint64_t prev = kNull;
    for (uint64_t node = firstFree_; node != kNull; node = nextOf(node))
    {
        if (++steps > freeCount)
            return fault(FaultKind::InvalidPointer, static_cast<int64_t>(node));
        auto info = block(node);
        if (!info || info.value().allocated)
            return fault(FaultKind::InvalidPointer, static_cast<int64_t>(node));
        if (prevOf(node) != prev || (prev != kNull && node <= prev))
            return fault(FaultKind::InvalidPointer, static_cast<int64_t>(node));
        prev = node;
    }
    if (steps != freeCount)
        return fault(FaultKind::InvalidPointer, static_cast<int64_t>(firstFree_));
    return {};
}

} // namespace ciphel::vm
