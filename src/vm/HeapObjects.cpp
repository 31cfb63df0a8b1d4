//===----------------------------------------------------------------------===//
//
// Part of the Ciphel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/HeapObjects.cpp
// Purpose: Implement heap vectors and strings on top of Heap block access.
//
//===----------------------------------------------------------------------===//

#include "vm/HeapObjects.hpp"

#include "support/bytes.hpp"

#include <algorithm>
#include <limits>

namespace ciphel::vm
{

namespace
{

constexpr std::size_t kCapacityOffset = 0;
constexpr std::size_t kLengthOffset = 8;
constexpr std::size_t kSizeMax = std::numeric_limits<std::size_t>::max();

/// @brief Largest item count whose data region, header included, fits in a size_t.
constexpr uint64_t maxItems(std::size_t itemSize)
{
    return itemSize == 0 ? kSizeMax : (kSizeMax - kObjectHeaderSize) / itemSize;
}

/// @brief Byte offset of item @p index within the object's data region.
VmResult<std::size_t> itemOffset(std::size_t itemSize, uint64_t index)
{
    if (index >= maxItems(itemSize))
        return fault(FaultKind::IndexOutOfBound, static_cast<int64_t>(index));
    return kObjectHeaderSize + static_cast<std::size_t>(index) * itemSize;
}

VmResult<uint64_t> readField(const Heap &heap, Heap::Pointer object, std::size_t offset)
{
    auto bytes = heap.read(object, 8, offset);
    if (!bytes)
        return bytes.failure();
    return support::loadLE64(bytes.value().data());
}

VmResult<void> writeField(Heap &heap, Heap::Pointer object, std::size_t offset, uint64_t value)
{
    const auto bytes = support::toLE64(value);
    return heap.write(object, bytes, offset);
}

/// @brief Number of bytes in the UTF-8 sequence introduced by @p lead, or 0.
std::size_t sequenceLength(uint8_t lead)
{
    if (lead <= 0x7F)
        return 1;
    if (lead >= 0xC0 && lead <= 0xDF)
        return 2;
    if (lead >= 0xE0 && lead <= 0xEF)
        return 3;
    if (lead >= 0xF0 && lead <= 0xF7)
        return 4;
    return 0;
}

} // namespace

VmResult<Heap::Pointer> createVector(Heap &heap, std::size_t itemSize, std::size_t length)
{
    if (length > kSizeMax / 2)
        return fault(FaultKind::AllocationError, 0);
    const std::size_t capacity = std::max<std::size_t>(1, 2 * length);
    if (capacity > maxItems(itemSize))
        return fault(FaultKind::AllocationError, 0);
    const std::size_t dataSize = capacity * itemSize;
    auto object = heap.alloc(kObjectHeaderSize + dataSize);
    if (!object)
        return object.failure();
    const Heap::Pointer pointer = object.value();

    std::vector<uint8_t> zeros(kObjectHeaderSize + dataSize, 0);
    support::storeLE64(zeros.data() + kCapacityOffset, capacity);
    support::storeLE64(zeros.data() + kLengthOffset, length);
    auto written = heap.write(pointer, zeros);
    if (!written)
        return written.failure();
    return pointer;
}

VmResult<uint64_t> vectorLength(const Heap &heap, Heap::Pointer object)
{
    return readField(heap, object, kLengthOffset);
}

VmResult<uint64_t> vectorCapacity(const Heap &heap, Heap::Pointer object)
{
    return readField(heap, object, kCapacityOffset);
}

VmResult<Heap::Pointer> pushItem(Heap &heap,
                                 Heap::Pointer object,
                                 std::size_t itemSize,
                                 std::span<const uint8_t> item)
{
    if (item.size() != itemSize)
        return fault(FaultKind::Deserialization, static_cast<int64_t>(item.size()));
    auto length = vectorLength(heap, object);
    if (!length)
        return length.failure();
    auto capacity = vectorCapacity(heap, object);
    if (!capacity)
        return capacity.failure();

    Heap::Pointer target = object;
    if (length.value() >= capacity.value())
    {
        if (capacity.value() > maxItems(itemSize) / 2)
            return fault(FaultKind::AllocationError, 0);
        const uint64_t grown = std::max<uint64_t>(1, capacity.value() * 2);
        auto moved = heap.realloc(object, kObjectHeaderSize + grown * itemSize);
        if (!moved)
            return moved.failure();
        target = moved.value();
        auto updated = writeField(heap, target, kCapacityOffset, grown);
        if (!updated)
            return updated.failure();
    }

    auto offset = itemOffset(itemSize, length.value());
    if (!offset)
        return offset.failure();
    auto stored = heap.write(target, item, offset.value());
    if (!stored)
        return stored.failure();
    auto counted = writeField(heap, target, kLengthOffset, length.value() + 1);
    if (!counted)
        return counted.failure();
    return target;
}

VmResult<std::vector<uint8_t>> popItem(Heap &heap, Heap::Pointer object, std::size_t itemSize)
{
    auto length = vectorLength(heap, object);
    if (!length)
        return length.failure();
    if (length.value() == 0)
        return fault(FaultKind::IndexOutOfBound, 0);

    const uint64_t last = length.value() - 1;
    auto offset = itemOffset(itemSize, last);
    if (!offset)
        return offset.failure();
    auto item = heap.read(object, itemSize, offset.value());
    if (!item)
        return item.failure();
    auto counted = writeField(heap, object, kLengthOffset, last);
    if (!counted)
        return counted.failure();
    return std::move(item.value());
}

VmResult<std::vector<uint8_t>> itemAt(const Heap &heap,
                                      Heap::Pointer object,
                                      std::size_t itemSize,
                                      uint64_t index)
{
    auto length = vectorLength(heap, object);
    if (!length)
        return length.failure();
    if (index >= length.value())
        return fault(FaultKind::IndexOutOfBound, static_cast<int64_t>(index));
    auto offset = itemOffset(itemSize, index);
    if (!offset)
        return offset.failure();
    return heap.read(object, itemSize, offset.value());
}

VmResult<void> setItem(Heap &heap,
                       Heap::Pointer object,
                       std::size_t itemSize,
                       uint64_t index,
                       std::span<const uint8_t> item)
{
    if (item.size() != itemSize)
        return fault(FaultKind::Deserialization, static_cast<int64_t>(item.size()));
    auto length = vectorLength(heap, object);
    if (!length)
        return length.failure();
    if (index >= length.value())
        return fault(FaultKind::IndexOutOfBound, static_cast<int64_t>(index));
    auto offset = itemOffset(itemSize, index);
    if (!offset)
        return offset.failure();
    return heap.write(object, item, offset.value());
}

VmResult<Heap::Pointer> createString(Heap &heap, std::string_view text)
{
    const std::size_t capacity = std::max<std::size_t>(1, text.size());
    auto object = heap.alloc(kObjectHeaderSize + capacity);
    if (!object)
        return object.failure();

    std::vector<uint8_t> bytes(kObjectHeaderSize + text.size(), 0);
    support::storeLE64(bytes.data() + kCapacityOffset, capacity);
    support::storeLE64(bytes.data() + kLengthOffset, text.size());
    std::copy(text.begin(), text.end(), bytes.begin() + kObjectHeaderSize);
    auto written = heap.write(object.value(), bytes);
    if (!written)
        return written.failure();
    return object.value();
}

VmResult<std::string> readString(const Heap &heap, Heap::Pointer object)
{
    auto length = vectorLength(heap, object);
    if (!length)
        return length.failure();
    auto bytes = heap.read(object, length.value(), kObjectHeaderSize);
    if (!bytes)
        return bytes.failure();
    return std::string(bytes.value().begin(), bytes.value().end());
}

VmResult<Utf8Char> utf8CharAt(const Heap &heap, Heap::Pointer object, std::size_t index)
{
    auto length = vectorLength(heap, object);
    if (!length)
        return length.failure();
    auto text = heap.read(object, length.value(), kObjectHeaderSize);
    if (!text)
        return text.failure();
    const std::vector<uint8_t> &bytes = text.value();

    std::size_t offset = 0;
    std::size_t current = 0;
    while (offset < bytes.size())
    {
        const std::size_t size = sequenceLength(bytes[offset]);
        if (size == 0 || size > bytes.size() - offset)
            return fault(FaultKind::ReadError, static_cast<int64_t>(offset));
        for (std::size_t i = 1; i < size; ++i)
        {
            if ((bytes[offset + i] & 0xC0) != 0x80)
                return fault(FaultKind::ReadError, static_cast<int64_t>(offset + i));
        }
        if (current == index)
        {
            Utf8Char ch;
            std::copy_n(bytes.begin() + static_cast<std::ptrdiff_t>(offset), size, ch.bytes.begin());
            ch.size = size;
            ch.offset = offset;
            return ch;
        }
        offset += size;
        ++current;
    }
    return fault(FaultKind::IndexOutOfBound, static_cast<int64_t>(index));
}

} // namespace ciphel::vm
