//===----------------------------------------------------------------------===//
//
// Part of the Ciphel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tests/vm/AddressTests.cpp
// Purpose: Flat address decoding and encoding across the three zones.
//
//===----------------------------------------------------------------------===//

#include "vm/Address.hpp"
#include "vm/Config.hpp"
#include "vm/Stack.hpp"

#include <gtest/gtest.h>

#include <cstdint>

using namespace ciphel::vm;

namespace
{

AddressSpace defaultSpace()
{
    return AddressSpace(kGlobalSize, kStackSize, kHeapSize);
}

} // namespace

TEST(Address, ZoneBoundaries)
{
    const AddressSpace space = defaultSpace();
    EXPECT_EQ(space.stackBase(), kGlobalSize);
    EXPECT_EQ(space.heapBase(), kGlobalSize + kStackSize);
    EXPECT_EQ(space.end(), kGlobalSize + kStackSize + kHeapSize);

    EXPECT_EQ(space.decode(0).value(), MemoryAddress::global(0));
    EXPECT_EQ(space.decode(kGlobalSize - 1).value(), MemoryAddress::global(kGlobalSize - 1));
    EXPECT_EQ(space.decode(kGlobalSize).value(), MemoryAddress::stack(0));
    EXPECT_EQ(space.decode(space.heapBase() - 1).value(), MemoryAddress::stack(kStackSize - 1));
    EXPECT_EQ(space.decode(space.heapBase()).value(), MemoryAddress::heap(0));
    EXPECT_EQ(space.decode(space.end() - 1).value(), MemoryAddress::heap(kHeapSize - 1));
}

TEST(Address, OutOfRangeIsMemoryViolation)
{
    const AddressSpace space = defaultSpace();
    auto decoded = space.decode(space.end());
    ASSERT_FALSE(decoded.isOk());
    EXPECT_EQ(decoded.error().kind, FaultKind::MemoryViolation);

    Stack stack(kStackSize);
    auto encoded = space.encode(MemoryAddress::heap(kHeapSize), stack);
    ASSERT_FALSE(encoded.isOk());
    EXPECT_EQ(encoded.error().kind, FaultKind::MemoryViolation);
}

TEST(Address, EncodeInvertsDecode)
{
    const AddressSpace space = defaultSpace();
    Stack stack(kStackSize);
    for (const MemoryAddress address :
         {MemoryAddress::global(8), MemoryAddress::stack(40), MemoryAddress::heap(64)})
    {
        auto flat = space.encode(address, stack);
        ASSERT_TRUE(flat.isOk()) << toString(address);
        EXPECT_EQ(space.decode(flat.value()).value(), address);
    }
}

TEST(Address, FrameOffsetsFollowFramePointer)
{
    const AddressSpace space = defaultSpace();
    Stack stack(kStackSize);
    ASSERT_TRUE(stack.push(24).isOk());
    ASSERT_TRUE(stack.openFrame(0, 0).isOk());

    const MemoryAddress local = MemoryAddress::frame(8);
    EXPECT_EQ(space.resolve(local, stack), MemoryAddress::stack(24 + Stack::kCallRecordSize + 8));
    auto flat = space.encode(local, stack);
    ASSERT_TRUE(flat.isOk());
    EXPECT_EQ(flat.value(), kGlobalSize + 24 + Stack::kCallRecordSize + 8);
}

TEST(Address, Arithmetic)
{
    const MemoryAddress base = MemoryAddress::heap(16);
    EXPECT_EQ(base.add(8), MemoryAddress::heap(24));
    EXPECT_EQ(base.sub(8), MemoryAddress::heap(8));
    EXPECT_EQ(base.sub(32), MemoryAddress::heap(0));
    EXPECT_EQ(toString(base), "heap+16");
}

TEST(Address, AddSaturatesInsteadOfWrapping)
{
    const MemoryAddress high = MemoryAddress::stack(UINT64_MAX - 4);
    EXPECT_EQ(high.add(4), MemoryAddress::stack(UINT64_MAX));
    EXPECT_EQ(high.add(5), MemoryAddress::stack(UINT64_MAX));
    EXPECT_EQ(high.add(UINT64_MAX), MemoryAddress::stack(UINT64_MAX));
    EXPECT_EQ(MemoryAddress::global(0).add(UINT64_MAX).zone, MemoryAddress::Zone::Global);
}
