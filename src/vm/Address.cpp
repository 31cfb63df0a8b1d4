//===----------------------------------------------------------------------===//
//
// Part of the Ciphel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Address.cpp
// Purpose: Convert between zone-tagged and flat addresses.
//
//===----------------------------------------------------------------------===//

#include "vm/Address.hpp"

#include "vm/Stack.hpp"

namespace ciphel::vm
{

std::string toString(const MemoryAddress &address)
{
    std::string out;
    switch (address.zone)
    {
        case MemoryAddress::Zone::Global:
            out = "global";
            break;
        case MemoryAddress::Zone::Stack:
            out = "stack";
            break;
        case MemoryAddress::Zone::Heap:
            out = "heap";
            break;
        case MemoryAddress::Zone::Frame:
            out = "frame";
            break;
    }
    out.push_back('+');
    out.append(std::to_string(address.offset));
    return out;
}

VmResult<MemoryAddress> AddressSpace::decode(uint64_t flat) const
{
    if (flat < globalSize_)
        return MemoryAddress::global(flat);
    if (flat < heapBase())
        return MemoryAddress::stack(flat - globalSize_);
    if (flat < end())
        return MemoryAddress::heap(flat - heapBase());
    return fault(FaultKind::MemoryViolation, static_cast<int64_t>(flat));
}

MemoryAddress AddressSpace::resolve(const MemoryAddress &address, const Stack &owner) const
{
    if (address.zone != MemoryAddress::Zone::Frame)
        return address;
    return MemoryAddress::stack(owner.framePointer() + address.offset);
}

VmResult<uint64_t> AddressSpace::encode(const MemoryAddress &address, const Stack &owner) const
{
    const MemoryAddress resolved = resolve(address, owner);
    switch (resolved.zone)
    {
        case MemoryAddress::Zone::Global:
            if (resolved.offset < globalSize_)
                return resolved.offset;
            break;
        case MemoryAddress::Zone::Stack:
            if (resolved.offset < stackSize_)
                return globalSize_ + resolved.offset;
            break;
        case MemoryAddress::Zone::Heap:
            if (resolved.offset < heapSize_)
                return heapBase() + resolved.offset;
            break;
        case MemoryAddress::Zone::Frame:
            break;
    }
    return fault(FaultKind::MemoryViolation, static_cast<int64_t>(resolved.offset));
}

} // namespace ciphel::vm
