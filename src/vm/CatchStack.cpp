//===----------------------------------------------------------------------===//
//
// Part of the Ciphel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/CatchStack.cpp
// Purpose: Jump-based fault recovery.
//
//===----------------------------------------------------------------------===//

#include "vm/CatchStack.hpp"

namespace ciphel::vm
{

VmResult<void> CatchStack::pop()
{
    if (labels_.empty())
        return fault(FaultKind::UnsupportedOperation);
    labels_.pop_back();
    return {};
}

VmResult<std::size_t> CatchStack::resolve(const Fault &fault, const Program &program) const
{
    if (labels_.empty())
        return support::fail(fault);
    return program.cursorOf(labels_.back());
}

} // namespace ciphel::vm
