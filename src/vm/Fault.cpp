//===----------------------------------------------------------------------===//
//
// Part of the Ciphel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Fault.cpp
// Purpose: Format runtime faults for host-facing diagnostics.
//
//===----------------------------------------------------------------------===//

#include "vm/Fault.hpp"

namespace ciphel::vm
{

std::string formatFault(const Fault &fault, uint64_t tid, std::size_t cursor)
{
    const auto kindStr = toString(fault.kind);

    std::string result;
    result.reserve(48 + kindStr.size());
    result.append("fault ");
    result.append(kindStr);
    result.append(" (code=");
    result.append(std::to_string(fault.code));
    result.append(") in thread ");
    result.append(std::to_string(tid));
    result.append(" at #");
    result.append(std::to_string(cursor));
    return result;
}

} // namespace ciphel::vm
