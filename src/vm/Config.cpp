//===----------------------------------------------------------------------===//
//
// Part of the Ciphel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Config.cpp
// Purpose: Validate runtime start-up configuration.
//
//===----------------------------------------------------------------------===//

#include "vm/Config.hpp"

#include "support/bytes.hpp"

#include <stdexcept>
#include <string>

namespace ciphel::vm
{

namespace
{

void requireAligned(std::size_t value, const char *field)
{
    if (!support::isAligned(value, kAlignment))
        throw std::invalid_argument(std::string(field) + " must be a multiple of " +
                                    std::to_string(kAlignment));
}

} // namespace

void RuntimeConfig::validate() const
{
    requireAligned(heapSize, "heapSize");
    requireAligned(stackSize, "stackSize");
    requireAligned(globalSize, "globalSize");
    if (heapSize < 4 * kAlignment)
        throw std::invalid_argument("heapSize must hold at least one minimum block");
    if (maxThreadCount == 0)
        throw std::invalid_argument("maxThreadCount must be positive");
    if (policy == PolicyKind::Weighted && tickBudget == 0)
        throw std::invalid_argument("tickBudget must be positive for the weighted policy");
}

} // namespace ciphel::vm
