//===----------------------------------------------------------------------===//
//
// Part of the Ciphel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/CatchStack.hpp
// Purpose: Per-thread stack of bytecode catch labels.
// Key invariants: Catching a fault inspects the innermost label but never pops
//                 it; only TRY_END pops.
// Ownership/Lifetime: Owned by its Thread.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "vm/Casm.hpp"
#include "vm/Fault.hpp"
#include "vm/Program.hpp"

#include <cstddef>
#include <vector>

namespace ciphel::vm
{

class CatchStack
{
  public:
    void push(LabelId label)
    {
        labels_.push_back(label);
    }

    /// @brief Leave the innermost protected region.
    /// @return UnsupportedOperation when no region is open.
    VmResult<void> pop();

    /// @brief Decide where execution resumes after @p fault.
    /// @return Cursor of the innermost catch label; @p fault itself when no
    ///         label is registered; CodeSegmentation when the label is not
    ///         placed in @p program.
    VmResult<std::size_t> resolve(const Fault &fault, const Program &program) const;

    bool empty() const
    {
        return labels_.empty();
    }

    std::size_t depth() const
    {
        return labels_.size();
    }

  private:
    std::vector<LabelId> labels_;
};

} // namespace ciphel::vm
