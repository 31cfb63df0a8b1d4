//===----------------------------------------------------------------------===//
//
// Part of the Ciphel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Extern.hpp
// Purpose: Host-registered instructions reachable through EXTERN.
// Key invariants: Extern indices are stable for the life of the table.
// Ownership/Lifetime: The Runtime owns the table; externs borrow the execution
//                     context only for the duration of one call.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "vm/Address.hpp"
#include "vm/Heap.hpp"
#include "vm/Signal.hpp"
#include "vm/Stack.hpp"
#include "vm/StdIO.hpp"
#include "vm/Weight.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace ciphel::vm
{

/// @brief State an extern may touch while it runs.
struct ExternContext
{
    Tid tid;
    Stack &stack;
    Heap &heap;
    StdIO &stdio;
    const AddressSpace &space;
};

using ExternFn = std::function<ExecStatus(ExternContext &)>;

/// @brief Description of one host extern.
/// @details Returning a Signal leaves the cursor on the EXTERN instruction, so
///          an extern can block its thread the same way built-in signals do.
struct ExternDesc
{
    std::string name;
    Weight weight = Weight::low();
    ExternFn fn;
};

class ExternTable
{
  public:
    /// @return Index to use as the EXTERN operand.
    std::size_t add(ExternDesc desc)
    {
        externs_.push_back(std::move(desc));
        return externs_.size() - 1;
    }

    /// @brief Extern at @p index, or nullptr.
    const ExternDesc *find(std::size_t index) const
    {
        return index < externs_.size() ? &externs_[index] : nullptr;
    }

    std::size_t size() const
    {
        return externs_.size();
    }

  private:
    std::vector<ExternDesc> externs_;
};

} // namespace ciphel::vm
