//===----------------------------------------------------------------------===//
//
// Part of the Ciphel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Config.hpp
// Purpose: Compile-time defaults and the start-up configuration of a runtime.
// Key invariants: Every size is a multiple of CIPHEL_ALIGNMENT; the heap holds
//                 at least one minimum block.
// Ownership/Lifetime: Shared header; RuntimeConfig is a plain value.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "vm/Trace.hpp"

#include <cstddef>
#include <cstdint>

// -----------------------------------------------------------------------------
// Compile-time defaults. Embedders override them with -D definitions; a
// RuntimeConfig built without explicit values picks them up.
// -----------------------------------------------------------------------------
#ifndef CIPHEL_HEAP_SIZE
#define CIPHEL_HEAP_SIZE 2048
#endif

#ifndef CIPHEL_STACK_SIZE
#define CIPHEL_STACK_SIZE 2024
#endif

#ifndef CIPHEL_GLOBAL_SIZE
#define CIPHEL_GLOBAL_SIZE 2024
#endif

#ifndef CIPHEL_MAX_THREAD_COUNT
#define CIPHEL_MAX_THREAD_COUNT 4
#endif

#ifndef CIPHEL_ALIGNMENT
#define CIPHEL_ALIGNMENT 8
#endif

#ifndef CIPHEL_TICK_BUDGET
#define CIPHEL_TICK_BUDGET 100
#endif

namespace ciphel::vm
{

inline constexpr std::size_t kHeapSize = CIPHEL_HEAP_SIZE;
inline constexpr std::size_t kStackSize = CIPHEL_STACK_SIZE;
inline constexpr std::size_t kGlobalSize = CIPHEL_GLOBAL_SIZE;
inline constexpr std::size_t kMaxThreadCount = CIPHEL_MAX_THREAD_COUNT;
inline constexpr std::size_t kAlignment = CIPHEL_ALIGNMENT;
inline constexpr uint64_t kTickBudget = CIPHEL_TICK_BUDGET;

static_assert((kAlignment & (kAlignment - 1)) == 0, "CIPHEL_ALIGNMENT must be a power of two");
static_assert(kAlignment >= 8, "heap blocks need room for their 8-byte tag words");

/// @brief Scheduling policies selectable at start-up.
enum class PolicyKind
{
    ToCompletion, ///< Every instruction is accepted; a thread runs until it blocks or idles.
    Weighted,     ///< Instruction weights are charged against a per-tick budget.
};

/// @brief Start-up configuration consumed by the Runtime constructor.
struct RuntimeConfig
{
    std::size_t heapSize = kHeapSize;
    std::size_t stackSize = kStackSize;
    std::size_t globalSize = kGlobalSize;
    std::size_t maxThreadCount = kMaxThreadCount;
    uint64_t tickBudget = kTickBudget;
    PolicyKind policy = PolicyKind::Weighted;
    TraceConfig trace{};

    /// @brief Reject inconsistent configurations.
    /// @throws std::invalid_argument naming the offending field.
    void validate() const;
};

} // namespace ciphel::vm
