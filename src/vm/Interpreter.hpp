//===----------------------------------------------------------------------===//
//
// Part of the Ciphel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Interpreter.hpp
// Purpose: Execute a single Casm instruction on behalf of one thread.
// Key invariants: On Continue the thread cursor already points at the next
//                 instruction; on Signal or Fault it is left unchanged.
// Ownership/Lifetime: Machine borrows runtime-owned state for one step.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "vm/Address.hpp"
#include "vm/Casm.hpp"
#include "vm/Extern.hpp"
#include "vm/Heap.hpp"
#include "vm/Signal.hpp"
#include "vm/Stack.hpp"
#include "vm/StdIO.hpp"
#include "vm/Thread.hpp"
#include "vm/Weight.hpp"

#include <cstddef>

namespace ciphel::vm
{

/// @brief Shared state an instruction may act on.
struct Machine
{
    Heap &heap;
    Globals &globals;
    const AddressSpace &space;
    StdIO &stdio;
    const ExternTable &externs;
    std::size_t stackSize;
};

/// @brief Execute @p instr for @p thread.
ExecStatus execute(const CasmInstr &instr, Thread &thread, Machine &machine);

/// @brief Weight charged for @p instr, honouring extern declarations.
Weight instructionWeight(const CasmInstr &instr, const Machine &machine);

/// @brief Flat address of the data region of heap block @p block.
uint64_t flatOfBlock(const AddressSpace &space, Heap::Pointer block);

/// @brief Heap block whose data region starts at flat address @p flat.
/// @return MemoryViolation outside every zone, InvalidPointer outside the heap.
VmResult<Heap::Pointer> blockOfFlat(const AddressSpace &space, uint64_t flat);

} // namespace ciphel::vm
