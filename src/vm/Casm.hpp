//===----------------------------------------------------------------------===//
//
// Part of the Ciphel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Casm.hpp
// Purpose: Casm instruction format and opcode definitions.
// Key invariants: Opcodes are grouped by functional category in hex ranges.
//                 Numbers on the stack are u64 little-endian; booleans are one
//                 byte.
// Ownership/Lifetime: Instructions are value types owned by their Program.
// Links: Program.hpp, Interpreter.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "vm/Address.hpp"
#include "vm/Weight.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

namespace ciphel::vm
{

/// @brief Identifier of a label inside one Program.
using LabelId = uint64_t;

/// @brief Marker for "no label" operands.
inline constexpr LabelId kNoLabel = std::numeric_limits<LabelId>::max();

enum class CasmOpcode : uint8_t
{
    // Data and stack (0x00-0x0F)
    NOP = 0x00,         ///< No operation.
    LABEL = 0x01,       ///< Position marker for @c label; no effect.
    PUSH = 0x02,        ///< Push the @c data bytes.
    POP = 0x03,         ///< Drop @c size bytes.
    DUP = 0x04,         ///< Duplicate the top @c size bytes.
    STACK_ALLOC = 0x05, ///< Push @c size zero bytes.

    // Addressing (0x10-0x1F)
    LOCATE = 0x10, ///< Push the flat encoding of @c address.
    LOAD = 0x11,   ///< Pop a flat address; push the @c size bytes it points to.
    STORE = 0x12,  ///< Pop @c size value bytes then a flat address; write the value.

    // Heap (0x20-0x2F)
    HEAP_ALLOC = 0x20,   ///< Allocate @c size bytes; push the flat data address.
    HEAP_FREE = 0x21,    ///< Pop a flat data address and free its block.
    HEAP_REALLOC = 0x22, ///< Pop a flat data address; move it to @c size bytes; push the new one.
    VEC_NEW = 0x23,      ///< Pop a u64 length; push a vector of @c size-byte items.
    VEC_PUSH = 0x24,     ///< Pop an item then a vector; push the (moved) vector.
    VEC_POP = 0x25,      ///< Pop a vector; push its removed last item.
    VEC_GET = 0x26,      ///< Pop an index then a vector; push the item.
    VEC_LEN = 0x27,      ///< Pop a vector; push its length.

    // Arithmetic on u64 (0x30-0x3F)
    ADD = 0x30, ///< a + b, wrapping.
    SUB = 0x31, ///< a - b, wrapping.
    MUL = 0x32, ///< a * b, wrapping.
    DIV = 0x33, ///< a / b; MathError when b is zero.
    MOD = 0x34, ///< a % b; MathError when b is zero.
    EQ = 0x35,  ///< Push bool a == b.
    LT = 0x36,  ///< Push bool a < b.
    NOT = 0x37, ///< Pop a bool; push its negation.

    // Control flow (0x40-0x4F)
    GOTO = 0x40,          ///< Jump to @c label.
    BRANCH_IF_NOT = 0x41, ///< Pop a bool; jump to @c label when false.
    CALL = 0x42,          ///< Open a frame over @c size argument bytes; jump to @c label.
    RETURN = 0x43,        ///< Close the frame keeping @c size return bytes.

    // Error handling (0x50-0x5F)
    TRY_START = 0x50, ///< Push @c label on the catch stack.
    TRY_END = 0x51,   ///< Pop the catch stack.
    RAISE = 0x52,     ///< Fault with kind @c size.

    // Threads (0x60-0x6F)
    SPAWN = 0x60, ///< Create a thread starting at @c label (or idle when none).
    EXIT = 0x61,  ///< Complete the calling thread.
    CLOSE = 0x62, ///< Pop a Tid and retire it.
    WAIT = 0x63,  ///< Block until woken.
    WAKE = 0x64,  ///< Pop a Tid and wake it.
    SLEEP = 0x65, ///< Pop a tick count and sleep that long.
    JOIN = 0x66,  ///< Pop a Tid and block until it exits.

    // I/O (0x70-0x7F)
    PRINT = 0x70,     ///< Pop a @c size-byte number (1 = bool, 8 = u64) and print it.
    PRINT_STR = 0x71, ///< Pop a string object and print it.
    READ_LINE = 0x72, ///< Push the next input line as a string object.

    // Host (0x80-0x8F)
    EXTERN = 0x80, ///< Invoke host extern number @c size.
};

/// @brief One Casm instruction with its operands.
/// @details Operand meaning depends on the opcode; see CasmOpcode.
struct CasmInstr
{
    CasmOpcode op = CasmOpcode::NOP;
    uint64_t size = 0;         ///< Byte count, item size, fault kind or extern index.
    LabelId label = kNoLabel;  ///< Control-flow target.
    MemoryAddress address{};   ///< LOCATE operand.
    std::vector<uint8_t> data; ///< PUSH payload.
};

/// @brief Mnemonic for @p op.
const char *opcodeName(CasmOpcode op);

/// @brief Declared cost of @p instr.
/// @param instr Instruction to weigh.
/// @param stackSize Configured stack capacity; heap allocations larger than a
///        tenth of it are Extreme.
/// @note EXTERN reports Low here; the interpreter substitutes the weight the
///       host declared for the extern.
Weight weightOf(const CasmInstr &instr, std::size_t stackSize);

} // namespace ciphel::vm
