//===----------------------------------------------------------------------===//
//
// Part of the Ciphel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Fault.hpp
// Purpose: Classify runtime faults raised by the allocator, the stack, address
//          decoding, the scheduler and instruction execution.
// Key invariants: Enum values are stable; bytecode raises faults by numeric
//                 kind through the Raise instruction.
// Ownership/Lifetime: Value types only.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/result.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace ciphel::vm
{

/// @brief Categorises true runtime failures.
/// @details Scheduling signals are not faults and never appear here.
enum class FaultKind : int32_t
{
    AllocationError = 0,               ///< No free block large enough.
    FreeError = 1,                     ///< Block already free (double free).
    InvalidPointer = 2,                ///< Malformed, misaligned or out-of-range block.
    ReadError = 3,                     ///< Heap or global read outside its range.
    WriteError = 4,                    ///< Heap or global write outside its range.
    StackOverflow = 5,                 ///< Push beyond the stack capacity.
    StackUnderflow = 6,                ///< Pop below the stack base.
    StackReadError = 7,                ///< Stack read at or beyond top.
    StackWriteError = 8,               ///< Stack write at or beyond top.
    MemoryViolation = 9,               ///< Flat address outside every zone.
    InvalidTID = 10,                   ///< Tid does not name a live thread.
    TooManyThread = 11,                ///< Thread pool exhausted.
    InvalidThreadStateTransition = 12, ///< Illegal thread state change.
    CodeSegmentation = 13,             ///< Cursor or label outside the program.
    MathError = 14,                    ///< Division or remainder by zero.
    Deserialization = 15,              ///< Operand bytes of an unexpected width.
    IndexOutOfBound = 16,              ///< Heap vector index past its length.
    UnsupportedOperation = 17,         ///< Missing extern or unusable instruction.
};

/// @brief Structured fault record.
struct Fault
{
    FaultKind kind = FaultKind::UnsupportedOperation; ///< Fault classification.
    int64_t code = 0;                                 ///< Secondary payload, e.g. the offending Tid.

    bool operator==(const Fault &) const = default;
};

/// @brief Result alias used throughout the runtime.
template <typename T> using VmResult = support::Result<T, Fault>;

/// @brief Build a failure carrier for @p kind.
inline support::Failure<Fault> fault(FaultKind kind, int64_t code = 0)
{
    return support::Failure<Fault>{Fault{kind, code}};
}

/// @brief Convert fault kind to canonical diagnostic string.
constexpr std::string_view toString(FaultKind kind) noexcept
{
    switch (kind)
    {
        case FaultKind::AllocationError:
            return "AllocationError";
        case FaultKind::FreeError:
            return "FreeError";
        case FaultKind::InvalidPointer:
            return "InvalidPointer";
        case FaultKind::ReadError:
            return "ReadError";
        case FaultKind::WriteError:
            return "WriteError";
        case FaultKind::StackOverflow:
            return "StackOverflow";
        case FaultKind::StackUnderflow:
            return "StackUnderflow";
        case FaultKind::StackReadError:
            return "StackReadError";
        case FaultKind::StackWriteError:
            return "StackWriteError";
        case FaultKind::MemoryViolation:
            return "MemoryViolation";
        case FaultKind::InvalidTID:
            return "InvalidTID";
        case FaultKind::TooManyThread:
            return "TooManyThread";
        case FaultKind::InvalidThreadStateTransition:
            return "InvalidThreadStateTransition";
        case FaultKind::CodeSegmentation:
            return "CodeSegmentation";
        case FaultKind::MathError:
            return "MathError";
        case FaultKind::Deserialization:
            return "Deserialization";
        case FaultKind::IndexOutOfBound:
            return "IndexOutOfBound";
        case FaultKind::UnsupportedOperation:
            return "UnsupportedOperation";
    }
    return "UnsupportedOperation";
}

/// @brief Translate an integer payload into a FaultKind value.
/// @return Enumerated kind, or UnsupportedOperation for unknown values.
constexpr FaultKind faultKindFromValue(int64_t value) noexcept
{
    if (value < 0 || value > static_cast<int64_t>(FaultKind::UnsupportedOperation))
        return FaultKind::UnsupportedOperation;
    return static_cast<FaultKind>(value);
}

/// @brief Render a fault for the host.
/// @details Format: "fault <Kind> (code=C) in thread T at #I".
std::string formatFault(const Fault &fault, uint64_t tid, std::size_t cursor);

} // namespace ciphel::vm
