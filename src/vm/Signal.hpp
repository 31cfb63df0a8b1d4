//===----------------------------------------------------------------------===//
//
// Part of the Ciphel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Signal.hpp
// Purpose: Scheduling signals and the per-instruction execution status.
// Key invariants: Signals travel only through ExecStatus::Kind::Signal and are
//                 never represented as a Fault, so catch labels cannot
//                 intercept them.
// Ownership/Lifetime: Value types.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "vm/Casm.hpp"
#include "vm/Fault.hpp"

#include <cstdint>

namespace ciphel::vm
{

/// @brief Thread identifier; 0 never names a thread.
using Tid = uint64_t;

enum class SignalKind : uint8_t
{
    Spawn,
    Exit,
    Close,
    Wait,
    Wake,
    Sleep,
    Join,
    WaitStdin,
};

const char *toString(SignalKind kind);

/// @brief Scheduling request raised by an instruction.
struct Signal
{
    SignalKind kind = SignalKind::Wait;
    Tid target = 0;           ///< Close, Wake and Join operand.
    uint64_t ticks = 0;       ///< Sleep duration in scheduler ticks.
    LabelId entry = kNoLabel; ///< Spawn entry label.
};

/// @brief Outcome of executing one instruction.
class ExecStatus
{
  public:
    enum class Kind : uint8_t
    {
        Continue, ///< Instruction completed; the cursor is already updated.
        Signal,   ///< The scheduler must act; the cursor is left on the instruction.
        Fault,    ///< The instruction failed; catch labels decide what happens.
    };

    static ExecStatus proceed()
    {
        return ExecStatus(Kind::Continue);
    }

    static ExecStatus raise(Signal signal)
    {
        ExecStatus status(Kind::Signal);
        status.signal_ = signal;
        return status;
    }

    static ExecStatus failed(Fault fault)
    {
        ExecStatus status(Kind::Fault);
        status.fault_ = fault;
        return status;
    }

    Kind kind() const
    {
        return kind_;
    }

    /// @pre kind() == Kind::Signal
    const Signal &signal() const
    {
        return signal_;
    }

    /// @pre kind() == Kind::Fault
    const Fault &fault() const
    {
        return fault_;
    }

  private:
    explicit ExecStatus(Kind kind) : kind_(kind) {}

    Kind kind_;
    Signal signal_{};
    Fault fault_{};
};

} // namespace ciphel::vm
