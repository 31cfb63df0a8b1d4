//===----------------------------------------------------------------------===//
//
// Part of the Ciphel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Thread.hpp
// Purpose: Logical thread: stack, program, cursor, catch stack and state.
// Key invariants: State changes go through ThreadState::transition, which
//                 rejects leaving COMPLETED and moving between WAITING and
//                 SLEEPING directly.
// Ownership/Lifetime: Owned by the Scheduler thread table; shares its Program.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "vm/CatchStack.hpp"
#include "vm/Fault.hpp"
#include "vm/Program.hpp"
#include "vm/Signal.hpp"
#include "vm/Stack.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>

namespace ciphel::vm
{

/// @brief Scheduling state of a thread.
class ThreadState
{
  public:
    enum class Kind : uint8_t
    {
        Running,
        Waiting,
        Sleeping,
        Completed,
    };

    static ThreadState running()
    {
        return ThreadState(Kind::Running, 0);
    }

    static ThreadState waiting()
    {
        return ThreadState(Kind::Waiting, 0);
    }

    static ThreadState sleeping(uint64_t ticks)
    {
        return ThreadState(Kind::Sleeping, ticks);
    }

    static ThreadState completed()
    {
        return ThreadState(Kind::Completed, 0);
    }

    Kind kind() const
    {
        return kind_;
    }

    /// @brief Ticks left before a sleeping thread runs again.
    uint64_t ticksRemaining() const
    {
        return ticks_;
    }

    /// @brief Move to @p next.
    /// @return InvalidThreadStateTransition for an illegal change.
    VmResult<void> transition(ThreadState next);

    bool operator==(const ThreadState &) const = default;

  private:
    ThreadState(Kind kind, uint64_t ticks) : kind_(kind), ticks_(ticks) {}

    Kind kind_;
    uint64_t ticks_;
};

const char *toString(ThreadState::Kind kind);

/// @brief Position of a thread in its program.
class ProgramCursor
{
  public:
    /// @brief Instruction about to execute.
    std::size_t position() const
    {
        return position_;
    }

    /// @brief True once the position lies past the last instruction.
    bool idle() const
    {
        return idle_;
    }

    void next()
    {
        ++position_;
        idle_ = false;
    }

    void jump(std::size_t to)
    {
        position_ = to;
        idle_ = false;
    }

    /// @brief Refresh the idle flag against @p program.
    void update(const Program &program)
    {
        idle_ = position_ >= program.size();
    }

  private:
    std::size_t position_ = 0;
    bool idle_ = false;
};

/// @brief Why a blocked thread is blocked, which decides how it resumes.
enum class BlockReason : uint8_t
{
    None,
    Signal, ///< WAIT, SLEEP or JOIN; resuming completes the instruction.
    Stdin,  ///< Input request; resuming retries the instruction.
};

class Thread
{
  public:
    Thread(Tid tid, std::size_t stackSize, std::shared_ptr<const Program> program, std::size_t entry);

    Tid tid() const
    {
        return tid_;
    }

    Stack &stack()
    {
        return stack_;
    }

    const Stack &stack() const
    {
        return stack_;
    }

    const Program &program() const
    {
        return *program_;
    }

    const std::shared_ptr<const Program> &sharedProgram() const
    {
        return program_;
    }

    /// @brief Replace the program; the cursor restarts at 0.
    void load(std::shared_ptr<const Program> program);

    ProgramCursor &cursor()
    {
        return cursor_;
    }

    const ProgramCursor &cursor() const
    {
        return cursor_;
    }

    CatchStack &catches()
    {
        return catches_;
    }

    const ThreadState &state() const
    {
        return state_;
    }

    VmResult<void> setState(ThreadState next)
    {
        return state_.transition(next);
    }

    BlockReason blockReason() const
    {
        return blockReason_;
    }

    void setBlockReason(BlockReason reason)
    {
        blockReason_ = reason;
    }

    /// @brief Live threads are every thread not yet completed.
    bool alive() const
    {
        return state_.kind() != ThreadState::Kind::Completed;
    }

    /// @brief True when the thread has an instruction to run this tick.
    bool runnable() const
    {
        return state_.kind() == ThreadState::Kind::Running && !cursor_.idle();
    }

    /// @brief Bring a blocked thread back to RUNNING.
    /// @details A thread blocked by a scheduling signal moves past the raising
    ///          instruction; one blocked on input retries it.
    VmResult<void> resume();

  private:
    Tid tid_;
    Stack stack_;
    std::shared_ptr<const Program> program_;
    ProgramCursor cursor_;
    CatchStack catches_;
    ThreadState state_ = ThreadState::running();
    BlockReason blockReason_ = BlockReason::None;
};

} // namespace ciphel::vm
