//===----------------------------------------------------------------------===//
//
// Part of the Ciphel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Thread.cpp
// Purpose: Thread state machine and thread construction.
//
//===----------------------------------------------------------------------===//

#include "vm/Thread.hpp"

#include <utility>

namespace ciphel::vm
{

VmResult<void> ThreadState::transition(ThreadState next)
{
    bool allowed = false;
    switch (kind_)
    {
        case Kind::Running:
            allowed = true;
            break;
        case Kind::Waiting:
            allowed = next.kind_ == Kind::Running || next.kind_ == Kind::Completed;
            break;
        case Kind::Sleeping:
            allowed = next.kind_ != Kind::Waiting;
            break;
        case Kind::Completed:
            allowed = false;
            break;
    }
    if (!allowed)
        return fault(FaultKind::InvalidThreadStateTransition, static_cast<int64_t>(next.kind_));
    *this = next;
    return {};
}

const char *toString(ThreadState::Kind kind)
{
    switch (kind)
    {
        case ThreadState::Kind::Running:
            return "RUNNING";
        case ThreadState::Kind::Waiting:
            return "WAITING";
        case ThreadState::Kind::Sleeping:
            return "SLEEPING";
        case ThreadState::Kind::Completed:
            return "COMPLETED";
    }
    return "?";
}

Thread::Thread(Tid tid,
               std::size_t stackSize,
               std::shared_ptr<const Program> program,
               std::size_t entry)
    : tid_(tid), stack_(stackSize), program_(std::move(program))
{
    if (!program_)
        program_ = std::make_shared<const Program>();
    cursor_.jump(entry);
    cursor_.update(*program_);
}

void Thread::load(std::shared_ptr<const Program> program)
{
    program_ = program ? std::move(program) : std::make_shared<const Program>();
    cursor_.jump(0);
    cursor_.update(*program_);
}

VmResult<void> Thread::resume()
{
    auto changed = state_.transition(ThreadState::running());
    if (!changed)
        return changed;
    if (blockReason_ == BlockReason::Signal)
        cursor_.next();
    blockReason_ = BlockReason::None;
    cursor_.update(*program_);
    return {};
}

} // namespace ciphel::vm
