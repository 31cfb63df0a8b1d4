//===----------------------------------------------------------------------===//
//
// Part of the Ciphel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Scheduler.cpp
// Purpose: Implement tick processing, signal handling, fault recovery and the
//          bundled scheduling policies.
// Key invariants: See Scheduler.hpp.
// Ownership/Lifetime: Threads are destroyed only by commit() at tick end.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Cooperative scheduler.
/// @details A tick runs in three phases:
///          1. wake: threads named by WAKE or by the exit of a joined thread
///             resume, stdin waiters resume when input is queued, and sleeping
///             threads count down;
///          2. run: every thread that was runnable when the phase started
///             executes instructions in Tid order until it blocks, idles or
///             the policy defers its next instruction;
///          3. commit: threads retired during the tick are destroyed and
///             their Tids become available again.

#include "vm/Scheduler.hpp"

#include <algorithm>
#include <string>

namespace ciphel::vm
{

const char *toString(SignalKind kind)
{
    switch (kind)
    {
        case SignalKind::Spawn:
            return "SPAWN";
        case SignalKind::Exit:
            return "EXIT";
        case SignalKind::Close:
            return "CLOSE";
        case SignalKind::Wait:
            return "WAIT";
        case SignalKind::Wake:
            return "WAKE";
        case SignalKind::Sleep:
            return "SLEEP";
        case SignalKind::Join:
            return "JOIN";
        case SignalKind::WaitStdin:
            return "WAIT_STDIN";
    }
    return "?";
}

//===----------------------------------------------------------------------===//
// WeightedPolicy
//===----------------------------------------------------------------------===//

void WeightedPolicy::beginTick(std::size_t runnable)
{
    runnable_ = runnable;
    if (runnable == 0)
    {
        share_ = 0;
        extra_ = 0;
    }
    else if (budget_ < runnable)
    {
        share_ = 1;
        extra_ = 0;
    }
    else
    {
        share_ = budget_ / runnable;
        extra_ = budget_ % runnable;
    }
    ++rotation_;
    remaining_ = 0;
    fresh_ = false;
}

void WeightedPolicy::beginThread(std::size_t slot)
{
    fresh_ = false;
    if (runnable_ == 0)
    {
        remaining_ = 0;
        return;
    }
    const uint64_t position = (slot + rotation_) % runnable_;
    remaining_ = share_ + (position < extra_ ? 1 : 0);
    fresh_ = true;
}

bool WeightedPolicy::accept(Weight weight) const
{
    return weight.isZero() || fresh_ || weight.units() <= remaining_;
}

void WeightedPolicy::consume(Weight weight)
{
    if (weight.isZero())
        return;
    fresh_ = false;
    remaining_ -= std::min(weight.units(), remaining_);
}

//===----------------------------------------------------------------------===//
// Scheduler
//===----------------------------------------------------------------------===//

Scheduler::Scheduler(std::size_t maxThreads,
                     std::size_t stackSize,
                     std::unique_ptr<SchedulingPolicy> policy,
                     TraceSink &trace)
    : maxThreads_(maxThreads), stackSize_(stackSize), policy_(std::move(policy)), trace_(trace)
{
    if (!policy_)
        policy_ = std::make_unique<ToCompletionPolicy>();
}

void Scheduler::setPolicy(std::unique_ptr<SchedulingPolicy> policy)
{
    policy_ = policy ? std::move(policy) : std::make_unique<ToCompletionPolicy>();
}

Thread *Scheduler::find(Tid tid)
{
    auto it = threads_.find(tid);
    return it == threads_.end() ? nullptr : it->second.get();
}

const Thread *Scheduler::find(Tid tid) const
{
    auto it = threads_.find(tid);
    return it == threads_.end() ? nullptr : it->second.get();
}

bool Scheduler::isAlive(Tid tid) const
{
    const Thread *thread = find(tid);
    return thread && thread->alive();
}

std::vector<Tid> Scheduler::liveTids() const
{
    std::vector<Tid> out;
    for (const auto &[tid, thread] : threads_)
    {
        if (thread->alive())
            out.push_back(tid);
    }
    return out;
}

bool Scheduler::hasPendingWork(bool inputAvailable) const
{
    if (inputAvailable && !stdinWaiters_.empty())
        return true;
    for (const auto &[tid, thread] : threads_)
    {
        if (!thread->alive())
            continue;
        if (thread->runnable() || thread->state().kind() == ThreadState::Kind::Sleeping ||
            wakingUp_.count(tid) != 0)
            return true;
    }
    return false;
}

VmResult<Tid> Scheduler::spawn(std::shared_ptr<const Program> program, std::size_t entry)
{
    if (threads_.size() >= maxThreads_)
        return fault(FaultKind::TooManyThread, static_cast<int64_t>(maxThreads_));

    Tid tid = 1;
    while (threads_.count(tid) != 0)
        ++tid;
    threads_.emplace(tid, std::make_unique<Thread>(tid, stackSize_, std::move(program), entry));
    return tid;
}

VmResult<void> Scheduler::load(Tid tid, std::shared_ptr<const Program> program)
{
    Thread *thread = find(tid);
    if (!thread || !thread->alive())
        return fault(FaultKind::InvalidTID, static_cast<int64_t>(tid));
    if (!thread->cursor().idle())
        return fault(FaultKind::UnsupportedOperation, static_cast<int64_t>(tid));
    thread->load(std::move(program));
    return {};
}

VmResult<void> Scheduler::pushStatus(Thread &caller, bool ok)
{
    const uint8_t status = ok ? kSignalOk : kSignalError;
    return caller.stack().pushBytes(std::span<const uint8_t>(&status, 1));
}

VmResult<void> Scheduler::block(Thread &thread, ThreadState state, BlockReason reason)
{
    auto changed = thread.setState(state);
    if (!changed)
        return changed;
    thread.setBlockReason(reason);
    return {};
}

VmResult<void> Scheduler::retire(Thread &thread)
{
    if (!thread.alive())
        return {};
    auto changed = thread.setState(ThreadState::completed());
    if (!changed)
        return changed;

    const Tid tid = thread.tid();
    closed_.push_back(tid);
    wakingUp_.erase(tid);
    stdinWaiters_.erase(std::remove(stdinWaiters_.begin(), stdinWaiters_.end(), tid),
                        stdinWaiters_.end());

    // Joiners of the retired thread wake on the next tick.
    std::vector<std::pair<Tid, Tid>> kept;
    for (const auto &entry : joinWaiting_)
    {
        if (entry.second == tid)
            wakingUp_.insert(entry.first);
        else if (entry.first != tid)
            kept.push_back(entry);
    }
    joinWaiting_.swap(kept);
    return {};
}

void Scheduler::commit()
{
    for (Tid tid : closed_)
        threads_.erase(tid);
    closed_.clear();
}

VmResult<void> Scheduler::wakePhase(Machine &machine)
{
    std::set<Tid> waking;
    waking.swap(wakingUp_);
    for (Tid tid : waking)
    {
        Thread *thread = find(tid);
        if (!thread || !thread->alive() || thread->state().kind() == ThreadState::Kind::Running)
            continue;
        auto resumed = thread->resume();
        if (!resumed)
            return resumed;
        joinWaiting_.erase(std::remove_if(joinWaiting_.begin(),
                                          joinWaiting_.end(),
                                          [tid](const auto &entry) { return entry.first == tid; }),
                           joinWaiting_.end());
        stdinWaiters_.erase(std::remove(stdinWaiters_.begin(), stdinWaiters_.end(), tid),
                            stdinWaiters_.end());
        trace_.onEvent(tid, "woken");
    }

    if (machine.stdio.hasInput() && !stdinWaiters_.empty())
    {
        std::vector<Tid> readers;
        readers.swap(stdinWaiters_);
        for (Tid tid : readers)
        {
            Thread *thread = find(tid);
            if (!thread || !thread->alive())
                continue;
            auto resumed = thread->resume();
            if (!resumed)
                return resumed;
            trace_.onEvent(tid, "input ready");
        }
    }

    for (auto &[tid, thread] : threads_)
    {
        if (thread->state().kind() != ThreadState::Kind::Sleeping)
            continue;
        const uint64_t left = thread->state().ticksRemaining();
        auto changed = left == 0 ? thread->resume() : thread->setState(ThreadState::sleeping(left - 1));
        if (!changed)
            return changed;
        if (left == 0)
            trace_.onEvent(tid, "awake");
    }
    return {};
}

VmResult<void> Scheduler::handleSignal(Thread &caller, const Signal &signal)
{
    const Tid self = caller.tid();
    switch (signal.kind)
    {
        case SignalKind::Spawn:
        {
            std::shared_ptr<const Program> program;
            std::size_t entry = 0;
            if (signal.entry != kNoLabel)
            {
                auto start = caller.program().cursorOf(signal.entry);
                if (!start)
                    return start.failure();
                program = caller.sharedProgram();
                entry = start.value();
            }
            auto child = spawn(std::move(program), entry);
            const Tid tid = child ? child.value() : 0;
            auto pushed = caller.stack().pushU64(tid);
            if (!pushed)
                return pushed;
            pushed = pushStatus(caller, child.isOk());
            if (!pushed)
                return pushed;
            trace_.onEvent(self, child ? "spawn -> " + std::to_string(tid) : std::string("spawn failed: TooManyThread"));
            caller.cursor().next();
            caller.cursor().update(caller.program());
            return {};
        }
        case SignalKind::Exit:
            trace_.onEvent(self, "exit");
            return retire(caller);
        case SignalKind::Close:
        {
            const bool valid = signal.target != self && isAlive(signal.target);
            if (valid)
            {
                auto retired = retire(*find(signal.target));
                if (!retired)
                    return retired;
            }
            auto pushed = pushStatus(caller, valid);
            if (!pushed)
                return pushed;
            trace_.onEvent(self,
                           (valid ? "close " : "close failed: InvalidTID ") + std::to_string(signal.target));
            caller.cursor().next();
            caller.cursor().update(caller.program());
            return {};
        }
        case SignalKind::Wait:
            trace_.onEvent(self, "wait");
            return block(caller, ThreadState::waiting(), BlockReason::Signal);
        case SignalKind::Wake:
        {
            const bool valid = isAlive(signal.target);
            if (valid)
                wakingUp_.insert(signal.target);
            auto pushed = pushStatus(caller, valid);
            if (!pushed)
                return pushed;
            trace_.onEvent(self, (valid ? "wake " : "wake failed: InvalidTID ") + std::to_string(signal.target));
            caller.cursor().next();
            caller.cursor().update(caller.program());
            return {};
        }
        case SignalKind::Sleep:
            trace_.onEvent(self, "sleep " + std::to_string(signal.ticks));
            return block(caller, ThreadState::sleeping(signal.ticks), BlockReason::Signal);
        case SignalKind::Join:
        {
            const bool valid = signal.target != self && isAlive(signal.target);
            auto pushed = pushStatus(caller, valid);
            if (!pushed)
                return pushed;
            if (!valid)
            {
                trace_.onEvent(self, "join failed: InvalidTID " + std::to_string(signal.target));
                caller.cursor().next();
                caller.cursor().update(caller.program());
                return {};
            }
            joinWaiting_.emplace_back(self, signal.target);
            trace_.onEvent(self, "join " + std::to_string(signal.target));
            return block(caller, ThreadState::waiting(), BlockReason::Signal);
        }
        case SignalKind::WaitStdin:
            stdinWaiters_.push_back(self);
            trace_.onEvent(self, "wait stdin");
            return block(caller, ThreadState::waiting(), BlockReason::Stdin);
    }
    return fault(FaultKind::UnsupportedOperation, static_cast<int64_t>(signal.kind));
}

VmResult<void> Scheduler::handleFault(Thread &thread, const Fault &failure)
{
    const std::size_t at = thread.cursor().position();
    auto target = thread.catches().resolve(failure, thread.program());
    if (target)
    {
        trace_.onEvent(thread.tid(), std::string("caught ") + std::string(toString(failure.kind)));
        thread.cursor().jump(target.value());
        thread.cursor().update(thread.program());
        return {};
    }

    const Fault fatal = target.error();
    lastFault_ = FaultReport{fatal, thread.tid(), at};
    trace_.onEvent(thread.tid(), formatFault(fatal, thread.tid(), at));
    auto retired = retire(thread);
    if (!retired)
        return retired;
    return support::fail(fatal);
}

VmResult<void> Scheduler::runThread(Thread &thread, Machine &machine, TickReport &report)
{
    while (thread.runnable())
    {
        const std::size_t position = thread.cursor().position();
        const CasmInstr *instr = thread.program().at(position);
        if (!instr)
            return handleFault(thread, Fault{FaultKind::CodeSegmentation, static_cast<int64_t>(position)});

        const Weight weight = instructionWeight(*instr, machine);
        if (!policy_->accept(weight))
            break;

        trace_.onStep(thread.tid(), position, thread.program());
        const ExecStatus status = execute(*instr, thread, machine);
        policy_->consume(weight);
        report.weight += weight.units();
        ++report.instructions;

        switch (status.kind())
        {
            case ExecStatus::Kind::Continue:
                thread.cursor().update(thread.program());
                break;
            case ExecStatus::Kind::Signal:
            {
                auto handled = handleSignal(thread, status.signal());
                if (!handled)
                {
                    auto recovered = handleFault(thread, handled.error());
                    if (!recovered)
                        return recovered;
                }
                break;
            }
            case ExecStatus::Kind::Fault:
            {
                auto recovered = handleFault(thread, status.fault());
                if (!recovered)
                    return recovered;
                break;
            }
        }
    }
    return {};
}

VmResult<TickReport> Scheduler::tick(Machine &machine)
{
    TickReport report;
    report.tick = ++tick_;
    trace_.onTick(tick_, "begin");

    auto woken = wakePhase(machine);
    if (!woken)
        return woken.failure();

    std::vector<Tid> order;
    for (const auto &[tid, thread] : threads_)
    {
        if (thread->runnable())
            order.push_back(tid);
    }

    policy_->beginTick(order.size());
    std::size_t slot = 0;
    for (Tid tid : order)
    {
        Thread *thread = find(tid);
        if (!thread || !thread->runnable())
            continue;
        policy_->beginThread(slot++);
        auto ran = runThread(*thread, machine, report);
        if (!ran)
        {
            commit();
            return ran.failure();
        }
    }

    commit();
    report.live = liveTids();
    trace_.onTick(tick_, "end");
    return report;
}

} // namespace ciphel::vm
