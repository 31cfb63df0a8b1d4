//===----------------------------------------------------------------------===//
//
// Part of the Ciphel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Scheduler.hpp
// Purpose: Cooperative scheduler stepping logical threads tick by tick and
//          applying the signals their instructions raise.
// Key invariants: At most maxThreads Tids are in use, counting threads retired
//                 during the current tick; Tids are released when the tick that
//                 retired them ends; threads spawned during a tick first run on
//                 the next one; wake-ups requested during a tick take effect
//                 at the start of the next one.
// Ownership/Lifetime: The Runtime owns the Scheduler, which owns every Thread
//                     and the scheduling policy.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "vm/Fault.hpp"
#include "vm/Interpreter.hpp"
#include "vm/Program.hpp"
#include "vm/Signal.hpp"
#include "vm/Thread.hpp"
#include "vm/Trace.hpp"
#include "vm/Weight.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <utility>
#include <vector>

namespace ciphel::vm
{

/// @brief Decides how much bytecode work one tick performs.
class SchedulingPolicy
{
  public:
    virtual ~SchedulingPolicy() = default;

    /// @brief A tick starts with @p runnable threads ready to run.
    virtual void beginTick(std::size_t runnable) = 0;

    /// @brief The @p slot-th runnable thread of this tick starts running.
    virtual void beginThread(std::size_t slot) = 0;

    /// @brief Whether an instruction of weight @p weight may run now.
    virtual bool accept(Weight weight) const = 0;

    /// @brief Charge @p weight for an executed instruction.
    virtual void consume(Weight weight) = 0;
};

/// @brief Runs each thread until it blocks, exits or idles.
class ToCompletionPolicy final : public SchedulingPolicy
{
  public:
    void beginTick(std::size_t) override {}

    void beginThread(std::size_t) override {}

    bool accept(Weight) const override
    {
        return true;
    }

    void consume(Weight) override {}
};

/// @brief Splits a per-tick budget evenly over the runnable threads.
/// @details Each thread gets at least one unit. The remainder of the division
///          is handed out one unit at a time, rotating across ticks.
///          ZERO-weight instructions are always accepted, and so is the first
///          weighted instruction of a turn, so an instruction heavier than the
///          share still runs once the thread gets a fresh turn.
class WeightedPolicy final : public SchedulingPolicy
{
  public:
    explicit WeightedPolicy(uint64_t budget) : budget_(budget) {}

    void beginTick(std::size_t runnable) override;
    void beginThread(std::size_t slot) override;
    bool accept(Weight weight) const override;
    void consume(Weight weight) override;

    uint64_t remaining() const
    {
        return remaining_;
    }

  private:
    uint64_t budget_;
    std::size_t runnable_ = 0;
    uint64_t share_ = 0;
    uint64_t extra_ = 0;
    uint64_t rotation_ = 0;
    uint64_t remaining_ = 0;
    bool fresh_ = false; ///< Nothing charged yet in the current turn.
};

/// @brief What one tick did.
struct TickReport
{
    uint64_t tick = 0;
    uint64_t weight = 0;       ///< Sum of the weights of executed instructions.
    uint64_t instructions = 0; ///< Executed instructions.
    std::vector<Tid> live;     ///< Threads alive after the tick, ascending.
};

/// @brief Where the last uncaught fault happened.
struct FaultReport
{
    Fault fault;
    Tid tid = 0;
    std::size_t cursor = 0;
};

class Scheduler
{
  public:
    /// @brief Status byte pushed after CLOSE, WAKE, JOIN and SPAWN.
    static constexpr uint8_t kSignalOk = 0;
    static constexpr uint8_t kSignalError = 1;

    Scheduler(std::size_t maxThreads,
              std::size_t stackSize,
              std::unique_ptr<SchedulingPolicy> policy,
              TraceSink &trace);

    /// @brief Create a thread running @p program from instruction @p entry.
    /// @return The new Tid, or TooManyThread when every Tid is in use.
    VmResult<Tid> spawn(std::shared_ptr<const Program> program, std::size_t entry = 0);

    /// @brief Run one scheduler pass.
    /// @return The tick report, or the fault that no catch label handled. The
    ///         faulting thread is retired before the fault is returned.
    VmResult<TickReport> tick(Machine &machine);

    /// @brief Replace the program of an idle thread.
    /// @return InvalidTID for a dead thread, UnsupportedOperation while the
    ///         thread still has instructions to run.
    VmResult<void> load(Tid tid, std::shared_ptr<const Program> program);

    void setPolicy(std::unique_ptr<SchedulingPolicy> policy);

    Thread *find(Tid tid);
    const Thread *find(Tid tid) const;

    bool isAlive(Tid tid) const;

    /// @brief Live Tids in ascending order.
    std::vector<Tid> liveTids() const;

    /// @brief True when some live thread could still make progress.
    /// @param inputAvailable Whether queued input would wake stdin waiters.
    bool hasPendingWork(bool inputAvailable = false) const;

    const std::vector<std::pair<Tid, Tid>> &joinWaitingList() const
    {
        return joinWaiting_;
    }

    const std::set<Tid> &wakingUp() const
    {
        return wakingUp_;
    }

    const std::vector<Tid> &stdinWaiters() const
    {
        return stdinWaiters_;
    }

    const std::optional<FaultReport> &lastFault() const
    {
        return lastFault_;
    }

    uint64_t ticks() const
    {
        return tick_;
    }

  private:
    VmResult<void> wakePhase(Machine &machine);
    VmResult<void> runThread(Thread &thread, Machine &machine, TickReport &report);
    VmResult<void> handleSignal(Thread &caller, const Signal &signal);
    VmResult<void> handleFault(Thread &thread, const Fault &fault);
    VmResult<void> pushStatus(Thread &caller, bool ok);
    VmResult<void> block(Thread &thread, ThreadState state, BlockReason reason);
    VmResult<void> retire(Thread &thread);
    void commit();

    std::size_t maxThreads_;
    std::size_t stackSize_;
    std::unique_ptr<SchedulingPolicy> policy_;
    TraceSink &trace_;

    std::map<Tid, std::unique_ptr<Thread>> threads_;
    std::vector<Tid> closed_;
    std::vector<std::pair<Tid, Tid>> joinWaiting_; ///< (waiter, target)
    std::set<Tid> wakingUp_;
    std::vector<Tid> stdinWaiters_;
    std::optional<FaultReport> lastFault_;
    uint64_t tick_ = 0;
};

} // namespace ciphel::vm
