//===----------------------------------------------------------------------===//
//
// Part of the Ciphel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Runtime.hpp
// Purpose: Own every piece of shared execution state and expose the host-side
//          operations used to drive programs tick by tick.
// Key invariants: The configuration is validated before any state is built;
//                 heap, globals and standard I/O are shared by all threads.
// Ownership/Lifetime: Runtime owns heap, globals, I/O queues, extern table,
//                     trace sink and scheduler; programs are shared with the
//                     threads that run them.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "vm/Address.hpp"
#include "vm/Config.hpp"
#include "vm/Extern.hpp"
#include "vm/Fault.hpp"
#include "vm/Heap.hpp"
#include "vm/Program.hpp"
#include "vm/Scheduler.hpp"
#include "vm/Stack.hpp"
#include "vm/StdIO.hpp"
#include "vm/Thread.hpp"
#include "vm/Trace.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace ciphel::vm
{

/// @brief Build the scheduling policy selected by @p kind.
std::unique_ptr<SchedulingPolicy> makePolicy(PolicyKind kind, uint64_t budget);

class Runtime
{
  public:
    /// @throws std::invalid_argument when @p config fails validation.
    explicit Runtime(RuntimeConfig config = {});

    Runtime(const Runtime &) = delete;
    Runtime &operator=(const Runtime &) = delete;

    /// @brief Create a host-owned thread starting at the first instruction of
    ///        @p program.
    VmResult<Tid> spawnRoot(std::shared_ptr<const Program> program);

    /// @brief Hand more code to an idle thread.
    VmResult<void> load(Tid tid, std::shared_ptr<const Program> program);

    /// @brief Run one scheduler pass.
    VmResult<TickReport> tick();

    /// @brief Tick until no thread can make progress or @p maxTicks ticks ran.
    /// @return Number of ticks executed, or the first uncaught fault.
    VmResult<uint64_t> runUntilIdle(uint64_t maxTicks);

    void pushInput(std::string line)
    {
        stdio_.pushInput(std::move(line));
    }

    std::string takeOutput()
    {
        return stdio_.takeOutput();
    }

    /// @brief State of thread @p tid; empty once its Tid was released.
    std::optional<ThreadState> state(Tid tid) const;

    /// @brief True when another tick could make progress.
    bool hasPendingWork() const
    {
        return scheduler_.hasPendingWork(stdio_.hasInput());
    }

    bool isAlive(Tid tid) const
    {
        return scheduler_.isAlive(tid);
    }

    /// @brief Register a host extern; the result is its EXTERN operand.
    std::size_t registerExtern(ExternDesc desc)
    {
        return externs_.add(std::move(desc));
    }

    void setPolicy(PolicyKind kind);

    /// @brief Host-facing rendering of the last uncaught fault, if any.
    std::optional<std::string> lastFaultMessage() const;

    const RuntimeConfig &config() const
    {
        return config_;
    }

    const AddressSpace &space() const
    {
        return space_;
    }

    Heap &heap()
    {
        return heap_;
    }

    Globals &globals()
    {
        return globals_;
    }

    Scheduler &scheduler()
    {
        return scheduler_;
    }

    const Scheduler &scheduler() const
    {
        return scheduler_;
    }

  private:
    Machine machine();

    RuntimeConfig config_;
    AddressSpace space_;
    Heap heap_;
    Globals globals_;
    StdIO stdio_;
    ExternTable externs_;
    TraceSink trace_;
    Scheduler scheduler_;
};

} // namespace ciphel::vm
