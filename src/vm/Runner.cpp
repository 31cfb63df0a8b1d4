//===----------------------------------------------------------------------===//
//
// Part of the Ciphel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Runner.cpp
// Purpose: Implement the public runner facade backed by the runtime.
// Key invariants: Runner forwards to the runtime and only derives the status
//                 it reports from scheduler state.
// Ownership/Lifetime: Runner owns its Runtime through the pimpl.
//
//===----------------------------------------------------------------------===//

#include "ciphel/vm/Runner.hpp"

#include "vm/Program.hpp"
#include "vm/Runtime.hpp"

#include <stdexcept>
#include <utility>

namespace ciphel::vm
{

/// @brief Private implementation that owns the runtime.
/// @details Keeps the heavy scheduler headers out of the public header.
class Runner::Impl
{
  public:
    Impl(std::shared_ptr<const Program> program, RuntimeConfig config) : runtime(std::move(config))
    {
        auto root = runtime.spawnRoot(std::move(program));
        if (!root)
            throw std::invalid_argument("cannot spawn root thread: " +
                                        std::string(toString(root.error().kind)));
    }

    RunStatus step()
    {
        auto report = runtime.tick();
        if (!report)
            return RunStatus::Faulted;
        return status();
    }

    RunStatus status() const
    {
        if (runtime.hasPendingWork())
            return RunStatus::Running;
        const Scheduler &scheduler = runtime.scheduler();
        for (Tid tid : scheduler.liveTids())
        {
            const Thread *thread = scheduler.find(tid);
            if (thread && thread->state().kind() == ThreadState::Kind::Waiting)
                return RunStatus::Blocked;
        }
        return RunStatus::Idle;
    }

    Runtime runtime;
};

Runner::Runner(std::shared_ptr<const Program> program, RuntimeConfig config)
    : impl(std::make_unique<Impl>(std::move(program), std::move(config)))
{
}

Runner::~Runner() = default;

Runner::Runner(Runner &&) noexcept = default;

Runner &Runner::operator=(Runner &&) noexcept = default;

Runner::RunStatus Runner::step()
{
    return impl->step();
}

Runner::RunStatus Runner::run(uint64_t maxTicks)
{
    RunStatus status = impl->status();
    uint64_t ran = 0;
    while (status == RunStatus::Running && (maxTicks == 0 || ran < maxTicks))
    {
        status = impl->step();
        ++ran;
    }
    return status;
}

void Runner::pushInput(std::string line)
{
    impl->runtime.pushInput(std::move(line));
}

std::string Runner::takeOutput()
{
    return impl->runtime.takeOutput();
}

uint64_t Runner::ticks() const
{
    return impl->runtime.scheduler().ticks();
}

std::optional<std::string> Runner::lastFaultMessage() const
{
    return impl->runtime.lastFaultMessage();
}

Runtime &Runner::runtime()
{
    return impl->runtime;
}

} // namespace ciphel::vm
