//===----------------------------------------------------------------------===//
//
// Part of the Ciphel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Runtime.cpp
// Purpose: Construct the shared execution state from a validated configuration
//          and forward host requests to the scheduler.
// Key invariants: See Runtime.hpp.
// Ownership/Lifetime: See Runtime.hpp.
//
//===----------------------------------------------------------------------===//

#include "vm/Runtime.hpp"

#include <utility>

namespace ciphel::vm
{

namespace
{

/// @brief Validate @p config and pass it through so member initialisers can
///        rely on consistent sizes.
RuntimeConfig validated(RuntimeConfig config)
{
    config.validate();
    return config;
}

} // namespace

std::unique_ptr<SchedulingPolicy> makePolicy(PolicyKind kind, uint64_t budget)
{
    switch (kind)
    {
        case PolicyKind::ToCompletion:
            return std::make_unique<ToCompletionPolicy>();
        case PolicyKind::Weighted:
            return std::make_unique<WeightedPolicy>(budget);
    }
    return std::make_unique<ToCompletionPolicy>();
}

Runtime::Runtime(RuntimeConfig config)
    : config_(validated(std::move(config))),
      space_(config_.globalSize, config_.stackSize, config_.heapSize),
      heap_(config_.heapSize, kAlignment),
      globals_(config_.globalSize),
      trace_(config_.trace),
      scheduler_(config_.maxThreadCount,
                 config_.stackSize,
                 makePolicy(config_.policy, config_.tickBudget),
                 trace_)
{
}

Machine Runtime::machine()
{
    return Machine{heap_, globals_, space_, stdio_, externs_, config_.stackSize};
}

VmResult<Tid> Runtime::spawnRoot(std::shared_ptr<const Program> program)
{
    auto tid = scheduler_.spawn(std::move(program));
    if (tid)
        trace_.onEvent(tid.value(), "spawned by host");
    return tid;
}

VmResult<void> Runtime::load(Tid tid, std::shared_ptr<const Program> program)
{
    return scheduler_.load(tid, std::move(program));
}

VmResult<TickReport> Runtime::tick()
{
    Machine m = machine();
    return scheduler_.tick(m);
}

VmResult<uint64_t> Runtime::runUntilIdle(uint64_t maxTicks)
{
    uint64_t ran = 0;
    while (ran < maxTicks && hasPendingWork())
    {
        auto report = tick();
        ++ran;
        if (!report)
            return report.failure();
    }
    return ran;
}

std::optional<ThreadState> Runtime::state(Tid tid) const
{
    const Thread *thread = scheduler_.find(tid);
    if (!thread)
        return std::nullopt;
    return thread->state();
}

void Runtime::setPolicy(PolicyKind kind)
{
    config_.policy = kind;
    scheduler_.setPolicy(makePolicy(kind, config_.tickBudget));
}

std::optional<std::string> Runtime::lastFaultMessage() const
{
    const auto &last = scheduler_.lastFault();
    if (!last)
        return std::nullopt;
    return formatFault(last->fault, last->tid, last->cursor);
}

} // namespace ciphel::vm
