//===----------------------------------------------------------------------===//
//
// Part of the Ciphel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tests/vm/SchedulerTests.cpp
// Purpose: Tick phases, thread signals, Tid allocation and the weighted
//          scheduling policy.
//
//===----------------------------------------------------------------------===//

#include "vm/ProgramBuilder.hpp"
#include "vm/Runtime.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

using namespace ciphel::vm;

namespace
{

RuntimeConfig sequential()
{
    RuntimeConfig config;
    config.policy = PolicyKind::ToCompletion;
    return config;
}

RuntimeConfig weighted(uint64_t budget)
{
    RuntimeConfig config;
    config.policy = PolicyKind::Weighted;
    config.tickBudget = budget;
    return config;
}

/// @brief Run one tick and fail the test when it reports a fault.
TickReport tickOk(Runtime &rt)
{
    auto report = rt.tick();
    EXPECT_TRUE(report.isOk()) << rt.lastFaultMessage().value_or("");
    return report ? report.value() : TickReport{};
}

ThreadState::Kind kindOf(const Runtime &rt, Tid tid)
{
    auto state = rt.state(tid);
    EXPECT_TRUE(state.has_value()) << "tid " << tid;
    return state ? state->kind() : ThreadState::Kind::Completed;
}

} // namespace

//===----------------------------------------------------------------------===//
// Thread table
//===----------------------------------------------------------------------===//

TEST(Scheduler, SpawnBeyondLimitIsTooManyThread)
{
    Runtime rt(sequential());
    for (Tid expected = 1; expected <= kMaxThreadCount; ++expected)
    {
        auto tid = rt.spawnRoot(nullptr);
        ASSERT_TRUE(tid.isOk());
        EXPECT_EQ(tid.value(), expected);
    }
    auto extra = rt.spawnRoot(nullptr);
    ASSERT_FALSE(extra.isOk());
    EXPECT_EQ(extra.error().kind, FaultKind::TooManyThread);
}

TEST(Scheduler, BytecodeSpawnBeyondLimitPushesError)
{
    RuntimeConfig config = sequential();
    config.maxThreadCount = 1;
    Runtime rt(config);
    ProgramBuilder b;
    b.spawn().print(1).print(8);
    ASSERT_TRUE(rt.spawnRoot(b.finish()).isOk());
    tickOk(rt);
    EXPECT_EQ(rt.takeOutput(), "true0");
}

TEST(Scheduler, TidIsReusedAfterTheRetiringTick)
{
    Runtime rt(sequential());
    ProgramBuilder b;
    b.exit();
    ASSERT_EQ(rt.spawnRoot(b.finish()).value(), 1u);
    ASSERT_EQ(rt.spawnRoot(nullptr).value(), 2u);
    const TickReport report = tickOk(rt);
    EXPECT_EQ(report.live, (std::vector<Tid>{2}));
    EXPECT_FALSE(rt.state(1).has_value());
    EXPECT_EQ(rt.spawnRoot(nullptr).value(), 1u);
}

TEST(Scheduler, SpawnedThreadRunsOnNextTick)
{
    Runtime rt(sequential());
    ProgramBuilder b;
    b.spawn("child").pop(9).pushU64(1).print(8).exit();
    b.place("child").pushU64(2).print(8).exit();
    ASSERT_TRUE(rt.spawnRoot(b.finish()).isOk());

    tickOk(rt);
    EXPECT_EQ(rt.takeOutput(), "1");
    EXPECT_TRUE(rt.isAlive(2));
    tickOk(rt);
    EXPECT_EQ(rt.takeOutput(), "2");
    EXPECT_FALSE(rt.hasPendingWork());
}

TEST(Scheduler, SpawnPushesChildTidAndOk)
{
    Runtime rt(sequential());
    ProgramBuilder b;
    b.spawn().print(1).print(8);
    ASSERT_TRUE(rt.spawnRoot(b.finish()).isOk());
    tickOk(rt);
    EXPECT_EQ(rt.takeOutput(), "false2");
}

TEST(Scheduler, LoadGivesIdleThreadMoreCode)
{
    Runtime rt(sequential());
    auto tid = rt.spawnRoot(nullptr);
    ASSERT_TRUE(tid.isOk());

    ProgramBuilder b;
    b.pushU64(3).print(8);
    ASSERT_TRUE(rt.load(tid.value(), b.finish()).isOk());
    tickOk(rt);
    EXPECT_EQ(rt.takeOutput(), "3");

    EXPECT_EQ(rt.load(9, nullptr).error().kind, FaultKind::InvalidTID);
    b.nop();
    ASSERT_TRUE(rt.load(tid.value(), b.finish()).isOk());
    EXPECT_EQ(rt.load(tid.value(), nullptr).error().kind, FaultKind::UnsupportedOperation);
}

//===----------------------------------------------------------------------===//
// Signals
//===----------------------------------------------------------------------===//

TEST(Scheduler, JoinWakesOnTickAfterExit)
{
    Runtime rt(sequential());
    ProgramBuilder b;
    b.spawn("child").pop(1).join().pop(1).pushU64(9).print(8).jump("end");
    b.place("child").exit();
    b.place("end");
    ASSERT_TRUE(rt.spawnRoot(b.finish()).isOk());

    tickOk(rt);
    EXPECT_EQ(kindOf(rt, 1), ThreadState::Kind::Waiting);
    EXPECT_EQ(rt.scheduler().joinWaitingList().size(), 1u);

    tickOk(rt); // child exits
    EXPECT_FALSE(rt.isAlive(2));
    EXPECT_EQ(kindOf(rt, 1), ThreadState::Kind::Waiting);
    EXPECT_EQ(rt.takeOutput(), "");

    tickOk(rt);
    EXPECT_EQ(kindOf(rt, 1), ThreadState::Kind::Running);
    EXPECT_EQ(rt.takeOutput(), "9");
    EXPECT_TRUE(rt.scheduler().joinWaitingList().empty());
}

TEST(Scheduler, JoinOnSelfOrDeadThreadFails)
{
    Runtime rt(sequential());
    ProgramBuilder b;
    b.pushU64(1).join().print(1);
    b.pushU64(4).join().print(1);
    ASSERT_TRUE(rt.spawnRoot(b.finish()).isOk());
    tickOk(rt);
    EXPECT_EQ(rt.takeOutput(), "truetrue");
    EXPECT_EQ(kindOf(rt, 1), ThreadState::Kind::Running);
}

TEST(Scheduler, SleepSkipsExactlyNTicks)
{
    Runtime rt(sequential());
    ProgramBuilder b;
    b.pushU64(2).sleep().pushU64(1).print(8);
    ASSERT_TRUE(rt.spawnRoot(b.finish()).isOk());

    tickOk(rt);
    EXPECT_EQ(kindOf(rt, 1), ThreadState::Kind::Sleeping);
    for (int skipped = 0; skipped < 2; ++skipped)
    {
        const TickReport report = tickOk(rt);
        EXPECT_EQ(report.instructions, 0u) << "tick " << report.tick;
        EXPECT_EQ(kindOf(rt, 1), ThreadState::Kind::Sleeping);
    }
    EXPECT_EQ(rt.takeOutput(), "");
    tickOk(rt);
    EXPECT_EQ(rt.takeOutput(), "1");
}

TEST(Scheduler, WaitBlocksUntilWoken)
{
    Runtime rt(sequential());
    ProgramBuilder b;
    b.spawn("sleeper").pop(1).pushU64(1).sleep().wake().print(1).exit();
    b.place("sleeper").wait().pushU64(5).print(8).exit();
    ASSERT_TRUE(rt.spawnRoot(b.finish()).isOk());

    tickOk(rt); // root spawns and sleeps
    tickOk(rt); // sleeper waits
    EXPECT_EQ(kindOf(rt, 2), ThreadState::Kind::Waiting);
    tickOk(rt); // root wakes the sleeper
    EXPECT_EQ(rt.takeOutput(), "false");
    EXPECT_EQ(kindOf(rt, 2), ThreadState::Kind::Waiting);
    tickOk(rt);
    EXPECT_EQ(rt.takeOutput(), "5");
}

TEST(Scheduler, WakeOfDeadThreadFails)
{
    Runtime rt(sequential());
    ProgramBuilder b;
    b.pushU64(3).wake().print(1);
    ASSERT_TRUE(rt.spawnRoot(b.finish()).isOk());
    tickOk(rt);
    EXPECT_EQ(rt.takeOutput(), "true");
}

TEST(Scheduler, CloseRetiresTargetAndRejectsSelf)
{
    Runtime rt(sequential());
    ProgramBuilder b;
    b.spawn().pop(1).close().print(1);
    b.pushU64(1).close().print(1);
    b.pushU64(7).close().print(1);
    ASSERT_TRUE(rt.spawnRoot(b.finish()).isOk());
    const TickReport report = tickOk(rt);
    EXPECT_EQ(rt.takeOutput(), "falsetruetrue");
    EXPECT_FALSE(rt.isAlive(2));
    EXPECT_EQ(report.live, (std::vector<Tid>{1}));
}

TEST(Scheduler, CloseWakesJoiners)
{
    Runtime rt(sequential());
    ProgramBuilder b;
    b.spawn().pop(9);          // tid 2, idle
    b.spawn("joiner").pop(9);  // tid 3
    b.pushU64(1).sleep();
    b.pushU64(2).close().pop(1).exit();
    b.place("joiner").pushU64(2).join().pop(1).pushU64(3).print(8).exit();
    ASSERT_TRUE(rt.spawnRoot(b.finish()).isOk());

    tickOk(rt);
    tickOk(rt);
    EXPECT_EQ(kindOf(rt, 3), ThreadState::Kind::Waiting);
    tickOk(rt);
    EXPECT_FALSE(rt.isAlive(2));
    tickOk(rt);
    EXPECT_EQ(rt.takeOutput(), "3");
}

TEST(Scheduler, CloseRetiresSleepingThread)
{
    Runtime rt(sequential());
    ProgramBuilder b;
    b.spawn("sleeper").pop(1).pushU64(1).sleep().close().print(1).exit();
    b.place("sleeper").pushU64(100).sleep().pushU64(5).print(8).exit();
    ASSERT_TRUE(rt.spawnRoot(b.finish()).isOk());

    tickOk(rt); // root spawns and sleeps
    tickOk(rt); // child starts a long sleep
    EXPECT_EQ(kindOf(rt, 2), ThreadState::Kind::Sleeping);
    tickOk(rt); // root closes it mid-sleep
    EXPECT_EQ(rt.takeOutput(), "false");
    EXPECT_FALSE(rt.isAlive(2));

    auto ran = rt.runUntilIdle(200);
    ASSERT_TRUE(ran.isOk());
    EXPECT_EQ(rt.takeOutput(), "");
    EXPECT_FALSE(rt.hasPendingWork());
}

TEST(Scheduler, CloseRetiresWaitingThread)
{
    Runtime rt(sequential());
    ProgramBuilder b;
    b.spawn("waiter").pop(9).pushU64(1).sleep();
    b.pushU64(2).close().print(1).pushU64(2).wake().print(1).exit();
    b.place("waiter").wait().pushU64(5).print(8).exit();
    ASSERT_TRUE(rt.spawnRoot(b.finish()).isOk());

    tickOk(rt);
    tickOk(rt);
    EXPECT_EQ(kindOf(rt, 2), ThreadState::Kind::Waiting);
    tickOk(rt);
    EXPECT_EQ(rt.takeOutput(), "falsetrue");
    EXPECT_FALSE(rt.isAlive(2));

    auto ran = rt.runUntilIdle(8);
    ASSERT_TRUE(ran.isOk());
    EXPECT_EQ(rt.takeOutput(), "");
}

TEST(Scheduler, ClosedJoinerIsNotWokenByTargetExit)
{
    Runtime rt(sequential());
    ProgramBuilder b;
    b.spawn("joiner").pop(9).pushU64(2).sleep();
    b.pushU64(2).close().print(1).exit();
    b.place("joiner").pushU64(1).join().pop(1).pushU64(5).print(8).exit();
    ASSERT_TRUE(rt.spawnRoot(b.finish()).isOk());

    tickOk(rt);
    tickOk(rt); // child blocks joining the root
    EXPECT_EQ(kindOf(rt, 2), ThreadState::Kind::Waiting);
    EXPECT_EQ(rt.scheduler().joinWaitingList().size(), 1u);
    tickOk(rt);
    tickOk(rt); // root closes the joiner, then exits
    EXPECT_EQ(rt.takeOutput(), "false");
    EXPECT_TRUE(rt.scheduler().joinWaitingList().empty());

    auto ran = rt.runUntilIdle(8);
    ASSERT_TRUE(ran.isOk());
    EXPECT_EQ(rt.takeOutput(), "");
    EXPECT_TRUE(rt.scheduler().liveTids().empty());
}

TEST(Scheduler, StdinWaitRetriesRead)
{
    Runtime rt(sequential());
    ProgramBuilder b;
    b.readLine().printStr();
    ASSERT_TRUE(rt.spawnRoot(b.finish()).isOk());

    auto ran = rt.runUntilIdle(8);
    ASSERT_TRUE(ran.isOk());
    EXPECT_EQ(ran.value(), 1u);
    EXPECT_EQ(kindOf(rt, 1), ThreadState::Kind::Waiting);
    EXPECT_EQ(rt.scheduler().stdinWaiters(), (std::vector<Tid>{1}));

    rt.pushInput("hello");
    EXPECT_TRUE(rt.hasPendingWork());
    tickOk(rt);
    EXPECT_EQ(rt.takeOutput(), "hello");
    EXPECT_TRUE(rt.scheduler().stdinWaiters().empty());
}

//===----------------------------------------------------------------------===//
// Faults
//===----------------------------------------------------------------------===//

TEST(Scheduler, UncaughtFaultRetiresOnlyTheFaultingThread)
{
    Runtime rt(sequential());
    ProgramBuilder bad;
    bad.pushU64(1).pushU64(0).div();
    ProgramBuilder good;
    good.pushU64(1).sleep().pushU64(4).print(8);
    ASSERT_TRUE(rt.spawnRoot(bad.finish()).isOk());
    ASSERT_TRUE(rt.spawnRoot(good.finish()).isOk());

    auto failed = rt.tick();
    ASSERT_FALSE(failed.isOk());
    EXPECT_EQ(failed.error().kind, FaultKind::MathError);
    EXPECT_FALSE(rt.state(1).has_value());
    ASSERT_TRUE(rt.scheduler().lastFault().has_value());
    EXPECT_EQ(rt.scheduler().lastFault()->tid, 1u);

    auto ran = rt.runUntilIdle(8);
    ASSERT_TRUE(ran.isOk());
    EXPECT_EQ(rt.takeOutput(), "4");
}

//===----------------------------------------------------------------------===//
// Weighted policy
//===----------------------------------------------------------------------===//

TEST(WeightedPolicy, BudgetLimitsWorkPerTick)
{
    Runtime rt(weighted(4));
    ProgramBuilder b;
    for (int i = 0; i < 6; ++i)
        b.pushU64(i);
    ASSERT_TRUE(rt.spawnRoot(b.finish()).isOk());

    TickReport first = tickOk(rt);
    EXPECT_EQ(first.instructions, 4u);
    EXPECT_EQ(first.weight, 4u);
    TickReport second = tickOk(rt);
    EXPECT_EQ(second.instructions, 2u);
    EXPECT_FALSE(rt.hasPendingWork());
}

TEST(WeightedPolicy, ZeroWeightIsAlwaysAccepted)
{
    Runtime rt(weighted(1));
    ProgramBuilder b;
    b.nop().nop().pushU64(1).nop().pushU64(2);
    ASSERT_TRUE(rt.spawnRoot(b.finish()).isOk());

    TickReport first = tickOk(rt);
    EXPECT_EQ(first.instructions, 4u);
    EXPECT_EQ(first.weight, 1u);
}

TEST(WeightedPolicy, HeavyInstructionIsDeferredNotSplit)
{
    Runtime rt(weighted(4));
    ProgramBuilder b;
    b.pushU64(0).heapAlloc(512);
    ASSERT_TRUE(rt.spawnRoot(b.finish()).isOk());

    TickReport first = tickOk(rt);
    EXPECT_EQ(first.instructions, 1u);
    EXPECT_EQ(rt.heap().allocatedSize(), 0u);

    TickReport second = tickOk(rt);
    EXPECT_EQ(second.instructions, 1u);
    EXPECT_EQ(second.weight, Weight::extreme().units());
    EXPECT_EQ(rt.heap().allocatedSize(), 512u);
}

TEST(WeightedPolicy, BudgetIsSharedAcrossThreads)
{
    Runtime rt(weighted(5));
    ProgramBuilder b;
    for (int i = 0; i < 8; ++i)
        b.pushU64(i);
    auto program = b.finish();
    ASSERT_TRUE(rt.spawnRoot(program).isOk());
    ASSERT_TRUE(rt.spawnRoot(program).isOk());

    for (int tick = 0; tick < 3; ++tick)
    {
        const TickReport report = tickOk(rt);
        EXPECT_EQ(report.weight, 5u);
    }
}

TEST(WeightedPolicy, RemainderRotatesAcrossTicks)
{
    WeightedPolicy policy(5);
    policy.beginTick(2);
    policy.beginThread(0);
    const uint64_t firstTickSlot0 = policy.remaining();
    policy.beginThread(1);
    const uint64_t firstTickSlot1 = policy.remaining();
    EXPECT_EQ(firstTickSlot0 + firstTickSlot1, 5u);

    policy.beginTick(2);
    policy.beginThread(0);
    EXPECT_EQ(policy.remaining(), firstTickSlot1);
    policy.beginThread(1);
    EXPECT_EQ(policy.remaining(), firstTickSlot0);
}

//===----------------------------------------------------------------------===//
// Tracing
//===----------------------------------------------------------------------===//

TEST(Scheduler, SchedTraceRecordsEvents)
{
    std::ostringstream trace;
    RuntimeConfig config = sequential();
    config.trace.mode = TraceConfig::Sched;
    config.trace.stream = &trace;
    Runtime rt(config);

    ProgramBuilder b;
    b.pushU64(1).exit();
    ASSERT_TRUE(rt.spawnRoot(b.finish()).isOk());
    tickOk(rt);

    const std::string text = trace.str();
    EXPECT_NE(text.find("[tick 1] begin"), std::string::npos);
    EXPECT_NE(text.find("[tid 1] exit"), std::string::npos);
    EXPECT_EQ(text.find("PUSH"), std::string::npos);
}

TEST(Scheduler, CasmTraceRecordsInstructions)
{
    std::ostringstream trace;
    RuntimeConfig config = sequential();
    config.trace.mode = TraceConfig::Casm;
    config.trace.stream = &trace;
    Runtime rt(config);

    ProgramBuilder b;
    b.pushU64(1).pop(8);
    ASSERT_TRUE(rt.spawnRoot(b.finish()).isOk());
    tickOk(rt);

    const std::string text = trace.str();
    EXPECT_NE(text.find("[tid 1] #0 PUSH 8B"), std::string::npos);
    EXPECT_NE(text.find("[tid 1] #1 POP 8"), std::string::npos);
}
