//===----------------------------------------------------------------------===//
//
// Part of the Ciphel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tests/vm/ThreadStateTests.cpp
// Purpose: Thread state machine, program cursor and resume semantics.
//
//===----------------------------------------------------------------------===//

#include "vm/Config.hpp"
#include "vm/ProgramBuilder.hpp"
#include "vm/Thread.hpp"

#include <gtest/gtest.h>

using namespace ciphel::vm;

TEST(ThreadState, LegalTransitions)
{
    ThreadState state = ThreadState::running();
    EXPECT_TRUE(state.transition(ThreadState::sleeping(2)).isOk());
    EXPECT_TRUE(state.transition(ThreadState::sleeping(1)).isOk());
    EXPECT_EQ(state.ticksRemaining(), 1u);
    EXPECT_TRUE(state.transition(ThreadState::running()).isOk());
    EXPECT_TRUE(state.transition(ThreadState::waiting()).isOk());
    EXPECT_TRUE(state.transition(ThreadState::running()).isOk());
    EXPECT_TRUE(state.transition(ThreadState::completed()).isOk());
}

TEST(ThreadState, CompletedIsTerminal)
{
    ThreadState state = ThreadState::completed();
    auto moved = state.transition(ThreadState::running());
    ASSERT_FALSE(moved.isOk());
    EXPECT_EQ(moved.error().kind, FaultKind::InvalidThreadStateTransition);
    EXPECT_EQ(state.kind(), ThreadState::Kind::Completed);
}

TEST(ThreadState, SleepingCannotWait)
{
    ThreadState state = ThreadState::sleeping(3);
    EXPECT_EQ(state.transition(ThreadState::waiting()).error().kind,
              FaultKind::InvalidThreadStateTransition);
    EXPECT_EQ(state.kind(), ThreadState::Kind::Sleeping);
}

TEST(ThreadState, WaitingOnlyResumesOrCompletes)
{
    ThreadState state = ThreadState::waiting();
    EXPECT_FALSE(state.transition(ThreadState::sleeping(1)).isOk());
    EXPECT_TRUE(state.transition(ThreadState::completed()).isOk());
}

TEST(Thread, EmptyProgramIsIdle)
{
    Thread thread(1, kStackSize, nullptr, 0);
    EXPECT_TRUE(thread.alive());
    EXPECT_TRUE(thread.cursor().idle());
    EXPECT_FALSE(thread.runnable());
}

TEST(Thread, ResumeAfterSignalMovesPastInstruction)
{
    ProgramBuilder b;
    b.wait().nop();
    Thread thread(1, kStackSize, b.finish(), 0);

    ASSERT_TRUE(thread.setState(ThreadState::waiting()).isOk());
    thread.setBlockReason(BlockReason::Signal);
    EXPECT_FALSE(thread.runnable());
    ASSERT_TRUE(thread.resume().isOk());
    EXPECT_EQ(thread.cursor().position(), 1u);
    EXPECT_TRUE(thread.runnable());
}

TEST(Thread, ResumeAfterStdinRetriesInstruction)
{
    ProgramBuilder b;
    b.readLine();
    Thread thread(1, kStackSize, b.finish(), 0);

    ASSERT_TRUE(thread.setState(ThreadState::waiting()).isOk());
    thread.setBlockReason(BlockReason::Stdin);
    ASSERT_TRUE(thread.resume().isOk());
    EXPECT_EQ(thread.cursor().position(), 0u);
    EXPECT_EQ(thread.blockReason(), BlockReason::None);
}

TEST(Thread, LoadRestartsCursor)
{
    ProgramBuilder b;
    b.nop();
    Thread thread(2, kStackSize, b.finish(), 0);
    thread.cursor().next();
    thread.cursor().update(thread.program());
    EXPECT_TRUE(thread.cursor().idle());

    b.nop().nop();
    thread.load(b.finish());
    EXPECT_EQ(thread.cursor().position(), 0u);
    EXPECT_TRUE(thread.runnable());
}
