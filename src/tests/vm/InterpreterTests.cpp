//===----------------------------------------------------------------------===//
//
// Part of the Ciphel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tests/vm/InterpreterTests.cpp
// Purpose: Instruction semantics observed through a single-thread runtime.
//
//===----------------------------------------------------------------------===//

#include "vm/Casm.hpp"
#include "vm/ProgramBuilder.hpp"
#include "vm/Runtime.hpp"

#include <gtest/gtest.h>

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

/// @brief Spawn @p program on @p rt, run it to idle and return its output.
std::string runToIdle(Runtime &rt, std::shared_ptr<const Program> program)
{
    EXPECT_TRUE(rt.spawnRoot(std::move(program)).isOk());
    auto ran = rt.runUntilIdle(16);
    EXPECT_TRUE(ran.isOk()) << rt.lastFaultMessage().value_or("");
    return rt.takeOutput();
}

/// @brief Run @p program expecting an uncaught fault; return its kind.
FaultKind runToFault(Runtime &rt, std::shared_ptr<const Program> program)
{
    EXPECT_TRUE(rt.spawnRoot(std::move(program)).isOk());
    auto ran = rt.runUntilIdle(16);
    EXPECT_FALSE(ran.isOk());
    return ran ? FaultKind::UnsupportedOperation : ran.error().kind;
}

} // namespace

TEST(Interpreter, Arithmetic)
{
    Runtime rt(sequential());
    ProgramBuilder b;
    b.pushU64(6).pushU64(7).mul().print(8);
    b.pushU64(10).pushU64(3).sub().print(8);
    b.pushU64(17).pushU64(5).mod().print(8);
    b.pushU64(2).pushU64(3).lt().print(1);
    b.pushU64(4).pushU64(4).eq().logicalNot().print(1);
    EXPECT_EQ(runToIdle(rt, b.finish()), "4272truefalse");
}

TEST(Interpreter, DivisionByZeroIsMathError)
{
    Runtime rt(sequential());
    ProgramBuilder b;
    b.pushU64(1).pushU64(0).div();
    EXPECT_EQ(runToFault(rt, b.finish()), FaultKind::MathError);
    ASSERT_TRUE(rt.lastFaultMessage().has_value());
    EXPECT_EQ(*rt.lastFaultMessage(), "fault MathError (code=0) in thread 1 at #2");
    EXPECT_FALSE(rt.isAlive(1));
}

TEST(Interpreter, LoopOverGlobals)
{
    Runtime rt(sequential());
    ProgramBuilder b;
    b.locate(MemoryAddress::global(0)).pushU64(0).store(8);
    b.locate(MemoryAddress::global(8)).pushU64(5).store(8);
    b.place("loop");
    b.locate(MemoryAddress::global(8)).load(8).pushU64(0).eq().logicalNot().branchIfNot("done");
    b.locate(MemoryAddress::global(0));
    b.locate(MemoryAddress::global(0)).load(8).locate(MemoryAddress::global(8)).load(8).add();
    b.store(8);
    b.locate(MemoryAddress::global(8));
    b.locate(MemoryAddress::global(8)).load(8).pushU64(1).sub();
    b.store(8);
    b.jump("loop");
    b.place("done");
    b.locate(MemoryAddress::global(0)).load(8).print(8);
    EXPECT_EQ(runToIdle(rt, b.finish()), "15");
}

TEST(Interpreter, CallAndReturn)
{
    Runtime rt(sequential());
    ProgramBuilder b;
    b.pushU64(20).call("twice", 8).print(8).exit();
    b.place("twice");
    b.locate(MemoryAddress::frame(0)).load(8).dup(8).add().ret(8);
    EXPECT_EQ(runToIdle(rt, b.finish()), "40");
}

TEST(Interpreter, StackZoneAddressesOwnStack)
{
    Runtime rt(sequential());
    ProgramBuilder b;
    b.stackAlloc(8);
    b.locate(MemoryAddress::stack(0)).pushU64(5).store(8);
    b.locate(MemoryAddress::stack(0)).load(8).print(8);
    EXPECT_EQ(runToIdle(rt, b.finish()), "5");
}

TEST(Interpreter, HeapStoreAndLoad)
{
    Runtime rt(sequential());
    ProgramBuilder b;
    b.heapAlloc(8).dup(8).pushU64(99).store(8).dup(8).load(8).print(8).heapFree();
    EXPECT_EQ(runToIdle(rt, b.finish()), "99");
    EXPECT_EQ(rt.heap().allocatedSize(), 0u);
    EXPECT_TRUE(rt.heap().checkIntegrity().isOk());
}

TEST(Interpreter, HeapAddressIsDataRegion)
{
    Runtime rt(sequential());
    ProgramBuilder b;
    b.heapAlloc(8).print(8);
    EXPECT_EQ(runToIdle(rt, b.finish()), std::to_string(rt.space().heapBase() + Heap::kWordSize));
}

TEST(Interpreter, FreeingNonHeapAddressIsInvalidPointer)
{
    Runtime rt(sequential());
    ProgramBuilder b;
    b.locate(MemoryAddress::global(0)).heapFree();
    EXPECT_EQ(runToFault(rt, b.finish()), FaultKind::InvalidPointer);
}

TEST(Interpreter, ReallocKeepsContent)
{
    Runtime rt(sequential());
    ProgramBuilder b;
    b.heapAlloc(8).dup(8).pushU64(31).store(8);
    b.heapRealloc(128).load(8).print(8);
    EXPECT_EQ(runToIdle(rt, b.finish()), "31");
}

TEST(Interpreter, Vectors)
{
    Runtime rt(sequential());
    ProgramBuilder b;
    b.pushU64(0).vecNew(8);
    b.pushU64(5).vecPush(8);
    b.pushU64(6).vecPush(8);
    b.dup(8).vecLen().print(8);
    b.dup(8).pushU64(1).vecGet(8).print(8);
    b.vecPop(8).print(8);
    EXPECT_EQ(runToIdle(rt, b.finish()), "266");
}

TEST(Interpreter, VectorIndexOutOfBound)
{
    Runtime rt(sequential());
    ProgramBuilder b;
    b.pushU64(2).vecNew(8).pushU64(2).vecGet(8);
    EXPECT_EQ(runToFault(rt, b.finish()), FaultKind::IndexOutOfBound);
}

TEST(Interpreter, ReadLineEchoes)
{
    Runtime rt(sequential());
    rt.pushInput("ciphel");
    ProgramBuilder b;
    b.readLine().printStr();
    EXPECT_EQ(runToIdle(rt, b.finish()), "ciphel");
}

TEST(Interpreter, CaughtFaultJumpsToHandler)
{
    Runtime rt(sequential());
    ProgramBuilder b;
    b.tryStart("handler").pushU64(1).pushU64(0).div().print(8).exit();
    b.place("handler").tryEnd().pushU64(7).print(8);
    EXPECT_EQ(runToIdle(rt, b.finish()), "7");
    EXPECT_FALSE(rt.lastFaultMessage().has_value());
}

TEST(Interpreter, RaiseWithoutHandlerReachesHost)
{
    Runtime rt(sequential());
    ProgramBuilder b;
    b.raise(FaultKind::ReadError);
    EXPECT_EQ(runToFault(rt, b.finish()), FaultKind::ReadError);
}

TEST(Interpreter, TryEndWithoutTryFails)
{
    Runtime rt(sequential());
    ProgramBuilder b;
    b.tryEnd();
    EXPECT_EQ(runToFault(rt, b.finish()), FaultKind::UnsupportedOperation);
}

TEST(Interpreter, JumpToUnplacedLabelIsCodeSegmentation)
{
    Runtime rt(sequential());
    ProgramBuilder b;
    b.jump("nowhere");
    EXPECT_EQ(runToFault(rt, b.finish()), FaultKind::CodeSegmentation);
}

TEST(Interpreter, PrintOfOddWidthIsDeserialization)
{
    Runtime rt(sequential());
    ProgramBuilder b;
    b.stackAlloc(4).print(4);
    EXPECT_EQ(runToFault(rt, b.finish()), FaultKind::Deserialization);
}

TEST(Interpreter, ExternCall)
{
    Runtime rt(sequential());
    const std::size_t twice = rt.registerExtern(ExternDesc{
        "twice",
        Weight::low(),
        [](ExternContext &ctx)
        {
            auto value = ctx.stack.popU64();
            if (!value)
                return ExecStatus::failed(value.error());
            auto pushed = ctx.stack.pushU64(value.value() * 2);
            if (!pushed)
                return ExecStatus::failed(pushed.error());
            return ExecStatus::proceed();
        }});

    ProgramBuilder b;
    b.pushU64(21).callExtern(twice).print(8);
    EXPECT_EQ(runToIdle(rt, b.finish()), "42");
}

TEST(Interpreter, UnknownExternIsUnsupported)
{
    Runtime rt(sequential());
    ProgramBuilder b;
    b.callExtern(3);
    EXPECT_EQ(runToFault(rt, b.finish()), FaultKind::UnsupportedOperation);
}

TEST(Interpreter, InstructionWeights)
{
    CasmInstr instr;
    instr.op = CasmOpcode::NOP;
    EXPECT_TRUE(weightOf(instr, kStackSize).isZero());
    instr.op = CasmOpcode::ADD;
    EXPECT_EQ(weightOf(instr, kStackSize), Weight::low());
    instr.op = CasmOpcode::LOAD;
    EXPECT_EQ(weightOf(instr, kStackSize), Weight::medium());
    instr.op = CasmOpcode::JOIN;
    EXPECT_EQ(weightOf(instr, kStackSize), Weight::high());
    instr.op = CasmOpcode::HEAP_ALLOC;
    instr.size = kStackSize / 10;
    EXPECT_EQ(weightOf(instr, kStackSize), Weight::medium());
    instr.size = kStackSize / 10 + 1;
    EXPECT_EQ(weightOf(instr, kStackSize), Weight::extreme());
}

TEST(Interpreter, Disassembly)
{
    ProgramBuilder b;
    b.place("top").pushU64(1).locate(MemoryAddress::frame(8)).jump("top");
    auto program = b.finish();
    EXPECT_EQ(program->disassemble(0), "LABEL top");
    EXPECT_EQ(program->disassemble(1), "PUSH 8B");
    EXPECT_EQ(program->disassemble(2), "LOCATE frame+8");
    EXPECT_EQ(program->disassemble(3), "GOTO top");
    EXPECT_EQ(program->disassemble(4), "<end>");
}
