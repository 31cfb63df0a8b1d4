//===----------------------------------------------------------------------===//
//
// Part of the Ciphel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Interpreter.cpp
// Purpose: Switch-based dispatch of Casm instructions.
// Key invariants: Instructions that need the scheduler return a Signal after
//                 popping their operands; everything else either completes and
//                 moves the cursor or reports a Fault.
// Ownership/Lifetime: Stateless; all state lives in Thread and Machine.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Casm instruction semantics.
/// @details Memory instructions work on flat addresses. A flat address is
///          decoded into its zone and served by the global segment, the
///          executing thread's own stack, or the shared heap. Heap objects are
///          addressed by the first byte of their block's data region.

#include "vm/Interpreter.hpp"

#include "support/bytes.hpp"
#include "vm/HeapObjects.hpp"

#include <string>

namespace ciphel::vm
{

namespace
{

VmResult<std::vector<uint8_t>> readFlat(Machine &m, Thread &thread, uint64_t flat, std::size_t size)
{
    auto address = m.space.decode(flat);
    if (!address)
        return address.failure();
    const MemoryAddress &at = address.value();
    switch (at.zone)
    {
        case MemoryAddress::Zone::Global:
            return m.globals.read(at.offset, size);
        case MemoryAddress::Zone::Stack:
            return thread.stack().read(at.offset, size);
        case MemoryAddress::Zone::Heap:
            return m.heap.readRaw(at.offset, size);
        case MemoryAddress::Zone::Frame:
            break;
    }
    return fault(FaultKind::MemoryViolation, static_cast<int64_t>(flat));
}

VmResult<void> writeFlat(Machine &m, Thread &thread, uint64_t flat, std::span<const uint8_t> bytes)
{
    auto address = m.space.decode(flat);
    if (!address)
        return address.failure();
    const MemoryAddress &at = address.value();
    switch (at.zone)
    {
        case MemoryAddress::Zone::Global:
            return m.globals.write(at.offset, bytes);
        case MemoryAddress::Zone::Stack:
            return thread.stack().write(at.offset, bytes);
        case MemoryAddress::Zone::Heap:
            return m.heap.writeRaw(at.offset, bytes);
        case MemoryAddress::Zone::Frame:
            break;
    }
    return fault(FaultKind::MemoryViolation, static_cast<int64_t>(flat));
}

/// @brief Pop a flat object address and translate it to its heap block.
VmResult<Heap::Pointer> popBlock(Machine &m, Stack &stack)
{
    auto flat = stack.popU64();
    if (!flat)
        return flat.failure();
    return blockOfFlat(m.space, flat.value());
}

VmResult<void> pushBlock(Machine &m, Stack &stack, Heap::Pointer block)
{
    return stack.pushU64(flatOfBlock(m.space, block));
}

VmResult<void> arithmetic(CasmOpcode op, Stack &stack)
{
    auto rhs = stack.popU64();
    if (!rhs)
        return rhs.failure();
    auto lhs = stack.popU64();
    if (!lhs)
        return lhs.failure();
    const uint64_t a = lhs.value();
    const uint64_t b = rhs.value();

    switch (op)
    {
        case CasmOpcode::ADD:
            return stack.pushU64(a + b);
        case CasmOpcode::SUB:
            return stack.pushU64(a - b);
        case CasmOpcode::MUL:
            return stack.pushU64(a * b);
        case CasmOpcode::DIV:
            if (b == 0)
                return fault(FaultKind::MathError);
            return stack.pushU64(a / b);
        case CasmOpcode::MOD:
            if (b == 0)
                return fault(FaultKind::MathError);
            return stack.pushU64(a % b);
        case CasmOpcode::EQ:
            return stack.pushBool(a == b);
        case CasmOpcode::LT:
            return stack.pushBool(a < b);
        default:
            break;
    }
    return fault(FaultKind::UnsupportedOperation, static_cast<int64_t>(op));
}

VmResult<void> print(Machine &m, Stack &stack, std::size_t size)
{
    auto bytes = stack.popBytes(size);
    if (!bytes)
        return bytes.failure();
    if (size == 1)
    {
        m.stdio.write(bytes.value()[0] != 0 ? "true" : "false");
        return {};
    }
    if (size == 8)
    {
        m.stdio.write(std::to_string(support::loadLE64(bytes.value().data())));
        return {};
    }
    return fault(FaultKind::Deserialization, static_cast<int64_t>(size));
}

/// @brief Execute every instruction that completes without scheduler help.
VmResult<void> step(const CasmInstr &instr, Thread &thread, Machine &m)
{
    Stack &stack = thread.stack();
    ProgramCursor &cursor = thread.cursor();

    switch (instr.op)
    {
        case CasmOpcode::NOP:
        case CasmOpcode::LABEL:
            break;

        case CasmOpcode::PUSH:
        {
            auto pushed = stack.pushBytes(instr.data);
            if (!pushed)
                return pushed;
            break;
        }
        case CasmOpcode::POP:
        {
            auto popped = stack.pop(instr.size);
            if (!popped)
                return popped;
            break;
        }
        case CasmOpcode::DUP:
        {
            if (instr.size > stack.top())
                return fault(FaultKind::StackUnderflow);
            auto bytes = stack.read(stack.top() - instr.size, instr.size);
            if (!bytes)
                return bytes.failure();
            auto pushed = stack.pushBytes(bytes.value());
            if (!pushed)
                return pushed;
            break;
        }
        case CasmOpcode::STACK_ALLOC:
        {
            auto pushed = stack.push(instr.size);
            if (!pushed)
                return pushed;
            break;
        }

        case CasmOpcode::LOCATE:
        {
            auto flat = m.space.encode(instr.address, stack);
            if (!flat)
                return flat.failure();
            auto pushed = stack.pushU64(flat.value());
            if (!pushed)
                return pushed;
            break;
        }
        case CasmOpcode::LOAD:
        {
            auto flat = stack.popU64();
            if (!flat)
                return flat.failure();
            auto bytes = readFlat(m, thread, flat.value(), instr.size);
            if (!bytes)
                return bytes.failure();
            auto pushed = stack.pushBytes(bytes.value());
            if (!pushed)
                return pushed;
            break;
        }
        case CasmOpcode::STORE:
        {
            auto value = stack.popBytes(instr.size);
            if (!value)
                return value.failure();
            auto flat = stack.popU64();
            if (!flat)
                return flat.failure();
            auto written = writeFlat(m, thread, flat.value(), value.value());
            if (!written)
                return written;
            break;
        }

        case CasmOpcode::HEAP_ALLOC:
        {
            auto block = m.heap.alloc(instr.size);
            if (!block)
                return block.failure();
            auto pushed = pushBlock(m, stack, block.value());
            if (!pushed)
                return pushed;
            break;
        }
        case CasmOpcode::HEAP_FREE:
        {
            auto block = popBlock(m, stack);
            if (!block)
                return block.failure();
            auto released = m.heap.free(block.value());
            if (!released)
                return released;
            break;
        }
        case CasmOpcode::HEAP_REALLOC:
        {
            auto block = popBlock(m, stack);
            if (!block)
                return block.failure();
            auto moved = m.heap.realloc(block.value(), instr.size);
            if (!moved)
                return moved.failure();
            auto pushed = pushBlock(m, stack, moved.value());
            if (!pushed)
                return pushed;
            break;
        }
        case CasmOpcode::VEC_NEW:
        {
            auto length = stack.popU64();
            if (!length)
                return length.failure();
            auto vec = createVector(m.heap, instr.size, length.value());
            if (!vec)
                return vec.failure();
            auto pushed = pushBlock(m, stack, vec.value());
            if (!pushed)
                return pushed;
            break;
        }
        case CasmOpcode::VEC_PUSH:
        {
            auto item = stack.popBytes(instr.size);
            if (!item)
                return item.failure();
            auto block = popBlock(m, stack);
            if (!block)
                return block.failure();
            auto vec = pushItem(m.heap, block.value(), instr.size, item.value());
            if (!vec)
                return vec.failure();
            auto pushed = pushBlock(m, stack, vec.value());
            if (!pushed)
                return pushed;
            break;
        }
        case CasmOpcode::VEC_POP:
        {
            auto block = popBlock(m, stack);
            if (!block)
                return block.failure();
            auto item = popItem(m.heap, block.value(), instr.size);
            if (!item)
                return item.failure();
            auto pushed = stack.pushBytes(item.value());
            if (!pushed)
                return pushed;
            break;
        }
        case CasmOpcode::VEC_GET:
        {
            auto index = stack.popU64();
            if (!index)
                return index.failure();
            auto block = popBlock(m, stack);
            if (!block)
                return block.failure();
            auto item = itemAt(m.heap, block.value(), instr.size, index.value());
            if (!item)
                return item.failure();
            auto pushed = stack.pushBytes(item.value());
            if (!pushed)
                return pushed;
            break;
        }
        case CasmOpcode::VEC_LEN:
        {
            auto block = popBlock(m, stack);
            if (!block)
                return block.failure();
            auto length = vectorLength(m.heap, block.value());
            if (!length)
                return length.failure();
            auto pushed = stack.pushU64(length.value());
            if (!pushed)
                return pushed;
            break;
        }

        case CasmOpcode::ADD:
        case CasmOpcode::SUB:
        case CasmOpcode::MUL:
        case CasmOpcode::DIV:
        case CasmOpcode::MOD:
        case CasmOpcode::EQ:
        case CasmOpcode::LT:
        {
            auto done = arithmetic(instr.op, stack);
            if (!done)
                return done;
            break;
        }
        case CasmOpcode::NOT:
        {
            auto value = stack.popBool();
            if (!value)
                return value.failure();
            auto pushed = stack.pushBool(!value.value());
            if (!pushed)
                return pushed;
            break;
        }

        case CasmOpcode::GOTO:
        {
            auto target = thread.program().cursorOf(instr.label);
            if (!target)
                return target.failure();
            cursor.jump(target.value());
            return {};
        }
        case CasmOpcode::BRANCH_IF_NOT:
        {
            auto condition = stack.popBool();
            if (!condition)
                return condition.failure();
            if (condition.value())
                break;
            auto target = thread.program().cursorOf(instr.label);
            if (!target)
                return target.failure();
            cursor.jump(target.value());
            return {};
        }
        case CasmOpcode::CALL:
        {
            auto target = thread.program().cursorOf(instr.label);
            if (!target)
                return target.failure();
            auto opened = stack.openFrame(instr.size, cursor.position() + 1);
            if (!opened)
                return opened;
            cursor.jump(target.value());
            return {};
        }
        case CasmOpcode::RETURN:
        {
            auto resumeAt = stack.closeFrame(instr.size);
            if (!resumeAt)
                return resumeAt.failure();
            cursor.jump(static_cast<std::size_t>(resumeAt.value()));
            return {};
        }

        case CasmOpcode::TRY_START:
            thread.catches().push(instr.label);
            break;
        case CasmOpcode::TRY_END:
        {
            auto popped = thread.catches().pop();
            if (!popped)
                return popped;
            break;
        }
        case CasmOpcode::RAISE:
            return fault(faultKindFromValue(static_cast<int64_t>(instr.size)));

        case CasmOpcode::PRINT:
        {
            auto printed = print(m, stack, instr.size);
            if (!printed)
                return printed;
            break;
        }
        case CasmOpcode::PRINT_STR:
        {
            auto block = popBlock(m, stack);
            if (!block)
                return block.failure();
            auto text = readString(m.heap, block.value());
            if (!text)
                return text.failure();
            m.stdio.write(text.value());
            break;
        }
        case CasmOpcode::READ_LINE:
        {
            auto line = m.stdio.takeLine();
            if (!line)
                return fault(FaultKind::UnsupportedOperation, static_cast<int64_t>(instr.op));
            auto text = createString(m.heap, *line);
            if (!text)
                return text.failure();
            auto pushed = pushBlock(m, stack, text.value());
            if (!pushed)
                return pushed;
            break;
        }

        case CasmOpcode::SPAWN:
        case CasmOpcode::EXIT:
        case CasmOpcode::CLOSE:
        case CasmOpcode::WAIT:
        case CasmOpcode::WAKE:
        case CasmOpcode::SLEEP:
        case CasmOpcode::JOIN:
        case CasmOpcode::EXTERN:
            return fault(FaultKind::UnsupportedOperation, static_cast<int64_t>(instr.op));
    }

    cursor.next();
    return {};
}

/// @brief Pop the Tid operand of CLOSE, WAKE or JOIN and raise @p kind.
ExecStatus raiseWithTarget(SignalKind kind, Stack &stack)
{
    auto target = stack.popU64();
    if (!target)
        return ExecStatus::failed(target.error());
    Signal signal;
    signal.kind = kind;
    signal.target = target.value();
    return ExecStatus::raise(signal);
}

} // namespace

uint64_t flatOfBlock(const AddressSpace &space, Heap::Pointer block)
{
    return space.heapBase() + block + Heap::kWordSize;
}

VmResult<Heap::Pointer> blockOfFlat(const AddressSpace &space, uint64_t flat)
{
    auto address = space.decode(flat);
    if (!address)
        return address.failure();
    const MemoryAddress &at = address.value();
    if (at.zone != MemoryAddress::Zone::Heap || at.offset < Heap::kWordSize)
        return fault(FaultKind::InvalidPointer, static_cast<int64_t>(flat));
    return at.offset - Heap::kWordSize;
}

ExecStatus execute(const CasmInstr &instr, Thread &thread, Machine &machine)
{
    Stack &stack = thread.stack();
    switch (instr.op)
    {
        case CasmOpcode::SPAWN:
        {
            Signal signal;
            signal.kind = SignalKind::Spawn;
            signal.entry = instr.label;
            return ExecStatus::raise(signal);
        }
        case CasmOpcode::EXIT:
            return ExecStatus::raise(Signal{SignalKind::Exit});
        case CasmOpcode::WAIT:
            return ExecStatus::raise(Signal{SignalKind::Wait});
        case CasmOpcode::CLOSE:
            return raiseWithTarget(SignalKind::Close, stack);
        case CasmOpcode::WAKE:
            return raiseWithTarget(SignalKind::Wake, stack);
        case CasmOpcode::JOIN:
            return raiseWithTarget(SignalKind::Join, stack);
        case CasmOpcode::SLEEP:
        {
            auto ticks = stack.popU64();
            if (!ticks)
                return ExecStatus::failed(ticks.error());
            Signal signal;
            signal.kind = SignalKind::Sleep;
            signal.ticks = ticks.value();
            return ExecStatus::raise(signal);
        }
        case CasmOpcode::READ_LINE:
            if (!machine.stdio.hasInput())
                return ExecStatus::raise(Signal{SignalKind::WaitStdin});
            break;
        case CasmOpcode::EXTERN:
        {
            const ExternDesc *desc = machine.externs.find(static_cast<std::size_t>(instr.size));
            if (!desc || !desc->fn)
                return ExecStatus::failed(Fault{FaultKind::UnsupportedOperation, static_cast<int64_t>(instr.size)});
            ExternContext ctx{thread.tid(), stack, machine.heap, machine.stdio, machine.space};
            ExecStatus status = desc->fn(ctx);
            if (status.kind() == ExecStatus::Kind::Continue)
                thread.cursor().next();
            return status;
        }
        default:
            break;
    }

    auto done = step(instr, thread, machine);
    if (!done)
        return ExecStatus::failed(done.error());
    return ExecStatus::proceed();
}

Weight instructionWeight(const CasmInstr &instr, const Machine &machine)
{
    if (instr.op == CasmOpcode::EXTERN)
    {
        if (const ExternDesc *desc = machine.externs.find(static_cast<std::size_t>(instr.size)))
            return desc->weight;
    }
    return weightOf(instr, machine.stackSize);
}

} // namespace ciphel::vm
