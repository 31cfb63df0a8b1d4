//===----------------------------------------------------------------------===//
//
// Part of the Ciphel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/ProgramBuilder.cpp
// Purpose: Fluent emitters for Casm programs.
//
//===----------------------------------------------------------------------===//

#include "vm/ProgramBuilder.hpp"

#include "support/bytes.hpp"

#include <stdexcept>
#include <utility>

namespace ciphel::vm
{

ProgramBuilder::ProgramBuilder() : program_(std::make_unique<Program>()) {}

LabelId ProgramBuilder::label(const std::string &name)
{
    auto it = labels_.find(name);
    if (it != labels_.end())
        return it->second;
    const LabelId id = program_->declareLabel(name);
    labels_.emplace(name, id);
    return id;
}

ProgramBuilder &ProgramBuilder::place(const std::string &name)
{
    auto placed = program_->placeLabel(label(name));
    if (!placed)
        throw std::invalid_argument("label placed twice: " + name);
    return *this;
}

ProgramBuilder &ProgramBuilder::emit(CasmOpcode op, uint64_t size, LabelId label)
{
    CasmInstr instr;
    instr.op = op;
    instr.size = size;
    instr.label = label;
    program_->append(std::move(instr));
    return *this;
}

ProgramBuilder &ProgramBuilder::nop()
{
    return emit(CasmOpcode::NOP);
}

ProgramBuilder &ProgramBuilder::pushBytes(std::span<const uint8_t> bytes)
{
    CasmInstr instr;
    instr.op = CasmOpcode::PUSH;
    instr.size = bytes.size();
    instr.data.assign(bytes.begin(), bytes.end());
    program_->append(std::move(instr));
    return *this;
}

ProgramBuilder &ProgramBuilder::pushU64(uint64_t value)
{
    const auto bytes = support::toLE64(value);
    return pushBytes(bytes);
}

ProgramBuilder &ProgramBuilder::pushBool(bool value)
{
    const uint8_t byte = value ? 1 : 0;
    return pushBytes(std::span<const uint8_t>(&byte, 1));
}

ProgramBuilder &ProgramBuilder::pop(uint64_t size)
{
    return emit(CasmOpcode::POP, size);
}

ProgramBuilder &ProgramBuilder::dup(uint64_t size)
{
    return emit(CasmOpcode::DUP, size);
}

ProgramBuilder &ProgramBuilder::stackAlloc(uint64_t size)
{
    return emit(CasmOpcode::STACK_ALLOC, size);
}

ProgramBuilder &ProgramBuilder::locate(MemoryAddress address)
{
    CasmInstr instr;
    instr.op = CasmOpcode::LOCATE;
    instr.address = address;
    program_->append(std::move(instr));
    return *this;
}

ProgramBuilder &ProgramBuilder::load(uint64_t size)
{
    return emit(CasmOpcode::LOAD, size);
}

ProgramBuilder &ProgramBuilder::store(uint64_t size)
{
    return emit(CasmOpcode::STORE, size);
}

ProgramBuilder &ProgramBuilder::heapAlloc(uint64_t size)
{
    return emit(CasmOpcode::HEAP_ALLOC, size);
}

ProgramBuilder &ProgramBuilder::heapFree()
{
    return emit(CasmOpcode::HEAP_FREE);
}

ProgramBuilder &ProgramBuilder::heapRealloc(uint64_t size)
{
    return emit(CasmOpcode::HEAP_REALLOC, size);
}

ProgramBuilder &ProgramBuilder::vecNew(uint64_t itemSize)
{
    return emit(CasmOpcode::VEC_NEW, itemSize);
}

ProgramBuilder &ProgramBuilder::vecPush(uint64_t itemSize)
{
    return emit(CasmOpcode::VEC_PUSH, itemSize);
}

ProgramBuilder &ProgramBuilder::vecPop(uint64_t itemSize)
{
    return emit(CasmOpcode::VEC_POP, itemSize);
}

ProgramBuilder &ProgramBuilder::vecGet(uint64_t itemSize)
{
    return emit(CasmOpcode::VEC_GET, itemSize);
}

ProgramBuilder &ProgramBuilder::vecLen()
{
    return emit(CasmOpcode::VEC_LEN);
}

ProgramBuilder &ProgramBuilder::add()
{
    return emit(CasmOpcode::ADD);
}

ProgramBuilder &ProgramBuilder::sub()
{
    return emit(CasmOpcode::SUB);
}

ProgramBuilder &ProgramBuilder::mul()
{
    return emit(CasmOpcode::MUL);
}

ProgramBuilder &ProgramBuilder::div()
{
    return emit(CasmOpcode::DIV);
}

ProgramBuilder &ProgramBuilder::mod()
{
    return emit(CasmOpcode::MOD);
}

ProgramBuilder &ProgramBuilder::eq()
{
    return emit(CasmOpcode::EQ);
}

ProgramBuilder &ProgramBuilder::lt()
{
    return emit(CasmOpcode::LT);
}

ProgramBuilder &ProgramBuilder::logicalNot()
{
    return emit(CasmOpcode::NOT);
}

ProgramBuilder &ProgramBuilder::jump(const std::string &target)
{
    return emit(CasmOpcode::GOTO, 0, label(target));
}

ProgramBuilder &ProgramBuilder::branchIfNot(const std::string &target)
{
    return emit(CasmOpcode::BRANCH_IF_NOT, 0, label(target));
}

ProgramBuilder &ProgramBuilder::call(const std::string &target, uint64_t paramSize)
{
    return emit(CasmOpcode::CALL, paramSize, label(target));
}

ProgramBuilder &ProgramBuilder::ret(uint64_t returnSize)
{
    return emit(CasmOpcode::RETURN, returnSize);
}

ProgramBuilder &ProgramBuilder::tryStart(const std::string &handler)
{
    return emit(CasmOpcode::TRY_START, 0, label(handler));
}

ProgramBuilder &ProgramBuilder::tryEnd()
{
    return emit(CasmOpcode::TRY_END);
}

ProgramBuilder &ProgramBuilder::raise(FaultKind kind)
{
    return emit(CasmOpcode::RAISE, static_cast<uint64_t>(kind));
}

ProgramBuilder &ProgramBuilder::spawn(const std::string &entry)
{
    return emit(CasmOpcode::SPAWN, 0, entry.empty() ? kNoLabel : label(entry));
}

ProgramBuilder &ProgramBuilder::exit()
{
    return emit(CasmOpcode::EXIT);
}

ProgramBuilder &ProgramBuilder::close()
{
    return emit(CasmOpcode::CLOSE);
}

ProgramBuilder &ProgramBuilder::wait()
{
    return emit(CasmOpcode::WAIT);
}

ProgramBuilder &ProgramBuilder::wake()
{
    return emit(CasmOpcode::WAKE);
}

ProgramBuilder &ProgramBuilder::sleep()
{
    return emit(CasmOpcode::SLEEP);
}

ProgramBuilder &ProgramBuilder::join()
{
    return emit(CasmOpcode::JOIN);
}

ProgramBuilder &ProgramBuilder::print(uint64_t size)
{
    return emit(CasmOpcode::PRINT, size);
}

ProgramBuilder &ProgramBuilder::printStr()
{
    return emit(CasmOpcode::PRINT_STR);
}

ProgramBuilder &ProgramBuilder::readLine()
{
    return emit(CasmOpcode::READ_LINE);
}

ProgramBuilder &ProgramBuilder::callExtern(uint64_t index)
{
    return emit(CasmOpcode::EXTERN, index);
}

std::shared_ptr<const Program> ProgramBuilder::finish()
{
    std::shared_ptr<const Program> done(std::move(program_));
    program_ = std::make_unique<Program>();
    labels_.clear();
    return done;
}

} // namespace ciphel::vm
