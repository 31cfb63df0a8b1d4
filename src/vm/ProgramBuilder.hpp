//===----------------------------------------------------------------------===//
//
// Part of the Ciphel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares ProgramBuilder, the host-side helper that assembles Casm
// programs. Labels are referenced by name and may be used before they are
// placed, so loops and forward branches read top to bottom.
//
// Typical Usage Pattern:
//   ProgramBuilder b;
//   b.pushU64(3).place("loop").pushU64(1).sub().dup(8).pushU64(0).eq()
//    .branchIfNot("loop").exit();
//   auto program = b.finish();
//
// The builder owns the Program under construction until finish() hands it out
// as an immutable shared Program.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "vm/Fault.hpp"
#include "vm/Program.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <unordered_map>

namespace ciphel::vm
{

class ProgramBuilder
{
  public:
    ProgramBuilder();

    /// @brief Label named @p name, declared on first use.
    LabelId label(const std::string &name);

    /// @brief Place label @p name at the current end of the program.
    /// @throws std::invalid_argument when the label was already placed.
    ProgramBuilder &place(const std::string &name);

    ProgramBuilder &nop();
    ProgramBuilder &pushBytes(std::span<const uint8_t> bytes);
    ProgramBuilder &pushU64(uint64_t value);
    ProgramBuilder &pushBool(bool value);
    ProgramBuilder &pop(uint64_t size);
    ProgramBuilder &dup(uint64_t size);
    ProgramBuilder &stackAlloc(uint64_t size);

    ProgramBuilder &locate(MemoryAddress address);
    ProgramBuilder &load(uint64_t size);
    ProgramBuilder &store(uint64_t size);

    ProgramBuilder &heapAlloc(uint64_t size);
    ProgramBuilder &heapFree();
    ProgramBuilder &heapRealloc(uint64_t size);
    ProgramBuilder &vecNew(uint64_t itemSize);
    ProgramBuilder &vecPush(uint64_t itemSize);
    ProgramBuilder &vecPop(uint64_t itemSize);
    ProgramBuilder &vecGet(uint64_t itemSize);
    ProgramBuilder &vecLen();

    ProgramBuilder &add();
    ProgramBuilder &sub();
    ProgramBuilder &mul();
    ProgramBuilder &div();
    ProgramBuilder &mod();
    ProgramBuilder &eq();
    ProgramBuilder &lt();
    ProgramBuilder &logicalNot();

    ProgramBuilder &jump(const std::string &target);
    ProgramBuilder &branchIfNot(const std::string &target);
    ProgramBuilder &call(const std::string &target, uint64_t paramSize);
    ProgramBuilder &ret(uint64_t returnSize);

    ProgramBuilder &tryStart(const std::string &handler);
    ProgramBuilder &tryEnd();
    ProgramBuilder &raise(FaultKind kind);

    /// @brief Spawn a thread entering at @p entry; an empty name spawns an
    ///        idle thread the host loads code into.
    ProgramBuilder &spawn(const std::string &entry = {});
    ProgramBuilder &exit();
    ProgramBuilder &close();
    ProgramBuilder &wait();
    ProgramBuilder &wake();
    ProgramBuilder &sleep();
    ProgramBuilder &join();

    ProgramBuilder &print(uint64_t size);
    ProgramBuilder &printStr();
    ProgramBuilder &readLine();

    ProgramBuilder &callExtern(uint64_t index);

    /// @brief Hand out the finished program and reset the builder.
    std::shared_ptr<const Program> finish();

  private:
    ProgramBuilder &emit(CasmOpcode op, uint64_t size = 0, LabelId label = kNoLabel);

    std::unique_ptr<Program> program_;
    std::unordered_map<std::string, LabelId> labels_;
};

} // namespace ciphel::vm
