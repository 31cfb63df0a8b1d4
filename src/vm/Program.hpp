//===----------------------------------------------------------------------===//
//
// Part of the Ciphel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Program.hpp
// Purpose: Ordered Casm instruction list with its label table.
// Key invariants: A placed label maps to the index of its LABEL marker;
//                 declared-but-unplaced labels resolve to CodeSegmentation.
// Ownership/Lifetime: Threads share an immutable Program through
//                     std::shared_ptr<const Program>.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "vm/Casm.hpp"
#include "vm/Fault.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ciphel::vm
{

class Program
{
  public:
    /// @brief Register a label without placing it.
    LabelId declareLabel(std::string name);

    /// @brief Emit the LABEL marker for @p label at the current end.
    /// @return CodeSegmentation for an undeclared or already placed label.
    VmResult<void> placeLabel(LabelId label);

    /// @brief Declare and immediately place a label.
    LabelId pushLabel(std::string name);

    void append(CasmInstr instr);

    /// @brief Index of the LABEL marker of @p label.
    VmResult<std::size_t> cursorOf(LabelId label) const;

    /// @brief Name given to @p label, or an empty view when unknown.
    std::string_view labelName(LabelId label) const;

    /// @brief Instruction at @p index, or nullptr past the end.
    const CasmInstr *at(std::size_t index) const
    {
        return index < instructions_.size() ? &instructions_[index] : nullptr;
    }

    std::size_t size() const
    {
        return instructions_.size();
    }

    bool empty() const
    {
        return instructions_.empty();
    }

    /// @brief One-line rendering of instruction @p index for traces.
    std::string disassemble(std::size_t index) const;

  private:
    struct LabelEntry
    {
        std::string name;
        std::optional<std::size_t> index;
    };

    std::vector<CasmInstr> instructions_;
    std::vector<LabelEntry> labels_;
};

} // namespace ciphel::vm
