//===----------------------------------------------------------------------===//
//
// Part of the Ciphel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Program.cpp
// Purpose: Label bookkeeping and disassembly for Casm programs.
//
//===----------------------------------------------------------------------===//

#include "vm/Program.hpp"

#include <utility>

namespace ciphel::vm
{

LabelId Program::declareLabel(std::string name)
{
    labels_.push_back(LabelEntry{std::move(name), std::nullopt});
    return labels_.size() - 1;
}

VmResult<void> Program::placeLabel(LabelId label)
{
    if (label >= labels_.size() || labels_[label].index)
        return fault(FaultKind::CodeSegmentation, static_cast<int64_t>(label));
    labels_[label].index = instructions_.size();
    CasmInstr marker;
    marker.op = CasmOpcode::LABEL;
    marker.label = label;
    instructions_.push_back(std::move(marker));
    return {};
}

LabelId Program::pushLabel(std::string name)
{
    const LabelId label = declareLabel(std::move(name));
    labels_[label].index = instructions_.size();
    CasmInstr marker;
    marker.op = CasmOpcode::LABEL;
    marker.label = label;
    instructions_.push_back(std::move(marker));
    return label;
}

void Program::append(CasmInstr instr)
{
    instructions_.push_back(std::move(instr));
}

VmResult<std::size_t> Program::cursorOf(LabelId label) const
{
    if (label >= labels_.size() || !labels_[label].index)
        return fault(FaultKind::CodeSegmentation, static_cast<int64_t>(label));
    return *labels_[label].index;
}

std::string_view Program::labelName(LabelId label) const
{
    if (label >= labels_.size())
        return {};
    return labels_[label].name;
}

std::string Program::disassemble(std::size_t index) const
{
    const CasmInstr *instr = at(index);
    if (!instr)
        return "<end>";

    std::string out = opcodeName(instr->op);
    switch (instr->op)
    {
        case CasmOpcode::PUSH:
            out.append(" ");
            out.append(std::to_string(instr->data.size()));
            out.append("B");
            break;
        case CasmOpcode::LOCATE:
            out.append(" ");
            out.append(toString(instr->address));
            break;
        case CasmOpcode::LABEL:
        case CasmOpcode::GOTO:
        case CasmOpcode::BRANCH_IF_NOT:
        case CasmOpcode::TRY_START:
            out.append(" ");
            out.append(labelName(instr->label));
            break;
        case CasmOpcode::CALL:
            out.append(" ");
            out.append(labelName(instr->label));
            out.append(" ");
            out.append(std::to_string(instr->size));
            break;
        case CasmOpcode::SPAWN:
            if (instr->label != kNoLabel)
            {
                out.append(" ");
                out.append(labelName(instr->label));
            }
            break;
        case CasmOpcode::RAISE:
            out.append(" ");
            out.append(toString(faultKindFromValue(static_cast<int64_t>(instr->size))));
            break;
        case CasmOpcode::NOP:
        case CasmOpcode::EXIT:
        case CasmOpcode::WAIT:
        case CasmOpcode::WAKE:
        case CasmOpcode::CLOSE:
        case CasmOpcode::SLEEP:
        case CasmOpcode::JOIN:
        case CasmOpcode::TRY_END:
        case CasmOpcode::HEAP_FREE:
        case CasmOpcode::VEC_LEN:
        case CasmOpcode::PRINT_STR:
        case CasmOpcode::READ_LINE:
        case CasmOpcode::ADD:
        case CasmOpcode::SUB:
        case CasmOpcode::MUL:
        case CasmOpcode::DIV:
        case CasmOpcode::MOD:
        case CasmOpcode::EQ:
        case CasmOpcode::LT:
        case CasmOpcode::NOT:
            break;
        default:
            out.append(" ");
            out.append(std::to_string(instr->size));
            break;
    }
    return out;
}

} // namespace ciphel::vm
