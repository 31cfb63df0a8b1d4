//===----------------------------------------------------------------------===//
//
// Part of the Ciphel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Casm.cpp
// Purpose: Opcode names and instruction weights.
//
//===----------------------------------------------------------------------===//

#include "vm/Casm.hpp"

namespace ciphel::vm
{

const char *opcodeName(CasmOpcode op)
{
    switch (op)
    {
        case CasmOpcode::NOP:
            return "NOP";
        case CasmOpcode::LABEL:
            return "LABEL";
        case CasmOpcode::PUSH:
            return "PUSH";
        case CasmOpcode::POP:
            return "POP";
        case CasmOpcode::DUP:
            return "DUP";
        case CasmOpcode::STACK_ALLOC:
            return "STACK_ALLOC";
        case CasmOpcode::LOCATE:
            return "LOCATE";
        case CasmOpcode::LOAD:
            return "LOAD";
        case CasmOpcode::STORE:
            return "STORE";
        case CasmOpcode::HEAP_ALLOC:
            return "HEAP_ALLOC";
        case CasmOpcode::HEAP_FREE:
            return "HEAP_FREE";
        case CasmOpcode::HEAP_REALLOC:
            return "HEAP_REALLOC";
        case CasmOpcode::VEC_NEW:
            return "VEC_NEW";
        case CasmOpcode::VEC_PUSH:
            return "VEC_PUSH";
        case CasmOpcode::VEC_POP:
            return "VEC_POP";
        case CasmOpcode::VEC_GET:
            return "VEC_GET";
        case CasmOpcode::VEC_LEN:
            return "VEC_LEN";
        case CasmOpcode::ADD:
            return "ADD";
        case CasmOpcode::SUB:
            return "SUB";
        case CasmOpcode::MUL:
            return "MUL";
        case CasmOpcode::DIV:
            return "DIV";
        case CasmOpcode::MOD:
            return "MOD";
        case CasmOpcode::EQ:
            return "EQ";
        case CasmOpcode::LT:
            return "LT";
        case CasmOpcode::NOT:
            return "NOT";
        case CasmOpcode::GOTO:
            return "GOTO";
        case CasmOpcode::BRANCH_IF_NOT:
            return "BRANCH_IF_NOT";
        case CasmOpcode::CALL:
            return "CALL";
        case CasmOpcode::RETURN:
            return "RETURN";
        case CasmOpcode::TRY_START:
            return "TRY_START";
        case CasmOpcode::TRY_END:
            return "TRY_END";
        case CasmOpcode::RAISE:
            return "RAISE";
        case CasmOpcode::SPAWN:
            return "SPAWN";
        case CasmOpcode::EXIT:
            return "EXIT";
        case CasmOpcode::CLOSE:
            return "CLOSE";
        case CasmOpcode::WAIT:
            return "WAIT";
        case CasmOpcode::WAKE:
            return "WAKE";
        case CasmOpcode::SLEEP:
            return "SLEEP";
        case CasmOpcode::JOIN:
            return "JOIN";
        case CasmOpcode::PRINT:
            return "PRINT";
        case CasmOpcode::PRINT_STR:
            return "PRINT_STR";
        case CasmOpcode::READ_LINE:
            return "READ_LINE";
        case CasmOpcode::EXTERN:
            return "EXTERN";
    }
    return "?";
}

Weight weightOf(const CasmInstr &instr, std::size_t stackSize)
{
    switch (instr.op)
    {
        case CasmOpcode::NOP:
        case CasmOpcode::LABEL:
        case CasmOpcode::TRY_START:
        case CasmOpcode::TRY_END:
        case CasmOpcode::EXIT:
            return Weight::zero();

        case CasmOpcode::LOAD:
        case CasmOpcode::STORE:
        case CasmOpcode::HEAP_FREE:
        case CasmOpcode::VEC_POP:
        case CasmOpcode::VEC_GET:
        case CasmOpcode::VEC_LEN:
        case CasmOpcode::PRINT:
        case CasmOpcode::PRINT_STR:
        case CasmOpcode::READ_LINE:
            return Weight::medium();

        case CasmOpcode::HEAP_ALLOC:
        case CasmOpcode::HEAP_REALLOC:
            return instr.size > stackSize / 10 ? Weight::extreme() : Weight::medium();

        case CasmOpcode::VEC_NEW:
        case CasmOpcode::VEC_PUSH:
            return Weight::medium();

        case CasmOpcode::SPAWN:
        case CasmOpcode::CLOSE:
        case CasmOpcode::WAIT:
        case CasmOpcode::WAKE:
        case CasmOpcode::SLEEP:
        case CasmOpcode::JOIN:
            return Weight::high();

        default:
            return Weight::low();
    }
}

} // namespace ciphel::vm
