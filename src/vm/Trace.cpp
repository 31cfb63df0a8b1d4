//===----------------------------------------------------------------------===//
//
// Part of the Ciphel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Trace.cpp
// Purpose: Implement deterministic tracing of Casm execution and scheduler
//          activity.
// Key invariants: Each call emits at most one flushed line and honours
//                 @ref TraceConfig::mode.
// Ownership/Lifetime: Trace sinks emit to externally owned streams.
//
//===----------------------------------------------------------------------===//

#include "vm/Trace.hpp"

#include "vm/Program.hpp"

#include <iostream>

namespace ciphel::vm
{

/// @brief Determine whether tracing output should be emitted.
bool TraceConfig::enabled() const
{
    return mode != Off;
}

TraceSink::TraceSink(TraceConfig cfg) : cfg(cfg) {}

std::ostream &TraceSink::out() const
{
    return cfg.stream ? *cfg.stream : std::cerr;
}

/// @details Only the Casm mode reports individual instructions. The line
///          format is "[tid T] #I MNEMONIC operands".
void TraceSink::onStep(uint64_t tid, std::size_t cursor, const Program &program)
{
    if (cfg.mode != TraceConfig::Casm)
        return;
    out() << "[tid " << tid << "] #" << cursor << ' ' << program.disassemble(cursor) << std::endl;
}

void TraceSink::onEvent(uint64_t tid, std::string_view what)
{
    if (!cfg.enabled())
        return;
    out() << "[tid " << tid << "] " << what << std::endl;
}

void TraceSink::onTick(uint64_t tick, std::string_view phase)
{
    if (!cfg.enabled())
        return;
    out() << "[tick " << tick << "] " << phase << std::endl;
}

} // namespace ciphel::vm
