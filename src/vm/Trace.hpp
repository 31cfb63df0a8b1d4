//===----------------------------------------------------------------------===//
//
// Part of the Ciphel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Trace.hpp
// Purpose: Declare tracing configuration and the sink for executed
//          instructions and scheduling events.
// Key invariants: Trace output is deterministic and line-oriented; tracing
//                 never changes execution results.
// Ownership/Lifetime: The sink borrows the output stream named in its config.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string_view>

namespace ciphel::vm
{

class Program;

/// @brief Configuration for runtime tracing.
struct TraceConfig
{
    /// @brief Tracing modes.
    enum Mode
    {
        Off,   ///< Tracing disabled
        Casm,  ///< Trace every executed instruction and scheduling event
        Sched, ///< Trace scheduling events only
    } mode{Off};

    /// @brief Destination stream; std::cerr when null.
    std::ostream *stream = nullptr;

    /// @brief Check whether tracing is enabled.
    bool enabled() const;
};

/// @brief Sink that formats and emits trace lines.
class TraceSink
{
  public:
    explicit TraceSink(TraceConfig cfg = {});

    /// @brief Record execution of instruction @p cursor of @p program by @p tid.
    void onStep(uint64_t tid, std::size_t cursor, const Program &program);

    /// @brief Record a scheduling event of thread @p tid.
    void onEvent(uint64_t tid, std::string_view what);

    /// @brief Record a tick boundary.
    void onTick(uint64_t tick, std::string_view phase);

    const TraceConfig &config() const
    {
        return cfg;
    }

  private:
    std::ostream &out() const;

    TraceConfig cfg; ///< Active configuration
};

} // namespace ciphel::vm
