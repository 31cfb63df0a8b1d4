//===----------------------------------------------------------------------===//
//
// Part of the Ciphel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/ciphel/vm/Runner.hpp
// Purpose: Declare a lightweight facade for running a program on the Ciphel
//          runtime without exposing scheduler internals.
// Key invariants: The facade owns its runtime and forwards every operation
//                 without altering its semantics.
// Ownership/Lifetime: Runner owns the runtime; the program is shared with the
//                     root thread.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "vm/Config.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace ciphel::vm
{
class Program;
class Runtime;

/// @brief Lightweight facade owning a runtime with one root thread.
class Runner
{
  public:
    /// @brief Aggregate status after a step or a run.
    enum class RunStatus
    {
        Idle,    ///< No live thread has anything left to do.
        Running, ///< Some thread can still make progress.
        Blocked, ///< Live threads exist but all wait for a wake-up or input.
        Faulted, ///< The last tick ended with an uncaught fault.
    };

    /// @brief Build a runtime from @p config and spawn the root thread over
    ///        @p program.
    /// @throws std::invalid_argument when @p config is invalid.
    explicit Runner(std::shared_ptr<const Program> program, RuntimeConfig config = {});

    ~Runner();

    Runner(const Runner &) = delete;
    Runner &operator=(const Runner &) = delete;
    Runner(Runner &&) noexcept;
    Runner &operator=(Runner &&) noexcept;

    /// @brief Execute exactly one scheduler tick.
    RunStatus step();

    /// @brief Tick until the runtime is idle, blocked or faulted.
    /// @param maxTicks Tick limit; zero disables the limit.
    RunStatus run(uint64_t maxTicks = 0);

    /// @brief Queue one line of standard input.
    void pushInput(std::string line);

    /// @brief Drain the captured standard output.
    [[nodiscard]] std::string takeOutput();

    /// @brief Number of ticks executed so far.
    [[nodiscard]] uint64_t ticks() const;

    /// @brief Message describing the last uncaught fault, if any.
    [[nodiscard]] std::optional<std::string> lastFaultMessage() const;

    /// @brief Access the underlying runtime for host integrations.
    Runtime &runtime();

  private:
    class Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace ciphel::vm
