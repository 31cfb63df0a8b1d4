//===----------------------------------------------------------------------===//
//
// Part of the Ciphel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/StdIO.hpp
// Purpose: Host-facing standard input and output buffers.
// Key invariants: Input lines are consumed in the order the host pushed them.
// Ownership/Lifetime: Owned by the Runtime; drained by the host.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace ciphel::vm
{

class StdIO
{
  public:
    /// @brief Append program output.
    void write(std::string_view text)
    {
        out_.append(text);
    }

    /// @brief Hand the buffered output to the host and clear it.
    std::string takeOutput()
    {
        std::string drained;
        drained.swap(out_);
        return drained;
    }

    /// @brief Queue one input line supplied by the host.
    void pushInput(std::string line)
    {
        in_.push_back(std::move(line));
    }

    bool hasInput() const
    {
        return !in_.empty();
    }

    /// @brief Next input line, or nothing when the host has not supplied one.
    std::optional<std::string> takeLine()
    {
        if (in_.empty())
            return std::nullopt;
        std::string line = std::move(in_.front());
        in_.pop_front();
        return line;
    }

  private:
    std::string out_;
    std::deque<std::string> in_;
};

} // namespace ciphel::vm
