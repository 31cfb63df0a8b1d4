//===----------------------------------------------------------------------===//
//
// Part of the Ciphel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Weight.hpp
// Purpose: Declared execution cost of an instruction.
// Key invariants: units() is monotonic in the level order Zero < Low < Medium
//                 < High < Extreme; Custom carries its own unit count.
// Ownership/Lifetime: Value type.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <limits>

namespace ciphel::vm
{

/// @brief Relative cost charged against a scheduling budget.
class Weight
{
  public:
    enum class Level : uint8_t
    {
        Zero,
        Low,
        Medium,
        High,
        Extreme,
        Custom,
        Max,
    };

    static constexpr Weight zero()
    {
        return Weight(Level::Zero, 0);
    }

    static constexpr Weight low()
    {
        return Weight(Level::Low, 1);
    }

    static constexpr Weight medium()
    {
        return Weight(Level::Medium, 2);
    }

    static constexpr Weight high()
    {
        return Weight(Level::High, 4);
    }

    static constexpr Weight extreme()
    {
        return Weight(Level::Extreme, 8);
    }

    static constexpr Weight custom(uint64_t units)
    {
        return Weight(Level::Custom, units);
    }

    /// @brief Cost that no finite budget accepts.
    static constexpr Weight max()
    {
        return Weight(Level::Max, std::numeric_limits<uint64_t>::max());
    }

    constexpr Level level() const noexcept
    {
        return level_;
    }

    constexpr uint64_t units() const noexcept
    {
        return units_;
    }

    constexpr bool isZero() const noexcept
    {
        return units_ == 0;
    }

    constexpr bool operator==(const Weight &) const = default;

  private:
    constexpr Weight(Level level, uint64_t units) : level_(level), units_(units) {}

    Level level_;
    uint64_t units_;
};

} // namespace ciphel::vm
