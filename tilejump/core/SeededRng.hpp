#pragma once

#include <cstdint>

namespace tilejump::core
{
// Deterministic 64-bit LCG with a splitmix-style seed scramble.
// Identical seeds produce identical streams on every platform.
class SeededRng
{
public:
    static constexpr std::uint64_t kMultiplier = 6364136223846793005ULL;
    static constexpr std::uint64_t kIncrement = 1ULL;

    explicit SeededRng(std::uint32_t seed);

    // Advances the state and returns its high 32 bits.
    std::uint32_t Next();

    // Value in [min, max). Returns min unchanged when the range is empty.
    std::uint32_t Range(std::uint32_t min, std::uint32_t max);

    [[nodiscard]] std::uint64_t State() const { return m_state; }

    [[nodiscard]] static std::uint64_t MixSeed(std::uint32_t seed);

private:
    std::uint64_t m_state;
};
} // namespace tilejump::core
