#include "tilejump/core/SeededRng.hpp"

namespace tilejump::core
{
namespace
{
constexpr std::uint64_t kGoldenGamma = 0x9E3779B97F4A7C15ULL;
constexpr std::uint64_t kMixA = 0xBF58476D1CE4E5B9ULL;
constexpr std::uint64_t kMixB = 0x94D049BB133111EBULL;
} // namespace

std::uint64_t SeededRng::MixSeed(std::uint32_t seed)
{
    std::uint64_t state = static_cast<std::uint64_t>(seed) + kGoldenGamma;
    state = (state ^ (state >> 30U)) * kMixA;
    state = (state ^ (state >> 27U)) * kMixB;
    return state ^ (state >> 31U);
}

SeededRng::SeededRng(std::uint32_t seed) : m_state(MixSeed(seed))
{
}

std::uint32_t SeededRng::Next()
{
    m_state = m_state * kMultiplier + kIncrement;
    return static_cast<std::uint32_t>(m_state >> 32U);
}

std::uint32_t SeededRng::Range(std::uint32_t min, std::uint32_t max)
{
    if (min >= max)
    {
        return min;
    }
    return min + (Next() % (max - min));
}
} // namespace tilejump::core
