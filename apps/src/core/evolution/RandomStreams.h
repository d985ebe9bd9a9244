#pragma once

#include <cstdint>
#include <random>

namespace StackEvo {

// Independent random streams of one run. Each is keyed by the run seed, the generation and an
// index inside that generation, so draws never depend on evaluation or thread order.
enum class RngDomain : uint64_t {
    Seeding = 1,
    Selection = 2,
    Reproduction = 3,
    Immigration = 4,
};

inline uint64_t splitMix64(uint64_t x)
{
    x += 0x9e3779b97f4a7c15ULL;
    x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
    x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
    return x ^ (x >> 31);
}

inline uint64_t deriveSeed(uint64_t runSeed, RngDomain domain, uint64_t generation, uint64_t index)
{
    uint64_t h = splitMix64(runSeed);
    h = splitMix64(h ^ static_cast<uint64_t>(domain));
    h = splitMix64(h ^ generation);
    return splitMix64(h ^ index);
}

inline std::mt19937 makeStreamRng(
    uint64_t runSeed, RngDomain domain, uint64_t generation, uint64_t index)
{
    const uint64_t seed = deriveSeed(runSeed, domain, generation, index);
    std::seed_seq seq{ static_cast<uint32_t>(seed), static_cast<uint32_t>(seed >> 32) };
    return std::mt19937(seq);
}

} // namespace StackEvo
