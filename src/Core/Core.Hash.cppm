module;
#include <cstddef>
#include <cstdint>
#include <functional>

export module Core.Hash;

export namespace Core::Hash
{
    // MurmurHash3 fmix64 finalizer (very fast, high avalanche)
    constexpr uint64_t Mix64(uint64_t val) noexcept
    {
        val ^= val >> 33;
        val *= 0xff51afd7ed558ccd;
        val ^= val >> 33;
        val *= 0xc4ceb9fe1a85ec53;
        val ^= val >> 33;
        return val;
    }

    // Order-dependent: Combine(Combine(s, a), b) != Combine(Combine(s, b), a)
    constexpr std::size_t Combine(std::size_t seed, std::size_t value) noexcept
    {
        const uint64_t mixed = Mix64(static_cast<uint64_t>(value) + 0x9e3779b97f4a7c15ull
                                     + (static_cast<uint64_t>(seed) << 6) + (static_cast<uint64_t>(seed) >> 2));
        return static_cast<std::size_t>(static_cast<uint64_t>(seed) ^ mixed);
    }

    template <typename... Ts>
    std::size_t HashValues(const Ts&... values)
    {
        std::size_t seed = 0;
        ((seed = Combine(seed, std::hash<Ts>{}(values))), ...);
        return seed;
    }
}
