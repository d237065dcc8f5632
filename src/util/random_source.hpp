#pragma once
#include <cstdint>
#include <optional>
#include <random>

#include "errors.hpp"

namespace gsynth {

// Seedable uniform integer source. Generators never touch global random state;
// every draw goes through one of these.
class random_source {
public:
    explicit random_source(std::optional<std::uint64_t> seed = std::nullopt)
        : seed_(seed ? *seed : fresh_seed()), rng_(seed_) {}

    // Uniform over [0, n).
    std::uint64_t next_in_range(std::uint64_t n) {
        if (n == 0) throw invalid_parameter("next_in_range: n must be >= 1");
        std::uniform_int_distribution<std::uint64_t> dist(0, n - 1);
        return dist(rng_);
    }

    // Seed in effect, also when it was drawn from the OS.
    std::uint64_t seed() const noexcept { return seed_; }

    // splitmix64 over (base, stream): independent seeds for sub-tasks that
    // must not depend on each other's draw counts.
    static std::uint64_t derive_seed(std::uint64_t base, std::uint64_t stream) noexcept {
        std::uint64_t z = base + 0x9E3779B97F4A7C15ull * (stream + 1);
        z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ull;
        z = (z ^ (z >> 27)) * 0x94D049BB133111EBull;
        return z ^ (z >> 31);
    }

private:
    static std::uint64_t fresh_seed() {
        std::random_device rd;
        return (static_cast<std::uint64_t>(rd()) << 32) ^ static_cast<std::uint64_t>(rd());
    }

    std::uint64_t seed_;
    std::mt19937_64 rng_;
};

}
