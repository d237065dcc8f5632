#pragma once
#include <cstddef>
#include <cstdint>
#include <unordered_set>

#include "../util/errors.hpp"

namespace gsynth {

// Set of (src, dst) pairs already emitted in the current run.
// Keys pack both ids into one 64-bit word, so ids must fit in 32 bits.
class dedup_guard {
public:
    static constexpr std::uint64_t max_node_count = std::uint64_t{1} << 32;

    explicit dedup_guard(std::size_t expected_pairs = 0) {
        if (expected_pairs > 0) seen_.reserve(expected_pairs);
    }

    // true on first occurrence (pair recorded), false if already seen.
    bool try_insert(std::uint64_t src, std::uint64_t dst) {
        return seen_.insert(pack(src, dst)).second;
    }

    bool contains(std::uint64_t src, std::uint64_t dst) const {
        return seen_.count(pack(src, dst)) != 0;
    }

    std::size_t size() const noexcept { return seen_.size(); }

private:
    static std::uint64_t pack(std::uint64_t src, std::uint64_t dst) {
        if (src >= max_node_count || dst >= max_node_count)
            throw invalid_parameter("dedup_guard: node id does not fit in 32 bits");
        return (src << 32) | dst;
    }

    std::unordered_set<std::uint64_t> seen_;
};

}
