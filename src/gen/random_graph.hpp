#pragma once
#include <fmt/format.h>
#include <algorithm>
#include <cstdint>
#include <filesystem>

#include "dedup_guard.hpp"
#include "gen_result.hpp"
#include "../util/random_source.hpp"

namespace gsynth {

// Draw budget for the uniform generator. Saturates instead of wrapping.
inline std::uint64_t attempt_budget(std::uint64_t num_edges, double attempt_factor) {
    const double budget = static_cast<double>(num_edges) * attempt_factor;
    if (budget >= 18446744073709551615.0) return UINT64_MAX;
    return static_cast<std::uint64_t>(budget);
}

// Uniform random directed graph without self-loops or duplicate pairs.
// Rejection-samples (src, dst) until num_edges are accepted, the draw budget
// runs out, or every distinct pair has been written; a shortfall is reported,
// not thrown.
inline GenResult generate_uniform_random(random_source& rng,
                                         std::uint64_t num_nodes,
                                         std::uint64_t num_edges,
                                         const std::filesystem::path& out,
                                         const GenOptions& opt = {})
{
    if (num_nodes < 2)
        throw invalid_parameter(fmt::format("random graph needs num_nodes >= 2 (got {})", num_nodes));
    if (num_nodes > dedup_guard::max_node_count)
        throw invalid_parameter(fmt::format("random graph: num_nodes {} exceeds the dedup id range", num_nodes));
    detail::check_gen_options(opt);

    const std::uint64_t max_attempts = attempt_budget(num_edges, opt.attempt_factor);
    // Distinct ordered pairs without self-loops; num_nodes <= 2^32 keeps this in range.
    const std::uint64_t max_pairs = num_nodes * (num_nodes - 1);
    const std::uint64_t expected = std::min({ num_edges, max_pairs, max_attempts });

    WallTimer wt; wt.start();
    GenResult r = detail::start_result("random", out, num_nodes, num_edges);
    edge_sink sink(out, fmt::format("// Random graph: {} nodes, {} edges", num_nodes, num_edges),
                   opt.buffer_bytes);
    dedup_guard seen(static_cast<std::size_t>(expected));

    bool cancelled = false;
    while (sink.edges_written() < num_edges && r.attempts < max_attempts && seen.size() < max_pairs) {
        if (detail::cancel_requested(opt)) { cancelled = true; break; }
        const std::uint64_t src = rng.next_in_range(num_nodes);
        const std::uint64_t dst = rng.next_in_range(num_nodes);
        ++r.attempts;
        if (src != dst && seen.try_insert(src, dst)) {
            sink.write_edge(src, dst);
        }
    }

    detail::finish(sink, r, cancelled, wt);
    if (!cancelled) r.shortfall = num_edges - r.edges_written;
    return r;
}

// Streaming variant for graphs too large to deduplicate: exactly num_edges
// iterations, O(1) memory. A self-loop draw skips its iteration, so slightly
// fewer than num_edges lines come out (about num_edges / num_nodes fewer), and
// duplicate pairs are kept. With opt.strict_count the self-loop is redrawn
// inside the iteration instead and exactly num_edges lines are written.
inline GenResult generate_streaming_random(random_source& rng,
                                           std::uint64_t num_nodes,
                                           std::uint64_t num_edges,
                                           const std::filesystem::path& out,
                                           const GenOptions& opt = {})
{
    if (num_nodes < 2)
        throw invalid_parameter(fmt::format("streaming random graph needs num_nodes >= 2 (got {})", num_nodes));
    detail::check_gen_options(opt);

    WallTimer wt; wt.start();
    GenResult r = detail::start_result("random_streaming", out, num_nodes, num_edges);
    edge_sink sink(out, fmt::format("// Random graph (streaming): {} nodes, {} edges", num_nodes, num_edges),
                   opt.buffer_bytes);

    bool cancelled = false;
    for (std::uint64_t i = 0; i < num_edges; ++i) {
        if (detail::cancel_requested(opt)) { cancelled = true; break; }
        std::uint64_t src = rng.next_in_range(num_nodes);
        std::uint64_t dst = rng.next_in_range(num_nodes);
        ++r.attempts;
        while (src == dst && opt.strict_count) {
            src = rng.next_in_range(num_nodes);
            dst = rng.next_in_range(num_nodes);
            ++r.attempts;
        }
        if (src != dst) sink.write_edge(src, dst);
    }

    return detail::finish(sink, r, cancelled, wt);
}

}
