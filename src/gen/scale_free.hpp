#pragma once
#include <fmt/format.h>
#include <algorithm>
#include <cstdint>
#include <filesystem>

#include "gen_result.hpp"
#include "../util/random_source.hpp"

namespace gsynth {

// Hubs are the lowest 5% of ids, at least one.
inline std::uint64_t scale_free_hub_count(std::uint64_t num_nodes) {
    return std::min(std::max<std::uint64_t>(1, num_nodes / 20), num_nodes);
}

// Approximate scale-free graph: every node links to one random hub plus
// avg_degree uniform targets. Hub in-degree ends up near num_nodes / num_hubs.
// This is degree skew by construction, not power-law sampling. No dedup:
// repeated targets and parallel hub edges are written as drawn.
inline GenResult generate_scale_free(random_source& rng,
                                     std::uint64_t num_nodes,
                                     std::uint64_t avg_degree,
                                     const std::filesystem::path& out,
                                     const GenOptions& opt = {})
{
    if (num_nodes < 1)
        throw invalid_parameter("scale-free graph needs num_nodes >= 1");
    if (avg_degree >= UINT64_MAX / num_nodes)
        throw invalid_parameter(fmt::format("scale-free graph: {} nodes x degree {} overflows", num_nodes, avg_degree));
    detail::check_gen_options(opt);

    const std::uint64_t num_hubs = scale_free_hub_count(num_nodes);

    WallTimer wt; wt.start();
    GenResult r = detail::start_result("scale_free", out, num_nodes, num_nodes * (avg_degree + 1));
    edge_sink sink(out, fmt::format("// Approximate scale-free graph: {} nodes", num_nodes), opt.buffer_bytes);

    bool cancelled = false;
    for (std::uint64_t v = 0; v < num_nodes; ++v) {
        if (detail::cancel_requested(opt)) { cancelled = true; break; }

        const std::uint64_t hub = rng.next_in_range(num_hubs);
        ++r.attempts;
        if (hub != v) sink.write_edge(v, hub);

        for (std::uint64_t k = 0; k < avg_degree; ++k) {
            const std::uint64_t target = rng.next_in_range(num_nodes);
            ++r.attempts;
            if (target != v) sink.write_edge(v, target);
        }
    }

    return detail::finish(sink, r, cancelled, wt);
}

}
