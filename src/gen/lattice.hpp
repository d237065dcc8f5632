#pragma once
#include <fmt/format.h>
#include <cstdint>
#include <filesystem>

#include "gen_result.hpp"

namespace gsynth {

// Edge count of a rows x cols grid with right and down links.
inline std::uint64_t grid_edge_count(std::uint64_t rows, std::uint64_t cols) {
    return rows * (cols - 1) + cols * (rows - 1);
}

// 2D grid, row-major ids (i * cols + j). Each cell links to its right
// neighbour, then to the one below. Deterministic and edge-unique.
inline GenResult generate_grid(std::uint64_t rows,
                               std::uint64_t cols,
                               const std::filesystem::path& out,
                               const GenOptions& opt = {})
{
    if (rows < 1 || cols < 1)
        throw invalid_parameter(fmt::format("grid graph needs rows >= 1 and cols >= 1 (got {}x{})", rows, cols));
    if (rows > UINT64_MAX / cols)
        throw invalid_parameter(fmt::format("grid graph: {}x{} overflows the node id range", rows, cols));
    detail::check_gen_options(opt);

    WallTimer wt; wt.start();
    GenResult r = detail::start_result("grid", out, rows * cols, grid_edge_count(rows, cols));
    edge_sink sink(out, fmt::format("// Grid graph: {}x{}", rows, cols), opt.buffer_bytes);

    bool cancelled = false;
    for (std::uint64_t i = 0; i < rows && !cancelled; ++i) {
        for (std::uint64_t j = 0; j < cols; ++j) {
            if (detail::cancel_requested(opt)) { cancelled = true; break; }
            const std::uint64_t node = i * cols + j;
            if (j + 1 < cols) sink.write_edge(node, node + 1);
            if (i + 1 < rows) sink.write_edge(node, node + cols);
        }
    }

    return detail::finish(sink, r, cancelled, wt);
}

// Path 0 -> 1 -> ... -> num_nodes-1. Maximal depth with no branching, the
// worst case for frontier-parallel traversals.
inline GenResult generate_chain(std::uint64_t num_nodes,
                                const std::filesystem::path& out,
                                const GenOptions& opt = {})
{
    if (num_nodes < 1)
        throw invalid_parameter("chain graph needs num_nodes >= 1");
    detail::check_gen_options(opt);

    WallTimer wt; wt.start();
    GenResult r = detail::start_result("chain", out, num_nodes, num_nodes - 1);
    edge_sink sink(out, fmt::format("// Chain graph: {} nodes", num_nodes), opt.buffer_bytes);

    bool cancelled = false;
    for (std::uint64_t i = 0; i + 1 < num_nodes; ++i) {
        if (detail::cancel_requested(opt)) { cancelled = true; break; }
        sink.write_edge(i, i + 1);
    }

    return detail::finish(sink, r, cancelled, wt);
}

}
