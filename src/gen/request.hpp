#pragma once
#include <fmt/format.h>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "gen_result.hpp"
#include "lattice.hpp"
#include "random_graph.hpp"
#include "scale_free.hpp"
#include "../util/random_source.hpp"

namespace gsynth {

enum class topology { uniform_random, streaming_random, scale_free, grid, chain };

inline const char* to_string(topology t) {
    switch (t) {
        case topology::uniform_random:   return "random";
        case topology::streaming_random: return "stream";
        case topology::scale_free:       return "scale-free";
        case topology::grid:             return "grid";
        default:                         return "chain";
    }
}

inline std::optional<topology> parse_topology(std::string_view s) {
    if (s == "random")     return topology::uniform_random;
    if (s == "stream")     return topology::streaming_random;
    if (s == "scale-free") return topology::scale_free;
    if (s == "grid")       return topology::grid;
    if (s == "chain")      return topology::chain;
    return std::nullopt;
}

// One generation run. Only the fields of `kind` are read:
//   uniform/streaming: num_nodes, num_edges
//   scale_free:        num_nodes, avg_degree
//   grid:              rows, cols
//   chain:             num_nodes
struct GenerationRequest {
    topology kind = topology::uniform_random;
    std::uint64_t num_nodes = 0;
    std::uint64_t num_edges = 0;
    std::uint64_t avg_degree = 0;
    std::uint64_t rows = 0;
    std::uint64_t cols = 0;
    std::filesystem::path path;
};

// Human-readable one-liner for progress output.
inline std::string describe(const GenerationRequest& req) {
    switch (req.kind) {
        case topology::uniform_random:
            return fmt::format("Random graph: {} nodes, {} edges", req.num_nodes, req.num_edges);
        case topology::streaming_random:
            return fmt::format("Random graph (streaming): {} nodes, {} edges", req.num_nodes, req.num_edges);
        case topology::scale_free:
            return fmt::format("Scale-free graph: {} nodes, avg_deg={}", req.num_nodes, req.avg_degree);
        case topology::grid:
            return fmt::format("Grid graph: {}x{} = {} nodes", req.rows, req.cols, req.rows * req.cols);
        default:
            return fmt::format("Chain graph: {} nodes", req.num_nodes);
    }
}

inline GenResult run_request(const GenerationRequest& req, random_source& rng, const GenOptions& opt = {}) {
    switch (req.kind) {
        case topology::uniform_random:
            return generate_uniform_random(rng, req.num_nodes, req.num_edges, req.path, opt);
        case topology::streaming_random:
            return generate_streaming_random(rng, req.num_nodes, req.num_edges, req.path, opt);
        case topology::scale_free:
            return generate_scale_free(rng, req.num_nodes, req.avg_degree, req.path, opt);
        case topology::grid:
            return generate_grid(req.rows, req.cols, req.path, opt);
        default:
            return generate_chain(req.num_nodes, req.path, opt);
    }
}

}
