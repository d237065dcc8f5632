#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

#include "../io/edge_sink.hpp"
#include "../metrics/timers.hpp"
#include "../util/cancel.hpp"
#include "../util/errors.hpp"

namespace gsynth {

// Knobs shared by every generator.
struct GenOptions {
    // Uniform generator: draw budget = attempt_factor * num_edges. Termination
    // on dense requests depends on it, so it is a knob rather than a constant.
    double attempt_factor = 3.0;
    // Streaming generator: redraw self-loops so exactly num_edges are written.
    bool strict_count = false;
    std::size_t buffer_bytes = edge_sink::default_buffer_bytes;
    const cancel_token* cancel = nullptr;
};

struct GenResult {
    std::string topology;             // "random" | "random_streaming" | "scale_free" | "grid" | "chain"
    std::filesystem::path path;       // final file; "<out>.partial" when cancelled
    std::uint64_t nodes = 0;
    std::uint64_t nominal_edges = 0;  // edge count the request asks for (upper bound for scale-free)
    std::uint64_t edges_written = 0;
    std::uint64_t attempts = 0;       // random draws of edge endpoints
    std::uint64_t shortfall = 0;      // uniform generator only: budget ran out first
    std::uintmax_t bytes = 0;
    double elapsed_ms = 0.0;
    bool cancelled = false;

    bool complete() const noexcept { return !cancelled; }
};

namespace detail {

inline bool cancel_requested(const GenOptions& opt) noexcept {
    return opt.cancel != nullptr && opt.cancel->requested();
}

inline void check_gen_options(const GenOptions& opt) {
    if (!(opt.attempt_factor > 0.0)) throw invalid_parameter("attempt_factor must be > 0");
    if (opt.buffer_bytes == 0) throw invalid_parameter("buffer_bytes must be > 0");
}

inline GenResult start_result(const char* topology,
                              const std::filesystem::path& out,
                              std::uint64_t nodes,
                              std::uint64_t nominal_edges) {
    GenResult r;
    r.topology = topology;
    r.path = out;
    r.nodes = nodes;
    r.nominal_edges = nominal_edges;
    return r;
}

// Closes the sink (or flags it partial on cancellation) and fills in the counters.
inline GenResult& finish(edge_sink& sink, GenResult& r, bool cancelled, WallTimer& wt) {
    r.edges_written = sink.edges_written();
    if (cancelled) {
        r.cancelled = true;
        r.path = sink.abandon();
    } else {
        sink.close();
    }
    r.bytes = sink.bytes_written();
    wt.stop();
    r.elapsed_ms = wt.ms();
    return r;
}

}

}
