#pragma once
#include <CLI/CLI.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "../gen/gen_result.hpp"
#include "../util/cancel.hpp"

namespace gsynth {

struct AppOptions {
    std::string command;                     // plan | random | stream | scale-free | grid | chain | verify

    // Shared
    std::string config = "config/gsynth.toml";
    std::optional<std::uint64_t> seed;
    double      attempt_factor = 3.0;
    std::int64_t chunk_bytes = 1048576;      // 1 MiB write buffer / read chunk

    // plan
    std::string output_root = "data";
    std::vector<std::string> tiers;          // empty = all
    std::string on_failure = "abort";        // abort | continue
    std::string manifest;                    // default <output_root>/manifest.json
    std::string summary_template;            // empty = built-in table
    bool        no_report = false;

    // single generators
    std::uint64_t nodes = 0;
    std::uint64_t edges = 0;
    std::uint64_t degree = 5;
    std::uint64_t rows = 0;
    std::uint64_t cols = 0;
    std::string   out;
    bool          strict_count = false;

    // verify
    std::string input;
    bool        check_duplicates = false;

    GenOptions gen_options(const cancel_token* cancel) const {
        GenOptions g;
        g.attempt_factor = attempt_factor;
        g.strict_count = strict_count;
        g.buffer_bytes = static_cast<std::size_t>(chunk_bytes);
        g.cancel = cancel;
        return g;
    }
};

// Thrown by parse_cli when the process should exit right away (--help,
// --version, bad arguments). CLI11 has already printed the message.
struct cli_exit {
    int code = 0;
};

inline AppOptions parse_cli(int argc, const char* const* argv) {
    AppOptions opt;
    CLI::App app{"gsynth: synthetic graph edge-list generator"};
    app.set_version_flag("--version", "0.1.0");
    app.require_subcommand(1);
    app.fallthrough();

    // Shared
    std::uint64_t seed_value = 0;
    app.set_config("--config", opt.config, "Read options from a TOML file");
    auto* seed_opt = app.add_option("--seed", seed_value, "Base random seed (default: drawn from the OS)");
    app.add_option("--attempt-factor", opt.attempt_factor,
                   "Uniform generator draw budget, as a multiple of the edge count")->default_val(3.0);
    app.add_option("--chunk-bytes", opt.chunk_bytes, "Write buffer / read chunk size (bytes)");

    // plan
    auto* plan = app.add_subcommand("plan", "Generate the standard small/medium/large/heavy corpus");
    plan->add_option("--output-root", opt.output_root, "Output directory root")->default_val("data");
    plan->add_option("--tiers", opt.tiers, "Tiers to generate (default: all)")
        ->delimiter(',')
        ->check(CLI::IsMember({"small", "medium", "large", "heavy"}));
    plan->add_option("--on-failure", opt.on_failure,
                     "What to do when an entry fails: abort the plan, or continue with the rest")
        ->default_val("abort")
        ->check(CLI::IsMember({"abort", "continue"}));
    plan->add_option("--manifest", opt.manifest, "manifest.json path (default: <output-root>/manifest.json)");
    plan->add_option("--summary-template", opt.summary_template, "Mustache template for summary.md");
    plan->add_flag("--no-report", opt.no_report, "Skip manifest.json and summary.md");

    // single generators
    auto* random = app.add_subcommand("random", "Uniform random graph, no duplicate edges");
    random->add_option("-n,--nodes", opt.nodes, "Number of nodes (>= 2)")->required();
    random->add_option("-e,--edges", opt.edges, "Number of edges")->required();
    random->add_option("-o,--out", opt.out, "Output edge-list path")->required();

    auto* stream = app.add_subcommand("stream", "Uniform random graph streamed without dedup");
    stream->add_option("-n,--nodes", opt.nodes, "Number of nodes (>= 2)")->required();
    stream->add_option("-e,--edges", opt.edges, "Number of draws")->required();
    stream->add_option("-o,--out", opt.out, "Output edge-list path")->required();
    stream->add_flag("--strict-count", opt.strict_count, "Redraw self-loops so exactly --edges lines are written");

    auto* scale_free = app.add_subcommand("scale-free", "Approximate scale-free graph (hub attachment)");
    scale_free->add_option("-n,--nodes", opt.nodes, "Number of nodes (>= 1)")->required();
    scale_free->add_option("-d,--degree", opt.degree, "Random links per node besides the hub link")->default_val(5);
    scale_free->add_option("-o,--out", opt.out, "Output edge-list path")->required();

    auto* grid = app.add_subcommand("grid", "2D grid graph (right and down links)");
    grid->add_option("-r,--rows", opt.rows, "Rows (>= 1)")->required();
    grid->add_option("-c,--cols", opt.cols, "Columns (>= 1)")->required();
    grid->add_option("-o,--out", opt.out, "Output edge-list path")->required();

    auto* chain = app.add_subcommand("chain", "Chain graph 0 -> 1 -> ... -> n-1");
    chain->add_option("-n,--nodes", opt.nodes, "Number of nodes (>= 1)")->required();
    chain->add_option("-o,--out", opt.out, "Output edge-list path")->required();

    // verify
    auto* verify = app.add_subcommand("verify", "Check an edge-list file against the format");
    verify->add_option("-i,--input", opt.input, "Edge-list file")->required()->check(CLI::ExistingFile);
    verify->add_flag("--check-duplicates", opt.check_duplicates, "Also count repeated (src, dst) pairs");

    try {
        app.parse(argc, argv);

        // --- Validation ---
        if (!(opt.attempt_factor > 0.0))
            throw CLI::ValidationError{"attempt-factor", "must be > 0"};
        if (opt.chunk_bytes <= 0)
            throw CLI::ValidationError{"chunk-bytes", "must be > 0"};
    } catch (const CLI::ParseError& e) {
        throw cli_exit{app.exit(e)};
    }

    if (seed_opt->count() > 0) opt.seed = seed_value;
    opt.command = app.get_subcommands().front()->get_name();
    return opt;
}

}
