#include <fmt/format.h>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <string>
#include <system_error>

#include "../cli/cli_options.hpp"
#include "../gen/request.hpp"
#include "../io/edge_scan.hpp"
#include "../io/file_stats.hpp"
#include "../metrics/process_stats.hpp"
#include "../metrics/timers.hpp"
#include "../plan/dataset_plan.hpp"
#include "../report/emit_manifest_json.hpp"
#include "../report/render_summary.hpp"
#include "../util/cancel.hpp"
#include "../util/errors.hpp"

namespace fs = std::filesystem;

namespace {

constexpr int kExitOk        = 0;
constexpr int kExitUsage     = 1;
constexpr int kExitIo        = 2;
constexpr int kExitInvalid   = 3;
constexpr int kExitInternal  = 4;
constexpr int kExitCancelled = 130;

std::string now_iso_utc() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buf);
}

const std::string kRule(70, '=');

gsynth::GenerationRequest request_from(const gsynth::AppOptions& opt) {
    gsynth::GenerationRequest req;
    const auto kind = gsynth::parse_topology(opt.command);
    if (!kind) throw gsynth::invalid_parameter("unknown generator: " + opt.command);
    req.kind = *kind;
    req.num_nodes = opt.nodes;
    req.num_edges = opt.edges;
    req.avg_degree = opt.degree;
    req.rows = opt.rows;
    req.cols = opt.cols;
    req.path = opt.out;
    return req;
}

int run_single(const gsynth::AppOptions& opt, const gsynth::GenOptions& gen) {
    const auto req = request_from(opt);
    gsynth::random_source rng(opt.seed);

    fmt::print("{}... ", gsynth::describe(req));
    std::fflush(stdout);
    const gsynth::GenResult r = gsynth::run_request(req, rng, gen);

    if (r.cancelled) {
        fmt::print("\n");
        fmt::print(stderr, "WARN: cancelled after {} edges; partial output kept at {}\n",
                   r.edges_written, r.path.string());
        return kExitCancelled;
    }
    if (r.shortfall > 0)
        fmt::print("(wrote only {} edges, graph may be too dense) ", r.edges_written);
    fmt::print("OK {}\n", r.path.string());
    fmt::print("  edges={} bytes={} time={:.0f} ms seed={}\n", r.edges_written, r.bytes, r.elapsed_ms, rng.seed());
    return kExitOk;
}

int run_plan_command(const gsynth::AppOptions& opt, const gsynth::GenOptions& gen) {
    gsynth::PlanOptions po;
    po.seed = opt.seed;
    po.gen = gen;
    const auto policy = gsynth::parse_failure_policy(opt.on_failure);
    if (!policy) throw gsynth::invalid_parameter("unknown failure policy: " + opt.on_failure);
    po.on_failure = *policy;
    for (const auto& t : opt.tiers) {
        const auto parsed = gsynth::parse_tier(t);
        if (!parsed) throw gsynth::invalid_parameter("unknown tier: " + t);
        po.tiers.push_back(*parsed);
    }

    const fs::path root = opt.output_root;

    fmt::print("{}\nGraph dataset generator\n{}\n", kRule, kRule);

    gsynth::WallTimer wt_all; wt_all.start();
    gsynth::RunInfo run;
    run.started_iso = now_iso_utc();

    const gsynth::PlanReport report = gsynth::run_plan(gsynth::standard_plan(root), po, stdout);

    wt_all.stop();
    run.ended_iso = now_iso_utc();
    run.wall_ms = wt_all.ms();
    run.rss_peak_mb = gsynth::process_peak_rss_mb();

    fmt::print("\n{}\n{}\n{}\n", kRule, report.succeeded() ? "Done!" : "Finished with problems.", kRule);
    const auto files = gsynth::list_output_files(root);
    gsynth::print_file_sizes(stdout, files);
    fmt::print("base seed: {}\n", report.base_seed);

    if (!opt.no_report) {
        std::error_code ec;
        fs::create_directories(root, ec);
        if (ec) throw gsynth::io_error("cannot create " + root.string() + ": " + ec.message());

        const fs::path manifest = opt.manifest.empty() ? root / "manifest.json" : fs::path(opt.manifest);
        gsynth::emit_manifest_json(manifest, run, report, files);

        try {
            gsynth::render_summary(opt.summary_template, run, report, files, root / "summary.md");
        } catch (const std::exception& re) {
            fmt::print(stderr, "WARN: summary render failed: {}\n", re.what());
        }
    }

    if (report.cancelled) return kExitCancelled;
    if (!report.succeeded()) {
        fmt::print(stderr, "ERROR: {} plan entr{} failed{}\n",
                   report.count(gsynth::entry_status::failed),
                   report.count(gsynth::entry_status::failed) == 1 ? "y" : "ies",
                   report.aborted ? "; remaining entries skipped" : "");
        return kExitIo;
    }
    return kExitOk;
}

int run_verify(const gsynth::AppOptions& opt) {
    const auto scan = gsynth::scan_edge_list(opt.input, static_cast<std::size_t>(opt.chunk_bytes),
                                             opt.check_duplicates);

    fmt::print("file:       {}\n", opt.input);
    fmt::print("header:     {}\n", scan.has_header() ? scan.header : "(missing)");
    fmt::print("edges:      {}\n", scan.edges);
    fmt::print("max node:   {}\n", scan.max_node ? std::to_string(*scan.max_node) : std::string("-"));
    fmt::print("self-loops: {}\n", scan.self_loops);
    fmt::print("malformed:  {}", scan.malformed);
    if (scan.malformed > 0) fmt::print(" (first at line {})", scan.first_malformed_line);
    fmt::print("\n");
    if (scan.duplicates_checked) fmt::print("duplicates: {}\n", scan.duplicates);

    if (!scan.valid()) {
        fmt::print(stderr, "ERROR: {} is not a valid edge list\n", opt.input);
        return kExitInvalid;
    }
    fmt::print("OK {}\n", opt.input);
    return kExitOk;
}

}

int main(int argc, char** argv) try {
    const auto opt = gsynth::parse_cli(argc, argv);

    gsynth::cancel_token cancel;
    const gsynth::interrupt_scope interrupts(cancel);
    const gsynth::GenOptions gen = opt.gen_options(&cancel);

    if (opt.command == "plan")   return run_plan_command(opt, gen);
    if (opt.command == "verify") return run_verify(opt);
    return run_single(opt, gen);
}
catch (const gsynth::cli_exit& e) {
    // CLI11 already printed help / the error
    return e.code == 0 ? kExitOk : kExitUsage;
}
catch (const gsynth::invalid_parameter& e) {
    fmt::print(stderr, "ERROR: {}\n", e.what());
    return kExitInvalid;
}
catch (const gsynth::io_error& e) {
    fmt::print(stderr, "ERROR: {}\n", e.what());
    return kExitIo;
}
catch (const std::exception& e) {
    fmt::print(stderr, "ERROR: {}\n", e.what());
    return kExitInternal;
}
