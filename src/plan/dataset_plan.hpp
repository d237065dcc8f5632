#pragma once
#include <fmt/format.h>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../gen/request.hpp"
#include "../io/file_stats.hpp"
#include "../util/cancel.hpp"
#include "../util/errors.hpp"
#include "../util/random_source.hpp"

namespace gsynth {

enum class tier { small, medium, large, heavy };

inline const char* to_string(tier t) {
    switch (t) {
        case tier::small:  return "small";
        case tier::medium: return "medium";
        case tier::large:  return "large";
        default:           return "heavy";
    }
}

inline std::optional<tier> parse_tier(std::string_view s) {
    if (s == "small")  return tier::small;
    if (s == "medium") return tier::medium;
    if (s == "large")  return tier::large;
    if (s == "heavy")  return tier::heavy;
    return std::nullopt;
}

struct PlanEntry {
    tier level = tier::small;
    std::string name;
    GenerationRequest request;
};

// The benchmark corpus, in run order. Paths are <root>/<tier>/<name>.txt.
inline std::vector<PlanEntry> standard_plan(const std::filesystem::path& root) {
    auto entry = [&root](tier t, const char* name, GenerationRequest req) {
        req.path = root / to_string(t) / (std::string(name) + ".txt");
        return PlanEntry{ t, name, std::move(req) };
    };
    auto uniform = [](std::uint64_t n, std::uint64_t e) {
        GenerationRequest r; r.kind = topology::uniform_random; r.num_nodes = n; r.num_edges = e; return r;
    };
    auto streaming = [](std::uint64_t n, std::uint64_t e) {
        GenerationRequest r; r.kind = topology::streaming_random; r.num_nodes = n; r.num_edges = e; return r;
    };
    auto scale_free = [](std::uint64_t n, std::uint64_t d) {
        GenerationRequest r; r.kind = topology::scale_free; r.num_nodes = n; r.avg_degree = d; return r;
    };
    auto grid = [](std::uint64_t rows, std::uint64_t cols) {
        GenerationRequest r; r.kind = topology::grid; r.rows = rows; r.cols = cols; return r;
    };
    auto chain = [](std::uint64_t n) {
        GenerationRequest r; r.kind = topology::chain; r.num_nodes = n; return r;
    };

    return {
        entry(tier::small,  "random_1k",       uniform(1'000, 5'000)),
        entry(tier::small,  "random_10k",      uniform(10'000, 50'000)),
        entry(tier::small,  "chain_10k",       chain(10'000)),

        entry(tier::medium, "random_100k",     uniform(100'000, 500'000)),
        entry(tier::medium, "scale_free_100k", scale_free(100'000, 5)),
        entry(tier::medium, "grid_100k",       grid(316, 316)),
        entry(tier::medium, "chain_100k",      chain(100'000)),

        entry(tier::large,  "random_1m",       uniform(1'000'000, 5'000'000)),
        entry(tier::large,  "scale_free_1m",   scale_free(1'000'000, 5)),

        // 100M nodes: too big to dedup, hence the streaming generator
        entry(tier::heavy,  "random_100m",     streaming(100'000'000, 500'000'000)),
        entry(tier::heavy,  "scale_free_100m", scale_free(100'000'000, 5)),
        entry(tier::heavy,  "chain_100m",      chain(100'000'000)),
        entry(tier::heavy,  "grid_100m",       grid(10'000, 10'000)),
    };
}

enum class failure_policy { abort, keep_going };

inline const char* to_string(failure_policy p) {
    return p == failure_policy::abort ? "abort" : "continue";
}

inline std::optional<failure_policy> parse_failure_policy(std::string_view s) {
    if (s == "abort")    return failure_policy::abort;
    if (s == "continue") return failure_policy::keep_going;
    return std::nullopt;
}

struct PlanOptions {
    std::optional<std::uint64_t> seed;   // base seed; drawn from the OS when absent
    std::vector<tier> tiers;             // empty = every tier
    failure_policy on_failure = failure_policy::abort;
    GenOptions gen;
};

enum class entry_status { ok, failed, cancelled, skipped };

inline const char* to_string(entry_status s) {
    switch (s) {
        case entry_status::ok:        return "ok";
        case entry_status::failed:    return "failed";
        case entry_status::cancelled: return "cancelled";
        default:                      return "skipped";
    }
}

struct EntryOutcome {
    PlanEntry entry;
    std::uint64_t seed = 0;
    entry_status status = entry_status::skipped;
    std::optional<GenResult> result;
    std::string error;
};

struct PlanReport {
    std::uint64_t base_seed = 0;
    failure_policy on_failure = failure_policy::abort;
    std::vector<EntryOutcome> outcomes;
    bool aborted = false;
    bool cancelled = false;

    std::size_t count(entry_status s) const {
        std::size_t n = 0;
        for (const auto& o : outcomes) if (o.status == s) ++n;
        return n;
    }
    bool succeeded() const { return !aborted && !cancelled && count(entry_status::failed) == 0; }
};

inline bool tier_selected(const PlanOptions& opt, tier t) {
    if (opt.tiers.empty()) return true;
    for (tier s : opt.tiers) if (s == t) return true;
    return false;
}

// Runs the selected entries in order.
// - Entry i of the full catalogue is seeded with derive_seed(base, i), so
//   filtering tiers never changes the bytes of a selected entry.
// - invalid_parameter / io_error fail only that entry; on_failure decides
//   whether the rest still run. Other exceptions propagate.
// - Progress goes to `log` when non-null.
inline PlanReport run_plan(const std::vector<PlanEntry>& plan,
                           const PlanOptions& opt,
                           std::FILE* log = nullptr)
{
    PlanReport report;
    report.base_seed = opt.seed ? *opt.seed : random_source().seed();
    report.on_failure = opt.on_failure;

    bool stop = false;
    std::optional<tier> last_tier;
    for (std::size_t i = 0; i < plan.size(); ++i) {
        const PlanEntry& e = plan[i];
        if (!tier_selected(opt, e.level)) continue;

        EntryOutcome outcome;
        outcome.entry = e;
        outcome.seed = random_source::derive_seed(report.base_seed, i);

        if (stop) {
            report.outcomes.push_back(std::move(outcome));
            continue;
        }

        if (log) {
            if (last_tier != e.level)
                fmt::print(log, "{}{} graphs:\n", last_tier ? "\n" : "", to_string(e.level));
            last_tier = e.level;
            fmt::print(log, "{}... ", describe(e.request));
            std::fflush(log);
        }

        try {
            random_source rng(outcome.seed);
            GenResult r = run_request(e.request, rng, opt.gen);
            if (r.cancelled) {
                outcome.status = entry_status::cancelled;
                report.cancelled = true;
                stop = true;
                if (log) fmt::print(log, "CANCELLED ({} edges kept in {})\n", r.edges_written, r.path.string());
            } else {
                outcome.status = entry_status::ok;
                if (log) {
                    if (r.shortfall > 0)
                        fmt::print(log, "(wrote only {} edges, graph may be too dense) ", r.edges_written);
                    fmt::print(log, "OK {}\n", r.path.string());
                }
            }
            outcome.result = std::move(r);
        } catch (const invalid_parameter& ex) {
            outcome.status = entry_status::failed;
            outcome.error = ex.what();
        } catch (const io_error& ex) {
            outcome.status = entry_status::failed;
            outcome.error = ex.what();
        }

        if (outcome.status == entry_status::failed) {
            if (log) fmt::print(log, "FAILED: {}\n", outcome.error);
            if (opt.on_failure == failure_policy::abort) {
                report.aborted = true;
                stop = true;
            }
        }
        report.outcomes.push_back(std::move(outcome));
    }
    return report;
}

// Size table of everything under `root`, one line per file.
inline void print_file_sizes(std::FILE* out, const std::vector<OutputFile>& files) {
    for (const auto& f : files) {
        fmt::print(out, "  {:<45} {:>8.2f} MB{}\n", f.path.string(), f.mb(), f.partial ? "  (partial)" : "");
    }
}

}
