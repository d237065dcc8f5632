#pragma once
#include <fmt/format.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "../io/file_stats.hpp"
#include "../plan/dataset_plan.hpp"
#include "../util/errors.hpp"
#include "../util/json_escape.hpp"

namespace gsynth {

struct RunInfo {
    std::string started_iso;
    std::string ended_iso;
    double wall_ms = 0.0;
    double rss_peak_mb = 0.0;
};

// Writes manifest.json (schema v1): run info, one record per plan entry, and
// the size listing of the output root.
inline void emit_manifest_json(const std::filesystem::path& out_path,
                               const RunInfo& run,
                               const PlanReport& report,
                               const std::vector<OutputFile>& files)
{
    std::ofstream f(out_path, std::ios::binary);
    if (!f) throw io_error("Failed to open for write: " + out_path.string());

    f << "{\n";
    f << R"(  "version":"1",)"
      << "\n  " << fmt::format(R"("started_at":"{}",)", run.started_iso)
      << "\n  " << fmt::format(R"("ended_at":"{}",)", run.ended_iso)
      << "\n  " << fmt::format(R"("wall_time_ms":{},)", run.wall_ms)
      << "\n  " << fmt::format(R"("rss_peak_mb":{},)", run.rss_peak_mb)
      << "\n  " << fmt::format(R"("base_seed":{},)", report.base_seed)
      << "\n  " << fmt::format(R"("on_failure":"{}",)", to_string(report.on_failure))
      << "\n  " << fmt::format(R"("aborted":{},)", report.aborted)
      << "\n  " << fmt::format(R"("cancelled":{},)", report.cancelled);

    f << "\n  \"entries\":[\n";
    for (size_t i = 0; i < report.outcomes.size(); ++i) {
        const auto& o = report.outcomes[i];
        const auto& req = o.entry.request;
        f << "    {"
          << fmt::format(R"("tier":"{}","name":"{}","topology":"{}","seed":{},"status":"{}")",
                         to_string(o.entry.level), json_escape(o.entry.name), to_string(req.kind),
                         o.seed, to_string(o.status));
        if (o.result) {
            const auto& r = *o.result;
            f << fmt::format(R"(,"path":"{}","nodes":{},"nominal_edges":{},"edges":{},"attempts":{},"shortfall":{},"bytes":{},"ms":{:.3f})",
                             json_escape(r.path.generic_string()), r.nodes, r.nominal_edges, r.edges_written,
                             r.attempts, r.shortfall, r.bytes, r.elapsed_ms);
        } else {
            f << fmt::format(R"(,"path":"{}")", json_escape(req.path.generic_string()));
        }
        if (!o.error.empty()) f << fmt::format(R"(,"error":"{}")", json_escape(o.error));
        f << "}";
        if (i + 1 < report.outcomes.size()) f << ",";
        f << "\n";
    }
    f << "  ],\n";

    f << "  \"files\":[\n";
    for (size_t i = 0; i < files.size(); ++i) {
        const auto& file = files[i];
        f << "    "
          << fmt::format(R"({{"path":"{}","bytes":{},"partial":{}}})",
                         json_escape(file.path.generic_string()), file.bytes, file.partial);
        if (i + 1 < files.size()) f << ",";
        f << "\n";
    }
    f << "  ]\n";

    f << "}\n";
    if (!f) throw io_error("Failed to write: " + out_path.string());
}

}
