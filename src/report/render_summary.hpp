#pragma once
#include <mustache.hpp>
#include <fmt/format.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "emit_manifest_json.hpp"
#include "../io/file_stats.hpp"
#include "../plan/dataset_plan.hpp"
#include "../util/errors.hpp"

#if defined(_WIN32)
  #include <windows.h>
#elif defined(__APPLE__)
  #include <mach-o/dyld.h>
#endif

namespace gsynth {

// Used when no template file is given.
inline constexpr const char* default_summary_template =
R"(# Graph dataset summary

- started: {{started_at}}
- wall time: {{wall_s}} s
- base seed: {{base_seed}} (rerun with `--seed {{base_seed}}` to reproduce)
- failure policy: {{on_failure}}
{{#aborted}}
- **plan aborted after a failed entry**
{{/aborted}}
{{#cancelled}}
- **plan cancelled; incomplete output is flagged `.partial`**
{{/cancelled}}

| tier | name | topology | status | nodes | edges | MB | ms |
|---|---|---|---|---:|---:|---:|---:|
{{#entries}}
| {{tier}} | {{{name}}} | {{topology}} | {{status}} | {{nodes}} | {{edges}}{{#short}} (short by {{shortfall}}){{/short}} | {{mb}} | {{ms}} |
{{/entries}}
{{#has_errors}}

## Errors

{{#entries}}
{{#error}}
- {{{name}}}: {{{error}}}
{{/error}}
{{/entries}}
{{/has_errors}}

## Files

{{#files}}
- `{{{path}}}` {{mb}} MB{{#partial}} (partial){{/partial}}
{{/files}}
)";

// ---------- utils ----------
inline std::filesystem::path exe_dir() {
#if defined(_WIN32)
    wchar_t buf[MAX_PATH]{};
    const DWORD len = GetModuleFileNameW(nullptr, buf, MAX_PATH);
    if (len == 0 || len == MAX_PATH) return std::filesystem::current_path();
    return std::filesystem::path(buf).parent_path();
#elif defined(__APPLE__)
    uint32_t size = 0;
    _NSGetExecutablePath(nullptr, &size);
    std::string tmp(size, '\0');
    if (_NSGetExecutablePath(tmp.data(), &size) != 0) return std::filesystem::current_path();
    return std::filesystem::path(tmp).parent_path();
#else
    std::error_code ec;
    auto p = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) return std::filesystem::current_path();
    return p.parent_path();
#endif
}

// Exact path first, then <exe_dir>/templates/<name>, then <cwd>/templates/<name>.
inline std::filesystem::path resolve_template(const std::filesystem::path& requested) {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (fs::is_regular_file(requested, ec)) return requested;

    const fs::path name = requested.filename();
    std::string tried = "  - " + requested.string() + "\n";
    for (const fs::path& c : { exe_dir() / "templates" / name, fs::current_path() / "templates" / name }) {
        if (fs::is_regular_file(c, ec)) return c;
        tried += "  - " + c.string() + "\n";
    }
    throw io_error("Template not found. Looked at:\n" + tried);
}

inline kainjow::mustache::data summary_context(const RunInfo& run,
                                               const PlanReport& report,
                                               const std::vector<OutputFile>& files)
{
    using kainjow::mustache::data;
    using kainjow::mustache::list;
    using kainjow::mustache::object;

    list entries;
    bool has_errors = false;
    for (const auto& o : report.outcomes) {
        object e{
            {"tier",     to_string(o.entry.level)},
            {"name",     o.entry.name},
            {"topology", to_string(o.entry.request.kind)},
            {"status",   to_string(o.status)},
        };
        if (o.result) {
            const auto& r = *o.result;
            e["nodes"] = data(std::to_string(r.nodes));
            e["edges"] = data(std::to_string(r.edges_written));
            e["short"] = data(r.shortfall > 0);
            e["shortfall"] = data(std::to_string(r.shortfall));
            e["mb"] = data(fmt::format("{:.2f}", static_cast<double>(r.bytes) / (1024.0 * 1024.0)));
            e["ms"] = data(fmt::format("{:.0f}", r.elapsed_ms));
        } else {
            e["nodes"] = data("-");
            e["edges"] = data("-");
            e["short"] = data(false);
            e["mb"] = data("-");
            e["ms"] = data("-");
        }
        if (!o.error.empty()) {
            e["error"] = data(o.error);
            has_errors = true;
        }
        entries.push_back(data(e));
    }

    list file_list;
    for (const auto& f : files) {
        file_list.push_back(data(object{
            {"path",    f.path.generic_string()},
            {"mb",      fmt::format("{:.2f}", f.mb())},
            {"partial", f.partial},
        }));
    }

    data ctx;
    ctx.set("started_at", data(run.started_iso));
    ctx.set("wall_s",     data(fmt::format("{:.1f}", run.wall_ms / 1000.0)));
    ctx.set("base_seed",  data(std::to_string(report.base_seed)));
    ctx.set("on_failure", data(to_string(report.on_failure)));
    ctx.set("aborted",    data(report.aborted));
    ctx.set("cancelled",  data(report.cancelled));
    ctx.set("has_errors", data(has_errors));
    ctx.set("entries",    data(entries));
    ctx.set("files",      data(file_list));
    return ctx;
}

/**
 * Renders the plan summary (Markdown) through Mustache.
 *
 * @param template_path  Template file, or empty for the built-in table.
 *                       Resolved like resolve_template().
 */
inline void render_summary(const std::filesystem::path& template_path,
                           const RunInfo& run,
                           const PlanReport& report,
                           const std::vector<OutputFile>& files,
                           const std::filesystem::path& out_md)
{
    std::string tmpl = default_summary_template;
    if (!template_path.empty()) {
        const auto resolved = resolve_template(template_path);
        std::ifstream tf(resolved, std::ios::binary);
        if (!tf) throw io_error("Failed to read template: " + resolved.string());
        std::ostringstream tss; tss << tf.rdbuf();
        tmpl = tss.str();
    }

    kainjow::mustache::mustache m{tmpl};
    if (!m.is_valid()) throw std::runtime_error("Mustache template parse error: " + m.error_message());

    const std::string rendered = m.render(summary_context(run, report, files));

    std::ofstream out(out_md, std::ios::binary);
    if (!out) throw io_error("Failed to write: " + out_md.string());
    out << rendered;
}

}
