#pragma once
#include <charconv>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "chunk_reader.hpp"
#include "../gen/dedup_guard.hpp"

namespace gsynth {

// Chunked validation pass over an edge-list file, without building the graph.
// - Line 1 must be a "//" comment (the header).
// - Every other line must be "<src> <dst>", decimal, single space.
// - CRLF is accepted. Blank lines are ignored.
// - A final line with no newline counts as malformed: generators only ever
//   write whole lines, so it means the file was cut short.
struct EdgeScan {
    std::string header;
    std::uint64_t edges = 0;
    std::uint64_t self_loops = 0;
    std::uint64_t malformed = 0;
    std::uint64_t first_malformed_line = 0;   // 1-based, 0 = none
    std::optional<std::uint64_t> max_node;
    bool duplicates_checked = false;
    std::uint64_t duplicates = 0;
    std::uint64_t bytes = 0;

    bool has_header() const noexcept { return !header.empty(); }
    bool valid() const noexcept {
        return has_header() && self_loops == 0 && malformed == 0 && duplicates == 0;
    }
};

inline bool parse_edge_line(std::string_view line, std::uint64_t& src, std::uint64_t& dst) {
    const char* p   = line.data();
    const char* end = line.data() + line.size();
    auto a = std::from_chars(p, end, src);
    if (a.ec != std::errc{} || a.ptr == p || a.ptr == end || *a.ptr != ' ') return false;
    const char* q = a.ptr + 1;
    auto b = std::from_chars(q, end, dst);
    return b.ec == std::errc{} && b.ptr != q && b.ptr == end;
}

inline EdgeScan scan_edge_list(const std::filesystem::path& path,
                               std::size_t chunk_bytes = 262144,
                               bool check_duplicates = false)
{
    chunk_reader reader(path, chunk_bytes);
    EdgeScan out;
    out.duplicates_checked = check_duplicates;

    dedup_guard seen;
    std::uint64_t line_no = 0;
    std::string carry;

    auto on_line = [&](std::string_view line) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

        if (line_no == 1 && line.substr(0, 2) == "//") {
            out.header = std::string(line);
            return;
        }
        if (line.empty()) return;

        std::uint64_t src = 0, dst = 0;
        if (!parse_edge_line(line, src, dst)) {
            if (out.malformed++ == 0) out.first_malformed_line = line_no;
            return;
        }
        ++out.edges;
        if (src == dst) ++out.self_loops;
        const std::uint64_t hi = src > dst ? src : dst;
        if (!out.max_node || hi > *out.max_node) out.max_node = hi;
        if (check_duplicates && !seen.try_insert(src, dst)) ++out.duplicates;
    };

    for (std::string_view chunk = reader.next(); !chunk.empty(); chunk = reader.next()) {
        std::size_t pos = 0;
        while (pos < chunk.size()) {
            const std::size_t nl = chunk.find('\n', pos);
            if (nl == std::string_view::npos) {
                carry.append(chunk.substr(pos));
                break;
            }
            if (carry.empty()) {
                on_line(chunk.substr(pos, nl - pos));
            } else {
                carry.append(chunk.substr(pos, nl - pos));
                on_line(carry);
                carry.clear();
            }
            pos = nl + 1;
        }
    }

    if (!carry.empty()) {
        ++line_no;
        if (out.malformed++ == 0) out.first_malformed_line = line_no;
    }

    out.bytes = reader.bytes_read();
    return out;
}

}
