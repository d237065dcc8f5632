#pragma once
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace gsynth {

inline std::uintmax_t file_size_bytes(const std::filesystem::path& p) {
    std::error_code ec;
    auto sz = std::filesystem::file_size(p, ec);
    return ec ? 0u : static_cast<std::uintmax_t>(sz);
}

struct OutputFile {
    std::filesystem::path path;
    std::uintmax_t bytes = 0;
    bool partial = false;   // "<name>.txt.partial" left by an interrupted run

    double mb() const { return static_cast<double>(bytes) / (1024.0 * 1024.0); }
};

// Every edge-list file under `root` (".txt" and ".partial"), sorted by path.
// A missing root yields an empty listing.
inline std::vector<OutputFile> list_output_files(const std::filesystem::path& root) {
    namespace fs = std::filesystem;
    std::vector<OutputFile> files;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) return files;

    for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        const auto ext = it->path().extension();
        if (ext != ".txt" && ext != ".partial") continue;
        files.push_back(OutputFile{ it->path(), file_size_bytes(it->path()), ext == ".partial" });
    }
    std::sort(files.begin(), files.end(),
              [](const OutputFile& a, const OutputFile& b) { return a.path < b.path; });
    return files;
}

}
