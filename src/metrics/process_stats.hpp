#pragma once
#include <cstdint>

#if defined(_WIN32)
  #include <windows.h>
  #include <psapi.h>
#else
  #include <sys/resource.h>
  #include <unistd.h>
  #include <fstream>
#endif

namespace gsynth {

// Current resident set size in MiB (0 when unavailable).
inline double process_rss_mb() {
#if defined(_WIN32)
    PROCESS_MEMORY_COUNTERS_EX pmc{};
    if (GetProcessMemoryInfo(GetCurrentProcess(),
                             reinterpret_cast<PROCESS_MEMORY_COUNTERS*>(&pmc),
                             sizeof(pmc))) {
        return static_cast<double>(pmc.WorkingSetSize) / (1024.0 * 1024.0);
    }
    return 0.0;
#else
    long rss_pages = 0L;
    long ignore = 0L;
    std::ifstream f("/proc/self/statm");
    if (f) {
        f >> ignore >> rss_pages;
    }
    const long page = sysconf(_SC_PAGESIZE);
    return (rss_pages > 0 && page > 0)
        ? (static_cast<double>(rss_pages) * static_cast<double>(page)) / (1024.0 * 1024.0)
        : 0.0;
#endif
}

// High-water RSS of the process in MiB. The dedup set of the uniform
// generator dominates this on large tiers.
inline double process_peak_rss_mb() {
#if defined(_WIN32)
    PROCESS_MEMORY_COUNTERS pmc{};
    if (GetProcessMemoryInfo(GetCurrentProcess(), &pmc, sizeof(pmc))) {
        return static_cast<double>(pmc.PeakWorkingSetSize) / (1024.0 * 1024.0);
    }
    return 0.0;
#else
    rusage ru{};
    if (getrusage(RUSAGE_SELF, &ru) != 0) return 0.0;
  #if defined(__APPLE__)
    return static_cast<double>(ru.ru_maxrss) / (1024.0 * 1024.0);  // bytes
  #else
    return static_cast<double>(ru.ru_maxrss) / 1024.0;             // KiB
  #endif
#endif
}

}
