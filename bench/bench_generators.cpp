#include "metrics/timers.hpp"
#include "metrics/process_stats.hpp"
#include "gen/request.hpp"
#include "io/file_stats.hpp"
#include <fmt/format.h>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <string>
#include <string_view>

using std::string;
namespace fs = std::filesystem;

int main(int argc, char** argv){
  // Defaults
  string kind = "random";
  std::uint64_t nodes = 100000;
  std::uint64_t edges = 500000;
  std::uint64_t seed  = 42;
  string outPath = "bench_out/graph.txt";
  bool keep = false;

  // Supported:
  //   --kind random|stream|scale-free|grid|chain
  //   --nodes <N>    (grid: rows)
  //   --edges <E>    (scale-free: degree; grid: cols)
  //   --seed <S>  --out <path>  --keep
  for (int i=1;i<argc;++i){
    std::string_view a(argv[i]);
    auto next_u64 = [&](std::string_view name, std::uint64_t* out)->bool{
      if (i+1<argc){ *out = std::stoull(argv[++i]); return true; }
      fmt::print(stderr, "missing value for {}\n", name);
      return false;
    };

    if (a == "--kind") {
      if (i+1>=argc){ fmt::print(stderr, "missing value for --kind\n"); return 2; }
      kind = argv[++i];
    } else if (a == "--nodes") {
      if (!next_u64("--nodes", &nodes)) return 2;
    } else if (a == "--edges") {
      if (!next_u64("--edges", &edges)) return 2;
    } else if (a == "--seed") {
      if (!next_u64("--seed", &seed)) return 2;
    } else if (a == "--out") {
      if (i+1>=argc){ fmt::print(stderr, "missing value for --out\n"); return 2; }
      outPath = argv[++i];
    } else if (a == "--keep") {
      keep = true;
    } else {
      fmt::print(stderr,
        "usage:\n"
        "  gsynth_bench [--kind random|stream|scale-free|grid|chain] [--nodes N] [--edges E]\n"
        "               [--seed S] [--out path] [--keep]\n");
      return 2;
    }
  }

  const auto topo = gsynth::parse_topology(kind);
  if (!topo){
    fmt::print(stderr, "unknown kind: {}\n", kind);
    return 2;
  }

  gsynth::GenerationRequest req;
  req.kind = *topo;
  req.num_nodes = nodes;
  req.num_edges = edges;
  req.avg_degree = edges;
  req.rows = nodes;
  req.cols = edges;
  req.path = outPath;

  gsynth::random_source rng(seed);
  gsynth::GenResult res;
  gsynth::WallTimer wt; wt.start();
  try {
    res = gsynth::run_request(req, rng);
  } catch (const std::exception& e) {
    fmt::print(stderr, "ERROR: {}\n", e.what());
    return 2;
  }
  wt.stop();

  const double secs = wt.secs();
  const double mb   = double(res.bytes)/(1024.0*1024.0);
  const double mbps = secs>0? (mb/secs) : 0.0;
  const double eps  = secs>0? (double(res.edges_written)/secs) : 0.0;

  // rss_mb is sampled after the generator returned, so it shows what the
  // dedup set leaves behind; rss_peak_mb includes it at its largest.
  fmt::print("bench_generators,kind={},nodes={},edges={},bytes={},sec={:.3f},MB/s={:.2f},edges/s={:.0f},rss_mb={:.1f},rss_peak_mb={:.1f}\n",
             kind, res.nodes, res.edges_written, res.bytes, secs, mbps, eps,
             gsynth::process_rss_mb(), gsynth::process_peak_rss_mb());

  if (!keep){
    std::error_code ec;
    fs::remove(res.path, ec);
  }
  return 0;
}
