#include <gtest/gtest.h>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "gen/lattice.hpp"
#include "io/file_stats.hpp"
#include "test_util.hpp"

namespace fs = std::filesystem;
using gsynth::test::Edge;
using gsynth::test::read_edges;
using gsynth::test::read_file;
using gsynth::test::temp_dir;

TEST(Grid, TwoByTwoInGenerationOrder) {
    temp_dir tmp;
    const auto r = gsynth::generate_grid(2, 2, tmp / "g.txt");
    EXPECT_EQ(r.topology, "grid");
    EXPECT_EQ(r.nodes, 4u);
    EXPECT_EQ(r.edges_written, 4u);
    EXPECT_EQ(r.attempts, 0u);
    EXPECT_EQ(read_file(tmp / "g.txt"), "// Grid graph: 2x2\n0 1\n0 2\n1 3\n2 3\n");
}

TEST(Grid, EdgeCountMatchesFormula) {
    temp_dir tmp;
    const std::vector<std::pair<std::uint64_t, std::uint64_t>> shapes = {
        {1, 1}, {1, 5}, {5, 1}, {3, 4}, {316, 316},
    };
    for (const auto& [rows, cols] : shapes) {
        const auto out = tmp / ("g_" + std::to_string(rows) + "x" + std::to_string(cols) + ".txt");
        const auto r = gsynth::generate_grid(rows, cols, out);
        const std::uint64_t expected = rows * (cols - 1) + cols * (rows - 1);
        EXPECT_EQ(gsynth::grid_edge_count(rows, cols), expected);
        EXPECT_EQ(r.nominal_edges, expected);
        EXPECT_EQ(r.edges_written, expected) << rows << "x" << cols;
        EXPECT_EQ(read_edges(out).size(), expected);
    }
}

TEST(Grid, EdgesAreUniqueAndPointRightOrDown) {
    temp_dir tmp;
    const std::uint64_t rows = 7, cols = 9;
    gsynth::generate_grid(rows, cols, tmp / "g.txt");

    std::set<Edge> unique;
    std::map<std::uint64_t, int> out_deg;
    for (const auto& [src, dst] : read_edges(tmp / "g.txt")) {
        EXPECT_TRUE(dst == src + 1 || dst == src + cols) << src << " " << dst;
        if (dst == src + 1) EXPECT_NE(src % cols, cols - 1);
        EXPECT_LT(dst, rows * cols);
        unique.emplace(src, dst);
        ++out_deg[src];
    }
    EXPECT_EQ(unique.size(), gsynth::grid_edge_count(rows, cols));
    for (const auto& kv : out_deg) EXPECT_LE(kv.second, 2);
    // the bottom-right cell has no outgoing edge
    EXPECT_EQ(out_deg.count(rows * cols - 1), 0u);
}

TEST(Grid, RejectsZeroDimensions) {
    temp_dir tmp;
    EXPECT_THROW(gsynth::generate_grid(0, 5, tmp / "g.txt"), gsynth::invalid_parameter);
    EXPECT_THROW(gsynth::generate_grid(5, 0, tmp / "g.txt"), gsynth::invalid_parameter);
    EXPECT_FALSE(fs::exists(tmp / "g.txt"));
}

TEST(Chain, FiveNodes) {
    temp_dir tmp;
    const auto r = gsynth::generate_chain(5, tmp / "c.txt");
    EXPECT_EQ(r.topology, "chain");
    EXPECT_EQ(r.nominal_edges, 4u);
    EXPECT_EQ(r.edges_written, 4u);
    EXPECT_EQ(read_file(tmp / "c.txt"), "// Chain graph: 5 nodes\n0 1\n1 2\n2 3\n3 4\n");
}

TEST(Chain, SingleNodeWritesOnlyTheHeader) {
    temp_dir tmp;
    const auto r = gsynth::generate_chain(1, tmp / "c.txt");
    EXPECT_EQ(r.edges_written, 0u);
    EXPECT_EQ(read_file(tmp / "c.txt"), "// Chain graph: 1 nodes\n");
}

TEST(Chain, RejectsZeroNodes) {
    temp_dir tmp;
    EXPECT_THROW(gsynth::generate_chain(0, tmp / "c.txt"), gsynth::invalid_parameter);
    EXPECT_FALSE(fs::exists(tmp / "c.txt"));
}

TEST(Chain, CancellationLeavesPartialFile) {
    temp_dir tmp;
    gsynth::cancel_token cancel;
    cancel.request();
    gsynth::GenOptions opt;
    opt.cancel = &cancel;
    const auto r = gsynth::generate_chain(1000, tmp / "c.txt", opt);
    EXPECT_TRUE(r.cancelled);
    EXPECT_FALSE(r.complete());
    EXPECT_FALSE(fs::exists(tmp / "c.txt"));
    EXPECT_TRUE(fs::exists(tmp / "c.txt.partial"));
}

TEST(Chain, CancelMidRunKeepsWholeLines) {
    temp_dir tmp;
    const auto out = tmp / "c.txt";
    gsynth::cancel_token cancel;
    gsynth::GenOptions opt;
    opt.cancel = &cancel;
    opt.buffer_bytes = 64;

    // cancel once a few buffers have reached the disk
    std::thread stopper([&] {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(30);
        while (gsynth::file_size_bytes(out) < 4096 && std::chrono::steady_clock::now() < deadline)
            std::this_thread::sleep_for(std::chrono::microseconds(200));
        cancel.request();
    });
    const auto r = gsynth::generate_chain(5'000'000, out, opt);
    stopper.join();

    ASSERT_TRUE(r.cancelled);
    EXPECT_FALSE(fs::exists(out));
    ASSERT_EQ(r.path.string(), out.string() + ".partial");
    EXPECT_GT(r.edges_written, 0u);
    EXPECT_LT(r.edges_written, 4'999'999u);

    const std::string text = read_file(r.path);
    ASSERT_FALSE(text.empty());
    EXPECT_EQ(text.back(), '\n');
    EXPECT_EQ(text.size(), r.bytes);

    const auto lines = gsynth::test::read_lines(r.path);
    ASSERT_EQ(lines.size(), r.edges_written + 1);
    EXPECT_EQ(lines[0], "// Chain graph: 5000000 nodes");
    for (std::uint64_t i = 0; i < r.edges_written; ++i)
        ASSERT_EQ(lines[i + 1], std::to_string(i) + " " + std::to_string(i + 1));
}
