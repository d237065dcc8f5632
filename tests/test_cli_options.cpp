#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "cli/cli_options.hpp"
#include "test_util.hpp"

using gsynth::AppOptions;
using gsynth::cli_exit;

namespace {

AppOptions parse(std::vector<const char*> args) {
    args.insert(args.begin(), "gsynth");
    return gsynth::parse_cli(static_cast<int>(args.size()), args.data());
}

int exit_code(std::vector<const char*> args) {
    try {
        parse(std::move(args));
    } catch (const cli_exit& e) {
        return e.code;
    }
    return -1;
}

}

TEST(CliOptions, RandomSubcommand) {
    const auto opt = parse({ "random", "-n", "1000", "-e", "5000", "-o", "out/g.txt", "--seed", "17" });
    EXPECT_EQ(opt.command, "random");
    EXPECT_EQ(opt.nodes, 1000u);
    EXPECT_EQ(opt.edges, 5000u);
    EXPECT_EQ(opt.out, "out/g.txt");
    ASSERT_TRUE(opt.seed.has_value());
    EXPECT_EQ(*opt.seed, 17u);
    EXPECT_DOUBLE_EQ(opt.attempt_factor, 3.0);
}

TEST(CliOptions, GlobalOptionsBeforeTheSubcommand) {
    const auto opt = parse({ "--attempt-factor", "1.5", "--chunk-bytes", "4096", "chain", "-n", "10", "-o", "c.txt" });
    EXPECT_EQ(opt.command, "chain");
    EXPECT_DOUBLE_EQ(opt.attempt_factor, 1.5);
    EXPECT_EQ(opt.chunk_bytes, 4096);
    EXPECT_FALSE(opt.seed.has_value());
}

TEST(CliOptions, PlanDefaults) {
    const auto opt = parse({ "plan" });
    EXPECT_EQ(opt.command, "plan");
    EXPECT_EQ(opt.output_root, "data");
    EXPECT_TRUE(opt.tiers.empty());
    EXPECT_EQ(opt.on_failure, "abort");
    EXPECT_FALSE(opt.no_report);
}

TEST(CliOptions, PlanTiersAreCommaSeparated) {
    const auto opt = parse({ "plan", "--tiers", "small,medium", "--on-failure", "continue", "--output-root", "/tmp/x" });
    EXPECT_EQ(opt.tiers, (std::vector<std::string>{ "small", "medium" }));
    EXPECT_EQ(opt.on_failure, "continue");
    EXPECT_EQ(opt.output_root, "/tmp/x");
}

TEST(CliOptions, StreamStrictCountAndScaleFreeDegree) {
    const auto s = parse({ "stream", "-n", "10", "-e", "20", "-o", "s.txt", "--strict-count" });
    EXPECT_TRUE(s.strict_count);
    const auto sf = parse({ "scale-free", "-n", "100", "-o", "sf.txt" });
    EXPECT_EQ(sf.degree, 5u);
    const auto g = parse({ "grid", "-r", "3", "-c", "4", "-o", "g.txt" });
    EXPECT_EQ(g.rows, 3u);
    EXPECT_EQ(g.cols, 4u);
}

TEST(CliOptions, RejectsBadValues) {
    EXPECT_NE(exit_code({ "plan", "--tiers", "small,huge" }), 0);
    EXPECT_NE(exit_code({ "plan", "--on-failure", "retry" }), 0);
    EXPECT_NE(exit_code({ "--attempt-factor", "0", "chain", "-n", "5", "-o", "c.txt" }), 0);
    EXPECT_NE(exit_code({ "--chunk-bytes", "0", "chain", "-n", "5", "-o", "c.txt" }), 0);
}

TEST(CliOptions, RequiresASubcommandAndItsArguments) {
    EXPECT_NE(exit_code({}), 0);
    EXPECT_NE(exit_code({ "random", "-n", "10", "-o", "g.txt" }), 0);
    EXPECT_NE(exit_code({ "bogus" }), 0);
}

TEST(CliOptions, HelpExitsWithZero) {
    EXPECT_EQ(exit_code({ "--help" }), 0);
}

TEST(CliOptions, ReadsConfigFile) {
    gsynth::test::temp_dir tmp;
    const auto cfg = (tmp / "gsynth.toml").string();
    gsynth::test::write_file(cfg, "seed = 42\nattempt-factor = 2.5\n");
    const auto opt = parse({ "--config", cfg.c_str(), "chain", "-n", "5", "-o", "c.txt" });
    ASSERT_TRUE(opt.seed.has_value());
    EXPECT_EQ(*opt.seed, 42u);
    EXPECT_DOUBLE_EQ(opt.attempt_factor, 2.5);
}

TEST(CliOptions, GenOptionsCarryTheKnobs) {
    const auto opt = parse({ "--attempt-factor", "4", "--chunk-bytes", "512",
                             "stream", "-n", "10", "-e", "20", "-o", "s.txt", "--strict-count" });
    gsynth::cancel_token cancel;
    const auto gen = opt.gen_options(&cancel);
    EXPECT_DOUBLE_EQ(gen.attempt_factor, 4.0);
    EXPECT_EQ(gen.buffer_bytes, 512u);
    EXPECT_TRUE(gen.strict_count);
    EXPECT_EQ(gen.cancel, &cancel);
}
