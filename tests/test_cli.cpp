// File: tests/test_cli.cpp
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "cli_options.hpp"
#include "qs/adapters/csv/csv_catalog_source.hpp"
#include "qs/core/log/run_log.hpp"
#include "qs/core/model/decluster_runner.hpp"
#include "test_helpers.hpp"

using namespace qs;
using namespace qs::cli;
using qs::testing::write_file;

namespace {

Args args_of(std::initializer_list<const char*> words) {
  std::vector<const char*> argv{"qs_decluster"};
  argv.insert(argv.end(), words.begin(), words.end());
  return parse_args(static_cast<int>(argv.size()), argv.data());
}

}  // namespace

TEST(ParseArgs, CommandValuesAndSwitches) {
  const Args a = args_of({"decluster", "--input", "cat.csv", "--lenient", "--scale", "1.5"});
  EXPECT_TRUE(a.error.empty()) << a.error;
  EXPECT_FALSE(a.help);
  EXPECT_EQ(a.command, "decluster");
  EXPECT_EQ(a.opts.at("--input"), "cat.csv");
  EXPECT_EQ(a.opts.at("--lenient"), "");
  EXPECT_EQ(a.opts.at("--scale"), "1.5");
}

TEST(ParseArgs, Errors) {
  EXPECT_EQ(args_of({"decluster", "--input"}).error, "missing value for --input");
  EXPECT_EQ(args_of({"decluster", "cat.csv"}).error, "unexpected argument: cat.csv");
  EXPECT_TRUE(args_of({"--help"}).help);
  EXPECT_TRUE(args_of({"window", "-h"}).help);
  EXPECT_TRUE(args_of({}).command.empty());
}

TEST(ApplyCommand, ModelPresets) {
  const std::vector<std::pair<const char*, WindowModelKind>> cases = {
      {"decluster", WindowModelKind::kGkFormula},
      {"decluster-table", WindowModelKind::kGkTable},
      {"decluster-a1b", WindowModelKind::kFixed},
      {"decluster-reasenberg", WindowModelKind::kReasenberg},
  };
  for (const auto& [command, model] : cases) {
    Config cfg;
    ASSERT_TRUE(apply_command(args_of({command}), cfg).ok()) << command;
    EXPECT_EQ(cfg.engine.window.model, model) << command;
    EXPECT_EQ(cfg.engine.claim_mode, ClaimMode::kSingleClaim) << command;
    EXPECT_FALSE(cfg.output.attribution) << command;
  }
}

TEST(ApplyCommand, WindowIsScaledNearestInTimeWithAttribution) {
  Config cfg;
  ASSERT_TRUE(apply_command(args_of({"window", "--window-size", "1.25"}), cfg).ok());
  EXPECT_EQ(cfg.engine.window.model, WindowModelKind::kGkFormula);
  EXPECT_EQ(cfg.engine.claim_mode, ClaimMode::kNearestInTime);
  EXPECT_TRUE(cfg.output.attribution);
  EXPECT_DOUBLE_EQ(cfg.engine.window.scale, 1.25);
}

TEST(ApplyCommand, WindowRequiresWindowSize) {
  Config cfg;
  const Status s = apply_command(args_of({"window"}), cfg);
  EXPECT_EQ(s.code(), Status::Code::kInvalidArgument);
  EXPECT_NE(s.message().find("--window-size"), std::string::npos);

  EXPECT_EQ(apply_command(args_of({"window", "--window-size", "big"}), cfg).code(),
            Status::Code::kInvalidArgument);
}

TEST(ApplyCommand, RunKeepsConfigAndUnknownFails) {
  Config cfg;
  cfg.engine.window.model = WindowModelKind::kGkTable;
  ASSERT_TRUE(apply_command(args_of({"run"}), cfg).ok());
  EXPECT_EQ(cfg.engine.window.model, WindowModelKind::kGkTable);

  EXPECT_EQ(apply_command(args_of({"cluster"}), cfg).code(), Status::Code::kInvalidArgument);
}

TEST(ApplyOptions, EngineFlags) {
  Config cfg;
  const Args a = args_of({"decluster-a1b", "--radius", "50", "--window", "30", "--claim-mode",
                          "nearest_in_time", "--below-table", "reject", "--rfact", "8",
                          "--tau-min", "0.5", "--tau-max", "12", "--p-value", "0.9", "--xmeff",
                          "2", "--b-value", "1.1", "--attribution", "--no-log"});
  ASSERT_TRUE(apply_options(a, cfg).ok());
  EXPECT_DOUBLE_EQ(cfg.engine.window.fixed.spatial_km, 50.0);
  EXPECT_DOUBLE_EQ(cfg.engine.window.fixed.temporal_days, 30.0);
  EXPECT_EQ(cfg.engine.claim_mode, ClaimMode::kNearestInTime);
  EXPECT_EQ(cfg.engine.window.below_table, BelowTablePolicy::kReject);
  EXPECT_DOUBLE_EQ(cfg.engine.reasenberg.r_fact, 8.0);
  EXPECT_DOUBLE_EQ(cfg.engine.reasenberg.tau_min_days, 0.5);
  EXPECT_DOUBLE_EQ(cfg.engine.reasenberg.tau_max_days, 12.0);
  EXPECT_DOUBLE_EQ(cfg.engine.reasenberg.p, 0.9);
  EXPECT_DOUBLE_EQ(cfg.engine.reasenberg.xmeff, 2.0);
  EXPECT_DOUBLE_EQ(cfg.engine.reasenberg.b_value, 1.1);
  EXPECT_TRUE(cfg.output.attribution);
  EXPECT_FALSE(cfg.log.enabled);
}

TEST(ApplyOptions, BadValuesRejected) {
  Config cfg;
  EXPECT_EQ(apply_options(args_of({"decluster", "--scale", "1.5x"}), cfg).code(),
            Status::Code::kInvalidArgument);
  EXPECT_FALSE(apply_options(args_of({"decluster", "--claim-mode", "greedy"}), cfg).ok());
  EXPECT_FALSE(apply_options(args_of({"decluster", "--below-table", "extend"}), cfg).ok());
}

class BuildConfigTest : public qs::testing::TempDirTest {
 protected:
  void SetUp() override {
    TempDirTest::SetUp();
    config_file = path("base.yaml");
    write_file(config_file,
               "engine:\n"
               "  model: gk_table\n"
               "  scale: 1.5\n"
               "input:\n"
               "  type: csv\n"
               "  path: from_config.csv\n"
               "  strict: false\n"
               "output:\n"
               "  independent_path: cfg_main.csv\n"
               "  dependent_path: cfg_after.csv\n");
  }

  std::string config_file;
};

TEST_F(BuildConfigTest, RunUsesConfigFile) {
  Config cfg;
  std::string used;
  ASSERT_TRUE(build_config(args_of({"run", "--config", config_file.c_str()}), &cfg, &used).ok());
  EXPECT_EQ(used, config_file);
  EXPECT_EQ(cfg.engine.window.model, WindowModelKind::kGkTable);
  EXPECT_DOUBLE_EQ(cfg.engine.window.scale, 1.5);
  EXPECT_EQ(cfg.input.path, "from_config.csv");
  EXPECT_FALSE(cfg.input.strict);
}

TEST_F(BuildConfigTest, CommandAndFlagsOverrideConfigFile) {
  Config cfg;
  std::string used;
  const Args a = args_of({"decluster-reasenberg", "--config", config_file.c_str(), "--input",
                          "flag.csv", "--mainshocks", "m.csv", "--strict", "--rfact", "6"});
  ASSERT_TRUE(build_config(a, &cfg, &used).ok());
  EXPECT_EQ(cfg.engine.window.model, WindowModelKind::kReasenberg);
  EXPECT_DOUBLE_EQ(cfg.engine.reasenberg.r_fact, 6.0);
  EXPECT_EQ(cfg.input.path, "flag.csv");
  EXPECT_TRUE(cfg.input.strict);
  EXPECT_EQ(cfg.output.independent_path, "m.csv");
  EXPECT_EQ(cfg.output.dependent_path, "cfg_after.csv");
  EXPECT_DOUBLE_EQ(cfg.engine.window.scale, 1.5);
}

TEST_F(BuildConfigTest, FailureLeavesConfigUntouched) {
  Config cfg;
  cfg.input.path = "keep.csv";
  std::string used = "unchanged";

  const Args bad_scale = args_of({"run", "--config", config_file.c_str(), "--scale", "-1"});
  EXPECT_EQ(build_config(bad_scale, &cfg, &used).code(), Status::Code::kInvalidArgument);
  EXPECT_EQ(cfg.input.path, "keep.csv");
  EXPECT_EQ(used, "unchanged");

  const std::string missing = path("missing.yaml");
  EXPECT_EQ(build_config(args_of({"run", "--config", missing.c_str()}), &cfg, &used).code(),
            Status::Code::kNotFound);

  // Nothing supplies an input path.
  Config bare;
  EXPECT_EQ(build_config(args_of({"decluster", "--mainshocks", "m.csv", "--aftershocks",
                                  "a.csv"}),
                         &bare, &used)
                .code(),
            Status::Code::kInvalidArgument);
}

TEST(ExitCode, RunFailuresAreRunErrors) {
  EXPECT_EQ(exit_code_for_run(Status::ok_status()), kExitOk);
  EXPECT_EQ(exit_code_for_run(Status::parse_error("row 2: bad magnitude")), kExitRunError);
  EXPECT_EQ(exit_code_for_run(Status::io_error("disk full")), kExitRunError);
  EXPECT_EQ(exit_code_for_run(Status::invalid_argument("late")), kExitRunError);
}

class CliRunTest : public qs::testing::TempDirTest {};

TEST_F(CliRunTest, MissingColumnIsRunErrorNotUsage) {
  write_file(path("nolon.csv"),
             "event_id,magnitude,timestamp,latitude\n"
             "A,7.0,2020-01-01T00:00:00Z,0\n");
  const std::string input = path("nolon.csv");
  const std::string m = path("m.csv");
  const std::string d = path("d.csv");

  Config cfg;
  std::string used;
  const Args a = args_of({"decluster", "--input", input.c_str(), "--mainshocks", m.c_str(),
                          "--aftershocks", d.c_str(), "--no-log"});
  ASSERT_TRUE(build_config(a, &cfg, &used).ok());

  DeclusterRunner runner(cfg, a.command, used);
  NullRunLogSink log;
  CsvCatalogSource source(CsvSourceConfig{cfg.input.path, ','});
  ASSERT_TRUE(runner.start(log).ok());
  auto r = runner.run(source, log);
  runner.stop(log);

  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code(), Status::Code::kCorruptData);
  EXPECT_NE(r.status().message().find("longitude"), std::string::npos);
  EXPECT_EQ(exit_code_for_run(r.status()), kExitRunError);
}
