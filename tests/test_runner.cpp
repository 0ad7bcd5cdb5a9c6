// File: tests/test_runner.cpp
#include <filesystem>
#include <string>

#include <gtest/gtest.h>

#include "qs/adapters/csv/csv_catalog_source.hpp"
#include "qs/adapters/synth/synth_catalog_source.hpp"
#include "qs/core/cluster/declusterer.hpp"
#include "qs/core/io/catalog_decoder.hpp"
#include "qs/core/log/jsonl_run_log.hpp"
#include "qs/core/model/decluster_runner.hpp"
#include "test_helpers.hpp"

using namespace qs;
using qs::testing::read_file;
using qs::testing::write_file;

namespace fs = std::filesystem;

class RunnerTest : public qs::testing::TempDirTest {
 protected:
  void SetUp() override {
    TempDirTest::SetUp();
    write_file(path("catalog.csv"),
               "event_id,magnitude,timestamp,latitude,longitude,depth_km,place\n"
               "A,7.0,2020-01-01T00:00:00Z,0,0,10,\"Sea, North\"\n"
               "B,4.5,2020-01-11T00:00:00Z,0.1,0.1,12,near A\n"
               "C,4.0,2020-07-19T00:00:00Z,0,0,8,later\n");

    cfg.engine.window.model = WindowModelKind::kFixed;
    cfg.engine.window.fixed = FixedWindowConfig{100.0, 100.0};
    cfg.input.path = path("catalog.csv");
    cfg.output.independent_path = path("out/mainshocks.csv");
    cfg.output.dependent_path = path("out/aftershocks.csv");
    cfg.log.out_dir = path("runs");
  }

  int count_runlogs() const {
    int n = 0;
    for (const auto& e : fs::directory_iterator(path("runs"))) {
      const std::string name = e.path().filename().string();
      if (name.rfind("runlog_", 0) == 0 && name != "runlog_latest.jsonl") ++n;
    }
    return n;
  }

  Config cfg;
};

TEST_F(RunnerTest, EndToEndCsv) {
  cfg.output.attribution = true;
  DeclusterRunner runner(cfg, "decluster-a1b", "");
  JsonlRunLog log;
  CsvCatalogSource source(CsvSourceConfig{cfg.input.path, ','});

  ASSERT_TRUE(runner.start(log).ok());
  auto r = runner.run(source, log);
  runner.stop(log);
  ASSERT_TRUE(r.ok()) << r.status().message();

  EXPECT_EQ(r->input_rows, 3u);
  EXPECT_EQ(r->skipped_rows, 0u);
  EXPECT_EQ(r->independent, 2u);
  EXPECT_EQ(r->dependent, 1u);

  RecordTable main_out;
  ASSERT_TRUE(CsvCatalogSource(CsvSourceConfig{cfg.output.independent_path, ','}).read(&main_out).ok());
  ASSERT_EQ(main_out.size(), 2u);
  EXPECT_EQ(main_out.rows[0][0], "A");
  EXPECT_EQ(main_out.rows[0][6], "Sea, North");
  EXPECT_EQ(main_out.rows[1][0], "C");
  EXPECT_EQ(main_out.header.size(), 7u);

  RecordTable after_out;
  ASSERT_TRUE(CsvCatalogSource(CsvSourceConfig{cfg.output.dependent_path, ','}).read(&after_out).ok());
  ASSERT_EQ(after_out.size(), 1u);
  EXPECT_EQ(after_out.header.back(), "delta_distance_km");
  EXPECT_EQ(after_out.rows[0][0], "B");
  EXPECT_EQ(after_out.rows[0][7], "A");

  EXPECT_FALSE(fs::exists(cfg.output.independent_path + ".tmp"));
  EXPECT_FALSE(fs::exists(cfg.output.dependent_path + ".tmp"));

  const std::string lines = read_file(log.latest_path());
  EXPECT_NE(lines.find("\"type\":\"run_started\""), std::string::npos);
  EXPECT_NE(lines.find("\"type\":\"catalog_loaded\""), std::string::npos);
  EXPECT_NE(lines.find("\"type\":\"decluster_finished\""), std::string::npos);
  EXPECT_NE(lines.find("\"type\":\"output_written\""), std::string::npos);
  EXPECT_NE(lines.find("\"type\":\"run_finished\""), std::string::npos);
  EXPECT_NE(lines.find("\"command\":\"decluster-a1b\""), std::string::npos);
}

TEST_F(RunnerTest, StrictBadRowWritesNothing) {
  write_file(path("catalog.csv"),
             "event_id,magnitude,timestamp,latitude,longitude\n"
             "A,7.0,2020-01-01T00:00:00Z,0,0\n"
             "B,huge,2020-01-11T00:00:00Z,0.1,0.1\n");
  DeclusterRunner runner(cfg, "decluster", "");
  JsonlRunLog log;
  CsvCatalogSource source(CsvSourceConfig{cfg.input.path, ','});

  ASSERT_TRUE(runner.start(log).ok());
  auto r = runner.run(source, log);
  runner.stop(log);

  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code(), Status::Code::kParseError);
  EXPECT_FALSE(fs::exists(cfg.output.independent_path));
  EXPECT_FALSE(fs::exists(cfg.output.dependent_path));

  const std::string lines = read_file(log.latest_path());
  EXPECT_NE(lines.find("\"type\":\"run_failed\""), std::string::npos);
  EXPECT_NE(lines.find("\"code\":\"parse_error\""), std::string::npos);
}

TEST_F(RunnerTest, FailedMoveRestoresPreviousOutputs) {
  fs::create_directories(path("out"));
  write_file(cfg.output.independent_path, "previous run\n");
  // A directory where the dependent file should go makes the second move fail.
  cfg.output.dependent_path = path("out/aftershocks_dir");
  fs::create_directories(cfg.output.dependent_path);

  DeclusterRunner runner(cfg, "decluster-a1b", "");
  NullRunLogSink log;
  CsvCatalogSource source(CsvSourceConfig{cfg.input.path, ','});
  ASSERT_TRUE(runner.start(log).ok());
  auto r = runner.run(source, log);
  runner.stop(log);

  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code(), Status::Code::kIoError);
  EXPECT_EQ(read_file(cfg.output.independent_path), "previous run\n");
  EXPECT_TRUE(fs::is_directory(cfg.output.dependent_path));
  for (const auto& e : fs::directory_iterator(path("out"))) {
    const std::string ext = e.path().extension().string();
    EXPECT_NE(ext, ".tmp") << e.path();
    EXPECT_NE(ext, ".bak") << e.path();
  }
}

TEST_F(RunnerTest, SuccessfulRunReplacesPreviousOutputs) {
  fs::create_directories(path("out"));
  write_file(cfg.output.independent_path, "previous run\n");

  DeclusterRunner runner(cfg, "decluster-a1b", "");
  NullRunLogSink log;
  CsvCatalogSource source(CsvSourceConfig{cfg.input.path, ','});
  ASSERT_TRUE(runner.start(log).ok());
  auto r = runner.run(source, log);
  runner.stop(log);

  ASSERT_TRUE(r.ok()) << r.status().message();
  EXPECT_EQ(read_file(cfg.output.independent_path).rfind("event_id,", 0), 0u);
  EXPECT_FALSE(fs::exists(cfg.output.independent_path + ".bak"));
}

TEST_F(RunnerTest, LenientSkipsBadRows) {
  write_file(path("catalog.csv"),
             "event_id,magnitude,timestamp,latitude,longitude\n"
             "A,7.0,2020-01-01T00:00:00Z,0,0\n"
             "B,huge,2020-01-11T00:00:00Z,0.1,0.1\n"
             "C,4.0,2020-01-12T00:00:00Z,0.1,0.1\n");
  cfg.input.strict = false;
  DeclusterRunner runner(cfg, "decluster", "");
  NullRunLogSink log;
  CsvCatalogSource source(CsvSourceConfig{cfg.input.path, ','});

  ASSERT_TRUE(runner.start(log).ok());
  auto r = runner.run(source, log);
  runner.stop(log);
  ASSERT_TRUE(r.ok()) << r.status().message();
  EXPECT_EQ(r->input_rows, 3u);
  EXPECT_EQ(r->skipped_rows, 1u);
  EXPECT_EQ(r->independent + r->dependent, 2u);
}

TEST_F(RunnerTest, InvalidConfigFailsRun) {
  cfg.engine.window.scale = -1.0;
  DeclusterRunner runner(cfg, "decluster", "");
  NullRunLogSink log;
  CsvCatalogSource source(CsvSourceConfig{cfg.input.path, ','});
  ASSERT_TRUE(runner.start(log).ok());
  auto r = runner.run(source, log);
  runner.stop(log);
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code(), Status::Code::kInvalidArgument);
}

TEST_F(RunnerTest, PrunesOldRunLogs) {
  fs::create_directories(path("runs"));
  for (const char* n : {"runlog_100.jsonl", "runlog_200.jsonl", "runlog_300.jsonl",
                        "runlog_400.jsonl", "runlog_500.jsonl"}) {
    write_file(path(std::string("runs/") + n), "{}\n");
  }
  write_file(path("runs/notes.txt"), "keep me\n");

  cfg.log.keep_last = 2;
  DeclusterRunner runner(cfg, "decluster", "");
  JsonlRunLog log;
  ASSERT_TRUE(runner.start(log).ok());
  runner.stop(log);

  EXPECT_EQ(count_runlogs(), 2);
  EXPECT_TRUE(fs::exists(path("runs/runlog_500.jsonl")));
  EXPECT_FALSE(fs::exists(path("runs/runlog_400.jsonl")));
  EXPECT_TRUE(fs::exists(path("runs/notes.txt")));
}

TEST_F(RunnerTest, SynthRunIsDeterministic) {
  cfg.input.type = "synth";
  cfg.engine.window.model = WindowModelKind::kGkTable;
  cfg.engine.claim_mode = ClaimMode::kNearestInTime;

  SynthSourceConfig sc;
  sc.seed = 7;
  sc.num_sequences = 3;
  sc.aftershocks_per_sequence = 10;
  sc.background_events = 20;

  RunSummary first;
  for (int i = 0; i < 2; ++i) {
    DeclusterRunner runner(cfg, "run", "");
    NullRunLogSink log;
    SynthCatalogSource source(sc);
    ASSERT_TRUE(runner.start(log).ok());
    auto r = runner.run(source, log);
    runner.stop(log);
    ASSERT_TRUE(r.ok()) << r.status().message();
    EXPECT_EQ(r->input_rows, 3u + 3u * 10u + 20u);
    EXPECT_EQ(r->independent + r->dependent, r->input_rows);
    // Every generated sequence has aftershocks close to its mainshock.
    EXPECT_GE(r->dependent, 3u);
    if (i == 0) {
      first = r.value();
    } else {
      EXPECT_EQ(r->independent, first.independent);
      EXPECT_EQ(r->dependent, first.dependent);
    }
  }
}

TEST(SynthCatalogSource, SameSeedSameTable) {
  SynthSourceConfig sc;
  sc.seed = 42;
  RecordTable a;
  RecordTable b;
  ASSERT_TRUE(SynthCatalogSource(sc).read(&a).ok());
  ASSERT_TRUE(SynthCatalogSource(sc).read(&b).ok());
  EXPECT_EQ(a.header, b.header);
  EXPECT_EQ(a.rows, b.rows);

  sc.seed = 43;
  RecordTable c;
  ASSERT_TRUE(SynthCatalogSource(sc).read(&c).ok());
  EXPECT_NE(a.rows, c.rows);
}

TEST(SynthCatalogSource, DecodesStrictly) {
  SynthSourceConfig sc;
  RecordTable t;
  ASSERT_TRUE(SynthCatalogSource(sc).read(&t).ok());
  EXPECT_EQ(t.size(), static_cast<std::size_t>(sc.num_sequences * (1 + sc.aftershocks_per_sequence) +
                                               sc.background_events));
  auto decoded = decode_catalog(t, sc.columns, true);
  ASSERT_TRUE(decoded.ok()) << decoded.status().message();
  EXPECT_EQ(decoded->events.size(), t.size());
}

TEST(SynthCatalogSource, RejectsBadCounts) {
  SynthSourceConfig sc;
  sc.background_events = -1;
  RecordTable t;
  EXPECT_EQ(SynthCatalogSource(sc).read(&t).code(), Status::Code::kInvalidArgument);
}
