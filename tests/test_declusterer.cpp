// File: tests/test_declusterer.cpp
#include <vector>

#include <gtest/gtest.h>

#include "qs/core/cluster/declusterer.hpp"
#include "qs/core/cluster/gardner_knopoff.hpp"
#include "qs/core/cluster/reasenberg.hpp"
#include "test_helpers.hpp"

using namespace qs;
using qs::testing::make_event;

class DeclustererTest : public ::testing::Test {
 protected:
  std::vector<Event> ev = {
      make_event("A", 7.0, 0.0, 0.0, 0.0),
      make_event("B", 4.5, 10.0, 0.1, 0.1),
      make_event("C", 4.0, 200.0, 0.0, 0.0),
      make_event("D", 3.0, 10.2, 0.12, 0.1),
  };
};

TEST_F(DeclustererTest, DispatchesToWindowEngine) {
  EngineConfig cfg;
  cfg.window.model = WindowModelKind::kFixed;
  cfg.window.fixed = FixedWindowConfig{100.0, 100.0};

  auto r = decluster(ev, cfg);
  ASSERT_TRUE(r.ok());

  auto model = make_window_model(cfg.window);
  ASSERT_TRUE(model.ok());
  auto direct = decluster_gardner_knopoff(ev, model.value(), cfg.claim_mode);
  ASSERT_TRUE(direct.ok());
  EXPECT_EQ(r->independent, direct->independent);
  EXPECT_EQ(r->dependent, direct->dependent);
}

TEST_F(DeclustererTest, DispatchesToReasenberg) {
  EngineConfig cfg;
  cfg.window.model = WindowModelKind::kReasenberg;

  auto r = decluster(ev, cfg);
  ASSERT_TRUE(r.ok());
  auto direct = decluster_reasenberg(ev, cfg.reasenberg);
  ASSERT_TRUE(direct.ok());
  EXPECT_EQ(r->independent, direct->partition.independent);
  EXPECT_EQ(r->dependent, direct->partition.dependent);
}

TEST_F(DeclustererTest, ScaleIsIgnoredByReasenberg) {
  EngineConfig cfg;
  cfg.window.model = WindowModelKind::kReasenberg;
  cfg.window.scale = -3.0;
  EXPECT_TRUE(decluster(ev, cfg).ok());
}

TEST_F(DeclustererTest, ConfigErrorsFailBeforeProcessing) {
  EngineConfig cfg;
  cfg.window.scale = 0.0;
  auto r = decluster(ev, cfg);
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code(), Status::Code::kInvalidArgument);

  EngineConfig rcfg;
  rcfg.window.model = WindowModelKind::kReasenberg;
  rcfg.reasenberg.p = 0.0;
  r = decluster(ev, rcfg);
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code(), Status::Code::kInvalidArgument);
}

TEST_F(DeclustererTest, TableWithRejectSurfacesOutOfRange) {
  EngineConfig cfg;
  cfg.window.model = WindowModelKind::kGkTable;
  cfg.window.below_table = BelowTablePolicy::kReject;

  ev.push_back(make_event("tiny", 1.9, 50.0, 5.0, 5.0));
  auto r = decluster(ev, cfg);
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code(), Status::Code::kOutOfRange);

  cfg.window.below_table = BelowTablePolicy::kClamp;
  EXPECT_TRUE(decluster(ev, cfg).ok());
}
