#include "console_session.h"

#include "gtest/gtest.h"
#include "support/fake_api.hpp"

using namespace std::chrono_literals;
using test_support::FakeLogSource;
using test_support::FakeStatusSource;
using test_support::make_line;
using test_support::make_snapshot;
using test_support::ManualClock;

namespace {

class ConsoleSessionTest : public ::testing::Test {
 protected:
  ConsoleSessionTest()
      : clock_(scheduler_), session_(config_, scheduler_, logs_, status_) {
    session_.set_redraw_callback([this] { redraws_++; });
  }

  // Answers every outstanding collaborator call.
  void complete_all() {
    while (!logs_.tail_calls.empty()) {
      logs_.complete_tail({make_line(99, "INFO", "api", "stale line")});
    }
    while (!logs_.page_calls.empty()) {
      logs_.complete_page(0, 3, {make_line(99, "INFO", "api", "stale line")});
    }
    while (!status_.calls.empty()) {
      status_.complete(make_snapshot("stale snapshot"));
    }
  }

  size_t outstanding_calls() const {
    return logs_.tail_calls.size() + logs_.page_calls.size() +
           status_.calls.size();
  }

  ConsoleConfig config_;
  Scheduler scheduler_;
  ManualClock clock_;
  FakeLogSource logs_;
  FakeStatusSource status_;
  ConsoleSession session_;
  int redraws_ = 0;
};

class ModeLifecycleTest : public ConsoleSessionTest,
                          public ::testing::WithParamInterface<Mode> {};

}  // namespace

TEST_F(ConsoleSessionTest, StartsInNormalModeWithoutController) {
  EXPECT_EQ(Mode::Normal, session_.mode());
  EXPECT_EQ(nullptr, session_.active_controller());
  EXPECT_TRUE(session_.follow_tail());
}

TEST_P(ModeLifecycleTest, EnterThenExitLeavesNothingRunning) {
  const Mode mode = GetParam();

  ASSERT_TRUE(session_.enter_mode(mode));
  EXPECT_EQ(mode, session_.mode());
  ASSERT_NE(nullptr, session_.active_controller());
  EXPECT_EQ(mode, session_.active_controller()->mode());

  session_.exit_mode();
  EXPECT_EQ(Mode::Normal, session_.mode());
  EXPECT_EQ(nullptr, session_.active_controller());

  std::string output = session_.output_buffer().text();
  std::string tail = session_.log_tail_buffer().text();
  complete_all();
  clock_.advance(60s);

  EXPECT_EQ(0u, outstanding_calls());
  EXPECT_EQ(0u, scheduler_.pending_timers());
  EXPECT_EQ(output, session_.output_buffer().text());
  EXPECT_EQ(tail, session_.log_tail_buffer().text());
}

TEST_P(ModeLifecycleTest, ExitTwiceEqualsExitOnce) {
  session_.enter_mode(GetParam());
  session_.exit_mode();
  int redraws = redraws_;

  session_.exit_mode();
  EXPECT_EQ(Mode::Normal, session_.mode());
  EXPECT_EQ(nullptr, session_.active_controller());
  EXPECT_EQ(redraws, redraws_);
}

TEST_P(ModeLifecycleTest, EnteringActiveModeIsRejected) {
  session_.enter_mode(GetParam());
  ModeController* controller = session_.active_controller();

  EXPECT_FALSE(session_.enter_mode(GetParam()));
  EXPECT_EQ(controller, session_.active_controller());
}

INSTANTIATE_TEST_SUITE_P(AllModes, ModeLifecycleTest,
                         ::testing::Values(Mode::LogTail, Mode::Watch,
                                           Mode::LogView));

TEST_F(ConsoleSessionTest, ExitInNormalModeIsNoOp) {
  session_.exit_mode();
  EXPECT_EQ(Mode::Normal, session_.mode());
  EXPECT_EQ(0, redraws_);
}

TEST_F(ConsoleSessionTest, SwitchingModesTearsDownPreviousController) {
  session_.enter_mode(Mode::Watch);
  ASSERT_EQ(1u, status_.calls.size());

  ASSERT_TRUE(session_.enter_mode(Mode::LogView));
  EXPECT_EQ(Mode::LogView, session_.mode());
  ASSERT_NE(nullptr, session_.log_view_controller());
  EXPECT_EQ(nullptr, session_.watch_controller());

  // the watch query lands after its mode is gone
  status_.complete(make_snapshot("stale snapshot"));
  EXPECT_EQ(std::string::npos,
            session_.visible_buffer().text().find("stale snapshot"));
  clock_.advance(60s);
  EXPECT_TRUE(status_.calls.empty());
}

TEST_F(ConsoleSessionTest, WatchScenario) {
  ASSERT_TRUE(session_.enter_mode(Mode::Watch));
  WatchController* watch = session_.watch_controller();
  ASSERT_NE(nullptr, watch);
  EXPECT_DOUBLE_EQ(config_.watch_interval_s, watch->refresh_interval());

  watch->set_interval(0.2);
  EXPECT_DOUBLE_EQ(0.5, watch->refresh_interval());

  session_.exit_mode();
  EXPECT_EQ(Mode::Normal, session_.mode());
  EXPECT_EQ(nullptr, session_.active_controller());
  EXPECT_EQ(nullptr, session_.watch_controller());
}

TEST_F(ConsoleSessionTest, ModeOptionsReachController) {
  ModeOptions options;
  options.watch_target = "devices";
  options.interval_s = 3.0;
  session_.enter_mode(Mode::Watch, options);

  ASSERT_EQ(1u, status_.calls.size());
  EXPECT_EQ("devices", status_.calls.front().target);
  EXPECT_DOUBLE_EQ(3.0, session_.watch_controller()->refresh_interval());
}

TEST_F(ConsoleSessionTest, LogTailWritesToTailBuffer) {
  session_.log_tail_buffer().append("old session\n", true);
  session_.enter_mode(Mode::LogTail);
  EXPECT_EQ(std::string::npos,
            session_.log_tail_buffer().text().find("old session"));

  logs_.complete_tail({make_line(1, "INFO", "api", "tailed")});
  EXPECT_NE(std::string::npos,
            session_.log_tail_buffer().text().find("tailed"));
  EXPECT_EQ(std::string::npos, session_.output_buffer().text().find("tailed"));
  EXPECT_EQ(&session_.log_tail_buffer(), &session_.visible_buffer());
}

TEST_F(ConsoleSessionTest, AppendFollowsTailOnlyWhenEnabled) {
  session_.append_output("first\n");
  EXPECT_EQ(session_.output_buffer().size(), session_.output_buffer().cursor());

  session_.set_follow_tail(false);
  session_.output_buffer().set_cursor(0);
  session_.append_output("second\n");
  EXPECT_EQ(0u, session_.output_buffer().cursor());
}

TEST_F(ConsoleSessionTest, ScrollUpDisablesAndScrollDownResumesFollow) {
  session_.append_output(std::string(2000, 'x'));
  session_.scroll(ScrollDirection::Up, 10);
  EXPECT_FALSE(session_.follow_tail());
  EXPECT_EQ(1200u, session_.output_buffer().cursor());

  session_.append_output("more");
  EXPECT_EQ(1200u, session_.output_buffer().cursor());

  session_.scroll(ScrollDirection::Down, 5);
  EXPECT_FALSE(session_.follow_tail());
  session_.scroll(ScrollDirection::Down, 5);
  EXPECT_TRUE(session_.follow_tail());
}

TEST_F(ConsoleSessionTest, QuitLeavesModeAndDropsInput) {
  int quits = 0;
  session_.set_quit_callback([&quits] { quits++; });
  session_.enter_mode(Mode::LogView);
  session_.input() = "half typed";

  session_.quit();
  EXPECT_TRUE(session_.quit_requested());
  EXPECT_EQ(Mode::Normal, session_.mode());
  EXPECT_EQ(nullptr, session_.active_controller());
  EXPECT_TRUE(session_.input().empty());

  session_.quit();
  session_.exit_mode();
  EXPECT_EQ(1, quits);

  complete_all();
  EXPECT_EQ(std::string::npos,
            session_.output_buffer().text().find("stale line"));
}
