/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <peerscout/basic/scheduler/asio_scheduler_backend.hpp>
#include <peerscout/basic/scheduler/manual_scheduler_backend.hpp>
#include <peerscout/basic/scheduler/scheduler_impl.hpp>

#include "testutil/prepare_loggers.hpp"

using peerscout::basic::ManualSchedulerBackend;
using peerscout::basic::Scheduler;
using peerscout::basic::SchedulerImpl;
using std::chrono_literals::operator""ms;

namespace {
  auto &log() {
    static auto logger = []() {
      if (std::getenv("TRACE_DEBUG") != nullptr) {
        testutil::prepareLoggers(soralog::Level::TRACE);
      } else {
        testutil::prepareLoggers(soralog::Level::INFO);
      }
      auto log = peerscout::log::createLogger("test", "testing");
      return log;
    }();
    return *logger;
  }

  /// Lvalue callbacks must be rejected at compile time
  template <typename S>
  constexpr bool acceptsLvalue =
      requires(S &scheduler, Scheduler::Callback &fn) { scheduler.schedule(fn); };
}  // namespace

static_assert(not acceptsLvalue<Scheduler>);

class ManualSchedulerTest : public ::testing::Test {
 public:
  void SetUp() override {
    log();
    backend = std::make_shared<ManualSchedulerBackend>();
    scheduler = std::make_shared<SchedulerImpl>(backend, Scheduler::Config{});
  }

  /// Runs until nothing is scheduled
  void runAll() {
    while (not backend->empty()) {
      backend->shiftToTimer();
    }
  }

  std::shared_ptr<ManualSchedulerBackend> backend;
  std::shared_ptr<Scheduler> scheduler;
  std::vector<std::string> calls;
};

/**
 * @given deferred and timed callbacks
 * @when time goes on
 * @then deferred callbacks are called first, timed ones by their delays
 */
TEST_F(ManualSchedulerTest, CallsInTimeOrder) {
  scheduler->schedule([&] { calls.emplace_back("155"); }, 155ms);
  scheduler->schedule([&] { calls.emplace_back("deferred"); });
  auto h1 =
      scheduler->scheduleWithHandle([&] { calls.emplace_back("45"); }, 45ms);
  auto h2 = scheduler->scheduleWithHandle(
      [&] { calls.emplace_back("deferred w/handle"); });

  runAll();

  EXPECT_EQ(calls,
            (std::vector<std::string>{
                "deferred", "deferred w/handle", "45", "155"}));
}

/**
 * @given timed callback with handle
 * @when the handle is destroyed before the delay elapses
 * @then the callback is never called
 */
TEST_F(ManualSchedulerTest, ResetHandleCancels) {
  auto h = scheduler->scheduleWithHandle(
      [&] { calls.emplace_back("cancelled"); }, 100ms);
  backend->shift(50ms);
  h.reset();
  backend->shift(100ms);
  runAll();

  EXPECT_TRUE(calls.empty());
}

/**
 * @given callback which owns a handle of another callback
 * @when the first callback fires
 * @then it may cancel the second one from inside the event loop
 */
TEST_F(ManualSchedulerTest, CancelFromCallback) {
  auto h5 = std::make_shared<Scheduler::Handle>(scheduler->scheduleWithHandle(
      [&] { calls.emplace_back("h5"); }, 78ms));
  auto h6 = scheduler->scheduleWithHandle(
      [&, h5] {
        h5->reset();
        calls.emplace_back("h6");
      },
      77ms);

  runAll();

  EXPECT_EQ(calls, (std::vector<std::string>{"h6"}));
}

/**
 * @given timed callback
 * @when clock is shifted to just before and then to the deadline
 * @then callback is called at the deadline, not earlier
 */
TEST_F(ManualSchedulerTest, NotBeforeDeadline) {
  auto start = scheduler->now();
  Scheduler::Time fired{};
  scheduler->schedule([&] { fired = scheduler->now(); }, 100ms);

  backend->shift(99ms);
  EXPECT_EQ(fired, Scheduler::Time{});
  backend->shift(1ms);
  EXPECT_EQ(fired, start + 100ms);
}

TEST(Scheduler, AsioBackend) {
  using namespace peerscout::basic;
  log();

  auto io = std::make_shared<boost::asio::io_context>(1);
  auto backend = std::make_shared<AsioSchedulerBackend>(io);
  auto scheduler =
      std::make_shared<SchedulerImpl>(std::move(backend), Scheduler::Config{});

  std::vector<int> calls;
  scheduler->schedule([&] { calls.push_back(30); }, 30ms);
  scheduler->schedule([&] { calls.push_back(0); });
  auto h = scheduler->scheduleWithHandle([&] { calls.push_back(-1); }, 20ms);
  h.reset();

  io->run_for(100ms);

  EXPECT_EQ(calls, (std::vector<int>{0, 30}));
}
