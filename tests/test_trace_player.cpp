#include <gtest/gtest.h>
#include <trace/trace_player.hpp>
#include <atomic>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

using namespace cantrace;
using namespace std::chrono_literals;
using trace::PlayerState;
using trace::TracePlayer;

namespace {

std::vector<trace::TraceRecord> Records(std::initializer_list<int64_t> offsets_ms) {
  std::vector<trace::TraceRecord> out;
  uint64_t seq = 0;
  for (auto ms : offsets_ms) {
    ++seq;
    auto f = core::Frame::MakeData(0x100 + static_cast<uint32_t>(seq), std::vector<uint8_t>{static_cast<uint8_t>(seq)});
    out.push_back({seq, std::chrono::milliseconds(ms), f.Value()});
  }
  return out;
}

// Records what the player emits and when
struct Sink {
  std::mutex mu;
  std::condition_variable cv;
  std::vector<uint32_t> ids;
  std::vector<std::chrono::steady_clock::time_point> at;

  void operator()(const core::Frame& f) {
    {
      std::lock_guard<std::mutex> lk(mu);
      ids.push_back(f.Id());
      at.push_back(std::chrono::steady_clock::now());
    }
    cv.notify_all();
  }
  bool WaitFor(std::size_t n, std::chrono::milliseconds timeout = 3s) {
    std::unique_lock<std::mutex> lk(mu);
    return cv.wait_for(lk, timeout, [&] { return ids.size() >= n; });
  }
  std::vector<uint32_t> Ids() {
    std::lock_guard<std::mutex> lk(mu);
    return ids;
  }
};

struct Finished {
  std::mutex mu;
  std::condition_variable cv;
  int count{0};
  void operator()() {
    { std::lock_guard<std::mutex> lk(mu); ++count; }
    cv.notify_all();
  }
  bool Wait(std::chrono::milliseconds timeout = 3s) {
    std::unique_lock<std::mutex> lk(mu);
    return cv.wait_for(lk, timeout, [&] { return count > 0; });
  }
};

} // namespace

TEST(TracePlayer, DoubleSpeedHalvesTheGaps) {
  Sink sink;
  Finished done;
  TracePlayer p([&](const core::Frame& f) { sink(f); });
  p.SetFinishedHandler([&] { done(); });
  ASSERT_TRUE(p.Load(Records({0, 100, 300})).HasValue());

  const auto t0 = std::chrono::steady_clock::now();
  ASSERT_TRUE(p.Play(trace::SpeedPreset::kDouble).HasValue());
  ASSERT_TRUE(done.Wait());
  const auto total = std::chrono::steady_clock::now() - t0;

  EXPECT_EQ(sink.Ids(), (std::vector<uint32_t>{0x101, 0x102, 0x103}));
  EXPECT_GE(total, 140ms);
  EXPECT_LT(total, 400ms);
  const auto first_gap = sink.at[1] - sink.at[0];
  EXPECT_GE(first_gap, 40ms);
  EXPECT_LT(first_gap, 150ms);
  EXPECT_EQ(p.State(), PlayerState::kStopped);
  EXPECT_EQ(p.Cursor(), 0u);
}

TEST(TracePlayer, MaxSpeedEmitsWithoutWaiting) {
  Sink sink;
  Finished done;
  TracePlayer p([&](const core::Frame& f) { sink(f); });
  p.SetFinishedHandler([&] { done(); });
  ASSERT_TRUE(p.Load(Records({0, 10000, 20000, 30000})).HasValue());

  const auto t0 = std::chrono::steady_clock::now();
  ASSERT_TRUE(p.Play(trace::SpeedPreset::kMax).HasValue());
  ASSERT_TRUE(done.Wait());
  EXPECT_LT(std::chrono::steady_clock::now() - t0, 1s);
  EXPECT_EQ(sink.Ids().size(), 4u);
}

TEST(TracePlayer, PauseAndResumeNeitherSkipsNorRepeats) {
  Sink sink;
  Finished done;
  TracePlayer p([&](const core::Frame& f) { sink(f); });
  p.SetFinishedHandler([&] { done(); });
  ASSERT_TRUE(p.Load(Records({0, 50, 100, 400, 450})).HasValue());

  ASSERT_TRUE(p.Play(1.0).HasValue());
  ASSERT_TRUE(sink.WaitFor(3));
  ASSERT_TRUE(p.Pause().HasValue());
  EXPECT_EQ(p.State(), PlayerState::kPaused);
  const auto during_pause = sink.Ids().size();
  const auto paused_at = p.Position();
  std::this_thread::sleep_for(400ms);
  EXPECT_EQ(sink.Ids().size(), during_pause);
  EXPECT_EQ(p.Position(), paused_at);

  ASSERT_TRUE(p.Play(1.0).HasValue());
  ASSERT_TRUE(done.Wait());
  EXPECT_EQ(sink.Ids(), (std::vector<uint32_t>{0x101, 0x102, 0x103, 0x104, 0x105}));
}

TEST(TracePlayer, SeekJumpsToTheFirstRecordAtOrAfterTheTarget) {
  Sink sink;
  Finished done;
  TracePlayer p([&](const core::Frame& f) { sink(f); });
  p.SetFinishedHandler([&] { done(); });
  ASSERT_TRUE(p.Load(Records({0, 1000, 2000, 2050, 2100})).HasValue());

  ASSERT_TRUE(p.Play(1.0).HasValue());
  ASSERT_TRUE(sink.WaitFor(1));
  ASSERT_TRUE(p.Seek(1500ms).HasValue());
  EXPECT_EQ(p.Cursor(), 2u);
  ASSERT_TRUE(done.Wait());
  EXPECT_EQ(sink.Ids(), (std::vector<uint32_t>{0x101, 0x103, 0x104, 0x105}));
}

TEST(TracePlayer, SeekWhilePausedAndBeforeTheStart) {
  Sink sink;
  TracePlayer p([&](const core::Frame& f) { sink(f); });
  ASSERT_TRUE(p.Load(Records({0, 5000, 6000})).HasValue());
  ASSERT_TRUE(p.Play(1.0).HasValue());
  ASSERT_TRUE(sink.WaitFor(1));
  ASSERT_TRUE(p.Pause().HasValue());

  ASSERT_TRUE(p.Seek(5500ms).HasValue());
  EXPECT_EQ(p.Cursor(), 2u);
  EXPECT_EQ(p.Position(), 5500ms);
  ASSERT_TRUE(p.Seek(-3s).HasValue());
  EXPECT_EQ(p.Cursor(), 0u);
  EXPECT_EQ(p.Position(), 0ms);
  EXPECT_EQ(p.State(), PlayerState::kPaused);
}

TEST(TracePlayer, StopIsSynchronous) {
  std::atomic<int> emitted{0};
  std::atomic<bool> stopped{false};
  std::atomic<bool> late{false};
  TracePlayer p([&](const core::Frame&) {
    if (stopped.load()) late.store(true);
    std::this_thread::sleep_for(5ms);
    ++emitted;
  });
  ASSERT_TRUE(p.Load(Records({0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12})).HasValue());
  ASSERT_TRUE(p.Play(trace::SpeedPreset::kMax).HasValue());
  std::this_thread::sleep_for(20ms);
  p.Stop();
  stopped.store(true);
  const int at_stop = emitted.load();
  std::this_thread::sleep_for(50ms);
  EXPECT_EQ(emitted.load(), at_stop);
  EXPECT_FALSE(late.load());
  EXPECT_EQ(p.State(), PlayerState::kStopped);
  EXPECT_EQ(p.Cursor(), 0u);
}

TEST(TracePlayer, PauseWaitsForTheFrameInFlight) {
  std::mutex mu;
  std::condition_variable cv;
  bool in_sink = false;
  bool release = false;
  std::atomic<bool> paused{false};
  std::atomic<bool> late{false};
  std::atomic<int> emitted{0};
  TracePlayer p([&](const core::Frame&) {
    if (paused.load()) late.store(true);
    std::unique_lock<std::mutex> lk(mu);
    in_sink = true;
    cv.notify_all();
    cv.wait(lk, [&] { return release; });
    ++emitted;
  });
  ASSERT_TRUE(p.Load(Records({0, 1, 2, 3})).HasValue());
  ASSERT_TRUE(p.Play(trace::SpeedPreset::kMax).HasValue());
  {
    std::unique_lock<std::mutex> lk(mu);
    ASSERT_TRUE(cv.wait_for(lk, 3s, [&] { return in_sink; }));
  }

  std::atomic<bool> pause_returned{false};
  std::thread pauser([&] {
    EXPECT_TRUE(p.Pause().HasValue());
    paused.store(true);
    pause_returned.store(true);
  });
  std::this_thread::sleep_for(30ms);
  EXPECT_FALSE(pause_returned.load());
  {
    std::lock_guard<std::mutex> lk(mu);
    release = true;
  }
  cv.notify_all();
  pauser.join();

  EXPECT_EQ(emitted.load(), 1);
  std::this_thread::sleep_for(30ms);
  EXPECT_EQ(emitted.load(), 1);
  EXPECT_FALSE(late.load());
  EXPECT_EQ(p.State(), PlayerState::kPaused);
  EXPECT_EQ(p.Cursor(), 1u);
  p.Stop();
}

TEST(TracePlayer, PlayAfterStopStartsFromTheBeginning) {
  Sink sink;
  Finished done;
  TracePlayer p([&](const core::Frame& f) { sink(f); });
  p.SetFinishedHandler([&] { done(); });
  ASSERT_TRUE(p.Load(Records({0, 2000})).HasValue());
  ASSERT_TRUE(p.Play(1.0).HasValue());
  ASSERT_TRUE(sink.WaitFor(1));
  p.Stop();
  ASSERT_TRUE(p.Play(trace::SpeedPreset::kMax).HasValue());
  ASSERT_TRUE(done.Wait());
  EXPECT_EQ(sink.Ids(), (std::vector<uint32_t>{0x101, 0x101, 0x102}));
}

TEST(TracePlayer, DecreasingOffsetIsAPlaybackError) {
  Sink sink;
  std::mutex mu;
  std::condition_variable cv;
  std::optional<core::ErrorCode> error;
  TracePlayer p([&](const core::Frame& f) { sink(f); });
  p.SetErrorHandler([&](const core::ErrorCode& e) {
    { std::lock_guard<std::mutex> lk(mu); error = e; }
    cv.notify_all();
  });
  ASSERT_TRUE(p.Load(Records({0, 100, 50, 200})).HasValue());
  ASSERT_TRUE(p.Play(trace::SpeedPreset::kMax).HasValue());
  {
    std::unique_lock<std::mutex> lk(mu);
    ASSERT_TRUE(cv.wait_for(lk, 3s, [&] { return error.has_value(); }));
    EXPECT_EQ(error->value, core::Errc::kPlaybackError);
  }
  EXPECT_EQ(sink.Ids(), (std::vector<uint32_t>{0x101, 0x102}));
  EXPECT_EQ(p.State(), PlayerState::kStopped);

  auto again = p.Play(1.0);
  ASSERT_FALSE(again.HasValue());
  EXPECT_EQ(again.Error().value, core::Errc::kPlaybackError);

  ASSERT_TRUE(p.Load(Records({0, 1})).HasValue());
  EXPECT_TRUE(p.Play(trace::SpeedPreset::kMax).HasValue());
}

TEST(TracePlayer, InvalidTransitionsAreStateErrors) {
  TracePlayer p([](const core::Frame&) {});
  auto empty = p.Play(1.0);
  ASSERT_FALSE(empty.HasValue());
  EXPECT_EQ(empty.Error().value, core::Errc::kStateError);
  EXPECT_EQ(p.Pause().Error().value, core::Errc::kStateError);
  EXPECT_EQ(p.Seek(0ms).Error().value, core::Errc::kStateError);
  EXPECT_EQ(p.Play(0.0).Error().value, core::Errc::kInvalidArgument);
  EXPECT_EQ(p.Play(-2.0).Error().value, core::Errc::kInvalidArgument);

  ASSERT_TRUE(p.Load(Records({0, 60000})).HasValue());
  ASSERT_TRUE(p.Play(1.0).HasValue());
  EXPECT_EQ(p.Play(1.0).Error().value, core::Errc::kStateError);
  EXPECT_EQ(p.Load(Records({0})).Error().value, core::Errc::kStateError);
  EXPECT_EQ(p.Size(), 2u);
  EXPECT_EQ(p.Duration(), 60000ms);
  p.Stop();
  p.Stop();
  EXPECT_TRUE(p.Load(Records({0})).HasValue());
}

TEST(TracePlayer, SinkMayStopThePlayer) {
  std::atomic<int> emitted{0};
  TracePlayer* self = nullptr;
  TracePlayer p([&](const core::Frame&) {
    ++emitted;
    self->Stop();
  });
  self = &p;
  ASSERT_TRUE(p.Load(Records({0, 1, 2})).HasValue());
  ASSERT_TRUE(p.Play(trace::SpeedPreset::kMax).HasValue());
  std::this_thread::sleep_for(100ms);
  EXPECT_EQ(emitted.load(), 1);
  EXPECT_EQ(p.State(), PlayerState::kStopped);
}

TEST(TracePlayer, EmittedFramesCarryTheReplayInstant) {
  Sink sink;
  core::Frame got;
  std::mutex mu;
  TracePlayer p([&](const core::Frame& f) {
    { std::lock_guard<std::mutex> lk(mu); got = f; }
    sink(f);
  });
  ASSERT_TRUE(p.Load(Records({0})).HasValue());
  const auto before = core::MonotonicNow();
  ASSERT_TRUE(p.Play(1.0).HasValue());
  ASSERT_TRUE(sink.WaitFor(1));
  std::lock_guard<std::mutex> lk(mu);
  EXPECT_GE(got.Timestamp(), before);
  EXPECT_TRUE(got.WallTime().has_value());
  EXPECT_EQ(got.Payload(), std::vector<uint8_t>{1});
}

TEST(SpeedPreset, Names) {
  EXPECT_EQ(trace::SpeedFromString("0.5x"), trace::SpeedPreset::kHalf);
  EXPECT_EQ(trace::SpeedFromString("1x"), trace::SpeedPreset::kNormal);
  EXPECT_EQ(trace::SpeedFromString("2x"), trace::SpeedPreset::kDouble);
  EXPECT_EQ(trace::SpeedFromString("10x"), trace::SpeedPreset::kTen);
  EXPECT_EQ(trace::SpeedFromString("Max"), trace::SpeedPreset::kMax);
  EXPECT_EQ(trace::SpeedFromString("max"), trace::SpeedPreset::kMax);
  EXPECT_FALSE(trace::SpeedFromString("3x").has_value());
  EXPECT_EQ(trace::ToString(trace::SpeedPreset::kTen), "10x");
  EXPECT_DOUBLE_EQ(trace::SpeedValue(trace::SpeedPreset::kHalf), 0.5);
  EXPECT_TRUE(std::isinf(trace::SpeedValue(trace::SpeedPreset::kMax)));
}
