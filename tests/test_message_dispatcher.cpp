#include <gtest/gtest.h>
#include <dispatch/message_dispatcher.hpp>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace cantrace;
using namespace cantrace::dispatch;
using namespace std::chrono_literals;

namespace {

core::Frame Make(uint32_t id, uint8_t b = 0) {
  return core::Frame::MakeData(id, std::vector<uint8_t>{b}).Value();
}

// Thread-safe collector used as a delivery target
struct Collector {
  std::mutex mu;
  std::vector<core::Frame> frames;
  void operator()(const core::Frame& f) {
    std::lock_guard<std::mutex> lk(mu);
    frames.push_back(f);
  }
  std::vector<core::Frame> Get() {
    std::lock_guard<std::mutex> lk(mu);
    return frames;
  }
};

} // namespace

TEST(MessageDispatcher, ExactFilterOnlySeesItsId) {
  MessageDispatcher d;
  Collector exact, all;
  ASSERT_TRUE(d.Subscribe(Filter::Exact(0x123), [&](const core::Frame& f) { exact(f); }).HasValue());
  ASSERT_TRUE(d.Subscribe(Filter::All(), [&](const core::Frame& f) { all(f); }).HasValue());
  EXPECT_EQ(d.SubscriberCount(), 2u);

  d.Dispatch(Make(0x123, 1));
  d.Dispatch(Make(0x456, 2));
  d.Dispatch(Make(0x123, 3));
  ASSERT_TRUE(d.WaitUntilIdle(2s));

  auto e = exact.Get();
  ASSERT_EQ(e.size(), 2u);
  EXPECT_EQ(e[0].Payload()[0], 1);
  EXPECT_EQ(e[1].Payload()[0], 3);
  EXPECT_EQ(all.Get().size(), 3u);
}

TEST(MessageDispatcher, PerSubscriptionOrderIsDispatchOrder) {
  MessageDispatcher d;
  Collector c;
  ASSERT_TRUE(d.Subscribe(Filter::All(), [&](const core::Frame& f) { c(f); },
                          SubscriptionOptions{"ordered", 0, OverflowPolicy::kUnbounded}).HasValue());
  std::vector<core::Frame> batch;
  for (int i = 0; i < 500; ++i) batch.push_back(Make(static_cast<uint32_t>(i % 0x7FF), static_cast<uint8_t>(i)));
  d.DispatchBatch(batch);
  ASSERT_TRUE(d.WaitUntilIdle(2s));

  auto got = c.Get();
  ASSERT_EQ(got.size(), batch.size());
  for (std::size_t i = 0; i < got.size(); ++i) EXPECT_EQ(got[i], batch[i]);
}

TEST(MessageDispatcher, ThrowingTargetDoesNotAffectOthers) {
  MessageDispatcher d;
  std::mutex mu;
  std::vector<DeliveryError> errors;
  d.SetErrorHandler([&](const DeliveryError& e) {
    std::lock_guard<std::mutex> lk(mu);
    errors.push_back(e);
  });

  Collector good;
  auto bad = d.Subscribe(Filter::All(), [](const core::Frame&) { throw std::runtime_error("decoder broke"); },
                         SubscriptionOptions{"watch", 0, OverflowPolicy::kDropOldest});
  ASSERT_TRUE(bad.HasValue());
  ASSERT_TRUE(d.Subscribe(Filter::All(), [&](const core::Frame& f) { good(f); }).HasValue());

  d.Dispatch(Make(0x10));
  d.Dispatch(Make(0x11));
  ASSERT_TRUE(d.WaitUntilIdle(2s));

  EXPECT_EQ(good.Get().size(), 2u);
  std::lock_guard<std::mutex> lk(mu);
  ASSERT_EQ(errors.size(), 2u);
  EXPECT_EQ(errors[0].subscription, "watch");
  EXPECT_EQ(errors[0].handle, *bad);
  EXPECT_EQ(errors[0].message, "decoder broke");
  EXPECT_EQ(errors[0].frame.Id(), 0x10u);

  auto st = d.Stats(*bad);
  ASSERT_TRUE(st.HasValue());
  EXPECT_EQ(st->faults, 2u);
  EXPECT_EQ(st->delivered, 0u);
}

TEST(MessageDispatcher, UnsubscribeStopsDelivery) {
  MessageDispatcher d;
  Collector c;
  auto h = d.Subscribe(Filter::All(), [&](const core::Frame& f) { c(f); });
  ASSERT_TRUE(h.HasValue());
  d.Dispatch(Make(1));
  ASSERT_TRUE(d.WaitUntilIdle(2s));
  ASSERT_TRUE(d.Unsubscribe(*h).HasValue());
  d.Dispatch(Make(2));
  ASSERT_TRUE(d.WaitUntilIdle(2s));
  EXPECT_EQ(c.Get().size(), 1u);
  EXPECT_EQ(d.SubscriberCount(), 0u);

  auto again = d.Unsubscribe(*h);
  ASSERT_FALSE(again.HasValue());
  EXPECT_EQ(again.Error().value, core::Errc::kNotFound);
  EXPECT_FALSE(d.Stats(*h).HasValue());
}

TEST(MessageDispatcher, TargetMayUnsubscribeItself) {
  MessageDispatcher d;
  std::atomic<int> calls{0};
  std::promise<SubscriptionHandle> self;
  auto self_handle = self.get_future().share();

  auto h = d.Subscribe(Filter::All(), [&](const core::Frame&) {
    ++calls;
    EXPECT_TRUE(d.Unsubscribe(self_handle.get()).HasValue());
  }, SubscriptionOptions{"once", 0, OverflowPolicy::kUnbounded});
  ASSERT_TRUE(h.HasValue());
  self.set_value(*h);

  d.Dispatch(Make(1));
  d.Dispatch(Make(2));
  d.Dispatch(Make(3));
  ASSERT_TRUE(d.WaitUntilIdle(2s));
  std::this_thread::sleep_for(20ms);
  EXPECT_EQ(calls.load(), 1);
  EXPECT_EQ(d.SubscriberCount(), 0u);
}

TEST(MessageDispatcher, UnsubscribeDiscardsFramesQueuedBehindABusyTarget) {
  MessageDispatcher d;
  std::promise<void> entered;
  auto entered_f = entered.get_future();
  std::promise<void> release;
  auto gate = release.get_future().share();
  std::atomic<int> calls{0};

  auto h = d.Subscribe(Filter::All(), [&](const core::Frame&) {
    if (++calls == 1) {
      entered.set_value();
      gate.wait();
    }
  }, SubscriptionOptions{"slow", 0, OverflowPolicy::kUnbounded});
  ASSERT_TRUE(h.HasValue());

  d.Dispatch(Make(0x1));
  ASSERT_EQ(entered_f.wait_for(2s), std::future_status::ready);
  for (uint8_t i = 0; i < 10; ++i) d.Dispatch(Make(0x1, i));
  auto st = d.Stats(*h);
  ASSERT_TRUE(st.HasValue());
  EXPECT_EQ(st->queued, 10u);

  // blocks until the running delivery returns
  std::thread unsubscriber([&] { EXPECT_TRUE(d.Unsubscribe(*h).HasValue()); });
  const auto deadline = std::chrono::steady_clock::now() + 2s;
  while (d.SubscriberCount() != 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(1ms);
  }
  EXPECT_EQ(d.SubscriberCount(), 0u);
  // waits for the control lock, so the slow queue is closed by now
  EXPECT_TRUE(d.Subscribe(Filter::Exact(0x7FF), [](const core::Frame&) {}).HasValue());
  release.set_value();
  unsubscriber.join();

  EXPECT_EQ(calls.load(), 1);
  EXPECT_TRUE(d.WaitUntilIdle(2s));
}

TEST(MessageDispatcher, RepeatedSelfUnsubscribeKeepsTheDispatcherUsable) {
  MessageDispatcher d;
  std::atomic<int> calls{0};
  for (int i = 0; i < 20; ++i) {
    std::promise<SubscriptionHandle> self;
    auto self_handle = self.get_future().share();
    auto h = d.Subscribe(Filter::Exact(0x30), [&, self_handle](const core::Frame&) {
      ++calls;
      EXPECT_TRUE(d.Unsubscribe(self_handle.get()).HasValue());
    });
    ASSERT_TRUE(h.HasValue());
    self.set_value(*h);
    d.Dispatch(Make(0x30));
    ASSERT_TRUE(d.WaitUntilIdle(2s));
    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (d.SubscriberCount() != 0 && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(1ms);
    }
    ASSERT_EQ(d.SubscriberCount(), 0u);
  }
  EXPECT_EQ(calls.load(), 20);

  Collector c;
  ASSERT_TRUE(d.Subscribe(Filter::All(), [&](const core::Frame& f) { c(f); }).HasValue());
  d.Dispatch(Make(0x31));
  ASSERT_TRUE(d.WaitUntilIdle(2s));
  EXPECT_EQ(c.Get().size(), 1u);
  d.Shutdown();
}

TEST(MessageDispatcher, ShutdownFromInsideATarget) {
  auto d = std::make_unique<MessageDispatcher>();
  std::promise<void> done;
  auto done_f = done.get_future();
  std::atomic<int> calls{0};
  Collector other;

  ASSERT_TRUE(d->Subscribe(Filter::Exact(0x1), [&](const core::Frame&) {
    if (++calls > 1) return;
    d->Shutdown();
    done.set_value();
  }, SubscriptionOptions{"closer", 0, OverflowPolicy::kUnbounded}).HasValue());
  ASSERT_TRUE(d->Subscribe(Filter::Exact(0x2), [&](const core::Frame& f) { other(f); }).HasValue());

  d->Dispatch(Make(0x1));
  d->Dispatch(Make(0x1));
  d->Dispatch(Make(0x2));
  ASSERT_EQ(done_f.wait_for(2s), std::future_status::ready);

  EXPECT_EQ(d->SubscriberCount(), 0u);
  auto r = d->Subscribe(Filter::All(), [](const core::Frame&) {});
  ASSERT_FALSE(r.HasValue());
  EXPECT_EQ(r.Error().value, core::Errc::kStateError);

  // the detached drain must not need the dispatcher any more
  d.reset();
  std::this_thread::sleep_for(20ms);
  EXPECT_EQ(calls.load(), 1);
}

TEST(MessageDispatcher, NonStandardThrowFromTheErrorHandlerIsContained) {
  MessageDispatcher d;
  std::atomic<int> reports{0};
  d.SetErrorHandler([&](const DeliveryError&) {
    ++reports;
    throw 42;
  });
  auto bad = d.Subscribe(Filter::All(), [](const core::Frame&) { throw std::runtime_error("broken"); });
  ASSERT_TRUE(bad.HasValue());

  d.Dispatch(Make(0x1));
  d.Dispatch(Make(0x2));
  ASSERT_TRUE(d.WaitUntilIdle(2s));
  EXPECT_EQ(reports.load(), 2);
  EXPECT_EQ(d.Stats(*bad)->faults, 2u);
}

TEST(MessageDispatcher, SubscribeFromInsideATarget) {
  MessageDispatcher d;
  Collector late;
  std::atomic<bool> added{false};
  ASSERT_TRUE(d.Subscribe(Filter::Exact(0x1), [&](const core::Frame&) {
    if (added.exchange(true)) return;
    EXPECT_TRUE(d.Subscribe(Filter::Exact(0x2), [&](const core::Frame& f) { late(f); }).HasValue());
  }).HasValue());

  d.Dispatch(Make(0x1));
  ASSERT_TRUE(d.WaitUntilIdle(2s));
  d.Dispatch(Make(0x2));
  ASSERT_TRUE(d.WaitUntilIdle(2s));
  EXPECT_EQ(late.Get().size(), 1u);
}

TEST(MessageDispatcher, SlowConsumerDropsOldestWithoutBlockingTheProducer) {
  MessageDispatcher d;
  std::promise<void> release;
  auto gate = release.get_future().share();
  Collector c;
  auto h = d.Subscribe(Filter::All(), [&](const core::Frame& f) {
    gate.wait();
    c(f);
  }, SubscriptionOptions{"slow", 4, OverflowPolicy::kDropOldest});
  ASSERT_TRUE(h.HasValue());

  const auto t0 = std::chrono::steady_clock::now();
  for (int i = 0; i < 100; ++i) d.Dispatch(Make(0x20, static_cast<uint8_t>(i)));
  EXPECT_LT(std::chrono::steady_clock::now() - t0, 1s);

  release.set_value();
  ASSERT_TRUE(d.WaitUntilIdle(2s));

  auto got = c.Get();
  // the frame in flight when the queue filled, then the newest four
  ASSERT_GE(got.size(), 4u);
  ASSERT_LE(got.size(), 5u);
  EXPECT_EQ(got.back().Payload()[0], 99);
  EXPECT_EQ(got[got.size() - 4].Payload()[0], 96);
  auto st = d.Stats(*h);
  ASSERT_TRUE(st.HasValue());
  EXPECT_EQ(st->dropped + st->delivered, 100u);
}

TEST(MessageDispatcher, DropNewestKeepsQueuedFrames) {
  MessageDispatcher d;
  std::promise<void> release;
  auto gate = release.get_future().share();
  std::promise<void> started;
  std::atomic<bool> first{true};
  Collector c;
  auto h = d.Subscribe(Filter::All(), [&](const core::Frame& f) {
    if (first.exchange(false)) started.set_value();
    gate.wait();
    c(f);
  }, SubscriptionOptions{"newest", 2, OverflowPolicy::kDropNewest});
  ASSERT_TRUE(h.HasValue());

  d.Dispatch(Make(0x30, 0));
  started.get_future().wait();   // frame 0 is in flight, queue empty
  for (uint8_t i = 1; i <= 5; ++i) d.Dispatch(Make(0x30, i));
  release.set_value();
  ASSERT_TRUE(d.WaitUntilIdle(2s));

  auto got = c.Get();
  ASSERT_EQ(got.size(), 3u);
  EXPECT_EQ(got[1].Payload()[0], 1);
  EXPECT_EQ(got[2].Payload()[0], 2);
  EXPECT_EQ(d.Stats(*h)->dropped, 3u);
}

TEST(MessageDispatcher, InvalidSubscriptions) {
  MessageDispatcher d;
  auto no_target = d.Subscribe(Filter::All(), nullptr);
  ASSERT_FALSE(no_target.HasValue());
  EXPECT_EQ(no_target.Error().value, core::Errc::kInvalidArgument);

  auto bad_id = d.Subscribe(Filter::Exact(0x20000000), [](const core::Frame&) {});
  ASSERT_FALSE(bad_id.HasValue());
  EXPECT_EQ(bad_id.Error().value, core::Errc::kInvalidArgument);
}

TEST(MessageDispatcher, NoSubscribersIsANoOp) {
  MessageDispatcher d;
  d.Dispatch(Make(0x1));
  EXPECT_TRUE(d.WaitUntilIdle(100ms));
}

TEST(MessageDispatcher, SubscribeAfterShutdownFails) {
  MessageDispatcher d;
  Collector c;
  ASSERT_TRUE(d.Subscribe(Filter::All(), [&](const core::Frame& f) { c(f); }).HasValue());
  d.Shutdown();
  EXPECT_EQ(d.SubscriberCount(), 0u);
  d.Dispatch(Make(0x1));
  auto r = d.Subscribe(Filter::All(), [](const core::Frame&) {});
  ASSERT_FALSE(r.HasValue());
  EXPECT_EQ(r.Error().value, core::Errc::kStateError);
}

TEST(MessageDispatcher, ConcurrentSubscribeWhileDispatching) {
  MessageDispatcher d;
  std::atomic<bool> stop{false};
  std::thread producer([&] {
    while (!stop.load()) d.Dispatch(Make(0x55));
  });
  for (int i = 0; i < 50; ++i) {
    auto h = d.Subscribe(Filter::Exact(0x55), [](const core::Frame&) {});
    ASSERT_TRUE(h.HasValue());
    ASSERT_TRUE(d.Unsubscribe(*h).HasValue());
  }
  stop.store(true);
  producer.join();
  EXPECT_EQ(d.SubscriberCount(), 0u);
}
