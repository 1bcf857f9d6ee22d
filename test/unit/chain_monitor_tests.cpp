// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#include "chain/chain_monitor.hpp"
#include "infra/fake_block_source.hpp"
#include "infra/recording_sink.hpp"
#include "infra/scripted_tip_feed.hpp"
#include "infra/test_helpers.hpp"
#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include <chrono>
#include <set>
#include <thread>

using namespace watchtower;
using namespace watchtower::chain;
using namespace watchtower::test;
using namespace std::chrono_literals;

namespace {

ChainMonitorConfig QuietPolling() {
  ChainMonitorConfig config;
  // Only WakePoller() triggers a poll
  config.polling_interval = std::chrono::hours(1);
  config.window_size = 10;
  config.notify_timeout = 10ms;
  config.feed_retry_delay = 10ms;
  return config;
}

// Monitor over a fake node and a scripted feed with two recording sinks
struct MonitorFixture {
  FakeBlockSource node;
  BlockProcessor processor{node};
  RecordingSink watcher;
  RecordingSink responder;
  ScriptedTipFeed *feed{nullptr};
  std::unique_ptr<ChainMonitor> monitor;

  explicit MonitorFixture(const ChainMonitorConfig &config = QuietPolling()) {
    auto scripted = std::make_unique<ScriptedTipFeed>();
    feed = scripted.get();
    monitor = std::make_unique<ChainMonitor>(
        std::vector<BlockSink *>{&watcher, &responder}, processor,
        std::move(scripted), config);
  }
};

// Node whose best tip query blocks until released
class SlowBestTipSource : public FakeBlockSource {
public:
  uint256 GetBestBlockHash() override {
    waiting_ = true;
    while (!released_) {
      std::this_thread::sleep_for(1ms);
    }
    return FakeBlockSource::GetBestBlockHash();
  }

  bool waiting() const { return waiting_.load(); }
  void Release() { released_ = true; }

private:
  std::atomic<bool> waiting_{false};
  std::atomic<bool> released_{false};
};

} // namespace

TEST_CASE("ChainMonitor: construction requires sinks and a feed",
          "[chain][monitor]") {
  FakeBlockSource node;
  BlockProcessor processor(node);
  RecordingSink sink;

  SECTION("Empty sink list") {
    REQUIRE_THROWS_AS(ChainMonitor({}, processor,
                                   std::make_unique<ScriptedTipFeed>()),
                      std::invalid_argument);
  }

  SECTION("Null sink") {
    REQUIRE_THROWS_AS(ChainMonitor({&sink, nullptr}, processor,
                                   std::make_unique<ScriptedTipFeed>()),
                      std::invalid_argument);
  }

  SECTION("Null feed") {
    REQUIRE_THROWS_AS(ChainMonitor({&sink}, processor, nullptr),
                      std::invalid_argument);
  }
}

TEST_CASE("ChainMonitor: lifecycle transitions are guarded",
          "[chain][monitor][lifecycle]") {
  MonitorFixture f;
  REQUIRE(f.monitor->GetPhase() == MonitorPhase::IDLE);

  SECTION("Activate before MonitorChain fails and leaves the phase") {
    REQUIRE_THROWS_AS(f.monitor->Activate(), LifecycleError);
    REQUIRE(f.monitor->GetPhase() == MonitorPhase::IDLE);
  }

  SECTION("MonitorChain twice fails") {
    f.monitor->MonitorChain();
    REQUIRE(f.monitor->GetPhase() == MonitorPhase::LISTENING);
    REQUIRE_THROWS_AS(f.monitor->MonitorChain(), LifecycleError);
    REQUIRE(f.monitor->GetPhase() == MonitorPhase::LISTENING);
  }

  SECTION("Activate twice fails") {
    f.monitor->MonitorChain();
    f.monitor->Activate();
    REQUIRE(f.monitor->GetPhase() == MonitorPhase::ACTIVE);
    REQUIRE_THROWS_AS(f.monitor->Activate(), LifecycleError);
    REQUIRE(f.monitor->GetPhase() == MonitorPhase::ACTIVE);
  }

  SECTION("Terminate from IDLE, then nothing can start") {
    f.monitor->Terminate();
    REQUIRE(f.monitor->GetPhase() == MonitorPhase::TERMINATED);
    REQUIRE_THROWS_AS(f.monitor->MonitorChain(), LifecycleError);
    REQUIRE_THROWS_AS(f.monitor->Activate(), LifecycleError);
  }

  SECTION("Terminate is idempotent") {
    f.monitor->MonitorChain();
    f.monitor->Activate();
    f.monitor->Terminate();
    f.monitor->Terminate();
    f.monitor->Join();
    REQUIRE(f.monitor->GetPhase() == MonitorPhase::TERMINATED);
  }

  SECTION("SeedTip only while IDLE") {
    f.monitor->SeedTip(TestHash(1000));
    REQUIRE(f.monitor->GetBestTip() == TestHash(1000));
    f.monitor->MonitorChain();
    REQUIRE_THROWS_AS(f.monitor->SeedTip(TestHash(1001)), LifecycleError);
  }
}

TEST_CASE("ChainMonitor: MonitorChain seeds the tip from the node",
          "[chain][monitor]") {
  MonitorFixture f;
  auto blocks = f.node.Extend(3);

  f.monitor->MonitorChain();
  REQUIRE(f.monitor->GetBestTip() == blocks.back());

  f.monitor->Activate();

  // The seed itself is never delivered
  f.monitor->WakePoller();
  std::this_thread::sleep_for(100ms);
  REQUIRE(f.watcher.Size() == 0);
  REQUIRE(f.responder.Size() == 0);
}

TEST_CASE("ChainMonitor: an existing tip is not re-seeded",
          "[chain][monitor]") {
  MonitorFixture f;
  f.node.Extend(2);

  f.monitor->SeedTip(TestHash(5000));
  f.monitor->MonitorChain();
  REQUIRE(f.monitor->GetBestTip() == TestHash(5000));
}

TEST_CASE("ChainMonitor: seeding does not hold up Terminate",
          "[chain][monitor][lifecycle]") {
  SlowBestTipSource node;
  BlockProcessor processor(node);
  RecordingSink sink;
  ChainMonitor monitor({&sink}, processor, std::make_unique<ScriptedTipFeed>(),
                       QuietPolling());

  std::atomic<bool> rejected{false};
  std::thread starter([&] {
    try {
      monitor.MonitorChain();
    } catch (const LifecycleError &) {
      rejected = true;
    }
  });
  REQUIRE(WaitUntil([&] { return node.waiting(); }));

  // The node has not answered yet
  auto start = std::chrono::steady_clock::now();
  monitor.Terminate();
  REQUIRE(monitor.GetPhase() == MonitorPhase::TERMINATED);
  REQUIRE(std::chrono::steady_clock::now() - start < 1s);

  node.Release();
  starter.join();
  REQUIRE(rejected);
  REQUIRE_FALSE(monitor.GetBestTip().has_value());
  monitor.Join();
}

TEST_CASE("ChainMonitor: feed and poller report the same tip once",
          "[chain][monitor]") {
  // Fresh instance, two sinks, W=10, seeded with a1
  MonitorFixture f;
  const uint256 a1 = f.node.Tip();

  f.monitor->MonitorChain();
  f.monitor->Activate();
  REQUIRE(f.monitor->GetBestTip() == a1);

  // b2 is mined; the feed sees it, then the poller does
  const uint256 b2 = f.node.Extend(1).back();
  f.feed->PublishTip(b2);
  REQUIRE(WaitUntil([&] { return f.watcher.Size() == 1; }));
  f.monitor->WakePoller();
  REQUIRE(WaitUntil([&] { return f.node.best_queries() >= 2; }));
  std::this_thread::sleep_for(50ms);

  REQUIRE(f.watcher.Received() == std::vector<uint256>{b2});
  REQUIRE(f.responder.Received() == std::vector<uint256>{b2});
  REQUIRE(f.monitor->GetBestTip() == b2);
  REQUIRE(f.monitor->GetLastTips() == std::vector<uint256>{a1});

  SECTION("Reorg back to a1 is rejected while a1 is in the window") {
    REQUIRE_FALSE(f.monitor->Enqueue(a1));
    f.feed->PublishTip(a1);
    std::this_thread::sleep_for(50ms);
    REQUIRE(f.watcher.Size() == 1);
    REQUIRE(f.monitor->GetBestTip() == b2);
  }
}

TEST_CASE("ChainMonitor: concurrent detection of one tip delivers once",
          "[chain][monitor][threading]") {
  MonitorFixture f;
  f.monitor->MonitorChain();
  f.monitor->Activate();

  for (int round = 0; round < 20; ++round) {
    const uint256 tip = f.node.Extend(1).back();
    f.feed->PublishTip(tip);
    f.monitor->WakePoller();
    std::thread extra([&] { f.monitor->Enqueue(tip); });
    extra.join();
    REQUIRE(WaitUntil([&] { return f.responder.Size() == size_t(round + 1); }));
  }

  std::this_thread::sleep_for(50ms);
  auto received = f.watcher.Received();
  REQUIRE(received.size() == 20);
  REQUIRE(std::set<uint256>(received.begin(), received.end()).size() == 20);
}

TEST_CASE("ChainMonitor: novel tips are delivered in order",
          "[chain][monitor]") {
  MonitorFixture f;
  f.monitor->MonitorChain();
  f.monitor->Activate();

  std::vector<uint256> expected;
  for (uint32_t i = 1; i <= 25; ++i) {
    expected.push_back(TestHash(100 + i));
    f.feed->PublishTip(expected.back());
  }

  REQUIRE(WaitUntil([&] { return f.watcher.Size() == expected.size(); }));
  REQUIRE(WaitUntil([&] { return f.responder.Size() == expected.size(); }));
  REQUIRE(f.watcher.Received() == expected);
  REQUIRE(f.responder.Received() == expected);
  REQUIRE(f.monitor->GetLastTips().size() == f.monitor->WindowCapacity());
}

TEST_CASE("ChainMonitor: LISTENING accumulates without delivering",
          "[chain][monitor][lifecycle]") {
  MonitorFixture f;
  f.monitor->MonitorChain();

  f.feed->PublishTip(TestHash(1));
  f.feed->PublishTip(TestHash(2));
  REQUIRE(WaitUntil([&] { return f.monitor->PendingCount() == 2; }));
  std::this_thread::sleep_for(50ms);
  REQUIRE(f.watcher.Size() == 0);

  f.monitor->Activate();
  REQUIRE(WaitUntil([&] { return f.watcher.Size() == 2; }));
  REQUIRE(f.watcher.Received() ==
          std::vector<uint256>{TestHash(1), TestHash(2)});
  REQUIRE(f.monitor->PendingCount() == 0);
}

TEST_CASE("ChainMonitor: Terminate drops pending hashes",
          "[chain][monitor][lifecycle]") {
  MonitorFixture f;
  f.monitor->MonitorChain();

  REQUIRE(f.monitor->Enqueue(TestHash(1)));
  REQUIRE(f.monitor->Enqueue(TestHash(2)));
  REQUIRE(f.monitor->Enqueue(TestHash(3)));
  REQUIRE(f.monitor->PendingCount() == 3);

  f.monitor->Terminate();
  f.monitor->Join();

  REQUIRE_FALSE(f.monitor->Enqueue(TestHash(4)));
  REQUIRE_THROWS_AS(f.monitor->Activate(), LifecycleError);
  std::this_thread::sleep_for(50ms);
  REQUIRE(f.watcher.Size() == 0);
  REQUIRE(f.responder.Size() == 0);
}

TEST_CASE("ChainMonitor: nothing is delivered after Terminate returns",
          "[chain][monitor][lifecycle]") {
  MonitorFixture f;
  f.monitor->MonitorChain();
  f.monitor->Activate();

  std::atomic<bool> stop{false};
  std::thread producer([&] {
    uint32_t n = 0;
    while (!stop) {
      f.monitor->Enqueue(TestHash(n++));
    }
  });

  REQUIRE(WaitUntil([&] { return f.watcher.Size() > 10; }));
  f.monitor->Terminate();
  const size_t delivered = f.watcher.Size();

  std::this_thread::sleep_for(50ms);
  stop = true;
  producer.join();
  f.monitor->Join();

  REQUIRE(f.watcher.Size() == delivered);
}

TEST_CASE("ChainMonitor: Terminate closes the feed and stops all loops",
          "[chain][monitor][lifecycle]") {
  MonitorFixture f;
  f.monitor->MonitorChain();
  f.monitor->Activate();

  f.monitor->Terminate();
  REQUIRE(f.feed->IsClosed());

  // Returns only if every loop noticed
  f.monitor->Join();
  REQUIRE(f.monitor->GetPhase() == MonitorPhase::TERMINATED);
}

TEST_CASE("ChainMonitor: poller picks up new tips", "[chain][monitor]") {
  ChainMonitorConfig config = QuietPolling();
  config.polling_interval = 20ms;
  MonitorFixture f(config);

  f.monitor->MonitorChain();
  f.monitor->Activate();

  auto mined = f.node.Extend(1);
  REQUIRE(WaitUntil([&] { return f.watcher.Size() == 1; }));
  REQUIRE(f.watcher.Received() == mined);

  SECTION("Node outage does not stop the poller") {
    f.node.SetUnavailable(true);
    const int before = f.node.best_queries();
    REQUIRE(WaitUntil([&] { return f.node.best_queries() > before + 2; }));

    f.node.SetUnavailable(false);
    auto next = f.node.Extend(1);
    REQUIRE(WaitUntil([&] { return f.watcher.Size() == 2; }));
    REQUIRE(f.watcher.Received().back() == next.back());
  }
}

TEST_CASE("ChainMonitor: malformed feed messages are ignored",
          "[chain][monitor]") {
  MonitorFixture f;
  f.monitor->MonitorChain();
  f.monitor->Activate();

  network::FeedMessage wrong_topic;
  wrong_topic.topic = "hashtx";
  wrong_topic.payload.assign(32, 0x11);
  f.feed->Publish(wrong_topic);

  network::FeedMessage short_payload;
  short_payload.topic = network::HASHBLOCK_TOPIC;
  short_payload.payload.assign(31, 0x22);
  f.feed->Publish(short_payload);

  f.feed->Publish(network::FeedMessage{});

  f.feed->PublishTip(TestHash(77));
  REQUIRE(WaitUntil([&] { return f.watcher.Size() == 1; }));
  std::this_thread::sleep_for(50ms);
  REQUIRE(f.watcher.Received() == std::vector<uint256>{TestHash(77)});
}

TEST_CASE("ChainMonitor: feed errors do not stop the feed reader",
          "[chain][monitor]") {
  MonitorFixture f;
  f.monitor->MonitorChain();
  f.monitor->Activate();

  f.feed->FailNext();
  f.feed->PublishTip(TestHash(9));
  REQUIRE(WaitUntil([&] { return f.watcher.Size() == 1; }));
  REQUIRE(f.watcher.Received() == std::vector<uint256>{TestHash(9)});
}

TEST_CASE("ChainMonitor: a failing sink does not block the others",
          "[chain][monitor]") {
  FakeBlockSource node;
  BlockProcessor processor(node);
  ThrowingSink broken;
  RecordingSink sink;
  auto feed = std::make_unique<ScriptedTipFeed>();
  auto *feed_ptr = feed.get();

  ChainMonitor monitor({&broken, &sink}, processor, std::move(feed),
                       QuietPolling());
  monitor.MonitorChain();
  monitor.Activate();

  feed_ptr->PublishTip(TestHash(1));
  feed_ptr->PublishTip(TestHash(2));
  REQUIRE(WaitUntil([&] { return sink.Size() == 2; }));
  REQUIRE(sink.Received() == std::vector<uint256>{TestHash(1), TestHash(2)});
}
