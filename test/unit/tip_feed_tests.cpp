// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#include "network/tip_feed.hpp"
#include "network/zmq_tip_feed.hpp"
#include "infra/test_helpers.hpp"
#include <algorithm>
#include <chrono>
#include <catch2/catch_test_macros.hpp>
#include <thread>

using namespace watchtower;
using namespace watchtower::network;
using watchtower::test::TestHash;

TEST_CASE("TipFeed: hashblock decoding", "[network][feed]") {
  const uint256 hash = TestHash(0x1234);

  FeedMessage message;
  message.topic = HASHBLOCK_TOPIC;
  message.payload.assign(hash.begin(), hash.end());
  // Published in display order
  std::reverse(message.payload.begin(), message.payload.end());

  SECTION("Valid notification") {
    auto decoded = DecodeTipMessage(message);
    REQUIRE(decoded.has_value());
    REQUIRE(*decoded == hash);
    REQUIRE(decoded->GetHex() == hash.GetHex());
  }

  SECTION("Other topics are ignored") {
    message.topic = "rawblock";
    REQUIRE_FALSE(DecodeTipMessage(message).has_value());
  }

  SECTION("Payload must be 32 bytes") {
    message.payload.pop_back();
    REQUIRE_FALSE(DecodeTipMessage(message).has_value());
    message.payload.assign(33, 0xff);
    REQUIRE_FALSE(DecodeTipMessage(message).has_value());
    message.payload.clear();
    REQUIRE_FALSE(DecodeTipMessage(message).has_value());
  }
}

TEST_CASE("TipFeed: endpoint", "[network][feed]") {
  FeedParams params;
  REQUIRE(params.Endpoint() == "tcp://127.0.0.1:28332");

  params.host = "10.0.0.2";
  params.port = 29000;
  REQUIRE(params.Endpoint() == "tcp://10.0.0.2:29000");
}

TEST_CASE("ZmqTipFeed: Close unblocks Receive", "[network][feed][zmq]") {
  FeedParams params;
  // Nothing listens here; connect is asynchronous in ZMQ
  params.port = 28399;
  ZmqTipFeed feed(params);

  std::optional<FeedMessage> received = FeedMessage{};
  std::thread reader([&] { received = feed.Receive(); });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  feed.Close();
  reader.join();

  REQUIRE_FALSE(received.has_value());
  REQUIRE_FALSE(feed.Receive().has_value());
  // Idempotent
  feed.Close();
}
