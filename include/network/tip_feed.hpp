// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#pragma once

#include "util/uint.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace watchtower {
namespace network {

// Topic bitcoind publishes new best-tip hashes on
inline constexpr const char *HASHBLOCK_TOPIC = "hashblock";

struct FeedMessage {
  std::string topic;
  std::vector<uint8_t> payload;
};

struct FeedParams {
  std::string protocol = "tcp";
  std::string host = "127.0.0.1";
  uint16_t port = 28332;

  // protocol://host:port
  std::string Endpoint() const;
};

// Decode a hashblock notification. Returns std::nullopt for other topics
// and for payloads that are not exactly 32 bytes.
std::optional<uint256> DecodeTipMessage(const FeedMessage &message);

/**
 * TipFeed - Abstract push channel of tip notifications
 *
 * Allows dependency injection of different implementations:
 * - ZmqTipFeed: bitcoind ZMQ publisher
 * - ScriptedTipFeed: replays canned messages for testing (in test/)
 */
class TipFeed {
public:
  virtual ~TipFeed() = default;

  // Block until the next message arrives
  // Returns std::nullopt once the feed has been closed
  virtual std::optional<FeedMessage> Receive() = 0;

  // Unblock any pending Receive() and make all later calls return
  // std::nullopt. Safe to call from any thread, more than once.
  virtual void Close() noexcept = 0;
};

} // namespace network
} // namespace watchtower
