// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#pragma once

#include "network/tip_feed.hpp"
#include <atomic>
#include <zmq.hpp>

namespace watchtower {
namespace network {

// ZmqTipFeed - SUB socket subscribed to bitcoind's hashblock publisher
// Close() shuts the context down, which fails the blocked receive with ETERM.
class ZmqTipFeed : public TipFeed {
public:
  explicit ZmqTipFeed(const FeedParams &params);
  ~ZmqTipFeed() override;

  ZmqTipFeed(const ZmqTipFeed &) = delete;
  ZmqTipFeed &operator=(const ZmqTipFeed &) = delete;

  std::optional<FeedMessage> Receive() override;
  void Close() noexcept override;

private:
  zmq::context_t context_;
  zmq::socket_t socket_;
  std::atomic<bool> closed_{false};
};

} // namespace network
} // namespace watchtower
