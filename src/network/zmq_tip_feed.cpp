// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#include "network/zmq_tip_feed.hpp"
#include "util/logging.hpp"
#include <cerrno>
#include <iterator>
#include <vector>
#include <zmq_addon.hpp>

namespace watchtower {
namespace network {

ZmqTipFeed::ZmqTipFeed(const FeedParams &params)
    : context_(1), socket_(context_, zmq::socket_type::sub) {
  // Never drop notifications on the floor
  socket_.set(zmq::sockopt::rcvhwm, 0);
  socket_.set(zmq::sockopt::linger, 0);
  socket_.set(zmq::sockopt::subscribe, HASHBLOCK_TOPIC);

  const std::string endpoint = params.Endpoint();
  socket_.connect(endpoint);
  LOG_CHAIN_INFO("Subscribed to {} on {}", HASHBLOCK_TOPIC, endpoint);
}

ZmqTipFeed::~ZmqTipFeed() {
  Close();
  socket_.close();
  context_.close();
}

std::optional<FeedMessage> ZmqTipFeed::Receive() {
  if (closed_.load()) {
    return std::nullopt;
  }

  // bitcoind sends [topic, body, sequence]
  std::vector<zmq::message_t> parts;
  try {
    if (!zmq::recv_multipart(socket_, std::back_inserter(parts))) {
      return FeedMessage{};
    }
  } catch (const zmq::error_t &e) {
    if (e.num() == ETERM) {
      return std::nullopt;
    }
    throw;
  }

  FeedMessage message;
  if (!parts.empty()) {
    message.topic = parts[0].to_string();
  }
  if (parts.size() > 1) {
    const auto *data = parts[1].data<uint8_t>();
    message.payload.assign(data, data + parts[1].size());
  }
  return message;
}

void ZmqTipFeed::Close() noexcept {
  if (closed_.exchange(true)) {
    return;
  }
  context_.shutdown();
}

} // namespace network
} // namespace watchtower
