// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#include "network/tip_feed.hpp"
#include <span>

namespace watchtower {
namespace network {

std::string FeedParams::Endpoint() const {
  return protocol + "://" + host + ":" + std::to_string(port);
}

std::optional<uint256> DecodeTipMessage(const FeedMessage &message) {
  if (message.topic != HASHBLOCK_TOPIC) {
    return std::nullopt;
  }
  if (message.payload.size() != uint256::size()) {
    return std::nullopt;
  }

  // Published in display order
  uint256 hash;
  hash.SetDisplayBytes(std::span<const unsigned char>(message.payload.data(),
                                                      message.payload.size()));
  return hash;
}

} // namespace network
} // namespace watchtower
