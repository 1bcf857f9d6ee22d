// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#include "chain/tip_state.hpp"
#include <algorithm>

namespace watchtower {
namespace chain {

TipStateTracker::TipStateTracker(util::ThreadSafeQueue<uint256> &pending,
                                 size_t window_size)
    : pending_(pending), window_size_(window_size) {}

bool TipStateTracker::Enqueue(const uint256 &hash) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_ || IsKnownLocked(hash)) {
    return false;
  }

  AdvanceLocked(hash);
  pending_.Push(hash);
  return true;
}

void TipStateTracker::Seed(const uint256 &hash) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (current_ && *current_ == hash) {
    return;
  }
  AdvanceLocked(hash);
}

void TipStateTracker::Close() {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_ = true;
}

bool TipStateTracker::IsClosed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

std::optional<uint256> TipStateTracker::GetTip() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_;
}

std::vector<uint256> TipStateTracker::GetWindow() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<uint256>(window_.begin(), window_.end());
}

bool TipStateTracker::InWindow(const uint256 &hash) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::find(window_.begin(), window_.end(), hash) != window_.end();
}

bool TipStateTracker::IsKnownLocked(const uint256 &hash) const {
  if (current_ && *current_ == hash) {
    return true;
  }
  return std::find(window_.begin(), window_.end(), hash) != window_.end();
}

void TipStateTracker::AdvanceLocked(const uint256 &hash) {
  // An absent tip is never recorded in the window
  if (current_) {
    window_.push_back(*current_);
    while (window_.size() > window_size_) {
      window_.pop_front();
    }
  }
  current_ = hash;
}

} // namespace chain
} // namespace watchtower
