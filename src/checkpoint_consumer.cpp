// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#include "checkpoint_consumer.hpp"
#include "util/logging.hpp"

namespace watchtower {
namespace app {

CheckpointConsumer::CheckpointConsumer(std::string name, chain::TipStore &store)
    : name_(std::move(name)), store_(store) {}

CheckpointConsumer::~CheckpointConsumer() { Stop(); }

void CheckpointConsumer::Start() {
  if (running_.exchange(true)) {
    return;
  }
  worker_ = std::thread(&CheckpointConsumer::Run, this);
  LOG_APP_INFO("{} started", name_);
}

void CheckpointConsumer::Stop() {
  running_ = false;
  if (worker_.joinable()) {
    worker_.join();
    LOG_APP_INFO("{} stopped after {} blocks", name_, processed_.load());
  }
}

void CheckpointConsumer::Run() {
  while (true) {
    auto hash = queue_.WaitAndPop(POP_TIMEOUT);
    if (!hash) {
      if (!running_) {
        break;
      }
      continue;
    }

    store_.SetTip(name_, *hash);
    ++processed_;
    LOG_APP_INFO("{}: new block {}", name_, hash->GetHex());
  }
}

} // namespace app
} // namespace watchtower
