// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#include "chain/chain_monitor.hpp"
#include "util/logging.hpp"
#include <string>

namespace watchtower {
namespace chain {

const char *MonitorPhaseName(MonitorPhase phase) {
  switch (phase) {
  case MonitorPhase::IDLE:
    return "idle";
  case MonitorPhase::LISTENING:
    return "listening";
  case MonitorPhase::ACTIVE:
    return "active";
  case MonitorPhase::TERMINATED:
    return "terminated";
  }
  return "unknown";
}

ChainMonitor::ChainMonitor(std::vector<BlockSink *> sinks,
                           BlockProcessor &block_processor,
                           std::unique_ptr<network::TipFeed> feed,
                           const ChainMonitorConfig &config)
    : sinks_(std::move(sinks)), block_processor_(block_processor),
      feed_(std::move(feed)), config_(config),
      tracker_(pending_, config.window_size) {
  if (sinks_.empty()) {
    throw std::invalid_argument("ChainMonitor requires at least one sink");
  }
  for (const auto *sink : sinks_) {
    if (!sink) {
      throw std::invalid_argument("ChainMonitor sink must not be null");
    }
  }
  if (!feed_) {
    throw std::invalid_argument("ChainMonitor requires a tip feed");
  }
}

ChainMonitor::~ChainMonitor() {
  Terminate();
  Join();
}

void ChainMonitor::MonitorChain() {
  const char *wrong_phase = "MonitorChain() called in phase ";
  if (MonitorPhase phase = GetPhase(); phase != MonitorPhase::IDLE) {
    throw LifecycleError(wrong_phase + std::string(MonitorPhaseName(phase)));
  }

  // Query outside the lock, the node may take up to its RPC timeout.
  // Reconciliation may already have set the tip.
  std::optional<uint256> seed;
  if (!tracker_.GetTip()) {
    seed = block_processor_.GetBestBlockHash();
    if (!seed) {
      LOG_CHAIN_WARN("Could not seed the chain tip, the first tip seen will "
                     "be delivered");
    }
  }

  std::lock_guard<std::mutex> lock(phase_mutex_);
  if (phase_ != MonitorPhase::IDLE) {
    throw LifecycleError(wrong_phase + std::string(MonitorPhaseName(phase_)));
  }
  if (seed && !tracker_.GetTip()) {
    tracker_.Seed(*seed);
    LOG_CHAIN_INFO("Monitoring chain from tip {}", seed->GetHex());
  }

  phase_ = MonitorPhase::LISTENING;
  poll_thread_ = std::thread(&ChainMonitor::PollingLoop, this);
  feed_thread_ = std::thread(&ChainMonitor::FeedLoop, this);
}

void ChainMonitor::Activate() {
  std::lock_guard<std::mutex> lock(phase_mutex_);
  if (phase_ != MonitorPhase::LISTENING) {
    throw LifecycleError(std::string("Activate() called in phase ") +
                         MonitorPhaseName(phase_));
  }

  phase_ = MonitorPhase::ACTIVE;
  notify_thread_ = std::thread(&ChainMonitor::NotifyLoop, this);
  LOG_CHAIN_INFO("Chain monitor active, {} pending", pending_.Size());
}

void ChainMonitor::Terminate() noexcept {
  {
    std::lock_guard<std::mutex> lock(phase_mutex_);
    if (phase_ == MonitorPhase::TERMINATED) {
      return;
    }
    phase_ = MonitorPhase::TERMINATED;
  }
  tracker_.Close();
  phase_cv_.notify_all();
  feed_->Close();
  LOG_CHAIN_INFO("Chain monitor terminated, dropping {} pending",
                 pending_.Size());
}

void ChainMonitor::Join() {
  if (poll_thread_.joinable()) {
    poll_thread_.join();
  }
  if (feed_thread_.joinable()) {
    feed_thread_.join();
  }
  if (notify_thread_.joinable()) {
    notify_thread_.join();
  }
}

bool ChainMonitor::Enqueue(const uint256 &hash) { return tracker_.Enqueue(hash); }

void ChainMonitor::SeedTip(const uint256 &hash) {
  std::lock_guard<std::mutex> lock(phase_mutex_);
  if (phase_ != MonitorPhase::IDLE) {
    throw LifecycleError(std::string("SeedTip() called in phase ") +
                         MonitorPhaseName(phase_));
  }
  tracker_.Seed(hash);
}

void ChainMonitor::WakePoller() {
  {
    std::lock_guard<std::mutex> lock(phase_mutex_);
    wake_requested_ = true;
  }
  phase_cv_.notify_all();
}

MonitorPhase ChainMonitor::GetPhase() const {
  std::lock_guard<std::mutex> lock(phase_mutex_);
  return phase_;
}

bool ChainMonitor::IsTerminated() const {
  return GetPhase() == MonitorPhase::TERMINATED;
}

void ChainMonitor::PollingLoop() {
  LOG_CHAIN_DEBUG("Poller started, interval {}ms",
                  config_.polling_interval.count());
  std::unique_lock<std::mutex> lock(phase_mutex_);
  while (phase_ != MonitorPhase::TERMINATED) {
    phase_cv_.wait_for(lock, config_.polling_interval, [this] {
      return phase_ == MonitorPhase::TERMINATED || wake_requested_;
    });
    if (phase_ == MonitorPhase::TERMINATED) {
      break;
    }
    wake_requested_ = false;
    lock.unlock();

    try {
      auto tip = block_processor_.GetBestBlockHash();
      if (tip && tracker_.Enqueue(*tip)) {
        LOG_CHAIN_INFO("New block received via polling: {}", tip->GetHex());
      }
    } catch (const std::exception &e) {
      LOG_CHAIN_ERROR("Poller error: {}", e.what());
    }

    lock.lock();
  }
  LOG_CHAIN_DEBUG("Poller stopped");
}

void ChainMonitor::FeedLoop() {
  LOG_CHAIN_DEBUG("Feed reader started");
  while (!IsTerminated()) {
    std::optional<network::FeedMessage> message;
    try {
      message = feed_->Receive();
    } catch (const std::exception &e) {
      LOG_CHAIN_WARN("Tip feed error: {}", e.what());
      std::unique_lock<std::mutex> lock(phase_mutex_);
      phase_cv_.wait_for(lock, config_.feed_retry_delay, [this] {
        return phase_ == MonitorPhase::TERMINATED;
      });
      continue;
    }

    if (!message) {
      break;
    }

    auto hash = network::DecodeTipMessage(*message);
    if (!hash) {
      LOG_CHAIN_DEBUG("Ignoring feed message on topic '{}' ({} bytes)",
                      message->topic, message->payload.size());
      continue;
    }

    if (tracker_.Enqueue(*hash)) {
      LOG_CHAIN_INFO("New block received via feed: {}", hash->GetHex());
    }
  }
  LOG_CHAIN_DEBUG("Feed reader stopped");
}

void ChainMonitor::NotifyLoop() {
  LOG_CHAIN_DEBUG("Notifier started");
  while (!IsTerminated()) {
    auto hash = pending_.WaitAndPop(config_.notify_timeout);
    if (!hash) {
      continue;
    }

    std::lock_guard<std::mutex> lock(phase_mutex_);
    if (phase_ != MonitorPhase::ACTIVE) {
      break;
    }
    NotifySubscribers(*hash);
  }
  LOG_CHAIN_DEBUG("Notifier stopped");
}

void ChainMonitor::NotifySubscribers(const uint256 &hash) {
  LOG_CHAIN_DEBUG("Notifying {} subscribers of {}", sinks_.size(),
                  hash.GetHex());
  for (auto *sink : sinks_) {
    try {
      sink->Push(hash);
    } catch (const std::exception &e) {
      LOG_CHAIN_ERROR("Sink rejected block {}: {}", hash.GetHex(), e.what());
    }
  }
}

} // namespace chain
} // namespace watchtower
