// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#include "application.hpp"
#include "chain/bootstrap.hpp"
#include "network/zmq_tip_feed.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <iostream>
#include <unistd.h> // write(), STDOUT_FILENO (async-signal-safe)
#include <zmq.hpp>

namespace watchtower {
namespace app {

namespace {
constexpr const char *TIPS_FILE = "tips.json";
constexpr const char *SOCKET_FILE = "watchtower.sock";
constexpr auto TIP_SAVE_INTERVAL = std::chrono::minutes(1);
} // namespace

uint16_t DefaultRpcPort(const std::string &btc_network) {
  if (btc_network == "mainnet")
    return 8332;
  if (btc_network == "testnet")
    return 18332;
  if (btc_network == "signet")
    return 38332;
  if (btc_network == "regtest")
    return 18443;
  return 0;
}

std::string ChainNameForNetwork(const std::string &btc_network) {
  if (btc_network == "mainnet")
    return "main";
  if (btc_network == "testnet")
    return "test";
  return btc_network;
}

// Static instance for signal handling
Application *Application::instance_ = nullptr;

Application::Application(const AppConfig &config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

Application *Application::instance() { return instance_; }

bool Application::initialize() {
  std::cout << GetStartupBanner(config_.btc_network) << std::flush;

  LOG_INFO("Initializing Watchtower...");

  if (!init_datadir()) {
    LOG_ERROR("Failed to initialize data directory");
    return false;
  }

  if (!init_bitcoind()) {
    LOG_ERROR("Failed to connect to bitcoind");
    return false;
  }

  if (!init_monitor()) {
    LOG_ERROR("Failed to initialize chain monitor");
    return false;
  }

  if (!init_rpc()) {
    LOG_ERROR("Failed to initialize RPC server");
    return false;
  }

  LOG_INFO("Initialization complete");
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_ERROR("Application already running");
    return false;
  }

  LOG_INFO("Starting Watchtower...");

  setup_signal_handlers();

  // Consumers must be draining before anything is replayed into them
  watcher_->Start();
  responder_->Start();

  if (!run_bootstrap()) {
    return false;
  }

  try {
    chain_monitor_->MonitorChain();
    chain_monitor_->Activate();
  } catch (const chain::LifecycleError &e) {
    LOG_ERROR("Failed to start chain monitor: {}", e.what());
    return false;
  }

  if (!rpc_server_->Start()) {
    LOG_ERROR("Failed to start RPC server");
    return false;
  }

  running_ = true;
  start_periodic_saves();

  LOG_INFO("Watchtower started successfully");
  LOG_INFO("Data directory: {}", config_.datadir.string());
  LOG_INFO("bitcoind RPC: {}:{}, feed: {}", config_.bitcoind.host,
           config_.bitcoind.port, config_.feed.Endpoint());
  LOG_INFO("Press Ctrl+C to stop");

  return true;
}

void Application::stop() {
  if (!running_) {
    return;
  }

  shutdown();
}

void Application::wait_for_shutdown() {
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (shutdown_requested_) {
    shutdown();
  }
}

void Application::shutdown() {
  if (!running_) {
    return;
  }

  LOG_INFO("Shutting down Watchtower...");

  running_ = false;

  stop_periodic_saves();

  // Stop accepting requests first
  if (rpc_server_) {
    LOG_INFO("Stopping RPC server...");
    rpc_server_->Stop();
  }

  if (chain_monitor_) {
    LOG_INFO("Stopping chain monitor...");
    chain_monitor_->Terminate();
    chain_monitor_->Join();
  }

  // Let the consumers finish what was already delivered
  if (watcher_) {
    watcher_->Stop();
  }
  if (responder_) {
    responder_->Stop();
  }

  if (tip_store_) {
    LOG_INFO("Saving consumer tips to disk...");
    if (!tip_store_->Save()) {
      LOG_ERROR("Failed to save consumer tips");
    }
  }

  if (datadir_lock_) {
    LOG_INFO("Releasing data directory lock...");
    datadir_lock_->Unlock();
  }

  LOG_INFO("Shutdown complete");
}

bool Application::init_datadir() {
  LOG_INFO("Data directory: {}", config_.datadir.string());

  if (!util::ensure_directory(config_.datadir)) {
    LOG_ERROR("Failed to create data directory: {}", config_.datadir.string());
    return false;
  }

  // Prevent multiple instances on one data directory
  datadir_lock_ = std::make_unique<util::DirectoryLock>(config_.datadir);
  util::LockResult lock_result = datadir_lock_->TryLock();

  if (lock_result == util::LockResult::ErrorWrite) {
    LOG_ERROR("Cannot write to data directory: {}", config_.datadir.string());
    return false;
  }

  if (lock_result == util::LockResult::ErrorLock) {
    LOG_ERROR("Cannot obtain a lock on data directory {}. "
              "Watchtower is probably already running.",
              config_.datadir.string());
    return false;
  }

  tip_store_ = std::make_unique<chain::TipStore>(config_.datadir / TIPS_FILE);
  if (!tip_store_->Load()) {
    LOG_INFO("No consumer tips found, starting fresh");
  }

  return true;
}

bool Application::init_bitcoind() {
  LOG_INFO("Connecting to bitcoind at {}:{}...", config_.bitcoind.host,
           config_.bitcoind.port);

  bitcoind_ = std::make_unique<rpc::BitcoindClient>(config_.bitcoind);

  std::string chain_name;
  try {
    chain_name = bitcoind_->GetChainName();
  } catch (const rpc::RPCError &e) {
    LOG_ERROR("bitcoind is not reachable: {}", e.what());
    return false;
  }

  const std::string expected = ChainNameForNetwork(config_.btc_network);
  if (chain_name != expected) {
    LOG_ERROR("bitcoind is running on {}, expected {}", chain_name, expected);
    return false;
  }

  block_processor_ = std::make_unique<chain::BlockProcessor>(*bitcoind_);
  return true;
}

bool Application::init_monitor() {
  LOG_INFO("Initializing chain monitor...");

  watcher_ = std::make_unique<CheckpointConsumer>("watcher", *tip_store_);
  responder_ = std::make_unique<CheckpointConsumer>("responder", *tip_store_);

  std::unique_ptr<network::TipFeed> feed;
  try {
    feed = std::make_unique<network::ZmqTipFeed>(config_.feed);
  } catch (const zmq::error_t &e) {
    LOG_ERROR("Failed to subscribe to {}: {}", config_.feed.Endpoint(),
              e.what());
    return false;
  }

  std::vector<chain::BlockSink *> sinks{&watcher_->queue(),
                                        &responder_->queue()};
  chain_monitor_ = std::make_unique<chain::ChainMonitor>(
      sinks, *block_processor_, std::move(feed), config_.monitor);
  return true;
}

bool Application::init_rpc() {
  LOG_INFO("Initializing RPC server...");

  std::string socket_path = (config_.datadir / SOCKET_FILE).string();
  auto shutdown_callback = [this]() { this->request_shutdown(); };

  rpc_server_ = std::make_unique<rpc::RPCServer>(
      socket_path, *chain_monitor_, *tip_store_, shutdown_callback);
  return true;
}

bool Application::run_bootstrap() {
  std::vector<chain::ConsumerCheckpoint> checkpoints{
      {watcher_->name(), tip_store_->GetTip(watcher_->name()),
       &watcher_->queue()},
      {responder_->name(), tip_store_->GetTip(responder_->name()),
       &responder_->queue()},
  };

  chain::BootstrapReconciler reconciler(*block_processor_, *chain_monitor_);

  for (int attempt = 1; attempt <= config_.bootstrap_attempts; ++attempt) {
    try {
      auto results = reconciler.Run(checkpoints);
      for (const auto &result : results) {
        if (!result.dropped_txids.empty()) {
          LOG_WARN("{}: {} transactions dropped by reorgs while offline",
                   result.name, result.dropped_txids.size());
        }
      }
      return true;
    } catch (const chain::ReconcileError &e) {
      if (e.kind() == chain::ReconcileErrorKind::NO_COMMON_ANCESTOR) {
        LOG_ERROR("Cannot reconcile consumer tips with bitcoind: {}. "
                  "Remove {} to start fresh.",
                  e.what(), tip_store_->path().string());
        return false;
      }
      LOG_WARN("Bootstrap attempt {}/{} failed: {}", attempt,
               config_.bootstrap_attempts, e.what());
    }

    if (attempt < config_.bootstrap_attempts && !shutdown_requested_) {
      std::this_thread::sleep_for(config_.bootstrap_retry_delay);
    }
  }

  LOG_ERROR("bitcoind unavailable, giving up on bootstrap");
  return false;
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int signal) {
  if (instance_) {
    // write() is async-signal-safe, std::cout is not
    const char *msg = "\nReceived signal\n";
    ssize_t written = write(STDOUT_FILENO, msg, 17);
    (void)written;

    instance_->shutdown_requested_ = true;
  }
}

void Application::start_periodic_saves() {
  LOG_INFO("Starting periodic tip saves (every minute)");
  save_thread_ =
      std::make_unique<std::thread>(&Application::periodic_save_loop, this);
}

void Application::stop_periodic_saves() {
  if (save_thread_ && save_thread_->joinable()) {
    LOG_DEBUG("Stopping periodic save thread");
    save_thread_->join();
    save_thread_.reset();
  }
}

void Application::periodic_save_loop() {
  using namespace std::chrono;

  auto last_save = steady_clock::now();

  while (running_) {
    std::this_thread::sleep_for(seconds(1));

    if (!running_)
      break;

    auto now = steady_clock::now();
    if (now - last_save >= TIP_SAVE_INTERVAL) {
      if (!tip_store_->Save()) {
        LOG_ERROR("Periodic tip save failed");
      }
      last_save = now;
    }
  }
}

} // namespace app
} // namespace watchtower
