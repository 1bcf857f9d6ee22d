// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#pragma once

#include "chain/block_processor.hpp"
#include "chain/chain_monitor.hpp"
#include "chain/tip_store.hpp"
#include "checkpoint_consumer.hpp"
#include "network/bitcoind_client.hpp"
#include "network/rpc_server.hpp"
#include "network/tip_feed.hpp"
#include "util/files.hpp"
#include "util/fs_lock.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>

namespace watchtower {
namespace app {

// Application configuration
struct AppConfig {
  std::filesystem::path datadir;

  // bitcoind network: mainnet, testnet, signet or regtest
  std::string btc_network = "mainnet";

  rpc::BitcoindParams bitcoind;
  network::FeedParams feed;
  chain::ChainMonitorConfig monitor;

  // Attempts at bootstrap reconciliation while bitcoind is unavailable
  int bootstrap_attempts = 3;
  std::chrono::milliseconds bootstrap_retry_delay{std::chrono::seconds(5)};

  bool verbose = false;

  AppConfig() : datadir(util::get_default_datadir()) {}
};

// bitcoind RPC port for a network, 0 if the network is unknown
uint16_t DefaultRpcPort(const std::string &btc_network);

// Chain name getblockchaininfo reports for a network ("main", "test", ...)
std::string ChainNameForNetwork(const std::string &btc_network);

// Application - Main application coordinator
// Initializes components, manages lifecycle, handles signals, coordinates
// shutdown
class Application {
public:
  explicit Application(const AppConfig &config = AppConfig{});
  ~Application();

  // Lifecycle
  bool initialize();
  bool start();
  void stop();
  void wait_for_shutdown();

  // Component access
  chain::ChainMonitor &chain_monitor() { return *chain_monitor_; }
  chain::TipStore &tip_store() { return *tip_store_; }

  bool is_running() const { return running_; }

  // Shutdown request (for RPC stop command)
  void request_shutdown() { shutdown_requested_ = true; }

  // Signal handling
  static void signal_handler(int signal);
  static Application *instance();

private:
  AppConfig config_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};

  // Components (initialized in order, destroyed in reverse)
  std::unique_ptr<util::DirectoryLock> datadir_lock_;
  std::unique_ptr<chain::TipStore> tip_store_;
  std::unique_ptr<rpc::BitcoindClient> bitcoind_;
  std::unique_ptr<chain::BlockProcessor> block_processor_;
  std::unique_ptr<CheckpointConsumer> watcher_;
  std::unique_ptr<CheckpointConsumer> responder_;
  std::unique_ptr<chain::ChainMonitor> chain_monitor_;
  std::unique_ptr<rpc::RPCServer> rpc_server_;

  // Periodic tip save thread
  std::unique_ptr<std::thread> save_thread_;

  // Initialization steps
  bool init_datadir();
  bool init_bitcoind();
  bool init_monitor();
  bool init_rpc();

  bool run_bootstrap();

  // Periodic saves
  void start_periodic_saves();
  void stop_periodic_saves();
  void periodic_save_loop();

  void shutdown();

  static Application *instance_;
  void setup_signal_handlers();
};

} // namespace app
} // namespace watchtower
