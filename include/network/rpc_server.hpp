// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <string>
#include <thread>
#include <vector>

namespace watchtower {

namespace chain {
class ChainMonitor;
class TipStore;
} // namespace chain

namespace rpc {

/**
 * RPC Server using Unix Domain Sockets (Local-Only Access)
 *
 * Control surface of the daemon. No network exposure: access is managed by
 * the permissions of the socket file (0600).
 *
 * The socket is created at: datadir/watchtower.sock
 *
 * Requests are single JSON objects: {"method": "...", "params": [...]}
 */
class RPCServer {
public:
  using CommandHandler =
      std::function<std::string(const std::vector<std::string> &)>;

  RPCServer(const std::string &socket_path, chain::ChainMonitor &monitor,
            chain::TipStore &tip_store,
            std::function<void()> shutdown_callback = nullptr);
  ~RPCServer();

  bool Start();
  void Stop();
  bool IsRunning() const { return running_; }

  // Dispatch without going through the socket
  std::string ExecuteCommand(const std::string &method,
                             const std::vector<std::string> &params);

private:
  void ServerThread();
  void HandleClient(int client_fd);
  void RegisterHandlers();

  std::string HandleGetTowerInfo(const std::vector<std::string> &params);
  std::string HandleGetBestBlockHash(const std::vector<std::string> &params);
  std::string HandleGetLastTips(const std::vector<std::string> &params);
  std::string HandleStop(const std::vector<std::string> &params);
  std::string HandleHelp(const std::vector<std::string> &params);

private:
  std::string socket_path_;
  chain::ChainMonitor &monitor_;
  chain::TipStore &tip_store_;
  std::function<void()> shutdown_callback_;

  int server_fd_;
  std::atomic<bool> running_;
  std::atomic<bool> shutting_down_;
  std::thread server_thread_;

  std::map<std::string, CommandHandler> handlers_;
};

} // namespace rpc
} // namespace watchtower
