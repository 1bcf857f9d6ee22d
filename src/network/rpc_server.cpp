// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

/**
 * RPC Server Implementation - Unix Domain Sockets
 *
 * - RPC is only accessible locally on the same machine
 * - No network port is opened
 * - Authentication is handled by filesystem permissions
 * - The socket file is created at: datadir/watchtower.sock
 */

#include "network/rpc_server.hpp"
#include "chain/chain_monitor.hpp"
#include "chain/tip_store.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <cerrno>
#include <cstring>
#include <nlohmann/json.hpp>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

namespace watchtower {
namespace rpc {

RPCServer::RPCServer(const std::string &socket_path,
                     chain::ChainMonitor &monitor, chain::TipStore &tip_store,
                     std::function<void()> shutdown_callback)
    : socket_path_(socket_path), monitor_(monitor), tip_store_(tip_store),
      shutdown_callback_(shutdown_callback), server_fd_(-1), running_(false),
      shutting_down_(false) {
  RegisterHandlers();
}

RPCServer::~RPCServer() { Stop(); }

void RPCServer::RegisterHandlers() {
  handlers_["gettowerinfo"] = [this](const auto &p) {
    return HandleGetTowerInfo(p);
  };
  handlers_["getbestblockhash"] = [this](const auto &p) {
    return HandleGetBestBlockHash(p);
  };
  handlers_["getlasttips"] = [this](const auto &p) {
    return HandleGetLastTips(p);
  };
  handlers_["stop"] = [this](const auto &p) { return HandleStop(p); };
  handlers_["help"] = [this](const auto &p) { return HandleHelp(p); };
}

bool RPCServer::Start() {
  if (running_) {
    return true;
  }

  // Remove stale socket file from an unclean shutdown
  unlink(socket_path_.c_str());

  // rw------- for the socket file
  mode_t old_umask = umask(0077);

  server_fd_ = socket(AF_UNIX, SOCK_STREAM, 0);
  if (server_fd_ < 0) {
    umask(old_umask);
    LOG_RPC_ERROR("Failed to create RPC socket");
    return false;
  }

  struct sockaddr_un addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sun_family = AF_UNIX;
  if (socket_path_.size() >= sizeof(addr.sun_path)) {
    LOG_RPC_ERROR("RPC socket path too long: {}", socket_path_);
    close(server_fd_);
    server_fd_ = -1;
    umask(old_umask);
    return false;
  }
  std::strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

  if (bind(server_fd_, (struct sockaddr *)&addr, sizeof(addr)) < 0) {
    LOG_RPC_ERROR("Failed to bind RPC socket to {}: {}", socket_path_,
                  std::strerror(errno));
    close(server_fd_);
    server_fd_ = -1;
    umask(old_umask);
    return false;
  }

  umask(old_umask);
  chmod(socket_path_.c_str(), 0600);

  if (listen(server_fd_, 5) < 0) {
    LOG_RPC_ERROR("Failed to listen on RPC socket");
    close(server_fd_);
    server_fd_ = -1;
    return false;
  }

  running_ = true;
  server_thread_ = std::thread(&RPCServer::ServerThread, this);

  LOG_RPC_INFO("RPC server started on {}", socket_path_);
  return true;
}

void RPCServer::Stop() {
  if (!running_) {
    return;
  }

  shutting_down_.store(true, std::memory_order_release);
  running_ = false;

  if (server_fd_ >= 0) {
    // Wakes the blocked accept()
    shutdown(server_fd_, SHUT_RDWR);
    close(server_fd_);
    server_fd_ = -1;
  }

  if (server_thread_.joinable()) {
    server_thread_.join();
  }

  unlink(socket_path_.c_str());

  LOG_RPC_INFO("RPC server stopped");
}

void RPCServer::ServerThread() {
  while (running_) {
    struct sockaddr_un client_addr;
    socklen_t client_len = sizeof(client_addr);

    int client_fd =
        accept(server_fd_, (struct sockaddr *)&client_addr, &client_len);
    if (client_fd < 0) {
      if (running_) {
        LOG_RPC_WARN("failed to accept RPC connection");
      }
      continue;
    }

    HandleClient(client_fd);
    close(client_fd);
  }
}

void RPCServer::HandleClient(int client_fd) {
  if (shutting_down_.load(std::memory_order_acquire)) {
    std::string error = util::JsonError("Server shutting down");
    send(client_fd, error.c_str(), error.size(), 0);
    return;
  }

  std::vector<char> buffer(4096);
  ssize_t received = recv(client_fd, buffer.data(), buffer.size(), 0);
  if (received <= 0) {
    return;
  }

  if (received >= static_cast<ssize_t>(buffer.size())) {
    LOG_RPC_ERROR("RPC request too large: {} bytes", received);
    std::string error = util::JsonError("Request too large");
    send(client_fd, error.c_str(), error.size(), 0);
    return;
  }

  std::string request(buffer.data(), received);
  std::string method;
  std::vector<std::string> params;

  try {
    nlohmann::json j = nlohmann::json::parse(request);

    if (!j.contains("method") || !j["method"].is_string()) {
      std::string error = util::JsonError("Missing or invalid method field");
      send(client_fd, error.c_str(), error.size(), 0);
      return;
    }
    method = j["method"].get<std::string>();

    if (j.contains("params") && j["params"].is_array()) {
      for (const auto &param : j["params"]) {
        params.push_back(param.is_string() ? param.get<std::string>()
                                           : param.dump());
      }
    }
  } catch (const nlohmann::json::exception &e) {
    LOG_RPC_WARN("RPC JSON parse error: {}", e.what());
    std::string error = util::JsonError("Invalid JSON");
    send(client_fd, error.c_str(), error.size(), 0);
    return;
  }

  std::string response = ExecuteCommand(method, params);
  send(client_fd, response.c_str(), response.size(), 0);
}

std::string RPCServer::ExecuteCommand(const std::string &method,
                                      const std::vector<std::string> &params) {
  auto it = handlers_.find(method);
  if (it == handlers_.end()) {
    return util::JsonError("Unknown command");
  }

  try {
    return it->second(params);
  } catch (const std::exception &e) {
    LOG_RPC_ERROR("RPC command '{}' failed: {}", method, e.what());
    return util::JsonError(e.what());
  }
}

std::string
RPCServer::HandleGetTowerInfo(const std::vector<std::string> &params) {
  nlohmann::json info;
  info["version"] = GetVersionString();
  info["phase"] = chain::MonitorPhaseName(monitor_.GetPhase());

  auto tip = monitor_.GetBestTip();
  info["bestblockhash"] =
      tip ? nlohmann::json(tip->GetHex()) : nlohmann::json(nullptr);
  info["last_tips"] = monitor_.GetLastTips().size();
  info["last_tips_capacity"] = monitor_.WindowCapacity();
  info["pending"] = monitor_.PendingCount();

  nlohmann::json consumers = nlohmann::json::object();
  for (const auto &[name, hash] : tip_store_.GetAll()) {
    consumers[name] = hash.GetHex();
  }
  info["consumers"] = consumers;

  return info.dump(2) + "\n";
}

std::string
RPCServer::HandleGetBestBlockHash(const std::vector<std::string> &params) {
  auto tip = monitor_.GetBestTip();
  if (!tip) {
    return "null\n";
  }
  return nlohmann::json(tip->GetHex()).dump() + "\n";
}

std::string
RPCServer::HandleGetLastTips(const std::vector<std::string> &params) {
  nlohmann::json tips = nlohmann::json::array();
  for (const auto &hash : monitor_.GetLastTips()) {
    tips.push_back(hash.GetHex());
  }
  return tips.dump(2) + "\n";
}

std::string RPCServer::HandleStop(const std::vector<std::string> &params) {
  LOG_RPC_INFO("Received stop command via RPC");

  shutting_down_.store(true, std::memory_order_release);
  if (shutdown_callback_) {
    shutdown_callback_();
  }

  return "\"Watchtower stopping\"\n";
}

std::string RPCServer::HandleHelp(const std::vector<std::string> &params) {
  // Sent as a JSON string, watchtower-cli prints it as is
  const std::string text =
      "gettowerinfo      Monitor phase, best tip, queue sizes and consumer "
      "checkpoints\n"
      "getbestblockhash  Most recent tip seen by the monitor\n"
      "getlasttips       Recently superseded tips, oldest first\n"
      "stop              Stop watchtowerd\n"
      "help              This message";
  return nlohmann::json(text).dump() + "\n";
}

} // namespace rpc
} // namespace watchtower
