// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace watchtower {
namespace rpc {

// RPCClient - watchtower-cli's end of the control socket
// The server answers one request per connection and then closes it, so
// every Call() opens a fresh connection.
class RPCClient {
public:
  explicit RPCClient(std::string socket_path);

  // Whether a daemon is accepting on the socket
  bool Ping();

  // Send {"method": ..., "params": [...]} and parse the reply.
  // Throws std::runtime_error on socket errors or a non-JSON reply.
  nlohmann::json Call(const std::string &method,
                      const std::vector<std::string> &params = {});

  const std::string &socket_path() const { return socket_path_; }

private:
  std::string socket_path_;
  boost::asio::io_context io_;
};

} // namespace rpc
} // namespace watchtower
