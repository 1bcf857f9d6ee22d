// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#include "network/rpc_client.hpp"
#include <stdexcept>

namespace watchtower {
namespace rpc {

using boost::asio::local::stream_protocol;

RPCClient::RPCClient(std::string socket_path)
    : socket_path_(std::move(socket_path)) {}

bool RPCClient::Ping() {
  stream_protocol::socket socket(io_);
  boost::system::error_code ec;
  socket.connect(stream_protocol::endpoint(socket_path_), ec);
  return !ec;
}

nlohmann::json RPCClient::Call(const std::string &method,
                               const std::vector<std::string> &params) {
  stream_protocol::socket socket(io_);
  boost::system::error_code ec;
  socket.connect(stream_protocol::endpoint(socket_path_), ec);
  if (ec) {
    throw std::runtime_error("cannot connect to " + socket_path_ + ": " +
                             ec.message());
  }

  nlohmann::json request{{"method", method}};
  if (!params.empty()) {
    request["params"] = params;
  }
  boost::asio::write(socket, boost::asio::buffer(request.dump() + "\n"), ec);
  if (ec) {
    throw std::runtime_error("failed to send request: " + ec.message());
  }

  // Reply ends when the server closes the connection
  std::string reply;
  boost::asio::read(socket, boost::asio::dynamic_buffer(reply), ec);
  if (ec && ec != boost::asio::error::eof) {
    throw std::runtime_error("failed to read reply: " + ec.message());
  }

  try {
    return nlohmann::json::parse(reply);
  } catch (const nlohmann::json::parse_error &e) {
    throw std::runtime_error(std::string("malformed reply: ") + e.what());
  }
}

} // namespace rpc
} // namespace watchtower
