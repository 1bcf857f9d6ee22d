// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#pragma once

#include "chain/block_source.hpp"
#include <chrono>
#include <cstdint>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace watchtower {
namespace rpc {

// bitcoind error code for unknown blocks (RPC_INVALID_ADDRESS_OR_KEY)
constexpr int RPC_INVALID_ADDRESS_OR_KEY = -5;

// Transport or RPC-level failure talking to bitcoind
// code is the JSON-RPC error code, 0 for transport failures
class RPCError : public chain::NodeQueryError {
public:
  explicit RPCError(const std::string &what, int code = 0)
      : chain::NodeQueryError(what), code_(code) {}

  int code() const { return code_; }

private:
  int code_;
};

struct BitcoindParams {
  std::string host = "localhost";
  uint16_t port = 8332;
  std::string user;
  std::string password;
  std::chrono::milliseconds timeout{std::chrono::seconds(5)};
};

struct HttpResponse {
  int status{0};
  std::string body;
};

// Split a raw HTTP/1.1 response into status code and body
// Throws RPCError if the status line is malformed
HttpResponse ParseHttpResponse(const std::string &raw);

// Extract "result" from a JSON-RPC reply body
// Throws RPCError if the reply is not JSON or carries an error
nlohmann::json ParseRpcReply(const std::string &body);

// Build BlockInfo from a verbose getblock result
// Throws RPCError if required fields are missing or malformed
chain::BlockInfo ParseBlockInfo(const nlohmann::json &result);

/**
 * BitcoindClient - bitcoind JSON-RPC over HTTP
 *
 * One short-lived connection per call (Connection: close), basic auth,
 * bounded by params.timeout. Calls are serialized.
 */
class BitcoindClient : public chain::BlockSource {
public:
  explicit BitcoindClient(const BitcoindParams &params);

  uint256 GetBestBlockHash() override;
  std::optional<chain::BlockInfo> GetBlock(const uint256 &hash) override;

  // "main", "test", "signet" or "regtest"
  std::string GetChainName();

  nlohmann::json Call(const std::string &method,
                      const nlohmann::json &params = nlohmann::json::array());

private:
  std::string Transact(const std::string &request);

  BitcoindParams params_;
  std::string auth_header_;
  std::mutex mutex_;
  uint64_t next_id_{0};
};

} // namespace rpc
} // namespace watchtower
