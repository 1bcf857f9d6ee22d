// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#include "network/bitcoind_client.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <boost/asio.hpp>
#include <sstream>

namespace watchtower {
namespace rpc {

namespace {

std::string Base64Encode(const std::string &input) {
  using namespace boost::archive::iterators;
  using Base64It =
      base64_from_binary<transform_width<std::string::const_iterator, 6, 8>>;

  // Encode whole 3-byte groups, then mark the padding
  const size_t pad = (3 - input.size() % 3) % 3;
  std::string padded = input;
  padded.append(pad, '\0');

  std::string encoded(Base64It(padded.cbegin()), Base64It(padded.cend()));
  encoded.replace(encoded.size() - pad, pad, pad, '=');
  return encoded;
}

uint256 ParseHashField(const nlohmann::json &value, const char *field) {
  if (!value.is_string()) {
    throw RPCError(std::string("field '") + field + "' is not a string");
  }
  auto hash = util::SafeParseHash(value.get<std::string>());
  if (!hash) {
    throw RPCError(std::string("field '") + field + "' is not a block hash");
  }
  return *hash;
}

} // namespace

HttpResponse ParseHttpResponse(const std::string &raw) {
  HttpResponse response;

  const size_t line_end = raw.find("\r\n");
  const std::string status_line = raw.substr(0, line_end);
  if (status_line.rfind("HTTP/", 0) != 0) {
    throw RPCError("malformed HTTP status line");
  }

  const size_t code_start = status_line.find(' ');
  if (code_start == std::string::npos) {
    throw RPCError("malformed HTTP status line");
  }
  auto status = util::SafeParseInt(status_line.substr(code_start + 1, 3), 100, 599);
  if (!status) {
    throw RPCError("malformed HTTP status code");
  }
  response.status = *status;

  const size_t header_end = raw.find("\r\n\r\n");
  if (header_end != std::string::npos) {
    response.body = raw.substr(header_end + 4);
  }
  return response;
}

nlohmann::json ParseRpcReply(const std::string &body) {
  nlohmann::json reply;
  try {
    reply = nlohmann::json::parse(body);
  } catch (const nlohmann::json::exception &e) {
    throw RPCError(std::string("invalid JSON-RPC reply: ") + e.what());
  }

  if (!reply.is_object()) {
    throw RPCError("JSON-RPC reply is not an object");
  }

  if (reply.contains("error") && !reply["error"].is_null()) {
    const auto &error = reply["error"];
    int code = error.value("code", 0);
    std::string message = error.value("message", std::string("unknown error"));
    throw RPCError(message, code);
  }

  if (!reply.contains("result")) {
    throw RPCError("JSON-RPC reply has no result");
  }
  return reply["result"];
}

chain::BlockInfo ParseBlockInfo(const nlohmann::json &result) {
  if (!result.is_object()) {
    throw RPCError("getblock result is not an object");
  }

  chain::BlockInfo block;
  try {
    block.hash = ParseHashField(result.at("hash"), "hash");
    if (result.contains("previousblockhash")) {
      block.prev_hash =
          ParseHashField(result["previousblockhash"], "previousblockhash");
    }
    block.height = result.at("height").get<int>();
    block.confirmations = result.at("confirmations").get<int>();

    if (result.contains("tx")) {
      for (const auto &tx : result["tx"]) {
        // Verbosity 1 lists txids, verbosity 2 full transactions
        if (tx.is_string()) {
          block.txids.push_back(tx.get<std::string>());
        } else if (tx.is_object() && tx.contains("txid")) {
          block.txids.push_back(tx["txid"].get<std::string>());
        }
      }
    }
  } catch (const nlohmann::json::exception &e) {
    throw RPCError(std::string("malformed getblock result: ") + e.what());
  }
  return block;
}

BitcoindClient::BitcoindClient(const BitcoindParams &params)
    : params_(params),
      auth_header_("Basic " + Base64Encode(params.user + ":" + params.password)) {}

uint256 BitcoindClient::GetBestBlockHash() {
  return ParseHashField(Call("getbestblockhash"), "result");
}

std::optional<chain::BlockInfo> BitcoindClient::GetBlock(const uint256 &hash) {
  try {
    return ParseBlockInfo(Call("getblock", nlohmann::json::array({hash.GetHex()})));
  } catch (const RPCError &e) {
    if (e.code() == RPC_INVALID_ADDRESS_OR_KEY) {
      return std::nullopt;
    }
    throw;
  }
}

std::string BitcoindClient::GetChainName() {
  auto result = Call("getblockchaininfo");
  if (!result.is_object() || !result.contains("chain") ||
      !result["chain"].is_string()) {
    throw RPCError("malformed getblockchaininfo result");
  }
  return result["chain"].get<std::string>();
}

nlohmann::json BitcoindClient::Call(const std::string &method,
                                    const nlohmann::json &params) {
  std::lock_guard<std::mutex> lock(mutex_);

  nlohmann::json request;
  request["jsonrpc"] = "1.0";
  request["id"] = next_id_++;
  request["method"] = method;
  request["params"] = params;

  const std::string body = request.dump();
  std::ostringstream http;
  http << "POST / HTTP/1.1\r\n"
       << "Host: " << params_.host << ":" << params_.port << "\r\n"
       << "Authorization: " << auth_header_ << "\r\n"
       << "Content-Type: application/json\r\n"
       << "Content-Length: " << body.size() << "\r\n"
       << "Connection: close\r\n\r\n"
       << body;

  LOG_RPC_TRACE("bitcoind call {}", method);
  HttpResponse response = ParseHttpResponse(Transact(http.str()));

  if (response.status == 401 || response.status == 403) {
    throw RPCError("bitcoind rejected the RPC credentials");
  }
  if (response.body.empty()) {
    throw RPCError("bitcoind returned HTTP " + std::to_string(response.status) +
                   " with no body");
  }

  // RPC errors come back as HTTP 404/500 with a JSON body
  return ParseRpcReply(response.body);
}

std::string BitcoindClient::Transact(const std::string &request) {
  using boost::asio::ip::tcp;

  boost::asio::io_context io;
  tcp::resolver resolver(io);
  tcp::socket socket(io);
  boost::asio::streambuf reply;
  boost::system::error_code result;
  bool done = false;

  auto finish = [&](const boost::system::error_code &ec) {
    result = ec;
    done = true;
  };

  resolver.async_resolve(
      params_.host, std::to_string(params_.port),
      [&](const boost::system::error_code &ec,
          tcp::resolver::results_type endpoints) {
        if (ec) {
          return finish(ec);
        }
        boost::asio::async_connect(
            socket, endpoints,
            [&](const boost::system::error_code &ec, const tcp::endpoint &) {
              if (ec) {
                return finish(ec);
              }
              boost::asio::async_write(
                  socket, boost::asio::buffer(request),
                  [&](const boost::system::error_code &ec, std::size_t) {
                    if (ec) {
                      return finish(ec);
                    }
                    boost::asio::async_read(
                        socket, reply, boost::asio::transfer_all(),
                        [&](const boost::system::error_code &ec, std::size_t) {
                          finish(ec == boost::asio::error::eof
                                     ? boost::system::error_code()
                                     : ec);
                        });
                  });
            });
      });

  io.run_for(params_.timeout);

  if (!done) {
    throw RPCError("bitcoind at " + params_.host + ":" +
                   std::to_string(params_.port) + " timed out after " +
                   std::to_string(params_.timeout.count()) + "ms");
  }
  if (result) {
    throw RPCError("bitcoind at " + params_.host + ":" +
                   std::to_string(params_.port) + ": " + result.message());
  }

  return std::string(boost::asio::buffers_begin(reply.data()),
                     boost::asio::buffers_end(reply.data()));
}

} // namespace rpc
} // namespace watchtower
