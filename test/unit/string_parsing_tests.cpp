// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#include "util/string_parsing.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cctype>
#include <nlohmann/json.hpp>

using namespace watchtower::util;
using namespace std::chrono_literals;

TEST_CASE("SafeParsePort: --btcrpcport and --btcfeedport", "[parsing]") {
  SECTION("Network defaults") {
    REQUIRE(SafeParsePort("8332") == 8332);
    REQUIRE(SafeParsePort("18443") == 18443);
    REQUIRE(SafeParsePort("28332") == 28332);
  }

  SECTION("Bounds") {
    REQUIRE(SafeParsePort("1") == 1);
    REQUIRE(SafeParsePort("65535") == 65535);
    REQUIRE_FALSE(SafeParsePort("0").has_value());
    REQUIRE_FALSE(SafeParsePort("65536").has_value());
    REQUIRE_FALSE(SafeParsePort("-8332").has_value());
  }

  SECTION("Not a bare number") {
    REQUIRE_FALSE(SafeParsePort("").has_value());
    REQUIRE_FALSE(SafeParsePort(" 8332").has_value());
    REQUIRE_FALSE(SafeParsePort("8332 ").has_value());
    REQUIRE_FALSE(SafeParsePort("+8332").has_value());
    REQUIRE_FALSE(SafeParsePort("8332abc").has_value());
    REQUIRE_FALSE(SafeParsePort("localhost:8332").has_value());
    REQUIRE_FALSE(SafeParsePort("8.3e3").has_value());
  }
}

TEST_CASE("SafeParseSeconds: --btcrpctimeout and --pollinginterval",
          "[parsing]") {
  REQUIRE(SafeParseSeconds("5", 3600) == 5s);
  REQUIRE(SafeParseSeconds("60", 86400) == 60s);
  REQUIRE(SafeParseSeconds("86400", 86400) == 86400s);

  REQUIRE_FALSE(SafeParseSeconds("0", 3600).has_value());
  REQUIRE_FALSE(SafeParseSeconds("3601", 3600).has_value());
  REQUIRE_FALSE(SafeParseSeconds("5s", 3600).has_value());
  REQUIRE_FALSE(SafeParseSeconds("1.5", 3600).has_value());
  REQUIRE_FALSE(SafeParseSeconds("99999999999999999999", 3600).has_value());
}

TEST_CASE("SafeParseInt: --tipwindow and HTTP status codes", "[parsing]") {
  REQUIRE(SafeParseInt("10", 1, 10000) == 10);
  REQUIRE(SafeParseInt("200", 100, 599) == 200);
  REQUIRE(SafeParseInt("-5", -10, 10) == -5);

  REQUIRE_FALSE(SafeParseInt("0", 1, 10000).has_value());
  REQUIRE_FALSE(SafeParseInt("600", 100, 599).has_value());
  REQUIRE_FALSE(SafeParseInt("2OO", 100, 599).has_value());
  REQUIRE_FALSE(SafeParseInt("2147483648", 0, 10).has_value());
}

TEST_CASE("SafeParseHash: getbestblockhash replies and tips.json entries",
          "[parsing]") {
  const std::string genesis =
      "000000000019d6689c085ae165831e934ff763ae46a2a6c172b3f1b60a8ce26f";

  SECTION("Block hash in display order") {
    auto hash = SafeParseHash(genesis);
    REQUIRE(hash.has_value());
    REQUIRE(hash->GetHex() == genesis);
  }

  SECTION("Upper case is accepted and normalized") {
    std::string upper = genesis;
    for (auto &c : upper) {
      c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    auto hash = SafeParseHash(upper);
    REQUIRE(hash.has_value());
    REQUIRE(hash->GetHex() == genesis);
  }

  SECTION("Wrong length") {
    REQUIRE_FALSE(SafeParseHash("").has_value());
    REQUIRE_FALSE(SafeParseHash(genesis.substr(1)).has_value());
    REQUIRE_FALSE(SafeParseHash(genesis + "0").has_value());
    // Prefixed form is 66 characters
    REQUIRE_FALSE(SafeParseHash("0x" + genesis).has_value());
  }

  SECTION("Non-hex characters") {
    std::string bad = genesis;
    bad[10] = 'g';
    REQUIRE_FALSE(SafeParseHash(bad).has_value());
    bad = genesis;
    bad[63] = ' ';
    REQUIRE_FALSE(SafeParseHash(bad).has_value());
  }
}

TEST_CASE("JsonError: control socket error replies", "[parsing][rpc]") {
  REQUIRE(JsonError("Unknown command") == "{\"error\":\"Unknown command\"}\n");

  // Quotes and control characters from exception text stay valid JSON
  std::string reply = JsonError("bad \"method\"\n\tline");
  REQUIRE(reply.back() == '\n');
  auto parsed = nlohmann::json::parse(reply);
  REQUIRE(parsed["error"] == "bad \"method\"\n\tline");
}
