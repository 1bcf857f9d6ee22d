// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#include "application.hpp"
#include <catch2/catch_test_macros.hpp>
#include <filesystem>

using namespace watchtower;

TEST_CASE("Application: network defaults", "[app]") {
  REQUIRE(app::DefaultRpcPort("mainnet") == 8332);
  REQUIRE(app::DefaultRpcPort("testnet") == 18332);
  REQUIRE(app::DefaultRpcPort("signet") == 38332);
  REQUIRE(app::DefaultRpcPort("regtest") == 18443);
  REQUIRE(app::DefaultRpcPort("litecoin") == 0);

  REQUIRE(app::ChainNameForNetwork("mainnet") == "main");
  REQUIRE(app::ChainNameForNetwork("testnet") == "test");
  REQUIRE(app::ChainNameForNetwork("regtest") == "regtest");
}

TEST_CASE("Application: initialization fails cleanly", "[app][lifecycle]") {
  auto datadir = std::filesystem::temp_directory_path() / "watchtower_app_test";
  std::filesystem::remove_all(datadir);

  app::AppConfig config;
  config.datadir = datadir;
  config.bitcoind.host = "127.0.0.1";
  config.bitcoind.port = 1; // Nothing listens
  config.bitcoind.timeout = std::chrono::milliseconds(500);

  {
    app::Application app(config);
    REQUIRE_FALSE(app.initialize());
    REQUIRE_FALSE(app.is_running());
    // Data directory was prepared before bitcoind was contacted
    REQUIRE(std::filesystem::exists(datadir / ".lock"));
  }

  std::filesystem::remove_all(datadir);
}
