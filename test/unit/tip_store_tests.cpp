// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#include "chain/tip_store.hpp"
#include "infra/test_helpers.hpp"
#include "util/files.hpp"
#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <nlohmann/json.hpp>

using namespace watchtower;
using namespace watchtower::chain;
using watchtower::test::TestHash;

TEST_CASE("TipStore: persistence", "[chain][tipstore]") {
  auto test_dir = std::filesystem::temp_directory_path() / "watchtower_tipstore_test";
  std::filesystem::remove_all(test_dir);
  REQUIRE(util::ensure_directory(test_dir));
  const auto path = test_dir / "tips.json";

  SECTION("Missing file starts empty") {
    TipStore store(path);
    REQUIRE_FALSE(store.Load());
    REQUIRE(store.GetAll().empty());
    REQUIRE_FALSE(store.GetTip("watcher").has_value());
  }

  SECTION("Save and load") {
    {
      TipStore store(path);
      store.SetTip("watcher", TestHash(1));
      store.SetTip("responder", TestHash(2));
      // Latest value wins
      store.SetTip("watcher", TestHash(3));
      REQUIRE(store.Save());
    }

    TipStore loaded(path);
    REQUIRE(loaded.Load());
    REQUIRE(loaded.GetTip("watcher") == TestHash(3));
    REQUIRE(loaded.GetTip("responder") == TestHash(2));
    REQUIRE(loaded.GetAll().size() == 2);

    auto root = nlohmann::json::parse(*util::read_file_string(path));
    REQUIRE(root["version"] == TipStore::VERSION);
    REQUIRE(root["tips"]["watcher"] == TestHash(3).GetHex());
  }

  SECTION("Unsupported version") {
    REQUIRE(util::atomic_write_file(
        path, R"({"version": 99, "tips": {"watcher": ")" +
                  TestHash(1).GetHex() + "\"}}"));
    TipStore store(path);
    REQUIRE_FALSE(store.Load());
    REQUIRE(store.GetAll().empty());
  }

  SECTION("Corrupt file") {
    REQUIRE(util::atomic_write_file(path, "{not json"));
    TipStore store(path);
    store.SetTip("stale", TestHash(9));
    REQUIRE_FALSE(store.Load());
    REQUIRE(store.GetAll().empty());
  }

  SECTION("Malformed entries are skipped") {
    REQUIRE(util::atomic_write_file(
        path, R"({"version": 1, "tips": {"watcher": ")" +
                  TestHash(5).GetHex() +
                  R"(", "responder": "xyz", "other": 42}})"));
    TipStore store(path);
    REQUIRE(store.Load());
    REQUIRE(store.GetTip("watcher") == TestHash(5));
    REQUIRE_FALSE(store.GetTip("responder").has_value());
    REQUIRE_FALSE(store.GetTip("other").has_value());
  }

  std::filesystem::remove_all(test_dir);
}
