// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#pragma once

#include "util/threadsafe_containers.hpp"
#include "util/uint.hpp"
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace watchtower {
namespace chain {

/**
 * TipStore - Last processed tip per consumer
 *
 * Persisted as JSON:
 *   {"version": 1, "tips": {"watcher": "<hex>", "responder": "<hex>"}}
 *
 * Written with util::atomic_write_file, so a crash leaves either the old or
 * the new file.
 */
class TipStore {
public:
  static constexpr int VERSION = 1;

  explicit TipStore(std::filesystem::path path);

  // Returns false if the file is missing or unreadable; the store is then
  // empty
  bool Load();
  bool Save() const;

  std::optional<uint256> GetTip(const std::string &consumer) const;
  void SetTip(const std::string &consumer, const uint256 &tip);

  std::vector<std::pair<std::string, uint256>> GetAll() const;
  const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
  util::ThreadSafeMap<std::string, uint256, std::map> tips_;
};

} // namespace chain
} // namespace watchtower
