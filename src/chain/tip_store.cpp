// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#include "chain/tip_store.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <nlohmann/json.hpp>

namespace watchtower {
namespace chain {

TipStore::TipStore(std::filesystem::path path) : path_(std::move(path)) {}

bool TipStore::Load() {
  using json = nlohmann::json;

  tips_.Clear();
  auto contents = util::read_file_string(path_);
  if (!contents) {
    LOG_CHAIN_TRACE("Tip file not found: {} (starting fresh)", path_.string());
    return false;
  }

  try {
    json root = json::parse(*contents);

    int version = root.value("version", 0);
    if (version != VERSION) {
      LOG_CHAIN_ERROR("Unsupported tip file version {} in {}", version,
                      path_.string());
      return false;
    }

    if (!root.contains("tips") || !root["tips"].is_object()) {
      LOG_CHAIN_ERROR("Tip file {} has no tips object", path_.string());
      return false;
    }

    for (const auto &[name, value] : root["tips"].items()) {
      if (!value.is_string()) {
        LOG_CHAIN_WARN("Ignoring non-string tip for '{}'", name);
        continue;
      }
      auto hash = util::SafeParseHash(value.get<std::string>());
      if (!hash) {
        LOG_CHAIN_WARN("Ignoring malformed tip for '{}'", name);
        continue;
      }
      tips_.Insert(name, *hash);
    }

    LOG_CHAIN_INFO("Loaded {} consumer tips from {}", tips_.Size(),
                   path_.string());
    return true;
  } catch (const json::exception &e) {
    LOG_CHAIN_ERROR("Failed to parse tip file {}: {}", path_.string(),
                    e.what());
    tips_.Clear();
    return false;
  }
}

bool TipStore::Save() const {
  using json = nlohmann::json;

  json root;
  root["version"] = VERSION;
  json tips = json::object();
  for (const auto &[name, hash] : tips_.GetAll()) {
    tips[name] = hash.GetHex();
  }
  root["tips"] = tips;

  if (!util::atomic_write_file(path_, root.dump(2) + "\n", 0600)) {
    LOG_CHAIN_ERROR("Failed to write tip file {}", path_.string());
    return false;
  }
  LOG_CHAIN_DEBUG("Saved {} consumer tips to {}", tips.size(), path_.string());
  return true;
}

std::optional<uint256> TipStore::GetTip(const std::string &consumer) const {
  std::optional<uint256> tip;
  tips_.Read(consumer, [&](const uint256 &hash) { tip = hash; });
  return tip;
}

void TipStore::SetTip(const std::string &consumer, const uint256 &tip) {
  tips_.Insert(consumer, tip);
}

std::vector<std::pair<std::string, uint256>> TipStore::GetAll() const {
  return tips_.GetAll();
}

} // namespace chain
} // namespace watchtower
