// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

/**
 * uint256 - A 32-byte block hash
 *
 * Bytes are kept in internal order, the order bitcoind hashes them. Text is
 * always in display order (bytes reversed), which is what getbestblockhash,
 * getblock and the hashblock feed use, so hashes from every source compare
 * equal once parsed.
 */
class uint256 {
public:
  static constexpr size_t WIDTH = 32;

  constexpr uint256() : m_data() {}

  bool IsNull() const;

  bool operator==(const uint256 &other) const = default;
  auto operator<=>(const uint256 &other) const = default;

  // 64 lowercase hex digits, display order
  std::string GetHex() const;
  std::string ToString() const { return GetHex(); }

  // Display-order hex with an optional 0x prefix. Shorter input is
  // left-padded with zeros. On bad input returns false and leaves the hash
  // null.
  bool SetHex(std::string_view hex);

  // Raw bytes in display order, as carried by a hashblock message.
  // Throws std::invalid_argument unless exactly WIDTH bytes.
  void SetDisplayBytes(std::span<const unsigned char> bytes);

  const unsigned char *data() const { return m_data.data(); }
  const unsigned char *begin() const { return m_data.data(); }
  const unsigned char *end() const { return m_data.data() + WIDTH; }

  static constexpr size_t size() { return WIDTH; }

private:
  std::array<unsigned char, WIDTH> m_data;
};

// uint256 from hex text, null if it does not parse
inline uint256 uint256S(std::string_view hex) {
  uint256 hash;
  hash.SetHex(hex);
  return hash;
}
