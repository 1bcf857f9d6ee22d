// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#include "util/uint.hpp"

#include <algorithm>
#include <stdexcept>

namespace {

int HexValue(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

} // namespace

bool uint256::IsNull() const {
  return std::all_of(m_data.begin(), m_data.end(),
                     [](unsigned char b) { return b == 0; });
}

std::string uint256::GetHex() const {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(2 * WIDTH);
  for (auto it = m_data.rbegin(); it != m_data.rend(); ++it) {
    hex.push_back(kDigits[*it >> 4]);
    hex.push_back(kDigits[*it & 0x0f]);
  }
  return hex;
}

bool uint256::SetHex(std::string_view hex) {
  m_data.fill(0);
  if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
    hex.remove_prefix(2);
  }
  if (hex.size() > 2 * WIDTH) {
    return false;
  }

  // Last digit is the low nibble of byte 0
  std::array<unsigned char, WIDTH> bytes{};
  size_t nibble = 0;
  for (auto it = hex.rbegin(); it != hex.rend(); ++it, ++nibble) {
    int value = HexValue(*it);
    if (value < 0) {
      return false;
    }
    bytes[nibble / 2] |= static_cast<unsigned char>(value << (4 * (nibble % 2)));
  }
  m_data = bytes;
  return true;
}

void uint256::SetDisplayBytes(std::span<const unsigned char> bytes) {
  if (bytes.size() != WIDTH) {
    throw std::invalid_argument("block hash must be 32 bytes, got " +
                                std::to_string(bytes.size()));
  }
  std::reverse_copy(bytes.begin(), bytes.end(), m_data.begin());
}
