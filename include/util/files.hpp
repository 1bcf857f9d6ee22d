// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace watchtower {
namespace util {

/**
 * Replace path with data so that a crash leaves either the old or the new
 * contents, never a mix: data goes to <path>.tmp.<pid>, is fsync'ed, and is
 * renamed over path once the directory entry is durable.
 *
 * Missing parent directories are created. Failures are logged.
 */
bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data, int mode = 0644);

// Whole file, std::nullopt if it is missing or unreadable
std::optional<std::string> read_file_string(const std::filesystem::path &path);

// Recursive; true if dir exists afterwards
bool ensure_directory(const std::filesystem::path &dir);

// $HOME/.watchtower, or ./.watchtower without a home directory
std::filesystem::path get_default_datadir();

} // namespace util
} // namespace watchtower
