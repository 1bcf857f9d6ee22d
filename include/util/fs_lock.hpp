// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <string>

namespace watchtower {
namespace util {

enum class LockResult {
  Success,    // Lock acquired
  ErrorWrite, // Could not create the lock file
  ErrorLock,  // Held by another process
};

/**
 * DirectoryLock - Exclusive fcntl() lock on <directory>/<lockfile_name>
 *
 * Keeps two daemons from sharing a data directory. The lock is held for the
 * lifetime of the object and released when its descriptor is closed.
 */
class DirectoryLock {
public:
  explicit DirectoryLock(std::filesystem::path directory,
                         std::string lockfile_name = ".lock");
  ~DirectoryLock();

  DirectoryLock(const DirectoryLock &) = delete;
  DirectoryLock &operator=(const DirectoryLock &) = delete;

  LockResult TryLock();
  void Unlock();

  bool IsLocked() const { return fd_ != -1; }
  const std::string &GetReason() const { return reason_; }

private:
  std::filesystem::path path_;
  std::string reason_;
  int fd_{-1};
};

} // namespace util
} // namespace watchtower
