// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#include "util/fs_lock.hpp"
#include "util/logging.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace watchtower {
namespace util {

DirectoryLock::DirectoryLock(std::filesystem::path directory,
                             std::string lockfile_name)
    : path_(std::move(directory) / lockfile_name) {}

DirectoryLock::~DirectoryLock() { Unlock(); }

LockResult DirectoryLock::TryLock() {
  if (fd_ != -1) {
    return LockResult::Success;
  }

  // O_CLOEXEC: the lock must not be inherited by child processes
  int fd = open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd == -1) {
    reason_ = std::strerror(errno);
    LOG_ERROR("Failed to open lock file {}: {}", path_.string(), reason_);
    return LockResult::ErrorWrite;
  }

  struct flock lock;
  std::memset(&lock, 0, sizeof(lock));
  lock.l_type = F_WRLCK;
  lock.l_whence = SEEK_SET;
  lock.l_start = 0;
  lock.l_len = 0; // Whole file

  if (fcntl(fd, F_SETLK, &lock) == -1) {
    reason_ = std::strerror(errno);
    close(fd);
    LOG_ERROR("Failed to lock {}: {}", path_.string(), reason_);
    return LockResult::ErrorLock;
  }

  fd_ = fd;
  LOG_TRACE("Acquired directory lock: {}", path_.string());
  return LockResult::Success;
}

void DirectoryLock::Unlock() {
  if (fd_ != -1) {
    // Closing the descriptor releases the fcntl lock
    close(fd_);
    fd_ = -1;
  }
}

} // namespace util
} // namespace watchtower
