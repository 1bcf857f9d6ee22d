// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#include "util/files.hpp"
#include "util/logging.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <iterator>
#include <unistd.h>

namespace watchtower {
namespace util {

namespace {

// Closes the descriptor on every exit path
class ScopedFd {
public:
  explicit ScopedFd(int fd) : fd_(fd) {}
  ~ScopedFd() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }
  ScopedFd(const ScopedFd &) = delete;
  ScopedFd &operator=(const ScopedFd &) = delete;

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }

private:
  int fd_;
};

bool write_all(int fd, const std::string &data) {
  const char *p = data.data();
  size_t left = data.size();
  while (left > 0) {
    ssize_t n = ::write(fd, p, left);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      return false;
    }
    p += n;
    left -= static_cast<size_t>(n);
  }
  return true;
}

bool fsync_directory(const std::filesystem::path &dir) {
  ScopedFd fd(::open(dir.c_str(), O_RDONLY | O_DIRECTORY));
  return fd.valid() && ::fsync(fd.get()) == 0;
}

} // namespace

bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data, int mode) {
  auto dir = path.parent_path();
  if (!dir.empty() && !ensure_directory(dir)) {
    LOG_WARN("Cannot create directory {}", dir.string());
    return false;
  }

  auto temp = path;
  temp += ".tmp." + std::to_string(::getpid());

  bool written = false;
  {
    ScopedFd fd(::open(temp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, mode));
    if (!fd.valid()) {
      LOG_WARN("Cannot open {}: {}", temp.string(), std::strerror(errno));
      return false;
    }
    written = write_all(fd.get(), data) && ::fsync(fd.get()) == 0;
    if (!written) {
      LOG_WARN("Cannot write {}: {}", temp.string(), std::strerror(errno));
    }
  }

  std::error_code ec;
  if (written) {
    std::filesystem::rename(temp, path, ec);
    if (!ec) {
      if (!dir.empty() && !fsync_directory(dir)) {
        LOG_WARN("fsync of {} failed, rename may not be durable", dir.string());
      }
      return true;
    }
    LOG_WARN("Cannot rename {} to {}: {}", temp.string(), path.string(),
             ec.message());
  }

  std::filesystem::remove(temp, ec);
  return false;
}

std::optional<std::string> read_file_string(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  return std::string(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>());
}

bool ensure_directory(const std::filesystem::path &dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return std::filesystem::is_directory(dir, ec);
}

std::filesystem::path get_default_datadir() {
  if (const char *home = std::getenv("HOME"); home && *home) {
    return std::filesystem::path(home) / ".watchtower";
  }
  return std::filesystem::current_path() / ".watchtower";
}

} // namespace util
} // namespace watchtower
