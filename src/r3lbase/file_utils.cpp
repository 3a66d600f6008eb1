#include "r3lbase/file_utils.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace r3lr0::util {

void unique_fd::reset(int fd) {
  if (fd_ >= 0) {
    ::close(fd_);
  }
  fd_ = fd;
}

unique_fd open_read_only(const std::string& path) {
  int fd = -1;
  do {
    fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  } while (fd < 0 && errno == EINTR);
  return unique_fd(fd);
}

bool read_fully_at(int fd, void* buffer, size_t size, uint64_t offset) {
  auto* out = static_cast<uint8_t*>(buffer);
  size_t done = 0;
  while (done < size) {
    ssize_t rv = ::pread(fd, out + done, size - done, static_cast<off_t>(offset + done));
    if (rv < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    if (rv == 0) {
      return false;
    }
    done += static_cast<size_t>(rv);
  }
  return true;
}

bool write_fully(int fd, const void* buffer, size_t size) {
  const auto* in = static_cast<const uint8_t*>(buffer);
  size_t done = 0;
  while (done < size) {
    ssize_t rv = ::write(fd, in + done, size - done);
    if (rv < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    done += static_cast<size_t>(rv);
  }
  return true;
}

std::optional<uint64_t> file_size(int fd) {
  struct stat st {};
  if (::fstat(fd, &st) != 0) {
    return std::nullopt;
  }
  return static_cast<uint64_t>(st.st_size);
}

std::optional<uint64_t> file_size(const std::string& path) {
  struct stat st {};
  if (::stat(path.c_str(), &st) != 0) {
    return std::nullopt;
  }
  return static_cast<uint64_t>(st.st_size);
}

bool path_exists(const std::string& path) {
  struct stat st {};
  return ::stat(path.c_str(), &st) == 0;
}

std::string errno_text() { return std::strerror(errno); }

} // namespace r3lr0::util
