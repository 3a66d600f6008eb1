#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace r3lr0::util {

// owning file descriptor, closed on destruction
class unique_fd {
public:
  unique_fd() = default;
  explicit unique_fd(int fd) : fd_(fd) {}
  ~unique_fd() { reset(); }

  unique_fd(const unique_fd&) = delete;
  unique_fd& operator=(const unique_fd&) = delete;

  unique_fd(unique_fd&& other) noexcept : fd_(other.release()) {}
  unique_fd& operator=(unique_fd&& other) noexcept {
    if (this != &other) {
      reset(other.release());
    }
    return *this;
  }

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  explicit operator bool() const { return valid(); }

  int release() {
    int fd = fd_;
    fd_ = -1;
    return fd;
  }

  void reset(int fd = -1);

private:
  int fd_ = -1;
};

unique_fd open_read_only(const std::string& path);

// full pread, retrying on EINTR and short reads; false on error or EOF
bool read_fully_at(int fd, void* buffer, size_t size, uint64_t offset);

// full write, retrying on EINTR and short writes
bool write_fully(int fd, const void* buffer, size_t size);

std::optional<uint64_t> file_size(int fd);
std::optional<uint64_t> file_size(const std::string& path);

bool path_exists(const std::string& path);

std::string errno_text();

} // namespace r3lr0::util
