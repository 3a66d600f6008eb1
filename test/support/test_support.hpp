#pragma once

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include <sys/wait.h>
#include <unistd.h>

#include <zlib.h>

namespace r3lr0::test {

// scratch directory removed with everything in it
class temp_dir {
public:
  temp_dir() {
    std::string pattern = (std::filesystem::temp_directory_path() / "r3lr0-test-XXXXXX").string();
    if (::mkdtemp(pattern.data())) {
      path_ = pattern;
    }
  }

  ~temp_dir() {
    std::error_code ec;
    if (!path_.empty()) {
      std::filesystem::remove_all(path_, ec);
    }
  }

  temp_dir(const temp_dir&) = delete;
  temp_dir& operator=(const temp_dir&) = delete;

  bool ok() const { return !path_.empty(); }
  const std::string& path() const { return path_; }
  std::string file(const std::string& name) const { return path_ + "/" + name; }

private:
  std::string path_;
};

inline bool write_file(const std::string& path, const std::vector<uint8_t>& bytes) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  return static_cast<bool>(out);
}

inline bool write_file(const std::string& path, const std::string& text) {
  return write_file(path, std::vector<uint8_t>(text.begin(), text.end()));
}

inline std::vector<uint8_t> read_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

/**
 * Minimal zip writer for archive fixtures. Entry bytes are written as given;
 * "deflated" entries are only labelled so, which is all the reader looks at.
 */
class zip_builder {
public:
  zip_builder& add(std::string name, std::vector<uint8_t> data, uint16_t method = 0, uint32_t align = 0) {
    entries_.push_back(pending{std::move(name), std::move(data), method, align});
    return *this;
  }

  zip_builder& comment(std::string text) {
    comment_ = std::move(text);
    return *this;
  }

  std::vector<uint8_t> build() const {
    std::vector<uint8_t> out;
    std::vector<uint8_t> directory;

    for (const auto& entry : entries_) {
      const uint32_t crc =
          static_cast<uint32_t>(::crc32(0L, entry.data.data(), static_cast<uInt>(entry.data.size())));
      const uint32_t offset = static_cast<uint32_t>(out.size());

      uint16_t extra = 0;
      if (entry.align != 0) {
        const size_t data_start = out.size() + 30 + entry.name.size();
        extra = static_cast<uint16_t>((entry.align - data_start % entry.align) % entry.align);
      }

      put32(out, 0x04034b50);
      put16(out, 20);
      put16(out, 0);
      put16(out, entry.method);
      put16(out, 0);
      put16(out, 0);
      put32(out, crc);
      put32(out, static_cast<uint32_t>(entry.data.size()));
      put32(out, static_cast<uint32_t>(entry.data.size()));
      put16(out, static_cast<uint16_t>(entry.name.size()));
      put16(out, extra);
      out.insert(out.end(), entry.name.begin(), entry.name.end());
      out.insert(out.end(), extra, 0);
      out.insert(out.end(), entry.data.begin(), entry.data.end());

      put32(directory, 0x02014b50);
      put16(directory, 20);
      put16(directory, 20);
      put16(directory, 0);
      put16(directory, entry.method);
      put16(directory, 0);
      put16(directory, 0);
      put32(directory, crc);
      put32(directory, static_cast<uint32_t>(entry.data.size()));
      put32(directory, static_cast<uint32_t>(entry.data.size()));
      put16(directory, static_cast<uint16_t>(entry.name.size()));
      put16(directory, 0);
      put16(directory, 0);
      put16(directory, 0);
      put16(directory, 0);
      put32(directory, 0);
      put32(directory, offset);
      directory.insert(directory.end(), entry.name.begin(), entry.name.end());
    }

    const uint32_t directory_offset = static_cast<uint32_t>(out.size());
    out.insert(out.end(), directory.begin(), directory.end());

    put32(out, 0x06054b50);
    put16(out, 0);
    put16(out, 0);
    put16(out, static_cast<uint16_t>(entries_.size()));
    put16(out, static_cast<uint16_t>(entries_.size()));
    put32(out, static_cast<uint32_t>(directory.size()));
    put32(out, directory_offset);
    put16(out, static_cast<uint16_t>(comment_.size()));
    out.insert(out.end(), comment_.begin(), comment_.end());
    return out;
  }

private:
  struct pending {
    std::string name;
    std::vector<uint8_t> data;
    uint16_t method = 0;
    uint32_t align = 0;
  };

  static void put16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value));
    out.push_back(static_cast<uint8_t>(value >> 8));
  }

  static void put32(std::vector<uint8_t>& out, uint32_t value) {
    put16(out, static_cast<uint16_t>(value));
    put16(out, static_cast<uint16_t>(value >> 16));
  }

  std::vector<pending> entries_;
  std::string comment_;
};

// runs body in a forked child and returns its exit code, -1 if it died
inline int run_in_child(const std::function<int()>& body) {
  const pid_t pid = ::fork();
  if (pid < 0) {
    return -1;
  }
  if (pid == 0) {
    int code = 100;
    try {
      code = body();
    } catch (const std::exception&) {
      code = 101;
    }
    ::_exit(code);
  }

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      return -1;
    }
  }
  return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

// true if a maps(5) line covering address is backed by a file ending in file_name
inline bool mapped_from_file(uintptr_t address, const std::string& file_name) {
  std::ifstream maps("/proc/self/maps");
  std::string line;
  while (std::getline(maps, line)) {
    unsigned long long start = 0;
    unsigned long long end = 0;
    if (std::sscanf(line.c_str(), "%llx-%llx", &start, &end) != 2) {
      continue;
    }
    if (address < start || address >= end) {
      continue;
    }
    return line.size() >= file_name.size() &&
           line.compare(line.size() - file_name.size(), file_name.size(), file_name) == 0;
  }
  return false;
}

} // namespace r3lr0::test
