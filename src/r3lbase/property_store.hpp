#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include <redlog.hpp>

namespace r3lr0::util {

// persisted key=value tunables, one pair per line; '#' starts a comment.
// every set() rewrites the whole file through a temp file + rename so
// concurrent readers in other processes never observe a partial file.
class property_store {
public:
  explicit property_store(std::string path);

  std::optional<std::string> get(const std::string& key) const;
  uint64_t get_u64(const std::string& key, uint64_t default_value) const;
  std::map<std::string, std::string> entries() const;

  bool set(const std::string& key, const std::string& value);
  bool set_u64(const std::string& key, uint64_t value) { return set(key, std::to_string(value)); }

  const std::string& path() const { return path_; }

private:
  std::map<std::string, std::string> load() const;
  bool store(const std::map<std::string, std::string>& values) const;

  std::string path_;
  mutable std::mutex mutex_;
  mutable redlog::logger log_;
};

} // namespace r3lr0::util
