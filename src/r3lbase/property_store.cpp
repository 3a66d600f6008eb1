#include "r3lbase/property_store.hpp"

#include <cerrno>
#include <cstdio>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>

#include "r3lbase/env_config.hpp"
#include "r3lbase/file_utils.hpp"

namespace r3lr0::util {

property_store::property_store(std::string path)
    : path_(std::move(path)), log_(redlog::get_logger("r3lr0.properties")) {}

std::map<std::string, std::string> property_store::load() const {
  std::map<std::string, std::string> values;
  std::ifstream input(path_);
  if (!input) {
    return values;
  }

  std::string line;
  size_t line_number = 0;
  while (std::getline(input, line)) {
    ++line_number;
    line = trim(line);
    if (line.empty() || line[0] == '#') {
      continue;
    }
    const size_t eq = line.find('=');
    if (eq == std::string::npos || eq == 0) {
      log_.wrn("ignoring malformed property line", redlog::field("path", path_), redlog::field("line", line_number));
      continue;
    }
    values[trim(line.substr(0, eq))] = trim(line.substr(eq + 1));
  }
  return values;
}

bool property_store::store(const std::map<std::string, std::string>& values) const {
  std::ostringstream out;
  for (const auto& [key, value] : values) {
    out << key << '=' << value << '\n';
  }
  const std::string contents = out.str();
  const std::string temp_path = path_ + ".tmp";

  unique_fd fd(::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
  if (!fd) {
    log_.err("failed to open property file for writing", redlog::field("path", temp_path),
             redlog::field("error", errno_text()));
    return false;
  }
  if (!write_fully(fd.get(), contents.data(), contents.size()) || ::fsync(fd.get()) != 0) {
    log_.err("failed to write property file", redlog::field("path", temp_path), redlog::field("error", errno_text()));
    ::unlink(temp_path.c_str());
    return false;
  }
  fd.reset();

  if (std::rename(temp_path.c_str(), path_.c_str()) != 0) {
    log_.err("failed to publish property file", redlog::field("path", path_), redlog::field("error", errno_text()));
    ::unlink(temp_path.c_str());
    return false;
  }
  return true;
}

std::optional<std::string> property_store::get(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto values = load();
  auto it = values.find(key);
  if (it == values.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::map<std::string, std::string> property_store::entries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return load();
}

uint64_t property_store::get_u64(const std::string& key, uint64_t default_value) const {
  auto value = get(key);
  if (!value || value->empty()) {
    return default_value;
  }
  if (auto parsed = parse_u64(*value)) {
    return *parsed;
  }
  log_.wrn("property is not a number, using default", redlog::field("key", key), redlog::field("value", *value));
  return default_value;
}

bool property_store::set(const std::string& key, const std::string& value) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto values = load();
  values[key] = value;
  if (!store(values)) {
    return false;
  }
  log_.dbg("property updated", redlog::field("key", key), redlog::field("value", value));
  return true;
}

} // namespace r3lr0::util
