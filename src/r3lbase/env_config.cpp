#include "r3lbase/env_config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>

namespace r3lr0::util {
namespace {

redlog::logger& config_log() {
  static redlog::logger log = redlog::get_logger("r3lr0.config");
  return log;
}

template <typename T, typename Parser>
T parse_or_default(const env_config& cfg, const std::string& name, const std::string& value, T default_value,
                   const char* type_name, Parser parser) {
  try {
    size_t consumed = 0;
    T parsed = parser(value, &consumed);
    if (consumed != value.size()) {
      throw std::invalid_argument("trailing characters");
    }
    return parsed;
  } catch (const std::exception& e) {
    config_log().wrn(
        "failed to parse variable, using default", redlog::field("variable", cfg.env_name(name)),
        redlog::field("type", type_name), redlog::field("error", e.what())
    );
    return default_value;
  }
}

} // namespace

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

std::string trim(const std::string& value) {
  const size_t first = value.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  const size_t last = value.find_last_not_of(" \t\r\n");
  return value.substr(first, last - first + 1);
}

std::optional<uint64_t> parse_u64(const std::string& value) {
  // stoull negates "-1" into 2^64-1 instead of failing
  if (value.empty() || value[0] == '-' || value[0] == '+' || std::isspace(static_cast<unsigned char>(value[0]))) {
    return std::nullopt;
  }
  try {
    size_t consumed = 0;
    const uint64_t parsed = std::stoull(value, &consumed, 0);
    if (consumed != value.size()) {
      return std::nullopt;
    }
    return parsed;
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

env_config::env_config(const std::string& prefix) : prefix_(prefix) {
  if (!prefix_.empty() && prefix_.back() != '_') {
    prefix_ += "_";
  }
}

std::string env_config::raw(const std::string& name) const {
  const char* value = std::getenv(env_name(name).c_str());
  return value ? trim(value) : std::string();
}

template <> std::string env_config::get<std::string>(const std::string& name, std::string default_value) const {
  std::string value = raw(name);
  return value.empty() ? default_value : value;
}

template <> bool env_config::get<bool>(const std::string& name, bool default_value) const {
  std::string value = raw(name);
  if (value.empty()) {
    return default_value;
  }
  const std::string lowered = to_lower(value);
  return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

template <> int env_config::get<int>(const std::string& name, int default_value) const {
  std::string value = raw(name);
  if (value.empty()) {
    return default_value;
  }
  return parse_or_default<int>(*this, name, value, default_value, "int", [](const std::string& s, size_t* pos) {
    return std::stoi(s, pos);
  });
}

template <> uint32_t env_config::get<uint32_t>(const std::string& name, uint32_t default_value) const {
  std::string value = raw(name);
  if (value.empty()) {
    return default_value;
  }
  auto parsed = parse_u64(value);
  if (!parsed || *parsed > UINT32_MAX) {
    config_log().wrn(
        "failed to parse variable, using default", redlog::field("variable", env_name(name)),
        redlog::field("type", "uint32_t"), redlog::field("value", value)
    );
    return default_value;
  }
  return static_cast<uint32_t>(*parsed);
}

template <> uint64_t env_config::get<uint64_t>(const std::string& name, uint64_t default_value) const {
  std::string value = raw(name);
  if (value.empty()) {
    return default_value;
  }
  auto parsed = parse_u64(value);
  if (!parsed) {
    config_log().wrn(
        "failed to parse variable, using default", redlog::field("variable", env_name(name)),
        redlog::field("type", "uint64_t"), redlog::field("value", value)
    );
    return default_value;
  }
  return *parsed;
}

} // namespace r3lr0::util
