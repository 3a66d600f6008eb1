#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <redlog.hpp>

namespace r3lr0::util {

// reads PREFIX_NAME style environment variables with typed defaults
class env_config {
public:
  explicit env_config(const std::string& prefix = "");

  template <typename T> T get(const std::string& name, T default_value) const;

  std::string env_name(const std::string& name) const { return prefix_ + name; }

private:
  std::string prefix_;
  std::string raw(const std::string& name) const;
};

std::string to_lower(std::string value);
std::string trim(const std::string& value);

// decimal, 0x hex or 0 octal; a sign, trailing characters or overflow give nullopt
std::optional<uint64_t> parse_u64(const std::string& value);

} // namespace r3lr0::util
