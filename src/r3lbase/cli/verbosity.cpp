#include "r3lbase/cli/verbosity.hpp"

#include <algorithm>

#include "r3lbase/env_config.hpp"

namespace r3lr0::cli {
namespace {

constexpr redlog::level kLevels[] = {
    redlog::level::info, redlog::level::verbose, redlog::level::trace, redlog::level::debug, redlog::level::pedantic,
};

} // namespace

redlog::level level_from_verbosity(int count) { return kLevels[std::clamp(count, 0, kMaxVerbosity)]; }

int resolve_verbosity(int flag_count, const util::env_config& env) {
  const int count = flag_count > 0 ? flag_count : env.get<int>(kVerbosityVariable, 0);
  return std::clamp(count, 0, kMaxVerbosity);
}

redlog::level apply_verbosity(int flag_count) {
  const redlog::level level = level_from_verbosity(resolve_verbosity(flag_count, util::env_config("R3LR0")));
  redlog::set_level(level);
  return level;
}

} // namespace r3lr0::cli
