#pragma once

#include <string>

#include <redlog.hpp>

namespace r3lr0::util {
class env_config;
}

namespace r3lr0::cli {

inline constexpr int kMaxVerbosity = 4;
inline constexpr const char* kVerbosityVariable = "VERBOSE";

// 0 info, 1 verbose, 2 trace, 3 debug, 4+ pedantic
redlog::level level_from_verbosity(int count);

// a -v count wins; otherwise <PREFIX>_VERBOSE, clamped to 0..kMaxVerbosity
int resolve_verbosity(int flag_count, const util::env_config& env);

// resolves against R3LR0_VERBOSE and sets the global redlog level; returns the level used
redlog::level apply_verbosity(int flag_count);

} // namespace r3lr0::cli
