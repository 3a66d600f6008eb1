#include <doctest/doctest.h>

#include <cstdlib>

#include "r3lbase/cli/verbosity.hpp"
#include "r3lbase/env_config.hpp"

namespace {

struct scoped_env {
  scoped_env(const char* name, const char* value) : name_(name) { ::setenv(name, value, 1); }
  ~scoped_env() { ::unsetenv(name_); }

  const char* name_;
};

} // namespace

TEST_CASE("verbosity counts map to redlog levels") {
  using r3lr0::cli::level_from_verbosity;
  CHECK(level_from_verbosity(-3) == redlog::level::info);
  CHECK(level_from_verbosity(0) == redlog::level::info);
  CHECK(level_from_verbosity(1) == redlog::level::verbose);
  CHECK(level_from_verbosity(2) == redlog::level::trace);
  CHECK(level_from_verbosity(3) == redlog::level::debug);
  CHECK(level_from_verbosity(4) == redlog::level::pedantic);
  CHECK(level_from_verbosity(12) == redlog::level::pedantic);
}

TEST_CASE("command line verbosity wins over the environment") {
  scoped_env verbose("R3LR0TEST_VERBOSE", "3");
  r3lr0::util::env_config env("R3LR0TEST");

  CHECK(r3lr0::cli::resolve_verbosity(0, env) == 3);
  CHECK(r3lr0::cli::resolve_verbosity(1, env) == 1);
  CHECK(r3lr0::cli::resolve_verbosity(9, env) == r3lr0::cli::kMaxVerbosity);
}

TEST_CASE("unset or malformed environment verbosity is quiet") {
  r3lr0::util::env_config env("R3LR0TEST");
  CHECK(r3lr0::cli::resolve_verbosity(0, env) == 0);

  scoped_env junk("R3LR0TEST_VERBOSE", "loud");
  CHECK(r3lr0::cli::resolve_verbosity(0, env) == 0);

  scoped_env negative("R3LR0TEST_VERBOSE", "-2");
  CHECK(r3lr0::cli::resolve_verbosity(0, env) == 0);
}

TEST_CASE("applying verbosity sets the global level") {
  scoped_env verbose("R3LR0_VERBOSE", "2");
  const redlog::level before = redlog::get_level();

  CHECK(r3lr0::cli::apply_verbosity(0) == redlog::level::trace);
  CHECK(redlog::get_level() == redlog::level::trace);
  CHECK(r3lr0::cli::apply_verbosity(3) == redlog::level::debug);
  CHECK(redlog::get_level() == redlog::level::debug);

  redlog::set_level(before);
}
