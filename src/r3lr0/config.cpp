#include "r3lr0/config.hpp"

#include "r3lbase/env_config.hpp"

namespace r3lr0 {

config config::from_environment() {
  util::env_config env("R3LR0");
  config cfg;
  cfg.relro_dir = env.get<std::string>("RELRO_DIR", cfg.relro_dir);
  cfg.relro_32_name = env.get<std::string>("RELRO_32_NAME", cfg.relro_32_name);
  cfg.relro_64_name = env.get<std::string>("RELRO_64_NAME", cfg.relro_64_name);
  cfg.property_file = env.get<std::string>("PROPERTY_FILE", cfg.property_file);
  cfg.writer_timeout = std::chrono::milliseconds(
      env.get<uint64_t>("WRITER_TIMEOUT_MS", static_cast<uint64_t>(cfg.writer_timeout.count()))
  );
  return cfg;
}

} // namespace r3lr0
