#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace r3lr0 {

// tunable key holding the reservation size for future process bootstraps
inline constexpr const char* kVmSizeProperty = "persist.r3lr0.vmsize";
inline constexpr uint64_t kDefaultReservationBytes = 100ull * 1024 * 1024;

struct config {
  std::string relro_dir = "/data/misc/shared_relro";
  std::string relro_32_name = "libprovider32.relro";
  std::string relro_64_name = "libprovider64.relro";
  std::string property_file = "/data/property/r3lr0.properties";
  std::chrono::milliseconds writer_timeout{10000};

  std::string relro_32_path() const { return relro_dir + "/" + relro_32_name; }
  std::string relro_64_path() const { return relro_dir + "/" + relro_64_name; }

  // R3LR0_RELRO_DIR, R3LR0_RELRO_32_NAME, R3LR0_RELRO_64_NAME,
  // R3LR0_PROPERTY_FILE, R3LR0_WRITER_TIMEOUT_MS
  static config from_environment();
};

} // namespace r3lr0
