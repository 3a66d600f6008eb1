#pragma once

#include <string>

namespace r3lr0 {

// stable integer contract shared with the update service and every reader
enum class load_status : int {
  success = 0,
  wrong_package_name = 1,
  address_space_not_reserved = 2,
  failed_waiting_for_relro = 3,
  failed_listing_packages = 4,
  failed_to_open_relro_file = 5,
  failed_to_load_library = 6,
  failed_on_load_hook = 7,
  failed_waiting_unknown = 8,
  failed_to_find_namespace = 10
};

// what happened to the relro of the most recent load; never an error by itself
enum class sharing_status {
  not_attempted,
  written,
  shared,
  partially_shared,
  snapshot_missing,
  snapshot_mismatch,
  remap_failed
};

const char* to_string(load_status status);
const char* to_string(sharing_status status);

inline int to_int(load_status status) { return static_cast<int>(status); }

// readable reason for a non-success status reported by the update service
std::string preparation_error_reason(load_status status);

// the service reports these when a provider is usable, a relro timeout included
inline bool is_usable_preparation(load_status status) {
  return status == load_status::success || status == load_status::failed_waiting_for_relro;
}

} // namespace r3lr0
