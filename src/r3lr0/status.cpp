#include "r3lr0/status.hpp"

#include "r3lr0/result.hpp"

namespace r3lr0 {

const char* to_string(load_status status) {
  switch (status) {
  case load_status::success:
    return "success";
  case load_status::wrong_package_name:
    return "wrong_package_name";
  case load_status::address_space_not_reserved:
    return "address_space_not_reserved";
  case load_status::failed_waiting_for_relro:
    return "failed_waiting_for_relro";
  case load_status::failed_listing_packages:
    return "failed_listing_packages";
  case load_status::failed_to_open_relro_file:
    return "failed_to_open_relro_file";
  case load_status::failed_to_load_library:
    return "failed_to_load_library";
  case load_status::failed_on_load_hook:
    return "failed_on_load_hook";
  case load_status::failed_waiting_unknown:
    return "failed_waiting_unknown";
  case load_status::failed_to_find_namespace:
    return "failed_to_find_namespace";
  }
  return "unknown";
}

const char* to_string(sharing_status status) {
  switch (status) {
  case sharing_status::not_attempted:
    return "not_attempted";
  case sharing_status::written:
    return "written";
  case sharing_status::shared:
    return "shared";
  case sharing_status::partially_shared:
    return "partially_shared";
  case sharing_status::snapshot_missing:
    return "snapshot_missing";
  case sharing_status::snapshot_mismatch:
    return "snapshot_mismatch";
  case sharing_status::remap_failed:
    return "remap_failed";
  }
  return "unknown";
}

const char* to_string(error_code code) {
  switch (code) {
  case error_code::ok:
    return "ok";
  case error_code::invalid_argument:
    return "invalid_argument";
  case error_code::missing_package:
    return "missing_package";
  case error_code::security_violation:
    return "security_violation";
  case error_code::load_failed:
    return "load_failed";
  case error_code::entry_point_missing:
    return "entry_point_missing";
  case error_code::instantiation_failed:
    return "instantiation_failed";
  case error_code::io_error:
    return "io_error";
  case error_code::internal_error:
    return "internal_error";
  }
  return "unknown";
}

std::string preparation_error_reason(load_status status) {
  switch (status) {
  case load_status::failed_waiting_for_relro:
    return "timed out waiting for relro files to be created";
  case load_status::failed_listing_packages:
    return "no provider package installed";
  case load_status::failed_waiting_unknown:
    return "preparation failed for unknown reason";
  default:
    return "unknown";
  }
}

} // namespace r3lr0
