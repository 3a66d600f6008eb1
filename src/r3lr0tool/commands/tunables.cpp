#include "tunables.hpp"

#include <iostream>

#include <redlog.hpp>

#include "r3lbase/property_store.hpp"
#include "r3lr0/config.hpp"
#include "r3lr0/reserve/address_space.hpp"

namespace r3lr0tool::commands {

std::string property_file_path(args::ValueFlag<std::string>& property_file_flag) {
  if (property_file_flag) {
    return args::get(property_file_flag);
  }
  return r3lr0::config::from_environment().property_file;
}

uint64_t requested_reservation_size(
    args::ValueFlag<uint64_t>& vm_size_flag, args::ValueFlag<std::string>& property_file_flag
) {
  if (vm_size_flag) {
    return args::get(vm_size_flag);
  }
  r3lr0::util::property_store properties(property_file_path(property_file_flag));
  return r3lr0::reserve::reservation_size_from(properties);
}

int tunables(args::ValueFlag<std::string>& property_file_flag, args::ValueFlag<uint64_t>& vm_size_flag) {
  auto log = redlog::get_logger("r3lr0tool.tunables");

  r3lr0::util::property_store properties(property_file_path(property_file_flag));
  const auto entries = properties.entries();
  log.dbg("read tunables", redlog::field("file", properties.path()), redlog::field("count", entries.size()));

  std::cout << "file: " << properties.path() << "\n";
  for (const auto& [key, value] : entries) {
    std::cout << "  " << key << "=" << value << "\n";
  }
  if (entries.find(r3lr0::kVmSizeProperty) == entries.end()) {
    std::cout << "  " << r3lr0::kVmSizeProperty << " unset, default " << r3lr0::kDefaultReservationBytes << "\n";
  }
  std::cout << "requested reservation: " << requested_reservation_size(vm_size_flag, property_file_flag) << "\n";
  return 0;
}

} // namespace r3lr0tool::commands
