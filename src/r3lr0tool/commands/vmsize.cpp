#include "vmsize.hpp"

#include <iostream>

#include <redlog.hpp>

#include "r3lbase/property_store.hpp"
#include "r3lr0/config.hpp"
#include "r3lr0/provider/change_handler.hpp"
#include "r3lr0/reserve/address_space.hpp"
#include "tunables.hpp"

namespace r3lr0tool::commands {

int vmsize(
    args::ValueFlag<std::string>& property_file_flag, args::ValueFlag<uint64_t>& set_flag,
    args::ValueFlag<std::string>& library32_flag, args::ValueFlag<std::string>& library64_flag, args::Flag& store_flag
) {
  auto log = redlog::get_logger("r3lr0tool.vmsize");

  r3lr0::util::property_store properties(property_file_path(property_file_flag));

  if (set_flag) {
    const uint64_t size = args::get(set_flag);
    if (!properties.set_u64(r3lr0::kVmSizeProperty, size)) {
      log.err("could not store reservation size", redlog::field("file", properties.path()));
      return 1;
    }
    log.inf("reservation size stored", redlog::field("bytes", size));
  }

  if (library32_flag || library64_flag) {
    r3lr0::paths::resolved_library_paths paths;
    paths.path32 = library32_flag ? args::get(library32_flag) : "";
    paths.path64 = library64_flag ? args::get(library64_flag) : "";
    const uint64_t computed = r3lr0::provider::compute_reservation_size(paths);
    std::cout << "computed: " << computed << "\n";
    if (store_flag && !properties.set_u64(r3lr0::kVmSizeProperty, computed)) {
      log.err("could not store reservation size", redlog::field("file", properties.path()));
      return 1;
    }
  }

  std::cout << r3lr0::kVmSizeProperty << ": " << r3lr0::reserve::reservation_size_from(properties) << "\n";
  return 0;
}

} // namespace r3lr0tool::commands
