#include "resolve_paths.hpp"

#include <iostream>

#include <redlog.hpp>

#include "r3lr0/abi.hpp"
#include "r3lr0/paths/library_paths.hpp"
#include "r3lr0/provider/change_handler.hpp"

namespace r3lr0tool::commands {

int resolve_paths(
    args::ValueFlag<std::string>& source_flag, args::ValueFlag<std::string>& primary_abi_flag,
    args::ValueFlag<std::string>& secondary_abi_flag, args::ValueFlag<std::string>& primary_dir_flag,
    args::ValueFlag<std::string>& secondary_dir_flag, args::ValueFlag<std::string>& file_name_flag
) {
  auto log = redlog::get_logger("r3lr0tool.resolve_paths");

  if (!file_name_flag || !primary_abi_flag) {
    log.err("--name and --primary-abi are required");
    return 1;
  }

  r3lr0::paths::library_descriptor descriptor;
  descriptor.primary_abi = args::get(primary_abi_flag);
  descriptor.secondary_abi = secondary_abi_flag ? args::get(secondary_abi_flag) : "";
  descriptor.source_path = source_flag ? args::get(source_flag) : "";
  descriptor.primary_lib_dir = primary_dir_flag ? args::get(primary_dir_flag) : "";
  descriptor.secondary_lib_dir = secondary_dir_flag ? args::get(secondary_dir_flag) : "";
  descriptor.library_file_name = args::get(file_name_flag);

  auto resolved = r3lr0::paths::resolve_paths(descriptor, r3lr0::abi_table::for_host());
  if (!resolved.ok()) {
    log.err("could not resolve library paths", redlog::field("error", resolved.status.message));
    return 1;
  }

  const auto& paths = resolved.value;
  std::cout << "path32:  " << (paths.path32.empty() ? "(none)" : paths.path32) << "\n";
  std::cout << "path64:  " << (paths.path64.empty() ? "(none)" : paths.path64) << "\n";
  std::cout << "vm size: " << r3lr0::provider::compute_reservation_size(paths) << "\n";
  return paths.empty() ? 1 : 0;
}

} // namespace r3lr0tool::commands
