#pragma once

#include <cstdint>

#include <redlog.hpp>

#include "r3lr0/abi.hpp"
#include "r3lr0/config.hpp"
#include "r3lr0/paths/library_paths.hpp"
#include "r3lr0/provider/package_info.hpp"

namespace r3lr0::util {
class property_store;
}

namespace r3lr0::provider {

class package_manager;
class relro_writer;

// largest library size over both widths, doubled, never below the default
uint64_t compute_reservation_size(const paths::resolved_library_paths& paths);

/**
 * Reacts to the provider package changing, in the privileged coordinating
 * process. Publishes the reservation size future bootstraps will use and
 * asks the writer to prepare fresh relro snapshots. Never throws.
 */
class change_handler {
public:
  change_handler(package_manager& packages, util::property_store& properties, abi_table abis, config cfg,
                 relro_writer* writer = nullptr);

  // returns how many snapshot preparations were started
  int on_provider_changed(package_info package) noexcept;

private:
  int prepare_snapshots(const paths::resolved_library_paths& paths);

  package_manager& packages_;
  util::property_store& properties_;
  abi_table abis_;
  config config_;
  relro_writer* writer_ = nullptr;
  redlog::logger log_;
};

} // namespace r3lr0::provider
