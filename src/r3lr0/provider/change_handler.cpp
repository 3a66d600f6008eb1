#include "r3lr0/provider/change_handler.hpp"

#include <algorithm>
#include <exception>
#include <optional>

#include "r3lbase/property_store.hpp"
#include "r3lr0/provider/package_verifier.hpp"
#include "r3lr0/provider/relro_writer.hpp"

namespace r3lr0::provider {

uint64_t compute_reservation_size(const paths::resolved_library_paths& paths) {
  auto log = redlog::get_logger("r3lr0.provider");

  uint64_t largest = 0;
  for (const std::string* path : {&paths.path32, &paths.path64}) {
    if (path->empty()) {
      continue;
    }
    log.dbg("checking file size", redlog::field("path", *path));
    if (auto size = paths::library_file_size(*path)) {
      largest = std::max(largest, *size);
      continue;
    }
    log.err("error sizing load", redlog::field("path", *path));
  }

  log.vrb("library size needs address space", redlog::field("bytes", largest));
  // bss makes the image larger than the file, and an update will likely grow it
  return std::max(2 * largest, kDefaultReservationBytes);
}

change_handler::change_handler(package_manager& packages, util::property_store& properties, abi_table abis,
                               config cfg, relro_writer* writer)
    : packages_(packages), properties_(properties), abis_(std::move(abis)), config_(std::move(cfg)),
      writer_(writer), log_(redlog::get_logger("r3lr0.provider")) {}

int change_handler::on_provider_changed(package_info package) noexcept {
  std::optional<paths::resolved_library_paths> resolved;
  try {
    if (auto s = fixup_stub_application_info(package.application, packages_); !s.ok()) {
      log_.err("error preparing provider native library", redlog::field("error", s.message));
    } else if (auto found = paths::resolve_paths(descriptor_for(package), abis_); !found.ok()) {
      log_.err("error preparing provider native library", redlog::field("error", found.status.message));
    } else {
      resolved = std::move(found.value);
      const uint64_t vm_size = compute_reservation_size(*resolved);
      log_.dbg("setting new address space size", redlog::field("bytes", vm_size));
      if (!properties_.set_u64(kVmSizeProperty, vm_size)) {
        log_.err("failed to publish reservation size", redlog::field("key", kVmSizeProperty));
      }
    }
  } catch (const std::exception& e) {
    log_.err("error preparing provider native library", redlog::field("error", e.what()));
  }

  try {
    return resolved ? prepare_snapshots(*resolved) : 0;
  } catch (const std::exception& e) {
    log_.err("error creating relro snapshots", redlog::field("error", e.what()));
    return 0;
  }
}

int change_handler::prepare_snapshots(const paths::resolved_library_paths& paths) {
  if (!writer_) {
    return 0;
  }

  int started = 0;
  for (elf_width width : {elf_width::bits32, elf_width::bits64}) {
    if (!abis_.supports(width) || !writer_->can_serve(width)) {
      continue;
    }
    const std::string& lib_path = paths.for_width(width);
    if (lib_path.empty()) {
      log_.dbg("no library for width, skipping relro", redlog::field("width", to_string(width)));
      continue;
    }

    const std::string relro_path = width == elf_width::bits64 ? config_.relro_64_path() : config_.relro_32_path();
    log_.vrb("creating relro file", redlog::field("width", to_string(width)), redlog::field("snapshot", relro_path));
    ++started;
    const load_status result = writer_->prepare(width, lib_path, relro_path);
    if (result != load_status::success) {
      log_.wrn("relro creation failed", redlog::field("width", to_string(width)),
               redlog::field("status", to_string(result)));
    }
  }
  return started;
}

} // namespace r3lr0::provider
