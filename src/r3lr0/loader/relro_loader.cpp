#include "r3lr0/loader/relro_loader.hpp"

#include <cinttypes>
#include <optional>

#include <sys/mman.h>

#include "r3lbase/file_utils.hpp"
#include "r3lr0/abi.hpp"
#include "r3lr0/elf/elf_layout.hpp"
#include "r3lr0/loader/image_source.hpp"
#include "r3lr0/loader/link_namespace.hpp"
#include "r3lr0/provider/native_provider.hpp"
#include "r3lr0/relro/snapshot.hpp"
#include "r3lr0/reserve/address_space.hpp"

namespace r3lr0::loader {
namespace {

relro::image_placement placement_of(const elf::mapped_image& image, const relro::image_identity& identity) {
  relro::image_placement placement;
  placement.elf_class = image.layout().elf_class;
  placement.elf_machine = image.layout().machine;
  placement.load_address = image.load_address();
  placement.load_size = image.layout().load_size;
  placement.relro_offset = image.layout().relro_offset();
  placement.relro_size = image.layout().relro_size;
  placement.identity = identity;
  return placement;
}

} // namespace

relro_loader::relro_loader(reserve::address_space_reservation& reservation, const namespace_registry* namespaces)
    : reservation_(reservation), namespaces_(namespaces), log_(redlog::get_logger("r3lr0.loader")) {}

void relro_loader::set_link_namespace(std::string name) {
  std::lock_guard<std::mutex> lock(mutex_);
  namespace_name_ = std::move(name);
}

const loaded_library* relro_loader::library() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return library_.get();
}

sharing_status relro_loader::last_sharing_status() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_sharing_;
}

load_status relro_loader::load_with_sharing(
    const std::string& path32, const std::string& path64, const std::string& relro32, const std::string& relro64
) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!reservation_.reserved()) {
    log_.wrn("address space not reserved, refusing shared load");
    return load_status::address_space_not_reserved;
  }

  const bool is_64 = native_width() == elf_width::bits64;
  const std::string& lib_path = is_64 ? path64 : path32;
  const std::string& relro_path = is_64 ? relro64 : relro32;
  const std::string& unused_path = is_64 ? path32 : path64;

  if (!unused_path.empty()) {
    log_.dbg("ignoring library for the other width", redlog::field("path", unused_path));
  }
  if (lib_path.empty()) {
    log_.err("no library for this process width", redlog::field("width", to_string(native_width())));
    return load_status::failed_to_load_library;
  }

  return load_locked(lib_path, relro_path, true);
}

load_status relro_loader::load_private(const std::string& lib_path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (lib_path.empty()) {
    return load_status::failed_to_load_library;
  }
  return load_locked(lib_path, std::string(), false);
}

load_status relro_loader::check_reusable(const std::string& lib_path) const {
  switch (state_) {
  case state::idle:
    return load_status::success;
  case state::loaded:
    if (library_ && library_->path() == lib_path) {
      return load_status::success;
    }
    log_.err("a different provider library is already loaded", redlog::field("loaded", library_->path()),
             redlog::field("requested", lib_path));
    return load_status::failed_to_load_library;
  case state::relro_written:
    log_.err("reservation holds the relro writer image", redlog::field("written", written_path_));
    return load_status::failed_to_load_library;
  case state::poisoned:
    log_.err("an earlier load left the reservation unusable");
    return load_status::failed_to_load_library;
  }
  return load_status::failed_to_load_library;
}

load_status relro_loader::prepare_image(const std::string& lib_path, uintptr_t base, size_t region_size,
                                        image_source& source, std::unique_ptr<elf::mapped_image>& image) {
  elf::link_options options;
  if (!namespace_name_.empty()) {
    std::optional<link_namespace> ns;
    if (namespaces_) {
      ns = namespaces_->find(namespace_name_);
    }
    if (!ns) {
      log_.err("link namespace not found", redlog::field("namespace", namespace_name_));
      return load_status::failed_to_find_namespace;
    }
    options.search_dirs = ns->search_dirs;
  }

  auto opened = open_image_source(lib_path);
  if (!opened.ok()) {
    log_.err("failed to open provider library", redlog::field("path", lib_path),
             redlog::field("error", opened.status.message));
    return load_status::failed_to_load_library;
  }
  source = std::move(opened.value);

  auto layout = elf::elf_layout::read(source.fd.get(), source.offset);
  if (!layout.ok()) {
    log_.err("invalid provider library", redlog::field("path", lib_path),
             redlog::field("error", layout.status.message));
    return load_status::failed_to_load_library;
  }

  if (layout.value.load_size > region_size) {
    log_.err("provider library does not fit the region", redlog::field("path", lib_path),
             redlog::field("load_size", layout.value.load_size), redlog::field("region", region_size));
    return load_status::failed_to_load_library;
  }

  auto mapped = elf::mapped_image::map(source.fd.get(), layout.value, base, lib_path);
  if (!mapped.ok()) {
    log_.err("failed to map provider library", redlog::field("path", lib_path),
             redlog::field("error", mapped.status.message));
    return load_status::failed_to_load_library;
  }
  image = std::move(mapped.value);

  if (auto s = image->link(options); !s.ok()) {
    log_.err("failed to link provider library", redlog::field("path", lib_path), redlog::field("error", s.message));
    image.reset();
    return load_status::failed_to_load_library;
  }
  return load_status::success;
}

sharing_status relro_loader::share_with_snapshot(const elf::mapped_image& image, const image_source& source,
                                                 const std::string& relro_path) {
  if (relro_path.empty()) {
    return sharing_status::not_attempted;
  }
  if (image.relro_size() == 0) {
    log_.wrn("provider library has no relro to share", redlog::field("path", source.path));
    return sharing_status::not_attempted;
  }

  util::unique_fd fd = util::open_read_only(relro_path);
  if (!fd) {
    log_.inf("no relro snapshot, keeping private relocation", redlog::field("snapshot", relro_path),
             redlog::field("error", util::errno_text()));
    return sharing_status::snapshot_missing;
  }

  auto header = relro::read_header(fd.get());
  if (!header.ok()) {
    log_.wrn("relro snapshot unreadable, keeping private relocation", redlog::field("snapshot", relro_path),
             redlog::field("error", header.status.message));
    return sharing_status::snapshot_mismatch;
  }

  auto identity = relro::compute_image_identity(source.fd.get(), source.offset, source.size);
  if (!identity.ok()) {
    log_.wrn("could not fingerprint provider library", redlog::field("path", source.path),
             redlog::field("error", identity.status.message));
    return sharing_status::snapshot_mismatch;
  }

  const uint64_t file_size = util::file_size(fd.get()).value_or(0);
  const auto check = relro::validate_header(header.value, placement_of(image, identity.value), file_size);
  if (check != relro::header_check::ok) {
    log_.wrn("stale relro snapshot, keeping private relocation", redlog::field("snapshot", relro_path),
             redlog::field("reason", relro::to_string(check)));
    return sharing_status::snapshot_mismatch;
  }

  const auto outcome = relro::share_pages(fd.get(), header.value, image.relro_start(), image.relro_size());
  const sharing_status result = outcome.as_sharing_status();
  if (result == sharing_status::shared) {
    log_.inf("sharing relro with snapshot", redlog::field("snapshot", relro_path),
             redlog::field("pages", outcome.pages_shared));
  } else {
    log_.wrn("relro only partly shared", redlog::field("snapshot", relro_path),
             redlog::field("status", to_string(result)), redlog::field("shared", outcome.pages_shared),
             redlog::field("pages", outcome.pages_total));
  }
  return result;
}

load_status relro_loader::finish_load(std::unique_ptr<elf::mapped_image> image, const std::string& lib_path,
                                      bool in_reservation) {
  image->retain();
  image->run_initializers();

  if (auto on_load = reinterpret_cast<on_load_fn>(image->find_symbol(kOnLoadSymbol))) {
    const uint32_t provider_abi = on_load(kHostAbiVersion);
    if (provider_abi < kMinimumProviderAbi) {
      log_.err("provider rejected by load hook", redlog::field("path", lib_path),
               redlog::field("provider_abi", provider_abi), redlog::field("minimum", kMinimumProviderAbi));
      // initializers ran, the image cannot be unmapped any more
      state_ = state::poisoned;
      image.release();
      return load_status::failed_on_load_hook;
    }
  }

  library_ = std::make_unique<loaded_library>(lib_path, std::move(image), in_reservation);
  state_ = state::loaded;
  log_.inf("provider library loaded", redlog::field("path", lib_path),
           redlog::field("address", "0x%" PRIxPTR, library_->load_address()),
           redlog::field("sharing", to_string(last_sharing_)));
  return load_status::success;
}

load_status relro_loader::load_locked(const std::string& lib_path, const std::string& relro_path,
                                      bool use_reservation) {
  if (auto s = check_reusable(lib_path); s != load_status::success) {
    return s;
  }
  if (state_ == state::loaded) {
    log_.dbg("provider library already loaded", redlog::field("path", lib_path));
    return load_status::success;
  }

  image_source source;
  std::unique_ptr<elf::mapped_image> image;

  if (use_reservation) {
    const auto status = prepare_image(lib_path, reservation_.address(), reservation_.size(), source, image);
    if (status != load_status::success) {
      return status;
    }
    last_sharing_ = share_with_snapshot(*image, source, relro_path);
    return finish_load(std::move(image), lib_path, true);
  }

  // size the private region from the headers before mapping
  auto opened = open_image_source(lib_path);
  if (!opened.ok()) {
    log_.err("failed to open provider library", redlog::field("path", lib_path),
             redlog::field("error", opened.status.message));
    return load_status::failed_to_load_library;
  }
  auto layout = elf::elf_layout::read(opened.value.fd.get(), opened.value.offset);
  if (!layout.ok()) {
    log_.err("invalid provider library", redlog::field("path", lib_path),
             redlog::field("error", layout.status.message));
    return load_status::failed_to_load_library;
  }

  void* region = mmap(nullptr, layout.value.load_size, PROT_NONE, MAP_PRIVATE | MAP_ANONYMOUS | MAP_NORESERVE, -1, 0);
  if (region == MAP_FAILED) {
    log_.err("failed to reserve private region", redlog::field("bytes", layout.value.load_size),
             redlog::field("error", util::errno_text()));
    return load_status::failed_to_load_library;
  }

  const size_t region_size = static_cast<size_t>(layout.value.load_size);
  const auto status = prepare_image(lib_path, reinterpret_cast<uintptr_t>(region), region_size, source, image);
  if (status != load_status::success) {
    munmap(region, region_size);
    return status;
  }
  last_sharing_ = sharing_status::not_attempted;
  return finish_load(std::move(image), lib_path, false);
}

load_status relro_loader::create_relro_file(const std::string& lib_path, const std::string& relro_path) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!reservation_.reserved()) {
    log_.wrn("address space not reserved, cannot create relro snapshot");
    return load_status::address_space_not_reserved;
  }
  if (state_ != state::idle) {
    log_.err("relro snapshots must be created by a fresh process", redlog::field("path", lib_path));
    return load_status::failed_to_load_library;
  }
  if (lib_path.empty() || relro_path.empty()) {
    return load_status::failed_to_load_library;
  }

  image_source source;
  std::unique_ptr<elf::mapped_image> image;
  if (auto s = prepare_image(lib_path, reservation_.address(), reservation_.size(), source, image);
      s != load_status::success) {
    return s;
  }

  auto identity = relro::compute_image_identity(source.fd.get(), source.offset, source.size);
  if (!identity.ok()) {
    log_.err("could not fingerprint provider library", redlog::field("path", lib_path),
             redlog::field("error", identity.status.message));
    return load_status::failed_to_load_library;
  }

  const auto header = relro::make_header(placement_of(*image, identity.value));
  if (auto s = relro::write_snapshot(relro_path, header, reinterpret_cast<const void*>(image->relro_start()));
      !s.ok()) {
    log_.err("failed to write relro snapshot", redlog::field("snapshot", relro_path), redlog::field("error", s.message));
    return load_status::failed_to_open_relro_file;
  }

  // the writer shares its own pages too
  last_sharing_ = sharing_status::written;
  if (util::unique_fd fd = util::open_read_only(relro_path)) {
    const auto outcome = relro::share_pages(fd.get(), header, image->relro_start(), image->relro_size());
    if (outcome.remap_failed) {
      last_sharing_ = sharing_status::remap_failed;
    }
  }

  image->retain();
  image.release();
  written_path_ = lib_path;
  state_ = state::relro_written;
  log_.inf("relro snapshot created", redlog::field("path", lib_path), redlog::field("snapshot", relro_path));
  return load_status::success;
}

} // namespace r3lr0::loader
