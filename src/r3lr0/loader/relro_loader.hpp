#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <redlog.hpp>

#include "r3lr0/elf/mapped_image.hpp"
#include "r3lr0/status.hpp"

namespace r3lr0::reserve {
class address_space_reservation;
}

namespace r3lr0::loader {

class namespace_registry;
struct image_source;

// the provider library once mapped, linked and initialized
class loaded_library {
public:
  loaded_library(std::string path, std::unique_ptr<elf::mapped_image> image, bool in_reservation)
      : path_(std::move(path)), image_(std::move(image)), in_reservation_(in_reservation) {}

  const std::string& path() const { return path_; }
  void* find_symbol(std::string_view name) const { return image_->find_symbol(name); }

  template <typename Fn> Fn find_function(std::string_view name) const {
    return reinterpret_cast<Fn>(find_symbol(name));
  }

  uintptr_t load_address() const { return image_->load_address(); }
  size_t load_size() const { return image_->load_size(); }
  uintptr_t relro_start() const { return image_->relro_start(); }
  size_t relro_size() const { return image_->relro_size(); }
  bool in_reservation() const { return in_reservation_; }

private:
  std::string path_;
  std::unique_ptr<elf::mapped_image> image_;
  bool in_reservation_ = false;
};

/**
 * Loads the provider library into the process reservation and shares its
 * relocated relro pages through a snapshot file.
 *
 * One library per process: the first successful load is cached, asking for
 * the same path again returns it and any other path is refused. A process
 * that ran create_relro_file() has used its reservation for the snapshot
 * image and cannot load another library.
 */
class relro_loader {
public:
  explicit relro_loader(reserve::address_space_reservation& reservation,
                        const namespace_registry* namespaces = nullptr);

  relro_loader(const relro_loader&) = delete;
  relro_loader& operator=(const relro_loader&) = delete;

  // dependencies are searched in this namespace; empty means the default lookup
  void set_link_namespace(std::string name);

  load_status load_with_sharing(
      const std::string& path32, const std::string& path64, const std::string& relro32, const std::string& relro64
  );

  load_status create_relro_file(const std::string& lib_path, const std::string& relro_path);

  // no reservation: map anywhere, never share
  load_status load_private(const std::string& lib_path);

  const loaded_library* library() const;
  sharing_status last_sharing_status() const;

private:
  enum class state { idle, loaded, relro_written, poisoned };

  load_status load_locked(const std::string& lib_path, const std::string& relro_path, bool use_reservation);
  load_status check_reusable(const std::string& lib_path) const;
  load_status prepare_image(const std::string& lib_path, uintptr_t base, size_t region_size, image_source& source,
                            std::unique_ptr<elf::mapped_image>& image);
  sharing_status share_with_snapshot(const elf::mapped_image& image, const image_source& source,
                                     const std::string& relro_path);
  load_status finish_load(std::unique_ptr<elf::mapped_image> image, const std::string& lib_path, bool in_reservation);

  reserve::address_space_reservation& reservation_;
  const namespace_registry* namespaces_ = nullptr;
  std::string namespace_name_;

  mutable std::mutex mutex_;
  state state_ = state::idle;
  std::unique_ptr<loaded_library> library_;
  std::string written_path_;
  sharing_status last_sharing_ = sharing_status::not_attempted;
  mutable redlog::logger log_;
};

} // namespace r3lr0::loader
