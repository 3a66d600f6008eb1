#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>

#include <redlog.hpp>

namespace r3lr0::util {
class property_store;
}

namespace r3lr0::reserve {

// vma name the kernel shows in /proc/<pid>/maps as "[anon:r3lr0 reservation]"
inline constexpr const char* kReservationName = "r3lr0 reservation";

struct region {
  uintptr_t address = 0;
  size_t size = 0;

  bool ok() const { return address != 0 && size != 0; }
};

/**
 * Process-wide virtual address reservation for the provider library.
 *
 * reserve() runs once during early bootstrap, before any library load, and
 * maps an inaccessible, uncommitted region so the library can later be placed
 * at the same address in every process forked from the reserving one. The
 * region is never released. Failure is sticky for the lifetime of the object
 * and never throws.
 */
class address_space_reservation {
public:
  address_space_reservation() : log_(redlog::get_logger("r3lr0.reserve")) {}

  address_space_reservation(const address_space_reservation&) = delete;
  address_space_reservation& operator=(const address_space_reservation&) = delete;

  // idempotent: later calls return the outcome of the first
  bool reserve(uint64_t size_bytes) noexcept;

  // take over a region reserved by a parent process (see find_named_reservation)
  bool adopt(region existing) noexcept;

  bool attempted() const;
  bool reserved() const;
  region get() const;
  uintptr_t address() const { return get().address; }
  size_t size() const { return get().size; }

private:
  mutable std::mutex mutex_;
  bool attempted_ = false;
  region region_{};
  redlog::logger log_;
};

// finds the named reservation line in maps(5) formatted text
std::optional<region> scan_maps_for_reservation(std::string_view maps);

// reads /proc/self/maps looking for a region made by address_space_reservation
std::optional<region> find_named_reservation();

// reservation size tunable, or the default when unset
uint64_t reservation_size_from(const util::property_store& properties);

// bootstrap hook: reserve the tunable size, log, never throw
bool prepare_in_bootstrap(address_space_reservation& reservation, const util::property_store& properties) noexcept;

} // namespace r3lr0::reserve
