#include "r3lr0/reserve/address_space.hpp"

#include <cerrno>
#include <cinttypes>
#include <cstdio>
#include <cstring>
#include <string>

#include <sys/mman.h>
#include <sys/prctl.h>
#include <unistd.h>

#include "r3lbase/file_utils.hpp"
#include "r3lbase/page_utils.hpp"
#include "r3lbase/property_store.hpp"
#include "r3lr0/config.hpp"

#ifndef PR_SET_VMA
#define PR_SET_VMA 0x53564d41
#endif
#ifndef PR_SET_VMA_ANON_NAME
#define PR_SET_VMA_ANON_NAME 0
#endif

namespace r3lr0::reserve {
namespace {

void name_region(void* address, size_t size, redlog::logger& log) {
  // kernels before 5.17 reject the request; the name only helps find_named_reservation
  if (prctl(PR_SET_VMA, PR_SET_VMA_ANON_NAME, address, size, kReservationName) != 0) {
    log.dbg("could not name reservation", redlog::field("error", util::errno_text()));
  }
}

} // namespace

bool address_space_reservation::reserve(uint64_t size_bytes) noexcept {
  try {
    std::lock_guard<std::mutex> lock(mutex_);
    if (attempted_) {
      log_.dbg("reservation already attempted", redlog::field("reserved", region_.ok()));
      return region_.ok();
    }
    attempted_ = true;

    if (size_bytes == 0 || size_bytes > SIZE_MAX - util::page_size()) {
      log_.err("invalid reservation size", redlog::field("bytes", size_bytes));
      return false;
    }

    const size_t size = static_cast<size_t>(util::page_end(size_bytes));
    void* address = mmap(nullptr, size, PROT_NONE, MAP_PRIVATE | MAP_ANONYMOUS | MAP_NORESERVE, -1, 0);
    if (address == MAP_FAILED) {
      log_.err("reserving address space failed", redlog::field("bytes", size), redlog::field("error", util::errno_text()));
      return false;
    }

    name_region(address, size, log_);
    region_.address = reinterpret_cast<uintptr_t>(address);
    region_.size = size;
    log_.inf("address space reserved", redlog::field("address", "0x%" PRIxPTR, region_.address),
             redlog::field("bytes", size));
    return true;
  } catch (const std::exception& e) {
    std::fprintf(stderr, "r3lr0: reservation failed: %s\n", e.what());
    return false;
  }
}

bool address_space_reservation::adopt(region existing) noexcept {
  try {
    std::lock_guard<std::mutex> lock(mutex_);
    if (attempted_) {
      return region_.ok();
    }
    attempted_ = true;
    if (!existing.ok() || !util::is_page_aligned(existing.address) || !util::is_page_aligned(existing.size)) {
      log_.err("refusing to adopt malformed reservation", redlog::field("address", "0x%" PRIxPTR, existing.address),
               redlog::field("bytes", existing.size));
      return false;
    }
    region_ = existing;
    log_.inf("adopted inherited reservation", redlog::field("address", "0x%" PRIxPTR, region_.address),
             redlog::field("bytes", region_.size));
    return true;
  } catch (const std::exception& e) {
    std::fprintf(stderr, "r3lr0: adopting reservation failed: %s\n", e.what());
    return false;
  }
}

bool address_space_reservation::attempted() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return attempted_;
}

bool address_space_reservation::reserved() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return region_.ok();
}

region address_space_reservation::get() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return region_;
}

std::optional<region> scan_maps_for_reservation(std::string_view maps) {
  const std::string marker = std::string("[anon:") + kReservationName + "]";
  const size_t position = maps.find(marker);
  if (position == std::string_view::npos) {
    return std::nullopt;
  }

  size_t line_start = maps.rfind('\n', position);
  line_start = line_start == std::string_view::npos ? 0 : line_start + 1;
  const std::string line(maps.substr(line_start, position - line_start));

  // 00400000-00452000 ---p 00000000 00:00 0  [anon:...]
  uintptr_t start = 0;
  uintptr_t end = 0;
  char permissions[5] = {};
  if (std::sscanf(line.c_str(), "%" SCNxPTR "-%" SCNxPTR " %4c", &start, &end, permissions) < 3) {
    return std::nullopt;
  }
  if (std::strcmp(permissions, "---p") != 0 || end <= start) {
    return std::nullopt;
  }
  if (!util::is_page_aligned(start) || !util::is_page_aligned(end)) {
    return std::nullopt;
  }
  return region{start, static_cast<size_t>(end - start)};
}

std::optional<region> find_named_reservation() {
  auto log = redlog::get_logger("r3lr0.reserve");
  util::unique_fd fd = util::open_read_only("/proc/self/maps");
  if (!fd) {
    log.err("failed to open /proc/self/maps", redlog::field("error", util::errno_text()));
    return std::nullopt;
  }

  // maps is generated on read, so read sequentially until EOF
  std::string contents;
  char buffer[4096];
  while (true) {
    ssize_t rv = ::read(fd.get(), buffer, sizeof(buffer));
    if (rv < 0) {
      if (errno == EINTR) {
        continue;
      }
      log.err("failed to read /proc/self/maps", redlog::field("error", util::errno_text()));
      return std::nullopt;
    }
    if (rv == 0) {
      break;
    }
    contents.append(buffer, static_cast<size_t>(rv));
  }
  return scan_maps_for_reservation(contents);
}

uint64_t reservation_size_from(const util::property_store& properties) {
  return properties.get_u64(kVmSizeProperty, kDefaultReservationBytes);
}

bool prepare_in_bootstrap(address_space_reservation& reservation, const util::property_store& properties) noexcept {
  try {
    auto log = redlog::get_logger("r3lr0.reserve");
    const uint64_t size = reservation_size_from(properties);
    if (reservation.reserve(size)) {
      log.vrb("bootstrap reservation ready", redlog::field("bytes", size));
      return true;
    }
    log.err("reserving address space failed; relro sharing disabled for this process", redlog::field("bytes", size));
    return false;
  } catch (const std::exception& e) {
    std::fprintf(stderr, "r3lr0: error preparing native loader: %s\n", e.what());
    return false;
  }
}

} // namespace r3lr0::reserve
