#pragma once

#include <cstddef>
#include <cstdint>

#include <unistd.h>

namespace r3lr0::util {

inline size_t page_size() {
  static const size_t size = [] {
    long value = sysconf(_SC_PAGESIZE);
    return value > 0 ? static_cast<size_t>(value) : static_cast<size_t>(4096);
  }();
  return size;
}

inline uint64_t page_start(uint64_t value, size_t page = page_size()) { return value & ~static_cast<uint64_t>(page - 1); }

inline uint64_t page_end(uint64_t value, size_t page = page_size()) {
  return page_start(value + page - 1, page);
}

inline uint64_t page_offset(uint64_t value, size_t page = page_size()) { return value & (page - 1); }

inline bool is_page_aligned(uint64_t value, size_t page = page_size()) { return page_offset(value, page) == 0; }

// checked a + b for 64-bit extents
inline bool compute_end(uint64_t start, uint64_t size, uint64_t* end) {
  if (size > UINT64_MAX - start) {
    return false;
  }
  *end = start + size;
  return true;
}

} // namespace r3lr0::util
