#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "r3lbase/file_utils.hpp"
#include "r3lr0/result.hpp"

namespace r3lr0::archive {

inline constexpr uint16_t kMethodStored = 0;
inline constexpr uint16_t kMethodDeflated = 8;

struct zip_entry {
  std::string name;
  uint16_t method = 0;
  uint16_t flags = 0;
  uint32_t crc32 = 0;
  uint64_t compressed_size = 0;
  uint64_t uncompressed_size = 0;
  uint64_t local_header_offset = 0;

  // stored, unencrypted entries can be mapped straight out of the archive
  bool mappable() const { return method == kMethodStored && (flags & 0x1) == 0; }
};

/**
 * Read-only view of a zip archive's central directory.
 *
 * Only what the loader needs is supported: entry lookup and the absolute file
 * offset of an entry's data. Zip64 archives are rejected.
 */
class zip_archive {
public:
  zip_archive() = default;
  zip_archive(zip_archive&&) = default;
  zip_archive& operator=(zip_archive&&) = default;

  static result<zip_archive> open(const std::string& path);

  const std::string& path() const { return path_; }
  int fd() const { return fd_.get(); }
  uint64_t size() const { return size_; }
  const std::vector<zip_entry>& entries() const { return entries_; }

  const zip_entry* find(std::string_view name) const;

  // absolute offset of the entry's bytes, after its local header
  std::optional<uint64_t> data_offset(const zip_entry& entry) const;

private:
  bool read_central_directory();

  std::string path_;
  util::unique_fd fd_;
  uint64_t size_ = 0;
  std::vector<zip_entry> entries_;
};

} // namespace r3lr0::archive
