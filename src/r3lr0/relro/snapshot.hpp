#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "r3lr0/result.hpp"
#include "r3lr0/status.hpp"

namespace r3lr0::relro {

inline constexpr char kSnapshotMagic[8] = {'R', '3', 'L', 'R', 'E', 'L', 'R', 'O'};
inline constexpr uint32_t kSnapshotFormatVersion = 1;

// on-disk header; the relro payload starts at payload_offset, page aligned
struct snapshot_header {
  char magic[8];
  uint32_t format_version;
  uint32_t header_size;
  uint32_t elf_class;
  uint32_t elf_machine;
  uint32_t page_size;
  uint32_t reserved;
  uint64_t load_address;
  uint64_t load_size;
  uint64_t relro_offset;
  uint64_t relro_size;
  uint64_t payload_offset;
  uint64_t image_size;
  uint32_t image_crc32;
  uint32_t header_crc32;
};

static_assert(sizeof(snapshot_header) == 88, "snapshot header layout changed");

// identity of the on-disk ELF bytes a snapshot was produced from
struct image_identity {
  uint64_t size = 0;
  uint32_t crc32 = 0;
};

result<image_identity> compute_image_identity(int fd, uint64_t offset, uint64_t size);

// fields a reader derives from its own image, without the checksums
struct image_placement {
  uint32_t elf_class = 0;
  uint32_t elf_machine = 0;
  uint64_t load_address = 0;
  uint64_t load_size = 0;
  uint64_t relro_offset = 0;
  uint64_t relro_size = 0;
  image_identity identity{};
};

snapshot_header make_header(const image_placement& placement);

uint32_t header_checksum(const snapshot_header& header);

enum class header_check {
  ok,
  truncated,
  bad_magic,
  bad_version,
  corrupt,
  wrong_architecture,
  wrong_page_size,
  wrong_address,
  wrong_layout,
  wrong_image
};

const char* to_string(header_check check);

// reads the header from the start of fd; truncated files are a read error
result<snapshot_header> read_header(int fd);

// checks a header read from a file of `file_size` bytes against the reader's placement
header_check validate_header(const snapshot_header& header, const image_placement& expected, uint64_t file_size);

// where write_snapshot stages the file before renaming it over `path`
std::string staging_path(const std::string& path);

// writes header + relro pages to staging_path(path) and renames it into place
status write_snapshot(const std::string& path, const snapshot_header& header, const void* relro);

struct share_outcome {
  size_t pages_total = 0;
  size_t pages_shared = 0;
  bool remap_failed = false;

  sharing_status as_sharing_status() const;
};

/**
 * Replaces identical relro pages with read-only mappings of the snapshot.
 *
 * Every page of [relro, relro + size) is compared with the payload; runs of
 * identical pages are remapped MAP_FIXED from the file so processes loading
 * the same image share the physical pages. Differing pages keep their
 * private copy.
 */
share_outcome share_pages(int fd, const snapshot_header& header, uintptr_t relro, size_t size);

} // namespace r3lr0::relro
