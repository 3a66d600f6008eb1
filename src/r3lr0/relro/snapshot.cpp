#include "r3lr0/relro/snapshot.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <redlog.hpp>
#include <zlib.h>

#include "r3lbase/file_utils.hpp"
#include "r3lbase/page_utils.hpp"

namespace r3lr0::relro {
namespace {

constexpr size_t kIdentityChunk = 64 * 1024;

redlog::logger& relro_log() {
  static redlog::logger log = redlog::get_logger("r3lr0.relro");
  return log;
}

uint32_t crc32_of(uint32_t seed, const void* data, size_t size) {
  uLong crc = seed;
  const auto* bytes = static_cast<const Bytef*>(data);
  while (size > 0) {
    const uInt chunk = static_cast<uInt>(std::min<size_t>(size, 1u << 30));
    crc = ::crc32(crc, bytes, chunk);
    bytes += chunk;
    size -= chunk;
  }
  return static_cast<uint32_t>(crc);
}

} // namespace

result<image_identity> compute_image_identity(int fd, uint64_t offset, uint64_t size) {
  std::vector<uint8_t> buffer(kIdentityChunk);
  uint32_t crc = static_cast<uint32_t>(::crc32(0L, Z_NULL, 0));

  uint64_t done = 0;
  while (done < size) {
    const size_t chunk = static_cast<size_t>(std::min<uint64_t>(buffer.size(), size - done));
    if (!util::read_fully_at(fd, buffer.data(), chunk, offset + done)) {
      return error_result<image_identity>(error_code::io_error, "failed to read image bytes");
    }
    crc = crc32_of(crc, buffer.data(), chunk);
    done += chunk;
  }

  image_identity identity;
  identity.size = size;
  identity.crc32 = crc;
  return ok_result(identity);
}

snapshot_header make_header(const image_placement& placement) {
  snapshot_header header{};
  std::memcpy(header.magic, kSnapshotMagic, sizeof(header.magic));
  header.format_version = kSnapshotFormatVersion;
  header.header_size = sizeof(snapshot_header);
  header.elf_class = placement.elf_class;
  header.elf_machine = placement.elf_machine;
  header.page_size = static_cast<uint32_t>(util::page_size());
  header.load_address = placement.load_address;
  header.load_size = placement.load_size;
  header.relro_offset = placement.relro_offset;
  header.relro_size = placement.relro_size;
  header.payload_offset = util::page_end(sizeof(snapshot_header));
  header.image_size = placement.identity.size;
  header.image_crc32 = placement.identity.crc32;
  header.header_crc32 = header_checksum(header);
  return header;
}

uint32_t header_checksum(const snapshot_header& header) {
  snapshot_header copy = header;
  copy.header_crc32 = 0;
  return crc32_of(static_cast<uint32_t>(::crc32(0L, Z_NULL, 0)), &copy, sizeof(copy));
}

const char* to_string(header_check check) {
  switch (check) {
  case header_check::ok:
    return "ok";
  case header_check::truncated:
    return "truncated";
  case header_check::bad_magic:
    return "bad_magic";
  case header_check::bad_version:
    return "bad_version";
  case header_check::corrupt:
    return "corrupt";
  case header_check::wrong_architecture:
    return "wrong_architecture";
  case header_check::wrong_page_size:
    return "wrong_page_size";
  case header_check::wrong_address:
    return "wrong_address";
  case header_check::wrong_layout:
    return "wrong_layout";
  case header_check::wrong_image:
    return "wrong_image";
  }
  return "unknown";
}

result<snapshot_header> read_header(int fd) {
  snapshot_header header{};
  if (!util::read_fully_at(fd, &header, sizeof(header), 0)) {
    return error_result<snapshot_header>(error_code::io_error, "snapshot header truncated or unreadable");
  }
  return ok_result(header);
}

header_check validate_header(const snapshot_header& header, const image_placement& expected, uint64_t file_size) {
  if (std::memcmp(header.magic, kSnapshotMagic, sizeof(header.magic)) != 0) {
    return header_check::bad_magic;
  }
  if (header.format_version != kSnapshotFormatVersion || header.header_size != sizeof(snapshot_header)) {
    return header_check::bad_version;
  }
  if (header.header_crc32 != header_checksum(header)) {
    return header_check::corrupt;
  }

  uint64_t payload_end = 0;
  if (!util::compute_end(header.payload_offset, header.relro_size, &payload_end) || payload_end > file_size) {
    return header_check::truncated;
  }

  if (header.elf_class != expected.elf_class || header.elf_machine != expected.elf_machine) {
    return header_check::wrong_architecture;
  }
  if (header.page_size != util::page_size() || !util::is_page_aligned(header.payload_offset)) {
    return header_check::wrong_page_size;
  }
  if (header.load_address != expected.load_address) {
    return header_check::wrong_address;
  }
  if (header.load_size != expected.load_size || header.relro_offset != expected.relro_offset ||
      header.relro_size != expected.relro_size) {
    return header_check::wrong_layout;
  }
  if (header.image_size != expected.identity.size || header.image_crc32 != expected.identity.crc32) {
    return header_check::wrong_image;
  }
  return header_check::ok;
}

std::string staging_path(const std::string& path) { return path + ".tmp"; }

status write_snapshot(const std::string& path, const snapshot_header& header, const void* relro) {
  auto& log = relro_log();
  const std::string tmp_path = staging_path(path);

  util::unique_fd fd(::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
  if (!fd) {
    return make_status(error_code::io_error, "failed to create " + tmp_path + ": " + util::errno_text());
  }

  std::vector<uint8_t> page(static_cast<size_t>(header.payload_offset), 0);
  std::memcpy(page.data(), &header, sizeof(header));

  bool written = util::write_fully(fd.get(), page.data(), page.size()) &&
                 util::write_fully(fd.get(), relro, static_cast<size_t>(header.relro_size));
  if (written) {
    // readers run under other identities
    written = ::fchmod(fd.get(), 0644) == 0 && ::fsync(fd.get()) == 0;
  }
  if (!written) {
    const std::string reason = util::errno_text();
    fd.reset();
    ::unlink(tmp_path.c_str());
    return make_status(error_code::io_error, "failed to write " + tmp_path + ": " + reason);
  }
  fd.reset();

  if (::rename(tmp_path.c_str(), path.c_str()) != 0) {
    const std::string reason = util::errno_text();
    ::unlink(tmp_path.c_str());
    return make_status(error_code::io_error, "failed to rename snapshot into place: " + reason);
  }

  log.inf("wrote relro snapshot", redlog::field("path", path),
          redlog::field("load_address", "0x%llx", static_cast<unsigned long long>(header.load_address)),
          redlog::field("relro_size", "0x%llx", static_cast<unsigned long long>(header.relro_size)),
          redlog::field("image_crc32", "0x%08x", header.image_crc32));
  return ok_status();
}

sharing_status share_outcome::as_sharing_status() const {
  if (remap_failed) {
    return sharing_status::remap_failed;
  }
  if (pages_total == 0 || pages_shared == 0) {
    return sharing_status::snapshot_mismatch;
  }
  return pages_shared == pages_total ? sharing_status::shared : sharing_status::partially_shared;
}

share_outcome share_pages(int fd, const snapshot_header& header, uintptr_t relro, size_t size) {
  auto& log = relro_log();
  const size_t page = util::page_size();

  share_outcome outcome;
  outcome.pages_total = size / page;
  if (outcome.pages_total == 0) {
    return outcome;
  }

  void* view = mmap(nullptr, size, PROT_READ, MAP_PRIVATE, fd, static_cast<off_t>(header.payload_offset));
  if (view == MAP_FAILED) {
    log.wrn("failed to map snapshot payload", redlog::field("error", util::errno_text()));
    outcome.remap_failed = true;
    return outcome;
  }

  const auto* snapshot_bytes = static_cast<const uint8_t*>(view);
  const auto* live_bytes = reinterpret_cast<const uint8_t*>(relro);

  // remaps [first, last) pages from the snapshot over the live relro
  auto remap_run = [&](size_t first, size_t last) {
    const size_t offset = first * page;
    const size_t length = (last - first) * page;
    void* target = reinterpret_cast<void*>(relro + offset);
    void* mapped = mmap(target, length, PROT_READ, MAP_FIXED | MAP_PRIVATE, fd,
                        static_cast<off_t>(header.payload_offset + offset));
    if (mapped == MAP_FAILED) {
      log.err("failed to remap relro pages", redlog::field("offset", "0x%zx", offset),
              redlog::field("length", "0x%zx", length), redlog::field("error", util::errno_text()));
      outcome.remap_failed = true;
      return;
    }
    outcome.pages_shared += last - first;
  };

  size_t run_start = 0;
  bool in_run = false;
  for (size_t i = 0; i < outcome.pages_total; ++i) {
    const bool same = std::memcmp(live_bytes + i * page, snapshot_bytes + i * page, page) == 0;
    if (same && !in_run) {
      run_start = i;
      in_run = true;
    } else if (!same && in_run) {
      remap_run(run_start, i);
      in_run = false;
    }
  }
  if (in_run) {
    remap_run(run_start, outcome.pages_total);
  }

  munmap(view, size);

  log.dbg("compared relro pages with snapshot", redlog::field("pages", outcome.pages_total),
          redlog::field("shared", outcome.pages_shared));
  return outcome;
}

} // namespace r3lr0::relro
