#include "inspect_relro.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <redlog.hpp>

#include "r3lbase/file_utils.hpp"
#include "r3lbase/page_utils.hpp"
#include "r3lr0/loader/image_source.hpp"
#include "r3lr0/relro/snapshot.hpp"

namespace r3lr0tool::commands {

namespace {

std::string hex(uint64_t value) {
  std::ostringstream ss;
  ss << "0x" << std::hex << value;
  return ss.str();
}

} // namespace

int inspect_relro(args::ValueFlag<std::string>& file_flag, args::ValueFlag<std::string>& library_flag) {
  auto log = redlog::get_logger("r3lr0tool.inspect_relro");

  if (!file_flag) {
    log.err("--file argument required");
    return 1;
  }

  const std::string path = args::get(file_flag);
  r3lr0::util::unique_fd fd = r3lr0::util::open_read_only(path);
  if (!fd) {
    log.err("cannot open snapshot", redlog::field("path", path), redlog::field("error", r3lr0::util::errno_text()));
    return 1;
  }

  auto header = r3lr0::relro::read_header(fd.get());
  if (!header.ok()) {
    log.err("cannot read snapshot header", redlog::field("path", path), redlog::field("error", header.status.message));
    return 1;
  }
  const auto& h = header.value;
  const uint64_t file_size = r3lr0::util::file_size(fd.get()).value_or(0);
  const bool checksum_ok = r3lr0::relro::header_checksum(h) == h.header_crc32;

  std::cout << "R3LR0 relro snapshot\n";
  std::cout << "  magic:          " << std::string(h.magic, sizeof(h.magic)) << "\n";
  std::cout << "  version:        " << h.format_version << "\n";
  std::cout << "  elf:            class " << h.elf_class << ", machine " << h.elf_machine << "\n";
  std::cout << "  page size:      " << h.page_size << "\n";
  std::cout << "  load address:   " << hex(h.load_address) << " (+" << hex(h.load_size) << ")\n";
  std::cout << "  relro:          +" << hex(h.relro_offset) << " (" << h.relro_size << " bytes, "
            << h.relro_size / std::max<uint64_t>(h.page_size, 1) << " pages)\n";
  std::cout << "  payload offset: " << hex(h.payload_offset) << "\n";
  std::cout << "  image:          " << h.image_size << " bytes, crc32 " << hex(h.image_crc32) << "\n";
  std::cout << "  header crc32:   " << hex(h.header_crc32) << (checksum_ok ? " (ok)" : " (CORRUPT)") << "\n";
  std::cout << "  file size:      " << file_size
            << (file_size >= h.payload_offset + h.relro_size ? "" : " (TRUNCATED)") << "\n";

  int exit_code = checksum_ok && file_size >= h.payload_offset + h.relro_size ? 0 : 1;

  if (library_flag) {
    const std::string library = args::get(library_flag);
    auto source = r3lr0::loader::open_image_source(library);
    if (!source.ok()) {
      log.err("cannot open library", redlog::field("path", library), redlog::field("error", source.status.message));
      return 1;
    }
    auto identity = r3lr0::relro::compute_image_identity(source.value.fd.get(), source.value.offset, source.value.size);
    if (!identity.ok()) {
      log.err("cannot fingerprint library", redlog::field("path", library),
              redlog::field("error", identity.status.message));
      return 1;
    }
    const bool same = identity.value.size == h.image_size && identity.value.crc32 == h.image_crc32;
    std::cout << "  library:        " << library << (same ? " (same image)" : " (different image)") << "\n";
    if (!same) {
      exit_code = 1;
    }
  }

  if (h.page_size != r3lr0::util::page_size()) {
    log.wrn("snapshot written with a different page size", redlog::field("snapshot", h.page_size),
            redlog::field("host", r3lr0::util::page_size()));
  }
  return exit_code;
}

} // namespace r3lr0tool::commands
