#include "r3lr0/elf/elf_layout.hpp"

#include <algorithm>
#include <cstring>
#include <string>

#include <redlog.hpp>

#include "r3lbase/file_utils.hpp"
#include "r3lbase/page_utils.hpp"

namespace r3lr0::elf {
namespace {

constexpr uint16_t kMaxProgramHeaders = 256;

result<elf_layout> layout_error(std::string message) {
  return error_result<elf_layout>(error_code::load_failed, std::move(message));
}

} // namespace

result<elf_layout> elf_layout::read(int fd, uint64_t offset) {
  auto log = redlog::get_logger("r3lr0.elf");

  ElfW(Ehdr) header{};
  if (!util::read_fully_at(fd, &header, sizeof(header), offset)) {
    return layout_error("failed to read elf header");
  }
  if (std::memcmp(header.e_ident, ELFMAG, SELFMAG) != 0) {
    return layout_error("bad elf magic");
  }
  if (header.e_ident[EI_CLASS] != kNativeClass) {
    return layout_error("elf class does not match this process");
  }
  if (header.e_machine != kNativeMachine) {
    return layout_error("elf machine does not match this process");
  }
  if (header.e_type != ET_DYN) {
    return layout_error("not a shared object");
  }
  if (header.e_phentsize != sizeof(ElfW(Phdr)) || header.e_phnum == 0 || header.e_phnum > kMaxProgramHeaders) {
    return layout_error("invalid program header table");
  }

  elf_layout layout;
  layout.file_offset = offset;
  layout.elf_class = header.e_ident[EI_CLASS];
  layout.machine = header.e_machine;
  layout.phdrs.resize(header.e_phnum);
  if (!util::read_fully_at(fd, layout.phdrs.data(), layout.phdrs.size() * sizeof(ElfW(Phdr)),
                           offset + header.e_phoff)) {
    return layout_error("failed to read program headers");
  }

  uint64_t low = UINT64_MAX;
  uint64_t high = 0;
  for (const auto& phdr : layout.phdrs) {
    switch (phdr.p_type) {
    case PT_LOAD:
    case PT_GNU_RELRO: {
      uint64_t end = 0;
      if (!util::compute_end(phdr.p_vaddr, phdr.p_memsz, &end)) {
        return layout_error("segment extent overflows");
      }
      low = std::min<uint64_t>(low, phdr.p_vaddr);
      high = std::max(high, end);
      if (phdr.p_type == PT_GNU_RELRO) {
        const uint64_t relro_start = util::page_start(phdr.p_vaddr);
        const uint64_t relro_end = util::page_start(end);
        layout.relro_vaddr = relro_start;
        layout.relro_size = relro_end > relro_start ? relro_end - relro_start : 0;
      }
      break;
    }
    case PT_TLS:
      layout.has_tls = true;
      break;
    case PT_DYNAMIC:
      layout.has_dynamic = true;
      break;
    default:
      break;
    }
  }

  if (low == UINT64_MAX || high <= low) {
    return layout_error("no loadable segments");
  }

  layout.min_vaddr = util::page_start(low);
  layout.load_size = util::page_end(high) - layout.min_vaddr;

  log.dbg("read elf layout", redlog::field("offset", "0x%llx", static_cast<unsigned long long>(offset)),
          redlog::field("load_size", "0x%llx", static_cast<unsigned long long>(layout.load_size)),
          redlog::field("relro_offset", "0x%llx", static_cast<unsigned long long>(layout.relro_offset())),
          redlog::field("relro_size", "0x%llx", static_cast<unsigned long long>(layout.relro_size)));
  return ok_result(std::move(layout));
}

} // namespace r3lr0::elf
