#pragma once

#include <cstdint>
#include <vector>

#include "r3lr0/elf/elf_defs.hpp"
#include "r3lr0/result.hpp"

namespace r3lr0::elf {

/**
 * Program header view of a shared object, read without mapping it.
 *
 * All addresses are link-time virtual addresses. load_size covers every
 * PT_LOAD and PT_GNU_RELRO segment rounded to pages; the relro range is the
 * page range the dynamic linker makes read-only after relocation (start
 * rounded down, end rounded down, as glibc does).
 */
struct elf_layout {
  uint64_t file_offset = 0;
  uint8_t elf_class = 0;
  uint16_t machine = 0;
  std::vector<ElfW(Phdr)> phdrs;
  uint64_t min_vaddr = 0;
  uint64_t load_size = 0;
  uint64_t relro_vaddr = 0;
  uint64_t relro_size = 0;
  bool has_tls = false;
  bool has_dynamic = false;

  bool has_relro() const { return relro_size != 0; }

  // relro start relative to the first loaded page
  uint64_t relro_offset() const { return relro_vaddr - min_vaddr; }

  // reads the ELF at `offset` in `fd`; class and machine must match this process
  static result<elf_layout> read(int fd, uint64_t offset);
};

} // namespace r3lr0::elf
