#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <redlog.hpp>

#include "r3lr0/elf/elf_defs.hpp"
#include "r3lr0/elf/elf_layout.hpp"
#include "r3lr0/result.hpp"

namespace r3lr0::elf {

struct link_options {
  // directories searched for DT_NEEDED entries before the default dlopen lookup
  std::vector<std::string> search_dirs;
};

/**
 * A shared object mapped at a caller-chosen address and linked by hand.
 *
 * The caller provides the region (normally the process reservation) so the
 * image lands at the same address in every process that maps it there. The
 * image is not registered with the system dynamic linker: dladdr, unwinding
 * across it and thread-local storage are unavailable to its code.
 *
 * Lifecycle: map() -> link() -> [relro sharing] -> run_initializers().
 * Until retain() is called, destruction turns the region back into
 * inaccessible reserved pages and closes the dependencies it opened.
 */
class mapped_image {
public:
  ~mapped_image();

  mapped_image(const mapped_image&) = delete;
  mapped_image& operator=(const mapped_image&) = delete;

  // maps every PT_LOAD of the ELF described by `layout` at `base`
  static result<std::unique_ptr<mapped_image>> map(int fd, const elf_layout& layout, uintptr_t base, std::string name);

  // dependencies, symbol binding, relocations, relro protection
  status link(const link_options& options);

  // DT_INIT then DT_INIT_ARRAY, once
  void run_initializers();

  // exported, defined symbol of this image
  void* find_symbol(std::string_view name) const;

  void retain() { retained_ = true; }

  const std::string& name() const { return name_; }
  const elf_layout& layout() const { return layout_; }
  uintptr_t load_address() const { return base_; }
  size_t load_size() const { return static_cast<size_t>(layout_.load_size); }
  uintptr_t relro_start() const { return bias_ + static_cast<uintptr_t>(layout_.relro_vaddr); }
  size_t relro_size() const { return static_cast<size_t>(layout_.relro_size); }

private:
  mapped_image(const elf_layout& layout, uintptr_t base, std::string name);

  status map_segments(int fd);
  status read_dynamic();
  status load_dependencies(const link_options& options);
  status resolve_symbol(uint32_t index, uintptr_t* value);
  template <typename Reloc> status apply_relocations(const Reloc* table, size_t count);
  status apply_relr(const ElfW(Addr)* table, size_t count);
  status protect_relro();

  const ElfW(Sym)* lookup_gnu(std::string_view name) const;
  const ElfW(Sym)* lookup_sysv(std::string_view name) const;

  template <typename T> T* at(ElfW(Addr) vaddr) const { return reinterpret_cast<T*>(bias_ + vaddr); }

  struct dynamic_info {
    const ElfW(Dyn)* dynamic = nullptr;
    const char* strtab = nullptr;
    size_t strsz = 0;
    const ElfW(Sym)* symtab = nullptr;
    const uint32_t* sysv_hash = nullptr;
    const uint32_t* gnu_hash = nullptr;
    const ElfW(Rela)* rela = nullptr;
    size_t rela_count = 0;
    const ElfW(Rel)* rel = nullptr;
    size_t rel_count = 0;
    const ElfW(Addr)* relr = nullptr;
    size_t relr_count = 0;
    const void* jmprel = nullptr;
    size_t jmprel_size = 0;
    ElfW(Sxword) pltrel = 0;
    ElfW(Addr) init = 0;
    const ElfW(Addr)* init_array = nullptr;
    size_t init_array_count = 0;
    std::vector<size_t> needed;
  };

  elf_layout layout_;
  uintptr_t base_ = 0;
  uintptr_t bias_ = 0;
  std::string name_;
  bool mapped_ = false;
  bool linked_ = false;
  bool initialized_ = false;
  bool retained_ = false;
  dynamic_info dyn_{};
  std::vector<void*> dependencies_;
  std::unordered_map<uint32_t, uintptr_t> symbol_cache_;
  std::vector<std::pair<ElfW(Addr)*, uintptr_t>> deferred_irelative_;
  redlog::logger log_;
};

} // namespace r3lr0::elf
