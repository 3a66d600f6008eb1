#include "r3lr0/elf/mapped_image.hpp"

#include <cstring>
#include <type_traits>

#include <dlfcn.h>
#include <sys/mman.h>
#include <unistd.h>

#include "r3lbase/file_utils.hpp"
#include "r3lbase/page_utils.hpp"
#include "r3lr0/elf/relocations.hpp"

namespace r3lr0::elf {
namespace {

uint32_t gnu_hash(std::string_view name) {
  uint32_t h = 5381;
  for (char c : name) {
    h = (h << 5) + h + static_cast<uint8_t>(c);
  }
  return h;
}

uint32_t sysv_hash(std::string_view name) {
  uint32_t h = 0;
  for (char c : name) {
    h = (h << 4) + static_cast<uint8_t>(c);
    const uint32_t g = h & 0xf0000000;
    if (g) {
      h ^= g >> 24;
    }
    h &= ~g;
  }
  return h;
}

int segment_protection(const ElfW(Phdr)& phdr) {
  int prot = 0;
  if (phdr.p_flags & PF_R) {
    prot |= PROT_READ;
  }
  if (phdr.p_flags & PF_W) {
    prot |= PROT_WRITE;
  }
  if (phdr.p_flags & PF_X) {
    prot |= PROT_EXEC;
  }
  return prot;
}

status link_error(std::string message) { return make_status(error_code::load_failed, std::move(message)); }

} // namespace

mapped_image::mapped_image(const elf_layout& layout, uintptr_t base, std::string name)
    : layout_(layout), base_(base), bias_(base - static_cast<uintptr_t>(layout.min_vaddr)), name_(std::move(name)),
      log_(redlog::get_logger("r3lr0.elf")) {}

mapped_image::~mapped_image() {
  if (retained_) {
    return;
  }

  for (void* handle : dependencies_) {
    dlclose(handle);
  }

  if (!mapped_) {
    return;
  }

  // hand the pages back to the reservation
  void* restored = mmap(reinterpret_cast<void*>(base_), load_size(), PROT_NONE,
                        MAP_PRIVATE | MAP_ANONYMOUS | MAP_NORESERVE | MAP_FIXED, -1, 0);
  if (restored == MAP_FAILED) {
    log_.err("failed to restore reservation pages", redlog::field("name", name_),
             redlog::field("error", util::errno_text()));
  }
}

result<std::unique_ptr<mapped_image>> mapped_image::map(
    int fd, const elf_layout& layout, uintptr_t base, std::string name
) {
  using image_result = result<std::unique_ptr<mapped_image>>;

  if (!util::is_page_aligned(base) || !util::is_page_aligned(layout.file_offset)) {
    return error_result<std::unique_ptr<mapped_image>>(error_code::invalid_argument,
                                                       "image base and file offset must be page aligned");
  }
  if (layout.has_tls) {
    return error_result<std::unique_ptr<mapped_image>>(error_code::load_failed,
                                                       "images with thread-local storage are not supported");
  }

  std::unique_ptr<mapped_image> image(new mapped_image(layout, base, std::move(name)));
  if (auto s = image->map_segments(fd); !s.ok()) {
    return error_result<std::unique_ptr<mapped_image>>(std::move(s));
  }
  return image_result{std::move(image), ok_status()};
}

status mapped_image::map_segments(int fd) {
  mapped_ = true;

  for (const auto& phdr : layout_.phdrs) {
    if (phdr.p_type != PT_LOAD) {
      continue;
    }
    if (util::page_offset(phdr.p_vaddr) != util::page_offset(phdr.p_offset)) {
      return link_error("segment offset is not congruent with its address");
    }
    if (phdr.p_filesz > phdr.p_memsz) {
      return link_error("segment file size exceeds memory size");
    }

    const uintptr_t seg_start = bias_ + phdr.p_vaddr;
    const uintptr_t seg_end = seg_start + phdr.p_memsz;
    const uintptr_t seg_page_start = util::page_start(seg_start);
    const uintptr_t seg_page_end = util::page_end(seg_end);
    const uintptr_t seg_file_end = seg_start + phdr.p_filesz;
    const uint64_t file_page = util::page_start(phdr.p_offset);
    const size_t file_length = seg_file_end - seg_page_start;
    const int prot = segment_protection(phdr);

    if (file_length != 0) {
      void* mapped = mmap(reinterpret_cast<void*>(seg_page_start), file_length, prot, MAP_FIXED | MAP_PRIVATE, fd,
                          static_cast<off_t>(layout_.file_offset + file_page));
      if (mapped == MAP_FAILED) {
        return link_error("failed to map segment: " + util::errno_text());
      }
    }

    // zero the tail of the last file page, then map anonymous pages for the rest of bss
    if (file_length != 0 && (prot & PROT_WRITE) && util::page_offset(seg_file_end) != 0) {
      std::memset(reinterpret_cast<void*>(seg_file_end), 0,
                  util::page_size() - static_cast<size_t>(util::page_offset(seg_file_end)));
    }

    const uintptr_t seg_file_page_end = phdr.p_filesz != 0 ? util::page_end(seg_file_end) : seg_page_start;
    if (seg_page_end > seg_file_page_end) {
      void* zeroed = mmap(reinterpret_cast<void*>(seg_file_page_end), seg_page_end - seg_file_page_end, prot,
                          MAP_FIXED | MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
      if (zeroed == MAP_FAILED) {
        return link_error("failed to map bss: " + util::errno_text());
      }
    }

    log_.trc("mapped segment", redlog::field("name", name_),
             redlog::field("start", "0x%llx", static_cast<unsigned long long>(seg_page_start)),
             redlog::field("end", "0x%llx", static_cast<unsigned long long>(seg_page_end)),
             redlog::field("prot", prot));
  }

  log_.dbg("mapped image", redlog::field("name", name_),
           redlog::field("base", "0x%llx", static_cast<unsigned long long>(base_)),
           redlog::field("size", "0x%llx", static_cast<unsigned long long>(layout_.load_size)));
  return ok_status();
}

status mapped_image::read_dynamic() {
  const ElfW(Phdr)* dynamic_phdr = nullptr;
  for (const auto& phdr : layout_.phdrs) {
    if (phdr.p_type == PT_DYNAMIC) {
      dynamic_phdr = &phdr;
      break;
    }
  }
  if (!dynamic_phdr) {
    return link_error("image has no dynamic segment");
  }

  dynamic_info info{};
  info.dynamic = at<const ElfW(Dyn)>(dynamic_phdr->p_vaddr);
  size_t pltrel_size = 0;
  size_t rela_size = 0;
  size_t rel_size = 0;
  size_t relr_size = 0;
  size_t init_array_size = 0;

  for (const ElfW(Dyn)* d = info.dynamic; d->d_tag != DT_NULL; ++d) {
    switch (d->d_tag) {
    case DT_NEEDED:
      info.needed.push_back(d->d_un.d_val);
      break;
    case DT_STRTAB:
      info.strtab = at<const char>(d->d_un.d_ptr);
      break;
    case DT_STRSZ:
      info.strsz = d->d_un.d_val;
      break;
    case DT_SYMTAB:
      info.symtab = at<const ElfW(Sym)>(d->d_un.d_ptr);
      break;
    case DT_HASH:
      info.sysv_hash = at<const uint32_t>(d->d_un.d_ptr);
      break;
    case DT_GNU_HASH:
      info.gnu_hash = at<const uint32_t>(d->d_un.d_ptr);
      break;
    case DT_RELA:
      info.rela = at<const ElfW(Rela)>(d->d_un.d_ptr);
      break;
    case DT_RELASZ:
      rela_size = d->d_un.d_val;
      break;
    case DT_RELAENT:
      if (d->d_un.d_val != sizeof(ElfW(Rela))) {
        return link_error("unexpected DT_RELAENT");
      }
      break;
    case DT_REL:
      info.rel = at<const ElfW(Rel)>(d->d_un.d_ptr);
      break;
    case DT_RELSZ:
      rel_size = d->d_un.d_val;
      break;
    case DT_RELENT:
      if (d->d_un.d_val != sizeof(ElfW(Rel))) {
        return link_error("unexpected DT_RELENT");
      }
      break;
    case DT_RELR:
      info.relr = at<const ElfW(Addr)>(d->d_un.d_ptr);
      break;
    case DT_RELRSZ:
      relr_size = d->d_un.d_val;
      break;
    case DT_RELRENT:
      if (d->d_un.d_val != sizeof(ElfW(Addr))) {
        return link_error("unexpected DT_RELRENT");
      }
      break;
    case DT_JMPREL:
      info.jmprel = at<const void>(d->d_un.d_ptr);
      break;
    case DT_PLTRELSZ:
      pltrel_size = d->d_un.d_val;
      break;
    case DT_PLTREL:
      info.pltrel = static_cast<ElfW(Sxword)>(d->d_un.d_val);
      break;
    case DT_INIT:
      info.init = d->d_un.d_ptr;
      break;
    case DT_INIT_ARRAY:
      info.init_array = at<const ElfW(Addr)>(d->d_un.d_ptr);
      break;
    case DT_INIT_ARRAYSZ:
      init_array_size = d->d_un.d_val;
      break;
    case DT_TEXTREL:
      return link_error("text relocations are not supported");
    case DT_FLAGS:
      if (d->d_un.d_val & DF_TEXTREL) {
        return link_error("text relocations are not supported");
      }
      break;
    case DT_ANDROID_REL:
    case DT_ANDROID_RELA:
    case DT_ANDROID_RELR:
      return link_error("packed android relocations are not supported");
    default:
      break;
    }
  }

  if (!info.strtab || !info.symtab) {
    return link_error("dynamic segment lacks a symbol or string table");
  }
  if (!info.gnu_hash && !info.sysv_hash) {
    return link_error("dynamic segment lacks a symbol hash table");
  }

  info.rela_count = rela_size / sizeof(ElfW(Rela));
  info.rel_count = rel_size / sizeof(ElfW(Rel));
  info.relr_count = relr_size / sizeof(ElfW(Addr));
  info.jmprel_size = pltrel_size;
  info.init_array_count = init_array_size / sizeof(ElfW(Addr));
  dyn_ = std::move(info);
  return ok_status();
}

status mapped_image::load_dependencies(const link_options& options) {
  for (size_t offset : dyn_.needed) {
    if (dyn_.strsz != 0 && offset >= dyn_.strsz) {
      return link_error("DT_NEEDED outside the string table");
    }
    const std::string needed = dyn_.strtab + offset;

    void* handle = nullptr;
    if (needed.find('/') == std::string::npos) {
      for (const auto& dir : options.search_dirs) {
        const std::string candidate = dir + "/" + needed;
        if (!util::path_exists(candidate)) {
          continue;
        }
        handle = dlopen(candidate.c_str(), RTLD_NOW);
        if (handle) {
          log_.vrb("loaded dependency from search dir", redlog::field("needed", needed),
                   redlog::field("path", candidate));
          break;
        }
      }
    }
    if (!handle) {
      handle = dlopen(needed.c_str(), RTLD_NOW);
    }
    if (!handle) {
      const char* reason = dlerror();
      return link_error("failed to load dependency " + needed + ": " + (reason ? reason : "unknown"));
    }
    dependencies_.push_back(handle);
  }
  return ok_status();
}

status mapped_image::resolve_symbol(uint32_t index, uintptr_t* value) {
  if (index == STN_UNDEF) {
    *value = 0;
    return ok_status();
  }
  if (auto it = symbol_cache_.find(index); it != symbol_cache_.end()) {
    *value = it->second;
    return ok_status();
  }

  const ElfW(Sym)& sym = dyn_.symtab[index];
  const char* name = dyn_.strtab + sym.st_name;
  uintptr_t address = 0;

  if (sym.st_shndx != SHN_UNDEF) {
    // bound to our own definition
    address = bias_ + sym.st_value;
    if (elf_st_type(sym.st_info) == STT_GNU_IFUNC) {
      address = call_ifunc_resolver(address);
    }
  } else {
    for (void* handle : dependencies_) {
      if (void* found = dlsym(handle, name)) {
        address = reinterpret_cast<uintptr_t>(found);
        break;
      }
    }
    if (!address) {
      if (void* found = dlsym(RTLD_DEFAULT, name)) {
        address = reinterpret_cast<uintptr_t>(found);
      }
    }
    if (!address) {
      if (elf_st_bind(sym.st_info) != STB_WEAK) {
        return link_error(std::string("undefined symbol: ") + name);
      }
      log_.ped("weak symbol left unresolved", redlog::field("symbol", name));
    }
  }

  symbol_cache_.emplace(index, address);
  *value = address;
  return ok_status();
}

template <typename Reloc> status mapped_image::apply_relocations(const Reloc* table, size_t count) {
  constexpr bool kHasAddend = std::is_same_v<Reloc, ElfW(Rela)>;

  for (size_t i = 0; i < count; ++i) {
    const Reloc& reloc = table[i];
    const uint32_t type = elf_r_type(reloc.r_info);
    const reloc_kind kind = classify_relocation(type);
    auto* target = at<ElfW(Addr)>(reloc.r_offset);

    ElfW(Addr) addend = 0;
    if constexpr (kHasAddend) {
      addend = static_cast<ElfW(Addr)>(reloc.r_addend);
    } else {
      addend = *target;
    }

    switch (kind) {
    case reloc_kind::none:
      break;
    case reloc_kind::relative:
      *target = bias_ + addend;
      break;
    case reloc_kind::irelative:
      deferred_irelative_.emplace_back(target, bias_ + addend);
      break;
    case reloc_kind::absolute:
    case reloc_kind::glob_dat:
    case reloc_kind::jump_slot: {
      uintptr_t symbol = 0;
      if (auto s = resolve_symbol(elf_r_sym(reloc.r_info), &symbol); !s.ok()) {
        return s;
      }
      if (kind == reloc_kind::absolute || kHasAddend) {
        *target = symbol + addend;
      } else {
        *target = symbol;
      }
      break;
    }
    case reloc_kind::unsupported:
      return link_error("unsupported relocation type " + std::to_string(type));
    }
  }
  return ok_status();
}

status mapped_image::apply_relr(const ElfW(Addr)* table, size_t count) {
  constexpr size_t kBitsPerEntry = sizeof(ElfW(Addr)) * 8 - 1;

  ElfW(Addr) next = 0;
  for (size_t i = 0; i < count; ++i) {
    const ElfW(Addr) entry = table[i];
    if ((entry & 1) == 0) {
      auto* target = at<ElfW(Addr)>(entry);
      *target += bias_;
      next = entry + sizeof(ElfW(Addr));
      continue;
    }

    ElfW(Addr) bitmap = entry >> 1;
    for (size_t bit = 0; bitmap != 0; ++bit, bitmap >>= 1) {
      if (bitmap & 1) {
        *at<ElfW(Addr)>(next + bit * sizeof(ElfW(Addr))) += bias_;
      }
    }
    next += kBitsPerEntry * sizeof(ElfW(Addr));
  }
  return ok_status();
}

status mapped_image::protect_relro() {
  if (!layout_.has_relro()) {
    return ok_status();
  }
  if (mprotect(reinterpret_cast<void*>(relro_start()), relro_size(), PROT_READ) != 0) {
    return link_error("failed to protect relro: " + util::errno_text());
  }
  return ok_status();
}

status mapped_image::link(const link_options& options) {
  if (linked_) {
    return ok_status();
  }

  if (auto s = read_dynamic(); !s.ok()) {
    return s;
  }
  if (auto s = load_dependencies(options); !s.ok()) {
    return s;
  }

  if (dyn_.relr_count) {
    if (auto s = apply_relr(dyn_.relr, dyn_.relr_count); !s.ok()) {
      return s;
    }
  }
  if (dyn_.rel_count) {
    if (auto s = apply_relocations(dyn_.rel, dyn_.rel_count); !s.ok()) {
      return s;
    }
  }
  if (dyn_.rela_count) {
    if (auto s = apply_relocations(dyn_.rela, dyn_.rela_count); !s.ok()) {
      return s;
    }
  }
  if (dyn_.jmprel && dyn_.jmprel_size) {
    status s;
    if (dyn_.pltrel == DT_RELA) {
      s = apply_relocations(static_cast<const ElfW(Rela)*>(dyn_.jmprel), dyn_.jmprel_size / sizeof(ElfW(Rela)));
    } else {
      s = apply_relocations(static_cast<const ElfW(Rel)*>(dyn_.jmprel), dyn_.jmprel_size / sizeof(ElfW(Rel)));
    }
    if (!s.ok()) {
      return s;
    }
  }

  // ifunc resolvers may call through the got, so they run last
  for (const auto& [target, resolver] : deferred_irelative_) {
    *target = call_ifunc_resolver(resolver);
  }
  deferred_irelative_.clear();

  if (auto s = protect_relro(); !s.ok()) {
    return s;
  }

  linked_ = true;
  log_.dbg("linked image", redlog::field("name", name_), redlog::field("dependencies", dependencies_.size()),
           redlog::field("symbols_bound", symbol_cache_.size()));
  return ok_status();
}

void mapped_image::run_initializers() {
  if (!linked_ || initialized_) {
    return;
  }
  initialized_ = true;

  if (dyn_.init) {
    using init_fn = void (*)();
    reinterpret_cast<init_fn>(bias_ + dyn_.init)();
  }

  using init_array_fn = void (*)(int, char**, char**);
  for (size_t i = 0; i < dyn_.init_array_count; ++i) {
    const ElfW(Addr) entry = dyn_.init_array[i];
    if (entry == 0 || entry == static_cast<ElfW(Addr)>(-1)) {
      continue;
    }
    reinterpret_cast<init_array_fn>(entry)(0, nullptr, environ);
  }
  log_.vrb("ran initializers", redlog::field("name", name_), redlog::field("init_array", dyn_.init_array_count));
}

const ElfW(Sym)* mapped_image::lookup_gnu(std::string_view name) const {
  const uint32_t* table = dyn_.gnu_hash;
  const uint32_t nbucket = table[0];
  const uint32_t symoffset = table[1];
  const uint32_t bloom_size = table[2];
  const uint32_t bloom_shift = table[3];
  if (nbucket == 0 || bloom_size == 0) {
    return nullptr;
  }

  const auto* bloom = reinterpret_cast<const ElfW(Addr)*>(table + 4);
  const auto* buckets = reinterpret_cast<const uint32_t*>(bloom + bloom_size);
  const uint32_t* chain = buckets + nbucket;

  constexpr uint32_t kBloomBits = sizeof(ElfW(Addr)) * 8;
  const uint32_t hash = gnu_hash(name);
  const ElfW(Addr) word = bloom[(hash / kBloomBits) % bloom_size];
  const ElfW(Addr) mask = (static_cast<ElfW(Addr)>(1) << (hash % kBloomBits)) |
                          (static_cast<ElfW(Addr)>(1) << ((hash >> bloom_shift) % kBloomBits));
  if ((word & mask) != mask) {
    return nullptr;
  }

  uint32_t index = buckets[hash % nbucket];
  if (index < symoffset) {
    return nullptr;
  }
  for (;; ++index) {
    const uint32_t chain_hash = chain[index - symoffset];
    if (((chain_hash ^ hash) >> 1) == 0) {
      const ElfW(Sym)& sym = dyn_.symtab[index];
      if (sym.st_shndx != SHN_UNDEF && elf_st_bind(sym.st_info) != STB_LOCAL && name == dyn_.strtab + sym.st_name) {
        return &sym;
      }
    }
    if (chain_hash & 1) {
      break;
    }
  }
  return nullptr;
}

const ElfW(Sym)* mapped_image::lookup_sysv(std::string_view name) const {
  const uint32_t* table = dyn_.sysv_hash;
  const uint32_t nbucket = table[0];
  const uint32_t nchain = table[1];
  if (nbucket == 0) {
    return nullptr;
  }
  const uint32_t* buckets = table + 2;
  const uint32_t* chain = buckets + nbucket;

  for (uint32_t index = buckets[sysv_hash(name) % nbucket]; index != STN_UNDEF && index < nchain;
       index = chain[index]) {
    const ElfW(Sym)& sym = dyn_.symtab[index];
    if (sym.st_shndx != SHN_UNDEF && elf_st_bind(sym.st_info) != STB_LOCAL && name == dyn_.strtab + sym.st_name) {
      return &sym;
    }
  }
  return nullptr;
}

void* mapped_image::find_symbol(std::string_view name) const {
  if (!linked_ || name.empty()) {
    return nullptr;
  }

  const ElfW(Sym)* sym = dyn_.gnu_hash ? lookup_gnu(name) : lookup_sysv(name);
  if (!sym) {
    return nullptr;
  }

  uintptr_t address = bias_ + sym->st_value;
  if (elf_st_type(sym->st_info) == STT_GNU_IFUNC) {
    address = call_ifunc_resolver(address);
  }
  return reinterpret_cast<void*>(address);
}

} // namespace r3lr0::elf
