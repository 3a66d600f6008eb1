#include "r3lr0/elf/relocations.hpp"

#include <sys/auxv.h>

#include "r3lr0/elf/elf_defs.hpp"

#if defined(__x86_64__)
#ifndef R_X86_64_IRELATIVE
#define R_X86_64_IRELATIVE 37
#endif
#elif defined(__i386__)
#ifndef R_386_IRELATIVE
#define R_386_IRELATIVE 42
#endif
#elif defined(__aarch64__)
#ifndef R_AARCH64_IRELATIVE
#define R_AARCH64_IRELATIVE 1032
#endif
#elif defined(__arm__)
#ifndef R_ARM_IRELATIVE
#define R_ARM_IRELATIVE 160
#endif
#elif defined(__riscv)
#ifndef R_RISCV_NONE
#define R_RISCV_NONE 0
#define R_RISCV_64 2
#define R_RISCV_RELATIVE 3
#define R_RISCV_JUMP_SLOT 5
#endif
#ifndef R_RISCV_IRELATIVE
#define R_RISCV_IRELATIVE 58
#endif
#endif

namespace r3lr0::elf {

reloc_kind classify_relocation(uint32_t type) {
  switch (type) {
#if defined(__x86_64__)
  case R_X86_64_NONE:
    return reloc_kind::none;
  case R_X86_64_64:
    return reloc_kind::absolute;
  case R_X86_64_GLOB_DAT:
    return reloc_kind::glob_dat;
  case R_X86_64_JUMP_SLOT:
    return reloc_kind::jump_slot;
  case R_X86_64_RELATIVE:
    return reloc_kind::relative;
  case R_X86_64_IRELATIVE:
    return reloc_kind::irelative;
#elif defined(__i386__)
  case R_386_NONE:
    return reloc_kind::none;
  case R_386_32:
    return reloc_kind::absolute;
  case R_386_GLOB_DAT:
    return reloc_kind::glob_dat;
  case R_386_JMP_SLOT:
    return reloc_kind::jump_slot;
  case R_386_RELATIVE:
    return reloc_kind::relative;
  case R_386_IRELATIVE:
    return reloc_kind::irelative;
#elif defined(__aarch64__)
  case R_AARCH64_NONE:
    return reloc_kind::none;
  case R_AARCH64_ABS64:
    return reloc_kind::absolute;
  case R_AARCH64_GLOB_DAT:
    return reloc_kind::glob_dat;
  case R_AARCH64_JUMP_SLOT:
    return reloc_kind::jump_slot;
  case R_AARCH64_RELATIVE:
    return reloc_kind::relative;
  case R_AARCH64_IRELATIVE:
    return reloc_kind::irelative;
#elif defined(__arm__)
  case R_ARM_NONE:
    return reloc_kind::none;
  case R_ARM_ABS32:
    return reloc_kind::absolute;
  case R_ARM_GLOB_DAT:
    return reloc_kind::glob_dat;
  case R_ARM_JUMP_SLOT:
    return reloc_kind::jump_slot;
  case R_ARM_RELATIVE:
    return reloc_kind::relative;
  case R_ARM_IRELATIVE:
    return reloc_kind::irelative;
#elif defined(__riscv)
  case R_RISCV_NONE:
    return reloc_kind::none;
  case R_RISCV_64:
    return reloc_kind::absolute;
  case R_RISCV_JUMP_SLOT:
    return reloc_kind::jump_slot;
  case R_RISCV_RELATIVE:
    return reloc_kind::relative;
  case R_RISCV_IRELATIVE:
    return reloc_kind::irelative;
#endif
  default:
    return reloc_kind::unsupported;
  }
}

const char* to_string(reloc_kind kind) {
  switch (kind) {
  case reloc_kind::none:
    return "none";
  case reloc_kind::absolute:
    return "absolute";
  case reloc_kind::glob_dat:
    return "glob_dat";
  case reloc_kind::jump_slot:
    return "jump_slot";
  case reloc_kind::relative:
    return "relative";
  case reloc_kind::irelative:
    return "irelative";
  case reloc_kind::unsupported:
    return "unsupported";
  }
  return "unknown";
}

uintptr_t call_ifunc_resolver(uintptr_t resolver) {
#if defined(__aarch64__)
  // resolver(hwcap | _IFUNC_ARG_HWCAP, &arg)
  struct ifunc_arg {
    unsigned long size;
    unsigned long hwcap;
    unsigned long hwcap2;
  };
#ifdef AT_HWCAP2
  ifunc_arg arg{sizeof(ifunc_arg), getauxval(AT_HWCAP), getauxval(AT_HWCAP2)};
#else
  ifunc_arg arg{sizeof(ifunc_arg), getauxval(AT_HWCAP), 0};
#endif
  using resolver_fn = uintptr_t (*)(uint64_t, const ifunc_arg*);
  return reinterpret_cast<resolver_fn>(resolver)(arg.hwcap | (1ull << 62), &arg);
#elif defined(__arm__)
  using resolver_fn = uintptr_t (*)(unsigned long);
  return reinterpret_cast<resolver_fn>(resolver)(getauxval(AT_HWCAP));
#else
  using resolver_fn = uintptr_t (*)();
  return reinterpret_cast<resolver_fn>(resolver)();
#endif
}

} // namespace r3lr0::elf
