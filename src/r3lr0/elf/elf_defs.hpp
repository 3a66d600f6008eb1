#pragma once

#include <cstdint>

#include <elf.h>
#include <link.h>

// older libc headers lack the relr and android tags
#ifndef DT_RELRSZ
#define DT_RELRSZ 35
#endif
#ifndef DT_RELR
#define DT_RELR 36
#endif
#ifndef DT_RELRENT
#define DT_RELRENT 37
#endif
#ifndef DT_ANDROID_REL
#define DT_ANDROID_REL 0x6000000f
#endif
#ifndef DT_ANDROID_RELSZ
#define DT_ANDROID_RELSZ 0x60000010
#endif
#ifndef DT_ANDROID_RELA
#define DT_ANDROID_RELA 0x60000011
#endif
#ifndef DT_ANDROID_RELASZ
#define DT_ANDROID_RELASZ 0x60000012
#endif
#ifndef DT_ANDROID_RELR
#define DT_ANDROID_RELR 0x6fffe000
#endif
#ifndef DT_ANDROID_RELRSZ
#define DT_ANDROID_RELRSZ 0x6fffe001
#endif
#ifndef EM_RISCV
#define EM_RISCV 243
#endif

namespace r3lr0::elf {

#if __ELF_NATIVE_CLASS == 64
inline constexpr uint8_t kNativeClass = ELFCLASS64;
#else
inline constexpr uint8_t kNativeClass = ELFCLASS32;
#endif

#if defined(__x86_64__)
inline constexpr uint16_t kNativeMachine = EM_X86_64;
#elif defined(__i386__)
inline constexpr uint16_t kNativeMachine = EM_386;
#elif defined(__aarch64__)
inline constexpr uint16_t kNativeMachine = EM_AARCH64;
#elif defined(__arm__)
inline constexpr uint16_t kNativeMachine = EM_ARM;
#elif defined(__riscv) && __riscv_xlen == 64
inline constexpr uint16_t kNativeMachine = EM_RISCV;
#else
#error "unsupported architecture"
#endif

inline uint32_t elf_r_sym(ElfW(Xword) info) {
#if __ELF_NATIVE_CLASS == 64
  return ELF64_R_SYM(info);
#else
  return ELF32_R_SYM(info);
#endif
}

inline uint32_t elf_r_type(ElfW(Xword) info) {
#if __ELF_NATIVE_CLASS == 64
  return ELF64_R_TYPE(info);
#else
  return ELF32_R_TYPE(info);
#endif
}

inline uint8_t elf_st_type(unsigned char info) { return ELF32_ST_TYPE(info); }
inline uint8_t elf_st_bind(unsigned char info) { return ELF32_ST_BIND(info); }

} // namespace r3lr0::elf
