#pragma once

#include <cstdint>

namespace r3lr0::elf {

// relocation semantics the image linker implements, independent of the machine encoding
enum class reloc_kind {
  none,
  absolute,  // S + A
  glob_dat,  // S (+ A on rela)
  jump_slot, // S (+ A on rela), bound eagerly
  relative,  // B + A
  irelative, // resolver(B + A)
  unsupported
};

// maps a native relocation type number to its kind
reloc_kind classify_relocation(uint32_t type);

const char* to_string(reloc_kind kind);

// calls an ifunc resolver with the arguments the platform abi expects
uintptr_t call_ifunc_resolver(uintptr_t resolver);

} // namespace r3lr0::elf
