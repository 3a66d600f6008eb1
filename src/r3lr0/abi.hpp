#pragma once

#include <string>
#include <vector>

namespace r3lr0 {

enum class elf_width { bits32 = 32, bits64 = 64 };

constexpr elf_width native_width() { return sizeof(void*) == 8 ? elf_width::bits64 : elf_width::bits32; }

inline const char* to_string(elf_width width) { return width == elf_width::bits64 ? "64" : "32"; }

// device ABI lists in preference order, per width
struct abi_table {
  std::vector<std::string> supported_32;
  std::vector<std::string> supported_64;

  // name based classification; unknown names count as 32-bit
  static bool is_64bit(const std::string& abi);

  const std::vector<std::string>& supported(elf_width width) const {
    return width == elf_width::bits64 ? supported_64 : supported_32;
  }

  bool supports(elf_width width) const { return !supported(width).empty(); }

  // lists matching the architecture this binary was compiled for
  static abi_table for_host();
};

} // namespace r3lr0
