#include "r3lr0/abi.hpp"

#include <algorithm>
#include <array>

namespace r3lr0 {

bool abi_table::is_64bit(const std::string& abi) {
  static const std::array<const char*, 5> k64bit = {"arm64-v8a", "x86_64", "riscv64", "mips64", "aarch64"};
  return std::any_of(k64bit.begin(), k64bit.end(), [&](const char* name) { return abi == name; });
}

abi_table abi_table::for_host() {
  abi_table table;
#if defined(__aarch64__)
  table.supported_64 = {"arm64-v8a"};
  table.supported_32 = {"armeabi-v7a", "armeabi"};
#elif defined(__arm__)
  table.supported_32 = {"armeabi-v7a", "armeabi"};
#elif defined(__x86_64__)
  table.supported_64 = {"x86_64"};
  table.supported_32 = {"x86"};
#elif defined(__i386__)
  table.supported_32 = {"x86"};
#elif defined(__riscv) && __riscv_xlen == 64
  table.supported_64 = {"riscv64"};
#endif
  return table;
}

} // namespace r3lr0
