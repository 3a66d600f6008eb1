#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "r3lr0/abi.hpp"
#include "r3lr0/result.hpp"

namespace r3lr0::paths {

// where a package keeps its native library; immutable once derived
struct library_descriptor {
  std::string primary_abi;
  std::string secondary_abi;
  std::string source_path;
  std::string primary_lib_dir;
  std::string secondary_lib_dir;
  std::string library_file_name;
};

// each slot is empty, a filesystem path or "<archive>!/<entry>"
struct resolved_library_paths {
  std::string path32;
  std::string path64;

  const std::string& for_width(elf_width width) const { return width == elf_width::bits64 ? path64 : path32; }
  bool empty() const { return path32.empty() && path64.empty(); }
};

inline bool operator==(const resolved_library_paths& a, const resolved_library_paths& b) {
  return a.path32 == b.path32 && a.path64 == b.path64;
}

inline constexpr const char* kArchiveSeparator = "!/";

struct archive_path {
  std::string archive;
  std::string entry;
};

std::optional<archive_path> split_archive_path(const std::string& path);
std::string format_archive_path(const std::string& archive, const std::string& entry);

// first STORED lib/<abi>/<file_name> entry in abi order, or "" when none matches.
// an unreadable archive is a missing_package error.
result<std::string> resolve_in_archive(
    const std::string& archive, const std::vector<std::string>& abis, const std::string& file_name
);

result<resolved_library_paths> resolve_paths(const library_descriptor& descriptor, const abi_table& abis);

// bytes of an extracted library or of a STORED in-archive entry
std::optional<uint64_t> library_file_size(const std::string& path);

} // namespace r3lr0::paths
