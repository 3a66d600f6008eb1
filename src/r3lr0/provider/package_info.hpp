#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "r3lr0/paths/library_paths.hpp"

namespace r3lr0::provider {

// metadata naming the provider's native library file
inline constexpr const char* kLibraryMetadataKey = "provider.library";
// metadata naming the package that holds a stub's code
inline constexpr const char* kDonorMetadataKey = "provider.donor_package";

struct application_info {
  std::string source_dir;
  std::vector<std::string> split_source_dirs;
  std::string native_library_dir;
  std::string secondary_native_library_dir;
  std::string primary_cpu_abi;
  std::string secondary_cpu_abi;
  std::map<std::string, std::string> metadata;

  std::optional<std::string> metadata_value(const std::string& key) const;
};

struct package_info {
  std::string package_name;
  std::string version_name;
  int64_t version_code = 0;
  // absent and empty are different: only absent matches absent
  std::optional<std::vector<std::string>> signatures;
  application_info application;
};

std::optional<std::string> provider_library_name(const application_info& app);

// where the package keeps its native library; file name empty when metadata is missing
paths::library_descriptor descriptor_for(const package_info& package);

} // namespace r3lr0::provider
