#include "r3lr0/provider/package_info.hpp"

namespace r3lr0::provider {

std::optional<std::string> application_info::metadata_value(const std::string& key) const {
  auto it = metadata.find(key);
  if (it == metadata.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<std::string> provider_library_name(const application_info& app) {
  return app.metadata_value(kLibraryMetadataKey);
}

paths::library_descriptor descriptor_for(const package_info& package) {
  const auto& app = package.application;

  paths::library_descriptor descriptor;
  descriptor.primary_abi = app.primary_cpu_abi;
  descriptor.secondary_abi = app.secondary_cpu_abi;
  descriptor.source_path = app.source_dir;
  descriptor.primary_lib_dir = app.native_library_dir;
  descriptor.secondary_lib_dir = app.secondary_native_library_dir;
  descriptor.library_file_name = provider_library_name(app).value_or(std::string());
  return descriptor;
}

} // namespace r3lr0::provider
