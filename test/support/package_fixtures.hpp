#pragma once

#include <filesystem>
#include <string>

#include "r3lr0/abi.hpp"
#include "r3lr0/provider/package_info.hpp"
#include "support/test_support.hpp"

namespace r3lr0::test {

// first abi this process can run, the one a package built for it would declare
inline std::string host_abi() {
  const auto abis = abi_table::for_host();
  const auto& native = abis.supported(native_width());
  return native.empty() ? std::string("x86_64") : native.front();
}

// an installed package whose extracted library lives in <dir>/<package>/lib
inline provider::package_info make_package(const temp_dir& dir, const std::string& name, int64_t version_code,
                                           const std::string& library = "libprov.so") {
  const std::string lib_dir = dir.file(name + "/lib");
  std::filesystem::create_directories(lib_dir);
  write_file(lib_dir + "/" + library, std::string("not really elf"));

  provider::package_info package;
  package.package_name = name;
  package.version_name = std::to_string(version_code);
  package.version_code = version_code;
  package.signatures = std::vector<std::string>{"sig-a", "sig-b"};
  package.application.source_dir = dir.file(name + "/base.apk");
  package.application.native_library_dir = lib_dir;
  package.application.primary_cpu_abi = host_abi();
  package.application.metadata[provider::kLibraryMetadataKey] = library;
  return package;
}

} // namespace r3lr0::test
