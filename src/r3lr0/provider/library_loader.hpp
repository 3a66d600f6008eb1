#pragma once

#include <string>
#include <string_view>
#include <utility>

#include "r3lr0/paths/library_paths.hpp"
#include "r3lr0/status.hpp"

namespace r3lr0::loader {
class relro_loader;
}

namespace r3lr0::provider {

// the part of the loader the coordinator drives
class native_library_loader {
public:
  virtual ~native_library_loader() = default;

  virtual load_status load_with_sharing(const paths::resolved_library_paths& paths) = 0;
  virtual load_status load_private(const std::string& path) = 0;

  // symbol of the loaded library, nullptr before a load or when absent
  virtual void* find_symbol(std::string_view name) const = 0;
};

// binds a relro_loader to the configured snapshot paths
class relro_library_loader : public native_library_loader {
public:
  relro_library_loader(loader::relro_loader& loader, std::string relro32, std::string relro64)
      : loader_(loader), relro32_(std::move(relro32)), relro64_(std::move(relro64)) {}

  load_status load_with_sharing(const paths::resolved_library_paths& paths) override;
  load_status load_private(const std::string& path) override;
  void* find_symbol(std::string_view name) const override;

private:
  loader::relro_loader& loader_;
  std::string relro32_;
  std::string relro64_;
};

} // namespace r3lr0::provider
