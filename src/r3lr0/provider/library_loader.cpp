#include "r3lr0/provider/library_loader.hpp"

#include "r3lr0/loader/relro_loader.hpp"

namespace r3lr0::provider {

load_status relro_library_loader::load_with_sharing(const paths::resolved_library_paths& paths) {
  return loader_.load_with_sharing(paths.path32, paths.path64, relro32_, relro64_);
}

load_status relro_library_loader::load_private(const std::string& path) { return loader_.load_private(path); }

void* relro_library_loader::find_symbol(std::string_view name) const {
  const auto* library = loader_.library();
  return library ? library->find_symbol(name) : nullptr;
}

} // namespace r3lr0::provider
