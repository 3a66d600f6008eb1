#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace r3lr0::loader {

// named set of directories a provider's dependencies are loaded from
struct link_namespace {
  std::string name;
  std::vector<std::string> search_dirs;
};

class namespace_registry {
public:
  // false if a namespace of that name already exists
  bool add(link_namespace ns);

  std::optional<link_namespace> find(const std::string& name) const;

private:
  mutable std::mutex mutex_;
  std::map<std::string, link_namespace> namespaces_;
};

} // namespace r3lr0::loader
