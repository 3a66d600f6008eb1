#include "r3lr0/loader/link_namespace.hpp"

namespace r3lr0::loader {

bool namespace_registry::add(link_namespace ns) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::string name = ns.name;
  return namespaces_.emplace(name, std::move(ns)).second;
}

std::optional<link_namespace> namespace_registry::find(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = namespaces_.find(name);
  if (it == namespaces_.end()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace r3lr0::loader
