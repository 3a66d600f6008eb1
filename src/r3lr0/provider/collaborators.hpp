#pragma once

#include <optional>
#include <string>

#include "r3lr0/provider/package_info.hpp"
#include "r3lr0/status.hpp"

namespace r3lr0::provider {

// what the update service decided the provider is, and how preparing it went
struct provider_response {
  load_status status = load_status::success;
  package_info package;
};

// out-of-process service choosing the provider and coordinating relro preparation
class update_service {
public:
  virtual ~update_service() = default;

  // blocks until preparation finished or failed; nullopt when the service is unreachable
  virtual std::optional<provider_response> wait_for_and_get_provider() = 0;
};

class package_manager {
public:
  virtual ~package_manager() = default;

  // current metadata of an installed package, nullopt if it is unknown
  virtual std::optional<package_info> get_package_info(const std::string& package_name) = 0;
};

class host_services {
public:
  virtual ~host_services() = default;

  // ties this process's lifetime to the package so an update restarts it
  virtual void add_package_dependency(const std::string& package_name) = 0;
};

} // namespace r3lr0::provider
