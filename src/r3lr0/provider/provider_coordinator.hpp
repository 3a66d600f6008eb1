#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include <redlog.hpp>

#include "r3lr0/abi.hpp"
#include "r3lr0/provider/collaborators.hpp"
#include "r3lr0/provider/native_provider.hpp"
#include "r3lr0/provider/package_info.hpp"
#include "r3lr0/result.hpp"

namespace r3lr0::provider {

class native_library_loader;

enum class coordinator_state { uninitialized, resolving, loading, ready, failed, fallback_null_provider };

const char* to_string(coordinator_state state);

// uids that must never host a provider
inline constexpr uint32_t kRootUid = 0;
inline constexpr uint32_t kSystemUid = 1000;
inline constexpr uint32_t kPhoneUid = 1001;
inline constexpr uint32_t kBluetoothUid = 1002;
inline constexpr uint32_t kNfcUid = 1027;

bool is_privileged_uid(uint32_t uid);

using provider_factory = std::function<native_provider*(const provider_delegate*)>;

// how to instantiate the provider once its library is loaded
struct provider_entry {
  provider_factory create;
  bool null_provider = false;
};

struct coordinator_context {
  update_service* updates = nullptr;
  package_manager* packages = nullptr;
  host_services* host = nullptr;
  native_library_loader* loader = nullptr;
  abi_table abis;
  uint32_t uid = 0;
  // builds a provider meaning "no provider on this device"; empty when the build has none
  provider_factory null_provider_factory;
};

/**
 * Per-process owner of the provider singleton.
 *
 * The first get_provider() caller resolves the package through the update
 * service, verifies it, loads its native library and instantiates the
 * provider; concurrent and later callers get the cached instance. The
 * provider class is resolved at most once: get_provider_class() and
 * get_provider() share the cached entry, and a failed resolution is terminal,
 * every later call reporting the same error.
 */
class provider_coordinator {
public:
  explicit provider_coordinator(coordinator_context context);

  provider_coordinator(const provider_coordinator&) = delete;
  provider_coordinator& operator=(const provider_coordinator&) = delete;

  result<native_provider*> get_provider();

  result<provider_entry> get_provider_class();

  // loads only the native half, for the package the update service prepared
  load_status load_native_library_from_package(const std::string& package_name);

  std::optional<package_info> loaded_package_info() const;
  coordinator_state state() const;

private:
  result<provider_entry> provider_class_locked();
  result<provider_entry> resolve_provider_class();
  result<provider_entry> load_provider_entry();
  result<package_info> fetch_verified_package();

  coordinator_context context_;
  mutable std::mutex mutex_;
  std::atomic<native_provider*> instance_{nullptr};
  coordinator_state state_ = coordinator_state::uninitialized;
  std::optional<provider_entry> entry_;
  std::optional<status> failure_;
  std::optional<package_info> loaded_package_;
  std::string delegate_package_name_;
  provider_delegate delegate_{};
  redlog::logger log_;
};

} // namespace r3lr0::provider
