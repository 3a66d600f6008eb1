#include "r3lr0/provider/provider_coordinator.hpp"

#include "r3lr0/paths/library_paths.hpp"
#include "r3lr0/provider/library_loader.hpp"
#include "r3lr0/provider/package_verifier.hpp"
#include "r3lr0/status.hpp"

namespace r3lr0::provider {

const char* to_string(coordinator_state state) {
  switch (state) {
  case coordinator_state::uninitialized:
    return "uninitialized";
  case coordinator_state::resolving:
    return "resolving";
  case coordinator_state::loading:
    return "loading";
  case coordinator_state::ready:
    return "ready";
  case coordinator_state::failed:
    return "failed";
  case coordinator_state::fallback_null_provider:
    return "fallback_null_provider";
  }
  return "unknown";
}

namespace {

// handed to providers through provider_delegate::log
void log_from_provider(const char* message) {
  static redlog::logger log = redlog::get_logger("r3lr0.provider.module");
  log.inf(message ? message : "");
}

} // namespace

bool is_privileged_uid(uint32_t uid) {
  switch (uid) {
  case kRootUid:
  case kSystemUid:
  case kPhoneUid:
  case kBluetoothUid:
  case kNfcUid:
    return true;
  default:
    return false;
  }
}

provider_coordinator::provider_coordinator(coordinator_context context)
    : context_(std::move(context)), log_(redlog::get_logger("r3lr0.provider")) {}

coordinator_state provider_coordinator::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

std::optional<package_info> provider_coordinator::loaded_package_info() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return loaded_package_;
}

result<native_provider*> provider_coordinator::get_provider() {
  if (is_privileged_uid(context_.uid)) {
    log_.err("refusing to load a provider in a privileged process", redlog::field("uid", context_.uid));
    return error_result<native_provider*>(error_code::security_violation,
                                          "for security reasons, providers are not allowed in privileged processes");
  }

  if (native_provider* cached = instance_.load(std::memory_order_acquire)) {
    return ok_result(cached);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (native_provider* cached = instance_.load(std::memory_order_relaxed)) {
    return ok_result(cached);
  }
  if (failure_) {
    return error_result<native_provider*>(*failure_);
  }

  auto entry = provider_class_locked();
  if (!entry.ok()) {
    log_.err("provider unavailable", redlog::field("error", entry.status.message));
    return error_result<native_provider*>(entry.status);
  }

  // the delegate outlives this call; its strings are owned here and never reassigned
  if (loaded_package_) {
    delegate_package_name_ = loaded_package_->package_name;
    delegate_.version_code = loaded_package_->version_code;
  }
  delegate_.package_name = delegate_package_name_.c_str();
  delegate_.host_abi = kHostAbiVersion;
  delegate_.log = &log_from_provider;

  native_provider* created = entry.value.create ? entry.value.create(&delegate_) : nullptr;
  if (!created) {
    state_ = coordinator_state::failed;
    failure_ = make_status(error_code::instantiation_failed, "provider factory returned no instance");
    log_.err("error instantiating provider");
    return error_result<native_provider*>(*failure_);
  }

  instance_.store(created, std::memory_order_release);
  state_ = entry.value.null_provider ? coordinator_state::fallback_null_provider : coordinator_state::ready;
  log_.inf("provider ready", redlog::field("name", created->name()), redlog::field("state", to_string(state_)));
  return ok_result(created);
}

result<provider_entry> provider_coordinator::get_provider_class() {
  std::lock_guard<std::mutex> lock(mutex_);
  return provider_class_locked();
}

result<provider_entry> provider_coordinator::provider_class_locked() {
  if (entry_) {
    return ok_result(*entry_);
  }
  if (failure_) {
    return error_result<provider_entry>(*failure_);
  }

  auto entry = resolve_provider_class();
  if (!entry.ok()) {
    state_ = coordinator_state::failed;
    failure_ = entry.status;
    return entry;
  }
  entry_ = entry.value;
  return entry;
}

result<provider_entry> provider_coordinator::resolve_provider_class() {
  auto entry = load_provider_entry();
  if (entry.ok()) {
    return entry;
  }

  if (entry.status.code == error_code::missing_package && context_.null_provider_factory) {
    // no provider package at all means a build without one, not an error
    log_.inf("provider package missing, using the null provider", redlog::field("reason", entry.status.message));
    state_ = coordinator_state::fallback_null_provider;
    provider_entry null_entry;
    null_entry.create = context_.null_provider_factory;
    null_entry.null_provider = true;
    return ok_result(std::move(null_entry));
  }

  log_.err("provider package does not exist", redlog::field("error", entry.status.message));
  return entry;
}

result<package_info> provider_coordinator::fetch_verified_package() {
  if (!context_.updates || !context_.packages) {
    return error_result<package_info>(error_code::internal_error, "coordinator has no update service or package manager");
  }

  auto response = context_.updates->wait_for_and_get_provider();
  if (!response) {
    return error_result<package_info>(
        error_code::missing_package,
        "failed to load provider: " + preparation_error_reason(load_status::failed_waiting_unknown)
    );
  }
  if (!is_usable_preparation(response->status)) {
    return error_result<package_info>(error_code::missing_package,
                                      "failed to load provider: " + preparation_error_reason(response->status));
  }
  if (response->status == load_status::failed_waiting_for_relro) {
    log_.wrn("relro preparation timed out, loading without a fresh snapshot");
  }

  const std::string& name = response->package.package_name;
  if (context_.host) {
    // registered before fetching so a concurrent update kills this process
    context_.host->add_package_dependency(name);
  }

  auto fetched = context_.packages->get_package_info(name);
  if (!fetched) {
    return error_result<package_info>(error_code::missing_package, "failed to load provider: package not found: " + name);
  }

  if (auto s = verify_package_info(response->package, *fetched); !s.ok()) {
    return error_result<package_info>(std::move(s));
  }
  if (auto s = fixup_stub_application_info(fetched->application, *context_.packages); !s.ok()) {
    return error_result<package_info>(std::move(s));
  }
  return ok_result(std::move(*fetched));
}

result<provider_entry> provider_coordinator::load_provider_entry() {
  state_ = coordinator_state::resolving;
  auto package = fetch_verified_package();
  if (!package.ok()) {
    return error_result<provider_entry>(package.status);
  }

  log_.inf("loading provider", redlog::field("package", package.value.package_name),
           redlog::field("version", package.value.version_name), redlog::field("code", package.value.version_code));

  state_ = coordinator_state::loading;
  auto paths = paths::resolve_paths(descriptor_for(package.value), context_.abis);
  if (!paths.ok()) {
    return error_result<provider_entry>(paths.status);
  }

  if (!context_.loader) {
    return error_result<provider_entry>(error_code::internal_error, "coordinator has no native library loader");
  }

  load_status loaded = context_.loader->load_with_sharing(paths.value);
  if (loaded == load_status::address_space_not_reserved) {
    log_.wrn("failed to load with relro file, proceeding without");
    loaded = context_.loader->load_private(paths.value.for_width(native_width()));
  }
  if (loaded != load_status::success) {
    return error_result<provider_entry>(error_code::load_failed,
                                        std::string("failed to load provider library: ") + to_string(loaded));
  }

  auto create = reinterpret_cast<create_provider_fn>(context_.loader->find_symbol(kCreateProviderSymbol));
  if (!create) {
    return error_result<provider_entry>(error_code::entry_point_missing,
                                        std::string("provider library does not export ") + kCreateProviderSymbol);
  }

  loaded_package_ = std::move(package.value);
  provider_entry entry;
  entry.create = create;
  return ok_result(std::move(entry));
}

load_status provider_coordinator::load_native_library_from_package(const std::string& package_name) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!context_.updates || !context_.packages || !context_.loader) {
    return load_status::failed_waiting_unknown;
  }

  auto response = context_.updates->wait_for_and_get_provider();
  if (!response) {
    log_.err("error waiting for relro creation");
    return load_status::failed_waiting_unknown;
  }
  if (!is_usable_preparation(response->status)) {
    return response->status;
  }
  if (response->package.package_name != package_name) {
    log_.wrn("requested package is not the prepared provider", redlog::field("requested", package_name),
             redlog::field("prepared", response->package.package_name));
    return load_status::wrong_package_name;
  }

  auto package = context_.packages->get_package_info(package_name);
  if (!package) {
    log_.err("couldn't find package", redlog::field("package", package_name));
    return load_status::wrong_package_name;
  }
  if (auto s = fixup_stub_application_info(package->application, *context_.packages); !s.ok()) {
    log_.err("failed to resolve donor package", redlog::field("error", s.message));
    return load_status::failed_to_load_library;
  }

  auto paths = paths::resolve_paths(descriptor_for(*package), context_.abis);
  if (!paths.ok()) {
    log_.err("failed to resolve native library paths", redlog::field("error", paths.status.message));
    return load_status::failed_to_load_library;
  }

  const load_status loaded = context_.loader->load_with_sharing(paths.value);
  if (loaded != load_status::success) {
    log_.wrn("failed to load with relro file", redlog::field("status", to_string(loaded)));
    return loaded;
  }
  // a relro timeout is still reported after a successful load
  return response->status;
}

} // namespace r3lr0::provider
