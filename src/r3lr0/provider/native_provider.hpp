#pragma once

#include <cstdint>

namespace r3lr0 {

// abi spoken between the host and provider libraries
inline constexpr uint32_t kHostAbiVersion = 1;
inline constexpr uint32_t kMinimumProviderAbi = 1;

inline constexpr const char* kCreateProviderSymbol = "r3lr0_create_provider";
inline constexpr const char* kOnLoadSymbol = "r3lr0_on_load";

// host services handed to the provider when it is created
struct provider_delegate {
  uint32_t host_abi = kHostAbiVersion;
  const char* package_name = nullptr;
  int64_t version_code = 0;
  void (*log)(const char* message) = nullptr;
};

// process-wide provider instance; created once, never destroyed
class native_provider {
public:
  virtual ~native_provider() = default;

  virtual const char* name() const = 0;
  virtual int64_t version_code() const = 0;
  virtual bool is_null_provider() const { return false; }
};

// extern "C" native_provider* r3lr0_create_provider(const provider_delegate*)
using create_provider_fn = native_provider* (*)(const provider_delegate*);

// optional: extern "C" uint32_t r3lr0_on_load(uint32_t host_abi), returns the provider abi
using on_load_fn = uint32_t (*)(uint32_t);

} // namespace r3lr0
