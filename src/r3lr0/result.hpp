#pragma once

#include <string>
#include <utility>

namespace r3lr0 {

enum class error_code {
  ok,
  invalid_argument,
  missing_package,
  security_violation,
  load_failed,
  entry_point_missing,
  instantiation_failed,
  io_error,
  internal_error
};

const char* to_string(error_code code);

// status holds an error code and a human-readable message
struct status {
  error_code code = error_code::ok;
  std::string message;

  bool ok() const noexcept { return code == error_code::ok; }
};

inline status ok_status() { return {}; }

inline status make_status(error_code code, std::string message) { return status{code, std::move(message)}; }

// result carries a value and a status; value is default-initialized on errors
template <typename T> struct result {
  T value{};
  ::r3lr0::status status{};

  bool ok() const noexcept { return status.ok(); }
};

template <typename T> inline result<T> ok_result(T value) { return result<T>{std::move(value), ok_status()}; }

template <typename T> inline result<T> error_result(error_code code, std::string message) {
  return result<T>{T{}, make_status(code, std::move(message))};
}

template <typename T> inline result<T> error_result(struct status failure) { return result<T>{T{}, std::move(failure)}; }

} // namespace r3lr0
