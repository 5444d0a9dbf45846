// Repository: AdReel
// Component: Result
// Purpose: Value-or-error return used across provider and media boundaries.
// Copyright (c) 2026 AdReel

#ifndef ADREEL_UTIL_RESULT_HPP_
#define ADREEL_UTIL_RESULT_HPP_

#include <string>
#include <utility>

namespace adreel::util {

// Result<T> carries either a value (ok == true) or a human-readable error.
// No exceptions cross module boundaries; callers check ok before value.
template <typename T>
struct Result {
  bool ok = false;
  T value{};
  std::string error;

  static Result Success(T v) {
    Result r;
    r.ok = true;
    r.value = std::move(v);
    return r;
  }

  static Result Failure(std::string message) {
    Result r;
    r.ok = false;
    r.error = std::move(message);
    return r;
  }
};

}  // namespace adreel::util

#endif  // ADREEL_UTIL_RESULT_HPP_
