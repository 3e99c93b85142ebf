#pragma once

#include <string>
#include <utility>
#include <variant>

namespace cintel::core {

// Error enumerations following E.14 (use purpose-designed types as error indicators).

enum class StorageError {
  kNotFound,
  kConflict,
  kUnavailable,
};

// Failures of the completion-provider collaborator. None of these escape answer
// synthesis; they select the extractive fallback.
enum class ProviderError {
  kUnavailable,
  kTimeout,
  kMalformedResponse,
  kCancelled,
};

struct ProviderFailure {
  ProviderError code;   // NOLINT(readability-identifier-naming)
  std::string message;  // NOLINT(readability-identifier-naming)
};

[[nodiscard]] inline const char* to_string(const StorageError error) {
  switch (error) {
    case StorageError::kNotFound:
      return "not_found";
    case StorageError::kConflict:
      return "conflict";
    case StorageError::kUnavailable:
      return "unavailable";
  }
  return "unknown";
}

[[nodiscard]] inline const char* to_string(const ProviderError error) {
  switch (error) {
    case ProviderError::kUnavailable:
      return "unavailable";
    case ProviderError::kTimeout:
      return "timeout";
    case ProviderError::kMalformedResponse:
      return "malformed_response";
    case ProviderError::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

// Result<T, E> follows C++ Core Guidelines E.27: systematic error handling without exceptions.
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
// T and E must be distinct types.
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool has_value() const { return data_.index() == 0; }
  [[nodiscard]] const T& value() const { return std::get<0>(data_); }
  [[nodiscard]] T& value() { return std::get<0>(data_); }
  [[nodiscard]] const E& error() const { return std::get<1>(data_); }

 private:
  template <std::size_t I, typename V>
  Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

  std::variant<T, E> data_;
};

}  // namespace cintel::core
