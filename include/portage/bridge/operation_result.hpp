#pragma once

#include <portage/schema/transaction_error_code.hpp>
#include <optional>
#include <string>
#include <utility>

namespace portage::bridge {

/// Value of a user-facing bridge operation, or the error code and message
/// the transaction result reports.
template <typename T>
struct operation_result final {
  std::optional<T> value;
  portage::schema::transaction_error_code error{};
  std::string message;

  explicit operator bool() const { return value.has_value(); }

  static operation_result success(T value) {
    return operation_result{.value = std::move(value)};
  }

  static operation_result failure(portage::schema::transaction_error_code code,
                                  std::string message) {
    return operation_result{.error = code, .message = std::move(message)};
  }
};

}  // namespace portage::bridge
