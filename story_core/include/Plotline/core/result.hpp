#pragma once

/**
 * @file result.hpp
 * @brief Value-or-error return type used across collaborator boundaries
 */

#include <optional>
#include <string>
#include <utility>

namespace Plotline {

/**
 * @brief Holds either a value of type T or an error message
 *
 * Construct through the named factories:
 * @code
 * Result<int> r = Result<int>::ok(42);
 * Result<int> e = Result<int>::error("not found");
 * @endcode
 */
template <typename T> class Result {
public:
  static Result ok(T value) {
    Result r;
    r.m_value = std::move(value);
    return r;
  }

  static Result error(std::string message) {
    Result r;
    r.m_error = std::move(message);
    return r;
  }

  [[nodiscard]] bool isOk() const { return m_value.has_value(); }
  [[nodiscard]] bool isError() const { return !m_value.has_value(); }

  [[nodiscard]] T& value() & { return *m_value; }
  [[nodiscard]] const T& value() const& { return *m_value; }
  [[nodiscard]] T&& value() && { return std::move(*m_value); }

  [[nodiscard]] T valueOr(T fallback) const {
    return m_value.has_value() ? *m_value : std::move(fallback);
  }

  [[nodiscard]] const std::string& error() const { return m_error; }

private:
  Result() = default;

  std::optional<T> m_value;
  std::string m_error;
};

/**
 * @brief Result specialization for operations without a return value
 */
template <> class Result<void> {
public:
  static Result ok() { return Result(true, {}); }

  static Result error(std::string message) { return Result(false, std::move(message)); }

  [[nodiscard]] bool isOk() const { return m_ok; }
  [[nodiscard]] bool isError() const { return !m_ok; }

  [[nodiscard]] const std::string& error() const { return m_error; }

private:
  Result(bool ok, std::string message) : m_ok(ok), m_error(std::move(message)) {}

  bool m_ok = false;
  std::string m_error;
};

} // namespace Plotline
