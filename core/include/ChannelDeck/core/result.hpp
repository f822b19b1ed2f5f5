#pragma once

/**
 * @file result.hpp
 * @brief Value-or-error return type
 *
 * Every fallible operation returns a Result. Callers check isOk()/isError()
 * before touching value() or error().
 */

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace ChannelDeck {

template <typename T> class Result {
public:
  static Result ok(T value) { return Result(std::move(value)); }

  static Result error(std::string message) {
    Result result;
    result.m_error = std::move(message);
    return result;
  }

  [[nodiscard]] bool isOk() const { return m_value.has_value(); }
  [[nodiscard]] bool isError() const { return !m_value.has_value(); }

  [[nodiscard]] T& value() & {
    if (!m_value) {
      throw std::logic_error("Result::value() called on error: " + m_error);
    }
    return *m_value;
  }

  [[nodiscard]] const T& value() const& {
    if (!m_value) {
      throw std::logic_error("Result::value() called on error: " + m_error);
    }
    return *m_value;
  }

  [[nodiscard]] T&& value() && {
    if (!m_value) {
      throw std::logic_error("Result::value() called on error: " + m_error);
    }
    return std::move(*m_value);
  }

  [[nodiscard]] T valueOr(T fallback) const& { return m_value ? *m_value : std::move(fallback); }

  [[nodiscard]] const std::string& error() const { return m_error; }

private:
  Result() = default;
  explicit Result(T value) : m_value(std::move(value)) {}

  std::optional<T> m_value;
  std::string m_error;
};

template <> class Result<void> {
public:
  static Result ok() { return Result(true, {}); }
  static Result error(std::string message) { return Result(false, std::move(message)); }

  [[nodiscard]] bool isOk() const { return m_ok; }
  [[nodiscard]] bool isError() const { return !m_ok; }
  [[nodiscard]] const std::string& error() const { return m_error; }

private:
  Result(bool ok, std::string error) : m_ok(ok), m_error(std::move(error)) {}

  bool m_ok = false;
  std::string m_error;
};

} // namespace ChannelDeck
