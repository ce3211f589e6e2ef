/**
 * @file expected.h
 * @brief Minimal std::expected-like result type for C++17
 *
 * Provides Expected<T, E> (value or error), Unexpected<E> and
 * BadExpectedAccess<E>, with the monadic helpers used across annotate:
 * transform, and_then, or_else, transform_error.
 *
 * Example usage:
 * @code
 * utils::Expected<Annotation, utils::Error> parsed = ParseAnnotation(line);
 * if (!parsed) {
 *   return utils::MakeUnexpected(parsed.error());
 * }
 * annotations.push_back(std::move(*parsed));
 * @endcode
 */

#pragma once

#include <exception>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace annotate::utils {

/**
 * @brief Wrapper marking a value as an error for Expected construction
 */
template <typename E>
class Unexpected {
 public:
  explicit Unexpected(E error) : error_(std::move(error)) {}

  const E& error() const& { return error_; }
  E& error() & { return error_; }
  E&& error() && { return std::move(error_); }

 private:
  E error_;
};

/**
 * @brief Create an Unexpected<E> from an error value
 */
template <typename E>
Unexpected<std::decay_t<E>> MakeUnexpected(E&& error) {
  return Unexpected<std::decay_t<E>>(std::forward<E>(error));
}

/**
 * @brief Thrown by Expected::value() when it holds an error
 */
template <typename E>
class BadExpectedAccess : public std::exception {
 public:
  explicit BadExpectedAccess(E error) : error_(std::move(error)) {}

  const char* what() const noexcept override { return "Bad Expected access: contains error"; }

  const E& error() const { return error_; }

 private:
  E error_;
};

namespace detail {

template <typename T>
struct IsUnexpected : std::false_type {};

template <typename E>
struct IsUnexpected<Unexpected<E>> : std::true_type {};

}  // namespace detail

/**
 * @brief Holds either a value of type T or an error of type E
 */
template <typename T, typename E>
class Expected {
 public:
  using value_type = T;
  using error_type = E;

  Expected() : storage_(std::in_place_index<0>) {}

  template <typename U = T,
            typename = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Expected> &&
                                        !detail::IsUnexpected<std::decay_t<U>>::value &&
                                        std::is_constructible_v<T, U&&>>>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(U&& value) : storage_(std::in_place_index<0>, std::forward<U>(value)) {}

  template <typename G>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(const Unexpected<G>& unexpected) : storage_(std::in_place_index<1>, unexpected.error()) {}

  template <typename G>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(Unexpected<G>&& unexpected) : storage_(std::in_place_index<1>, std::move(unexpected).error()) {}

  [[nodiscard]] bool has_value() const { return storage_.index() == 0; }
  explicit operator bool() const { return has_value(); }

  T& value() & {
    ThrowIfError();
    return std::get<0>(storage_);
  }
  const T& value() const& {
    ThrowIfError();
    return std::get<0>(storage_);
  }
  T&& value() && {
    ThrowIfError();
    return std::get<0>(std::move(storage_));
  }

  E& error() & { return std::get<1>(storage_); }
  const E& error() const& { return std::get<1>(storage_); }
  E&& error() && { return std::get<1>(std::move(storage_)); }

  T& operator*() & { return std::get<0>(storage_); }
  const T& operator*() const& { return std::get<0>(storage_); }
  T&& operator*() && { return std::get<0>(std::move(storage_)); }

  T* operator->() { return &std::get<0>(storage_); }
  const T* operator->() const { return &std::get<0>(storage_); }

  template <typename U>
  T value_or(U&& default_value) const& {
    return has_value() ? **this : static_cast<T>(std::forward<U>(default_value));
  }

  template <typename U>
  T value_or(U&& default_value) && {
    return has_value() ? std::move(**this) : static_cast<T>(std::forward<U>(default_value));
  }

  /**
   * @brief Map the value with func, propagating the error untouched
   */
  template <typename F>
  auto transform(F&& func) const& {
    using U = std::remove_cv_t<std::invoke_result_t<F, const T&>>;
    if (!has_value()) {
      return Expected<U, E>(Unexpected<E>(error()));
    }
    if constexpr (std::is_void_v<U>) {
      std::invoke(std::forward<F>(func), **this);
      return Expected<U, E>();
    } else {
      return Expected<U, E>(std::invoke(std::forward<F>(func), **this));
    }
  }

  /**
   * @brief Chain an operation that itself returns an Expected
   */
  template <typename F>
  auto and_then(F&& func) const& {
    using R = std::decay_t<std::invoke_result_t<F, const T&>>;
    if (!has_value()) {
      return R(Unexpected<E>(error()));
    }
    return std::invoke(std::forward<F>(func), **this);
  }

  /**
   * @brief Recover from an error with an operation returning an Expected
   */
  template <typename F>
  auto or_else(F&& func) const& {
    using R = std::decay_t<std::invoke_result_t<F, const E&>>;
    if (has_value()) {
      return R(**this);
    }
    return std::invoke(std::forward<F>(func), error());
  }

  /**
   * @brief Map the error with func, keeping the value untouched
   */
  template <typename F>
  auto transform_error(F&& func) const& {
    using G = std::decay_t<std::invoke_result_t<F, const E&>>;
    if (has_value()) {
      return Expected<T, G>(**this);
    }
    return Expected<T, G>(Unexpected<G>(std::invoke(std::forward<F>(func), error())));
  }

 private:
  void ThrowIfError() const {
    if (!has_value()) {
      throw BadExpectedAccess<E>(std::get<1>(storage_));
    }
  }

  std::variant<T, E> storage_;
};

/**
 * @brief Expected specialization for operations without a result value
 */
template <typename E>
class Expected<void, E> {
 public:
  using value_type = void;
  using error_type = E;

  Expected() = default;

  template <typename G>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(const Unexpected<G>& unexpected) : error_(unexpected.error()) {}

  template <typename G>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(Unexpected<G>&& unexpected) : error_(std::move(unexpected).error()) {}

  [[nodiscard]] bool has_value() const { return !error_.has_value(); }
  explicit operator bool() const { return has_value(); }

  void value() const {
    if (error_.has_value()) {
      throw BadExpectedAccess<E>(*error_);
    }
  }

  E& error() & { return *error_; }
  const E& error() const& { return *error_; }
  E&& error() && { return std::move(*error_); }

  template <typename F>
  auto transform(F&& func) const {
    using U = std::remove_cv_t<std::invoke_result_t<F>>;
    if (!has_value()) {
      return Expected<U, E>(Unexpected<E>(error()));
    }
    if constexpr (std::is_void_v<U>) {
      std::invoke(std::forward<F>(func));
      return Expected<U, E>();
    } else {
      return Expected<U, E>(std::invoke(std::forward<F>(func)));
    }
  }

  template <typename F>
  auto and_then(F&& func) const {
    using R = std::decay_t<std::invoke_result_t<F>>;
    if (!has_value()) {
      return R(Unexpected<E>(error()));
    }
    return std::invoke(std::forward<F>(func));
  }

  template <typename F>
  auto or_else(F&& func) const {
    using R = std::decay_t<std::invoke_result_t<F, const E&>>;
    if (has_value()) {
      return R();
    }
    return std::invoke(std::forward<F>(func), error());
  }

  template <typename F>
  auto transform_error(F&& func) const {
    using G = std::decay_t<std::invoke_result_t<F, const E&>>;
    if (has_value()) {
      return Expected<void, G>();
    }
    return Expected<void, G>(Unexpected<G>(std::invoke(std::forward<F>(func), error())));
  }

 private:
  std::optional<E> error_;
};

}  // namespace annotate::utils
