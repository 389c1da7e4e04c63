#pragma once

#include <respkit/resp3/kind.hpp>
#include <respkit/resp3/value.hpp>

#include <concepts>
#include <type_traits>
#include <utility>
#include <variant>

namespace respkit::resp3 {

namespace detail {

// Concept to verify that a type has a static kind_id member
template <typename T>
concept has_kind_id = requires {
  { T::kind_id } -> std::convertible_to<kind>;
};

template <typename... Ts>
constexpr bool all_have_kind_id = (has_kind_id<Ts> && ...);

}  // namespace detail

// clang-format off

/// A RESP3 value: exactly one of the modeled kinds.
///
/// The kind is read from the alternative's `kind_id`, never from the variant
/// index. Only the accessor for the held alternative is valid.
struct message {
  using value_type = std::variant<
    // Simple types
    simple_string,
    simple_error,
    number,
    null,
    boolean,

    // Blob types
    blob_string,
    blob_error,
    verbatim_string,

    // Aggregate types
    array,
    set,
    map
  >;

  static_assert(detail::all_have_kind_id<
    simple_string, simple_error, number, null, boolean,
    blob_string, blob_error, verbatim_string,
    array, set, map
  >, "All RESP3 value types must have a static kind_id member");

  value_type value;

  // Default constructor - creates a null message
  message() : value(null{}) {}

  template <typename T>
    requires std::constructible_from<value_type, T>
  explicit message(T&& val) : value(std::forward<T>(val)) {}

  [[nodiscard]] auto get_kind() const -> kind {
    return std::visit([](const auto& val) -> kind {
      using T = std::decay_t<decltype(val)>;
      return T::kind_id;
    }, value);
  }

  template <typename T>
  [[nodiscard]] bool is() const {
    return std::holds_alternative<T>(value);
  }

  /// Throws std::bad_variant_access if the type doesn't match
  template <typename T>
  [[nodiscard]] auto as() -> T& {
    return std::get<T>(value);
  }

  template <typename T>
  [[nodiscard]] auto as() const -> const T& {
    return std::get<T>(value);
  }

  /// Returns nullptr if the type doesn't match
  template <typename T>
  [[nodiscard]] auto try_as() -> T* {
    return std::get_if<T>(&value);
  }

  template <typename T>
  [[nodiscard]] auto try_as() const -> const T* {
    return std::get_if<T>(&value);
  }

  [[nodiscard]] bool is_null() const {
    return is<null>();
  }

  [[nodiscard]] bool is_aggregate() const {
    return is<array>() || is<set>() || is<map>();
  }

  [[nodiscard]] bool is_simple() const {
    return is<simple_string>() || is<simple_error>() || is<number>() ||
           is<null>() || is<boolean>();
  }

  [[nodiscard]] bool is_bulk() const {
    return is<blob_string>() || is<blob_error>() || is<verbatim_string>();
  }

  [[nodiscard]] bool is_error() const {
    return is<simple_error>() || is<blob_error>();
  }

  [[nodiscard]] bool is_string() const {
    return is<simple_string>() || is<blob_string>() || is<verbatim_string>();
  }
};

// clang-format on

}  // namespace respkit::resp3
