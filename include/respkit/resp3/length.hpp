#pragma once

#include <respkit/resp3/message.hpp>

#include <concepts>
#include <cstddef>
#include <type_traits>

namespace respkit::resp3 {

/// Number of bytes needed to print `v` in base 10.
///
/// `decimal_width(0) == 1`. A negative value counts its '-' sign, and the
/// most negative value of `T` is handled without overflow.
template <std::integral T>
  requires(!std::same_as<T, bool>)
[[nodiscard]] constexpr auto decimal_width(T v) noexcept -> std::size_t {
  using U = std::make_unsigned_t<T>;

  std::size_t width = 1;
  U magnitude = static_cast<U>(v);
  if constexpr (std::is_signed_v<T>) {
    if (v < 0) {
      ++width;
      magnitude = static_cast<U>(U{0} - magnitude);
    }
  }

  while (magnitude >= 10) {
    magnitude /= 10;
    ++width;
  }
  return width;
}

/// Exact number of bytes `msg` occupies in the RESP3 wire format.
///
/// Total: never fails and never throws for any constructible message.
/// Aggregates are the sum of their header and their children.
[[nodiscard]] auto encoded_length(const message& msg) noexcept -> std::size_t;

}  // namespace respkit::resp3
