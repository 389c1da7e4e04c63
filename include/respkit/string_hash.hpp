#pragma once

#include <array>
#include <bit>
#include <cstdint>
#include <string_view>

namespace respkit {

/// Non-cryptographic one-at-a-time hash.
///
/// Deterministic and allocation free. Not collision resistant against
/// adversarial input; do not use it where that matters.
using hash_type = std::uint32_t;

/// Fold one input word into the accumulator.
[[nodiscard]] constexpr auto mix(hash_type acc, hash_type v) noexcept -> hash_type {
  hash_type r = acc + v;
  r += r << 10;
  r ^= r >> 6;
  return r;
}

/// Avalanche step applied after the last `mix`.
[[nodiscard]] constexpr auto finalize(hash_type h) noexcept -> hash_type {
  hash_type r = h + (h << 3);
  r ^= r >> 11;
  r += r << 15;
  return r;
}

[[nodiscard]] constexpr auto hash_bytes(std::string_view bytes) noexcept -> hash_type {
  hash_type acc = 0;
  for (char c : bytes) {
    acc = mix(acc, static_cast<unsigned char>(c));
  }
  return finalize(acc);
}

/// Hash of the native (in-memory) byte representation of `v`.
///
/// The result depends on host endianness.
[[nodiscard]] constexpr auto hash_int64(std::int64_t v) noexcept -> hash_type {
  auto const raw = std::bit_cast<std::array<unsigned char, sizeof(v)>>(v);
  hash_type acc = 0;
  for (unsigned char b : raw) {
    acc = mix(acc, b);
  }
  return finalize(acc);
}

}  // namespace respkit
