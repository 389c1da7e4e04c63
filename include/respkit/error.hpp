#pragma once

#include <system_error>
#include <type_traits>

namespace respkit {

enum class error {
  /// The byte is a RESP3 prefix, but its kind is not part of the value model.
  ///
  /// Covers double (,), big number ((), attribute (|), push (>) and the
  /// HELLO handshake marker (H). Values of these kinds cannot be constructed.
  unsupported_kind = 1,

  /// The byte is not a RESP3 prefix at all.
  invalid_prefix,

  /// A map insert was given a key structurally equal to an existing key.
  ///
  /// `map::insert` rejects and leaves the map unchanged. Use
  /// `map::insert_or_assign` to overwrite instead.
  map_key_collision,
};

auto make_error_code(error e) -> std::error_code;

}  // namespace respkit

namespace std {

template <>
struct is_error_code_enum<respkit::error> : std::true_type {};

}  // namespace std
