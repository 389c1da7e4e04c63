#pragma once

#include <respkit/error.hpp>
#include <respkit/expected.hpp>
#include <respkit/logger.hpp>

#include <string_view>

namespace respkit::resp3 {

// clang-format off

/// RESP3 kinds carried by the value model.
///
/// Double, big number, attribute, push and the HELLO marker exist on the
/// wire but are deliberately absent here; see `kind_from_prefix`.
enum class kind {
  // Simple
  simple_string,   // +
  simple_error,    // -
  number,          // :
  null,            // _
  boolean,         // #

  // Blob
  blob_string,     // $
  blob_error,      // !
  verbatim_string, // =

  // Aggregate
  array,           // *
  set,             // ~
  map,             // %
};

// clang-format on

/// Leading prefix byte of a kind in the wire format.
[[nodiscard]] constexpr auto kind_to_prefix(kind k) noexcept -> char {
  switch (k) {
    case kind::simple_string:   return '+';
    case kind::simple_error:    return '-';
    case kind::number:          return ':';
    case kind::null:            return '_';
    case kind::boolean:         return '#';
    case kind::blob_string:     return '$';
    case kind::blob_error:      return '!';
    case kind::verbatim_string: return '=';
    case kind::array:           return '*';
    case kind::set:             return '~';
    case kind::map:             return '%';
  }
  return '\0';
}

/// User-readable kind name (for diagnostics/logging).
[[nodiscard]] constexpr auto kind_name(kind k) noexcept -> std::string_view {
  switch (k) {
    case kind::simple_string:   return "simple_string";
    case kind::simple_error:    return "simple_error";
    case kind::number:          return "number";
    case kind::null:            return "null";
    case kind::boolean:         return "boolean";
    case kind::blob_string:     return "blob_string";
    case kind::blob_error:      return "blob_error";
    case kind::verbatim_string: return "verbatim_string";
    case kind::array:           return "array";
    case kind::set:             return "set";
    case kind::map:             return "map";
  }
  return "<unknown>";
}

/// Map a prefix byte to a modeled kind.
///
/// Fails with `error::unsupported_kind` for RESP3 kinds the model does not
/// carry, and with `error::invalid_prefix` for any other byte.
[[nodiscard]] inline auto kind_from_prefix(char b) -> expected<kind, std::error_code> {
  switch (b) {
    case '+': return kind::simple_string;
    case '-': return kind::simple_error;
    case ':': return kind::number;
    case '_': return kind::null;
    case '#': return kind::boolean;
    case '$': return kind::blob_string;
    case '!': return kind::blob_error;
    case '=': return kind::verbatim_string;
    case '*': return kind::array;
    case '~': return kind::set;
    case '%': return kind::map;

    case ',':  // double
    case '(':  // big number
    case '|':  // attribute
    case '>':  // push
    case 'H':  // hello
      RESPKIT_LOG_DEBUG("unsupported RESP3 kind prefix '{}'", b);
      return unexpected(make_error_code(error::unsupported_kind));

    default:
      RESPKIT_LOG_DEBUG("invalid RESP3 prefix byte {:#04x}", static_cast<unsigned char>(b));
      return unexpected(make_error_code(error::invalid_prefix));
  }
}

}  // namespace respkit::resp3
