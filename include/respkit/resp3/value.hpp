#pragma once

#include <respkit/detail/hashed_table.hpp>
#include <respkit/error.hpp>
#include <respkit/expected.hpp>
#include <respkit/resp3/kind.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace respkit::resp3 {

// Forward declarations
struct message;
struct message_hash;
struct message_equal;

// All string payloads are views into a buffer owned by the caller. The
// buffer must outlive every message viewing it.

/// Error payload shared by simple and blob errors.
/// On the wire the two fields are joined by a single space.
struct error_reply {
  std::string_view code;
  std::string_view message;
};

/// Format of a verbatim string.
enum class verbatim_format {
  text,
  markdown,
};

/// 3-byte wire tag of a verbatim format.
[[nodiscard]] constexpr auto verbatim_format_tag(verbatim_format f) noexcept -> std::string_view {
  switch (f) {
    case verbatim_format::text:
      return "txt";
    case verbatim_format::markdown:
      return "mkd";
  }
  return "txt";
}

/// Blob string value ($)
struct blob_string {
  static constexpr kind kind_id = kind::blob_string;
  std::string_view data;
};

/// Simple string value (+)
struct simple_string {
  static constexpr kind kind_id = kind::simple_string;
  std::string_view data;
};

/// Simple error value (-)
struct simple_error {
  static constexpr kind kind_id = kind::simple_error;
  error_reply value;
};

/// Number value (:)
struct number {
  static constexpr kind kind_id = kind::number;
  std::int64_t value;
};

/// Null value (_)
struct null {
  static constexpr kind kind_id = kind::null;
};

/// Boolean value (#)
struct boolean {
  static constexpr kind kind_id = kind::boolean;
  bool value;
};

/// Blob error value (!)
struct blob_error {
  static constexpr kind kind_id = kind::blob_error;
  error_reply value;
};

/// Verbatim string value (=)
struct verbatim_string {
  static constexpr kind kind_id = kind::verbatim_string;
  verbatim_format format;
  std::string_view data;
};

/// Array value (*)
struct array {
  static constexpr kind kind_id = kind::array;
  std::vector<message> elements;
};

/// Set value (~)
/// Backed by an ordered sequence: element order takes part in equality and
/// hashing, and duplicates are not removed.
struct set {
  static constexpr kind kind_id = kind::set;
  std::vector<message> elements;
};

/// Map value (%)
///
/// Keys are unique under structural equality and may themselves be any
/// message, composites included. Entries iterate in insertion order; the
/// order does not take part in equality or hashing.
///
/// The backing table is owned by the map and released with it.
class map {
 public:
  static constexpr kind kind_id = kind::map;

  using table_type = detail::hashed_table<message, message, message_hash, message_equal>;
  using value_type = std::pair<message, message>;
  using const_iterator = table_type::const_iterator;

  map() = default;

  /// Add an entry. A key equal to an existing key is rejected with
  /// `error::map_key_collision` and the map is left unchanged.
  auto insert(message key, message value) -> expected<void, std::error_code>;

  /// Add an entry, or overwrite the value of an existing equal key.
  /// Returns true if a new entry was added.
  auto insert_or_assign(message key, message value) -> bool;

  /// Value paired with a key equal to `key`, or nullptr.
  [[nodiscard]] auto find(const message& key) const -> const message*;

  [[nodiscard]] auto contains(const message& key) const -> bool;

  [[nodiscard]] auto size() const noexcept -> std::size_t;
  [[nodiscard]] auto empty() const noexcept -> bool;

  [[nodiscard]] auto begin() const noexcept -> const_iterator;
  [[nodiscard]] auto end() const noexcept -> const_iterator;

  void clear() noexcept;

 private:
  table_type table_;
};

}  // namespace respkit::resp3
