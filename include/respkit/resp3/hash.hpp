#pragma once

#include <respkit/resp3/message.hpp>
#include <respkit/string_hash.hpp>

#include <cstddef>
#include <functional>

namespace respkit::resp3 {

/// Structural hash, consistent with `equals`: equal messages hash equal.
///
/// The kind's prefix byte is mixed in first, so equal payloads of different
/// kinds usually differ. Arrays and sets fold their children in order; maps
/// combine entries independently of insertion order.
[[nodiscard]] auto hash(const message& msg) noexcept -> hash_type;

/// Hash functor for hash-keyed containers of messages.
struct message_hash {
  auto operator()(const message& msg) const noexcept -> std::size_t {
    return static_cast<std::size_t>(hash(msg));
  }
};

}  // namespace respkit::resp3

template <>
struct std::hash<respkit::resp3::message> : respkit::resp3::message_hash {};
