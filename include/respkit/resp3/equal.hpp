#pragma once

#include <respkit/resp3/message.hpp>

namespace respkit::resp3 {

/// Deep structural equality.
///
/// Messages of different kinds are never equal. Arrays and sets compare
/// element-wise in order; maps compare by key lookup, independent of
/// insertion order.
[[nodiscard]] auto equals(const message& a, const message& b) noexcept -> bool;

[[nodiscard]] inline auto operator==(const message& a, const message& b) noexcept -> bool {
  return equals(a, b);
}

/// Key-equality functor matching `message_hash`.
struct message_equal {
  auto operator()(const message& a, const message& b) const noexcept -> bool {
    return equals(a, b);
  }
};

}  // namespace respkit::resp3
