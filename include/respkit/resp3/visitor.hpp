#pragma once

#include <respkit/resp3/message.hpp>

#include <utility>
#include <variant>

namespace respkit::resp3 {

/// Visit a message with a visitor callable.
/// The visitor must accept every value type; a missing overload is a compile
/// error, so adding a kind forces every operation to handle it.
template <typename Visitor>
auto visit(Visitor&& visitor, message& msg) -> decltype(auto) {
  return std::visit(std::forward<Visitor>(visitor), msg.value);
}

template <typename Visitor>
auto visit(Visitor&& visitor, const message& msg) -> decltype(auto) {
  return std::visit(std::forward<Visitor>(visitor), msg.value);
}

}  // namespace respkit::resp3
