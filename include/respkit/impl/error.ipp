#include <respkit/assert.hpp>
#include <respkit/error.hpp>

#include <string>

namespace respkit {
namespace detail {

struct error_category_impl : std::error_category {
  virtual ~error_category_impl() = default;

  auto name() const noexcept -> char const* override {
    return "respkit";
  }

  auto message(int ev) const -> std::string override {
    // clang-format off
    switch (static_cast<error>(ev)) {
      case error::unsupported_kind:  return "RESP3 kind is not supported by the value model.";
      case error::invalid_prefix:    return "Not a RESP3 type prefix.";
      case error::map_key_collision: return "Map already contains an equal key.";
    }
    // clang-format on
    return "respkit error.";
  }
};

auto category() -> std::error_category const& {
  static error_category_impl instance;
  return instance;
}

}  // namespace detail

auto make_error_code(error e) -> std::error_code {
  return std::error_code{static_cast<int>(e), detail::category()};
}

}  // namespace respkit
