#include <respkit/assert.hpp>
#include <respkit/resp3/equal.hpp>
#include <respkit/resp3/visitor.hpp>

#include <vector>

namespace respkit::resp3 {

namespace {

auto same_reply(const error_reply& a, const error_reply& b) noexcept -> bool {
  return a.code == b.code && a.message == b.message;
}

auto same_sequence(const std::vector<message>& a, const std::vector<message>& b) noexcept
  -> bool {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (!equals(a[i], b[i])) {
      return false;
    }
  }
  return true;
}

// Equal sizes plus unique keys make one-directional coverage sufficient.
auto same_map(const map& a, const map& b) noexcept -> bool {
  if (a.size() != b.size()) {
    return false;
  }
  for (const auto& [key, value] : a) {
    const auto* other = b.find(key);
    if (other == nullptr || !equals(value, *other)) {
      return false;
    }
  }
  return true;
}

// Payload of `m`, known to hold `T` because the kinds already matched.
template <typename T>
auto peer(const message& m) noexcept -> const T& {
  const auto* p = m.try_as<T>();
  RESPKIT_ASSERT(p != nullptr, "kind mismatch after kind check");
  return *p;
}

struct equal_visitor {
  const message& rhs;

  auto operator()(const blob_string& v) const noexcept -> bool {
    return v.data == peer<blob_string>(rhs).data;
  }

  auto operator()(const simple_string& v) const noexcept -> bool {
    return v.data == peer<simple_string>(rhs).data;
  }

  auto operator()(const simple_error& v) const noexcept -> bool {
    return same_reply(v.value, peer<simple_error>(rhs).value);
  }

  auto operator()(const number& v) const noexcept -> bool {
    return v.value == peer<number>(rhs).value;
  }

  auto operator()(const null&) const noexcept -> bool { return true; }

  auto operator()(const boolean& v) const noexcept -> bool {
    return v.value == peer<boolean>(rhs).value;
  }

  auto operator()(const blob_error& v) const noexcept -> bool {
    return same_reply(v.value, peer<blob_error>(rhs).value);
  }

  auto operator()(const verbatim_string& v) const noexcept -> bool {
    const auto& other = peer<verbatim_string>(rhs);
    return v.format == other.format && v.data == other.data;
  }

  auto operator()(const array& v) const noexcept -> bool {
    return same_sequence(v.elements, peer<array>(rhs).elements);
  }

  // Order-sensitive, like array.
  auto operator()(const set& v) const noexcept -> bool {
    return same_sequence(v.elements, peer<set>(rhs).elements);
  }

  auto operator()(const map& v) const noexcept -> bool { return same_map(v, peer<map>(rhs)); }
};

}  // namespace

auto equals(const message& a, const message& b) noexcept -> bool {
  if (&a == &b) {
    return true;
  }
  if (a.get_kind() != b.get_kind()) {
    return false;
  }
  return visit(equal_visitor{b}, a);
}

}  // namespace respkit::resp3
