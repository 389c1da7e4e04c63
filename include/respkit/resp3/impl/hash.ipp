#include <respkit/resp3/hash.hpp>
#include <respkit/resp3/visitor.hpp>

#include <vector>

namespace respkit::resp3 {

namespace {

auto hash_reply(const error_reply& e) noexcept -> hash_type {
  return finalize(mix(hash_bytes(e.code), hash_bytes(e.message)));
}

auto hash_sequence(const std::vector<message>& elements) noexcept -> hash_type {
  hash_type acc = 0;
  for (const auto& elem : elements) {
    acc = mix(acc, hash(elem));
  }
  return finalize(acc);
}

// Per-kind payload hash, before the kind tag is mixed in.
struct hash_visitor {
  auto operator()(const blob_string& v) const noexcept -> hash_type { return hash_bytes(v.data); }

  auto operator()(const simple_string& v) const noexcept -> hash_type {
    return hash_bytes(v.data);
  }

  auto operator()(const simple_error& v) const noexcept -> hash_type {
    return hash_reply(v.value);
  }

  auto operator()(const number& v) const noexcept -> hash_type { return hash_int64(v.value); }

  auto operator()(const null&) const noexcept -> hash_type { return 0; }

  auto operator()(const boolean& v) const noexcept -> hash_type { return v.value ? 1 : 0; }

  auto operator()(const blob_error& v) const noexcept -> hash_type { return hash_reply(v.value); }

  auto operator()(const verbatim_string& v) const noexcept -> hash_type {
    return finalize(mix(static_cast<hash_type>(v.format), hash_bytes(v.data)));
  }

  auto operator()(const array& v) const noexcept -> hash_type {
    return hash_sequence(v.elements);
  }

  auto operator()(const set& v) const noexcept -> hash_type { return hash_sequence(v.elements); }

  // Map equality ignores insertion order, so entry hashes are combined with
  // wrapping addition.
  auto operator()(const map& v) const noexcept -> hash_type {
    hash_type sum = 0;
    for (const auto& [key, value] : v) {
      sum += finalize(mix(hash(key), hash(value)));
    }
    return finalize(mix(0, sum));
  }
};

}  // namespace

auto hash(const message& msg) noexcept -> hash_type {
  auto tag = static_cast<unsigned char>(kind_to_prefix(msg.get_kind()));
  auto result = mix(0, tag);
  auto child = visit(hash_visitor{}, msg);
  return finalize(mix(result, child));
}

}  // namespace respkit::resp3
