#include <respkit/resp3/length.hpp>
#include <respkit/resp3/visitor.hpp>

#include <vector>

namespace respkit::resp3 {

namespace {

// Prefix byte plus the CRLF closing the header line.
constexpr std::size_t k_header_overhead = 3;

// CRLF closing the payload of a length-prefixed kind.
constexpr std::size_t k_crlf = 2;

// Space joining an error's code and message.
constexpr std::size_t k_error_separator = 1;

// 3-byte format tag plus ':' in front of verbatim data.
constexpr std::size_t k_verbatim_tag_len = 4;

struct length_visitor {
  // <prefix><len>\r\n<payload>\r\n
  static auto bulk(std::size_t payload_len) noexcept -> std::size_t {
    return k_header_overhead + decimal_width(payload_len) + payload_len + k_crlf;
  }

  // <prefix><count>\r\n<element>...
  static auto aggregate(const std::vector<message>& elements) noexcept -> std::size_t {
    auto total = k_header_overhead + decimal_width(elements.size());
    for (const auto& elem : elements) {
      total += encoded_length(elem);
    }
    return total;
  }

  auto operator()(const blob_string& v) const noexcept -> std::size_t {
    return bulk(v.data.size());
  }

  auto operator()(const simple_string& v) const noexcept -> std::size_t {
    return k_header_overhead + v.data.size();
  }

  auto operator()(const simple_error& v) const noexcept -> std::size_t {
    return k_header_overhead + v.value.code.size() + k_error_separator + v.value.message.size();
  }

  auto operator()(const number& v) const noexcept -> std::size_t {
    return k_header_overhead + decimal_width(v.value);
  }

  auto operator()(const null&) const noexcept -> std::size_t { return k_header_overhead; }

  // #t or #f
  auto operator()(const boolean&) const noexcept -> std::size_t { return k_header_overhead + 1; }

  auto operator()(const blob_error& v) const noexcept -> std::size_t {
    return bulk(v.value.code.size() + k_error_separator + v.value.message.size());
  }

  auto operator()(const verbatim_string& v) const noexcept -> std::size_t {
    return bulk(k_verbatim_tag_len + v.data.size());
  }

  auto operator()(const array& v) const noexcept -> std::size_t { return aggregate(v.elements); }

  auto operator()(const set& v) const noexcept -> std::size_t { return aggregate(v.elements); }

  // The header counts pairs, not keys plus values.
  auto operator()(const map& v) const noexcept -> std::size_t {
    auto total = k_header_overhead + decimal_width(v.size());
    for (const auto& [key, value] : v) {
      total += encoded_length(key) + encoded_length(value);
    }
    return total;
  }
};

}  // namespace

auto encoded_length(const message& msg) noexcept -> std::size_t {
  return visit(length_visitor{}, msg);
}

}  // namespace respkit::resp3
