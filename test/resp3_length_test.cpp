#include <gtest/gtest.h>
#include <respkit/resp3/length.hpp>

#include "test_util.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

using namespace respkit::resp3;
using namespace respkit::test_util;

namespace {

// The literal wire form is the reference: its size is the expected length.
void expect_length(const message& msg, std::string_view wire) {
  EXPECT_EQ(encoded_length(msg), wire.size()) << "wire: " << wire;
}

TEST(resp3_length_test, decimal_width_of_signed_values) {
  EXPECT_EQ(decimal_width(std::int64_t{0}), 1U);
  EXPECT_EQ(decimal_width(std::int64_t{9}), 1U);
  EXPECT_EQ(decimal_width(std::int64_t{10}), 2U);
  EXPECT_EQ(decimal_width(std::int64_t{99}), 2U);
  EXPECT_EQ(decimal_width(std::int64_t{100}), 3U);
  EXPECT_EQ(decimal_width(std::int64_t{-1}), 2U);
  EXPECT_EQ(decimal_width(std::int64_t{-10}), 3U);
  EXPECT_EQ(decimal_width(std::numeric_limits<std::int64_t>::max()), 19U);
  EXPECT_EQ(decimal_width(std::numeric_limits<std::int64_t>::min()), 20U);
}

TEST(resp3_length_test, decimal_width_of_unsigned_values) {
  EXPECT_EQ(decimal_width(std::size_t{0}), 1U);
  EXPECT_EQ(decimal_width(std::size_t{1000}), 4U);
  EXPECT_EQ(decimal_width(std::numeric_limits<std::uint64_t>::max()), 20U);
}

TEST(resp3_length_test, decimal_width_matches_printed_form) {
  for (std::int64_t v : {std::int64_t{-123456}, std::int64_t{-7}, std::int64_t{0},
                         std::int64_t{42}, std::int64_t{999999}, std::int64_t{1000000}}) {
    EXPECT_EQ(decimal_width(v), std::to_string(v).size()) << v;
  }
}

TEST(resp3_length_test, decimal_width_is_constexpr) {
  static_assert(decimal_width(0) == 1);
  static_assert(decimal_width(-5) == 2);
  static_assert(decimal_width(12345U) == 5);
}

TEST(resp3_length_test, blob_string) {
  expect_length(blob("helloworld"), "$10\r\nhelloworld\r\n");
  EXPECT_EQ(encoded_length(blob("helloworld")), 17U);
  expect_length(blob(""), "$0\r\n\r\n");
  expect_length(blob("xxxxxxxxxxxx"), "$12\r\nxxxxxxxxxxxx\r\n");
}

TEST(resp3_length_test, simple_string) {
  expect_length(simple("hello world"), "+hello world\r\n");
  EXPECT_EQ(encoded_length(simple("hello world")), 14U);
  expect_length(simple(""), "+\r\n");
}

TEST(resp3_length_test, simple_error) {
  message err{simple_error{{"ERR", "this is the error description"}}};
  expect_length(err, "-ERR this is the error description\r\n");

  message empty{simple_error{{"", ""}}};
  expect_length(empty, "- \r\n");
}

TEST(resp3_length_test, number) {
  expect_length(num(1234), ":1234\r\n");
  EXPECT_EQ(encoded_length(num(1234)), 7U);
  expect_length(num(0), ":0\r\n");
  expect_length(num(-42), ":-42\r\n");
  expect_length(num(std::numeric_limits<std::int64_t>::min()), ":-9223372036854775808\r\n");
  expect_length(num(std::numeric_limits<std::int64_t>::max()), ":9223372036854775807\r\n");
}

TEST(resp3_length_test, null_and_boolean) {
  expect_length(message{null{}}, "_\r\n");
  expect_length(message{boolean{true}}, "#t\r\n");
  expect_length(message{boolean{false}}, "#f\r\n");
}

TEST(resp3_length_test, blob_error) {
  message err{blob_error{{"SYNTAX", "invalid syntax"}}};
  expect_length(err, "!21\r\nSYNTAX invalid syntax\r\n");

  // The separator pushes the payload length from 9 to 10: one more digit.
  message boundary{blob_error{{"ERRO", "12345"}}};
  expect_length(boundary, "!10\r\nERRO 12345\r\n");

  message empty{blob_error{{"", ""}}};
  expect_length(empty, "!1\r\n \r\n");
}

TEST(resp3_length_test, verbatim_string) {
  message text{verbatim_string{verbatim_format::text, "Some string"}};
  expect_length(text, "=15\r\ntxt:Some string\r\n");

  message md{verbatim_string{verbatim_format::markdown, ""}};
  expect_length(md, "=4\r\nmkd:\r\n");
}

TEST(resp3_length_test, array_of_numbers) {
  expect_length(make_array({num(1), num(2), num(3)}), "*3\r\n:1\r\n:2\r\n:3\r\n");
  expect_length(make_array({}), "*0\r\n");
}

TEST(resp3_length_test, array_count_with_two_digits) {
  array arr;
  for (std::int64_t i = 0; i < 10; ++i) {
    arr.elements.push_back(num(i));
  }
  expect_length(message{std::move(arr)},
                "*10\r\n:0\r\n:1\r\n:2\r\n:3\r\n:4\r\n:5\r\n:6\r\n:7\r\n:8\r\n:9\r\n");
}

TEST(resp3_length_test, set_of_mixed_kinds) {
  auto s = make_set({simple("orange"), simple("apple"), message{boolean{true}}, num(100), num(999)});
  expect_length(s, "~5\r\n+orange\r\n+apple\r\n#t\r\n:100\r\n:999\r\n");
  expect_length(make_set({}), "~0\r\n");
}

TEST(resp3_length_test, map_counts_pairs) {
  auto m = make_map({{simple("first"), num(1)}, {simple("second"), num(2)}});
  expect_length(m, "%2\r\n+first\r\n:1\r\n+second\r\n:2\r\n");
  expect_length(make_map({}), "%0\r\n");
}

TEST(resp3_length_test, nested_aggregates) {
  auto nested = make_array({
    make_array({num(1), message{null{}}}),
    make_map({{blob("key"), make_set({message{boolean{false}}})}}),
  });
  expect_length(nested, "*2\r\n*2\r\n:1\r\n_\r\n%1\r\n$3\r\nkey\r\n~1\r\n#f\r\n");
}

TEST(resp3_length_test, aggregate_length_is_additive) {
  auto a = blob("alpha");
  auto b = num(-7);
  auto c = message{verbatim_string{verbatim_format::text, "gamma"}};
  auto arr = make_array({a, b, c});

  EXPECT_EQ(encoded_length(arr), 3 + decimal_width(std::size_t{3}) + encoded_length(a) +
                                   encoded_length(b) + encoded_length(c));
}

TEST(resp3_length_test, repeated_calls_agree) {
  auto m = make_map({{make_array({num(1)}), simple("v")}});
  auto first = encoded_length(m);
  EXPECT_EQ(encoded_length(m), first);
}

}  // namespace
