#include <gtest/gtest.h>
#include <respkit/resp3/message.hpp>

#include "test_util.hpp"

#include <utility>
#include <variant>

using namespace respkit::resp3;
using namespace respkit::test_util;

namespace {

TEST(resp3_message_test, default_is_null) {
  message msg;
  EXPECT_TRUE(msg.is_null());
  EXPECT_EQ(msg.get_kind(), kind::null);
}

TEST(resp3_message_test, scalar_creation) {
  message str{simple_string{"OK"}};
  EXPECT_EQ(str.get_kind(), kind::simple_string);
  EXPECT_TRUE(str.is<simple_string>());
  EXPECT_EQ(str.as<simple_string>().data, "OK");

  message n{number{-42}};
  EXPECT_EQ(n.get_kind(), kind::number);
  EXPECT_EQ(n.as<number>().value, -42);

  message b{boolean{false}};
  EXPECT_EQ(b.get_kind(), kind::boolean);
  EXPECT_FALSE(b.as<boolean>().value);

  message bulk{blob_string{"hello"}};
  EXPECT_EQ(bulk.get_kind(), kind::blob_string);
  EXPECT_EQ(bulk.as<blob_string>().data, "hello");
}

TEST(resp3_message_test, error_and_verbatim_payloads) {
  message err{blob_error{{"SYNTAX", "invalid syntax"}}};
  EXPECT_EQ(err.get_kind(), kind::blob_error);
  EXPECT_EQ(err.as<blob_error>().value.code, "SYNTAX");
  EXPECT_EQ(err.as<blob_error>().value.message, "invalid syntax");

  message vs{verbatim_string{verbatim_format::markdown, "*bold*"}};
  EXPECT_EQ(vs.get_kind(), kind::verbatim_string);
  EXPECT_EQ(verbatim_format_tag(vs.as<verbatim_string>().format), "mkd");
  EXPECT_EQ(verbatim_format_tag(verbatim_format::text), "txt");
}

TEST(resp3_message_test, aggregates) {
  array arr;
  arr.elements.push_back(message{number{1}});
  arr.elements.push_back(message{simple_string{"two"}});
  message array_msg{std::move(arr)};
  EXPECT_EQ(array_msg.get_kind(), kind::array);
  EXPECT_EQ(array_msg.as<array>().elements.size(), 2U);
  EXPECT_EQ(array_msg.as<array>().elements[0].as<number>().value, 1);

  auto s = make_set({num(1)});
  EXPECT_EQ(s.get_kind(), kind::set);

  auto m = make_map({{simple("key"), num(100)}});
  EXPECT_EQ(m.get_kind(), kind::map);
  EXPECT_EQ(m.as<map>().size(), 1U);
}

TEST(resp3_message_test, exactly_one_accessor_is_valid) {
  message n{number{7}};
  EXPECT_NE(n.try_as<number>(), nullptr);
  EXPECT_EQ(n.try_as<boolean>(), nullptr);
  EXPECT_EQ(n.try_as<simple_string>(), nullptr);
  EXPECT_THROW((void)n.as<blob_string>(), std::bad_variant_access);
}

TEST(resp3_message_test, classification_helpers) {
  message str{simple_string{"test"}};
  EXPECT_TRUE(str.is_string());
  EXPECT_TRUE(str.is_simple());
  EXPECT_FALSE(str.is_bulk());
  EXPECT_FALSE(str.is_error());

  message err{simple_error{{"ERR", "x"}}};
  EXPECT_TRUE(err.is_error());
  EXPECT_TRUE(err.is_simple());

  message berr{blob_error{{"ERR", "x"}}};
  EXPECT_TRUE(berr.is_error());
  EXPECT_TRUE(berr.is_bulk());

  EXPECT_TRUE(make_array({}).is_aggregate());
  EXPECT_TRUE(make_set({}).is_aggregate());
  EXPECT_TRUE(make_map({}).is_aggregate());
  EXPECT_FALSE(num(1).is_aggregate());
}

TEST(resp3_message_test, nested_structures) {
  auto nested = make_array({simple("start"), make_array({num(1), num(2)})});
  const auto& outer = nested.as<array>().elements;
  ASSERT_EQ(outer.size(), 2U);
  EXPECT_TRUE(outer[1].is<array>());
  EXPECT_EQ(outer[1].as<array>().elements.size(), 2U);
}

TEST(resp3_message_test, static_kind_ids) {
  static_assert(blob_string::kind_id == kind::blob_string);
  static_assert(number::kind_id == kind::number);
  static_assert(set::kind_id == kind::set);
  static_assert(map::kind_id == kind::map);
  static_assert(null::kind_id == kind::null);
}

}  // namespace
