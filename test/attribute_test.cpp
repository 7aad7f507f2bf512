#include <gtest/gtest.h>

#include <methodxml/attribute.hpp>
#include <methodxml/kind.hpp>

#include <optional>

using namespace methodxml;

TEST(attribute_test, binary_operator_tokens) {
  EXPECT_EQ(binary_operator_text(binary_operator_kind::plus), "plus");
  EXPECT_EQ(binary_operator_text(binary_operator_kind::bitwise_or), "bitor");
  EXPECT_EQ(binary_operator_text(binary_operator_kind::bitwise_and), "bitand");
  EXPECT_EQ(binary_operator_text(binary_operator_kind::concatenate), "concatenate");
  EXPECT_EQ(binary_operator_text(binary_operator_kind::add_delegate), "adddelegate");

  auto attr = binary_operator_attribute(binary_operator_kind::concatenate);
  ASSERT_FALSE(attr.is_empty());
  EXPECT_EQ(attr.name, "binaryoperator");
  EXPECT_EQ(attr.value, "concatenate");
}

TEST(attribute_test, variable_kind_tokens) {
  EXPECT_EQ(variable_kind_text(variable_kind::property), "property");
  EXPECT_EQ(variable_kind_text(variable_kind::method), "method");
  EXPECT_EQ(variable_kind_text(variable_kind::field), "field");
  EXPECT_EQ(variable_kind_text(variable_kind::local), "local");
  EXPECT_EQ(variable_kind_text(variable_kind::unknown), "unknown");

  auto attr = variable_kind_attribute(variable_kind::local);
  EXPECT_EQ(attr.name, "variablekind");
  EXPECT_EQ(attr.value, "local");
}

TEST(attribute_test, none_inputs_produce_empty_attribute) {
  EXPECT_TRUE(binary_operator_attribute(binary_operator_kind::none).is_empty());
  EXPECT_TRUE(variable_kind_attribute(variable_kind::none).is_empty());
  EXPECT_TRUE(implicit_attribute(std::nullopt).is_empty());
  EXPECT_TRUE(special_cast_attribute(std::nullopt).is_empty());
  EXPECT_TRUE(name_attribute("").is_empty());
  EXPECT_TRUE(name_attribute("  \t").is_empty());
  EXPECT_TRUE(full_name_attribute("").is_empty());
  EXPECT_TRUE(full_name_attribute("\r\n").is_empty());
  EXPECT_TRUE(type_attribute(" ").is_empty());
  EXPECT_TRUE(rank_attribute(0).is_empty());
  EXPECT_TRUE(attribute::empty().is_empty());
}

TEST(attribute_test, empty_value_is_not_empty_attribute) {
  attribute attr{"name", ""};
  EXPECT_FALSE(attr.is_empty());
}

TEST(attribute_test, implicit_is_tri_state) {
  auto yes = implicit_attribute(true);
  EXPECT_EQ(yes.name, "implicit");
  EXPECT_EQ(yes.value, "yes");

  auto no = implicit_attribute(false);
  EXPECT_EQ(no.name, "implicit");
  EXPECT_EQ(no.value, "no");
}

TEST(attribute_test, special_cast_uses_distinct_attribute_names) {
  auto direct = special_cast_attribute(special_cast_kind::direct_cast);
  EXPECT_EQ(direct.name, "directcast");
  EXPECT_EQ(direct.value, "yes");

  auto try_cast = special_cast_attribute(special_cast_kind::try_cast);
  EXPECT_EQ(try_cast.name, "trycast");
  EXPECT_EQ(try_cast.value, "yes");
}

TEST(attribute_test, numeric_attributes) {
  EXPECT_EQ(line_attribute(0).value, "0");
  EXPECT_EQ(line_attribute(42).value, "42");
  EXPECT_EQ(line_attribute(42).name, "line");
  EXPECT_EQ(rank_attribute(1).value, "1");
  EXPECT_EQ(rank_attribute(3).name, "rank");
}

TEST(attribute_test, text_attributes_keep_value_verbatim) {
  // Escaping happens in the writer, not here.
  auto attr = full_name_attribute("N.C<T>.M");
  EXPECT_EQ(attr.name, "fullname");
  EXPECT_EQ(attr.value, "N.C<T>.M");

  EXPECT_EQ(name_attribute(" x ").value, " x ");
  EXPECT_EQ(type_attribute("System.Int32").name, "type");
}

TEST(attribute_test, symbol_kinds_map_to_variable_kinds) {
  EXPECT_EQ(to_variable_kind(symbol_kind::field), variable_kind::field);
  EXPECT_EQ(to_variable_kind(symbol_kind::event), variable_kind::field);
  EXPECT_EQ(to_variable_kind(symbol_kind::local), variable_kind::local);
  EXPECT_EQ(to_variable_kind(symbol_kind::parameter), variable_kind::local);
  EXPECT_EQ(to_variable_kind(symbol_kind::method), variable_kind::method);
  EXPECT_EQ(to_variable_kind(symbol_kind::property), variable_kind::property);
}

TEST(attribute_test, special_type_names) {
  EXPECT_EQ(special_type_name(special_type::system_int32), "System.Int32");
  EXPECT_EQ(special_type_name(special_type::system_double), "System.Double");
  EXPECT_EQ(special_type_name(special_type::system_string), "System.String");
}

TEST(attribute_death_test, unmapped_binary_operator_is_fatal) {
  EXPECT_DEATH((void)binary_operator_text(static_cast<binary_operator_kind>(99)),
               "Invalid binary_operator_kind: 99");
  EXPECT_DEATH((void)binary_operator_text(binary_operator_kind::none),
               "Invalid binary_operator_kind: 0");
}

TEST(attribute_death_test, unmapped_variable_kind_is_fatal) {
  EXPECT_DEATH((void)variable_kind_attribute(static_cast<variable_kind>(42)),
               "Invalid variable_kind: 42");
}

TEST(attribute_death_test, unmapped_symbol_kind_is_fatal) {
  EXPECT_DEATH((void)to_variable_kind(symbol_kind::namespace_), "Invalid symbol_kind");
}

TEST(attribute_death_test, out_of_range_cast_kind_is_fatal) {
  EXPECT_DEATH((void)special_cast_attribute(static_cast<special_cast_kind>(7)),
               "UNREACHABLE failure");
}
