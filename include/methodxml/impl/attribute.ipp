#include <methodxml/assert.hpp>
#include <methodxml/attribute.hpp>
#include <methodxml/names.hpp>

#include <charconv>

namespace methodxml {

namespace {

auto int_text(int v) -> std::string {
  char tmp[16]{};
  auto res = std::to_chars(tmp, tmp + sizeof(tmp), v);
  METHODXML_ASSERT(res.ec == std::errc{});
  return std::string(tmp, res.ptr);
}

auto text_attribute(std::string_view name, std::string_view value) -> attribute {
  if (is_blank(value)) {
    return attribute::empty();
  }
  return attribute{name, std::string(value)};
}

}  // namespace

auto is_blank(std::string_view text) noexcept -> bool {
  for (char c : text) {
    switch (c) {
      case ' ':
      case '\t':
      case '\n':
      case '\r':
      case '\v':
      case '\f':
        continue;
      default:
        return false;
    }
  }
  return true;
}

auto binary_operator_attribute(binary_operator_kind kind) -> attribute {
  if (kind == binary_operator_kind::none) {
    return attribute::empty();
  }
  return attribute{attribute_names::binary_operator, std::string(binary_operator_text(kind))};
}

auto full_name_attribute(std::string_view name) -> attribute {
  return text_attribute(attribute_names::full_name, name);
}

auto implicit_attribute(std::optional<bool> is_implicit) -> attribute {
  if (!is_implicit.has_value()) {
    return attribute::empty();
  }
  return attribute{attribute_names::implicit, *is_implicit ? "yes" : "no"};
}

auto line_attribute(int line) -> attribute {
  return attribute{attribute_names::line, int_text(line)};
}

auto name_attribute(std::string_view name) -> attribute {
  return text_attribute(attribute_names::name, name);
}

auto rank_attribute(int rank) -> attribute {
  if (rank < 1) {
    return attribute::empty();
  }
  return attribute{attribute_names::rank, int_text(rank)};
}

auto special_cast_attribute(std::optional<special_cast_kind> kind) -> attribute {
  if (!kind.has_value()) {
    return attribute::empty();
  }
  switch (*kind) {
    case special_cast_kind::direct_cast:
      return attribute{attribute_names::direct_cast, "yes"};
    case special_cast_kind::try_cast:
      return attribute{attribute_names::try_cast, "yes"};
  }
  METHODXML_UNREACHABLE();
}

auto type_attribute(std::string_view type_name) -> attribute {
  return text_attribute(attribute_names::type, type_name);
}

auto variable_kind_attribute(variable_kind kind) -> attribute {
  if (kind == variable_kind::none) {
    return attribute::empty();
  }
  return attribute{attribute_names::variable_kind, std::string(variable_kind_text(kind))};
}

}  // namespace methodxml
