#include <methodxml/builder.hpp>
#include <methodxml/logger.hpp>

#include <utility>

namespace methodxml {

namespace {

auto append_utf8(std::string& out, char32_t cp) -> void {
  if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
    cp = 0xFFFD;
  }
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

}  // namespace

method_xml_builder::method_xml_builder(source_text const& text, config cfg)
    : text_(&text), cfg_(std::move(cfg)), writer_(cfg_) {}

auto method_xml_builder::get_variable_kind(symbol const* sym) const -> variable_kind {
  if (sym == nullptr) {
    return variable_kind::unknown;
  }
  return to_variable_kind(sym->kind);
}

auto method_xml_builder::get_type_name(type_symbol const& type) const -> std::string {
  if (!type.is_array()) {
    return type.metadata_name;
  }

  METHODXML_ENSURE(type.element_type != nullptr, "array type without element type");
  auto name = get_type_name(*type.element_type);
  name.push_back('[');
  name.append(static_cast<std::size_t>(type.rank - 1), ',');
  name.push_back(']');
  return name;
}

auto method_xml_builder::get_special_type(special_type type) const -> type_ptr {
  return make_named_type(std::string(special_type_name(type)), cfg_.core_library_name);
}

auto method_xml_builder::generate_unknown(syntax_node const& node) -> void {
  auto const line = get_line_number(node.span_start);
  METHODXML_LOG_DEBUG("quoting {} bytes of unmodeled source at line {}", node.text.size(), line);
  auto tag = quote_tag(line);
  encoded_text(node.text);
}

auto method_xml_builder::generate_name(std::string_view name) -> void {
  auto tag = name_tag();
  encoded_text(name);
}

auto method_xml_builder::generate_type(type_symbol const& type, std::optional<bool> is_implicit,
                                       bool assembly_qualify) -> void {
  if (type.is_array()) {
    METHODXML_ENSURE(type.element_type != nullptr, "array type without element type");
    auto tag = array_type_tag(type.rank);
    generate_type(*type.element_type, is_implicit, assembly_qualify);
    return;
  }

  auto tag = type_tag(is_implicit);
  auto type_name = get_type_name(type);
  if (assembly_qualify) {
    type_name += ", ";
    type_name += type.assembly_name;
  }
  encoded_text(type_name);
}

auto method_xml_builder::generate_type(special_type type) -> void {
  generate_type(*get_special_type(type));
}

auto method_xml_builder::generate_null_literal() -> void {
  auto tag = literal_tag();
  null_tag();
}

auto method_xml_builder::generate_number(number const& value, type_symbol const& type) -> void {
  auto tag = number_tag(get_type_name(type));
  encoded_text(format_number(value));
}

auto method_xml_builder::generate_number(number const& value, special_type type) -> void {
  generate_number(value, *get_special_type(type));
}

auto method_xml_builder::generate_number(number const& value) -> void {
  generate_number(value, number_type(value));
}

auto method_xml_builder::generate_char(char32_t value) -> void {
  auto tag = char_tag();
  std::string text;
  append_utf8(text, value);
  encoded_text(text);
}

auto method_xml_builder::generate_string(std::string_view value) -> void {
  auto tag = string_tag();
  encoded_text(value);
}

auto method_xml_builder::generate_boolean(bool value) -> void {
  auto tag = boolean_tag();
  encoded_text(value ? "true" : "false");
}

}  // namespace methodxml
