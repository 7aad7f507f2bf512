#pragma once

#include <methodxml/attribute.hpp>
#include <methodxml/config.hpp>
#include <methodxml/kind.hpp>
#include <methodxml/names.hpp>
#include <methodxml/number.hpp>
#include <methodxml/source_text.hpp>
#include <methodxml/symbol.hpp>
#include <methodxml/writer.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace methodxml {

/// Emission substrate for one method body.
///
/// A language visitor walks the body and calls into this class: the *_tag() functions open one
/// element each and return the scope that closes it; generate_*() emit complete literal, type and
/// reference shapes.
///
///   {
///     auto stmt = b.expression_statement_tag(b.get_line_number(pos));
///     auto call = b.method_call_tag();
///     b.generate_this_reference();
///   }
///
/// Speculative output is dropped with mark()/rewind(); every scope opened after the mark must be
/// closed before rewinding, and every scope open at the mark must still be open.
class method_xml_builder {
 public:
  using scope = writer::element_scope;
  using checkpoint = writer::checkpoint;

  explicit method_xml_builder(source_text const& text, config cfg = {});

  method_xml_builder(method_xml_builder const&) = delete;
  auto operator=(method_xml_builder const&) -> method_xml_builder& = delete;

  // -------------------- tags --------------------

  [[nodiscard]] auto argument_tag() -> scope { return writer_.open(element_names::argument); }

  [[nodiscard]] auto array_element_access_tag() -> scope {
    return writer_.open(element_names::array_element_access);
  }

  [[nodiscard]] auto array_tag() -> scope { return writer_.open(element_names::array); }

  [[nodiscard]] auto array_type_tag(int rank) -> scope {
    return writer_.open(element_names::array_type, rank_attribute(rank));
  }

  [[nodiscard]] auto assignment_tag(binary_operator_kind kind = binary_operator_kind::none)
    -> scope {
    return writer_.open(element_names::assignment, binary_operator_attribute(kind));
  }

  [[nodiscard]] auto binary_operation_tag(binary_operator_kind kind) -> scope {
    return writer_.open(element_names::binary_operation, binary_operator_attribute(kind));
  }

  [[nodiscard]] auto block_tag() -> scope { return writer_.open(element_names::block); }
  [[nodiscard]] auto boolean_tag() -> scope { return writer_.open(element_names::boolean); }
  [[nodiscard]] auto bound_tag() -> scope { return writer_.open(element_names::bound); }

  [[nodiscard]] auto cast_tag(std::optional<special_cast_kind> kind = std::nullopt) -> scope {
    return writer_.open(element_names::cast, special_cast_attribute(kind));
  }

  [[nodiscard]] auto char_tag() -> scope { return writer_.open(element_names::char_); }
  [[nodiscard]] auto comment_tag() -> scope { return writer_.open(element_names::comment); }
  [[nodiscard]] auto expression_tag() -> scope { return writer_.open(element_names::expression); }

  [[nodiscard]] auto expression_statement_tag(int line) -> scope {
    return writer_.open(element_names::expression_statement, line_attribute(line));
  }

  [[nodiscard]] auto literal_tag() -> scope { return writer_.open(element_names::literal); }

  [[nodiscard]] auto local_tag(int line) -> scope {
    return writer_.open(element_names::local, line_attribute(line));
  }

  [[nodiscard]] auto method_call_tag() -> scope {
    return writer_.open(element_names::method_call);
  }

  [[nodiscard]] auto name_tag() -> scope { return writer_.open(element_names::name); }

  [[nodiscard]] auto name_ref_tag(variable_kind kind, std::string_view name = {},
                                  std::string_view full_name = {}) -> scope {
    return writer_.open(element_names::name_ref, variable_kind_attribute(kind),
                        name_attribute(name), full_name_attribute(full_name));
  }

  [[nodiscard]] auto new_array_tag() -> scope { return writer_.open(element_names::new_array); }
  [[nodiscard]] auto new_class_tag() -> scope { return writer_.open(element_names::new_class); }

  [[nodiscard]] auto new_delegate_tag(std::string_view name) -> scope {
    return writer_.open(element_names::new_delegate, name_attribute(name));
  }

  [[nodiscard]] auto number_tag(std::string_view type_name = {}) -> scope {
    return writer_.open(element_names::number, type_attribute(type_name));
  }

  [[nodiscard]] auto parentheses_tag() -> scope {
    return writer_.open(element_names::parentheses);
  }

  [[nodiscard]] auto quote_tag(int line) -> scope {
    return writer_.open(element_names::quote, line_attribute(line));
  }

  [[nodiscard]] auto string_tag() -> scope { return writer_.open(element_names::string); }

  [[nodiscard]] auto type_tag(std::optional<bool> is_implicit = std::nullopt) -> scope {
    return writer_.open(element_names::type, implicit_attribute(is_implicit));
  }

  auto base_reference_tag() -> void { writer_.leaf(element_names::base_reference); }
  auto null_tag() -> void { writer_.leaf(element_names::null); }
  auto this_reference_tag() -> void { writer_.leaf(element_names::this_reference); }

  // -------------------- raw output --------------------

  auto encoded_text(std::string_view text) -> void { writer_.text(text); }
  auto line_break() -> void { writer_.line_break(); }

  [[nodiscard]] auto mark() const noexcept -> checkpoint { return writer_.mark(); }
  auto rewind(checkpoint const& mark) -> void { writer_.rewind(mark); }

  [[nodiscard]] auto view() const noexcept -> std::string_view { return writer_.view(); }
  [[nodiscard]] auto str() const -> std::string { return writer_.str(); }
  [[nodiscard]] auto take() -> std::string { return writer_.take(); }

  // -------------------- queries --------------------

  /// NameRef classification of a symbol; a missing symbol is `unknown`.
  [[nodiscard]] auto get_variable_kind(symbol const* sym) const -> variable_kind;

  [[nodiscard]] auto get_type_name(type_symbol const& type) const -> std::string;

  [[nodiscard]] auto get_line_number(std::size_t position) const -> int {
    return text_->line_index(position);
  }

  [[nodiscard]] auto get_special_type(special_type type) const -> type_ptr;

  // -------------------- generators --------------------

  /// `<Quote line="N">source text</Quote>` for constructs the visitor does not model.
  auto generate_unknown(syntax_node const& node) -> void;

  auto generate_name(std::string_view name) -> void;

  /// Arrays become nested `<ArrayType rank="R">` wrappers around the element type.
  auto generate_type(type_symbol const& type, std::optional<bool> is_implicit = std::nullopt,
                     bool assembly_qualify = false) -> void;

  auto generate_type(special_type type) -> void;

  /// `<Literal><Null/></Literal>`
  auto generate_null_literal() -> void;

  auto generate_number(number const& value, type_symbol const& type) -> void;
  auto generate_number(number const& value, special_type type) -> void;

  /// Typed by the value itself (`double` is `System.Double`, ...).
  auto generate_number(number const& value) -> void;

  auto generate_char(char32_t value) -> void;
  auto generate_string(std::string_view value) -> void;
  auto generate_boolean(bool value) -> void;

  auto generate_this_reference() -> void { this_reference_tag(); }
  auto generate_base_reference() -> void { base_reference_tag(); }

 private:
  source_text const* text_;
  config cfg_;
  writer writer_;
};

}  // namespace methodxml
