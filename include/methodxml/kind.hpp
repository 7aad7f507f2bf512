#pragma once

#include <methodxml/assert.hpp>

#include <cstdint>
#include <string_view>

namespace methodxml {

// clang-format off

/// Binary operator classification carried by Assignment and BinaryOperation elements.
enum class binary_operator_kind : std::uint8_t {
  none,          // no attribute
  plus,
  bitwise_or,
  bitwise_and,
  concatenate,
  add_delegate,
};

/// How a NameRef resolves.
enum class variable_kind : std::uint8_t {
  none,          // no attribute
  property,
  method,
  field,
  local,
  unknown,
};

/// Language-specific cast forms; a plain cast has no special kind.
enum class special_cast_kind : std::uint8_t {
  direct_cast,
  try_cast,
};

/// Symbol kinds reported by the analysis layer.
enum class symbol_kind : std::uint8_t {
  alias,
  array_type,
  assembly,
  dynamic_type,
  error_type,
  event,
  field,
  label,
  local,
  method,
  net_module,
  named_type,
  namespace_,
  parameter,
  pointer_type,
  property,
  range_variable,
  type_parameter,
  preprocessing,
  discard,
  function_pointer_type,
};

/// Built-in types the builder can emit without a type symbol.
enum class special_type : std::uint8_t {
  system_object,
  system_void,
  system_boolean,
  system_char,
  system_sbyte,
  system_byte,
  system_int16,
  system_uint16,
  system_int32,
  system_uint32,
  system_int64,
  system_uint64,
  system_decimal,
  system_single,
  system_double,
  system_string,
};

// clang-format on

/// Attribute token for an operator kind.
///
/// `none` never reaches this table: the attribute builder maps it to an empty attribute first.
[[nodiscard]] inline auto binary_operator_text(binary_operator_kind kind) -> std::string_view {
  // clang-format off
  switch (kind) {
    case binary_operator_kind::plus:         return "plus";
    case binary_operator_kind::bitwise_or:   return "bitor";
    case binary_operator_kind::bitwise_and:  return "bitand";
    case binary_operator_kind::concatenate:  return "concatenate";
    case binary_operator_kind::add_delegate: return "adddelegate";
    case binary_operator_kind::none:         break;
  }
  // clang-format on
  METHODXML_INVALID_ENUM("binary_operator_kind", kind);
}

/// Attribute token for a variable kind. `none` is handled by the caller, as above.
[[nodiscard]] inline auto variable_kind_text(variable_kind kind) -> std::string_view {
  // clang-format off
  switch (kind) {
    case variable_kind::property: return "property";
    case variable_kind::method:   return "method";
    case variable_kind::field:    return "field";
    case variable_kind::local:    return "local";
    case variable_kind::unknown:  return "unknown";
    case variable_kind::none:     break;
  }
  // clang-format on
  METHODXML_INVALID_ENUM("variable_kind", kind);
}

/// Classify a symbol kind for a NameRef.
///
/// Only symbols that can appear as a name in an expression are mapped; anything else means the
/// caller's visitor handed us a symbol it should have dealt with itself.
[[nodiscard]] inline auto to_variable_kind(symbol_kind kind) -> variable_kind {
  switch (kind) {
    case symbol_kind::event:
    case symbol_kind::field:
      return variable_kind::field;
    case symbol_kind::local:
    case symbol_kind::parameter:
      return variable_kind::local;
    case symbol_kind::method:
      return variable_kind::method;
    case symbol_kind::property:
      return variable_kind::property;
    default:
      break;
  }
  METHODXML_INVALID_ENUM("symbol_kind", kind);
}

/// Metadata name of a built-in type.
[[nodiscard]] constexpr auto special_type_name(special_type type) noexcept -> std::string_view {
  // clang-format off
  switch (type) {
    case special_type::system_object:  return "System.Object";
    case special_type::system_void:    return "System.Void";
    case special_type::system_boolean: return "System.Boolean";
    case special_type::system_char:    return "System.Char";
    case special_type::system_sbyte:   return "System.SByte";
    case special_type::system_byte:    return "System.Byte";
    case special_type::system_int16:   return "System.Int16";
    case special_type::system_uint16:  return "System.UInt16";
    case special_type::system_int32:   return "System.Int32";
    case special_type::system_uint32:  return "System.UInt32";
    case special_type::system_int64:   return "System.Int64";
    case special_type::system_uint64:  return "System.UInt64";
    case special_type::system_decimal: return "System.Decimal";
    case special_type::system_single:  return "System.Single";
    case special_type::system_double:  return "System.Double";
    case special_type::system_string:  return "System.String";
  }
  // clang-format on
  return "<unknown>";
}

}  // namespace methodxml
