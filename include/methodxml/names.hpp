#pragma once

#include <string_view>

// Element and attribute names understood by downstream consumers of method markup.
// These strings are part of the output format and must not change.

namespace methodxml::element_names {

inline constexpr std::string_view argument = "Argument";
inline constexpr std::string_view array = "Array";
inline constexpr std::string_view array_element_access = "ArrayElementAccess";
inline constexpr std::string_view array_type = "ArrayType";
inline constexpr std::string_view assignment = "Assignment";
inline constexpr std::string_view base_reference = "BaseReference";
inline constexpr std::string_view binary_operation = "BinaryOperation";
inline constexpr std::string_view block = "Block";
inline constexpr std::string_view boolean = "Boolean";
inline constexpr std::string_view bound = "Bound";
inline constexpr std::string_view cast = "Cast";
inline constexpr std::string_view char_ = "Char";
inline constexpr std::string_view comment = "Comment";
inline constexpr std::string_view expression = "Expression";
inline constexpr std::string_view expression_statement = "ExpressionStatement";
inline constexpr std::string_view literal = "Literal";
inline constexpr std::string_view local = "Local";
inline constexpr std::string_view method_call = "MethodCall";
inline constexpr std::string_view name = "Name";
inline constexpr std::string_view name_ref = "NameRef";
inline constexpr std::string_view new_array = "NewArray";
inline constexpr std::string_view new_class = "NewClass";
inline constexpr std::string_view new_delegate = "NewDelegate";
inline constexpr std::string_view null = "Null";
inline constexpr std::string_view number = "Number";
inline constexpr std::string_view parentheses = "Parentheses";
inline constexpr std::string_view quote = "Quote";
inline constexpr std::string_view string = "String";
inline constexpr std::string_view this_reference = "ThisReference";
inline constexpr std::string_view type = "Type";

}  // namespace methodxml::element_names

namespace methodxml::attribute_names {

inline constexpr std::string_view binary_operator = "binaryoperator";
inline constexpr std::string_view direct_cast = "directcast";
inline constexpr std::string_view full_name = "fullname";
inline constexpr std::string_view implicit = "implicit";
inline constexpr std::string_view line = "line";
inline constexpr std::string_view name = "name";
inline constexpr std::string_view rank = "rank";
inline constexpr std::string_view try_cast = "trycast";
inline constexpr std::string_view type = "type";
inline constexpr std::string_view variable_kind = "variablekind";

}  // namespace methodxml::attribute_names
