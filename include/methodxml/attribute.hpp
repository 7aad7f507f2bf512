#pragma once

#include <methodxml/kind.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace methodxml {

/// A name="value" pair on an open tag.
///
/// A default-constructed attribute is the "empty" attribute: the writer skips it entirely. This
/// is different from an attribute whose value is the empty string, which is written as `name=""`.
struct attribute {
  std::string_view name{};
  std::string value{};

  attribute() = default;
  attribute(std::string_view n, std::string v) : name(n), value(std::move(v)) {}

  [[nodiscard]] auto is_empty() const noexcept -> bool { return name.empty(); }

  [[nodiscard]] static auto empty() -> attribute { return attribute{}; }
};

// Attribute builders. Each returns the empty attribute when its input carries no information.

[[nodiscard]] auto binary_operator_attribute(binary_operator_kind kind) -> attribute;

/// Empty when `name` is empty or whitespace only.
[[nodiscard]] auto full_name_attribute(std::string_view name) -> attribute;

/// implicit="yes" / implicit="no"; empty when not known.
[[nodiscard]] auto implicit_attribute(std::optional<bool> is_implicit) -> attribute;

[[nodiscard]] auto line_attribute(int line) -> attribute;

/// Empty when `name` is empty or whitespace only.
[[nodiscard]] auto name_attribute(std::string_view name) -> attribute;

/// Empty for a rank below 1, which no array type has.
[[nodiscard]] auto rank_attribute(int rank) -> attribute;

/// directcast="yes" or trycast="yes"; empty for an ordinary cast.
[[nodiscard]] auto special_cast_attribute(std::optional<special_cast_kind> kind) -> attribute;

/// Empty when `type_name` is empty or whitespace only.
[[nodiscard]] auto type_attribute(std::string_view type_name) -> attribute;

[[nodiscard]] auto variable_kind_attribute(variable_kind kind) -> attribute;

/// True when `text` is empty or consists of ASCII whitespace only.
[[nodiscard]] auto is_blank(std::string_view text) noexcept -> bool;

}  // namespace methodxml
