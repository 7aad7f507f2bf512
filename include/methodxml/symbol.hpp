#pragma once

#include <methodxml/assert.hpp>
#include <methodxml/kind.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

namespace methodxml {

/// Type information supplied by the analysis layer.
///
/// A type is either named (metadata name plus owning assembly) or an array of an element type.
/// Rank is per dimension group: `int[][]` is rank 1 of rank 1, `int[,]` is rank 2.
struct type_symbol {
  enum class type_kind : std::uint8_t {
    named,
    array,
  };

  type_kind kind = type_kind::named;

  /// Metadata name (`System.Int32`, `N.Outer+Inner`, `List`1`). Named types only.
  std::string metadata_name{};

  /// Display name of the containing assembly. Named types only.
  std::string assembly_name{};

  /// Array types only.
  int rank = 0;
  std::shared_ptr<type_symbol const> element_type{};

  [[nodiscard]] auto is_array() const noexcept -> bool { return kind == type_kind::array; }
};

using type_ptr = std::shared_ptr<type_symbol const>;

[[nodiscard]] inline auto make_named_type(std::string metadata_name, std::string assembly_name = {})
  -> type_ptr {
  auto t = std::make_shared<type_symbol>();
  t->kind = type_symbol::type_kind::named;
  t->metadata_name = std::move(metadata_name);
  t->assembly_name = std::move(assembly_name);
  return t;
}

[[nodiscard]] inline auto make_array_type(type_ptr element_type, int rank = 1) -> type_ptr {
  METHODXML_ENSURE(element_type != nullptr, "array type needs an element type");
  METHODXML_ENSURE(rank >= 1, "array rank must be at least 1");
  auto t = std::make_shared<type_symbol>();
  t->kind = type_symbol::type_kind::array;
  t->rank = rank;
  t->element_type = std::move(element_type);
  return t;
}

/// A symbol referenced from a method body.
struct symbol {
  symbol_kind kind = symbol_kind::local;
  std::string name{};
};

/// A syntax node the caller does not model; emitted verbatim.
struct syntax_node {
  std::size_t span_start = 0;
  std::string text{};
};

}  // namespace methodxml
