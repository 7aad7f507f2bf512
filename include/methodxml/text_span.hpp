#pragma once

#include <methodxml/assert.hpp>

#include <cstddef>

namespace methodxml {

/// Half-open range [start, start + length) of positions in a text.
struct text_span {
  std::size_t start = 0;
  std::size_t length = 0;

  [[nodiscard]] static auto from_bounds(std::size_t start, std::size_t end) -> text_span {
    METHODXML_ENSURE(start <= end, "span end before span start");
    return text_span{.start = start, .length = end - start};
  }

  [[nodiscard]] constexpr auto end() const noexcept -> std::size_t { return start + length; }
  [[nodiscard]] constexpr auto is_empty() const noexcept -> bool { return length == 0; }

  friend constexpr auto operator==(text_span const&, text_span const&) -> bool = default;
};

}  // namespace methodxml
