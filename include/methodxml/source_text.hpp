#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace methodxml {

/// Source text of a document with a line-start index.
///
/// Line breaks are `\n`, `\r\n` and a lone `\r`; `\r\n` counts once.
class source_text {
 public:
  source_text() : source_text(std::string{}) {}
  explicit source_text(std::string text);

  [[nodiscard]] auto text() const noexcept -> std::string_view { return text_; }
  [[nodiscard]] auto size() const noexcept -> std::size_t { return text_.size(); }

  [[nodiscard]] auto line_count() const noexcept -> std::size_t { return line_starts_.size(); }

  /// Zero-based index of the line containing `position`.
  /// `position == size()` is accepted and maps to the last line.
  [[nodiscard]] auto line_index(std::size_t position) const -> int;

  /// Offset of the first character of `line`.
  [[nodiscard]] auto line_start(std::size_t line) const -> std::size_t;

 private:
  std::string text_;
  std::vector<std::size_t> line_starts_;
};

}  // namespace methodxml
