#include <methodxml/assert.hpp>
#include <methodxml/source_text.hpp>

#include <algorithm>
#include <iterator>
#include <utility>

namespace methodxml {

source_text::source_text(std::string text) : text_(std::move(text)) {
  line_starts_.push_back(0);
  for (std::size_t i = 0; i < text_.size(); ++i) {
    auto const c = text_[i];
    if (c == '\r') {
      if (i + 1 < text_.size() && text_[i + 1] == '\n') {
        ++i;
      }
      line_starts_.push_back(i + 1);
    } else if (c == '\n') {
      line_starts_.push_back(i + 1);
    }
  }
}

auto source_text::line_index(std::size_t position) const -> int {
  METHODXML_ENSURE(position <= text_.size(), "position is outside the source text");
  // First line start greater than position; the line before it contains position.
  auto it = std::upper_bound(line_starts_.begin(), line_starts_.end(), position);
  return static_cast<int>(std::distance(line_starts_.begin(), it) - 1);
}

auto source_text::line_start(std::size_t line) const -> std::size_t {
  METHODXML_ENSURE(line < line_starts_.size(), "line index out of range");
  return line_starts_[line];
}

}  // namespace methodxml
