#include <methodxml/error.hpp>
#include <methodxml/span_markers.hpp>

#include <algorithm>

namespace methodxml {

auto extract_span_markers(std::string_view input, std::string_view start_marker,
                          std::string_view end_marker) -> result<marked_text> {
  if (start_marker.empty() || end_marker.empty() || start_marker == end_marker) {
    return unexpected(make_error_code(error::invalid_argument));
  }

  marked_text out;
  out.text.reserve(input.size());
  std::vector<std::size_t> open;

  std::size_t pos = 0;
  while (pos < input.size()) {
    auto rest = input.substr(pos);
    if (rest.starts_with(start_marker)) {
      open.push_back(out.text.size());
      pos += start_marker.size();
      continue;
    }
    if (rest.starts_with(end_marker)) {
      if (open.empty()) {
        return unexpected(make_error_code(error::unmatched_span_end));
      }
      out.spans.push_back(text_span::from_bounds(open.back(), out.text.size()));
      open.pop_back();
      pos += end_marker.size();
      continue;
    }

    // Copy up to the next place either marker could begin.
    auto next = std::min(input.find(start_marker.front(), pos + 1),
                         input.find(end_marker.front(), pos + 1));
    if (next == std::string_view::npos) {
      next = input.size();
    }
    out.text.append(input.data() + pos, next - pos);
    pos = next;
  }

  if (!open.empty()) {
    return unexpected(make_error_code(error::unclosed_span_start));
  }
  return out;
}

auto normalize_spans(std::vector<text_span> spans) -> std::vector<text_span> {
  std::sort(spans.begin(), spans.end(), [](text_span const& a, text_span const& b) {
    return a.start != b.start ? a.start < b.start : a.length < b.length;
  });

  std::vector<text_span> merged;
  merged.reserve(spans.size());
  for (auto const& span : spans) {
    if (!merged.empty() && span.start <= merged.back().end()) {
      auto& last = merged.back();
      last = text_span::from_bounds(last.start, std::max(last.end(), span.end()));
      continue;
    }
    merged.push_back(span);
  }
  return merged;
}

}  // namespace methodxml
