#pragma once

#include <methodxml/expected.hpp>
#include <methodxml/text_span.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace methodxml {

inline constexpr std::string_view k_default_span_start_marker = "/*1*/";
inline constexpr std::string_view k_default_span_end_marker = "/*2*/";

/// Text with its span markers removed.
struct marked_text {
  std::string text{};
  /// One span per marker pair, in the order the pairs were closed, positions in `text`.
  std::vector<text_span> spans{};
};

/// Remove start/end markers from `input` and report the spans they delimited.
///
/// Pairs nest: an end marker closes the most recent unclosed start marker.
///
/// Errors:
/// - error::unmatched_span_end: end marker with no open start marker
/// - error::unclosed_span_start: start marker left open at end of input
/// - error::invalid_argument: a marker is empty, or both markers are equal
[[nodiscard]] auto extract_span_markers(std::string_view input,
                                        std::string_view start_marker = k_default_span_start_marker,
                                        std::string_view end_marker = k_default_span_end_marker)
  -> result<marked_text>;

/// Sort spans and merge the ones that overlap or touch.
///
/// The result is ascending and pairwise disjoint with a gap between neighbours. An empty span is
/// kept only when no other span covers its position.
[[nodiscard]] auto normalize_spans(std::vector<text_span> spans) -> std::vector<text_span>;

}  // namespace methodxml
