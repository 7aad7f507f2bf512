#pragma once

#include <system_error>
#include <type_traits>

namespace methodxml {

/// Recoverable errors reported by the decoding and span-marker helpers.
///
/// Contract violations inside the encoder (bad rewind, out-of-order close, unmapped enum) are
/// not represented here; they are fatal and go through METHODXML_ENSURE.
enum class error {
  /// `&...;` sequence that is not one of `&lt;`, `&gt;`, `&amp;`.
  unknown_entity = 1,

  /// `&` without a terminating `;`.
  unterminated_entity,

  /// Number text could not be parsed back, or did not consume the whole input.
  invalid_number,

  /// Close marker with no preceding unmatched open marker.
  unmatched_span_end,

  /// Open marker never closed.
  unclosed_span_start,

  /// Empty or identical open/close markers.
  invalid_argument,
};

auto make_error_code(error e) -> std::error_code;

}  // namespace methodxml

namespace std {

template <>
struct is_error_code_enum<methodxml::error> : std::true_type {};

}  // namespace std
