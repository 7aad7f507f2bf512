#pragma once

#include <methodxml/expected.hpp>

#include <string>
#include <string_view>

namespace methodxml {

/// Append `text` to `out`, replacing `<`, `>` and `&` with `&lt;`, `&gt;` and `&amp;`.
///
/// Runs of unreserved characters are appended in one call. Quotes are left alone: attribute
/// values are always written between double quotes by the writer and the consumers of this
/// format never escaped them.
auto append_escaped(std::string& out, std::string_view text) -> void;

[[nodiscard]] auto escape(std::string_view text) -> std::string;

/// Inverse of escape(): `unescape(escape(s)) == s` for every `s`.
///
/// Errors:
/// - error::unknown_entity: an `&name;` other than the three produced by escape()
/// - error::unterminated_entity: `&` with no `;` after it
[[nodiscard]] auto unescape(std::string_view text) -> result<std::string>;

}  // namespace methodxml
