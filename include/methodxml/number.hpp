#pragma once

#include <methodxml/expected.hpp>
#include <methodxml/kind.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace methodxml {

/// A numeric literal value as seen by the analysis layer.
using number = std::variant<std::int8_t, std::uint8_t, std::int16_t, std::uint16_t, std::int32_t,
                            std::uint32_t, std::int64_t, std::uint64_t, float, double>;

/// Culture-invariant text of a number.
///
/// - double: 17 significant digits (always round-trips), general layout
/// - float: shortest text that round-trips
/// - integers: plain decimal
///
/// Exponents are written with an upper-case `E` and a sign (`1E+20`); non-finite values are
/// `NaN`, `Infinity` and `-Infinity`.
[[nodiscard]] auto format_number(number const& value) -> std::string;

[[nodiscard]] auto format_double(double value) -> std::string;
[[nodiscard]] auto format_float(float value) -> std::string;

/// Parse text written by format_double()/format_float(). The whole input must be consumed.
[[nodiscard]] auto parse_double(std::string_view text) -> result<double>;
[[nodiscard]] auto parse_float(std::string_view text) -> result<float>;

/// The built-in type a number value belongs to.
[[nodiscard]] auto number_type(number const& value) noexcept -> special_type;

}  // namespace methodxml
