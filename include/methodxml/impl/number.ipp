#include <methodxml/assert.hpp>
#include <methodxml/error.hpp>
#include <methodxml/number.hpp>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>

namespace methodxml {

namespace {

constexpr std::string_view k_nan = "NaN";
constexpr std::string_view k_positive_infinity = "Infinity";
constexpr std::string_view k_negative_infinity = "-Infinity";

constexpr int k_float_fixed_max_exponent = 15;

template <typename F>
auto non_finite_text(F v) -> std::string_view {
  if (std::isnan(v)) {
    return k_nan;
  }
  return v > 0 ? k_positive_infinity : k_negative_infinity;
}

auto finish_float_text(char* first, char* last) -> std::string {
  std::replace(first, last, 'e', 'E');
  return std::string(first, last);
}

template <typename F>
auto parse_floating(std::string_view text) -> result<F> {
  if (text == k_nan) {
    return std::numeric_limits<F>::quiet_NaN();
  }
  if (text == k_positive_infinity) {
    return std::numeric_limits<F>::infinity();
  }
  if (text == k_negative_infinity) {
    return -std::numeric_limits<F>::infinity();
  }

  F value{};
  auto const* first = text.data();
  auto const* last = text.data() + text.size();
  auto res = std::from_chars(first, last, value, std::chars_format::general);
  if (res.ec != std::errc{} || res.ptr != last) {
    return unexpected(make_error_code(error::invalid_number));
  }
  return value;
}

}  // namespace

auto format_double(double value) -> std::string {
  if (!std::isfinite(value)) {
    return std::string(non_finite_text(value));
  }
  char tmp[64]{};
  auto res = std::to_chars(tmp, tmp + sizeof(tmp), value, std::chars_format::general,
                           std::numeric_limits<double>::max_digits10);
  METHODXML_ENSURE(res.ec == std::errc{}, "to_chars failed for double");
  return finish_float_text(tmp, res.ptr);
}

auto format_float(float value) -> std::string {
  if (!std::isfinite(value)) {
    return std::string(non_finite_text(value));
  }
  // Shortest round-trip digits, then laid out like a general format: fixed while
  // -5 < exponent < 15, scientific otherwise.
  char tmp[64]{};
  auto res = std::to_chars(tmp, tmp + sizeof(tmp), value, std::chars_format::scientific);
  METHODXML_ENSURE(res.ec == std::errc{}, "to_chars failed for float");

  std::string_view sci{tmp, static_cast<std::size_t>(res.ptr - tmp)};
  auto const e_pos = sci.find('e');
  METHODXML_ASSERT(e_pos != std::string_view::npos);

  int exponent = 0;
  auto const* exp_first = sci.data() + e_pos + 1;
  if (*exp_first == '+') {
    ++exp_first;
  }
  auto exp_res = std::from_chars(exp_first, sci.data() + sci.size(), exponent);
  METHODXML_ENSURE(exp_res.ec == std::errc{}, "unreadable float exponent");

  if (exponent >= k_float_fixed_max_exponent || exponent <= -5) {
    return finish_float_text(tmp, res.ptr);
  }

  auto mantissa = sci.substr(0, e_pos);
  std::string out;
  if (mantissa.front() == '-') {
    out.push_back('-');
    mantissa.remove_prefix(1);
  }
  std::string digits;
  for (char c : mantissa) {
    if (c != '.') {
      digits.push_back(c);
    }
  }

  if (exponent < 0) {
    out.append("0.");
    out.append(static_cast<std::size_t>(-exponent - 1), '0');
    out.append(digits);
    return out;
  }
  auto const int_len = static_cast<std::size_t>(exponent) + 1;
  if (digits.size() <= int_len) {
    out.append(digits);
    out.append(int_len - digits.size(), '0');
    return out;
  }
  out.append(digits, 0, int_len);
  out.push_back('.');
  out.append(digits, int_len);
  return out;
}

auto format_number(number const& value) -> std::string {
  return std::visit(
    [](auto v) -> std::string {
      using T = decltype(v);
      if constexpr (std::is_same_v<T, double>) {
        return format_double(v);
      } else if constexpr (std::is_same_v<T, float>) {
        return format_float(v);
      } else {
        char tmp[32]{};
        auto res = std::to_chars(tmp, tmp + sizeof(tmp), v);
        METHODXML_ASSERT(res.ec == std::errc{});
        return std::string(tmp, res.ptr);
      }
    },
    value);
}

auto parse_double(std::string_view text) -> result<double> { return parse_floating<double>(text); }

auto parse_float(std::string_view text) -> result<float> { return parse_floating<float>(text); }

auto number_type(number const& value) noexcept -> special_type {
  // clang-format off
  switch (value.index()) {
    case 0: return special_type::system_sbyte;
    case 1: return special_type::system_byte;
    case 2: return special_type::system_int16;
    case 3: return special_type::system_uint16;
    case 4: return special_type::system_int32;
    case 5: return special_type::system_uint32;
    case 6: return special_type::system_int64;
    case 7: return special_type::system_uint64;
    case 8: return special_type::system_single;
    case 9: return special_type::system_double;
    default: break;
  }
  // clang-format on
  return special_type::system_object;
}

}  // namespace methodxml
