#include <methodxml/assert.hpp>
#include <methodxml/error.hpp>

#include <string>

namespace methodxml {
namespace detail {

struct error_category_impl : std::error_category {
  virtual ~error_category_impl() = default;

  auto name() const noexcept -> char const* override { return "methodxml"; }

  auto message(int ev) const -> std::string override {
    // clang-format off
    switch (static_cast<error>(ev)) {
      case error::unknown_entity:      return "Unknown entity in escaped text.";
      case error::unterminated_entity: return "Entity is missing its terminating ';'.";
      case error::invalid_number:      return "Text is not a valid number.";
      case error::unmatched_span_end:  return "Span end marker has no matching start marker.";
      case error::unclosed_span_start: return "Span start marker is never closed.";
      case error::invalid_argument:    return "Invalid argument.";
    }
    // clang-format on
    return "methodxml error.";
  }
};

auto category() -> std::error_category const& {
  static error_category_impl instance;
  return instance;
}

}  // namespace detail

auto make_error_code(error e) -> std::error_code {
  return std::error_code{static_cast<int>(e), detail::category()};
}

}  // namespace methodxml
