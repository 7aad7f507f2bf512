#include <methodxml/error.hpp>
#include <methodxml/escape.hpp>

#include <array>

namespace methodxml {

namespace {

constexpr std::string_view k_reserved = "<>&";

struct entity {
  char ch;
  std::string_view text;
};

constexpr std::array<entity, 3> k_entities{{
  {'<', "&lt;"},
  {'>', "&gt;"},
  {'&', "&amp;"},
}};

constexpr auto entity_for(char ch) noexcept -> std::string_view {
  for (auto const& e : k_entities) {
    if (e.ch == ch) {
      return e.text;
    }
  }
  return {};
}

}  // namespace

auto append_escaped(std::string& out, std::string_view text) -> void {
  std::size_t start = 0;
  while (start < text.size()) {
    auto pos = text.find_first_of(k_reserved, start);
    if (pos == std::string_view::npos) {
      break;
    }
    out.append(text.data() + start, pos - start);
    out.append(entity_for(text[pos]));
    start = pos + 1;
  }
  if (start < text.size()) {
    out.append(text.data() + start, text.size() - start);
  }
}

auto escape(std::string_view text) -> std::string {
  std::string out;
  out.reserve(text.size());
  append_escaped(out, text);
  return out;
}

auto unescape(std::string_view text) -> result<std::string> {
  std::string out;
  out.reserve(text.size());

  std::size_t start = 0;
  while (start < text.size()) {
    auto amp = text.find('&', start);
    if (amp == std::string_view::npos) {
      break;
    }
    out.append(text.data() + start, amp - start);

    auto semi = text.find(';', amp);
    if (semi == std::string_view::npos) {
      return unexpected(make_error_code(error::unterminated_entity));
    }

    auto token = text.substr(amp, semi - amp + 1);
    bool matched = false;
    for (auto const& e : k_entities) {
      if (e.text == token) {
        out.push_back(e.ch);
        matched = true;
        break;
      }
    }
    if (!matched) {
      return unexpected(make_error_code(error::unknown_entity));
    }
    start = semi + 1;
  }
  if (start < text.size()) {
    out.append(text.data() + start, text.size() - start);
  }
  return out;
}

}  // namespace methodxml
