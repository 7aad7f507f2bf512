#pragma once

#include <methodxml/assert.hpp>
#include <methodxml/attribute.hpp>
#include <methodxml/config.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace methodxml {

/// Markup writer over a single growable buffer.
///
/// - Elements are opened through open(), which returns an element_scope; the close tag is written
///   when the scope is destroyed (or close() is called on it), so nesting is always LIFO.
/// - Text and attribute values are escaped on the way in.
/// - mark()/rewind() snapshot and truncate the buffer, discarding speculative output.
///
/// Contracts (fatal when violated):
/// - rewind(c) requires c.size <= size(), and every element open when `c` was taken must
///   still be open
/// - an element_scope must be released while its element is the innermost open one, and its open
///   tag must not have been discarded by a rewind
///
/// Not thread-safe; one writer per serialization task.
class writer {
 public:
  class element_scope;

  /// Snapshot taken by mark(): buffer length plus the open elements it sits inside.
  struct checkpoint {
    std::size_t size = 0;
    std::size_t depth = 0;
    std::uint64_t innermost_id = 0;
  };

  writer() : writer(config{}) {}
  explicit writer(config const& cfg);

  writer(writer const&) = delete;
  auto operator=(writer const&) -> writer& = delete;

  /// Write `<name attr="...">` and return the scope that will write `</name>`.
  /// `name` is kept by reference until the close tag is written.
  /// Empty attributes are skipped.
  template <typename... Attrs>
    requires(std::same_as<std::remove_cvref_t<Attrs>, attribute> && ...)
  [[nodiscard]] auto open(std::string_view name, Attrs const&... attrs) -> element_scope;

  /// Write `<name/>`.
  auto leaf(std::string_view name) -> void;

  /// Write escaped text content.
  auto text(std::string_view value) -> void;

  auto line_break() -> void;

  [[nodiscard]] auto mark() const noexcept -> checkpoint {
    return checkpoint{
      .size = buffer_.size(),
      .depth = open_.size(),
      .innermost_id = open_.empty() ? 0 : open_.back().id,
    };
  }

  /// Truncate the buffer to `mark`, dropping everything written since.
  /// Elements opened after `mark` are forgotten; their scopes must not be released afterwards.
  auto rewind(checkpoint const& mark) -> void;

  [[nodiscard]] auto size() const noexcept -> std::size_t { return buffer_.size(); }

  /// Number of currently open elements.
  [[nodiscard]] auto depth() const noexcept -> std::size_t { return open_.size(); }

  [[nodiscard]] auto view() const noexcept -> std::string_view { return buffer_; }

  [[nodiscard]] auto str() const -> std::string { return buffer_; }

  /// Move the finished markup out. All elements must be closed.
  [[nodiscard]] auto take() -> std::string;

 private:
  struct open_element {
    std::string_view name;
    std::size_t offset;
    std::uint64_t id;
  };

  auto begin_open_tag(std::string_view name) -> void;
  auto append_attribute(attribute const& attr) -> void;
  auto end_open_tag(std::string_view name, std::size_t offset) -> element_scope;
  auto close(std::uint64_t id) -> void;

  std::string buffer_;
  std::vector<open_element> open_;
  std::uint64_t next_id_ = 1;
  std::string line_break_;
};

/// Scope of one open element. Writes the close tag exactly once.
///
/// Neither copyable nor movable; it only exists as the local returned by writer::open().
class [[nodiscard]] writer::element_scope {
 public:
  element_scope(element_scope const&) = delete;
  auto operator=(element_scope const&) -> element_scope& = delete;
  element_scope(element_scope&&) = delete;
  auto operator=(element_scope&&) -> element_scope& = delete;

  ~element_scope() { close(); }

  /// Write the close tag now instead of at end of scope.
  auto close() -> void {
    if (writer_ == nullptr) {
      return;
    }
    auto* w = writer_;
    writer_ = nullptr;
    w->close(id_);
  }

 private:
  friend class writer;

  element_scope(writer& w, std::uint64_t id) noexcept : writer_(&w), id_(id) {}

  writer* writer_;
  std::uint64_t id_;
};

template <typename... Attrs>
  requires(std::same_as<std::remove_cvref_t<Attrs>, attribute> && ...)
auto writer::open(std::string_view name, Attrs const&... attrs) -> element_scope {
  auto const offset = buffer_.size();
  begin_open_tag(name);
  (append_attribute(attrs), ...);
  return end_open_tag(name, offset);
}

}  // namespace methodxml
