#include <methodxml/escape.hpp>
#include <methodxml/logger.hpp>
#include <methodxml/writer.hpp>

#include <utility>

namespace methodxml {

writer::writer(config const& cfg) : line_break_(cfg.line_break) {
  buffer_.reserve(cfg.initial_capacity);
}

auto writer::begin_open_tag(std::string_view name) -> void {
  METHODXML_ASSERT(!name.empty());
  buffer_.push_back('<');
  buffer_.append(name);
}

auto writer::append_attribute(attribute const& attr) -> void {
  if (attr.is_empty()) {
    return;
  }
  buffer_.push_back(' ');
  buffer_.append(attr.name);
  buffer_.append("=\"");
  append_escaped(buffer_, attr.value);
  buffer_.push_back('"');
}

auto writer::end_open_tag(std::string_view name, std::size_t offset) -> element_scope {
  buffer_.push_back('>');
  auto const id = next_id_++;
  open_.push_back(open_element{.name = name, .offset = offset, .id = id});
  return element_scope{*this, id};
}

auto writer::close(std::uint64_t id) -> void {
  if (open_.empty() || open_.back().id != id) {
    METHODXML_LOG_ERROR("closing element #{} but innermost open element is {}", id,
                        open_.empty() ? std::string_view{"<none>"} : open_.back().name);
  }
  METHODXML_ENSURE(!open_.empty() && open_.back().id == id,
                   "element closed out of order, or its open tag was discarded by rewind()");

  auto const& top = open_.back();
  METHODXML_ASSERT(top.offset < buffer_.size());
  buffer_.append("</");
  buffer_.append(top.name);
  buffer_.push_back('>');
  open_.pop_back();
}

auto writer::leaf(std::string_view name) -> void {
  METHODXML_ASSERT(!name.empty());
  buffer_.push_back('<');
  buffer_.append(name);
  buffer_.append("/>");
}

auto writer::text(std::string_view value) -> void { append_escaped(buffer_, value); }

auto writer::line_break() -> void { buffer_.append(line_break_); }

auto writer::rewind(checkpoint const& mark) -> void {
  if (mark.size > buffer_.size()) {
    METHODXML_LOG_ERROR("rewind to {} but buffer only holds {} bytes", mark.size, buffer_.size());
  }
  METHODXML_ENSURE(mark.size <= buffer_.size(), "rewind() past the end of the buffer");

  // Ids are never reused, so a matching innermost id means the whole enclosing stack survived.
  auto const enclosing_open =
    open_.size() >= mark.depth &&
    (mark.depth == 0 || open_[mark.depth - 1].id == mark.innermost_id);
  if (!enclosing_open) {
    METHODXML_LOG_ERROR("rewind to {} inside element #{} which is no longer open", mark.size,
                        mark.innermost_id);
  }
  METHODXML_ENSURE(enclosing_open, "rewind() into an element that has since been closed");

  METHODXML_LOG_DEBUG("rewind discards {} bytes", buffer_.size() - mark.size);
  buffer_.resize(mark.size);

  // Elements opened after the mark are no longer open; releasing their scopes is fatal.
  open_.resize(mark.depth);
  METHODXML_ASSERT(open_.empty() || open_.back().offset < buffer_.size());
}

auto writer::take() -> std::string {
  METHODXML_ENSURE(open_.empty(), "take() while elements are still open");
  auto out = std::move(buffer_);
  buffer_.clear();
  return out;
}

}  // namespace methodxml
