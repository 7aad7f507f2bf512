#pragma once

#include <methodxml/logger.hpp>
#include <methodxml/text_span.hpp>

#include <iocoro/awaitable.hpp>

#include <concepts>
#include <cstdint>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace methodxml {

struct document_id {
  std::uint64_t value = 0;

  friend constexpr auto operator==(document_id, document_id) -> bool = default;
};

struct version_stamp {
  std::uint64_t value = 0;

  friend constexpr auto operator==(version_stamp, version_stamp) -> bool = default;
};

/// Single-slot cache of a document's member spans.
///
/// Contract:
/// - a lookup hits only when both document id and version equal the stored key
/// - a miss computes outside the lock and then overwrites the slot
/// - two concurrent misses both compute; whichever stores last wins
/// - only one entry is ever kept
class member_span_cache {
 public:
  member_span_cache() = default;

  member_span_cache(member_span_cache const&) = delete;
  auto operator=(member_span_cache const&) -> member_span_cache& = delete;

  [[nodiscard]] auto try_get(document_id id, version_stamp version) const
    -> std::optional<std::vector<text_span>> {
    std::scoped_lock lk{mtx_};
    if (slot_.has_value() && slot_->id == id && slot_->version == version) {
      return slot_->spans;
    }
    return std::nullopt;
  }

  auto save(document_id id, version_stamp version, std::vector<text_span> spans) -> void {
    std::scoped_lock lk{mtx_};
    if (slot_.has_value() && !(slot_->id == id && slot_->version == version)) {
      METHODXML_LOG_DEBUG("member span cache: replacing document {} version {}", slot_->id.value,
                          slot_->version.value);
    }
    slot_ = entry{.id = id, .version = version, .spans = std::move(spans)};
  }

  /// Return the cached spans for (id, version), or await `compute()` and store its result.
  ///
  /// `compute` is a callable returning `iocoro::awaitable<std::vector<text_span>>`.
  template <typename Compute>
    requires std::invocable<Compute&>
  auto get_or_create(document_id id, version_stamp version, Compute compute)
    -> iocoro::awaitable<std::vector<text_span>> {
    if (auto cached = try_get(id, version)) {
      METHODXML_LOG_DEBUG("member span cache: hit for document {} version {}", id.value,
                          version.value);
      co_return std::move(*cached);
    }

    METHODXML_LOG_DEBUG("member span cache: miss for document {} version {}", id.value,
                        version.value);
    std::vector<text_span> spans = co_await compute();
    save(id, version, spans);
    co_return spans;
  }

 private:
  struct entry {
    document_id id;
    version_stamp version;
    std::vector<text_span> spans;
  };

  mutable std::mutex mtx_;
  std::optional<entry> slot_;
};

}  // namespace methodxml
