#include <methodxml/methodxml.hpp>

#include <iocoro/iocoro.hpp>

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

// Caches the member spans of a document across repeated requests. The "analysis" here just
// marks each member with /*1*/ ... /*2*/.

auto compute_member_spans(std::string marked) -> iocoro::awaitable<std::vector<methodxml::text_span>> {
  auto r = methodxml::extract_span_markers(marked);
  if (!r) {
    std::cerr << "bad markers: " << r.error().message() << "\n";
    co_return std::vector<methodxml::text_span>{};
  }
  co_return methodxml::normalize_spans(std::move(r->spans));
}

auto member_spans_task(methodxml::member_span_cache& cache) -> iocoro::awaitable<void> {
  std::string const v1 = "class C { /*1*/void A() {}/*2*/ /*1*/void B() {}/*2*/ }";
  std::string const v2 = "class C { /*1*/void A() { x(); }/*2*/ }";
  auto const doc = methodxml::document_id{1};

  struct request {
    std::uint64_t version;
    std::string text;
  };
  std::vector<request> const requests{{1, v1}, {1, v1}, {2, v2}};

  for (auto const& req : requests) {
    auto const version = req.version;
    auto spans = co_await cache.get_or_create(doc, methodxml::version_stamp{version},
                                              [&req]() { return compute_member_spans(req.text); });
    std::cout << "version " << version << ":";
    for (auto const& s : spans) {
      std::cout << " [" << s.start << ", " << s.end() << ")";
    }
    std::cout << "\n";
  }
}

int main() {
  methodxml::set_log_level(methodxml::log_level::debug);

  iocoro::io_context ctx;
  methodxml::member_span_cache cache;

  iocoro::co_spawn(ctx.get_executor(), member_spans_task(cache), iocoro::detached);
  ctx.run();
  return 0;
}
