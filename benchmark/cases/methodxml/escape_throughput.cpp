#include <methodxml/methodxml.hpp>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>

namespace {

struct bench_options {
  std::uint64_t iterations = 2000;
  std::size_t text_bytes = 64 * 1024;
};

auto make_text(std::size_t n) -> std::string {
  // Mostly plain source text with an occasional reserved character.
  std::string const line = "    if (count < limit && items[i] > 0) { total += items[i]; }\n";
  std::string out;
  out.reserve(n + line.size());
  while (out.size() < n) {
    out += line;
  }
  out.resize(n);
  return out;
}

auto parse_options(int argc, char** argv) -> bench_options {
  bench_options opt{};
  if (argc > 1) {
    opt.iterations = std::strtoull(argv[1], nullptr, 10);
  }
  if (argc > 2) {
    opt.text_bytes = std::strtoull(argv[2], nullptr, 10);
  }
  return opt;
}

}  // namespace

int main(int argc, char** argv) {
  auto const opt = parse_options(argc, argv);
  auto const text = make_text(opt.text_bytes);
  methodxml::source_text source{text};

  std::size_t total_out = 0;
  auto const start = std::chrono::steady_clock::now();
  for (std::uint64_t i = 0; i < opt.iterations; ++i) {
    methodxml::method_xml_builder b{source};
    {
      auto block = b.block_tag();
      b.generate_unknown(methodxml::syntax_node{.span_start = 0, .text = text});
      b.generate_number(methodxml::number{static_cast<double>(i) / 3.0});
    }
    total_out += b.take().size();
  }
  auto const elapsed = std::chrono::steady_clock::now() - start;

  auto const secs = std::chrono::duration<double>(elapsed).count();
  auto const in_mb = static_cast<double>(opt.iterations * opt.text_bytes) / (1024.0 * 1024.0);

  std::cout << "methodxml_escape_throughput\n";
  std::cout << "  iterations : " << opt.iterations << "\n";
  std::cout << "  text bytes : " << opt.text_bytes << "\n";
  std::cout << "  output     : " << total_out << " bytes\n";
  std::cout << "  elapsed    : " << std::fixed << std::setprecision(3) << secs << " s\n";
  std::cout << "  throughput : " << std::fixed << std::setprecision(1) << (in_mb / secs)
            << " MiB/s\n";
  return 0;
}
