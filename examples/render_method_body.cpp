#include <methodxml/methodxml.hpp>

#include <cstdint>
#include <iostream>
#include <string>

// Renders the body of
//
//   void M()
//   {
//       int[] xs = new int[3];
//       this.total = xs.Length + 1.5;
//       Log("a < b");
//   }
//
// the way a language visitor would drive the builder.

namespace {

auto render_local(methodxml::method_xml_builder& b, std::size_t pos) -> void {
  auto int32 = b.get_special_type(methodxml::special_type::system_int32);
  auto local = b.local_tag(b.get_line_number(pos));
  b.generate_type(*methodxml::make_array_type(int32));
  b.generate_name("xs");
  auto expr = b.expression_tag();
  auto new_array = b.new_array_tag();
  b.generate_type(*int32);
  auto bound = b.bound_tag();
  auto bound_expr = b.expression_tag();
  auto lit = b.literal_tag();
  b.generate_number(methodxml::number{std::int32_t{3}});
}

// Returns false when the call cannot be modeled; the caller rewinds and quotes it instead.
auto try_render_call(methodxml::method_xml_builder& b, std::size_t pos, bool resolved) -> bool {
  auto stmt = b.expression_statement_tag(b.get_line_number(pos));
  auto expr = b.expression_tag();
  auto call = b.method_call_tag();
  {
    auto target = b.expression_tag();
    auto ref = b.name_ref_tag(methodxml::variable_kind::method, "Log");
  }
  if (!resolved) {
    return false;
  }
  auto arg = b.argument_tag();
  auto arg_expr = b.expression_tag();
  auto lit = b.literal_tag();
  b.generate_string("a < b");
  return true;
}

}  // namespace

int main() {
  methodxml::set_log_level(methodxml::log_level::debug);

  std::string const code =
    "void M()\n"
    "{\n"
    "    int[] xs = new int[3];\n"
    "    this.total = xs.Length + 1.5;\n"
    "    Log(\"a < b\");\n"
    "}\n";
  methodxml::source_text text{code};
  methodxml::method_xml_builder b{text};

  {
    auto block = b.block_tag();

    render_local(b, code.find("int[]"));

    {
      auto stmt = b.expression_statement_tag(b.get_line_number(code.find("this.total")));
      auto expr = b.expression_tag();
      auto assign = b.assignment_tag();
      {
        auto lhs = b.expression_tag();
        auto ref = b.name_ref_tag(methodxml::variable_kind::field, "total");
        auto target = b.expression_tag();
        b.generate_this_reference();
      }
      {
        auto rhs = b.expression_tag();
        auto op = b.binary_operation_tag(methodxml::binary_operator_kind::plus);
        {
          auto left = b.expression_tag();
          auto ref = b.name_ref_tag(methodxml::variable_kind::property, "Length");
          auto target = b.expression_tag();
          auto xs = b.name_ref_tag(methodxml::variable_kind::local, "xs");
        }
        {
          auto right = b.expression_tag();
          auto lit = b.literal_tag();
          b.generate_number(methodxml::number{1.5});
        }
      }
    }

    auto const call_pos = code.find("Log(");
    auto const mark = b.mark();
    if (!try_render_call(b, call_pos, false)) {
      b.rewind(mark);
      b.generate_unknown(methodxml::syntax_node{.span_start = call_pos, .text = "Log(\"a < b\");"});
    }
  }

  std::cout << b.take() << "\n";
  return 0;
}
