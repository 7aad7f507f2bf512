#include <gtest/gtest.h>

#include <methodxml/attribute.hpp>
#include <methodxml/writer.hpp>

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace methodxml;

namespace {

// Checks that every close tag matches the most recently opened, unclosed element.
auto is_well_formed(std::string_view xml) -> bool {
  std::vector<std::string> stack;
  std::size_t pos = 0;
  while ((pos = xml.find('<', pos)) != std::string_view::npos) {
    auto end = xml.find('>', pos);
    if (end == std::string_view::npos) {
      return false;
    }
    auto tag = xml.substr(pos + 1, end - pos - 1);
    pos = end + 1;

    if (tag.ends_with('/')) {
      continue;
    }
    if (tag.starts_with('/')) {
      if (stack.empty() || stack.back() != tag.substr(1)) {
        return false;
      }
      stack.pop_back();
      continue;
    }
    stack.emplace_back(tag.substr(0, tag.find(' ')));
  }
  return stack.empty();
}

}  // namespace

TEST(writer_test, scopes_close_in_reverse_order) {
  writer w;
  {
    auto block = w.open("Block");
    {
      auto stmt = w.open("ExpressionStatement", line_attribute(3));
      auto call = w.open("MethodCall");
      w.leaf("ThisReference");
      EXPECT_EQ(w.depth(), 3u);
    }
    auto lit = w.open("Literal");
    w.leaf("Null");
  }

  EXPECT_EQ(w.depth(), 0u);
  EXPECT_EQ(w.view(),
            "<Block><ExpressionStatement line=\"3\"><MethodCall><ThisReference/></MethodCall>"
            "</ExpressionStatement><Literal><Null/></Literal></Block>");
  EXPECT_TRUE(is_well_formed(w.view()));
}

TEST(writer_test, empty_attributes_are_skipped) {
  writer w;
  {
    auto tag = w.open("NameRef", variable_kind_attribute(variable_kind::field), name_attribute("x"),
                      full_name_attribute(""));
  }
  EXPECT_EQ(w.view(), "<NameRef variablekind=\"field\" name=\"x\"></NameRef>");

  writer w2;
  {
    auto tag = w2.open("Cast", special_cast_attribute(std::nullopt));
  }
  EXPECT_EQ(w2.view(), "<Cast></Cast>");
}

TEST(writer_test, empty_string_value_is_written) {
  writer w;
  {
    auto tag = w.open("Type", attribute{"name", ""});
  }
  EXPECT_EQ(w.view(), "<Type name=\"\"></Type>");
}

TEST(writer_test, text_and_attribute_values_are_escaped) {
  writer w;
  {
    auto tag = w.open("NewDelegate", name_attribute("op<&>"));
    w.text("a < b & c > d");
  }
  EXPECT_EQ(w.view(), "<NewDelegate name=\"op&lt;&amp;&gt;\">a &lt; b &amp; c &gt; d</NewDelegate>");
}

TEST(writer_test, explicit_close_is_idempotent) {
  writer w;
  {
    auto outer = w.open("Block");
    auto inner = w.open("Expression");
    inner.close();
    inner.close();
    w.text("after");
  }
  EXPECT_EQ(w.view(), "<Block><Expression></Expression>after</Block>");
}

TEST(writer_test, early_exit_still_closes_elements) {
  writer w;
  auto emit = [&] {
    auto block = w.open("Block");
    auto call = w.open("MethodCall");
    w.text("partial");
    throw std::runtime_error("visitor gave up");
  };

  EXPECT_THROW(emit(), std::runtime_error);
  EXPECT_EQ(w.depth(), 0u);
  EXPECT_EQ(w.view(), "<Block><MethodCall>partial</MethodCall></Block>");
  EXPECT_TRUE(is_well_formed(w.view()));
}

TEST(writer_test, rewind_restores_content_at_mark) {
  writer w;
  auto block = w.open("Block");
  w.text("kept");
  auto const before = w.str();
  auto const m = w.mark();

  {
    auto arg = w.open("Argument");
    auto lit = w.open("Literal");
    w.leaf("Null");
  }
  w.text("speculative");
  w.line_break();

  w.rewind(m);
  EXPECT_EQ(w.str(), before);
  EXPECT_EQ(w.depth(), 1u);

  block.close();
  EXPECT_EQ(w.view(), "<Block>kept</Block>");
}

TEST(writer_test, rewind_to_current_length_is_noop) {
  writer w;
  auto const start = w.mark();
  w.text("abc");
  w.rewind(w.mark());
  EXPECT_EQ(w.view(), "abc");

  w.rewind(start);
  EXPECT_EQ(w.view(), "");
}

TEST(writer_test, mark_records_enclosing_elements) {
  writer w;
  auto const top = w.mark();
  EXPECT_EQ(top.size, 0u);
  EXPECT_EQ(top.depth, 0u);

  auto block = w.open("Block");
  auto stmt = w.open("ExpressionStatement", line_attribute(2));
  auto const inner = w.mark();
  EXPECT_EQ(inner.size, w.size());
  EXPECT_EQ(inner.depth, 2u);
  EXPECT_NE(inner.innermost_id, 0u);
}

TEST(writer_test, rewind_inside_open_element_keeps_it_open) {
  writer w;
  auto block = w.open("Block");
  auto const m = w.mark();
  {
    auto call = w.open("MethodCall");
    w.text("dropped");
  }
  w.rewind(m);
  EXPECT_EQ(w.depth(), 1u);
  w.leaf("ThisReference");
  block.close();
  EXPECT_EQ(w.take(), "<Block><ThisReference/></Block>");
}

TEST(writer_test, nested_marks_rewind_independently) {
  writer w;
  auto const m0 = w.mark();
  w.text("a");
  auto const m1 = w.mark();
  w.text("b");
  w.rewind(m1);
  EXPECT_EQ(w.view(), "a");
  w.text("c");
  w.rewind(m0);
  EXPECT_EQ(w.view(), "");
}

TEST(writer_test, line_break_uses_config) {
  writer crlf;
  crlf.line_break();
  EXPECT_EQ(crlf.view(), "\r\n");

  config cfg;
  cfg.line_break = "\n";
  writer lf{cfg};
  lf.line_break();
  EXPECT_EQ(lf.view(), "\n");
}

TEST(writer_test, take_moves_result_out) {
  writer w;
  w.leaf("ThisReference");
  auto out = w.take();
  EXPECT_EQ(out, "<ThisReference/>");
  EXPECT_EQ(w.size(), 0u);
}

TEST(writer_death_test, rewind_forward_is_fatal) {
  writer w;
  w.text("abc");
  auto const past_end = writer::checkpoint{.size = 4, .depth = 0, .innermost_id = 0};
  EXPECT_DEATH(w.rewind(past_end), "rewind\\(\\) past the end of the buffer");
}

TEST(writer_death_test, rewind_into_closed_element_is_fatal) {
  EXPECT_DEATH(
    {
      writer w;
      writer::checkpoint m;
      {
        auto block = w.open("Block");
        m = w.mark();
      }
      w.rewind(m);
    },
    "rewind\\(\\) into an element that has since been closed");
}

TEST(writer_death_test, rewind_into_replaced_element_is_fatal) {
  EXPECT_DEATH(
    {
      writer w;
      auto outer = w.open("Block");
      writer::checkpoint m;
      {
        auto first = w.open("Expression");
        m = w.mark();
      }
      auto second = w.open("Expression");
      w.rewind(m);
    },
    "rewind\\(\\) into an element that has since been closed");
}

TEST(writer_death_test, releasing_rewound_scope_is_fatal) {
  EXPECT_DEATH(
    {
      writer w;
      auto const m = w.mark();
      auto tag = w.open("Block");
      w.rewind(m);
    },
    "element closed out of order");
}

TEST(writer_death_test, out_of_order_close_is_fatal) {
  EXPECT_DEATH(
    {
      writer w;
      auto outer = w.open("Block");
      auto inner = w.open("Expression");
      outer.close();
    },
    "element closed out of order");
}

TEST(writer_death_test, take_with_open_element_is_fatal) {
  EXPECT_DEATH(
    {
      writer w;
      auto tag = w.open("Block");
      (void)w.take();
    },
    "still open");
}
