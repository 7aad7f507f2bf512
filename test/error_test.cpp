#include <gtest/gtest.h>

#include <methodxml/error.hpp>

#include <string>
#include <system_error>

using methodxml::error;

TEST(error_test, category_name) {
  std::error_code ec = error::invalid_number;
  EXPECT_STREQ(ec.category().name(), "methodxml");
  EXPECT_TRUE(static_cast<bool>(ec));
}

TEST(error_test, every_code_has_a_message) {
  for (auto e : {error::unknown_entity, error::unterminated_entity, error::invalid_number,
                 error::unmatched_span_end, error::unclosed_span_start,
                 error::invalid_argument}) {
    std::error_code ec = e;
    EXPECT_FALSE(ec.message().empty());
    EXPECT_NE(ec.message(), "methodxml error.");
  }
}

TEST(error_test, codes_are_distinct) {
  std::error_code a = error::unmatched_span_end;
  std::error_code b = error::unclosed_span_start;
  EXPECT_NE(a, b);
  EXPECT_EQ(a, methodxml::make_error_code(error::unmatched_span_end));
}
