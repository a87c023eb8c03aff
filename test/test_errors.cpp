#include "test_common.hpp"

#include <cstring>
#include <string>

using namespace jsonvfy;

static void test_common_syntax_errors() {
  {
    auto r = verify_detailed("{\"a\":1,}");
    JSONVFY_CHECK_ERR(r.err, error_code::unexpected_token);
  }
  {
    auto r = verify_detailed("[1 2]");
    JSONVFY_CHECK_ERR(r.err, error_code::unexpected_token);
    JSONVFY_CHECK(r.err.message == "obtained number 2, expected COMMA | CLOSING_BRACKET at $[0]");
  }
  {
    auto r = verify_detailed("\"unterminated");
    JSONVFY_CHECK_ERR(r.err, error_code::unexpected_eof);
  }
  {
    auto r = verify_detailed("[tru]");
    JSONVFY_CHECK_ERR(r.err, error_code::invalid_bareword_beginning);
  }
}

static void test_error_line_column_tracking() {
  const char* json = "{\n  \"a\": 1,\n  \"b\": 01\n}";
  auto r = verify_detailed(json);
  JSONVFY_CHECK_ERR(r.err, error_code::unexpected_token);
  JSONVFY_CHECK(r.err.offset < std::strlen(json));
  // The stray "1" after "0" is on line 3.
  JSONVFY_CHECK(r.err.line == 3);
  JSONVFY_CHECK(r.err.column == 9);
  JSONVFY_CHECK(describe(r.err) == "3:9: obtained number 1, expected COMMA | CLOSING_BRACE at $[\"b\"]");
}

static void test_positions_point_at_the_offender() {
  {
    // Escape errors report the backslash.
    auto r = verify_detailed("[\n  \"ab\\q\"]");
    JSONVFY_CHECK_ERR(r.err, error_code::unknown_escape);
    JSONVFY_CHECK(r.err.line == 2 && r.err.column == 6);
  }
  {
    // Number errors report the byte that does not fit.
    auto r = verify_detailed("[1.5e*]");
    JSONVFY_CHECK_ERR(r.err, error_code::invalid_number_character);
    JSONVFY_CHECK(r.err.offset == 5);
  }
  {
    // Grammar errors report the start of the token.
    auto r = verify_detailed("{\"k\": [1], \"k\": 2}");
    JSONVFY_CHECK_ERR(r.err, error_code::duplicate_key);
    JSONVFY_CHECK(r.err.offset == 11);
  }
  {
    auto r = verify_detailed("[1]   \n  x");
    JSONVFY_CHECK_ERR(r.err, error_code::trailing_garbage);
    JSONVFY_CHECK(r.err.line == 2 && r.err.column == 3);
  }
  {
    auto r = verify_detailed("[\r\n\r\n");
    JSONVFY_CHECK_ERR(r.err, error_code::unclosed_container);
    JSONVFY_CHECK(r.err.line == 3 && r.err.column == 1);
  }
}

static void test_first_error_wins() {
  error e;
  source_position first;
  first.offset = 3;
  detail::set_error(e, error_code::duplicate_key, first, "first");
  source_position second;
  second.offset = 9;
  detail::set_error(e, error_code::trailing_garbage, second, "second");
  JSONVFY_CHECK(e.code == error_code::duplicate_key);
  JSONVFY_CHECK(e.offset == 3);
  JSONVFY_CHECK(e.message == "first");
}

static void test_describe_and_code_names() {
  error e;
  JSONVFY_CHECK(!e);
  JSONVFY_CHECK(std::string(to_string(e.code)) == "ok");

  detail::set_error(e, error_code::unclosed_container, source_position{});
  JSONVFY_CHECK(static_cast<bool>(e));
  JSONVFY_CHECK(describe(e) == "1:1: unclosed_container");

  JSONVFY_CHECK(std::string(to_string(error_code::utf8_sequence_produced_surrogate)) == "utf8_sequence_produced_surrogate");
  JSONVFY_CHECK(std::string(to_string(error_code::nesting_too_deep)) == "nesting_too_deep");
}

static void test_diagnostics_are_printable() {
  auto r = verify_detailed("[\"a\", \x01\xFFxy]");
  JSONVFY_CHECK_ERR(r.err, error_code::invalid_bareword_beginning);
  JSONVFY_CHECK(r.err.message == "invalid bareword beginning \"\\x01\\xFFxy\"");
  for (const char c : r.err.message) {
    const unsigned char uc = static_cast<unsigned char>(c);
    JSONVFY_CHECK(uc >= 0x20u && uc < 0x7Fu);
  }
}

void test_errors() {
  test_common_syntax_errors();
  test_error_line_column_tracking();
  test_positions_point_at_the_offender();
  test_first_error_wins();
  test_describe_and_code_names();
  test_diagnostics_are_printable();
}
