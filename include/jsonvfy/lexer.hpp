#pragma once

#include <jsonvfy/cursor.hpp>
#include <jsonvfy/error.hpp>
#include <jsonvfy/token.hpp>

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace jsonvfy {

namespace detail {

inline bool is_ws(unsigned char c) noexcept {
  return c == ' ' || c == '\n' || c == '\r' || c == '\t';
}

inline bool is_digit(unsigned char c) noexcept { return c >= '0' && c <= '9'; }

inline int hex_val(unsigned char c) noexcept {
  if (c >= '0' && c <= '9') return static_cast<int>(c - '0');
  const unsigned char lc = static_cast<unsigned char>(c | 0x20u); // ASCII to-lower
  if (lc >= 'a' && lc <= 'f') return 10 + static_cast<int>(lc - 'a');
  return -1;
}

// Consumes leading whitespace of the buffered region. Returns true when the
// whole region was whitespace, i.e. the caller has to pull more input.
inline bool skip_buffered_ws(cursor& c, error& e) {
  const std::string_view buf = c.fill_buf(e);
  if (buf.empty()) return false;
  std::size_t n = 0;
  while (n < buf.size() && is_ws(static_cast<unsigned char>(buf[n]))) ++n;
  c.consume(n);
  return n == buf.size();
}

inline std::optional<token::kind> structural_kind(unsigned char b) noexcept {
  switch (b) {
    case '[': return token::kind::opening_bracket;
    case ']': return token::kind::closing_bracket;
    case '{': return token::kind::opening_brace;
    case '}': return token::kind::closing_brace;
    case ':': return token::kind::colon;
    case ',': return token::kind::comma;
    default: return std::nullopt;
  }
}

inline std::string_view as_chars(const unsigned char* p, std::size_t n) noexcept {
  return {reinterpret_cast<const char*>(p), n};
}

// Reads a string token; the cursor must be on the opening quote.
inline std::optional<json_chars> read_string(cursor& c, error& e) {
  const std::optional<unsigned char> open = c.read_byte(e);
  assert(open && *open == '"');
  (void)open;

  json_chars chars;
  bool escaping = false;
  source_position escape_pos;
  for (;;) {
    const source_position at = c.position();
    const std::optional<unsigned char> b = c.read_required(e);
    if (!b) return std::nullopt;

    if (!escaping) {
      if (*b == '"') return chars;
      if (*b == '\\') {
        escaping = true;
        escape_pos = at;
      } else {
        chars.push_back(json_char::raw(*b));
      }
      continue;
    }

    escaping = false;
    switch (*b) {
      case '"': chars.push_back(json_char::escape(json_char::kind::escaped_quote)); break;
      case '\\': chars.push_back(json_char::escape(json_char::kind::escaped_backslash)); break;
      case '/': chars.push_back(json_char::escape(json_char::kind::escaped_slash)); break;
      case 'b': chars.push_back(json_char::escape(json_char::kind::escaped_backspace)); break;
      case 'f': chars.push_back(json_char::escape(json_char::kind::escaped_form_feed)); break;
      case 'n': chars.push_back(json_char::escape(json_char::kind::escaped_line_feed)); break;
      case 'r': chars.push_back(json_char::escape(json_char::kind::escaped_carriage_return)); break;
      case 't': chars.push_back(json_char::escape(json_char::kind::escaped_tab)); break;
      case 'u': {
        unsigned char hex[4];
        if (!c.read_exact(hex, 4, e)) return std::nullopt;
        std::uint32_t unit = 0;
        for (const unsigned char h : hex) {
          const int v = hex_val(h);
          if (v < 0) {
            set_error(e, error_code::invalid_unicode_escape, escape_pos,
                      "invalid Unicode escape value " + quote_bytes(as_chars(hex, 4)));
            return std::nullopt;
          }
          unit = (unit << 4) | static_cast<std::uint32_t>(v);
        }
        chars.push_back(json_char::unicode(static_cast<std::uint16_t>(unit)));
        break;
      }
      default: {
        const unsigned char bad = *b;
        set_error(e, error_code::unknown_escape, escape_pos, "unknown escape character " + quote_bytes(as_chars(&bad, 1)));
        return std::nullopt;
      }
    }
  }
}

// States of the number grammar -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
enum class number_state {
  minus_or_zero_or_lead_digit,
  lead_digit_only,
  dot_or_exponent,
  mantissa_dot_or_exponent,
  fraction_digit,
  fraction_digit_or_exponent,
  exponent_sign_or_digit,
  exponent_digit,
  exponent_digit_optional
};

// Whether the state needs one more byte before the number may end.
inline bool requires_byte(number_state s) noexcept {
  switch (s) {
    case number_state::minus_or_zero_or_lead_digit:
    case number_state::lead_digit_only:
    case number_state::fraction_digit:
    case number_state::exponent_sign_or_digit:
    case number_state::exponent_digit:
      return true;
    default:
      return false;
  }
}

// Next state after `b`, or none when `b` does not extend the number.
inline std::optional<number_state> number_transition(number_state s, unsigned char b) noexcept {
  const bool digit = is_digit(b);
  const bool exponent = b == 'e' || b == 'E';
  switch (s) {
    case number_state::minus_or_zero_or_lead_digit:
      if (b == '-') return number_state::lead_digit_only;
      [[fallthrough]];
    case number_state::lead_digit_only:
      if (b == '0') return number_state::dot_or_exponent;
      if (digit) return number_state::mantissa_dot_or_exponent;
      return std::nullopt;
    case number_state::dot_or_exponent:
      if (b == '.') return number_state::fraction_digit;
      if (exponent) return number_state::exponent_sign_or_digit;
      return std::nullopt;
    case number_state::mantissa_dot_or_exponent:
      if (digit) return number_state::mantissa_dot_or_exponent;
      if (b == '.') return number_state::fraction_digit;
      if (exponent) return number_state::exponent_sign_or_digit;
      return std::nullopt;
    case number_state::fraction_digit:
      if (digit) return number_state::fraction_digit_or_exponent;
      return std::nullopt;
    case number_state::fraction_digit_or_exponent:
      if (digit) return number_state::fraction_digit_or_exponent;
      if (exponent) return number_state::exponent_sign_or_digit;
      return std::nullopt;
    case number_state::exponent_sign_or_digit:
      if (b == '+' || b == '-') return number_state::exponent_digit;
      if (digit) return number_state::exponent_digit_optional;
      return std::nullopt;
    case number_state::exponent_digit:
    case number_state::exponent_digit_optional:
      if (digit) return number_state::exponent_digit_optional;
      return std::nullopt;
  }
  return std::nullopt;
}

// Reads a number token and returns its raw bytes. Required states consume the
// next byte and fail if it does not fit; optional states only peek, so the
// byte that ends the number stays in the cursor.
inline std::optional<std::string> read_number(cursor& c, error& e) {
  std::string raw;
  number_state state = number_state::minus_or_zero_or_lead_digit;
  for (;;) {
    if (requires_byte(state)) {
      const source_position at = c.position();
      const std::optional<unsigned char> b = c.read_required(e);
      if (!b) return std::nullopt;
      const std::optional<number_state> next = number_transition(state, *b);
      if (!next) {
        const unsigned char bad = *b;
        set_error(e, error_code::invalid_number_character, at,
                  "invalid number character " + quote_bytes(as_chars(&bad, 1)) + " after " + quote_bytes(raw));
        return std::nullopt;
      }
      raw.push_back(static_cast<char>(*b));
      state = *next;
      continue;
    }

    const std::optional<unsigned char> b = c.peek(e);
    if (e) return std::nullopt;
    if (!b) return raw;
    const std::optional<number_state> next = number_transition(state, *b);
    if (!next) return raw;
    c.consume(1);
    raw.push_back(static_cast<char>(*b));
    state = *next;
  }
}

// true, false and null. Reads four bytes up front (five for false) whatever
// they are.
inline std::optional<token> read_bareword(cursor& c, error& e) {
  const source_position at = c.position();
  unsigned char buf[5];
  if (!c.read_exact(buf, 4, e)) return std::nullopt;

  const std::string_view word = as_chars(buf, 4);
  if (word == "true") return token(token::kind::true_literal);
  if (word == "null") return token(token::kind::null_literal);
  if (word == "fals") {
    if (!c.read_exact(buf + 4, 1, e)) return std::nullopt;
    if (buf[4] == 'e') return token(token::kind::false_literal);
    set_error(e, error_code::invalid_bareword_beginning, at, "invalid bareword beginning " + quote_bytes(as_chars(buf, 5)));
    return std::nullopt;
  }
  set_error(e, error_code::invalid_bareword_beginning, at, "invalid bareword beginning " + quote_bytes(word));
  return std::nullopt;
}

} // namespace detail

// Consumes space, tab, line feed and carriage return up to the next other byte
// or the end of input.
inline void skip_whitespace(cursor& c, error& e) {
  while (detail::skip_buffered_ws(c, e)) {
  }
}

// Pulls the next token. Returns none with `e` unset only at a clean end of
// input; on failure returns none with `e` set.
inline std::optional<token> next_token(cursor& c, error& e) {
  skip_whitespace(c, e);
  if (e) return std::nullopt;

  const std::optional<unsigned char> b = c.peek(e);
  if (!b) return std::nullopt;

  if (const std::optional<token::kind> k = detail::structural_kind(*b)) {
    c.consume(1);
    return token(*k);
  }

  if (*b == '"') {
    std::optional<json_chars> chars = detail::read_string(c, e);
    if (!chars) return std::nullopt;
    return token::make_string(std::move(*chars));
  }

  if (*b == '-' || detail::is_digit(*b)) {
    std::optional<std::string> raw = detail::read_number(c, e);
    if (!raw) return std::nullopt;
    return token::make_number(std::move(*raw));
  }

  return detail::read_bareword(c, e);
}

} // namespace jsonvfy
