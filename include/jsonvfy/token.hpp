#pragma once

#include <jsonvfy/error.hpp>

#include <cassert>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace jsonvfy {

// One unit of a JSON string as written in the source: a raw byte, one of the
// eight short escapes, or an escaped UTF-16 code unit. Nothing is decoded here.
struct json_char {
  enum class kind : std::uint8_t {
    raw_byte,
    escaped_quote,
    escaped_backslash,
    escaped_slash,
    escaped_backspace,
    escaped_form_feed,
    escaped_line_feed,
    escaped_carriage_return,
    escaped_tab,
    unicode_escape
  };

  kind type{kind::raw_byte};
  // The byte for raw_byte, the code unit for unicode_escape, else unused.
  std::uint16_t value{0};

  static json_char raw(unsigned char b) noexcept { return {kind::raw_byte, b}; }
  static json_char escape(kind k) noexcept { return {k, 0}; }
  static json_char unicode(std::uint16_t unit) noexcept { return {kind::unicode_escape, unit}; }

  bool is_raw_byte() const noexcept { return type == kind::raw_byte; }
  bool is_unicode_escape() const noexcept { return type == kind::unicode_escape; }

  friend bool operator==(const json_char& a, const json_char& b) noexcept {
    return a.type == b.type && a.value == b.value;
  }
  friend bool operator!=(const json_char& a, const json_char& b) noexcept { return !(a == b); }
};

using json_chars = std::vector<json_char>;

class token {
public:
  enum class kind {
    opening_bracket,
    closing_bracket,
    opening_brace,
    closing_brace,
    colon,
    comma,
    string,
    number,
    null_literal,
    true_literal,
    false_literal
  };

  // Structural tokens and the three literals carry no payload.
  explicit token(kind k) noexcept : kind_(k) {
    assert(k != kind::string && k != kind::number);
  }

  static token make_string(json_chars chars) {
    token t(kind::string, 0);
    t.data_ = std::move(chars);
    return t;
  }

  static token make_number(std::string raw) {
    token t(kind::number, 0);
    t.data_ = std::move(raw);
    return t;
  }

  kind type() const noexcept { return kind_; }

  bool is_string() const noexcept { return kind_ == kind::string; }
  bool is_number() const noexcept { return kind_ == kind::number; }

  const json_chars& as_chars() const { return std::get<json_chars>(data_); }
  // The exact bytes of the number as they appeared in the source.
  const std::string& as_number() const { return std::get<std::string>(data_); }

  friend bool operator==(const token& a, const token& b) { return a.kind_ == b.kind_ && a.data_ == b.data_; }
  friend bool operator!=(const token& a, const token& b) { return !(a == b); }

private:
  token(kind k, int) noexcept : kind_(k) {}

  kind kind_;
  std::variant<std::monostate, json_chars, std::string> data_;
};

namespace detail {

inline void append_source(std::string& out, const json_char& c) {
  switch (c.type) {
    case json_char::kind::raw_byte: out.push_back(static_cast<char>(c.value)); return;
    case json_char::kind::escaped_quote: out += "\\\""; return;
    case json_char::kind::escaped_backslash: out += "\\\\"; return;
    case json_char::kind::escaped_slash: out += "\\/"; return;
    case json_char::kind::escaped_backspace: out += "\\b"; return;
    case json_char::kind::escaped_form_feed: out += "\\f"; return;
    case json_char::kind::escaped_line_feed: out += "\\n"; return;
    case json_char::kind::escaped_carriage_return: out += "\\r"; return;
    case json_char::kind::escaped_tab: out += "\\t"; return;
    case json_char::kind::unicode_escape: {
      out += "\\u";
      append_hex_byte(out, static_cast<unsigned char>(c.value >> 8));
      append_hex_byte(out, static_cast<unsigned char>(c.value & 0xFFu));
      return;
    }
  }
}

} // namespace detail

// Re-renders characters the way they were spelled between the quotes.
inline std::string to_source(const json_chars& chars) {
  std::string out;
  out.reserve(chars.size());
  for (const json_char& c : chars) detail::append_source(out, c);
  return out;
}

inline const char* to_string(token::kind k) noexcept {
  switch (k) {
    case token::kind::opening_bracket: return "[";
    case token::kind::closing_bracket: return "]";
    case token::kind::opening_brace: return "{";
    case token::kind::closing_brace: return "}";
    case token::kind::colon: return ":";
    case token::kind::comma: return ",";
    case token::kind::string: return "string";
    case token::kind::number: return "number";
    case token::kind::null_literal: return "null";
    case token::kind::true_literal: return "true";
    case token::kind::false_literal: return "false";
  }
  return "?";
}

// One-line rendering for token dumps and diagnostics, e.g. `string "ab"`.
// Raw bytes outside printable ASCII are shown as \xHH.
inline std::string to_string(const token& t) {
  switch (t.type()) {
    case token::kind::string: {
      std::string out = "string ";
      const std::string src = to_source(t.as_chars());
      // to_source() already escapes quotes and backslashes that were escaped in
      // the input, so only raw bytes need the printable treatment here.
      out.push_back('"');
      for (const char c : src) {
        const unsigned char uc = static_cast<unsigned char>(c);
        if (uc >= 0x20u && uc < 0x7Fu) {
          out.push_back(c);
        } else {
          out += "\\x";
          detail::append_hex_byte(out, uc);
        }
      }
      out.push_back('"');
      return out;
    }
    case token::kind::number: return std::string("number ") + t.as_number();
    default: return to_string(t.type());
  }
}

} // namespace jsonvfy
