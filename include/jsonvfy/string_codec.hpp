#pragma once

#include <jsonvfy/error.hpp>
#include <jsonvfy/token.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace jsonvfy {

namespace detail {

inline void append_utf8(std::string& out, std::uint32_t cp) {
  if (cp <= 0x7Fu) {
    out.push_back(static_cast<char>(cp));
  } else if (cp <= 0x7FFu) {
    out.push_back(static_cast<char>(0xC0u | (cp >> 6)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  } else if (cp <= 0xFFFFu) {
    out.push_back(static_cast<char>(0xE0u | (cp >> 12)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  } else {
    out.push_back(static_cast<char>(0xF0u | (cp >> 18)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 12) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  }
}

inline std::string hex_code_point(std::uint32_t cp) {
  std::string out = "0x";
  if (cp > 0xFFFFu) append_hex_byte(out, static_cast<unsigned char>(cp >> 16));
  append_hex_byte(out, static_cast<unsigned char>((cp >> 8) & 0xFFu));
  append_hex_byte(out, static_cast<unsigned char>(cp & 0xFFu));
  return out;
}

// Source form of chars[first, last), quoted for diagnostics.
inline std::string quote_chars(const json_chars& chars, std::size_t first, std::size_t last) {
  std::string src;
  for (std::size_t k = first; k < last && k < chars.size(); ++k) append_source(src, chars[k]);
  return quote_bytes(src);
}

inline bool is_continuation(const json_char& c) noexcept {
  return c.is_raw_byte() && (c.value & 0xC0u) == 0x80u;
}

// Decodes the UTF-8 sequence of raw bytes starting at chars[i] and advances i
// past it.
inline bool decode_utf8(const json_chars& chars, std::size_t& i, std::string& out, error& e, const source_position& at) {
  const std::uint32_t b0 = chars[i].value;
  if (b0 < 0x80u) {
    out.push_back(static_cast<char>(b0));
    ++i;
    return true;
  }

  std::size_t len = 0;
  std::uint32_t cp = 0;
  std::uint32_t min_cp = 0;
  if ((b0 & 0xE0u) == 0xC0u) {
    len = 2;
    cp = b0 & 0x1Fu;
    min_cp = 0x80u;
  } else if ((b0 & 0xF0u) == 0xE0u) {
    len = 3;
    cp = b0 & 0x0Fu;
    min_cp = 0x800u;
  } else if ((b0 & 0xF8u) == 0xF0u) {
    len = 4;
    cp = b0 & 0x07u;
    min_cp = 0x10000u;
  } else {
    set_error(e, error_code::invalid_utf8_sequence, at, "invalid UTF-8 sequence " + quote_chars(chars, i, i + 1));
    return false;
  }

  for (std::size_t k = 1; k < len; ++k) {
    if (i + k >= chars.size() || !is_continuation(chars[i + k])) {
      set_error(e, error_code::invalid_utf8_sequence, at, "invalid UTF-8 sequence " + quote_chars(chars, i, i + k + 1));
      return false;
    }
    cp = (cp << 6) | (chars[i + k].value & 0x3Fu);
  }

  // Overlong forms would let two spellings share one canonical text.
  if (cp < min_cp || cp > 0x10FFFFu) {
    set_error(e, error_code::invalid_utf8_sequence, at,
              "invalid UTF-8 sequence " + quote_chars(chars, i, i + len) + " (overlong or out of range)");
    return false;
  }
  if (cp >= 0xD800u && cp <= 0xDFFFu) {
    set_error(e, error_code::utf8_sequence_produced_surrogate, at, "UTF-8 sequence produced surrogate " + hex_code_point(cp));
    return false;
  }

  append_utf8(out, cp);
  i += len;
  return true;
}

// Decodes the escaped UTF-16 code unit at chars[i] (and its low surrogate, if it is a high
// surrogate) and advances i past them.
inline bool decode_utf16(const json_chars& chars, std::size_t& i, std::string& out, error& e, const source_position& at) {
  const std::uint32_t unit = chars[i].value;
  if (unit >= 0xD800u && unit <= 0xDBFFu) {
    if (i + 1 < chars.size() && chars[i + 1].is_unicode_escape() && chars[i + 1].value >= 0xDC00u &&
        chars[i + 1].value <= 0xDFFFu) {
      const std::uint32_t hi = unit - 0xD800u;
      const std::uint32_t lo = static_cast<std::uint32_t>(chars[i + 1].value) - 0xDC00u;
      append_utf8(out, 0x10000u + ((hi << 10) | lo));
      i += 2;
      return true;
    }
    set_error(e, error_code::invalid_utf16_surrogate_sequence, at,
              "invalid UTF-16 surrogate sequence " + quote_chars(chars, i, i + 2));
    return false;
  }
  if (unit >= 0xDC00u && unit <= 0xDFFFu) {
    set_error(e, error_code::invalid_utf16_surrogate_sequence, at,
              "invalid UTF-16 surrogate sequence " + quote_chars(chars, i, i + 1));
    return false;
  }
  append_utf8(out, unit);
  ++i;
  return true;
}

} // namespace detail

// Decodes a string token's characters into canonical UTF-8 text. Two strings
// are the same JSON string exactly when their canonical texts are equal.
// `at` is stamped on any error, since the characters carry no position.
inline std::optional<std::string> interpret_string(const json_chars& chars, error& e, const source_position& at = {}) {
  std::string out;
  out.reserve(chars.size());

  std::size_t i = 0;
  while (i < chars.size()) {
    const json_char& c = chars[i];
    switch (c.type) {
      case json_char::kind::raw_byte:
        if (!detail::decode_utf8(chars, i, out, e, at)) return std::nullopt;
        continue;
      case json_char::kind::unicode_escape:
        if (!detail::decode_utf16(chars, i, out, e, at)) return std::nullopt;
        continue;
      case json_char::kind::escaped_quote: out.push_back('"'); break;
      case json_char::kind::escaped_backslash: out.push_back('\\'); break;
      case json_char::kind::escaped_slash: out.push_back('/'); break;
      case json_char::kind::escaped_backspace: out.push_back('\b'); break;
      case json_char::kind::escaped_form_feed: out.push_back('\f'); break;
      case json_char::kind::escaped_line_feed: out.push_back('\n'); break;
      case json_char::kind::escaped_carriage_return: out.push_back('\r'); break;
      case json_char::kind::escaped_tab: out.push_back('\t'); break;
    }
    ++i;
  }
  return out;
}

} // namespace jsonvfy
