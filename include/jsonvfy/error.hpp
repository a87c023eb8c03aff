#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace jsonvfy {

enum class error_code {
  ok = 0,
  io_failure,
  unexpected_eof,
  unknown_escape,
  invalid_unicode_escape,
  invalid_number_character,
  invalid_bareword_beginning,
  invalid_utf8_sequence,
  utf8_sequence_produced_surrogate,
  invalid_utf16_surrogate_sequence,
  unexpected_token,
  duplicate_key,
  unclosed_container,
  trailing_garbage,
  nesting_too_deep
};

inline const char* to_string(error_code code) noexcept {
  switch (code) {
    case error_code::ok: return "ok";
    case error_code::io_failure: return "io_failure";
    case error_code::unexpected_eof: return "unexpected_eof";
    case error_code::unknown_escape: return "unknown_escape";
    case error_code::invalid_unicode_escape: return "invalid_unicode_escape";
    case error_code::invalid_number_character: return "invalid_number_character";
    case error_code::invalid_bareword_beginning: return "invalid_bareword_beginning";
    case error_code::invalid_utf8_sequence: return "invalid_utf8_sequence";
    case error_code::utf8_sequence_produced_surrogate: return "utf8_sequence_produced_surrogate";
    case error_code::invalid_utf16_surrogate_sequence: return "invalid_utf16_surrogate_sequence";
    case error_code::unexpected_token: return "unexpected_token";
    case error_code::duplicate_key: return "duplicate_key";
    case error_code::unclosed_container: return "unclosed_container";
    case error_code::trailing_garbage: return "trailing_garbage";
    case error_code::nesting_too_deep: return "nesting_too_deep";
  }
  return "unknown";
}

// Location of the next unread byte. Line and column are 1-based.
struct source_position {
  std::size_t offset{0};
  std::size_t line{1};
  std::size_t column{1};
};

struct error {
  error_code code{error_code::ok};
  std::size_t offset{0};
  std::size_t line{1};
  std::size_t column{1};
  std::string message;

  explicit operator bool() const noexcept { return code != error_code::ok; }
};

// "line:column: message", or just the code name when there is no message.
inline std::string describe(const error& e) {
  std::string out = std::to_string(e.line);
  out.push_back(':');
  out += std::to_string(e.column);
  out += ": ";
  if (e.message.empty()) {
    out += to_string(e.code);
  } else {
    out += e.message;
  }
  return out;
}

// Raised when the grammar state machine contradicts itself. This is a bug in
// jsonvfy, never a property of the input.
class invariant_violation : public std::logic_error {
public:
  explicit invariant_violation(const std::string& what) : std::logic_error("jsonvfy: internal invariant violated: " + what) {}
};

namespace detail {

// First error wins; later failures while unwinding are ignored.
inline void set_error(error& e, error_code code, const source_position& at, std::string message = {}) {
  if (e) return;
  e.code = code;
  e.offset = at.offset;
  e.line = at.line;
  e.column = at.column;
  e.message = std::move(message);
}

inline void append_hex_byte(std::string& out, unsigned char b) {
  static const char digits[] = "0123456789ABCDEF";
  out.push_back(digits[b >> 4]);
  out.push_back(digits[b & 0x0Fu]);
}

// Renders arbitrary bytes as a double-quoted, printable diagnostic string.
inline std::string quote_bytes(std::string_view bytes) {
  std::string out;
  out.reserve(bytes.size() + 2);
  out.push_back('"');
  for (const char c : bytes) {
    const unsigned char uc = static_cast<unsigned char>(c);
    if (c == '"' || c == '\\') {
      out.push_back('\\');
      out.push_back(c);
    } else if (uc >= 0x20u && uc < 0x7Fu) {
      out.push_back(c);
    } else {
      out += "\\x";
      append_hex_byte(out, uc);
    }
  }
  out.push_back('"');
  return out;
}

} // namespace detail

} // namespace jsonvfy
