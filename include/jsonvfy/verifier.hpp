#pragma once

#include <jsonvfy/cursor.hpp>
#include <jsonvfy/error.hpp>
#include <jsonvfy/lexer.hpp>
#include <jsonvfy/string_codec.hpp>
#include <jsonvfy/token.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace jsonvfy {

// Token categories the grammar can ask for next.
enum class expectation : std::uint8_t {
  value = 0x01,
  key = 0x02,
  comma = 0x04,
  colon = 0x08,
  closing_bracket = 0x10,
  closing_brace = 0x20
};

class expectation_set {
public:
  constexpr expectation_set() noexcept = default;
  constexpr expectation_set(expectation x) noexcept : bits_(static_cast<std::uint8_t>(x)) {}

  constexpr bool contains(expectation x) const noexcept { return (bits_ & static_cast<std::uint8_t>(x)) != 0; }
  constexpr bool empty() const noexcept { return bits_ == 0; }
  constexpr std::uint8_t bits() const noexcept { return bits_; }

  friend constexpr expectation_set operator|(expectation_set a, expectation_set b) noexcept {
    expectation_set r;
    r.bits_ = static_cast<std::uint8_t>(a.bits_ | b.bits_);
    return r;
  }
  friend constexpr bool operator==(expectation_set a, expectation_set b) noexcept { return a.bits_ == b.bits_; }
  friend constexpr bool operator!=(expectation_set a, expectation_set b) noexcept { return a.bits_ != b.bits_; }

  // "VALUE | CLOSING_BRACKET"
  std::string to_string() const {
    static constexpr std::pair<expectation, const char*> names[] = {
        {expectation::value, "VALUE"},
        {expectation::key, "KEY"},
        {expectation::comma, "COMMA"},
        {expectation::colon, "COLON"},
        {expectation::closing_bracket, "CLOSING_BRACKET"},
        {expectation::closing_brace, "CLOSING_BRACE"},
    };
    std::string out;
    for (const auto& n : names) {
      if (!contains(n.first)) continue;
      if (!out.empty()) out += " | ";
      out += n.second;
    }
    return out.empty() ? std::string("NOTHING") : out;
  }

private:
  std::uint8_t bits_{0};
};

constexpr expectation_set operator|(expectation a, expectation b) noexcept {
  return expectation_set(a) | expectation_set(b);
}

struct array_frame {
  std::size_t index{0};
};

struct object_frame {
  std::unordered_set<std::string> known_keys;
  std::optional<std::string> pending_key;
};

using container_frame = std::variant<array_frame, object_frame>;

struct verify_options {
  std::size_t max_depth{(std::numeric_limits<std::size_t>::max)()};
  // Value strings are only lexed by default; keys are always decoded.
  bool validate_value_strings{false};
  std::size_t buffer_size{JSONVFY_DEFAULT_BUFFER_SIZE};
};

struct verify_result {
  bool valid{false};
  error err;
};

class verifier {
public:
  explicit verifier(cursor& c, verify_options opt = {}) : cur_(&c), opt_(opt) {}

  verifier(const verifier&) = delete;
  verifier& operator=(const verifier&) = delete;

  // Pulls tokens until the top-level value is complete, then requires that
  // only whitespace remains.
  verify_result run() {
    verify_result r;
    while (!complete_) {
      skip_whitespace(*cur_, r.err);
      if (r.err) return r;
      const source_position at = cur_->position();
      std::optional<token> tok = next_token(*cur_, r.err);
      if (r.err) return r;
      if (!tok) break;
      accept(*tok, at, r.err);
      if (r.err) return r;
    }

    if (!stack_.empty()) {
      detail::set_error(r.err, error_code::unclosed_container, cur_->position(),
                        "document ends with " + std::to_string(stack_.size()) + " unclosed container(s) at " + path());
      return r;
    }
    if (!complete_) {
      detail::set_error(r.err, error_code::unexpected_eof, cur_->position(), "document contains no value");
      return r;
    }

    skip_whitespace(*cur_, r.err);
    if (r.err) return r;
    const std::optional<unsigned char> extra = cur_->peek(r.err);
    if (r.err) return r;
    if (extra) {
      detail::set_error(r.err, error_code::trailing_garbage, cur_->position(), "trailing garbage after end of document");
      return r;
    }
    r.valid = true;
    return r;
  }

  // Feeds one token through the state machine. Returns true once the
  // top-level value is complete; no further token may be fed after that.
  bool accept(const token& tok, const source_position& at, error& e) {
    switch (tok.type()) {
      case token::kind::string: {
        if (expects_.contains(expectation::key)) {
          accept_key(tok, at, e);
          return complete_;
        }
        if (!require(expectation::value, tok, at, e)) return complete_;
        if (opt_.validate_value_strings && !interpret_string(tok.as_chars(), e, at)) return complete_;
        value_completed();
        return complete_;
      }

      case token::kind::null_literal:
      case token::kind::true_literal:
      case token::kind::false_literal:
      case token::kind::number:
        if (!require(expectation::value, tok, at, e)) return complete_;
        value_completed();
        return complete_;

      case token::kind::colon:
        if (!require(expectation::colon, tok, at, e)) return complete_;
        top_object("COLON");
        expects_ = expectation::value;
        return complete_;

      case token::kind::comma: {
        if (!require(expectation::comma, tok, at, e)) return complete_;
        if (stack_.empty()) throw invariant_violation("COMMA expected with an empty container stack");
        if (auto* arr = std::get_if<array_frame>(&stack_.back())) {
          ++arr->index;
          expects_ = expectation::value;
        } else {
          std::get<object_frame>(stack_.back()).pending_key.reset();
          expects_ = expectation::key;
        }
        return complete_;
      }

      case token::kind::opening_bracket:
        if (!require(expectation::value, tok, at, e)) return complete_;
        if (!push(array_frame{}, at, e)) return complete_;
        expects_ = expectation::value | expectation::closing_bracket;
        return complete_;

      case token::kind::opening_brace:
        if (!require(expectation::value, tok, at, e)) return complete_;
        if (!push(object_frame{}, at, e)) return complete_;
        expects_ = expectation::key | expectation::closing_brace;
        return complete_;

      case token::kind::closing_bracket:
        if (!require(expectation::closing_bracket, tok, at, e)) return complete_;
        pop<array_frame>("CLOSING_BRACKET");
        value_completed();
        return complete_;

      case token::kind::closing_brace:
        if (!require(expectation::closing_brace, tok, at, e)) return complete_;
        pop<object_frame>("CLOSING_BRACE");
        value_completed();
        return complete_;
    }
    return complete_;
  }

  expectation_set expects() const noexcept { return expects_; }
  std::size_t depth() const noexcept { return stack_.size(); }
  bool complete() const noexcept { return complete_; }

  // Location of the current parse position, e.g. $["a"][2].
  std::string path() const {
    std::string out = "$";
    for (const container_frame& f : stack_) {
      if (const auto* arr = std::get_if<array_frame>(&f)) {
        out.push_back('[');
        out += std::to_string(arr->index);
        out.push_back(']');
      } else {
        const object_frame& obj = std::get<object_frame>(f);
        if (!obj.pending_key) continue;
        out.push_back('[');
        out += detail::quote_bytes(*obj.pending_key);
        out.push_back(']');
      }
    }
    return out;
  }

private:
  bool require(expectation x, const token& tok, const source_position& at, error& e) {
    if (expects_.contains(x)) return true;
    detail::set_error(e, error_code::unexpected_token, at,
                      "obtained " + to_string(tok) + ", expected " + expects_.to_string() + " at " + path());
    return false;
  }

  object_frame& top_object(const char* what) {
    if (stack_.empty() || !std::holds_alternative<object_frame>(stack_.back())) {
      throw invariant_violation(std::string(what) + " expected but the top of the container stack is not an object");
    }
    return std::get<object_frame>(stack_.back());
  }

  void accept_key(const token& tok, const source_position& at, error& e) {
    object_frame& obj = top_object("KEY");
    std::optional<std::string> key = interpret_string(tok.as_chars(), e, at);
    if (!key) return;
    if (obj.known_keys.count(*key) != 0) {
      detail::set_error(e, error_code::duplicate_key, at, "duplicate key " + detail::quote_bytes(*key) + " at " + path());
      return;
    }
    obj.known_keys.insert(*key);
    obj.pending_key = std::move(*key);
    expects_ = expectation::colon;
  }

  bool push(container_frame f, const source_position& at, error& e) {
    if (stack_.size() >= opt_.max_depth) {
      detail::set_error(e, error_code::nesting_too_deep, at,
                        "nesting deeper than " + std::to_string(opt_.max_depth) + " at " + path());
      return false;
    }
    stack_.push_back(std::move(f));
    return true;
  }

  template <class Frame>
  void pop(const char* what) {
    if (stack_.empty() || !std::holds_alternative<Frame>(stack_.back())) {
      throw invariant_violation(std::string(what) + " expected but the popped container has the other kind");
    }
    stack_.pop_back();
  }

  // A value just finished: expect what may follow it in the enclosing
  // container, or finish the document.
  void value_completed() {
    if (stack_.empty()) {
      complete_ = true;
      expects_ = expectation_set();
    } else if (std::holds_alternative<array_frame>(stack_.back())) {
      expects_ = expectation::comma | expectation::closing_bracket;
    } else {
      expects_ = expectation::comma | expectation::closing_brace;
    }
  }

  cursor* cur_;
  verify_options opt_;
  std::vector<container_frame> stack_;
  expectation_set expects_{expectation::value};
  bool complete_{false};
};

inline verify_result verify_detailed(byte_reader& reader, verify_options opt = {}) {
  cursor c(reader, opt.buffer_size);
  verifier v(c, opt);
  return v.run();
}

inline verify_result verify_detailed(std::string_view json, verify_options opt = {}) {
  memory_reader reader(json);
  return verify_detailed(reader, opt);
}

// True iff the input is exactly one JSON document, optionally surrounded by
// whitespace.
inline bool verify(byte_reader& reader, verify_options opt = {}) {
  return verify_detailed(reader, opt).valid;
}

inline bool verify(std::string_view json, verify_options opt = {}) {
  return verify_detailed(json, opt).valid;
}

} // namespace jsonvfy
