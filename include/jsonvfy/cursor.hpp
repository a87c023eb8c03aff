#pragma once

#include <jsonvfy/error.hpp>

#include <algorithm>
#include <cassert>
#include <cerrno>
#include <cstddef>
#include <cstdio>
#include <cstring>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace jsonvfy {

// Config: size of the read buffer a cursor pulls into.
// Override by defining JSONVFY_DEFAULT_BUFFER_SIZE before including this header.
#ifndef JSONVFY_DEFAULT_BUFFER_SIZE
  #define JSONVFY_DEFAULT_BUFFER_SIZE (64u * 1024u)
#endif

// A blocking source of bytes. read_some() returns 0 only at end of input, and
// reports failures through `ec` instead of throwing.
class byte_reader {
public:
  virtual ~byte_reader() = default;

  virtual std::size_t read_some(char* dst, std::size_t cap, std::error_code& ec) = 0;
};

class memory_reader final : public byte_reader {
public:
  explicit memory_reader(std::string_view data) noexcept : data_(data) {}

  std::size_t read_some(char* dst, std::size_t cap, std::error_code&) override {
    const std::size_t n = (std::min)(cap, data_.size() - pos_);
    if (n != 0) std::memcpy(dst, data_.data() + pos_, n);
    pos_ += n;
    return n;
  }

  void rewind() noexcept { pos_ = 0; }

private:
  std::string_view data_;
  std::size_t pos_{0};
};

class istream_reader final : public byte_reader {
public:
  explicit istream_reader(std::istream& in) noexcept : in_(in) {}

  std::size_t read_some(char* dst, std::size_t cap, std::error_code& ec) override {
    if (in_.eof()) return 0;
    in_.read(dst, static_cast<std::streamsize>(cap));
    if (in_.bad()) {
      ec = std::make_error_code(std::errc::io_error);
      return 0;
    }
    return static_cast<std::size_t>(in_.gcount());
  }

private:
  std::istream& in_;
};

// Owns a std::FILE* opened for binary reading.
class file_reader final : public byte_reader {
public:
  explicit file_reader(const std::string& path) {
    errno = 0;
    fp_ = std::fopen(path.c_str(), "rb");
    if (!fp_) open_error_ = std::error_code(errno != 0 ? errno : ENOENT, std::generic_category());
  }

  ~file_reader() override {
    if (fp_) std::fclose(fp_);
  }

  file_reader(const file_reader&) = delete;
  file_reader& operator=(const file_reader&) = delete;

  bool is_open() const noexcept { return fp_ != nullptr; }
  const std::error_code& open_error() const noexcept { return open_error_; }

  std::size_t read_some(char* dst, std::size_t cap, std::error_code& ec) override {
    if (!fp_) {
      ec = open_error_;
      return 0;
    }
    const std::size_t n = std::fread(dst, 1, cap, fp_);
    if (n == 0 && std::ferror(fp_)) {
      ec = std::error_code(errno != 0 ? errno : EIO, std::generic_category());
    }
    return n;
  }

  void rewind() noexcept {
    if (fp_) std::rewind(fp_);
  }

private:
  std::FILE* fp_{nullptr};
  std::error_code open_error_;
};

// Buffered view over a byte_reader with single-byte lookahead. Every consumed
// byte advances position().
class cursor {
public:
  explicit cursor(byte_reader& reader, std::size_t buffer_size = JSONVFY_DEFAULT_BUFFER_SIZE)
      : reader_(&reader), buf_(buffer_size != 0 ? buffer_size : 1) {}

  cursor(const cursor&) = delete;
  cursor& operator=(const cursor&) = delete;

  // Returns the buffered, unconsumed bytes, refilling from the reader when the
  // buffer is drained. Empty at end of input or on failure.
  std::string_view fill_buf(error& e) {
    if (begin_ < end_) return {buf_.data() + begin_, end_ - begin_};
    if (eof_) return {};

    std::error_code ec;
    const std::size_t n = reader_->read_some(buf_.data(), buf_.size(), ec);
    if (ec) {
      detail::set_error(e, error_code::io_failure, pos_, "I/O error: " + ec.message());
      return {};
    }
    begin_ = 0;
    end_ = n;
    if (n == 0) eof_ = true;
    return {buf_.data(), n};
  }

  void consume(std::size_t n) noexcept {
    assert(n <= end_ - begin_);
    for (std::size_t k = 0; k < n; ++k) advance(buf_[begin_ + k]);
    begin_ += n;
  }

  std::optional<unsigned char> peek(error& e) {
    const std::string_view buf = fill_buf(e);
    if (buf.empty()) return std::nullopt;
    return static_cast<unsigned char>(buf[0]);
  }

  std::optional<unsigned char> read_byte(error& e) {
    const std::optional<unsigned char> b = peek(e);
    if (b) consume(1);
    return b;
  }

  // Like read_byte(), but end of input is an error: for grammar positions
  // where a byte is mandatory.
  std::optional<unsigned char> read_required(error& e) {
    const source_position at = pos_;
    const std::optional<unsigned char> b = read_byte(e);
    if (!b && !e) detail::set_error(e, error_code::unexpected_eof, at, "unexpected end of input");
    return b;
  }

  bool read_exact(unsigned char* out, std::size_t n, error& e) {
    std::size_t done = 0;
    while (done < n) {
      const std::string_view buf = fill_buf(e);
      if (e) return false;
      if (buf.empty()) {
        detail::set_error(e, error_code::unexpected_eof, pos_,
                          "unexpected end of input (" + std::to_string(n - done) + " more byte(s) required)");
        return false;
      }
      const std::size_t take = (std::min)(buf.size(), n - done);
      std::memcpy(out + done, buf.data(), take);
      consume(take);
      done += take;
    }
    return true;
  }

  const source_position& position() const noexcept { return pos_; }

private:
  void advance(char c) noexcept {
    ++pos_.offset;
    if (c == '\n') {
      ++pos_.line;
      pos_.column = 1;
    } else {
      ++pos_.column;
    }
  }

  byte_reader* reader_;
  std::vector<char> buf_;
  std::size_t begin_{0};
  std::size_t end_{0};
  bool eof_{false};
  source_position pos_;
};

} // namespace jsonvfy
