#include "test_common.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>

using namespace jsonvfy;

namespace {

// Hands out its payload, then fails every further read.
class failing_reader final : public byte_reader {
public:
  explicit failing_reader(std::string_view head) : head_(head) {}

  std::size_t read_some(char* dst, std::size_t cap, std::error_code& ec) override {
    if (done_) {
      ec = std::make_error_code(std::errc::io_error);
      return 0;
    }
    const std::size_t n = (std::min)(cap, head_.size());
    std::memcpy(dst, head_.data(), n);
    head_.remove_prefix(n);
    if (head_.empty()) done_ = true;
    return n;
  }

private:
  std::string_view head_;
  bool done_{false};
};

} // namespace

static void test_peek_and_read_byte() {
  memory_reader reader("ab");
  cursor c(reader);
  error e;

  auto b = c.peek(e);
  JSONVFY_CHECK(b && *b == 'a');
  b = c.peek(e);
  JSONVFY_CHECK(b && *b == 'a');
  b = c.read_byte(e);
  JSONVFY_CHECK(b && *b == 'a');
  b = c.read_byte(e);
  JSONVFY_CHECK(b && *b == 'b');

  // End of input is not an error for the optional forms.
  JSONVFY_CHECK(!c.peek(e));
  JSONVFY_CHECK(!c.read_byte(e));
  JSONVFY_CHECK(!e);

  // ...but it is where a byte is mandatory.
  JSONVFY_CHECK(!c.read_required(e));
  JSONVFY_CHECK_ERR(e, error_code::unexpected_eof);
}

static void test_read_exact_across_refills() {
  memory_reader reader("\\u00e9rest");
  cursor c(reader, /*buffer_size=*/1);
  error e;

  unsigned char buf[6];
  JSONVFY_CHECK(c.read_exact(buf, 6, e));
  JSONVFY_CHECK(!e);
  JSONVFY_CHECK(std::memcmp(buf, "\\u00e9", 6) == 0);
  JSONVFY_CHECK(c.position().offset == 6);

  JSONVFY_CHECK(!c.read_exact(buf, 5, e));
  JSONVFY_CHECK_ERR(e, error_code::unexpected_eof);
}

static void test_position_tracking() {
  memory_reader reader("ab\ncd\n\nx");
  cursor c(reader, /*buffer_size=*/2);
  error e;

  JSONVFY_CHECK(c.position().line == 1 && c.position().column == 1);
  (void)c.read_byte(e);
  (void)c.read_byte(e);
  JSONVFY_CHECK(c.position().line == 1 && c.position().column == 3);
  (void)c.read_byte(e); // '\n'
  JSONVFY_CHECK(c.position().line == 2 && c.position().column == 1);

  unsigned char buf[4];
  JSONVFY_CHECK(c.read_exact(buf, 4, e));
  JSONVFY_CHECK(c.position().line == 4 && c.position().column == 1);
  JSONVFY_CHECK(c.position().offset == 7);
}

static void test_skip_whitespace_over_many_refills() {
  const std::string json = std::string(1000, ' ') + "\n\t\r  x";
  for (std::size_t buffer_size : {std::size_t{1}, std::size_t{2}, std::size_t{7}, std::size_t{4096}}) {
    memory_reader reader(json);
    cursor c(reader, buffer_size);
    error e;
    skip_whitespace(c, e);
    JSONVFY_CHECK(!e);
    const auto b = c.peek(e);
    JSONVFY_CHECK(b && *b == 'x');
    JSONVFY_CHECK(c.position().offset == json.size() - 1);
    JSONVFY_CHECK(c.position().line == 2);

    // Idempotent at a token boundary.
    skip_whitespace(c, e);
    JSONVFY_CHECK(c.position().offset == json.size() - 1);
  }

  {
    memory_reader reader("  \n ");
    cursor c(reader, 2);
    error e;
    skip_whitespace(c, e);
    JSONVFY_CHECK(!e);
    JSONVFY_CHECK(!c.peek(e));
    JSONVFY_CHECK(!e);
  }
}

static void test_io_failure_is_reported() {
  {
    failing_reader reader("[1,");
    cursor c(reader, 2);
    error e;
    while (c.read_byte(e)) {
    }
    JSONVFY_CHECK_ERR(e, error_code::io_failure);
    JSONVFY_CHECK(c.position().offset == 3);
  }
  {
    failing_reader reader("[1,");
    auto r = verify_detailed(reader);
    JSONVFY_CHECK(!r.valid);
    JSONVFY_CHECK_ERR(r.err, error_code::io_failure);
  }
}

static void test_istream_reader() {
  std::istringstream in(" {\"a\": [true, false, null]} \n");
  istream_reader reader(in);
  JSONVFY_CHECK(verify(reader));

  std::istringstream bad("{\"a\": [true, false, null}");
  istream_reader bad_reader(bad);
  JSONVFY_CHECK(!verify(bad_reader));
}

static void test_file_reader() {
  {
    file_reader missing("jsonvfy-test-file-that-does-not-exist.json");
    JSONVFY_CHECK(!missing.is_open());
    JSONVFY_CHECK(static_cast<bool>(missing.open_error()));
    auto r = verify_detailed(missing);
    JSONVFY_CHECK_ERR(r.err, error_code::io_failure);
  }

  const char* path = "jsonvfy_test_file_reader.json";
  {
    std::ofstream out(path, std::ios::binary);
    out << "[1, 2.5e3, \"x\"]\n";
  }
  {
    file_reader reader(path);
    JSONVFY_CHECK(reader.is_open());
    JSONVFY_CHECK(verify(reader));
    // Same bytes, same verdict.
    reader.rewind();
    JSONVFY_CHECK(verify(reader));
  }
  std::remove(path);
}

static void test_memory_reader_rewind() {
  memory_reader reader("{\"a\":0,\"b\":[]}");
  const auto first = verify_detailed(reader);
  reader.rewind();
  const auto second = verify_detailed(reader);
  JSONVFY_CHECK(first.valid && second.valid);

  memory_reader bad("{\"a\":0,\"a\":[]}");
  const auto bad_first = verify_detailed(bad);
  bad.rewind();
  const auto bad_second = verify_detailed(bad);
  JSONVFY_CHECK(!bad_first.valid && !bad_second.valid);
  JSONVFY_CHECK(bad_first.err.code == bad_second.err.code);
  JSONVFY_CHECK(bad_first.err.offset == bad_second.err.offset);
}

void test_cursor() {
  test_peek_and_read_byte();
  test_read_exact_across_refills();
  test_position_tracking();
  test_skip_whitespace_over_many_refills();
  test_io_failure_is_reported();
  test_istream_reader();
  test_file_reader();
  test_memory_reader_rewind();
}
