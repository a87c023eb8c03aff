#include <jsonvfy/jsonvfy.hpp>

#include <charconv>
#include <cstddef>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace {

struct cli_options {
  bool tokenize{false};
  jsonvfy::verify_options verify;
  std::string list_file;
  std::string path;
};

void print_usage() {
  std::cerr << "usage: jsonvfy [options] <file.json|->\n";
  std::cerr << "       jsonvfy [options] --list <paths.txt>\n";
  std::cerr << "options:\n";
  std::cerr << "  -t, --tokenize        print one token per line instead of verifying\n";
  std::cerr << "  -s, --strict-strings  also check UTF-8 and surrogates in value strings\n";
  std::cerr << "  -d, --max-depth N     reject nesting deeper than N\n";
  std::cerr << "  -b, --buffer-size N   read buffer size in bytes\n";
}

bool parse_size(std::string_view s, std::size_t& out) {
  const char* first = s.data();
  const char* last = s.data() + s.size();
  const auto r = std::from_chars(first, last, out);
  return r.ec == std::errc{} && r.ptr == last && !s.empty();
}

// Returns false on a usage error.
bool parse_args(int argc, char** argv, cli_options& opt) {
  for (int k = 1; k < argc; ++k) {
    const std::string_view arg{argv[k]};
    const bool has_value = k + 1 < argc;
    if (arg == "-t" || arg == "--tokenize") {
      opt.tokenize = true;
    } else if (arg == "-s" || arg == "--strict-strings") {
      opt.verify.validate_value_strings = true;
    } else if (arg == "-d" || arg == "--max-depth") {
      if (!has_value || !parse_size(argv[++k], opt.verify.max_depth)) return false;
    } else if (arg == "-b" || arg == "--buffer-size") {
      if (!has_value || !parse_size(argv[++k], opt.verify.buffer_size) || opt.verify.buffer_size == 0) return false;
    } else if (arg == "--list") {
      if (!has_value) return false;
      opt.list_file = argv[++k];
    } else if (arg.size() > 1 && arg[0] == '-') {
      return false;
    } else if (opt.path.empty()) {
      opt.path = std::string(arg);
    } else {
      return false;
    }
  }
  if (opt.tokenize && !opt.list_file.empty()) return false;
  return opt.list_file.empty() != opt.path.empty();
}

// "-" reads standard input.
std::unique_ptr<jsonvfy::byte_reader> open_source(const std::string& path, std::error_code& ec) {
  if (path == "-") return std::make_unique<jsonvfy::istream_reader>(std::cin);
  auto file = std::make_unique<jsonvfy::file_reader>(path);
  if (!file->is_open()) {
    ec = file->open_error();
    return nullptr;
  }
  return file;
}

int tokenize_one(const std::string& path, const cli_options& opt) {
  std::error_code ec;
  const auto reader = open_source(path, ec);
  if (!reader) {
    std::cerr << "failed to open " << path << ": " << ec.message() << "\n";
    return 2;
  }

  jsonvfy::cursor c(*reader, opt.verify.buffer_size);
  jsonvfy::error err;
  while (const auto tok = jsonvfy::next_token(c, err)) {
    std::cout << jsonvfy::to_string(*tok) << "\n";
  }
  if (err) {
    std::cerr << path << ":" << jsonvfy::describe(err) << "\n";
    return err.code == jsonvfy::error_code::io_failure ? 2 : 1;
  }
  return 0;
}

// 0 valid, 1 invalid, 2 the file could not be read.
int verify_one(const std::string& path, const cli_options& opt, bool report) {
  std::error_code ec;
  const auto reader = open_source(path, ec);
  if (!reader) {
    if (report) std::cerr << "failed to open " << path << ": " << ec.message() << "\n";
    return 2;
  }

  const jsonvfy::verify_result r = jsonvfy::verify_detailed(*reader, opt.verify);
  if (r.valid) return 0;
  if (report) std::cerr << path << ":" << jsonvfy::describe(r.err) << "\n";
  return r.err.code == jsonvfy::error_code::io_failure ? 2 : 1;
}

int verify_list(const std::string& list_file, const cli_options& opt) {
  std::ifstream in(list_file);
  if (!in) {
    std::cerr << "failed to read list file: " << list_file << "\n";
    return 2;
  }

  bool any_fail = false;
  bool any_io_fail = false;
  std::string path;
  while (std::getline(in, path)) {
    if (path.empty()) continue;
    const int rc = verify_one(path, opt, /*report=*/false);
    if (rc == 0) {
      std::cout << path << "\tOK\n";
    } else {
      std::cout << path << "\tFAIL\n";
      any_fail = true;
      if (rc == 2) any_io_fail = true;
    }
  }
  return any_io_fail ? 2 : (any_fail ? 1 : 0);
}

} // namespace

int main(int argc, char** argv) {
  cli_options opt;
  if (!parse_args(argc, argv, opt)) {
    print_usage();
    return 2;
  }

  try {
    if (!opt.list_file.empty()) return verify_list(opt.list_file, opt);
    if (opt.tokenize) return tokenize_one(opt.path, opt);
    return verify_one(opt.path, opt, /*report=*/true);
  } catch (const jsonvfy::invariant_violation& ex) {
    std::cerr << ex.what() << "\n";
    return 3;
  }
}
