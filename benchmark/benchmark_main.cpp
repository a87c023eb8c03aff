#include <jsonvfy/jsonvfy.hpp>

#include "bench_common.hpp"

#include <cstddef>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

namespace {

using namespace jsonvfy_bench;

bench_result bench_verify(std::string_view json, std::size_t iters, const jsonvfy::verify_options& opt) {
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    const jsonvfy::verify_result r = jsonvfy::verify_detailed(json, opt);
    if (!r.valid) {
      std::cerr << "payload rejected: " << jsonvfy::describe(r.err) << "\n";
      std::exit(1);
    }
    do_not_optimize(r.valid);
  }
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), json.size() * iters};
}

bench_result bench_tokenize(std::string_view json, std::size_t iters, std::size_t buffer_size) {
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    jsonvfy::memory_reader reader(json);
    jsonvfy::cursor c(reader, buffer_size);
    jsonvfy::error err;
    std::size_t count = 0;
    while (jsonvfy::next_token(c, err)) ++count;
    if (err) {
      std::cerr << "payload failed to lex: " << jsonvfy::describe(err) << "\n";
      std::exit(1);
    }
    do_not_optimize(count);
  }
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), json.size() * iters};
}

} // namespace

int main(int argc, char** argv) {
  std::size_t n_objects = 2000;
  std::size_t str_len = 24;
  std::size_t iters = 50;
  std::size_t runs = 5;

  if (argc >= 2) n_objects = static_cast<std::size_t>(std::stoull(argv[1]));
  if (argc >= 3) iters = static_cast<std::size_t>(std::stoull(argv[2]));
  if (argc >= 4) runs = static_cast<std::size_t>(std::stoull(argv[3]));

  const std::string payload = make_payload(n_objects, str_len, true);
  std::cout << "payload bytes: " << payload.size() << "\n";

  // Warm-up
  {
    const bool ok = jsonvfy::verify(payload);
    do_not_optimize(ok);
  }

  std::cout << "\n== verify ==\n";
  for (const std::size_t buffer_size : {std::size_t{64}, std::size_t{4096}, std::size_t{JSONVFY_DEFAULT_BUFFER_SIZE}}) {
    jsonvfy::verify_options opt;
    opt.buffer_size = buffer_size;
    print_mbps("verify(buffer=" + std::to_string(buffer_size) + ")", run_median(runs, [&] { return bench_verify(payload, iters, opt); }));
  }
  {
    jsonvfy::verify_options opt;
    opt.validate_value_strings = true;
    print_mbps("verify(strict strings)", run_median(runs, [&] { return bench_verify(payload, iters, opt); }));
  }

  std::cout << "\n== tokenize ==\n";
  print_mbps("tokenize", run_median(runs, [&] { return bench_tokenize(payload, iters, JSONVFY_DEFAULT_BUFFER_SIZE); }));

  return 0;
}
