#include <jsonvfy/jsonvfy.hpp>

#include "bench_common.hpp"

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

// nlohmann/json (from json_cpp)
#include <nlohmann/json.hpp>

// jsoncpp (from jsoncpp)
#include <json/json.h>

// RapidJSON (from rapidjson)
#include <rapidjson/memorystream.h>
#include <rapidjson/reader.h>

namespace {

using namespace jsonvfy_bench;

// Each checker answers "is this exactly one valid JSON document?" as strictly
// as its library allows.

bool jsonvfy_accepts(std::string_view json) { return jsonvfy::verify(json); }

bool nlohmann_accepts(std::string_view json) {
  return nlohmann::json::accept(json, /*ignore_comments=*/false);
}

class jsoncpp_checker {
public:
  jsoncpp_checker() {
    Json::CharReaderBuilder::strictMode(&builder_.settings_);
    reader_.reset(builder_.newCharReader());
  }

  bool accepts(std::string_view json) {
    Json::Value root;
    std::string errs;
    return reader_->parse(json.data(), json.data() + json.size(), &root, &errs);
  }

private:
  Json::CharReaderBuilder builder_;
  std::unique_ptr<Json::CharReader> reader_;
};

bool rapidjson_accepts(std::string_view json) {
  rapidjson::MemoryStream ms(json.data(), json.size());
  rapidjson::Reader reader;
  rapidjson::BaseReaderHandler<> handler;
  const rapidjson::ParseResult ok = reader.Parse<rapidjson::kParseValidateEncodingFlag>(ms, handler);
  return !ok.IsError();
}

template <class Fn>
bench_result bench_accept(std::string_view json, std::size_t iters, const char* name, Fn&& accepts) {
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    const bool ok = accepts(json);
    if (!ok) {
      std::cerr << name << ": payload rejected\n";
      std::exit(1);
    }
    do_not_optimize(ok);
  }
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), json.size() * iters};
}

struct edge_case {
  const char* name;
  std::string json;
};

std::vector<edge_case> edge_cases() {
  return {
      {"empty object", "{}"},
      {"empty array", "[]"},
      {"scalar root", "42"},
      {"empty document", ""},
      {"duplicate key", "{\"a\":0,\"a\":1}"},
      {"duplicate key, escaped", "{\"a\":0,\"\\u0061\":1}"},
      {"duplicate key, solidus", "{\"/\":0,\"\\/\":1}"},
      {"trailing comma", "[1,]"},
      {"trailing garbage", "{}{}"},
      {"bracket mismatch", "{\"a\":[0}"},
      {"leading zero", "01"},
      {"bare fraction", ".5"},
      {"lone surrogate value", "[\"\\uD800\"]"},
      {"lone surrogate key", "{\"\\uDC00\":0}"},
      {"invalid UTF-8 value", "[\"\xC3\"]"},
      {"overlong UTF-8 value", "[\"\xC0\xAF\"]"},
      {"raw control byte", "[\"a\tb\"]"},
      {"deep nesting", std::string(512, '[') + std::string(512, ']')},
  };
}

void print_verdict_table() {
  jsoncpp_checker jsoncpp;
  const auto verdict = [](bool ok) { return ok ? "ok" : "FAIL"; };

  std::cout << std::left << std::setw(26) << "case" << std::setw(10) << "jsonvfy" << std::setw(10) << "nlohmann"
            << std::setw(10) << "jsoncpp" << "rapidjson\n";
  for (const edge_case& c : edge_cases()) {
    std::cout << std::left << std::setw(26) << c.name << std::setw(10) << verdict(jsonvfy_accepts(c.json)) << std::setw(10)
              << verdict(nlohmann_accepts(c.json)) << std::setw(10) << verdict(jsoncpp.accepts(c.json))
              << verdict(rapidjson_accepts(c.json)) << "\n";
  }
}

} // namespace

int main(int argc, char** argv) {
  std::size_t n_objects = 2000;
  std::size_t iters = 50;
  std::size_t runs = 5;

  if (argc >= 2) n_objects = static_cast<std::size_t>(std::stoull(argv[1]));
  if (argc >= 3) iters = static_cast<std::size_t>(std::stoull(argv[2]));
  if (argc >= 4) runs = static_cast<std::size_t>(std::stoull(argv[3]));

  std::cout << "== Verdicts ==\n";
  print_verdict_table();

  const std::string payload = make_payload(n_objects, 24, false);
  std::cout << "\npayload bytes: " << payload.size() << "\n";

  jsoncpp_checker jsoncpp;

  // Warm-up
  do_not_optimize(jsonvfy_accepts(payload));
  do_not_optimize(nlohmann_accepts(payload));
  do_not_optimize(jsoncpp.accepts(payload));
  do_not_optimize(rapidjson_accepts(payload));

  std::cout << "\n== Accept ==\n";
  print_mbps("jsonvfy verify", run_median(runs, [&] { return bench_accept(payload, iters, "jsonvfy", jsonvfy_accepts); }));
  print_mbps("nlohmann accept", run_median(runs, [&] { return bench_accept(payload, iters, "nlohmann", nlohmann_accepts); }));
  print_mbps("jsoncpp strict parse", run_median(runs, [&] {
               return bench_accept(payload, iters, "jsoncpp", [&](std::string_view j) { return jsoncpp.accepts(j); });
             }));
  print_mbps("rapidjson SAX", run_median(runs, [&] { return bench_accept(payload, iters, "rapidjson", rapidjson_accepts); }));

  return 0;
}
