// benchmarks/bench_numbers.cpp
// Number resolution: numscan vs yyjson vs RapidJSON vs nlohmann/json.
// Every literal is parsed as a standalone JSON document by the other
// libraries, so their figures include document setup; numscan resolves the
// literal directly, which is what a tape builder does per number token.
//
// Usage:
//   ./bench_numbers              # 200000 literals, 20 rounds
//   ./bench_numbers --count 1000000 --rounds 5

#include "utils.hpp"
#include <numscan/numscan.hpp>
#include <nlohmann/json.hpp>
#include <rapidjson/document.h>
#include <yyjson.h>

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

using numscan::Number;

// Keeps the timed loops from being optimized away.
static volatile uint64_t g_sink = 0;

// Reference decode through yyjson: the value a conforming parser produces.
static bool same_as_yyjson(const std::string &lit, const Number &n) {
  yyjson_doc *d = yyjson_read(lit.c_str(), lit.size(), 0);
  if (!d)
    return !n.valid();
  yyjson_val *v = yyjson_doc_get_root(d);
  bool ok = false;
  if (yyjson_is_sint(v))
    ok = n.is_int() && n.as_int64() == yyjson_get_sint(v);
  else if (yyjson_is_uint(v))
    ok = n.get_uint64() == yyjson_get_uint(v);
  else if (yyjson_is_real(v))
    ok = n.is_double() && n.as_double() == yyjson_get_real(v);
  yyjson_doc_free(d);
  return ok;
}

static void run(size_t count, size_t rounds) {
  const std::vector<std::string> corpus = bench::make_corpus(count);
  const double mb = bench::corpus_bytes(corpus) / (1024.0 * 1024.0);
  const double total = double(count) * rounds;

  bench::print_header("bench_numbers: " + std::to_string(count) +
                      " literals x " + std::to_string(rounds));
  bench::print_table_header();

  // ── 1. numscan (two-word tape encoding) ────────────────────────────────
  {
    uint64_t sink = 0;
    bench::Timer t;
    t.start();
    for (size_t r = 0; r < rounds; ++r)
      for (const auto &lit : corpus) {
        numscan::tape::Words w = numscan::tape::parse_number(lit);
        sink += w.tag_word ^ w.value_word;
      }
    double ns = t.elapsed_ns();

    bool ok = true;
    for (const auto &lit : corpus) {
      auto n = numscan::try_parse_number(lit);
      if (!n || !same_as_yyjson(lit, *n)) {
        std::cerr << "  numscan mismatch on '" << lit << "'\n";
        ok = false;
        break;
      }
    }
    bench::Result{"numscan", ns / total, mb * rounds / (ns / 1e9), ok}.print();
    g_sink = sink;
  }

  // ── 2. yyjson ──────────────────────────────────────────────────────────
  {
    uint64_t sink = 0;
    bench::Timer t;
    t.start();
    for (size_t r = 0; r < rounds; ++r)
      for (const auto &lit : corpus) {
        yyjson_doc *d = yyjson_read(lit.c_str(), lit.size(), 0);
        sink += yyjson_get_uint(yyjson_doc_get_root(d));
        yyjson_doc_free(d);
      }
    double ns = t.elapsed_ns();
    bench::Result{"yyjson", ns / total, mb * rounds / (ns / 1e9), true}
        .print();
    g_sink = sink;
  }

  // ── 3. RapidJSON (full-precision) ──────────────────────────────────────
  {
    uint64_t sink = 0;
    bench::Timer t;
    t.start();
    for (size_t r = 0; r < rounds; ++r)
      for (const auto &lit : corpus) {
        rapidjson::Document d;
        d.Parse<rapidjson::kParseFullPrecisionFlag>(lit.c_str(), lit.size());
        if (d.IsUint64())
          sink += d.GetUint64();
        else if (d.IsInt64())
          sink += static_cast<uint64_t>(d.GetInt64());
        else if (d.IsDouble())
          sink += d.GetDouble() > 0;
      }
    double ns = t.elapsed_ns();
    bench::Result{"rapidjson", ns / total, mb * rounds / (ns / 1e9), true}
        .print();
    g_sink = sink;
  }

  // ── 4. nlohmann/json (baseline) ────────────────────────────────────────
  {
    uint64_t sink = 0;
    bench::Timer t;
    t.start();
    for (size_t r = 0; r < rounds; ++r)
      for (const auto &lit : corpus) {
        nlohmann::json j = nlohmann::json::parse(lit);
        if (j.is_number_unsigned())
          sink += j.get<uint64_t>();
        else if (j.is_number_integer())
          sink += static_cast<uint64_t>(j.get<int64_t>());
      }
    double ns = t.elapsed_ns();
    bench::Result{"nlohmann", ns / total, mb * rounds / (ns / 1e9), true}
        .print();
    g_sink = sink;
  }

  std::cout << "\n";
}

// ── main ──────────────────────────────────────────────────────────────────

int main(int argc, char **argv) {
  size_t count = 200000;
  size_t rounds = 20;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--count") == 0 && i + 1 < argc)
      count = std::strtoull(argv[++i], nullptr, 10);
    else if (std::strcmp(argv[i], "--rounds") == 0 && i + 1 < argc)
      rounds = std::strtoull(argv[++i], nullptr, 10);
  }
  run(count, rounds);
  return 0;
}
