#include <cowjson/cowjson.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <algorithm>
#include <iostream>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace {

using clock_type = std::chrono::high_resolution_clock;

template <class T>
inline void do_not_optimize(const T& v) {
#if defined(_MSC_VER)
  volatile const char* p = reinterpret_cast<const char*>(&v);
  (void)p;
#else
  asm volatile("" : : "g"(v) : "memory");
#endif
}

// Records with plain keys and names; every `escape_every`-th name carries
// escapes so it has to be copied.
std::string make_payload(std::size_t n_objects, std::size_t str_len, std::size_t escape_every) {
  std::mt19937_64 rng(1234567);
  std::uniform_int_distribution<int> ch('a', 'z');

  std::string s;
  s.reserve(n_objects * (str_len + 64));
  s.push_back('[');
  for (std::size_t i = 0; i < n_objects; ++i) {
    if (i) s.push_back(',');
    s += "{\"id\":";
    s += std::to_string(static_cast<std::uint64_t>(i));
    s += ",\"ok\":";
    s += (i % 2 == 0) ? "true" : "false";
    s += ",\"name\":\"";

    for (std::size_t k = 0; k < str_len; ++k) {
      s.push_back(static_cast<char>(ch(rng)));
    }

    if (escape_every != 0 && (i % escape_every) == 0) {
      s += "\\n";
      s += "\\u4F60\\u597D";
    }

    s += "\",\"val\":";
    s += (i % 3 == 0) ? "3.141592653589793" : "1e-10";
    s += "}";
  }
  s.push_back(']');
  return s;
}

struct bench_result {
  double seconds{0.0};
  std::size_t bytes{0};
};

template <class Fn>
bench_result run_median(std::size_t runs, Fn&& fn) {
  if (runs <= 1) return fn();
  std::vector<double> secs;
  secs.reserve(runs);
  std::size_t bytes = 0;
  for (std::size_t r = 0; r < runs; ++r) {
    const auto br = fn();
    secs.push_back(br.seconds);
    bytes = br.bytes;
  }
  std::nth_element(secs.begin(), secs.begin() + (secs.size() / 2), secs.end());
  return {secs[secs.size() / 2], bytes};
}

bench_result bench_parse(std::string_view json, std::size_t iters) {
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    auto r = cowjson::parse(json);
    do_not_optimize(r.err.code);
    do_not_optimize(r.val.type());
  }
  const auto t1 = clock_type::now();
  const double sec = std::chrono::duration<double>(t1 - t0).count();
  return {sec, json.size() * iters};
}

bench_result bench_parse_owned(std::string_view json, std::size_t iters) {
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    auto r = cowjson::parse_owned(json);
    do_not_optimize(r.err.code);
    do_not_optimize(r.val.type());
  }
  const auto t1 = clock_type::now();
  const double sec = std::chrono::duration<double>(t1 - t0).count();
  return {sec, json.size() * iters};
}

bench_result bench_parse_document(std::string_view json, std::size_t iters) {
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    auto r = cowjson::parse_document(json);
    do_not_optimize(r.err.code);
    do_not_optimize(r.doc.root().type());
  }
  const auto t1 = clock_type::now();
  const double sec = std::chrono::duration<double>(t1 - t0).count();
  return {sec, json.size() * iters};
}

bench_result bench_dump(std::string_view json, std::size_t iters) {
  auto r = cowjson::parse(json);
  if (r.err) {
    std::cerr << "input parse failed: " << cowjson::describe(r.err, json) << "\n";
    std::exit(1);
  }

  const auto t0 = clock_type::now();
  std::size_t bytes = 0;
  for (std::size_t i = 0; i < iters; ++i) {
    auto out = cowjson::dump(r.val);
    bytes += out.size();
    do_not_optimize(out.size());
  }
  const auto t1 = clock_type::now();
  const double sec = std::chrono::duration<double>(t1 - t0).count();
  return {sec, bytes};
}

void print_mbps(const char* name, const bench_result& r) {
  const double mb = static_cast<double>(r.bytes) / (1024.0 * 1024.0);
  const double mbps = (r.seconds > 0.0) ? (mb / r.seconds) : 0.0;
  std::cout << name << ": " << mbps << " MiB/s (" << r.seconds << " s)" << "\n";
}

void print_spans(std::string_view json) {
  const auto r = cowjson::parse(json);
  const cowjson::span_stats st = cowjson::collect_span_stats(r.val);
  std::cout << "strings borrowed: " << st.borrowed << " (" << st.borrowed_bytes << " bytes)"
            << ", owned: " << st.owned << " (" << st.owned_bytes << " bytes)\n";
}

} // namespace

int main(int argc, char** argv) {
  std::size_t n_objects = 2000;
  std::size_t str_len = 24;
  std::size_t iters = 200;
  std::size_t runs = 5;

  if (argc >= 2) n_objects = static_cast<std::size_t>(std::stoull(argv[1]));
  if (argc >= 3) iters = static_cast<std::size_t>(std::stoull(argv[2]));
  if (argc >= 4) runs = static_cast<std::size_t>(std::stoull(argv[3]));

  const std::string plain = make_payload(n_objects, str_len, 0);
  const std::string escaped = make_payload(n_objects, str_len, 1);
  std::cout << "payload bytes: " << plain.size() << " plain, " << escaped.size() << " escaped\n";

  // Warm-up
  {
    auto r = cowjson::parse(plain);
    do_not_optimize(r.val.type());
  }

  std::cout << "\n== All strings plain ==\n";
  print_spans(plain);
  print_mbps("parse(borrowing)", run_median(runs, [&] { return bench_parse(plain, iters); }));
  print_mbps("parse_owned", run_median(runs, [&] { return bench_parse_owned(plain, iters); }));
  print_mbps("parse_document", run_median(runs, [&] { return bench_parse_document(plain, iters); }));
  print_mbps("dump", run_median(runs, [&] { return bench_dump(plain, iters); }));

  std::cout << "\n== Every name escaped ==\n";
  print_spans(escaped);
  print_mbps("parse(borrowing)", run_median(runs, [&] { return bench_parse(escaped, iters); }));
  print_mbps("parse_owned", run_median(runs, [&] { return bench_parse_owned(escaped, iters); }));

  return 0;
}
