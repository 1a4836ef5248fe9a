#include "test_common.hpp"

#include <cstring>
#include <string>
#include <vector>

using namespace tot;

namespace {

struct rng {
  std::uint64_t s{0x9E3779B97F4A7C15ull};
  std::uint64_t next_u64() {
    // xorshift64*
    std::uint64_t x = s;
    x ^= x >> 12;
    x ^= x << 25;
    x ^= x >> 27;
    s = x;
    return x * 2685821657736338717ull;
  }
  std::uint32_t next_u32() { return static_cast<std::uint32_t>(next_u64() >> 32); }
  std::size_t range(std::size_t n) { return n ? static_cast<std::size_t>(next_u64() % n) : 0u; }
  bool coin() { return (next_u64() & 1ull) != 0; }
};

static std::string random_string(rng& r, std::size_t max_len) {
  const std::size_t len = r.range(max_len + 1);
  std::string out;
  out.reserve(len);
  for (std::size_t i = 0; i < len; ++i) {
    const std::uint32_t pick = r.next_u32() % 20u;
    switch (pick) {
      case 0: out.push_back('"'); break;
      case 1: out.push_back('\\'); break;
      case 2: out.push_back('\n'); break;
      case 3: out.push_back('\t'); break;
      case 4: out.push_back(static_cast<char>(r.next_u32() % 32u)); break;
      case 5: out += "\xC3\xA9"; break;
      case 6: out += "\xF0\x9F\x98\x83"; break;
      default: {
        // printable ASCII
        char c = static_cast<char>(' ' + (r.next_u32() % 95u));
        out.push_back(c);
        break;
      }
    }
  }
  return out;
}

// Mostly bare-token keys, with the occasional key that has to be quoted.
static std::string random_key(rng& r) {
  static const char kBare[] = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_-.:/*@!";
  if (r.range(5) == 0) return random_string(r, 8);
  const std::size_t len = 1 + r.range(10);
  std::string out;
  for (std::size_t i = 0; i < len; ++i) out.push_back(kBare[r.range(sizeof(kBare) - 1)]);
  return out;
}

static value random_number(rng& r) {
  switch (r.range(3)) {
    case 0: return value::number(static_cast<double>(static_cast<std::int32_t>(r.next_u32())));
    case 1: {
      const double base = static_cast<double>(static_cast<std::int32_t>(r.next_u32() % 2000000u) - 1000000);
      return value::number(base / 1000.0);
    }
    default: {
      // Any finite bit pattern; formatting must round-trip all of them.
      for (;;) {
        const std::uint64_t bits = r.next_u64();
        double d = 0.0;
        std::memcpy(&d, &bits, sizeof(d));
        if (std::isfinite(d)) return value::number(d);
      }
    }
  }
}

static value random_value(rng& r, int depth);

static value random_list(rng& r, int depth) {
  value::list a;
  const std::size_t n = r.range(8);
  a.reserve(n);
  for (std::size_t i = 0; i < n; ++i) a.emplace_back(random_value(r, depth - 1));
  return value(std::move(a));
}

static value random_dict(rng& r, int depth) {
  value::dict o;
  value::dict_builder entries(o);
  const std::size_t n = r.range(24);
  for (std::size_t i = 0; i < n; ++i) entries.assign(random_key(r), random_value(r, depth - 1));
  return value(std::move(o));
}

static value random_value(rng& r, int depth) {
  if (depth <= 0) {
    const std::uint32_t k = r.next_u32() % 4u;
    switch (k) {
      case 0: return value(nullptr);
      case 1: return value(r.coin());
      case 2: return random_number(r);
      default: return value(random_string(r, 20));
    }
  }

  const std::uint32_t k = r.next_u32() % 6u;
  switch (k) {
    case 0: return value(nullptr);
    case 1: return value(r.coin());
    case 2: return random_number(r);
    case 3: return value(random_string(r, 20));
    case 4: return random_list(r, depth);
    default: return random_dict(r, depth);
  }
}

} // namespace

void test_random() {
  rng r;
  // Deterministic pseudo-fuzz: generate random value trees, dump, parse, and compare.
  for (int iter = 0; iter < 2000; ++iter) {
    const value v = (iter % 3 == 0) ? random_dict(r, 4) : random_value(r, 4);
    for (const bool pretty : {true, false}) {
      const std::string s = dump(v, pretty);
      auto pr = parse(s);
      if (pr.err) {
        const std::string msg = describe(pr.err) + "\n  document: " + s;
        tot_test::fail("!pr.err", __FILE__, __LINE__, msg.c_str());
      }
      TOT_CHECK(pr.val == v);

      // Dump output is stable under parse/dump.
      TOT_CHECK(dump(pr.val, pretty) == s);
    }
  }
}
