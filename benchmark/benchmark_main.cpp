#include "bench_common.hpp"

#include <tot/codec.hpp>
#include <tot/tot.hpp>

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace {

using tot_bench::keep;
using tot_bench::sample;
using tot_bench::time_loop;

struct item {
  std::uint64_t id{0};
  bool ok{false};
  std::string name;
  double val{0.0};

  static auto tot_fields() {
    return tot::make_fields(tot::field("id", &item::id), tot::field("ok", &item::ok), tot::field("name", &item::name),
                            tot::field("val", &item::val));
  }
};

struct catalog {
  std::vector<item> items;

  static auto tot_fields() { return tot::make_fields(tot::field("items", &catalog::items)); }
};

// An implicit root dict holding one list of small dicts, with comments and
// commas sprinkled in.
std::string make_catalog_text(std::size_t n_items, std::size_t name_len) {
  std::mt19937_64 rng(1234567);
  std::uniform_int_distribution<int> letter('a', 'z');

  std::string s;
  s.reserve(n_items * (name_len + 64));
  s += "// generated\nitems [\n";
  for (std::size_t i = 0; i < n_items; ++i) {
    s += "    { id " + std::to_string(static_cast<std::uint64_t>(i));
    s += (i % 2 == 0) ? ", ok true" : ", ok false";
    s += ", name \"";
    for (std::size_t k = 0; k < name_len; ++k) s.push_back(static_cast<char>(letter(rng)));
    if (i % 16 == 0) s += "\\n\\u{4F60}\\u{597D}";
    s += "\", val ";
    s += (i % 3 == 0) ? "3.141592653589793" : "1e-10";
    s += (i % 8 == 0) ? " } /* eighth */\n" : " }\n";
  }
  s += "]\n";
  return s;
}

sample parse_tree(std::string_view text, std::size_t iters) {
  return time_loop(iters, [&] {
    auto r = tot::parse(text);
    keep(r.err.code);
    keep(r.val.type());
    return text.size();
  });
}

sample decode_records(std::string_view text, std::size_t iters) {
  catalog c;
  return time_loop(iters, [&] {
    const tot::error err = tot::decode_into(text, c);
    keep(err.code);
    keep(c.items.size());
    return text.size();
  });
}

sample dump_tree(std::string_view text, std::size_t iters, bool pretty) {
  auto r = tot::parse(text);
  if (r.err) tot_bench::die("input parse failed", tot::describe(r.err));
  return time_loop(iters, [&] {
    const std::string out = tot::dump(r.val, pretty);
    keep(out.size());
    return out.size();
  });
}

sample encode_records(const catalog& c, std::size_t iters) {
  return time_loop(iters, [&] {
    const std::string out = tot::encode(c);
    keep(out.size());
    return out.size();
  });
}

} // namespace

int main(int argc, char** argv) {
  const tot_bench::bench_args args = tot_bench::read_args(argc, argv);
  const std::size_t iters = args.iters;
  const std::size_t runs = args.runs;

  const std::string payload = make_catalog_text(args.n_objects, 24);
  std::cout << "payload bytes: " << payload.size() << "\n";

  // Warm-up, and make sure the payload decodes at all.
  catalog c;
  const tot::error err = tot::decode_into(payload, c);
  if (err) {
    std::cerr << "payload decode failed: " << tot::describe(err) << "\n";
    return 1;
  }

  using tot_bench::median_of;
  using tot_bench::report;

  report("parse(value)", median_of(runs, [&] { return parse_tree(payload, iters); }));
  report("decode(record)", median_of(runs, [&] { return decode_records(payload, iters); }));
  report("dump(pretty)", median_of(runs, [&] { return dump_tree(payload, iters, true); }));
  report("dump(compact)", median_of(runs, [&] { return dump_tree(payload, iters, false); }));
  report("encode(record)", median_of(runs, [&] { return encode_records(c, iters); }));

  return 0;
}
