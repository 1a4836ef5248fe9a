#include "bench_common.hpp"

#include <tot/tot.hpp>

#include <cstdint>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include <json/json.h>

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace {

using tot_bench::keep;
using tot_bench::sample;
using tot_bench::time_loop;

// The same records rendered twice: as a JSON array and as a Tot list.
struct payload_pair {
  std::string json;
  std::string tot;
};

payload_pair make_records(std::size_t n_objects, std::size_t str_len) {
  std::mt19937_64 rng(1234567);
  std::uniform_int_distribution<int> letter('a', 'z');

  payload_pair p;
  p.json.reserve(n_objects * (str_len + 64));
  p.tot.reserve(n_objects * (str_len + 64));
  p.json.push_back('[');
  p.tot.push_back('[');
  for (std::size_t i = 0; i < n_objects; ++i) {
    if (i) p.json.push_back(',');
    const std::string id = std::to_string(static_cast<std::uint64_t>(i));
    const char* ok = (i % 2 == 0) ? "true" : "false";
    const char* val = (i % 3 == 0) ? "3.141592653589793" : "1e-10";

    std::string name;
    for (std::size_t k = 0; k < str_len; ++k) name.push_back(static_cast<char>(letter(rng)));

    p.json += "{\"id\":" + id + ",\"ok\":" + ok + ",\"name\":\"" + name;
    p.tot += "\n    {id " + id + " ok " + ok + " name \"" + name;
    if (i % 16 == 0) {
      p.json += "\\n\\u4F60\\u597D";
      p.tot += "\\n\\u{4F60}\\u{597D}";
    }
    p.json += std::string("\",\"val\":") + val + "}";
    p.tot += std::string("\" val ") + val + "}";
  }
  p.json.push_back(']');
  p.tot += "\n]\n";
  return p;
}

// Number-heavy; every entry takes the floating-point path.
payload_pair make_numbers(std::size_t count) {
  static const char* const pool[] = {"3.141592653589793", "-0.000000000123456789", "1.234567890123456e-200",
                                     "2.2250738585072014e-308"};
  payload_pair p;
  p.json.reserve(count * 24);
  p.tot.reserve(count * 24);
  p.json.push_back('[');
  p.tot.push_back('[');
  for (std::size_t i = 0; i < count; ++i) {
    if (i) {
      p.json.push_back(',');
      p.tot.push_back(' ');
    }
    p.json += pool[i % 4];
    p.tot += pool[i % 4];
  }
  p.json.push_back(']');
  p.tot.push_back(']');
  return p;
}

// ---- tot -------------------------------------------------------------------------

sample tot_parse(std::string_view text, std::size_t iters) {
  return time_loop(iters, [&] {
    auto r = tot::parse(text);
    keep(r.err.code);
    keep(r.val.type());
    return text.size();
  });
}

sample tot_parse_sum(std::string_view text, std::size_t iters) {
  return time_loop(iters, [&] {
    auto r = tot::parse(text);
    if (r.err || !r.val.is_list()) tot_bench::die("tot", "numbers payload did not parse");
    double sum = 0.0;
    for (const auto& v : r.val.as_list()) sum += v.as_number();
    keep(sum);
    return text.size();
  });
}

sample tot_dump(std::string_view text, std::size_t iters) {
  auto r = tot::parse(text);
  if (r.err) tot_bench::die("tot", tot::describe(r.err));
  return time_loop(iters, [&] {
    const std::string out = tot::dump(r.val, false);
    keep(out.size());
    return out.size();
  });
}

// ---- nlohmann/json ---------------------------------------------------------------

nlohmann::json nlohmann_load(std::string_view text) {
  return nlohmann::json::parse(text, /*callback=*/nullptr, /*allow_exceptions=*/false, /*ignore_comments=*/false);
}

sample nlohmann_parse(std::string_view text, std::size_t iters) {
  return time_loop(iters, [&] {
    const nlohmann::json j = nlohmann_load(text);
    keep(j.is_discarded());
    return text.size();
  });
}

sample nlohmann_dump(std::string_view text, std::size_t iters) {
  const nlohmann::json j = nlohmann_load(text);
  if (j.is_discarded()) tot_bench::die("nlohmann", "records payload did not parse");
  return time_loop(iters, [&] {
    const std::string out = j.dump();
    keep(out.size());
    return out.size();
  });
}

// ---- jsoncpp ---------------------------------------------------------------------

void make_strict(Json::CharReaderBuilder& builder) {
  builder["collectComments"] = false;
  builder["allowComments"] = false;
  builder["allowTrailingCommas"] = false;
  builder["strictRoot"] = true;
}

bool jsoncpp_load(const Json::CharReaderBuilder& builder, std::string_view text, Json::Value& root, std::string& errs) {
  const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  return reader->parse(text.data(), text.data() + text.size(), &root, &errs);
}

sample jsoncpp_parse(std::string_view text, std::size_t iters) {
  Json::CharReaderBuilder builder;
  make_strict(builder);
  return time_loop(iters, [&] {
    Json::Value root;
    std::string errs;
    const bool ok = jsoncpp_load(builder, text, root, errs);
    keep(ok);
    return text.size();
  });
}

sample jsoncpp_dump(std::string_view text, std::size_t iters) {
  Json::CharReaderBuilder builder;
  make_strict(builder);
  Json::Value root;
  std::string errs;
  if (!jsoncpp_load(builder, text, root, errs)) tot_bench::die("jsoncpp", errs);

  Json::StreamWriterBuilder wb;
  wb["indentation"] = "";
  wb["emitUTF8"] = true;
  wb["precision"] = 17;
  return time_loop(iters, [&] {
    const std::string out = Json::writeString(wb, root);
    keep(out.size());
    return out.size();
  });
}

// ---- rapidjson -------------------------------------------------------------------

sample rapidjson_parse(std::string_view text, std::size_t iters) {
  return time_loop(iters, [&] {
    rapidjson::Document d;
    d.Parse(text.data(), text.size());
    keep(d.HasParseError());
    return text.size();
  });
}

sample rapidjson_parse_sum(std::string_view text, std::size_t iters) {
  return time_loop(iters, [&] {
    rapidjson::Document d;
    d.Parse(text.data(), text.size());
    if (d.HasParseError() || !d.IsArray()) tot_bench::die("rapidjson", "numbers payload did not parse");
    double sum = 0.0;
    for (const auto& v : d.GetArray()) sum += v.GetDouble();
    keep(sum);
    return text.size();
  });
}

sample rapidjson_dump(std::string_view text, std::size_t iters) {
  rapidjson::Document d;
  d.Parse(text.data(), text.size());
  if (d.HasParseError()) tot_bench::die("rapidjson", "records payload did not parse");
  return time_loop(iters, [&] {
    rapidjson::StringBuffer sb;
    rapidjson::Writer<rapidjson::StringBuffer> w(sb);
    d.Accept(w);
    keep(sb.GetSize());
    return sb.GetSize();
  });
}

} // namespace

int main(int argc, char** argv) {
  const tot_bench::bench_args args = tot_bench::read_args(argc, argv);
  const std::size_t iters = args.iters;
  const std::size_t runs = args.runs;

  const payload_pair records = make_records(args.n_objects, 24);
  const payload_pair numbers = make_numbers(args.n_objects * 8);
  std::cout << "records: json " << records.json.size() << " bytes, tot " << records.tot.size() << " bytes\n";
  std::cout << "numbers: json " << numbers.json.size() << " bytes, tot " << numbers.tot.size() << " bytes\n";

  // Both renderings must hold the same data before timing anything.
  {
    auto r = tot::parse(records.tot);
    if (r.err || !r.val.is_list() || r.val.as_list().size() != args.n_objects) {
      std::cerr << "tot: records payload did not parse: " << tot::describe(r.err) << "\n";
      return 1;
    }
  }

  using tot_bench::median_of;
  using tot_bench::report;

  std::cout << "-- records --\n";
  report("tot parse", median_of(runs, [&] { return tot_parse(records.tot, iters); }));
  report("nlohmann parse", median_of(runs, [&] { return nlohmann_parse(records.json, iters); }));
  report("jsoncpp parse", median_of(runs, [&] { return jsoncpp_parse(records.json, iters); }));
  report("rapidjson parse", median_of(runs, [&] { return rapidjson_parse(records.json, iters); }));

  report("tot dump", median_of(runs, [&] { return tot_dump(records.tot, iters); }));
  report("nlohmann dump", median_of(runs, [&] { return nlohmann_dump(records.json, iters); }));
  report("jsoncpp dump", median_of(runs, [&] { return jsoncpp_dump(records.json, iters); }));
  report("rapidjson dump", median_of(runs, [&] { return rapidjson_dump(records.json, iters); }));

  std::cout << "-- numbers --\n";
  report("tot parse+sum", median_of(runs, [&] { return tot_parse_sum(numbers.tot, iters); }));
  report("rapidjson parse+sum", median_of(runs, [&] { return rapidjson_parse_sum(numbers.json, iters); }));

  return 0;
}
