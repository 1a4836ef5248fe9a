#include <tot/tot.hpp>

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <json/json.h>

#include <ryml.hpp>
#include <ryml_std.hpp>

#include <toml++/toml.hpp>

namespace {

// ---- logging -------------------------------------------------------------------

enum class log_level { error = 0, warn = 1, info = 2, debug = 3, off = 4 };

const char* level_name(log_level l) {
  switch (l) {
    case log_level::error: return "ERROR";
    case log_level::warn: return "WARN";
    case log_level::info: return "INFO";
    case log_level::debug: return "DEBUG";
    case log_level::off: return "OFF";
  }
  return "?";
}

// Messages go to stderr; TOT_LOG=error|warn|info|debug|off picks the cutoff.
class logger {
public:
  static logger& get() {
    static logger instance;
    return instance;
  }

  bool enabled(log_level l) const noexcept {
    return threshold_ != log_level::off && static_cast<int>(l) <= static_cast<int>(threshold_);
  }

  void write(log_level l, std::string_view msg) const {
    if (!enabled(l)) return;
    std::cerr << "[" << level_name(l) << " totcli] " << msg << "\n";
  }

private:
  logger() {
    const char* env = std::getenv("TOT_LOG");
    if (!env) return;
    const std::string_view v{env};
    if (v == "error") threshold_ = log_level::error;
    else if (v == "warn") threshold_ = log_level::warn;
    else if (v == "info") threshold_ = log_level::info;
    else if (v == "debug") threshold_ = log_level::debug;
    else if (v == "off") threshold_ = log_level::off;
    else std::cerr << "[WARN totcli] unknown TOT_LOG level '" << v << "', using debug\n";
  }

  log_level threshold_{log_level::debug};
};

void log_error(std::string_view msg) { logger::get().write(log_level::error, msg); }
void log_info(std::string_view msg) { logger::get().write(log_level::info, msg); }
void log_debug(std::string_view msg) { logger::get().write(log_level::debug, msg); }

// ---- exit codes and failures -----------------------------------------------------

constexpr int kExitOk = 0;
constexpr int kExitInvalid = 1;
constexpr int kExitUsage = 2;

// Input that could be read but is not a valid document.
struct invalid_input : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Missing files, unwritable outputs, unsupported formats.
struct usage_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

std::string read_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw usage_error("cannot open '" + path + "' for reading");
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) throw usage_error("failed to read '" + path + "'");
  return ss.str();
}

void write_file(const std::string& path, std::string_view text) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) throw usage_error("cannot open '" + path + "' for writing");
  out.write(text.data(), static_cast<std::streamsize>(text.size()));
  out.flush();
  if (!out) throw usage_error("failed to write '" + path + "'");
}

tot::value parse_tot(const std::string& path) {
  const std::string text = read_file(path);
  auto r = tot::parse(text);
  if (r.err) throw invalid_input(path + ": " + tot::describe(r.err));
  return std::move(r.val);
}

// ---- JSON ----------------------------------------------------------------------

// Integral doubles inside the 64-bit range are written as JSON integers.
Json::Value to_json(const tot::value& v) {
  switch (v.type()) {
    case tot::value::kind::unit: return Json::Value(Json::nullValue);
    case tot::value::kind::boolean: return Json::Value(v.as_bool());
    case tot::value::kind::number: {
      const double d = v.as_number();
      if (std::trunc(d) == d && d >= -9223372036854775808.0 && d < 9223372036854775808.0) {
        return Json::Value(static_cast<Json::Int64>(d));
      }
      return Json::Value(d);
    }
    case tot::value::kind::string: return Json::Value(v.as_string());
    case tot::value::kind::list: {
      Json::Value out(Json::arrayValue);
      for (const auto& e : v.as_list()) out.append(to_json(e));
      return out;
    }
    case tot::value::kind::dict: {
      Json::Value out(Json::objectValue);
      for (const auto& kv : v.as_dict()) out[kv.first] = to_json(kv.second);
      return out;
    }
  }
  return Json::Value(Json::nullValue);
}

tot::value from_json(const Json::Value& j) {
  switch (j.type()) {
    case Json::nullValue: return tot::value(nullptr);
    case Json::booleanValue: return tot::value(j.asBool());
    case Json::intValue: return tot::value::number(static_cast<double>(j.asInt64()));
    case Json::uintValue: return tot::value::number(static_cast<double>(j.asUInt64()));
    case Json::realValue: return tot::value::number(j.asDouble());
    case Json::stringValue: return tot::value(j.asString());
    case Json::arrayValue: {
      tot::value::list out;
      out.reserve(j.size());
      for (const auto& e : j) out.push_back(from_json(e));
      return tot::value(std::move(out));
    }
    case Json::objectValue: {
      tot::value::dict out;
      tot::value::dict_builder entries(out);
      for (const auto& name : j.getMemberNames()) entries.assign(name, from_json(j[name]));
      return tot::value(std::move(out));
    }
  }
  return tot::value(nullptr);
}

std::string dump_json(const tot::value& v) {
  Json::StreamWriterBuilder wb;
  wb["indentation"] = "  ";
  wb["emitUTF8"] = true;
  wb["precision"] = 17;
  wb["precisionType"] = "significant";
  return Json::writeString(wb, to_json(v)) + "\n";
}

tot::value parse_json(const std::string& path) {
  const std::string text = read_file(path);
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  builder["allowComments"] = false;
  builder["strictRoot"] = false;
  Json::Value root;
  std::string errs;
  const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  if (!reader->parse(text.data(), text.data() + text.size(), &root, &errs)) {
    throw invalid_input(path + ": invalid JSON: " + errs);
  }
  return from_json(root);
}

// ---- YAML ----------------------------------------------------------------------

[[noreturn]] void on_yaml_error(const char* msg, std::size_t len, ryml::Location loc, void*) {
  std::string what = "invalid YAML";
  if (loc.line != 0 || loc.col != 0) {
    what += " at line " + std::to_string(loc.line + 1) + ", column " + std::to_string(loc.col + 1);
  }
  what += ": ";
  what.append(msg, len);
  throw invalid_input(what);
}

std::string to_std(ryml::csubstr s) { return std::string(s.str ? s.str : "", s.len); }

// Plain scalars that read as Tot scalars keep that type; anything else is a string.
tot::value from_yaml_scalar(ryml::ConstNodeRef n) {
  const ryml::csubstr v = n.val();
  const std::string text = to_std(v);
  if (n.is_val_quoted()) return tot::value(text);
  if (text.empty() || text == "~" || text == "null" || text == "Null" || text == "NULL") return tot::value(nullptr);
  auto r = tot::parse(text);
  if (!r.err && (r.val.is_number() || r.val.is_bool() || r.val.is_unit())) return std::move(r.val);
  return tot::value(text);
}

tot::value from_yaml(ryml::ConstNodeRef n) {
  if (n.is_map()) {
    tot::value::dict out;
    tot::value::dict_builder entries(out);
    for (ryml::ConstNodeRef ch : n.children()) entries.assign(to_std(ch.key()), from_yaml(ch));
    return tot::value(std::move(out));
  }
  if (n.is_seq()) {
    tot::value::list out;
    for (ryml::ConstNodeRef ch : n.children()) out.push_back(from_yaml(ch));
    return tot::value(std::move(out));
  }
  if (n.has_val()) return from_yaml_scalar(n);
  return tot::value(nullptr);
}

ryml::csubstr in_arena(ryml::NodeRef n, std::string_view s) {
  return n.tree()->copy_to_arena(ryml::csubstr(s.data(), s.size()));
}

// Strings are written plain; ones that look like other scalars are not quoted.
void fill_yaml(ryml::NodeRef n, const tot::value& v) {
  switch (v.type()) {
    case tot::value::kind::unit: n.set_val("~"); return;
    case tot::value::kind::boolean: n.set_val(v.as_bool() ? "true" : "false"); return;
    case tot::value::kind::number: n.set_val(in_arena(n, tot::dump(v, false))); return;
    case tot::value::kind::string: n.set_val(in_arena(n, v.as_string())); return;
    case tot::value::kind::list:
      n |= ryml::SEQ;
      for (const auto& e : v.as_list()) fill_yaml(n.append_child(), e);
      return;
    case tot::value::kind::dict:
      n |= ryml::MAP;
      for (const auto& kv : v.as_dict()) {
        ryml::NodeRef ch = n.append_child();
        ch.set_key(in_arena(ch, kv.first));
        fill_yaml(ch, kv.second);
      }
      return;
  }
}

void install_yaml_callbacks() {
  ryml::set_callbacks(ryml::Callbacks(nullptr, nullptr, nullptr, &on_yaml_error));
}

tot::value parse_yaml(const std::string& path) {
  const std::string text = read_file(path);
  install_yaml_callbacks();
  try {
    ryml::Tree tree = ryml::parse_in_arena(ryml::to_csubstr(text));
    ryml::ConstNodeRef root = tree.crootref();
    if (root.is_stream()) {
      if (root.num_children() == 0) return tot::value(tot::value::dict{});
      root = root.first_child();
    }
    return from_yaml(root);
  } catch (const invalid_input& e) {
    throw invalid_input(path + ": " + e.what());
  }
}

std::string dump_yaml(const tot::value& v) {
  install_yaml_callbacks();
  ryml::Tree tree;
  fill_yaml(tree.rootref(), v);
  return ryml::emitrs_yaml<std::string>(tree);
}

// ---- TOML ----------------------------------------------------------------------

// Dates and times have no Tot counterpart and are kept as their TOML text.
template <class T>
tot::value toml_text(const T& v) {
  std::ostringstream os;
  os << v;
  return tot::value(os.str());
}

tot::value from_toml(const toml::node& n) {
  switch (n.type()) {
    case toml::node_type::table: {
      tot::value::dict out;
      tot::value::dict_builder entries(out);
      for (auto&& kv : *n.as_table()) entries.assign(std::string(kv.first.str()), from_toml(kv.second));
      return tot::value(std::move(out));
    }
    case toml::node_type::array: {
      tot::value::list out;
      for (auto&& e : *n.as_array()) out.push_back(from_toml(e));
      return tot::value(std::move(out));
    }
    case toml::node_type::string: return tot::value(std::string(n.as_string()->get()));
    case toml::node_type::integer: return tot::value::number(static_cast<double>(n.as_integer()->get()));
    case toml::node_type::floating_point: {
      const double d = n.as_floating_point()->get();
      if (!std::isfinite(d)) throw invalid_input("toml float " + toml_text(d).as_string() + " has no Tot form");
      return tot::value::number(d);
    }
    case toml::node_type::boolean: return tot::value(n.as_boolean()->get());
    case toml::node_type::date: return toml_text(n.as_date()->get());
    case toml::node_type::time: return toml_text(n.as_time()->get());
    case toml::node_type::date_time: return toml_text(n.as_date_time()->get());
    case toml::node_type::none: break;
  }
  return tot::value(nullptr);
}

// Where a converted value goes: the end of an array, or a key of a table.
struct toml_array_sink {
  toml::array& a;
  template <class T>
  void operator()(T&& v) const { a.push_back(std::forward<T>(v)); }
};

struct toml_table_sink {
  toml::table& t;
  const std::string& key;
  template <class T>
  void operator()(T&& v) const { t.insert_or_assign(key, std::forward<T>(v)); }
};

// Integral doubles inside the 64-bit range become TOML integers. TOML has no
// null, so unit values are rejected.
template <class Sink>
void to_toml(const tot::value& v, const Sink& sink) {
  switch (v.type()) {
    case tot::value::kind::unit: throw invalid_input("null has no TOML form");
    case tot::value::kind::boolean: sink(v.as_bool()); return;
    case tot::value::kind::number: {
      const double d = v.as_number();
      if (std::trunc(d) == d && d >= -9223372036854775808.0 && d < 9223372036854775808.0) {
        sink(static_cast<std::int64_t>(d));
      } else {
        sink(d);
      }
      return;
    }
    case tot::value::kind::string: sink(v.as_string()); return;
    case tot::value::kind::list: {
      toml::array out;
      for (const auto& e : v.as_list()) to_toml(e, toml_array_sink{out});
      sink(std::move(out));
      return;
    }
    case tot::value::kind::dict: {
      toml::table out;
      for (const auto& kv : v.as_dict()) to_toml(kv.second, toml_table_sink{out, kv.first});
      sink(std::move(out));
      return;
    }
  }
}

std::string dump_toml(const tot::value& v) {
  if (!v.is_dict()) throw invalid_input("a TOML document must be a table at the root");
  toml::table root;
  for (const auto& kv : v.as_dict()) to_toml(kv.second, toml_table_sink{root, kv.first});
  std::ostringstream os;
  os << root << "\n";
  return os.str();
}

tot::value parse_toml(const std::string& path) {
  const std::string text = read_file(path);
  try {
    const toml::table root = toml::parse(text, path);
    return from_toml(root);
  } catch (const toml::parse_error& e) {
    const auto& at = e.source().begin;
    throw invalid_input(path + ": invalid TOML at line " + std::to_string(at.line) + ", column " +
                        std::to_string(at.column) + ": " + std::string(e.description()));
  }
}

// ---- commands ------------------------------------------------------------------

enum class file_type { json, yaml, toml };

file_type parse_file_type(std::string_view s) {
  if (s == "json") return file_type::json;
  if (s == "yaml" || s == "yml") return file_type::yaml;
  if (s == "toml") return file_type::toml;
  throw usage_error("unknown file type '" + std::string(s) + "' (expected json, yaml or toml)");
}

int run_check(const std::string& path) {
  const tot::value v = parse_tot(path);
  log_info(path + ": ok (" + (v.is_dict() ? std::to_string(v.as_dict().size()) + " top-level entries" : "single value") + ")");
  return kExitOk;
}

int run_to(const std::string& path, file_type type, const std::string& out_path) {
  const tot::value v = parse_tot(path);
  switch (type) {
    case file_type::json: write_file(out_path, dump_json(v)); break;
    case file_type::yaml: write_file(out_path, dump_yaml(v)); break;
    case file_type::toml: write_file(out_path, dump_toml(v)); break;
  }
  log_info("wrote " + out_path);
  return kExitOk;
}

int run_from(const std::string& path, file_type type, const std::string& out_path) {
  tot::value v;
  switch (type) {
    case file_type::json: v = parse_json(path); break;
    case file_type::yaml: v = parse_yaml(path); break;
    case file_type::toml: v = parse_toml(path); break;
  }
  write_file(out_path, tot::dump(v));
  log_info("wrote " + out_path);
  return kExitOk;
}

void print_usage(std::ostream& os) {
  os << "usage: totcli <file> check\n";
  os << "       totcli <file> to   (json|yaml|toml) <out>\n";
  os << "       totcli <file> from (json|yaml|toml) <out>\n";
  os << "\n";
  os << "  check   verify a .tot file\n";
  os << "  to      convert the .tot file to the given file type\n";
  os << "  from    convert a file of the given type to .tot\n";
  os << "\n";
  os << "exit status: 0 ok, 1 invalid input, 2 usage or I/O error\n";
  os << "logging: TOT_LOG=error|warn|info|debug|off (default debug)\n";
}

int run(int argc, char** argv) {
  if (argc == 2 && (std::string_view{argv[1]} == "--help" || std::string_view{argv[1]} == "-h")) {
    print_usage(std::cout);
    return kExitOk;
  }
  if (argc < 3) throw usage_error("missing file or command");

  const std::string file = argv[1];
  const std::string_view command = argv[2];
  log_debug("file=" + file + " command=" + std::string(command));

  if (command == "check") {
    if (argc != 3) throw usage_error("check takes no arguments");
    return run_check(file);
  }
  if (command == "to" || command == "from") {
    if (argc != 5) throw usage_error(std::string(command) + " needs a file type and an output path");
    const file_type type = parse_file_type(argv[3]);
    const std::string out_path = argv[4];
    return command == "to" ? run_to(file, type, out_path) : run_from(file, type, out_path);
  }
  throw usage_error("unknown command '" + std::string(command) + "'");
}

} // namespace

int main(int argc, char** argv) {
  log_debug("starting");
  try {
    return run(argc, argv);
  } catch (const invalid_input& e) {
    log_error(e.what());
    return kExitInvalid;
  } catch (const usage_error& e) {
    log_error(e.what());
    if (std::string_view{e.what()}.find("missing file") == 0 || std::string_view{e.what()}.find("unknown command") == 0) {
      print_usage(std::cerr);
    }
    return kExitUsage;
  } catch (const tot::exception& e) {
    // Values that cannot be written as Tot, e.g. non-finite numbers.
    log_error(e.what());
    return kExitInvalid;
  } catch (const std::exception& e) {
    log_error(e.what());
    return kExitUsage;
  }
}
