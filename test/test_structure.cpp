#include "test_common.hpp"

#include <string>

using namespace tot;

static void test_primitives_and_whitespace() {
  TOT_CHECK(parse_value("null").is_unit());
  TOT_CHECK(parse_value(" true ").as_bool() == true);
  TOT_CHECK(parse_value("\n\tfalse\r\n").as_bool() == false);
  TOT_CHECK(parse_value("/*c*/ true //t").as_bool() == true);
  TOT_CHECK(parse_value(",,42,,").as_number() == 42.0);
  TOT_CHECK(parse_value("\"s\" // trailing comment").as_string() == "s");
}

static void test_commas_and_comments_are_whitespace() {
  const value a = parse_value("[1, 2, 3]");
  const value b = parse_value("[1 2 3]");
  const value c = parse_value("[/* inner */ 1 2\n,3]");
  TOT_CHECK(a == b);
  TOT_CHECK(b == c);
  TOT_CHECK(a.as_list().size() == 3);
  TOT_CHECK(a.as_list()[2].as_number() == 3.0);

  const value plain = parse_value("name \"x\"\nports [80 443]\nlimits { cpu 2 mem 512 }\n");
  const value noisy = parse_value(
      "// header comment\n"
      "name /* inline */ \"x\",\n"
      "  ports [ 80 , /* a */ 443 , ] // tail\n"
      "\n"
      "limits {\n"
      "    cpu 2, // two cores\n"
      "    /* multi\n"
      "       line */ mem 512\n"
      "},\n");
  TOT_CHECK(plain == noisy);
}

static void test_implicit_root_dict() {
  const value v = parse_value("a 1\nb [true false]\nc { d \"x\" e null }\n");
  TOT_CHECK(v.is_dict());
  TOT_CHECK(v.as_dict().size() == 3);
  TOT_CHECK(v.as_dict()[0].first == "a");
  TOT_CHECK(v.as_dict()[1].first == "b");
  TOT_CHECK(v.as_dict()[2].first == "c");
  TOT_CHECK(v.find("b")->as_list().size() == 2);
  const value* c = v.find("c");
  TOT_CHECK(c && c->is_dict());
  TOT_CHECK(c->find("d")->as_string() == "x");
  TOT_CHECK(c->find("e")->is_unit());

  // The braced form of the same document is the same value.
  TOT_CHECK(parse_value("{ a 1 b [true false] c { d \"x\" e null } }") == v);
}

static void test_root_document_shapes() {
  TOT_CHECK(parse_value("").is_dict());
  TOT_CHECK(parse_value("").as_dict().empty());
  TOT_CHECK(parse_value("  // only a comment\n").as_dict().empty());
  TOT_CHECK(parse_value("[1 2]").is_list());
  TOT_CHECK(parse_value("{}").is_dict());

  // A scalar followed by more tokens is an implicit dict entry.
  const value kv = parse_value("true false");
  TOT_CHECK(kv.is_dict());
  TOT_CHECK(kv.find("true") && kv.find("true")->as_bool() == false);
  TOT_CHECK(parse_value("1 2").find("1")->as_number() == 2.0);
  TOT_CHECK(parse_value("null 1").find("null")->as_number() == 1.0);
  TOT_CHECK(parse_value("\"k\" 1").find("k")->as_number() == 1.0);
  TOT_CHECK(parse_value("1x 2").find("1x")->as_number() == 2.0);
  TOT_CHECK(parse_value("nullable 3").find("nullable")->as_number() == 3.0);
}

static void test_bare_keys() {
  const value v = parse_value("key-with.dots/and:colons 1\na//b 2\n*weird!@# 3\n\xC3\xA9t\xC3\xA9 4\n");
  TOT_CHECK(v.as_dict().size() == 4);
  TOT_CHECK(v.find("key-with.dots/and:colons")->as_number() == 1.0);
  TOT_CHECK(v.find("a//b")->as_number() == 2.0);
  TOT_CHECK(v.find("*weird!@#")->as_number() == 3.0);
  TOT_CHECK(v.find("\xC3\xA9t\xC3\xA9")->as_number() == 4.0);

  // Brackets and quotes end a bare key.
  const value w = parse_value("a[1] b{c 2}");
  TOT_CHECK(w.find("a")->is_list());
  TOT_CHECK(w.find("b")->is_dict());
}

static void test_duplicate_keys_last_writer_wins() {
  const value v = parse_value("a 1 b 2 a 3");
  TOT_CHECK(v.as_dict().size() == 2);
  TOT_CHECK(v.find("a")->as_number() == 3.0);
  TOT_CHECK(v.as_dict()[0].first == "a");
  TOT_CHECK(v.as_dict()[1].first == "b");

  const value nested = parse_value("x { k 1 k { deep true } }");
  TOT_CHECK(nested.find("x")->find("k")->is_dict());
}

// Large dicts go through the key index; order and overwrite rules still hold.
static void test_large_dict_with_repeats() {
  const std::size_t n = 100000;
  std::string text;
  text.reserve(n * 24);
  for (std::size_t i = 0; i < n; ++i) text += "k" + std::to_string(i) + " " + std::to_string(i) + "\n";
  for (std::size_t i = 0; i < n; i += 1000) text += "k" + std::to_string(i) + " -1\n";
  text += "nested { ";
  for (std::size_t i = 0; i < 40; ++i) text += "n" + std::to_string(i % 20) + " " + std::to_string(i) + " ";
  text += "}\n";

  const value v = parse_value(text);
  const value::dict& d = v.as_dict();
  TOT_CHECK(d.size() == n + 1);
  TOT_CHECK(d[0].first == "k0");
  TOT_CHECK(d[0].second.as_number() == -1.0);
  TOT_CHECK(d[1].second.as_number() == 1.0);
  TOT_CHECK(d[n - 1].first == "k" + std::to_string(n - 1));
  TOT_CHECK(v.find("k99000")->as_number() == -1.0);
  TOT_CHECK(v.find("k99001")->as_number() == 99001.0);

  const value::dict& inner = v.find("nested")->as_dict();
  TOT_CHECK(inner.size() == 20);
  TOT_CHECK(inner[0].first == "n0");
  TOT_CHECK(inner[0].second.as_number() == 20.0);
  TOT_CHECK(inner[19].second.as_number() == 39.0);
}

static void test_dict_builder() {
  value::dict d;
  value::dict_builder b(d);
  for (int round = 0; round < 2; ++round) {
    for (int i = 0; i < 30; ++i) b.assign("key" + std::to_string(i), value::number(round * 100 + i));
  }
  TOT_CHECK(d.size() == 30);
  TOT_CHECK(d[0].first == "key0");
  TOT_CHECK(d[0].second.as_number() == 100.0);
  TOT_CHECK(d[29].second.as_number() == 129.0);
}

static void test_bracket_balance() {
  TOT_CHECK_ERR(parse("[1 2").err, error_code::unexpected_eof);
  TOT_CHECK_ERR(parse("a [1 2").err, error_code::unexpected_eof);
  TOT_CHECK_ERR(parse("{a 1").err, error_code::unexpected_eof);
  TOT_CHECK_ERR(parse("a { b { c 1 }").err, error_code::unexpected_eof);
  TOT_CHECK_ERR(parse("[1 2]]").err, error_code::trailing_characters);
  TOT_CHECK_ERR(parse("{a 1}}").err, error_code::trailing_characters);
  TOT_CHECK_ERR(parse("[1] 2").err, error_code::trailing_characters);
  TOT_CHECK_ERR(parse("a 1 ]").err, error_code::unmatched_close);
  TOT_CHECK_ERR(parse("a 1 }").err, error_code::unmatched_close);
  TOT_CHECK_ERR(parse("}").err, error_code::unmatched_close);
  TOT_CHECK_ERR(parse("a {b 1]").err, error_code::expected_dict_end);
  TOT_CHECK_ERR(parse("a [1 2}").err, error_code::expected_list_end);
  TOT_CHECK_ERR(parse("a {b [1}").err, error_code::expected_list_end);
  TOT_CHECK_ERR(parse("a {[1] 2}").err, error_code::expected_key);
}

static void test_key_requires_value() {
  TOT_CHECK_ERR(parse("a").err, error_code::expected_value);
  TOT_CHECK_ERR(parse("a 1 b").err, error_code::expected_value);
  TOT_CHECK_ERR(parse("a 1 b // no value\n").err, error_code::expected_value);
  TOT_CHECK_ERR(parse("x {a}").err, error_code::expected_value);
  TOT_CHECK_ERR(parse("x [1 =]").err, error_code::expected_value);
}

static void test_literals() {
  TOT_CHECK_ERR(parse("[nul]").err, error_code::invalid_literal);
  TOT_CHECK_ERR(parse("[truex]").err, error_code::invalid_literal);
  TOT_CHECK_ERR(parse("x True").err, error_code::expected_value);
  TOT_CHECK(parse_value("[true false null]").as_list()[2].is_unit());
}

static void test_require_eof_option() {
  parse_options opt;
  opt.require_eof = false;
  {
    auto r = parse("[1 2] trailing", opt);
    TOT_CHECK(!r.err);
    TOT_CHECK(r.val.is_list());
  }
  {
    auto r = parse("[1 2] trailing");
    TOT_CHECK_ERR(r.err, error_code::trailing_characters);
  }
}

static void test_max_depth_option() {
  parse_options opt;
  opt.max_depth = 3;
  TOT_CHECK(!parse("[[[1]]]", opt).err);
  TOT_CHECK(!parse("a {b {c {d 1}}}", opt).err);
  TOT_CHECK_ERR(parse("[[[[1]]]]", opt).err, error_code::nesting_too_deep);
  TOT_CHECK_ERR(parse("a {b {c {d {e 1}}}}", opt).err, error_code::nesting_too_deep);

  std::string deep(300, '[');
  deep += std::string(300, ']');
  TOT_CHECK_ERR(parse(deep).err, error_code::nesting_too_deep);
}

static void test_value_model() {
  value v = value(value::dict{});
  v.set("a", value::number(1));
  v.set("b", "text");
  v.set("a", true);
  TOT_CHECK(v.as_dict().size() == 2);
  TOT_CHECK(v.find("a")->as_bool());
  TOT_CHECK(v.find("missing") == nullptr);
  TOT_CHECK(value(nullptr).type() == value::kind::unit);
  TOT_CHECK(value(value::list{}).type() == value::kind::list);

  // Dict equality ignores entry order; list equality does not.
  TOT_CHECK(parse_value("a 1 b 2") == parse_value("b 2 a 1"));
  TOT_CHECK(parse_value("[1 2]") != parse_value("[2 1]"));
  TOT_CHECK(parse_value("a 1") != parse_value("a 1 b 2"));
}

void test_structure() {
  test_primitives_and_whitespace();
  test_commas_and_comments_are_whitespace();
  test_implicit_root_dict();
  test_root_document_shapes();
  test_bare_keys();
  test_duplicate_keys_last_writer_wins();
  test_large_dict_with_repeats();
  test_dict_builder();
  test_bracket_balance();
  test_key_requires_value();
  test_literals();
  test_require_eof_option();
  test_max_depth_option();
  test_value_model();
}
