#include "test_common.hpp"

#include <clocale>
#include <cmath>
#include <limits>
#include <string>

using namespace tot;

static double parse_number(std::string_view text) {
  auto r = parse(text);
  TOT_CHECK(!r.err);
  TOT_CHECK(r.val.is_number());
  return r.val.as_number();
}

static void test_number_forms() {
  TOT_CHECK(parse_number("0") == 0.0);
  TOT_CHECK(parse_number("-0") == 0.0);
  TOT_CHECK(std::signbit(parse_number("-0")));
  TOT_CHECK(parse_number("+5") == 5.0);
  TOT_CHECK(parse_number("007") == 7.0);
  TOT_CHECK(parse_number("1.5") == 1.5);
  TOT_CHECK(parse_number("-2.25e3") == -2250.0);
  TOT_CHECK(parse_number("1E2") == 100.0);
  TOT_CHECK(parse_number("5e-3") == 0.005);
  TOT_CHECK(parse_number("2e+2") == 200.0);
  TOT_CHECK(parse_number("22.0") == 22.0);
  // Underflow rounds toward zero; only overflow is an error.
  TOT_CHECK(parse_number("1e-400") == 0.0);
  TOT_CHECK(parse_number("1.7976931348623157e308") == (std::numeric_limits<double>::max)());
}

static void test_invalid_numbers() {
  TOT_CHECK_ERR(parse("[1.]").err, error_code::invalid_number);
  TOT_CHECK_ERR(parse("[1e]").err, error_code::invalid_number);
  TOT_CHECK_ERR(parse("[1e+]").err, error_code::invalid_number);
  TOT_CHECK_ERR(parse("[-]").err, error_code::invalid_number);
  TOT_CHECK_ERR(parse("[+ 1]").err, error_code::invalid_number);
  TOT_CHECK_ERR(parse("[1x]").err, error_code::invalid_number);
  TOT_CHECK_ERR(parse("[1.2.3]").err, error_code::invalid_number);
  TOT_CHECK_ERR(parse("[1_000]").err, error_code::invalid_number);
  TOT_CHECK_ERR(parse("[.5]").err, error_code::expected_value);
  TOT_CHECK_ERR(parse("[1e400]").err, error_code::number_out_of_range);
  TOT_CHECK_ERR(parse("x -1e400").err, error_code::number_out_of_range);
}

static void test_number_formatting() {
  auto text = [](double d) { return dump(value::number(d), false); };
  TOT_CHECK(text(22.0) == "22.0");
  TOT_CHECK(text(0.0) == "0.0");
  TOT_CHECK(text(-0.0) == "-0.0");
  TOT_CHECK(text(1.5) == "1.5");
  TOT_CHECK(text(-0.25) == "-0.25");
  TOT_CHECK(text(100.0) == "100.0");
  TOT_CHECK(text(0.1) == "0.1");
  TOT_CHECK(text(1e-5) == "0.00001");
  TOT_CHECK(text(1.5e-7) == "1.5e-7");
  TOT_CHECK(text(1e15) == "1000000000000000.0");
  TOT_CHECK(text(1e16) == "1e16");
  TOT_CHECK(text(123456789012345678.0) == "1.2345678901234568e17");
  TOT_CHECK(text(-1e300) == "-1e300");
  TOT_CHECK(text(5e-324) == "5e-324");
  TOT_CHECK(text(3.141592653589793) == "3.141592653589793");

  TOT_CHECK(dump(value::number(22.0)) == "22.0\n");
}

static void test_formatting_roundtrips_exactly() {
  const double samples[] = {0.1, 1.0 / 3.0, 2.0 / 3.0, 1e-5, 9.999999999999999e15, 1e16, 4.35,
                            -7.000000000000001, 5e-324, 2.2250738585072014e-308, 1.7976931348623157e308};
  for (const double d : samples) {
    const std::string s = dump(value::number(d), false);
    TOT_CHECK(parse_number(s) == d);
  }
}

static void test_nan_inf_rejected() {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const double inf = std::numeric_limits<double>::infinity();
  TOT_CHECK_ERR(TOT_CATCH(dump(value::number(nan))), error_code::non_finite_number);
  TOT_CHECK_ERR(TOT_CATCH(dump(value::number(inf))), error_code::non_finite_number);
  TOT_CHECK_ERR(TOT_CATCH(dump(value::number(-inf))), error_code::non_finite_number);
  TOT_CHECK(TOT_CATCH(dump(value::number(nan))).kind() == error_kind::coercion);
}

// Numbers read the same under a comma-decimal C locale. Skipped when no such
// locale is installed.
static void test_parse_ignores_c_locale() {
  const char* const candidates[] = {"de_DE.UTF-8", "de_DE.utf8", "fr_FR.UTF-8", "fr_FR.utf8", "de_DE"};
  bool switched = false;
  for (const char* name : candidates) {
    if (std::setlocale(LC_NUMERIC, name) && std::localeconv()->decimal_point[0] == ',') {
      switched = true;
      break;
    }
  }
  if (!switched) {
    std::setlocale(LC_NUMERIC, "C");
    return;
  }

  const value v = parse_value("x 1.5\ny -2.25e-3\n");
  const bool x_ok = v.find("x")->as_number() == 1.5;
  const bool y_ok = v.find("y")->as_number() == -0.00225;
  const bool stable = parse_value(dump(v)) == v;
  const bool underflow = parse_number("1e-400") == 0.0;
  std::setlocale(LC_NUMERIC, "C");

  TOT_CHECK(x_ok);
  TOT_CHECK(y_ok);
  TOT_CHECK(stable);
  TOT_CHECK(underflow);
}

static void test_out_of_range_edges() {
  TOT_CHECK(std::signbit(parse_number("-1e-400")));
  TOT_CHECK(parse_number("0.000e99999") == 0.0);
  TOT_CHECK(parse_number("0.0000001e-400") == 0.0);
  TOT_CHECK_ERR(parse("[+1e309]").err, error_code::number_out_of_range);
  TOT_CHECK_ERR(parse("[0.001e312]").err, error_code::number_out_of_range);
  TOT_CHECK(parse_number("0.001e310") == 1e307);
}

void test_numbers() {
  test_number_forms();
  test_invalid_numbers();
  test_number_formatting();
  test_formatting_roundtrips_exactly();
  test_nan_inf_rejected();
  test_parse_ignores_c_locale();
  test_out_of_range_edges();
}
