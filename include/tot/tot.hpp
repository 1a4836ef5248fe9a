#pragma once

// tot: a small, header-only C++17 codec for the Tot configuration language.
// The document root is a dict without braces, numbers carry no type tag and
// commas and comments count as whitespace.

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace tot {

enum class error_code {
  ok = 0,
  // lexical
  invalid_literal,
  invalid_number,
  number_out_of_range,
  invalid_string,
  unterminated_string,
  invalid_escape,
  invalid_unicode_escape,
  unterminated_comment,
  // grammar
  unexpected_eof,
  expected_value,
  expected_key,
  expected_list_start,
  expected_list_end,
  expected_dict_start,
  expected_dict_end,
  unmatched_close,
  trailing_characters,
  nesting_too_deep,
  // coercion
  integer_out_of_range,
  invalid_char,
  type_mismatch,
  invalid_key,
  non_finite_number,
  // framework
  custom,
  missing_field,
  unknown_variant,
  invalid_length,
  invalid_state,
  // io
  io_failure
};

enum class error_kind { none, lexical, grammar, coercion, framework, io };

inline error_kind kind_of(error_code c) noexcept {
  switch (c) {
    case error_code::ok:
      return error_kind::none;
    case error_code::invalid_literal:
    case error_code::invalid_number:
    case error_code::number_out_of_range:
    case error_code::invalid_string:
    case error_code::unterminated_string:
    case error_code::invalid_escape:
    case error_code::invalid_unicode_escape:
    case error_code::unterminated_comment:
      return error_kind::lexical;
    case error_code::unexpected_eof:
    case error_code::expected_value:
    case error_code::expected_key:
    case error_code::expected_list_start:
    case error_code::expected_list_end:
    case error_code::expected_dict_start:
    case error_code::expected_dict_end:
    case error_code::unmatched_close:
    case error_code::trailing_characters:
    case error_code::nesting_too_deep:
      return error_kind::grammar;
    case error_code::integer_out_of_range:
    case error_code::invalid_char:
    case error_code::type_mismatch:
    case error_code::invalid_key:
    case error_code::non_finite_number:
      return error_kind::coercion;
    case error_code::custom:
    case error_code::missing_field:
    case error_code::unknown_variant:
    case error_code::invalid_length:
    case error_code::invalid_state:
      return error_kind::framework;
    case error_code::io_failure:
      return error_kind::io;
  }
  return error_kind::none;
}

inline const char* to_string(error_code c) noexcept {
  switch (c) {
    case error_code::ok: return "ok";
    case error_code::invalid_literal: return "invalid_literal";
    case error_code::invalid_number: return "invalid_number";
    case error_code::number_out_of_range: return "number_out_of_range";
    case error_code::invalid_string: return "invalid_string";
    case error_code::unterminated_string: return "unterminated_string";
    case error_code::invalid_escape: return "invalid_escape";
    case error_code::invalid_unicode_escape: return "invalid_unicode_escape";
    case error_code::unterminated_comment: return "unterminated_comment";
    case error_code::unexpected_eof: return "unexpected_eof";
    case error_code::expected_value: return "expected_value";
    case error_code::expected_key: return "expected_key";
    case error_code::expected_list_start: return "expected_list_start";
    case error_code::expected_list_end: return "expected_list_end";
    case error_code::expected_dict_start: return "expected_dict_start";
    case error_code::expected_dict_end: return "expected_dict_end";
    case error_code::unmatched_close: return "unmatched_close";
    case error_code::trailing_characters: return "trailing_characters";
    case error_code::nesting_too_deep: return "nesting_too_deep";
    case error_code::integer_out_of_range: return "integer_out_of_range";
    case error_code::invalid_char: return "invalid_char";
    case error_code::type_mismatch: return "type_mismatch";
    case error_code::invalid_key: return "invalid_key";
    case error_code::non_finite_number: return "non_finite_number";
    case error_code::custom: return "custom";
    case error_code::missing_field: return "missing_field";
    case error_code::unknown_variant: return "unknown_variant";
    case error_code::invalid_length: return "invalid_length";
    case error_code::invalid_state: return "invalid_state";
    case error_code::io_failure: return "io_failure";
  }
  return "unknown";
}

inline const char* to_string(error_kind k) noexcept {
  switch (k) {
    case error_kind::none: return "none";
    case error_kind::lexical: return "lexical";
    case error_kind::grammar: return "grammar";
    case error_kind::coercion: return "coercion";
    case error_kind::framework: return "framework";
    case error_kind::io: return "io";
  }
  return "unknown";
}

// Errors raised while reading carry a byte offset and a 1-based line/column.
// Errors raised while writing have no input position (line == 0).
struct error {
  error_code code{error_code::ok};
  std::size_t offset{0};
  std::size_t line{1};
  std::size_t column{1};
  std::string message{};

  explicit operator bool() const noexcept { return code != error_code::ok; }
  error_kind kind() const noexcept { return kind_of(code); }
};

inline std::string describe(const error& e) {
  std::string out = "tot: ";
  out += to_string(e.kind());
  out += " error (";
  out += to_string(e.code);
  out += ")";
  if (e.line != 0) {
    out += " at line ";
    out += std::to_string(e.line);
    out += ", column ";
    out += std::to_string(e.column);
    out += " (offset ";
    out += std::to_string(e.offset);
    out += ")";
  }
  if (!e.message.empty()) {
    out += ": ";
    out += e.message;
  }
  return out;
}

class exception : public std::runtime_error {
public:
  explicit exception(error e) : std::runtime_error(describe(e)), err_(std::move(e)) {}

  const error& err() const noexcept { return err_; }
  error_code code() const noexcept { return err_.code; }
  error_kind kind() const noexcept { return err_.kind(); }

private:
  error err_;
};

namespace detail {

inline void update_line_col(std::string_view s, std::size_t pos, std::size_t& line, std::size_t& col) {
  line = 1;
  col = 1;
  for (std::size_t i = 0; i < pos && i < s.size(); ++i) {
    if (s[i] == '\n') {
      ++line;
      col = 1;
    } else {
      ++col;
    }
  }
}

inline error make_error(error_code code, std::string message) {
  error e;
  e.code = code;
  e.line = 0;
  e.column = 0;
  e.message = std::move(message);
  return e;
}

inline bool is_ws(char c) noexcept {
  return c == ' ' || c == '\n' || c == '\r' || c == '\t';
}

inline bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

inline bool is_alpha(char c) noexcept {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

// Characters that end a bare token.
inline bool is_delimiter(char c) noexcept {
  switch (c) {
    case ' ':
    case '\n':
    case '\r':
    case '\t':
    case ',':
    case '{':
    case '}':
    case '[':
    case ']':
    case '"':
      return true;
    default:
      return false;
  }
}

inline bool starts_scalar(char c) noexcept {
  switch (c) {
    case 'n':
    case 't':
    case 'f':
    case '"':
    case '\'':
    case '[':
    case '{':
    case '+':
    case '-':
      return true;
    default:
      return is_digit(c);
  }
}

inline int hex_val(char c) noexcept {
  const unsigned char uc = static_cast<unsigned char>(c);
  if (uc >= static_cast<unsigned char>('0') && uc <= static_cast<unsigned char>('9')) {
    return static_cast<int>(uc - static_cast<unsigned char>('0'));
  }
  const unsigned char lc = static_cast<unsigned char>(uc | 0x20u); // ASCII to-lower
  if (lc >= static_cast<unsigned char>('a') && lc <= static_cast<unsigned char>('f')) {
    return 10 + static_cast<int>(lc - static_cast<unsigned char>('a'));
  }
  return -1;
}

inline bool is_scalar_value(std::uint32_t cp) noexcept {
  return cp <= 0x10FFFFu && (cp < 0xD800u || cp > 0xDFFFu);
}

inline void append_utf8(std::string& out, std::uint32_t cp) {
  if (cp <= 0x7Fu) {
    out.push_back(static_cast<char>(cp));
  } else if (cp <= 0x7FFu) {
    out.push_back(static_cast<char>(0xC0u | (cp >> 6)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  } else if (cp <= 0xFFFFu) {
    out.push_back(static_cast<char>(0xE0u | (cp >> 12)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  } else {
    out.push_back(static_cast<char>(0xF0u | (cp >> 18)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 12) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  }
}

// Decodes one UTF-8 sequence starting at `i`. Rejects overlong forms,
// surrogates and truncated sequences.
inline bool decode_utf8(std::string_view s, std::size_t& i, char32_t& out) noexcept {
  if (i >= s.size()) return false;
  const unsigned char b0 = static_cast<unsigned char>(s[i]);
  std::size_t len = 0;
  std::uint32_t cp = 0;
  if (b0 < 0x80u) {
    out = b0;
    ++i;
    return true;
  } else if ((b0 & 0xE0u) == 0xC0u) {
    len = 2;
    cp = b0 & 0x1Fu;
  } else if ((b0 & 0xF0u) == 0xE0u) {
    len = 3;
    cp = b0 & 0x0Fu;
  } else if ((b0 & 0xF8u) == 0xF0u) {
    len = 4;
    cp = b0 & 0x07u;
  } else {
    return false;
  }
  if (i + len > s.size()) return false;
  for (std::size_t k = 1; k < len; ++k) {
    const unsigned char b = static_cast<unsigned char>(s[i + k]);
    if ((b & 0xC0u) != 0x80u) return false;
    cp = (cp << 6) | (b & 0x3Fu);
  }
  static const std::uint32_t min_for_len[5] = {0, 0, 0x80u, 0x800u, 0x10000u};
  if (cp < min_for_len[len] || !is_scalar_value(cp)) return false;
  out = static_cast<char32_t>(cp);
  i += len;
  return true;
}

// Short, printable excerpt of the input at `pos` for error messages.
inline std::string excerpt(std::string_view s, std::size_t pos) {
  if (pos >= s.size()) return "end of input";
  constexpr std::size_t kMaxExcerpt = 16;
  std::string out = "\"";
  std::size_t n = 0;
  for (std::size_t i = pos; i < s.size() && n < kMaxExcerpt; ++i, ++n) {
    const char c = s[i];
    if (c == '\n' || c == '\r') break;
    out.push_back(c);
  }
  if (pos + n < s.size() && n == kMaxExcerpt) out += "...";
  out.push_back('"');
  return out;
}

// Decimal exponent of the first significant digit of a validated token.
// False when every digit is zero. The exponent is clamped while reading.
inline bool leading_exponent(std::string_view token, long& out) {
  std::size_t i = 0;
  if (token[i] == '+' || token[i] == '-') ++i;
  long int_digits = 0;
  long frac_zeros = 0;
  bool seen = false;
  while (i < token.size() && is_digit(token[i])) {
    if (token[i] != '0') seen = true;
    if (seen) ++int_digits;
    ++i;
  }
  if (i < token.size() && token[i] == '.') {
    ++i;
    while (i < token.size() && is_digit(token[i])) {
      if (!seen && token[i] != '0') seen = true;
      if (!seen) ++frac_zeros;
      ++i;
    }
  }
  if (!seen) return false;

  long exp = 0;
  bool neg_exp = false;
  if (i < token.size()) {
    ++i; // 'e' or 'E'
    if (token[i] == '+' || token[i] == '-') neg_exp = token[i++] == '-';
    for (; i < token.size(); ++i) {
      if (exp < 100000) exp = exp * 10 + (token[i] - '0');
    }
  }
  out = (int_digits > 0 ? int_digits - 1 : -frac_zeros - 1) + (neg_exp ? -exp : exp);
  return true;
}

// Strict decimal token in, double out, independent of the C locale. Returns
// false when the value does not fit in a double; values too small for a
// double become a signed zero.
inline bool parse_double(std::string_view token, double& out) {
  const char* first = token.data();
  const char* last = token.data() + token.size();
  if (first != last && *first == '+') ++first;
  const auto r = std::from_chars(first, last, out, std::chars_format::general);
  if (r.ec == std::errc{} && r.ptr == last) return std::isfinite(out);
  if (r.ec != std::errc::result_out_of_range) return false;

  long exp = 0;
  if (!leading_exponent(token, exp) || exp < 0) {
    out = (token.front() == '-') ? -0.0 : 0.0;
    return true;
  }
  return false;
}

// Shortest round-trip text for a finite number. Fixed notation for
// 1e-5 <= |d| < 1e16 (and zero), integral values end in ".0"; scientific
// notation with a bare exponent otherwise.
template <class Float>
inline void append_number(std::string& out, Float d) {
  if (d == 0) {
    out += std::signbit(d) ? "-0.0" : "0.0";
    return;
  }
  char buf[64];
  const auto r = std::to_chars(buf, buf + sizeof(buf), d, std::chars_format::scientific);
  if (r.ec != std::errc{}) {
    throw exception(make_error(error_code::invalid_state, "failed to format number"));
  }
  std::string_view sci(buf, static_cast<std::size_t>(r.ptr - buf));
  if (sci.front() == '-') {
    out.push_back('-');
    sci.remove_prefix(1);
  }

  const std::size_t epos = sci.find('e');
  std::string digits;
  digits.reserve(epos);
  for (std::size_t k = 0; k < epos; ++k) {
    if (sci[k] != '.') digits.push_back(sci[k]);
  }
  int exp = 0;
  bool exp_neg = false;
  for (std::size_t k = epos + 1; k < sci.size(); ++k) {
    const char c = sci[k];
    if (c == '-') {
      exp_neg = true;
    } else if (is_digit(c)) {
      exp = exp * 10 + (c - '0');
    }
  }
  if (exp_neg) exp = -exp;

  if (exp >= -5 && exp < 16) {
    if (exp < 0) {
      out += "0.";
      out.append(static_cast<std::size_t>(-exp - 1), '0');
      out += digits;
      return;
    }
    const std::size_t int_len = static_cast<std::size_t>(exp) + 1;
    if (digits.size() <= int_len) {
      out += digits;
      out.append(int_len - digits.size(), '0');
      out += ".0";
    } else {
      out.append(digits, 0, int_len);
      out.push_back('.');
      out.append(digits, int_len, std::string::npos);
    }
    return;
  }

  out.push_back(digits[0]);
  if (digits.size() > 1) {
    out.push_back('.');
    out.append(digits, 1, std::string::npos);
  }
  out.push_back('e');
  out += std::to_string(exp);
}

inline void append_quoted(std::string& out, std::string_view s) {
  static const char* const kHex = "0123456789abcdef";
  out.push_back('"');
  std::size_t chunk_begin = 0;
  for (std::size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    const unsigned char uc = static_cast<unsigned char>(c);
    const char* rep = nullptr;
    switch (c) {
      case '"': rep = "\\\""; break;
      case '\\': rep = "\\\\"; break;
      case '\n': rep = "\\n"; break;
      case '\r': rep = "\\r"; break;
      case '\t': rep = "\\t"; break;
      case '\b': rep = "\\b"; break;
      case '\f': rep = "\\f"; break;
      default: break;
    }
    if (!rep && uc >= 0x20u && uc != 0x7Fu) continue;

    out.append(s.data() + chunk_begin, i - chunk_begin);
    chunk_begin = i + 1;
    if (rep) {
      out += rep;
    } else {
      out += "\\u{";
      if (uc >= 0x10u) out.push_back(kHex[uc >> 4]);
      out.push_back(kHex[uc & 0x0Fu]);
      out.push_back('}');
    }
  }
  out.append(s.data() + chunk_begin, s.size() - chunk_begin);
  out.push_back('"');
}

// A key can be written bare when it reads back as a single token.
inline bool key_needs_quotes(std::string_view key) noexcept {
  if (key.empty()) return true;
  if (key.front() == '\'') return true;
  if (key.size() >= 2 && key[0] == '/' && (key[1] == '/' || key[1] == '*')) return true;
  for (const char c : key) {
    const unsigned char uc = static_cast<unsigned char>(c);
    if (is_delimiter(c) || uc < 0x20u || uc == 0x7Fu) return true;
  }
  return false;
}

inline void append_indent(std::string& out, int indent) {
  out.append(static_cast<std::size_t>(indent) * 4u, ' ');
}

// Narrows a rounded double. Widths below 64 bits report overflow; 64-bit
// widths saturate. Negative values saturate to zero for unsigned targets.
template <class Int>
inline bool coerce_integer(double d, Int& out) noexcept {
  using lim = std::numeric_limits<Int>;
  if (std::is_unsigned<Int>::value && d < 0.0) {
    out = 0;
    return true;
  }
  const double lo = static_cast<double>(lim::min());
  const double hi = std::ldexp(1.0, lim::digits); // exclusive
  if (d < lo || d >= hi) {
    if (lim::digits < 63) return false;
    out = d < lo ? lim::min() : lim::max();
    return true;
  }
  out = static_cast<Int>(d);
  return true;
}

enum class match { hit, miss, fail };

// Cursor over the input plus the first error seen. Every scan_* primitive
// either consumes a complete form (hit), leaves the cursor untouched (miss),
// or records a fatal error (fail).
struct cursor {
  std::string_view s;
  std::size_t i{0};
  error err;

  bool at_end() const noexcept { return i >= s.size(); }
  char peek() const noexcept { return i < s.size() ? s[i] : '\0'; }

  void set_error(error_code code, std::string_view what, std::size_t at = std::numeric_limits<std::size_t>::max()) {
    if (err) return;
    err.code = code;
    err.offset = (at == std::numeric_limits<std::size_t>::max()) ? i : at;
    update_line_col(s, err.offset, err.line, err.column);
    err.message.assign(what.data(), what.size());
    err.message += ", found ";
    err.message += excerpt(s, err.offset);
  }

  // Whitespace, commas, line comments and block comments.
  bool skip_ignored() {
    const std::size_t n = s.size();
    while (i < n) {
      const char c = s[i];
      if (is_ws(c) || c == ',') {
        ++i;
        continue;
      }
      if (c == '/' && i + 1 < n && s[i + 1] == '/') {
        i += 2;
        while (i < n && s[i] != '\n') ++i;
        continue;
      }
      if (c == '/' && i + 1 < n && s[i + 1] == '*') {
        const std::size_t close = s.find("*/", i + 2);
        if (close == std::string_view::npos) {
          set_error(error_code::unterminated_comment, "block comment is never closed");
          return false;
        }
        i = close + 2;
        continue;
      }
      break;
    }
    return true;
  }

  match scan_word(std::string_view word) {
    if (at_end() || s[i] != word.front()) return match::miss;
    const bool same = s.substr(i, word.size()) == word;
    const std::size_t end = i + word.size();
    if (!same || (end < s.size() && (is_alpha(s[end]) || is_digit(s[end]) || s[end] == '_'))) {
      std::string what = "expected '";
      what.append(word.data(), word.size());
      what += "'";
      set_error(error_code::invalid_literal, what);
      return match::fail;
    }
    i = end;
    return match::hit;
  }

  match scan_null() { return scan_word("null"); }

  match scan_bool(bool& out) {
    if (peek() == 't') {
      const match m = scan_word("true");
      if (m == match::hit) out = true;
      return m;
    }
    if (peek() == 'f') {
      const match m = scan_word("false");
      if (m == match::hit) out = false;
      return m;
    }
    return match::miss;
  }

  // [+-]? digits ('.' digits)? ([eE] [+-]? digits)?
  match scan_number(double& out) {
    const std::size_t n = s.size();
    const std::size_t start = i;
    std::size_t j = i;
    if (j < n && (s[j] == '+' || s[j] == '-')) ++j;
    if (j >= n || !is_digit(s[j])) {
      if (j == start) return match::miss;
      set_error(error_code::invalid_number, "expected digits after sign", start);
      return match::fail;
    }
    while (j < n && is_digit(s[j])) ++j;
    if (j < n && s[j] == '.') {
      ++j;
      if (j >= n || !is_digit(s[j])) {
        set_error(error_code::invalid_number, "expected digits after decimal point", start);
        return match::fail;
      }
      while (j < n && is_digit(s[j])) ++j;
    }
    if (j < n && (s[j] == 'e' || s[j] == 'E')) {
      ++j;
      if (j < n && (s[j] == '+' || s[j] == '-')) ++j;
      if (j >= n || !is_digit(s[j])) {
        set_error(error_code::invalid_number, "expected digits in exponent", start);
        return match::fail;
      }
      while (j < n && is_digit(s[j])) ++j;
    }
    if (j < n && (is_alpha(s[j]) || is_digit(s[j]) || s[j] == '_' || s[j] == '.')) {
      set_error(error_code::invalid_number, "malformed number", start);
      return match::fail;
    }
    if (!parse_double(s.substr(start, j - start), out)) {
      set_error(error_code::number_out_of_range, "number does not fit in a double", start);
      return match::fail;
    }
    i = j;
    return match::hit;
  }

  match scan_string(std::string& out) {
    if (peek() == '\'') {
      set_error(error_code::invalid_string, "strings must use double quotes");
      return match::fail;
    }
    if (peek() != '"') return match::miss;

    const std::size_t quote_pos = i;
    const std::size_t n = s.size();
    const char* base = s.data();
    ++i;
    out.clear();
    std::size_t chunk_begin = i;

    while (i < n) {
      const char c = base[i];
      if (c == '"') {
        out.append(base + chunk_begin, i - chunk_begin);
        ++i;
        return match::hit;
      }
      if (c != '\\') {
        ++i;
        continue;
      }

      out.append(base + chunk_begin, i - chunk_begin);
      const std::size_t esc_pos = i;
      ++i;
      if (i >= n) break;
      const char esc = base[i++];
      switch (esc) {
        case '"': out.push_back('"'); break;
        case '\\': out.push_back('\\'); break;
        case '/': out.push_back('/'); break;
        case 'b': out.push_back('\b'); break;
        case 'f': out.push_back('\f'); break;
        case 'n': out.push_back('\n'); break;
        case 'r': out.push_back('\r'); break;
        case 't': out.push_back('\t'); break;
        case ' ':
        case '\t':
        case '\n':
        case '\r':
          // Escaped whitespace: the backslash and the whole run vanish.
          while (i < n && is_ws(base[i])) ++i;
          break;
        case 'u': {
          if (i >= n || base[i] != '{') {
            set_error(error_code::invalid_unicode_escape, "expected '{' after \\u", esc_pos);
            return match::fail;
          }
          ++i;
          std::uint32_t cp = 0;
          std::size_t digits = 0;
          while (i < n && digits < 6 && hex_val(base[i]) >= 0) {
            cp = (cp << 4) | static_cast<std::uint32_t>(hex_val(base[i]));
            ++i;
            ++digits;
          }
          if (digits == 0 || i >= n || base[i] != '}') {
            set_error(error_code::invalid_unicode_escape, "expected 1 to 6 hex digits and '}' in \\u{...}", esc_pos);
            return match::fail;
          }
          ++i;
          if (!is_scalar_value(cp)) {
            set_error(error_code::invalid_unicode_escape, "\\u{...} does not name a unicode scalar value", esc_pos);
            return match::fail;
          }
          append_utf8(out, cp);
          break;
        }
        default:
          set_error(error_code::invalid_escape, "unknown escape sequence", esc_pos);
          return match::fail;
      }
      chunk_begin = i;
    }

    set_error(error_code::unterminated_string, "string is never closed", quote_pos);
    return match::fail;
  }

  match scan_token(std::string& out) {
    const std::size_t start = i;
    while (i < s.size() && !is_delimiter(s[i])) ++i;
    if (i == start) return match::miss;
    out.assign(s.data() + start, i - start);
    return match::hit;
  }

  match scan_key(std::string& out) {
    const char c = peek();
    if (c == '"' || c == '\'') return scan_string(out);
    return scan_token(out);
  }
};

} // namespace detail

class value {
public:
  using list = std::vector<value>;
  using dict = std::vector<std::pair<std::string, value>>;

  enum class kind { unit, boolean, number, string, list, dict };

  value() noexcept : data_(std::monostate{}) {}
  value(std::nullptr_t) noexcept : data_(std::monostate{}) {}
  value(bool b) : data_(b) {}
  value(std::string s) : data_(std::move(s)) {}
  value(const char* s) : data_(std::string(s)) {}
  value(list l) : data_(std::move(l)) {}
  value(dict d) : data_(std::move(d)) {}

  static value number(double d) {
    value v;
    v.data_ = d;
    return v;
  }

  kind type() const noexcept {
    switch (data_.index()) {
      case 0: return kind::unit;
      case 1: return kind::boolean;
      case 2: return kind::number;
      case 3: return kind::string;
      case 4: return kind::list;
      case 5: return kind::dict;
      default: return kind::unit;
    }
  }

  bool is_unit() const noexcept { return std::holds_alternative<std::monostate>(data_); }
  bool is_bool() const noexcept { return std::holds_alternative<bool>(data_); }
  bool is_number() const noexcept { return std::holds_alternative<double>(data_); }
  bool is_string() const noexcept { return std::holds_alternative<std::string>(data_); }
  bool is_list() const noexcept { return std::holds_alternative<list>(data_); }
  bool is_dict() const noexcept { return std::holds_alternative<dict>(data_); }

  bool as_bool() const { return std::get<bool>(data_); }
  double as_number() const { return std::get<double>(data_); }
  const std::string& as_string() const { return std::get<std::string>(data_); }
  const list& as_list() const { return std::get<list>(data_); }
  const dict& as_dict() const { return std::get<dict>(data_); }

  std::string& as_string() { return std::get<std::string>(data_); }
  list& as_list() { return std::get<list>(data_); }
  dict& as_dict() { return std::get<dict>(data_); }

  const value* find(std::string_view key) const noexcept {
    if (!is_dict()) return nullptr;
    for (const auto& kv : std::get<dict>(data_)) {
      if (kv.first == key) return &kv.second;
    }
    return nullptr;
  }

  value* find(std::string_view key) noexcept {
    if (!is_dict()) return nullptr;
    for (auto& kv : std::get<dict>(data_)) {
      if (kv.first == key) return &kv.second;
    }
    return nullptr;
  }

  // Last writer wins; a replaced entry keeps its original position.
  static void assign(dict& d, std::string key, value v) {
    for (auto& kv : d) {
      if (kv.first == key) {
        kv.second = std::move(v);
        return;
      }
    }
    d.emplace_back(std::move(key), std::move(v));
  }

  void set(std::string key, value v) { assign(as_dict(), std::move(key), std::move(v)); }

  // Appends entries to a dict in amortized constant time. A repeated key
  // overwrites the earlier value and keeps its first position. Small dicts are
  // scanned; the key index is built once the dict grows past kScanLimit.
  class dict_builder {
  public:
    explicit dict_builder(dict& d) : d_(d) {}

    void assign(std::string key, value v) {
      if (index_.empty() && d_.size() < kScanLimit) {
        for (auto& kv : d_) {
          if (kv.first == key) {
            kv.second = std::move(v);
            return;
          }
        }
        d_.emplace_back(std::move(key), std::move(v));
        return;
      }
      if (index_.empty()) {
        index_.reserve(d_.size() * 2);
        for (std::size_t i = 0; i < d_.size(); ++i) index_.emplace(d_[i].first, i);
      }
      const auto it = index_.find(key);
      if (it != index_.end()) {
        d_[it->second].second = std::move(v);
        return;
      }
      index_.emplace(key, d_.size());
      d_.emplace_back(std::move(key), std::move(v));
    }

  private:
    static constexpr std::size_t kScanLimit = 16;

    dict& d_;
    std::unordered_map<std::string, std::size_t> index_;
  };

  friend bool operator==(const value& a, const value& b);
  friend bool operator!=(const value& a, const value& b) { return !(a == b); }

private:
  // index: 0 unit, 1 bool, 2 number, 3 string, 4 list, 5 dict
  std::variant<std::monostate, bool, double, std::string, list, dict> data_;
};

// Dicts compare as key sets; entry order does not matter.
inline bool operator==(const value& a, const value& b) {
  if (a.type() != b.type()) return false;
  switch (a.type()) {
    case value::kind::unit: return true;
    case value::kind::boolean: return a.as_bool() == b.as_bool();
    case value::kind::number: return a.as_number() == b.as_number();
    case value::kind::string: return a.as_string() == b.as_string();
    case value::kind::list: return a.as_list() == b.as_list();
    case value::kind::dict: {
      const auto& da = a.as_dict();
      const auto& db = b.as_dict();
      if (da.size() != db.size()) return false;
      for (const auto& kv : da) {
        const value* other = b.find(kv.first);
        if (!other || !(kv.second == *other)) return false;
      }
      return true;
    }
  }
  return false;
}

struct parse_options {
  std::size_t max_depth{256};
  // When false, a document opened by '[' or '{' ends at the matching bracket.
  bool require_eof{true};
};

struct parse_result {
  value val;
  error err;
};

struct parser {
  detail::cursor cur;
  parse_options opt;

  parse_result run() {
    parse_result r;
    r.val = parse_root();
    if (cur.err) {
      r.err = cur.err;
      r.val = value{};
    }
    return r;
  }

  bool failed() const noexcept { return static_cast<bool>(cur.err); }

  // A document is either exactly one scalar or the body of the implicit
  // root dict. An implicit dict entry always has two parts, so the two
  // readings never overlap.
  value parse_root() {
    if (!cur.skip_ignored()) return {};
    if (cur.at_end()) return value(value::dict{});

    const char c = cur.peek();
    const bool bracketed = c == '[' || c == '{';
    if (detail::starts_scalar(c)) {
      parser trial{cur, opt};
      value v = trial.parse_value(0);
      if (!trial.failed()) {
        if (bracketed && !opt.require_eof) {
          cur = trial.cur;
          return v;
        }
        if (trial.cur.skip_ignored() && trial.cur.at_end()) {
          cur = trial.cur;
          return v;
        }
      }
      if (bracketed) {
        trial.cur.set_error(error_code::trailing_characters, "expected end of input after the root value");
        cur = trial.cur;
        return {};
      }
    }

    value::dict d;
    if (!parse_entries(0, true, d)) return {};
    return value(std::move(d));
  }

  // Cursor sits on the first byte of a value.
  value parse_value(std::size_t depth) {
    if (cur.at_end()) {
      cur.set_error(error_code::unexpected_eof, "expected a value");
      return {};
    }

    const char c = cur.peek();
    switch (c) {
      case 'n':
        if (cur.scan_null() != detail::match::hit) return {};
        return value(nullptr);
      case 't':
      case 'f': {
        bool b = false;
        if (cur.scan_bool(b) != detail::match::hit) return {};
        return value(b);
      }
      case '"':
      case '\'': {
        std::string out;
        if (cur.scan_string(out) != detail::match::hit) return {};
        return value(std::move(out));
      }
      case '[':
        return parse_list(depth + 1);
      case '{':
        return parse_dict(depth + 1);
      default:
        break;
    }

    double d = 0.0;
    const detail::match m = cur.scan_number(d);
    if (m == detail::match::hit) return value::number(d);
    if (m == detail::match::miss) cur.set_error(error_code::expected_value, "expected a value");
    return {};
  }

  value parse_list(std::size_t depth) {
    if (depth > opt.max_depth) {
      cur.set_error(error_code::nesting_too_deep, "lists and dicts nest too deeply");
      return {};
    }
    ++cur.i; // '['

    value::list l;
    while (true) {
      if (!cur.skip_ignored()) return {};
      if (cur.at_end()) {
        cur.set_error(error_code::unexpected_eof, "expected ']' to close list");
        return {};
      }
      const char c = cur.peek();
      if (c == ']') {
        ++cur.i;
        return value(std::move(l));
      }
      if (c == '}') {
        cur.set_error(error_code::expected_list_end, "expected ']' to close list");
        return {};
      }
      value elem = parse_value(depth);
      if (failed()) return {};
      l.emplace_back(std::move(elem));
    }
  }

  value parse_dict(std::size_t depth) {
    if (depth > opt.max_depth) {
      cur.set_error(error_code::nesting_too_deep, "lists and dicts nest too deeply");
      return {};
    }
    ++cur.i; // '{'

    value::dict d;
    if (!parse_entries(depth, false, d)) return {};
    return value(std::move(d));
  }

  // Key/value pairs up to '}' (explicit) or end of input (implicit root).
  bool parse_entries(std::size_t depth, bool implicit, value::dict& out) {
    value::dict_builder entries(out);
    std::string key;
    while (true) {
      if (!cur.skip_ignored()) return false;
      if (cur.at_end()) {
        if (implicit) return true;
        cur.set_error(error_code::unexpected_eof, "expected '}' to close dict");
        return false;
      }

      const char c = cur.peek();
      if (c == '}' || c == ']') {
        if (implicit) {
          cur.set_error(error_code::unmatched_close, "closing bracket without a matching opening bracket");
          return false;
        }
        if (c == '}') {
          ++cur.i;
          return true;
        }
        cur.set_error(error_code::expected_dict_end, "expected '}' to close dict");
        return false;
      }

      const detail::match m = cur.scan_key(key);
      if (m == detail::match::fail) return false;
      if (m == detail::match::miss) {
        cur.set_error(error_code::expected_key, "expected a key");
        return false;
      }

      if (!cur.skip_ignored()) return false;
      if (cur.at_end() || cur.peek() == '}' || cur.peek() == ']') {
        cur.set_error(error_code::expected_value, "expected a value after key '" + key + "'");
        return false;
      }
      value v = parse_value(depth);
      if (failed()) return false;
      entries.assign(std::move(key), std::move(v));
      key.clear();
    }
  }
};

inline parse_result parse(std::string_view text, parse_options opt = {}) {
  parser p;
  p.cur.s = text;
  p.opt = opt;
  return p.run();
}

inline value parse_value(std::string_view text, parse_options opt = {}) {
  auto r = parse(text, opt);
  if (r.err) throw exception(std::move(r.err));
  return std::move(r.val);
}

// Pull interface over the input. Reads walk the text directly; the depth
// counter tells the implicit root dict (depth 0) from explicit containers.
class deserializer {
public:
  class seq_access;
  class map_access;
  class variant_access;

  explicit deserializer(std::string_view text, parse_options opt = {}) : opt_(opt) { cur_.s = text; }

  deserializer(const deserializer&) = delete;
  deserializer& operator=(const deserializer&) = delete;

  std::size_t depth() const noexcept { return depth_; }
  std::size_t offset() const noexcept { return cur_.i; }
  const parse_options& options() const noexcept { return opt_; }

  // First non-ignored byte, or '\0' at end of input.
  char peek() {
    skip();
    return cur_.peek();
  }

  bool at_end() {
    skip();
    return cur_.at_end();
  }

  value read_any() {
    parser p{cur_, opt_};
    value v;
    if (depth_ == 0) {
      v = p.parse_root();
    } else {
      if (p.cur.skip_ignored()) v = p.parse_value(explicit_depth());
    }
    cur_ = p.cur;
    if (cur_.err) raise();
    return v;
  }

  void skip_value() { (void)read_any(); }

  void read_unit() {
    scan_or_fail([&] { return cur_.scan_null(); }, "expected null");
  }

  bool read_bool() {
    bool b = false;
    scan_or_fail([&] { return cur_.scan_bool(b); }, "expected a boolean");
    return b;
  }

  double read_number() {
    double d = 0.0;
    scan_or_fail([&] { return cur_.scan_number(d); }, "expected a number");
    return d;
  }

  // Nearest single; magnitudes beyond the float range become infinity.
  float read_float32() {
    const double d = read_number();
    constexpr double max = static_cast<double>(std::numeric_limits<float>::max());
    if (d > max) return std::numeric_limits<float>::infinity();
    if (d < -max) return -std::numeric_limits<float>::infinity();
    return static_cast<float>(d);
  }

  std::string read_string() {
    std::string out;
    scan_or_fail([&] { return cur_.scan_string(out); }, "expected a string");
    return out;
  }

  char32_t read_char() {
    skip();
    const std::size_t at = cur_.i;
    const std::string s = read_string();
    std::size_t i = 0;
    char32_t cp = 0;
    if (s.empty() || !detail::decode_utf8(s, i, cp) || i != s.size()) {
      cur_.set_error(error_code::invalid_char, "expected a string holding exactly one character", at);
      raise();
    }
    return cp;
  }

  // A one-character string whose character is ASCII.
  char read_ascii_char() {
    skip();
    const std::size_t at = cur_.i;
    const char32_t cp = read_char();
    if (cp > 0x7Fu) {
      cur_.set_error(error_code::invalid_char, "character does not fit in a char", at);
      raise();
    }
    return static_cast<char>(cp);
  }

  template <class Int>
  Int read_integer() {
    static_assert(std::is_integral<Int>::value && !std::is_same<Int, bool>::value, "integer type required");
    skip();
    const std::size_t at = cur_.i;
    const double d = std::round(read_number());
    Int out{};
    if (!detail::coerce_integer(d, out)) {
      using lim = std::numeric_limits<Int>;
      std::string what = "value ";
      detail::append_number(what, d);
      what += " does not fit in a ";
      what += std::to_string(lim::digits + (lim::is_signed ? 1 : 0));
      what += lim::is_signed ? "-bit signed integer" : "-bit unsigned integer";
      cur_.set_error(error_code::integer_out_of_range, what, at);
      raise();
    }
    return out;
  }

  // Consumes `null` and returns true when the next token begins with 'n'.
  bool next_is_null() {
    skip();
    if (cur_.at_end() || cur_.peek() != 'n') return false;
    read_unit();
    return true;
  }

  seq_access begin_seq();
  map_access begin_map();
  variant_access begin_variant();

  // Requires that nothing but ignored input remains.
  void finish() {
    skip();
    if (!cur_.at_end()) fail(error_code::trailing_characters, "expected end of input");
  }

  [[noreturn]] void fail(error_code code, std::string_view what) {
    cur_.set_error(code, what);
    raise();
  }

  [[noreturn]] void fail(std::string_view what) { fail(error_code::custom, what); }

private:
  void skip() {
    if (!cur_.skip_ignored()) raise();
  }

  [[noreturn]] void raise() { throw exception(cur_.err); }

  template <class Scan>
  void scan_or_fail(Scan&& scan, const char* what) {
    skip();
    if (cur_.at_end()) fail(error_code::unexpected_eof, what);
    const detail::match m = scan();
    if (m == detail::match::fail) raise();
    if (m == detail::match::miss) fail(error_code::type_mismatch, what);
  }

  void require_char(char c, error_code code, const char* what) {
    skip();
    if (cur_.at_end()) fail(error_code::unexpected_eof, what);
    if (cur_.peek() != c) fail(code, what);
    ++cur_.i;
  }

  // Bracketed lists and dicts only; the implicit root dict is not counted, so
  // max_depth means the same here as in parse().
  std::size_t explicit_depth() const noexcept { return implicit_root_ ? depth_ - 1 : depth_; }

  void check_depth() {
    if (explicit_depth() + 1 > opt_.max_depth) fail(error_code::nesting_too_deep, "lists and dicts nest too deeply");
  }

  void leave(std::size_t saved_depth, bool implicit) noexcept {
    depth_ = saved_depth;
    if (implicit) implicit_root_ = false;
  }

  // Reads a key that must be followed by a value.
  std::string read_entry_key() {
    std::string key;
    const detail::match m = cur_.scan_key(key);
    if (m == detail::match::fail) raise();
    if (m == detail::match::miss) fail(error_code::expected_key, "expected a key");
    skip();
    if (cur_.at_end() || cur_.peek() == '}' || cur_.peek() == ']') {
      fail(error_code::expected_value, "expected a value after key '" + key + "'");
    }
    return key;
  }

  detail::cursor cur_;
  parse_options opt_;
  std::size_t depth_{0};
  bool implicit_root_{false};
};

// Each access object restores the depth counter when it goes out of scope,
// including during stack unwinding.
class deserializer::seq_access {
public:
  seq_access(const seq_access&) = delete;
  seq_access& operator=(const seq_access&) = delete;
  ~seq_access() { d_.depth_ = saved_depth_; }

  // True when another element follows; false at the closing bracket.
  bool next() {
    d_.skip();
    if (d_.cur_.at_end()) d_.fail(error_code::unexpected_eof, "expected ']' to close list");
    const char c = d_.cur_.peek();
    if (c == ']') return false;
    if (c == '}') d_.fail(error_code::expected_list_end, "expected ']' to close list");
    ++count_;
    return true;
  }

  void end() {
    d_.require_char(']', error_code::expected_list_end, "expected ']' to close list");
    d_.depth_ = saved_depth_;
  }

  std::size_t count() const noexcept { return count_; }

private:
  friend class deserializer;
  seq_access(deserializer& d, std::size_t saved_depth) noexcept : d_(d), saved_depth_(saved_depth) {}

  deserializer& d_;
  std::size_t saved_depth_;
  std::size_t count_{0};
};

class deserializer::map_access {
public:
  map_access(const map_access&) = delete;
  map_access& operator=(const map_access&) = delete;
  ~map_access() { d_.leave(saved_depth_, implicit_); }

  bool implicit() const noexcept { return implicit_; }

  // Reads the next key, or returns false at '}' (explicit dict) or end of
  // input (implicit root). A key must be followed by a value.
  bool next_key(std::string& key) {
    d_.skip();
    if (d_.cur_.at_end()) {
      if (implicit_) return false;
      d_.fail(error_code::unexpected_eof, "expected '}' to close dict");
    }
    const char c = d_.cur_.peek();
    if (c == '}' || c == ']') {
      if (implicit_) d_.fail(error_code::unmatched_close, "closing bracket without a matching opening bracket");
      if (c == '}') return false;
      d_.fail(error_code::expected_dict_end, "expected '}' to close dict");
    }
    key = d_.read_entry_key();
    return true;
  }

  void end() {
    if (!implicit_) d_.require_char('}', error_code::expected_dict_end, "expected '}' to close dict");
    d_.leave(saved_depth_, implicit_);
  }

private:
  friend class deserializer;
  map_access(deserializer& d, std::size_t saved_depth, bool implicit) noexcept
      : d_(d), saved_depth_(saved_depth), implicit_(implicit) {}

  deserializer& d_;
  std::size_t saved_depth_;
  bool implicit_;
};

class deserializer::variant_access {
public:
  variant_access(const variant_access&) = delete;
  variant_access& operator=(const variant_access&) = delete;
  ~variant_access() { d_.leave(saved_depth_, implicit_); }

  const std::string& name() const noexcept { return name_; }

  // True for the bare "Name" form, which carries no payload.
  bool is_unit() const noexcept { return unit_; }

  void end() {
    if (unit_) return;
    d_.skip();
    if (implicit_) {
      if (!d_.cur_.at_end()) d_.fail(error_code::trailing_characters, "expected a single variant entry at document root");
    } else {
      if (d_.cur_.at_end()) d_.fail(error_code::unexpected_eof, "expected '}' after variant payload");
      if (d_.cur_.peek() != '}') d_.fail(error_code::expected_dict_end, "expected '}' after variant payload");
      ++d_.cur_.i;
    }
    d_.leave(saved_depth_, implicit_);
  }

private:
  friend class deserializer;
  variant_access(deserializer& d, std::size_t saved_depth, std::string name, bool unit, bool implicit)
      : d_(d), saved_depth_(saved_depth), name_(std::move(name)), unit_(unit), implicit_(implicit) {}

  deserializer& d_;
  std::size_t saved_depth_;
  std::string name_;
  bool unit_;
  bool implicit_;
};

inline deserializer::seq_access deserializer::begin_seq() {
  const std::size_t saved = depth_;
  check_depth();
  require_char('[', error_code::expected_list_start, "expected '[' to open a list");
  ++depth_;
  return seq_access(*this, saved);
}

// A key never starts with '{', so a braced document root is unambiguous.
inline deserializer::map_access deserializer::begin_map() {
  const std::size_t saved = depth_;
  const bool implicit = depth_ == 0 && peek() != '{';
  if (!implicit) {
    check_depth();
    require_char('{', error_code::expected_dict_start, "expected '{' to open a dict");
  }
  ++depth_;
  implicit_root_ = implicit_root_ || implicit;
  return map_access(*this, saved, implicit);
}

inline deserializer::variant_access deserializer::begin_variant() {
  const std::size_t saved = depth_;
  skip();
  if (cur_.at_end()) fail(error_code::unexpected_eof, "expected a variant");
  if (cur_.peek() == '"') {
    // At the root a quoted string is the whole document or the key of the
    // single implicit entry.
    const std::size_t start = cur_.i;
    std::string name = read_string();
    if (depth_ != 0 || at_end()) return variant_access(*this, saved, std::move(name), true, false);
    cur_.i = start;
  }

  const bool implicit = depth_ == 0 && cur_.peek() != '{';
  if (!implicit) {
    check_depth();
    require_char('{', error_code::type_mismatch, "expected a variant name or a one-entry dict");
  }
  skip();
  if (cur_.at_end()) fail(error_code::unexpected_eof, "expected a variant name");
  if (cur_.peek() == '}') fail(error_code::expected_key, "expected a variant name");
  std::string name = read_entry_key();
  ++depth_;
  implicit_root_ = implicit_root_ || implicit;
  return variant_access(*this, saved, std::move(name), false, implicit);
}

enum class format_mode { pretty, compact };

enum class root_kind { unset, dict, list };

// Output policy for the serializer. The serializer decides what to write;
// the formatter decides the layout between tokens.
class formatter {
public:
  virtual ~formatter() = default;

  // Before every list element and dict entry.
  virtual void begin_item(std::string& out, bool first, bool implicit) = 0;
  virtual void begin_list(std::string& out) = 0;
  virtual void end_list(std::string& out, bool empty) = 0;
  virtual void begin_dict(std::string& out, bool implicit) = 0;
  virtual void end_dict(std::string& out, bool implicit, bool empty) = 0;
  virtual void finish(std::string& out) = 0;

  // `text` is already quoted when the key is not a bare token.
  virtual void write_key(std::string& out, std::string_view text) {
    out.append(text.data(), text.size());
    out.push_back(' ');
  }

  int indent() const noexcept { return indent_; }
  root_kind root() const noexcept { return root_; }
  void set_root(root_kind k) noexcept {
    if (root_ == root_kind::unset) root_ = k;
  }

protected:
  int indent_{0};
  root_kind root_{root_kind::unset};
};

// Four spaces per level, one entry per line, trailing newline.
class pretty_formatter final : public formatter {
public:
  void begin_item(std::string& out, bool first, bool implicit) override {
    if (implicit) {
      if (!first) out.push_back('\n');
      return;
    }
    out.push_back('\n');
    detail::append_indent(out, indent_);
  }

  void begin_list(std::string& out) override {
    out.push_back('[');
    ++indent_;
  }

  void end_list(std::string& out, bool empty) override {
    --indent_;
    if (!empty) {
      out.push_back('\n');
      detail::append_indent(out, indent_);
    }
    out.push_back(']');
  }

  void begin_dict(std::string& out, bool implicit) override {
    if (implicit) return;
    out.push_back('{');
    ++indent_;
  }

  void end_dict(std::string& out, bool implicit, bool empty) override {
    if (implicit) return;
    --indent_;
    if (!empty) {
      out.push_back('\n');
      detail::append_indent(out, indent_);
    }
    out.push_back('}');
  }

  void finish(std::string& out) override {
    if (out.empty() || out.back() != '\n') out.push_back('\n');
  }
};

// Single line; entries separated by ','. The root dict keeps its implicit form.
class compact_formatter final : public formatter {
public:
  void begin_item(std::string& out, bool first, bool) override {
    if (!first) out.push_back(',');
  }

  void begin_list(std::string& out) override {
    out.push_back('[');
    ++indent_;
  }

  void end_list(std::string& out, bool) override {
    --indent_;
    out.push_back(']');
  }

  void begin_dict(std::string& out, bool implicit) override {
    if (implicit) return;
    out.push_back('{');
    ++indent_;
  }

  void end_dict(std::string& out, bool implicit, bool) override {
    if (implicit) return;
    --indent_;
    out.push_back('}');
  }

  void finish(std::string&) override {}
};

inline std::unique_ptr<formatter> make_formatter(format_mode mode) {
  if (mode == format_mode::compact) return std::make_unique<compact_formatter>();
  return std::make_unique<pretty_formatter>();
}

// Push interface: validates the event order and writes through a formatter.
class serializer {
public:
  explicit serializer(format_mode mode = format_mode::pretty) : fmt_(make_formatter(mode)) {}
  explicit serializer(std::unique_ptr<formatter> fmt) : fmt_(std::move(fmt)) {}

  void write_unit() {
    before_value();
    out_ += "null";
    after_value();
  }

  void write_bool(bool b) {
    before_value();
    out_ += b ? "true" : "false";
    after_value();
  }

  void write_number(double d) {
    if (!std::isfinite(d)) raise(error_code::non_finite_number, "NaN and infinity have no Tot representation");
    before_value();
    detail::append_number(out_, d);
    after_value();
  }

  void write_float(float f) {
    if (!std::isfinite(f)) raise(error_code::non_finite_number, "NaN and infinity have no Tot representation");
    before_value();
    detail::append_number(out_, f);
    after_value();
  }

  // Integers are written as doubles.
  template <class Int>
  void write_integer(Int v) {
    write_number(static_cast<double>(v));
  }

  void write_string(std::string_view s) {
    before_value();
    detail::append_quoted(out_, s);
    after_value();
  }

  void write_char(char32_t c) {
    if (!detail::is_scalar_value(static_cast<std::uint32_t>(c))) {
      raise(error_code::invalid_char, "not a unicode scalar value");
    }
    std::string buf;
    detail::append_utf8(buf, static_cast<std::uint32_t>(c));
    write_string(buf);
  }

  void begin_seq() {
    before_value();
    if (stack_.empty()) fmt_->set_root(root_kind::list);
    fmt_->begin_list(out_);
    stack_.push_back(frame{false, false, 0, false});
  }

  void end_seq() {
    if (stack_.empty() || stack_.back().is_map) raise(error_code::invalid_state, "end_seq without a matching begin_seq");
    const frame f = stack_.back();
    stack_.pop_back();
    fmt_->end_list(out_, f.count == 0);
    after_value();
  }

  // The root dict is written without braces.
  void begin_map() {
    before_value();
    const bool root = stack_.empty();
    if (root) fmt_->set_root(root_kind::dict);
    fmt_->begin_dict(out_, root);
    stack_.push_back(frame{true, root, 0, false});
  }

  void key(std::string_view k) {
    if (stack_.empty() || !stack_.back().is_map) raise(error_code::invalid_state, "key written outside a dict");
    frame& f = stack_.back();
    if (f.key_pending) raise(error_code::invalid_state, "previous key has no value");
    fmt_->begin_item(out_, f.count == 0, f.implicit);
    ++f.count;
    if (detail::key_needs_quotes(k)) {
      std::string quoted;
      detail::append_quoted(quoted, k);
      fmt_->write_key(out_, quoted);
    } else {
      fmt_->write_key(out_, k);
    }
    f.key_pending = true;
  }

  void end_map() {
    if (stack_.empty() || !stack_.back().is_map) raise(error_code::invalid_state, "end_map without a matching begin_map");
    const frame f = stack_.back();
    if (f.key_pending) raise(error_code::invalid_state, "last key has no value");
    stack_.pop_back();
    fmt_->end_dict(out_, f.implicit, f.count == 0);
    after_value();
  }

  void write_unit_variant(std::string_view name) { write_string(name); }

  // { Name payload }, braces elided at the root.
  void begin_variant(std::string_view name) {
    begin_map();
    key(name);
  }

  void end_variant() { end_map(); }

  const std::string& buffer() const noexcept { return out_; }
  const formatter& format() const noexcept { return *fmt_; }

  std::string finish() {
    if (!stack_.empty()) raise(error_code::invalid_state, "document ends inside an open list or dict");
    fmt_->finish(out_);
    return std::move(out_);
  }

private:
  struct frame {
    bool is_map;
    bool implicit;
    std::size_t count;
    bool key_pending;
  };

  void before_value() {
    if (stack_.empty()) {
      if (root_done_) raise(error_code::invalid_state, "document already holds a root value");
      return;
    }
    frame& f = stack_.back();
    if (f.is_map) {
      if (!f.key_pending) raise(error_code::invalid_state, "dict value written without a key");
      f.key_pending = false;
      return;
    }
    fmt_->begin_item(out_, f.count == 0, false);
    ++f.count;
  }

  void after_value() noexcept {
    if (stack_.empty()) root_done_ = true;
  }

  [[noreturn]] static void raise(error_code code, std::string message) {
    throw exception(detail::make_error(code, std::move(message)));
  }

  std::unique_ptr<formatter> fmt_;
  std::string out_;
  std::vector<frame> stack_;
  bool root_done_{false};
};

inline void serialize(serializer& s, const value& v) {
  switch (v.type()) {
    case value::kind::unit: s.write_unit(); return;
    case value::kind::boolean: s.write_bool(v.as_bool()); return;
    case value::kind::number: s.write_number(v.as_number()); return;
    case value::kind::string: s.write_string(v.as_string()); return;
    case value::kind::list:
      s.begin_seq();
      for (const auto& e : v.as_list()) serialize(s, e);
      s.end_seq();
      return;
    case value::kind::dict:
      s.begin_map();
      for (const auto& kv : v.as_dict()) {
        s.key(kv.first);
        serialize(s, kv.second);
      }
      s.end_map();
      return;
  }
}

inline std::string dump(const value& v, bool pretty = true) {
  serializer s(pretty ? format_mode::pretty : format_mode::compact);
  serialize(s, v);
  return s.finish();
}

} // namespace tot
