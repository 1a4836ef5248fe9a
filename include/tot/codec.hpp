#pragma once

// Typed reading and writing on top of tot::deserializer / tot::serializer.
//
// A type is supported when tot::codec<T> provides
//   static void read(tot::deserializer&, T&);
//   static void write(tot::serializer&, const T&);
// Specializations ship for the standard vocabulary types. Records describe
// themselves with a static tot_fields(), enums map through enum_codec, and
// std::variant sums name their alternatives with variant_names.

#include <tot/tot.hpp>

#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace tot {

template <class T, class Enable = void>
struct codec;

template <class V>
struct variant_names;

namespace detail {

template <class T, class = void>
struct has_fields : std::false_type {};

template <class T>
struct has_fields<T, std::void_t<decltype(T::tot_fields())>> : std::true_type {};

template <class T>
struct is_optional : std::false_type {};

template <class T>
struct is_optional<std::optional<T>> : std::true_type {};

template <class T>
struct is_plain_integer
    : std::integral_constant<bool, std::is_integral<T>::value && !std::is_same<T, bool>::value &&
                                       !std::is_same<T, char>::value && !std::is_same<T, char32_t>::value> {};

template <class Tuple, class Fn, std::size_t... I>
void for_each_field(const Tuple& t, Fn&& fn, std::index_sequence<I...>) {
  (fn(std::integral_constant<std::size_t, I>{}, std::get<I>(t)), ...);
}

template <class Tuple, class Fn>
void for_each_field(const Tuple& t, Fn&& fn) {
  for_each_field(t, std::forward<Fn>(fn), std::make_index_sequence<std::tuple_size<Tuple>::value>{});
}

} // namespace detail

// ---- scalars ---------------------------------------------------------------

template <>
struct codec<bool> {
  static void read(deserializer& d, bool& out) { out = d.read_bool(); }
  static void write(serializer& s, const bool& v) { s.write_bool(v); }
};

template <class T>
struct codec<T, std::enable_if_t<detail::is_plain_integer<T>::value>> {
  static void read(deserializer& d, T& out) { out = d.read_integer<T>(); }
  static void write(serializer& s, const T& v) { s.write_integer(v); }
};

template <>
struct codec<double> {
  static void read(deserializer& d, double& out) { out = d.read_number(); }
  static void write(serializer& s, const double& v) { s.write_number(v); }
};

template <>
struct codec<float> {
  static void read(deserializer& d, float& out) { out = d.read_float32(); }
  static void write(serializer& s, const float& v) { s.write_float(v); }
};

// A one-character string; only ASCII fits in a char.
template <>
struct codec<char> {
  static void read(deserializer& d, char& out) { out = d.read_ascii_char(); }
  static void write(serializer& s, const char& v) {
    if (static_cast<unsigned char>(v) > 0x7Fu) {
      throw exception(detail::make_error(error_code::invalid_char, "char holds a byte outside ASCII"));
    }
    s.write_char(static_cast<char32_t>(v));
  }
};

template <>
struct codec<char32_t> {
  static void read(deserializer& d, char32_t& out) { out = d.read_char(); }
  static void write(serializer& s, const char32_t& v) { s.write_char(v); }
};

template <>
struct codec<std::string> {
  static void read(deserializer& d, std::string& out) { out = d.read_string(); }
  static void write(serializer& s, const std::string& v) { s.write_string(v); }
};

template <>
struct codec<std::monostate> {
  static void read(deserializer& d, std::monostate&) { d.read_unit(); }
  static void write(serializer& s, const std::monostate&) { s.write_unit(); }
};

template <>
struct codec<value> {
  static void read(deserializer& d, value& out) { out = d.read_any(); }
  static void write(serializer& s, const value& v) { serialize(s, v); }
};

template <class T>
struct codec<std::optional<T>> {
  static void read(deserializer& d, std::optional<T>& out) {
    if (d.next_is_null()) {
      out.reset();
      return;
    }
    out.emplace();
    codec<T>::read(d, *out);
  }
  static void write(serializer& s, const std::optional<T>& v) {
    if (!v) {
      s.write_unit();
      return;
    }
    codec<T>::write(s, *v);
  }
};

// ---- sequences ---------------------------------------------------------------

template <class T, class A>
struct codec<std::vector<T, A>> {
  static void read(deserializer& d, std::vector<T, A>& out) {
    out.clear();
    auto seq = d.begin_seq();
    while (seq.next()) {
      T elem{};
      codec<T>::read(d, elem);
      out.push_back(std::move(elem));
    }
    seq.end();
  }
  static void write(serializer& s, const std::vector<T, A>& v) {
    s.begin_seq();
    for (const auto& elem : v) {
      const T& e = elem;
      codec<T>::write(s, e);
    }
    s.end_seq();
  }
};

template <class T, std::size_t N>
struct codec<std::array<T, N>> {
  static void read(deserializer& d, std::array<T, N>& out) {
    auto seq = d.begin_seq();
    std::size_t n = 0;
    while (seq.next()) {
      if (n == N) d.fail(error_code::invalid_length, "too many elements, expected " + std::to_string(N));
      codec<T>::read(d, out[n++]);
    }
    if (n != N) d.fail(error_code::invalid_length, "expected " + std::to_string(N) + " elements, found " + std::to_string(n));
    seq.end();
  }
  static void write(serializer& s, const std::array<T, N>& v) {
    s.begin_seq();
    for (const auto& e : v) codec<T>::write(s, e);
    s.end_seq();
  }
};

namespace detail {

template <class Tuple, std::size_t... I>
void read_tuple(deserializer& d, Tuple& out, std::index_sequence<I...>) {
  constexpr std::size_t n = sizeof...(I);
  auto seq = d.begin_seq();
  auto one = [&](auto& elem) {
    if (!seq.next()) d.fail(error_code::invalid_length, "expected " + std::to_string(n) + " elements");
    codec<std::decay_t<decltype(elem)>>::read(d, elem);
  };
  (one(std::get<I>(out)), ...);
  if (seq.next()) d.fail(error_code::invalid_length, "expected " + std::to_string(n) + " elements");
  seq.end();
}

template <class Tuple, std::size_t... I>
void write_tuple(serializer& s, const Tuple& v, std::index_sequence<I...>) {
  s.begin_seq();
  (codec<std::tuple_element_t<I, Tuple>>::write(s, std::get<I>(v)), ...);
  s.end_seq();
}

} // namespace detail

template <class... T>
struct codec<std::tuple<T...>> {
  static void read(deserializer& d, std::tuple<T...>& out) {
    detail::read_tuple(d, out, std::index_sequence_for<T...>{});
  }
  static void write(serializer& s, const std::tuple<T...>& v) {
    detail::write_tuple(s, v, std::index_sequence_for<T...>{});
  }
};

template <class A, class B>
struct codec<std::pair<A, B>> {
  static void read(deserializer& d, std::pair<A, B>& out) {
    detail::read_tuple(d, out, std::make_index_sequence<2>{});
  }
  static void write(serializer& s, const std::pair<A, B>& v) {
    detail::write_tuple(s, v, std::make_index_sequence<2>{});
  }
};

// ---- enums -------------------------------------------------------------------

template <class E>
struct enum_entry {
  E value;
  const char* name;
};

// Enumerators travel as unit variants: a quoted name.
//
//   inline constexpr tot::enum_entry<color> color_names[] = {{color::red, "Red"}, ...};
//   template <> struct tot::codec<color> : tot::enum_codec<color, color_names> {};
template <class E, const auto& Entries>
struct enum_codec {
  static const char* name_of(E v) noexcept {
    for (const auto& e : Entries) {
      if (e.value == v) return e.name;
    }
    return nullptr;
  }

  static bool from_name(std::string_view name, E& out) noexcept {
    for (const auto& e : Entries) {
      if (name == e.name) {
        out = e.value;
        return true;
      }
    }
    return false;
  }

  static void read(deserializer& d, E& out) {
    auto v = d.begin_variant();
    if (!from_name(v.name(), out)) d.fail(error_code::unknown_variant, "unknown variant '" + v.name() + "'");
    if (!v.is_unit()) d.read_unit();
    v.end();
  }

  static void write(serializer& s, const E& v) {
    const char* name = name_of(v);
    if (!name) throw exception(detail::make_error(error_code::unknown_variant, "enumerator has no registered name"));
    s.write_unit_variant(name);
  }
};

// ---- maps --------------------------------------------------------------------

namespace detail {

template <class K, class = void>
struct key_traits;

template <>
struct key_traits<std::string> {
  static std::string from_key(deserializer&, std::string key) { return key; }
  static std::string to_key(const std::string& k) { return k; }
};

// Integer keys are written as plain integer text and read back with the
// same rounding and range rules as integer values.
template <class K>
struct key_traits<K, std::enable_if_t<is_plain_integer<K>::value>> {
  static K from_key(deserializer& d, const std::string& key) {
    cursor c;
    c.s = key;
    double v = 0.0;
    if (c.scan_number(v) != match::hit || !c.at_end()) {
      d.fail(error_code::invalid_key, "key '" + key + "' is not a number");
    }
    K out{};
    if (!coerce_integer(std::round(v), out)) {
      d.fail(error_code::integer_out_of_range, "key '" + key + "' does not fit the key type");
    }
    return out;
  }
  static std::string to_key(const K& k) { return std::to_string(k); }
};

template <class K>
struct key_traits<K, std::enable_if_t<std::is_enum<K>::value>> {
  static K from_key(deserializer& d, const std::string& key) {
    K out{};
    if (!codec<K>::from_name(key, out)) d.fail(error_code::invalid_key, "unknown variant '" + key + "' used as key");
    return out;
  }
  static std::string to_key(const K& k) {
    const char* name = codec<K>::name_of(k);
    if (!name) throw exception(make_error(error_code::invalid_key, "enumerator has no registered name"));
    return name;
  }
};

template <class Map>
void read_map(deserializer& d, Map& out) {
  using K = typename Map::key_type;
  using V = typename Map::mapped_type;
  out.clear();
  auto m = d.begin_map();
  std::string key;
  while (m.next_key(key)) {
    K k = key_traits<K>::from_key(d, key);
    V v{};
    codec<V>::read(d, v);
    out.insert_or_assign(std::move(k), std::move(v));
  }
  m.end();
}

template <class Map>
void write_map(serializer& s, const Map& v) {
  using K = typename Map::key_type;
  using V = typename Map::mapped_type;
  s.begin_map();
  for (const auto& kv : v) {
    s.key(key_traits<K>::to_key(kv.first));
    codec<V>::write(s, kv.second);
  }
  s.end_map();
}

} // namespace detail

template <class K, class V, class C, class A>
struct codec<std::map<K, V, C, A>> {
  static void read(deserializer& d, std::map<K, V, C, A>& out) { detail::read_map(d, out); }
  static void write(serializer& s, const std::map<K, V, C, A>& v) { detail::write_map(s, v); }
};

template <class K, class V, class H, class E, class A>
struct codec<std::unordered_map<K, V, H, E, A>> {
  static void read(deserializer& d, std::unordered_map<K, V, H, E, A>& out) { detail::read_map(d, out); }
  static void write(serializer& s, const std::unordered_map<K, V, H, E, A>& v) { detail::write_map(s, v); }
};

// ---- records -----------------------------------------------------------------

struct defaulted_t {
  explicit defaulted_t() = default;
};

// Marks a field that may be absent; the member keeps its default.
inline constexpr defaulted_t defaulted{};

template <class T, class M>
struct field_t {
  const char* name;
  M T::*member;
  bool required;
};

// std::optional members are never required.
template <class T, class M>
constexpr field_t<T, M> field(const char* name, M T::*member) {
  return field_t<T, M>{name, member, !detail::is_optional<M>::value};
}

template <class T, class M>
constexpr field_t<T, M> field(const char* name, M T::*member, defaulted_t) {
  return field_t<T, M>{name, member, false};
}

template <class... F>
constexpr std::tuple<F...> make_fields(F... fields) {
  return std::tuple<F...>(fields...);
}

// Records read from and write to dicts. Unknown keys are skipped, a repeated
// key overwrites the earlier value, and a missing required field fails.
template <class T>
struct codec<T, std::enable_if_t<detail::has_fields<T>::value>> {
  static void read(deserializer& d, T& out) {
    const auto fields = T::tot_fields();
    using fields_type = std::decay_t<decltype(fields)>;
    std::array<bool, std::tuple_size<fields_type>::value> seen{};

    auto m = d.begin_map();
    std::string key;
    while (m.next_key(key)) {
      bool matched = false;
      detail::for_each_field(fields, [&](auto index, const auto& f) {
        if (matched || key != f.name) return;
        using member_type = std::decay_t<decltype(out.*(f.member))>;
        codec<member_type>::read(d, out.*(f.member));
        seen[decltype(index)::value] = true;
        matched = true;
      });
      if (!matched) d.skip_value();
    }
    detail::for_each_field(fields, [&](auto index, const auto& f) {
      if (f.required && !seen[decltype(index)::value]) {
        d.fail(error_code::missing_field, std::string("missing field '") + f.name + "'");
      }
    });
    m.end();
  }

  static void write(serializer& s, const T& v) {
    const auto fields = T::tot_fields();
    s.begin_map();
    detail::for_each_field(fields, [&](auto, const auto& f) {
      using member_type = std::decay_t<decltype(v.*(f.member))>;
      s.key(f.name);
      codec<member_type>::write(s, v.*(f.member));
    });
    s.end_map();
  }
};

// ---- named sums --------------------------------------------------------------

// std::variant alternatives need names:
//
//   template <> struct tot::variant_names<shape> {
//     static constexpr const char* names[] = {"Unit", "Circle", "Rect"};
//   };
//
// An empty alternative is a unit variant written as "Name"; any other
// alternative is written as { Name payload } with the alternative's own
// codec producing the payload (a list for tuples, a dict for records).
template <class... A>
struct codec<std::variant<A...>> {
  using variant_type = std::variant<A...>;

  static void read(deserializer& d, variant_type& out) {
    auto va = d.begin_variant();
    bool found = false;
    read_alternative(d, va, out, found, std::index_sequence_for<A...>{});
    if (!found) d.fail(error_code::unknown_variant, "unknown variant '" + va.name() + "'");
    va.end();
  }

  static void write(serializer& s, const variant_type& v) {
    if (v.valueless_by_exception()) {
      throw exception(detail::make_error(error_code::invalid_state, "variant holds no value"));
    }
    write_alternative(s, v, std::index_sequence_for<A...>{});
  }

private:
  static constexpr std::size_t count = sizeof...(A);
  static_assert(std::extent<decltype(variant_names<variant_type>::names)>::value == count,
                "variant_names must name every alternative");

  template <std::size_t I>
  static void read_one(deserializer& d, deserializer::variant_access& va, variant_type& out, bool& found) {
    using alt = std::variant_alternative_t<I, variant_type>;
    if (found || va.name() != variant_names<variant_type>::names[I]) return;
    found = true;
    if constexpr (std::is_empty<alt>::value) {
      if (!va.is_unit()) d.read_unit();
      out.template emplace<I>();
    } else {
      if (va.is_unit()) d.fail(error_code::type_mismatch, "variant '" + va.name() + "' expects a payload");
      alt payload{};
      codec<alt>::read(d, payload);
      out.template emplace<I>(std::move(payload));
    }
  }

  template <std::size_t... I>
  static void read_alternative(deserializer& d, deserializer::variant_access& va, variant_type& out, bool& found,
                               std::index_sequence<I...>) {
    (read_one<I>(d, va, out, found), ...);
  }

  template <std::size_t I>
  static void write_one(serializer& s, const variant_type& v) {
    using alt = std::variant_alternative_t<I, variant_type>;
    const char* name = variant_names<variant_type>::names[I];
    if constexpr (std::is_empty<alt>::value) {
      s.write_unit_variant(name);
    } else {
      s.begin_variant(name);
      codec<alt>::write(s, std::get<I>(v));
      s.end_variant();
    }
  }

  template <std::size_t... I>
  static void write_alternative(serializer& s, const variant_type& v, std::index_sequence<I...>) {
    ((v.index() == I ? write_one<I>(s, v) : void()), ...);
  }
};

// ---- entry points ------------------------------------------------------------

// Reads a whole document as T. Throws tot::exception.
template <class T>
T decode(std::string_view text, parse_options opt = {}) {
  deserializer d(text, opt);
  T out{};
  codec<T>::read(d, out);
  d.finish();
  return out;
}

// Non-throwing form of decode. `out` is unspecified when an error is returned.
template <class T>
error decode_into(std::string_view text, T& out, parse_options opt = {}) {
  try {
    deserializer d(text, opt);
    codec<T>::read(d, out);
    d.finish();
  } catch (const exception& e) {
    return e.err();
  }
  return {};
}

template <class T>
std::string encode(const T& v, format_mode mode = format_mode::pretty) {
  serializer s(mode);
  codec<T>::write(s, v);
  return s.finish();
}

template <class T>
std::string encode_compact(const T& v) {
  return encode(v, format_mode::compact);
}

// Writes the encoded document to `os`. Stream failure raises io_failure;
// whatever reached the stream stays there.
template <class T>
void encode_to(std::ostream& os, const T& v, format_mode mode = format_mode::pretty) {
  const std::string text = encode(v, mode);
  os.write(text.data(), static_cast<std::streamsize>(text.size()));
  if (!os) throw exception(detail::make_error(error_code::io_failure, "failed to write encoded document to stream"));
}

} // namespace tot
