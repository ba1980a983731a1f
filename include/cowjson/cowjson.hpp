#pragma once

// cowjson: a small, header-only C++17 JSON library.
// Builds a dynamic value tree from a pull-style token source, borrowing
// unescaped strings straight from the input buffer and copying only the
// strings that had to be unescaped.

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#if defined(_M_X64) || defined(__SSE2__)
  #if defined(_MSC_VER)
    #include <intrin.h>
  #endif
  #include <immintrin.h>
#endif
#include <functional>
#include <limits>
#include <memory>
#include <new>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace cowjson {

// Config: floating-point parsing backend.
// Override by defining COWJSON_USE_FROM_CHARS_DOUBLE to 0/1 before including this header.
#ifndef COWJSON_USE_FROM_CHARS_DOUBLE
  #define COWJSON_USE_FROM_CHARS_DOUBLE 0
#endif

enum class error_code {
  ok = 0,
  // Lexical: reported by the token source.
  unexpected_eof,
  invalid_value,
  invalid_number,
  invalid_string,
  invalid_escape,
  invalid_unicode_escape,
  invalid_utf16_surrogate,
  invalid_utf8,
  expected_colon,
  expected_comma_or_end,
  expected_key_string,
  trailing_characters,
  // Valid JSON the value tree cannot represent.
  integer_too_large,
  number_out_of_range,
  unsupported_token,
  // The token source handed the builder a state outside their contract.
  unresolved_minus,
  nesting_too_deep
};

enum class error_category { none, lexical, unsupported_shape, structural_defect, limit };

inline error_category category(error_code code) noexcept {
  switch (code) {
    case error_code::ok: return error_category::none;
    case error_code::integer_too_large:
    case error_code::number_out_of_range:
    case error_code::unsupported_token: return error_category::unsupported_shape;
    case error_code::unresolved_minus: return error_category::structural_defect;
    case error_code::nesting_too_deep: return error_category::limit;
    default: return error_category::lexical;
  }
}

inline const char* to_string(error_code code) noexcept {
  switch (code) {
    case error_code::ok: return "ok";
    case error_code::unexpected_eof: return "unexpected end of input";
    case error_code::invalid_value: return "invalid value";
    case error_code::invalid_number: return "invalid number";
    case error_code::invalid_string: return "invalid string";
    case error_code::invalid_escape: return "invalid escape sequence";
    case error_code::invalid_unicode_escape: return "invalid unicode escape";
    case error_code::invalid_utf16_surrogate: return "invalid utf-16 surrogate";
    case error_code::invalid_utf8: return "invalid utf-8";
    case error_code::expected_colon: return "expected ':'";
    case error_code::expected_comma_or_end: return "expected ',' or end of container";
    case error_code::expected_key_string: return "expected string key";
    case error_code::trailing_characters: return "trailing characters";
    case error_code::integer_too_large: return "integer does not fit in 64 bits";
    case error_code::number_out_of_range: return "number does not fit in a double";
    case error_code::unsupported_token: return "unsupported token kind";
    case error_code::unresolved_minus: return "unresolved minus sign from token source";
    case error_code::nesting_too_deep: return "nesting too deep";
  }
  return "unknown error";
}

struct error {
  error_code code{error_code::ok};
  std::size_t offset{0};
  std::size_t line{1};
  std::size_t column{1};

  constexpr explicit operator bool() const noexcept { return code != error_code::ok; }
  error_category category() const noexcept { return cowjson::category(code); }
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

// Records the first error only; later failures while unwinding keep it intact.
inline void set_error(error& e, std::string_view s, error_code code, std::size_t offset) {
  if (e) return;
  e.code = code;
  e.offset = offset;
  update_line_col(s, offset, e.line, e.column);
}

inline bool is_ws(char c) noexcept {
  return c == ' ' || c == '\n' || c == '\r' || c == '\t';
}

inline void skip_ws(const char* buf, std::size_t size, std::size_t& i) noexcept {
  // Fast path: SSE2 scan 16 bytes at a time (available on MSVC x64 and most x86).
#if defined(_M_X64) || defined(__SSE2__)
  while (i + 16 <= size) {
    const __m128i v = _mm_loadu_si128(reinterpret_cast<const __m128i*>(buf + i));
    const __m128i is_space = _mm_cmpeq_epi8(v, _mm_set1_epi8(' '));
    const __m128i is_nl = _mm_cmpeq_epi8(v, _mm_set1_epi8('\n'));
    const __m128i is_cr = _mm_cmpeq_epi8(v, _mm_set1_epi8('\r'));
    const __m128i is_tab = _mm_cmpeq_epi8(v, _mm_set1_epi8('\t'));
    const __m128i is_ws_v = _mm_or_si128(_mm_or_si128(is_space, is_nl), _mm_or_si128(is_cr, is_tab));
    const unsigned ws_mask = static_cast<unsigned>(_mm_movemask_epi8(is_ws_v));
    if (ws_mask == 0xFFFFu) {
      i += 16;
      continue;
    }

    const unsigned non = (~ws_mask) & 0xFFFFu;
#if defined(_MSC_VER)
    unsigned long idx = 0;
    _BitScanForward(&idx, non);
    i += static_cast<std::size_t>(idx);
#else
    i += static_cast<std::size_t>(__builtin_ctz(non));
#endif
    return;
  }
#endif

  while (i < size && is_ws(buf[i])) ++i;
}

// Advances `i` over printable ASCII that needs no attention inside a string
// literal. Stops at '"', '\\', control bytes and the lead byte of any
// multi-byte UTF-8 sequence.
inline void skip_plain_string_bytes(const char* buf, std::size_t size, std::size_t& i) noexcept {
#if defined(_M_X64) || defined(__SSE2__)
  const __m128i q = _mm_set1_epi8('"');
  const __m128i bs = _mm_set1_epi8('\\');
  const __m128i k1f = _mm_set1_epi8(0x1F);
  const __m128i zero = _mm_setzero_si128();
  while (i + 16 <= size) {
    const __m128i v = _mm_loadu_si128(reinterpret_cast<const __m128i*>(buf + i));
    const __m128i is_q = _mm_cmpeq_epi8(v, q);
    const __m128i is_bs = _mm_cmpeq_epi8(v, bs);
    // Unsigned check for v <= 0x1F using saturated subtract.
    const __m128i sub = _mm_subs_epu8(v, k1f);
    const __m128i is_ctrl = _mm_cmpeq_epi8(sub, zero);
    const __m128i any = _mm_or_si128(_mm_or_si128(is_q, is_bs), is_ctrl);
    // High bit set: non-ASCII, must go through UTF-8 validation.
    const unsigned mask = static_cast<unsigned>(_mm_movemask_epi8(any)) | static_cast<unsigned>(_mm_movemask_epi8(v));
    if (mask == 0u) {
      i += 16;
      continue;
    }
#if defined(_MSC_VER)
    unsigned long bit = 0;
    _BitScanForward(&bit, static_cast<unsigned long>(mask));
    i += static_cast<std::size_t>(bit);
#else
    i += static_cast<std::size_t>(__builtin_ctz(mask));
#endif
    return;
  }
#endif
  while (i < size) {
    const unsigned char uc = static_cast<unsigned char>(buf[i]);
    if (uc == '"' || uc == '\\' || uc <= 0x1F || uc >= 0x80) return;
    ++i;
  }
}

// Length of the well-formed UTF-8 sequence starting at `p`, or 0 when the
// sequence is truncated, overlong, a surrogate or above U+10FFFF.
inline std::size_t utf8_sequence_length(const char* p, std::size_t avail) noexcept {
  if (avail == 0) return 0;
  const unsigned char c0 = static_cast<unsigned char>(p[0]);
  if (c0 < 0x80u) return 1;

  std::size_t len = 0;
  std::uint32_t cp = 0;
  std::uint32_t min_cp = 0;
  if ((c0 & 0xE0u) == 0xC0u) {
    len = 2;
    cp = c0 & 0x1Fu;
    min_cp = 0x80u;
  } else if ((c0 & 0xF0u) == 0xE0u) {
    len = 3;
    cp = c0 & 0x0Fu;
    min_cp = 0x800u;
  } else if ((c0 & 0xF8u) == 0xF0u) {
    len = 4;
    cp = c0 & 0x07u;
    min_cp = 0x10000u;
  } else {
    return 0;
  }
  if (avail < len) return 0;

  for (std::size_t k = 1; k < len; ++k) {
    const unsigned char c = static_cast<unsigned char>(p[k]);
    if ((c & 0xC0u) != 0x80u) return 0;
    cp = (cp << 6) | (c & 0x3Fu);
  }
  if (cp < min_cp || cp > 0x10FFFFu) return 0;
  if (cp >= 0xD800u && cp <= 0xDFFFu) return 0;
  return len;
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

inline bool parse_u4(std::string_view s, std::size_t& i, std::uint32_t& out_cp) noexcept {
  if (i + 4 > s.size()) return false;
  const int h0 = hex_val(s[i]);
  const int h1 = hex_val(s[i + 1]);
  const int h2 = hex_val(s[i + 2]);
  const int h3 = hex_val(s[i + 3]);
  if ((h0 | h1 | h2 | h3) < 0) return false;
  out_cp = (static_cast<std::uint32_t>(h0) << 12) |
           (static_cast<std::uint32_t>(h1) << 8) |
           (static_cast<std::uint32_t>(h2) << 4) |
           static_cast<std::uint32_t>(h3);
  i += 4;
  return true;
}

inline bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

struct number_token {
  std::string_view text{};
  // No fraction and no exponent.
  bool is_int{false};
  // Only meaningful when `is_int`: the magnitude fits in std::int64_t.
  bool fits_int64{false};
  std::int64_t i{0};
};

inline double parse_double(std::string_view token) {
  // Backend choice:
  // - strtod: often quite fast on MSVC/Windows and very robust.
  // - from_chars: locale-free and allocation-free, but performance varies by STL.
#if defined(COWJSON_USE_FROM_CHARS_DOUBLE) && COWJSON_USE_FROM_CHARS_DOUBLE
#if defined(__cpp_lib_to_chars)
  {
    double v = 0.0;
    const char* first = token.data();
    const char* last = token.data() + token.size();
    auto r = std::from_chars(first, last, v, std::chars_format::general);
    if (r.ec == std::errc{} && r.ptr == last) return v;
  }
#endif
#endif

  // Token is not NUL-terminated; avoid heap alloc for typical short numbers.
  constexpr std::size_t kStackCap = 128;
  if (token.size() < kStackCap) {
    char buf[kStackCap];
    if (!token.empty()) std::memcpy(buf, token.data(), token.size());
    buf[token.size()] = '\0';
    return std::strtod(buf, nullptr);
  }
  return std::strtod(std::string(token).c_str(), nullptr);
}

// Scans one number token starting at `i`. On success `i` is one past the
// token. Does not convert fractional tokens; see parse_double.
inline bool scan_number(const char* buf, std::size_t size, std::size_t& i, number_token& out) noexcept {
  // JSON number grammar:
  // -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
  const std::size_t start = i;
  if (i >= size) return false;

  bool neg = false;
  if (buf[i] == '-') {
    neg = true;
    ++i;
    if (i >= size) return false;
  }

  std::uint64_t acc = 0;
  bool overflow = false;

  if (buf[i] == '0') {
    ++i;
    if (i < size && is_digit(buf[i])) return false;
  } else {
    const char c0 = buf[i];
    if (c0 < '1' || c0 > '9') return false;
    acc = static_cast<std::uint64_t>(c0 - '0');
    ++i;
    while (i < size && is_digit(buf[i])) {
      const std::uint64_t d = static_cast<std::uint64_t>(buf[i] - '0');
      if (!overflow) {
        if (acc > (std::numeric_limits<std::uint64_t>::max() - d) / 10u) {
          overflow = true;
        } else {
          acc = acc * 10u + d;
        }
      }
      ++i;
    }
  }

  bool is_int = true;
  if (i < size && buf[i] == '.') {
    is_int = false;
    ++i;
    if (i >= size || !is_digit(buf[i])) return false;
    while (i < size && is_digit(buf[i])) ++i;
  }

  if (i < size && (buf[i] == 'e' || buf[i] == 'E')) {
    is_int = false;
    ++i;
    if (i >= size) return false;
    if (buf[i] == '+' || buf[i] == '-') {
      ++i;
      if (i >= size) return false;
    }
    if (!is_digit(buf[i])) return false;
    while (i < size && is_digit(buf[i])) ++i;
  }

  out.text = std::string_view(buf + start, i - start);
  out.is_int = is_int;
  out.fits_int64 = false;
  out.i = 0;
  if (!is_int || overflow) return true;

  if (neg) {
    const std::uint64_t limit = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()) + 1ull;
    if (acc > limit) return true;
    out.fits_int64 = true;
    out.i = (acc == limit) ? std::numeric_limits<std::int64_t>::min() : -static_cast<std::int64_t>(acc);
    return true;
  }

  if (acc > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) return true;
  out.fits_int64 = true;
  out.i = static_cast<std::int64_t>(acc);
  return true;
}

// True when `inner` is a sub-range of `outer` by address, not by content.
// std::less_equal gives a total order over unrelated pointers.
inline bool contains_range(std::string_view outer, std::string_view inner) noexcept {
  if (outer.data() == nullptr || inner.data() == nullptr) return false;
  const std::less_equal<const char*> le;
  const char* ob = outer.data();
  const char* oe = outer.data() + outer.size();
  const char* ib = inner.data();
  const char* ie = inner.data() + inner.size();
  return le(ob, ib) && le(ie, oe);
}

} // namespace detail

// Renders an error together with the part of the document it points at:
//
//   invalid number at line 3, column 8 (offset 20)
//     "b": 01
//          ^
inline std::string describe(const error& e, std::string_view source) {
  if (!e) return "ok";

  std::string out = to_string(e.code);
  out += " at line ";
  out += std::to_string(e.line);
  out += ", column ";
  out += std::to_string(e.column);
  out += " (offset ";
  out += std::to_string(e.offset);
  out += ")";

  if (source.empty()) return out;

  const std::size_t offset = (std::min)(e.offset, source.size());
  std::size_t line_begin = offset;
  while (line_begin > 0 && source[line_begin - 1] != '\n') --line_begin;
  std::size_t line_end = offset;
  while (line_end < source.size() && source[line_end] != '\n') ++line_end;

  // Clip long lines around the column.
  constexpr std::size_t kContext = 40;
  const std::size_t from = (offset - line_begin > kContext) ? offset - kContext : line_begin;
  const std::size_t to = (line_end - offset > kContext) ? offset + kContext : line_end;

  out += "\n  ";
  for (std::size_t k = from; k < to; ++k) {
    const char c = source[k];
    out.push_back((c == '\t' || c == '\r') ? ' ' : c);
  }
  out += "\n  ";
  out.append(offset - from, ' ');
  out.push_back('^');
  return out;
}

class parse_error : public std::runtime_error {
public:
  parse_error(const error& err, std::string_view source)
      : std::runtime_error("cowjson: " + describe(err, source)), err_(err), source_(source) {}

  const error& err() const noexcept { return err_; }
  error_code code() const noexcept { return err_.code; }
  std::string_view source() const noexcept { return source_; }

private:
  error err_;
  std::string source_;
};

// -----------------------------
// string_span
// -----------------------------

class string_span {
public:
  string_span() noexcept : data_(std::string_view{}) {}
  string_span(std::string s) : data_(std::move(s)) {}
  string_span(const char* s) : data_(std::string(s)) {}

  // The caller guarantees `s` lives at least as long as the span.
  static string_span borrowed(std::string_view s) noexcept {
    string_span out;
    out.data_ = s;
    return out;
  }

  static string_span owned(std::string s) { return string_span(std::move(s)); }

  bool is_borrowed() const noexcept { return data_.index() == 0; }
  bool is_owned() const noexcept { return data_.index() == 1; }

  std::string_view view() const noexcept {
    if (const auto* b = std::get_if<std::string_view>(&data_)) return *b;
    return *std::get_if<std::string>(&data_);
  }

  const char* data() const noexcept { return view().data(); }
  std::size_t size() const noexcept { return view().size(); }
  bool empty() const noexcept { return view().empty(); }

  std::string str() const { return std::string(view()); }
  string_span to_owned() const { return owned(str()); }

private:
  std::variant<std::string_view, std::string> data_;
};

// Equality and ordering look at content only.
inline bool operator==(const string_span& a, const string_span& b) noexcept { return a.view() == b.view(); }
inline bool operator!=(const string_span& a, const string_span& b) noexcept { return !(a == b); }
inline bool operator<(const string_span& a, const string_span& b) noexcept { return a.view() < b.view(); }
inline bool operator==(const string_span& a, std::string_view b) noexcept { return a.view() == b; }
inline bool operator==(std::string_view a, const string_span& b) noexcept { return a == b.view(); }
inline bool operator!=(const string_span& a, std::string_view b) noexcept { return !(a == b); }
inline bool operator!=(std::string_view a, const string_span& b) noexcept { return !(a == b); }
inline bool operator==(const string_span& a, const char* b) noexcept { return a.view() == std::string_view(b); }
inline bool operator!=(const string_span& a, const char* b) noexcept { return !(a == b); }

// Borrows `text` when its bytes lie inside `source`, copies it otherwise.
inline string_span make_string_span(std::string_view source, std::string_view text) {
  if (detail::contains_range(source, text)) return string_span::borrowed(text);
  return string_span::owned(std::string(text));
}

// -----------------------------
// value tree
// -----------------------------

class value;

// Vector of values; `with` appends and chains, for building literals.
class array : public std::vector<value> {
public:
  using std::vector<value>::vector;

  array& with(value v) &;
  array&& with(value v) &&;
};

// Insertion-ordered map with unique keys. A hash of each key indexes its
// position in `entries_`, so lookups do not depend on where key bytes live.
// Keys must not be changed through iterators. Member functions that touch the
// entries are defined after `value` is complete.
class map {
public:
  using entry = std::pair<string_span, value>;
  using container = std::vector<entry>;
  using iterator = container::iterator;
  using const_iterator = container::const_iterator;

  map() = default;

  std::size_t size() const noexcept;
  bool empty() const noexcept;
  void reserve(std::size_t n);

  iterator begin() noexcept;
  iterator end() noexcept;
  const_iterator begin() const noexcept;
  const_iterator end() const noexcept;

  // Inserts `key -> v`; an equal key already present keeps its position and
  // gets `v` as its new value.
  value& insert_or_assign(string_span key, value v);

  const value* find(std::string_view key) const noexcept;
  value* find(std::string_view key) noexcept;
  bool contains(std::string_view key) const noexcept;

  map& with(string_span key, value v) &;
  map&& with(string_span key, value v) &&;

private:
  const entry* lookup(std::string_view key, std::size_t hash) const noexcept;

  static std::size_t hash_key(std::string_view key) noexcept { return std::hash<std::string_view>{}(key); }

  container entries_;
  // key hash -> index into entries_
  std::unordered_multimap<std::size_t, std::size_t> index_;
};

class value {
public:
  using array = cowjson::array;
  using map = cowjson::map;

  enum class kind { null, boolean, integer, floating, string, array, map };

  value() noexcept : data_(std::monostate{}) {}
  value(std::nullptr_t) noexcept : data_(std::monostate{}) {}
  value(bool b) noexcept : data_(std::in_place_type<bool>, b) {}
  value(string_span s) : data_(std::in_place_type<string_span>, std::move(s)) {}
  value(std::string s) : data_(std::in_place_type<string_span>, string_span::owned(std::move(s))) {}
  value(const char* s) : data_(std::in_place_type<string_span>, string_span::owned(std::string(s))) {}
  value(array a) : data_(std::in_place_type<array>, std::move(a)) {}
  value(map m) : data_(std::in_place_type<map>, std::move(m)) {}

  static value integer(std::int64_t i) {
    value v;
    v.data_.emplace<std::int64_t>(i);
    return v;
  }

  static value floating(double d) {
    value v;
    v.data_.emplace<double>(d);
    return v;
  }

  kind type() const noexcept {
    switch (data_.index()) {
      case 0: return kind::null;
      case 1: return kind::boolean;
      case 2: return kind::integer;
      case 3: return kind::floating;
      case 4: return kind::string;
      case 5: return kind::array;
      case 6: return kind::map;
      default: return kind::null;
    }
  }

  bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data_); }
  bool is_bool() const noexcept { return std::holds_alternative<bool>(data_); }
  bool is_int() const noexcept { return std::holds_alternative<std::int64_t>(data_); }
  bool is_float() const noexcept { return std::holds_alternative<double>(data_); }
  bool is_number() const noexcept { return is_int() || is_float(); }
  bool is_string() const noexcept { return std::holds_alternative<string_span>(data_); }
  bool is_array() const noexcept { return std::holds_alternative<array>(data_); }
  bool is_map() const noexcept { return std::holds_alternative<map>(data_); }

  bool as_bool() const { return std::get<bool>(data_); }
  std::int64_t as_int() const { return std::get<std::int64_t>(data_); }
  double as_float() const { return std::get<double>(data_); }

  // Integers widen to double.
  double as_double() const {
    if (const auto* i = std::get_if<std::int64_t>(&data_)) return static_cast<double>(*i);
    return std::get<double>(data_);
  }

  const string_span& as_string() const { return std::get<string_span>(data_); }
  std::string_view as_string_view() const { return as_string().view(); }
  const array& as_array() const { return std::get<array>(data_); }
  const map& as_map() const { return std::get<map>(data_); }

  array& as_array() { return std::get<array>(data_); }
  map& as_map() { return std::get<map>(data_); }

  const value* find(std::string_view key) const noexcept {
    if (const auto* m = std::get_if<map>(&data_)) return m->find(key);
    return nullptr;
  }

  value* find(std::string_view key) noexcept {
    if (auto* m = std::get_if<map>(&data_)) return m->find(key);
    return nullptr;
  }

  // Deep copy that no longer refers to the input buffer.
  value to_owned() const;

  // True if any string or key in the tree is borrowed.
  bool borrows() const noexcept;

private:
  // index: 0 null, 1 bool, 2 integer, 3 floating, 4 string, 5 array, 6 map
  std::variant<std::monostate, bool, std::int64_t, double, string_span, array, map> data_;
};

inline bool operator==(const value& a, const value& b);
inline bool operator!=(const value& a, const value& b) { return !(a == b); }

inline std::size_t map::size() const noexcept { return entries_.size(); }
inline bool map::empty() const noexcept { return entries_.empty(); }
inline void map::reserve(std::size_t n) {
  entries_.reserve(n);
  index_.reserve(n);
}
inline map::iterator map::begin() noexcept { return entries_.begin(); }
inline map::iterator map::end() noexcept { return entries_.end(); }
inline map::const_iterator map::begin() const noexcept { return entries_.begin(); }
inline map::const_iterator map::end() const noexcept { return entries_.end(); }

inline const map::entry* map::lookup(std::string_view key, std::size_t hash) const noexcept {
  const auto range = index_.equal_range(hash);
  for (auto it = range.first; it != range.second; ++it) {
    const entry& kv = entries_[it->second];
    if (kv.first.view() == key) return &kv;
  }
  return nullptr;
}

inline value& map::insert_or_assign(string_span key, value v) {
  const std::size_t h = hash_key(key.view());
  if (const entry* found = lookup(key.view(), h)) {
    value& slot = entries_[static_cast<std::size_t>(found - entries_.data())].second;
    slot = std::move(v);
    return slot;
  }
  entries_.emplace_back(std::move(key), std::move(v));
  try {
    index_.emplace(h, entries_.size() - 1);
  } catch (const std::bad_alloc&) {
    entries_.pop_back();
    throw;
  }
  return entries_.back().second;
}

inline const value* map::find(std::string_view key) const noexcept {
  const entry* kv = lookup(key, hash_key(key));
  return kv ? &kv->second : nullptr;
}

inline value* map::find(std::string_view key) noexcept {
  const entry* kv = lookup(key, hash_key(key));
  return kv ? &entries_[static_cast<std::size_t>(kv - entries_.data())].second : nullptr;
}

inline bool map::contains(std::string_view key) const noexcept { return find(key) != nullptr; }

inline map& map::with(string_span key, value v) & {
  insert_or_assign(std::move(key), std::move(v));
  return *this;
}

inline map&& map::with(string_span key, value v) && {
  insert_or_assign(std::move(key), std::move(v));
  return std::move(*this);
}

inline array& array::with(value v) & {
  push_back(std::move(v));
  return *this;
}

inline array&& array::with(value v) && {
  push_back(std::move(v));
  return std::move(*this);
}

// Order-independent: insertion order is not part of a map's content.
inline bool operator==(const map& a, const map& b) {
  if (a.size() != b.size()) return false;
  for (const auto& kv : a) {
    const value* other = b.find(kv.first.view());
    if (other == nullptr || !(kv.second == *other)) return false;
  }
  return true;
}

inline bool operator!=(const map& a, const map& b) { return !(a == b); }

inline bool operator==(const value& a, const value& b) {
  if (a.type() != b.type()) return false;
  switch (a.type()) {
    case value::kind::null: return true;
    case value::kind::boolean: return a.as_bool() == b.as_bool();
    case value::kind::integer: return a.as_int() == b.as_int();
    case value::kind::floating: return a.as_float() == b.as_float();
    case value::kind::string: return a.as_string() == b.as_string();
    case value::kind::array: return a.as_array() == b.as_array();
    case value::kind::map: return a.as_map() == b.as_map();
  }
  return false;
}

inline value value::to_owned() const {
  switch (type()) {
    case kind::string:
      return value(as_string().to_owned());
    case kind::array: {
      const auto& a = as_array();
      array out;
      out.reserve(a.size());
      for (const auto& e : a) out.emplace_back(e.to_owned());
      return value(std::move(out));
    }
    case kind::map: {
      map out;
      out.reserve(as_map().size());
      for (const auto& kv : as_map()) out.insert_or_assign(kv.first.to_owned(), kv.second.to_owned());
      return value(std::move(out));
    }
    default:
      return *this;
  }
}

inline bool value::borrows() const noexcept {
  switch (type()) {
    case kind::string:
      return as_string().is_borrowed();
    case kind::array:
      for (const auto& e : *std::get_if<array>(&data_)) {
        if (e.borrows()) return true;
      }
      return false;
    case kind::map:
      for (const auto& kv : *std::get_if<map>(&data_)) {
        if (kv.first.is_borrowed() || kv.second.borrows()) return true;
      }
      return false;
    default:
      return false;
  }
}

// -----------------------------
// Token source
// -----------------------------

struct parse_options {
  std::size_t max_depth{256};
  bool require_eof{true};
  // Accept the non-standard literals Infinity, -Infinity and NaN.
  bool allow_inf_nan{false};
};

enum class token_kind { null, true_value, false_value, number, minus, infinity, nan, string, array, object };

struct string_token {
  std::string_view text{};
  // The text is a slice of the input rather than an unescaped copy.
  bool borrowed{false};
};

enum class integer_status { ok, not_integer, too_large };

struct integer_token {
  integer_status status{integer_status::not_integer};
  std::int64_t value{0};
};

// Pull parser over one JSON document. `peek` reports what comes next without
// consuming it; the `known_*` members consume a token the caller has already
// peeked. Unescaped strings are returned as slices of the input; escaped ones
// are decoded into a scratch buffer that stays valid until the next call.
class lexer {
public:
  explicit lexer(std::string_view json, parse_options opt = {}) noexcept
      : s_(json), buf_(json.data()), size_(json.size()), opt_(opt) {}

  std::string_view source() const noexcept { return s_; }
  std::size_t position() const noexcept { return i_; }

  token_kind peek(error& e) {
    detail::skip_ws(buf_, size_, i_);
    if (i_ >= size_) {
      set_error(e, error_code::unexpected_eof);
      return token_kind::null;
    }

    const char c = buf_[i_];
    switch (c) {
      case 'n': return token_kind::null;
      case 't': return token_kind::true_value;
      case 'f': return token_kind::false_value;
      case '"': return token_kind::string;
      case '[': return token_kind::array;
      case '{': return token_kind::object;
      case '-': return resolve_minus(e);
      case 'I':
        if (opt_.allow_inf_nan) return token_kind::infinity;
        break;
      case 'N':
        if (opt_.allow_inf_nan) return token_kind::nan;
        break;
      default:
        if (detail::is_digit(c)) return token_kind::number;
        break;
    }
    set_error(e, error_code::invalid_value);
    return token_kind::null;
  }

  void known_null(error& e) { match_literal("null", 4, e); }

  bool known_bool(token_kind peeked, error& e) {
    if (peeked == token_kind::true_value) {
      match_literal("true", 4, e);
      return true;
    }
    match_literal("false", 5, e);
    return false;
  }

  string_token known_string(error& e) {
    // JSON string: " ... ", disallow raw control chars.
    if (i_ >= size_ || buf_[i_] != '"') {
      set_error(e, error_code::invalid_string);
      return {};
    }
    const std::size_t quote_pos = i_;
    ++i_;
    const std::size_t start = i_;

    // Unescaped: the literal is a slice of the input.
    while (true) {
      detail::skip_plain_string_bytes(buf_, size_, i_);
      if (i_ >= size_) {
        set_error(e, error_code::unexpected_eof, quote_pos);
        return {};
      }
      const char c = buf_[i_];
      if (c == '"') {
        string_token out;
        out.text = std::string_view(buf_ + start, i_ - start);
        out.borrowed = true;
        ++i_;
        return out;
      }
      if (c == '\\') break;
      if (!step_special_byte(e)) return {};
    }

    // Escaped: decode into the scratch buffer.
    scratch_.assign(buf_ + start, i_ - start);
    std::size_t chunk_begin = i_;
    while (true) {
      detail::skip_plain_string_bytes(buf_, size_, i_);
      if (i_ >= size_) {
        set_error(e, error_code::unexpected_eof, quote_pos);
        return {};
      }
      const char c = buf_[i_];
      if (c == '"') {
        if (i_ > chunk_begin) scratch_.append(buf_ + chunk_begin, i_ - chunk_begin);
        ++i_;
        string_token out;
        out.text = scratch_;
        out.borrowed = false;
        return out;
      }
      if (c == '\\') {
        if (i_ > chunk_begin) scratch_.append(buf_ + chunk_begin, i_ - chunk_begin);
        if (!decode_escape(quote_pos, e)) return {};
        chunk_begin = i_;
        continue;
      }
      if (!step_special_byte(e)) return {};
    }
  }

  // Consumes '[' and peeks the first element, or consumes "[]" whole.
  std::optional<token_kind> known_array(error& e) {
    if (i_ >= size_ || buf_[i_] != '[') {
      set_error(e, error_code::invalid_value);
      return std::nullopt;
    }
    ++i_;
    detail::skip_ws(buf_, size_, i_);
    if (i_ < size_ && buf_[i_] == ']') {
      ++i_;
      return std::nullopt;
    }
    const token_kind k = peek(e);
    if (e) return std::nullopt;
    return k;
  }

  std::optional<token_kind> array_step(error& e) {
    detail::skip_ws(buf_, size_, i_);
    if (i_ >= size_) {
      set_error(e, error_code::unexpected_eof);
      return std::nullopt;
    }
    const char c = buf_[i_++];
    if (c == ',') {
      const token_kind k = peek(e);
      if (e) return std::nullopt;
      return k;
    }
    if (c == ']') return std::nullopt;
    set_error(e, error_code::expected_comma_or_end, i_ - 1);
    return std::nullopt;
  }

  // Consumes '{' and the first key with its ':', or consumes "{}" whole.
  std::optional<string_token> known_object(error& e) {
    if (i_ >= size_ || buf_[i_] != '{') {
      set_error(e, error_code::invalid_value);
      return std::nullopt;
    }
    ++i_;
    detail::skip_ws(buf_, size_, i_);
    if (i_ < size_ && buf_[i_] == '}') {
      ++i_;
      return std::nullopt;
    }
    return key(e);
  }

  std::optional<string_token> next_key(error& e) {
    detail::skip_ws(buf_, size_, i_);
    if (i_ >= size_) {
      set_error(e, error_code::unexpected_eof);
      return std::nullopt;
    }
    const char c = buf_[i_++];
    if (c == ',') return key(e);
    if (c == '}') return std::nullopt;
    set_error(e, error_code::expected_comma_or_end, i_ - 1);
    return std::nullopt;
  }

  // Consumes the number only when it is integer-shaped and fits in 64 bits.
  integer_token next_int(error& e) {
    integer_token out;
    detail::skip_ws(buf_, size_, i_);
    if (opt_.allow_inf_nan && at_non_finite_literal()) {
      out.status = integer_status::not_integer;
      return out;
    }

    detail::number_token num;
    std::size_t end = i_;
    if (!detail::scan_number(buf_, size_, end, num)) {
      set_error(e, error_code::invalid_number, i_);
      return out;
    }
    if (!num.is_int) {
      out.status = integer_status::not_integer;
      return out;
    }
    if (!num.fits_int64) {
      out.status = integer_status::too_large;
      return out;
    }
    out.status = integer_status::ok;
    out.value = num.i;
    i_ = end;
    return out;
  }

  double next_float(error& e) {
    detail::skip_ws(buf_, size_, i_);
    if (opt_.allow_inf_nan) {
      double d = 0.0;
      if (consume_non_finite(d)) return d;
    }

    detail::number_token num;
    std::size_t end = i_;
    if (!detail::scan_number(buf_, size_, end, num)) {
      set_error(e, error_code::invalid_number, i_);
      return 0.0;
    }
    const double d = detail::parse_double(num.text);
    // Finite literals like 1e400 overflow to infinity; that is not the number
    // the document wrote.
    if (!std::isfinite(d)) {
      set_error(e, error_code::number_out_of_range, i_);
      return 0.0;
    }
    i_ = end;
    return d;
  }

  // Checks that only whitespace follows the document, when required.
  bool finish(error& e) {
    detail::skip_ws(buf_, size_, i_);
    if (opt_.require_eof && i_ != size_) {
      set_error(e, error_code::trailing_characters);
      return false;
    }
    return true;
  }

private:
  std::string_view s_;
  const char* buf_{nullptr};
  std::size_t size_{0};
  std::size_t i_{0};
  parse_options opt_;
  std::string scratch_;

  void set_error(error& e, error_code code, std::size_t at = std::numeric_limits<std::size_t>::max()) {
    detail::set_error(e, s_, code, (at == std::numeric_limits<std::size_t>::max()) ? i_ : at);
  }

  // A sign is only ever handed out as part of a number.
  token_kind resolve_minus(error& e) {
    if (i_ + 1 < size_) {
      const char next = buf_[i_ + 1];
      if (detail::is_digit(next)) return token_kind::number;
      if (opt_.allow_inf_nan && next == 'I') return token_kind::number;
    }
    set_error(e, error_code::invalid_number);
    return token_kind::null;
  }

  void match_literal(const char* lit, std::size_t len, error& e) {
    if (i_ + len > size_) {
      set_error(e, error_code::unexpected_eof);
      return;
    }
    if (std::memcmp(buf_ + i_, lit, len) != 0) {
      set_error(e, error_code::invalid_value);
      return;
    }
    i_ += len;
  }

  std::optional<string_token> key(error& e) {
    detail::skip_ws(buf_, size_, i_);
    if (i_ >= size_) {
      set_error(e, error_code::unexpected_eof);
      return std::nullopt;
    }
    if (buf_[i_] != '"') {
      set_error(e, error_code::expected_key_string);
      return std::nullopt;
    }
    const string_token k = known_string(e);
    if (e) return std::nullopt;

    detail::skip_ws(buf_, size_, i_);
    if (i_ >= size_) {
      set_error(e, error_code::unexpected_eof);
      return std::nullopt;
    }
    if (buf_[i_] != ':') {
      set_error(e, error_code::expected_colon);
      return std::nullopt;
    }
    ++i_;
    return k;
  }

  // Steps over a control or non-ASCII byte inside a string literal.
  bool step_special_byte(error& e) {
    const unsigned char uc = static_cast<unsigned char>(buf_[i_]);
    if (uc <= 0x1F) {
      set_error(e, error_code::invalid_string, i_);
      return false;
    }
    const std::size_t len = detail::utf8_sequence_length(buf_ + i_, size_ - i_);
    if (len == 0) {
      set_error(e, error_code::invalid_utf8, i_);
      return false;
    }
    i_ += len;
    return true;
  }

  // Decodes the escape at the cursor (which sits on '\\') into scratch_.
  bool decode_escape(std::size_t quote_pos, error& e) {
    ++i_;
    if (i_ >= size_) {
      set_error(e, error_code::unexpected_eof, quote_pos);
      return false;
    }
    const char esc = buf_[i_++];
    switch (esc) {
      case '"': scratch_.push_back('"'); return true;
      case '\\': scratch_.push_back('\\'); return true;
      case '/': scratch_.push_back('/'); return true;
      case 'b': scratch_.push_back('\b'); return true;
      case 'f': scratch_.push_back('\f'); return true;
      case 'n': scratch_.push_back('\n'); return true;
      case 'r': scratch_.push_back('\r'); return true;
      case 't': scratch_.push_back('\t'); return true;
      case 'u': {
        std::uint32_t cp = 0;
        if (!detail::parse_u4(s_, i_, cp)) {
          set_error(e, error_code::invalid_unicode_escape, i_);
          return false;
        }
        if (cp >= 0xD800u && cp <= 0xDBFFu) {
          if (i_ + 2 > size_ || buf_[i_] != '\\' || buf_[i_ + 1] != 'u') {
            set_error(e, error_code::invalid_utf16_surrogate, i_);
            return false;
          }
          i_ += 2;
          std::uint32_t low = 0;
          if (!detail::parse_u4(s_, i_, low)) {
            set_error(e, error_code::invalid_unicode_escape, i_);
            return false;
          }
          if (low < 0xDC00u || low > 0xDFFFu) {
            set_error(e, error_code::invalid_utf16_surrogate, i_);
            return false;
          }
          const std::uint32_t hi = cp - 0xD800u;
          const std::uint32_t lo = low - 0xDC00u;
          cp = 0x10000u + ((hi << 10) | lo);
        } else if (cp >= 0xDC00u && cp <= 0xDFFFu) {
          set_error(e, error_code::invalid_utf16_surrogate, i_);
          return false;
        }
        detail::append_utf8(scratch_, cp);
        return true;
      }
      default:
        set_error(e, error_code::invalid_escape, i_ - 1);
        return false;
    }
  }

  bool at_non_finite_literal() const noexcept {
    if (i_ >= size_) return false;
    const char c = buf_[i_];
    if (c == 'I' || c == 'N') return true;
    return c == '-' && i_ + 1 < size_ && buf_[i_ + 1] == 'I';
  }

  bool consume_non_finite(double& out) noexcept {
    const std::string_view rest = s_.substr(i_);
    if (rest.substr(0, 3) == "NaN") {
      out = std::numeric_limits<double>::quiet_NaN();
      i_ += 3;
      return true;
    }
    if (rest.substr(0, 8) == "Infinity") {
      out = std::numeric_limits<double>::infinity();
      i_ += 8;
      return true;
    }
    if (rest.substr(0, 9) == "-Infinity") {
      out = -std::numeric_limits<double>::infinity();
      i_ += 9;
      return true;
    }
    return false;
  }
};

// -----------------------------
// Value builder
// -----------------------------

// Builds a value tree from any token source with the lexer's interface
// (peek, known_null, known_bool, known_string, known_array, array_step,
// known_object, next_key, next_int, next_float, source, position).
//
// Strings the source reports as slices of its input are borrowed after the
// address range has been checked against source(); everything else is
// copied. On error the result is null and `e` holds the first failure.
template <class Source>
class value_builder {
public:
  explicit value_builder(Source& src, parse_options opt = {}) noexcept : src_(src), opt_(opt) {}

  value build(error& e) {
    const token_kind peeked = src_.peek(e);
    if (e) return nullptr;
    return build(peeked, e);
  }

  value build(token_kind peeked, error& e) {
    value v = build_value(peeked, 0, e);
    if (e) return nullptr;
    return v;
  }

private:
  Source& src_;
  parse_options opt_;

  void fail(error& e, error_code code) { detail::set_error(e, src_.source(), code, src_.position()); }

  string_span make_span(const string_token& t) const {
    if (t.borrowed) return make_string_span(src_.source(), t.text);
    return string_span::owned(std::string(t.text));
  }

  value build_value(token_kind peeked, std::size_t depth, error& e) {
    switch (peeked) {
      case token_kind::null:
        src_.known_null(e);
        return nullptr;
      case token_kind::true_value:
      case token_kind::false_value: {
        const bool b = src_.known_bool(peeked, e);
        if (e) return nullptr;
        return value(b);
      }
      case token_kind::string: {
        const string_token t = src_.known_string(e);
        if (e) return nullptr;
        return value(make_span(t));
      }
      case token_kind::array: return build_array(depth + 1, e);
      case token_kind::object: return build_map(depth + 1, e);
      case token_kind::number: return build_number(e);
      case token_kind::infinity:
      case token_kind::nan: {
        const double d = src_.next_float(e);
        if (e) return nullptr;
        return value::floating(d);
      }
      case token_kind::minus:
        // The source must fold the sign into a number before handing it over.
        fail(e, error_code::unresolved_minus);
        return nullptr;
    }
    fail(e, error_code::unsupported_token);
    return nullptr;
  }

  value build_number(error& e) {
    const integer_token n = src_.next_int(e);
    if (e) return nullptr;
    switch (n.status) {
      case integer_status::ok:
        return value::integer(n.value);
      case integer_status::too_large:
        fail(e, error_code::integer_too_large);
        return nullptr;
      case integer_status::not_integer:
        break;
    }
    const double d = src_.next_float(e);
    if (e) return nullptr;
    return value::floating(d);
  }

  value build_array(std::size_t depth, error& e) {
    if (depth > opt_.max_depth) {
      fail(e, error_code::nesting_too_deep);
      return nullptr;
    }

    value::array a;
    std::optional<token_kind> next = src_.known_array(e);
    if (e) return nullptr;
    while (next) {
      value elem = build_value(*next, depth, e);
      if (e) return nullptr;
      a.emplace_back(std::move(elem));
      next = src_.array_step(e);
      if (e) return nullptr;
    }
    return value(std::move(a));
  }

  value build_map(std::size_t depth, error& e) {
    if (depth > opt_.max_depth) {
      fail(e, error_code::nesting_too_deep);
      return nullptr;
    }

    map m;
    std::optional<string_token> key = src_.known_object(e);
    if (e) return nullptr;
    while (key) {
      // Convert before peeking: an escaped key lives in the source's scratch buffer.
      string_span k = make_span(*key);
      const token_kind peeked = src_.peek(e);
      if (e) return nullptr;
      value v = build_value(peeked, depth, e);
      if (e) return nullptr;
      m.insert_or_assign(std::move(k), std::move(v));
      key = src_.next_key(e);
      if (e) return nullptr;
    }
    return value(std::move(m));
  }
};

template <class Source>
inline value build_value(Source& src, error& e, parse_options opt = {}) {
  value_builder<Source> b(src, opt);
  return b.build(e);
}

template <class Source>
inline value build_value_with_peek(Source& src, token_kind peeked, error& e, parse_options opt = {}) {
  value_builder<Source> b(src, opt);
  return b.build(peeked, e);
}

// -----------------------------
// Entry points
// -----------------------------

struct parse_result {
  value val;
  error err;
};

// Strings in the result may borrow from `json`; keep it alive and unchanged
// for as long as the value is used.
inline parse_result parse(std::string_view json, parse_options opt = {}) {
  parse_result r;
  lexer lex(json, opt);
  r.val = build_value(lex, r.err, opt);
  if (r.err) return r;
  if (!lex.finish(r.err)) r.val = nullptr;
  return r;
}

// Like parse(), but the result owns all of its strings.
inline parse_result parse_owned(std::string_view json, parse_options opt = {}) {
  parse_result r = parse(json, opt);
  if (!r.err) r.val = r.val.to_owned();
  return r;
}

inline value parse_or_throw(std::string_view json, parse_options opt = {}) {
  auto r = parse(json, opt);
  if (r.err) throw parse_error(r.err, json);
  return std::move(r.val);
}

struct document_parse_result;

// Owns the input and the value built from it. The string object itself lives
// on the heap, so moving a document keeps every borrowed string valid even
// when the text fits in the string's inline storage.
class document {
public:
  document() = default;

  explicit document(std::string json) : buffer_(std::make_unique<std::string>(std::move(json))) {}

  document(const document&) = delete;
  document& operator=(const document&) = delete;

  document(document&&) noexcept = default;
  document& operator=(document&&) noexcept = default;

  std::string_view buffer() const noexcept { return buffer_ ? std::string_view(*buffer_) : std::string_view{}; }
  const value& root() const noexcept { return root_; }

  // Drops the value; the buffer stays.
  void clear() noexcept { root_ = nullptr; }

private:
  std::unique_ptr<std::string> buffer_;
  // Declared after the buffer so it is destroyed first.
  value root_;

  friend document_parse_result parse_document(std::string&& json, parse_options opt);
};

struct document_parse_result {
  document doc;
  error err;
};

// Takes over `json` without copying it.
inline document_parse_result parse_document(std::string&& json, parse_options opt = {}) {
  document_parse_result r;
  r.doc = document(std::move(json));

  lexer lex(r.doc.buffer(), opt);
  value root = build_value(lex, r.err, opt);
  if (r.err) return r;
  if (!lex.finish(r.err)) return r;
  r.doc.root_ = std::move(root);
  return r;
}

inline document_parse_result parse_document(std::string_view json, parse_options opt = {}) {
  return parse_document(std::string(json), opt);
}

inline document_parse_result parse_document(const char* json, parse_options opt = {}) {
  return parse_document(std::string_view(json), opt);
}

inline document parse_document_or_throw(std::string&& json, parse_options opt = {}) {
  auto r = parse_document(std::move(json), opt);
  if (r.err) throw parse_error(r.err, r.doc.buffer());
  return std::move(r.doc);
}

inline document parse_document_or_throw(std::string_view json, parse_options opt = {}) {
  return parse_document_or_throw(std::string(json), opt);
}

inline document parse_document_or_throw(const char* json, parse_options opt = {}) {
  return parse_document_or_throw(std::string_view(json), opt);
}

// -----------------------------
// Statistics
// -----------------------------

// Counts borrowed vs owned strings (keys included).
struct span_stats {
  std::size_t borrowed{0};
  std::size_t owned{0};
  std::size_t borrowed_bytes{0};
  std::size_t owned_bytes{0};
};

namespace detail {

inline void count_span(const string_span& s, span_stats& out) noexcept {
  if (s.is_borrowed()) {
    ++out.borrowed;
    out.borrowed_bytes += s.size();
  } else {
    ++out.owned;
    out.owned_bytes += s.size();
  }
}

inline void collect_span_stats(const value& v, span_stats& out) {
  switch (v.type()) {
    case value::kind::string:
      count_span(v.as_string(), out);
      return;
    case value::kind::array:
      for (const auto& e : v.as_array()) collect_span_stats(e, out);
      return;
    case value::kind::map:
      for (const auto& kv : v.as_map()) {
        count_span(kv.first, out);
        collect_span_stats(kv.second, out);
      }
      return;
    default:
      return;
  }
}

} // namespace detail

inline span_stats collect_span_stats(const value& v) {
  span_stats out;
  detail::collect_span_stats(v, out);
  return out;
}

// -----------------------------
// Serializer
// -----------------------------

struct dump_options {
  bool pretty{false};
  // Write non-finite floats as Infinity, -Infinity and NaN instead of throwing.
  bool allow_inf_nan{false};
};

namespace detail {

inline std::size_t find_first_escape(std::string_view s) noexcept {
  const char* p = s.data();
  const std::size_t n = s.size();

  std::size_t i = 0;
#if defined(_M_X64) || defined(__SSE2__)
  const __m128i q = _mm_set1_epi8('"');
  const __m128i bs = _mm_set1_epi8('\\');
  const __m128i k1f = _mm_set1_epi8(0x1F);
  const __m128i zero = _mm_setzero_si128();

  while (i + 16 <= n) {
    const __m128i v = _mm_loadu_si128(reinterpret_cast<const __m128i*>(p + i));
    const __m128i is_q = _mm_cmpeq_epi8(v, q);
    const __m128i is_bs = _mm_cmpeq_epi8(v, bs);
    const __m128i sub = _mm_subs_epu8(v, k1f);
    const __m128i is_ctrl = _mm_cmpeq_epi8(sub, zero);
    const __m128i any = _mm_or_si128(_mm_or_si128(is_q, is_bs), is_ctrl);
    const int mask = _mm_movemask_epi8(any);
    if (mask != 0) {
#if defined(_MSC_VER)
      unsigned long bit = 0;
      _BitScanForward(&bit, static_cast<unsigned long>(mask));
      return i + static_cast<std::size_t>(bit);
#else
      return i + static_cast<std::size_t>(__builtin_ctz(static_cast<unsigned>(mask)));
#endif
    }
    i += 16;
  }
#endif
  for (; i < n; ++i) {
    const unsigned char uc = static_cast<unsigned char>(p[i]);
    const char c = p[i];
    if (c == '"' || c == '\\' || uc <= 0x1F) return i;
  }
  return n;
}

inline void dump_escaped(std::string& out, std::string_view s) {
  static constexpr char hex[] = "0123456789ABCDEF";

  const char* data = s.data();
  const std::size_t n = s.size();
  const std::size_t first = find_first_escape(s);

  out.push_back('"');
  if (first == n) {
    out.append(data, n);
    out.push_back('"');
    return;
  }

  if (first > 0) out.append(data, first);

  std::size_t chunk_begin = first;
  for (std::size_t i = first; i < n; ++i) {
    const unsigned char uc = static_cast<unsigned char>(data[i]);
    const char c = data[i];

    const char* esc = nullptr;
    std::size_t esc_len = 0;

    switch (c) {
      case '"': esc = "\\\""; esc_len = 2; break;
      case '\\': esc = "\\\\"; esc_len = 2; break;
      case '\b': esc = "\\b"; esc_len = 2; break;
      case '\f': esc = "\\f"; esc_len = 2; break;
      case '\n': esc = "\\n"; esc_len = 2; break;
      case '\r': esc = "\\r"; esc_len = 2; break;
      case '\t': esc = "\\t"; esc_len = 2; break;
      default: break;
    }

    if (esc != nullptr) {
      if (i > chunk_begin) out.append(data + chunk_begin, i - chunk_begin);
      out.append(esc, esc_len);
      chunk_begin = i + 1;
      continue;
    }

    if (uc <= 0x1F) {
      if (i > chunk_begin) out.append(data + chunk_begin, i - chunk_begin);
      out.append("\\u00", 4);
      out.push_back(hex[(uc >> 4) & 0xF]);
      out.push_back(hex[uc & 0xF]);
      chunk_begin = i + 1;
      continue;
    }
  }

  if (n > chunk_begin) out.append(data + chunk_begin, n - chunk_begin);
  out.push_back('"');
}

inline void dump_int64(std::string& out, std::int64_t v) {
  char buf[32];
  auto r = std::to_chars(buf, buf + sizeof(buf), v);
  if (r.ec != std::errc{}) {
    throw std::runtime_error("cowjson: failed to format integer");
  }
  out.append(buf, static_cast<std::size_t>(r.ptr - buf));
}

// Floats always keep a '.' or an exponent so they parse back as floats.
inline void dump_double(std::string& out, double d, bool allow_inf_nan) {
  if (!std::isfinite(d)) {
    if (!allow_inf_nan) throw std::runtime_error("cowjson: cannot dump NaN/Inf as JSON number");
    if (std::isnan(d)) out.append("NaN", 3);
    else if (d < 0) out.append("-Infinity", 9);
    else out.append("Infinity", 8);
    return;
  }

  const std::size_t mark = out.size();
  char buf[64];
  auto r = std::to_chars(buf, buf + sizeof(buf), d, std::chars_format::general);
  if (r.ec == std::errc{}) {
    out.append(buf, static_cast<std::size_t>(r.ptr - buf));
  } else {
    const int n = std::snprintf(buf, sizeof(buf), "%.17g", d);
    if (n <= 0 || static_cast<std::size_t>(n) >= sizeof(buf)) {
      throw std::runtime_error("cowjson: failed to format double");
    }
    out.append(buf, static_cast<std::size_t>(n));
  }

  if (out.find_first_of(".eE", mark) == std::string::npos) out.append(".0", 2);
}

inline void dump_indent(std::string& out, int indent) {
  out.append(static_cast<std::size_t>(indent), ' ');
}

inline void dump_scalar(std::string& out, const value& v, bool allow_inf_nan) {
  switch (v.type()) {
    case value::kind::null: out.append("null", 4); return;
    case value::kind::boolean:
      if (v.as_bool()) out.append("true", 4);
      else out.append("false", 5);
      return;
    case value::kind::integer: dump_int64(out, v.as_int()); return;
    case value::kind::floating: dump_double(out, v.as_float(), allow_inf_nan); return;
    case value::kind::string: dump_escaped(out, v.as_string_view()); return;
    default: return;
  }
}

inline void dump_pretty(std::string& out, const value& v, int indent, bool allow_inf_nan) {
  switch (v.type()) {
    case value::kind::array: {
      const auto& a = v.as_array();
      out.push_back('[');
      if (!a.empty()) out.push_back('\n');
      for (std::size_t idx = 0; idx < a.size(); ++idx) {
        dump_indent(out, indent + 2);
        dump_pretty(out, a[idx], indent + 2, allow_inf_nan);
        if (idx + 1 != a.size()) out.push_back(',');
        out.push_back('\n');
      }
      if (!a.empty()) dump_indent(out, indent);
      out.push_back(']');
      return;
    }
    case value::kind::map: {
      const auto& m = v.as_map();
      out.push_back('{');
      if (!m.empty()) out.push_back('\n');
      std::size_t idx = 0;
      for (const auto& kv : m) {
        dump_indent(out, indent + 2);
        dump_escaped(out, kv.first.view());
        out.append(": ", 2);
        dump_pretty(out, kv.second, indent + 2, allow_inf_nan);
        if (++idx != m.size()) out.push_back(',');
        out.push_back('\n');
      }
      if (!m.empty()) dump_indent(out, indent);
      out.push_back('}');
      return;
    }
    default:
      dump_scalar(out, v, allow_inf_nan);
      return;
  }
}

} // namespace detail

inline void dump_to(std::string& out, const value& v, const dump_options& opt) {
  if (opt.pretty) {
    detail::dump_pretty(out, v, 0, opt.allow_inf_nan);
    return;
  }

  // Non-recursive traversal; `idx` is the next child to emit.
  struct frame {
    const value* v{nullptr};
    std::size_t idx{0};
  };
  std::vector<frame> stack;
  stack.reserve(32);
  stack.push_back(frame{&v, 0});

  while (!stack.empty()) {
    frame& f = stack.back();
    const value& cur = *f.v;

    switch (cur.type()) {
      case value::kind::array: {
        const auto& a = cur.as_array();
        if (f.idx == 0) out.push_back('[');
        if (f.idx == a.size()) {
          out.push_back(']');
          stack.pop_back();
          break;
        }
        if (f.idx > 0) out.push_back(',');
        const value* child = &a[f.idx++];
        stack.push_back(frame{child, 0});
        break;
      }
      case value::kind::map: {
        const auto& m = cur.as_map();
        if (f.idx == 0) out.push_back('{');
        if (f.idx == m.size()) {
          out.push_back('}');
          stack.pop_back();
          break;
        }
        if (f.idx > 0) out.push_back(',');
        const auto& kv = *(m.begin() + static_cast<std::ptrdiff_t>(f.idx++));
        detail::dump_escaped(out, kv.first.view());
        out.push_back(':');
        stack.push_back(frame{&kv.second, 0});
        break;
      }
      default:
        detail::dump_scalar(out, cur, opt.allow_inf_nan);
        stack.pop_back();
        break;
    }
  }
}

inline void dump_to(std::string& out, const value& v, bool pretty = false) {
  dump_options opt;
  opt.pretty = pretty;
  dump_to(out, v, opt);
}

inline std::string dump(const value& v, const dump_options& opt) {
  struct dump_reserve_hints {
    std::size_t compact{256};
    std::size_t pretty{256};
  };
  thread_local dump_reserve_hints hints;

  std::string out;
  std::size_t& hint = opt.pretty ? hints.pretty : hints.compact;
  out.reserve(hint);
  dump_to(out, v, opt);

  constexpr std::size_t min_hint = 256;
  constexpr std::size_t max_hint = 16u * 1024u * 1024u;
  const std::size_t sz = out.size();
  hint = (sz < min_hint) ? min_hint : (sz > max_hint ? max_hint : sz);
  return out;
}

inline std::string dump(const value& v, bool pretty = false) {
  dump_options opt;
  opt.pretty = pretty;
  return dump(v, opt);
}

} // namespace cowjson

template <>
struct std::hash<cowjson::string_span> {
  std::size_t operator()(const cowjson::string_span& s) const noexcept {
    return std::hash<std::string_view>{}(s.view());
  }
};
