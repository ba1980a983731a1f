#include "test_common.hpp"

#include <optional>
#include <string>
#include <vector>

using namespace cowjson;

namespace {

// Token source that replays a fixed script, so the builder can be driven
// through states the lexer never produces.
struct scripted_source {
  std::string_view input;
  std::vector<std::optional<token_kind>> kinds;
  std::vector<std::optional<string_token>> strings;
  std::vector<integer_token> ints;
  std::vector<double> floats;

  std::size_t kind_pos{0};
  std::size_t string_pos{0};
  std::size_t int_pos{0};
  std::size_t float_pos{0};

  std::string_view source() const noexcept { return input; }
  std::size_t position() const noexcept { return kind_pos; }

  std::optional<token_kind> take_kind() {
    if (kind_pos >= kinds.size()) cowjson_test::fail("kind script exhausted", __FILE__, __LINE__);
    return kinds[kind_pos++];
  }

  std::optional<string_token> take_string() {
    if (string_pos >= strings.size()) cowjson_test::fail("string script exhausted", __FILE__, __LINE__);
    return strings[string_pos++];
  }

  token_kind peek(error&) { return *take_kind(); }
  void known_null(error&) {}
  bool known_bool(token_kind peeked, error&) { return peeked == token_kind::true_value; }
  string_token known_string(error&) { return *take_string(); }
  std::optional<token_kind> known_array(error&) { return take_kind(); }
  std::optional<token_kind> array_step(error&) { return take_kind(); }
  std::optional<string_token> known_object(error&) { return take_string(); }
  std::optional<string_token> next_key(error&) { return take_string(); }

  integer_token next_int(error&) {
    if (int_pos >= ints.size()) cowjson_test::fail("int script exhausted", __FILE__, __LINE__);
    return ints[int_pos++];
  }

  double next_float(error&) {
    if (float_pos >= floats.size()) cowjson_test::fail("float script exhausted", __FILE__, __LINE__);
    return floats[float_pos++];
  }
};

integer_token int_token(integer_status status, std::int64_t v = 0) {
  integer_token t;
  t.status = status;
  t.value = v;
  return t;
}

} // namespace

static void test_minus_is_structural_defect() {
  scripted_source src;
  src.input = "-1";
  src.kinds = {token_kind::minus};

  error e;
  const value v = build_value(src, e);
  cowjson_test::check_err(e, error_code::unresolved_minus, error_category::structural_defect);
  COWJSON_CHECK(v.is_null());
}

static void test_minus_inside_array_aborts_build() {
  scripted_source src;
  src.input = "[1,-2]";
  src.kinds = {token_kind::array, token_kind::number, token_kind::minus};
  src.ints = {int_token(integer_status::ok, 1)};

  error e;
  const value v = build_value(src, e);
  cowjson_test::check_err(e, error_code::unresolved_minus);
  // No partial tree.
  COWJSON_CHECK(v.is_null());
}

static void test_unknown_kind_is_unsupported() {
  scripted_source src;
  src.input = "?";
  src.kinds = {static_cast<token_kind>(42)};

  error e;
  const value v = build_value(src, e);
  cowjson_test::check_err(e, error_code::unsupported_token, error_category::unsupported_shape);
  COWJSON_CHECK(v.is_null());
}

static void test_integer_overflow_is_unsupported() {
  scripted_source src;
  src.input = "18446744073709551616";
  src.kinds = {token_kind::number};
  src.ints = {int_token(integer_status::too_large)};

  error e;
  const value v = build_value(src, e);
  cowjson_test::check_err(e, error_code::integer_too_large, error_category::unsupported_shape);
  COWJSON_CHECK(v.is_null());
  // Never silently converted.
  COWJSON_CHECK(src.float_pos == 0);
}

static void test_number_falls_back_to_float() {
  scripted_source src;
  src.input = "[42,42.0]";
  src.kinds = {token_kind::array, token_kind::number, token_kind::number, std::nullopt};
  src.ints = {int_token(integer_status::ok, 42), int_token(integer_status::not_integer)};
  src.floats = {42.0};

  error e;
  const value v = build_value(src, e);
  COWJSON_CHECK(!e);
  const auto& a = v.as_array();
  COWJSON_CHECK(a.size() == 2);
  COWJSON_CHECK(a[0].is_int() && a[0].as_int() == 42);
  COWJSON_CHECK(a[1].is_float() && a[1].as_float() == 42.0);
}

static void test_borrow_needs_flag_and_range() {
  const std::string input = R"(["inside","flagless"])";
  const std::string elsewhere = "inside";
  const std::string_view in(input);

  string_token inside;
  inside.text = in.substr(2, 6);
  inside.borrowed = true;

  // Claims to be a slice but lives in another buffer.
  string_token liar;
  liar.text = elsewhere;
  liar.borrowed = true;

  // Lies inside the input but the source did not vouch for it.
  string_token flagless;
  flagless.text = in.substr(11, 8);
  flagless.borrowed = false;

  scripted_source src;
  src.input = in;
  src.kinds = {token_kind::array, token_kind::string, token_kind::string, token_kind::string, std::nullopt};
  src.strings = {inside, liar, flagless};

  error e;
  const value v = build_value(src, e);
  COWJSON_CHECK(!e);
  const auto& a = v.as_array();
  COWJSON_CHECK(a.size() == 3);

  COWJSON_CHECK(a[0].as_string().is_borrowed());
  COWJSON_CHECK(a[0].as_string().data() == input.data() + 2);

  COWJSON_CHECK(a[1].as_string().is_owned());
  COWJSON_CHECK(a[1].as_string() == "inside");
  COWJSON_CHECK(a[1].as_string().data() != elsewhere.data());

  COWJSON_CHECK(a[2].as_string().is_owned());
  COWJSON_CHECK(a[2].as_string() == "flagless");
}

static void test_map_keys_last_write_wins() {
  const std::string input = R"({"k":1,"k":2})";
  const std::string_view in(input);

  string_token k1;
  k1.text = in.substr(2, 1);
  k1.borrowed = true;
  string_token k2;
  k2.text = in.substr(8, 1);
  k2.borrowed = true;

  scripted_source src;
  src.input = in;
  src.kinds = {token_kind::object, token_kind::number, token_kind::number};
  src.strings = {k1, k2, std::nullopt};
  src.ints = {int_token(integer_status::ok, 1), int_token(integer_status::ok, 2)};

  error e;
  const value v = build_value(src, e);
  COWJSON_CHECK(!e);
  COWJSON_CHECK(v.as_map().size() == 1);
  COWJSON_CHECK(v.find("k")->as_int() == 2);
  COWJSON_CHECK(v.as_map().begin()->first.is_borrowed());
}

static void test_build_with_peek_on_lexer() {
  const std::string json = R"({"a":[true,null,"x"]})";
  error e;
  lexer lex(json);
  const token_kind k = lex.peek(e);
  COWJSON_CHECK(k == token_kind::object);

  const value v = build_value_with_peek(lex, k, e);
  COWJSON_CHECK(!e);
  COWJSON_CHECK(lex.finish(e));

  const value* a = v.find("a");
  COWJSON_CHECK(a && a->as_array().size() == 3);
  COWJSON_CHECK(a->as_array()[0].as_bool());
  COWJSON_CHECK(a->as_array()[1].is_null());
  COWJSON_CHECK(a->as_array()[2].as_string().is_borrowed());
}

static void test_depth_limit_on_builder() {
  parse_options opt;
  opt.max_depth = 2;

  {
    error e;
    lexer lex("[[1]]", opt);
    value_builder<lexer> b(lex, opt);
    const value v = b.build(e);
    COWJSON_CHECK(!e);
    COWJSON_CHECK(v.as_array()[0].as_array()[0].as_int() == 1);
  }
  {
    error e;
    lexer lex("[[[1]]]", opt);
    value_builder<lexer> b(lex, opt);
    const value v = b.build(e);
    cowjson_test::check_err(e, error_code::nesting_too_deep, error_category::limit);
    COWJSON_CHECK(v.is_null());
    COWJSON_CHECK(e.offset == 2);
  }
}

void test_builder() {
  test_minus_is_structural_defect();
  test_minus_inside_array_aborts_build();
  test_unknown_kind_is_unsupported();
  test_integer_overflow_is_unsupported();
  test_number_falls_back_to_float();
  test_borrow_needs_flag_and_range();
  test_map_keys_last_write_wins();
  test_build_with_peek_on_lexer();
  test_depth_limit_on_builder();
}
