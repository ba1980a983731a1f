#include "test_common.hpp"

#include <string>
#include <unordered_set>
#include <utility>

using namespace cowjson;

static void test_span_borrows_inside_source() {
  const std::string src = R"({"name":"value"})";
  const std::string_view whole(src);

  const string_span s = make_string_span(whole, whole.substr(9, 5));
  COWJSON_CHECK(s.is_borrowed());
  COWJSON_CHECK(s == "value");
  COWJSON_CHECK(s.data() == src.data() + 9);

  // The whole buffer is still inside itself.
  COWJSON_CHECK(make_string_span(whole, whole).is_borrowed());
  // Empty slice at the end boundary.
  COWJSON_CHECK(make_string_span(whole, whole.substr(whole.size())).is_borrowed());
}

static void test_span_copies_outside_source() {
  const std::string src = "abcdef";
  const std::string other = "abcdef";

  // Same content, different storage.
  const string_span s = make_string_span(src, other);
  COWJSON_CHECK(s.is_owned());
  COWJSON_CHECK(s == "abcdef");
  COWJSON_CHECK(s.data() != other.data());

  // Starts inside, runs past the end.
  const std::string_view straddle(src.data() + 3, 4);
  COWJSON_CHECK(make_string_span(std::string_view(src.data(), 6), straddle).is_owned());

  // Starts before the source.
  const std::string_view tail(src.data() + 2, 4);
  COWJSON_CHECK(make_string_span(tail, std::string_view(src.data() + 1, 2)).is_owned());
}

static void test_span_equality_ignores_variant() {
  const std::string src = "key";
  const string_span b = string_span::borrowed(src);
  const string_span o = string_span::owned("key");
  COWJSON_CHECK(b.is_borrowed());
  COWJSON_CHECK(o.is_owned());
  COWJSON_CHECK(b == o);
  COWJSON_CHECK(!(b != o));
  COWJSON_CHECK(b == std::string_view("key"));
  COWJSON_CHECK(std::string_view("key") == o);
  COWJSON_CHECK(string_span::owned("a") < string_span::borrowed("b"));

  std::unordered_set<string_span> set;
  set.insert(b);
  COWJSON_CHECK(set.count(o) == 1);

  const string_span copy = b.to_owned();
  COWJSON_CHECK(copy.is_owned());
  COWJSON_CHECK(copy == b);
  COWJSON_CHECK(copy.data() != src.data());

  // Implicit construction always copies.
  const string_span implicit = std::string("x");
  COWJSON_CHECK(implicit.is_owned());
  COWJSON_CHECK(string_span().empty());
}

static void test_value_kinds() {
  COWJSON_CHECK(value().is_null());
  COWJSON_CHECK(value(nullptr).type() == value::kind::null);
  COWJSON_CHECK(value(true).as_bool());
  COWJSON_CHECK(value("s").is_string());
  COWJSON_CHECK(value::integer(42).is_int());
  COWJSON_CHECK(value::integer(42).as_double() == 42.0);
  COWJSON_CHECK(value::floating(42.0).is_float());
  COWJSON_CHECK(value::floating(42.0).is_number());
  COWJSON_CHECK(value(value::array{}).is_array());
  COWJSON_CHECK(value(map{}).is_map());

  // 42 and 42.0 are different values.
  COWJSON_CHECK(value::integer(42) != value::floating(42.0));

  COWJSON_EXPECT_THROW(std::bad_variant_access, value::integer(1).as_float());
  COWJSON_EXPECT_THROW(std::bad_variant_access, value("x").as_map());
  COWJSON_CHECK(value::integer(1).find("a") == nullptr);
}

static void test_map_last_write_wins() {
  map m;
  m.insert_or_assign("a", value::integer(1));
  m.insert_or_assign("b", value::integer(2));
  m.insert_or_assign("a", value::integer(3));

  COWJSON_CHECK(m.size() == 2);
  COWJSON_CHECK(m.contains("a"));
  COWJSON_CHECK(!m.contains("c"));
  COWJSON_CHECK(m.find("a")->as_int() == 3);

  // The overwritten key keeps its first position.
  auto it = m.begin();
  COWJSON_CHECK(it->first == "a");
  ++it;
  COWJSON_CHECK(it->first == "b");
}

static void test_map_lookup_survives_growth_and_copy() {
  // Short owned keys live inside their string objects and move when the
  // entries grow.
  map m;
  for (int i = 0; i < 1000; ++i) m.insert_or_assign(std::to_string(i), value::integer(i));
  m.insert_or_assign("500", value::integer(-500));
  COWJSON_CHECK(m.size() == 1000);
  for (int i = 0; i < 1000; ++i) {
    const value* v = m.find(std::to_string(i));
    COWJSON_CHECK(v && v->as_int() == (i == 500 ? -500 : i));
  }

  const map copy = m;
  COWJSON_CHECK(copy.find("999") && copy.find("999")->as_int() == 999);
  COWJSON_CHECK(copy == m);

  map moved = std::move(m);
  moved.insert_or_assign("0", value::integer(7));
  COWJSON_CHECK(moved.find("0")->as_int() == 7);
  COWJSON_CHECK(moved.size() == 1000);
  COWJSON_CHECK(moved != copy);
}

static void test_array_with_chains() {
  const value v = value::array().with(value::integer(1)).with("two").with(value::array().with(nullptr));
  const auto& a = v.as_array();
  COWJSON_CHECK(a.size() == 3);
  COWJSON_CHECK(a[0].as_int() == 1);
  COWJSON_CHECK(a[1].as_string_view() == "two");
  COWJSON_CHECK(a[2].as_array().size() == 1 && a[2].as_array()[0].is_null());

  value::array b;
  b.with(value::integer(1)).with(value::integer(2));
  COWJSON_CHECK(b.size() == 2 && b[1].as_int() == 2);
}

static void test_map_equality_ignores_order() {
  const value a = map().with("x", value::integer(1)).with("y", true);
  const value b = map().with("y", true).with("x", value::integer(1));
  const value c = map().with("x", value::integer(1));
  const value d = map().with("x", value::integer(1)).with("z", true);

  COWJSON_CHECK(a == b);
  COWJSON_CHECK(a != c);
  COWJSON_CHECK(a != d);
}

static void test_to_owned_and_borrows() {
  const std::string src = R"(["k","v"])";
  const std::string_view sv(src);

  map inner;
  inner.insert_or_assign(string_span::borrowed(sv.substr(2, 1)), value(string_span::borrowed(sv.substr(6, 1))));
  value::array arr;
  arr.emplace_back(std::move(inner));
  arr.emplace_back(value::integer(7));
  const value v(std::move(arr));

  COWJSON_CHECK(v.borrows());
  const span_stats before = collect_span_stats(v);
  COWJSON_CHECK(before.borrowed == 2);
  COWJSON_CHECK(before.owned == 0);
  COWJSON_CHECK(before.borrowed_bytes == 2);

  const value owned = v.to_owned();
  COWJSON_CHECK(!owned.borrows());
  COWJSON_CHECK(owned == v);
  const span_stats after = collect_span_stats(owned);
  COWJSON_CHECK(after.borrowed == 0);
  COWJSON_CHECK(after.owned == 2);
  COWJSON_CHECK(after.owned_bytes == 2);

  COWJSON_CHECK(!value::integer(1).borrows());
}

void test_values() {
  test_span_borrows_inside_source();
  test_span_copies_outside_source();
  test_span_equality_ignores_variant();
  test_value_kinds();
  test_map_last_write_wins();
  test_map_lookup_survives_growth_and_copy();
  test_array_with_chains();
  test_map_equality_ignores_order();
  test_to_owned_and_borrows();
}
