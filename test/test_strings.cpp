#include "test_common.hpp"

#include <string>
#include <string_view>

using namespace cowjson;

static void test_plain_strings_are_borrowed() {
  const std::string json = R"({"key":"plain","list":["a","bc",""]})";
  auto r = parse(json);
  COWJSON_CHECK(!r.err);

  for (const auto& kv : r.val.as_map()) {
    COWJSON_CHECK(kv.first.is_borrowed());
    COWJSON_CHECK(cowjson_test::points_into(json, kv.first.view()));
  }

  const value* s = r.val.find("key");
  COWJSON_CHECK(s && s->as_string().is_borrowed());
  COWJSON_CHECK(s->as_string_view() == "plain");
  COWJSON_CHECK(s->as_string().data() == json.data() + json.find("plain"));

  for (const auto& e : r.val.find("list")->as_array()) {
    COWJSON_CHECK(e.as_string().is_borrowed());
    COWJSON_CHECK(cowjson_test::points_into(json, e.as_string_view()));
  }
}

static void test_escaped_strings_are_owned() {
  const std::string json = R"({"k\"q":"line\nbreak","plain":"x"})";
  auto r = parse(json);
  COWJSON_CHECK(!r.err);

  const value* esc = r.val.find("k\"q");
  COWJSON_CHECK(esc != nullptr);
  COWJSON_CHECK(esc->as_string().is_owned());
  COWJSON_CHECK(esc->as_string_view() == "line\nbreak");
  COWJSON_CHECK(!cowjson_test::points_into(json, esc->as_string_view()));

  const auto it = r.val.as_map().begin();
  COWJSON_CHECK(it->first.is_owned());
  COWJSON_CHECK(it->first == "k\"q");

  // Unrelated plain strings in the same document still borrow.
  COWJSON_CHECK(r.val.find("plain")->as_string().is_borrowed());
}

static void test_escape_sequences() {
  auto r = parse("\"\\\"\\\\\\/\\b\\f\\n\\r\\t\"");
  COWJSON_CHECK(!r.err);
  COWJSON_CHECK(r.val.is_string());
  COWJSON_CHECK(r.val.as_string_view() == std::string_view("\"\\/\b\f\n\r\t"));
}

static void test_unicode_escapes_and_surrogates() {
  {
    auto r = parse("\"\\u4F60\\u597D\"");
    COWJSON_CHECK(!r.err);
    COWJSON_CHECK(r.val.as_string_view() == "\xE4\xBD\xA0\xE5\xA5\xBD");
  }
  {
    auto r = parse("\"\\uD83D\\uDE03\"");
    COWJSON_CHECK(!r.err);
    COWJSON_CHECK(r.val.as_string_view() == "\xF0\x9F\x98\x83");
  }
  {
    auto r = parse("\"\\u00e9\"");
    COWJSON_CHECK(!r.err);
    COWJSON_CHECK(r.val.as_string_view() == "\xC3\xA9");
  }
}

static void test_invalid_string_escapes() {
  {
    auto r = parse("\"\\v\"");
    cowjson_test::check_err(r.err, error_code::invalid_escape, error_category::lexical);
  }
  {
    auto r = parse("\"\\u12G4\"");
    cowjson_test::check_err(r.err, error_code::invalid_unicode_escape);
  }
  {
    auto r = parse("\"\\uD800\"");
    cowjson_test::check_err(r.err, error_code::invalid_utf16_surrogate);
  }
  {
    auto r = parse("\"\\uD800\\u0041\"");
    cowjson_test::check_err(r.err, error_code::invalid_utf16_surrogate);
  }
  {
    auto r = parse("\"\\uDE03\"");
    cowjson_test::check_err(r.err, error_code::invalid_utf16_surrogate);
  }
}

static void test_unescaped_control_character_rejected() {
  // newline inside JSON string literal is invalid JSON
  auto r = parse("\"a\n\"");
  cowjson_test::check_err(r.err, error_code::invalid_string);
  COWJSON_CHECK(r.val.is_null());
}

static void test_invalid_utf8_rejected() {
  const char* bad[] = {
      "\"\xC0\xAF\"",         // overlong '/'
      "\"\xED\xA0\x80\"",     // encoded surrogate
      "\"\xF4\x90\x80\x80\"", // above U+10FFFF
      "\"\xE4\xBD\"",         // truncated
      "\"\x80\"",             // stray continuation byte
  };
  for (const char* s : bad) {
    auto r = parse(s);
    cowjson_test::check_err(r.err, error_code::invalid_utf8);
  }

  auto ok = parse("\"\xF0\x9F\x98\x83 ok\"");
  COWJSON_CHECK(!ok.err);
  COWJSON_CHECK(ok.val.as_string().is_borrowed());
}

static void test_unterminated_string() {
  auto r = parse("\"unterminated");
  cowjson_test::check_err(r.err, error_code::unexpected_eof);
  // Reported at the opening quote.
  COWJSON_CHECK(r.err.offset == 0);
}

static void test_dump_escapes_and_roundtrip() {
  value v(std::string("x\n\"y\\z\x01"));
  const std::string s = dump(v);
  COWJSON_CHECK(s == "\"x\\n\\\"y\\\\z\\u0001\"");
  auto r = parse(s);
  COWJSON_CHECK(!r.err);
  COWJSON_CHECK(r.val == v);
  COWJSON_CHECK(r.val.as_string().is_owned());
}

void test_strings() {
  test_plain_strings_are_borrowed();
  test_escaped_strings_are_owned();
  test_escape_sequences();
  test_unicode_escapes_and_surrogates();
  test_invalid_string_escapes();
  test_unescaped_control_character_rejected();
  test_invalid_utf8_rejected();
  test_unterminated_string();
  test_dump_escapes_and_roundtrip();
}
