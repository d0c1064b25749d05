#include <iostream>
#include <stdexcept>
#include <string>

#include "starlane/util/json.h"

#define SL_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

static std::string parse_error_message(const std::string& text) {
  try {
    (void)starlane::json::parse(text);
  } catch (const std::runtime_error& e) {
    return std::string(e.what());
  }
  return {};
}

int test_json() {
  using namespace starlane;

  // Error positions.
  {
    const std::string msg = parse_error_message("[\n  1,\n  ,\n  2\n]\n");
    SL_ASSERT(msg.find("line 3, col 3") != std::string::npos);
    SL_ASSERT(msg.find("unexpected") != std::string::npos);
  }
  {
    const std::string msg = parse_error_message("{\n  \"a\": 1,\n  \"b\": 2\n");
    SL_ASSERT(msg.find("line 4") != std::string::npos);
    SL_ASSERT(msg.find("expected") != std::string::npos);
  }
  SL_ASSERT(!parse_error_message("{} x").empty());
  SL_ASSERT(!parse_error_message("\"unterminated").empty());
  SL_ASSERT(!parse_error_message("[tru]").empty());

  // UTF-8 BOM is tolerated.
  {
    const json::Value v = json::parse("\xEF\xBB\xBF{\"k\": 3}");
    SL_ASSERT(v.at("k").int_value() == 3);
  }

  // Escapes, including a surrogate pair.
  {
    const json::Value v = json::parse(R"(["a\nb", "\u00e9", "\ud83d\ude80"])");
    const json::Array& a = v.array();
    SL_ASSERT(a.size() == 3);
    SL_ASSERT(a[0].string_value() == "a\nb");
    SL_ASSERT(a[1].string_value() == "\xC3\xA9");
    SL_ASSERT(a[2].string_value() == "\xF0\x9F\x9A\x80");
    SL_ASSERT(!parse_error_message(R"(["\udc00"])").empty());
  }

  // Output is stable: sorted keys, integral numbers without a fraction.
  {
    json::Object o;
    o["zeta"] = 1.0;
    o["alpha"] = json::Array{true, nullptr, 2.5};
    o["mid"] = std::string("x\"y");
    const std::string compact = json::stringify(o, 0);
    SL_ASSERT(compact == R"({"alpha":[true,null,2.5],"mid":"x\"y","zeta":1})");

    const json::Value back = json::parse(json::stringify(o, 2));
    SL_ASSERT(back.at("zeta").number_value() == 1.0);
    SL_ASSERT(back.at("alpha").array().size() == 3);
  }

  // Typed accessors.
  {
    const json::Value v = json::parse(R"({"n": 4, "s": "str", "b": false})");
    SL_ASSERT(v.at("n").is_number());
    SL_ASSERT(v.at("s").string_value() == "str");
    SL_ASSERT(v.at("b").bool_value(true) == false);
    SL_ASSERT(v.at("s").number_value(-1.0) == -1.0);

    bool threw = false;
    try {
      (void)v.at("missing");
    } catch (const std::runtime_error&) {
      threw = true;
    }
    SL_ASSERT(threw);
  }

  return 0;
}
