#include <doctest/doctest.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "kitten/response.hpp"

namespace kitten = xpto::kitten;

using kitten::response_list;
using kitten::response_map;
using kitten::response_value;

TEST_CASE("response-map-keeps-insertion-order") {
  response_map m;
  m["key.offset"] = std::int64_t{1};
  m["key.kind"] = "k";
  m["key.length"] = std::int64_t{2};

  CHECK(m.keys() == std::vector<std::string>{"key.offset", "key.kind", "key.length"});

  // Reassigning keeps the position
  m.insert_or_assign("key.offset", std::int64_t{9});
  CHECK(m.keys() == std::vector<std::string>{"key.offset", "key.kind", "key.length"});
  CHECK(*m.at("key.offset").if_int64() == 9);
  CHECK(m.size() == 3);
}

TEST_CASE("response-map-unique-keys") {
  response_map m{{"a", std::int64_t{1}}, {"b", std::int64_t{2}}, {"a", std::int64_t{3}}};
  CHECK(m.size() == 2);
  CHECK(*m.at("a").if_int64() == 3);
  CHECK(m.keys() == std::vector<std::string>{"a", "b"});
}

TEST_CASE("response-map-lookup-and-erase") {
  response_map m{{"a", true}};

  CHECK(m.contains("a"));
  CHECK_FALSE(m.contains("b"));
  CHECK(m.find("b") == nullptr);
  CHECK_THROWS_AS(m.at("b"), std::out_of_range);

  CHECK(m.erase("a"));
  CHECK_FALSE(m.erase("a"));
  CHECK(m.empty());

  // operator[] inserts a null
  CHECK(m["c"].is_null());
  CHECK(m.size() == 1);
}

TEST_CASE("response-value-alternatives") {
  response_value v;
  CHECK(v.is_null());
  CHECK(kitten::kind_name(v) == "null");

  v = std::uint64_t{4'300'000'001};
  CHECK(v.if_int64() == nullptr);
  REQUIRE(v.if_uint64() != nullptr);
  CHECK(kitten::kind_name(v) == "uint64");

  v = "text";
  REQUIRE(v.if_string() != nullptr);
  CHECK(*v.if_string() == "text");
  CHECK(v.if_bool() == nullptr);

  v = kitten::response_bytes{0, 1};
  CHECK(kitten::kind_name(v) == "bytes");

  v = response_list{response_map{{"x", 0.5}}};
  CHECK(kitten::kind_name(v) == "list");
  CHECK(*(*v.if_list())[0].if_map()->at("x").if_double() == doctest::Approx(0.5));
}

TEST_CASE("response-equality-is-deep-and-ordered") {
  response_map a{{"x", std::int64_t{1}}, {"y", response_list{true}}};
  response_map b{{"x", std::int64_t{1}}, {"y", response_list{true}}};
  response_map c{{"y", response_list{true}}, {"x", std::int64_t{1}}};

  CHECK(a == b);
  CHECK_FALSE(a == c);
  CHECK_FALSE(response_value{std::int64_t{1}} == response_value{std::uint64_t{1}});
}
