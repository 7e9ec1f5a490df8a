#include <catch2/catch.hpp>
#include "ordered_map.hpp"
#include <string>
#include <utility>
#include <vector>

using namespace switchyard;

TEST_CASE("OrderedMap: iterates in first-insertion order", "[ordered_map]") {
    OrderedMap<std::string, int> m;
    m.try_emplace("zeta", 1);
    m.try_emplace("alpha", 2);
    m.try_emplace("mid", 3);

    std::vector<std::string> keys;
    for (const auto& entry : m) keys.push_back(entry.first);
    REQUIRE(keys == std::vector<std::string>{"zeta", "alpha", "mid"});
}

TEST_CASE("OrderedMap: try_emplace keeps the existing slot", "[ordered_map]") {
    OrderedMap<std::string, int> m;
    auto first = m.try_emplace("a", 1);
    m.try_emplace("b", 2);
    auto again = m.try_emplace("a", 99);

    REQUIRE(first.second);
    REQUIRE_FALSE(again.second);
    REQUIRE(*again.first == 1);
    REQUIRE(m.size() == 2);
    REQUIRE(m.begin()->first == "a");
}

TEST_CASE("OrderedMap: find and contains", "[ordered_map]") {
    OrderedMap<std::string, int> m;
    m.try_emplace("a", 1);
    REQUIRE(m.contains("a"));
    REQUIRE_FALSE(m.contains("b"));
    REQUIRE(m.find("b") == nullptr);
    *m.find("a") = 5;
    REQUIRE(*m.find("a") == 5);
}

TEST_CASE("OrderedMap: operator[] default-inserts at the end", "[ordered_map]") {
    OrderedMap<std::string, std::string> m;
    m["x"] += "he";
    m["y"] = "other";
    m["x"] += "llo";
    REQUIRE(m.size() == 2);
    REQUIRE(m.begin()->second == "hello");
}

TEST_CASE("OrderedMap: composite keys distinguish kinds", "[ordered_map]") {
    OrderedMap<std::pair<int, std::string>, std::string> m;
    m.try_emplace({0, "1"}, "text");
    m.try_emplace({1, "1"}, "tool");
    REQUIRE(m.size() == 2);
    REQUIRE(*m.find({1, "1"}) == "tool");
}

TEST_CASE("OrderedMap: empty map", "[ordered_map]") {
    OrderedMap<int, int> m;
    REQUIRE(m.empty());
    REQUIRE(m.begin() == m.end());
}
