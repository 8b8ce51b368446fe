#include <catch.hpp>

#include <bplus/exception.hpp>
#include <bplus/key.hpp>
#include <bplus/schema.hpp>

#include <fmt/format.h>

#include <sstream>
#include <string>

using namespace bplus;

TEST_CASE("schema", "[key]") {
    schema s{column::int32(), column::int64(), column::float32(), column::float64(),
             column::fixed_string(10)};
    REQUIRE(s.size() == 5);
    REQUIRE(s.key_size() == 4 + 8 + 4 + 8 + 10);
    REQUIRE(s[4].type() == column_type::fixed_string);
    REQUIRE(s[4].width() == 10);
    REQUIRE(fmt::format("{}", s) == "[int32, int64, float32, float64, fixed_string(10)]");

    REQUIRE_THROWS_AS(schema(std::vector<column>()), bad_argument);
    REQUIRE_THROWS_AS(column::fixed_string(0), bad_argument);
    REQUIRE_THROWS_AS(column::fixed_string(max_key_size + 1), bad_argument);
    REQUIRE_THROWS_AS((schema{column::fixed_string(max_key_size), column::int32()}), bad_argument);
}

TEST_CASE("keys are checked against their schema", "[key]") {
    schema s{column::int32(), column::fixed_string(4)};

    key k(s, {42, std::string("abcd")});
    REQUIRE(k.size() == 2);
    REQUIRE(std::get<i32>(k[0]) == 42);
    REQUIRE(std::get<std::string>(k[1]) == "abcd");
    REQUIRE(k == key(s, {42, std::string("abcd")}));
    REQUIRE(k != key(s, {43, std::string("abcd")}));

    // Shorter strings are fine, they are padded when encoded.
    REQUIRE_NOTHROW(key(s, {1, std::string("a")}));
    REQUIRE_NOTHROW(key(s, {1, std::string()}));

    // Wrong number of values.
    REQUIRE_THROWS_AS(key(s, {42}), bad_argument);

    // Type mismatch (i64 in an int32 column).
    REQUIRE_THROWS_AS(key(s, {i64(42), std::string("abcd")}), bad_argument);

    // String too long.
    REQUIRE_THROWS_AS(key(s, {42, std::string("abcde")}), bad_argument);

    // Embedded zero bytes cannot be distinguished from padding.
    REQUIRE_THROWS_AS(key(s, {42, std::string("a\0b", 3)}), bad_argument);

    schema other{column::int32(), column::fixed_string(2)};
    REQUIRE_THROWS_AS(check_key(other, k), bad_argument);
    REQUIRE_NOTHROW(check_key(s, k));
}

TEST_CASE("keys can be printed", "[key]") {
    schema s{column::int64(), column::float64(), column::fixed_string(8)};
    key k(s, {i64(-7), 2.5, std::string("hello")});

    std::ostringstream os;
    os << k;
    REQUIRE(os.str() == "(-7, 2.5, hello)");
}
