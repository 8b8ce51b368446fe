#include <catch.hpp>

#include <bplus/exception.hpp>
#include <bplus/key_codec.hpp>

#include <array>
#include <cmath>
#include <limits>
#include <vector>

using namespace bplus;

TEST_CASE("encoding of an int32 and a fixed string", "[key-codec]") {
    schema s{column::int32(), column::fixed_string(3)};
    key k(s, {42, std::string("abc")});

    std::array<byte, 7> buffer{};
    REQUIRE(encode_key(s, k, buffer.data(), buffer.size()) == 7);

    std::array<byte, 7> expected{0x00, 0x00, 0x00, 0x2A, 'a', 'b', 'c'};
    REQUIRE(buffer == expected);

    key decoded = decode_key(s, buffer.data(), buffer.size());
    REQUIRE(decoded == k);
    REQUIRE(std::get<i32>(decoded[0]) == 42);
    REQUIRE(std::get<std::string>(decoded[1]) == "abc");
}

TEST_CASE("short strings are zero padded", "[key-codec]") {
    schema s{column::fixed_string(6), column::int64()};
    key k(s, {std::string("ab"), i64(-1)});

    std::array<byte, 14> buffer;
    buffer.fill(0xCC);
    REQUIRE(encode_key(s, k, buffer.data(), buffer.size()) == 14);

    std::array<byte, 14> expected{'a',  'b',  0,    0,    0,    0,    0xFF,
                                  0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF};
    REQUIRE(buffer == expected);

    key decoded = decode_key(s, buffer.data(), buffer.size());
    REQUIRE(std::get<std::string>(decoded[0]) == "ab");
    REQUIRE(decoded == k);
}

TEST_CASE("keys survive encoding", "[key-codec]") {
    schema s{column::int32(),   column::int64(),          column::float32(),
             column::float64(), column::fixed_string(5), column::fixed_string(1)};

    std::vector<key> keys{
        key(s, {0, i64(0), 0.0f, 0.0, std::string(), std::string()}),
        key(s, {std::numeric_limits<i32>::min(), std::numeric_limits<i64>::max(), -1.5f, 1e300,
                std::string("hello"), std::string("x")}),
        key(s, {-1, i64(-1), std::numeric_limits<float>::infinity(), -0.25, std::string("hi"),
                std::string("")}),
    };

    std::array<byte, 30> buffer;
    REQUIRE(s.key_size() == buffer.size());
    for (const key& k : keys) {
        encode_key(s, k, buffer.data(), buffer.size());
        REQUIRE(decode_key(s, buffer.data(), buffer.size()) == k);
    }
}

TEST_CASE("decoding truncated or malformed keys fails", "[key-codec]") {
    schema s{column::int32(), column::fixed_string(4)};

    std::array<byte, 8> buffer{0, 0, 0, 1, 'a', 'b', 0, 0};
    REQUIRE_NOTHROW(decode_key(s, buffer.data(), buffer.size()));
    REQUIRE_THROWS_AS(decode_key(s, buffer.data(), buffer.size() - 1), corruption_error);
    REQUIRE_THROWS_AS(decode_key(s, buffer.data(), 0), corruption_error);

    // Garbage after the terminating zero byte.
    std::array<byte, 8> garbage{0, 0, 0, 1, 'a', 0, 'b', 0};
    REQUIRE_THROWS_AS(decode_key(s, garbage.data(), garbage.size()), corruption_error);
}

TEST_CASE("encoding checks its inputs", "[key-codec]") {
    schema s{column::int32(), column::fixed_string(4)};
    key k(s, {1, std::string("abcd")});

    std::array<byte, 8> buffer{};
    REQUIRE_THROWS_AS(encode_key(s, k, buffer.data(), 7), bad_argument);

    schema other{column::int64(), column::fixed_string(4)};
    std::array<byte, 12> other_buffer{};
    REQUIRE_THROWS_AS(encode_key(other, k, other_buffer.data(), other_buffer.size()),
                      bad_argument);
}

TEST_CASE("keys are formatted for diagnostics", "[key-codec]") {
    schema s{column::int32(), column::fixed_string(3)};
    REQUIRE(format_key(s, key(s, {42, std::string("abc")})) == "[42 abc]");

    schema mixed{column::int64(), column::float32(), column::float64(), column::fixed_string(4)};
    REQUIRE(format_key(mixed, key(mixed, {i64(-3), 1.5f, -2.25, std::string("ab")}))
            == "[-3 1.5 -2.25 ab]");
}
