#include <catch2/catch.hpp>

#include "defines.h"
#include "routines.h"

#include <array>
#include <string>
#include <vector>

using namespace std::string_literals;

using V8 = std::vector<uint8_t>;

static V8 bytes(std::string const& s)
{
    return V8(s.begin(), s.end());
}

TEST_CASE("capitalize.basic", "[routines]")
{
    auto buf = bytes("hello, friends");
    eighty::capitalize(buf, 14);
    REQUIRE(buf == bytes("HELLO, FRIENDS"));
}

TEST_CASE("capitalize.all_bytes", "[routines]")
{
    V8 buf(256);
    for (int i = 0; i < 256; i++)
        buf[i] = i;
    eighty::capitalize(buf.data(), buf.size());

    for (int i = 0; i < 256; i++) {
        if (i >= 0x61 && i <= 0x7a) {
            REQUIRE(buf[i] == i - 0x20);
        } else {
            REQUIRE(buf[i] == i);
        }
    }
}

TEST_CASE("capitalize.partial", "[routines]")
{
    auto buf = bytes("abcdef");
    eighty::capitalize(buf, 3);
    REQUIRE(buf == bytes("ABCdef"));

    // Zero length does nothing
    eighty::capitalize(buf, 0);
    REQUIRE(buf == bytes("ABCdef"));
}

TEST_CASE("capitalize.idempotent", "[routines]")
{
    auto once = bytes("Mixed {case} `text` @ 0x7a~z");
    eighty::capitalize(once);
    auto twice = once;
    eighty::capitalize(twice);
    REQUIRE(once == twice);
    REQUIRE(once == bytes("MIXED {CASE} `TEXT` @ 0X7A~Z"));
}

TEST_CASE("capitalize.checked", "[routines]")
{
    auto buf = bytes("abc");
    REQUIRE_THROWS_AS(eighty::capitalize(buf, 4), eighty::routine_error);
    REQUIRE(buf == bytes("abc"));

    V8 empty;
    eighty::capitalize(empty, 0);
    REQUIRE(empty.empty());
}

TEST_CASE("copy.basic", "[routines]")
{
    V8 const source{0x11, 0x22, 0x33, 0x44, 0x55};
    V8 target(10, 0);
    eighty::copy_bytes(source, target, 5);
    REQUIRE(target == V8{0x11, 0x22, 0x33, 0x44, 0x55, 0, 0, 0, 0, 0});
}

TEST_CASE("copy.zero_count", "[routines]")
{
    V8 const source{1, 2, 3};
    V8 target{9, 9, 9};
    eighty::copy_bytes(source, target, 0);
    REQUIRE(target == V8{9, 9, 9});

    // Unchecked form must not touch either pointer
    eighty::copy_bytes(nullptr, nullptr, 0);
}

TEST_CASE("copy.rest_untouched", "[routines]")
{
    V8 source(64);
    for (size_t i = 0; i < source.size(); i++)
        source[i] = static_cast<uint8_t>(i * 7 + 3);

    for (size_t count = 0; count <= source.size(); count += 9) {
        V8 target(80, 0xee);
        eighty::copy_bytes(source.data(), target.data(), count);
        for (size_t i = 0; i < target.size(); i++) {
            REQUIRE(target[i] == (i < count ? source[i] : 0xee));
        }
    }
}

TEST_CASE("copy.checked", "[routines]")
{
    V8 const source{1, 2, 3};
    V8 target(2, 0);
    REQUIRE_THROWS_AS(eighty::copy_bytes(source, target, 3),
                      eighty::routine_error);
    REQUIRE(target == V8{0, 0});

    V8 big(8, 0);
    REQUIRE_THROWS_AS(eighty::copy_bytes(source, big, 4),
                      eighty::routine_error);
    REQUIRE(big == V8(8, 0));
}

TEST_CASE("copy.overlap", "[routines]")
{
    V8 buf{1, 2, 3, 4, 5, 6, 7, 8};
    std::span<uint8_t> all{buf};

    REQUIRE(eighty::overlaps(buf.data(), buf.data() + 3, 4));
    REQUIRE(eighty::overlaps(buf.data() + 3, buf.data(), 4));
    REQUIRE(!eighty::overlaps(buf.data(), buf.data() + 4, 4));
    REQUIRE(!eighty::overlaps(buf.data(), buf.data(), 0));

    REQUIRE_THROWS_AS(
        eighty::copy_bytes(all.subspan(0, 4), all.subspan(2, 4), 4),
        eighty::routine_error);
    REQUIRE(buf == V8{1, 2, 3, 4, 5, 6, 7, 8});

    // Adjacent regions are fine
    eighty::copy_bytes(all.subspan(0, 4), all.subspan(4, 4), 4);
    REQUIRE(buf == V8{1, 2, 3, 4, 1, 2, 3, 4});
}
