#include <catch2/catch.hpp>

#include "defines.h"
#include "emu_policy.h"
#include "emulated.h"
#include "programs.h"
#include "routines.h"
#include "runner.h"

#include <memory>
#include <string>
#include <vector>

using V8 = std::vector<uint8_t>;

TEST_CASE("programs.capitalize", "[programs]")
{
    using L = eighty::CapitalizeLayout;
    auto m = std::make_unique<eighty::Machine<EmuPolicy>>();
    auto res = eighty::runProgram(*m, eighty::capitalizeProgram(), 0, 100000);

    REQUIRE(res.halted);
    REQUIRE(m->lastPC() == 0x000b);
    REQUIRE(m->regSP() == eighty::StackTop);

    std::string text(L::Length, ' ');
    for (size_t i = 0; i < text.size(); i++)
        text[i] = static_cast<char>(m->read_ram(L::String + i));
    REQUIRE(text == "HELLO, FRIENDS");
    // Counter ran down to zero
    REQUIRE(m->get<eighty::Reg::C>() == 0);
}

TEST_CASE("programs.memcpy", "[programs]")
{
    using L = eighty::MemcpyLayout;
    auto m = std::make_unique<eighty::Machine<EmuPolicy>>();
    auto res = eighty::runProgram(*m, eighty::memcpyProgram(), 0, 100000);

    REQUIRE(res.halted);
    V8 target(L::TargetLength);
    m->read_ram(L::Target, target.data(), target.size());
    REQUIRE(target == V8{0x11, 0x22, 0x33, 0x44, 0x55, 0, 0, 0, 0, 0});
    REQUIRE(m->get<eighty::Reg::B>() == 0);
    REQUIRE(m->get<eighty::Reg::C>() == 0);
}

TEST_CASE("programs.relocate", "[programs]")
{
    auto a = eighty::capitalizeRoutine(0x0000);
    auto b = eighty::capitalizeRoutine(0x1234);
    REQUIRE(a.size() == 26);
    REQUIRE(b.size() == a.size());
    // jmp Capitalize at the end points back at the start
    REQUIRE(b[0x16] == 0xc3);
    REQUIRE(b[0x17] == 0x34);
    REQUIRE(b[0x18] == 0x12);

    auto c = eighty::memcpyRoutine(0x8000);
    REQUIRE(c.size() == 14);
    REQUIRE(c[0x0a] == 0xc2);
    REQUIRE(c[0x0b] == 0x03);
    REQUIRE(c[0x0c] == 0x80);
}

TEST_CASE("emulated.capitalize", "[programs]")
{
    V8 buf{'h', 'e', 'l', 'l', 'o', ',', ' ', 'f',
           'r', 'i', 'e', 'n', 'd', 's', 'x', 'y'};
    eighty::emulated_capitalize(buf, 14);
    REQUIRE(std::string(buf.begin(), buf.end()) == "HELLO, FRIENDSxy");

    V8 empty;
    REQUIRE(eighty::emulated_capitalize(empty, 0) > 0);
}

TEST_CASE("emulated.capitalize_matches_native", "[programs]")
{
    V8 all(255);
    for (size_t i = 0; i < all.size(); i++)
        all[i] = static_cast<uint8_t>(i + 1);

    for (size_t len : {0, 1, 31, 100, 255}) {
        auto native = all;
        auto emulated = all;
        eighty::capitalize(native, len);
        eighty::emulated_capitalize(emulated, len);
        REQUIRE(native == emulated);
    }
}

TEST_CASE("emulated.capitalize_limits", "[programs]")
{
    V8 buf(300, 'a');
    REQUIRE_THROWS_AS(eighty::emulated_capitalize(buf, 256),
                      eighty::routine_error);
    REQUIRE_THROWS_AS(eighty::emulated_capitalize(buf, 301),
                      eighty::routine_error);
    REQUIRE(buf == V8(300, 'a'));
}

TEST_CASE("emulated.copy", "[programs]")
{
    V8 const source{0x11, 0x22, 0x33, 0x44, 0x55};
    V8 target(10, 0);
    eighty::emulated_copy_bytes(source, target, 5);
    REQUIRE(target == V8{0x11, 0x22, 0x33, 0x44, 0x55, 0, 0, 0, 0, 0});

    V8 untouched(4, 0xaa);
    eighty::emulated_copy_bytes(source, untouched, 0);
    REQUIRE(untouched == V8(4, 0xaa));
}

TEST_CASE("emulated.copy_matches_native", "[programs]")
{
    // 16 bit counter, so go past 256
    V8 source(1000);
    for (size_t i = 0; i < source.size(); i++)
        source[i] = static_cast<uint8_t>(i ^ (i >> 3));

    for (size_t count : {1, 255, 256, 257, 1000}) {
        V8 native(1000, 0);
        V8 emulated(1000, 0);
        eighty::copy_bytes(source, native, count);
        eighty::emulated_copy_bytes(source, emulated, count);
        REQUIRE(native == emulated);
    }
}

TEST_CASE("emulated.copy_limits", "[programs]")
{
    V8 buf(16, 1);
    std::span<uint8_t> all{buf};
    REQUIRE_THROWS_AS(
        eighty::emulated_copy_bytes(all.subspan(0, 8), all.subspan(4, 8), 8),
        eighty::routine_error);

    V8 const source(4, 2);
    REQUIRE_THROWS_AS(eighty::emulated_copy_bytes(source, buf, 5),
                      eighty::routine_error);

    V8 const huge(eighty::EmulatedLayout::Window + 1, 3);
    V8 out(huge.size());
    REQUIRE_THROWS_AS(eighty::emulated_copy_bytes(huge, out, huge.size()),
                      eighty::routine_error);
}
