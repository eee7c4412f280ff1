#include <catch2/catch.hpp>

#include "disasm.h"
#include "emulator.h"
#include "programs.h"

#include <string>
#include <vector>

using V8 = std::vector<uint8_t>;

static std::string dis(V8 const& code)
{
    auto lines = eighty::disassemble(code, 0);
    return lines.empty() ? std::string{} : lines.front().second;
}

TEST_CASE("disasm.single", "[disasm]")
{
    REQUIRE(dis({0x00}) == "nop");
    REQUIRE(dis({0x76}) == "hlt");
    REQUIRE(dis({0x7e}) == "mov a,m");
    REQUIRE(dis({0x77}) == "mov m,a");
    REQUIRE(dis({0x31, 0xff, 0x9f}) == "lxi sp,$9fff");
    REQUIRE(dis({0x0e, 0x0e}) == "mvi c,$0e");
    REQUIRE(dis({0xfe, 0x61}) == "cpi $61");
    REQUIRE(dis({0xca, 0x25, 0x00}) == "jz $0025");
    REQUIRE(dis({0xc8}) == "rz");
    REQUIRE(dis({0xf5}) == "push psw");
    REQUIRE(dis({0x1a}) == "ldax d");
    REQUIRE(dis({0xdb, 0x10}) == "in $10");
    REQUIRE(dis({0xef}) == "rst 5");
    REQUIRE(dis({0x32, 0x00, 0x20}) == "sta $2000");
}

TEST_CASE("disasm.aliases", "[disasm]")
{
    REQUIRE(dis({0x08}) == "nop");
    REQUIRE(dis({0xcb, 0x00, 0x10}) == "jmp $1000");
    REQUIRE(dis({0xd9}) == "ret");
    REQUIRE(dis({0xfd, 0x34, 0x12}) == "call $1234");
}

TEST_CASE("disasm.machine", "[disasm]")
{
    eighty::Machine<> m;
    V8 const code{0x00, 0xc3, 0x00, 0x01};
    m.write_ram(0x200, code.data(), code.size());

    auto d = eighty::disassembleAt(m, 0x201);
    REQUIRE(d.text == "jmp $0100");
    REQUIRE(d.size == 3);
}

TEST_CASE("disasm.program", "[disasm]")
{
    auto program = eighty::capitalizeProgram();
    auto lines = eighty::disassemble(program.data, program.org);
    REQUIRE(lines.size() > 16);

    std::vector<std::pair<uint16_t, std::string>> const expected = {
        {0x0000, "lxi sp,$9fff"}, {0x0003, "lxi h,$0026"},
        {0x0006, "mvi c,$0e"},    {0x0008, "call $000c"},
        {0x000b, "hlt"},          {0x000c, "mov a,c"},
        {0x000d, "cpi $00"},      {0x000f, "jz $0025"},
        {0x0012, "mov a,m"},      {0x0013, "cpi $61"},
        {0x0015, "jc $0020"},     {0x0018, "cpi $7b"},
        {0x001a, "jnc $0020"},    {0x001d, "sui $20"},
        {0x001f, "mov m,a"},      {0x0020, "inx h"},
        {0x0021, "dcr c"},        {0x0022, "jmp $000c"},
        {0x0025, "ret"},
    };
    for (size_t i = 0; i < expected.size(); i++) {
        REQUIRE(lines[i] == expected[i]);
    }
}

TEST_CASE("disasm.listing", "[disasm]")
{
    auto routine = eighty::memcpyRoutine(0x0020);
    auto text = eighty::listing(routine, 0x0020);
    REQUIRE(text.rfind("0020 : mov a,b\n0021 : ora c\n0022 : rz\n", 0) == 0);
    REQUIRE(text.find("002a : jnz $0023\n") != std::string::npos);
    REQUIRE(text.find("002d : ret\n") != std::string::npos);
}
