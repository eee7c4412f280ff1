#include <catch2/catch.hpp>

#include "defines.h"
#include "emu_policy.h"
#include "runner.h"

#include <coreutils/file.h>

#include <memory>
#include <string>
#include <vector>

using V8 = std::vector<uint8_t>;

static fs::path writeImage(std::string const& name, V8 const& data)
{
    auto p = fs::temp_directory_path() / name;
    utils::File f{p.string(), utils::File::Mode::Write};
    f.write(data);
    return p;
}

TEST_CASE("runner.parse_number", "[runner]")
{
    using eighty::parseNumber;
    REQUIRE(parseNumber("0") == 0u);
    REQUIRE(parseNumber("256") == 256u);
    REQUIRE(parseNumber("0x100") == 0x100u);
    REQUIRE(parseNumber("0X1f") == 0x1fu);
    REQUIRE(parseNumber("9fffh") == 0x9fffu);
    REQUIRE(parseNumber("$c000") == 0xc000u);
    REQUIRE(!parseNumber(""));
    REQUIRE(!parseNumber("0x"));
    REQUIRE(!parseNumber("12z"));
    REQUIRE(!parseNumber("h"));
}

TEST_CASE("runner.parse_dump", "[runner]")
{
    auto d = eighty::parseDump("0x26:14");
    REQUIRE(d.start == 0x26);
    REQUIRE(d.len == 14);

    // No length gives one line
    d = eighty::parseDump("26h");
    REQUIRE(d.start == 0x26);
    REQUIRE(d.len == 16);

    d = eighty::parseDump("$fff0:0x10000");
    REQUIRE(d.start == 0xfff0);
    REQUIRE(d.len == 0x10000);

    REQUIRE_THROWS_AS(eighty::parseDump(":5"), eighty::machine_error);
    REQUIRE_THROWS_AS(eighty::parseDump("0:x"), eighty::machine_error);
    REQUIRE_THROWS_AS(eighty::parseDump("0:"), eighty::machine_error);
    REQUIRE_THROWS_AS(eighty::parseDump("0x10000:1"), eighty::machine_error);
    REQUIRE_THROWS_AS(eighty::parseDump("0:0x10001"), eighty::machine_error);
    REQUIRE_THROWS_AS(eighty::parseDump("0:0xffffffff"),
                      eighty::machine_error);
}

TEST_CASE("runner.parse_address", "[runner]")
{
    REQUIRE(eighty::parseAddress("0xffff", "--org") == 0xffff);
    REQUIRE(eighty::parseAddress("100h", "--start") == 0x100);
    REQUIRE_THROWS_AS(eighty::parseAddress("65536", "--org"),
                      eighty::machine_error);
    REQUIRE_THROWS_AS(eighty::parseAddress("", "--org"), eighty::machine_error);
}

TEST_CASE("runner.exit_code", "[runner]")
{
    auto m = std::make_unique<eighty::Machine<EmuPolicy>>();
    auto halted = eighty::runProgram(*m, eighty::memcpyProgram(), 0, 100000);
    REQUIRE(eighty::exitCode(halted) == 0);

    auto spin = std::make_unique<eighty::Machine<EmuPolicy>>();
    eighty::Program loop{0x0000, {0xc3, 0x00, 0x00}};
    auto budget = eighty::runProgram(*spin, loop, 0, 1000);
    REQUIRE(eighty::exitCode(budget) == 2);
}

TEST_CASE("runner.load_and_run", "[runner]")
{
    // mvi a,2ah; out 1; hlt
    auto path = writeImage("eighty_runner_test.bin",
                           {0x3e, 0x2a, 0xd3, 0x01, 0x76});

    auto program = eighty::loadProgram(path, 0x100);
    REQUIRE(program.org == 0x100);
    REQUIRE(program.data.size() == 5);

    auto m = std::make_unique<eighty::Machine<EmuPolicy>>();
    auto res = eighty::runProgram(*m, program, 0x100, 1000);
    REQUIRE(res.halted);
    REQUIRE(res.instructions == 3);
    REQUIRE(res.cycles == 7 + 10 + 7);
    REQUIRE(m->policy().output == "*");
    REQUIRE(m->read_ram(0x100) == 0x3e);

    fs::remove(path);
}

TEST_CASE("runner.budget", "[runner]")
{
    eighty::Program program{0x0000, {0xc3, 0x00, 0x00}};
    auto m = std::make_unique<eighty::Machine<EmuPolicy>>();
    auto res = eighty::runProgram(*m, program, 0, 1000);
    REQUIRE(!res.halted);
    REQUIRE(res.instructions == 100);
}

TEST_CASE("runner.load_errors", "[runner]")
{
    auto path = writeImage("eighty_runner_big.bin", V8(0x200, 0));
    REQUIRE_THROWS_AS(eighty::loadProgram(path, 0xff00),
                      eighty::machine_error);
    REQUIRE(eighty::loadProgram(path, 0xfe00).data.size() == 0x200);
    fs::remove(path);

    REQUIRE_THROWS(eighty::loadProgram(
        fs::temp_directory_path() / "eighty_no_such_file.bin", 0));
}

TEST_CASE("runner.state", "[runner]")
{
    auto m = std::make_unique<eighty::Machine<EmuPolicy>>();
    auto res = eighty::runProgram(*m, eighty::capitalizeProgram(), 0, 100000);
    REQUIRE(res.halted);

    auto state = eighty::stateString(*m);
    REQUIRE(state.find("Final Processor State:") == 0);
    REQUIRE(state.find("SP 9fff  PC 000c") != std::string::npos);
    REQUIRE(state.find("Halted yes") != std::string::npos);

    using L = eighty::CapitalizeLayout;
    auto dump = eighty::dumpMemory(*m, L::String, L::Length);
    REQUIRE(dump == "0026 : 48 45 4c 4c 4f 2c 20 46 52 49 45 4e 44 53\n");

    auto two = eighty::dumpMemory(*m, 0, 20);
    REQUIRE(two.find("\n0010 :") != std::string::npos);
}

TEST_CASE("runner.trace", "[runner]")
{
    auto m = std::make_unique<eighty::Machine<EmuPolicy>>();
    m->policy().trace = true;
    auto res = eighty::runProgram(*m, eighty::memcpyProgram(), 0, 100000);
    REQUIRE(res.halted);
    // 7 in the driver, 3 on entry, 8 per byte, ret
    REQUIRE(res.instructions == 7 + 3 + 5 * 8 + 1);
}
