#include <catch2/catch.hpp>

#include "emulator.h"

#include <memory>
#include <utility>
#include <vector>

using eighty::Reg;
using V8 = std::vector<uint8_t>;

struct IoPolicy : eighty::DefaultPolicy
{
    explicit IoPolicy(eighty::Machine<IoPolicy>& /*m*/) {}

    std::vector<std::pair<uint8_t, uint8_t>> writes;

    static uint8_t ioRead(IoPolicy&, uint8_t port)
    {
        return port == 2 ? 0x5a : 0;
    }
    static void ioWrite(IoPolicy& p, uint8_t port, uint8_t v)
    {
        p.writes.emplace_back(port, v);
    }
};

struct StepPolicy : eighty::DefaultPolicy
{
    explicit StepPolicy(eighty::Machine<StepPolicy>& /*m*/) {}

    int ops = 0;
    int stopAfter = 3;

    static bool eachOp(StepPolicy& p) { return ++p.ops >= p.stopAfter; }
};

struct RunPolicy : eighty::DefaultPolicy
{
    explicit RunPolicy(eighty::Machine<RunPolicy>& /*m*/) {}

    int runs = 0;

    static void afterRun(RunPolicy& p) { p.runs++; }
};

// Load code at 0 and run it
template <typename POLICY = eighty::DefaultPolicy>
static std::unique_ptr<eighty::Machine<POLICY>> runCode(V8 const& code,
                                                        uint32_t toCycles =
                                                            100000)
{
    auto m = std::make_unique<eighty::Machine<POLICY>>();
    m->write_ram(0, code.data(), code.size());
    m->setPC(0);
    m->run(toCycles);
    return m;
}

TEST_CASE("emu.inr", "[emulator]")
{
    auto m = runCode({
        0x06, 0x01,       // mvi b,1
        0x04,             // inr b
        0x0e, 0x02,       // mvi c,2
        0x0c,             // inr c
        0x16, 0x03,       // mvi d,3
        0x14,             // inr d
        0x1e, 0x04,       // mvi e,4
        0x1c,             // inr e
        0x21, 0x21, 0x21, // lxi h,2121h
        0x36, 0x00,       // mvi m,0
        0x34,             // inr m
        0x76,             // hlt
    });
    REQUIRE(m->halted());
    REQUIRE(m->get<Reg::B>() == 2);
    REQUIRE(m->get<Reg::C>() == 3);
    REQUIRE(m->get<Reg::D>() == 4);
    REQUIRE(m->get<Reg::E>() == 5);
    REQUIRE(m->get<Reg::H>() == 0x21);
    REQUIRE(m->get<Reg::L>() == 0x21);
    REQUIRE(m->read_ram(0x2121) == 1);
}

TEST_CASE("emu.inr_wrap", "[emulator]")
{
    auto m = runCode({
        0x37,       // stc
        0x3e, 0xff, // mvi a,ffh
        0x3c,       // inr a
        0x76,       // hlt
    });
    REQUIRE(m->get<Reg::A>() == 0);
    REQUIRE(m->zero());
    REQUIRE(m->auxCarry());
    // inr leaves carry alone
    REQUIRE(m->carry());

    m = runCode({
        0x3e, 0x00, // mvi a,0
        0x3d,       // dcr a
        0x76,       // hlt
    });
    REQUIRE(m->get<Reg::A>() == 0xff);
    REQUIRE(m->sign());
    REQUIRE(m->parity());
    REQUIRE(!m->carry());
}

TEST_CASE("emu.mem", "[emulator]")
{
    auto m = runCode({
        0x21, 0x20, 0x20, // lxi h,2020h
        0x36, 0x01,       // mvi m,1
        0x46,             // mov b,m
        0x3e, 0x07,       // mvi a,7
        0x32, 0x21, 0x21, // sta 2121h
        0x3a, 0x20, 0x20, // lda 2020h
        0x4f,             // mov c,a
        0x11, 0x21, 0x21, // lxi d,2121h
        0x1a,             // ldax d
        0x57,             // mov d,a
        0x76,             // hlt
    });
    REQUIRE(m->get<Reg::B>() == 1);
    REQUIRE(m->get<Reg::C>() == 1);
    REQUIRE(m->get<Reg::D>() == 7);
    REQUIRE(m->read_ram(0x2020) == 1);
    REQUIRE(m->read_ram(0x2121) == 7);
}

TEST_CASE("emu.shld_lhld", "[emulator]")
{
    auto m = runCode({
        0x21, 0x34, 0x12, // lxi h,1234h
        0x22, 0x00, 0x30, // shld 3000h
        0x21, 0x00, 0x00, // lxi h,0
        0x2a, 0x00, 0x30, // lhld 3000h
        0x76,             // hlt
    });
    REQUIRE(m->read_ram(0x3000) == 0x34);
    REQUIRE(m->read_ram(0x3001) == 0x12);
    REQUIRE(m->get<Reg::H>() == 0x12);
    REQUIRE(m->get<Reg::L>() == 0x34);
}

TEST_CASE("emu.add", "[emulator]")
{
    auto m = runCode({
        0x3e, 0xfd, // mvi a,fdh
        0x06, 0xfe, // mvi b,feh
        0x80,       // add b
        0x76,       // hlt
    });
    REQUIRE(m->get<Reg::A>() == 0xfb);
    REQUIRE(m->sign());
    REQUIRE(m->carry());
    REQUIRE(!m->zero());
    REQUIRE(!m->parity());

    m = runCode({
        0x37,       // stc
        0x3e, 0x0f, // mvi a,0fh
        0xce, 0x00, // aci 0
        0x76,       // hlt
    });
    REQUIRE(m->get<Reg::A>() == 0x10);
    REQUIRE(m->auxCarry());
    REQUIRE(!m->carry());
}

TEST_CASE("emu.sub", "[emulator]")
{
    auto m = runCode({
        0x3e, 0x03, // mvi a,3
        0xd6, 0x05, // sui 5
        0x76,       // hlt
    });
    REQUIRE(m->get<Reg::A>() == 0xfe);
    REQUIRE(m->carry());
    REQUIRE(m->sign());

    m = runCode({
        0x37,       // stc
        0x3e, 0x05, // mvi a,5
        0xde, 0x04, // sbi 4
        0x76,       // hlt
    });
    REQUIRE(m->get<Reg::A>() == 0);
    REQUIRE(m->zero());
    REQUIRE(!m->carry());
}

TEST_CASE("emu.compare", "[emulator]")
{
    // cpi leaves A alone; carry means A is below the operand
    auto m = runCode({0x3e, 0x60, 0xfe, 0x61, 0x76});
    REQUIRE(m->get<Reg::A>() == 0x60);
    REQUIRE(m->carry());
    REQUIRE(!m->zero());

    m = runCode({0x3e, 0x61, 0xfe, 0x61, 0x76});
    REQUIRE(!m->carry());
    REQUIRE(m->zero());

    m = runCode({0x3e, 0x7b, 0xfe, 0x7b, 0x76});
    REQUIRE(!m->carry());

    m = runCode({0x3e, 0x7a, 0x06, 0x7b, 0xb8, 0x76}); // cmp b
    REQUIRE(m->carry());
    REQUIRE(m->get<Reg::A>() == 0x7a);
}

TEST_CASE("emu.logic", "[emulator]")
{
    auto m = runCode({
        0x37,       // stc
        0x3e, 0xf0, // mvi a,f0h
        0xe6, 0x3c, // ani 3ch
        0x76,       // hlt
    });
    REQUIRE(m->get<Reg::A>() == 0x30);
    REQUIRE(!m->carry());
    REQUIRE(m->parity());

    m = runCode({0x3e, 0x55, 0xaf, 0x76}); // xra a
    REQUIRE(m->get<Reg::A>() == 0);
    REQUIRE(m->zero());
    REQUIRE(m->flags() == 0x46);

    m = runCode({0x3e, 0x0f, 0xf6, 0x80, 0xee, 0x01, 0x2f, 0x76});
    // ori 80h -> 8f, xri 1 -> 8e, cma -> 71
    REQUIRE(m->get<Reg::A>() == 0x71);
}

TEST_CASE("emu.rotate", "[emulator]")
{
    auto m = runCode({0x3e, 0x81, 0x07, 0x76}); // rlc
    REQUIRE(m->get<Reg::A>() == 0x03);
    REQUIRE(m->carry());

    m = runCode({0x3e, 0x81, 0x0f, 0x76}); // rrc
    REQUIRE(m->get<Reg::A>() == 0xc0);
    REQUIRE(m->carry());

    m = runCode({0x3e, 0x80, 0x17, 0x76}); // ral, carry was clear
    REQUIRE(m->get<Reg::A>() == 0x00);
    REQUIRE(m->carry());

    m = runCode({0x37, 0x3e, 0x02, 0x1f, 0x76}); // stc, rar
    REQUIRE(m->get<Reg::A>() == 0x81);
    REQUIRE(!m->carry());
}

TEST_CASE("emu.dad", "[emulator]")
{
    auto m = runCode({
        0x21, 0xff, 0xff, // lxi h,ffffh
        0x01, 0x02, 0x00, // lxi b,2
        0x09,             // dad b
        0x76,             // hlt
    });
    REQUIRE(m->get<Reg::H>() == 0x00);
    REQUIRE(m->get<Reg::L>() == 0x01);
    REQUIRE(m->carry());
}

TEST_CASE("emu.inx_dcx", "[emulator]")
{
    auto m = runCode({
        0x01, 0xff, 0x00, // lxi b,00ffh
        0x03,             // inx b
        0x11, 0x00, 0x00, // lxi d,0
        0x1b,             // dcx d
        0x76,             // hlt
    });
    REQUIRE(m->get<Reg::B>() == 0x01);
    REQUIRE(m->get<Reg::C>() == 0x00);
    REQUIRE(m->get<Reg::D>() == 0xff);
    REQUIRE(m->get<Reg::E>() == 0xff);
    // No flags touched
    REQUIRE(!m->zero());
}

TEST_CASE("emu.daa", "[emulator]")
{
    auto m = runCode({0x3e, 0x9b, 0x27, 0x76});
    REQUIRE(m->get<Reg::A>() == 0x01);
    REQUIRE(m->carry());
    REQUIRE(m->auxCarry());

    // 38 + 45 = 83 in BCD
    m = runCode({0x3e, 0x38, 0xc6, 0x45, 0x27, 0x76});
    REQUIRE(m->get<Reg::A>() == 0x83);
    REQUIRE(!m->carry());
}

TEST_CASE("emu.call", "[emulator]")
{
    auto m = runCode({
        0x31, 0x55, 0x00, // lxi sp,55h
        0xcd, 0x08, 0x00, // call 8
        0x76,             // hlt
        0x00,             // nop
        0x76,             // hlt
    });
    REQUIRE(m->regSP() == 0x53);
    REQUIRE(m->lastPC() == 0x08);
    REQUIRE(m->regPC() == 0x09);
    REQUIRE(m->read_ram(0x53) == 0x06);
    REQUIRE(m->read_ram(0x54) == 0x00);

    m = runCode({
        0x31, 0x55, 0x00, // lxi sp,55h
        0xcd, 0x08, 0x00, // call 8
        0x76,             // hlt
        0x00,             // nop
        0xc9,             // ret
    });
    REQUIRE(m->regSP() == 0x55);
    REQUIRE(m->lastPC() == 0x06);
}

TEST_CASE("emu.conditional_cycles", "[emulator]")
{
    V8 code = {
        0x31, 0x00, 0x01, // lxi sp,100h   10
        0xaf,             // xra a          4
        0xcc, 0x08, 0x00, // cz 8          17 taken
        0x76,             // hlt
        0x76,             // hlt            7
    };
    auto m = std::make_unique<eighty::Machine<>>();
    m->write_ram(0, code.data(), code.size());
    REQUIRE(m->run() == 38);
    REQUIRE(m->lastPC() == 0x08);

    code[4] = 0xc4; // cnz, not taken  11
    m = std::make_unique<eighty::Machine<>>();
    m->write_ram(0, code.data(), code.size());
    REQUIRE(m->run() == 32);
    REQUIRE(m->lastPC() == 0x07);

    // rz taken is 11, rnz not taken 5
    m = runCode({0x31, 0x00, 0x01, 0xcd, 0x07, 0x00, 0x76, 0xaf, 0xc0, 0xc8});
    REQUIRE(m->halted());
    REQUIRE(m->regSP() == 0x100);
}

TEST_CASE("emu.push_pop", "[emulator]")
{
    auto m = runCode({
        0x31, 0x00, 0x01, // lxi sp,100h
        0x01, 0x34, 0x12, // lxi b,1234h
        0xc5,             // push b
        0xd1,             // pop d
        0x3e, 0x42,       // mvi a,42h
        0x37,             // stc
        0xf5,             // push psw
        0xaf,             // xra a
        0xf1,             // pop psw
        0x76,             // hlt
    });
    REQUIRE(m->get<Reg::A>() == 0x42);
    REQUIRE(m->carry());
    REQUIRE(!m->zero());
    REQUIRE(m->get<Reg::D>() == 0x12);
    REQUIRE(m->get<Reg::E>() == 0x34);
    REQUIRE(m->regSP() == 0x100);
    // Flag byte as pushed: bit 1 set, carry set
    REQUIRE(m->read_ram(0xfe) == 0x03);
    REQUIRE(m->read_ram(0xff) == 0x42);
}

TEST_CASE("emu.exchange", "[emulator]")
{
    auto m = runCode({
        0x31, 0x00, 0x01, // lxi sp,100h
        0x21, 0x22, 0x11, // lxi h,1122h
        0x11, 0x44, 0x33, // lxi d,3344h
        0xeb,             // xchg
        0xd5,             // push d
        0x21, 0x66, 0x55, // lxi h,5566h
        0xe3,             // xthl
        0x76,             // hlt
    });
    REQUIRE(m->get<Reg::D>() == 0x11);
    REQUIRE(m->get<Reg::E>() == 0x22);
    REQUIRE(m->get<Reg::H>() == 0x11);
    REQUIRE(m->get<Reg::L>() == 0x22);
    REQUIRE(m->read_ram(0xfe) == 0x66);
    REQUIRE(m->read_ram(0xff) == 0x55);
}

TEST_CASE("emu.pchl_sphl", "[emulator]")
{
    auto m = runCode({
        0x21, 0x08, 0x00, // lxi h,8
        0xf9,             // sphl
        0xe9,             // pchl
        0x00, 0x00, 0x00, //
        0x76,             // hlt
    });
    REQUIRE(m->regSP() == 0x08);
    REQUIRE(m->lastPC() == 0x08);
}

TEST_CASE("emu.rst", "[emulator]")
{
    V8 code(0x20, 0);
    code[0] = 0x31; // lxi sp,100h
    code[1] = 0x00;
    code[2] = 0x01;
    code[3] = 0xdf; // rst 3
    code[0x18] = 0x76;
    auto m = runCode(code);
    REQUIRE(m->lastPC() == 0x18);
    REQUIRE(m->read_ram(0xfe) == 0x04);
}

TEST_CASE("emu.io", "[emulator]")
{
    auto m = runCode<IoPolicy>({
        0x3e, 0x41, // mvi a,41h
        0xd3, 0x01, // out 1
        0xdb, 0x02, // in 2
        0x76,       // hlt
    });
    REQUIRE(m->policy().writes.size() == 1);
    REQUIRE(m->policy().writes[0].first == 1);
    REQUIRE(m->policy().writes[0].second == 0x41);
    REQUIRE(m->get<Reg::A>() == 0x5a);
}

TEST_CASE("emu.interrupts", "[emulator]")
{
    V8 code(0x10, 0);
    code[0] = 0x31; // lxi sp,100h
    code[1] = 0x00;
    code[2] = 0x01;
    code[3] = 0xfb; // ei
    code[4] = 0x76; // hlt
    code[8] = 0x76; // rst 1 lands here
    auto m = runCode(code);
    REQUIRE(m->halted());
    REQUIRE(m->interruptsEnabled());

    REQUIRE(m->irq(1));
    REQUIRE(!m->halted());
    REQUIRE(!m->interruptsEnabled());
    m->run();
    REQUIRE(m->lastPC() == 0x08);
    // Return address is the instruction after hlt
    REQUIRE(m->read_ram(0xfe) == 0x05);

    // Disabled interrupts are ignored
    REQUIRE(!m->irq(2));
}

TEST_CASE("emu.aliases", "[emulator]")
{
    auto m = runCode({
        0x08,             // nop
        0xcb, 0x05, 0x00, // jmp 5
        0x76,             //
        0x3e, 0x09,       // mvi a,9
        0x76,             // hlt
    });
    REQUIRE(m->get<Reg::A>() == 9);
    REQUIRE(m->lastPC() == 0x07);
}

TEST_CASE("emu.budget", "[emulator]")
{
    auto m = std::make_unique<eighty::Machine<>>();
    m->write_ram(0, V8{0xc3, 0x00, 0x00}.data(), 3); // jmp 0
    auto cycles = m->run(100);
    REQUIRE(!m->halted());
    REQUIRE(cycles >= 100);
    REQUIRE(cycles < 110);
}

TEST_CASE("emu.budget_limit", "[emulator]")
{
    // jmp 0 never halts, and the budget sits right at the top of the range
    auto m = std::make_unique<eighty::Machine<>>();
    V8 const code{0xc3, 0x00, 0x00};
    m->write_ram(0, code.data(), code.size());
    auto cycles = m->run(0xffffffff);
    REQUIRE(!m->halted());
    REQUIRE(cycles == 0xffffffff);
}

TEST_CASE("emu.after_run", "[emulator]")
{
    auto m = runCode<RunPolicy>({0x00, 0x76});
    REQUIRE(m->halted());
    REQUIRE(m->policy().runs == 1);

    // Also called when the budget runs out
    m->reset();
    m->write_ram(0, V8{0xc3, 0x00, 0x00}.data(), 3);
    m->run(100);
    REQUIRE(m->policy().runs == 2);
}

TEST_CASE("emu.clear_ram", "[emulator]")
{
    auto m = runCode({0x3e, 0x12, 0x32, 0x00, 0x20, 0x76});
    REQUIRE(m->read_ram(0x2000) == 0x12);
    REQUIRE(m->read_ram(0x0000) == 0x3e);

    m->clear_ram();
    V8 all(0x10000, 0xff);
    m->read_ram(0, all.data(), all.size());
    REQUIRE(all == V8(0x10000, 0));
    REQUIRE(m->get<Reg::A>() == 0x12);
}

TEST_CASE("emu.each_op", "[emulator]")
{
    auto m = runCode<StepPolicy>({0x00, 0x00, 0x00, 0x00, 0x00, 0x76});
    REQUIRE(!m->halted());
    REQUIRE(m->policy().ops == 3);
    REQUIRE(m->regPC() == 3);
}

TEST_CASE("emu.reset", "[emulator]")
{
    auto m = runCode({0x3e, 0x12, 0x32, 0x00, 0x20, 0x37, 0x76});
    REQUIRE(m->halted());
    m->reset();
    REQUIRE(!m->halted());
    REQUIRE(m->get<Reg::A>() == 0);
    REQUIRE(!m->carry());
    REQUIRE(m->flags() == 0x02);
    REQUIRE(m->read_ram(0x2000) == 0x12);

    m->set<Reg::PSW>(0x55d7);
    REQUIRE(m->get<Reg::A>() == 0x55);
    REQUIRE(m->flags() == 0xd7);
}

TEST_CASE("emu.instruction_table", "[emulator]")
{
    auto const& table = eighty::Machine<>::getInstructions();
    std::vector<int> seen(256, 0);
    for (auto const& i : table) {
        for (auto const& o : i.opcodes) {
            seen[o.code]++;
            REQUIRE(o.cycles == eighty::cycleTable[o.code]);
        }
    }
    int documented = 0;
    for (auto n : seen) {
        REQUIRE(n <= 1);
        documented += n;
    }
    // 256 minus 12 undocumented aliases
    REQUIRE(documented == 244);
}
