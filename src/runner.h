#pragma once

#include "defines.h"
#include "emu_policy.h"
#include "emulator.h"
#include "programs.h"

#include <fmt/format.h>

#include <cstdint>
#include <string>

namespace eighty {

struct RunResult
{
    uint32_t cycles = 0;
    uint64_t instructions = 0;
    bool halted = false;
};

// Exit status for a finished run: 0 on HLT, 2 when the budget ran out
int exitCode(RunResult const& result);

struct DumpRange
{
    uint16_t start = 0;
    size_t len = 16;
};

// Parse ADDR or ADDR:LEN. LEN defaults to 16 and may not exceed 64K.
// Throws machine_error on bad input.
DumpRange parseDump(std::string const& text);

// Parse a 16 bit address, `what` names the option in the error message
uint16_t parseAddress(std::string const& text, char const* what);

// Read a raw binary image to be loaded at `org`.
// Throws machine_error if it does not fit in memory; file errors come
// through as utils::io_exception.
Program loadProgram(fs::path const& path, uint16_t org);

void loadInto(Machine<EmuPolicy>& m, Program const& program);

// Load, jump to `start` and run until HLT or until the budget is used up
RunResult runProgram(Machine<EmuPolicy>& m, Program const& program,
                     uint16_t start, uint32_t maxCycles);

template <typename POLICY>
std::string stateString(Machine<POLICY> const& m)
{
    auto [a, b, c, d, e, h, l, sp, pc] = m.regs();
    std::string out = "Final Processor State:\n";
    out += fmt::format("A  {:02x}  B  {:02x}  C  {:02x}  D  {:02x}  "
                       "E  {:02x}  H  {:02x}  L  {:02x}\n",
                       a, b, c, d, e, h, l);
    out += fmt::format("SP {:04x}  PC {:04x}\n", sp, pc);
    out += fmt::format("S {:d}  Z {:d}  AC {:d}  P {:d}  CY {:d}  ({:02x})\n",
                       m.sign(), m.zero(), m.auxCarry(), m.parity(),
                       m.carry(), m.flags());
    out += fmt::format("Halted {}  Interrupts {}\n", m.halted() ? "yes" : "no",
                       m.interruptsEnabled() ? "on" : "off");
    return out;
}

// 16 bytes per line: "0026 : 48 45 4c ..."
template <typename POLICY>
std::string dumpMemory(Machine<POLICY> const& m, uint16_t start, size_t len)
{
    std::string out;
    for (size_t i = 0; i < len; i += 16) {
        auto adr = static_cast<uint16_t>(start + i);
        out += fmt::format("{:04x} :", adr);
        for (size_t j = i; j < len && j < i + 16; j++) {
            auto v = m.read_mem(static_cast<uint16_t>(start + j));
            out += fmt::format(" {:02x}", v);
        }
        out += "\n";
    }
    return out;
}

} // namespace eighty
