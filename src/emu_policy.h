#pragma once

#include "disasm.h"
#include "emulator.h"

#include <fmt/format.h>

#include <cstdint>
#include <string>

struct EmuPolicy : public eighty::DefaultPolicy
{
    explicit EmuPolicy(eighty::Machine<EmuPolicy>& m) : machine(m) {}

    eighty::Machine<EmuPolicy>& machine;

    // Print every executed instruction with the resulting registers
    bool trace = false;
    uint64_t ops = 0;

    // Bytes written with OUT, any port
    std::string output;

    // This function is run after each opcode. Return true to stop emulation.
    static bool eachOp(EmuPolicy& policy)
    {
        policy.ops++;
        if (policy.trace) {
            auto const& m = policy.machine;
            auto pc = m.lastPC();
            [[maybe_unused]] auto [a, b, c, d, e, h, l, sp, npc] = m.regs();
            fmt::print("{:04x} : {:<14} A {:02x} BC {:02x}{:02x} DE {:02x}{:02x} "
                       "HL {:02x}{:02x} SP {:04x} F {:02x}\n",
                       pc, eighty::disassembleAt(m, pc).text, a, b, c, d, e,
                       h, l, sp, m.flags());
        }
        return false;
    }

    static void ioWrite(EmuPolicy& policy, uint8_t /*port*/, uint8_t v)
    {
        policy.output.push_back(static_cast<char>(v));
    }
};
