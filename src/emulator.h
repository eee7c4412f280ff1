#pragma once

#include "8080.h"

#include <algorithm>
#include <array>
#include <cstdint>
#include <limits>
#include <string>
#include <tuple>
#include <vector>

namespace eighty {

template <typename POLICY>
struct Machine;

// The Policy defines the compile & runtime time settings for the emulator
struct DefaultPolicy
{
    DefaultPolicy() = default;
    explicit DefaultPolicy(Machine<DefaultPolicy>&) {}

    static constexpr int MemSize = 65536;

    // This function is run after each opcode. Return true to stop emulation.
    static constexpr bool eachOp(DefaultPolicy&) { return false; }
    static constexpr void afterRun(DefaultPolicy&) {}

    // IN / OUT instructions
    static constexpr uint8_t ioRead(DefaultPolicy&, uint8_t /*port*/)
    {
        return 0xff;
    }
    static constexpr void ioWrite(DefaultPolicy&, uint8_t /*port*/,
                                  uint8_t /*v*/)
    {}
};

// clang-format off
// Base cycles per opcode. Conditional call and return list the cycles for
// the not-taken case; a taken one costs 6 more.
static constexpr std::array<uint8_t, 256> cycleTable = {
     4, 10,  7,  5,  5,  5,  7,  4,  4, 10,  7,  5,  5,  5,  7,  4, // 00
     4, 10,  7,  5,  5,  5,  7,  4,  4, 10,  7,  5,  5,  5,  7,  4, // 10
     4, 10, 16,  5,  5,  5,  7,  4,  4, 10, 16,  5,  5,  5,  7,  4, // 20
     4, 10, 13,  5, 10, 10, 10,  4,  4, 10, 13,  5,  5,  5,  7,  4, // 30
     5,  5,  5,  5,  5,  5,  7,  5,  5,  5,  5,  5,  5,  5,  7,  5, // 40
     5,  5,  5,  5,  5,  5,  7,  5,  5,  5,  5,  5,  5,  5,  7,  5, // 50
     5,  5,  5,  5,  5,  5,  7,  5,  5,  5,  5,  5,  5,  5,  7,  5, // 60
     7,  7,  7,  7,  7,  7,  7,  7,  5,  5,  5,  5,  5,  5,  7,  5, // 70
     4,  4,  4,  4,  4,  4,  7,  4,  4,  4,  4,  4,  4,  4,  7,  4, // 80
     4,  4,  4,  4,  4,  4,  7,  4,  4,  4,  4,  4,  4,  4,  7,  4, // 90
     4,  4,  4,  4,  4,  4,  7,  4,  4,  4,  4,  4,  4,  4,  7,  4, // a0
     4,  4,  4,  4,  4,  4,  7,  4,  4,  4,  4,  4,  4,  4,  7,  4, // b0
     5, 10, 10, 10, 11, 11,  7, 11,  5, 10, 10, 10, 11, 17,  7, 11, // c0
     5, 10, 10, 10, 11, 11,  7, 11,  5, 10, 10, 10, 11, 17,  7, 11, // d0
     5, 10, 10, 18, 11, 11,  7, 11,  5,  5, 10,  4, 11, 17,  7, 11, // e0
     5, 10, 10,  4, 11, 11,  7, 11,  5,  5, 10,  4, 11, 17,  7, 11, // f0
};
// clang-format on

template <typename POLICY = DefaultPolicy>
struct Machine
{
    static_assert((POLICY::MemSize & (POLICY::MemSize - 1)) == 0,
                  "MemSize must be a power of two");

    using Adr = uint16_t;
    using Word = uint8_t;

    struct Opcode
    {
        Opcode() = default;
        Opcode(uint8_t code, int cycles, Mode mode, std::string args = {})
            : code(code), cycles(cycles), mode(mode), args(std::move(args))
        {
        }
        uint8_t code = 0;
        uint8_t cycles = 0;
        Mode mode = Mode::NONE;
        // Fixed operands encoded in the opcode ("a,m", "sp", "3")
        std::string args;
    };

    struct Instruction
    {
        Instruction(char const* name, std::vector<Opcode> ov)
            : name(name), opcodes(std::move(ov))
        {
        }
        char const* name;
        std::vector<Opcode> opcodes;
    };

    ~Machine() = default;
    Machine(Machine&& op) noexcept = default;
    Machine& operator=(Machine&& op) noexcept = default;

    Machine() : policy_{*this} { ram.fill(0); }

    POLICY policy_;

    POLICY& policy() { return policy_; }

    // Access ram directly

    void write_ram(uint16_t org, Word const data) { ram[mask(org)] = data; }

    void clear_ram() { std::fill(ram.begin(), ram.end(), 0); }

    void write_ram(uint16_t org, uint8_t const* data, size_t size)
    {
        for (size_t i = 0; i < size; i++)
            ram[mask(org + i)] = data[i];
    }

    void read_ram(uint16_t org, uint8_t* data, size_t size) const
    {
        for (size_t i = 0; i < size; i++)
            data[i] = ram[mask(org + i)];
    }

    [[nodiscard]] uint8_t read_ram(uint16_t org) const
    {
        return ram[mask(org)];
    }

    [[nodiscard]] uint8_t read_mem(uint16_t org) const { return Read(org); }

    // Registers

    template <enum Reg REG>
    [[nodiscard]] unsigned get() const
    {
        if constexpr (REG == Reg::M) return Read(hl());
        else if constexpr (REG == Reg::PSW) return (a << 8) | get_flags();
        else return Register<REG>();
    }

    template <enum Reg REG>
    void set(unsigned v)
    {
        if constexpr (REG == Reg::M) {
            Write(hl(), v);
        } else if constexpr (REG == Reg::PSW) {
            a = (v >> 8) & 0xff;
            set_flags(v);
        } else if constexpr (REG == Reg::SP || REG == Reg::PC) {
            Register<REG>() = v & 0xffff;
        } else {
            Register<REG>() = v & 0xff;
        }
    }

    [[nodiscard]] Adr regPC() const { return pc; }
    void setPC(uint16_t const& p) { pc = p; }
    [[nodiscard]] Adr regSP() const { return sp; }
    void setSP(uint16_t const& s) { sp = s; }

    // Address of the most recently executed opcode
    [[nodiscard]] Adr lastPC() const { return opPC; }

    [[nodiscard]] bool halted() const { return halt; }
    [[nodiscard]] bool interruptsEnabled() const { return inte; }

    auto regs() const { return std::make_tuple(a, b, c, d, e, h, l, sp, pc); }

    // S Z 0 AC 0 P 1 CY
    [[nodiscard]] uint8_t flags() const { return get_flags(); }

    [[nodiscard]] bool carry() const { return cy; }
    [[nodiscard]] bool zero() const { return z; }
    [[nodiscard]] bool sign() const { return s; }
    [[nodiscard]] bool parity() const { return p; }
    [[nodiscard]] bool auxCarry() const { return ac; }

    // Registers and flags back to power-on state; RAM is kept
    void reset()
    {
        a = b = c = d = e = h = l = 0;
        sp = pc = opPC = 0;
        cy = ac = z = s = p = false;
        halt = false;
        inte = false;
        cycles = 0;
    }

    // Deliver RST n if interrupts are enabled. Wakes a halted machine.
    bool irq(unsigned rst)
    {
        if (!inte) return false;
        inte = false;
        halt = false;
        Push(pc);
        pc = (rst & 7) * 8;
        return true;
    }

    // Returns the cycles used, saturated at 0xffffffff
    uint32_t run(uint32_t toCycles = 0x10000000)
    {
        auto& pol = policy();
        cycles = 0;
        while (!halt && cycles < toCycles) {
            opPC = pc;
            auto code = ReadPC();
            cycles += cycleTable[code];
            execute(code);
            if (POLICY::eachOp(pol)) break;
        }
        POLICY::afterRun(pol);
        return static_cast<uint32_t>(
            std::min<uint64_t>(cycles, std::numeric_limits<uint32_t>::max()));
    }

    static auto const& getInstructions()
    {
        static std::vector<Instruction> const instructionTable =
            makeInstructionTable();
        return instructionTable;
    }

private:
    // The 8080 registers
    unsigned pc{0};
    unsigned sp{0};
    unsigned a{0};
    unsigned b{0};
    unsigned c{0};
    unsigned d{0};
    unsigned e{0};
    unsigned h{0};
    unsigned l{0};

    // Condition bits
    bool cy{false};
    bool ac{false};
    bool z{false};
    bool s{false};
    bool p{false};

    bool halt{false};
    bool inte{false};

    unsigned opPC{0};
    uint64_t cycles = 0;

    std::array<Word, POLICY::MemSize> ram;

    static constexpr unsigned mask(unsigned adr)
    {
        return adr & (POLICY::MemSize - 1);
    }

    template <enum Reg REG>
    constexpr auto const& Register() const
    {
        if constexpr (REG == Reg::A) return a;
        if constexpr (REG == Reg::B) return b;
        if constexpr (REG == Reg::C) return c;
        if constexpr (REG == Reg::D) return d;
        if constexpr (REG == Reg::E) return e;
        if constexpr (REG == Reg::H) return h;
        if constexpr (REG == Reg::L) return l;
        if constexpr (REG == Reg::SP) return sp;
        if constexpr (REG == Reg::PC) return pc;
    }

    template <enum Reg REG>
    constexpr auto& Register()
    {
        if constexpr (REG == Reg::A) return a;
        if constexpr (REG == Reg::B) return b;
        if constexpr (REG == Reg::C) return c;
        if constexpr (REG == Reg::D) return d;
        if constexpr (REG == Reg::E) return e;
        if constexpr (REG == Reg::H) return h;
        if constexpr (REG == Reg::L) return l;
        if constexpr (REG == Reg::SP) return sp;
        if constexpr (REG == Reg::PC) return pc;
    }

    /////////////////////////////////////////////////////////////////////////
    ///
    /// THE FLAG REGISTER
    ///
    /////////////////////////////////////////////////////////////////////////

    // S Z - A - P - C
    // 7 6 5 4 3 2 1 0

    enum FLAG_BITS
    {
        CY = 0x01,
        ONE = 0x02,
        P = 0x04,
        AC = 0x10,
        Z = 0x40,
        S = 0x80,
    };

    static constexpr bool parityOf(unsigned v)
    {
        v &= 0xff;
        v ^= v >> 4;
        v ^= v >> 2;
        v ^= v >> 1;
        return (v & 1) == 0;
    }

    [[nodiscard]] uint8_t get_flags() const
    {
        return (s ? S : 0) | (z ? Z : 0) | (ac ? AC : 0) | (p ? P : 0) | ONE |
               (cy ? CY : 0);
    }

    void set_flags(unsigned f)
    {
        s = (f & S) != 0;
        z = (f & Z) != 0;
        ac = (f & AC) != 0;
        p = (f & P) != 0;
        cy = (f & CY) != 0;
    }

    void setSZP(unsigned v)
    {
        v &= 0xff;
        s = (v & 0x80) != 0;
        z = v == 0;
        p = parityOf(v);
    }

    [[nodiscard]] bool check(unsigned cond) const
    {
        switch (static_cast<Cond>(cond & 7)) {
        case Cond::NZ: return !z;
        case Cond::Z: return z;
        case Cond::NC: return !cy;
        case Cond::C: return cy;
        case Cond::PO: return !p;
        case Cond::PE: return p;
        case Cond::P: return !s;
        case Cond::M: return s;
        }
        return false;
    }

    /////////////////////////////////////////////////////////////////////////
    ///
    /// MEMORY ACCESS
    ///
    /////////////////////////////////////////////////////////////////////////

    // Get low byte from an address
    static constexpr unsigned lo(unsigned a) { return a & 0xff; }
    // Get high byte from an address
    static constexpr unsigned hi(unsigned a) { return (a >> 8) & 0xff; }

    // Form an address from lo and hi byte
    static constexpr unsigned to_adr(unsigned lo, unsigned hi)
    {
        return (hi << 8) | lo;
    }

    [[nodiscard]] unsigned Read(unsigned adr) const { return ram[mask(adr)]; }

    void Write(unsigned adr, unsigned v) { ram[mask(adr)] = v & 0xff; }

    unsigned ReadPC()
    {
        auto v = Read(pc);
        pc = (pc + 1) & 0xffff;
        return v;
    }

    unsigned ReadPC16()
    {
        auto low = ReadPC();
        return to_adr(low, ReadPC());
    }

    [[nodiscard]] unsigned Read16(unsigned adr) const
    {
        return to_adr(Read(adr), Read(adr + 1));
    }

    void Write16(unsigned adr, unsigned v)
    {
        Write(adr, lo(v));
        Write(adr + 1, hi(v));
    }

    void Push(unsigned v)
    {
        sp = (sp - 1) & 0xffff;
        Write(sp, hi(v));
        sp = (sp - 1) & 0xffff;
        Write(sp, lo(v));
    }

    unsigned Pop()
    {
        auto low = Read(sp);
        sp = (sp + 1) & 0xffff;
        auto high = Read(sp);
        sp = (sp + 1) & 0xffff;
        return to_adr(low, high);
    }

    [[nodiscard]] unsigned hl() const { return to_adr(l, h); }

    [[nodiscard]] unsigned getReg(unsigned r) const
    {
        switch (r & 7) {
        case 0: return b;
        case 1: return c;
        case 2: return d;
        case 3: return e;
        case 4: return h;
        case 5: return l;
        case 6: return Read(hl());
        default: return a;
        }
    }

    void setReg(unsigned r, unsigned v)
    {
        v &= 0xff;
        switch (r & 7) {
        case 0: b = v; break;
        case 1: c = v; break;
        case 2: d = v; break;
        case 3: e = v; break;
        case 4: h = v; break;
        case 5: l = v; break;
        case 6: Write(hl(), v); break;
        default: a = v; break;
        }
    }

    // rp 3 is SP here; push/pop handle PSW themselves
    [[nodiscard]] unsigned getPair(unsigned rp) const
    {
        switch (rp & 3) {
        case 0: return to_adr(c, b);
        case 1: return to_adr(e, d);
        case 2: return to_adr(l, h);
        default: return sp;
        }
    }

    void setPair(unsigned rp, unsigned v)
    {
        v &= 0xffff;
        switch (rp & 3) {
        case 0: b = hi(v); c = lo(v); break;
        case 1: d = hi(v); e = lo(v); break;
        case 2: h = hi(v); l = lo(v); break;
        default: sp = v; break;
        }
    }

    /////////////////////////////////////////////////////////////////////////
    ///
    ///   OPCODES
    ///
    /////////////////////////////////////////////////////////////////////////

    void Add(unsigned v, unsigned carry)
    {
        unsigned rc = a + v + carry;
        ac = ((a & 0xf) + (v & 0xf) + carry) > 0xf;
        cy = rc > 0xff;
        a = rc & 0xff;
        setSZP(a);
    }

    // Subtract is done as an add of the complement, which is how AC comes
    // out on the real chip. CY is the inverted carry (borrow).
    unsigned Sub(unsigned v, unsigned borrow)
    {
        unsigned nv = (~v) & 0xff;
        unsigned rc = a + nv + (borrow ^ 1);
        ac = ((a & 0xf) + (nv & 0xf) + (borrow ^ 1)) > 0xf;
        cy = rc <= 0xff;
        setSZP(rc);
        return rc & 0xff;
    }

    void Alu(unsigned op, unsigned v)
    {
        switch (op & 7) {
        case 0: Add(v, 0); break;
        case 1: Add(v, cy ? 1 : 0); break;
        case 2: a = Sub(v, 0); break;
        case 3: a = Sub(v, cy ? 1 : 0); break;
        case 4:
            ac = ((a | v) & 0x08) != 0;
            a &= v;
            cy = false;
            setSZP(a);
            break;
        case 5:
            a = (a ^ v) & 0xff;
            cy = ac = false;
            setSZP(a);
            break;
        case 6:
            a = (a | v) & 0xff;
            cy = ac = false;
            setSZP(a);
            break;
        default: Sub(v, 0); break; // cmp
        }
    }

    void Inr(unsigned r)
    {
        unsigned v = (getReg(r) + 1) & 0xff;
        ac = (v & 0xf) == 0;
        setSZP(v);
        setReg(r, v);
    }

    void Dcr(unsigned r)
    {
        unsigned v = (getReg(r) - 1) & 0xff;
        ac = (v & 0xf) != 0xf;
        setSZP(v);
        setReg(r, v);
    }

    void Dad(unsigned rp)
    {
        unsigned rc = hl() + getPair(rp);
        cy = rc > 0xffff;
        setPair(2, rc);
    }

    void Daa()
    {
        unsigned corr = 0;
        bool carry = cy;
        unsigned lsb = a & 0xf;
        unsigned msb = a >> 4;
        if (ac || lsb > 9) corr |= 0x06;
        if (cy || msb > 9 || (msb >= 9 && lsb > 9)) {
            corr |= 0x60;
            carry = true;
        }
        Add(corr, 0);
        cy = carry;
    }

    void Call(unsigned adr)
    {
        Push(pc);
        pc = adr;
    }

    void PushPair(unsigned rp)
    {
        if ((rp & 3) == 3) Push(to_adr(get_flags(), a));
        else Push(getPair(rp));
    }

    void PopPair(unsigned rp)
    {
        auto v = Pop();
        if ((rp & 3) == 3) {
            a = hi(v);
            set_flags(lo(v));
        } else {
            setPair(rp, v);
        }
    }

    void execute(unsigned code)
    {
        // MOV / HLT
        if ((code & 0xc0) == 0x40) {
            if (code == 0x76) {
                halt = true;
                return;
            }
            setReg((code >> 3) & 7, getReg(code & 7));
            return;
        }
        // ADD, ADC, SUB, SBB, ANA, XRA, ORA, CMP
        if ((code & 0xc0) == 0x80) {
            Alu((code >> 3) & 7, getReg(code & 7));
            return;
        }

        unsigned const ddd = (code >> 3) & 7;
        unsigned const rp = (code >> 4) & 3;

        if ((code & 0xc0) == 0x00) {
            switch (code & 0x0f) {
            case 0x01: setPair(rp, ReadPC16()); return;
            case 0x03: setPair(rp, getPair(rp) + 1); return;
            case 0x09: Dad(rp); return;
            case 0x0b: setPair(rp, getPair(rp) - 1); return;
            default: break;
            }
            switch (code & 0x07) {
            case 0x04: Inr(ddd); return;
            case 0x05: Dcr(ddd); return;
            case 0x06: setReg(ddd, ReadPC()); return;
            default: break;
            }
            switch (code) {
            case 0x02: // stax b
            case 0x12: // stax d
                Write(getPair(rp), a);
                break;
            case 0x0a: // ldax b
            case 0x1a: // ldax d
                a = Read(getPair(rp));
                break;
            case 0x22: Write16(ReadPC16(), hl()); break;
            case 0x2a: setPair(2, Read16(ReadPC16())); break;
            case 0x32: Write(ReadPC16(), a); break;
            case 0x3a: a = Read(ReadPC16()); break;
            case 0x07: {
                unsigned bit = a >> 7;
                a = ((a << 1) | bit) & 0xff;
                cy = bit != 0;
                break;
            }
            case 0x0f: {
                unsigned bit = a & 1;
                a = (a >> 1) | (bit << 7);
                cy = bit != 0;
                break;
            }
            case 0x17: {
                unsigned bit = a >> 7;
                a = ((a << 1) | (cy ? 1 : 0)) & 0xff;
                cy = bit != 0;
                break;
            }
            case 0x1f: {
                unsigned bit = a & 1;
                a = (a >> 1) | (cy ? 0x80 : 0);
                cy = bit != 0;
                break;
            }
            case 0x27: Daa(); break;
            case 0x2f: a = (~a) & 0xff; break;
            case 0x37: cy = true; break;
            case 0x3f: cy = !cy; break;
            default: break; // nop and its aliases
            }
            return;
        }

        // 0xc0 - 0xff
        switch (code & 0x07) {
        case 0x00: // rcc
            if (check(ddd)) {
                pc = Pop();
                cycles += 6;
            }
            return;
        case 0x02: { // jcc
            auto adr = ReadPC16();
            if (check(ddd)) pc = adr;
            return;
        }
        case 0x04: { // ccc
            auto adr = ReadPC16();
            if (check(ddd)) {
                Call(adr);
                cycles += 6;
            }
            return;
        }
        case 0x06: Alu(ddd, ReadPC()); return;
        case 0x07: Call(ddd * 8); return; // rst
        default: break;
        }

        switch (code & 0x0f) {
        case 0x01: PopPair(rp); return;
        case 0x05: PushPair(rp); return;
        default: break;
        }

        switch (code) {
        case 0xc3:
        case 0xcb: pc = ReadPC16(); break;
        case 0xc9:
        case 0xd9: pc = Pop(); break;
        case 0xcd:
        case 0xdd:
        case 0xed:
        case 0xfd: Call(ReadPC16()); break;
        case 0xd3: POLICY::ioWrite(policy(), ReadPC(), a); break;
        case 0xdb: a = POLICY::ioRead(policy(), ReadPC()); break;
        case 0xe3: {
            auto v = Read16(sp);
            Write16(sp, hl());
            setPair(2, v);
            break;
        }
        case 0xe9: pc = hl(); break;
        case 0xeb:
            std::swap(h, d);
            std::swap(l, e);
            break;
        case 0xf3: inte = false; break;
        case 0xf9: sp = hl(); break;
        case 0xfb: inte = true; break;
        default: break;
        }
    }

    static std::vector<Instruction> makeInstructionTable()
    {
        static constexpr std::array<char const*, 8> r = {"b", "c", "d", "e",
                                                         "h", "l", "m", "a"};
        static constexpr std::array<char const*, 4> rp = {"b", "d", "h", "sp"};
        static constexpr std::array<char const*, 4> rpp = {"b", "d", "h",
                                                           "psw"};
        static constexpr std::array<char const*, 8> cc = {
            "nz", "z", "nc", "c", "po", "pe", "p", "m"};
        static constexpr std::array<char const*, 8> alu = {
            "add", "adc", "sub", "sbb", "ana", "xra", "ora", "cmp"};
        static constexpr std::array<char const*, 8> alui = {
            "adi", "aci", "sui", "sbi", "ani", "xri", "ori", "cpi"};

        auto op = [](unsigned code, Mode mode, std::string args = {}) {
            return Opcode(code, cycleTable[code], mode, std::move(args));
        };

        std::vector<Instruction> table = {
            {"nop", {op(0x00, Mode::NONE)}},
            {"hlt", {op(0x76, Mode::NONE)}},
            {"stax", {op(0x02, Mode::NONE, "b"), op(0x12, Mode::NONE, "d")}},
            {"ldax", {op(0x0a, Mode::NONE, "b"), op(0x1a, Mode::NONE, "d")}},
            {"shld", {op(0x22, Mode::ADR)}},
            {"lhld", {op(0x2a, Mode::ADR)}},
            {"sta", {op(0x32, Mode::ADR)}},
            {"lda", {op(0x3a, Mode::ADR)}},
            {"rlc", {op(0x07, Mode::NONE)}},
            {"rrc", {op(0x0f, Mode::NONE)}},
            {"ral", {op(0x17, Mode::NONE)}},
            {"rar", {op(0x1f, Mode::NONE)}},
            {"daa", {op(0x27, Mode::NONE)}},
            {"cma", {op(0x2f, Mode::NONE)}},
            {"stc", {op(0x37, Mode::NONE)}},
            {"cmc", {op(0x3f, Mode::NONE)}},
            {"jmp", {op(0xc3, Mode::ADR)}},
            {"call", {op(0xcd, Mode::ADR)}},
            {"ret", {op(0xc9, Mode::NONE)}},
            {"out", {op(0xd3, Mode::PORT)}},
            {"in", {op(0xdb, Mode::PORT)}},
            {"xthl", {op(0xe3, Mode::NONE)}},
            {"pchl", {op(0xe9, Mode::NONE)}},
            {"xchg", {op(0xeb, Mode::NONE)}},
            {"di", {op(0xf3, Mode::NONE)}},
            {"sphl", {op(0xf9, Mode::NONE)}},
            {"ei", {op(0xfb, Mode::NONE)}},
        };

        auto add = [&](char const* name, std::vector<Opcode> ops) {
            table.emplace_back(name, std::move(ops));
        };

        std::vector<Opcode> mov;
        for (unsigned dst = 0; dst < 8; dst++) {
            for (unsigned src = 0; src < 8; src++) {
                if (dst == 6 && src == 6) continue;
                mov.push_back(op(0x40 | (dst << 3) | src, Mode::NONE,
                                 std::string(r[dst]) + "," + r[src]));
            }
        }
        add("mov", std::move(mov));

        std::vector<Opcode> mvi, inr, dcr;
        for (unsigned i = 0; i < 8; i++) {
            mvi.push_back(op(0x06 | (i << 3), Mode::IMM8, r[i]));
            inr.push_back(op(0x04 | (i << 3), Mode::NONE, r[i]));
            dcr.push_back(op(0x05 | (i << 3), Mode::NONE, r[i]));
        }
        add("mvi", std::move(mvi));
        add("inr", std::move(inr));
        add("dcr", std::move(dcr));

        std::vector<Opcode> lxi, inx, dcx, dad, push, pop;
        for (unsigned i = 0; i < 4; i++) {
            lxi.push_back(op(0x01 | (i << 4), Mode::IMM16, rp[i]));
            inx.push_back(op(0x03 | (i << 4), Mode::NONE, rp[i]));
            dcx.push_back(op(0x0b | (i << 4), Mode::NONE, rp[i]));
            dad.push_back(op(0x09 | (i << 4), Mode::NONE, rp[i]));
            push.push_back(op(0xc5 | (i << 4), Mode::NONE, rpp[i]));
            pop.push_back(op(0xc1 | (i << 4), Mode::NONE, rpp[i]));
        }
        add("lxi", std::move(lxi));
        add("inx", std::move(inx));
        add("dcx", std::move(dcx));
        add("dad", std::move(dad));
        add("push", std::move(push));
        add("pop", std::move(pop));

        for (unsigned i = 0; i < 8; i++) {
            std::vector<Opcode> ops;
            for (unsigned src = 0; src < 8; src++)
                ops.push_back(op(0x80 | (i << 3) | src, Mode::NONE, r[src]));
            add(alu[i], std::move(ops));
            add(alui[i], {op(0xc6 | (i << 3), Mode::IMM8)});
        }

        // Conditional jumps, calls and returns get the condition in the name
        static std::array<std::string, 24> condNames;
        for (unsigned i = 0; i < 8; i++) {
            condNames[i] = std::string("j") + cc[i];
            condNames[8 + i] = std::string("c") + cc[i];
            condNames[16 + i] = std::string("r") + cc[i];
            add(condNames[i].c_str(), {op(0xc2 | (i << 3), Mode::ADR)});
            add(condNames[8 + i].c_str(), {op(0xc4 | (i << 3), Mode::ADR)});
            add(condNames[16 + i].c_str(), {op(0xc0 | (i << 3), Mode::NONE)});
        }

        std::vector<Opcode> rst;
        for (unsigned i = 0; i < 8; i++)
            rst.push_back(op(0xc7 | (i << 3), Mode::NONE, std::to_string(i)));
        add("rst", std::move(rst));

        return table;
    }
};

} // namespace eighty
