#pragma once

#include <cstdint>

namespace eighty {

// Operand modes
enum class Mode : uint8_t
{
    NONE,
    IMM8,
    IMM16,
    ADR, // 16 bit address operand (jumps, calls, direct loads)
    PORT,
};

// Register numbers as encoded in the opcode (sss / ddd fields)
enum class Reg : uint8_t
{
    B,
    C,
    D,
    E,
    H,
    L,
    M, // Memory at (HL)
    A,
    SP,
    PC,
    PSW
};

// Condition codes as encoded in the opcode (ccc field)
enum class Cond : uint8_t
{
    NZ,
    Z,
    NC,
    C,
    PO,
    PE,
    P,
    M
};

static constexpr inline int opSize(Mode m)
{
    return (m == Mode::IMM16 || m == Mode::ADR)
               ? 3
               : ((m == Mode::IMM8 || m == Mode::PORT) ? 2 : 1);
}

} // namespace eighty
