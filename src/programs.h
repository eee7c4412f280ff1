#pragma once

#include <cstdint>
#include <vector>

namespace eighty {

// A raw 8080 image and the address it is loaded at
struct Program
{
    uint16_t org = 0;
    std::vector<uint8_t> data;
};

// Stack pointer set up by the driver programs
constexpr uint16_t StackTop = 0x9fff;

// Capitalize subroutine. HL = buffer, C = length (8 bit).
// Clobbers A, C, HL and flags.
std::vector<uint8_t> capitalizeRoutine(uint16_t org);

// memcpy subroutine. BC = count, DE = source, HL = target.
// Clobbers A, BC, DE, HL and flags.
std::vector<uint8_t> memcpyRoutine(uint16_t org);

struct CapitalizeLayout
{
    static constexpr uint16_t Routine = 0x000c;
    static constexpr uint16_t String = 0x0026;
    static constexpr uint16_t Length = 14;
};

struct MemcpyLayout
{
    static constexpr uint16_t Source = 0x0011;
    static constexpr uint16_t SourceLength = 5;
    static constexpr uint16_t Target = 0x0016;
    static constexpr uint16_t TargetLength = 10;
    static constexpr uint16_t Routine = 0x0020;
};

// Capitalizes the built in string "hello, friends" and halts
Program capitalizeProgram();

// Copies 11 22 33 44 55 into a zeroed 10 byte target and halts
Program memcpyProgram();

} // namespace eighty
