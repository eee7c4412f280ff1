#include "programs.h"

#include <initializer_list>
#include <string_view>

namespace eighty {

namespace {

constexpr uint8_t lo(unsigned a)
{
    return a & 0xff;
}
constexpr uint8_t hi(unsigned a)
{
    return (a >> 8) & 0xff;
}

void emit(std::vector<uint8_t>& out, std::initializer_list<uint8_t> bytes)
{
    out.insert(out.end(), bytes.begin(), bytes.end());
}

} // namespace

std::vector<uint8_t> capitalizeRoutine(uint16_t org)
{
    unsigned const skipIt = org + 0x14;
    unsigned const allDone = org + 0x19;

    std::vector<uint8_t> code;
    emit(code, {0x79});                           // mov a,c
    emit(code, {0xfe, 0x00});                     // cpi 0
    emit(code, {0xca, lo(allDone), hi(allDone)}); // jz AllDone
    emit(code, {0x7e});                           // mov a,m
    emit(code, {0xfe, 0x61});                     // cpi 'a'
    emit(code, {0xda, lo(skipIt), hi(skipIt)});   // jc SkipIt
    emit(code, {0xfe, 0x7b});                     // cpi 'z'+1
    emit(code, {0xd2, lo(skipIt), hi(skipIt)});   // jnc SkipIt
    emit(code, {0xd6, 0x20});                     // sui 20h
    emit(code, {0x77});                           // mov m,a
    // SkipIt:
    emit(code, {0x23});                 // inx h
    emit(code, {0x0d});                 // dcr c
    emit(code, {0xc3, lo(org), hi(org)}); // jmp Capitalize
    // AllDone:
    emit(code, {0xc9}); // ret
    return code;
}

std::vector<uint8_t> memcpyRoutine(uint16_t org)
{
    unsigned const loop = org + 3;

    std::vector<uint8_t> code;
    emit(code, {0x78}); // mov a,b
    emit(code, {0xb1}); // ora c
    emit(code, {0xc8}); // rz
    // loop:
    emit(code, {0x1a});                     // ldax d
    emit(code, {0x77});                     // mov m,a
    emit(code, {0x13});                     // inx d
    emit(code, {0x23});                     // inx h
    emit(code, {0x0b});                     // dcx b
    emit(code, {0x78});                     // mov a,b
    emit(code, {0xb1});                     // ora c
    emit(code, {0xc2, lo(loop), hi(loop)}); // jnz loop
    emit(code, {0xc9});                     // ret
    return code;
}

Program capitalizeProgram()
{
    using L = CapitalizeLayout;
    Program p;
    auto& out = p.data;
    emit(out, {0x31, lo(StackTop), hi(StackTop)}); // lxi sp,9fffh
    emit(out, {0x21, lo(L::String), hi(L::String)}); // lxi h,str
    emit(out, {0x0e, static_cast<uint8_t>(L::Length)}); // mvi c,14
    emit(out, {0xcd, lo(L::Routine), hi(L::Routine)}); // call Capitalize
    emit(out, {0x76});                                // hlt

    auto routine = capitalizeRoutine(L::Routine);
    out.insert(out.end(), routine.begin(), routine.end());

    constexpr std::string_view text = "hello, friends";
    static_assert(text.size() == L::Length);
    out.insert(out.end(), text.begin(), text.end());
    return p;
}

Program memcpyProgram()
{
    using L = MemcpyLayout;
    Program p;
    auto& out = p.data;
    emit(out, {0x11, lo(L::Source), hi(L::Source)}); // lxi d,SourceArray
    emit(out, {0x21, lo(L::Target), hi(L::Target)}); // lxi h,TargetArray
    emit(out, {0x31, lo(StackTop), hi(StackTop)});   // lxi sp,9fffh
    emit(out, {0x06, 0x00});                         // mvi b,0
    emit(out, {0x0e, static_cast<uint8_t>(L::SourceLength)}); // mvi c,5
    emit(out, {0xcd, lo(L::Routine), hi(L::Routine)}); // call memcpy
    emit(out, {0x76});                                // hlt

    emit(out, {0x11, 0x22, 0x33, 0x44, 0x55});
    out.resize(out.size() + L::TargetLength, 0);

    auto routine = memcpyRoutine(L::Routine);
    out.insert(out.end(), routine.begin(), routine.end());
    return p;
}

} // namespace eighty
