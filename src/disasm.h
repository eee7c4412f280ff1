#pragma once

#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace eighty {

struct Disassembly
{
    std::string text;
    int size = 1;
};

// Disassemble the instruction at `pc`, fetching bytes through `read`
Disassembly disassemble(std::function<uint8_t(uint16_t)> const& read,
                        uint16_t pc);

// Disassemble the instruction at `pc` in a Machine's memory
template <typename MACHINE>
Disassembly disassembleAt(MACHINE const& m, uint16_t pc)
{
    std::function<uint8_t(uint16_t)> const read = [&m](uint16_t adr) {
        return m.read_mem(adr);
    };
    return disassemble(read, pc);
}

// Disassemble a whole image loaded at `org`
std::vector<std::pair<uint16_t, std::string>>
disassemble(std::span<uint8_t const> image, uint16_t org);

// "0000 : lxi sp,$9fff" lines, newline terminated
std::string listing(std::span<uint8_t const> image, uint16_t org);

} // namespace eighty
