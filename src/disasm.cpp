#include "disasm.h"
#include "emulator.h"

#include <fmt/format.h>

#include <array>

namespace eighty {

// clang-format off
constexpr static std::array modeTemplate = {
        "",
        "${:02x}",
        "${:04x}",
        "${:04x}",
        "${:02x}",
};
// clang-format on

namespace {

struct Entry
{
    char const* name = nullptr;
    std::string args;
    Mode mode = Mode::NONE;
};

// Undocumented opcodes decode as the instruction they behave like
constexpr std::array<std::pair<uint8_t, uint8_t>, 12> aliases{{
    {0x08, 0x00},
    {0x10, 0x00},
    {0x18, 0x00},
    {0x20, 0x00},
    {0x28, 0x00},
    {0x30, 0x00},
    {0x38, 0x00},
    {0xcb, 0xc3},
    {0xd9, 0xc9},
    {0xdd, 0xcd},
    {0xed, 0xcd},
    {0xfd, 0xcd},
}};

std::array<Entry, 256> const& opcodeMap()
{
    static std::array<Entry, 256> const map = [] {
        std::array<Entry, 256> m{};
        for (auto const& i : Machine<>::getInstructions()) {
            for (auto const& o : i.opcodes) {
                m[o.code] = Entry{i.name, o.args, o.mode};
            }
        }
        for (auto const& [alias, real] : aliases) {
            m[alias] = m[real];
        }
        return m;
    }();
    return map;
}

} // namespace

Disassembly disassemble(std::function<uint8_t(uint16_t)> const& read,
                        uint16_t pc)
{
    auto code = read(pc);
    auto const& entry = opcodeMap()[code];
    if (entry.name == nullptr) {
        return {fmt::format("db ${:02x}", code), 1};
    }

    auto size = opSize(entry.mode);
    unsigned v = 0;
    if (size == 2) {
        v = read(pc + 1);
    } else if (size == 3) {
        v = read(pc + 1) | (read(pc + 2) << 8);
    }

    std::string text = entry.name;
    if (!entry.args.empty()) {
        text += " " + entry.args;
    }
    if (entry.mode != Mode::NONE) {
        text += entry.args.empty() ? " " : ",";
        text += fmt::format(
            fmt::runtime(modeTemplate.at(static_cast<int>(entry.mode))), v);
    }
    return {text, size};
}

std::vector<std::pair<uint16_t, std::string>>
disassemble(std::span<uint8_t const> image, uint16_t org)
{
    std::vector<std::pair<uint16_t, std::string>> result;
    std::function<uint8_t(uint16_t)> const read = [&](uint16_t adr) {
        auto offset = static_cast<uint16_t>(adr - org);
        return offset < image.size() ? image[offset] : 0;
    };
    size_t offset = 0;
    while (offset < image.size()) {
        auto pc = static_cast<uint16_t>(org + offset);
        auto d = disassemble(read, pc);
        result.emplace_back(pc, d.text);
        offset += d.size;
    }
    return result;
}

std::string listing(std::span<uint8_t const> image, uint16_t org)
{
    std::string out;
    for (auto const& [pc, text] : disassemble(image, org)) {
        out += fmt::format("{:04x} : {}\n", pc, text);
    }
    return out;
}

} // namespace eighty
