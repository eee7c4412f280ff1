#include "runner.h"

#include <coreutils/file.h>
#include <coreutils/log.h>

namespace eighty {

int exitCode(RunResult const& result)
{
    return result.halted ? 0 : 2;
}

uint16_t parseAddress(std::string const& text, char const* what)
{
    auto v = parseNumber(text);
    if (!v || *v > 0xffff) {
        throw machine_error(
            fmt::format("{}: '{}' is not a 16 bit address", what, text));
    }
    return static_cast<uint16_t>(*v);
}

DumpRange parseDump(std::string const& text)
{
    DumpRange range;
    auto colon = text.find(':');
    range.start = parseAddress(text.substr(0, colon), "--dump");
    if (colon != std::string::npos) {
        auto len = parseNumber(text.substr(colon + 1));
        if (!len || *len > 0x10000) {
            throw machine_error(fmt::format("--dump: bad length in '{}'", text));
        }
        range.len = *len;
    }
    return range;
}

Program loadProgram(fs::path const& path, uint16_t org)
{
    utils::File f{path.string()};
    Program program;
    program.org = org;
    program.data = f.readAll();

    if (org + program.data.size() > 0x10000) {
        throw machine_error(fmt::format(
            "{}: {} bytes at {:04x} do not fit in 64K", path.string(),
            program.data.size(), org));
    }
    LOGD("Loaded %d bytes at %04x from %s", program.data.size(), org,
         path.string());
    return program;
}

void loadInto(Machine<EmuPolicy>& m, Program const& program)
{
    m.write_ram(program.org, program.data.data(), program.data.size());
}

RunResult runProgram(Machine<EmuPolicy>& m, Program const& program,
                     uint16_t start, uint32_t maxCycles)
{
    loadInto(m, program);
    m.setPC(start);

    auto before = m.policy().ops;
    RunResult result;
    result.cycles = m.run(maxCycles);
    result.instructions = m.policy().ops - before;
    result.halted = m.halted();
    if (result.halted) {
        LOGD("Halted at %04x after %d cycles", m.lastPC(), result.cycles);
    } else {
        LOGI("Stopped at %04x, cycle budget of %d used up", m.regPC(),
             maxCycles);
    }
    return result;
}

} // namespace eighty
