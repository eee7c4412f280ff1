#include "emulated.h"
#include "defines.h"
#include "emulator.h"
#include "programs.h"
#include "routines.h"

#include <coreutils/log.h>
#include <fmt/format.h>

#include <memory>

namespace eighty {

namespace {

// Both routines are linear in the byte count, this is plenty
constexpr uint32_t CycleBudget = 0x1000000;

using Layout = EmulatedLayout;

std::unique_ptr<Machine<>> makeMachine(std::vector<uint8_t> const& routine)
{
    auto m = std::make_unique<Machine<>>();

    // call Routine; hlt
    uint8_t const stub[] = {0xcd, Layout::Routine & 0xff, Layout::Routine >> 8,
                            0x76};
    m->write_ram(Layout::Stub, stub, sizeof(stub));
    m->write_ram(Layout::Routine, routine.data(), routine.size());
    m->setSP(StackTop);
    m->setPC(Layout::Stub);
    return m;
}

template <typename POLICY>
uint32_t runToHalt(Machine<POLICY>& m, char const* what)
{
    auto cycles = m.run(CycleBudget);
    if (!m.halted()) {
        throw machine_error(
            fmt::format("{}: no halt after {} cycles, pc at {:04x}", what,
                        cycles, m.regPC()));
    }
    LOGD("%s finished in %d cycles", what, cycles);
    return cycles;
}

} // namespace

uint32_t emulated_capitalize(std::span<uint8_t> buffer, size_t length)
{
    if (length > buffer.size()) {
        throw routine_error(
            fmt::format("capitalize: length {} exceeds buffer of {} bytes",
                        length, buffer.size()));
    }
    if (length > 0xff) {
        throw routine_error(fmt::format(
            "capitalize: 8080 routine counts in C, length {} > 255", length));
    }

    auto m = makeMachine(capitalizeRoutine(Layout::Routine));
    m->write_ram(Layout::Source, buffer.data(), length);
    m->set<Reg::H>(Layout::Source >> 8);
    m->set<Reg::L>(Layout::Source & 0xff);
    m->set<Reg::C>(static_cast<unsigned>(length));

    auto cycles = runToHalt(*m, "capitalize");
    m->read_ram(Layout::Source, buffer.data(), length);
    return cycles;
}

uint32_t emulated_copy_bytes(std::span<uint8_t const> source,
                             std::span<uint8_t> target, size_t count)
{
    if (count > 0) {
        if (count > source.size() || count > target.size()) {
            throw routine_error(fmt::format(
                "copy_bytes: count {} exceeds source ({}) or target ({})",
                count, source.size(), target.size()));
        }
        if (overlaps(source.data(), target.data(), count)) {
            throw routine_error("copy_bytes: source and target overlap");
        }
        if (count > Layout::Window) {
            throw routine_error(
                fmt::format("copy_bytes: count {} larger than the {} byte "
                            "emulator window",
                            count, Layout::Window));
        }
    }

    auto m = makeMachine(memcpyRoutine(Layout::Routine));
    m->write_ram(Layout::Source, source.data(), count);
    m->set<Reg::B>(static_cast<unsigned>(count >> 8));
    m->set<Reg::C>(static_cast<unsigned>(count & 0xff));
    m->set<Reg::D>(Layout::Source >> 8);
    m->set<Reg::E>(Layout::Source & 0xff);
    m->set<Reg::H>(Layout::Target >> 8);
    m->set<Reg::L>(Layout::Target & 0xff);

    auto cycles = runToHalt(*m, "copy_bytes");
    m->read_ram(Layout::Target, target.data(), count);
    return cycles;
}

} // namespace eighty
