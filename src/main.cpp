#include "defines.h"
#include "disasm.h"
#include "emu_policy.h"
#include "emulated.h"
#include "programs.h"
#include "runner.h"

#include <coreutils/file.h>
#include <coreutils/log.h>

#include <CLI/CLI.hpp>
#include <fmt/format.h>

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

static const char* const banner = R"(
      _       _     _
  ___(_) __ _| |__ | |_ _   _
 / _ \ |/ _` | '_ \| __| | | |
|  __/ | (_| | | | | |_| |_| |
 \___|_|\__, |_| |_|\__|\__, |
        |___/           |___/
8080 emulator (1.0)
)";

struct EmulatorState
{
    std::string programFile;
    std::string orgText = "0";
    std::string startText;
    std::vector<std::string> dumps;
    std::string capitalizeText;
    uint32_t maxCycles = 100'000'000;
    bool trace = false;
    bool list = false;
    bool demo = false;
    bool quiet = false;
    bool verbose = false;
    bool doCapitalize = false;

    uint16_t org = 0;
    uint16_t start = 0;

    std::vector<eighty::DumpRange> dumpRanges;

    void parseArgs(int argc, char** argv)
    {
        CLI::App app{"eighty"};
        app.set_help_flag();
        auto* help = app.add_flag("-h,--help", "Request help");
        app.add_option("-o,--org", orgText, "Load address");
        app.add_option("-s,--start", startText,
                       "Start address (defaults to org)");
        app.add_option("--max-cycles", maxCycles, "Cycle budget");
        app.add_flag("-t,--trace", trace, "Trace executed instructions");
        app.add_option("-d,--dump", dumps, "Dump memory ADDR:LEN after run");
        app.add_flag("-l,--list", list, "Disassemble instead of running");
        auto* cap = app.add_option("-c,--capitalize", capitalizeText,
                                   "Capitalize TEXT on the 8080");
        app.add_flag("--demo", demo, "Run the built in programs");
        app.add_flag("-q,--quiet", quiet, "Less noise");
        app.add_flag("-v,--verbose", verbose, "Debug logging");
        app.add_option("program", programFile, "Binary image to run")
            ->check(CLI::ExistingFile);

        bool showHelp = false;

        try {
            app.parse(argc, argv);
            showHelp = (*help || (programFile.empty() && !demo &&
                                  cap->count() == 0));
            if (showHelp) {
                if (!quiet) puts(banner + 1);

                throw CLI::CallForHelp();
            }
        } catch (const CLI::ParseError& e) {
            exit(app.exit(e));
        }

        doCapitalize = cap->count() > 0;
        org = eighty::parseAddress(orgText, "--org");
        start = startText.empty() ? org
                                  : eighty::parseAddress(startText, "--start");

        for (auto const& d : dumps) {
            dumpRanges.push_back(eighty::parseDump(d));
        }

        logging::setLevel(verbose ? logging::Level::Debug
                                  : logging::Level::Info);
    }
};

static int runDemo(bool quiet)
{
    auto show = [&](char const* name, eighty::Program const& program,
                    uint16_t at, size_t len) {
        auto m = std::make_unique<eighty::Machine<EmuPolicy>>();
        auto res = eighty::runProgram(*m, program, program.org, 100000);
        fmt::print("{}: {} instructions, {} cycles\n", name, res.instructions,
                   res.cycles);
        fmt::print("{}", eighty::dumpMemory(*m, at, len));
        if (!quiet) fmt::print("{}", eighty::stateString(*m));
        return res.halted;
    };

    using CL = eighty::CapitalizeLayout;
    using ML = eighty::MemcpyLayout;
    bool ok = show("capitalize", eighty::capitalizeProgram(), CL::String,
                   CL::Length);
    ok = show("memcpy", eighty::memcpyProgram(), ML::Target,
              ML::TargetLength) &&
         ok;
    return ok ? 0 : 2;
}

static int run(EmulatorState const& state)
{
    if (state.doCapitalize) {
        std::vector<uint8_t> buf(state.capitalizeText.begin(),
                                 state.capitalizeText.end());
        auto cycles = eighty::emulated_capitalize(buf, buf.size());
        fmt::print("{}\n", std::string(buf.begin(), buf.end()));
        if (!state.quiet) fmt::print("({} cycles)\n", cycles);
        if (state.programFile.empty() && !state.demo) return 0;
    }

    if (state.demo) {
        auto rc = runDemo(state.quiet);
        if (state.programFile.empty()) return rc;
    }

    auto program = eighty::loadProgram(state.programFile, state.org);

    if (state.list) {
        fmt::print("{}", eighty::listing(program.data, program.org));
        return 0;
    }

    auto m = std::make_unique<eighty::Machine<EmuPolicy>>();
    m->policy().trace = state.trace;
    auto res = eighty::runProgram(*m, program, state.start, state.maxCycles);

    if (!m->policy().output.empty()) {
        fmt::print("{}", m->policy().output);
    }
    if (!state.quiet) {
        fmt::print("{}", eighty::stateString(*m));
        fmt::print("{} instructions, {} cycles\n", res.instructions,
                   res.cycles);
    }
    for (auto const& d : state.dumpRanges) {
        fmt::print("{}", eighty::dumpMemory(*m, d.start, d.len));
    }
    return eighty::exitCode(res);
}

int main(int argc, char** argv)
{
    EmulatorState state;
    try {
        state.parseArgs(argc, argv);
        return run(state);
    } catch (utils::io_exception&) {
        fmt::print(stderr, "**Error: Could not read {}\n", state.programFile);
    } catch (eighty::machine_error& e) {
        fmt::print(stderr, "**Error: {}\n", e.what());
    } catch (eighty::routine_error& e) {
        fmt::print(stderr, "**Error: {}\n", e.what());
    }
    return 1;
}
