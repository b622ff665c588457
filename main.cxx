/*
    Brisk - A direct brainfuck interpreter
    Main standalone file
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include <unistd.h>

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "ansi.hxx"
#include "dump.hxx"
#include "vm.hxx"
#include "vm/source.hxx"

namespace {
struct CmdArgs {
    std::string filename;
    std::string evalCode;
    bool hasEval = false;
    bool dumpMemory = false;
    bool help = false;
    bool invalid = false;
    bool profile = false;
    brisk::Config config;
};

bool parseCount(const char* val, unsigned long long max, std::size_t& out) {
    char* end = nullptr;
    unsigned long long parsed = std::strtoull(val, &end, 10);
    if (val[0] == '-' || end == val || *end != '\0' || parsed == 0 || parsed > max) return false;
    out = static_cast<std::size_t>(parsed);
    return true;
}

bool takesValue(std::string_view arg) {
    return arg == "-e" || arg == "-i" || arg == "-eof" || arg == "-ts" || arg == "-pm";
}

bool parseOption(CmdArgs& args, int argc, char* argv[], int& i) {
    std::string_view arg = argv[i];
    if (takesValue(arg) && i + 1 >= argc) {
        std::cerr << "Missing value for " << arg << std::endl;
        args.invalid = true;
    } else if (arg == "-e") {
        args.evalCode = argv[++i];
        args.hasEval = true;
        args.filename.clear();
    } else if (arg == "-i") {
        ++i;
        if (!args.hasEval) args.filename = argv[i];
    } else if (arg == "-dm") {
        args.dumpMemory = true;
    } else if (arg == "-h") {
        args.help = true;
    } else if (arg == "--profile") {
        args.profile = true;
    } else if (arg == "-eof") {
        const char* val = argv[++i];
        char* end = nullptr;
        long parsed = std::strtol(val, &end, 10);
        if (end == val || *end != '\0' || parsed < 0 || parsed > 2) {
            std::cerr << "Invalid EOF mode: " << val << std::endl;
            args.invalid = true;
        } else {
            args.config.eof = static_cast<brisk::EofBehaviour>(parsed);
        }
    } else if (arg == "-ts") {
        const char* val = argv[++i];
        if (!parseCount(val, BRISK_TAPE_MAX_BYTES, args.config.tapeSize)) {
            std::cerr << "Tape size must be a positive integer up to " << BRISK_TAPE_MAX_BYTES
                      << ": " << val << std::endl;
            args.invalid = true;
        }
    } else if (arg == "-pm") {
        const char* val = argv[++i];
        if (!parseCount(val, SIZE_MAX - 1, args.config.programMax)) {
            std::cerr << "Program length must be a positive integer: " << val << std::endl;
            args.invalid = true;
        }
    } else {
        return false;
    }
    return true;
}

CmdArgs parseArgs(int argc, char* argv[]) {
    CmdArgs args;
    bool optionsDone = false;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        // Program text can begin with '-' or '+', so only exact option names are options.
        if (!optionsDone && parseOption(args, argc, argv, i)) continue;
        if (!optionsDone && arg == "--") {
            optionsDone = true;
            continue;
        }
        if (args.hasEval) {
            std::cerr << "Unexpected argument: " << arg << std::endl;
            args.invalid = true;
            continue;
        }
        args.evalCode = std::string(arg);
        args.hasEval = true;
        args.filename.clear();
    }
    return args;
}

void printHelp(const char* prog, std::ostream& out) {
    out << "Usage: " << prog << " [options] [program]\n"
        << "Runs the program given as an argument, or read from standard input.\n"
        << "Options:\n"
        << "  -e <code>        Execute Brainfuck code directly\n"
        << "  -i <file>        Execute code from file\n"
        << "  -ts <size>       Tape size in cells (default " << BRISK_TAPE_SIZE << ")\n"
        << "  -pm <count>      Maximum program length (default " << BRISK_PROGRAM_MAX << ")\n"
        << "  -eof <value>     EOF behaviour: 0 unchanged, 1 zero (default), 2 max\n"
        << "  -dm              Dump memory after program\n"
        << "  --profile        Print execution profile\n"
        << "  -h               Show this help message" << std::endl;
}

void report(bool colour, std::string_view colourCode, std::string_view tag,
            const std::string& message) {
    if (colour) {
        std::cerr << colourCode << tag << ansi::reset;
    } else {
        std::cerr << tag;
    }
    std::cerr << ' ' << message << std::endl;
}
}  // namespace

int main(int argc, char* argv[]) {
    CmdArgs opts = parseArgs(argc, argv);
    const bool colour = ansi::enabled(STDERR_FILENO);
    if (opts.invalid) {
        printHelp(argv[0], std::cerr);
        return 1;
    }
    if (opts.help) {
        printHelp(argv[0], std::cout);
        return 0;
    }

    brisk::Sanitizer sanitizer(opts.config.programMax);
    if (opts.hasEval) {
        sanitizer.feed(opts.evalCode);
    } else if (!opts.filename.empty()) {
        std::string err;
        if (!brisk::readProgramFile(opts.filename, sanitizer, err)) {
            report(colour, ansi::red, "ERROR:", err + ": " + opts.filename);
            return 1;
        }
    } else {
        brisk::readProgram(std::cin, sanitizer);
    }
    if (sanitizer.truncated()) {
        report(colour, ansi::yellow, "WARNING:",
               "Program truncated to " + std::to_string(sanitizer.capacity()) + " instructions");
    }
    const std::string code = sanitizer.release();

    brisk::JumpTable table;
    std::size_t errorPos = 0;
    const brisk::Status status = brisk::resolveBrackets(code, table, &errorPos);
    if (status != brisk::Status::Ok) {
        report(colour, ansi::red, "ERROR:",
               std::string(brisk::statusMessage(status)) + " at instruction " +
                   std::to_string(errorPos));
        return 1;
    }

    std::vector<uint8_t> cells(opts.config.tapeSize, 0);
    size_t cellPtr = 0;
    brisk::ProfileInfo prof;
    brisk::ProfileInfo* profPtr = opts.profile ? &prof : nullptr;
    brisk::run(code, table, cells, cellPtr, opts.config.eof, std::cin, std::cout, profPtr);
    std::cout.flush();

    if (opts.dumpMemory) brisk::dumpMemory(cells, cellPtr, std::cerr, colour);
    if (opts.profile) {
        std::cerr << "Instructions executed: " << prof.instructions << std::endl;
        std::cerr << "Elapsed time: " << prof.seconds << "s" << std::endl;
    }
    return 0;
}
