#include <cstdio>
#include <cstdlib>
#include <string>
#include <string_view>

#include "common/config.h"
#include "common/log.h"
#include "emulator.h"

LOG_CHANNEL(MAIN);

void PrintUsageAndExit(int exit_code);
bool ParseNumber(std::string_view arg, int base, u64& out);

int main(int argc, char* argv[]) {

    // parse command line arguments

    // without an address, ARM9 binaries go to shared main memory and ARM7 binaries to ARM7 work RAM
    u32 arm9_address = 0x02000000;
    u32 arm7_address = 0x03000000;
    u32 next_address = 0;
    bool next_address_set = false;

    u64 arg_steps = 0;
    bool arg_steps_set = false;
    bool arg_trace = false;

    for (int i = 1; i < argc; i++) {
        std::string_view arg(argv[i]);

        if (arg == "-h" || arg == "--help") PrintUsageAndExit(0);

        if (arg == "-t" || arg == "--trace") {
            arg_trace = true;
            continue;
        }

        if (i + 1 >= argc) PrintUsageAndExit(1);
        std::string_view value(argv[i + 1]);

        // an address applies to the binary that follows it
        if (arg == "-a" || arg == "--address") {
            u64 address = 0;
            if (!ParseNumber(value, 16, address) || address > 0xFFFFFFFF) {
                std::printf("Invalid address '%s'\n", value.data());
                PrintUsageAndExit(1);
            }
            next_address = static_cast<u32>(address);
            next_address_set = true;
            i++;
            continue;
        }
        if (arg == "-9" || arg == "--arm9") {
            Config::arm9_binary_path = std::string(value);
            if (next_address_set) arm9_address = next_address;
            next_address_set = false;
            i++;
            continue;
        }
        if (arg == "-7" || arg == "--arm7") {
            Config::arm7_binary_path = std::string(value);
            if (next_address_set) arm7_address = next_address;
            next_address_set = false;
            i++;
            continue;
        }
        if (arg == "-n" || arg == "--steps") {
            if (!ParseNumber(value, 10, arg_steps)) {
                std::printf("Invalid step count '%s'\n", value.data());
                PrintUsageAndExit(1);
            }
            arg_steps_set = true;
            i++;
            continue;
        }

        std::printf("Unknown argument '%s'\n", arg.data());
        PrintUsageAndExit(1);
    }

    if (Config::arm9_binary_path.empty() && Config::arm7_binary_path.empty()) PrintUsageAndExit(1);

    // initialize logger, the level is updated once the config is loaded
    Log::Init(spdlog::level::info);

    Config::LoadConfig();
    Log::SetLevel(Log::ParseLevel(Config::log_level.Get(), spdlog::level::info));

    if (arg_trace) {
        Config::trace_instructions.Set(true);
        Log::SetLevel(spdlog::level::trace);
    }
    if (arg_steps_set) Config::max_steps.Set(arg_steps);

    Emulator emulator;
    emulator.SetMainMemoryTiming(Config::main_memory_nonseq_cycles.Get(), Config::main_memory_seq_cycles.Get());
    emulator.SetTraceInstructions(Config::trace_instructions.Get());

    if (!Config::arm9_binary_path.empty() &&
        !emulator.LoadBinary(Processor::ARM9, Config::arm9_binary_path, arm9_address)) {
        LogErr("Failed to load ARM9 binary {}", Config::arm9_binary_path);
        Log::Shutdown();
        return 1;
    }
    if (!Config::arm7_binary_path.empty() &&
        !emulator.LoadBinary(Processor::ARM7, Config::arm7_binary_path, arm7_address)) {
        LogErr("Failed to load ARM7 binary {}", Config::arm7_binary_path);
        Log::Shutdown();
        return 1;
    }

    emulator.Reset(arm9_address, arm7_address);
    emulator.Run(Config::max_steps.Get());
    emulator.LogRegisters();

    Log::Shutdown();

    return 0;
}

bool ParseNumber(std::string_view arg, int base, u64& out) {
    if (base == 16 && (arg.starts_with("0x") || arg.starts_with("0X"))) arg.remove_prefix(2);
    if (arg.empty()) return false;

    std::string str(arg);
    char* end = nullptr;
    out = std::strtoull(str.c_str(), &end, base);

    return end != nullptr && *end == '\0';
}

void PrintUsageAndExit(int exit_code) {
    printf("Usage: nitrate-headless [OPTIONS]\n\n");
    printf("Options:\n");
    printf("    -h, --help          Display this message\n");
    printf("    -9, --arm9 FILE     Load a raw binary for the ARM9 (default address 0x02000000)\n");
    printf("    -7, --arm7 FILE     Load a raw binary for the ARM7 (default address 0x03000000)\n");
    printf("    -a, --address HEX   Load address and entry point of the binary that follows\n");
    printf("    -n, --steps N       Number of steps to run (overwrites config file)\n");
    printf("    -t, --trace         Log the register state before every instruction\n\n");

    std::exit(exit_code);
}
