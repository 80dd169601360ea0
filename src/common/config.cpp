#include "config.h"

#include <cstdlib>
#include <filesystem>

#include "SimpleIni.h"

#include "log.h"

LOG_CHANNEL(CONFIG);

// Global emulator configuration
namespace Config {
namespace {
constexpr char CONFIG_FILE[] = "nitrate.ini";

// ini section names
constexpr char SEC_GENERAL[] = "General";
constexpr char SEC_DEBUG[] = "Debug";
constexpr char SEC_MEMORY[] = "Memory";
constexpr char SEC_RUN[] = "Run";
}


// ### SAVED TO FILE ###

// General
ConfigEntry<std::string> log_level {"info"};

// Debug
ConfigEntry<bool> trace_instructions {false};

// Memory
ConfigEntry<u32> main_memory_nonseq_cycles {3};
ConfigEntry<u32> main_memory_seq_cycles {1};

// Run
ConfigEntry<u64> max_steps {1000000};

// ### NOT SAVED TO FILE ###

std::string arm9_binary_path;
std::string arm7_binary_path;

void SaveConfig() {
    CSimpleIniA ini;

    ini.SetValue(SEC_GENERAL, "LogLevel", log_level.Get().c_str());
    ini.SetBoolValue(SEC_DEBUG, "TraceInstructions", trace_instructions.Get());
    ini.SetLongValue(SEC_MEMORY, "MainMemoryNonSeqCycles", static_cast<long>(main_memory_nonseq_cycles.Get()));
    ini.SetLongValue(SEC_MEMORY, "MainMemorySeqCycles", static_cast<long>(main_memory_seq_cycles.Get()));
    ini.SetValue(SEC_RUN, "MaxSteps", std::to_string(max_steps.Get()).c_str());

    // if the config file exists this will overwrite the above set values
    // otherwise it will create a new config file
    auto rc = ini.SaveFile(CONFIG_FILE);
    if (rc != SI_OK) LogErr("Failed to save config file {}", CONFIG_FILE);
}

void LoadConfig() {
    // if no config exists first create a new one with compile-time values
    if (!std::filesystem::exists(CONFIG_FILE)) {
        LogInfo("No config file found. Creating new {}", CONFIG_FILE);
        SaveConfig();
    }

    CSimpleIniA ini;
    auto rc = ini.LoadFile(CONFIG_FILE);
    if (rc != SI_OK) {
        LogErr("Failed to open config {}", CONFIG_FILE);
        return;
    }

    log_level.Set(ini.GetValue(SEC_GENERAL, "LogLevel", log_level.Get().c_str()));
    trace_instructions.Set(ini.GetBoolValue(SEC_DEBUG, "TraceInstructions", trace_instructions.Get()));

    const long nonseq = ini.GetLongValue(SEC_MEMORY, "MainMemoryNonSeqCycles", main_memory_nonseq_cycles.Get());
    const long seq = ini.GetLongValue(SEC_MEMORY, "MainMemorySeqCycles", main_memory_seq_cycles.Get());
    if (nonseq < 1 || seq < 1) {
        LogWarn("Ignoring invalid main memory timings N={} S={}", nonseq, seq);
    } else {
        main_memory_nonseq_cycles.Set(static_cast<u32>(nonseq));
        main_memory_seq_cycles.Set(static_cast<u32>(seq));
    }

    const char* steps = ini.GetValue(SEC_RUN, "MaxSteps", nullptr);
    if (steps) max_steps.Set(std::strtoull(steps, nullptr, 10));
}

}
