#pragma once

#include <string>

#include "util/types.h"

// Global emulator configuration
namespace Config {

void SaveConfig();
void LoadConfig();

template<typename T>
struct ConfigEntry {
public:
    ConfigEntry() = delete;
    explicit ConfigEntry(T entry) : entry(entry) {};

    void Set(T value) {
        entry = value;
    }

    T Get() const {
        return entry;
    }

private:
    T entry;
};

// General
extern ConfigEntry<std::string> log_level;

// Debug
extern ConfigEntry<bool> trace_instructions;

// Memory
extern ConfigEntry<u32> main_memory_nonseq_cycles;
extern ConfigEntry<u32> main_memory_seq_cycles;

// Run
extern ConfigEntry<u64> max_steps;

extern std::string arm9_binary_path;
extern std::string arm7_binary_path;

}
