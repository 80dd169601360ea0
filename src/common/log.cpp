#include "log.h"

#include <chrono>
#include <cstdio>
#include <memory>
#include <string>

#include "spdlog/pattern_formatter.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

namespace Log {
namespace {

std::chrono::high_resolution_clock::time_point program_start = std::chrono::high_resolution_clock::now();

class time_since_launch_formatter : public spdlog::custom_flag_formatter {
public:
    void format(const spdlog::details::log_msg&, const std::tm&, spdlog::memory_buf_t& dest) override {
        auto time_since_launch = std::chrono::high_resolution_clock::now() - program_start;
        auto s = std::chrono::duration_cast<std::chrono::seconds>(time_since_launch);
        auto us = std::chrono::duration_cast<std::chrono::microseconds>(time_since_launch - s);

        char buffer[32];
        int size = std::snprintf(buffer, sizeof(buffer), "%05lld.%06lld", static_cast<long long>(s.count()),
                                 static_cast<long long>(us.count()));
        dest.append(buffer, buffer + size);
    }

    std::unique_ptr<custom_flag_formatter> clone() const override {
        return spdlog::details::make_unique<time_since_launch_formatter>();
    }
};

}    //namespace

void Init(spdlog::level::level_enum log_level) {
    auto logger = spdlog::get("stdout_logger");
    if (!logger) logger = spdlog::stdout_color_mt("stdout_logger");
    spdlog::set_default_logger(logger);

    spdlog::set_level(log_level);

    auto formatter = std::make_unique<spdlog::pattern_formatter>();
    formatter->add_flag<time_since_launch_formatter>('*');

    formatter->set_pattern("%^[%*][%l][%!] %v%$");
    spdlog::set_formatter(std::move(formatter));
}

void SetLevel(spdlog::level::level_enum log_level) {
    spdlog::set_level(log_level);
}

void Shutdown() {
    spdlog::shutdown();
}

spdlog::level::level_enum ParseLevel(std::string_view name, spdlog::level::level_enum fallback) {
    const auto level = spdlog::level::from_str(std::string(name));
    // from_str maps unknown names to "off"
    if (level == spdlog::level::off && name != "off") return fallback;
    return level;
}

}    //namespace Log
