#include "Logger.hpp"

#include <cstdlib>
#include <filesystem>
#include <vector>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {
constexpr std::size_t kMaxLogFileSize = 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;

const std::vector<std::string>& logger_names()
{
    static const std::vector<std::string> names = {"core_logger", "ui_logger"};
    return names;
}
}


std::string Logger::get_log_directory()
{
    std::filesystem::path base;
    if (const char* state_home = std::getenv("XDG_STATE_HOME"); state_home && *state_home) {
        base = state_home;
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        base = std::filesystem::path(home) / ".local" / "state";
    } else {
        base = std::filesystem::temp_directory_path();
    }
    return (base / "ReadBar" / "logs").string();
}


std::string Logger::get_log_file_path()
{
    return (std::filesystem::path(get_log_directory()) / "readbar.log").string();
}


void Logger::setup_loggers()
{
    std::filesystem::create_directories(get_log_directory());

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        get_log_file_path(), kMaxLogFileSize, kMaxLogFiles);
    console_sink->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] [thread %t] %v");

    for (const auto& name : logger_names()) {
        if (spdlog::get(name)) {
            continue;
        }
        auto logger = std::make_shared<spdlog::logger>(
            name, spdlog::sinks_init_list{console_sink, file_sink});
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    }
}


std::shared_ptr<spdlog::logger> Logger::get_logger(const std::string& name)
{
    return spdlog::get(name);
}


void Logger::set_debug(bool enabled)
{
    const auto level = enabled ? spdlog::level::debug : spdlog::level::info;
    for (const auto& name : logger_names()) {
        if (auto logger = spdlog::get(name)) {
            logger->set_level(level);
        }
    }
}
