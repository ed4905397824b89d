#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

class Logger {
public:
    /**
     * @brief Create core_logger and ui_logger with console and rotating file sinks.
     * @throws spdlog::spdlog_ex when the log directory or file cannot be opened.
     */
    static void setup_loggers();

    /**
     * @brief Look up a logger by name.
     * @return The logger or nullptr when setup_loggers() has not run.
     */
    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

    static void set_debug(bool enabled);

    static std::string get_log_directory();

private:
    static std::string get_log_file_path();
};

#endif
