#include "AppException.hpp"
#include "Logger.hpp"
#include "ReadBarApp.hpp"
#include "Settings.hpp"

#include <QApplication>
#include <QGuiApplication>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <vector>


bool initialize_loggers()
{
    try {
        Logger::setup_loggers();
        return true;
    } catch (const std::exception &e) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("Failed to initialize loggers: {}", e.what());
        } else {
            std::fprintf(stderr, "Failed to initialize loggers: %s\n", e.what());
        }
        return false;
    }
}

namespace {

struct ParsedArguments {
    bool debug_mode{false};
    std::vector<char*> qt_args;
};

ParsedArguments parse_command_line(int argc, char** argv)
{
    ParsedArguments parsed;
    parsed.qt_args.reserve(static_cast<size_t>(argc) + 1);

    for (int i = 0; i < argc; ++i) {
        const bool is_flag = (i > 0);
        if (is_flag && std::strcmp(argv[i], "--debug") == 0) {
            parsed.debug_mode = true;
            continue;
        }
        parsed.qt_args.push_back(argv[i]);
    }
    parsed.qt_args.push_back(nullptr);
    return parsed;
}

void load_settings(Settings& settings)
{
    auto logger = Logger::get_logger("core_logger");
    if (settings.load()) {
        if (logger) {
            logger->info("Loaded settings from {}", settings.get_config_path());
        }
        return;
    }

    if (logger) {
        logger->info("No settings at {}, writing defaults", settings.get_config_path());
    }
    try {
        settings.save();
    } catch (const ErrorCodes::AppException& ex) {
        // Running on defaults is still useful
        if (logger) {
            logger->warn("{}", ex.get_full_details());
        }
    }
}

int run_application(int argc, char** argv)
{
    QCoreApplication::setApplicationName(QStringLiteral("ReadBar"));
    QGuiApplication::setApplicationDisplayName(QStringLiteral("ReadBar"));

    ParsedArguments parsed_args = parse_command_line(argc, argv);
    if (parsed_args.debug_mode) {
        Logger::set_debug(true);
    }

    int qt_argc = static_cast<int>(parsed_args.qt_args.size()) - 1;
    char** qt_argv = const_cast<char**>(parsed_args.qt_args.data());
    QApplication app(qt_argc, qt_argv);
    app.setQuitOnLastWindowClosed(false);

    Settings settings;
    load_settings(settings);
    if (settings.get_debug_logging()) {
        Logger::set_debug(true);
    }
    settings.validate();

    ReadBarApp readbar_app(settings);
    readbar_app.run();

    const int result = app.exec();
    readbar_app.shutdown();
    return result;
}

} // namespace


int main(int argc, char **argv) {
    if (!initialize_loggers()) {
        return EXIT_FAILURE;
    }

    try {
        return run_application(argc, argv);
    } catch (const ErrorCodes::AppException& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("{}", ex.get_full_details());
        } else {
            std::fprintf(stderr, "%s\n", ex.get_full_details().c_str());
        }
        return EXIT_FAILURE;
    } catch (const std::exception& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("Error: {}", ex.what());
        } else {
            std::fprintf(stderr, "Error: %s\n", ex.what());
        }
        return EXIT_FAILURE;
    }
}
