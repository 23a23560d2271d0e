#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>

class Logger {
public:
    // Registers core_logger and ui_logger with console and rotating file sinks.
    // Throws spdlog::spdlog_ex when the log directory can't be opened.
    static void setup_loggers(const std::string& log_dir = std::string(),
                              spdlog::level::level_enum level = spdlog::level::info);
    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);
    static void set_level(spdlog::level::level_enum level);
    static std::string get_log_directory();

private:
    static std::string resolve_log_directory();
};

#endif
