#include "Logger.hpp"
#include "Utils.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <filesystem>
#include <vector>

namespace {
constexpr std::size_t kMaxLogFileSize = 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;
constexpr const char* kLogFileName = "date-sorter.log";
const std::vector<std::string> kLoggerNames = {"core_logger", "ui_logger"};
}

std::string Logger::resolve_log_directory()
{
    return Utils::path_to_utf8(Utils::get_config_dir() / "logs");
}

std::string Logger::get_log_directory()
{
    return resolve_log_directory();
}

void Logger::setup_loggers(const std::string& log_dir, spdlog::level::level_enum level)
{
    const std::string directory = log_dir.empty() ? resolve_log_directory() : log_dir;
    std::error_code ec;
    std::filesystem::create_directories(Utils::utf8_to_path(directory), ec);
    if (ec) {
        throw spdlog::spdlog_ex("Failed to create log directory '" + directory + "': " + ec.message());
    }

    const std::string log_file = Utils::path_to_utf8(Utils::utf8_to_path(directory) / kLogFileName);

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern("[%H:%M:%S] [%^%l%$] %v");
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        log_file, kMaxLogFileSize, kMaxLogFiles);
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] [thread %t] %v");

    for (const auto& name : kLoggerNames) {
        spdlog::drop(name);
        auto logger = std::make_shared<spdlog::logger>(
            name, spdlog::sinks_init_list{console_sink, file_sink});
        logger->set_level(level);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    }
}

std::shared_ptr<spdlog::logger> Logger::get_logger(const std::string& name)
{
    return spdlog::get(name);
}

void Logger::set_level(spdlog::level::level_enum level)
{
    for (const auto& name : kLoggerNames) {
        if (auto logger = spdlog::get(name)) {
            logger->set_level(level);
        }
    }
}
