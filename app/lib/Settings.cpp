#include "Settings.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <cstdio>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>


namespace {
constexpr const char* kSection = "Sort";
constexpr int kMaxWorkerThreads = 256;

template <typename... Args>
void settings_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->log(level, "{}", message);
    } else {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}
}


Settings::Settings()
{
    config_path = define_config_path();
    config_dir = Utils::utf8_to_path(config_path).parent_path();
}


std::string Settings::define_config_path() const
{
    return Utils::path_to_utf8(Utils::get_config_dir() / "config.ini");
}


std::string Settings::get_config_path() const
{
    return config_path;
}


std::string Settings::get_config_dir() const
{
    return Utils::path_to_utf8(config_dir);
}


bool Settings::load()
{
    if (!config.load(config_path)) {
        return false;
    }

    input_dir = config.getValue(kSection, "input_dir", input_dir);
    output_dir = config.getValue(kSection, "output_dir", output_dir);
    recursive = config.getBool(kSection, "recursive").value_or(recursive);
    group_format = config.getValue(kSection, "group_format", group_format);
    rename_enabled = config.getBool(kSection, "rename_enabled").value_or(rename_enabled);
    rename_format = config.getValue(kSection, "rename_format", rename_format);
    sort_unknown = config.getBool(kSection, "sort_unknown").value_or(sort_unknown);
    worker_threads = config.getInt(kSection, "worker_threads").value_or(worker_threads);
    stall_timeout_seconds = config.getInt(kSection, "stall_timeout_seconds").value_or(stall_timeout_seconds);

    settings_log(spdlog::level::info,
                 "Loaded settings from '{}' (recursive: {}, group format: '{}', rename: {}, sort unknown: {})",
                 config_path, recursive, group_format, rename_enabled, sort_unknown);
    return true;
}


bool Settings::save()
{
    try {
        std::filesystem::create_directories(config_dir);
    } catch (const std::filesystem::filesystem_error& e) {
        settings_log(spdlog::level::err, "Error creating configuration directory: {}", e.what());
        return false;
    }

    config.setValue(kSection, "input_dir", input_dir);
    config.setValue(kSection, "output_dir", output_dir);
    config.setBool(kSection, "recursive", recursive);
    config.setValue(kSection, "group_format", group_format);
    config.setBool(kSection, "rename_enabled", rename_enabled);
    config.setValue(kSection, "rename_format", rename_format);
    config.setBool(kSection, "sort_unknown", sort_unknown);
    config.setInt(kSection, "worker_threads", worker_threads);
    config.setInt(kSection, "stall_timeout_seconds", stall_timeout_seconds);

    return config.save(config_path);
}


void Settings::validate() const
{
    const std::filesystem::path input = Utils::utf8_to_path(input_dir);
    if (input_dir.empty() || !Utils::is_valid_directory(input)) {
        THROW_APP_ERROR(ErrorCodes::Code::PATH_INVALID, "Input directory: '" + input_dir + "'");
    }
    if (Utils::utf8_to_path(group_format).is_absolute()) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_INVALID_VALUE,
                            "Group format must produce a relative path",
                            "group_format = " + group_format);
    }
    if (rename_enabled && rename_format.empty()) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_INVALID_VALUE,
                            "Rename format must not be empty when renaming is enabled",
                            "rename_format");
    }
    if (worker_threads < 0 || worker_threads > kMaxWorkerThreads) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_INVALID_VALUE,
                            fmt::format("Worker thread count must be between 0 and {}", kMaxWorkerThreads),
                            "worker_threads = " + std::to_string(worker_threads));
    }
    if (stall_timeout_seconds <= 0) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_INVALID_VALUE,
                            "Stall timeout must be positive",
                            "stall_timeout_seconds = " + std::to_string(stall_timeout_seconds));
    }
}


SortOptions Settings::build_sort_options() const
{
    SortOptions options;
    options.input_dir = Utils::utf8_to_path(input_dir);
    options.output_dir = output_dir.empty()
        ? options.input_dir / kDefaultOutputFolderName
        : Utils::utf8_to_path(output_dir);
    options.recursive = recursive;
    options.group_format = group_format;
    if (rename_enabled) {
        options.rename_format = rename_format;
    }
    options.sort_unknown = sort_unknown;
    options.worker_threads = static_cast<unsigned>(worker_threads);
    options.stall_timeout = std::chrono::seconds(stall_timeout_seconds);
    return options;
}


std::string Settings::get_input_dir() const { return input_dir; }
void Settings::set_input_dir(const std::string& path) { input_dir = path; }

std::string Settings::get_output_dir() const { return output_dir; }
void Settings::set_output_dir(const std::string& path) { output_dir = path; }

bool Settings::get_recursive() const { return recursive; }
void Settings::set_recursive(bool value) { recursive = value; }

std::string Settings::get_group_format() const { return group_format; }
void Settings::set_group_format(const std::string& format) { group_format = format; }

bool Settings::get_rename_enabled() const { return rename_enabled; }
void Settings::set_rename_enabled(bool value) { rename_enabled = value; }

std::string Settings::get_rename_format() const { return rename_format; }
void Settings::set_rename_format(const std::string& format) { rename_format = format; }

bool Settings::get_sort_unknown() const { return sort_unknown; }
void Settings::set_sort_unknown(bool value) { sort_unknown = value; }

int Settings::get_worker_threads() const { return worker_threads; }
void Settings::set_worker_threads(int value) { worker_threads = value; }

int Settings::get_stall_timeout_seconds() const { return stall_timeout_seconds; }
void Settings::set_stall_timeout_seconds(int value) { stall_timeout_seconds = value; }
