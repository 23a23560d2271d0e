#include "AppException.hpp"
#include "ConsoleSortObserver.hpp"
#include "DestinationRouter.hpp"
#include "ErrorMessages.hpp"
#include "ExifDateClassifier.hpp"
#include "FileRelocator.hpp"
#include "Logger.hpp"
#include "Settings.hpp"
#include "SortEngine.hpp"
#include "Utils.hpp"

#include <atomic>
#include <chrono>
#include <clocale>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <exception>
#include <libintl.h>
#include <optional>
#include <string>
#include <thread>

namespace {

constexpr int kExitFailures = 2;
constexpr int kExitCancelled = 130;
constexpr auto kCancelPollInterval = std::chrono::milliseconds(100);

std::atomic<bool> interrupt_received{false};

extern "C" void handle_interrupt(int)
{
    interrupt_received.store(true);
}

struct ParsedArguments {
    std::optional<std::string> input_dir;
    std::optional<std::string> output_dir;
    std::optional<bool> recursive;
    std::optional<std::string> group_format;
    std::optional<std::string> rename_format;
    std::optional<bool> sort_unknown;
    std::optional<int> worker_threads;
    std::optional<int> stall_timeout_seconds;
    bool save_config{false};
    bool preview{false};
    bool verbose{false};
    bool show_help{false};
};

void print_usage(const char* program)
{
    std::printf(
        "Usage: %s [options] [INPUT_DIR]\n"
        "\n"
        "Moves files into folders named after the date stored in their EXIF data.\n"
        "\n"
        "  -i, --input DIR          directory to sort\n"
        "  -o, --output DIR         destination root (default: INPUT_DIR/sort_output)\n"
        "  -r, --recursive          also sort files in subdirectories\n"
        "      --no-recursive       only sort files directly in INPUT_DIR\n"
        "  -g, --group-format FMT   strftime format of the destination folder (default: %s)\n"
        "  -n, --rename-format FMT  rename files using the strftime format FMT\n"
        "      --keep-names         keep the original file names\n"
        "  -u, --sort-unknown       move files without a date into the destination root\n"
        "      --skip-unknown       leave files without a date in place\n"
        "  -j, --threads N          number of worker threads (0: one per CPU)\n"
        "      --stall-timeout S    warn when nothing happened for S seconds (default: 60)\n"
        "      --preview            print a sample destination path and exit\n"
        "      --save-config        store the effective options in the configuration file\n"
        "  -v, --verbose            log debug output\n"
        "  -h, --help               show this help\n",
        program, kDefaultGroupFormat);
}

int parse_int_argument(const std::string& flag, const char* value)
{
    try {
        std::size_t consumed = 0;
        const int parsed = std::stoi(value, &consumed);
        if (consumed == std::strlen(value)) {
            return parsed;
        }
    } catch (const std::exception&) {
        // reported below
    }
    THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_INVALID_VALUE,
                        "Expected a number after " + flag,
                        flag + " " + value);
}

ParsedArguments parse_command_line(int argc, char** argv)
{
    ParsedArguments parsed;

    auto next_value = [&](int& i, const std::string& flag) -> const char* {
        if (i + 1 >= argc) {
            THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_INVALID_VALUE,
                                "Missing value after " + flag, flag);
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-i" || arg == "--input") {
            parsed.input_dir = next_value(i, arg);
        } else if (arg == "-o" || arg == "--output") {
            parsed.output_dir = next_value(i, arg);
        } else if (arg == "-r" || arg == "--recursive") {
            parsed.recursive = true;
        } else if (arg == "--no-recursive") {
            parsed.recursive = false;
        } else if (arg == "-g" || arg == "--group-format") {
            parsed.group_format = next_value(i, arg);
        } else if (arg == "-n" || arg == "--rename-format") {
            parsed.rename_format = next_value(i, arg);
        } else if (arg == "--keep-names") {
            parsed.rename_format = std::string();
        } else if (arg == "-u" || arg == "--sort-unknown") {
            parsed.sort_unknown = true;
        } else if (arg == "--skip-unknown") {
            parsed.sort_unknown = false;
        } else if (arg == "-j" || arg == "--threads") {
            parsed.worker_threads = parse_int_argument(arg, next_value(i, arg));
        } else if (arg == "--stall-timeout") {
            parsed.stall_timeout_seconds = parse_int_argument(arg, next_value(i, arg));
        } else if (arg == "--preview") {
            parsed.preview = true;
        } else if (arg == "--save-config") {
            parsed.save_config = true;
        } else if (arg == "-v" || arg == "--verbose" || arg == "--development") {
            parsed.verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            parsed.show_help = true;
        } else if (!arg.empty() && arg.front() != '-' && !parsed.input_dir) {
            parsed.input_dir = arg;
        } else {
            THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_INVALID_VALUE, "Unknown option " + arg, arg);
        }
    }
    return parsed;
}

void apply_arguments(const ParsedArguments& args, Settings& settings)
{
    if (args.input_dir) settings.set_input_dir(*args.input_dir);
    if (args.output_dir) settings.set_output_dir(*args.output_dir);
    if (args.recursive) settings.set_recursive(*args.recursive);
    if (args.group_format) settings.set_group_format(*args.group_format);
    if (args.rename_format) {
        settings.set_rename_enabled(!args.rename_format->empty());
        if (!args.rename_format->empty()) {
            settings.set_rename_format(*args.rename_format);
        }
    }
    if (args.sort_unknown) settings.set_sort_unknown(*args.sort_unknown);
    if (args.worker_threads) settings.set_worker_threads(*args.worker_threads);
    if (args.stall_timeout_seconds) settings.set_stall_timeout_seconds(*args.stall_timeout_seconds);
}

bool initialize_loggers(bool verbose)
{
    try {
        Logger::setup_loggers(std::string(), verbose ? spdlog::level::debug : spdlog::level::info);
        return true;
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Failed to initialize loggers: %s\n", e.what());
        return false;
    }
}

void print_preview(const SortOptions& options)
{
    const std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    const auto preview = DestinationRouter::preview_destination(options, local);
    std::printf("%s\n", Utils::path_to_utf8(preview).c_str());
}

int exit_code_for(const SortSummary& summary)
{
    if (summary.cancelled) {
        return kExitCancelled;
    }
    return summary.failed > 0 ? kExitFailures : EXIT_SUCCESS;
}

int run_application(const ParsedArguments& args)
{
    auto ui_logger = Logger::get_logger("ui_logger");

    Settings settings;
    settings.load();
    apply_arguments(args, settings);
    settings.validate();

    if (args.save_config) {
        if (!settings.save()) {
            THROW_APP_ERROR(ErrorCodes::Code::CONFIG_SAVE_FAILED, settings.get_config_path());
        }
        if (ui_logger) {
            ui_logger->info("Saved settings to '{}'", settings.get_config_path());
        }
    }

    const SortOptions options = settings.build_sort_options();
    if (args.preview) {
        print_preview(options);
        return EXIT_SUCCESS;
    }

    ExifDateClassifier classifier;
    FileRelocator relocator;
    SortEngine engine(classifier, relocator, Logger::get_logger("core_logger"));
    ConsoleSortObserver observer(ui_logger, options.stall_timeout);

    std::signal(SIGINT, handle_interrupt);
    std::signal(SIGTERM, handle_interrupt);

    SortSummary summary;
    std::exception_ptr failure;
    std::atomic<bool> finished{false};
    std::thread sort_thread([&]() {
        try {
            summary = engine.run(options, &observer);
        } catch (...) {
            failure = std::current_exception();
        }
        finished = true;
    });

    bool cancel_sent = false;
    while (!finished.load()) {
        if (!cancel_sent && interrupt_received.load()) {
            if (ui_logger) {
                ui_logger->warn("Cancelling; files already being moved are finished first");
            }
            engine.cancel();
            cancel_sent = true;
        }
        std::this_thread::sleep_for(kCancelPollInterval);
    }
    sort_thread.join();

    if (failure) {
        std::rethrow_exception(failure);
    }

    if (ui_logger) {
        if (summary.cancelled) {
            ui_logger->info("{}", MSG_SORT_CANCELLED);
        }
        ui_logger->info("{} moved, {} skipped, {} failed", summary.moved, summary.skipped, summary.failed);
    }
    return exit_code_for(summary);
}

} // namespace


int main(int argc, char** argv)
{
    setlocale(LC_ALL, "");
    textdomain("date-sorter");

    ParsedArguments args;
    try {
        args = parse_command_line(argc, argv);
    } catch (const ErrorCodes::AppException& ex) {
        std::fprintf(stderr, "%s\n\n", ex.what());
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }
    if (args.show_help) {
        print_usage(argv[0]);
        return EXIT_SUCCESS;
    }

    if (!initialize_loggers(args.verbose)) {
        return EXIT_FAILURE;
    }

    try {
        return run_application(args);
    } catch (const ErrorCodes::AppException& ex) {
        if (auto logger = Logger::get_logger("ui_logger")) {
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
