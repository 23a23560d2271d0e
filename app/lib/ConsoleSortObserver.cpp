#include "ConsoleSortObserver.hpp"
#include "ErrorMessages.hpp"
#include "Utils.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>

ConsoleSortObserver::ConsoleSortObserver(std::shared_ptr<spdlog::logger> ui_logger,
                                         std::chrono::milliseconds stall_timeout)
    : ui_logger(std::move(ui_logger)),
      stall_timeout(stall_timeout) {}

int ConsoleSortObserver::to_percent(double progress)
{
    return static_cast<int>(std::floor(std::clamp(progress, 0.0, 1.0) * 100.0));
}

void ConsoleSortObserver::on_moved(const std::filesystem::path& old_path,
                                   const std::filesystem::path& new_path,
                                   double progress)
{
    if (ui_logger) {
        ui_logger->info("[{:3}%] Moved \"{}\" to \"{}\"", to_percent(progress),
                        Utils::abbreviate_user_path(Utils::path_to_utf8(old_path)),
                        Utils::abbreviate_user_path(Utils::path_to_utf8(new_path)));
    }
}

void ConsoleSortObserver::on_skipped(const std::filesystem::path& path, double progress)
{
    if (ui_logger) {
        ui_logger->info("[{:3}%] Skipped \"{}\"", to_percent(progress),
                        Utils::abbreviate_user_path(Utils::path_to_utf8(path)));
    }
}

void ConsoleSortObserver::on_error(const SortError& error, double progress)
{
    if (ui_logger) {
        ui_logger->error("[{:3}%] Error: {}", to_percent(progress), describe_sort_error(error));
    }
}

void ConsoleSortObserver::on_stalled(double progress)
{
    if (ui_logger) {
        const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(stall_timeout).count();
        ui_logger->warn("[{:3}%] Warning: {}", to_percent(progress),
                        fmt::format(fmt::runtime(MSG_SORT_STALLED), seconds));
    }
}

void ConsoleSortObserver::on_finished()
{
    if (ui_logger) {
        ui_logger->info("Sort run finished");
    }
}
