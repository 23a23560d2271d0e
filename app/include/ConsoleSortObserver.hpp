#ifndef CONSOLE_SORT_OBSERVER_HPP
#define CONSOLE_SORT_OBSERVER_HPP

#include "ISortObserver.hpp"

#include <chrono>
#include <memory>

namespace spdlog { class logger; }

// Reports sort progress through the ui_logger, one line per event.
class ConsoleSortObserver : public ISortObserver {
public:
    ConsoleSortObserver(std::shared_ptr<spdlog::logger> ui_logger, std::chrono::milliseconds stall_timeout);

    void on_moved(const std::filesystem::path& old_path,
                  const std::filesystem::path& new_path,
                  double progress) override;
    void on_skipped(const std::filesystem::path& path, double progress) override;
    void on_error(const SortError& error, double progress) override;
    void on_stalled(double progress) override;
    void on_finished() override;

    static int to_percent(double progress);

private:
    std::shared_ptr<spdlog::logger> ui_logger;
    std::chrono::milliseconds stall_timeout;
};

#endif
