#ifndef DIRECTORY_PLANNER_HPP
#define DIRECTORY_PLANNER_HPP

#include "ProgressTracker.hpp"
#include "SortEvent.hpp"

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>

namespace spdlog { class logger; }

// Walks the input tree once and records one DirectoryPlan per directory to sort.
class DirectoryPlanner {
public:
    using ErrorCallback = std::function<void(SortError)>;

    DirectoryPlanner(const std::atomic<bool>& stop_flag,
                     ErrorCallback error_callback,
                     std::shared_ptr<spdlog::logger> core_logger);

    // Appends plans to tracker depth-first, each directory after its
    // subdirectories. Stops early, keeping the plans collected so far, once
    // stop_flag is set. The excluded subtree (the output root) is never planned.
    void prepare(const std::filesystem::path& root,
                 bool recursive,
                 ProgressTracker& tracker,
                 const std::filesystem::path& excluded = {}) const;

private:
    void visit(const std::filesystem::path& directory,
               bool recursive,
               const std::filesystem::path& excluded,
               ProgressTracker& tracker) const;
    void report_listing_failure(const std::filesystem::path& directory,
                                std::error_code ec,
                                ProgressTracker& tracker) const;

    const std::atomic<bool>& stop_flag;
    ErrorCallback error_callback;
    std::shared_ptr<spdlog::logger> core_logger;
};

#endif
