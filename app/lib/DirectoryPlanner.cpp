#include "DirectoryPlanner.hpp"
#include "Utils.hpp"

#include <spdlog/spdlog.h>

DirectoryPlanner::DirectoryPlanner(const std::atomic<bool>& stop_flag,
                                   ErrorCallback error_callback,
                                   std::shared_ptr<spdlog::logger> core_logger)
    : stop_flag(stop_flag),
      error_callback(std::move(error_callback)),
      core_logger(std::move(core_logger)) {}


void DirectoryPlanner::prepare(const std::filesystem::path& root,
                               bool recursive,
                               ProgressTracker& tracker,
                               const std::filesystem::path& excluded) const
{
    if (core_logger) {
        core_logger->debug("Preparing '{}' ({})", Utils::path_to_utf8(root), recursive ? "recursive" : "top level only");
    }

    visit(root, recursive, excluded.empty() ? excluded : Utils::normalize_path(excluded), tracker);

    if (core_logger) {
        core_logger->info("Prepared {} director{} with {} file(s){}",
                          tracker.size(), tracker.size() == 1 ? "y" : "ies",
                          tracker.total_files(),
                          stop_flag.load() ? " before cancellation" : "");
    }
}


void DirectoryPlanner::visit(const std::filesystem::path& directory,
                             bool recursive,
                             const std::filesystem::path& excluded,
                             ProgressTracker& tracker) const
{
    std::error_code ec;
    std::filesystem::directory_iterator it(directory, ec);
    if (ec) {
        report_listing_failure(directory, ec, tracker);
        return;
    }

    std::size_t files = 0;
    for (const std::filesystem::directory_iterator end{}; it != end; it.increment(ec)) {
        if (stop_flag.load()) {
            break;
        }

        const auto& entry = *it;
        std::error_code type_ec;
        if (entry.is_directory(type_ec)) {
            // Symlinked directories are neither followed nor sorted
            if (recursive && !entry.is_symlink(type_ec)) {
                if (!excluded.empty() && Utils::normalize_path(entry.path()) == excluded) {
                    if (core_logger) {
                        core_logger->debug("Not planning output directory '{}'", Utils::path_to_utf8(entry.path()));
                    }
                    continue;
                }
                visit(entry.path(), recursive, excluded, tracker);
            }
            continue;
        }
        ++files;
    }

    if (ec) {
        report_listing_failure(directory, ec, tracker);
        return;
    }

    tracker.add_plan(directory, files);
    if (core_logger) {
        core_logger->trace("Planned '{}' with {} file(s)", Utils::path_to_utf8(directory), files);
    }
}


void DirectoryPlanner::report_listing_failure(const std::filesystem::path& directory,
                                              std::error_code ec,
                                              ProgressTracker& tracker) const
{
    if (core_logger) {
        core_logger->warn("Error while scanning '{}': {}", Utils::path_to_utf8(directory), ec.message());
    }
    tracker.add_plan(directory, 0, true);
    if (error_callback) {
        error_callback(make_directory_error(directory, ec));
    }
}
