#ifndef DIRECTORY_PLAN_HPP
#define DIRECTORY_PLAN_HPP

#include <atomic>
#include <cstddef>
#include <filesystem>

/**
 * @brief Per-directory progress bookkeeping of one sort run.
 *
 * `processed` is written only by the task that owns the directory and read
 * from any thread; it never exceeds `total_files` and never decreases.
 */
class DirectoryPlan {
public:
    DirectoryPlan(std::filesystem::path directory, std::size_t total_files, bool listing_failed = false);

    DirectoryPlan(const DirectoryPlan&) = delete;
    DirectoryPlan& operator=(const DirectoryPlan&) = delete;

    const std::filesystem::path& directory() const noexcept { return directory_; }
    std::size_t total_files() const noexcept { return total_files_; }
    std::size_t processed() const noexcept { return processed_.load(std::memory_order_acquire); }

    // Set when preparation couldn't list the directory; its error was already reported
    bool listing_failed() const noexcept { return listing_failed_; }

    // Counts one file; saturates at total_files for files that appeared after planning
    void advance() noexcept;

    // Marks every planned file as done so an abandoned directory stops holding back progress
    void complete() noexcept;

private:
    std::filesystem::path directory_;
    std::size_t total_files_;
    bool listing_failed_;
    std::atomic<std::size_t> processed_{0};
};

#endif
