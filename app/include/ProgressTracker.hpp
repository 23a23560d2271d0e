#ifndef PROGRESS_TRACKER_HPP
#define PROGRESS_TRACKER_HPP

#include "DirectoryPlan.hpp"

#include <memory>
#include <vector>

class ProgressTracker {
public:
    using PlanList = std::vector<std::unique_ptr<DirectoryPlan>>;

    ProgressTracker() = default;

    // Replaces the plans of a previous run. Must not be called while workers run.
    void reset(PlanList plans);

    DirectoryPlan& add_plan(std::filesystem::path directory, std::size_t total_files, bool listing_failed = false);

    // Schedules the directories visited last first
    void reverse_order();

    // processed / total across all plans; 1.0 when there is nothing to do
    double progress() const;

    std::size_t total_files() const;
    std::size_t processed_files() const;

    std::size_t size() const noexcept { return plans_.size(); }
    bool empty() const noexcept { return plans_.empty(); }
    DirectoryPlan& plan(std::size_t index) { return *plans_.at(index); }
    const DirectoryPlan& plan(std::size_t index) const { return *plans_.at(index); }

private:
    PlanList plans_;
};

#endif
