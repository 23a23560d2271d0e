#include "ProgressTracker.hpp"

#include <algorithm>

DirectoryPlan::DirectoryPlan(std::filesystem::path directory, std::size_t total_files, bool listing_failed)
    : directory_(std::move(directory)),
      total_files_(total_files),
      listing_failed_(listing_failed) {}

void DirectoryPlan::advance() noexcept
{
    const std::size_t current = processed_.load(std::memory_order_relaxed);
    if (current < total_files_) {
        processed_.store(current + 1, std::memory_order_release);
    }
}

void DirectoryPlan::complete() noexcept
{
    processed_.store(total_files_, std::memory_order_release);
}


void ProgressTracker::reset(PlanList plans)
{
    plans_ = std::move(plans);
}

DirectoryPlan& ProgressTracker::add_plan(std::filesystem::path directory, std::size_t total_files, bool listing_failed)
{
    plans_.push_back(std::make_unique<DirectoryPlan>(std::move(directory), total_files, listing_failed));
    return *plans_.back();
}

void ProgressTracker::reverse_order()
{
    std::reverse(plans_.begin(), plans_.end());
}

std::size_t ProgressTracker::total_files() const
{
    std::size_t total = 0;
    for (const auto& plan : plans_) {
        total += plan->total_files();
    }
    return total;
}

std::size_t ProgressTracker::processed_files() const
{
    std::size_t processed = 0;
    for (const auto& plan : plans_) {
        processed += plan->processed();
    }
    return processed;
}

double ProgressTracker::progress() const
{
    std::size_t total = 0;
    std::size_t processed = 0;
    for (const auto& plan : plans_) {
        total += plan->total_files();
        processed += plan->processed();
    }
    if (total == 0) {
        return 1.0;
    }
    return std::min(1.0, static_cast<double>(processed) / static_cast<double>(total));
}
