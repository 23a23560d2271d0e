#pragma once

#include "SortEvent.hpp"

#include <filesystem>

// Receives the outcome of a sort run. Every method is called from the thread
// that called SortEngine::run, one at a time, with the overall progress in [0, 1].
class ISortObserver {
public:
    virtual ~ISortObserver() = default;

    virtual void on_moved(const std::filesystem::path& old_path,
                          const std::filesystem::path& new_path,
                          double progress) = 0;
    virtual void on_skipped(const std::filesystem::path& path, double progress) = 0;
    virtual void on_error(const SortError& error, double progress) = 0;
    // Informational: nothing happened within the stall window, the run continues
    virtual void on_stalled(double progress) = 0;
    // Called exactly once per run, after every other callback
    virtual void on_finished() = 0;
};
