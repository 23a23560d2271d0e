#ifndef TYPES_HPP
#define TYPES_HPP

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

inline constexpr const char* kDefaultGroupFormat = "%Y/%B/%d";
inline constexpr const char* kDefaultRenameFormat = "%Y-%m-%d %H.%M.%S";
inline constexpr const char* kDefaultOutputFolderName = "sort_output";
inline constexpr std::chrono::seconds kDefaultStallTimeout{60};

/**
 * @brief Immutable configuration of one sort run.
 *
 * Built by Settings (or directly by tests) before SortEngine::run and only
 * read while the run is in progress.
 */
struct SortOptions {
    std::filesystem::path input_dir;
    std::filesystem::path output_dir;
    bool recursive{false};
    std::string group_format{kDefaultGroupFormat};
    std::optional<std::string> rename_format; ///< Unset keeps the original file name.
    bool sort_unknown{false};                 ///< Move files without a date into the output root.
    unsigned worker_threads{0};               ///< 0 selects the hardware concurrency.
    std::chrono::milliseconds stall_timeout{kDefaultStallTimeout};
};

/**
 * @brief Totals reported once a run has finished.
 */
struct SortSummary {
    std::size_t moved{0};
    std::size_t skipped{0};
    std::size_t failed{0};
    std::size_t stalls{0};
    std::size_t directories{0};
    double progress{0.0}; ///< Overall progress when the run finished; 1.0 unless cancelled.
    bool cancelled{false};
};

#endif
