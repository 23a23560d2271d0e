#ifndef SORT_EVENT_HPP
#define SORT_EVENT_HPP

#include "ErrorCode.hpp"

#include <filesystem>
#include <string>
#include <system_error>
#include <variant>

class FileMoveError;

// A failure reported to the observer. Never thrown.
struct SortError {
    ErrorCodes::Code code{ErrorCodes::Code::UNKNOWN_ERROR};
    std::filesystem::path path;
    std::error_code cause;
    std::string message;
};

SortError make_move_error(const FileMoveError& error);
SortError make_directory_error(const std::filesystem::path& directory, std::error_code cause);
SortError make_task_error(const std::filesystem::path& directory, const std::string& what);

// "Permission denied to <path>", "<path> not found", or the error message
std::string describe_sort_error(const SortError& error);

namespace SortEvents {

struct Moved {
    std::filesystem::path from;
    std::filesystem::path to;
};

struct Skipped {
    std::filesystem::path path;
};

struct Failed {
    SortError error;
};

// Last event of every directory task
struct DirectoryDone {
    std::filesystem::path directory;
};

} // namespace SortEvents

using SortEventPayload = std::variant<SortEvents::Moved,
                                      SortEvents::Skipped,
                                      SortEvents::Failed,
                                      SortEvents::DirectoryDone>;

struct SortEvent {
    SortEventPayload payload;
    double progress{0.0}; ///< Overall progress in [0, 1] when the event was emitted.
};

#endif
