#include "SortEvent.hpp"
#include "AppException.hpp"
#include "Utils.hpp"

#include <fmt/format.h>

SortError make_move_error(const FileMoveError& error)
{
    SortError result;
    result.code = ErrorCodes::Code::FILE_MOVE_FAILED;
    result.path = error.path();
    result.cause = error.cause();
    result.message = error.what();
    return result;
}

SortError make_directory_error(const std::filesystem::path& directory, std::error_code cause)
{
    SortError result;
    result.code = ErrorCodes::Code::DIRECTORY_READ_FAILED;
    result.path = directory;
    result.cause = cause;
    result.message = fmt::format("Couldn't list directory ({}): {}", Utils::path_to_utf8(directory), cause.message());
    return result;
}

SortError make_task_error(const std::filesystem::path& directory, const std::string& what)
{
    SortError result;
    result.code = ErrorCodes::Code::SORT_TASK_FAILED;
    result.path = directory;
    result.message = fmt::format("Sorting '{}' failed: {}", Utils::path_to_utf8(directory), what);
    return result;
}

std::string describe_sort_error(const SortError& error)
{
    const std::string path = Utils::path_to_utf8(error.path);
    if (error.cause == std::errc::permission_denied || error.cause == std::errc::operation_not_permitted) {
        return fmt::format("Permission denied to {}", path);
    }
    if (error.cause == std::errc::no_such_file_or_directory) {
        return fmt::format("{} not found", path);
    }
    if (error.cause) {
        return fmt::format("{}: {}", error.message, error.cause.message());
    }
    return error.message;
}
