#ifndef ERRORCODE_HPP
#define ERRORCODE_HPP

#include <string>
#include <utility>

namespace ErrorCodes {

// Error codes are grouped by range:
//   File System   1200-1299
//   Configuration 1500-1599
//   Sort          1800-1899
enum class Code {
    UNKNOWN_ERROR = 1,

    FILE_NOT_FOUND = 1200,
    FILE_PERMISSION_DENIED = 1201,
    FILE_OPEN_FAILED = 1202,
    FILE_READ_FAILED = 1203,
    FILE_MOVE_FAILED = 1204,
    FILE_ALREADY_EXISTS = 1205,
    DIRECTORY_NOT_FOUND = 1210,
    DIRECTORY_READ_FAILED = 1211,
    DIRECTORY_CREATE_FAILED = 1212,
    PATH_INVALID = 1220,

    CONFIG_LOAD_FAILED = 1500,
    CONFIG_SAVE_FAILED = 1501,
    CONFIG_INVALID_VALUE = 1502,

    SORT_NO_FILES = 1800,
    SORT_CANCELLED = 1801,
    SORT_STALLED = 1802,
    SORT_TASK_FAILED = 1803
};

struct ErrorInfo {
    Code code{Code::UNKNOWN_ERROR};
    std::string message;
    std::string resolution;
    std::string context;

    ErrorInfo() = default;
    ErrorInfo(Code code, std::string message, std::string resolution, std::string context = "")
        : code(code),
          message(std::move(message)),
          resolution(std::move(resolution)),
          context(std::move(context)) {}

    // Message followed by the resolution hint, suitable for end users
    std::string get_user_message() const;

    // Code, message, resolution and technical context
    std::string get_full_details() const;
};

class ErrorCatalog {
public:
    static ErrorInfo get_error_info(Code code, const std::string& context = "");
};

} // namespace ErrorCodes

#endif // ERRORCODE_HPP
