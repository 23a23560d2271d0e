#include "ErrorCode.hpp"
#include "ErrorMessages.hpp"

#include <fmt/format.h>

namespace ErrorCodes {

std::string ErrorInfo::get_user_message() const
{
    if (resolution.empty()) {
        return message;
    }
    return fmt::format("{}\n\n{}", message, resolution);
}

std::string ErrorInfo::get_full_details() const
{
    std::string details = fmt::format("Error {}: {}", static_cast<int>(code), message);
    if (!resolution.empty()) {
        details += fmt::format("\nResolution: {}", resolution);
    }
    if (!context.empty()) {
        details += fmt::format("\nDetails: {}", context);
    }
    return details;
}

ErrorInfo ErrorCatalog::get_error_info(Code code, const std::string& context)
{
    switch (code) {
        case Code::FILE_NOT_FOUND:
            return {code, _("The file could not be found."),
                    _("Check that the file was not moved or deleted while sorting."), context};
        case Code::FILE_PERMISSION_DENIED:
            return {code, _("Permission denied."),
                    _("Make sure you have read and write access to the file and its folder."), context};
        case Code::FILE_OPEN_FAILED:
            return {code, _("The file could not be opened or its metadata could not be read."),
                    _("The file is sorted as if it had no date."), context};
        case Code::FILE_READ_FAILED:
            return {code, _("Reading the file failed."),
                    _("Check the storage device for errors."), context};
        case Code::FILE_MOVE_FAILED:
            return {code, _("The file could not be moved."),
                    _("The file was left in place. Check free space and permissions of the output folder."),
                    context};
        case Code::FILE_ALREADY_EXISTS:
            return {code, _("A file with the same name already exists."), "", context};
        case Code::DIRECTORY_NOT_FOUND:
            return {code, _("The directory does not exist."),
                    _("Choose an existing input directory."), context};
        case Code::DIRECTORY_READ_FAILED:
            return {code, _("The directory contents could not be listed."),
                    _("Check the directory permissions."), context};
        case Code::DIRECTORY_CREATE_FAILED:
            return {code, _("A destination directory could not be created."),
                    _("Check the permissions of the output folder."), context};
        case Code::PATH_INVALID:
            return {code, _("Invalid directory path."),
                    _("Choose an existing directory."), context};
        case Code::CONFIG_LOAD_FAILED:
            return {code, _("The configuration file could not be read."),
                    _("Default settings are used."), context};
        case Code::CONFIG_SAVE_FAILED:
            return {code, _("The configuration file could not be saved."),
                    _("Check the permissions of the configuration directory."), context};
        case Code::CONFIG_INVALID_VALUE:
            return {code, _("A configuration value is invalid."),
                    _("Correct the value on the command line or in config.ini."), context};
        case Code::SORT_NO_FILES:
            return {code, _("There are no files to sort."), "", context};
        case Code::SORT_CANCELLED:
            return {code, _("Sorting cancelled."), "", context};
        case Code::SORT_STALLED:
            return {code, _("Nothing was done recently."),
                    _("Sorting continues; slow or network storage may cause this."), context};
        case Code::SORT_TASK_FAILED:
            return {code, _("Sorting a directory failed unexpectedly."), "", context};
        case Code::UNKNOWN_ERROR:
        default:
            return {Code::UNKNOWN_ERROR, _("An unknown error occurred."), "", context};
    }
}

} // namespace ErrorCodes
