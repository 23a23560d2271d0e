#ifndef UTILS_HPP
#define UTILS_HPP

#include <ctime>
#include <filesystem>
#include <optional>
#include <string>

namespace Utils {

std::filesystem::path utf8_to_path(const std::string& value);
std::string path_to_utf8(const std::filesystem::path& path);

bool is_valid_directory(const std::filesystem::path& path);

// Absolute form with symlinks of the existing prefix resolved; purely lexical
// when the filesystem can't be queried
std::filesystem::path normalize_path(const std::filesystem::path& path);
// True when both paths name the same location, however they are spelled
bool same_path(const std::filesystem::path& lhs, const std::filesystem::path& rhs);

/**
 * @brief Format a calendar time with a strftime-style template in the current C locale.
 * @param time Broken-down time to format.
 * @param format Format string, e.g. "%Y/%B/%d".
 * @return Formatted text; empty when the template itself is empty.
 */
std::string format_time(const std::tm& time, const std::string& format);

// Parses "YYYY:MM:DD HH:MM:SS" (EXIF) then ISO-8601 date/time variants.
std::optional<std::tm> parse_date_time(const std::string& text);

std::filesystem::path get_config_dir();

std::string abbreviate_user_path(const std::string& path);

} // namespace Utils

#endif
