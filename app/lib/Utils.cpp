#include "Utils.hpp"

#include <array>
#include <cstdlib>
#include <iomanip>
#include <locale>
#include <sstream>
#include <vector>

namespace {
constexpr const char* kAppName = "DateSorter";
constexpr std::size_t kInitialFormatBuffer = 128;
constexpr std::size_t kMaxFormatBuffer = 16 * 1024;

bool has_valid_suffix(std::istringstream& stream)
{
    const int next = stream.peek();
    if (next == std::char_traits<char>::eof()) {
        return true;
    }
    // Fractional seconds, UTC designator or numeric offset are accepted and ignored
    return next == '.' || next == ',' || next == 'Z' || next == '+' || next == '-';
}

std::optional<std::tm> try_parse(const std::string& text, const char* format, bool allow_suffix)
{
    std::tm tm{};
    std::istringstream stream(text);
    stream.imbue(std::locale::classic());
    stream >> std::get_time(&tm, format);
    if (stream.fail()) {
        return std::nullopt;
    }
    if (allow_suffix ? !has_valid_suffix(stream) : stream.peek() != std::char_traits<char>::eof()) {
        return std::nullopt;
    }
    if (tm.tm_mday < 1 || tm.tm_mon < 0 || tm.tm_mon > 11) {
        return std::nullopt;
    }
    tm.tm_isdst = -1;
    return tm;
}
}

namespace Utils {

std::filesystem::path utf8_to_path(const std::string& value)
{
#ifdef _WIN32
    return std::filesystem::u8path(value);
#else
    return std::filesystem::path(value);
#endif
}

std::string path_to_utf8(const std::filesystem::path& path)
{
#ifdef _WIN32
    const auto u8 = path.u8string();
    return std::string(u8.begin(), u8.end());
#else
    return path.string();
#endif
}

bool is_valid_directory(const std::filesystem::path& path)
{
    std::error_code ec;
    return !path.empty() && std::filesystem::is_directory(path, ec) && !ec;
}

std::filesystem::path normalize_path(const std::filesystem::path& path)
{
    std::error_code ec;
    std::filesystem::path normalized = std::filesystem::weakly_canonical(path, ec);
    if (!ec) {
        return normalized;
    }
    normalized = std::filesystem::absolute(path, ec);
    return ec ? path.lexically_normal() : normalized.lexically_normal();
}

bool same_path(const std::filesystem::path& lhs, const std::filesystem::path& rhs)
{
    return normalize_path(lhs) == normalize_path(rhs);
}

std::string format_time(const std::tm& time, const std::string& format)
{
    if (format.empty()) {
        return std::string();
    }

    std::vector<char> buffer(kInitialFormatBuffer);
    while (buffer.size() <= kMaxFormatBuffer) {
        const std::size_t written = std::strftime(buffer.data(), buffer.size(), format.c_str(), &time);
        if (written > 0) {
            return std::string(buffer.data(), written);
        }
        buffer.resize(buffer.size() * 2);
    }
    return std::string();
}

std::optional<std::tm> parse_date_time(const std::string& text)
{
    static const std::array<std::pair<const char*, bool>, 4> formats = {{
        {"%Y:%m:%d %H:%M:%S", false},
        {"%Y-%m-%dT%H:%M:%S", true},
        {"%Y-%m-%d %H:%M:%S", true},
        {"%Y-%m-%d", false},
    }};

    // EXIF strings are NUL padded
    std::string trimmed = text.substr(0, text.find('\0'));
    while (!trimmed.empty() && (trimmed.back() == ' ' || trimmed.back() == '\n')) {
        trimmed.pop_back();
    }
    if (trimmed.empty()) {
        return std::nullopt;
    }

    for (const auto& [format, allow_suffix] : formats) {
        if (auto parsed = try_parse(trimmed, format, allow_suffix)) {
            return parsed;
        }
    }
    return std::nullopt;
}

std::filesystem::path get_config_dir()
{
    if (const char* override_root = std::getenv("DATE_SORTER_CONFIG_DIR")) {
        return std::filesystem::path(override_root) / kAppName;
    }
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / kAppName;
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / kAppName;
    }
    return std::filesystem::current_path() / ".date-sorter";
}

std::string abbreviate_user_path(const std::string& path)
{
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        return path;
    }

    std::error_code ec;
    const auto relative = std::filesystem::relative(utf8_to_path(path), utf8_to_path(home), ec);
    if (ec || relative.empty()) {
        return path;
    }
    const std::string relative_str = path_to_utf8(relative);
    if (relative_str.rfind("..", 0) == 0) {
        return path;
    }
    return relative_str;
}

} // namespace Utils
