#include "IniConfig.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <utility>

namespace {
template <typename... Args>
void ini_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->log(level, "{}", message);
    } else {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

std::string trim_copy(const std::string& input)
{
    const auto begin = input.find_first_not_of(" \t\r");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(" \t\r");
    return input.substr(begin, end - begin + 1);
}

std::string to_lower_copy(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

bool is_comment_or_blank(const std::string& line)
{
    return line.empty() || line.front() == ';' || line.front() == '#';
}
}


bool IniConfig::load(const std::string& filename)
{
    std::ifstream file(filename);
    if (!file.is_open()) {
        ini_log(spdlog::level::debug, "Config file not readable: {}", filename);
        return false;
    }

    data.clear();
    std::string raw_line;
    std::string section;
    std::size_t line_number = 0;
    while (std::getline(file, raw_line)) {
        ++line_number;
        const std::string line = trim_copy(raw_line);
        if (is_comment_or_blank(line)) {
            continue;
        }
        if (line.front() == '[') {
            if (line.back() != ']' || line.size() < 2) {
                ini_log(spdlog::level::warn, "{}:{}: malformed section header ignored", filename, line_number);
                continue;
            }
            section = trim_copy(line.substr(1, line.size() - 2));
            continue;
        }

        const auto delimiter = line.find('=');
        if (delimiter == std::string::npos) {
            ini_log(spdlog::level::warn, "{}:{}: line without '=' ignored", filename, line_number);
            continue;
        }
        std::string key = trim_copy(line.substr(0, delimiter));
        if (key.empty()) {
            continue;
        }
        data[section][key] = trim_copy(line.substr(delimiter + 1));
    }
    return true;
}


bool IniConfig::save(const std::string& filename) const
{
    std::ofstream file(filename, std::ios::trunc);
    if (!file.is_open()) {
        ini_log(spdlog::level::err, "Failed to open config file for writing: {}", filename);
        return false;
    }

    for (const auto& [section, values] : data) {
        file << "[" << section << "]\n";
        for (const auto& [key, value] : values) {
            file << key << " = " << value << "\n";
        }
        file << "\n";
    }
    return static_cast<bool>(file);
}


std::string IniConfig::getValue(const std::string& section,
                                const std::string& key,
                                const std::string& default_value) const
{
    auto sec_it = data.find(section);
    if (sec_it == data.end()) {
        return default_value;
    }
    auto key_it = sec_it->second.find(key);
    return key_it != sec_it->second.end() ? key_it->second : default_value;
}


std::optional<bool> IniConfig::getBool(const std::string& section, const std::string& key) const
{
    if (!hasValue(section, key)) {
        return std::nullopt;
    }
    const std::string value = to_lower_copy(getValue(section, key));
    if (value == "true" || value == "1" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "false" || value == "0" || value == "no" || value == "off") {
        return false;
    }
    ini_log(spdlog::level::warn, "Ignoring non-boolean value '{}' for [{}] {}", value, section, key);
    return std::nullopt;
}


std::optional<int> IniConfig::getInt(const std::string& section, const std::string& key) const
{
    if (!hasValue(section, key)) {
        return std::nullopt;
    }
    const std::string value = getValue(section, key);
    try {
        std::size_t consumed = 0;
        const int parsed = std::stoi(value, &consumed);
        if (consumed == value.size()) {
            return parsed;
        }
    } catch (const std::exception&) {
        // fall through to the warning below
    }
    ini_log(spdlog::level::warn, "Ignoring non-numeric value '{}' for [{}] {}", value, section, key);
    return std::nullopt;
}


void IniConfig::setValue(const std::string& section, const std::string& key, const std::string& value)
{
    data[section][key] = value;
}


void IniConfig::setBool(const std::string& section, const std::string& key, bool value)
{
    setValue(section, key, value ? "true" : "false");
}


void IniConfig::setInt(const std::string& section, const std::string& key, int value)
{
    setValue(section, key, std::to_string(value));
}


bool IniConfig::hasValue(const std::string& section, const std::string& key) const
{
    const auto sec_it = data.find(section);
    return sec_it != data.end() && sec_it->second.count(key) > 0;
}
