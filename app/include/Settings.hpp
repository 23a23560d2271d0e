#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include <IniConfig.hpp>
#include <Types.hpp>
#include <filesystem>
#include <string>


class Settings
{
public:
    Settings();

    bool load();
    bool save();

    std::string get_input_dir() const;
    void set_input_dir(const std::string& path);

    std::string get_output_dir() const;
    void set_output_dir(const std::string& path);

    bool get_recursive() const;
    void set_recursive(bool value);

    std::string get_group_format() const;
    void set_group_format(const std::string& format);

    bool get_rename_enabled() const;
    void set_rename_enabled(bool value);
    std::string get_rename_format() const;
    void set_rename_format(const std::string& format);

    bool get_sort_unknown() const;
    void set_sort_unknown(bool value);

    int get_worker_threads() const;
    void set_worker_threads(int value);

    int get_stall_timeout_seconds() const;
    void set_stall_timeout_seconds(int value);

    // Throws ErrorCodes::AppException when the input directory or a value is unusable
    void validate() const;
    SortOptions build_sort_options() const;

    std::string get_config_path() const;
    std::string get_config_dir() const;

private:
    std::string define_config_path() const;

    std::string config_path;
    std::filesystem::path config_dir;
    IniConfig config;

    std::string input_dir;
    std::string output_dir;
    bool recursive{false};
    std::string group_format{kDefaultGroupFormat};
    bool rename_enabled{false};
    std::string rename_format{kDefaultRenameFormat};
    bool sort_unknown{false};
    int worker_threads{0};
    int stall_timeout_seconds{static_cast<int>(kDefaultStallTimeout.count())};
};

#endif
