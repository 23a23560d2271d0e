#include "DestinationRouter.hpp"
#include "Utils.hpp"

namespace {
constexpr const char* kPreviewStem = "image";
constexpr const char* kPreviewExtension = ".jpg";
}

DestinationRouter::DestinationRouter(const SortOptions& options)
    : options_(options) {}

std::optional<std::filesystem::path> DestinationRouter::route(const std::filesystem::path& file,
                                                              const std::optional<std::tm>& timestamp) const
{
    std::filesystem::path file_name = file.filename();
    std::filesystem::path destination = options_.output_dir;

    if (timestamp) {
        destination /= Utils::utf8_to_path(Utils::format_time(*timestamp, options_.group_format));
        if (options_.rename_format) {
            const std::string renamed = Utils::format_time(*timestamp, *options_.rename_format);
            if (!renamed.empty()) {
                file_name = Utils::utf8_to_path(renamed + Utils::path_to_utf8(file.extension()));
            }
        }
    } else if (!options_.sort_unknown) {
        return std::nullopt;
    }

    return destination / file_name;
}

std::filesystem::path DestinationRouter::preview_destination(const SortOptions& options, const std::tm& now)
{
    std::filesystem::path preview = options.output_dir;
    preview /= Utils::utf8_to_path(Utils::format_time(now, options.group_format));
    if (options.rename_format) {
        preview /= Utils::utf8_to_path(Utils::format_time(now, *options.rename_format) + kPreviewExtension);
    } else {
        preview /= std::string(kPreviewStem) + kPreviewExtension;
    }
    return preview;
}
