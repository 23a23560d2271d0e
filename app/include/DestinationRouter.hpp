#ifndef DESTINATION_ROUTER_HPP
#define DESTINATION_ROUTER_HPP

#include "Types.hpp"

#include <ctime>
#include <filesystem>
#include <optional>

class DestinationRouter {
public:
    explicit DestinationRouter(const SortOptions& options);

    // Desired destination of a file, or std::nullopt when the file is skipped
    // (no date and unknown dates are not sorted).
    std::optional<std::filesystem::path> route(const std::filesystem::path& file,
                                               const std::optional<std::tm>& timestamp) const;

    // Sample destination shown before a run: the group and rename formats
    // applied to `now`, with "image" standing in for the original name.
    static std::filesystem::path preview_destination(const SortOptions& options, const std::tm& now);

private:
    const SortOptions& options_;
};

#endif
