#pragma once

#include <filesystem>

class IRelocator {
public:
    virtual ~IRelocator() = default;

    // Moves source to desired_destination, or to the first free "name-N.ext"
    // sibling of it, creating missing parent directories. Returns the path the
    // file ended up at. Throws FileMoveError; the source stays in place then.
    virtual std::filesystem::path relocate(const std::filesystem::path& source,
                                           const std::filesystem::path& desired_destination) const = 0;
};
