#pragma once

#include <ctime>
#include <filesystem>
#include <optional>

// Reads the date a file should be sorted by. Implementations are called
// concurrently from every sort worker and must not keep per-call state.
class IPathClassifier {
public:
    virtual ~IPathClassifier() = default;

    // Returns std::nullopt when the file carries no usable date.
    // Throws FileOpenError when the file can't be read or decoded.
    virtual std::optional<std::tm> classify(const std::filesystem::path& path) const = 0;
};
