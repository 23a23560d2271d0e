#ifndef EXIF_DATE_CLASSIFIER_HPP
#define EXIF_DATE_CLASSIFIER_HPP

#include "IPathClassifier.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Classifies JPEG and TIFF images by the date stored in their EXIF block.
 *
 * IFD0 DateTime (tag 306) is preferred; DateTimeOriginal from the Exif sub-IFD
 * is used when DateTime is absent or unparsable.
 */
class ExifDateClassifier : public IPathClassifier {
public:
    ExifDateClassifier() = default;

    std::optional<std::tm> classify(const std::filesystem::path& path) const override;

    // Exposed for tests: extracts the raw date string from a TIFF/EXIF block.
    static std::optional<std::string> find_date_string(const std::vector<std::uint8_t>& tiff);

private:
    static std::vector<std::uint8_t> read_tiff_block(const std::filesystem::path& path);
};

#endif
