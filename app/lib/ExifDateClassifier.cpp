#include "ExifDateClassifier.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <array>
#include <cstring>
#include <fstream>
#include <iterator>

namespace {
constexpr std::uint16_t kTagDateTime = 0x0132;
constexpr std::uint16_t kTagExifIfd = 0x8769;
constexpr std::uint16_t kTagDateTimeOriginal = 0x9003;
constexpr std::uint16_t kTypeAscii = 2;
constexpr std::uint16_t kTypeLong = 4;
constexpr std::size_t kIfdEntrySize = 12;
constexpr std::size_t kMaxTiffBytes = 64 * 1024 * 1024;

constexpr std::uint8_t kJpegMarker = 0xFF;
constexpr std::uint8_t kJpegSoi = 0xD8;
constexpr std::uint8_t kJpegEoi = 0xD9;
constexpr std::uint8_t kJpegSos = 0xDA;
constexpr std::uint8_t kJpegApp1 = 0xE1;
constexpr std::array<char, 6> kExifHeader = {'E', 'x', 'i', 'f', '\0', '\0'};

class TiffReader {
public:
    explicit TiffReader(const std::vector<std::uint8_t>& data)
        : data_(data) {}

    bool init()
    {
        if (data_.size() < 8) {
            return false;
        }
        if (data_[0] == 'I' && data_[1] == 'I') {
            little_endian_ = true;
        } else if (data_[0] == 'M' && data_[1] == 'M') {
            little_endian_ = false;
        } else {
            return false;
        }
        return u16(2).value_or(0) == 42;
    }

    std::optional<std::uint32_t> first_ifd() const { return u32(4); }

    std::optional<std::uint16_t> u16(std::size_t offset) const
    {
        if (offset + 2 > data_.size()) {
            return std::nullopt;
        }
        const std::uint16_t a = data_[offset];
        const std::uint16_t b = data_[offset + 1];
        return static_cast<std::uint16_t>(little_endian_ ? (a | (b << 8)) : ((a << 8) | b));
    }

    std::optional<std::uint32_t> u32(std::size_t offset) const
    {
        if (offset + 4 > data_.size()) {
            return std::nullopt;
        }
        std::uint32_t value = 0;
        for (std::size_t i = 0; i < 4; ++i) {
            const std::uint32_t byte = data_[offset + i];
            value |= little_endian_ ? (byte << (8 * i)) : (byte << (8 * (3 - i)));
        }
        return value;
    }

    // Offset of the 12-byte entry for tag in the IFD at ifd_offset
    std::optional<std::size_t> find_entry(std::size_t ifd_offset, std::uint16_t tag) const
    {
        const auto count = u16(ifd_offset);
        if (!count) {
            return std::nullopt;
        }
        for (std::size_t i = 0; i < *count; ++i) {
            const std::size_t entry = ifd_offset + 2 + i * kIfdEntrySize;
            const auto entry_tag = u16(entry);
            if (!entry_tag) {
                return std::nullopt;
            }
            if (*entry_tag == tag) {
                return entry;
            }
        }
        return std::nullopt;
    }

    std::optional<std::string> ascii(std::size_t entry) const
    {
        const auto type = u16(entry + 2);
        const auto count = u32(entry + 4);
        if (!type || !count || *type != kTypeAscii || *count == 0) {
            return std::nullopt;
        }
        std::size_t value_offset = entry + 8;
        if (*count > 4) {
            const auto pointer = u32(entry + 8);
            if (!pointer) {
                return std::nullopt;
            }
            value_offset = *pointer;
        }
        if (value_offset + *count > data_.size()) {
            return std::nullopt;
        }
        const auto* begin = reinterpret_cast<const char*>(data_.data() + value_offset);
        return std::string(begin, begin + *count);
    }

    std::optional<std::uint32_t> long_value(std::size_t entry) const
    {
        const auto type = u16(entry + 2);
        if (!type || *type != kTypeLong) {
            return std::nullopt;
        }
        return u32(entry + 8);
    }

private:
    const std::vector<std::uint8_t>& data_;
    bool little_endian_{true};
};

std::uint16_t read_be16(std::istream& in)
{
    std::array<unsigned char, 2> bytes{};
    in.read(reinterpret_cast<char*>(bytes.data()), 2);
    return static_cast<std::uint16_t>((bytes[0] << 8) | bytes[1]);
}

bool is_standalone_marker(std::uint8_t marker)
{
    return marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7);
}

// Returns the TIFF block of the first APP1 Exif segment, empty when there is none
std::vector<std::uint8_t> read_jpeg_exif(std::istream& in, const std::filesystem::path& path)
{
    while (in) {
        int byte = in.get();
        if (byte != kJpegMarker) {
            break;
        }
        int marker = in.get();
        while (marker == kJpegMarker) {
            marker = in.get();
        }
        if (!in) {
            break;
        }
        if (marker == kJpegEoi || marker == kJpegSos) {
            return {};
        }
        if (is_standalone_marker(static_cast<std::uint8_t>(marker))) {
            continue;
        }

        const std::uint16_t length = read_be16(in);
        if (!in || length < 2) {
            break;
        }
        const std::size_t payload_size = length - 2;
        if (marker == kJpegApp1 && payload_size > kExifHeader.size()) {
            std::vector<std::uint8_t> payload(payload_size);
            in.read(reinterpret_cast<char*>(payload.data()), static_cast<std::streamsize>(payload_size));
            if (!in) {
                break;
            }
            if (std::memcmp(payload.data(), kExifHeader.data(), kExifHeader.size()) == 0) {
                return std::vector<std::uint8_t>(payload.begin() + kExifHeader.size(), payload.end());
            }
            continue;
        }
        in.seekg(static_cast<std::streamoff>(payload_size), std::ios::cur);
    }
    throw FileOpenError(path);
}
}


std::vector<std::uint8_t> ExifDateClassifier::read_tiff_block(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw FileOpenError(path);
    }

    std::array<unsigned char, 4> magic{};
    in.read(reinterpret_cast<char*>(magic.data()), magic.size());
    if (in.gcount() < 2) {
        throw FileOpenError(path);
    }

    if (magic[0] == kJpegMarker && magic[1] == kJpegSoi) {
        in.clear();
        in.seekg(2);
        return read_jpeg_exif(in, path);
    }

    const bool tiff_le = magic[0] == 'I' && magic[1] == 'I' && magic[2] == 42 && magic[3] == 0;
    const bool tiff_be = magic[0] == 'M' && magic[1] == 'M' && magic[2] == 0 && magic[3] == 42;
    if (!tiff_le && !tiff_be) {
        throw FileOpenError(path);
    }

    in.clear();
    in.seekg(0);
    std::vector<std::uint8_t> data;
    data.reserve(64 * 1024);
    std::istreambuf_iterator<char> it(in);
    std::istreambuf_iterator<char> end;
    for (; it != end && data.size() < kMaxTiffBytes; ++it) {
        data.push_back(static_cast<std::uint8_t>(*it));
    }
    return data;
}


std::optional<std::string> ExifDateClassifier::find_date_string(const std::vector<std::uint8_t>& tiff)
{
    TiffReader reader(tiff);
    if (!reader.init()) {
        return std::nullopt;
    }
    const auto ifd0 = reader.first_ifd();
    if (!ifd0) {
        return std::nullopt;
    }

    std::optional<std::string> date_time;
    if (const auto entry = reader.find_entry(*ifd0, kTagDateTime)) {
        date_time = reader.ascii(*entry);
    }
    if (date_time && Utils::parse_date_time(*date_time)) {
        return date_time;
    }

    if (const auto exif_entry = reader.find_entry(*ifd0, kTagExifIfd)) {
        if (const auto exif_ifd = reader.long_value(*exif_entry)) {
            if (const auto entry = reader.find_entry(*exif_ifd, kTagDateTimeOriginal)) {
                if (auto original = reader.ascii(*entry)) {
                    return original;
                }
            }
        }
    }
    return date_time;
}


std::optional<std::tm> ExifDateClassifier::classify(const std::filesystem::path& path) const
{
    const std::vector<std::uint8_t> tiff = read_tiff_block(path);
    if (tiff.empty()) {
        return std::nullopt;
    }

    const auto date_string = find_date_string(tiff);
    if (!date_string) {
        return std::nullopt;
    }

    auto parsed = Utils::parse_date_time(*date_string);
    if (!parsed) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->debug("Unparsable EXIF date '{}' in '{}'", *date_string, Utils::path_to_utf8(path));
        }
    }
    return parsed;
}
