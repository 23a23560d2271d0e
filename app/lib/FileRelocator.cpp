#include "FileRelocator.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <cerrno>
#include <cstdio>

#if defined(__linux__)
#include <fcntl.h>
#include <stdio.h>
#endif

namespace {
constexpr unsigned kMaxCollisionAttempts = 100000;
}


std::filesystem::path FileRelocator::candidate_path(const std::filesystem::path& desired, unsigned attempt)
{
    if (attempt == 0) {
        return desired;
    }
    std::filesystem::path candidate = desired.parent_path();
    candidate /= desired.stem().string() + "-" + std::to_string(attempt) + desired.extension().string();
    return candidate;
}


bool FileRelocator::copy_then_remove(const std::filesystem::path& source,
                                     const std::filesystem::path& destination,
                                     std::error_code& ec)
{
    // copy_options::none fails with file_exists instead of overwriting
    if (!std::filesystem::copy_file(source, destination, std::filesystem::copy_options::none, ec)) {
        if (ec == std::errc::file_exists) {
            ec.clear();
        }
        return false;
    }
    std::filesystem::remove(source, ec);
    if (ec) {
        std::error_code cleanup_ec;
        std::filesystem::remove(destination, cleanup_ec);
        return false;
    }
    return true;
}


bool FileRelocator::move_if_absent(const std::filesystem::path& source,
                                   const std::filesystem::path& destination,
                                   std::error_code& ec)
{
    ec.clear();
#if defined(__linux__) && defined(RENAME_NOREPLACE)
    if (::renameat2(AT_FDCWD, source.c_str(), AT_FDCWD, destination.c_str(), RENAME_NOREPLACE) == 0) {
        return true;
    }
    const int error = errno;
    if (error == EEXIST) {
        return false;
    }
    if (error == EXDEV) {
        return copy_then_remove(source, destination, ec);
    }
    if (error != EINVAL && error != ENOSYS) {
        ec.assign(error, std::generic_category());
        return false;
    }
    // Filesystem without RENAME_NOREPLACE support: fall through to the check-then-rename path
#endif
    if (std::filesystem::exists(destination, ec) || ec) {
        return false;
    }
    std::filesystem::rename(source, destination, ec);
    if (ec == std::errc::cross_device_link) {
        ec.clear();
        return copy_then_remove(source, destination, ec);
    }
    return !ec;
}


std::filesystem::path FileRelocator::relocate(const std::filesystem::path& source,
                                              const std::filesystem::path& desired_destination) const
{
    auto logger = Logger::get_logger("core_logger");

    std::error_code ec;
    std::filesystem::create_directories(desired_destination.parent_path(), ec);
    if (ec) {
        if (logger) {
            logger->error("Failed to create directories for '{}': {}",
                          Utils::path_to_utf8(desired_destination.parent_path()), ec.message());
        }
        throw FileMoveError(source, ec);
    }

    for (unsigned attempt = 0; attempt < kMaxCollisionAttempts; ++attempt) {
        const std::filesystem::path candidate = candidate_path(desired_destination, attempt);
        if (move_if_absent(source, candidate, ec)) {
            if (logger) {
                logger->debug("Moved '{}' to '{}'", Utils::path_to_utf8(source), Utils::path_to_utf8(candidate));
            }
            return candidate;
        }
        if (ec) {
            if (logger) {
                logger->error("Failed to move '{}' to '{}': {}",
                              Utils::path_to_utf8(source), Utils::path_to_utf8(candidate), ec.message());
            }
            throw FileMoveError(source, ec);
        }
        if (logger && attempt == 0) {
            logger->debug("Destination already contains '{}'; trying a suffixed name",
                          Utils::path_to_utf8(candidate));
        }
    }

    throw FileMoveError(source, std::make_error_code(std::errc::file_exists));
}
