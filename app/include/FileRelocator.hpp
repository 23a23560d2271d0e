#ifndef FILE_RELOCATOR_HPP
#define FILE_RELOCATOR_HPP

#include "IRelocator.hpp"

#include <filesystem>
#include <system_error>

class FileRelocator : public IRelocator {
public:
    FileRelocator() = default;

    std::filesystem::path relocate(const std::filesystem::path& source,
                                   const std::filesystem::path& desired_destination) const override;

    // name.ext, name-1.ext, name-2.ext, ...
    static std::filesystem::path candidate_path(const std::filesystem::path& desired, unsigned attempt);

private:
    // Moves without replacing an existing destination. Returns false when
    // destination is taken; other failures are reported through ec.
    static bool move_if_absent(const std::filesystem::path& source,
                               const std::filesystem::path& destination,
                               std::error_code& ec);
    static bool copy_then_remove(const std::filesystem::path& source,
                                 const std::filesystem::path& destination,
                                 std::error_code& ec);
};

#endif
