#include <catch2/catch_test_macros.hpp>

#include "SortEvent.hpp"
#include "AppException.hpp"

TEST_CASE("move errors keep the failing path and cause") {
    const FileMoveError failure("/photos/a.jpg", std::make_error_code(std::errc::permission_denied));
    const SortError error = make_move_error(failure);

    CHECK(error.code == ErrorCodes::Code::FILE_MOVE_FAILED);
    CHECK(error.path == std::filesystem::path("/photos/a.jpg"));
    CHECK(error.cause == std::errc::permission_denied);
    CHECK(describe_sort_error(error) == "Permission denied to /photos/a.jpg");
}

TEST_CASE("missing directories are described as not found") {
    const SortError error = make_directory_error("/photos/gone",
                                                 std::make_error_code(std::errc::no_such_file_or_directory));
    CHECK(error.code == ErrorCodes::Code::DIRECTORY_READ_FAILED);
    CHECK(describe_sort_error(error) == "/photos/gone not found");
}

TEST_CASE("other causes are appended to the message") {
    SortError error = make_directory_error("/photos", std::make_error_code(std::errc::io_error));
    const std::string description = describe_sort_error(error);
    CHECK(description.find("/photos") != std::string::npos);
    CHECK(description.find(std::make_error_code(std::errc::io_error).message()) != std::string::npos);
}

TEST_CASE("task errors without a cause use their message") {
    const SortError error = make_task_error("/photos", "boom");
    CHECK(error.code == ErrorCodes::Code::SORT_TASK_FAILED);
    CHECK(describe_sort_error(error) == "Sorting '/photos' failed: boom");
}
