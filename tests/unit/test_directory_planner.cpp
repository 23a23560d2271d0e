#include <catch2/catch_test_macros.hpp>

#include "DirectoryPlanner.hpp"
#include "TestHelpers.hpp"

#include <atomic>
#include <map>

namespace fs = std::filesystem;

namespace {

std::map<fs::path, std::size_t> counts_by_directory(const ProgressTracker& tracker)
{
    std::map<fs::path, std::size_t> counts;
    for (std::size_t i = 0; i < tracker.size(); ++i) {
        counts[tracker.plan(i).directory()] = tracker.plan(i).total_files();
    }
    return counts;
}

void create_sample_tree(const fs::path& root)
{
    write_file(root / "image1.jpg");
    write_file(root / "image2.jpg");
    write_file(root / "holidays" / "IMG001.jpg");
    write_file(root / "holidays" / "IMG002.jpg");
    write_file(root / "random stuff" / "DSC0001.jpg");
    write_file(root / "random stuff" / "nested" / "archive.zip");
    write_file(root / "random stuff" / "nested" / "password.txt");
    fs::create_directories(root / "empty");
}

} // namespace

TEST_CASE("non-recursive planning counts only the root's files") {
    TempDir temp_dir;
    create_sample_tree(temp_dir.path());

    std::atomic<bool> stop{false};
    std::vector<SortError> errors;
    DirectoryPlanner planner(stop, [&](SortError error) { errors.push_back(std::move(error)); }, nullptr);
    ProgressTracker tracker;
    planner.prepare(temp_dir.path(), false, tracker);

    REQUIRE(tracker.size() == 1);
    CHECK(tracker.plan(0).directory() == temp_dir.path());
    CHECK(tracker.plan(0).total_files() == 2);
    CHECK(tracker.plan(0).processed() == 0);
    CHECK(errors.empty());
}

TEST_CASE("recursive planning visits every directory once with its own file count") {
    TempDir temp_dir;
    const fs::path& root = temp_dir.path();
    create_sample_tree(root);

    std::atomic<bool> stop{false};
    DirectoryPlanner planner(stop, nullptr, nullptr);
    ProgressTracker tracker;
    planner.prepare(root, true, tracker);

    const auto counts = counts_by_directory(tracker);
    REQUIRE(tracker.size() == 5);
    REQUIRE(counts.size() == 5);
    CHECK(counts.at(root) == 2);
    CHECK(counts.at(root / "holidays") == 2);
    CHECK(counts.at(root / "random stuff") == 1);
    CHECK(counts.at(root / "random stuff" / "nested") == 2);
    CHECK(counts.at(root / "empty") == 0);
    CHECK(tracker.total_files() == 7);

    // Each directory is recorded after its subdirectories, so the root comes last
    CHECK(tracker.plan(tracker.size() - 1).directory() == root);
    tracker.reverse_order();
    CHECK(tracker.plan(0).directory() == root);
}

TEST_CASE("an unlistable root yields an error and an empty failed plan") {
    TempDir temp_dir;
    const fs::path missing = temp_dir.path() / "missing";

    std::atomic<bool> stop{false};
    std::vector<SortError> errors;
    DirectoryPlanner planner(stop, [&](SortError error) { errors.push_back(std::move(error)); }, nullptr);
    ProgressTracker tracker;
    planner.prepare(missing, true, tracker);

    REQUIRE(errors.size() == 1);
    CHECK(errors.front().code == ErrorCodes::Code::DIRECTORY_READ_FAILED);
    CHECK(errors.front().path == missing);
    REQUIRE(tracker.size() == 1);
    CHECK(tracker.plan(0).listing_failed());
    CHECK(tracker.plan(0).total_files() == 0);
    CHECK(tracker.progress() == 1.0);
}

TEST_CASE("planning stops early once cancelled") {
    TempDir temp_dir;
    create_sample_tree(temp_dir.path());

    std::atomic<bool> stop{true};
    DirectoryPlanner planner(stop, nullptr, nullptr);
    ProgressTracker tracker;
    planner.prepare(temp_dir.path(), true, tracker);

    REQUIRE(tracker.size() == 1);
    CHECK(tracker.plan(0).directory() == temp_dir.path());
    CHECK(tracker.plan(0).total_files() == 0);
}

TEST_CASE("symlinked directories are not followed") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "real" / "a.jpg");
    std::error_code ec;
    fs::create_directory_symlink(temp_dir.path() / "real", temp_dir.path() / "link", ec);
    if (ec) {
        SUCCEED("symlinks unsupported here");
        return;
    }

    std::atomic<bool> stop{false};
    DirectoryPlanner planner(stop, nullptr, nullptr);
    ProgressTracker tracker;
    planner.prepare(temp_dir.path(), true, tracker);

    const auto counts = counts_by_directory(tracker);
    CHECK(counts.size() == 2);
    CHECK(counts.count(temp_dir.path() / "link") == 0);
    CHECK(counts.at(temp_dir.path()) == 0);
}

TEST_CASE("the output directory inside the input tree is not planned") {
    TempDir temp_dir;
    const fs::path& root = temp_dir.path();
    write_file(root / "new.jpg");
    write_file(root / "sort_output" / "2022" / "old.jpg");

    std::atomic<bool> stop{false};
    DirectoryPlanner planner(stop, nullptr, nullptr);
    ProgressTracker tracker;
    planner.prepare(root, true, tracker, root / "sort_output");

    const auto counts = counts_by_directory(tracker);
    REQUIRE(counts.size() == 1);
    CHECK(counts.at(root) == 1);
}

TEST_CASE("the output directory is excluded however its path is spelled") {
    TempDir temp_dir;
    const fs::path& root = temp_dir.path();
    write_file(root / "photos" / "new.jpg");
    write_file(root / "photos" / "sort_output" / "2022" / "old.jpg");
    CurrentPathGuard cwd(root);

    std::atomic<bool> stop{false};
    DirectoryPlanner planner(stop, nullptr, nullptr);
    ProgressTracker tracker;
    planner.prepare("photos", true, tracker, root / "photos" / "." / "sort_output");

    REQUIRE(tracker.size() == 1);
    CHECK(tracker.plan(0).directory() == fs::path("photos"));
    CHECK(tracker.plan(0).total_files() == 1);
}
