#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "FileRelocator.hpp"
#include "SortEngine.hpp"
#include "TestHelpers.hpp"

#include <algorithm>
#include <filesystem>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

SortOptions make_options(const TempDir& input, const TempDir& output)
{
    SortOptions options;
    options.input_dir = input.path();
    options.output_dir = output.path();
    options.worker_threads = 4;
    return options;
}

bool is_non_decreasing(const std::vector<double>& values)
{
    return std::is_sorted(values.begin(), values.end());
}

bool is_strictly_increasing(const std::vector<double>& values)
{
    return std::adjacent_find(values.begin(), values.end(),
                              [](double a, double b) { return a >= b; }) == values.end();
}

} // namespace

TEST_CASE("undated files are skipped when unknown dates are not sorted") {
    TempDir input;
    TempDir output;
    for (const char* name : {"image1.jpg", "image2.jpg", "image3.jpg", "image4.jpg"}) {
        write_file(input.path() / name);
    }

    FakeClassifier classifier;
    FileRelocator relocator;
    SortEngine engine(classifier, relocator, nullptr);
    RecordingObserver observer;

    auto options = make_options(input, output);
    options.sort_unknown = false;
    const SortSummary summary = engine.run(options, &observer);

    CHECK(observer.skips.size() == 4);
    CHECK(observer.moves.empty());
    CHECK(observer.errors.empty());
    CHECK(observer.finished == 1);
    CHECK(observer.events_after_finish == 0);
    REQUIRE_FALSE(observer.progress.empty());
    CHECK_THAT(observer.progress.back(), Catch::Matchers::WithinAbs(1.0, 1e-9));
    CHECK(summary.skipped == 4);
    CHECK_FALSE(summary.cancelled);
    CHECK(fs::exists(input.path() / "image1.jpg"));
}

TEST_CASE("non-recursive run only touches direct files of the input root") {
    TempDir input;
    TempDir output;
    for (const char* name : {"image1.jpg", "image2.jpg", "image3.jpg", "image4.jpg"}) {
        write_file(input.path() / name);
    }
    write_file(input.path() / "holidays" / "IMG001.jpg");
    write_file(input.path() / "holidays" / "IMG002.jpg");

    FakeClassifier classifier;
    classifier.default_date = make_tm(2022, 12, 8, 15, 17, 49);
    FileRelocator relocator;
    SortEngine engine(classifier, relocator, nullptr);
    RecordingObserver observer;

    const SortSummary summary = engine.run(make_options(input, output), &observer);

    CHECK(observer.file_events() == 4);
    CHECK(observer.moves.size() == 4);
    CHECK(observer.finished == 1);
    CHECK(summary.directories == 1);
    CHECK(fs::exists(input.path() / "holidays" / "IMG001.jpg"));
    CHECK(fs::exists(input.path() / "holidays" / "IMG002.jpg"));
}

TEST_CASE("recursive run moves every dated file into its group folder") {
    TempDir input;
    TempDir output;
    const std::vector<fs::path> sources = {
        input.path() / "holidays" / "IMG001.jpg",
        input.path() / "holidays" / "IMG002.jpg",
        input.path() / "random stuff" / "DSC0001.jpg",
        input.path() / "random stuff" / "DSC0002.jpg",
        input.path() / "random stuff" / "DSC0003.jpg",
    };
    for (const auto& source : sources) {
        write_file(source, source.filename().string());
    }

    FakeClassifier classifier;
    classifier.default_date = make_tm(2022, 12, 8, 15, 17, 49);
    FileRelocator relocator;
    SortEngine engine(classifier, relocator, nullptr);
    RecordingObserver observer;

    auto options = make_options(input, output);
    options.recursive = true;
    options.group_format = "%Y/%B/%d";
    const SortSummary summary = engine.run(options, &observer);

    REQUIRE(observer.moves.size() == 5);
    CHECK(observer.skips.empty());
    CHECK(observer.errors.empty());
    CHECK(summary.directories == 3);
    const fs::path group = output.path() / "2022" / "December" / "08";
    for (const auto& move : observer.moves) {
        CHECK(move.to == group / move.from.filename());
        CHECK(fs::exists(move.to));
        CHECK_FALSE(fs::exists(move.from));
        CHECK(read_file(move.to) == move.from.filename().string());
    }
    CHECK(is_strictly_increasing(observer.progress));
    CHECK_THAT(observer.progress.back(), Catch::Matchers::WithinAbs(1.0, 1e-9));
    CHECK(observer.finished == 1);
}

TEST_CASE("rename format replaces names and collisions get numeric suffixes") {
    TempDir input;
    TempDir output;
    write_file(input.path() / "a.jpg", "a");
    write_file(input.path() / "b.jpg", "b");
    write_file(input.path() / "c.JPG", "c");
    write_file(output.path() / "2022" / "20221208.jpg", "existing");

    FakeClassifier classifier;
    classifier.default_date = make_tm(2022, 12, 8);
    FileRelocator relocator;
    SortEngine engine(classifier, relocator, nullptr);
    RecordingObserver observer;

    auto options = make_options(input, output);
    options.group_format = "%Y";
    options.rename_format = "%Y%m%d";
    options.worker_threads = 1;
    engine.run(options, &observer);

    REQUIRE(observer.moves.size() == 3);
    CHECK(read_file(output.path() / "2022" / "20221208.jpg") == "existing");
    std::set<fs::path> destinations;
    for (const auto& move : observer.moves) {
        destinations.insert(move.to);
    }
    CHECK(destinations.size() == 3);
    CHECK(destinations.count(output.path() / "2022" / "20221208.JPG") == 1);
    CHECK(destinations.count(output.path() / "2022" / "20221208-1.jpg") == 1);
    CHECK(destinations.count(output.path() / "2022" / "20221208-2.jpg") == 1);
}

TEST_CASE("unknown dates go to the output root when enabled") {
    TempDir input;
    TempDir output;
    write_file(input.path() / "dated.jpg");
    write_file(input.path() / "undated.jpg");
    write_file(input.path() / "broken.jpg");

    FakeClassifier classifier;
    classifier.dates["dated.jpg"] = make_tm(2021, 1, 2);
    classifier.unreadable.insert("broken.jpg");
    FileRelocator relocator;
    SortEngine engine(classifier, relocator, nullptr);
    RecordingObserver observer;

    auto options = make_options(input, output);
    options.group_format = "%Y-%m-%d";
    options.sort_unknown = true;
    engine.run(options, &observer);

    CHECK(observer.moves.size() == 3);
    CHECK(observer.errors.empty());
    CHECK(fs::exists(output.path() / "2021-01-02" / "dated.jpg"));
    CHECK(fs::exists(output.path() / "undated.jpg"));
    CHECK(fs::exists(output.path() / "broken.jpg"));
}

TEST_CASE("unreadable files are skipped when unknown dates are not sorted") {
    TempDir input;
    TempDir output;
    write_file(input.path() / "broken.jpg");

    FakeClassifier classifier;
    classifier.unreadable.insert("broken.jpg");
    FileRelocator relocator;
    SortEngine engine(classifier, relocator, nullptr);
    RecordingObserver observer;

    engine.run(make_options(input, output), &observer);

    REQUIRE(observer.skips.size() == 1);
    CHECK(observer.skips.front() == input.path() / "broken.jpg");
    CHECK(observer.errors.empty());
}

TEST_CASE("a failed move is reported and the directory keeps going") {
    TempDir input;
    TempDir output;
    for (const char* name : {"one.jpg", "two.jpg", "three.jpg"}) {
        write_file(input.path() / name);
    }

    FakeClassifier classifier;
    classifier.default_date = make_tm(2020, 5, 1);
    FailingRelocator relocator;
    relocator.failing.insert("two.jpg");
    SortEngine engine(classifier, relocator, nullptr);
    RecordingObserver observer;

    auto options = make_options(input, output);
    options.worker_threads = 1;
    const SortSummary summary = engine.run(options, &observer);

    CHECK(observer.moves.size() == 2);
    REQUIRE(observer.errors.size() == 1);
    CHECK(observer.errors.front().code == ErrorCodes::Code::FILE_MOVE_FAILED);
    CHECK(observer.errors.front().path == input.path() / "two.jpg");
    CHECK(observer.errors.front().cause == std::errc::permission_denied);
    CHECK(fs::exists(input.path() / "two.jpg"));
    CHECK(summary.failed == 1);
    CHECK_THAT(observer.progress.back(), Catch::Matchers::WithinAbs(1.0, 1e-9));
    CHECK(observer.finished == 1);
}

TEST_CASE("missing input directory reports one error and still finishes") {
    TempDir output;
    const fs::path missing = output.path() / "does-not-exist";

    FakeClassifier classifier;
    FileRelocator relocator;
    SortEngine engine(classifier, relocator, nullptr);
    RecordingObserver observer;

    SortOptions options;
    options.input_dir = missing;
    options.output_dir = output.path() / "out";
    const SortSummary summary = engine.run(options, &observer);

    REQUIRE(observer.errors.size() == 1);
    CHECK(observer.errors.front().code == ErrorCodes::Code::DIRECTORY_READ_FAILED);
    CHECK(observer.errors.front().path == missing);
    CHECK(observer.errors.front().cause == std::errc::no_such_file_or_directory);
    CHECK(observer.finished == 1);
    CHECK(summary.failed == 1);
    CHECK_THAT(observer.progress.back(), Catch::Matchers::WithinAbs(1.0, 1e-9));
}

TEST_CASE("unreadable subdirectory reports exactly one error") {
    if (geteuid() == 0) {
        SUCCEED("permission checks are bypassed for root");
        return;
    }

    TempDir input;
    TempDir output;
    write_file(input.path() / "top.jpg");
    write_file(input.path() / "locked" / "hidden.jpg");
    fs::permissions(input.path() / "locked", fs::perms::none);

    FakeClassifier classifier;
    classifier.default_date = make_tm(2022, 12, 8);
    FileRelocator relocator;
    SortEngine engine(classifier, relocator, nullptr);
    RecordingObserver observer;

    auto options = make_options(input, output);
    options.recursive = true;
    engine.run(options, &observer);
    fs::permissions(input.path() / "locked", fs::perms::owner_all);

    REQUIRE(observer.errors.size() == 1);
    CHECK(observer.errors.front().code == ErrorCodes::Code::DIRECTORY_READ_FAILED);
    CHECK(describe_sort_error(observer.errors.front()) ==
          "Permission denied to " + (input.path() / "locked").string());
    CHECK(observer.moves.size() == 1);
    CHECK(observer.finished == 1);
    CHECK_THAT(observer.progress.back(), Catch::Matchers::WithinAbs(1.0, 1e-9));
}

TEST_CASE("cancellation stops before the remaining files but finishes the one in flight") {
    TempDir input;
    TempDir output;
    for (const char* name : {"1.jpg", "2.jpg", "3.jpg", "4.jpg"}) {
        write_file(input.path() / name);
    }

    FakeClassifier classifier;
    classifier.default_date = make_tm(2022, 12, 8);
    SlowRelocator relocator(std::chrono::milliseconds(150));
    SortEngine engine(classifier, relocator, nullptr);
    RecordingObserver observer;
    int in_flight_at_cancel = 0;
    observer.on_first_move = [&]() {
        in_flight_at_cancel = relocator.started.load();
        engine.cancel();
    };

    auto options = make_options(input, output);
    options.worker_threads = 1;
    const SortSummary summary = engine.run(options, &observer);

    CHECK(summary.cancelled);
    CHECK(engine.is_cancelled());
    CHECK(observer.file_events() < 4);
    CHECK(static_cast<int>(observer.file_events()) >= in_flight_at_cancel);
    CHECK(relocator.started.load() == relocator.finished.load());
    CHECK(observer.finished == 1);
    CHECK(is_non_decreasing(observer.progress));

    std::size_t remaining = 0;
    for (const auto& entry : fs::directory_iterator(input.path())) {
        (void)entry;
        ++remaining;
    }
    CHECK(remaining == 4 - observer.moves.size());
}

TEST_CASE("a quiet period raises a stall notice without ending the run") {
    TempDir input;
    TempDir output;
    write_file(input.path() / "slow.jpg");

    FakeClassifier classifier;
    classifier.default_date = make_tm(2022, 12, 8);
    SlowRelocator relocator(std::chrono::milliseconds(400));
    SortEngine engine(classifier, relocator, nullptr);
    RecordingObserver observer;

    auto options = make_options(input, output);
    options.stall_timeout = std::chrono::milliseconds(50);
    const SortSummary summary = engine.run(options, &observer);

    CHECK(observer.stalls >= 1);
    CHECK(summary.stalls == static_cast<std::size_t>(observer.stalls));
    CHECK(observer.errors.empty());
    CHECK(observer.moves.size() == 1);
    CHECK(observer.finished == 1);
}

TEST_CASE("empty input finishes immediately at full progress") {
    TempDir input;
    TempDir output;

    FakeClassifier classifier;
    FileRelocator relocator;
    SortEngine engine(classifier, relocator, nullptr);
    RecordingObserver observer;

    auto options = make_options(input, output);
    options.stall_timeout = std::chrono::seconds(30);
    const auto started = std::chrono::steady_clock::now();
    const SortSummary summary = engine.run(options, &observer);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    CHECK(elapsed < std::chrono::seconds(5));
    CHECK(observer.progress.empty());
    CHECK(observer.stalls == 0);
    CHECK(observer.finished == 1);
    CHECK(summary.directories == 1);
}

TEST_CASE("engine runs without an observer and can be reused") {
    TempDir input;
    TempDir output;
    write_file(input.path() / "a.jpg");

    FakeClassifier classifier;
    classifier.default_date = make_tm(2019, 7, 4);
    FileRelocator relocator;
    SortEngine engine(classifier, relocator, nullptr);

    auto options = make_options(input, output);
    options.group_format = "%Y";
    const SortSummary first = engine.run(options);
    CHECK(first.moved == 1);
    CHECK_FALSE(engine.is_running());

    write_file(input.path() / "b.jpg");
    RecordingObserver observer;
    const SortSummary second = engine.run(options, &observer);
    CHECK(second.moved == 1);
    CHECK(observer.moves.size() == 1);
    CHECK(fs::exists(output.path() / "2019" / "a.jpg"));
    CHECK(fs::exists(output.path() / "2019" / "b.jpg"));
}

TEST_CASE("many directories processed concurrently report every file once") {
    TempDir input;
    TempDir output;
    std::size_t expected = 0;
    for (int dir = 0; dir < 12; ++dir) {
        for (int file = 0; file <= dir % 4; ++file) {
            write_file(input.path() / ("dir" + std::to_string(dir)) / ("f" + std::to_string(file) + ".jpg"));
            ++expected;
        }
    }

    FakeClassifier classifier;
    classifier.default_date = make_tm(2022, 12, 8);
    FileRelocator relocator;
    SortEngine engine(classifier, relocator, nullptr);
    RecordingObserver observer;

    auto options = make_options(input, output);
    options.recursive = true;
    options.sort_unknown = true;
    options.group_format = "%Y";
    const SortSummary summary = engine.run(options, &observer);

    CHECK(observer.moves.size() == expected);
    CHECK(summary.directories == 13);
    std::set<fs::path> destinations;
    for (const auto& move : observer.moves) {
        destinations.insert(move.to);
    }
    CHECK(destinations.size() == expected);
    CHECK(is_strictly_increasing(observer.progress));
    CHECK_THAT(observer.progress.back(), Catch::Matchers::WithinAbs(1.0, 1e-9));
}

TEST_CASE("re-running into the default output folder leaves sorted files alone") {
    TempDir input;
    write_file(input.path() / "fresh.jpg", "fresh");
    const fs::path sorted = input.path() / "sort_output" / "2022" / "December" / "08" / "old.jpg";
    write_file(sorted, "old");

    FakeClassifier classifier;
    classifier.default_date = make_tm(2022, 12, 8);
    FileRelocator relocator;
    SortEngine engine(classifier, relocator, nullptr);
    RecordingObserver observer;

    SortOptions options;
    options.input_dir = input.path();
    options.output_dir = input.path() / "sort_output";
    options.recursive = true;
    engine.run(options, &observer);

    REQUIRE(observer.moves.size() == 1);
    CHECK(observer.moves.front().from == input.path() / "fresh.jpg");
    CHECK(read_file(sorted) == "old");
    CHECK_FALSE(fs::exists(sorted.parent_path() / "old-1.jpg"));
}

TEST_CASE("files already at their destination are skipped") {
    TempDir input;
    write_file(input.path() / "notes.txt");

    FakeClassifier classifier;
    FileRelocator relocator;
    SortEngine engine(classifier, relocator, nullptr);
    RecordingObserver observer;

    SortOptions options;
    options.input_dir = input.path();
    options.output_dir = input.path();
    options.sort_unknown = true;
    const SortSummary summary = engine.run(options, &observer);

    CHECK(summary.moved == 0);
    CHECK(summary.skipped == 1);
    CHECK(fs::exists(input.path() / "notes.txt"));
}

TEST_CASE("progress never goes back when an unreadable subdirectory is planned first") {
    if (geteuid() == 0) {
        SUCCEED("permission checks are bypassed for root");
        return;
    }

    TempDir input;
    TempDir output;
    for (const char* name : {"a.jpg", "b.jpg", "c.jpg"}) {
        write_file(input.path() / name);
    }
    fs::create_directories(input.path() / "locked");
    fs::permissions(input.path() / "locked", fs::perms::none);

    FakeClassifier classifier;
    classifier.default_date = make_tm(2022, 12, 8);
    FileRelocator relocator;
    SortEngine engine(classifier, relocator, nullptr);
    RecordingObserver observer;

    auto options = make_options(input, output);
    options.recursive = true;
    options.worker_threads = 1;
    const SortSummary summary = engine.run(options, &observer);
    fs::permissions(input.path() / "locked", fs::perms::owner_all);

    REQUIRE(observer.errors.size() == 1);
    CHECK(observer.moves.size() == 3);
    REQUIRE(observer.progress.size() == 4);
    CHECK(observer.progress.front() == 0.0);
    CHECK(is_non_decreasing(observer.progress));
    CHECK_THAT(observer.progress.back(), Catch::Matchers::WithinAbs(1.0, 1e-9));
    CHECK(summary.progress == 1.0);
}

TEST_CASE("a relative input with an absolute output keeps earlier output untouched") {
    TempDir workspace;
    const fs::path photos = workspace.path() / "photos";
    const fs::path output = photos / "sort_output";
    write_file(photos / "a.jpg", "first");
    CurrentPathGuard cwd(workspace.path());

    FakeClassifier classifier;
    classifier.default_date = make_tm(2022, 12, 8);
    FileRelocator relocator;
    SortEngine engine(classifier, relocator, nullptr);

    SortOptions options;
    options.input_dir = "photos";
    options.output_dir = output;
    options.recursive = true;

    RecordingObserver first_run;
    engine.run(options, &first_run);
    const fs::path sorted = output / "2022" / "December" / "08" / "a.jpg";
    REQUIRE(first_run.moves.size() == 1);
    CHECK(fs::exists(sorted));

    write_file(photos / "b.jpg", "second");
    RecordingObserver second_run;
    const SortSummary summary = engine.run(options, &second_run);

    REQUIRE(second_run.moves.size() == 1);
    CHECK(second_run.moves.front().from.filename() == "b.jpg");
    CHECK(summary.directories == 1);
    CHECK(read_file(sorted) == "first");
    CHECK_FALSE(fs::exists(sorted.parent_path() / "a-1.jpg"));
}

TEST_CASE("files already in place are recognised through a differently spelled output") {
    TempDir workspace;
    write_file(workspace.path() / "photos" / "notes.txt");
    CurrentPathGuard cwd(workspace.path());

    FakeClassifier classifier;
    FileRelocator relocator;
    SortEngine engine(classifier, relocator, nullptr);
    RecordingObserver observer;

    SortOptions options;
    options.input_dir = "photos";
    options.output_dir = workspace.path() / "photos" / ".";
    options.sort_unknown = true;
    const SortSummary summary = engine.run(options, &observer);

    CHECK(summary.moved == 0);
    CHECK(summary.skipped == 1);
    CHECK(fs::exists(workspace.path() / "photos" / "notes.txt"));
    CHECK_FALSE(fs::exists(workspace.path() / "photos" / "notes-1.txt"));
}

TEST_CASE("files removed after planning still let the run reach full progress") {
    TempDir input;
    TempDir output;
    write_file(input.path() / "a.jpg");
    write_file(input.path() / "sub" / "b.jpg");
    write_file(input.path() / "sub" / "vanishing.jpg");

    FakeClassifier classifier;
    classifier.default_date = make_tm(2022, 12, 8);
    HookedRelocator relocator;
    relocator.before_move = [&input](const fs::path& source) {
        if (source.filename() == "a.jpg") {
            fs::remove(input.path() / "sub" / "vanishing.jpg");
        }
    };
    SortEngine engine(classifier, relocator, nullptr);
    RecordingObserver observer;

    auto options = make_options(input, output);
    options.recursive = true;
    // The root is scheduled first, so sub/ is listed after the removal
    options.worker_threads = 1;
    const SortSummary summary = engine.run(options, &observer);

    CHECK(observer.moves.size() == 2);
    CHECK(observer.errors.empty());
    CHECK(is_non_decreasing(observer.progress));
    CHECK(summary.progress == 1.0);
    CHECK_FALSE(summary.cancelled);
}
