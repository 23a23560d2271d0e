#include "SortEngine.hpp"

#include "AppException.hpp"
#include "DestinationRouter.hpp"
#include "DirectoryPlanner.hpp"
#include "IPathClassifier.hpp"
#include "IRelocator.hpp"
#include "ISortObserver.hpp"
#include "Utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <system_error>

namespace {

unsigned resolve_worker_count(unsigned requested, std::size_t task_count)
{
    const unsigned hw_threads = std::max(1u, std::thread::hardware_concurrency());
    const unsigned wanted = requested == 0 ? hw_threads : requested;
    return static_cast<unsigned>(std::min<std::size_t>(wanted, task_count));
}

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace


SortEngine::SortEngine(const IPathClassifier& classifier,
                       const IRelocator& relocator,
                       std::shared_ptr<spdlog::logger> core_logger)
    : classifier(classifier),
      relocator(relocator),
      core_logger(std::move(core_logger)) {}


SortEngine::~SortEngine()
{
    stop_requested = true;
    join_workers();
}


void SortEngine::cancel() noexcept
{
    stop_requested.store(true);
}


bool SortEngine::is_cancelled() const noexcept
{
    return stop_requested.load();
}


bool SortEngine::is_running() const noexcept
{
    return running.load();
}


SortSummary SortEngine::run(const SortOptions& options, ISortObserver* observer)
{
    // Declared before the guard so it outlives the workers the guard joins
    const DestinationRouter router(options);
    if (running.exchange(true)) {
        throw std::logic_error("SortEngine::run called while a run is in progress");
    }
    struct RunGuard {
        SortEngine& engine;
        ~RunGuard()
        {
            engine.join_workers();
            engine.running = false;
        }
    } guard{*this};

    stop_requested = false;
    next_task = 0;
    completed_tasks = 0;
    channel.clear();
    tracker.reset({});

    SortSummary summary;
    if (core_logger) {
        core_logger->info("Sorting '{}' into '{}' (recursive: {}, group format: '{}', rename format: '{}', sort unknown: {})",
                          Utils::path_to_utf8(options.input_dir),
                          Utils::path_to_utf8(options.output_dir),
                          options.recursive,
                          options.group_format,
                          options.rename_format.value_or(""),
                          options.sort_unknown);
    }

    // Listing errors are held back until every plan is known, so their
    // progress stamp is measured against the full file count
    std::vector<SortError> planning_errors;
    DirectoryPlanner planner(stop_requested,
                             [&planning_errors](SortError error) { planning_errors.push_back(std::move(error)); },
                             core_logger);
    const bool separate_output = !Utils::same_path(options.output_dir, options.input_dir);
    planner.prepare(options.input_dir, options.recursive, tracker,
                    separate_output ? options.output_dir : std::filesystem::path());
    tracker.reverse_order();
    summary.directories = tracker.size();
    for (auto& error : planning_errors) {
        emit(SortEvents::Failed{std::move(error)});
    }

    start_workers(options, router);
    if (workers.empty() && !tracker.empty()) {
        // No thread could be started: process everything here, the channel is unbounded
        worker_loop(router);
    }

    run_event_loop(options, observer, summary);
    join_workers();

    summary.cancelled = stop_requested.load();
    summary.progress = tracker.progress();
    if (core_logger) {
        core_logger->info("Sorting {}: {} moved, {} skipped, {} failed",
                          summary.cancelled ? "cancelled" : "finished",
                          summary.moved, summary.skipped, summary.failed);
    }

    if (observer) {
        try {
            observer->on_finished();
        } catch (const std::exception& ex) {
            if (core_logger) {
                core_logger->error("Observer failed in on_finished: {}", ex.what());
            }
        }
    }
    return summary;
}


void SortEngine::start_workers(const SortOptions& options, const DestinationRouter& router)
{
    const unsigned count = resolve_worker_count(options.worker_threads, tracker.size());
    if (core_logger) {
        core_logger->debug("Starting {} worker(s) for {} director{}",
                           count, tracker.size(), tracker.size() == 1 ? "y" : "ies");
    }

    workers.reserve(count);
    for (unsigned i = 0; i < count; ++i) {
        try {
            workers.emplace_back([this, &router]() { worker_loop(router); });
        } catch (const std::system_error& ex) {
            if (core_logger) {
                core_logger->error("Failed to start sort worker {}: {}", i, ex.what());
            }
            break;
        }
    }
}


void SortEngine::join_workers()
{
    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers.clear();
}


void SortEngine::worker_loop(const DestinationRouter& router)
{
    for (;;) {
        const std::size_t index = next_task.fetch_add(1);
        if (index >= tracker.size()) {
            return;
        }
        process_directory(tracker.plan(index), router);
    }
}


void SortEngine::process_directory(DirectoryPlan& plan, const DestinationRouter& router)
{
    const std::filesystem::path& directory = plan.directory();

    // Preparation already reported why this directory can't be listed
    if (!plan.listing_failed()) {
        if (core_logger) {
            core_logger->debug("Sorting directory '{}' ({} file(s))", Utils::path_to_utf8(directory), plan.total_files());
        }
        try {
            std::error_code ec;
            std::filesystem::directory_iterator it(directory, ec);
            for (const std::filesystem::directory_iterator end{}; !ec && it != end; it.increment(ec)) {
                if (stop_requested.load()) {
                    break;
                }
                std::error_code type_ec;
                if (it->is_directory(type_ec)) {
                    continue;
                }
                process_file(plan, it->path(), router);
            }
            if (ec) {
                if (core_logger) {
                    core_logger->error("Failed to list '{}': {}", Utils::path_to_utf8(directory), ec.message());
                }
                plan.complete();
                emit(SortEvents::Failed{make_directory_error(directory, ec)});
            } else if (!stop_requested.load()) {
                // Files planned but gone by now no longer count as pending
                plan.complete();
            }
        } catch (const std::exception& ex) {
            if (core_logger) {
                core_logger->error("Sorting '{}' aborted: {}", Utils::path_to_utf8(directory), ex.what());
            }
            plan.complete();
            emit(SortEvents::Failed{make_task_error(directory, ex.what())});
        }
    }

    emit(SortEvents::DirectoryDone{directory});
}


std::optional<std::tm> SortEngine::classify_file(const std::filesystem::path& file) const
{
    try {
        return classifier.classify(file);
    } catch (const FileOpenError& ex) {
        if (core_logger) {
            core_logger->debug("{}; treating as undated", ex.what());
        }
    } catch (const std::exception& ex) {
        if (core_logger) {
            core_logger->warn("Reading the date of '{}' failed: {}", Utils::path_to_utf8(file), ex.what());
        }
    }
    return std::nullopt;
}


void SortEngine::process_file(DirectoryPlan& plan, const std::filesystem::path& file, const DestinationRouter& router)
{
    const auto timestamp = classify_file(file);
    const auto destination = router.route(file, timestamp);
    if (!destination) {
        emit(SortEvents::Skipped{file}, &plan);
        return;
    }
    if (Utils::same_path(*destination, file)) {
        if (core_logger) {
            core_logger->debug("'{}' is already in place", Utils::path_to_utf8(file));
        }
        emit(SortEvents::Skipped{file}, &plan);
        return;
    }

    try {
        std::filesystem::path moved_to = relocator.relocate(file, *destination);
        emit(SortEvents::Moved{file, std::move(moved_to)}, &plan);
    } catch (const FileMoveError& ex) {
        emit(SortEvents::Failed{make_move_error(ex)}, &plan);
    } catch (const std::exception& ex) {
        if (core_logger) {
            core_logger->error("Unexpected failure moving '{}': {}", Utils::path_to_utf8(file), ex.what());
        }
        emit(SortEvents::Failed{make_move_error(FileMoveError(file, std::make_error_code(std::errc::io_error)))},
             &plan);
    }
}


void SortEngine::emit(SortEventPayload payload, DirectoryPlan* counted_plan)
{
    // Counting, stamping and enqueueing under one lock makes the delivered
    // progress sequence match the order files were counted in
    std::lock_guard<std::mutex> lock(emit_mutex);
    if (counted_plan) {
        counted_plan->advance();
    }
    channel.push(SortEvent{std::move(payload), tracker.progress()});
}


std::optional<double> SortEngine::progress_if_idle() const
{
    std::lock_guard<std::mutex> lock(emit_mutex);
    if (!channel.empty()) {
        return std::nullopt;
    }
    return tracker.progress();
}


void SortEngine::run_event_loop(const SortOptions& options, ISortObserver* observer, SortSummary& summary)
{
    const std::size_t task_count = tracker.size();
    while (completed_tasks < task_count || !channel.empty()) {
        if (auto event = channel.pop_for(options.stall_timeout)) {
            dispatch(*event, observer, summary);
            continue;
        }

        const auto progress = progress_if_idle();
        if (!progress || completed_tasks >= task_count) {
            continue;
        }
        ++summary.stalls;
        if (core_logger) {
            core_logger->warn("No sort event received in the last {} ms ({} of {} directories done)",
                              options.stall_timeout.count(), completed_tasks, task_count);
        }
        if (observer) {
            try {
                observer->on_stalled(*progress);
            } catch (const std::exception& ex) {
                if (core_logger) {
                    core_logger->error("Observer failed in on_stalled: {}", ex.what());
                }
            }
        }
    }
}


void SortEngine::dispatch(const SortEvent& event, ISortObserver* observer, SortSummary& summary)
{
    try {
        std::visit(overloaded{
            [&](const SortEvents::Moved& moved) {
                ++summary.moved;
                if (core_logger) {
                    core_logger->info("Moved '{}' to '{}'",
                                      Utils::path_to_utf8(moved.from), Utils::path_to_utf8(moved.to));
                }
                if (observer) {
                    observer->on_moved(moved.from, moved.to, event.progress);
                }
            },
            [&](const SortEvents::Skipped& skipped) {
                ++summary.skipped;
                if (core_logger) {
                    core_logger->debug("Skipped '{}' (no date)", Utils::path_to_utf8(skipped.path));
                }
                if (observer) {
                    observer->on_skipped(skipped.path, event.progress);
                }
            },
            [&](const SortEvents::Failed& failed) {
                ++summary.failed;
                if (core_logger) {
                    core_logger->warn("{}", describe_sort_error(failed.error));
                }
                if (observer) {
                    observer->on_error(failed.error, event.progress);
                }
            },
            [&](const SortEvents::DirectoryDone& done) {
                ++completed_tasks;
                if (core_logger) {
                    core_logger->debug("Directory '{}' done", Utils::path_to_utf8(done.directory));
                }
            },
        }, event.payload);
    } catch (const std::exception& ex) {
        if (core_logger) {
            core_logger->error("Observer callback failed: {}", ex.what());
        }
    }
}
