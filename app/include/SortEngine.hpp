#ifndef SORT_ENGINE_HPP
#define SORT_ENGINE_HPP

#include "EventChannel.hpp"
#include "ProgressTracker.hpp"
#include "SortEvent.hpp"
#include "Types.hpp"

#include <atomic>
#include <ctime>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

class DestinationRouter;
class IPathClassifier;
class IRelocator;
class ISortObserver;
namespace spdlog { class logger; }

/**
 * @brief Sorts a directory tree into date folders, one worker task per directory.
 *
 * run() plans the tree, processes the planned directories on a fixed pool of
 * worker threads and, on the calling thread, forwards every outcome to the
 * observer in the order each directory produced it. Per-file and per-directory
 * failures are reported to the observer; they never abort the run.
 */
class SortEngine {
public:
    SortEngine(const IPathClassifier& classifier,
               const IRelocator& relocator,
               std::shared_ptr<spdlog::logger> core_logger);
    ~SortEngine();

    SortEngine(const SortEngine&) = delete;
    SortEngine& operator=(const SortEngine&) = delete;

    // Blocks until every planned directory is done and all events were
    // delivered, then calls observer->on_finished(). observer may be null.
    // Throws std::logic_error when another run is already in progress.
    SortSummary run(const SortOptions& options, ISortObserver* observer = nullptr);

    // Best-effort stop: files already being moved are finished, no new file is started.
    void cancel() noexcept;
    bool is_cancelled() const noexcept;
    bool is_running() const noexcept;

private:
    void start_workers(const SortOptions& options, const DestinationRouter& router);
    void join_workers();
    void worker_loop(const DestinationRouter& router);
    void process_directory(DirectoryPlan& plan, const DestinationRouter& router);
    void process_file(DirectoryPlan& plan, const std::filesystem::path& file, const DestinationRouter& router);
    std::optional<std::tm> classify_file(const std::filesystem::path& file) const;

    // counted_plan, when given, is advanced by one file before the event is stamped
    void emit(SortEventPayload payload, DirectoryPlan* counted_plan = nullptr);
    std::optional<double> progress_if_idle() const;

    void run_event_loop(const SortOptions& options, ISortObserver* observer, SortSummary& summary);
    void dispatch(const SortEvent& event, ISortObserver* observer, SortSummary& summary);

    const IPathClassifier& classifier;
    const IRelocator& relocator;
    std::shared_ptr<spdlog::logger> core_logger;

    ProgressTracker tracker;
    EventChannel<SortEvent> channel;
    mutable std::mutex emit_mutex;
    std::vector<std::thread> workers;
    std::atomic<std::size_t> next_task{0};
    std::size_t completed_tasks{0};
    std::atomic<bool> stop_requested{false};
    std::atomic<bool> running{false};
};

#endif
