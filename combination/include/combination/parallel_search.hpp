#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

#include "combination/types.hpp"
#include "combination/aggregator.hpp"
#include "combination/cancellation.hpp"
#include "combination/constraint_set.hpp"
#include "combination/messages.hpp"
#include "combination/partitioner.hpp"
#include "combination/range_builder.hpp"

namespace combination {

// =============================================================================
// SearchSummary
// =============================================================================

struct SearchSummary {
    uint64_t processed{0};
    uint64_t valid{0};
    uint64_t stored{0};
    uint64_t expected{0};     // product of all lattice sizes
    size_t num_workers{0};
    bool cancelled{false};    // stopped before every leaf was accounted for
    bool truncated{false};    // display view hit its cap
    double elapsed_ms{0.0};
};

// =============================================================================
// ParallelSearch
// =============================================================================
// Coordinator for one search at a time.
//
// run():
// 1. Validate the request (ValidationError, nothing started)
// 2. Build the lattice and constraint set, shared read-only by all workers
// 3. Split dimension 0 into one shard per worker
// 4. Pin one SearchEngine job per shard onto its own pool thread
// 5. Drain the message channel into the aggregator on the calling thread
//    until every worker has sent Done
//
// The aggregator is only touched by the calling thread. Workers talk to it
// exclusively through the channel.
//
// STOPPING:
// request_stop() may be called from any thread (a UI thread, a worker, the
// progress callback). It applies to the run in progress: once run() has
// marked itself running, a stop is never lost; while idle it is ignored.
// Signal handlers should set their own flag and use run_with_abort().
// Workers unwind within one candidate and still send Done, so run() always
// returns a consistent summary.
//
// ERRORS:
// If a worker job throws, the other workers are stopped, the pool is drained
// and the exception is rethrown from run().

class ParallelSearch {
public:
    // Called on the run() thread after each drained group of messages
    using ProgressCallback = std::function<void(const ResultAggregator&)>;

    explicit ParallelSearch(SearchOptions options = {});
    virtual ~ParallelSearch() = default;

    ParallelSearch(const ParallelSearch&) = delete;
    ParallelSearch& operator=(const ParallelSearch&) = delete;

    SearchSummary run(const SearchRequest& request);

    // abort_check() is polled on the calling thread between drains (about
    // every 50ms when idle). Returning true raises the stop flag; the run
    // then finishes once every worker acknowledged.
    template<typename AbortCheck>
    SearchSummary run_with_abort(const SearchRequest& request, AbortCheck&& abort_check) {
        return execute(request, std::function<bool()>(std::forward<AbortCheck>(abort_check)));
    }

    void request_stop();

    // True once the current (or last) run was asked to stop
    bool stop_requested() const { return cancel_.requested(); }
    bool is_running() const { return running_.load(std::memory_order_acquire); }

    void set_progress_callback(ProgressCallback callback) { progress_callback_ = std::move(callback); }

    // Results of the last run. Not safe to read while run() is in progress
    // on another thread; use the progress callback instead.
    const ResultAggregator& results() const { return results_; }

    const SearchOptions& options() const { return options_; }

protected:
    // Body of one pool job: searches `shard` and reports into `sink`.
    // Runs on a worker thread; anything it throws fails the whole run.
    virtual void run_shard(const Shard& shard,
                           std::shared_ptr<const CandidateLattice> lattice,
                           std::shared_ptr<const ConstraintSet> constraints,
                           SearchSink& sink,
                           std::optional<size_t> max_stored);

private:
    SearchSummary execute(const SearchRequest& request, const std::function<bool()>& abort_check);

    SearchOptions options_;
    CancellationFlag cancel_;
    ResultAggregator results_;
    ProgressCallback progress_callback_;
    // Guards the idle <-> running transitions against request_stop()
    std::mutex state_mutex_;
    std::atomic<bool> running_{false};
};

}  // namespace combination
