// parallel_search.cpp - Implementation of ParallelSearch coordinator

#include "combination/parallel_search.hpp"

#include "combination/constraint_set.hpp"
#include "combination/debug_log.hpp"
#include "combination/message_channel.hpp"
#include "combination/partitioner.hpp"
#include "combination/range_builder.hpp"
#include "combination/search_engine.hpp"
#include "combination/validation.hpp"
#include "combination/worker_pool.hpp"

#include <chrono>
#include <mutex>
#include <stdexcept>

namespace combination {

namespace {

constexpr auto DRAIN_POLL = std::chrono::milliseconds(50);

// Marks a run active for the lifetime of execute(). The stop flag is cleared
// under the same lock that request_stop() takes, so a stop either lands
// before the run begins (and is ignored) or is seen by the run.
class RunningGuard {
public:
    RunningGuard(std::mutex& mutex, std::atomic<bool>& flag, CancellationFlag& cancel)
        : mutex_(mutex), flag_(flag)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (flag_.load(std::memory_order_relaxed)) {
            throw std::logic_error("ParallelSearch::run is already in progress");
        }
        cancel.reset();
        flag_.store(true, std::memory_order_release);
    }

    ~RunningGuard() {
        std::lock_guard<std::mutex> lock(mutex_);
        flag_.store(false, std::memory_order_release);
    }

private:
    std::mutex& mutex_;
    std::atomic<bool>& flag_;
};

}  // namespace

ParallelSearch::ParallelSearch(SearchOptions options)
    : options_(options)
{
}

void ParallelSearch::request_stop() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (running_.load(std::memory_order_relaxed)) {
        cancel_.request();
    }
}

SearchSummary ParallelSearch::run(const SearchRequest& request) {
    return execute(request, std::function<bool()>());
}

void ParallelSearch::run_shard(const Shard& shard,
                               std::shared_ptr<const CandidateLattice> lattice,
                               std::shared_ptr<const ConstraintSet> constraints,
                               SearchSink& sink,
                               std::optional<size_t> max_stored) {
    SearchEngine engine(std::move(lattice), std::move(constraints), &cancel_, &sink, options_, max_stored);
    engine.run(shard);
}

// =============================================================================
// Main Run
// =============================================================================

SearchSummary ParallelSearch::execute(const SearchRequest& request,
                                      const std::function<bool()>& abort_check) {
    // Nothing is built or started for an invalid request
    validate_request(request);

    RunningGuard guard(state_mutex_, running_, cancel_);
    const auto started = std::chrono::steady_clock::now();

    auto lattice = build_lattice(request);
    auto constraints = std::make_shared<const ConstraintSet>(request);

    const size_t num_workers = resolve_worker_count(options_.num_workers, lattice->dimension_size(0));
    std::vector<Shard> shards = partition_first_dimension(lattice->values(0), num_workers);

    results_ = ResultAggregator(num_workers, lattice->num_dimensions(),
                                lattice->total_combinations(), options_.display_cap);

    COMBINATION_DEBUG_LOG("run: %zu components, %zu workers, %llu leaves expected",
                          lattice->num_dimensions(), num_workers,
                          static_cast<unsigned long long>(lattice->total_combinations()));

    // Channel must outlive the pool: workers emit into it until they exit
    MessageChannel channel;
    WorkerPool pool(num_workers);
    pool.start();

    const std::optional<size_t> max_stored = request.max_stored_results;

    for (auto& shard : shards) {
        const WorkerId worker_id = shard.worker_id;
        pool.submit_to_worker(worker_id, make_job(
            [lattice, constraints, max_stored, &channel, this, shard = std::move(shard)]() {
                run_shard(shard, lattice, constraints, channel, max_stored);
            }));
    }

    bool aborted = false;
    try {
        while (!results_.is_done()) {
            if (!aborted && abort_check && abort_check()) {
                aborted = true;
                request_stop();
                COMBINATION_DEBUG_LOG("run: abort requested, waiting for %zu workers",
                                      num_workers - results_.workers_done());
            }

            // A failed worker never sends Done
            if (pool.has_error()) break;

            auto message = channel.pop_for(DRAIN_POLL);
            if (!message) continue;

            results_.consume(std::move(*message));
            while (auto more = channel.try_pop()) {
                results_.consume(std::move(*more));
            }

            if (progress_callback_) {
                progress_callback_(results_);
            }
        }
    } catch (...) {
        // Callback or aggregator failure: unwind the workers before propagating
        request_stop();
        pool.wait_for_completion();
        throw;
    }

    if (pool.has_error()) {
        COMBINATION_DEBUG_LOG("run: worker failed (%s), stopping", pool.get_error_description());
        request_stop();
        pool.wait_for_completion();
        pool.shutdown();
        pool.rethrow_if_error();
    }

    pool.wait_for_completion();
    pool.shutdown();

    SearchSummary summary;
    summary.processed = results_.total_processed();
    summary.valid = results_.total_valid();
    summary.stored = results_.total_stored();
    summary.expected = results_.total_expected();
    summary.num_workers = num_workers;
    summary.cancelled = results_.incomplete();
    summary.truncated = results_.truncated();
    summary.elapsed_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - started).count();

    COMBINATION_DEBUG_LOG("run: %s processed=%llu valid=%llu stored=%llu in %.1fms",
                          summary.cancelled ? "stopped" : "complete",
                          static_cast<unsigned long long>(summary.processed),
                          static_cast<unsigned long long>(summary.valid),
                          static_cast<unsigned long long>(summary.stored),
                          summary.elapsed_ms);
    return summary;
}

}  // namespace combination
