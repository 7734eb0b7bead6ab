#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "combination/types.hpp"
#include "combination/cancellation.hpp"
#include "combination/constraint_set.hpp"
#include "combination/messages.hpp"
#include "combination/partitioner.hpp"
#include "combination/range_builder.hpp"

namespace combination {

// =============================================================================
// Search Counters
// =============================================================================
// Local to one worker. Only ever reported through Progress / Done.

struct SearchCounters {
    uint64_t processed{0};  // leaves evaluated or skipped by pruning
    uint64_t valid{0};      // leaves that passed every rule
    uint64_t stored{0};     // valid leaves actually sent (bounded by the store cap)
};

// =============================================================================
// SearchEngine
// =============================================================================
// Depth-first enumeration of one shard.
//
// At depth i the engine walks dimension i of the lattice (the shard instead
// of dimension 0 at the root). A candidate is pruned when the rounded running
// sum passes max_total + epsilon or when its own group breaks an upper-bound
// rule. Leaves are checked against the total window and every constrained
// group. Accepted rows go out in lexicographic lattice order.
//
// BRANCH STATE:
// One set of aggregates per engine. Before recursing, the group's mass and
// count are saved, updated, and restored on return. Nothing is allocated
// per node, and a sibling never sees another sibling's update.
//
// PROCESSED COUNT:
// A pruned candidate credits every leaf beneath it, so a full run over a
// shard ends with processed == shard size * leaves_below(1). A cancelled run
// ends below that.
//
// CANCELLATION:
// The flag is polled on entry to every call and before every candidate.
// After a stop the engine flushes rows already buffered, sends a last
// Progress, then Done.

class SearchEngine {
public:
    SearchEngine(std::shared_ptr<const CandidateLattice> lattice,
                 std::shared_ptr<const ConstraintSet> constraints,
                 const CancellationFlag* cancel,
                 SearchSink* sink,
                 const SearchOptions& options = {},
                 std::optional<size_t> max_stored = std::nullopt);

    // Enumerates every tuple whose first value is in shard.first_values, then
    // sends Done. May be called once per engine.
    void run(const Shard& shard);

    const SearchCounters& counters() const { return counters_; }
    WorkerId worker_id() const { return worker_id_; }

private:
    void search(size_t index, double running_sum);
    void evaluate_leaf(double running_sum);
    void skip_subtree(size_t index);
    void store_row();
    void flush_rows();
    void maybe_report_progress();
    void report_progress();

    bool stopped() const { return cancel_ && cancel_->requested(); }

    std::shared_ptr<const CandidateLattice> lattice_;
    std::shared_ptr<const ConstraintSet> constraints_;
    const CancellationFlag* cancel_;
    SearchSink* sink_;

    WorkerId worker_id_{0};
    const std::vector<double>* first_values_{nullptr};
    size_t num_dimensions_;
    size_t batch_size_;
    uint64_t progress_interval_;
    uint64_t next_progress_at_;
    uint64_t store_limit_;

    // Branch state (saved/restored around each recursion)
    std::vector<double> current_values_;
    std::vector<double> group_mass_;
    std::vector<uint32_t> group_count_;

    // Pending batch
    std::vector<double> batch_rows_;
    size_t batch_row_count_{0};

    SearchCounters counters_;
    bool finished_{false};
};

}  // namespace combination
