// search_engine.cpp - Depth-first enumeration of one shard

#include "combination/search_engine.hpp"
#include "combination/debug_log.hpp"

#include <algorithm>
#include <stdexcept>

namespace combination {

namespace {

uint64_t saturating_add(uint64_t a, uint64_t b) {
    return b > UINT64_MAX - a ? UINT64_MAX : a + b;
}

}  // namespace

// =============================================================================
// Construction
// =============================================================================

SearchEngine::SearchEngine(std::shared_ptr<const CandidateLattice> lattice,
                           std::shared_ptr<const ConstraintSet> constraints,
                           const CancellationFlag* cancel,
                           SearchSink* sink,
                           const SearchOptions& options,
                           std::optional<size_t> max_stored)
    : lattice_(std::move(lattice))
    , constraints_(std::move(constraints))
    , cancel_(cancel)
    , sink_(sink)
    , num_dimensions_(lattice_ ? lattice_->num_dimensions() : 0)
    , batch_size_(std::max<size_t>(1, options.batch_size))
    , progress_interval_(options.progress_interval)
    , next_progress_at_(options.progress_interval)
    , store_limit_(max_stored ? static_cast<uint64_t>(*max_stored) : UINT64_MAX)
{
    if (!lattice_ || !constraints_ || !sink_) {
        throw std::invalid_argument("SearchEngine requires a lattice, constraints and a sink");
    }
    if (constraints_->num_components() != num_dimensions_) {
        throw std::invalid_argument("SearchEngine: constraint set and lattice disagree on component count");
    }

    current_values_.assign(num_dimensions_, 0.0);
    group_mass_.assign(constraints_->num_groups(), 0.0);
    group_count_.assign(constraints_->num_groups(), 0);
    batch_rows_.reserve(batch_size_ * num_dimensions_);
}

// =============================================================================
// Run
// =============================================================================

void SearchEngine::run(const Shard& shard) {
    if (finished_) {
        throw std::logic_error("SearchEngine::run called twice");
    }

    worker_id_ = shard.worker_id;
    first_values_ = &shard.first_values;
    debug::WorkerTag tag(worker_id_);

    COMBINATION_DEBUG_LOG("%zu first values, %llu leaves expected",
                          shard.first_values.size(),
                          static_cast<unsigned long long>(
                              saturating_mul(shard.first_values.size(), lattice_->leaves_below(1))));

    if (num_dimensions_ > 0) {
        search(0, 0.0);
    }

    // Rows already buffered were counted as stored; deliver them even after a stop
    flush_rows();
    report_progress();

    COMBINATION_DEBUG_LOG("done%s: processed=%llu valid=%llu stored=%llu",
                          stopped() ? " (stopped)" : "",
                          static_cast<unsigned long long>(counters_.processed),
                          static_cast<unsigned long long>(counters_.valid),
                          static_cast<unsigned long long>(counters_.stored));

    finished_ = true;
    first_values_ = nullptr;
    sink_->emit(Done{worker_id_, counters_.processed, counters_.valid, counters_.stored});
}

// =============================================================================
// Recursion
// =============================================================================

void SearchEngine::search(size_t index, double running_sum) {
    if (stopped()) return;

    if (index == num_dimensions_) {
        evaluate_leaf(running_sum);
        return;
    }

    const std::vector<double>& candidates = index == 0 ? *first_values_ : lattice_->values(index);
    const GroupId group = constraints_->group_of(index);

    for (double value : candidates) {
        if (stopped()) return;

        double new_sum = round_value(running_sum + value);
        if (constraints_->exceeds_total(new_sum)) {
            skip_subtree(index + 1);
            continue;
        }

        const double saved_mass = group_mass_[group];
        const uint32_t saved_count = group_count_[group];

        // Zero does not count as "present" for min/max count rules
        if (value > 0.0) {
            group_mass_[group] = saved_mass + value;
            group_count_[group] = saved_count + 1;
        }

        if (constraints_->violates_partial(group, group_mass_[group], group_count_[group])) {
            group_mass_[group] = saved_mass;
            group_count_[group] = saved_count;
            skip_subtree(index + 1);
            continue;
        }

        current_values_[index] = value;
        search(index + 1, new_sum);

        group_mass_[group] = saved_mass;
        group_count_[group] = saved_count;
    }
}

void SearchEngine::evaluate_leaf(double running_sum) {
    counters_.processed = saturating_add(counters_.processed, 1);

    if (constraints_->total_in_window(running_sum) &&
        constraints_->accepts_leaf(group_mass_.data(), group_count_.data())) {
        ++counters_.valid;
        if (counters_.stored < store_limit_) {
            store_row();
        }
    }

    maybe_report_progress();
}

void SearchEngine::skip_subtree(size_t index) {
    counters_.processed = saturating_add(counters_.processed, lattice_->leaves_below(index));
    maybe_report_progress();
}

// =============================================================================
// Output
// =============================================================================

void SearchEngine::store_row() {
    batch_rows_.insert(batch_rows_.end(), current_values_.begin(), current_values_.end());
    ++batch_row_count_;
    ++counters_.stored;
    if (batch_row_count_ >= batch_size_) {
        flush_rows();
    }
}

void SearchEngine::flush_rows() {
    if (batch_row_count_ == 0) return;

    ResultBatch batch(worker_id_, std::move(batch_rows_), batch_row_count_);
    batch_rows_ = std::vector<double>();
    batch_rows_.reserve(batch_size_ * num_dimensions_);
    batch_row_count_ = 0;

    sink_->emit(std::move(batch));
}

void SearchEngine::maybe_report_progress() {
    if (progress_interval_ == 0 || counters_.processed < next_progress_at_) return;

    report_progress();
    uint64_t next = (counters_.processed / progress_interval_ + 1);
    next_progress_at_ = saturating_mul(next, progress_interval_);
}

void SearchEngine::report_progress() {
    sink_->emit(Progress{worker_id_, counters_.processed, counters_.valid});
}

}  // namespace combination
