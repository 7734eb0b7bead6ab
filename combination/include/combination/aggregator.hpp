#ifndef COMBINATION_AGGREGATOR_HPP
#define COMBINATION_AGGREGATOR_HPP

#include "combination/messages.hpp"

#include <cstdint>
#include <vector>

namespace combination {

// =============================================================================
// ResultAggregator
// =============================================================================
// Coordinator-side merge of everything the workers send. Owned and mutated
// by the coordinating thread only.
//
// - Progress: latest processed/valid per worker, summed for display
// - Batches: kept whole, in arrival order, as the export stream (unbounded)
// - Display: copy of the first `display_cap` rows, truncated() once more arrive
// - Done: run is complete when every worker has sent one

class ResultAggregator {
public:
    ResultAggregator() = default;
    ResultAggregator(size_t num_workers, size_t row_width, uint64_t total_expected,
                     size_t display_cap);

    void consume(WorkerMessage&& message);

    uint64_t total_processed() const { return total_processed_; }
    uint64_t total_valid() const { return total_valid_; }
    uint64_t total_stored() const { return total_stored_; }
    uint64_t total_expected() const { return total_expected_; }

    // 0..100. Fixed at 100 once every worker is done.
    double progress_percent() const;

    size_t num_workers() const { return workers_.size(); }
    size_t workers_done() const { return workers_done_; }
    bool is_done() const { return workers_done_ == workers_.size(); }
    bool worker_done(WorkerId worker) const { return workers_[worker].done; }

    // True if a finished run left leaves unvisited (i.e. it was stopped)
    bool incomplete() const { return is_done() && total_processed_ < total_expected_; }

    // Bounded display view
    size_t row_width() const { return row_width_; }
    size_t display_row_count() const { return row_width_ ? display_rows_.size() / row_width_ : 0; }
    const double* display_row(size_t i) const { return display_rows_.data() + i * row_width_; }
    bool truncated() const { return truncated_; }
    size_t display_cap() const { return display_cap_; }

    // Unbounded export stream, worker-major arrival order
    const std::vector<ResultBatch>& export_batches() const { return export_batches_; }

    template<typename Func>
    void for_each_export_row(Func&& func) const {
        for (const auto& batch : export_batches_) {
            for (size_t i = 0; i < batch.row_count; ++i) {
                func(batch.rows.data() + i * row_width_, row_width_);
            }
        }
    }

    std::vector<std::vector<double>> export_rows() const;

private:
    struct WorkerTotals {
        uint64_t processed{0};
        uint64_t valid{0};
        uint64_t stored{0};
        bool done{false};
    };

    void on_progress(const Progress& progress);
    void on_batch(ResultBatch&& batch);
    void on_done(const Done& done);
    void update_worker(WorkerId worker, uint64_t processed, uint64_t valid);
    WorkerTotals& worker(WorkerId id);

    std::vector<WorkerTotals> workers_;
    size_t row_width_{0};
    uint64_t total_expected_{0};
    size_t display_cap_{0};

    uint64_t total_processed_{0};
    uint64_t total_valid_{0};
    uint64_t total_stored_{0};
    size_t workers_done_{0};

    std::vector<double> display_rows_;
    bool truncated_{false};
    std::vector<ResultBatch> export_batches_;
};

}  // namespace combination

#endif  // COMBINATION_AGGREGATOR_HPP
