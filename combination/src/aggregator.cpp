// aggregator.cpp - Coordinator-side merge of worker messages

#include "combination/aggregator.hpp"
#include "combination/debug_log.hpp"

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace combination {

ResultAggregator::ResultAggregator(size_t num_workers, size_t row_width,
                                   uint64_t total_expected, size_t display_cap)
    : workers_(num_workers)
    , row_width_(row_width)
    , total_expected_(total_expected)
    , display_cap_(display_cap)
{
    display_rows_.reserve(std::min<size_t>(display_cap_, 4096) * row_width_);
}

void ResultAggregator::consume(WorkerMessage&& message) {
    std::visit([this](auto&& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, Progress>) {
            on_progress(m);
        } else if constexpr (std::is_same_v<T, ResultBatch>) {
            on_batch(std::move(m));
        } else {
            on_done(m);
        }
    }, std::move(message));
}

double ResultAggregator::progress_percent() const {
    if (is_done()) return 100.0;
    if (total_expected_ == 0) return 0.0;
    double pct = 100.0 * static_cast<double>(total_processed_) / static_cast<double>(total_expected_);
    return std::min(pct, 100.0);
}

std::vector<std::vector<double>> ResultAggregator::export_rows() const {
    std::vector<std::vector<double>> rows;
    rows.reserve(static_cast<size_t>(total_stored_));
    for_each_export_row([&rows](const double* row, size_t width) {
        rows.emplace_back(row, row + width);
    });
    return rows;
}

ResultAggregator::WorkerTotals& ResultAggregator::worker(WorkerId id) {
    if (id >= workers_.size()) {
        throw std::out_of_range("ResultAggregator: message from unknown worker " + std::to_string(id));
    }
    return workers_[id];
}

// Totals are rebuilt from per-worker deltas: a worker's report replaces its
// own previous values, never the run total.
void ResultAggregator::update_worker(WorkerId id, uint64_t processed, uint64_t valid) {
    WorkerTotals& w = worker(id);
    if (processed > w.processed) {
        total_processed_ += processed - w.processed;
        w.processed = processed;
    }
    if (valid > w.valid) {
        total_valid_ += valid - w.valid;
        w.valid = valid;
    }
}

void ResultAggregator::on_progress(const Progress& progress) {
    update_worker(progress.worker_id, progress.processed, progress.valid);
}

void ResultAggregator::on_batch(ResultBatch&& batch) {
    WorkerTotals& w = worker(batch.worker_id);
    if (batch.row_count == 0) return;

    w.stored += batch.row_count;
    total_stored_ += batch.row_count;

    size_t shown = display_row_count();
    if (shown < display_cap_) {
        size_t take = std::min(display_cap_ - shown, batch.row_count);
        display_rows_.insert(display_rows_.end(), batch.rows.begin(),
                             batch.rows.begin() + static_cast<std::ptrdiff_t>(take * row_width_));
        if (take < batch.row_count) truncated_ = true;
    } else {
        truncated_ = true;
    }

    export_batches_.push_back(std::move(batch));
}

void ResultAggregator::on_done(const Done& done) {
    WorkerTotals& w = worker(done.worker_id);
    if (w.done) return;

    update_worker(done.worker_id, done.processed, done.valid);
    w.done = true;
    ++workers_done_;

    COMBINATION_DEBUG_LOG("aggregator: worker %u done (%zu/%zu), stored %llu/%llu reported",
                          done.worker_id, workers_done_, workers_.size(),
                          static_cast<unsigned long long>(w.stored),
                          static_cast<unsigned long long>(done.stored));
}

}  // namespace combination
