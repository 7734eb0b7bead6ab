#ifndef COMBINATION_MESSAGES_HPP
#define COMBINATION_MESSAGES_HPP

#include "combination/types.hpp"

#include <cstdint>
#include <variant>
#include <vector>

namespace combination {

// =============================================================================
// Worker -> coordinator messages
// =============================================================================
// Workers never touch the coordinator's totals. Everything they report goes
// through one of these, in this order per worker:
//   Progress* / ResultBatch* (interleaved)  then exactly one Done.

// Cumulative counters of one worker. processed never decreases.
struct Progress {
    WorkerId worker_id{0};
    uint64_t processed{0};
    uint64_t valid{0};
};

// Accepted rows, flattened row-major (row_count * num_components doubles).
// Moved from worker to coordinator, never copied.
struct ResultBatch {
    WorkerId worker_id{0};
    std::vector<double> rows;
    size_t row_count{0};

    ResultBatch() = default;
    ResultBatch(WorkerId id, std::vector<double> data, size_t count)
        : worker_id(id), rows(std::move(data)), row_count(count) {}

    ResultBatch(ResultBatch&&) noexcept = default;
    ResultBatch& operator=(ResultBatch&&) noexcept = default;
    ResultBatch(const ResultBatch&) = delete;
    ResultBatch& operator=(const ResultBatch&) = delete;

    size_t row_width() const { return row_count ? rows.size() / row_count : 0; }
    const double* row(size_t i) const { return rows.data() + i * row_width(); }
};

// Terminal message. A worker sends nothing after Done.
struct Done {
    WorkerId worker_id{0};
    uint64_t processed{0};
    uint64_t valid{0};
    uint64_t stored{0};
};

using WorkerMessage = std::variant<Progress, ResultBatch, Done>;

inline WorkerId message_worker(const WorkerMessage& message) {
    return std::visit([](const auto& m) { return m.worker_id; }, message);
}

// =============================================================================
// SearchSink
// =============================================================================
// Where a SearchEngine sends its messages. MessageChannel is the threaded
// implementation; tests collect into a vector.

class SearchSink {
public:
    virtual ~SearchSink() = default;
    virtual void emit(WorkerMessage&& message) = 0;
};

}  // namespace combination

#endif  // COMBINATION_MESSAGES_HPP
