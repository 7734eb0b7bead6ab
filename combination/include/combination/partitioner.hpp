#ifndef COMBINATION_PARTITIONER_HPP
#define COMBINATION_PARTITIONER_HPP

#include "combination/types.hpp"

#include <vector>

namespace combination {

// Contiguous slice of dimension 0 handed to one worker
struct Shard {
    WorkerId worker_id{0};
    std::vector<double> first_values;
};

// W = clamp(available, 1, first_dimension_size). `available` of 0 means
// "ask the hardware".
size_t resolve_worker_count(size_t available, size_t first_dimension_size);

// Splits `first_dimension` into `num_workers` order-preserving slices of
// ceil(len / W) values. Trailing shards may be short or empty; every worker
// still gets a Shard so it can report Done.
std::vector<Shard> partition_first_dimension(const std::vector<double>& first_dimension,
                                             size_t num_workers);

}  // namespace combination

#endif  // COMBINATION_PARTITIONER_HPP
