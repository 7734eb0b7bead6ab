// partitioner.cpp - Sharding of the outermost dimension

#include "combination/partitioner.hpp"
#include "combination/debug_log.hpp"

#include <algorithm>
#include <thread>

namespace combination {

size_t resolve_worker_count(size_t available, size_t first_dimension_size) {
    size_t workers = available > 0 ? available : std::thread::hardware_concurrency();
    if (workers == 0) workers = 1;
    return std::clamp<size_t>(workers, 1, std::max<size_t>(1, first_dimension_size));
}

std::vector<Shard> partition_first_dimension(const std::vector<double>& first_dimension,
                                             size_t num_workers) {
    if (num_workers == 0) num_workers = 1;

    const size_t len = first_dimension.size();
    const size_t chunk = (len + num_workers - 1) / num_workers;

    std::vector<Shard> shards(num_workers);
    for (size_t w = 0; w < num_workers; ++w) {
        shards[w].worker_id = static_cast<WorkerId>(w);
        size_t begin = std::min(len, w * chunk);
        size_t end = std::min(len, begin + chunk);
        shards[w].first_values.assign(first_dimension.begin() + begin,
                                      first_dimension.begin() + end);
        COMBINATION_DEBUG_LOG("shard %zu: [%zu, %zu)", w, begin, end);
    }
    return shards;
}

}  // namespace combination
