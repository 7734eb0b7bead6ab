#ifndef COMBINATION_TYPES_HPP
#define COMBINATION_TYPES_HPP

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace combination {

// Dense group index assigned when the constraint set is built.
// The search loop only ever sees GroupIds, never group names.
using GroupId = uint32_t;
using WorkerId = uint32_t;

constexpr GroupId INVALID_GROUP = std::numeric_limits<GroupId>::max();

constexpr double DEFAULT_EPSILON = 1e-6;
constexpr int VALUE_DECIMALS = 6;
constexpr double VALUE_SCALE = 1e6;

// Round to VALUE_DECIMALS places. All emitted values and running sums pass
// through here so that 0.1 + 0.2 compares equal to 0.3.
inline double round_value(double value) {
    return std::round(value * VALUE_SCALE) / VALUE_SCALE;
}

// =============================================================================
// ComponentSpec
// =============================================================================
// One dimension of the search. Either `fixed` is set and the component
// contributes exactly that value, or min..max is sampled every `step`.

struct ComponentSpec {
    std::string name;
    std::string group;
    double min{0.0};
    double max{1.0};
    double step{0.1};
    std::optional<double> fixed;

    bool is_fixed() const { return fixed.has_value(); }
};

// =============================================================================
// GroupConstraint
// =============================================================================
// Aggregate rules for all components sharing a group. Every field is
// optional; an empty optional means "unconstrained".
// fixed_mass dominates max_mass when pruning partial tuples.

struct GroupConstraint {
    std::optional<double> min_mass;
    std::optional<double> max_mass;
    std::optional<double> fixed_mass;
    std::optional<uint32_t> min_count;
    std::optional<uint32_t> max_count;

    bool is_unconstrained() const {
        return !min_mass && !max_mass && !fixed_mass && !min_count && !max_count;
    }
};

// =============================================================================
// SearchRequest
// =============================================================================
// Built once per run by the caller, validated, then treated as immutable.

struct SearchRequest {
    std::vector<ComponentSpec> components;
    std::map<std::string, GroupConstraint> groups;
    double min_total{1.0};
    double max_total{1.0};
    double epsilon{DEFAULT_EPSILON};
    // Per-worker retention cap. Rows past the cap are still counted as valid.
    std::optional<size_t> max_stored_results;

    size_t num_components() const { return components.size(); }

    std::vector<std::string> component_names() const {
        std::vector<std::string> names;
        names.reserve(components.size());
        for (const auto& c : components) {
            names.push_back(c.name);
        }
        return names;
    }
};

// =============================================================================
// SearchOptions
// =============================================================================
// Runtime tuning knobs for a ParallelSearch. Defaults match the interactive
// tool: 200-row batches, progress every 5000 leaves, 1000 rows on screen.

struct SearchOptions {
    size_t num_workers{0};          // 0 = std::thread::hardware_concurrency()
    size_t batch_size{200};         // rows per ResultBatch
    uint64_t progress_interval{5000};  // leaves between Progress messages
    size_t display_cap{1000};       // rows kept in the bounded display view
};

}  // namespace combination

#endif  // COMBINATION_TYPES_HPP
