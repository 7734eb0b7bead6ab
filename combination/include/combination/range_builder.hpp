#ifndef COMBINATION_RANGE_BUILDER_HPP
#define COMBINATION_RANGE_BUILDER_HPP

#include "combination/types.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace combination {

// =============================================================================
// Range discretization
// =============================================================================
// Values are enumerated on an integer lattice: min, max and step are scaled
// by 10^d (d = most fractional digits among them) so that stepping is exact
// integer arithmetic. A naive `for (v = min; v <= max; v += step)` drifts and
// can lose or duplicate the final value.

// Number of significant fractional digits of `value` (at most 10).
int decimal_places(double value);

// Ordered candidate values for one component. Never empty: a range that
// yields no values falls back to round_value(min).
std::vector<double> build_component_values(const ComponentSpec& component);

// =============================================================================
// CandidateLattice
// =============================================================================
// One value sequence per component, in component order. Built once per run
// and shared read-only by every worker.

class CandidateLattice {
public:
    CandidateLattice() = default;
    explicit CandidateLattice(std::vector<std::vector<double>> dimensions);

    size_t num_dimensions() const { return dimensions_.size(); }
    const std::vector<double>& values(size_t dimension) const { return dimensions_[dimension]; }
    size_t dimension_size(size_t dimension) const { return dimensions_[dimension].size(); }

    // Product of all dimension sizes, saturating at UINT64_MAX
    uint64_t total_combinations() const { return leaves_below(0); }

    // Leaves in the subtree rooted at depth `dimension`, i.e. the product of
    // sizes of dimensions [dimension, num_dimensions). 1 past the last one.
    uint64_t leaves_below(size_t dimension) const {
        return dimension < suffix_products_.size() ? suffix_products_[dimension] : 1;
    }

private:
    std::vector<std::vector<double>> dimensions_;
    std::vector<uint64_t> suffix_products_;
};

// Builds every dimension of the request. The request must already be valid.
std::shared_ptr<const CandidateLattice> build_lattice(const SearchRequest& request);

// Saturating multiply used for leaf counts
inline uint64_t saturating_mul(uint64_t a, uint64_t b) {
    if (a != 0 && b > UINT64_MAX / a) return UINT64_MAX;
    return a * b;
}

}  // namespace combination

#endif  // COMBINATION_RANGE_BUILDER_HPP
