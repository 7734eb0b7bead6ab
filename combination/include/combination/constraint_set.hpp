#ifndef COMBINATION_CONSTRAINT_SET_HPP
#define COMBINATION_CONSTRAINT_SET_HPP

#include "combination/types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace combination {

// =============================================================================
// ConstraintSet
// =============================================================================
// Global total window plus per-group aggregate rules, resolved to dense
// GroupIds so the search never touches a string.
//
// GroupIds are handed out in order of first appearance: groups named by
// components first (component order), then groups that only appear in the
// constraint map (name order). A constraint on a group with no components is
// still checked at the leaf, against mass 0 and count 0.

class ConstraintSet {
public:
    explicit ConstraintSet(const SearchRequest& request);

    size_t num_groups() const { return group_names_.size(); }
    size_t num_components() const { return component_groups_.size(); }

    GroupId group_of(size_t component) const { return component_groups_[component]; }
    const std::string& group_name(GroupId group) const { return group_names_[group]; }
    const GroupConstraint& constraint(GroupId group) const { return constraints_[group]; }

    // Returns INVALID_GROUP for an unknown name
    GroupId find_group(const std::string& name) const;

    double min_total() const { return min_total_; }
    double max_total() const { return max_total_; }
    double epsilon() const { return epsilon_; }

    // Partial sums only grow (values are non-negative), so a prefix above the
    // upper bound can never recover.
    bool exceeds_total(double partial_sum) const {
        return partial_sum > max_total_ + epsilon_;
    }

    bool total_in_window(double sum) const {
        return sum >= min_total_ - epsilon_ && sum <= max_total_ + epsilon_;
    }

    // Upper-bound rules of one group against its partial aggregate.
    // fixed_mass acts as an upper bound until the leaf.
    bool violates_partial(GroupId group, double mass, uint32_t count) const {
        const GroupConstraint& c = constraints_[group];
        if (c.fixed_mass && mass > *c.fixed_mass + epsilon_) return true;
        if (c.max_mass && mass > *c.max_mass + epsilon_) return true;
        if (c.max_count && count > *c.max_count) return true;
        return false;
    }

    // Full rule check of one group at a leaf
    bool accepts_group(GroupId group, double mass, uint32_t count) const;

    // Checks every constrained group, stopping at the first failure.
    // `masses` and `counts` are indexed by GroupId.
    bool accepts_leaf(const double* masses, const uint32_t* counts) const {
        for (GroupId group : constrained_groups_) {
            if (!accepts_group(group, masses[group], counts[group])) return false;
        }
        return true;
    }

    const std::vector<GroupId>& constrained_groups() const { return constrained_groups_; }

private:
    GroupId intern(const std::string& name);

    std::vector<std::string> group_names_;
    std::vector<GroupConstraint> constraints_;
    std::vector<GroupId> component_groups_;
    std::vector<GroupId> constrained_groups_;
    double min_total_;
    double max_total_;
    double epsilon_;
};

}  // namespace combination

#endif  // COMBINATION_CONSTRAINT_SET_HPP
