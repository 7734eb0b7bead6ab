// constraint_set.cpp - Group interning and leaf acceptance

#include "combination/constraint_set.hpp"
#include "combination/debug_log.hpp"

#include <cmath>

namespace combination {

ConstraintSet::ConstraintSet(const SearchRequest& request)
    : min_total_(request.min_total)
    , max_total_(request.max_total)
    , epsilon_(request.epsilon)
{
    component_groups_.reserve(request.components.size());
    for (const auto& component : request.components) {
        component_groups_.push_back(intern(component.group));
    }
    for (const auto& [name, rules] : request.groups) {
        GroupId id = intern(name);
        constraints_[id] = rules;
    }

    for (GroupId id = 0; id < constraints_.size(); ++id) {
        if (!constraints_[id].is_unconstrained()) {
            constrained_groups_.push_back(id);
        }
    }

    COMBINATION_DEBUG_LOG("constraint set: %zu groups, %zu constrained, total [%g, %g] eps %g",
                          group_names_.size(), constrained_groups_.size(),
                          min_total_, max_total_, epsilon_);
}

GroupId ConstraintSet::intern(const std::string& name) {
    GroupId existing = find_group(name);
    if (existing != INVALID_GROUP) return existing;

    group_names_.push_back(name);
    constraints_.emplace_back();
    return static_cast<GroupId>(group_names_.size() - 1);
}

GroupId ConstraintSet::find_group(const std::string& name) const {
    // Only used while building; group counts are small
    for (GroupId id = 0; id < group_names_.size(); ++id) {
        if (group_names_[id] == name) return id;
    }
    return INVALID_GROUP;
}

bool ConstraintSet::accepts_group(GroupId group, double mass, uint32_t count) const {
    const GroupConstraint& c = constraints_[group];
    if (c.fixed_mass && std::fabs(mass - *c.fixed_mass) > epsilon_) return false;
    if (c.min_mass && mass < *c.min_mass - epsilon_) return false;
    if (c.min_count && count < *c.min_count) return false;
    if (c.max_mass && mass > *c.max_mass + epsilon_) return false;
    if (c.max_count && count > *c.max_count) return false;
    return true;
}

}  // namespace combination
