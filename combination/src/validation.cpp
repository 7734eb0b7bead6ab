// validation.cpp - SearchRequest checks run before a search starts

#include "combination/validation.hpp"
#include "combination/range_builder.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace combination {

namespace {

// Finest step that survives rounding to VALUE_DECIMALS places
constexpr double MIN_STEP = 1.0 / VALUE_SCALE;

// Scaled bounds are stepped as integers; past 2^53 a double no longer holds
// every integer and llround may overflow.
constexpr double MAX_SCALED_BOUND = 9007199254740992.0;

constexpr double MAX_COMPONENT_VALUES = 10000000.0;

std::string component_label(const ComponentSpec& component, size_t index) {
    std::ostringstream oss;
    if (component.name.empty()) {
        oss << "Component #" << (index + 1);
    } else {
        oss << "Component '" << component.name << "'";
    }
    return oss.str();
}

std::optional<std::string> check_component(const ComponentSpec& component, size_t index) {
    const std::string label = component_label(component, index);

    if (component.is_fixed()) {
        double value = *component.fixed;
        if (!std::isfinite(value)) {
            return label + ": fixed value must be a number";
        }
        if (value < 0.0) {
            return label + ": fixed value must not be negative";
        }
        return std::nullopt;
    }

    if (!std::isfinite(component.min) || !std::isfinite(component.max)) {
        return label + ": min and max are required";
    }
    if (!std::isfinite(component.step) || component.step <= 0.0) {
        return label + ": step must be greater than 0";
    }
    if (component.min < 0.0) {
        return label + ": min must not be negative";
    }
    if (component.min > component.max) {
        return label + ": min must not exceed max";
    }
    if (component.step < MIN_STEP) {
        return label + ": step must be at least 0.000001";
    }

    const int digits = std::max({decimal_places(component.step),
                                 decimal_places(component.min),
                                 decimal_places(component.max)});
    const double scale = std::pow(10.0, digits);
    if (component.max * scale > MAX_SCALED_BOUND || component.step * scale > MAX_SCALED_BOUND) {
        return label + ": bounds are too large for the precision of min, max and step";
    }

    const double count = std::floor((component.max - component.min) / component.step) + 1.0;
    if (count > MAX_COMPONENT_VALUES) {
        std::ostringstream oss;
        oss << label << ": range has too many values (" << static_cast<unsigned long long>(count)
            << ", limit " << static_cast<unsigned long long>(MAX_COMPONENT_VALUES) << ")";
        return oss.str();
    }
    return std::nullopt;
}

std::optional<std::string> check_group(const std::string& name, const GroupConstraint& group) {
    const std::string label = "Group '" + name + "'";

    for (const auto* mass : {&group.min_mass, &group.max_mass, &group.fixed_mass}) {
        if (!mass->has_value()) continue;
        if (!std::isfinite(**mass)) {
            return label + ": mass bounds must be numbers";
        }
        if (**mass < 0.0) {
            return label + ": mass bounds must not be negative";
        }
    }
    if (group.min_mass && group.max_mass && *group.min_mass > *group.max_mass) {
        return label + ": min mass must not exceed max mass";
    }
    if (group.min_count && group.max_count && *group.min_count > *group.max_count) {
        return label + ": min count must not exceed max count";
    }
    return std::nullopt;
}

}  // namespace

std::optional<std::string> check_request(const SearchRequest& request) {
    if (request.components.empty()) {
        return std::string("Add at least one component");
    }

    for (size_t i = 0; i < request.components.size(); ++i) {
        if (auto problem = check_component(request.components[i], i)) {
            return problem;
        }
    }

    if (!std::isfinite(request.min_total) || !std::isfinite(request.max_total)) {
        return std::string("Total bounds are required");
    }
    if (request.min_total > request.max_total) {
        return std::string("Minimum total must not exceed maximum total");
    }
    if (!std::isfinite(request.epsilon) || request.epsilon < 0.0) {
        return std::string("Tolerance must be a non-negative number");
    }

    for (const auto& [name, group] : request.groups) {
        if (auto problem = check_group(name, group)) {
            return problem;
        }
    }

    return std::nullopt;
}

void validate_request(const SearchRequest& request) {
    if (auto problem = check_request(request)) {
        throw ValidationError(*problem);
    }
}

}  // namespace combination
