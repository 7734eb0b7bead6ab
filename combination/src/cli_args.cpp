// cli_args.cpp - argument parsing for the formulation_search tool

#include "combination/cli_args.hpp"

#include <sstream>

namespace combination {
namespace cli {

std::vector<std::string> split(const std::string& text, char sep) {
    std::vector<std::string> parts;
    std::stringstream ss(text);
    std::string part;
    while (std::getline(ss, part, sep)) {
        parts.push_back(part);
    }
    if (!text.empty() && text.back() == sep) {
        parts.emplace_back();
    }
    return parts;
}

double parse_number(const std::string& text, const std::string& what) {
    try {
        size_t used = 0;
        double value = std::stod(text, &used);
        if (used != text.size()) throw std::invalid_argument(text);
        return value;
    } catch (const std::logic_error&) {
        throw UsageError("'" + text + "' is not a number (" + what + ")");
    }
}

uint64_t parse_count(const std::string& text, const std::string& what, uint64_t max) {
    unsigned long long value = 0;
    try {
        size_t used = 0;
        value = std::stoull(text, &used);
        if (used != text.size() || text.find('-') != std::string::npos) throw std::invalid_argument(text);
    } catch (const std::logic_error&) {
        throw UsageError("'" + text + "' is not a non-negative integer (" + what + ")");
    }
    if (value > max) {
        throw UsageError("'" + text + "' is too large (" + what + ", at most " + std::to_string(max) + ")");
    }
    return value;
}

ComponentSpec parse_component(const std::string& arg) {
    auto parts = split(arg, ':');
    if (parts.size() != 5) {
        throw UsageError("--component expects NAME:GROUP:MIN:MAX:STEP, got '" + arg + "'");
    }
    ComponentSpec spec;
    spec.name = parts[0];
    spec.group = parts[1];
    spec.min = parse_number(parts[2], "min of " + parts[0]);
    spec.max = parse_number(parts[3], "max of " + parts[0]);
    spec.step = parse_number(parts[4], "step of " + parts[0]);
    return spec;
}

ComponentSpec parse_fixed(const std::string& arg) {
    auto parts = split(arg, ':');
    if (parts.size() != 3) {
        throw UsageError("--fixed expects NAME:GROUP:VALUE, got '" + arg + "'");
    }
    ComponentSpec spec;
    spec.name = parts[0];
    spec.group = parts[1];
    spec.fixed = parse_number(parts[2], "value of " + parts[0]);
    return spec;
}

void parse_group(const std::string& arg, SearchRequest& request) {
    size_t colon = arg.find(':');
    if (colon == std::string::npos || colon == 0) {
        throw UsageError("--group expects GROUP:key=value[,key=value], got '" + arg + "'");
    }
    const std::string name = arg.substr(0, colon);
    GroupConstraint& group = request.groups[name];

    for (const auto& rule : split(arg.substr(colon + 1), ',')) {
        size_t eq = rule.find('=');
        if (eq == std::string::npos) {
            throw UsageError("group rule '" + rule + "' must be key=value");
        }
        const std::string key = rule.substr(0, eq);
        const std::string value = rule.substr(eq + 1);
        const std::string what = key + " of group " + name;
        constexpr uint64_t count_limit = std::numeric_limits<uint32_t>::max();

        if (key == "minMass") {
            group.min_mass = parse_number(value, what);
        } else if (key == "maxMass") {
            group.max_mass = parse_number(value, what);
        } else if (key == "fixedMass") {
            group.fixed_mass = parse_number(value, what);
        } else if (key == "minCount") {
            group.min_count = static_cast<uint32_t>(parse_count(value, what, count_limit));
        } else if (key == "maxCount") {
            group.max_count = static_cast<uint32_t>(parse_count(value, what, count_limit));
        } else {
            throw UsageError("unknown group rule '" + key + "'");
        }
    }
}

void parse_total(const std::string& arg, SearchRequest& request) {
    auto bounds = split(arg, ':');
    if (bounds.size() != 2) throw UsageError("--total expects MIN:MAX");
    request.min_total = parse_number(bounds[0], "minimum total");
    request.max_total = parse_number(bounds[1], "maximum total");
}

}  // namespace cli
}  // namespace combination
