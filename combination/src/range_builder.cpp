// range_builder.cpp - Component range discretization

#include "combination/range_builder.hpp"
#include "combination/debug_log.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstring>

namespace combination {

namespace {

constexpr int MAX_DECIMAL_PLACES = 10;

}  // namespace

int decimal_places(double value) {
    if (!std::isfinite(value)) return 0;

    // Printing with a fixed number of digits absorbs binary noise such as
    // 0.30000000000000004 before trailing zeros are counted off.
    char buffer[64];
    int len = snprintf(buffer, sizeof(buffer), "%.*f", MAX_DECIMAL_PLACES, std::fabs(value));
    if (len <= 0 || len >= static_cast<int>(sizeof(buffer))) return 0;

    const char* dot = std::strchr(buffer, '.');
    if (!dot) return 0;

    int places = static_cast<int>(std::strlen(dot + 1));
    while (places > 0 && dot[places] == '0') {
        --places;
    }
    return places;
}

std::vector<double> build_component_values(const ComponentSpec& component) {
    if (component.is_fixed()) {
        return {round_value(*component.fixed)};
    }

    int digits = std::max({decimal_places(component.step),
                           decimal_places(component.min),
                           decimal_places(component.max)});
    const double scale = std::pow(10.0, digits);

    const long long lo = std::llround(component.min * scale);
    const long long hi = std::llround(component.max * scale);
    const long long stride = std::max(1LL, std::llround(component.step * scale));

    std::vector<double> values;
    if (hi >= lo) {
        values.reserve(static_cast<size_t>((hi - lo) / stride + 1));
        for (long long i = lo; i <= hi; i += stride) {
            values.push_back(round_value(static_cast<double>(i) / scale));
        }
    }

    if (values.empty()) {
        values.push_back(round_value(component.min));
    }
    return values;
}

CandidateLattice::CandidateLattice(std::vector<std::vector<double>> dimensions)
    : dimensions_(std::move(dimensions))
    , suffix_products_(dimensions_.size() + 1, 1)
{
    for (size_t i = dimensions_.size(); i-- > 0;) {
        suffix_products_[i] = saturating_mul(suffix_products_[i + 1], dimensions_[i].size());
    }
}

std::shared_ptr<const CandidateLattice> build_lattice(const SearchRequest& request) {
    std::vector<std::vector<double>> dimensions;
    dimensions.reserve(request.components.size());
    for (const auto& component : request.components) {
        dimensions.push_back(build_component_values(component));
        COMBINATION_DEBUG_LOG("lattice '%s': %zu values",
                              component.name.c_str(), dimensions.back().size());
    }
    return std::make_shared<const CandidateLattice>(std::move(dimensions));
}

}  // namespace combination
