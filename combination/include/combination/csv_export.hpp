#ifndef COMBINATION_CSV_EXPORT_HPP
#define COMBINATION_CSV_EXPORT_HPP

#include "combination/aggregator.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace combination {

// Shortest decimal form with at most 6 fractional digits ("0.25", "1", "0.333333")
std::string format_value(double value);

// Quotes a header cell if it contains a separator, quote or line break
std::string csv_escape(const std::string& cell);

// Header of component names, then every exported row in arrival order.
// Returns the number of data rows written.
size_t write_csv(std::ostream& out,
                 const std::vector<std::string>& component_names,
                 const ResultAggregator& results);

}  // namespace combination

#endif  // COMBINATION_CSV_EXPORT_HPP
