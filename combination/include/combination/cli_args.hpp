#ifndef COMBINATION_CLI_ARGS_HPP
#define COMBINATION_CLI_ARGS_HPP

#include "combination/types.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace combination {
namespace cli {

// Bad command line. The formulation_search tool exits with code 2 on it.
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Splits on sep, keeping empty fields (a trailing separator yields a final "").
std::vector<std::string> split(const std::string& text, char sep);

// Whole-string parses. `what` names the argument in the error message.
double parse_number(const std::string& text, const std::string& what);

// Rejects signs, trailing characters and values above max.
uint64_t parse_count(const std::string& text, const std::string& what,
                     uint64_t max = std::numeric_limits<uint64_t>::max());

// NAME:GROUP:MIN:MAX:STEP
ComponentSpec parse_component(const std::string& arg);

// NAME:GROUP:VALUE
ComponentSpec parse_fixed(const std::string& arg);

// GROUP:key=value[,key=value], merged into request.groups[GROUP].
// Keys: minMass maxMass fixedMass minCount maxCount.
void parse_group(const std::string& arg, SearchRequest& request);

// MIN:MAX into request.min_total / request.max_total
void parse_total(const std::string& arg, SearchRequest& request);

}  // namespace cli
}  // namespace combination

#endif  // COMBINATION_CLI_ARGS_HPP
