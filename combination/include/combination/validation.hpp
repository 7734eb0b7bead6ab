#ifndef COMBINATION_VALIDATION_HPP
#define COMBINATION_VALIDATION_HPP

#include "combination/types.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace combination {

// Raised before any lattice is built or any worker is started.
// what() is a single message suitable for showing to the user as-is.
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& message)
        : std::invalid_argument(message) {}
};

// Returns the first problem found, or nullopt if the request can be searched.
std::optional<std::string> check_request(const SearchRequest& request);

// Throws ValidationError with the message from check_request().
void validate_request(const SearchRequest& request);

}  // namespace combination

#endif  // COMBINATION_VALIDATION_HPP
