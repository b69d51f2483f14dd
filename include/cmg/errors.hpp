// include/cmg/errors.hpp
#pragma once

#include <stdexcept>
#include <string>

namespace cmg {

// Malformed data handed to the engine (empty batches, bad records, ragged fields)
class InvalidInput : public std::invalid_argument {
public:
    explicit InvalidInput(const std::string& what)
        : std::invalid_argument("Invalid input: " + what) {}
};

// Static settings that can never produce a valid batch
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what)
        : std::invalid_argument("Configuration error: " + what) {}
};

} // namespace cmg
