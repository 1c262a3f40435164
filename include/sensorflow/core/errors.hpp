#pragma once

/**
 * @file errors.hpp
 * @brief Exception types raised by the library
 */

#include <stdexcept>
#include <string>

namespace sensorflow {

/**
 * @brief An aggregate was requested over data whose total weight is zero
 */
class EmptyAggregateError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Configuration could not be read or holds an invalid value
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A finalized aggregate could not be written to its output
 */
class OutputError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief An input document (locations, recorded events) is unusable as a whole
 */
class SourceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace sensorflow
