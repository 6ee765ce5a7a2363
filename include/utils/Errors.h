#pragma once

#include <stdexcept>
#include <string>

namespace landmark_eval {

/**
 * Raised when an operation receives an empty point set (or an empty
 * collection of point sets) where at least one element is required.
 */
class InvalidInputError : public std::invalid_argument {
public:
    explicit InvalidInputError(const std::string& what)
        : std::invalid_argument(what) {}
};

/**
 * Raised when point data does not have exactly two coordinate columns.
 */
class DimensionMismatchError : public std::invalid_argument {
public:
    explicit DimensionMismatchError(const std::string& what)
        : std::invalid_argument(what) {}
};

} // namespace landmark_eval
