/**
 * @file Errors.h
 * @brief Exception types raised by keyforge builders and the finishing stage
 *
 * Boolean failures inside the assembler are reported as values
 * (BooleanResult / StepStatus). Exceptions are reserved for conditions
 * that end a builder call: invalid dimensions, an annulus whose hole could
 * not be cut, and a final solid with no geometry.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace keyforge {

/**
 * @brief A dimension, count or scale is outside its valid domain
 */
class InvalidParameterError : public std::invalid_argument {
public:
    InvalidParameterError(const std::string& parameter, const std::string& detail)
        : std::invalid_argument("Invalid parameter '" + parameter + "': " + detail)
        , parameter_(parameter) {}

    const std::string& parameter() const { return parameter_; }

private:
    std::string parameter_;
};

/**
 * @brief A boolean operation could not produce a valid solid
 */
class BooleanOperationError : public std::runtime_error {
public:
    explicit BooleanOperationError(const std::string& msg)
        : std::runtime_error(msg) {}
};

/**
 * @brief The solid handed to a stage has no usable geometry
 */
class NoGeometryError : public std::runtime_error {
public:
    explicit NoGeometryError(const std::string& msg)
        : std::runtime_error(msg) {}
};

// Throws InvalidParameterError unless value > 0 (and finite).
void requirePositive(const char* parameter, double value);

} // namespace keyforge
