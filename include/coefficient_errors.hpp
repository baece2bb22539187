#pragma once

#include <stdexcept>
#include <string>

/**
 * @file coefficient_errors.hpp
 * @brief Exception types raised by coefficient evaluation.
 *
 * Callers can catch the standard base classes; the concrete types let
 * tests and drivers tell input errors apart from solver failures.
 */

namespace deckcoef
{

/**
 * @brief An angle magnitude is outside the supported range.
 */
class DomainRangeError : public std::domain_error
{
public:
    explicit DomainRangeError(const std::string& what) : std::domain_error(what) {}
};

/**
 * @brief Query sequences are mismatched in length or otherwise malformed.
 */
class ShapeError : public std::invalid_argument
{
public:
    explicit ShapeError(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @brief Unknown strategy/frame token, or a missing or invalid channel configuration.
 */
class UnsupportedConfigurationError : public std::invalid_argument
{
public:
    explicit UnsupportedConfigurationError(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @brief Polynomial surface fit could not be solved.
 */
class FitError : public std::runtime_error
{
public:
    explicit FitError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Measurement table could not be read or parsed.
 */
class TableLoadError : public std::runtime_error
{
public:
    explicit TableLoadError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace deckcoef
