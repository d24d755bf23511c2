/**
 * @file lenkf_errors.hpp
 * @brief Exception types raised by the localized EnKF
 */

#ifndef LENKF_ERRORS_HPP
#define LENKF_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace driftda {

/**
 * @brief Particle, drifter or grid counts differ from the cached configuration
 */
class ConfigurationMismatch : public std::runtime_error {
public:
    explicit ConfigurationMismatch(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * @brief Singular or indefinite matrix met during an update
 */
class LinearAlgebraFailure : public std::runtime_error {
public:
    explicit LinearAlgebraFailure(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * @brief Unknown update method name
 */
class UnsupportedMethod : public std::invalid_argument {
public:
    explicit UnsupportedMethod(const std::string& what)
        : std::invalid_argument(what) {}
};

} // namespace driftda

#endif // LENKF_ERRORS_HPP
