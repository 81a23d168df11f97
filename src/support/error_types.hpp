// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace optrisk {

/// Error codes for input validation failures
enum class ValidationErrorCode {
    InvalidStrike,
    InvalidSpotPrice,
    InvalidVolatility,
    InvalidRate,
    InvalidDividend,
    InvalidQuantity,
    InvalidHorizon,
    InvalidSimulationCount,
    InvalidCrashFraction,
    EmptyGrid,
    InvalidGridSize,
    InvalidGridRange
};

/// Detailed validation error for parameter validation failures
struct ValidationError {
    ValidationErrorCode code;
    double value;  // The invalid value that was provided
    size_t index;  // Index into the offending list (0 if not applicable)

    ValidationError(ValidationErrorCode code,
                   double value = 0.0,
                   size_t index = 0)
        : code(code), value(value), index(index) {}
};

/// IV solver error categories
enum class IVErrorCode {
    // Validation errors
    NonPositiveMarketPrice,
    ExpiredOption,
    InvalidInput,      ///< Contract or market rejected, see IVError::cause

    // Convergence errors
    MaxIterationsExceeded
};

/// Detailed IV solver error with diagnostics
struct IVError {
    IVErrorCode code;
    size_t iterations = 0;           ///< Newton + bisection iterations before failure
    double final_error = 0.0;        ///< |Price(σ) - Market_Price| at the last candidate
    std::optional<double> last_vol;  ///< Last volatility candidate tried
    std::optional<ValidationError> cause;  ///< Set for InvalidInput
};

/// True when the solver ran and failed to converge, false for rejected input
constexpr bool is_convergence_failure(IVErrorCode code) {
    return code == IVErrorCode::MaxIterationsExceeded;
}

constexpr std::string_view to_string(ValidationErrorCode code) {
    switch (code) {
        case ValidationErrorCode::InvalidStrike:          return "strike must be positive and finite";
        case ValidationErrorCode::InvalidSpotPrice:       return "spot price must be positive and finite";
        case ValidationErrorCode::InvalidVolatility:      return "volatility must be non-negative and finite";
        case ValidationErrorCode::InvalidRate:            return "risk-free rate must be finite";
        case ValidationErrorCode::InvalidDividend:        return "dividend yield must be non-negative and finite";
        case ValidationErrorCode::InvalidQuantity:        return "quantity must be finite";
        case ValidationErrorCode::InvalidHorizon:         return "horizon must be a positive number of days";
        case ValidationErrorCode::InvalidSimulationCount: return "simulation count must be positive";
        case ValidationErrorCode::InvalidCrashFraction:   return "crash fraction must be negative and above -1";
        case ValidationErrorCode::EmptyGrid:              return "grid must not be empty";
        case ValidationErrorCode::InvalidGridSize:        return "grid must have at least two points";
        case ValidationErrorCode::InvalidGridRange:       return "grid range must be positive";
    }
    return "unknown validation error";
}

constexpr std::string_view to_string(IVErrorCode code) {
    switch (code) {
        case IVErrorCode::NonPositiveMarketPrice: return "market price must be positive";
        case IVErrorCode::ExpiredOption:          return "implied volatility is undefined at or after expiry";
        case IVErrorCode::InvalidInput:           return "contract or market is invalid";
        case IVErrorCode::MaxIterationsExceeded:  return "implied volatility did not converge";
    }
    return "unknown implied volatility error";
}

/// Output stream operator for ValidationError
inline std::ostream& operator<<(std::ostream& os, const ValidationError& err) {
    os << "ValidationError{" << to_string(err.code)
       << ", value=" << err.value
       << ", index=" << err.index << "}";
    return os;
}

/// Output stream operator for IVError
inline std::ostream& operator<<(std::ostream& os, const IVError& err) {
    os << "IVError{" << to_string(err.code)
       << ", iterations=" << err.iterations
       << ", final_error=" << err.final_error;
    if (err.last_vol) {
        os << ", last_vol=" << *err.last_vol;
    }
    if (err.cause) {
        os << ", cause=" << *err.cause;
    }
    os << "}";
    return os;
}

}  // namespace optrisk
