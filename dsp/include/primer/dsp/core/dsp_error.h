// ==============================================================================
// Layer 0: Core Utility - Error Types
// ==============================================================================
// Exception hierarchy thrown by every analysis operation when its inputs are
// out of range. Each error names the component, the offending parameter, its
// value and the violated constraint, so the caller can correct the input.
//
// Operations validate eagerly and throw before computing anything: there are
// no partial results and no NaN outputs.
//
// Hierarchy:
//   std::invalid_argument
//     DspError
//       InvalidParameter   (out-of-range generator/filter/quantizer settings)
//         InvalidSpec      (filter specification violations)
//       InvalidInput       (malformed signals, e.g. too short)
//       InvalidSpectrum    (degenerate spectra, no fundamental)
// ==============================================================================

#pragma once

#include <cmath>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace Primer {
namespace DSP {

/// @brief Error category carried by every DspError
enum class ErrorKind : uint8_t {
    InvalidParameter,
    InvalidInput,
    InvalidSpectrum
};

/// @brief Human-readable name of an error kind
[[nodiscard]] inline const char* errorKindName(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidParameter: return "InvalidParameter";
        case ErrorKind::InvalidInput:     return "InvalidInput";
        case ErrorKind::InvalidSpectrum:  return "InvalidSpectrum";
    }
    return "Unknown";
}

namespace detail {

template <typename T>
[[nodiscard]] std::string formatValue(const T& value) {
    std::ostringstream os;
    os << value;
    return os.str();
}

[[nodiscard]] inline std::string formatMessage(ErrorKind kind,
                                               const std::string& component,
                                               const std::string& parameter,
                                               const std::string& value,
                                               const std::string& constraint) {
    std::ostringstream os;
    os << errorKindName(kind) << ": " << component << ": " << parameter
       << " = " << value << " (" << constraint << ")";
    return os.str();
}

} // namespace detail

// =============================================================================
// DspError
// =============================================================================

/// @brief Base class of all analysis errors
class DspError : public std::invalid_argument {
public:
    DspError(ErrorKind kind,
             std::string component,
             std::string parameter,
             std::string value,
             std::string constraint)
        : std::invalid_argument(detail::formatMessage(kind, component, parameter, value, constraint))
        , kind_(kind)
        , component_(std::move(component))
        , parameter_(std::move(parameter))
        , value_(std::move(value))
        , constraint_(std::move(constraint)) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& component() const noexcept { return component_; }
    [[nodiscard]] const std::string& parameter() const noexcept { return parameter_; }
    [[nodiscard]] const std::string& value() const noexcept { return value_; }
    [[nodiscard]] const std::string& constraint() const noexcept { return constraint_; }

private:
    ErrorKind kind_;
    std::string component_;
    std::string parameter_;
    std::string value_;
    std::string constraint_;
};

/// @brief Out-of-range configuration value
class InvalidParameter : public DspError {
public:
    template <typename T>
    InvalidParameter(std::string component, std::string parameter, const T& value,
                     std::string constraint)
        : DspError(ErrorKind::InvalidParameter, std::move(component), std::move(parameter),
                   detail::formatValue(value), std::move(constraint)) {}
};

/// @brief Filter specification that cannot be designed
class InvalidSpec : public InvalidParameter {
public:
    template <typename T>
    InvalidSpec(std::string parameter, const T& value, std::string constraint)
        : InvalidParameter("FilterSpec", std::move(parameter), value, std::move(constraint)) {}
};

/// @brief Malformed input signal
class InvalidInput : public DspError {
public:
    template <typename T>
    InvalidInput(std::string component, std::string parameter, const T& value,
                 std::string constraint)
        : DspError(ErrorKind::InvalidInput, std::move(component), std::move(parameter),
                   detail::formatValue(value), std::move(constraint)) {}
};

/// @brief Spectrum from which metrics cannot be extracted
class InvalidSpectrum : public DspError {
public:
    template <typename T>
    InvalidSpectrum(std::string component, std::string parameter, const T& value,
                    std::string constraint)
        : DspError(ErrorKind::InvalidSpectrum, std::move(component), std::move(parameter),
                   detail::formatValue(value), std::move(constraint)) {}
};

// =============================================================================
// Validation Helpers
// =============================================================================

/// @brief Throw InvalidParameter unless value is finite and > 0
inline void requirePositive(const char* component, const char* parameter, double value) {
    if (!std::isfinite(value) || value <= 0.0) {
        throw InvalidParameter(component, parameter, value, "must be finite and > 0");
    }
}

/// @brief Throw InvalidParameter unless value is finite and >= 0
inline void requireNonNegative(const char* component, const char* parameter, double value) {
    if (!std::isfinite(value) || value < 0.0) {
        throw InvalidParameter(component, parameter, value, "must be finite and >= 0");
    }
}

/// @brief Throw InvalidParameter unless value is finite
inline void requireFinite(const char* component, const char* parameter, double value) {
    if (!std::isfinite(value)) {
        throw InvalidParameter(component, parameter, value, "must be finite");
    }
}

} // namespace DSP
} // namespace Primer
