#pragma once

/**
 * Engine error taxonomy
 *
 * Every failure is an input-validation failure raised at the offending call.
 * Nothing is retried; the caller must supply corrected input.
 */

#include <cstdint>
#include <stdexcept>
#include <string>

namespace gpo {

enum class ErrorCode : uint8_t {
    InsufficientData = 0,  // Price series too short
    InvalidPrice,          // Non-positive or non-finite price
    InvalidPortfolioValue, // Negative or non-finite portfolio/holding value
    InvalidWeights,        // Negative or non-finite weight, overlapping sleeves
    Config                 // Malformed or inconsistent configuration
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
    case ErrorCode::InsufficientData:
        return "InsufficientData";
    case ErrorCode::InvalidPrice:
        return "InvalidPrice";
    case ErrorCode::InvalidPortfolioValue:
        return "InvalidPortfolioValue";
    case ErrorCode::InvalidWeights:
        return "InvalidWeights";
    case ErrorCode::Config:
        return "ConfigError";
    default:
        return "Unknown";
    }
}

class EngineError : public std::runtime_error {
public:
    EngineError(ErrorCode code, const std::string& message)
        : std::runtime_error(std::string(error_code_to_string(code)) + ": " + message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

class InsufficientData : public EngineError {
public:
    explicit InsufficientData(const std::string& message) : EngineError(ErrorCode::InsufficientData, message) {}
};

class InvalidPrice : public EngineError {
public:
    explicit InvalidPrice(const std::string& message) : EngineError(ErrorCode::InvalidPrice, message) {}
};

class InvalidPortfolioValue : public EngineError {
public:
    explicit InvalidPortfolioValue(const std::string& message)
        : EngineError(ErrorCode::InvalidPortfolioValue, message) {}
};

class InvalidWeights : public EngineError {
public:
    explicit InvalidWeights(const std::string& message) : EngineError(ErrorCode::InvalidWeights, message) {}
};

class ConfigError : public EngineError {
public:
    explicit ConfigError(const std::string& message) : EngineError(ErrorCode::Config, message) {}
};

} // namespace gpo
