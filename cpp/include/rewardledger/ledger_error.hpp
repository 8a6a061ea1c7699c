#pragma once

#include <stdexcept>
#include <string>

namespace rewardledger {

enum class ErrorCode {
    Unauthorized,
    InvalidAmount,
    InsufficientBalance,
    NotRegistered,
    AlreadyRegistered,
    RedistributionLocked,
    NoRewards,
    BatchTooLarge,
    ClockRegression,
    ArithmeticFault,
    InvalidState,
};

// Stable lower-case name, used in harness output
inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unauthorized:         return "unauthorized";
        case ErrorCode::InvalidAmount:        return "invalid_amount";
        case ErrorCode::InsufficientBalance:  return "insufficient_balance";
        case ErrorCode::NotRegistered:        return "not_registered";
        case ErrorCode::AlreadyRegistered:    return "already_registered";
        case ErrorCode::RedistributionLocked: return "redistribution_locked";
        case ErrorCode::NoRewards:            return "no_rewards";
        case ErrorCode::BatchTooLarge:        return "batch_too_large";
        case ErrorCode::ClockRegression:      return "clock_regression";
        case ErrorCode::ArithmeticFault:      return "arithmetic_fault";
        case ErrorCode::InvalidState:         return "invalid_state";
    }
    return "unknown";
}

class LedgerError : public std::runtime_error {
public:
    LedgerError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }
    const char* code_name() const noexcept { return error_code_name(code_); }

private:
    ErrorCode code_;
};

} // namespace rewardledger
