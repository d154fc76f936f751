#include "vault/errors/vault_error.hpp"

#include <utility>

namespace vault {

// -----------------------------------------------------------------------------
// toString: ErrorCode → stable name
// -----------------------------------------------------------------------------
const char* toString(ErrorCode code) {
  switch (code) {
    case ErrorCode::PlatformHalted:
      return "PlatformHalted";
    case ErrorCode::InvalidAsset:
      return "InvalidAsset";
    case ErrorCode::ZeroAmount:
      return "ZeroAmount";
    case ErrorCode::ZeroShares:
      return "ZeroShares";
    case ErrorCode::InsufficientBalance:
      return "InsufficientBalance";
    case ErrorCode::AllocationInvalid:
      return "AllocationInvalid";
    case ErrorCode::NoQuoteAvailable:
      return "NoQuoteAvailable";
    case ErrorCode::ValueLossExceeded:
      return "ValueLossExceeded";
    case ErrorCode::AllocationStillOutOfTolerance:
      return "AllocationStillOutOfTolerance";
    case ErrorCode::Unaccountable:
      return "Unaccountable";
    case ErrorCode::Unauthorized:
      return "Unauthorized";
    case ErrorCode::Paused:
      return "Paused";
    case ErrorCode::RebalancingPaused:
      return "RebalancingPaused";
    case ErrorCode::ReentrantCall:
      return "ReentrantCall";
    case ErrorCode::InvalidParameter:
      return "InvalidParameter";
    case ErrorCode::NotConfigured:
      return "NotConfigured";
    case ErrorCode::ExecutionFailed:
      return "ExecutionFailed";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// VaultError
// -----------------------------------------------------------------------------
VaultError::VaultError(ErrorCode code, const std::string& message,
                       ErrorDetail detail)
    : std::runtime_error(std::string(toString(code)) + ": " + message),
      code_(code),
      detail_(std::move(detail)) {}

}  // namespace vault
