#pragma once

#include "vault/domain/fixed_point.hpp"

#include <stdexcept>
#include <string>

namespace vault {

// -----------------------------------------------------------------------------
// ErrorCode: why a vault operation was rejected
// -----------------------------------------------------------------------------
//
// @brief  Enumerates every failure the engine reports to callers.
//
// @details
// Every code corresponds to an atomic rollback: when a VaultError escapes a
// mutating call, no engine state has changed. The engine never retries;
// callers inspect the code (and ErrorDetail) to decide whether retrying with
// different parameters is worthwhile:
//
//   ValueLossExceeded / AllocationStillOutOfTolerance / NoQuoteAvailable
//     → transient market conditions; retrying later may succeed.
//   PlatformHalted / Paused / RebalancingPaused
//     → administrative state; retry after it is lifted.
//   Everything else → the request itself is wrong.
// -----------------------------------------------------------------------------
enum class ErrorCode {
  PlatformHalted,
  InvalidAsset,
  ZeroAmount,
  ZeroShares,
  InsufficientBalance,
  AllocationInvalid,
  NoQuoteAvailable,
  ValueLossExceeded,
  AllocationStillOutOfTolerance,
  Unaccountable,
  Unauthorized,
  Paused,
  RebalancingPaused,
  ReentrantCall,
  InvalidParameter,
  NotConfigured,
  ExecutionFailed,
};

// Stable, human-readable name for logs and JSON ("ValueLossExceeded").
const char* toString(ErrorCode code);

// -----------------------------------------------------------------------------
// ErrorDetail: structured context attached to a VaultError
// -----------------------------------------------------------------------------
// Field meaning depends on the code:
//   InsufficientBalance            asset=holder or asset, actual=available,
//                                  limit=requested
//   ValueLossExceeded              actual=value after, limit=minimum
//                                  acceptable value, value_before=value before
//   AllocationStillOutOfTolerance  asset, actual=weight bps, limit=target bps,
//                                  value_before=value before
//   InvalidAsset / NoQuoteAvailable / ExecutionFailed
//                                  asset (for quotes: "in->out")
// Unused fields stay zero / empty.
// -----------------------------------------------------------------------------
struct ErrorDetail {
  std::string asset;
  domain::Uint256 actual{0};
  domain::Uint256 limit{0};
  domain::Uint256 value_before{0};
};

// -----------------------------------------------------------------------------
// VaultError
// -----------------------------------------------------------------------------
//
// @brief  The exception type thrown by every engine component.
//
// @details
// Derives from std::runtime_error so what() carries a readable message for
// logs, while code() and detail() give callers something to branch on.
// -----------------------------------------------------------------------------
class VaultError : public std::runtime_error {
 public:
  VaultError(ErrorCode code, const std::string& message,
             ErrorDetail detail = {});

  ErrorCode code() const noexcept { return code_; }
  const ErrorDetail& detail() const noexcept { return detail_; }

 private:
  ErrorCode code_;
  ErrorDetail detail_;
};

}  // namespace vault
