#pragma once

#include "vault/domain/fixed_point.hpp"

namespace vault {

// -----------------------------------------------------------------------------
// INativeWrapper: converts between the native asset and its wrapped token
// -----------------------------------------------------------------------------
// Used by QuoteRouter around trades on venues flagged wraps_native: the
// native input is wrapped before the swap and a native output is unwrapped
// after it. Both calls convert 1:1 and throw on failure.
// -----------------------------------------------------------------------------
class INativeWrapper {
 public:
  virtual ~INativeWrapper() = default;

  virtual void wrap(const domain::Uint256& amount) = 0;
  virtual void unwrap(const domain::Uint256& amount) = 0;
};

}  // namespace vault
