#pragma once

#include "vault/domain/asset.hpp"
#include "event_types.hpp"

#include <cstdint>
#include <string>

namespace vault {

// -----------------------------------------------------------------------------
// AdminEvent
// -----------------------------------------------------------------------------
// Responsibility: Audit trail for manager operations (pause, allocation
// update, venue change, fee split, route executor). action is a stable
// verb ("pause", "configure_venue", ...); detail is free text for logs.
// -----------------------------------------------------------------------------
struct AdminEvent {
  domain::AccountId actor;
  std::string action;
  std::string detail;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace vault
