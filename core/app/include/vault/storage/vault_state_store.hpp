#pragma once

#include "vault/domain/vault_snapshot.hpp"
#include "vault/storage/i_key_value_store.hpp"

#include <optional>
#include <string>

namespace vault {

// -----------------------------------------------------------------------------
// VaultStateStore: VaultSnapshot persistence over an IKeyValueStore
// -----------------------------------------------------------------------------
//
// @brief  Serializes snapshots to JSON (nlohmann/json) and stores them under
//         "vault/<vault_id>/snapshot".
//
// @details
// save() overwrites the previous snapshot of the same vault. load() returns
// nullopt when nothing was stored; a stored document that does not parse or
// lacks a required field raises VaultError(InvalidParameter).
//
// Thread model:
//   Stateless apart from the store reference; thread safety is the store's.
//
// Ownership:
//   Holds a non-owning reference to the store.
// -----------------------------------------------------------------------------
class VaultStateStore {
 public:
  explicit VaultStateStore(IKeyValueStore& store);

  static std::string keyFor(const std::string& vault_id);

  void save(const domain::VaultSnapshot& snapshot);
  std::optional<domain::VaultSnapshot> load(const std::string& vault_id) const;

  static std::string serialize(const domain::VaultSnapshot& snapshot);
  static domain::VaultSnapshot deserialize(const std::string& document);

 private:
  IKeyValueStore& store_;
};

}  // namespace vault
