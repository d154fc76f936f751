#include "vault/storage/vault_state_store.hpp"
#include "vault/errors/vault_error.hpp"
#include "vault/storage/json_codec.hpp"

namespace vault {

VaultStateStore::VaultStateStore(IKeyValueStore& store) : store_(store) {}

std::string VaultStateStore::keyFor(const std::string& vault_id) {
  return "vault/" + vault_id + "/snapshot";
}

std::string VaultStateStore::serialize(const domain::VaultSnapshot& snapshot) {
  nlohmann::json j = snapshot;
  return j.dump();
}

domain::VaultSnapshot VaultStateStore::deserialize(const std::string& document) {
  try {
    return nlohmann::json::parse(document).get<domain::VaultSnapshot>();
  } catch (const nlohmann::json::exception& e) {
    throw VaultError(ErrorCode::InvalidParameter,
                     std::string("malformed vault snapshot: ") + e.what());
  }
}

void VaultStateStore::save(const domain::VaultSnapshot& snapshot) {
  store_.put(keyFor(snapshot.vault_id), serialize(snapshot));
}

std::optional<domain::VaultSnapshot> VaultStateStore::load(
    const std::string& vault_id) const {
  auto document = store_.get(keyFor(vault_id));
  if (!document) {
    return std::nullopt;
  }
  return deserialize(*document);
}

}  // namespace vault
