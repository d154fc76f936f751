#pragma once

#include "vault/storage/i_key_value_store.hpp"

#include <cstddef>
#include <map>
#include <mutex>

namespace vault {

// -----------------------------------------------------------------------------
// InMemoryKeyValueStore: process-local IKeyValueStore
// -----------------------------------------------------------------------------
// Mutex-guarded std::map. Used by the simulation and by tests that restore
// a vault into a fresh engine.
// -----------------------------------------------------------------------------
class InMemoryKeyValueStore final : public IKeyValueStore {
 public:
  void put(const std::string& key, const std::string& value) override;
  std::optional<std::string> get(const std::string& key) const override;
  bool erase(const std::string& key) override;

  std::size_t size() const;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, std::string> entries_;
};

}  // namespace vault
