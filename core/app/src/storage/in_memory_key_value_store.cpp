#include "vault/storage/in_memory_key_value_store.hpp"

namespace vault {

void InMemoryKeyValueStore::put(const std::string& key,
                                const std::string& value) {
  std::lock_guard lock(mutex_);
  entries_[key] = value;
}

std::optional<std::string> InMemoryKeyValueStore::get(
    const std::string& key) const {
  std::lock_guard lock(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool InMemoryKeyValueStore::erase(const std::string& key) {
  std::lock_guard lock(mutex_);
  return entries_.erase(key) > 0;
}

std::size_t InMemoryKeyValueStore::size() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

}  // namespace vault
