#pragma once

#include <optional>
#include <string>

namespace vault {

// -----------------------------------------------------------------------------
// IKeyValueStore: durable string key/value storage
// -----------------------------------------------------------------------------
// The engine persists one JSON document per vault through this interface.
// put() either stores the value or throws; a throwing put() rolls the
// engine call that triggered it back.
// -----------------------------------------------------------------------------
class IKeyValueStore {
 public:
  virtual ~IKeyValueStore() = default;

  virtual void put(const std::string& key, const std::string& value) = 0;
  virtual std::optional<std::string> get(const std::string& key) const = 0;
  virtual bool erase(const std::string& key) = 0;
};

}  // namespace vault
