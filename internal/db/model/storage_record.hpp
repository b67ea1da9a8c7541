#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <tuple>

#include "subnet/manager/v1/storage.pb.h"

namespace subnet::db::model {

/*
  Address of one storage cell.

  item   - storage item name ("SubnetTAO", "Alpha", ...)
  scope  - owning network id, or kGlobalScope for chain-wide items
  subkey - entry key inside keyed collections (uid, hotkey/coldkey, name);
           empty for plain per-network values

  Ordering is (item, scope, subkey) with bytewise subkey comparison. Both
  backends scan in this order.
*/

using Scope = uint32_t;

inline constexpr Scope kGlobalScope = std::numeric_limits<Scope>::max();

struct StorageKey {
  std::string item;
  Scope       scope = kGlobalScope;
  std::string subkey;

  friend bool operator<(const StorageKey& a, const StorageKey& b) {
    return std::tie(a.item, a.scope, a.subkey) < std::tie(b.item, b.scope, b.subkey);
  }

  friend bool operator==(const StorageKey& a, const StorageKey& b) {
    return a.item == b.item && a.scope == b.scope && a.subkey == b.subkey;
  }
};

struct StorageEntry {
  StorageKey                        key;
  subnet::manager::v1::StorageValue    value;
};

} // namespace subnet::db::model
