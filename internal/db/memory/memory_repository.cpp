#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace subnet::db::memory {

using subnet::manager::v1::StorageValue;

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

std::optional<StorageValue> MemoryRepository::Get(Transaction& t, const model::StorageKey& key) {
  const auto& s  = TX(t).View();
  const auto  it = s.cells.find(key);
  if (it == s.cells.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::Put(Transaction& t, const model::StorageKey& key, const StorageValue& value) {
  TX(t).Mutable().cells[key] = value;
  return Result::Ok();
}

Result MemoryRepository::Erase(Transaction& t, const model::StorageKey& key) {
  TX(t).Mutable().cells.erase(key);
  return Result::Ok();
}

Result MemoryRepository::ErasePrefix(Transaction& t, const std::string& item, model::Scope scope) {
  auto& cells = TX(t).Mutable().cells;
  auto  it    = cells.lower_bound(model::StorageKey{item, scope, {}});
  while (it != cells.end() && it->first.item == item && it->first.scope == scope) {
    it = cells.erase(it);
  }
  return Result::Ok();
}

std::vector<model::StorageEntry> MemoryRepository::Scan(Transaction& t, const std::string& item, std::optional<model::Scope> scope) {
  const auto& cells = TX(t).View().cells;

  std::vector<model::StorageEntry> out;
  auto it = cells.lower_bound(model::StorageKey{item, scope.value_or(0), {}});
  for (; it != cells.end() && it->first.item == item; ++it) {
    if (scope && it->first.scope != *scope) break;
    out.push_back(model::StorageEntry{it->first, it->second});
  }
  return out;
}

} // namespace subnet::db::memory
