#pragma once

#include <map>
#include <mutex>

#include "internal/db/api/repository.hpp"

namespace subnet::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  std::optional<subnet::manager::v1::StorageValue> Get(Transaction&, const model::StorageKey&) override;
  Result Put(Transaction&, const model::StorageKey&, const subnet::manager::v1::StorageValue&) override;
  Result Erase(Transaction&, const model::StorageKey&) override;

  Result ErasePrefix(Transaction&, const std::string& item, model::Scope scope) override;
  std::vector<model::StorageEntry> Scan(Transaction&, const std::string& item,
                                        std::optional<model::Scope> scope) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::map<model::StorageKey, subnet::manager::v1::StorageValue> cells;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

}
