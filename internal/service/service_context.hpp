#pragma once

#include <memory>

namespace subnet::db { class Repository; }
namespace subnet::lifecycle { class SettlementEngine; class Registrar; }

namespace subnet::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<subnet::db::Repository> repository;
  std::shared_ptr<subnet::lifecycle::SettlementEngine> settlement;
  std::shared_ptr<subnet::lifecycle::Registrar> registrar;
};

}
