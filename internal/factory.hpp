#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"

namespace subnet::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository> repository;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Constructs the entire backend based on runtime config: opens the store,
  writes genesis parameters, runs pending migrations and wires the services.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const subnet::runtime::config::RuntimeConfig& config);

std::shared_ptr<db::Repository> BuildRepository(const subnet::runtime::config::RuntimeConfig& config);

} // namespace subnet::factory
