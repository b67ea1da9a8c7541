#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "subnet/manager/v1/network_admin_service.grpc.pb.h"
#include "internal/service/network_service.hpp"

namespace subnet::grpc {

class NetworkAdminServer final : public subnet::manager::v1::NetworkAdminService::Service {
public:
  explicit NetworkAdminServer(std::shared_ptr<subnet::service::NetworkService> svc);

  ::grpc::Status RegisterNetwork(::grpc::ServerContext*,
                                 const subnet::manager::v1::RegisterNetworkRequest*,
                                 subnet::manager::v1::RegisterNetworkResponse*) override;

  ::grpc::Status DissolveNetwork(::grpc::ServerContext*,
                                 const subnet::manager::v1::DissolveNetworkRequest*,
                                 subnet::manager::v1::DissolveNetworkResponse*) override;

  ::grpc::Status GetNetworkToPrune(::grpc::ServerContext*,
                                   const subnet::manager::v1::GetNetworkToPruneRequest*,
                                   subnet::manager::v1::GetNetworkToPruneResponse*) override;

  ::grpc::Status GetNetwork(::grpc::ServerContext*,
                            const subnet::manager::v1::GetNetworkRequest*,
                            subnet::manager::v1::NetworkInfo*) override;

  ::grpc::Status GetBalance(::grpc::ServerContext*,
                            const subnet::manager::v1::GetBalanceRequest*,
                            subnet::manager::v1::GetBalanceResponse*) override;

  ::grpc::Status AdvanceBlock(::grpc::ServerContext*,
                              const subnet::manager::v1::AdvanceBlockRequest*,
                              subnet::manager::v1::AdvanceBlockResponse*) override;

private:
  std::shared_ptr<subnet::service::NetworkService> service_;
};

}
