#pragma once

#include "service_context.hpp"
#include "subnet/manager/v1.hpp"

namespace subnet::service {

/*
  Transaction boundary for the admin API. Each call runs in one repository
  transaction that is committed only when the core operation returns.
*/
class NetworkService {
public:
  explicit NetworkService(ServiceContext ctx);

  subnet::manager::v1::RegisterNetworkResponse
  RegisterNetwork(const subnet::manager::v1::RegisterNetworkRequest& req);

  subnet::manager::v1::DissolveNetworkResponse
  DissolveNetwork(const subnet::manager::v1::DissolveNetworkRequest& req);

  subnet::manager::v1::GetNetworkToPruneResponse
  GetNetworkToPrune(const subnet::manager::v1::GetNetworkToPruneRequest& req);

  subnet::manager::v1::NetworkInfo
  GetNetwork(const subnet::manager::v1::GetNetworkRequest& req);

  subnet::manager::v1::GetBalanceResponse
  GetBalance(const subnet::manager::v1::GetBalanceRequest& req);

  subnet::manager::v1::AdvanceBlockResponse
  AdvanceBlock(const subnet::manager::v1::AdvanceBlockRequest& req);

private:
  ServiceContext ctx_;
};

}
