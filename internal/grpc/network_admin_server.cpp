#include "network_admin_server.hpp"

#include "grpc_error.hpp"
#include "subnet/manager/v1.hpp"

namespace subnet::grpc {

using namespace subnet::manager::v1;

NetworkAdminServer::NetworkAdminServer(std::shared_ptr<subnet::service::NetworkService> svc) : service_(std::move(svc)) {
}

::grpc::Status NetworkAdminServer::RegisterNetwork(::grpc::ServerContext*, const RegisterNetworkRequest* req, RegisterNetworkResponse* resp) {
  try {
    *resp = service_->RegisterNetwork(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status NetworkAdminServer::DissolveNetwork(::grpc::ServerContext*, const DissolveNetworkRequest* req, DissolveNetworkResponse* resp) {
  try {
    *resp = service_->DissolveNetwork(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status NetworkAdminServer::GetNetworkToPrune(::grpc::ServerContext*, const GetNetworkToPruneRequest* req,
                                                     GetNetworkToPruneResponse* resp) {
  try {
    *resp = service_->GetNetworkToPrune(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status NetworkAdminServer::GetNetwork(::grpc::ServerContext*, const GetNetworkRequest* req, NetworkInfo* resp) {
  try {
    *resp = service_->GetNetwork(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status NetworkAdminServer::GetBalance(::grpc::ServerContext*, const GetBalanceRequest* req, GetBalanceResponse* resp) {
  try {
    *resp = service_->GetBalance(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status NetworkAdminServer::AdvanceBlock(::grpc::ServerContext*, const AdvanceBlockRequest* req, AdvanceBlockResponse* resp) {
  try {
    *resp = service_->AdvanceBlock(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace subnet::grpc
