#include "network_service.hpp"

#include <limits>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/lifecycle/eviction_selector.hpp"
#include "internal/lifecycle/registrar.hpp"
#include "internal/lifecycle/settlement_engine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/ledger.hpp"
#include "internal/util/errors.hpp"

namespace subnet::service {

using namespace subnet::manager::v1;

namespace {

void ValidateAccount(const std::string& field, const std::string& account) {
  if (account.empty()) {
    throw util::InvalidArgument(field + " is required");
  }
  if (account.find('/') != std::string::npos) {
    throw util::InvalidArgument(field + " must not contain '/'");
  }
}

model::NetworkId ValidateNetuid(uint32_t netuid) {
  if (netuid > std::numeric_limits<model::NetworkId>::max()) {
    throw util::InvalidArgument("netuid " + std::to_string(netuid) + " is out of range");
  }
  return static_cast<model::NetworkId>(netuid);
}

void LogFailure(std::string_view route, const std::exception& ex) {
  SUBNET_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("error", ex.what())});
}

} // namespace

NetworkService::NetworkService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

RegisterNetworkResponse NetworkService::RegisterNetwork(const RegisterNetworkRequest& req) {
  try {
    ValidateAccount("coldkey", req.coldkey());
    ValidateAccount("hotkey", req.hotkey());

    auto            tx = ctx_.repository->Begin();
    storage::Ledger ledger(*ctx_.repository, *tx);
    const auto      result = ctx_.registrar->Register(ledger, req.coldkey(), req.hotkey());
    tx->Commit();

    RegisterNetworkResponse resp;
    resp.set_netuid(result.netuid);
    resp.set_lock_cost(result.lock_cost);
    resp.set_pruned(result.pruned.has_value());
    if (result.pruned) {
      resp.set_pruned_netuid(result.pruned->netuid);
    }
    return resp;
  } catch (const std::exception& ex) {
    LogFailure("NetworkService.RegisterNetwork", ex);
    throw;
  }
}

DissolveNetworkResponse NetworkService::DissolveNetwork(const DissolveNetworkRequest& req) {
  try {
    const auto netuid = ValidateNetuid(req.netuid());

    auto            tx = ctx_.repository->Begin();
    storage::Ledger ledger(*ctx_.repository, *tx);
    const auto      report = ctx_.settlement->Dissolve(ledger, netuid);
    tx->Commit();

    DissolveNetworkResponse resp;
    resp.set_netuid(report.netuid);
    resp.set_pot(report.pot);
    resp.set_distributed(report.distributed);
    resp.set_owner_refund(report.owner_refund);
    resp.set_recycled(report.recycled);
    resp.set_stakers(report.stakers);
    resp.set_positions_liquidated(report.positions_liquidated);
    return resp;
  } catch (const std::exception& ex) {
    LogFailure("NetworkService.DissolveNetwork", ex);
    throw;
  }
}

GetNetworkToPruneResponse NetworkService::GetNetworkToPrune(const GetNetworkToPruneRequest&) {
  try {
    auto            tx = ctx_.repository->Begin();
    storage::Ledger ledger(*ctx_.repository, *tx);
    const auto      victim = lifecycle::NetworkToPrune(ledger);
    tx->Commit();

    GetNetworkToPruneResponse resp;
    resp.set_has_candidate(victim.has_value());
    if (victim) {
      resp.set_netuid(*victim);
    }
    return resp;
  } catch (const std::exception& ex) {
    LogFailure("NetworkService.GetNetworkToPrune", ex);
    throw;
  }
}

NetworkInfo NetworkService::GetNetwork(const GetNetworkRequest& req) {
  try {
    const auto netuid = ValidateNetuid(req.netuid());

    auto            tx = ctx_.repository->Begin();
    storage::Ledger ledger(*ctx_.repository, *tx);
    if (!ledger.NetworkExists(netuid)) {
      throw util::NetworkDoesNotExist("get network: network " + std::to_string(netuid) + " does not exist");
    }
    const auto summary = ledger.Summary(netuid);
    tx->Commit();

    NetworkInfo info;
    info.set_netuid(summary.id);
    info.set_owner_coldkey(summary.owner_coldkey);
    info.set_owner_hotkey(summary.owner_hotkey);
    info.set_registered_at(summary.registered_at);
    info.set_subnet_tao(summary.subnet_tao);
    info.set_subnet_alpha_in(summary.alpha_in);
    info.set_subnet_alpha_out(summary.alpha_out);
    info.set_locked(summary.locked);
    info.set_total_emission(summary.total_emission);
    info.set_tempo(summary.tempo);
    info.set_subnetwork_n(summary.subnetwork_n);
    return info;
  } catch (const std::exception& ex) {
    LogFailure("NetworkService.GetNetwork", ex);
    throw;
  }
}

GetBalanceResponse NetworkService::GetBalance(const GetBalanceRequest& req) {
  try {
    ValidateAccount("account", req.account());

    auto            tx = ctx_.repository->Begin();
    storage::Ledger ledger(*ctx_.repository, *tx);
    const auto      balance = ledger.BalanceOf(req.account());
    tx->Commit();

    GetBalanceResponse resp;
    resp.set_account(req.account());
    resp.set_balance(balance);
    return resp;
  } catch (const std::exception& ex) {
    LogFailure("NetworkService.GetBalance", ex);
    throw;
  }
}

AdvanceBlockResponse NetworkService::AdvanceBlock(const AdvanceBlockRequest& req) {
  try {
    auto            tx = ctx_.repository->Begin();
    storage::Ledger ledger(*ctx_.repository, *tx);
    const auto      block = ledger.AdvanceBlock(req.blocks());
    tx->Commit();

    AdvanceBlockResponse resp;
    resp.set_block_number(block);
    return resp;
  } catch (const std::exception& ex) {
    LogFailure("NetworkService.AdvanceBlock", ex);
    throw;
  }
}

} // namespace subnet::service
