#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "subnet/manager/v1.hpp"

using namespace subnet::manager::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  subnetctl <addr> register <coldkey> <hotkey>\n"
            << "  subnetctl <addr> dissolve <netuid>\n"
            << "  subnetctl <addr> prune-candidate\n"
            << "  subnetctl <addr> info <netuid>\n"
            << "  subnetctl <addr> balance <account>\n"
            << "  subnetctl <addr> advance <blocks>\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = NetworkAdminService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "register") {
    if (argc < 5) return 1;

    RegisterNetworkRequest req;
    req.set_coldkey(argv[3]);
    req.set_hotkey(argv[4]);

    RegisterNetworkResponse resp;

    auto status = stub->RegisterNetwork(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "netuid=" << resp.netuid() << "\n";
    std::cout << "lock_cost=" << resp.lock_cost() << "\n";
    if (resp.pruned()) {
      std::cout << "pruned=" << resp.pruned_netuid() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "dissolve") {
    if (argc < 4) return 1;

    DissolveNetworkRequest req;
    req.set_netuid(static_cast<uint32_t>(std::stoul(argv[3])));

    DissolveNetworkResponse resp;

    auto status = stub->DissolveNetwork(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "pot=" << resp.pot() << "\n";
    std::cout << "distributed=" << resp.distributed() << "\n";
    std::cout << "owner_refund=" << resp.owner_refund() << "\n";
    std::cout << "recycled=" << resp.recycled() << "\n";
    std::cout << "stakers=" << resp.stakers() << "\n";
    std::cout << "positions=" << resp.positions_liquidated() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "prune-candidate") {
    GetNetworkToPruneRequest  req;
    GetNetworkToPruneResponse resp;

    auto status = stub->GetNetworkToPrune(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    if (resp.has_candidate()) {
      std::cout << "netuid=" << resp.netuid() << "\n";
    } else {
      std::cout << "none\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "info") {
    if (argc < 4) return 1;

    GetNetworkRequest req;
    req.set_netuid(static_cast<uint32_t>(std::stoul(argv[3])));

    NetworkInfo resp;

    auto status = stub->GetNetwork(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "owner=" << resp.owner_coldkey() << "\n";
    std::cout << "hotkey=" << resp.owner_hotkey() << "\n";
    std::cout << "registered_at=" << resp.registered_at() << "\n";
    std::cout << "subnet_tao=" << resp.subnet_tao() << "\n";
    std::cout << "alpha_in=" << resp.subnet_alpha_in() << "\n";
    std::cout << "alpha_out=" << resp.subnet_alpha_out() << "\n";
    std::cout << "locked=" << resp.locked() << "\n";
    std::cout << "total_emission=" << resp.total_emission() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "balance") {
    if (argc < 4) return 1;

    GetBalanceRequest req;
    req.set_account(argv[3]);

    GetBalanceResponse resp;

    auto status = stub->GetBalance(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << resp.account() << "=" << resp.balance() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "advance") {
    if (argc < 4) return 1;

    AdvanceBlockRequest req;
    req.set_blocks(std::stoull(argv[3]));

    AdvanceBlockResponse resp;

    auto status = stub->AdvanceBlock(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "block=" << resp.block_number() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
