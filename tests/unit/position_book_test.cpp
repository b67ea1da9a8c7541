#include "internal/liquidity/position_book.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/storage/ledger.hpp"
#include "internal/storage/storage_items.hpp"
#include "internal/util/errors.hpp"

namespace {

using subnet::liquidity::PositionBook;
using subnet::manager::v1::LiquidityPosition;
using subnet::storage::Ledger;
using subnet::util::FixedU96F32;

namespace items = subnet::storage::items;

constexpr subnet::model::NetworkId kNet = 4;

LiquidityPosition MakePosition(const std::string& cold, int32_t low, int32_t high, uint64_t tao, uint64_t alpha) {
  LiquidityPosition position;
  position.set_owner_coldkey(cold);
  position.set_owner_hotkey(cold + "-hot");
  position.set_tick_low(low);
  position.set_tick_high(high);
  position.set_liquidity(tao + alpha);
  position.set_tao(tao);
  position.set_alpha(alpha);
  position.set_fees_tao(1);
  position.set_fees_alpha(2);
  return position;
}

void MarkNetwork(Ledger& ledger, subnet::model::NetworkId net) {
  ledger.Put(subnet::storage::Key(items::kNetworksAdded, net), subnet::storage::FlagValue(true));
}

void TestAddPositionMaintainsPoolBookkeeping() {
  subnet::db::memory::MemoryRepository repo;
  auto                                 tx = repo.Begin();
  Ledger                               ledger(repo, *tx);
  MarkNetwork(ledger, kNet);

  PositionBook book;
  assert(book.AddPosition(ledger, kNet, MakePosition("alice", -1, 64, 10, 20)) == 1);
  assert(book.AddPosition(ledger, kNet, MakePosition("bob", 0, 5, 3, 4)) == 2);

  const auto positions = book.Positions(ledger, kNet);
  assert(positions.size() == 2);
  assert(positions[0].owner_coldkey() == "alice");
  assert(positions[0].id() == 1);

  assert(ledger.GetU64(items::kCurrentLiquidity, kNet) == 37);
  assert(ledger.GetU64(items::kFeeGlobalTao, kNet) == 2);
  assert(ledger.GetU64(items::kFeeGlobalAlpha, kNet) == 4);

  // Tick -1 is the top bit of word -1; ticks 0, 5 and 64 sit in words 0 and 1.
  assert(ledger.GetU64(items::kTickIndexBitmapWords, kNet, "-1") == (uint64_t{1} << 63));
  assert(ledger.GetU64(items::kTickIndexBitmapWords, kNet, "0") == ((uint64_t{1} << 0) | (uint64_t{1} << 5)));
  assert(ledger.GetU64(items::kTickIndexBitmapWords, kNet, "1") == 1);
  assert(ledger.HasCell(items::kSwapV3Initialized, kNet));
  tx->Commit();
}

void TestAddPositionRejectsBadInput() {
  subnet::db::memory::MemoryRepository repo;
  auto                                 tx = repo.Begin();
  Ledger                               ledger(repo, *tx);
  PositionBook                         book;

  bool missing = false;
  try {
    book.AddPosition(ledger, kNet, MakePosition("alice", 0, 1, 1, 1));
  } catch (const subnet::util::NetworkDoesNotExist&) {
    missing = true;
  }
  assert(missing);

  MarkNetwork(ledger, kNet);
  bool inverted = false;
  try {
    book.AddPosition(ledger, kNet, MakePosition("alice", 10, 10, 1, 1));
  } catch (const subnet::util::InvalidArgument&) {
    inverted = true;
  }
  assert(inverted);
  assert(book.Positions(ledger, kNet).empty());
}

void TestLiquidateAllReturnsFundsAndClearsBook() {
  subnet::db::memory::MemoryRepository repo;
  auto                                 tx = repo.Begin();
  Ledger                               ledger(repo, *tx);
  MarkNetwork(ledger, kNet);
  MarkNetwork(ledger, kNet + 1);

  PositionBook book;
  book.EnableUserLiquidity(ledger, kNet, true);
  book.AddPosition(ledger, kNet, MakePosition("alice", -200, 200, 10, 20));
  book.AddPosition(ledger, kNet, MakePosition("bob", 0, 5, 3, 0));
  book.AddPosition(ledger, kNet + 1, MakePosition("carol", 0, 5, 9, 9));

  const auto result = book.LiquidateAll(ledger, kNet);
  assert(result.positions.size() == 2);
  assert(result.total_tao == (10 + 1) + (3 + 1));
  assert(result.total_alpha == (20 + 2) + (0 + 2));
  assert(result.positions[0].owner_hotkey == "alice-hot");

  for (const auto item : {items::kPositions, items::kTickIndexBitmapWords}) {
    assert(ledger.Scan(item, kNet).empty());
  }
  for (const auto item : {items::kCurrentLiquidity, items::kFeeGlobalTao, items::kFeeGlobalAlpha, items::kSwapV3Initialized,
                          items::kEnabledUserLiquidity, items::kLastPositionId}) {
    assert(!ledger.HasCell(item, kNet));
  }

  // Neighbouring network untouched.
  assert(book.Positions(ledger, kNet + 1).size() == 1);
  assert(ledger.GetU64(items::kCurrentLiquidity, kNet + 1) == 18);
}

void TestCurrentPriceIsTaoPerAlpha() {
  subnet::db::memory::MemoryRepository repo;
  auto                                 tx = repo.Begin();
  Ledger                               ledger(repo, *tx);
  PositionBook                         book;

  assert(book.CurrentPrice(ledger, kNet) == FixedU96F32{});

  ledger.SetSubnetTao(kNet, 3000);
  ledger.SetAlphaIn(kNet, 2000);
  assert(book.CurrentPrice(ledger, kNet) == FixedU96F32::FromRatio(3, 2));
}

} // namespace

int main() {
  TestAddPositionMaintainsPoolBookkeeping();
  TestAddPositionRejectsBadInput();
  TestLiquidateAllReturnsFundsAndClearsBook();
  TestCurrentPriceIsTaoPerAlpha();

  std::cout << "subnet_manager_unit_position_book: pass\n";
  return 0;
}
