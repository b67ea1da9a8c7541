#include "internal/liquidity/position_book.hpp"

#include <string>

#include "internal/storage/ledger.hpp"
#include "internal/storage/storage_items.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/saturating.hpp"

namespace subnet::liquidity {

using subnet::manager::v1::LiquidityPosition;
using subnet::manager::v1::StorageValue;

namespace items = storage::items;

namespace {

constexpr int kTicksPerWord = 64;

// Floor division so negative ticks land in the right word.
int64_t WordOf(int32_t tick) {
  return tick >= 0 ? tick / kTicksPerWord : -((-static_cast<int64_t>(tick) + kTicksPerWord - 1) / kTicksPerWord);
}

void MarkTick(storage::Ledger& ledger, model::NetworkId net, int32_t tick) {
  const auto word   = WordOf(tick);
  const auto bit    = static_cast<unsigned>(static_cast<int64_t>(tick) - word * kTicksPerWord);
  const auto subkey = std::to_string(word);
  const auto bits   = ledger.GetU64(items::kTickIndexBitmapWords, net, subkey);
  ledger.PutU64(items::kTickIndexBitmapWords, net, bits | (uint64_t{1} << bit), subkey);
}

} // namespace

uint64_t PositionBook::AddPosition(storage::Ledger& ledger, model::NetworkId net, LiquidityPosition position) {
  if (!ledger.NetworkExists(net)) {
    throw util::NetworkDoesNotExist("add position: network " + std::to_string(net) + " does not exist");
  }
  if (position.tick_low() >= position.tick_high()) {
    throw util::InvalidArgument("add position: tick_low must be below tick_high");
  }

  const auto id = ledger.GetU64(items::kLastPositionId, net) + 1;
  ledger.PutU64(items::kLastPositionId, net, id);
  position.set_id(id);

  StorageValue value;
  *value.mutable_position() = position;
  ledger.Put(storage::Key(items::kPositions, net, storage::PositionSubkey(position.owner_coldkey(), id)), value);

  ledger.PutU64(items::kCurrentLiquidity, net,
                util::SaturatingAdd(ledger.GetU64(items::kCurrentLiquidity, net), position.liquidity()));
  ledger.PutU64(items::kFeeGlobalTao, net, util::SaturatingAdd(ledger.GetU64(items::kFeeGlobalTao, net), position.fees_tao()));
  ledger.PutU64(items::kFeeGlobalAlpha, net,
                util::SaturatingAdd(ledger.GetU64(items::kFeeGlobalAlpha, net), position.fees_alpha()));
  MarkTick(ledger, net, position.tick_low());
  MarkTick(ledger, net, position.tick_high());
  ledger.Put(storage::Key(items::kSwapV3Initialized, net), storage::FlagValue(true));
  return id;
}

std::vector<LiquidityPosition> PositionBook::Positions(const storage::Ledger& ledger, model::NetworkId net) const {
  std::vector<LiquidityPosition> out;
  for (const auto& entry : ledger.Scan(items::kPositions, net)) {
    out.push_back(entry.value.position());
  }
  return out;
}

void PositionBook::EnableUserLiquidity(storage::Ledger& ledger, model::NetworkId net, bool enabled) {
  ledger.Put(storage::Key(items::kEnabledUserLiquidity, net), storage::FlagValue(enabled));
}

LiquidationResult PositionBook::LiquidateAll(storage::Ledger& ledger, model::NetworkId net) {
  LiquidationResult result;
  for (const auto& position : Positions(ledger, net)) {
    FreedPosition freed;
    freed.position_id   = position.id();
    freed.owner_coldkey = position.owner_coldkey();
    freed.owner_hotkey  = position.owner_hotkey();
    freed.tao           = util::SaturatingAdd(position.tao(), position.fees_tao());
    freed.alpha         = util::SaturatingAdd(position.alpha(), position.fees_alpha());

    result.total_tao   = util::SaturatingAdd(result.total_tao, freed.tao);
    result.total_alpha = util::SaturatingAdd(result.total_alpha, freed.alpha);
    result.positions.push_back(std::move(freed));
  }

  storage::ApplyTeardown(ledger, net, storage::LiquidityTeardownRules());
  return result;
}

util::FixedU96F32 PositionBook::CurrentPrice(const storage::Ledger& ledger, model::NetworkId net) const {
  return util::FixedU96F32::FromRatio(ledger.SubnetTao(net), ledger.AlphaIn(net));
}

} // namespace subnet::liquidity
