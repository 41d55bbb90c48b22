#include "calculation/decomposer.hpp"

#include "calculation/wait_classifier.hpp"
#include "calculation/invalid_hule.hpp"
#include "calculation/hand.hpp"
#include "calculation/hule_input.hpp"
#include "calculation/mianzi.hpp"
#include "calculation/tile.hpp"
#include "common/assert.hpp"
#include "common/throw.hpp"
#include <vector>
#include <array>
#include <functional>
#include <stdexcept>
#include <cstdint>


namespace{

using std::placeholders::_1;

bool isAvailable(Hule::TileCounts const &counts, Hule::Mianzi const &mianzi)
{
  Hule::TileCounts needed{};
  for (Hule::Tile const tile : Hule::getTiles(mianzi)) {
    ++needed[tile.getIndex()];
  }
  for (std::uint_fast8_t i = 0u; i < Hule::Tile::num_kinds; ++i) {
    if (counts[i] < needed[i]) {
      return false;
    }
  }
  return true;
}

// Takes the tiles of a set out of the counts, and puts them back on
// destruction unless committed.
class ScopedRemoval
{
public:
  ScopedRemoval(Hule::TileCounts &counts, Hule::Mianzi const &mianzi)
    : counts_(counts),
      tiles_(Hule::getTiles(mianzi)),
      committed_(false)
  {
    HULE_ASSERT((isAvailable(counts_, mianzi))) << mianzi;
    for (Hule::Tile const tile : tiles_) {
      --counts_[tile.getIndex()];
    }
  }

  ScopedRemoval(ScopedRemoval const &) = delete;

  ScopedRemoval &operator=(ScopedRemoval const &) = delete;

  ~ScopedRemoval()
  {
    if (!committed_) {
      for (Hule::Tile const tile : tiles_) {
        ++counts_[tile.getIndex()];
      }
    }
  }

  void commit() noexcept
  {
    committed_ = true;
  }

private:
  Hule::TileCounts &counts_;
  std::vector<Hule::Tile> tiles_;
  bool committed_;
}; // class ScopedRemoval

bool tryMianzi(
  Hule::TileCounts &counts, Hule::Mianzi const &mianzi, std::vector<Hule::Mianzi> &mianzi_list)
{
  ScopedRemoval removal(counts, mianzi);
  mianzi_list.push_back(mianzi);
  if (Hule::searchMianzi(counts, mianzi_list)) {
    removal.commit();
    return true;
  }
  mianzi_list.pop_back();
  return false;
}

Hule::Mianzi toDeclaredMianzi(Hule::Fulu const &fulu)
{
  using Hule::RejectReason;
  using Hule::InvalidHule;

  Hule::Tile const tile = fulu.getTile();
  if (fulu.getType() == Hule::Fulu::Type::chi && (!tile.isShupai() || tile.getRank() > 7u)) {
    HULE_THROW<InvalidHule>(RejectReason::invalid_chi, _1)
      << tile << ": A chi must start at a numbered tile of rank 1-7.";
  }
  return fulu.toMianzi();
}

Hule::RejectReason getMissingReason(Hule::Fulu::Type const type) noexcept
{
  switch (type) {
  case Hule::Fulu::Type::chi:
    return Hule::RejectReason::missing_chi;
  case Hule::Fulu::Type::peng:
    return Hule::RejectReason::missing_peng;
  case Hule::Fulu::Type::minggang:
    break;
  }
  return Hule::RejectReason::missing_minggang;
}

std::array<Hule::Mianzi, 4u> toArray(std::vector<Hule::Mianzi> const &mianzi_list)
{
  if (mianzi_list.size() != 4u) {
    HULE_THROW<std::logic_error>(_1)
      << mianzi_list.size() << ": A complete hand must have 4 sets.";
  }
  return { mianzi_list[0u], mianzi_list[1u], mianzi_list[2u], mianzi_list[3u] };
}

} // namespace `anonymous`

namespace Hule{

bool searchMianzi(TileCounts &counts, std::vector<Mianzi> &mianzi_list)
{
  std::uint_fast8_t i = 0u;
  while (i < Tile::num_kinds && counts[i] == 0u) {
    ++i;
  }
  if (i == Tile::num_kinds) {
    return true;
  }

  Tile const tile = Tile::fromIndex(i);
  if (counts[i] >= 3u && tryMianzi(counts, Kezi(tile, /*open = */false), mianzi_list)) {
    return true;
  }
  if (tile.isShupai() && tile.getRank() <= 7u && counts[i + 1u] >= 1u && counts[i + 2u] >= 1u
      && tryMianzi(counts, Shunzi(tile, /*open = */false), mianzi_list)) {
    return true;
  }
  return false;
}

Decomposition decompose(HuleInput const &input, TileCounts const &counts)
{
  TileCounts concealed = counts;
  std::vector<Mianzi> declared;
  declared.reserve(4u);

  // 暗槓
  for (Tile const tile : input.angang_list) {
    Mianzi const gangzi = Gangzi(tile, /*open = */false);
    if (!isAvailable(concealed, gangzi)) {
      HULE_THROW<InvalidHule>(RejectReason::missing_angang, _1)
        << tile << ": The declared concealed quad is not in the hand.";
    }
    ScopedRemoval(concealed, gangzi).commit();
    declared.push_back(gangzi);
  }

  // 副露
  for (Fulu const &fulu : input.fulu_list) {
    Mianzi const mianzi = toDeclaredMianzi(fulu);
    if (!isAvailable(concealed, mianzi)) {
      HULE_THROW<InvalidHule>(getMissingReason(fulu.getType()), _1)
        << mianzi << ": The declared call is not in the hand.";
    }
    ScopedRemoval(concealed, mianzi).commit();
    declared.push_back(mianzi);
  }

  std::uint_fast8_t const num_declared = declared.size();
  std::uint_fast8_t const num_needed = 4u - num_declared;
  Tile const hupai = input.hupai;

  if (num_needed == 0u) {
    // 裸単騎
    for (std::uint_fast8_t i = 0u; i < Tile::num_kinds; ++i) {
      if (concealed[i] == 2u) {
        return RegularHand(
          toArray(declared), Quetou(Tile::fromIndex(i)), hupai, Tingpai::danqi, num_declared);
      }
    }
    if (input.tiles.size() != 14u) {
      HULE_THROW<InvalidHule>(RejectReason::missing_quetou, _1)
        << "No pair is left beside the four declared calls.";
    }
  }

  for (std::uint_fast8_t i = 0u; i < Tile::num_kinds; ++i) {
    if (concealed[i] < 2u) {
      continue;
    }
    TileCounts rest = concealed;
    rest[i] -= 2u;
    std::vector<Mianzi> found;
    if (!searchMianzi(rest, found) || found.size() != num_needed) {
      continue;
    }

    std::vector<Mianzi> mianzi_list = declared;
    mianzi_list.insert(mianzi_list.cend(), found.cbegin(), found.cend());
    std::array<Mianzi, 4u> const mianzi_array = toArray(mianzi_list);
    Quetou const quetou(Tile::fromIndex(i));
    Tingpai const tingpai = classifyTingpai(mianzi_array, quetou, hupai);
    return RegularHand(mianzi_array, quetou, hupai, tingpai, num_declared);
  }

  return IrregularHand(counts, hupai);
}

} // namespace Hule
