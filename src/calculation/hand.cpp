#include "calculation/hand.hpp"

#include "calculation/mianzi.hpp"
#include "calculation/tile.hpp"
#include "common/throw.hpp"
#include <ostream>
#include <variant>
#include <array>
#include <functional>
#include <stdexcept>
#include <cstdint>


namespace{

using std::placeholders::_1;

} // namespace `anonymous`

namespace Hule{

RegularHand::RegularHand(
  std::array<Mianzi, 4u> const &mianzi_list, Quetou const quetou, Tile const hupai,
  Tingpai const tingpai, std::uint_fast8_t const num_declared)
  : mianzi_list_(mianzi_list),
    quetou_(quetou),
    hupai_(hupai),
    tingpai_(tingpai),
    num_declared_(num_declared)
{
  if (num_declared_ > 4u) {
    HULE_THROW<std::logic_error>(_1)
      << static_cast<unsigned>(num_declared_) << ": An invalid number of declared sets.";
  }
}

std::array<Mianzi, 4u> const &RegularHand::getMianziList() const noexcept
{
  return mianzi_list_;
}

Quetou RegularHand::getQuetou() const noexcept
{
  return quetou_;
}

Tile RegularHand::getHupai() const noexcept
{
  return hupai_;
}

Tingpai RegularHand::getTingpai() const noexcept
{
  return tingpai_;
}

std::uint_fast8_t RegularHand::getNumDeclared() const noexcept
{
  return num_declared_;
}

TileCounts RegularHand::getCounts() const
{
  TileCounts counts{};
  for (Mianzi const &mianzi : mianzi_list_) {
    for (Tile const tile : getTiles(mianzi)) {
      ++counts[tile.getIndex()];
    }
  }
  counts[quetou_.getTile().getIndex()] += 2u;
  return counts;
}

IrregularHand::IrregularHand(TileCounts const &counts, Tile const hupai) noexcept
  : counts_(counts),
    hupai_(hupai)
{}

TileCounts const &IrregularHand::getCounts() const noexcept
{
  return counts_;
}

Tile IrregularHand::getHupai() const noexcept
{
  return hupai_;
}

std::ostream &operator<<(std::ostream &os, RegularHand const &hand)
{
  for (Mianzi const &mianzi : hand.getMianziList()) {
    os << mianzi << ' ';
  }
  Tile const quetou = hand.getQuetou().getTile();
  os << static_cast<unsigned>(quetou.getRank()) << quetou;
  return os << " (" << hand.getHupai() << ", " << hand.getTingpai() << ')';
}

std::ostream &operator<<(std::ostream &os, IrregularHand const &hand)
{
  for (std::uint_fast8_t i = 0u; i < Tile::num_kinds; ++i) {
    for (std::uint_fast8_t j = 0u; j < hand.getCounts()[i]; ++j) {
      os << Tile::fromIndex(i);
    }
  }
  return os << " (" << hand.getHupai() << ')';
}

std::ostream &operator<<(std::ostream &os, Decomposition const &decomposition)
{
  std::visit([&os](auto const &hand) { os << hand; }, decomposition);
  return os;
}

} // namespace Hule
