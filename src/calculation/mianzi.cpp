#include "calculation/mianzi.hpp"

#include "calculation/tile.hpp"
#include "common/throw.hpp"
#include <ostream>
#include <variant>
#include <vector>
#include <array>
#include <functional>
#include <stdexcept>
#include <cstdint>


namespace{

using std::placeholders::_1;

template<typename... F>
struct Overloaded
  : F...
{
  using F::operator()...;
}; // struct Overloaded

template<typename... F>
Overloaded(F...) -> Overloaded<F...>;

} // namespace `anonymous`

namespace Hule{

Shunzi::Shunzi(Tile const first, bool const open)
  : first_(first),
    open_(open)
{
  if (!first.isShupai() || first.getRank() > 7u) {
    HULE_THROW<std::invalid_argument>(_1) << first << ": An invalid first tile of a sequence.";
  }
}

Tile Shunzi::getFirst() const noexcept
{
  return first_;
}

Tile Shunzi::getMiddle() const
{
  return Tile::fromIndex(first_.getIndex() + 1u);
}

Tile Shunzi::getLast() const
{
  return Tile::fromIndex(first_.getIndex() + 2u);
}

std::array<Tile, 3u> Shunzi::getTiles() const
{
  return { first_, getMiddle(), getLast() };
}

bool Shunzi::isOpen() const noexcept
{
  return open_;
}

bool Shunzi::contains(Tile const tile) const noexcept
{
  std::uint_fast8_t const first = first_.getIndex();
  return first <= tile.getIndex() && tile.getIndex() <= first + 2u;
}

Kezi::Kezi(Tile const tile, bool const open) noexcept
  : tile_(tile),
    open_(open)
{}

Tile Kezi::getTile() const noexcept
{
  return tile_;
}

std::array<Tile, 3u> Kezi::getTiles() const noexcept
{
  return { tile_, tile_, tile_ };
}

bool Kezi::isOpen() const noexcept
{
  return open_;
}

bool Kezi::contains(Tile const tile) const noexcept
{
  return tile == tile_;
}

Gangzi::Gangzi(Tile const tile, bool const open) noexcept
  : tile_(tile),
    open_(open)
{}

Tile Gangzi::getTile() const noexcept
{
  return tile_;
}

std::array<Tile, 4u> Gangzi::getTiles() const noexcept
{
  return { tile_, tile_, tile_, tile_ };
}

bool Gangzi::isOpen() const noexcept
{
  return open_;
}

bool Gangzi::contains(Tile const tile) const noexcept
{
  return tile == tile_;
}

bool isOpen(Mianzi const &mianzi) noexcept
{
  return std::visit([](auto const &m) { return m.isOpen(); }, mianzi);
}

bool contains(Mianzi const &mianzi, Tile const tile) noexcept
{
  return std::visit([tile](auto const &m) { return m.contains(tile); }, mianzi);
}

Tile getRepresentativeTile(Mianzi const &mianzi) noexcept
{
  return std::visit(Overloaded{
      [](Shunzi const &m) { return m.getFirst(); },
      [](Kezi const &m) { return m.getTile(); },
      [](Gangzi const &m) { return m.getTile(); }
    }, mianzi);
}

std::vector<Tile> getTiles(Mianzi const &mianzi)
{
  return std::visit([](auto const &m) {
      auto const tiles = m.getTiles();
      return std::vector<Tile>(tiles.cbegin(), tiles.cend());
    }, mianzi);
}

std::ostream &operator<<(std::ostream &os, Mianzi const &mianzi)
{
  std::visit(Overloaded{
      [&os](Shunzi const &m) {
        os << static_cast<unsigned>(m.getFirst().getRank())
           << static_cast<unsigned>(m.getMiddle().getRank())
           << m.getLast();
      },
      [&os](Kezi const &m) {
        auto const rank = static_cast<unsigned>(m.getTile().getRank());
        os << rank << rank << m.getTile();
      },
      [&os](Gangzi const &m) {
        auto const rank = static_cast<unsigned>(m.getTile().getRank());
        os << rank << rank << rank << m.getTile();
      }
    }, mianzi);
  if (isOpen(mianzi)) {
    os << '*';
  }
  return os;
}

Quetou::Quetou(Tile const tile) noexcept
  : tile_(tile)
{}

Tile Quetou::getTile() const noexcept
{
  return tile_;
}

std::array<Tile, 2u> Quetou::getTiles() const noexcept
{
  return { tile_, tile_ };
}

char const *getTingpaiName(Tingpai const tingpai) noexcept
{
  switch (tingpai) {
  case Tingpai::liangmian:
    return "liangmian";
  case Tingpai::bianzhang:
    return "bianzhang";
  case Tingpai::kanzhang:
    return "kanzhang";
  case Tingpai::shuangpeng:
    return "shuangpeng";
  case Tingpai::danqi:
    return "danqi";
  case Tingpai::guoshi_yimian:
    return "guoshi_yimian";
  case Tingpai::guoshi_shisanmian:
    return "guoshi_shisanmian";
  }
  return "unknown";
}

std::ostream &operator<<(std::ostream &os, Tingpai const tingpai)
{
  return os << getTingpaiName(tingpai);
}

} // namespace Hule
