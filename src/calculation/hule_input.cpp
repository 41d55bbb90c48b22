#include "calculation/hule_input.hpp"

#include "calculation/mianzi.hpp"
#include "calculation/tile.hpp"
#include <ostream>
#include <cstdint>


namespace Hule{

std::ostream &operator<<(std::ostream &os, WinMethod const win_method)
{
  return os << (win_method == WinMethod::zimo ? "zimo" : "rong");
}

Fulu::Fulu(Type const type, Tile const tile) noexcept
  : type_(type),
    tile_(tile)
{}

Fulu::Type Fulu::getType() const noexcept
{
  return type_;
}

Tile Fulu::getTile() const noexcept
{
  return tile_;
}

Mianzi Fulu::toMianzi() const
{
  switch (type_) {
  case Type::chi:
    return Shunzi(tile_, /*open = */true);
  case Type::peng:
    return Kezi(tile_, /*open = */true);
  case Type::minggang:
    break;
  }
  return Gangzi(tile_, /*open = */true);
}

std::uint_fast8_t getNumGangzi(HuleInput const &input) noexcept
{
  std::uint_fast8_t result = input.angang_list.size();
  for (Fulu const &fulu : input.fulu_list) {
    if (fulu.getType() == Fulu::Type::minggang) {
      ++result;
    }
  }
  return result;
}

} // namespace Hule
