#include "calculation/tile.hpp"

#include "common/throw.hpp"
#include <ostream>
#include <string_view>
#include <string>
#include <vector>
#include <functional>
#include <stdexcept>
#include <limits>
#include <cstdint>


namespace{

using std::placeholders::_1;

} // namespace `anonymous`

namespace Hule{

Tile::Tile(Suit const suit, std::uint_fast8_t const rank)
  : index_(std::numeric_limits<std::uint_fast8_t>::max())
{
  if (suit == Suit::zipai) {
    if (rank == 0u || rank > 7u) {
      HULE_THROW<std::invalid_argument>(_1)
        << static_cast<unsigned>(rank) << ": An invalid rank for an honor tile.";
    }
    index_ = 27u + rank - 1u;
    return;
  }
  if (suit != Suit::manzi && suit != Suit::pinzi && suit != Suit::suozi) {
    HULE_THROW<std::invalid_argument>(_1) << static_cast<unsigned>(suit) << ": An invalid suit.";
  }
  if (rank == 0u || rank > 9u) {
    HULE_THROW<std::invalid_argument>(_1)
      << static_cast<unsigned>(rank) << ": An invalid rank for a numbered tile.";
  }
  index_ = static_cast<std::uint_fast8_t>(suit) * 9u + rank - 1u;
}

Tile Tile::fromIndex(std::uint_fast8_t const index)
{
  if (index >= num_kinds) {
    HULE_THROW<std::logic_error>(_1) << static_cast<unsigned>(index) << ": A logic error.";
  }
  return Tile(index);
}

Tile Tile::fromFeng(Feng const feng) noexcept
{
  return Tile(static_cast<std::uint_fast8_t>(27u + static_cast<std::uint_fast8_t>(feng)));
}

Suit Tile::getSuit() const noexcept
{
  if (index_ >= 27u) {
    return Suit::zipai;
  }
  return static_cast<Suit>(index_ / 9u);
}

std::uint_fast8_t Tile::getRank() const noexcept
{
  if (index_ >= 27u) {
    return index_ - 27u + 1u;
  }
  return index_ % 9u + 1u;
}

bool Tile::isShupai() const noexcept
{
  return index_ < 27u;
}

bool Tile::isZipai() const noexcept
{
  return index_ >= 27u;
}

bool Tile::isFeng() const noexcept
{
  return 27u <= index_ && index_ < 31u;
}

bool Tile::isSanyuan() const noexcept
{
  return index_ >= 31u;
}

bool Tile::isLaotou() const noexcept
{
  return isShupai() && (getRank() == 1u || getRank() == 9u);
}

bool Tile::isYaojiu() const noexcept
{
  return isZipai() || isLaotou();
}

std::string Tile::toString() const
{
  constexpr char suits[] = { 'm', 'p', 's', 'z' };
  std::string result;
  result.push_back(static_cast<char>('0' + getRank()));
  result.push_back(suits[static_cast<std::uint_fast8_t>(getSuit())]);
  return result;
}

bool operator==(Tile const &lhs, Tile const &rhs) noexcept
{
  return lhs.getIndex() == rhs.getIndex();
}

bool operator!=(Tile const &lhs, Tile const &rhs) noexcept
{
  return !(lhs == rhs);
}

bool operator<(Tile const &lhs, Tile const &rhs) noexcept
{
  return lhs.getIndex() < rhs.getIndex();
}

std::ostream &operator<<(std::ostream &os, Tile const &tile)
{
  return os << tile.toString();
}

std::ostream &operator<<(std::ostream &os, Feng const feng)
{
  switch (feng) {
  case Feng::dong:
    return os << "dong";
  case Feng::nan:
    return os << "nan";
  case Feng::xi:
    return os << "xi";
  case Feng::bei:
    return os << "bei";
  }
  return os << static_cast<unsigned>(feng);
}

TileCounts countTiles(std::vector<Tile> const &tiles)
{
  TileCounts counts{};
  for (Tile const &tile : tiles) {
    ++counts[tile.getIndex()];
  }
  return counts;
}

namespace{

Suit parseSuit(char const c, std::string_view const context)
{
  switch (c) {
  case 'm':
    return Suit::manzi;
  case 'p':
    return Suit::pinzi;
  case 's':
    return Suit::suozi;
  case 'z':
    return Suit::zipai;
  default:
    break;
  }
  HULE_THROW<std::invalid_argument>(_1) << context << ": An invalid suit `" << c << "'.";
}

std::uint_fast8_t parseRank(char const c, std::string_view const context)
{
  if (c < '1' || '9' < c) {
    HULE_THROW<std::invalid_argument>(_1) << context << ": An invalid rank `" << c << "'.";
  }
  return c - '0';
}

} // namespace `anonymous`

Tile parseTile(std::string_view const tile)
{
  if (tile.size() != 2u) {
    HULE_THROW<std::invalid_argument>(_1) << "tile = " << tile;
  }
  return Tile(parseSuit(tile[1u], tile), parseRank(tile[0u], tile));
}

std::vector<Tile> parseTiles(std::string_view const tiles)
{
  std::vector<Tile> result;
  std::string ranks;
  for (char const c : tiles) {
    if (c == ' ') {
      if (!ranks.empty()) {
        HULE_THROW<std::invalid_argument>(_1) << tiles << ": A rank without a suit.";
      }
      continue;
    }
    if ('0' <= c && c <= '9') {
      ranks.push_back(c);
      continue;
    }
    if (ranks.empty()) {
      HULE_THROW<std::invalid_argument>(_1) << tiles << ": A suit without a rank.";
    }
    Suit const suit = parseSuit(c, tiles);
    for (char const r : ranks) {
      result.emplace_back(suit, parseRank(r, tiles));
    }
    ranks.clear();
  }
  if (!ranks.empty()) {
    HULE_THROW<std::invalid_argument>(_1) << tiles << ": A rank without a suit.";
  }
  return result;
}

Tile getDoraFromIndicator(Tile const indicator)
{
  std::uint_fast8_t const index = indicator.getIndex();
  if (index < 27u) {
    // 9 -> 1 で一周する．
    std::uint_fast8_t const base = index / 9u * 9u;
    return Tile::fromIndex(base + (index - base + 1u) % 9u);
  }
  if (index < 31u) {
    // 北 -> 東
    return Tile::fromIndex(27u + (index - 27u + 1u) % 4u);
  }
  // 中 -> 白
  return Tile::fromIndex(31u + (index - 31u + 1u) % 3u);
}

std::uint_fast8_t countDora(TileCounts const &counts, std::vector<Tile> const &indicators)
{
  std::uint_fast8_t result = 0u;
  for (Tile const indicator : indicators) {
    result += counts[getDoraFromIndicator(indicator).getIndex()];
  }
  return result;
}

} // namespace Hule
