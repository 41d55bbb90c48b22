#if !defined(HULE_CALCULATION_TILE_HPP_INCLUDE_GUARD)
#define HULE_CALCULATION_TILE_HPP_INCLUDE_GUARD

#include <iosfwd>
#include <string_view>
#include <string>
#include <vector>
#include <array>
#include <cstdint>


namespace Hule{

enum struct Suit : std::uint_fast8_t
{
  manzi = 0u,
  pinzi = 1u,
  suozi = 2u,
  zipai = 3u,
}; // enum struct Suit

enum struct Feng : std::uint_fast8_t
{
  dong = 0u,
  nan = 1u,
  xi = 2u,
  bei = 3u,
}; // enum struct Feng

// One of the 34 tile kinds. The canonical index is
//
//   [ 0,  9): 1m-9m
//   [ 9, 18): 1p-9p
//   [18, 27): 1s-9s
//   [27, 31): 東南西北 (1z-4z)
//   [31, 34): 白發中 (5z-7z)
class Tile
{
public:
  static constexpr std::uint_fast8_t num_kinds = 34u;

  Tile(Suit suit, std::uint_fast8_t rank);

  static Tile fromIndex(std::uint_fast8_t index);

  static Tile fromFeng(Hule::Feng feng) noexcept;

private:
  explicit constexpr Tile(std::uint_fast8_t index) noexcept
    : index_(index)
  {}

public:
  std::uint_fast8_t getIndex() const noexcept
  {
    return index_;
  }

  Suit getSuit() const noexcept;

  // 1-9 for numbered tiles, 1-7 for honors.
  std::uint_fast8_t getRank() const noexcept;

  bool isShupai() const noexcept;

  bool isZipai() const noexcept;

  bool isFeng() const noexcept;

  bool isSanyuan() const noexcept;

  bool isLaotou() const noexcept;

  // 幺九牌: terminal or honor.
  bool isYaojiu() const noexcept;

  std::string toString() const;

private:
  std::uint_fast8_t index_;
}; // class Tile

bool operator==(Tile const &lhs, Tile const &rhs) noexcept;

bool operator!=(Tile const &lhs, Tile const &rhs) noexcept;

bool operator<(Tile const &lhs, Tile const &rhs) noexcept;

std::ostream &operator<<(std::ostream &os, Tile const &tile);

std::ostream &operator<<(std::ostream &os, Feng feng);

using TileCounts = std::array<std::uint_fast8_t, Tile::num_kinds>;

TileCounts countTiles(std::vector<Tile> const &tiles);

// `5m`, `1z` (東), `7z` (中), and so on.
Tile parseTile(std::string_view tile);

// Compact notation such as `234m567m345p678p44s` or `123m 11z`.
std::vector<Tile> parseTiles(std::string_view tiles);

Tile getDoraFromIndicator(Tile indicator);

std::uint_fast8_t countDora(TileCounts const &counts, std::vector<Tile> const &indicators);

} // namespace Hule

#endif // !defined(HULE_CALCULATION_TILE_HPP_INCLUDE_GUARD)
