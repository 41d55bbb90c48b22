#if !defined(HULE_CALCULATION_MIANZI_HPP_INCLUDE_GUARD)
#define HULE_CALCULATION_MIANZI_HPP_INCLUDE_GUARD

#include "calculation/tile.hpp"
#include <iosfwd>
#include <variant>
#include <vector>
#include <array>
#include <cstdint>


namespace Hule{

// 順子
class Shunzi
{
public:
  // `first` must be a numbered tile of rank 1-7.
  Shunzi(Tile first, bool open);

  Tile getFirst() const noexcept;

  Tile getMiddle() const;

  Tile getLast() const;

  std::array<Tile, 3u> getTiles() const;

  bool isOpen() const noexcept;

  bool contains(Tile tile) const noexcept;

private:
  Tile first_;
  bool open_;
}; // class Shunzi

// 刻子
class Kezi
{
public:
  Kezi(Tile tile, bool open) noexcept;

  Tile getTile() const noexcept;

  std::array<Tile, 3u> getTiles() const noexcept;

  bool isOpen() const noexcept;

  bool contains(Tile tile) const noexcept;

private:
  Tile tile_;
  bool open_;
}; // class Kezi

// 槓子. Only ever formed by a declared call (明槓 or 暗槓).
class Gangzi
{
public:
  Gangzi(Tile tile, bool open) noexcept;

  Tile getTile() const noexcept;

  std::array<Tile, 4u> getTiles() const noexcept;

  bool isOpen() const noexcept;

  bool contains(Tile tile) const noexcept;

private:
  Tile tile_;
  bool open_;
}; // class Gangzi

using Mianzi = std::variant<Shunzi, Kezi, Gangzi>;

bool isOpen(Mianzi const &mianzi) noexcept;

bool contains(Mianzi const &mianzi, Tile tile) noexcept;

// The tile a fu value depends on: the first tile of a sequence, the repeated
// tile of a triplet or quad.
Tile getRepresentativeTile(Mianzi const &mianzi) noexcept;

std::vector<Tile> getTiles(Mianzi const &mianzi);

std::ostream &operator<<(std::ostream &os, Mianzi const &mianzi);

// 雀頭
class Quetou
{
public:
  explicit Quetou(Tile tile) noexcept;

  Tile getTile() const noexcept;

  std::array<Tile, 2u> getTiles() const noexcept;

private:
  Tile tile_;
}; // class Quetou

// 待ちの形
enum struct Tingpai : std::uint_fast8_t
{
  liangmian,         // 両面
  bianzhang,         // 辺張
  kanzhang,          // 嵌張
  shuangpeng,        // 双碰
  danqi,             // 単騎
  guoshi_yimian,     // 国士無双単騎
  guoshi_shisanmian, // 国士無双十三面
}; // enum struct Tingpai

char const *getTingpaiName(Tingpai tingpai) noexcept;

std::ostream &operator<<(std::ostream &os, Tingpai tingpai);

} // namespace Hule

#endif // !defined(HULE_CALCULATION_MIANZI_HPP_INCLUDE_GUARD)
