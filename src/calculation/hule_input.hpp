#if !defined(HULE_CALCULATION_HULE_INPUT_HPP_INCLUDE_GUARD)
#define HULE_CALCULATION_HULE_INPUT_HPP_INCLUDE_GUARD

#include "calculation/mianzi.hpp"
#include "calculation/tile.hpp"
#include <iosfwd>
#include <vector>
#include <cstdint>


namespace Hule{

enum struct WinMethod : std::uint_fast8_t
{
  zimo, // 自摸和
  rong, // 栄和
}; // enum struct WinMethod

std::ostream &operator<<(std::ostream &os, WinMethod win_method);

// 副露. A declared open call. Concealed quads (暗槓) are declared separately.
class Fulu
{
public:
  enum struct Type : std::uint_fast8_t
  {
    chi,
    peng,
    minggang,
  }; // enum struct Type

  // For `chi`, `tile` is the lowest tile of the sequence.
  Fulu(Type type, Tile tile) noexcept;

  Type getType() const noexcept;

  Tile getTile() const noexcept;

  // The set this call contributes to the hand. Throws `std::invalid_argument`
  // for a `chi` that cannot start at `getTile()`.
  Mianzi toMianzi() const;

private:
  Type type_;
  Tile tile_;
}; // class Fulu

struct PlayerContext
{
  Feng zifeng = Feng::dong;
  bool zhuangjia = false;
  bool lizhi = false;
  bool double_lizhi = false;
  bool yifa = false;
  bool menqian = true;
}; // struct PlayerContext

struct GameContext
{
  Feng changfeng = Feng::dong;
  std::uint_fast8_t ju = 1u;
  std::uint_fast8_t benchang = 0u;
  std::uint_fast8_t num_lizhi_deposits = 0u;
  std::vector<Tile> dora_indicators{};
  std::vector<Tile> lidora_indicators{};
  std::uint_fast8_t num_hongbaopai = 0u;

  bool tianhu = false;    // 天和
  bool dihu = false;      // 地和
  bool renhu = false;     // 人和
  bool haidi = false;     // 海底摸月
  bool hedi = false;      // 河底撈魚
  bool lingshang = false; // 嶺上開花
  bool qianggang = false; // 搶槓
}; // struct GameContext

// Everything declared at the moment of winning. `tiles` holds every tile of
// the hand, including the called tiles and the winning tile.
struct HuleInput
{
  std::vector<Tile> tiles;
  Tile hupai;
  std::vector<Fulu> fulu_list{};
  std::vector<Tile> angang_list{};
  PlayerContext player{};
  GameContext game{};
  WinMethod win_method = WinMethod::zimo;
}; // struct HuleInput

std::uint_fast8_t getNumGangzi(HuleInput const &input) noexcept;

} // namespace Hule

#endif // !defined(HULE_CALCULATION_HULE_INPUT_HPP_INCLUDE_GUARD)
