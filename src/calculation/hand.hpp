#if !defined(HULE_CALCULATION_HAND_HPP_INCLUDE_GUARD)
#define HULE_CALCULATION_HAND_HPP_INCLUDE_GUARD

#include "calculation/mianzi.hpp"
#include "calculation/tile.hpp"
#include <iosfwd>
#include <variant>
#include <array>
#include <cstdint>


namespace Hule{

// A hand grouped into four sets and a pair (四面子一雀頭).
class RegularHand
{
public:
  // `mianzi_list` holds the declared sets first (concealed quads, then open
  // calls, in the order declared), followed by the sets found by the search.
  RegularHand(
    std::array<Mianzi, 4u> const &mianzi_list, Quetou quetou, Tile hupai,
    Tingpai tingpai, std::uint_fast8_t num_declared);

  std::array<Mianzi, 4u> const &getMianziList() const noexcept;

  Quetou getQuetou() const noexcept;

  Tile getHupai() const noexcept;

  Tingpai getTingpai() const noexcept;

  std::uint_fast8_t getNumDeclared() const noexcept;

  // The union of the tiles of every set and the pair.
  TileCounts getCounts() const;

private:
  std::array<Mianzi, 4u> mianzi_list_;
  Quetou quetou_;
  Tile hupai_;
  Tingpai tingpai_;
  std::uint_fast8_t num_declared_;
}; // class RegularHand

// A hand with no four-sets-and-a-pair grouping. Seven pairs and thirteen
// orphans are told apart by the recognizer, not here.
class IrregularHand
{
public:
  IrregularHand(TileCounts const &counts, Tile hupai) noexcept;

  TileCounts const &getCounts() const noexcept;

  Tile getHupai() const noexcept;

private:
  TileCounts counts_;
  Tile hupai_;
}; // class IrregularHand

using Decomposition = std::variant<RegularHand, IrregularHand>;

std::ostream &operator<<(std::ostream &os, RegularHand const &hand);

std::ostream &operator<<(std::ostream &os, IrregularHand const &hand);

std::ostream &operator<<(std::ostream &os, Decomposition const &decomposition);

} // namespace Hule

#endif // !defined(HULE_CALCULATION_HAND_HPP_INCLUDE_GUARD)
