#include "calculation/validator.hpp"

#include "calculation/invalid_hule.hpp"
#include "calculation/hule_input.hpp"
#include "calculation/tile.hpp"
#include "common/throw.hpp"
#include <initializer_list>
#include <functional>
#include <cstdint>
#include <cstddef>


namespace{

using std::placeholders::_1;

void validateState(Hule::HuleInput const &input)
{
  using Hule::RejectReason;
  using Hule::InvalidHule;

  Hule::PlayerContext const &player = input.player;
  Hule::GameContext const &game = input.game;
  bool const zimo = input.win_method == Hule::WinMethod::zimo;
  bool const rong = !zimo;
  bool const has_calls = !input.fulu_list.empty() || !input.angang_list.empty();

  if (player.lizhi && player.double_lizhi) {
    HULE_THROW<InvalidHule>(RejectReason::lizhi_and_double_lizhi, _1)
      << "`lizhi` and `double_lizhi` are both declared.";
  }
  if (player.yifa && !player.lizhi && !player.double_lizhi) {
    HULE_THROW<InvalidHule>(RejectReason::yifa_without_lizhi, _1)
      << "`yifa` requires `lizhi` or `double_lizhi`.";
  }
  if (player.menqian && !input.fulu_list.empty()) {
    HULE_THROW<InvalidHule>(RejectReason::menqian_with_fulu, _1)
      << input.fulu_list.size() << ": A concealed hand is declared with open calls.";
  }

  if (game.haidi && rong) {
    HULE_THROW<InvalidHule>(RejectReason::haidi_with_rong, _1)
      << "`haidi` is a win on the last draw.";
  }
  if (game.hedi && zimo) {
    HULE_THROW<InvalidHule>(RejectReason::hedi_with_zimo, _1)
      << "`hedi` is a win on the last discard.";
  }
  if (game.haidi && game.hedi) {
    HULE_THROW<InvalidHule>(RejectReason::haidi_and_hedi, _1)
      << "`haidi` and `hedi` are both declared.";
  }
  if (game.lingshang && rong) {
    HULE_THROW<InvalidHule>(RejectReason::lingshang_with_rong, _1)
      << "`lingshang` is a win on the replacement draw.";
  }
  if (game.qianggang && zimo) {
    HULE_THROW<InvalidHule>(RejectReason::qianggang_with_zimo, _1)
      << "`qianggang` is a win on a robbed quad.";
  }

  if (game.tianhu) {
    if (!player.zhuangjia) {
      HULE_THROW<InvalidHule>(RejectReason::tianhu_without_zhuangjia, _1)
        << "`tianhu` is for the dealer only.";
    }
    if (!zimo) {
      HULE_THROW<InvalidHule>(RejectReason::tianhu_without_zimo, _1)
        << "`tianhu` must be `zimo`.";
    }
    if (has_calls) {
      HULE_THROW<InvalidHule>(RejectReason::tianhu_with_calls, _1)
        << "`tianhu` cannot have any call.";
    }
  }
  if (game.dihu) {
    if (player.zhuangjia) {
      HULE_THROW<InvalidHule>(RejectReason::dihu_with_zhuangjia, _1)
        << "`dihu` is for a non-dealer only.";
    }
    if (!zimo) {
      HULE_THROW<InvalidHule>(RejectReason::dihu_without_zimo, _1)
        << "`dihu` must be `zimo`.";
    }
    if (has_calls) {
      HULE_THROW<InvalidHule>(RejectReason::dihu_with_calls, _1)
        << "`dihu` cannot have any call.";
    }
  }
  if (game.renhu && !rong) {
    HULE_THROW<InvalidHule>(RejectReason::renhu_without_rong, _1)
      << "`renhu` must be `rong`.";
  }
}

void validateComposition(Hule::HuleInput const &input, Hule::TileCounts const &counts)
{
  using Hule::RejectReason;
  using Hule::InvalidHule;
  using Hule::Tile;

  std::size_t const num_calls = input.fulu_list.size() + input.angang_list.size();
  if (num_calls > 4u) {
    HULE_THROW<InvalidHule>(RejectReason::too_many_calls, _1)
      << num_calls << ": More than 4 calls are declared.";
  }

  std::size_t const num_gangzi = Hule::getNumGangzi(input);
  std::size_t const num_tiles = input.tiles.size();
  // 3 tiles for each set, 4 for each quad, 2 for the pair. A 14-tile hand
  // without any quad may still be seven pairs or thirteen orphans.
  std::size_t const expected = 3u * (4u - num_gangzi) + 4u * num_gangzi + 2u;
  if (!(num_tiles == 14u && num_gangzi == 0u) && num_tiles != expected) {
    HULE_THROW<InvalidHule>(RejectReason::wrong_number_of_tiles, _1)
      << num_tiles << " tiles with " << num_gangzi << " quads (expected " << expected << ").";
  }

  if (counts[input.hupai.getIndex()] == 0u) {
    HULE_THROW<InvalidHule>(RejectReason::hupai_not_in_hand, _1)
      << input.hupai << ": The winning tile is not in the hand.";
  }

  for (std::uint_fast8_t i = 0u; i < Tile::num_kinds; ++i) {
    if (counts[i] > 4u) {
      HULE_THROW<InvalidHule>(RejectReason::too_many_copies, _1)
        << Tile::fromIndex(i) << ": " << static_cast<unsigned>(counts[i]) << " copies.";
    }
  }

  unsigned num_fives = 0u;
  for (Hule::Suit const suit : { Hule::Suit::manzi, Hule::Suit::pinzi, Hule::Suit::suozi }) {
    num_fives += counts[Tile(suit, 5u).getIndex()];
  }
  unsigned const num_hongbaopai = input.game.num_hongbaopai;
  if (num_hongbaopai > num_fives) {
    HULE_THROW<InvalidHule>(RejectReason::too_many_hongbaopai_for_fives, _1)
      << num_hongbaopai << " red fives for " << num_fives << " fives.";
  }
  if (num_hongbaopai > 4u) {
    HULE_THROW<InvalidHule>(RejectReason::too_many_hongbaopai, _1)
      << num_hongbaopai << ": More than 4 red fives.";
  }
}

} // namespace `anonymous`

namespace Hule{

void validateHuleInput(HuleInput const &input, TileCounts const &counts)
{
  validateState(input);
  validateComposition(input, counts);
}

} // namespace Hule
