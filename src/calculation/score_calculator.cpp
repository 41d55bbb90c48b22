#include "calculation/score_calculator.hpp"

#include "calculation/pattern_recognizer.hpp"
#include "calculation/pattern.hpp"
#include "calculation/hand.hpp"
#include "calculation/hule_input.hpp"
#include "calculation/mianzi.hpp"
#include "calculation/tile.hpp"
#include "common/throw.hpp"
#include <ostream>
#include <variant>
#include <algorithm>
#include <vector>
#include <utility>
#include <functional>
#include <stdexcept>
#include <cstdint>


namespace{

using std::placeholders::_1;

bool hasPattern(std::vector<Hule::Pattern> const &patterns, Hule::Pattern const pattern)
{
  return std::find(patterns.cbegin(), patterns.cend(), pattern) != patterns.cend();
}

std::uint_fast8_t getMianziFu(Hule::Mianzi const &mianzi) noexcept
{
  if (std::holds_alternative<Hule::Shunzi>(mianzi)) {
    return 0u;
  }

  // 明刻 2, 幺九牌の明刻 4, 暗刻 4, 幺九牌の暗刻 8. 槓子はその 4 倍.
  std::uint_fast8_t fu = 2u;
  if (!Hule::isOpen(mianzi)) {
    fu *= 2u;
  }
  if (Hule::getRepresentativeTile(mianzi).isYaojiu()) {
    fu *= 2u;
  }
  if (std::holds_alternative<Hule::Gangzi>(mianzi)) {
    fu *= 4u;
  }
  return fu;
}

std::uint_fast8_t getQuetouFu(Hule::Quetou const quetou, Hule::HuleInput const &input) noexcept
{
  Hule::Tile const tile = quetou.getTile();
  if (tile.isSanyuan()) {
    return 2u;
  }

  std::uint_fast8_t fu = 0u;
  if (tile == Hule::Tile::fromFeng(input.game.changfeng)) {
    fu += 2u;
  }
  if (tile == Hule::Tile::fromFeng(input.player.zifeng)) {
    fu += 2u;
  }
  return fu;
}

std::uint_fast8_t getTingpaiFu(Hule::Tingpai const tingpai) noexcept
{
  switch (tingpai) {
  case Hule::Tingpai::kanzhang:
  case Hule::Tingpai::bianzhang:
  case Hule::Tingpai::danqi:
    return 2u;
  default:
    return 0u;
  }
}

void settle(std::int_fast32_t const basic_points, Hule::HuleInput const &input, Hule::ScoreResult &result)
{
  using Hule::roundUpTo100;

  std::int_fast32_t const benchang = input.game.benchang;
  bool const zimo = input.win_method == Hule::WinMethod::zimo;

  if (input.player.zhuangjia) {
    if (zimo) {
      // 親の自摸和
      std::int_fast32_t const payment = roundUpTo100(basic_points * 2);
      result.base_payment = payment;
      result.zhuangjia_payment = payment;
      result.sanjia_payment = 0;
      result.total_payment = (payment + 100 * benchang) * 3;
    }
    else {
      // 親の栄和
      std::int_fast32_t const total = roundUpTo100(basic_points * 6) + 300 * benchang;
      result.base_payment = total;
      result.total_payment = total;
    }
  }
  else {
    if (zimo) {
      // 子の自摸和
      std::int_fast32_t const zhuangjia_payment = roundUpTo100(basic_points * 2);
      std::int_fast32_t const sanjia_payment = roundUpTo100(basic_points);
      result.base_payment = sanjia_payment;
      result.zhuangjia_payment = zhuangjia_payment;
      result.sanjia_payment = sanjia_payment;
      result.total_payment
        = (zhuangjia_payment + 100 * benchang) + (sanjia_payment + 100 * benchang) * 2;
    }
    else {
      // 子の栄和
      std::int_fast32_t const total = roundUpTo100(basic_points * 4) + 300 * benchang;
      result.base_payment = total;
      result.total_payment = total;
    }
  }

  result.lizhi_deposit_points = 1000 * static_cast<std::int_fast32_t>(input.game.num_lizhi_deposits);
}

} // namespace `anonymous`

namespace Hule{

char const *getLimitTierName(LimitTier const tier) noexcept
{
  switch (tier) {
  case LimitTier::none:
    return "none";
  case LimitTier::manguan:
    return "manguan";
  case LimitTier::tiaoman:
    return "tiaoman";
  case LimitTier::beiman:
    return "beiman";
  case LimitTier::sanbeiman:
    return "sanbeiman";
  case LimitTier::shuyi_yiman:
    return "shuyi_yiman";
  case LimitTier::yiman:
    return "yiman";
  case LimitTier::double_yiman:
    return "double_yiman";
  }
  return "unknown";
}

std::ostream &operator<<(std::ostream &os, LimitTier const tier)
{
  return os << getLimitTierName(tier);
}

std::uint_fast8_t calculateFan(std::vector<Pattern> const &patterns, bool const menqian) noexcept
{
  std::uint_fast8_t fan = 0u;
  for (Pattern const pattern : patterns) {
    fan += getFan(pattern, menqian);
  }
  return fan;
}

std::uint_fast8_t countYakuman(std::vector<Pattern> const &patterns) noexcept
{
  std::uint_fast8_t count = 0u;
  for (Pattern const pattern : patterns) {
    count += getYakumanMultiplier(pattern);
  }
  return count;
}

std::uint_fast8_t calculateFu(
  Decomposition const &decomposition, std::vector<Pattern> const &patterns,
  HuleInput const &input)
{
  if (hasPattern(patterns, Pattern::qiduizi)) {
    return 25u;
  }

  bool const zimo = input.win_method == WinMethod::zimo;
  if (hasPattern(patterns, Pattern::pinghe)) {
    return zimo ? 20u : 30u;
  }

  RegularHand const *p_hand = std::get_if<RegularHand>(&decomposition);
  if (p_hand == nullptr) {
    HULE_THROW<std::logic_error>(_1)
      << std::get<IrregularHand>(decomposition) << ": No fu for a hand without sets.";
  }
  RegularHand const &hand = *p_hand;

  // 副底
  std::uint_fast8_t fu = 20u;
  if (zimo) {
    fu += 2u;
  }
  else if (input.player.menqian) {
    // 門前加符
    fu += 10u;
  }
  for (Mianzi const &mianzi : hand.getMianziList()) {
    fu += getMianziFu(mianzi);
  }
  fu += getQuetouFu(hand.getQuetou(), input);
  fu += getTingpaiFu(hand.getTingpai());

  return (fu + 9u) / 10u * 10u;
}

std::pair<std::int_fast32_t, LimitTier> calculateBasicPoints(
  std::uint_fast8_t const fan, std::uint_fast8_t const fu) noexcept
{
  if (fan >= 13u) {
    return { 8000, LimitTier::shuyi_yiman };
  }
  if (fan >= 11u) {
    return { 6000, LimitTier::sanbeiman };
  }
  if (fan >= 8u) {
    return { 4000, LimitTier::beiman };
  }
  if (fan >= 6u) {
    return { 3000, LimitTier::tiaoman };
  }
  if (fan == 5u) {
    return { 2000, LimitTier::manguan };
  }

  std::int_fast32_t const basic_points = static_cast<std::int_fast32_t>(fu) << (fan + 2u);
  if (basic_points >= 2000) {
    return { 2000, LimitTier::manguan };
  }
  return { basic_points, LimitTier::none };
}

std::int_fast32_t roundUpTo100(std::int_fast32_t const points) noexcept
{
  return (points + 99) / 100 * 100;
}

ScoreResult calculateScore(
  Recognition const &recognition, Decomposition const &decomposition, HuleInput const &input)
{
  ScoreResult result;

  std::uint_fast8_t const num_yakuman = countYakuman(recognition.patterns);
  if (num_yakuman >= 1u) {
    // Bonus tiles add nothing to a top-tier hand.
    for (Pattern const pattern : recognition.patterns) {
      if (!isBonusPattern(pattern)) {
        result.patterns.push_back(pattern);
      }
    }
    result.fan = 13u * num_yakuman;
    result.fu = 0u;
    result.num_hongbaopai = 0u;
    result.limit_tier = num_yakuman >= 2u ? LimitTier::double_yiman : LimitTier::yiman;
    settle(8000 * static_cast<std::int_fast32_t>(num_yakuman), input, result);
    return result;
  }

  result.patterns = recognition.patterns;
  result.num_hongbaopai = recognition.num_hongbaopai;
  result.fan = calculateFan(recognition.patterns, input.player.menqian);
  result.fu = calculateFu(decomposition, recognition.patterns, input);
  auto const [basic_points, limit_tier] = calculateBasicPoints(result.fan, result.fu);
  result.limit_tier = limit_tier;
  settle(basic_points, input, result);
  return result;
}

} // namespace Hule
