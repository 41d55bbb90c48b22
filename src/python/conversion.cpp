#define PY_SSIZE_T_CLEAN
#include "python/conversion.hpp"

#include "calculation/score_calculator.hpp"
#include "calculation/pattern_recognizer.hpp"
#include "calculation/pattern.hpp"
#include "calculation/hand.hpp"
#include "calculation/hule_input.hpp"
#include "calculation/mianzi.hpp"
#include "calculation/tile.hpp"
#include "common/throw.hpp"
#include <boost/python/extract.hpp>
#include <boost/python/dict.hpp>
#include <boost/python/list.hpp>
#include <boost/python/tuple.hpp>
#include <boost/python/object.hpp>
#include <Python.h>
#include <variant>
#include <vector>
#include <string>
#include <functional>
#include <limits>
#include <stdexcept>
#include <cstdint>


namespace{

using std::placeholders::_1;
namespace python = boost::python;

template<typename T>
T extractValue(python::object o, char const *key)
{
  python::extract<T> e(o);
  if (!e.check()) {
    HULE_THROW<std::invalid_argument>(_1) << key << ": A type error.";
  }
  return e();
}

std::uint_fast8_t extractCount(python::object o, char const *key)
{
  long const value = extractValue<long>(o, key);
  if (value < 0 || std::numeric_limits<std::uint_fast8_t>::max() < value) {
    HULE_THROW<std::invalid_argument>(_1) << key << ": " << value << ": Out of range.";
  }
  return value;
}

Hule::Tile extractTile(python::object o, char const *key)
{
  return Hule::parseTile(extractValue<std::string>(o, key));
}

Hule::Feng extractFeng(python::object o, char const *key)
{
  std::string const name = extractValue<std::string>(o, key);
  if (name == "dong") {
    return Hule::Feng::dong;
  }
  if (name == "nan") {
    return Hule::Feng::nan;
  }
  if (name == "xi") {
    return Hule::Feng::xi;
  }
  if (name == "bei") {
    return Hule::Feng::bei;
  }
  HULE_THROW<std::invalid_argument>(_1) << key << ": " << name << ": An invalid wind.";
}

Hule::Fulu extractFulu(python::object o)
{
  if (python::len(o) != 2) {
    HULE_THROW<std::invalid_argument>(_1)
      << "fulu: A call must be a pair of a type and a tile.";
  }
  std::string const type = extractValue<std::string>(o[0], "fulu");
  Hule::Tile const tile = extractTile(o[1], "fulu");
  if (type == "chi") {
    return Hule::Fulu(Hule::Fulu::Type::chi, tile);
  }
  if (type == "peng") {
    return Hule::Fulu(Hule::Fulu::Type::peng, tile);
  }
  if (type == "minggang") {
    return Hule::Fulu(Hule::Fulu::Type::minggang, tile);
  }
  HULE_THROW<std::invalid_argument>(_1) << "fulu: " << type << ": An invalid type.";
}

Hule::WinMethod extractWinMethod(python::object o)
{
  std::string const name = extractValue<std::string>(o, "win_method");
  if (name == "zimo") {
    return Hule::WinMethod::zimo;
  }
  if (name == "rong") {
    return Hule::WinMethod::rong;
  }
  HULE_THROW<std::invalid_argument>(_1) << "win_method: " << name << ": An invalid value.";
}

Hule::PlayerContext extractPlayer(python::dict player)
{
  Hule::PlayerContext result;
  result.zifeng = extractFeng(player.get("zifeng", "dong"), "player.zifeng");
  result.zhuangjia = extractValue<bool>(player.get("zhuangjia", false), "player.zhuangjia");
  result.lizhi = extractValue<bool>(player.get("lizhi", false), "player.lizhi");
  result.double_lizhi = extractValue<bool>(player.get("double_lizhi", false), "player.double_lizhi");
  result.yifa = extractValue<bool>(player.get("yifa", false), "player.yifa");
  result.menqian = extractValue<bool>(player.get("menqian", true), "player.menqian");
  return result;
}

Hule::GameContext extractGame(python::dict game)
{
  Hule::GameContext result;
  result.changfeng = extractFeng(game.get("changfeng", "dong"), "game.changfeng");
  result.ju = extractCount(game.get("ju", 1), "game.ju");
  result.benchang = extractCount(game.get("benchang", 0), "game.benchang");
  result.num_lizhi_deposits = extractCount(
    game.get("num_lizhi_deposits", 0), "game.num_lizhi_deposits");
  result.dora_indicators = Hule::toTiles(
    game.get("dora_indicators", python::list()), "game.dora_indicators");
  result.lidora_indicators = Hule::toTiles(
    game.get("lidora_indicators", python::list()), "game.lidora_indicators");
  result.num_hongbaopai = extractCount(game.get("num_hongbaopai", 0), "game.num_hongbaopai");
  result.tianhu = extractValue<bool>(game.get("tianhu", false), "game.tianhu");
  result.dihu = extractValue<bool>(game.get("dihu", false), "game.dihu");
  result.renhu = extractValue<bool>(game.get("renhu", false), "game.renhu");
  result.haidi = extractValue<bool>(game.get("haidi", false), "game.haidi");
  result.hedi = extractValue<bool>(game.get("hedi", false), "game.hedi");
  result.lingshang = extractValue<bool>(game.get("lingshang", false), "game.lingshang");
  result.qianggang = extractValue<bool>(game.get("qianggang", false), "game.qianggang");
  return result;
}

char const *getMianziTypeName(Hule::Mianzi const &mianzi) noexcept
{
  if (std::holds_alternative<Hule::Shunzi>(mianzi)) {
    return "shunzi";
  }
  if (std::holds_alternative<Hule::Kezi>(mianzi)) {
    return "kezi";
  }
  return "gangzi";
}

python::dict handToPython(Hule::RegularHand const &hand)
{
  python::list mianzi_list;
  for (Hule::Mianzi const &mianzi : hand.getMianziList()) {
    python::dict m;
    m["type"] = getMianziTypeName(mianzi);
    m["tile"] = Hule::getRepresentativeTile(mianzi).toString();
    m["open"] = Hule::isOpen(mianzi);
    mianzi_list.append(m);
  }

  python::dict result;
  result["type"] = "regular";
  result["mianzi"] = mianzi_list;
  result["quetou"] = hand.getQuetou().getTile().toString();
  result["hupai"] = hand.getHupai().toString();
  result["tingpai"] = Hule::getTingpaiName(hand.getTingpai());
  result["num_declared"] = static_cast<long>(hand.getNumDeclared());
  return result;
}

python::dict handToPython(Hule::IrregularHand const &hand)
{
  python::list counts;
  for (std::uint_fast8_t const count : hand.getCounts()) {
    counts.append(static_cast<long>(count));
  }

  python::dict result;
  result["type"] = "irregular";
  result["counts"] = counts;
  result["hupai"] = hand.getHupai().toString();
  return result;
}

} // namespace `anonymous`

namespace Hule{

HuleInput toHuleInput(python::dict input)
{
  if (!input.has_key("tiles")) {
    HULE_THROW<std::invalid_argument>("`tiles` is missing.");
  }
  if (!input.has_key("winning_tile")) {
    HULE_THROW<std::invalid_argument>("`winning_tile` is missing.");
  }

  HuleInput result{
    Hule::toTiles(input["tiles"], "tiles"),
    extractTile(input["winning_tile"], "winning_tile")
  };

  python::object fulu_list = input.get("fulu", python::list());
  python::ssize_t const num_fulu = python::len(fulu_list);
  for (python::ssize_t i = 0; i < num_fulu; ++i) {
    result.fulu_list.push_back(extractFulu(fulu_list[i]));
  }
  result.angang_list = Hule::toTiles(input.get("angang", python::list()), "angang");

  python::object player = input.get("player", python::dict());
  result.player = extractPlayer(extractValue<python::dict>(player, "player"));
  python::object game = input.get("game", python::dict());
  result.game = extractGame(extractValue<python::dict>(game, "game"));

  result.win_method = extractWinMethod(input.get("win_method", "zimo"));
  return result;
}

std::vector<Tile> toTiles(python::object tiles, char const *key)
{
  python::extract<std::string> str(tiles);
  if (str.check()) {
    return parseTiles(str());
  }

  std::vector<Tile> result;
  python::ssize_t const size = python::len(tiles);
  for (python::ssize_t i = 0; i < size; ++i) {
    result.push_back(extractTile(tiles[i], key));
  }
  return result;
}

python::dict toPython(Decomposition const &decomposition)
{
  return std::visit([](auto const &hand) { return handToPython(hand); }, decomposition);
}

Recognition toRecognition(python::object recognition)
{
  python::tuple const t = extractValue<python::tuple>(recognition, "recognize");
  if (python::len(t) != 2) {
    HULE_THROW<std::invalid_argument>(_1)
      << "recognize: " << python::len(t) << ": A length error.";
  }

  Recognition result;
  python::object patterns = t[0];
  python::ssize_t const num_patterns = python::len(patterns);
  for (python::ssize_t i = 0; i < num_patterns; ++i) {
    result.patterns.push_back(parsePattern(extractValue<std::string>(patterns[i], "recognize")));
  }
  result.num_hongbaopai = extractCount(t[1], "recognize");
  return result;
}

python::dict toPython(ScoreResult const &result)
{
  python::list patterns;
  for (Pattern const pattern : result.patterns) {
    patterns.append(getPatternName(pattern));
  }

  python::dict d;
  d["fan"] = static_cast<long>(result.fan);
  d["fu"] = static_cast<long>(result.fu);
  d["patterns"] = patterns;
  d["num_hongbaopai"] = static_cast<long>(result.num_hongbaopai);
  d["limit_tier"] = getLimitTierName(result.limit_tier);
  d["base_payment"] = static_cast<long>(result.base_payment);
  d["zhuangjia_payment"] = static_cast<long>(result.zhuangjia_payment);
  d["sanjia_payment"] = static_cast<long>(result.sanjia_payment);
  d["total_payment"] = static_cast<long>(result.total_payment);
  d["lizhi_deposit_points"] = static_cast<long>(result.lizhi_deposit_points);
  return d;
}

} // namespace Hule
