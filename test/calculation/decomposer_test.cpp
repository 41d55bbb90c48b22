#include "calculation/decomposer.hpp"

#include "calculation/test_utility.hpp"
#include "calculation/invalid_hule.hpp"
#include "calculation/hand.hpp"
#include "calculation/hule_input.hpp"
#include "calculation/mianzi.hpp"
#include "calculation/tile.hpp"
#include <gtest/gtest.h>
#include <random>
#include <variant>
#include <vector>
#include <string_view>
#include <cstdint>
#include <cstddef>


namespace{

using Hule::HuleInput;
using Hule::RegularHand;
using Hule::Tile;
using Hule::Test::makeInput;

Hule::Decomposition decompose(HuleInput const &input)
{
  return Hule::decompose(input, Hule::countTiles(input.tiles));
}

RegularHand decomposeRegular(HuleInput const &input)
{
  Hule::Decomposition const decomposition = decompose(input);
  if (!std::holds_alternative<RegularHand>(decomposition)) {
    ADD_FAILURE() << decomposition << ": Not a regular hand.";
  }
  return std::get<RegularHand>(decomposition);
}

void expectMissing(HuleInput const &input, Hule::RejectReason const reason)
{
  try {
    decompose(input);
    ADD_FAILURE() << "Expected a rejection for " << reason << '.';
  }
  catch (Hule::InvalidHule const &e) {
    EXPECT_EQ(reason, e.getReason());
  }
}

void expectShunzi(Hule::Mianzi const &mianzi, std::string_view const first, bool const open)
{
  ASSERT_TRUE(std::holds_alternative<Hule::Shunzi>(mianzi)) << mianzi;
  EXPECT_EQ(Hule::parseTile(first), std::get<Hule::Shunzi>(mianzi).getFirst());
  EXPECT_EQ(open, Hule::isOpen(mianzi));
}

void expectKezi(Hule::Mianzi const &mianzi, std::string_view const tile, bool const open)
{
  ASSERT_TRUE(std::holds_alternative<Hule::Kezi>(mianzi)) << mianzi;
  EXPECT_EQ(Hule::parseTile(tile), std::get<Hule::Kezi>(mianzi).getTile());
  EXPECT_EQ(open, Hule::isOpen(mianzi));
}

void expectGangzi(Hule::Mianzi const &mianzi, std::string_view const tile, bool const open)
{
  ASSERT_TRUE(std::holds_alternative<Hule::Gangzi>(mianzi)) << mianzi;
  EXPECT_EQ(Hule::parseTile(tile), std::get<Hule::Gangzi>(mianzi).getTile());
  EXPECT_EQ(open, Hule::isOpen(mianzi));
}

TEST(DecomposerTest, AllSequences)
{
  RegularHand const hand = decomposeRegular(makeInput("234m567m345p678p44s", "8p"));
  auto const &mianzi_list = hand.getMianziList();
  expectShunzi(mianzi_list[0u], "2m", false);
  expectShunzi(mianzi_list[1u], "5m", false);
  expectShunzi(mianzi_list[2u], "3p", false);
  expectShunzi(mianzi_list[3u], "6p", false);
  EXPECT_EQ(Hule::parseTile("4s"), hand.getQuetou().getTile());
  EXPECT_EQ(Hule::parseTile("8p"), hand.getHupai());
  EXPECT_EQ(Hule::Tingpai::liangmian, hand.getTingpai());
  EXPECT_EQ(0u, hand.getNumDeclared());
}

TEST(DecomposerTest, TripletBeforeSequence)
{
  RegularHand const hand = decomposeRegular(makeInput("111222333m456p77s", "7s"));
  auto const &mianzi_list = hand.getMianziList();
  expectKezi(mianzi_list[0u], "1m", false);
  expectKezi(mianzi_list[1u], "2m", false);
  expectKezi(mianzi_list[2u], "3m", false);
  expectShunzi(mianzi_list[3u], "4p", false);
  EXPECT_EQ(Hule::parseTile("7s"), hand.getQuetou().getTile());
  EXPECT_EQ(Hule::Tingpai::danqi, hand.getTingpai());
}

TEST(DecomposerTest, FirstPairInIndexOrder)
{
  // Both (11)(123)(444) and (44)(111)(234) are complete. The lower pair wins.
  RegularHand const hand = decomposeRegular(makeInput("11123444m456p789s", "4m"));
  EXPECT_EQ(Hule::parseTile("1m"), hand.getQuetou().getTile());
  auto const &mianzi_list = hand.getMianziList();
  expectShunzi(mianzi_list[0u], "1m", false);
  expectKezi(mianzi_list[1u], "4m", false);
  expectShunzi(mianzi_list[2u], "4p", false);
  expectShunzi(mianzi_list[3u], "7s", false);
  EXPECT_EQ(Hule::Tingpai::shuangpeng, hand.getTingpai());
}

TEST(DecomposerTest, DeclaredCallsComeFirst)
{
  HuleInput input = makeInput("234m567m1111z345p44s", "4s");
  input.angang_list.push_back(Hule::parseTile("1z"));
  input.fulu_list.emplace_back(Hule::Fulu::Type::chi, Hule::parseTile("5m"));
  input.player.menqian = false;

  RegularHand const hand = decomposeRegular(input);
  auto const &mianzi_list = hand.getMianziList();
  expectGangzi(mianzi_list[0u], "1z", false);
  expectShunzi(mianzi_list[1u], "5m", true);
  expectShunzi(mianzi_list[2u], "2m", false);
  expectShunzi(mianzi_list[3u], "3p", false);
  EXPECT_EQ(2u, hand.getNumDeclared());
  EXPECT_EQ(Hule::Tingpai::danqi, hand.getTingpai());
}

TEST(DecomposerTest, FourCalls)
{
  HuleInput input = makeInput("234m777z5555p1111s99m", "9m");
  input.angang_list.push_back(Hule::parseTile("1s"));
  input.fulu_list.emplace_back(Hule::Fulu::Type::chi, Hule::parseTile("2m"));
  input.fulu_list.emplace_back(Hule::Fulu::Type::peng, Hule::parseTile("7z"));
  input.fulu_list.emplace_back(Hule::Fulu::Type::minggang, Hule::parseTile("5p"));
  input.player.menqian = false;

  RegularHand const hand = decomposeRegular(input);
  auto const &mianzi_list = hand.getMianziList();
  expectGangzi(mianzi_list[0u], "1s", false);
  expectShunzi(mianzi_list[1u], "2m", true);
  expectKezi(mianzi_list[2u], "7z", true);
  expectGangzi(mianzi_list[3u], "5p", true);
  EXPECT_EQ(Hule::parseTile("9m"), hand.getQuetou().getTile());
  EXPECT_EQ(Hule::Tingpai::danqi, hand.getTingpai());
  EXPECT_EQ(4u, hand.getNumDeclared());
}

TEST(DecomposerTest, FourCallsWithoutPair)
{
  HuleInput input = makeInput("234m777z5555p1111s89m", "9m");
  input.angang_list.push_back(Hule::parseTile("1s"));
  input.fulu_list.emplace_back(Hule::Fulu::Type::chi, Hule::parseTile("2m"));
  input.fulu_list.emplace_back(Hule::Fulu::Type::peng, Hule::parseTile("7z"));
  input.fulu_list.emplace_back(Hule::Fulu::Type::minggang, Hule::parseTile("5p"));
  input.player.menqian = false;
  expectMissing(input, Hule::RejectReason::missing_quetou);
}

TEST(DecomposerTest, MissingCalls)
{
  HuleInput input = makeInput("234m567m345p678p44s", "8p");
  input.angang_list.push_back(Hule::parseTile("1z"));
  expectMissing(input, Hule::RejectReason::missing_angang);

  input = makeInput("234m567m345p678p44s", "8p");
  input.fulu_list.emplace_back(Hule::Fulu::Type::peng, Hule::parseTile("4s"));
  expectMissing(input, Hule::RejectReason::missing_peng);

  input = makeInput("234m567m345p678p44s", "8p");
  input.fulu_list.emplace_back(Hule::Fulu::Type::minggang, Hule::parseTile("4s"));
  expectMissing(input, Hule::RejectReason::missing_minggang);

  input = makeInput("234m567m345p678p44s", "8p");
  input.fulu_list.emplace_back(Hule::Fulu::Type::chi, Hule::parseTile("7p"));
  expectMissing(input, Hule::RejectReason::missing_chi);

  input = makeInput("234m567m345p678p44s", "8p");
  input.fulu_list.emplace_back(Hule::Fulu::Type::chi, Hule::parseTile("8p"));
  expectMissing(input, Hule::RejectReason::invalid_chi);

  input = makeInput("234m567m345p678p44s", "8p");
  input.fulu_list.emplace_back(Hule::Fulu::Type::chi, Hule::parseTile("1z"));
  expectMissing(input, Hule::RejectReason::invalid_chi);
}

TEST(DecomposerTest, SevenPairsIsIrregular)
{
  HuleInput const input = makeInput("1122m3344p5566s77z", "7z");
  Hule::Decomposition const decomposition = decompose(input);
  ASSERT_TRUE(std::holds_alternative<Hule::IrregularHand>(decomposition)) << decomposition;
  Hule::IrregularHand const &hand = std::get<Hule::IrregularHand>(decomposition);
  EXPECT_EQ(Hule::countTiles(input.tiles), hand.getCounts());
  EXPECT_EQ(Hule::parseTile("7z"), hand.getHupai());
}

TEST(DecomposerTest, ThirteenOrphansIsIrregular)
{
  HuleInput const input = makeInput("19m19p19s12345677z", "1m");
  EXPECT_TRUE(std::holds_alternative<Hule::IrregularHand>(decompose(input)));
}

TEST(DecomposerTest, SevenPairsThatAreAlsoRegular)
{
  // 112233m is also (123m)(123m).
  RegularHand const hand = decomposeRegular(makeInput("112233m445566p77s", "7s"));
  EXPECT_EQ(Hule::parseTile("7s"), hand.getQuetou().getTile());
  EXPECT_EQ(Hule::Tingpai::danqi, hand.getTingpai());
}

TEST(DecomposerTest, TilesAreConserved)
{
  for (char const *tiles : {
      "234m567m345p678p44s", "111222333m456p77s", "11123444m456p789s", "112233m445566p77s",
      "11123456789999m", "22233344455566s", "1112345678999p5p" }) {
    std::vector<Tile> const parsed = Hule::parseTiles(tiles);
    HuleInput const input{ parsed, parsed.front() };
    Hule::TileCounts const counts = Hule::countTiles(parsed);
    Hule::Decomposition const decomposition = Hule::decompose(input, counts);
    ASSERT_TRUE(std::holds_alternative<RegularHand>(decomposition)) << tiles;
    EXPECT_EQ(counts, std::get<RegularHand>(decomposition).getCounts()) << tiles;
  }
}

TEST(DecomposerTest, SearchLeavesCountsOnFailure)
{
  Hule::TileCounts counts = Hule::countTiles(Hule::parseTiles("12345m89p"));
  Hule::TileCounts const original = counts;
  std::vector<Hule::Mianzi> mianzi_list;
  EXPECT_FALSE(Hule::searchMianzi(counts, mianzi_list));
  EXPECT_EQ(original, counts);
  EXPECT_TRUE(mianzi_list.empty());

  counts = Hule::countTiles(Hule::parseTiles("123345m"));
  EXPECT_TRUE(Hule::searchMianzi(counts, mianzi_list));
  EXPECT_EQ(Hule::TileCounts{}, counts);
  EXPECT_EQ(2u, mianzi_list.size());
}

// Every triplet and sequence, for the exhaustive cross-check below.
std::vector<std::vector<std::uint_fast8_t>> getAllSets()
{
  std::vector<std::vector<std::uint_fast8_t>> result;
  for (std::uint_fast8_t i = 0u; i < Tile::num_kinds; ++i) {
    result.push_back({ i, i, i });
  }
  for (std::uint_fast8_t i = 0u; i < 27u; ++i) {
    if (i % 9u <= 6u) {
      result.push_back({ i, static_cast<std::uint_fast8_t>(i + 1u), static_cast<std::uint_fast8_t>(i + 2u) });
    }
  }
  return result;
}

// Tries every non-decreasing choice of sets, independently of the
// lowest-tile-first search.
bool enumerateSets(
  Hule::TileCounts &counts, std::size_t const num_sets, std::size_t const start,
  std::vector<std::vector<std::uint_fast8_t>> const &sets)
{
  if (num_sets == 0u) {
    for (std::uint_fast8_t const count : counts) {
      if (count != 0u) {
        return false;
      }
    }
    return true;
  }
  for (std::size_t i = start; i < sets.size(); ++i) {
    bool available = true;
    for (std::uint_fast8_t const index : sets[i]) {
      if (counts[index] == 0u) {
        available = false;
      }
      --counts[index];
    }
    bool const found = available && enumerateSets(counts, num_sets - 1u, i, sets);
    for (std::uint_fast8_t const index : sets[i]) {
      ++counts[index];
    }
    if (found) {
      return true;
    }
  }
  return false;
}

bool isRegularByEnumeration(Hule::TileCounts counts)
{
  static std::vector<std::vector<std::uint_fast8_t>> const sets = getAllSets();
  for (std::uint_fast8_t i = 0u; i < Tile::num_kinds; ++i) {
    if (counts[i] < 2u) {
      continue;
    }
    counts[i] -= 2u;
    bool const found = enumerateSets(counts, 4u, 0u, sets);
    counts[i] += 2u;
    if (found) {
      return true;
    }
  }
  return false;
}

std::vector<Tile> makeRandomHand(std::mt19937 &urng, bool const complete)
{
  static std::vector<std::vector<std::uint_fast8_t>> const sets = getAllSets();

  for (;;) {
    Hule::TileCounts counts{};
    std::vector<Tile> tiles;
    auto add = [&](std::uint_fast8_t const index) {
      ++counts[index];
      tiles.push_back(Tile::fromIndex(index));
    };

    if (complete) {
      std::uniform_int_distribution<std::size_t> set_dist(0u, sets.size() - 1u);
      for (std::uint_fast8_t i = 0u; i < 4u; ++i) {
        for (std::uint_fast8_t const index : sets[set_dist(urng)]) {
          add(index);
        }
      }
      std::uniform_int_distribution<unsigned> kind_dist(0u, Tile::num_kinds - 1u);
      std::uint_fast8_t const pair = kind_dist(urng);
      add(pair);
      add(pair);
    }
    else {
      // Random tiles from one or two suits give more near-complete hands.
      std::uniform_int_distribution<unsigned> kind_dist(0u, 17u);
      for (std::uint_fast8_t i = 0u; i < 14u; ++i) {
        add(kind_dist(urng));
      }
    }

    bool valid = true;
    for (std::uint_fast8_t const count : counts) {
      if (count > 4u) {
        valid = false;
      }
    }
    if (valid) {
      return tiles;
    }
  }
}

TEST(DecomposerTest, AgreesWithExhaustiveEnumeration)
{
  std::mt19937 urng(20240601u);
  unsigned num_regular = 0u;
  for (unsigned i = 0u; i < 2000u; ++i) {
    std::vector<Tile> const tiles = makeRandomHand(urng, i % 2u == 0u);
    HuleInput const input{ tiles, tiles.front() };
    Hule::TileCounts const counts = Hule::countTiles(tiles);

    bool const expected = isRegularByEnumeration(counts);
    Hule::Decomposition const decomposition = Hule::decompose(input, counts);
    bool const regular = std::holds_alternative<RegularHand>(decomposition);
    EXPECT_EQ(expected, regular) << decomposition;
    if (regular) {
      EXPECT_EQ(counts, std::get<RegularHand>(decomposition).getCounts()) << decomposition;
      ++num_regular;
    }
  }
  EXPECT_GE(num_regular, 1000u);
}

} // namespace `anonymous`
