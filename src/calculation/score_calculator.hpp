#if !defined(HULE_CALCULATION_SCORE_CALCULATOR_HPP_INCLUDE_GUARD)
#define HULE_CALCULATION_SCORE_CALCULATOR_HPP_INCLUDE_GUARD

#include "calculation/pattern_recognizer.hpp"
#include "calculation/pattern.hpp"
#include "calculation/hand.hpp"
#include "calculation/hule_input.hpp"
#include <iosfwd>
#include <vector>
#include <utility>
#include <cstdint>


namespace Hule{

enum struct LimitTier : std::uint_fast8_t
{
  none,
  manguan,      // 満貫
  tiaoman,      // 跳満
  beiman,       // 倍満
  sanbeiman,    // 三倍満
  shuyi_yiman,  // 数え役満
  yiman,        // 役満
  double_yiman, // 二倍以上の役満
}; // enum struct LimitTier

char const *getLimitTierName(LimitTier tier) noexcept;

std::ostream &operator<<(std::ostream &os, LimitTier tier);

struct ScoreResult
{
  std::uint_fast8_t fan = 0u;
  std::uint_fast8_t fu = 0u;
  std::vector<Pattern> patterns{};
  std::uint_fast8_t num_hongbaopai = 0u;
  LimitTier limit_tier = LimitTier::none;

  // For `zimo` by the dealer, what each of the other three pays. For `zimo`
  // by a non-dealer, what each non-dealer pays. For `rong`, the total.
  std::int_fast32_t base_payment = 0;
  std::int_fast32_t zhuangjia_payment = 0;
  std::int_fast32_t sanjia_payment = 0;
  // Including the `benchang` bonus. The `lizhi` deposits are not included.
  std::int_fast32_t total_payment = 0;
  std::int_fast32_t lizhi_deposit_points = 0;
}; // struct ScoreResult

std::uint_fast8_t calculateFan(std::vector<Pattern> const &patterns, bool menqian) noexcept;

// Counts a double top-tier pattern twice.
std::uint_fast8_t countYakuman(std::vector<Pattern> const &patterns) noexcept;

// 符. Rounded up to a multiple of 10 except for seven pairs (25).
std::uint_fast8_t calculateFu(
  Decomposition const &decomposition, std::vector<Pattern> const &patterns,
  HuleInput const &input);

// 基本点. Returns the basic points and the limit tier they reached.
std::pair<std::int_fast32_t, LimitTier> calculateBasicPoints(std::uint_fast8_t fan, std::uint_fast8_t fu) noexcept;

std::int_fast32_t roundUpTo100(std::int_fast32_t points) noexcept;

ScoreResult calculateScore(
  Recognition const &recognition, Decomposition const &decomposition, HuleInput const &input);

} // namespace Hule

#endif // !defined(HULE_CALCULATION_SCORE_CALCULATOR_HPP_INCLUDE_GUARD)
