#if !defined(HULE_CALCULATION_PATTERN_HPP_INCLUDE_GUARD)
#define HULE_CALCULATION_PATTERN_HPP_INCLUDE_GUARD

#include <iosfwd>
#include <string_view>
#include <cstdint>


namespace Hule{

// 役
enum struct Pattern : std::uint_fast8_t
{
  // 1 翻
  lizhi = 0u,
  yifa,
  menqian_zimo,
  pinghe,
  yibeikou,
  haidi_moyue,
  hedi_laoyu,
  lingshang_kaihua,
  qianggang,
  duanyaojiu,
  zifeng,     // 役牌 自風
  changfeng,  // 役牌 場風
  sanyuanpai, // 役牌 三元牌

  // 2 翻
  double_lizhi,
  qiduizi,
  sanse_tongshun,
  yiqi_tongguan,
  hunquandaiyaojiu,
  duiduihu,
  sananke,
  sanse_tongke,
  sangangzi,
  xiaosanyuan,
  hunlaotou,

  // 3 翻
  erbeikou,
  chunquandaiyaojiu,
  hunyise,

  // 6 翻
  qingyise,

  // 役満
  tianhu,
  dihu,
  renhu,
  dasanyuan,
  sianke,
  dasixi,
  xiaosixi,
  ziyise,
  qinglaotou,
  lvyise,
  sigangzi,
  guoshi_wushuang,
  jiulian_baodeng,

  // ダブル役満
  sianke_danqi,
  guoshi_wushuang_shisanmian,
  chunzheng_jiulian_baodeng,

  // ドラ. One entry for each bonus tile.
  dora,
  lidora,
  hongbaopai,
}; // enum struct Pattern

inline constexpr std::uint_fast8_t num_patterns = static_cast<std::uint_fast8_t>(Pattern::hongbaopai) + 1u;

// The han of `pattern`, reduced for an open hand where the rules say so.
// Top-tier patterns are worth 0 here.
std::uint_fast8_t getFan(Pattern pattern, bool menqian) noexcept;

// 1 for a top-tier pattern, 2 for a double one, 0 otherwise.
std::uint_fast8_t getYakumanMultiplier(Pattern pattern) noexcept;

bool isBonusPattern(Pattern pattern) noexcept;

char const *getPatternName(Pattern pattern) noexcept;

// Inverse of `getPatternName`. Throws `std::invalid_argument` for an unknown
// name.
Pattern parsePattern(std::string_view name);

std::ostream &operator<<(std::ostream &os, Pattern pattern);

} // namespace Hule

#endif // !defined(HULE_CALCULATION_PATTERN_HPP_INCLUDE_GUARD)
