#include "calculation/pattern.hpp"

#include "common/throw.hpp"
#include <ostream>
#include <string_view>
#include <array>
#include <functional>
#include <stdexcept>
#include <cstdint>


namespace{

using std::placeholders::_1;
using Hule::Pattern;

struct PatternEntry
{
  Pattern pattern;
  char const *name;
  std::uint_fast8_t menqian_fan;
  std::uint_fast8_t open_fan;
  std::uint_fast8_t yakuman;
}; // struct PatternEntry

constexpr std::array<PatternEntry, Hule::num_patterns> pattern_table{{
  { Pattern::lizhi,                      "lizhi",                      1u, 1u, 0u },
  { Pattern::yifa,                       "yifa",                       1u, 1u, 0u },
  { Pattern::menqian_zimo,               "menqian_zimo",               1u, 1u, 0u },
  { Pattern::pinghe,                     "pinghe",                     1u, 1u, 0u },
  { Pattern::yibeikou,                   "yibeikou",                   1u, 1u, 0u },
  { Pattern::haidi_moyue,                "haidi_moyue",                1u, 1u, 0u },
  { Pattern::hedi_laoyu,                 "hedi_laoyu",                 1u, 1u, 0u },
  { Pattern::lingshang_kaihua,           "lingshang_kaihua",           1u, 1u, 0u },
  { Pattern::qianggang,                  "qianggang",                  1u, 1u, 0u },
  { Pattern::duanyaojiu,                 "duanyaojiu",                 1u, 1u, 0u },
  { Pattern::zifeng,                     "zifeng",                     1u, 1u, 0u },
  { Pattern::changfeng,                  "changfeng",                  1u, 1u, 0u },
  { Pattern::sanyuanpai,                 "sanyuanpai",                 1u, 1u, 0u },

  { Pattern::double_lizhi,               "double_lizhi",               2u, 2u, 0u },
  { Pattern::qiduizi,                    "qiduizi",                    2u, 2u, 0u },
  { Pattern::sanse_tongshun,             "sanse_tongshun",             2u, 1u, 0u },
  { Pattern::yiqi_tongguan,              "yiqi_tongguan",              2u, 1u, 0u },
  { Pattern::hunquandaiyaojiu,           "hunquandaiyaojiu",           2u, 1u, 0u },
  { Pattern::duiduihu,                   "duiduihu",                   2u, 2u, 0u },
  { Pattern::sananke,                    "sananke",                    2u, 2u, 0u },
  { Pattern::sanse_tongke,               "sanse_tongke",               2u, 2u, 0u },
  { Pattern::sangangzi,                  "sangangzi",                  2u, 2u, 0u },
  { Pattern::xiaosanyuan,                "xiaosanyuan",                2u, 2u, 0u },
  { Pattern::hunlaotou,                  "hunlaotou",                  2u, 2u, 0u },

  { Pattern::erbeikou,                   "erbeikou",                   3u, 3u, 0u },
  { Pattern::chunquandaiyaojiu,          "chunquandaiyaojiu",          3u, 2u, 0u },
  { Pattern::hunyise,                    "hunyise",                    3u, 2u, 0u },

  { Pattern::qingyise,                   "qingyise",                   6u, 5u, 0u },

  { Pattern::tianhu,                     "tianhu",                     0u, 0u, 1u },
  { Pattern::dihu,                       "dihu",                       0u, 0u, 1u },
  { Pattern::renhu,                      "renhu",                      0u, 0u, 1u },
  { Pattern::dasanyuan,                  "dasanyuan",                  0u, 0u, 1u },
  { Pattern::sianke,                     "sianke",                     0u, 0u, 1u },
  { Pattern::dasixi,                     "dasixi",                     0u, 0u, 1u },
  { Pattern::xiaosixi,                   "xiaosixi",                   0u, 0u, 1u },
  { Pattern::ziyise,                     "ziyise",                     0u, 0u, 1u },
  { Pattern::qinglaotou,                 "qinglaotou",                 0u, 0u, 1u },
  { Pattern::lvyise,                     "lvyise",                     0u, 0u, 1u },
  { Pattern::sigangzi,                   "sigangzi",                   0u, 0u, 1u },
  { Pattern::guoshi_wushuang,            "guoshi_wushuang",            0u, 0u, 1u },
  { Pattern::jiulian_baodeng,            "jiulian_baodeng",            0u, 0u, 1u },

  { Pattern::sianke_danqi,               "sianke_danqi",               0u, 0u, 2u },
  { Pattern::guoshi_wushuang_shisanmian, "guoshi_wushuang_shisanmian", 0u, 0u, 2u },
  { Pattern::chunzheng_jiulian_baodeng,  "chunzheng_jiulian_baodeng",  0u, 0u, 2u },

  { Pattern::dora,                       "dora",                       1u, 1u, 0u },
  { Pattern::lidora,                     "lidora",                     1u, 1u, 0u },
  { Pattern::hongbaopai,                 "hongbaopai",                 1u, 1u, 0u },
}};

constexpr bool isTableInOrder() noexcept
{
  for (std::uint_fast8_t i = 0u; i < pattern_table.size(); ++i) {
    if (static_cast<std::uint_fast8_t>(pattern_table[i].pattern) != i) {
      return false;
    }
  }
  return true;
}

static_assert(isTableInOrder());

PatternEntry const &getEntry(Pattern const pattern) noexcept
{
  return pattern_table[static_cast<std::uint_fast8_t>(pattern)];
}

} // namespace `anonymous`

namespace Hule{

std::uint_fast8_t getFan(Pattern const pattern, bool const menqian) noexcept
{
  PatternEntry const &entry = getEntry(pattern);
  return menqian ? entry.menqian_fan : entry.open_fan;
}

std::uint_fast8_t getYakumanMultiplier(Pattern const pattern) noexcept
{
  return getEntry(pattern).yakuman;
}

bool isBonusPattern(Pattern const pattern) noexcept
{
  return pattern == Pattern::dora || pattern == Pattern::lidora || pattern == Pattern::hongbaopai;
}

char const *getPatternName(Pattern const pattern) noexcept
{
  return getEntry(pattern).name;
}

Pattern parsePattern(std::string_view const name)
{
  for (PatternEntry const &entry : pattern_table) {
    if (name == entry.name) {
      return entry.pattern;
    }
  }
  HULE_THROW<std::invalid_argument>(_1) << name << ": An unknown pattern.";
}

std::ostream &operator<<(std::ostream &os, Pattern const pattern)
{
  return os << getPatternName(pattern);
}

} // namespace Hule
