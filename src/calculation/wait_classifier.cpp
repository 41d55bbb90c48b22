#include "calculation/wait_classifier.hpp"

#include "calculation/mianzi.hpp"
#include "calculation/tile.hpp"
#include "common/throw.hpp"
#include <variant>
#include <array>
#include <functional>
#include <stdexcept>
#include <cstdint>


namespace{

using std::placeholders::_1;

Hule::Tingpai classifyShunzi(Hule::Shunzi const &shunzi, Hule::Tile const hupai)
{
  using Hule::Tingpai;

  if (hupai == shunzi.getMiddle()) {
    return Tingpai::kanzhang;
  }
  if (hupai == shunzi.getFirst()) {
    // 89 waiting on 7.
    return shunzi.getLast().getRank() == 9u ? Tingpai::bianzhang : Tingpai::liangmian;
  }
  // 12 waiting on 3.
  return shunzi.getFirst().getRank() == 1u ? Tingpai::bianzhang : Tingpai::liangmian;
}

Hule::Tingpai classifyMianzi(Hule::Mianzi const &mianzi, Hule::Tile const hupai)
{
  if (Hule::Shunzi const *p = std::get_if<Hule::Shunzi>(&mianzi)) {
    return classifyShunzi(*p, hupai);
  }
  return Hule::Tingpai::shuangpeng;
}

} // namespace `anonymous`

namespace Hule{

Tingpai classifyTingpai(
  std::array<Mianzi, 4u> const &mianzi_list, Quetou const quetou, Tile const hupai)
{
  if (hupai == quetou.getTile()) {
    return Tingpai::danqi;
  }

  for (Mianzi const &mianzi : mianzi_list) {
    if (contains(mianzi, hupai)) {
      return classifyMianzi(mianzi, hupai);
    }
  }

  HULE_THROW<std::logic_error>(_1)
    << hupai << ": The winning tile is in neither the pair nor any set.";
}

} // namespace Hule
