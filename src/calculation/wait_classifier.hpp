#if !defined(HULE_CALCULATION_WAIT_CLASSIFIER_HPP_INCLUDE_GUARD)
#define HULE_CALCULATION_WAIT_CLASSIFIER_HPP_INCLUDE_GUARD

#include "calculation/mianzi.hpp"
#include "calculation/tile.hpp"
#include <array>


namespace Hule{

// Classifies how `hupai` completed a four-sets-and-a-pair hand. The pair is
// checked first, then the sets in the order of `mianzi_list` (declared calls
// first). The first set holding `hupai` decides.
//
// Throws `std::logic_error` if neither the pair nor any set contains `hupai`.
Tingpai classifyTingpai(std::array<Mianzi, 4u> const &mianzi_list, Quetou quetou, Tile hupai);

} // namespace Hule

#endif // !defined(HULE_CALCULATION_WAIT_CLASSIFIER_HPP_INCLUDE_GUARD)
