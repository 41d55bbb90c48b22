#if !defined(HULE_CALCULATION_VALIDATOR_HPP_INCLUDE_GUARD)
#define HULE_CALCULATION_VALIDATOR_HPP_INCLUDE_GUARD

#include "calculation/hule_input.hpp"
#include "calculation/tile.hpp"


namespace Hule{

// Throws `InvalidHule` with the reason of the first failing check. The
// declared flags are checked before the composition of the hand. `counts` is
// `countTiles(input.tiles)`.
void validateHuleInput(HuleInput const &input, TileCounts const &counts);

} // namespace Hule

#endif // !defined(HULE_CALCULATION_VALIDATOR_HPP_INCLUDE_GUARD)
