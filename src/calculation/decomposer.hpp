#if !defined(HULE_CALCULATION_DECOMPOSER_HPP_INCLUDE_GUARD)
#define HULE_CALCULATION_DECOMPOSER_HPP_INCLUDE_GUARD

#include "calculation/hand.hpp"
#include "calculation/hule_input.hpp"
#include "calculation/mianzi.hpp"
#include "calculation/tile.hpp"
#include <vector>


namespace Hule{

// Searches `counts` for sets only, by scanning from the lowest tile kind and
// trying a triplet before a sequence. On success `counts` is left empty and
// the sets are appended to `mianzi_list` in the order found. On failure both
// are left as they were.
bool searchMianzi(TileCounts &counts, std::vector<Mianzi> &mianzi_list);

// Groups the hand of a validated input. The declared calls are taken out
// first, then the pair kinds are tried in index order and the first one for
// which the rest splits into sets wins. A hand with no such split comes back
// as an `IrregularHand` holding `counts`.
//
// Throws `InvalidHule` when a declared call is not in the hand, or when four
// calls leave no pair. `counts` is `countTiles(input.tiles)`.
Decomposition decompose(HuleInput const &input, TileCounts const &counts);

} // namespace Hule

#endif // !defined(HULE_CALCULATION_DECOMPOSER_HPP_INCLUDE_GUARD)
