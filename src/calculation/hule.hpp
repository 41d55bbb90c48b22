#if !defined(HULE_CALCULATION_HULE_HPP_INCLUDE_GUARD)
#define HULE_CALCULATION_HULE_HPP_INCLUDE_GUARD

#include "calculation/score_calculator.hpp"
#include "calculation/pattern_recognizer.hpp"
#include "calculation/hule_input.hpp"


namespace Hule{

// Scores a declared winning hand. Throws `InvalidHule` if the input is
// rejected or no pattern applies to the hand.
ScoreResult calculateHule(HuleInput const &input, PatternRecognizer const &recognizer);

} // namespace Hule

#endif // !defined(HULE_CALCULATION_HULE_HPP_INCLUDE_GUARD)
