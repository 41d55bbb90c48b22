#include "calculation/hule.hpp"

#include "calculation/score_calculator.hpp"
#include "calculation/decomposer.hpp"
#include "calculation/validator.hpp"
#include "calculation/invalid_hule.hpp"
#include "calculation/pattern_recognizer.hpp"
#include "calculation/hand.hpp"
#include "calculation/hule_input.hpp"
#include "calculation/tile.hpp"
#include "common/throw.hpp"
#include <functional>


namespace{

using std::placeholders::_1;

} // namespace `anonymous`

namespace Hule{

ScoreResult calculateHule(HuleInput const &input, PatternRecognizer const &recognizer)
{
  TileCounts const counts = countTiles(input.tiles);
  validateHuleInput(input, counts);

  Decomposition const decomposition = decompose(input, counts);

  Recognition const recognition = recognizer.recognize(decomposition, input);
  if (recognition.patterns.empty()) {
    HULE_THROW<InvalidHule>(RejectReason::no_pattern, _1)
      << decomposition << ": No pattern applies to the hand.";
  }

  return calculateScore(recognition, decomposition, input);
}

} // namespace Hule
