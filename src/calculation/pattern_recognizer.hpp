#if !defined(HULE_CALCULATION_PATTERN_RECOGNIZER_HPP_INCLUDE_GUARD)
#define HULE_CALCULATION_PATTERN_RECOGNIZER_HPP_INCLUDE_GUARD

#include "calculation/pattern.hpp"
#include "calculation/hand.hpp"
#include "calculation/hule_input.hpp"
#include <vector>
#include <cstdint>


namespace Hule{

struct Recognition
{
  // One entry for each occurrence, e.g. two `dora` for two bonus tiles.
  std::vector<Pattern> patterns{};
  std::uint_fast8_t num_hongbaopai = 0u;
}; // struct Recognition

// 役判定. An empty pattern list means no pattern applies, which makes the hand
// invalid.
class PatternRecognizer
{
protected:
  PatternRecognizer() = default;

public:
  PatternRecognizer(PatternRecognizer const &) = delete;

  PatternRecognizer &operator=(PatternRecognizer const &) = delete;

  virtual ~PatternRecognizer() = default;

  virtual Recognition recognize(Decomposition const &decomposition, HuleInput const &input) const = 0;
}; // class PatternRecognizer

} // namespace Hule

#endif // !defined(HULE_CALCULATION_PATTERN_RECOGNIZER_HPP_INCLUDE_GUARD)
