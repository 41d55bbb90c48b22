#if !defined(HULE_PYTHON_CONVERSION_HPP_INCLUDE_GUARD)
#define HULE_PYTHON_CONVERSION_HPP_INCLUDE_GUARD

#include "calculation/score_calculator.hpp"
#include "calculation/pattern_recognizer.hpp"
#include "calculation/hand.hpp"
#include "calculation/hule_input.hpp"
#include "calculation/tile.hpp"
#include <boost/python/dict.hpp>
#include <boost/python/object.hpp>
#include <vector>


namespace Hule{

// The GIL must be held by the caller of every function below.

// Accepts
//
//   {
//     'tiles': '234m567m345p678p44s',    # or ['2m', '3m', ...]
//     'winning_tile': '8p',
//     'fulu': [('chi', '2m'), ('peng', '7z'), ('minggang', '5p')],
//     'angang': ['1z'],
//     'player': { 'zifeng': 'nan', 'zhuangjia': False, 'lizhi': True, ... },
//     'game': { 'changfeng': 'dong', 'benchang': 1, 'dora_indicators': '3m', ... },
//     'win_method': 'zimo',              # or 'rong'
//   }
//
// Omitted keys take their defaults. Throws `std::invalid_argument` for a
// malformed value.
HuleInput toHuleInput(boost::python::dict input);

// A compact string such as `123m44z`, or a list of tile strings.
std::vector<Tile> toTiles(boost::python::object tiles, char const *key);

boost::python::dict toPython(Decomposition const &decomposition);

// Accepts `(patterns, num_hongbaopai)` where `patterns` is a list of pattern
// names.
Recognition toRecognition(boost::python::object recognition);

boost::python::dict toPython(ScoreResult const &result);

} // namespace Hule

#endif // !defined(HULE_PYTHON_CONVERSION_HPP_INCLUDE_GUARD)
