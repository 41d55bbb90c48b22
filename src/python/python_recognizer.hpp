#if !defined(HULE_PYTHON_PYTHON_RECOGNIZER_HPP_INCLUDE_GUARD)
#define HULE_PYTHON_PYTHON_RECOGNIZER_HPP_INCLUDE_GUARD

#include "calculation/pattern_recognizer.hpp"
#include "calculation/hand.hpp"
#include "calculation/hule_input.hpp"
#include <boost/python/dict.hpp>
#include <boost/python/object.hpp>


namespace Hule{

// Delegates to a Python object with a method
// `recognize(decomposition: dict, input: dict) -> (list[str], int)`. The GIL
// must be held when an instance is constructed or destroyed, but not when
// `recognize` is called.
class PythonRecognizer
  : public PatternRecognizer
{
public:
  PythonRecognizer(boost::python::object recognizer, boost::python::dict input);

  Recognition recognize(Decomposition const &decomposition, HuleInput const &input) const override;

private:
  boost::python::object recognizer_;
  boost::python::dict input_;
}; // class PythonRecognizer

} // namespace Hule

#endif // !defined(HULE_PYTHON_PYTHON_RECOGNIZER_HPP_INCLUDE_GUARD)
