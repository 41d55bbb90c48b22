#define PY_SSIZE_T_CLEAN
#include "python/python_recognizer.hpp"

#include "python/conversion.hpp"
#include "python/utility.hpp"
#include "python/gil.hpp"
#include "calculation/pattern_recognizer.hpp"
#include "calculation/hand.hpp"
#include "calculation/hule_input.hpp"
#include "common/throw.hpp"
#include <boost/python/dict.hpp>
#include <boost/python/object.hpp>
#include <boost/python/errors.hpp>
#include <Python.h>
#include <exception>
#include <stdexcept>


namespace{

namespace python = boost::python;

} // namespace `anonymous`

namespace Hule{

PythonRecognizer::PythonRecognizer(python::object recognizer, python::dict input)
  : recognizer_(recognizer),
    input_(input)
{
  if (recognizer_.is_none()) {
    HULE_THROW<std::invalid_argument>("`recognizer` must not be `None`.");
  }
}

Recognition PythonRecognizer::recognize(Decomposition const &decomposition, HuleInput const &) const
try {
  Hule::GIL::RecursiveLock gil_lock;
  python::object result = recognizer_.attr("recognize")(toPython(decomposition), input_);
  return toRecognition(result);
}
catch (std::exception const &) {
  throw;
}
catch (python::error_already_set const &) {
  Hule::translatePythonException();
}
catch (...) {
  std::terminate();
}

} // namespace Hule
