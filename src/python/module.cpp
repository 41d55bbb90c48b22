#define PY_SSIZE_T_CLEAN
#include "python/python_recognizer.hpp"
#include "python/conversion.hpp"
#include "python/utility.hpp"
#include "python/gil.hpp"
#include "calculation/hule.hpp"
#include "calculation/score_calculator.hpp"
#include "calculation/invalid_hule.hpp"
#include "calculation/hule_input.hpp"
#include "calculation/tile.hpp"
#include "common/throw.hpp"
#include <boost/python/module.hpp>
#include <boost/python/def.hpp>
#include <boost/python/extract.hpp>
#include <boost/python/dict.hpp>
#include <boost/python/list.hpp>
#include <boost/python/str.hpp>
#include <boost/python/object.hpp>
#include <boost/python/errors.hpp>
#include <Python.h>
#include <iostream>
#include <string>
#include <functional>
#include <stdexcept>
#include <exception>


namespace{

using std::placeholders::_1;
namespace python = boost::python;

python::dict calculate(python::dict input, python::object recognizer)
try {
  if (PyGILState_Check() == 0) {
    HULE_THROW<std::runtime_error>("GIL must be held.");
  }

  Hule::HuleInput const hule_input = Hule::toHuleInput(input);
  Hule::PythonRecognizer const python_recognizer(recognizer, input);
  Hule::ScoreResult const result = [&]() {
    Hule::GIL::RecursiveRelease gil_release;
    return Hule::calculateHule(hule_input, python_recognizer);
  }();
  return Hule::toPython(result);
}
catch (Hule::InvalidHule const &) {
  throw;
}
catch (std::exception const &e) {
  std::cerr << e.what() << std::endl;
  throw;
}
catch (python::error_already_set const &) {
  Hule::translatePythonException();
}
catch (...) {
  std::terminate();
}

python::list parseTiles(python::str tiles)
try {
  python::extract<std::string> str(tiles);
  if (!str.check()) {
    HULE_THROW<std::invalid_argument>("`tiles` must be a string.");
  }

  python::list result;
  for (Hule::Tile const tile : Hule::parseTiles(str())) {
    result.append(static_cast<long>(tile.getIndex()));
  }
  return result;
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

// For recognizers written in Python. `tiles` and `indicators` are in the same
// forms as `tiles` of `calculate`.
long countDora(python::object tiles, python::object indicators)
try {
  Hule::TileCounts const counts = Hule::countTiles(Hule::toTiles(tiles, "tiles"));
  return Hule::countDora(counts, Hule::toTiles(indicators, "indicators"));
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

std::string getDoraFromIndicator(std::string const &indicator)
{
  return Hule::getDoraFromIndicator(Hule::parseTile(indicator)).toString();
}

} // namespace `anonymous`

BOOST_PYTHON_MODULE(_hule)
{
  boost::python::def("calculate", &calculate);
  boost::python::def("parse_tiles", &parseTiles);
  boost::python::def("count_dora", &countDora);
  boost::python::def("dora_from_indicator", &getDoraFromIndicator);
}
