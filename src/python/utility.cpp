#define PY_SSIZE_T_CLEAN
#include "python/utility.hpp"

#include "python/gil.hpp"
#include "common/assert.hpp"
#include "common/throw.hpp"
#include <boost/python/import.hpp>
#include <boost/python/extract.hpp>
#include <boost/python/handle.hpp>
#include <boost/python/str.hpp>
#include <boost/python/object.hpp>
#include <boost/python/errors.hpp>
#include <Python.h>
#include <string>
#include <tuple>
#include <stdexcept>
#include <exception>


namespace{

namespace python = boost::python;

} // namespace `anonymous`

namespace Hule{

void translatePythonException()
{
  std::exception_ptr const p = std::current_exception();
  if (!p) {
    HULE_THROW<std::logic_error>("No exception.");
  }

  try {
    std::rethrow_exception(p);
  }
  catch (python::error_already_set const &) {
    Hule::GIL::RecursiveLock gil_lock;

    auto const [type, value, traceback] = []() {
      PyObject *p_type = nullptr;
      PyObject *p_value = nullptr;
      PyObject *p_traceback = nullptr;
      PyErr_Fetch(&p_type, &p_value, &p_traceback);
      PyErr_NormalizeException(&p_type, &p_value, &p_traceback);

      python::object type{ python::handle<>(p_type) };

      python::object value;
      if (p_value != nullptr) {
        value = python::object{ python::handle<>(p_value) };
      }

      python::object traceback;
      if (p_traceback != nullptr) {
        traceback = python::object{ python::handle<>(p_traceback) };
      }

      return std::tuple(type, value, traceback);
    }();

    python::object m = python::import("traceback");
    python::object o = m.attr("format_exception")(type, value, traceback);
    o = python::str("").attr("join")(o);
    python::extract<std::string> str(o);
    HULE_ASSERT((str.check()));
    HULE_THROW<std::runtime_error>(str());
  }
}

} // namespace Hule
