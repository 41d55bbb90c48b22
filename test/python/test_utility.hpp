#if !defined(HULE_TEST_PYTHON_TEST_UTILITY_HPP_INCLUDE_GUARD)
#define HULE_TEST_PYTHON_TEST_UTILITY_HPP_INCLUDE_GUARD

#define PY_SSIZE_T_CLEAN
#include <boost/python/import.hpp>
#include <boost/python/exec.hpp>
#include <boost/python/extract.hpp>
#include <boost/python/handle.hpp>
#include <boost/python/str.hpp>
#include <boost/python/object.hpp>
#include <boost/python/errors.hpp>
#include <gtest/gtest.h>
#include <Python.h>
#include <string>
#include <utility>


// Defined by `BOOST_PYTHON_MODULE(_hule)`.
extern "C" PyObject *PyInit__hule();

namespace Hule::Test{

// Starts an embedded interpreter with `_hule` as a built-in module. The
// interpreter lives until the process exits, and the calling thread keeps the
// GIL.
inline void initializeInterpreter()
{
  if (Py_IsInitialized() == 0) {
    if (PyImport_AppendInittab("_hule", &PyInit__hule) == -1) {
      FAIL() << "Failed to register `_hule`.";
    }
    Py_Initialize();
  }
}

class PythonTest
  : public ::testing::Test
{
protected:
  static void SetUpTestSuite()
  {
    initializeInterpreter();
  }
}; // class PythonTest

inline boost::python::object getMainNamespace()
{
  return boost::python::import("__main__").attr("__dict__");
}

inline boost::python::object evaluate(char const *expression)
{
  return boost::python::eval(expression, getMainNamespace());
}

inline void execute(char const *code)
{
  boost::python::exec(code, getMainNamespace());
}

struct PythonError
{
  boost::python::object type{};
  std::string message{};
}; // struct PythonError

// Takes the pending Python exception out of the interpreter.
inline PythonError fetchPythonError()
{
  namespace python = boost::python;

  PyObject *p_type = nullptr;
  PyObject *p_value = nullptr;
  PyObject *p_traceback = nullptr;
  PyErr_Fetch(&p_type, &p_value, &p_traceback);
  PyErr_NormalizeException(&p_type, &p_value, &p_traceback);

  python::object type{ python::handle<>(p_type) };
  python::object value{ python::handle<>(python::allow_null(p_value)) };
  python::handle<> traceback(python::allow_null(p_traceback));
  std::string message = python::extract<std::string>(python::str(value))();
  return { std::move(type), std::move(message) };
}

template<typename F>
PythonError catchPythonError(F &&f)
{
  try {
    std::forward<F>(f)();
  }
  catch (boost::python::error_already_set const &) {
    return fetchPythonError();
  }
  ADD_FAILURE() << "No Python exception is raised.";
  return {};
}

inline bool isInstanceOf(PythonError const &error, PyObject *type)
{
  return error.type.ptr() != nullptr && PyErr_GivenExceptionMatches(error.type.ptr(), type) != 0;
}

inline bool startsWith(std::string const &str, std::string const &prefix)
{
  return str.rfind(prefix, 0u) == 0u;
}

} // namespace Hule::Test

#endif // !defined(HULE_TEST_PYTHON_TEST_UTILITY_HPP_INCLUDE_GUARD)
