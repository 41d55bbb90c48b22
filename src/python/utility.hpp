#if !defined(HULE_PYTHON_UTILITY_HPP_INCLUDE_GUARD)
#define HULE_PYTHON_UTILITY_HPP_INCLUDE_GUARD


namespace Hule{

// Must be called from a handler of `boost::python::error_already_set`. Fetches
// the pending Python exception and rethrows it as `std::runtime_error`
// carrying the formatted traceback.
[[noreturn]] void translatePythonException();

} // namespace Hule

#endif // !defined(HULE_PYTHON_UTILITY_HPP_INCLUDE_GUARD)
