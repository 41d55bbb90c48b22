#if !defined(HULE_PYTHON_GIL_HPP_INCLUDE_GUARD)
#define HULE_PYTHON_GIL_HPP_INCLUDE_GUARD

#define PY_SSIZE_T_CLEAN
#include <Python.h>


namespace Hule::GIL{

// Holds the GIL while a recognizer or the Python error machinery is called
// from a thread that may have released it. Nesting is allowed.
class RecursiveLock
{
public:
  RecursiveLock();

  RecursiveLock(RecursiveLock const &) = delete;

  ~RecursiveLock();

  RecursiveLock &operator=(RecursiveLock const &) = delete;

private:
  PyGILState_STATE state_;
}; // class RecursiveLock

// Releases the GIL, if held, while the calculation runs.
class RecursiveRelease
{
public:
  RecursiveRelease();

  RecursiveRelease(RecursiveRelease const &) = delete;

  ~RecursiveRelease();

  RecursiveRelease &operator=(RecursiveRelease const &) = delete;

private:
  PyThreadState *save_;
}; // class RecursiveRelease

} // namespace Hule::GIL

#endif // !defined(HULE_PYTHON_GIL_HPP_INCLUDE_GUARD)
