#define PY_SSIZE_T_CLEAN
#include "python/gil.hpp"

#include <Python.h>


namespace Hule::GIL{

RecursiveLock::RecursiveLock()
  : state_(PyGILState_Ensure())
{}

RecursiveLock::~RecursiveLock()
{
  PyGILState_Release(state_);
}

RecursiveRelease::RecursiveRelease()
  : save_(PyGILState_Check() != 0 ? PyEval_SaveThread() : nullptr)
{}

RecursiveRelease::~RecursiveRelease()
{
  if (save_ != nullptr) {
    PyEval_RestoreThread(save_);
  }
}

} // namespace Hule::GIL
