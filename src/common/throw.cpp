#include "common/throw.hpp"

#include <boost/exception/get_error_info.hpp>
#include <boost/exception/exception.hpp>
#include <boost/stacktrace/frame.hpp>
#include <boost/stacktrace/stacktrace.hpp>
#include <iostream>
#include <vector>
#include <string>
#include <memory>
#include <typeinfo>
#include <exception>
#include <cstdlib>
#include <cxxabi.h>


#if defined(HULE_WITH_COVERAGE)

extern "C" void __gcov_dump();

#endif // defined(HULE_WITH_COVERAGE)

namespace Hule::Detail_{

namespace{

std::string getTypeName(std::type_info const &ti)
{
  char const * const name = ti.name();
  int status = -1;
  std::unique_ptr<char, void (*)(void *)> p(
    abi::__cxa_demangle(name, nullptr, nullptr, &status), std::free);
  return { status == 0 ? p.get() : name };
}

[[noreturn]] void abort_() noexcept
{
#if defined(HULE_WITH_COVERAGE)
  __gcov_dump();
#endif // defined(HULE_WITH_COVERAGE)
  std::abort();
}

void printThrowSite(boost::exception const &e)
{
  if (char const * const * const p = boost::get_error_info<boost::throw_file>(e)) {
    std::cerr << *p << ':';
  }
  if (int const * const p = boost::get_error_info<boost::throw_line>(e)) {
    std::cerr << *p << ": ";
  }
  if (char const * const * const p = boost::get_error_info<boost::throw_function>(e)) {
    std::cerr << *p << ": ";
  }
  if (std::exception const * const p = dynamic_cast<std::exception const *>(&e)) {
    std::cerr << p->what() << '\n';
  }
}

// Unwinds the chain built by `HULE_THROW_WITH_NESTED`, outermost first.
std::vector<std::exception_ptr> collectNestedExceptions(std::exception_ptr p)
{
  std::vector<std::exception_ptr> result{p};
  for (;;) {
    try {
      std::rethrow_exception(result.back());
    }
    catch (std::exception const &e) {
      try {
        std::rethrow_if_nested(e);
        break;
      }
      catch (...) {
        result.push_back(std::current_exception());
      }
    }
    catch (...) {
      break;
    }
  }
  return result;
}

} // namespace *unnamed*

[[noreturn]] void TerminateHandlerSetter::terminate_handler_() noexcept
try {
  std::exception_ptr const p = std::current_exception();
  if (p == nullptr) {
    std::cerr << "`std::terminate' is called without throwing any exception.\n";
    boost::stacktrace::stacktrace stacktrace;
    if (!stacktrace.empty()) {
      std::cerr << "Backtrace:\n" << stacktrace;
    }
    abort_();
  }

  std::vector<std::exception_ptr> const chain = collectNestedExceptions(p);
  for (auto iter = chain.crbegin(); iter != chain.crend(); ++iter) {
    bool const innermost = (iter == chain.crbegin());
    try {
      std::rethrow_exception(*iter);
    }
    catch (boost::exception const &e) {
      if (innermost) {
        std::cerr << "`std::terminate' is called after throwing an instance of `"
                  << getTypeName(typeid(e)) << "'.\n";
      }
      else {
        std::cerr << "A nesting exception of type `" << getTypeName(typeid(e)) << "'.\n";
      }
      printThrowSite(e);
      if (innermost) {
        using Stacktrace = boost::stacktrace::stacktrace;
        if (Stacktrace const * const q = boost::get_error_info<Hule::StackTraceErrorInfo>(e)) {
          if (q->size() != 0u) {
            std::cerr << "Backtrace:\n" << *q;
          }
        }
      }
    }
    catch (std::exception const &e) {
      std::cerr << (innermost ? "`std::terminate' is called after throwing an instance of `"
                              : "A nesting exception of type `")
                << getTypeName(typeid(e)) << "'.\n" << e.what() << '\n';
    }
    catch (...) {
      std::cerr << "An exception of an unknown type.\n";
    }
  }

  std::cerr << std::flush;
  abort_();
}
catch (...) {
  abort_();
}

TerminateHandlerSetter::TerminateHandlerSetter() noexcept
{
  std::set_terminate(&terminate_handler_);
}

} // namespace Hule::Detail_
