#if !defined(HULE_COMMON_ASSERT_HPP_INCLUDE_GUARD)
#define HULE_COMMON_ASSERT_HPP_INCLUDE_GUARD

#if defined(HULE_ENABLE_ASSERT)

#include "common/throw.hpp"
#include <boost/stacktrace/frame.hpp>
#include <boost/stacktrace/stacktrace.hpp>
#include <boost/current_function.hpp>
#include <boost/config.hpp>
#include <sstream>
#include <ostream>
#include <string>
#include <utility>
#include <stdexcept>


namespace Hule{

class AssertionFailure
  : public std::logic_error
{
public:
  explicit AssertionFailure(std::string const &error_message);

  AssertionFailure(AssertionFailure const &rhs) noexcept = default;

  AssertionFailure &operator=(AssertionFailure const &) noexcept = default;
}; // class AssertionFailure

namespace Detail_{

// Collects the message streamed after a failed `HULE_ASSERT` and throws
// `AssertionFailure` from the throw site at the end of the full expression.
class AssertMessenger
{
public:
  AssertMessenger(Hule::Detail_::ThrowSite &&site, char const *expression);

  AssertMessenger(AssertMessenger const &) = delete;

  AssertMessenger &operator=(AssertMessenger const &) = delete;

  template<typename T>
  AssertMessenger &operator<<(T &&x)
  {
    oss_ << std::forward<T>(x);
    return *this;
  }

  AssertMessenger &operator<<(std::ostream &(*pf)(std::ostream &));

  operator int() const noexcept;

  [[noreturn]] ~AssertMessenger() noexcept(false);

private:
  Hule::Detail_::ThrowSite site_;
  std::ostringstream oss_;
}; // class AssertMessenger

} // namespace Detail_

} // namespace Hule

#define HULE_ASSERT(EXPR)                                                    \
  BOOST_LIKELY(!!(EXPR)) ? 0 :                                               \
  ::Hule::Detail_::AssertMessenger(                                          \
    ::Hule::Detail_::ThrowSite(                                              \
      BOOST_CURRENT_FUNCTION, __FILE__, __LINE__,                            \
      ::boost::stacktrace::stacktrace()),                                    \
    #EXPR)                                                                   \
  /**/

#else // defined(HULE_ENABLE_ASSERT)

#include <iosfwd>

namespace Hule::Detail_{

class DummyAssertMessenger{
public:
  constexpr DummyAssertMessenger() = default;

  DummyAssertMessenger(DummyAssertMessenger const &) = delete;

  DummyAssertMessenger &operator=(DummyAssertMessenger const &) = delete;

  template<typename T>
  DummyAssertMessenger const &operator<<(T &&) const noexcept
  {
    return *this;
  }

  DummyAssertMessenger const &
  operator<<(std::ostream &(*)(std::ostream &)) const noexcept
  {
    return *this;
  }

  constexpr operator int() const noexcept
  {
    return 0;
  }
}; // class DummyAssertMessenger

} // namespace Hule::Detail_

#define HULE_ASSERT(EXPR)                            \
  true ? 0 : ::Hule::Detail_::DummyAssertMessenger{} \
  /**/

#endif // defined(HULE_ENABLE_ASSERT)

#endif // !defined(HULE_COMMON_ASSERT_HPP_INCLUDE_GUARD)
