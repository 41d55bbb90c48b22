#include "common/assert.hpp"

#if defined(HULE_ENABLE_ASSERT)

#include "common/throw.hpp"
#include <ostream>
#include <string>
#include <utility>
#include <stdexcept>


namespace Hule{

AssertionFailure::AssertionFailure(std::string const &error_message)
  : std::logic_error(error_message)
{}

namespace Detail_{

AssertMessenger::AssertMessenger(Hule::Detail_::ThrowSite &&site, char const *expression)
  : site_(std::move(site)),
    oss_()
{
  oss_ << "Assertion `" << expression << "' failed. ";
}

AssertMessenger &AssertMessenger::operator<<(std::ostream &(*pf)(std::ostream &))
{
  oss_ << pf;
  return *this;
}

AssertMessenger::operator int() const noexcept
{
  return 0;
}

[[noreturn]] AssertMessenger::~AssertMessenger() noexcept(false)
{
  site_.raise<Hule::Detail_::ThrowType::throw_>(Hule::AssertionFailure(oss_.str()));
}

} // namespace Detail_

} // namespace Hule

#endif // defined(HULE_ENABLE_ASSERT)
