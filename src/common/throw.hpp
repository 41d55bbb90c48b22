#if !defined(HULE_COMMON_THROW_HPP_INCLUDE_GUARD)
#define HULE_COMMON_THROW_HPP_INCLUDE_GUARD

#include <boost/exception/enable_error_info.hpp>
#include <boost/exception/info.hpp>
#include <boost/exception/exception.hpp>
#include <boost/stacktrace/frame.hpp>
#include <boost/stacktrace/stacktrace.hpp>
#include <boost/current_function.hpp>
#include <sstream>
#include <ostream>
#include <ios>
#include <string>
#include <type_traits>
#include <functional>
#include <tuple>
#include <utility>
#include <exception>


namespace Hule{

namespace Detail_{

struct StackTraceErrorInfoTag_;

} // namespace Detail_

using StackTraceErrorInfo = boost::error_info<
  Detail_::StackTraceErrorInfoTag_, boost::stacktrace::stacktrace>;

namespace Detail_{

enum struct ThrowType
{
  throw_,
  throw_with_nested,
}; // enum struct ThrowType

// Holds the throw site until the thrower is destroyed at the end of the full
// expression, so that a message can be streamed into it beforehand.
class ThrowSite
{
public:
  ThrowSite(char const *function_name, char const *file_name, int line_number,
            boost::stacktrace::stacktrace &&stacktrace) noexcept
    : function_name_(function_name),
      file_name_(file_name),
      line_number_(line_number),
      stacktrace_(std::move(stacktrace))
  {}

  ThrowSite(ThrowSite const &) = delete;

  ThrowSite(ThrowSite &&) = default;

  ThrowSite &operator=(ThrowSite const &) = delete;

  template<Hule::Detail_::ThrowType throw_type, typename Exception>
  [[noreturn]] void raise(Exception &&e)
  {
    auto decorated = boost::enable_error_info(std::move(e))
      << boost::throw_function(function_name_)
      << boost::throw_file(file_name_)
      << boost::throw_line(line_number_)
      << StackTraceErrorInfo(std::move(stacktrace_));
    if constexpr (throw_type == Hule::Detail_::ThrowType::throw_) {
      throw decorated;
    }
    else {
      std::throw_with_nested(std::move(decorated));
    }
  }

private:
  char const *function_name_;
  char const *file_name_;
  int line_number_;
  boost::stacktrace::stacktrace stacktrace_;
}; // class ThrowSite

template<typename T>
using RemoveCVRef = std::remove_cv_t<std::remove_reference_t<T>>;

template<typename T>
inline constexpr bool is_placeholder_v = (std::is_placeholder<RemoveCVRef<T>>::value == 1);

template<typename Exception, Hule::Detail_::ThrowType throw_type,
         typename HasPlaceholder, typename... Args>
class ExceptionThrower;

// `HULE_THROW<E>(args...)`: `E` is constructed from `args...` as they are.
template<typename Exception, Hule::Detail_::ThrowType throw_type, typename... Args>
class ExceptionThrower<Exception, throw_type, std::false_type, Args...>
{
private:
  static_assert(!std::is_reference_v<Exception>);
  static_assert(!std::is_const_v<Exception>);
  static_assert(!std::is_volatile_v<Exception>);
  static_assert((... && std::is_reference_v<Args>));

public:
  ExceptionThrower(Hule::Detail_::ThrowSite &&site, std::tuple<Args...> args) noexcept
    : site_(std::move(site)),
      args_(std::move(args))
  {}

  ExceptionThrower(ExceptionThrower const &) = delete;

  ExceptionThrower &operator=(ExceptionThrower const &) = delete;

  [[noreturn]] ~ExceptionThrower() noexcept(false)
  {
    site_.raise<throw_type>(std::make_from_tuple<Exception>(std::move(args_)));
  }

private:
  Hule::Detail_::ThrowSite site_;
  std::tuple<Args...> args_;
}; // class ExceptionThrower

// `HULE_THROW<E>(..., _1, ...) << message`: the placeholder is replaced with
// the streamed message.
template<typename Exception, Hule::Detail_::ThrowType throw_type, typename... Args>
class ExceptionThrower<Exception, throw_type, std::true_type, Args...>
{
private:
  static_assert(!std::is_reference_v<Exception>);
  static_assert(!std::is_const_v<Exception>);
  static_assert(!std::is_volatile_v<Exception>);
  static_assert((... && std::is_reference_v<Args>));

  template<typename T>
  static decltype(auto) substitute(T &&arg, std::string const &what) noexcept
  {
    if constexpr (Hule::Detail_::is_placeholder_v<T>) {
      return (what);
    }
    else {
      return std::forward<T>(arg);
    }
  }

public:
  ExceptionThrower(Hule::Detail_::ThrowSite &&site, std::tuple<Args...> args) noexcept
    : site_(std::move(site)),
      args_(std::move(args)),
      oss_()
  {}

  ExceptionThrower(ExceptionThrower const &) = delete;

  ExceptionThrower &operator=(ExceptionThrower const &) = delete;

  template<typename T>
  ExceptionThrower &operator<<(T &&value)
  {
    oss_ << std::forward<T>(value);
    return *this;
  }

  ExceptionThrower &operator<<(std::ostream &(*pf)(std::ostream &))
  {
    oss_ << pf;
    return *this;
  }

  ExceptionThrower &operator<<(std::ios_base &(*pf)(std::ios_base &))
  {
    oss_ << pf;
    return *this;
  }

  [[noreturn]] ~ExceptionThrower() noexcept(false)
  {
    std::string const what = oss_.str();
    site_.raise<throw_type>(std::apply(
      [&what](auto &&... args) {
        return Exception(substitute(std::forward<decltype(args)>(args), what)...);
      },
      std::move(args_)));
  }

private:
  Hule::Detail_::ThrowSite site_;
  std::tuple<Args...> args_;
  std::ostringstream oss_;
}; // class ExceptionThrower

class ExceptionInfoHolder
{
public:
  ExceptionInfoHolder(char const *function_name, char const *file_name, int line_number,
                      boost::stacktrace::stacktrace &&stacktrace) noexcept
    : site_(function_name, file_name, line_number, std::move(stacktrace))
  {}

  ExceptionInfoHolder(ExceptionInfoHolder const &) = delete;

  ExceptionInfoHolder &operator=(ExceptionInfoHolder const &) = delete;

  template<typename... Args>
  using HasPlaceholder = std::bool_constant<(... || Hule::Detail_::is_placeholder_v<Args>)>;

  template<typename Exception, Hule::Detail_::ThrowType throw_type, typename... Args>
  using Thrower = ExceptionThrower<Exception, throw_type, HasPlaceholder<Args...>, Args &&...>;

  template<typename Exception, typename... Args>
  Thrower<Exception, Hule::Detail_::ThrowType::throw_, Args...>
  setExceptionToThrow(Args &&... args) noexcept
  {
    using Result = Thrower<Exception, Hule::Detail_::ThrowType::throw_, Args...>;
    return Result(std::move(site_), std::forward_as_tuple(std::forward<Args>(args)...));
  }

  template<typename Exception, typename... Args>
  Thrower<Exception, Hule::Detail_::ThrowType::throw_with_nested, Args...>
  setExceptionToThrowWithNested(Args &&... args) noexcept
  {
    using Result = Thrower<Exception, Hule::Detail_::ThrowType::throw_with_nested, Args...>;
    return Result(std::move(site_), std::forward_as_tuple(std::forward<Args>(args)...));
  }

private:
  Hule::Detail_::ThrowSite site_;
}; // class ExceptionInfoHolder

} // namespace Detail_

} // namespace Hule

#define HULE_THROW                      \
  ::Hule::Detail_::ExceptionInfoHolder( \
    BOOST_CURRENT_FUNCTION,             \
    __FILE__,                           \
    __LINE__,                           \
    ::boost::stacktrace::stacktrace())  \
    .template setExceptionToThrow       \
  /**/

#define HULE_THROW_WITH_NESTED                \
  ::Hule::Detail_::ExceptionInfoHolder(       \
    BOOST_CURRENT_FUNCTION,                   \
    __FILE__,                                 \
    __LINE__,                                 \
    ::boost::stacktrace::stacktrace())        \
    .template setExceptionToThrowWithNested   \
  /**/

namespace Hule::Detail_{

class TerminateHandlerSetter
{
private:
  [[noreturn]] static void terminate_handler_() noexcept;

public:
  TerminateHandlerSetter() noexcept;

  TerminateHandlerSetter(TerminateHandlerSetter const &) = delete;

  TerminateHandlerSetter &operator=(TerminateHandlerSetter const &) = delete;
}; // class TerminateHandlerSetter

// Must stay an inline variable defined in this header. Defined in a .cpp file,
// its initialization could be skipped unless something else in that
// translation unit is used.
inline TerminateHandlerSetter terminate_handler_setter;

} // namespace Hule::Detail_

#endif // !defined(HULE_COMMON_THROW_HPP_INCLUDE_GUARD)
