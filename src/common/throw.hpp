#if !defined(QUEZHUO_COMMON_THROW_HPP_INCLUDE_GUARD)
#define QUEZHUO_COMMON_THROW_HPP_INCLUDE_GUARD

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


namespace Quezhuo{

namespace Detail_{

struct StackTraceErrorInfoTag_;

} // namespace Detail_

using StackTraceErrorInfo = boost::error_info<
  Detail_::StackTraceErrorInfoTag_, boost::stacktrace::stacktrace>;

// Writes the exception held by `p`, and then every exception nested in it,
// to `os`. Throw location and backtrace are printed when attached.
void printExceptionChain(std::ostream &os, std::exception_ptr p);

namespace Detail_{

enum struct ThrowType
{
  throw_,
  throw_with_nested,
}; // enum struct ThrowType

// Arguments equal to `std::placeholders::_1` are replaced with the message
// streamed into the thrower. The exception is thrown when the thrower, a
// temporary, is destroyed at the end of the full expression.
template<typename Exception, Quezhuo::Detail_::ThrowType throw_type, typename... Args>
class ExceptionThrower
{
private:
  static_assert(!std::is_reference_v<Exception>);
  static_assert(!std::is_const_v<Exception>);
  static_assert(!std::is_volatile_v<Exception>);

  template<typename T>
  static constexpr bool is_placeholder_v
    = (std::is_placeholder<std::remove_cvref_t<T>>::value == 1);

  static constexpr bool has_placeholder = (false || ... || is_placeholder_v<Args>);

  template<typename T>
  static decltype(auto) substitute_(T &&arg, std::string const &what) noexcept
  {
    if constexpr (is_placeholder_v<T>) {
      return (what);
    }
    else {
      return std::forward<T>(arg);
    }
  }

  Exception makeException_()
  {
    std::string const what = oss_.str();
    return std::apply(
      [&what](auto &&... args) -> Exception {
        return Exception(substitute_(std::forward<decltype(args)>(args), what)...);
      },
      std::move(args_));
  }

public:
  ExceptionThrower(char const *function_name, char const *file_name, int line_number,
                   boost::stacktrace::stacktrace &&stacktrace, std::tuple<Args &&...> args) noexcept
    : function_name_(function_name),
      file_name_(file_name),
      line_number_(line_number),
      stacktrace_(std::move(stacktrace)),
      args_(std::move(args)),
      oss_()
  {}

  ExceptionThrower(ExceptionThrower const &) = delete;

  ExceptionThrower &operator=(ExceptionThrower const &) = delete;

  template<typename T>
  ExceptionThrower &operator<<(T &&value)
  {
    static_assert(has_placeholder && sizeof(T) != 0u, "A message requires `std::placeholders::_1'.");
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
    if constexpr (throw_type == Quezhuo::Detail_::ThrowType::throw_) {
      throw boost::enable_error_info(makeException_())
        << boost::throw_function(function_name_)
        << boost::throw_file(file_name_)
        << boost::throw_line(line_number_)
        << StackTraceErrorInfo(std::move(stacktrace_));
    }
    else {
      std::throw_with_nested(
        boost::enable_error_info(makeException_())
          << boost::throw_function(function_name_)
          << boost::throw_file(file_name_)
          << boost::throw_line(line_number_)
          << StackTraceErrorInfo(std::move(stacktrace_)));
    }
  }

private:
  char const *function_name_;
  char const *file_name_;
  int line_number_;
  boost::stacktrace::stacktrace stacktrace_;
  std::tuple<Args &&...> args_;
  std::ostringstream oss_;
}; // class ExceptionThrower

class ThrowLocation
{
public:
  ThrowLocation(char const *function_name, char const *file_name, int line_number,
                boost::stacktrace::stacktrace &&stacktrace) noexcept
    : function_name_(function_name),
      file_name_(file_name),
      line_number_(line_number),
      stacktrace_(std::move(stacktrace))
  {}

  ThrowLocation(ThrowLocation const &) = delete;

  ThrowLocation &operator=(ThrowLocation const &) = delete;

  template<typename Exception, typename... Args>
  ExceptionThrower<Exception, Quezhuo::Detail_::ThrowType::throw_, Args...>
  setExceptionToThrow(Args &&... args) noexcept
  {
    return { function_name_, file_name_, line_number_, std::move(stacktrace_),
             std::forward_as_tuple(std::forward<Args>(args)...) };
  }

  template<typename Exception, typename... Args>
  ExceptionThrower<Exception, Quezhuo::Detail_::ThrowType::throw_with_nested, Args...>
  setExceptionToThrowWithNested(Args &&... args) noexcept
  {
    return { function_name_, file_name_, line_number_, std::move(stacktrace_),
             std::forward_as_tuple(std::forward<Args>(args)...) };
  }

private:
  char const *function_name_;
  char const *file_name_;
  int line_number_;
  boost::stacktrace::stacktrace stacktrace_;
}; // class ThrowLocation

} // namespace Detail_

} // namespace Quezhuo

#define QUEZHUO_THROW                    \
  ::Quezhuo::Detail_::ThrowLocation(     \
    BOOST_CURRENT_FUNCTION,              \
    __FILE__,                            \
    __LINE__,                            \
    ::boost::stacktrace::stacktrace())   \
    .template setExceptionToThrow        \
  /**/

#define QUEZHUO_THROW_WITH_NESTED          \
  ::Quezhuo::Detail_::ThrowLocation(       \
    BOOST_CURRENT_FUNCTION,                \
    __FILE__,                              \
    __LINE__,                              \
    ::boost::stacktrace::stacktrace())     \
    .template setExceptionToThrowWithNested \
  /**/

namespace Quezhuo::Detail_{

class TerminateHandlerSetter
{
private:
  [[noreturn]] static void terminate_handler_() noexcept;

public:
  TerminateHandlerSetter() noexcept;

  TerminateHandlerSetter(TerminateHandlerSetter const &) = delete;

  TerminateHandlerSetter &operator=(TerminateHandlerSetter const &) = delete;
}; // class TerminateHandlerSetter

// Must stay in the header. Defined in a .cpp file, the initialization could be
// skipped unless something else in that translation unit is used.
inline TerminateHandlerSetter terminate_handler_setter;

} // namespace Quezhuo::Detail_

#endif // !defined(QUEZHUO_COMMON_THROW_HPP_INCLUDE_GUARD)
