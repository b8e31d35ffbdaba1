#if !defined(QUEZHUO_COMMON_ASSERT_HPP_INCLUDE_GUARD)
#define QUEZHUO_COMMON_ASSERT_HPP_INCLUDE_GUARD

#include <stdexcept>
#include <string>


namespace Quezhuo{

class AssertionFailure
  : public std::logic_error
{
public:
  explicit AssertionFailure(std::string const &error_message);

  AssertionFailure(AssertionFailure const &rhs) noexcept = default;

  AssertionFailure &operator=(AssertionFailure const &) noexcept = default;
}; // class AssertionFailure

} // namespace Quezhuo

#if defined(QUEZHUO_ENABLE_ASSERT)

#include <boost/stacktrace/stacktrace.hpp>
#include <boost/current_function.hpp>
#include <boost/config.hpp>
#include <sstream>
#include <ostream>
#include <utility>


namespace Quezhuo::Detail_{

// Collects the message of a failed assertion and throws
// `Quezhuo::AssertionFailure` on destruction.
class AssertMessenger
{
public:
  AssertMessenger(char const *file_name, int line_number, char const *function_name,
                  char const *expression, boost::stacktrace::stacktrace &&stacktrace);

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
  std::ostringstream oss_;
  char const *file_name_;
  int line_number_;
  char const *function_name_;
  boost::stacktrace::stacktrace stacktrace_;
}; // class AssertMessenger

} // namespace Quezhuo::Detail_

#define QUEZHUO_ASSERT(EXPR)                                             \
  BOOST_LIKELY(!!(EXPR)) ? 0 :                                           \
  ::Quezhuo::Detail_::AssertMessenger(__FILE__,                          \
                                      __LINE__,                          \
                                      BOOST_CURRENT_FUNCTION,            \
                                      #EXPR,                             \
                                      ::boost::stacktrace::stacktrace()) \
  /**/

#else // defined(QUEZHUO_ENABLE_ASSERT)

#include <ostream>


namespace Quezhuo::Detail_{

class DummyAssertMessenger
{
public:
  constexpr DummyAssertMessenger() = default;

  DummyAssertMessenger(DummyAssertMessenger const &) = delete;

  DummyAssertMessenger &operator=(DummyAssertMessenger const &) = delete;

  template<typename T>
  DummyAssertMessenger const &operator<<(T &&) const noexcept
  {
    return *this;
  }

  DummyAssertMessenger const &operator<<(std::ostream &(*)(std::ostream &)) const noexcept
  {
    return *this;
  }

  constexpr operator int() const noexcept
  {
    return 0;
  }
}; // class DummyAssertMessenger

} // namespace Quezhuo::Detail_

#define QUEZHUO_ASSERT(EXPR)                           \
  true ? 0 : ::Quezhuo::Detail_::DummyAssertMessenger{} \
  /**/

#endif // defined(QUEZHUO_ENABLE_ASSERT)

#endif // !defined(QUEZHUO_COMMON_ASSERT_HPP_INCLUDE_GUARD)
