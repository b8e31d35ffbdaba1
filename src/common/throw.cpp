#include "common/throw.hpp"

#include "common/type_name.hpp"
#include <boost/exception/get_error_info.hpp>
#include <boost/exception/exception.hpp>
#include <boost/stacktrace/stacktrace.hpp>
#include <iostream>
#include <ostream>
#include <exception>
#include <cstdlib>


#if defined(QUEZHUO_WITH_COVERAGE)

extern "C" void __gcov_dump();

#endif // defined(QUEZHUO_WITH_COVERAGE)

namespace{

void printThrowLocation(std::ostream &os, boost::exception const &e)
{
  if (char const * const * const p = boost::get_error_info<boost::throw_file>(e)) {
    os << *p << ':';
  }
  if (int const * const p = boost::get_error_info<boost::throw_line>(e)) {
    os << *p << ": ";
  }
  if (char const * const * const p = boost::get_error_info<boost::throw_function>(e)) {
    os << *p << ": ";
  }
}

[[noreturn]] void abort_() noexcept
{
#if defined(QUEZHUO_WITH_COVERAGE)
  __gcov_dump(); std::abort();
#else // defined(QUEZHUO_WITH_COVERAGE)
  std::abort();
#endif // defined(QUEZHUO_WITH_COVERAGE)
}

} // namespace `anonymous`

namespace Quezhuo{

void printExceptionChain(std::ostream &os, std::exception_ptr p)
{
  bool outermost = true;
  while (p != nullptr) {
    std::exception_ptr nested = nullptr;
    try {
      std::rethrow_exception(p);
    }
    catch (std::exception const &e) {
      os << (outermost ? "An exception of type `" : "A nested exception of type `")
         << Quezhuo::getTypeName(e) << "'.\n";
      if (auto const * const pb = dynamic_cast<boost::exception const *>(&e)) {
        printThrowLocation(os, *pb);
      }
      os << e.what() << '\n';
      if (outermost) {
        auto const * const pb = dynamic_cast<boost::exception const *>(&e);
        using Stacktrace = boost::stacktrace::stacktrace;
        if (pb != nullptr) {
          if (Stacktrace const * const ps = boost::get_error_info<StackTraceErrorInfo>(*pb)) {
            if (!ps->empty()) {
              os << "Backtrace:\n" << *ps;
            }
          }
        }
      }
      if (auto const * const pn = dynamic_cast<std::nested_exception const *>(&e)) {
        nested = pn->nested_ptr();
      }
    }
    catch (...) {
      os << "An exception of an unknown type.\n";
    }
    p = nested;
    outermost = false;
  }
  os << std::flush;
}

} // namespace Quezhuo

namespace Quezhuo::Detail_{

[[noreturn]] void TerminateHandlerSetter::terminate_handler_() noexcept
try {
  std::exception_ptr const p = std::current_exception();
  if (p == nullptr) {
    std::cerr << "`std::terminate' is called without throwing any exception.\n";
    boost::stacktrace::stacktrace stacktrace;
    if (!stacktrace.empty()) {
      std::cerr << "Backtrace:\n" << stacktrace;
    }
    std::cerr << std::flush;
    abort_();
  }

  std::cerr << "`std::terminate' is called after throwing an exception.\n";
  Quezhuo::printExceptionChain(std::cerr, p);
  abort_();
}
catch (...) {
  abort_();
}

TerminateHandlerSetter::TerminateHandlerSetter() noexcept
{
  std::set_terminate(&terminate_handler_);
}

} // namespace Quezhuo::Detail_
