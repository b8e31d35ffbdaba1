#include "common/type_name.hpp"

#include <string>
#include <memory>
#include <typeinfo>
#include <cstdlib>
#include <cxxabi.h>


namespace Quezhuo{

std::string getTypeName(std::type_info const &ti)
{
  char const * const name = ti.name();
  int status = 0;
  std::unique_ptr<char, void (*)(void *)> const p(
    abi::__cxa_demangle(name, nullptr, nullptr, &status), std::free);
  if (status != 0 || p == nullptr) {
    return name;
  }
  return p.get();
}

} // namespace Quezhuo
