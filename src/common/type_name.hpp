#if !defined(QUEZHUO_COMMON_TYPE_NAME_HPP_INCLUDE_GUARD)
#define QUEZHUO_COMMON_TYPE_NAME_HPP_INCLUDE_GUARD

#include <string>
#include <typeinfo>


namespace Quezhuo{

// Demangled name of the dynamic type, used when reporting exceptions.
std::string getTypeName(std::type_info const &ti);

template<typename T>
std::string getTypeName(T const &x)
{
  return Quezhuo::getTypeName(typeid(x));
}

} // namespace Quezhuo

#endif // !defined(QUEZHUO_COMMON_TYPE_NAME_HPP_INCLUDE_GUARD)
