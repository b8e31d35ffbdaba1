#include "engine/action.hpp"

#include "engine/fulu.hpp"
#include "engine/pai.hpp"
#include <variant>
#include <ostream>
#include <string>


namespace Quezhuo{

std::string toString(Action const &action)
{
  return std::visit(Overloaded{
      [](Dapai const &a) {
        return "dapai(" + a.pai.toString() + ')';
      },
      [](Lizhi const &a) {
        return "lizhi(" + a.pai.toString() + ')';
      },
      [](Chi const &a) {
        return "chi(" + a.target.toString() + ", " + a.pais[0u].toString()
          + a.pais[1u].toString() + ')';
      },
      [](Peng const &a) {
        return "peng(" + a.target.toString() + ", " + a.pais[0u].toString()
          + a.pais[1u].toString() + ')';
      },
      [](Gang const &a) {
        return std::string(getName(a.type)) + '(' + a.pai.toString() + ')';
      },
      [](Zimohu const &) {
        return std::string("zimohu");
      },
      [](Rong const &) {
        return std::string("rong");
      },
      [](Skip const &) {
        return std::string("skip");
      },
      [](JiuzhongJiupai const &) {
        return std::string("jiuzhong_jiupai");
      }
    }, action);
}

std::ostream &operator<<(std::ostream &os, Action const &action)
{
  return os << toString(action);
}

} // namespace Quezhuo
