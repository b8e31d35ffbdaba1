#if !defined(QUEZHUO_ENGINE_ACTION_HPP_INCLUDE_GUARD)
#define QUEZHUO_ENGINE_ACTION_HPP_INCLUDE_GUARD

#include "engine/fulu.hpp"
#include "engine/pai.hpp"
#include <variant>
#include <iosfwd>
#include <string>
#include <array>
#include <cstdint>


namespace Quezhuo{

// Da Pai (打牌)
struct Dapai
{
  Pai pai;

  bool operator==(Dapai const &) const = default;
}; // struct Dapai

// Li Zhi (立直). `pai` is the declaration discard.
struct Lizhi
{
  Pai pai;

  bool operator==(Lizhi const &) const = default;
}; // struct Lizhi

// Chi (チー). `pais` are the two tiles taken from the hand.
struct Chi
{
  Pai target;
  std::array<Pai, 2u> pais;

  bool operator==(Chi const &) const = default;
}; // struct Chi

// Peng (ポン)
struct Peng
{
  Pai target;
  std::array<Pai, 2u> pais;

  bool operator==(Peng const &) const = default;
}; // struct Peng

// Gang (槓). `type` is one of angang, jiagang and daminggang. For a
// daminggang `pai` is the discard, otherwise any tile of the kan value.
struct Gang
{
  FuluType type;
  Pai pai;

  bool operator==(Gang const &) const = default;
}; // struct Gang

// Zi Mo Hu (自摸和)
struct Zimohu
{
  bool operator==(Zimohu const &) const = default;
}; // struct Zimohu

// Rong (栄和)
struct Rong
{
  bool operator==(Rong const &) const = default;
}; // struct Rong

struct Skip
{
  bool operator==(Skip const &) const = default;
}; // struct Skip

// Jiu Zhong Jiu Pai (九種九牌)
struct JiuzhongJiupai
{
  bool operator==(JiuzhongJiupai const &) const = default;
}; // struct JiuzhongJiupai

using Action = std::variant<
  Dapai, Lizhi, Chi, Peng, Gang, Zimohu, Rong, Skip, JiuzhongJiupai>;

template<typename... Fs>
struct Overloaded
  : Fs...
{
  using Fs::operator()...;
}; // struct Overloaded

template<typename... Fs>
Overloaded(Fs...) -> Overloaded<Fs...>;

std::string toString(Action const &action);

std::ostream &operator<<(std::ostream &os, Action const &action);

} // namespace Quezhuo

#endif // !defined(QUEZHUO_ENGINE_ACTION_HPP_INCLUDE_GUARD)
