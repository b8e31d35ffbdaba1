#if !defined(QUEZHUO_ENGINE_HULE_FORM_HPP_INCLUDE_GUARD)
#define QUEZHUO_ENGINE_HULE_FORM_HPP_INCLUDE_GUARD

#include "engine/fulu.hpp"
#include <iosfwd>
#include <string>
#include <vector>
#include <cstdint>


namespace Quezhuo{

enum struct MianziType : std::uint_fast8_t
{
  shunzi = 0u, // 順子
  kezi = 1u,   // 刻子
  gangzi = 2u, // 槓子
  duizi = 3u,  // 対子 (雀頭)
}; // enum struct MianziType

struct Mianzi
{
  MianziType type;
  // The smallest tile value of the component.
  std::uint_fast8_t first;
  // Formed by a call. Set for every fulu except an angang.
  bool open;

  bool contains(std::uint_fast8_t value) const noexcept;

  bool operator==(Mianzi const &) const = default;
}; // struct Mianzi

Mianzi toMianzi(Fulu const &fulu) noexcept;

enum struct HuleShape : std::uint_fast8_t
{
  standard = 0u, // 4 面子 1 雀頭
  qidui = 1u,    // 七対子
  guoshi = 2u,   // 国士無双
}; // enum struct HuleShape

// One decomposition of a winning hand. For `standard` the fulu come first,
// then the concealed components; the pair is the last element. For `qidui`
// the seven pairs are listed. For `guoshi` the only element is the doubled
// tile as a duizi.
struct HuleForm
{
  HuleShape shape;
  std::vector<Mianzi> mianzi_list;

  Mianzi const &getJiangpai() const noexcept;

  bool operator==(HuleForm const &) const = default;
}; // struct HuleForm

std::string toString(HuleForm const &form);

std::ostream &operator<<(std::ostream &os, HuleForm const &form);

} // namespace Quezhuo

#endif // !defined(QUEZHUO_ENGINE_HULE_FORM_HPP_INCLUDE_GUARD)
