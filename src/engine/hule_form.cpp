#include "engine/hule_form.hpp"

#include "engine/fulu.hpp"
#include "engine/pai.hpp"
#include <ostream>
#include <string>
#include <cstdint>


namespace Quezhuo{

bool Mianzi::contains(std::uint_fast8_t const value) const noexcept
{
  if (type == MianziType::shunzi) {
    return first <= value && value < first + 3u;
  }
  return value == first;
}

Mianzi toMianzi(Fulu const &fulu) noexcept
{
  switch (fulu.getType()) {
  case FuluType::chi:
    return { MianziType::shunzi, fulu.getFirstValue(), true };
  case FuluType::peng:
    return { MianziType::kezi, fulu.getFirstValue(), true };
  case FuluType::angang:
    return { MianziType::gangzi, fulu.getFirstValue(), false };
  case FuluType::jiagang:
  case FuluType::daminggang:
    return { MianziType::gangzi, fulu.getFirstValue(), true };
  }
  return { MianziType::kezi, fulu.getFirstValue(), true };
}

Mianzi const &HuleForm::getJiangpai() const noexcept
{
  return mianzi_list.back();
}

std::string toString(HuleForm const &form)
{
  std::string result;
  switch (form.shape) {
  case HuleShape::standard:
    break;
  case HuleShape::qidui:
    result += "qidui:";
    break;
  case HuleShape::guoshi:
    return "guoshi:" + Pai(form.getJiangpai().first).toString();
  }
  for (Mianzi const &m : form.mianzi_list) {
    result.push_back(' ');
    if (m.open) {
      result.push_back('+');
    }
    std::uint_fast8_t const n = m.type == MianziType::shunzi ? 3u
      : m.type == MianziType::kezi ? 3u : m.type == MianziType::gangzi ? 4u : 2u;
    for (std::uint_fast8_t i = 0u; i < n; ++i) {
      std::uint_fast8_t const value = m.type == MianziType::shunzi ? m.first + i : m.first;
      result += Pai(value).toString();
    }
  }
  return result;
}

std::ostream &operator<<(std::ostream &os, HuleForm const &form)
{
  return os << toString(form);
}

} // namespace Quezhuo
