#include "engine/pingju.hpp"

#include <array>
#include <cstdint>


namespace Quezhuo{

char const *getName(LiujuType const type) noexcept
{
  switch (type) {
  case LiujuType::jiuzhong_jiupai:
    return "jiuzhong_jiupai";
  case LiujuType::sifeng_lianda:
    return "sifeng_lianda";
  case LiujuType::sijia_lizhi:
    return "sijia_lizhi";
  case LiujuType::lingshang_exhaustion:
    return "lingshang_exhaustion";
  case LiujuType::dealing_exhaustion:
    return "dealing_exhaustion";
  }
  return "unknown";
}

std::array<std::int_fast32_t, 4u> calculateNotenPayments(std::array<bool, 4u> const &tingpai) noexcept
{
  std::array<std::int_fast32_t, 4u> result{};

  std::int_fast32_t num_tingpai = 0;
  for (bool const t : tingpai) {
    num_tingpai += t ? 1 : 0;
  }
  if (num_tingpai == 0 || num_tingpai == 4) {
    return result;
  }

  std::int_fast32_t const num_buting = 4 - num_tingpai;
  for (std::uint_fast8_t i = 0u; i < 4u; ++i) {
    result[i] = tingpai[i] ? 3000 / num_tingpai : -3000 / num_buting;
  }
  return result;
}

} // namespace Quezhuo
