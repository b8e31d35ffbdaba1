#if !defined(QUEZHUO_ENGINE_PINGJU_HPP_INCLUDE_GUARD)
#define QUEZHUO_ENGINE_PINGJU_HPP_INCLUDE_GUARD

#include <array>
#include <cstdint>


namespace Quezhuo{

// 途中流局の種類
enum struct LiujuType : std::uint_fast8_t
{
  jiuzhong_jiupai = 0u, // 九種九牌
  sifeng_lianda = 1u,   // 四風連打
  sijia_lizhi = 2u,     // 四家立直
  // 嶺上牌が尽きた，あるいは王牌を補充できない槓．
  lingshang_exhaustion = 3u,
  // 配牌の途中で牌山が尽きた．
  dealing_exhaustion = 4u,
}; // enum struct LiujuType

char const *getName(LiujuType type) noexcept;

// 不聴罰符．3000 points move from the noten seats to the tenpai seats, split
// evenly within each group. Nothing moves when every seat or no seat is
// tenpai.
std::array<std::int_fast32_t, 4u> calculateNotenPayments(std::array<bool, 4u> const &tingpai) noexcept;

} // namespace Quezhuo

#endif // !defined(QUEZHUO_ENGINE_PINGJU_HPP_INCLUDE_GUARD)
