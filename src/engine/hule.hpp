#if !defined(QUEZHUO_ENGINE_HULE_HPP_INCLUDE_GUARD)
#define QUEZHUO_ENGINE_HULE_HPP_INCLUDE_GUARD

#include "engine/yaku.hpp"
#include "engine/hule_form.hpp"
#include "engine/fulu.hpp"
#include "engine/pai.hpp"
#include <iosfwd>
#include <optional>
#include <vector>
#include <array>
#include <cstdint>


namespace Quezhuo{

// 和了の点数計算結果
struct HuleDetails
{
  bool valid = false;
  std::vector<YakuEntry> yaku_list{};
  // Dora included. 13 per yakuman for a yakuman hand.
  std::uint_fast8_t han = 0u;
  std::uint_fast8_t fu = 0u;
  std::uint_fast8_t dora = 0u;
  std::uint_fast8_t aka_dora = 0u;
  std::uint_fast8_t ura_dora = 0u;
  // The number of yakuman, 0 for an ordinary hand.
  std::uint_fast8_t yakuman = 0u;
  // 基本点
  std::int_fast32_t base_points = 0;
  // The value of the hand without 本場 or 供託.
  std::int_fast32_t points = 0;
  // What each seat pays, 本場 included.
  std::array<std::int_fast32_t, 4u> payments{};
  // Score changes, 供託 included.
  std::array<std::int_fast32_t, 4u> delta_scores{};
  std::optional<HuleForm> form{};
}; // struct HuleDetails

std::ostream &operator<<(std::ostream &os, HuleDetails const &details);

// 満貫以上の切り上げを含む基本点．
std::int_fast32_t calculateBasePoints(std::uint_fast8_t han, std::uint_fast8_t fu) noexcept;

// Evaluates the hand `shoupai` (13 tiles in hand minus those in fulu) won on
// `hupai`. The result is invalid when the tiles do not form a winning hand,
// when the hand has no yaku, or on a rong in 振聴.
HuleDetails calculateHule(
  std::vector<Pai> const &shoupai, std::vector<Fulu> const &fulu_list, Pai hupai,
  HuleContext const &context);

} // namespace Quezhuo

#endif // !defined(QUEZHUO_ENGINE_HULE_HPP_INCLUDE_GUARD)
