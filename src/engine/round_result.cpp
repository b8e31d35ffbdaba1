#include "engine/round_result.hpp"

#include "engine/hule.hpp"
#include "engine/pingju.hpp"
#include <ostream>
#include <cstdint>


namespace Quezhuo{

std::ostream &operator<<(std::ostream &os, RoundParameters const &parameters)
{
  static char const * const chang_names[] = { "E", "S", "W", "N" };
  return os << chang_names[parameters.chang % 4u] << static_cast<unsigned>(parameters.ju) + 1u
            << '-' << static_cast<unsigned>(parameters.ben_chang)
            << " (" << static_cast<unsigned>(parameters.lizhi_deposits) << " deposits)";
}

char const *getName(RoundEndType const type) noexcept
{
  switch (type) {
  case RoundEndType::zimo:
    return "zimo";
  case RoundEndType::rong:
    return "rong";
  case RoundEndType::huangpai_pingju:
    return "huangpai_pingju";
  case RoundEndType::liuju:
    return "liuju";
  }
  return "unknown";
}

bool RoundResult::isLianzhuang() const noexcept
{
  switch (type) {
  case RoundEndType::zimo:
  case RoundEndType::rong:
    return winner == parameters.getZhuangjia();
  case RoundEndType::huangpai_pingju:
    return tingpai[parameters.getZhuangjia()];
  case RoundEndType::liuju:
    return true;
  }
  return true;
}

std::ostream &operator<<(std::ostream &os, RoundResult const &result)
{
  os << result.parameters << ": " << getName(result.type);
  if (result.isHule()) {
    os << " by " << static_cast<unsigned>(result.winner);
    if (result.type == RoundEndType::rong) {
      os << " from " << static_cast<unsigned>(result.loser);
    }
    if (result.hule) {
      os << ": " << *result.hule;
    }
  }
  if (result.liuju) {
    os << ": " << getName(*result.liuju);
  }
  os << " [";
  for (std::uint_fast8_t i = 0u; i < 4u; ++i) {
    os << (i == 0u ? "" : ", ") << result.delta_scores[i];
  }
  return os << ']';
}

RoundParameters calculateNextRoundParameters(RoundResult const &result) noexcept
{
  RoundParameters next = result.parameters;

  if (result.isHule()) {
    next.lizhi_deposits = 0u;
  }

  if (result.isLianzhuang()) {
    ++next.ben_chang;
    return next;
  }

  // 輪荘
  if (++next.ju == 4u) {
    ++next.chang;
    next.ju = 0u;
  }
  next.ben_chang = result.isHule() ? 0u : next.ben_chang + 1u;
  return next;
}

} // namespace Quezhuo
