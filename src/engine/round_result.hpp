#if !defined(QUEZHUO_ENGINE_ROUND_RESULT_HPP_INCLUDE_GUARD)
#define QUEZHUO_ENGINE_ROUND_RESULT_HPP_INCLUDE_GUARD

#include "engine/hule.hpp"
#include "engine/pingju.hpp"
#include <iosfwd>
#include <optional>
#include <array>
#include <cstdint>


namespace Quezhuo{

// 局のパラメータ．親は `ju` 番の席．
struct RoundParameters
{
  std::uint_fast8_t chang = 0u;
  std::uint_fast8_t ju = 0u;
  std::uint_fast8_t ben_chang = 0u;
  std::uint_fast8_t lizhi_deposits = 0u;

  std::uint_fast8_t getZhuangjia() const noexcept
  {
    return ju;
  }

  bool operator==(RoundParameters const &) const = default;
}; // struct RoundParameters

std::ostream &operator<<(std::ostream &os, RoundParameters const &parameters);

enum struct RoundEndType : std::uint_fast8_t
{
  zimo = 0u,
  rong = 1u,
  // 荒牌平局
  huangpai_pingju = 2u,
  // 途中流局
  liuju = 3u,
}; // enum struct RoundEndType

char const *getName(RoundEndType type) noexcept;

struct RoundResult
{
  static constexpr std::uint_fast8_t no_seat = 4u;

  RoundEndType type = RoundEndType::huangpai_pingju;
  std::uint_fast8_t winner = no_seat;
  // The discarder on a rong.
  std::uint_fast8_t loser = no_seat;
  std::array<std::int_fast32_t, 4u> delta_scores{};
  std::optional<HuleDetails> hule{};
  std::optional<LiujuType> liuju{};
  std::array<bool, 4u> tingpai{};
  // The parameters of the hand that ended, with the deposits left on the
  // table when it ended.
  RoundParameters parameters{};

  bool isHule() const noexcept
  {
    return type == RoundEndType::zimo || type == RoundEndType::rong;
  }

  // 連荘
  bool isLianzhuang() const noexcept;
}; // struct RoundResult

std::ostream &operator<<(std::ostream &os, RoundResult const &result);

// The parameters of the next hand. Whether the game is over is up to the
// caller.
RoundParameters calculateNextRoundParameters(RoundResult const &result) noexcept;

} // namespace Quezhuo

#endif // !defined(QUEZHUO_ENGINE_ROUND_RESULT_HPP_INCLUDE_GUARD)
