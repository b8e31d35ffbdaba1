#if !defined(QUEZHUO_ENGINE_GAME_STATE_HPP_INCLUDE_GUARD)
#define QUEZHUO_ENGINE_GAME_STATE_HPP_INCLUDE_GUARD

#include "engine/round_result.hpp"
#include "engine/rule_config.hpp"
#include <array>
#include <cstdint>


namespace Quezhuo{

// 半荘を通じた状態．点数と供託はここにしかない．
class GameState
{
public:
  explicit GameState(Quezhuo::RuleConfig const &config);

  GameState(GameState const &) = default;

  GameState(GameState &&) = default;

  GameState &operator=(GameState const &) = default;

  GameState &operator=(GameState &&) = default;

public:
  Quezhuo::RuleConfig const &getConfig() const noexcept
  {
    return config_;
  }

  Quezhuo::RoundParameters const &getRoundParameters() const noexcept
  {
    return parameters_;
  }

  std::uint_fast8_t getChang() const noexcept;

  std::uint_fast8_t getJu() const noexcept;

  std::uint_fast8_t getZhuangjia() const noexcept;

  std::uint_fast8_t getBenChang() const noexcept;

  std::uint_fast8_t getNumLizhiDeposits() const noexcept;

  std::int_fast32_t getPlayerScore(std::uint_fast8_t seat) const;

  std::array<std::int_fast32_t, 4u> const &getScores() const noexcept
  {
    return scores_;
  }

  // 0-origin. Ties are broken in favor of the smaller seat.
  std::uint_fast8_t getPlayerRanking(std::uint_fast8_t seat) const;

  bool isGameOver() const noexcept
  {
    return game_over_;
  }

public:
  void onSuccessfulLizhi(std::uint_fast8_t seat);

  // Settles `result` and moves on to the next hand, or ends the game.
  void onRoundEnd(Quezhuo::RoundResult const &result);

private:
  Quezhuo::RuleConfig config_;
  Quezhuo::RoundParameters parameters_{};
  std::array<std::int_fast32_t, 4u> scores_;
  bool game_over_ = false;
}; // class GameState

} // namespace Quezhuo

#endif // !defined(QUEZHUO_ENGINE_GAME_STATE_HPP_INCLUDE_GUARD)
