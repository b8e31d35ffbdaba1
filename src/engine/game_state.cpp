#include "engine/game_state.hpp"

#include "engine/round_result.hpp"
#include "engine/rule_config.hpp"
#include "engine/error.hpp"
#include "common/throw.hpp"
#include <algorithm>
#include <functional>
#include <stdexcept>
#include <cstdint>


namespace{

using std::placeholders::_1;

} // namespace `anonymous`

namespace Quezhuo{

GameState::GameState(Quezhuo::RuleConfig const &config)
  : config_(config),
    scores_{ config.initial_score, config.initial_score, config.initial_score, config.initial_score }
{
  config_.validate();
}

std::uint_fast8_t GameState::getChang() const noexcept
{
  return parameters_.chang;
}

std::uint_fast8_t GameState::getJu() const noexcept
{
  return parameters_.ju;
}

std::uint_fast8_t GameState::getZhuangjia() const noexcept
{
  return parameters_.getZhuangjia();
}

std::uint_fast8_t GameState::getBenChang() const noexcept
{
  return parameters_.ben_chang;
}

std::uint_fast8_t GameState::getNumLizhiDeposits() const noexcept
{
  return parameters_.lizhi_deposits;
}

std::int_fast32_t GameState::getPlayerScore(std::uint_fast8_t const seat) const
{
  if (seat >= 4u) {
    QUEZHUO_THROW<std::invalid_argument>(_1) << static_cast<unsigned>(seat) << ": An invalid seat.";
  }
  return scores_[seat];
}

std::uint_fast8_t GameState::getPlayerRanking(std::uint_fast8_t const seat) const
{
  std::int_fast32_t const score = getPlayerScore(seat);
  std::uint_fast8_t ranking = 0u;
  for (std::uint_fast8_t i = 0u; i < seat; ++i) {
    if (scores_[i] >= score) {
      ++ranking;
    }
  }
  for (std::uint_fast8_t i = seat + 1u; i < 4u; ++i) {
    if (scores_[i] > score) {
      ++ranking;
    }
  }
  return ranking;
}

void GameState::onSuccessfulLizhi(std::uint_fast8_t const seat)
{
  if (getPlayerScore(seat) < 1000) {
    QUEZHUO_THROW<InvariantViolation>(_1)
      << "seat " << static_cast<unsigned>(seat) << ": " << scores_[seat]
      << ": Not enough points for a lizhi.";
  }
  scores_[seat] -= 1000;
  ++parameters_.lizhi_deposits;
}

void GameState::onRoundEnd(Quezhuo::RoundResult const &result)
{
  if (game_over_) {
    QUEZHUO_THROW<InvariantViolation>("A hand ended after the end of the game.");
  }
  if (result.parameters.chang != parameters_.chang || result.parameters.ju != parameters_.ju
      || result.parameters.ben_chang != parameters_.ben_chang)
  {
    QUEZHUO_THROW<InvariantViolation>(_1)
      << result.parameters << ": The result of another hand (" << parameters_ << ").";
  }

  for (std::uint_fast8_t i = 0u; i < 4u; ++i) {
    scores_[i] += result.delta_scores[i];
  }
  parameters_ = calculateNextRoundParameters(result);

  bool const bankrupt = std::any_of(
    scores_.cbegin(), scores_.cend(),
    [this](std::int_fast32_t const score) { return score < config_.min_game_end_score; });
  bool const reached = config_.target_score && std::any_of(
    scores_.cbegin(), scores_.cend(),
    [this](std::int_fast32_t const score) { return score >= *config_.target_score; });
  game_over_ = bankrupt || reached || parameters_.chang > config_.getLastChang();
}

} // namespace Quezhuo
