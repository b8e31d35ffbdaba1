#if !defined(QUEZHUO_ENGINE_TABLE_HPP_INCLUDE_GUARD)
#define QUEZHUO_ENGINE_TABLE_HPP_INCLUDE_GUARD

#include "engine/round_state.hpp"
#include "engine/game_state.hpp"
#include "engine/round_result.hpp"
#include "engine/rule_config.hpp"
#include "engine/paishan.hpp"
#include "engine/action.hpp"
#include <random>
#include <optional>
#include <vector>
#include <deque>
#include <cstdint>


namespace Quezhuo{

enum struct ApplyStatus : std::uint_fast8_t
{
  accepted = 0u,
  // Not one of the legal actions of the seat. Nothing has changed.
  illegal_action = 1u,
}; // enum struct ApplyStatus

struct ApplyResult
{
  ApplyStatus status;
  // The phase the table waits in after the action.
  Phase phase;
  // Set when the action ended a hand.
  std::optional<RoundResult> round_result{};
}; // struct ApplyResult

// 卓．The single owner of the game state. Every `apply` runs the game forward
// until somebody has to decide again.
class Table
{
public:
  explicit Table(Quezhuo::RuleConfig const &config);

  Table(Table const &) = delete;

  Table(Table &&) = delete;

  Table &operator=(Table const &) = delete;

  Table &operator=(Table &&) = delete;

public:
  void resetGame();

  void resetGame(std::vector<std::uint_least32_t> const &seed);

  // Deals the current hand again with a new wall.
  void resetRound();

  // Walls to use, one per hand, before falling back to shuffled ones.
  void setTestPaishans(std::vector<Quezhuo::Paishan> paishans);

public:
  Quezhuo::RuleConfig const &getConfig() const noexcept
  {
    return config_;
  }

  Phase getPhase() const noexcept;

  // The seat expected to act, or `RoundState::no_seat`.
  std::uint_fast8_t getCurrentSeat() const;

  // Empty for a seat that is not to act.
  std::vector<Action> getCandidates(std::uint_fast8_t seat) const;

  Quezhuo::GameState const &getGameState() const noexcept
  {
    return game_state_;
  }

  bool hasRoundState() const noexcept
  {
    return round_state_.has_value();
  }

  Quezhuo::RoundState const &getRoundState() const;

  std::optional<Quezhuo::RoundResult> const &getLastRoundResult() const noexcept
  {
    return last_round_result_;
  }

  bool isGameOver() const noexcept;

public:
  ApplyResult apply(std::uint_fast8_t seat, Action const &action);

private:
  Quezhuo::Paishan createPaishan_();

  void startRound_();

  void endRound_(Quezhuo::RoundResult result);

  void endRoundByLiuju_(Quezhuo::LiujuType type);

  void endRoundByHule_(std::uint_fast8_t seat, bool zimo);

  void afterGang_();

  void afterDapai_();

  void onResponsesPassed_();

  void onResponsesResolved_();

  void onPlayerAction_(Action const &action);

  void onResponse_(std::uint_fast8_t seat, Action const &action);

private:
  Quezhuo::RuleConfig config_;
  std::mt19937 urng_;
  std::deque<Quezhuo::Paishan> test_paishans_{};
  Quezhuo::GameState game_state_;
  std::optional<Quezhuo::RoundState> round_state_{};
  std::optional<Quezhuo::RoundResult> last_round_result_{};
  std::optional<Quezhuo::RoundResult> pending_round_result_{};
  bool broken_ = false;
}; // class Table

} // namespace Quezhuo

#endif // !defined(QUEZHUO_ENGINE_TABLE_HPP_INCLUDE_GUARD)
