#if !defined(QUEZHUO_ENGINE_ROUND_STATE_HPP_INCLUDE_GUARD)
#define QUEZHUO_ENGINE_ROUND_STATE_HPP_INCLUDE_GUARD

#include "engine/round_result.hpp"
#include "engine/player_state.hpp"
#include "engine/paishan.hpp"
#include "engine/rule_config.hpp"
#include "engine/action.hpp"
#include "engine/pai.hpp"
#include <optional>
#include <vector>
#include <array>
#include <map>
#include <cstdint>


namespace Quezhuo{

enum struct Phase : std::uint_fast8_t
{
  game_start = 0u,
  dealing = 1u,
  // The acting seat has 14 tiles' worth and must act.
  player_discard = 2u,
  // Seats in the response queue declare on a discard or an added kan.
  waiting_for_response = 3u,
  // Replacement draw and dora reveal after a kan.
  action_processing = 4u,
  hand_over_scores = 5u,
  game_over = 6u,
}; // enum struct Phase

char const *getName(Phase phase) noexcept;

// 局の状態．Only `Table` mutates it.
class RoundState
{
public:
  static constexpr std::uint_fast8_t no_seat = 4u;

  RoundState(
    Quezhuo::RoundParameters const &parameters, Quezhuo::RuleConfig const &config,
    Quezhuo::Paishan paishan);

  RoundState(RoundState const &) = default;

  RoundState(RoundState &&) = default;

  RoundState &operator=(RoundState const &) = default;

  RoundState &operator=(RoundState &&) = default;

public:
  Quezhuo::RoundParameters const &getParameters() const noexcept
  {
    return parameters_;
  }

  Quezhuo::RuleConfig const &getConfig() const noexcept
  {
    return config_;
  }

  std::uint_fast8_t getZhuangjia() const noexcept
  {
    return parameters_.getZhuangjia();
  }

  Quezhuo::Paishan const &getPaishan() const noexcept
  {
    return paishan_;
  }

  Quezhuo::PlayerState const &getPlayer(std::uint_fast8_t seat) const;

  Phase getPhase() const noexcept
  {
    return phase_;
  }

  // The seat to draw or discard.
  std::uint_fast8_t getSeat() const noexcept
  {
    return seat_;
  }

  // The tile the response window is about, i.e. the last discard or the
  // tile of a pending jiagang.
  std::optional<Pai> const &getDapai() const noexcept
  {
    return dapai_;
  }

  std::uint_fast8_t getDapaiSeat() const noexcept
  {
    return dapai_seat_;
  }

  // The response window is on a jiagang (槍槓).
  bool isQianggang() const noexcept
  {
    return qianggang_;
  }

  // The acting seat has just called a chi or a peng and discards without a draw.
  bool isAfterFulu() const noexcept
  {
    return after_fulu_;
  }

  // The drawn tile came from the dead wall.
  bool isLingshang() const noexcept
  {
    return lingshang_;
  }

  // No discard yet by `seat` and no call by anybody.
  bool isFirstZimo(std::uint_fast8_t seat) const;

  std::vector<std::uint_fast8_t> const &getResponseQueue() const noexcept
  {
    return response_queue_;
  }

  std::map<std::uint_fast8_t, Action> const &getDeclarations() const noexcept
  {
    return declarations_;
  }

  std::optional<std::uint_fast8_t> getDelayedLizhi() const noexcept;

  std::array<bool, 4u> getTingpaiList() const;

  std::optional<Quezhuo::RoundResult> const &getResult() const noexcept
  {
    return result_;
  }

  // 四風連打
  bool checkSifengLianda() const;

  // 四家立直
  bool checkSijiaLizhi() const;

private:
  Quezhuo::PlayerState &getPlayer_(std::uint_fast8_t seat);

  void revealDelayedDora_();

  void onGangDora_(bool angang);

  void onFulu_();

public:
  // 配牌．Returns `false` if the wall runs out while dealing.
  bool deal();

  // Returns `false` on an exhausted live wall.
  bool onZimo(std::uint_fast8_t seat);

  // Returns `false` when no replacement tile can be drawn.
  bool onLingshangZimo();

  void onDapai(Pai pai, bool lizhi);

  // Makes the delayed lizhi effective and returns its seat.
  std::uint_fast8_t onLizhiAccepted();

  // Holds a jiagang of `pai` back while the others may rob it.
  void onQianggangWindow(Pai pai);

  void openResponseWindow(std::vector<std::uint_fast8_t> queue);

  void onDeclaration(std::uint_fast8_t seat, Action const &action);

  void closeResponseWindow() noexcept;

  // Sets 振聴 on every seat that let a winning tile pass.
  void onHupaiPassed();

  void onChi(std::uint_fast8_t seat, Chi const &chi);

  void onPeng(std::uint_fast8_t seat, Peng const &peng);

  void onDaminggang(std::uint_fast8_t seat);

  void onAngang(Pai pai);

  // Completes the jiagang held back by `onQianggangWindow`.
  void onJiagang();

  void onRoundEnd(Quezhuo::RoundResult result);

  void onGameOver() noexcept;

private:
  Quezhuo::RoundParameters parameters_;
  Quezhuo::RuleConfig config_;
  Quezhuo::Paishan paishan_;
  std::array<Quezhuo::PlayerState, 4u> players_;
  Phase phase_ = Phase::dealing;
  std::uint_fast8_t seat_;
  std::optional<Pai> dapai_{};
  std::uint_fast8_t dapai_seat_ = no_seat;
  bool qianggang_ = false;
  bool after_fulu_ = false;
  bool lingshang_ = false;
  std::array<bool, 4u> first_zimo_ = { true, true, true, true };
  std::uint_fast8_t lizhi_delayed_ = no_seat;
  bool double_lizhi_delayed_ = false;
  std::uint_fast8_t num_delayed_dora_ = 0u;
  std::vector<std::uint_fast8_t> response_queue_{};
  std::map<std::uint_fast8_t, Action> declarations_{};
  std::optional<Quezhuo::RoundResult> result_{};
}; // class RoundState

} // namespace Quezhuo

#endif // !defined(QUEZHUO_ENGINE_ROUND_STATE_HPP_INCLUDE_GUARD)
