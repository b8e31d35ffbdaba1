#include "engine/round_state.hpp"

#include "engine/round_result.hpp"
#include "engine/player_state.hpp"
#include "engine/paishan.hpp"
#include "engine/rule_config.hpp"
#include "engine/action.hpp"
#include "engine/fulu.hpp"
#include "engine/pai.hpp"
#include "engine/error.hpp"
#include "common/throw.hpp"
#include <algorithm>
#include <functional>
#include <optional>
#include <vector>
#include <array>
#include <utility>
#include <stdexcept>
#include <cstdint>


namespace{

using std::placeholders::_1;

} // namespace `anonymous`

namespace Quezhuo{

char const *getName(Phase const phase) noexcept
{
  switch (phase) {
  case Phase::game_start:
    return "game_start";
  case Phase::dealing:
    return "dealing";
  case Phase::player_discard:
    return "player_discard";
  case Phase::waiting_for_response:
    return "waiting_for_response";
  case Phase::action_processing:
    return "action_processing";
  case Phase::hand_over_scores:
    return "hand_over_scores";
  case Phase::game_over:
    return "game_over";
  }
  return "unknown";
}

RoundState::RoundState(
  Quezhuo::RoundParameters const &parameters, Quezhuo::RuleConfig const &config,
  Quezhuo::Paishan paishan)
  : parameters_(parameters),
    config_(config),
    paishan_(std::move(paishan)),
    players_{ PlayerState(0u), PlayerState(1u), PlayerState(2u), PlayerState(3u) },
    seat_(parameters.getZhuangjia())
{
  if (parameters_.ju >= 4u) {
    QUEZHUO_THROW<std::invalid_argument>(_1)
      << static_cast<unsigned>(parameters_.ju) << ": An invalid hand number.";
  }
}

Quezhuo::PlayerState const &RoundState::getPlayer(std::uint_fast8_t const seat) const
{
  if (seat >= 4u) {
    QUEZHUO_THROW<std::invalid_argument>(_1) << static_cast<unsigned>(seat) << ": An invalid seat.";
  }
  return players_[seat];
}

Quezhuo::PlayerState &RoundState::getPlayer_(std::uint_fast8_t const seat)
{
  if (seat >= 4u) {
    QUEZHUO_THROW<InvariantViolation>(_1) << static_cast<unsigned>(seat) << ": An invalid seat.";
  }
  return players_[seat];
}

bool RoundState::isFirstZimo(std::uint_fast8_t const seat) const
{
  if (seat >= 4u) {
    QUEZHUO_THROW<std::invalid_argument>(_1) << static_cast<unsigned>(seat) << ": An invalid seat.";
  }
  return first_zimo_[seat];
}

std::optional<std::uint_fast8_t> RoundState::getDelayedLizhi() const noexcept
{
  if (lizhi_delayed_ == no_seat) {
    return std::nullopt;
  }
  return lizhi_delayed_;
}

std::array<bool, 4u> RoundState::getTingpaiList() const
{
  std::array<bool, 4u> result{};
  for (std::uint_fast8_t i = 0u; i < 4u; ++i) {
    result[i] = players_[i].isTingpai();
  }
  return result;
}

bool RoundState::checkSifengLianda() const
{
  std::optional<std::uint_fast8_t> value;
  for (PlayerState const &player : players_) {
    if (player.getHe().size() != 1u || !player.getFuluList().empty()) {
      return false;
    }
    std::uint_fast8_t const v = player.getHe().front().pai.getValue();
    if (!isFeng(v) || (value && *value != v)) {
      return false;
    }
    value = v;
  }
  return true;
}

bool RoundState::checkSijiaLizhi() const
{
  return std::all_of(
    players_.cbegin(), players_.cend(),
    [](PlayerState const &player) { return player.getLizhi() != 0u; });
}

void RoundState::revealDelayedDora_()
{
  for (; num_delayed_dora_ > 0u; --num_delayed_dora_) {
    paishan_.revealNewDora();
  }
}

void RoundState::onGangDora_(bool const angang)
{
  // 前の槓の新ドラ
  revealDelayedDora_();

  switch (config_.gang_dora_timing) {
  case GangDoraTiming::immediate:
    paishan_.revealNewDora();
    break;
  case GangDoraTiming::after_lingshang:
    ++num_delayed_dora_;
    break;
  case GangDoraTiming::angang_immediate:
    if (angang) {
      paishan_.revealNewDora();
    }
    else {
      ++num_delayed_dora_;
    }
    break;
  }
}

void RoundState::onFulu_()
{
  for (PlayerState &player : players_) {
    player.onYifaCleared();
  }
  first_zimo_.fill(false);
}

bool RoundState::deal()
{
  if (phase_ != Phase::dealing) {
    QUEZHUO_THROW<InvariantViolation>(_1) << getName(phase_) << ": Not dealing.";
  }

  std::uint_fast8_t const zhuangjia = getZhuangjia();
  for (std::uint_fast8_t round = 0u; round < 4u; ++round) {
    std::uint_fast8_t const n = round < 3u ? 4u : 1u;
    for (std::uint_fast8_t i = 0u; i < 4u; ++i) {
      PlayerState &player = players_[(zhuangjia + i) % 4u];
      for (std::uint_fast8_t j = 0u; j < n; ++j) {
        std::optional<Pai> const pai = paishan_.drawPai();
        if (!pai) {
          return false;
        }
        player.onDeal(*pai);
      }
    }
  }

  // 親の第一ツモ
  return onZimo(zhuangjia);
}

bool RoundState::onZimo(std::uint_fast8_t const seat)
{
  std::optional<Pai> const pai = paishan_.drawPai();
  if (!pai) {
    return false;
  }
  getPlayer_(seat).onZimo(*pai);
  seat_ = seat;
  dapai_.reset();
  dapai_seat_ = no_seat;
  qianggang_ = false;
  after_fulu_ = false;
  lingshang_ = false;
  phase_ = Phase::player_discard;
  return true;
}

bool RoundState::onLingshangZimo()
{
  std::optional<Pai> const pai = paishan_.drawLingshangPai();
  if (!pai) {
    return false;
  }
  getPlayer_(seat_).onZimo(*pai);
  after_fulu_ = false;
  lingshang_ = true;
  phase_ = Phase::player_discard;
  return true;
}

void RoundState::onDapai(Pai const pai, bool const lizhi)
{
  if (phase_ != Phase::player_discard) {
    QUEZHUO_THROW<InvariantViolation>(_1) << getName(phase_) << ": A discard out of turn.";
  }

  revealDelayedDora_();
  getPlayer_(seat_).onDapai(pai, lizhi);
  if (lizhi) {
    lizhi_delayed_ = seat_;
    double_lizhi_delayed_ = first_zimo_[seat_];
  }
  first_zimo_[seat_] = false;
  dapai_ = pai;
  dapai_seat_ = seat_;
  after_fulu_ = false;
  lingshang_ = false;
}

std::uint_fast8_t RoundState::onLizhiAccepted()
{
  if (lizhi_delayed_ == no_seat) {
    QUEZHUO_THROW<InvariantViolation>("No lizhi to accept.");
  }
  std::uint_fast8_t const seat = lizhi_delayed_;
  getPlayer_(seat).onLizhiAccepted(double_lizhi_delayed_);
  lizhi_delayed_ = no_seat;
  double_lizhi_delayed_ = false;
  return seat;
}

void RoundState::onQianggangWindow(Pai const pai)
{
  if (phase_ != Phase::player_discard) {
    QUEZHUO_THROW<InvariantViolation>(_1) << getName(phase_) << ": A kan out of turn.";
  }
  dapai_ = pai;
  dapai_seat_ = seat_;
  qianggang_ = true;
}

void RoundState::openResponseWindow(std::vector<std::uint_fast8_t> queue)
{
  if (!dapai_) {
    QUEZHUO_THROW<InvariantViolation>("A response window without a tile.");
  }
  response_queue_ = std::move(queue);
  declarations_.clear();
  phase_ = Phase::waiting_for_response;
}

void RoundState::onDeclaration(std::uint_fast8_t const seat, Action const &action)
{
  if (phase_ != Phase::waiting_for_response || response_queue_.empty()
      || response_queue_.front() != seat)
  {
    QUEZHUO_THROW<InvariantViolation>(_1)
      << static_cast<unsigned>(seat) << ": A declaration out of turn.";
  }
  response_queue_.erase(response_queue_.begin());
  declarations_.emplace(seat, action);
}

void RoundState::closeResponseWindow() noexcept
{
  response_queue_.clear();
  declarations_.clear();
}

void RoundState::onHupaiPassed()
{
  if (!dapai_) {
    QUEZHUO_THROW<InvariantViolation>("No tile to let pass.");
  }
  std::uint_fast8_t const value = dapai_->getValue();
  for (std::uint_fast8_t i = 0u; i < 4u; ++i) {
    if (i == dapai_seat_) {
      continue;
    }
    PlayerState &player = players_[i];
    std::vector<std::uint_fast8_t> const &hupai_list = player.getHupaiList();
    if (!std::binary_search(hupai_list.cbegin(), hupai_list.cend(), value)) {
      continue;
    }
    player.onTongxunZhenting();
    if (player.getLizhi() != 0u) {
      player.onLizhiZhenting();
    }
  }
}

void RoundState::onChi(std::uint_fast8_t const seat, Chi const &chi)
{
  if (!dapai_ || *dapai_ != chi.target || qianggang_) {
    QUEZHUO_THROW<InvariantViolation>(_1) << Action(chi) << ": Not on the last discard.";
  }
  Fulu fulu(FuluType::chi, { chi.pais[0u], chi.pais[1u], chi.target }, chi.target, dapai_seat_);
  getPlayer_(dapai_seat_).onDapaiCalled();
  getPlayer_(seat).onChi(std::move(fulu), config_.forbid_kuikae);
  onFulu_();
  seat_ = seat;
  after_fulu_ = true;
  lingshang_ = false;
  phase_ = Phase::player_discard;
}

void RoundState::onPeng(std::uint_fast8_t const seat, Peng const &peng)
{
  if (!dapai_ || *dapai_ != peng.target || qianggang_) {
    QUEZHUO_THROW<InvariantViolation>(_1) << Action(peng) << ": Not on the last discard.";
  }
  Fulu fulu(FuluType::peng, { peng.pais[0u], peng.pais[1u], peng.target }, peng.target, dapai_seat_);
  getPlayer_(dapai_seat_).onDapaiCalled();
  getPlayer_(seat).onPeng(std::move(fulu), config_.forbid_kuikae);
  onFulu_();
  seat_ = seat;
  after_fulu_ = true;
  lingshang_ = false;
  phase_ = Phase::player_discard;
}

void RoundState::onDaminggang(std::uint_fast8_t const seat)
{
  if (!dapai_ || qianggang_) {
    QUEZHUO_THROW<InvariantViolation>("A daminggang without a discard.");
  }
  Pai const dapai = *dapai_;
  std::vector<Pai> pais;
  for (Pai const &pai : getPlayer_(seat).getShoupai()) {
    if (pai.getValue() == dapai.getValue()) {
      pais.push_back(pai);
    }
  }
  pais.push_back(dapai);
  Fulu fulu(FuluType::daminggang, std::move(pais), dapai, dapai_seat_);
  getPlayer_(dapai_seat_).onDapaiCalled();
  getPlayer_(seat).onDaminggang(std::move(fulu));
  onFulu_();
  seat_ = seat;
  after_fulu_ = false;
  phase_ = Phase::action_processing;
  onGangDora_(false);
}

void RoundState::onAngang(Pai const pai)
{
  if (phase_ != Phase::player_discard) {
    QUEZHUO_THROW<InvariantViolation>(_1) << getName(phase_) << ": A kan out of turn.";
  }
  PlayerState &player = getPlayer_(seat_);
  std::vector<Pai> pais;
  for (Pai const &p : player.getConcealedPais()) {
    if (p.getValue() == pai.getValue()) {
      pais.push_back(p);
    }
  }
  Fulu fulu(FuluType::angang, std::move(pais), pai, Fulu::no_seat);
  player.onAngang(std::move(fulu));
  onFulu_();
  phase_ = Phase::action_processing;
  onGangDora_(true);
}

void RoundState::onJiagang()
{
  if (!qianggang_ || !dapai_ || dapai_seat_ != seat_) {
    QUEZHUO_THROW<InvariantViolation>("No jiagang to complete.");
  }
  getPlayer_(seat_).onJiagang(*dapai_);
  dapai_.reset();
  dapai_seat_ = no_seat;
  qianggang_ = false;
  onFulu_();
  phase_ = Phase::action_processing;
  onGangDora_(false);
}

void RoundState::onRoundEnd(Quezhuo::RoundResult result)
{
  if (result_) {
    QUEZHUO_THROW<InvariantViolation>("The hand has already ended.");
  }
  closeResponseWindow();
  result_ = std::move(result);
  phase_ = Phase::hand_over_scores;
}

void RoundState::onGameOver() noexcept
{
  phase_ = Phase::game_over;
}

} // namespace Quezhuo
