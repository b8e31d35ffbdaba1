#include "engine/table.hpp"

#include "engine/candidates.hpp"
#include "engine/round_state.hpp"
#include "engine/game_state.hpp"
#include "engine/round_result.hpp"
#include "engine/player_state.hpp"
#include "engine/hule.hpp"
#include "engine/pingju.hpp"
#include "engine/rule_config.hpp"
#include "engine/paishan.hpp"
#include "engine/action.hpp"
#include "engine/utility.hpp"
#include "engine/error.hpp"
#include "common/throw.hpp"
#include <iostream>
#include <random>
#include <algorithm>
#include <functional>
#include <optional>
#include <variant>
#include <vector>
#include <utility>
#include <stdexcept>
#include <exception>
#include <cstdint>


namespace{

using std::placeholders::_1;

} // namespace `anonymous`

namespace Quezhuo{

Table::Table(Quezhuo::RuleConfig const &config)
  : config_(config),
    urng_(),
    game_state_(config)
{}

void Table::resetGame()
{
  resetGame(getRandomSeed());
}

void Table::resetGame(std::vector<std::uint_least32_t> const &seed)
{
  std::seed_seq seed_seq(seed.cbegin(), seed.cend());
  urng_.seed(seed_seq);
  game_state_ = GameState(config_);
  round_state_.reset();
  last_round_result_.reset();
  pending_round_result_.reset();
  broken_ = false;
  startRound_();
}

void Table::resetRound()
{
  if (broken_ || !round_state_ || game_state_.isGameOver()) {
    QUEZHUO_THROW<std::logic_error>("No hand to deal again.");
  }
  round_state_.reset();
  pending_round_result_.reset();
  startRound_();
}

void Table::setTestPaishans(std::vector<Quezhuo::Paishan> paishans)
{
  test_paishans_.assign(
    std::make_move_iterator(paishans.begin()), std::make_move_iterator(paishans.end()));
}

Phase Table::getPhase() const noexcept
{
  if (!round_state_) {
    return Phase::game_start;
  }
  return round_state_->getPhase();
}

std::uint_fast8_t Table::getCurrentSeat() const
{
  if (broken_ || !round_state_) {
    return RoundState::no_seat;
  }
  switch (round_state_->getPhase()) {
  case Phase::player_discard:
    return round_state_->getSeat();
  case Phase::waiting_for_response:
    return round_state_->getResponseQueue().front();
  default:
    return RoundState::no_seat;
  }
}

std::vector<Action> Table::getCandidates(std::uint_fast8_t const seat) const
{
  if (broken_ || !round_state_ || seat >= 4u) {
    return {};
  }
  switch (round_state_->getPhase()) {
  case Phase::player_discard:
    return getCandidatesOnZimo(game_state_, *round_state_, seat);
  case Phase::waiting_for_response:
    if (round_state_->getResponseQueue().front() != seat) {
      return {};
    }
    return getCandidatesOnDapai(game_state_, *round_state_, seat);
  default:
    return {};
  }
}

Quezhuo::RoundState const &Table::getRoundState() const
{
  if (!round_state_) {
    QUEZHUO_THROW<std::logic_error>("No hand has been dealt.");
  }
  return *round_state_;
}

bool Table::isGameOver() const noexcept
{
  return game_state_.isGameOver();
}

Quezhuo::Paishan Table::createPaishan_()
{
  if (!test_paishans_.empty()) {
    Paishan paishan = std::move(test_paishans_.front());
    test_paishans_.pop_front();
    return paishan;
  }
  return Paishan(urng_, config_);
}

void Table::startRound_()
{
  round_state_.emplace(game_state_.getRoundParameters(), config_, createPaishan_());
  if (!round_state_->deal()) {
    endRoundByLiuju_(LiujuType::dealing_exhaustion);
  }
}

void Table::endRound_(Quezhuo::RoundResult result)
{
  result.parameters = game_state_.getRoundParameters();
  round_state_->onRoundEnd(result);
  game_state_.onRoundEnd(result);
  last_round_result_ = result;
  pending_round_result_ = std::move(result);

  if (game_state_.isGameOver()) {
    round_state_->onGameOver();
    return;
  }
  startRound_();
}

void Table::endRoundByLiuju_(Quezhuo::LiujuType const type)
{
  RoundResult result;
  result.type = RoundEndType::liuju;
  result.liuju = type;
  result.tingpai = round_state_->getTingpaiList();
  endRound_(std::move(result));
}

void Table::endRoundByHule_(std::uint_fast8_t const seat, bool const zimo)
{
  RoundState const &round_state = *round_state_;
  PlayerState const &player = round_state.getPlayer(seat);
  std::optional<Pai> const &hupai = zimo ? player.getZimoPai() : round_state.getDapai();
  if (!hupai) {
    QUEZHUO_THROW<InvariantViolation>(_1)
      << "seat " << static_cast<unsigned>(seat) << ": No tile to win on.";
  }

  HuleContext const context = createHuleContext(game_state_, round_state, seat, zimo);
  HuleDetails details = calculateHule(player.getShoupai(), player.getFuluList(), *hupai, context);
  if (!details.valid) {
    QUEZHUO_THROW<InvariantViolation>(_1)
      << "seat " << static_cast<unsigned>(seat) << ": " << *hupai << ": Not a winning hand.";
  }

  RoundResult result;
  result.type = zimo ? RoundEndType::zimo : RoundEndType::rong;
  result.winner = seat;
  result.loser = zimo ? RoundResult::no_seat : round_state.getDapaiSeat();
  result.delta_scores = details.delta_scores;
  result.hule = std::move(details);
  result.tingpai = round_state.getTingpaiList();
  endRound_(std::move(result));
}

void Table::afterGang_()
{
  // 嶺上牌
  if (!round_state_->onLingshangZimo()) {
    endRoundByLiuju_(LiujuType::lingshang_exhaustion);
  }
}

void Table::afterDapai_()
{
  RoundState &round_state = *round_state_;

  std::vector<std::uint_fast8_t> queue;
  for (std::uint_fast8_t i = 1u; i < 4u; ++i) {
    std::uint_fast8_t const seat = (round_state.getDapaiSeat() + i) % 4u;
    // `Skip` is always there.
    if (getCandidatesOnDapai(game_state_, round_state, seat).size() >= 2u) {
      queue.push_back(seat);
    }
  }

  if (queue.empty()) {
    onResponsesPassed_();
    return;
  }
  round_state.openResponseWindow(std::move(queue));
}

void Table::onResponsesPassed_()
{
  RoundState &round_state = *round_state_;
  round_state.onHupaiPassed();

  if (round_state.isQianggang()) {
    round_state.onJiagang();
    afterGang_();
    return;
  }

  if (round_state.getDelayedLizhi()) {
    game_state_.onSuccessfulLizhi(round_state.onLizhiAccepted());
    if (config_.sijia_lizhi && round_state.checkSijiaLizhi()) {
      endRoundByLiuju_(LiujuType::sijia_lizhi);
      return;
    }
  }

  if (config_.sifeng_lianda && round_state.checkSifengLianda()) {
    endRoundByLiuju_(LiujuType::sifeng_lianda);
    return;
  }

  if (round_state.getPaishan().getNumLeftPais() == 0u) {
    // 荒牌平局
    RoundResult result;
    result.type = RoundEndType::huangpai_pingju;
    result.tingpai = round_state.getTingpaiList();
    result.delta_scores = calculateNotenPayments(result.tingpai);
    endRound_(std::move(result));
    return;
  }

  if (!round_state.onZimo((round_state.getDapaiSeat() + 1u) % 4u)) {
    QUEZHUO_THROW<InvariantViolation>("Failed to draw from a live wall with tiles left.");
  }
}

void Table::onResponsesResolved_()
{
  RoundState &round_state = *round_state_;
  std::optional<std::pair<std::uint_fast8_t, Action>> const resolved
    = resolveDeclarations(round_state.getDeclarations(), round_state.getDapaiSeat());
  round_state.closeResponseWindow();
  if (!resolved) {
    onResponsesPassed_();
    return;
  }

  std::uint_fast8_t const seat = resolved->first;
  Action const &action = resolved->second;
  if (std::holds_alternative<Rong>(action)) {
    endRoundByHule_(seat, false);
    return;
  }

  // The discard survived: 振聴 for the others and the lizhi takes effect.
  round_state.onHupaiPassed();
  if (round_state.getDelayedLizhi()) {
    game_state_.onSuccessfulLizhi(round_state.onLizhiAccepted());
    if (config_.sijia_lizhi && round_state.checkSijiaLizhi()) {
      endRoundByLiuju_(LiujuType::sijia_lizhi);
      return;
    }
  }

  std::visit(Overloaded{
      [&](Chi const &chi) {
        round_state.onChi(seat, chi);
      },
      [&](Peng const &peng) {
        round_state.onPeng(seat, peng);
      },
      [&](Gang const &gang) {
        if (gang.type != FuluType::daminggang) {
          QUEZHUO_THROW<InvariantViolation>(_1) << Action(gang) << ": Not a response.";
        }
        round_state.onDaminggang(seat);
        afterGang_();
      },
      [&](auto const &a) {
        QUEZHUO_THROW<InvariantViolation>(_1) << Action(a) << ": Not a response.";
      }
    }, action);
}

void Table::onPlayerAction_(Action const &action)
{
  RoundState &round_state = *round_state_;
  std::visit(Overloaded{
      [&](Dapai const &dapai) {
        round_state.onDapai(dapai.pai, false);
        afterDapai_();
      },
      [&](Lizhi const &lizhi) {
        round_state.onDapai(lizhi.pai, true);
        afterDapai_();
      },
      [&](Gang const &gang) {
        switch (gang.type) {
        case FuluType::angang:
          round_state.onAngang(gang.pai);
          afterGang_();
          return;
        case FuluType::jiagang:
          break;
        default:
          QUEZHUO_THROW<InvariantViolation>(_1) << Action(gang) << ": Not on a turn.";
        }

        // 槍槓の受付
        round_state.onQianggangWindow(gang.pai);
        std::vector<std::uint_fast8_t> queue;
        for (std::uint_fast8_t i = 1u; i < 4u; ++i) {
          std::uint_fast8_t const seat = (round_state.getSeat() + i) % 4u;
          if (getCandidatesOnDapai(game_state_, round_state, seat).size() >= 2u) {
            queue.push_back(seat);
          }
        }
        if (queue.empty()) {
          round_state.onJiagang();
          afterGang_();
          return;
        }
        round_state.openResponseWindow(std::move(queue));
      },
      [&](Zimohu const &) {
        endRoundByHule_(round_state.getSeat(), true);
      },
      [&](JiuzhongJiupai const &) {
        endRoundByLiuju_(LiujuType::jiuzhong_jiupai);
      },
      [&](auto const &a) {
        QUEZHUO_THROW<InvariantViolation>(_1) << Action(a) << ": Not on a turn.";
      }
    }, action);
}

void Table::onResponse_(std::uint_fast8_t const seat, Action const &action)
{
  round_state_->onDeclaration(seat, action);
  if (round_state_->getResponseQueue().empty()) {
    onResponsesResolved_();
  }
}

ApplyResult Table::apply(std::uint_fast8_t const seat, Action const &action)
{
  if (broken_) {
    QUEZHUO_THROW<InvariantViolation>("The table is broken by an earlier invariant violation.");
  }

  std::vector<Action> const candidates = getCandidates(seat);
  if (std::find(candidates.cbegin(), candidates.cend(), action) == candidates.cend()) {
    return { ApplyStatus::illegal_action, getPhase(), std::nullopt };
  }

  pending_round_result_.reset();
  try {
    if (round_state_->getPhase() == Phase::player_discard) {
      onPlayerAction_(action);
    }
    else {
      onResponse_(seat, action);
    }
  }
  catch (std::logic_error const &) {
    broken_ = true;
    std::cerr << "quezhuo: seat " << static_cast<unsigned>(seat) << ": " << action
              << ": An invariant violation. The table is no longer usable." << std::endl;
    printExceptionChain(std::cerr, std::current_exception());
    QUEZHUO_THROW_WITH_NESTED<InvariantViolation>(_1)
      << "seat " << static_cast<unsigned>(seat) << ": " << action << ": Failed to apply.";
  }

  ApplyResult result{ ApplyStatus::accepted, getPhase(), std::move(pending_round_result_) };
  pending_round_result_.reset();
  return result;
}

} // namespace Quezhuo
