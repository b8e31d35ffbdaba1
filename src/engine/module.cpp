#include "engine/module.hpp"

#include "engine/table.hpp"
#include "engine/round_state.hpp"
#include "engine/game_state.hpp"
#include "engine/round_result.hpp"
#include "engine/player_state.hpp"
#include "engine/rule_config.hpp"
#include "engine/action.hpp"
#include "engine/fulu.hpp"
#include "engine/pai.hpp"
#include "engine/utility.hpp"
#include "common/throw.hpp"
#include <boost/python/extract.hpp>
#include <boost/python/dict.hpp>
#include <boost/python/list.hpp>
#include <boost/python/str.hpp>
#include <boost/python/object.hpp>
#include <iostream>
#include <sstream>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <stdexcept>
#include <exception>
#include <cstdint>


namespace{

using std::placeholders::_1;
namespace python = boost::python;

template<typename T>
T extractValue(python::object const &o, char const *name)
{
  python::extract<T> value(o);
  if (!value.check()) {
    QUEZHUO_THROW<std::invalid_argument>(_1) << "`" << name << "': A type error.";
  }
  return value();
}

Quezhuo::RuleConfig makeRuleConfig(python::dict const &config)
{
  Quezhuo::RuleConfig result;

  if (python::object o = config.get("initial_score"); !o.is_none()) {
    result.initial_score = extractValue<long>(o, "initial_score");
  }
  if (python::object o = config.get("use_red_fives"); !o.is_none()) {
    std::uint_fast8_t const n = extractValue<bool>(o, "use_red_fives") ? 1u : 0u;
    result.num_red_fives = { n, n, n };
  }
  if (python::object o = config.get("allow_kuitan"); !o.is_none()) {
    result.allow_kuitan = extractValue<bool>(o, "allow_kuitan");
  }
  if (python::object o = config.get("forbid_kuikae"); !o.is_none()) {
    result.forbid_kuikae = extractValue<bool>(o, "forbid_kuikae");
  }
  if (python::object o = config.get("sifeng_lianda"); !o.is_none()) {
    result.sifeng_lianda = extractValue<bool>(o, "sifeng_lianda");
  }
  if (python::object o = config.get("sijia_lizhi"); !o.is_none()) {
    result.sijia_lizhi = extractValue<bool>(o, "sijia_lizhi");
  }
  if (python::object o = config.get("target_score"); !o.is_none()) {
    result.target_score = extractValue<long>(o, "target_score");
  }

  if (python::object o = config.get("game_rules"); !o.is_none()) {
    python::dict const game_rules = extractValue<python::dict>(o, "game_rules");
    if (python::object p = game_rules.get("game_length"); !p.is_none()) {
      std::string const game_length = extractValue<std::string>(p, "game_length");
      if (game_length == "tonpuusen") {
        result.game_length = Quezhuo::GameLength::dongfeng_zhan;
      }
      else if (game_length == "hanchan") {
        result.game_length = Quezhuo::GameLength::banzhuang;
      }
      else if (game_length == "issousen") {
        result.game_length = Quezhuo::GameLength::yizhuang;
      }
      else {
        QUEZHUO_THROW<std::invalid_argument>(_1)
          << game_length << ": An invalid value for `game_length'.";
      }
    }
    if (python::object p = game_rules.get("min_game_end_score"); !p.is_none()) {
      result.min_game_end_score = extractValue<long>(p, "min_game_end_score");
    }
  }

  result.validate();
  return result;
}

std::uint_fast8_t toSeat(long const seat)
{
  if (seat < 0 || 4 <= seat) {
    QUEZHUO_THROW<std::invalid_argument>(_1) << seat << ": An invalid seat.";
  }
  return seat;
}

template<typename T>
std::string toStr(T const &value)
{
  std::ostringstream oss;
  oss << value;
  return oss.str();
}

python::dict makePlayerSnapshot(
  Quezhuo::PlayerState const &player, Quezhuo::GameState const &game_state)
{
  python::dict result;
  result["score"] = game_state.getPlayerScore(player.getSeat());
  result["shoupai"] = Quezhuo::toString(player.getShoupai());
  if (player.getZimoPai()) {
    result["zimo_pai"] = player.getZimoPai()->toString();
  }
  else {
    result["zimo_pai"] = python::object();
  }

  python::list fulu_list;
  for (Quezhuo::Fulu const &fulu : player.getFuluList()) {
    fulu_list.append(fulu.toString());
  }
  result["fulu_list"] = fulu_list;

  python::list he;
  for (Quezhuo::HeEntry const &e : player.getHe()) {
    python::dict entry;
    entry["pai"] = e.pai.toString();
    entry["moqi"] = e.moqi;
    entry["lizhi"] = e.lizhi;
    entry["called"] = e.called;
    he.append(entry);
  }
  result["he"] = he;

  result["lizhi"] = static_cast<long>(player.getLizhi());
  result["yifa"] = player.isYifa();
  result["zhenting"] = player.isZhenting();
  return result;
}

} // namespace `anonymous`

namespace Quezhuo{

PythonTable::PythonTable(python::dict config)
  : p_table_(std::make_unique<Table>(makeRuleConfig(config)))
{}

void PythonTable::reset(python::object seed)
{
  if (seed.is_none()) {
    p_table_->resetGame();
    return;
  }

  python::list const seed_list = extractValue<python::list>(seed, "seed");
  std::vector<std::uint_least32_t> seed_;
  for (long i = 0; i < python::len(seed_list); ++i) {
    seed_.push_back(extractValue<unsigned long>(seed_list[i], "seed"));
  }
  if (seed_.empty()) {
    QUEZHUO_THROW<std::invalid_argument>("`seed' is empty.");
  }
  p_table_->resetGame(seed_);
}

void PythonTable::resetRound()
{
  p_table_->resetRound();
}

python::list PythonTable::getLegalActions(long const seat) const
{
  python::list result;
  for (Action const &action : p_table_->getCandidates(toSeat(seat))) {
    result.append(toString(action));
  }
  return result;
}

python::dict PythonTable::apply(long const seat, long const index)
{
  std::uint_fast8_t const seat_ = toSeat(seat);

  python::dict result;
  std::vector<Action> const candidates = p_table_->getCandidates(seat_);
  if (index < 0 || static_cast<long>(candidates.size()) <= index) {
    result["status"] = "illegal_action";
    result["phase"] = getName(p_table_->getPhase());
    result["round_result"] = python::object();
    return result;
  }

  ApplyResult applied = [&]() {
    try {
      return p_table_->apply(seat_, candidates[index]);
    }
    catch (std::exception const &) {
      std::cerr << "_quezhuo: Failed to apply `" << candidates[index] << "' by seat " << seat
                << '.' << std::endl;
      throw;
    }
  }();

  result["status"] = applied.status == ApplyStatus::accepted ? "accepted" : "illegal_action";
  result["phase"] = getName(applied.phase);
  if (applied.round_result) {
    result["round_result"] = toStr(*applied.round_result);
  }
  else {
    result["round_result"] = python::object();
  }
  return result;
}

python::dict PythonTable::getSnapshot() const
{
  GameState const &game_state = p_table_->getGameState();

  python::dict result;
  result["phase"] = getName(p_table_->getPhase());
  result["chang"] = static_cast<long>(game_state.getChang());
  result["ju"] = static_cast<long>(game_state.getJu());
  result["ben_chang"] = static_cast<long>(game_state.getBenChang());
  result["lizhi_deposits"] = static_cast<long>(game_state.getNumLizhiDeposits());

  python::list scores;
  for (std::int_fast32_t const score : game_state.getScores()) {
    scores.append(static_cast<long>(score));
  }
  result["scores"] = scores;

  python::list rankings;
  for (std::uint_fast8_t i = 0u; i < 4u; ++i) {
    rankings.append(static_cast<long>(game_state.getPlayerRanking(i)));
  }
  result["rankings"] = rankings;

  std::uint_fast8_t const current_seat = p_table_->getCurrentSeat();
  if (current_seat < 4u) {
    result["current_seat"] = static_cast<long>(current_seat);
  }
  else {
    result["current_seat"] = python::object();
  }

  if (!p_table_->hasRoundState()) {
    return result;
  }
  RoundState const &round_state = p_table_->getRoundState();

  result["dora_indicators"] = toString(round_state.getPaishan().getDoraIndicators());
  result["num_left_pais"] = static_cast<long>(round_state.getPaishan().getNumLeftPais());
  python::list players;
  for (std::uint_fast8_t i = 0u; i < 4u; ++i) {
    players.append(makePlayerSnapshot(round_state.getPlayer(i), game_state));
  }
  result["players"] = players;

  if (p_table_->getLastRoundResult()) {
    result["last_round_result"] = toStr(*p_table_->getLastRoundResult());
  }
  return result;
}

bool PythonTable::isGameOver() const
{
  return p_table_->isGameOver();
}

} // namespace Quezhuo
