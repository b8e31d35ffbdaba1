#include "engine/candidates.hpp"

#include "engine/round_state.hpp"
#include "engine/game_state.hpp"
#include "engine/player_state.hpp"
#include "engine/paishan.hpp"
#include "engine/shoupai_analyzer.hpp"
#include "engine/hule.hpp"
#include "engine/yaku.hpp"
#include "engine/action.hpp"
#include "engine/fulu.hpp"
#include "engine/pai.hpp"
#include "engine/error.hpp"
#include "common/throw.hpp"
#include <algorithm>
#include <functional>
#include <optional>
#include <variant>
#include <vector>
#include <array>
#include <utility>
#include <map>
#include <cstdint>


namespace{

using std::placeholders::_1;
using Quezhuo::Pai;
using Quezhuo::Fulu;
using Quezhuo::FuluType;
using Quezhuo::Action;

std::vector<Pai> uniquePais(std::vector<Pai> pais)
{
  std::sort(pais.begin(), pais.end());
  pais.erase(std::unique(pais.begin(), pais.end()), pais.end());
  return pais;
}

std::vector<Pai> removePais(std::vector<Pai> pais, std::vector<Pai> const &removed)
{
  for (Pai const &pai : removed) {
    auto const found = std::find(pais.begin(), pais.end(), pai);
    if (found == pais.end()) {
      QUEZHUO_THROW<Quezhuo::InvariantViolation>(_1)
        << pai << ": Not in " << Quezhuo::toString(pais) << '.';
    }
    pais.erase(found);
  }
  return pais;
}

// Distinct pairs of tiles of `shoupai` with the values `v0` and `v1`, red
// fives telling them apart.
std::vector<std::array<Pai, 2u>> pickPairs(
  std::vector<Pai> const &shoupai, std::uint_fast8_t const v0, std::uint_fast8_t const v1)
{
  std::vector<std::array<Pai, 2u>> result;
  for (std::size_t i = 0u; i < shoupai.size(); ++i) {
    if (shoupai[i].getValue() != v0) {
      continue;
    }
    for (std::size_t j = v0 == v1 ? i + 1u : 0u; j < shoupai.size(); ++j) {
      if (shoupai[j].getValue() != v1) {
        continue;
      }
      std::array<Pai, 2u> pair{ shoupai[i], shoupai[j] };
      std::sort(pair.begin(), pair.end());
      if (std::find(result.cbegin(), result.cend(), pair) == result.cend()) {
        result.push_back(pair);
      }
    }
  }
  return result;
}

// Whether a tile is left to discard after the call of `fulu` with `pair`.
bool canDapaiAfterFulu(
  std::vector<Pai> const &shoupai, std::array<Pai, 2u> const &pair, Fulu const &fulu,
  bool const forbid_kuikae)
{
  std::vector<Pai> const rest = removePais(shoupai, { pair[0u], pair[1u] });
  if (!forbid_kuikae) {
    return !rest.empty();
  }
  std::vector<std::uint_fast8_t> const kuikae = Quezhuo::calculateKuikaeValues(fulu);
  return std::any_of(
    rest.cbegin(), rest.cend(),
    [&kuikae](Pai const &pai) {
      return std::find(kuikae.cbegin(), kuikae.cend(), pai.getValue()) == kuikae.cend();
    });
}

std::uint_fast8_t getPriority(Action const &action) noexcept
{
  return std::visit(Quezhuo::Overloaded{
      [](Quezhuo::Rong const &) -> std::uint_fast8_t { return 3u; },
      [](Quezhuo::Peng const &) -> std::uint_fast8_t { return 2u; },
      [](Quezhuo::Gang const &a) -> std::uint_fast8_t {
        return a.type == FuluType::daminggang ? 2u : 0u;
      },
      [](Quezhuo::Chi const &) -> std::uint_fast8_t { return 1u; },
      [](auto const &) -> std::uint_fast8_t { return 0u; }
    }, action);
}

} // namespace `anonymous`

namespace Quezhuo{

HuleContext createHuleContext(
  GameState const &game_state, RoundState const &round_state, std::uint_fast8_t const seat,
  bool const zimo)
{
  PlayerState const &player = round_state.getPlayer(seat);
  Paishan const &paishan = round_state.getPaishan();

  HuleContext context;
  context.seat = seat;
  context.zhuangjia = round_state.getZhuangjia();
  context.chang = round_state.getParameters().chang;
  context.zimo = zimo;
  context.lizhi = player.getLizhi();
  context.yifa = player.isYifa();
  if (zimo) {
    context.haidi = !round_state.isLingshang() && paishan.getNumLeftPais() == 0u;
    context.lingshang_kaihua = round_state.isLingshang();
    if (round_state.isFirstZimo(seat)) {
      context.tianhu = seat == context.zhuangjia;
      context.dihu = seat != context.zhuangjia;
    }
  }
  else {
    context.loser = round_state.getDapaiSeat();
    context.qianggang = round_state.isQianggang();
    context.hedi = !round_state.isQianggang() && paishan.getNumLeftPais() == 0u;
    context.zhenting = player.isZhenting();
  }
  context.allow_kuitan = round_state.getConfig().allow_kuitan;
  context.dora_indicators = paishan.getDoraIndicators();
  context.ura_dora_indicators = paishan.getUraDoraIndicators();
  context.ben_chang = game_state.getBenChang();
  context.lizhi_deposits = game_state.getNumLizhiDeposits();
  return context;
}

std::vector<Action> getCandidatesOnZimo(
  GameState const &game_state, RoundState const &round_state, std::uint_fast8_t const seat)
{
  std::vector<Action> result;
  if (round_state.getPhase() != Phase::player_discard || seat != round_state.getSeat()) {
    return result;
  }

  PlayerState const &player = round_state.getPlayer(seat);
  if (player.getNumPais() != 14u) {
    QUEZHUO_THROW<InvariantViolation>(_1)
      << "seat " << static_cast<unsigned>(seat) << ": "
      << static_cast<unsigned>(player.getNumPais()) << " tiles on its turn.";
  }

  if (round_state.isAfterFulu()) {
    // 鳴いた後は打牌のみ．喰い替えは禁止．
    std::vector<std::uint_fast8_t> const &kuikae = player.getKuikaeValues();
    for (Pai const &pai : uniquePais(player.getShoupai())) {
      if (std::find(kuikae.cbegin(), kuikae.cend(), pai.getValue()) == kuikae.cend()) {
        result.push_back(Dapai{ pai });
      }
    }
    return result;
  }

  if (!player.getZimoPai()) {
    QUEZHUO_THROW<InvariantViolation>(_1)
      << "seat " << static_cast<unsigned>(seat) << ": No drawn tile on its turn.";
  }
  Pai const zimo_pai = *player.getZimoPai();
  Paishan const &paishan = round_state.getPaishan();
  std::vector<Pai> const concealed = player.getConcealedPais();
  std::vector<Fulu> const &fulu_list = player.getFuluList();
  bool const can_gang = paishan.getNumLeftPais() > 0u && paishan.getNumLeftLingshangPais() > 0u;

  if (player.getLizhi() != 0u) {
    // 立直後はツモ切りと待ちの変わらない暗槓のみ．
    result.push_back(Dapai{ zimo_pai });
    std::vector<Pai> const &shoupai = player.getShoupai();
    std::vector<Pai> gang_pais;
    for (Pai const &pai : shoupai) {
      if (pai.getValue() == zimo_pai.getValue()) {
        gang_pais.push_back(pai);
      }
    }
    if (can_gang && gang_pais.size() == 3u) {
      std::vector<Pai> const rest = removePais(shoupai, gang_pais);
      gang_pais.push_back(zimo_pai);
      std::vector<Fulu> new_fulu_list = fulu_list;
      new_fulu_list.emplace_back(FuluType::angang, gang_pais, zimo_pai, Fulu::no_seat);
      if (calculateHupaiList(rest, new_fulu_list) == player.getHupaiList()) {
        result.push_back(Gang{ FuluType::angang, zimo_pai });
      }
    }
  }
  else {
    std::vector<Pai> const pais = uniquePais(concealed);
    for (Pai const &pai : pais) {
      result.push_back(Dapai{ pai });
    }

    if (player.isMenqian() && game_state.getPlayerScore(seat) >= 1000
        && paishan.getNumLeftPais() >= 4u)
    {
      for (Pai const &pai : pais) {
        if (isTingpai(removePais(concealed, { pai }), fulu_list)) {
          result.push_back(Lizhi{ pai });
        }
      }
    }

    if (can_gang) {
      PaiCounts const counts = countPais(concealed);
      for (std::size_t i = 0u; i < pais.size(); ++i) {
        std::uint_fast8_t const v = pais[i].getValue();
        if (counts[v] == 4u && (i == 0u || pais[i - 1u].getValue() != v)) {
          result.push_back(Gang{ FuluType::angang, pais[i] });
        }
      }
      for (Fulu const &fulu : fulu_list) {
        if (fulu.getType() != FuluType::peng) {
          continue;
        }
        auto const found = std::find_if(
          concealed.cbegin(), concealed.cend(),
          [&fulu](Pai const &p) { return p.getValue() == fulu.getFirstValue(); });
        if (found != concealed.cend()) {
          result.push_back(Gang{ FuluType::jiagang, *found });
        }
      }
    }
  }

  HuleContext const context = createHuleContext(game_state, round_state, seat, true);
  if (calculateHule(player.getShoupai(), fulu_list, zimo_pai, context).valid) {
    result.push_back(Zimohu{});
  }

  if (round_state.isFirstZimo(seat) && countYaojiuKinds(concealed) >= 9u) {
    result.push_back(JiuzhongJiupai{});
  }

  return result;
}

std::vector<Action> getCandidatesOnDapai(
  GameState const &game_state, RoundState const &round_state, std::uint_fast8_t const seat)
{
  std::vector<Action> result;
  if (!round_state.getDapai() || seat >= 4u || seat == round_state.getDapaiSeat()
      || round_state.getResult())
  {
    return result;
  }

  Pai const dapai = *round_state.getDapai();
  std::uint_fast8_t const value = dapai.getValue();
  PlayerState const &player = round_state.getPlayer(seat);
  Paishan const &paishan = round_state.getPaishan();
  std::vector<Pai> const &shoupai = player.getShoupai();

  std::vector<std::uint_fast8_t> const &hupai_list = player.getHupaiList();
  if (std::binary_search(hupai_list.cbegin(), hupai_list.cend(), value)) {
    HuleContext const context = createHuleContext(game_state, round_state, seat, false);
    if (calculateHule(shoupai, player.getFuluList(), dapai, context).valid) {
      result.push_back(Rong{});
    }
  }

  // 槍槓と河底牌には和了しかできない．
  if (!round_state.isQianggang() && paishan.getNumLeftPais() > 0u && player.getLizhi() == 0u) {
    std::uint_fast8_t const dapai_seat = round_state.getDapaiSeat();
    bool const forbid_kuikae = round_state.getConfig().forbid_kuikae;

    for (std::array<Pai, 2u> const &pair : pickPairs(shoupai, value, value)) {
      Fulu const fulu(FuluType::peng, { pair[0u], pair[1u], dapai }, dapai, dapai_seat);
      if (canDapaiAfterFulu(shoupai, pair, fulu, forbid_kuikae)) {
        result.push_back(Peng{ dapai, pair });
      }
    }

    std::size_t const num_same = std::count_if(
      shoupai.cbegin(), shoupai.cend(), [value](Pai const &p) { return p.getValue() == value; });
    if (num_same == 3u && paishan.getNumLeftLingshangPais() > 0u) {
      result.push_back(Gang{ FuluType::daminggang, dapai });
    }

    if (seat == (dapai_seat + 1u) % 4u && !isZipai(value)) {
      std::int_fast8_t const number = getNumber(value);
      static constexpr std::array<std::array<std::int_fast8_t, 2u>, 3u> offsets{ {
        { -2, -1 }, { -1, 1 }, { 1, 2 }
      } };
      for (std::array<std::int_fast8_t, 2u> const &offset : offsets) {
        if (number + offset[0u] < 1 || number + offset[1u] > 9) {
          continue;
        }
        std::uint_fast8_t const v0 = value + offset[0u];
        std::uint_fast8_t const v1 = value + offset[1u];
        for (std::array<Pai, 2u> const &pair : pickPairs(shoupai, v0, v1)) {
          Fulu const fulu(FuluType::chi, { pair[0u], pair[1u], dapai }, dapai, dapai_seat);
          if (canDapaiAfterFulu(shoupai, pair, fulu, forbid_kuikae)) {
            result.push_back(Chi{ dapai, pair });
          }
        }
      }
    }
  }

  result.push_back(Skip{});
  return result;
}

std::optional<std::pair<std::uint_fast8_t, Action>> resolveDeclarations(
  std::map<std::uint_fast8_t, Action> const &declarations, std::uint_fast8_t const dapai_seat)
{
  std::uint_fast8_t best = 0u;
  for (auto const &[seat, action] : declarations) {
    best = std::max(best, getPriority(action));
  }
  if (best == 0u) {
    return std::nullopt;
  }

  for (std::uint_fast8_t i = 1u; i < 4u; ++i) {
    std::uint_fast8_t const seat = (dapai_seat + 4u - i) % 4u;
    auto const found = declarations.find(seat);
    if (found != declarations.cend() && getPriority(found->second) == best) {
      return std::make_pair(seat, found->second);
    }
  }
  return std::nullopt;
}

} // namespace Quezhuo
