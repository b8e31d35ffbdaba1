#include "engine/hule.hpp"

#include "engine/shoupai_analyzer.hpp"
#include "engine/yaku.hpp"
#include "engine/hule_form.hpp"
#include "engine/fulu.hpp"
#include "engine/pai.hpp"
#include "common/throw.hpp"
#include <ostream>
#include <algorithm>
#include <stdexcept>
#include <vector>
#include <cstddef>
#include <cstdint>


namespace{

using std::placeholders::_1;
using Quezhuo::Pai;

std::int_fast32_t roundUp100(std::int_fast32_t const points) noexcept
{
  return (points + 99) / 100 * 100;
}

std::uint_fast8_t countDora(
  std::vector<Pai> const &pais, std::vector<Pai> const &indicators) noexcept
{
  std::uint_fast8_t result = 0u;
  for (Pai const &indicator : indicators) {
    std::uint_fast8_t const dora = Quezhuo::getDoraValue(indicator.getValue());
    result += std::count_if(
      pais.cbegin(), pais.cend(), [dora](Pai const &p) { return p.getValue() == dora; });
  }
  return result;
}

std::uint_fast8_t sumHan(std::vector<Quezhuo::YakuEntry> const &yaku_list) noexcept
{
  std::uint_fast8_t han = 0u;
  for (Quezhuo::YakuEntry const &e : yaku_list) {
    han += e.han;
  }
  return han;
}

void settle(
  Quezhuo::HuleDetails &details, Quezhuo::HuleContext const &context)
{
  std::int_fast32_t const base = details.base_points;
  bool const zhuangjia = context.seat == context.zhuangjia;
  std::int_fast32_t const ben_chang = context.ben_chang;

  details.payments.fill(0);
  if (context.zimo) {
    for (std::uint_fast8_t i = 0u; i < 4u; ++i) {
      if (i == context.seat) {
        continue;
      }
      std::int_fast32_t const payment = zhuangjia || i == context.zhuangjia
        ? roundUp100(2 * base) : roundUp100(base);
      details.points += payment;
      details.payments[i] = payment + 100 * ben_chang;
    }
  }
  else {
    std::int_fast32_t const payment = roundUp100(base * (zhuangjia ? 6 : 4));
    details.points = payment;
    details.payments[context.loser] = payment + 300 * ben_chang;
  }

  details.delta_scores.fill(0);
  for (std::uint_fast8_t i = 0u; i < 4u; ++i) {
    details.delta_scores[i] -= details.payments[i];
    details.delta_scores[context.seat] += details.payments[i];
  }
  details.delta_scores[context.seat] += 1000 * context.lizhi_deposits;
}

} // namespace `anonymous`

namespace Quezhuo{

std::ostream &operator<<(std::ostream &os, HuleDetails const &details)
{
  if (!details.valid) {
    return os << "(no hule)";
  }
  for (YakuEntry const &e : details.yaku_list) {
    os << getName(e.yaku) << '(' << static_cast<unsigned>(e.han) << ") ";
  }
  if (details.yakuman == 0u) {
    os << "dora " << static_cast<unsigned>(details.dora)
       << " aka " << static_cast<unsigned>(details.aka_dora)
       << " ura " << static_cast<unsigned>(details.ura_dora) << ' ';
  }
  return os << static_cast<unsigned>(details.han) << "han "
            << static_cast<unsigned>(details.fu) << "fu " << details.points;
}

std::int_fast32_t calculateBasePoints(
  std::uint_fast8_t const han, std::uint_fast8_t const fu) noexcept
{
  if (han >= 13u) {
    // 数え役満
    return 8000;
  }
  if (han >= 11u) {
    // 三倍満
    return 6000;
  }
  if (han >= 8u) {
    // 倍満
    return 4000;
  }
  if (han >= 6u) {
    // 跳満
    return 3000;
  }
  if (han == 5u) {
    return 2000;
  }
  std::int_fast32_t const base = static_cast<std::int_fast32_t>(fu) << (han + 2u);
  return std::min<std::int_fast32_t>(base, 2000);
}

HuleDetails calculateHule(
  std::vector<Pai> const &shoupai, std::vector<Fulu> const &fulu_list, Pai const hupai,
  HuleContext const &context)
{
  if (context.seat >= 4u || context.zhuangjia >= 4u) {
    QUEZHUO_THROW<std::invalid_argument>(_1)
      << static_cast<unsigned>(context.seat) << ": an invalid seat.";
  }
  if (!context.zimo && (context.loser >= 4u || context.loser == context.seat)) {
    QUEZHUO_THROW<std::invalid_argument>(_1)
      << static_cast<unsigned>(context.loser) << ": an invalid loser of a rong.";
  }

  HuleDetails details;
  if (!context.zimo && context.zhenting) {
    return details;
  }

  std::vector<Pai> pais = shoupai;
  pais.push_back(hupai);
  std::vector<HuleForm> const forms = decomposeHule(pais, fulu_list);
  if (forms.empty()) {
    return details;
  }

  // 役満は通常役と複合しない．
  std::vector<YakuEntry> best_yakuman;
  HuleForm const *best_form = nullptr;
  for (HuleForm const &form : forms) {
    for (std::size_t const i : getHupaiIndices(form, hupai.getValue(), fulu_list.size())) {
      std::vector<YakuEntry> yakuman = findYakuman(form, i, context);
      if (yakuman.size() > best_yakuman.size()) {
        best_yakuman = std::move(yakuman);
        best_form = &form;
      }
    }
  }

  if (!best_yakuman.empty()) {
    details.valid = true;
    details.yakuman = best_yakuman.size();
    details.yaku_list = std::move(best_yakuman);
    details.han = 13u * details.yakuman;
    details.base_points = 8000 * details.yakuman;
    details.form = *best_form;
    settle(details, context);
    return details;
  }

  std::uint_fast8_t best_han = 0u;
  std::uint_fast8_t best_fu = 0u;
  std::vector<YakuEntry> best_yaku_list;
  for (HuleForm const &form : forms) {
    for (std::size_t const i : getHupaiIndices(form, hupai.getValue(), fulu_list.size())) {
      std::vector<YakuEntry> yaku_list = findYaku(form, i, hupai.getValue(), context);
      std::uint_fast8_t const han = sumHan(yaku_list);
      if (han == 0u) {
        continue;
      }
      bool const pinghu = std::any_of(
        yaku_list.cbegin(), yaku_list.cend(),
        [](YakuEntry const &e) { return e.yaku == Yaku::pinghu; });
      std::uint_fast8_t const fu = calculateFu(form, i, hupai.getValue(), context, pinghu);
      if (han > best_han || (han == best_han && fu > best_fu)) {
        best_han = han;
        best_fu = fu;
        best_yaku_list = std::move(yaku_list);
        best_form = &form;
      }
    }
  }
  if (best_han == 0u) {
    // 役なし
    return details;
  }

  std::vector<Pai> all_pais = pais;
  for (Fulu const &fulu : fulu_list) {
    all_pais.insert(all_pais.end(), fulu.getPais().cbegin(), fulu.getPais().cend());
  }

  details.valid = true;
  details.yaku_list = std::move(best_yaku_list);
  details.fu = best_fu;
  details.dora = countDora(all_pais, context.dora_indicators);
  details.aka_dora = std::count_if(
    all_pais.cbegin(), all_pais.cend(), [](Pai const &p) { return p.isRed(); });
  if (context.lizhi >= 1u) {
    details.ura_dora = countDora(all_pais, context.ura_dora_indicators);
  }
  details.han = best_han + details.dora + details.aka_dora + details.ura_dora;
  details.base_points = calculateBasePoints(details.han, details.fu);
  details.form = *best_form;
  settle(details, context);
  return details;
}

} // namespace Quezhuo
