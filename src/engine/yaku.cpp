#include "engine/yaku.hpp"

#include "engine/hule_form.hpp"
#include "engine/pai.hpp"
#include <algorithm>
#include <vector>
#include <array>
#include <cstddef>
#include <cstdint>


namespace{

using Quezhuo::Yaku;
using Quezhuo::YakuEntry;
using Quezhuo::HuleContext;
using Quezhuo::HuleForm;
using Quezhuo::HuleShape;
using Quezhuo::Mianzi;
using Quezhuo::MianziType;
using Quezhuo::PaiCounts;
using Quezhuo::num_pai_values;

enum struct Tingpai : std::uint_fast8_t
{
  liangmian, // 両面
  kanzhang,  // 嵌張
  bianzhang, // 辺張
  shuangpeng, // 双碰
  danqi,     // 単騎
}; // enum struct Tingpai

Tingpai getTingpai(Mianzi const &m, std::uint_fast8_t const hupai) noexcept
{
  switch (m.type) {
  case MianziType::duizi:
    return Tingpai::danqi;
  case MianziType::kezi:
  case MianziType::gangzi:
    return Tingpai::shuangpeng;
  case MianziType::shunzi:
    break;
  }
  if (hupai == m.first + 1u) {
    return Tingpai::kanzhang;
  }
  if (hupai == m.first && Quezhuo::getNumber(m.first) == 7u) {
    return Tingpai::bianzhang;
  }
  if (hupai == m.first + 2u && Quezhuo::getNumber(m.first) == 1u) {
    return Tingpai::bianzhang;
  }
  return Tingpai::liangmian;
}

bool isKezi(Mianzi const &m) noexcept
{
  return m.type == MianziType::kezi || m.type == MianziType::gangzi;
}

// 暗刻．A kezi completed by a rong counts as open.
bool isAnke(
  HuleForm const &form, std::size_t const i, std::size_t const hupai_index,
  bool const zimo) noexcept
{
  Mianzi const &m = form.mianzi_list[i];
  if (!isKezi(m) || m.open) {
    return false;
  }
  return !(m.type == MianziType::kezi && i == hupai_index && !zimo);
}

bool isMenqian(HuleForm const &form) noexcept
{
  return std::none_of(
    form.mianzi_list.cbegin(), form.mianzi_list.cend(),
    [](Mianzi const &m) { return m.open; });
}

PaiCounts countFormPais(HuleForm const &form) noexcept
{
  PaiCounts counts{};
  if (form.shape == HuleShape::guoshi) {
    for (std::uint_fast8_t i = 0u; i < num_pai_values; ++i) {
      if (Quezhuo::isYaojiu(i)) {
        ++counts[i];
      }
    }
    ++counts[form.getJiangpai().first];
    return counts;
  }
  for (Mianzi const &m : form.mianzi_list) {
    switch (m.type) {
    case MianziType::shunzi:
      ++counts[m.first];
      ++counts[m.first + 1u];
      ++counts[m.first + 2u];
      break;
    case MianziType::kezi:
      counts[m.first] += 3u;
      break;
    case MianziType::gangzi:
      counts[m.first] += 4u;
      break;
    case MianziType::duizi:
      counts[m.first] += 2u;
      break;
    }
  }
  return counts;
}

struct PaiSummary
{
  bool has_zipai = false;
  bool has_zhongzhang = false; // 中張牌 (2-8)
  bool has_laotou = false;
  // Bit i set when suit i appears.
  std::uint_fast8_t suits = 0u;
  bool all_green = true;
}; // struct PaiSummary

PaiSummary summarize(PaiCounts const &counts) noexcept
{
  PaiSummary summary;
  for (std::uint_fast8_t i = 0u; i < num_pai_values; ++i) {
    if (counts[i] == 0u) {
      continue;
    }
    if (Quezhuo::isZipai(i)) {
      summary.has_zipai = true;
    }
    else {
      summary.suits |= 1u << Quezhuo::getSuit(i);
      if (Quezhuo::isLaotou(i)) {
        summary.has_laotou = true;
      }
      else {
        summary.has_zhongzhang = true;
      }
    }
    // 緑一色: 2s 3s 4s 6s 8s 發
    switch (i) {
    case 19u: case 20u: case 21u: case 23u: case 25u: case 32u:
      break;
    default:
      summary.all_green = false;
    }
  }
  return summary;
}

bool isSingleSuit(PaiSummary const &summary) noexcept
{
  return summary.suits == 1u || summary.suits == 2u || summary.suits == 4u;
}

bool containsYaojiu(Mianzi const &m) noexcept
{
  if (m.type == MianziType::shunzi) {
    return Quezhuo::isLaotou(m.first) || Quezhuo::isLaotou(m.first + 2u);
  }
  return Quezhuo::isYaojiu(m.first);
}

bool isYakuhai(std::uint_fast8_t const value, HuleContext const &context) noexcept
{
  return Quezhuo::isSanyuan(value) || value == 27u + context.getMenfeng()
    || value == 27u + context.chang;
}

void push(std::vector<YakuEntry> &result, Yaku const yaku, std::uint_fast8_t const han)
{
  result.push_back({ yaku, han });
}

} // namespace `anonymous`

namespace Quezhuo{

char const *getName(Yaku const yaku) noexcept
{
  switch (yaku) {
  case Yaku::lizhi: return "lizhi";
  case Yaku::yifa: return "yifa";
  case Yaku::menqian_qing_zimohu: return "menqian_qing_zimohu";
  case Yaku::pinghu: return "pinghu";
  case Yaku::duanyaojiu: return "duanyaojiu";
  case Yaku::yibeikou: return "yibeikou";
  case Yaku::menfengpai: return "menfengpai";
  case Yaku::quanfengpai: return "quanfengpai";
  case Yaku::sanyuanpai_bai: return "sanyuanpai_bai";
  case Yaku::sanyuanpai_fa: return "sanyuanpai_fa";
  case Yaku::sanyuanpai_zhong: return "sanyuanpai_zhong";
  case Yaku::lingshang_kaihua: return "lingshang_kaihua";
  case Yaku::qianggang: return "qianggang";
  case Yaku::haidi_laoyue: return "haidi_laoyue";
  case Yaku::hedi_laoyu: return "hedi_laoyu";
  case Yaku::double_lizhi: return "double_lizhi";
  case Yaku::qiduizi: return "qiduizi";
  case Yaku::hunquandaiyaojiu: return "hunquandaiyaojiu";
  case Yaku::yiqi_tongguan: return "yiqi_tongguan";
  case Yaku::sanse_tongshun: return "sanse_tongshun";
  case Yaku::sanse_tongke: return "sanse_tongke";
  case Yaku::sangangzi: return "sangangzi";
  case Yaku::duiduihu: return "duiduihu";
  case Yaku::sananke: return "sananke";
  case Yaku::xiaosanyuan: return "xiaosanyuan";
  case Yaku::hunlaotou: return "hunlaotou";
  case Yaku::erbeikou: return "erbeikou";
  case Yaku::chunquandaiyaojiu: return "chunquandaiyaojiu";
  case Yaku::hunyise: return "hunyise";
  case Yaku::qingyise: return "qingyise";
  case Yaku::tianhu: return "tianhu";
  case Yaku::dihu: return "dihu";
  case Yaku::guoshi_wushuang: return "guoshi_wushuang";
  case Yaku::sianke: return "sianke";
  case Yaku::dasanyuan: return "dasanyuan";
  case Yaku::xiaosixi: return "xiaosixi";
  case Yaku::dasixi: return "dasixi";
  case Yaku::ziyise: return "ziyise";
  case Yaku::qinglaotou: return "qinglaotou";
  case Yaku::lvyise: return "lvyise";
  case Yaku::jiulian_baodeng: return "jiulian_baodeng";
  case Yaku::sigangzi: return "sigangzi";
  }
  return "unknown";
}

bool isYakuman(Yaku const yaku) noexcept
{
  return yaku >= Yaku::tianhu;
}

std::vector<std::size_t> getHupaiIndices(
  HuleForm const &form, std::uint_fast8_t const hupai, std::size_t const num_fulu)
{
  std::vector<std::size_t> result;
  if (form.shape == HuleShape::guoshi) {
    result.push_back(0u);
    return result;
  }
  std::size_t const begin = form.shape == HuleShape::standard ? num_fulu : 0u;
  for (std::size_t i = begin; i < form.mianzi_list.size(); ++i) {
    if (form.mianzi_list[i].contains(hupai)) {
      result.push_back(i);
    }
  }
  return result;
}

std::vector<YakuEntry> findYakuman(
  HuleForm const &form, std::size_t const hupai_index, HuleContext const &context)
{
  std::vector<YakuEntry> result;

  if (context.tianhu) {
    push(result, Yaku::tianhu, 13u);
  }
  if (context.dihu) {
    push(result, Yaku::dihu, 13u);
  }

  PaiCounts const counts = countFormPais(form);
  PaiSummary const summary = summarize(counts);

  if (form.shape == HuleShape::guoshi) {
    push(result, Yaku::guoshi_wushuang, 13u);
    return result;
  }

  if (form.shape == HuleShape::standard) {
    std::uint_fast8_t num_anke = 0u;
    std::uint_fast8_t num_gangzi = 0u;
    std::uint_fast8_t num_sanyuan_kezi = 0u;
    std::uint_fast8_t num_feng_kezi = 0u;
    for (std::size_t i = 0u; i + 1u < form.mianzi_list.size(); ++i) {
      Mianzi const &m = form.mianzi_list[i];
      if (isAnke(form, i, hupai_index, context.zimo)) {
        ++num_anke;
      }
      if (m.type == MianziType::gangzi) {
        ++num_gangzi;
      }
      if (isKezi(m) && isSanyuan(m.first)) {
        ++num_sanyuan_kezi;
      }
      if (isKezi(m) && isFeng(m.first)) {
        ++num_feng_kezi;
      }
    }

    if (num_anke == 4u) {
      push(result, Yaku::sianke, 13u);
    }
    if (num_sanyuan_kezi == 3u) {
      push(result, Yaku::dasanyuan, 13u);
    }
    if (num_feng_kezi == 4u) {
      push(result, Yaku::dasixi, 13u);
    }
    else if (num_feng_kezi == 3u && isFeng(form.getJiangpai().first)) {
      push(result, Yaku::xiaosixi, 13u);
    }
    if (num_gangzi == 4u) {
      push(result, Yaku::sigangzi, 13u);
    }

    // 九蓮宝燈: 1112345678999 + 1 tile of the same suit, no fulu at all.
    if (isMenqian(form) && num_gangzi == 0u && !summary.has_zipai
        && isSingleSuit(summary))
    {
      std::uint_fast8_t const base = summary.suits == 1u ? 0u : summary.suits == 2u ? 9u : 18u;
      bool jiulian = counts[base] >= 3u && counts[base + 8u] >= 3u;
      for (std::uint_fast8_t i = 1u; i < 8u; ++i) {
        jiulian = jiulian && counts[base + i] >= 1u;
      }
      if (jiulian) {
        push(result, Yaku::jiulian_baodeng, 13u);
      }
    }
  }

  if (!summary.has_laotou && !summary.has_zhongzhang) {
    push(result, Yaku::ziyise, 13u);
  }
  if (!summary.has_zipai && !summary.has_zhongzhang) {
    push(result, Yaku::qinglaotou, 13u);
  }
  if (summary.all_green) {
    push(result, Yaku::lvyise, 13u);
  }

  return result;
}

std::vector<YakuEntry> findYaku(
  HuleForm const &form, std::size_t const hupai_index, std::uint_fast8_t const hupai,
  HuleContext const &context)
{
  std::vector<YakuEntry> result;
  bool const menqian = isMenqian(form);

  if (context.lizhi == 1u) {
    push(result, Yaku::lizhi, 1u);
  }
  if (context.lizhi == 2u) {
    push(result, Yaku::double_lizhi, 2u);
  }
  if (context.yifa) {
    push(result, Yaku::yifa, 1u);
  }
  if (menqian && context.zimo) {
    push(result, Yaku::menqian_qing_zimohu, 1u);
  }
  if (context.lingshang_kaihua) {
    push(result, Yaku::lingshang_kaihua, 1u);
  }
  if (context.qianggang) {
    push(result, Yaku::qianggang, 1u);
  }
  if (context.haidi && context.zimo) {
    push(result, Yaku::haidi_laoyue, 1u);
  }
  if (context.hedi && !context.zimo) {
    push(result, Yaku::hedi_laoyu, 1u);
  }

  PaiCounts const counts = countFormPais(form);
  PaiSummary const summary = summarize(counts);

  if (!summary.has_zipai && !summary.has_laotou && (menqian || context.allow_kuitan)) {
    push(result, Yaku::duanyaojiu, 1u);
  }
  if (isSingleSuit(summary)) {
    if (summary.has_zipai) {
      push(result, Yaku::hunyise, menqian ? 3u : 2u);
    }
    else {
      push(result, Yaku::qingyise, menqian ? 6u : 5u);
    }
  }
  if (!summary.has_zhongzhang && summary.has_zipai && summary.has_laotou) {
    push(result, Yaku::hunlaotou, 2u);
  }

  if (form.shape == HuleShape::qidui) {
    push(result, Yaku::qiduizi, 2u);
    return result;
  }
  if (form.shape != HuleShape::standard) {
    return result;
  }

  std::vector<Mianzi> const &mianzi_list = form.mianzi_list;
  Mianzi const &jiangpai = form.getJiangpai();
  std::size_t const num_mianzi = mianzi_list.size() - 1u;

  std::uint_fast8_t num_shunzi = 0u;
  std::uint_fast8_t num_anke = 0u;
  std::uint_fast8_t num_gangzi = 0u;
  std::uint_fast8_t num_sanyuan_kezi = 0u;
  // Bit (suit) set per number for shunzi starting at that number and for kezi.
  std::array<std::uint_fast8_t, 9u> shunzi_suits{};
  std::array<std::uint_fast8_t, 9u> kezi_suits{};
  std::array<std::uint_fast8_t, 27u> concealed_shunzi{};
  bool all_yaojiu = containsYaojiu(jiangpai);

  for (std::size_t i = 0u; i < num_mianzi; ++i) {
    Mianzi const &m = mianzi_list[i];
    all_yaojiu = all_yaojiu && containsYaojiu(m);
    if (m.type == MianziType::shunzi) {
      ++num_shunzi;
      shunzi_suits[getNumber(m.first) - 1u] |= 1u << getSuit(m.first);
      if (!m.open) {
        ++concealed_shunzi[m.first];
      }
      continue;
    }
    if (isAnke(form, i, hupai_index, context.zimo)) {
      ++num_anke;
    }
    if (m.type == MianziType::gangzi) {
      ++num_gangzi;
    }
    if (isZipai(m.first)) {
      if (m.first == 31u) {
        push(result, Yaku::sanyuanpai_bai, 1u);
      }
      if (m.first == 32u) {
        push(result, Yaku::sanyuanpai_fa, 1u);
      }
      if (m.first == 33u) {
        push(result, Yaku::sanyuanpai_zhong, 1u);
      }
      if (isSanyuan(m.first)) {
        ++num_sanyuan_kezi;
      }
      if (m.first == 27u + context.getMenfeng()) {
        push(result, Yaku::menfengpai, 1u);
      }
      if (m.first == 27u + context.chang) {
        push(result, Yaku::quanfengpai, 1u);
      }
    }
    else {
      kezi_suits[getNumber(m.first) - 1u] |= 1u << getSuit(m.first);
    }
  }

  if (menqian && num_shunzi == 4u && !isYakuhai(jiangpai.first, context)
      && getTingpai(mianzi_list[hupai_index], hupai) == Tingpai::liangmian)
  {
    push(result, Yaku::pinghu, 1u);
  }

  if (menqian) {
    std::uint_fast8_t num_beikou = 0u;
    for (std::uint_fast8_t const n : concealed_shunzi) {
      num_beikou += n / 2u;
    }
    if (num_beikou == 2u) {
      push(result, Yaku::erbeikou, 3u);
    }
    else if (num_beikou == 1u) {
      push(result, Yaku::yibeikou, 1u);
    }
  }

  for (std::uint_fast8_t n = 0u; n < 9u; ++n) {
    if (shunzi_suits[n] == 7u) {
      push(result, Yaku::sanse_tongshun, menqian ? 2u : 1u);
      break;
    }
  }
  for (std::uint_fast8_t n = 0u; n < 9u; ++n) {
    if (kezi_suits[n] == 7u) {
      push(result, Yaku::sanse_tongke, 2u);
      break;
    }
  }
  for (std::uint_fast8_t suit = 0u; suit < 3u; ++suit) {
    std::uint_fast8_t const bit = 1u << suit;
    if ((shunzi_suits[0u] & bit) != 0u && (shunzi_suits[3u] & bit) != 0u
        && (shunzi_suits[6u] & bit) != 0u)
    {
      push(result, Yaku::yiqi_tongguan, menqian ? 2u : 1u);
      break;
    }
  }

  if (all_yaojiu && num_shunzi >= 1u) {
    if (summary.has_zipai) {
      push(result, Yaku::hunquandaiyaojiu, menqian ? 2u : 1u);
    }
    else {
      push(result, Yaku::chunquandaiyaojiu, menqian ? 3u : 2u);
    }
  }

  if (num_shunzi == 0u) {
    push(result, Yaku::duiduihu, 2u);
  }
  if (num_anke == 3u) {
    push(result, Yaku::sananke, 2u);
  }
  if (num_gangzi == 3u) {
    push(result, Yaku::sangangzi, 2u);
  }
  if (num_sanyuan_kezi == 2u && isSanyuan(jiangpai.first)) {
    push(result, Yaku::xiaosanyuan, 2u);
  }

  return result;
}

std::uint_fast8_t calculateFu(
  HuleForm const &form, std::size_t const hupai_index, std::uint_fast8_t const hupai,
  HuleContext const &context, bool const pinghu)
{
  if (form.shape == HuleShape::qidui) {
    return 25u;
  }

  // 副底
  std::uint_fast8_t fu = 20u;
  if (pinghu && context.zimo) {
    return fu;
  }

  bool const menqian = isMenqian(form);
  if (menqian && !context.zimo) {
    // 門前加符
    fu += 10u;
  }
  if (context.zimo) {
    fu += 2u;
  }

  if (form.shape == HuleShape::standard) {
    for (std::size_t i = 0u; i + 1u < form.mianzi_list.size(); ++i) {
      Mianzi const &m = form.mianzi_list[i];
      if (!isKezi(m)) {
        continue;
      }
      std::uint_fast8_t mianzi_fu = m.type == MianziType::kezi ? 2u : 8u;
      if (isAnke(form, i, hupai_index, context.zimo)) {
        mianzi_fu *= 2u;
      }
      if (isYaojiu(m.first)) {
        mianzi_fu *= 2u;
      }
      fu += mianzi_fu;
    }

    std::uint_fast8_t const jiangpai = form.getJiangpai().first;
    if (isSanyuan(jiangpai)) {
      fu += 2u;
    }
    if (jiangpai == 27u + context.getMenfeng()) {
      fu += 2u;
    }
    if (jiangpai == 27u + context.chang) {
      fu += 2u;
    }

    switch (getTingpai(form.mianzi_list[hupai_index], hupai)) {
    case Tingpai::kanzhang:
    case Tingpai::bianzhang:
    case Tingpai::danqi:
      fu += 2u;
      break;
    case Tingpai::liangmian:
    case Tingpai::shuangpeng:
      break;
    }
  }

  fu = (fu + 9u) / 10u * 10u;
  if (!menqian && fu == 20u) {
    // 喰い平和形
    fu = 30u;
  }
  return fu;
}

} // namespace Quezhuo
