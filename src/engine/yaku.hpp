#if !defined(QUEZHUO_ENGINE_YAKU_HPP_INCLUDE_GUARD)
#define QUEZHUO_ENGINE_YAKU_HPP_INCLUDE_GUARD

#include "engine/hule_form.hpp"
#include "engine/pai.hpp"
#include <vector>
#include <cstddef>
#include <cstdint>


namespace Quezhuo{

enum struct Yaku : std::uint_fast8_t
{
  // 1 翻
  lizhi,                // 立直
  yifa,                 // 一発
  menqian_qing_zimohu,  // 門前清自摸和
  pinghu,               // 平和
  duanyaojiu,           // 断幺九
  yibeikou,             // 一盃口
  menfengpai,           // 自風牌
  quanfengpai,          // 場風牌
  sanyuanpai_bai,       // 役牌 白
  sanyuanpai_fa,        // 役牌 發
  sanyuanpai_zhong,     // 役牌 中
  lingshang_kaihua,     // 嶺上開花
  qianggang,            // 槍槓
  haidi_laoyue,         // 海底撈月
  hedi_laoyu,           // 河底撈魚
  // 2 翻
  double_lizhi,         // ダブル立直
  qiduizi,              // 七対子
  hunquandaiyaojiu,     // 混全帯幺九
  yiqi_tongguan,        // 一気通貫
  sanse_tongshun,       // 三色同順
  sanse_tongke,         // 三色同刻
  sangangzi,            // 三槓子
  duiduihu,             // 対々和
  sananke,              // 三暗刻
  xiaosanyuan,          // 小三元
  hunlaotou,            // 混老頭
  // 3 翻以上
  erbeikou,             // 二盃口
  chunquandaiyaojiu,    // 純全帯幺九
  hunyise,              // 混一色
  qingyise,             // 清一色
  // 役満
  tianhu,               // 天和
  dihu,                 // 地和
  guoshi_wushuang,      // 国士無双
  sianke,               // 四暗刻
  dasanyuan,            // 大三元
  xiaosixi,             // 小四喜
  dasixi,               // 大四喜
  ziyise,               // 字一色
  qinglaotou,           // 清老頭
  lvyise,               // 緑一色
  jiulian_baodeng,      // 九蓮宝燈
  sigangzi,             // 四槓子
}; // enum struct Yaku

char const *getName(Yaku yaku) noexcept;

bool isYakuman(Yaku yaku) noexcept;

struct YakuEntry
{
  Yaku yaku;
  // 翻数．役満は 13．
  std::uint_fast8_t han;

  bool operator==(YakuEntry const &) const = default;
}; // struct YakuEntry

// The situation a hand is won in. Seats are absolute.
struct HuleContext
{
  static constexpr std::uint_fast8_t no_seat = 4u;

  std::uint_fast8_t seat = 0u;
  std::uint_fast8_t zhuangjia = 0u;
  // 場風．0: 東, 1: 南, 2: 西, 3: 北
  std::uint_fast8_t chang = 0u;
  // The discarder on a rong.
  std::uint_fast8_t loser = no_seat;
  bool zimo = false;
  // 0: none, 1: 立直, 2: ダブル立直
  std::uint_fast8_t lizhi = 0u;
  bool yifa = false;
  bool haidi = false;
  bool hedi = false;
  bool lingshang_kaihua = false;
  bool qianggang = false;
  bool tianhu = false;
  bool dihu = false;
  // 振聴．Only meaningful on a rong.
  bool zhenting = false;
  bool allow_kuitan = false;
  std::vector<Pai> dora_indicators{};
  std::vector<Pai> ura_dora_indicators{};
  std::uint_fast8_t ben_chang = 0u;
  std::uint_fast8_t lizhi_deposits = 0u;

  // 自風．0: 東, 1: 南, 2: 西, 3: 北
  std::uint_fast8_t getMenfeng() const noexcept
  {
    return (seat + 4u - zhuangjia) % 4u;
  }
}; // struct HuleContext

// Components of `form` that may hold the winning tile, i.e. concealed
// components containing `hupai`. `num_fulu` leading components are fulu.
std::vector<std::size_t> getHupaiIndices(
  HuleForm const &form, std::uint_fast8_t hupai, std::size_t num_fulu);

// 役満．`hupai_index` names the component completed by the winning tile.
std::vector<YakuEntry> findYakuman(
  HuleForm const &form, std::size_t hupai_index, HuleContext const &context);

// Every non-yakuman yaku, situational ones included. Dora are not yaku.
std::vector<YakuEntry> findYaku(
  HuleForm const &form, std::size_t hupai_index, std::uint_fast8_t hupai,
  HuleContext const &context);

// 符．Rounded up to a multiple of 10 except for 七対子 (25).
std::uint_fast8_t calculateFu(
  HuleForm const &form, std::size_t hupai_index, std::uint_fast8_t hupai,
  HuleContext const &context, bool pinghu);

} // namespace Quezhuo

#endif // !defined(QUEZHUO_ENGINE_YAKU_HPP_INCLUDE_GUARD)
