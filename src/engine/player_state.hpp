#if !defined(QUEZHUO_ENGINE_PLAYER_STATE_HPP_INCLUDE_GUARD)
#define QUEZHUO_ENGINE_PLAYER_STATE_HPP_INCLUDE_GUARD

#include "engine/fulu.hpp"
#include "engine/pai.hpp"
#include <optional>
#include <vector>
#include <cstdint>


namespace Quezhuo{

// 河の 1 枚
struct HeEntry
{
  Pai pai;
  // ツモ切り
  bool moqi;
  // 立直宣言牌
  bool lizhi;
  // 鳴かれた
  bool called;

  bool operator==(HeEntry const &) const = default;
}; // struct HeEntry

// 喰い替えで切れない牌の種類．The called value, and for a chi completing a
// run at either end also the value three away from it.
std::vector<std::uint_fast8_t> calculateKuikaeValues(Fulu const &fulu);

class PlayerState
{
public:
  explicit PlayerState(std::uint_fast8_t seat);

  PlayerState(PlayerState const &) = default;

  PlayerState(PlayerState &&) = default;

  PlayerState &operator=(PlayerState const &) = default;

  PlayerState &operator=(PlayerState &&) = default;

public:
  std::uint_fast8_t getSeat() const noexcept
  {
    return seat_;
  }

  // 手牌．Sorted, the drawn tile excluded.
  std::vector<Pai> const &getShoupai() const noexcept
  {
    return shoupai_;
  }

  std::optional<Pai> const &getZimoPai() const noexcept
  {
    return zimo_pai_;
  }

  // Concealed tiles with the drawn tile, sorted.
  std::vector<Pai> getConcealedPais() const;

  std::vector<Fulu> const &getFuluList() const noexcept
  {
    return fulu_list_;
  }

  std::vector<HeEntry> const &getHe() const noexcept
  {
    return he_;
  }

  // 0: none, 1: 立直, 2: ダブル立直
  std::uint_fast8_t getLizhi() const noexcept
  {
    return lizhi_;
  }

  bool isYifa() const noexcept
  {
    return yifa_;
  }

  bool isMenqian() const noexcept;

  std::uint_fast8_t getNumGangzi() const noexcept;

  // 待ち牌．Valid whenever the hand holds 13 tiles' worth.
  std::vector<std::uint_fast8_t> const &getHupaiList() const noexcept
  {
    return hupai_list_;
  }

  bool isTingpai() const noexcept
  {
    return !hupai_list_.empty();
  }

  // 喰い替えで切れない牌
  std::vector<std::uint_fast8_t> const &getKuikaeValues() const noexcept
  {
    return kuikae_values_;
  }

  // 捨て牌による振聴
  bool isHeZhenting() const;

  bool isTongxunZhenting() const noexcept
  {
    return tongxun_zhenting_;
  }

  bool isLizhiZhenting() const noexcept
  {
    return lizhi_zhenting_;
  }

  bool isZhenting() const;

  // The number of tiles held, every kan counted as 3.
  std::uint_fast8_t getNumPais() const noexcept;

public:
  // 配牌
  void onDeal(Pai pai);

  void onZimo(Pai pai);

  // `pai` is taken from the drawn-tile slot when it holds that very tile.
  void onDapai(Pai pai, bool lizhi);

  void onLizhiAccepted(bool double_lizhi) noexcept;

  void onYifaCleared() noexcept
  {
    yifa_ = false;
  }

  void onDapaiCalled();

  void onChi(Fulu fulu, bool forbid_kuikae);

  void onPeng(Fulu fulu, bool forbid_kuikae);

  void onDaminggang(Fulu fulu);

  void onAngang(Fulu fulu);

  // Upgrades the peng of the value of `pai`.
  void onJiagang(Pai pai);

  // 同巡内振聴
  void onTongxunZhenting() noexcept
  {
    tongxun_zhenting_ = true;
  }

  // 立直後の見逃し
  void onLizhiZhenting() noexcept
  {
    lizhi_zhenting_ = true;
  }

private:
  void mergeZimoPai_();

  void removePai_(Pai pai);

  void updateHupaiList_();

private:
  std::uint_fast8_t seat_;
  std::vector<Pai> shoupai_{};
  std::optional<Pai> zimo_pai_{};
  std::vector<Fulu> fulu_list_{};
  std::vector<HeEntry> he_{};
  std::uint_fast8_t lizhi_ = 0u;
  bool yifa_ = false;
  bool tongxun_zhenting_ = false;
  bool lizhi_zhenting_ = false;
  std::vector<std::uint_fast8_t> kuikae_values_{};
  std::vector<std::uint_fast8_t> hupai_list_{};
}; // class PlayerState

} // namespace Quezhuo

#endif // !defined(QUEZHUO_ENGINE_PLAYER_STATE_HPP_INCLUDE_GUARD)
