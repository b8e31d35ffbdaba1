#include "engine/player_state.hpp"

#include "engine/shoupai_analyzer.hpp"
#include "engine/error.hpp"
#include "engine/fulu.hpp"
#include "engine/pai.hpp"
#include "common/throw.hpp"
#include <algorithm>
#include <functional>
#include <optional>
#include <vector>
#include <utility>
#include <stdexcept>
#include <cstdint>


namespace{

using std::placeholders::_1;

} // namespace `anonymous`

namespace Quezhuo{

std::vector<std::uint_fast8_t> calculateKuikaeValues(Fulu const &fulu)
{
  std::uint_fast8_t const target = fulu.getCalledPai().getValue();
  std::vector<std::uint_fast8_t> result{ target };
  if (fulu.getType() != FuluType::chi) {
    return result;
  }
  std::uint_fast8_t const first = fulu.getFirstValue();
  if (target == first && getNumber(target) <= 6u) {
    result.push_back(target + 3u);
  }
  else if (target == first + 2u && getNumber(target) >= 4u) {
    result.push_back(target - 3u);
  }
  return result;
}

PlayerState::PlayerState(std::uint_fast8_t const seat)
  : seat_(seat)
{
  if (seat_ >= 4u) {
    QUEZHUO_THROW<std::invalid_argument>(_1) << static_cast<unsigned>(seat_) << ": An invalid seat.";
  }
}

std::vector<Pai> PlayerState::getConcealedPais() const
{
  std::vector<Pai> result = shoupai_;
  if (zimo_pai_) {
    result.push_back(*zimo_pai_);
    std::sort(result.begin(), result.end());
  }
  return result;
}

bool PlayerState::isMenqian() const noexcept
{
  return std::none_of(
    fulu_list_.cbegin(), fulu_list_.cend(), [](Fulu const &f) { return f.isOpen(); });
}

std::uint_fast8_t PlayerState::getNumGangzi() const noexcept
{
  return std::count_if(
    fulu_list_.cbegin(), fulu_list_.cend(), [](Fulu const &f) { return f.isGang(); });
}

bool PlayerState::isHeZhenting() const
{
  for (HeEntry const &e : he_) {
    if (std::binary_search(hupai_list_.cbegin(), hupai_list_.cend(), e.pai.getValue())) {
      return true;
    }
  }
  return false;
}

bool PlayerState::isZhenting() const
{
  return tongxun_zhenting_ || lizhi_zhenting_ || isHeZhenting();
}

std::uint_fast8_t PlayerState::getNumPais() const noexcept
{
  return shoupai_.size() + (zimo_pai_ ? 1u : 0u) + 3u * fulu_list_.size();
}

void PlayerState::mergeZimoPai_()
{
  if (!zimo_pai_) {
    return;
  }
  shoupai_.insert(std::upper_bound(shoupai_.begin(), shoupai_.end(), *zimo_pai_), *zimo_pai_);
  zimo_pai_.reset();
}

void PlayerState::removePai_(Pai const pai)
{
  auto const found = std::find(shoupai_.begin(), shoupai_.end(), pai);
  if (found == shoupai_.end()) {
    QUEZHUO_THROW<InvariantViolation>(_1)
      << "seat " << static_cast<unsigned>(seat_) << ": " << pai << ": Not in the hand "
      << toString(shoupai_) << '.';
  }
  shoupai_.erase(found);
}

void PlayerState::updateHupaiList_()
{
  hupai_list_ = calculateHupaiList(shoupai_, fulu_list_);
}

void PlayerState::onDeal(Pai const pai)
{
  if (getNumPais() >= 13u) {
    QUEZHUO_THROW<InvariantViolation>(_1)
      << "seat " << static_cast<unsigned>(seat_) << ": Dealt more than 13 tiles.";
  }
  shoupai_.insert(std::upper_bound(shoupai_.begin(), shoupai_.end(), pai), pai);
  if (shoupai_.size() == 13u) {
    updateHupaiList_();
  }
}

void PlayerState::onZimo(Pai const pai)
{
  if (zimo_pai_ || getNumPais() != 13u) {
    QUEZHUO_THROW<InvariantViolation>(_1)
      << "seat " << static_cast<unsigned>(seat_) << ": " << pai << ": A draw to a hand of "
      << static_cast<unsigned>(getNumPais()) << " tiles.";
  }
  zimo_pai_ = pai;
}

void PlayerState::onDapai(Pai const pai, bool const lizhi)
{
  if (getNumPais() != 14u) {
    QUEZHUO_THROW<InvariantViolation>(_1)
      << "seat " << static_cast<unsigned>(seat_) << ": " << pai << ": A discard from a hand of "
      << static_cast<unsigned>(getNumPais()) << " tiles.";
  }

  bool const moqi = zimo_pai_ && *zimo_pai_ == pai;
  if (moqi) {
    zimo_pai_.reset();
  }
  else {
    removePai_(pai);
    mergeZimoPai_();
  }

  he_.push_back({ pai, moqi, lizhi, false });
  yifa_ = false;
  tongxun_zhenting_ = false;
  kuikae_values_.clear();
  updateHupaiList_();
}

void PlayerState::onLizhiAccepted(bool const double_lizhi) noexcept
{
  lizhi_ = double_lizhi ? 2u : 1u;
  yifa_ = true;
}

void PlayerState::onDapaiCalled()
{
  if (he_.empty()) {
    QUEZHUO_THROW<InvariantViolation>(_1)
      << "seat " << static_cast<unsigned>(seat_) << ": No discard to call.";
  }
  he_.back().called = true;
}

void PlayerState::onChi(Fulu fulu, bool const forbid_kuikae)
{
  if (fulu.getType() != FuluType::chi) {
    QUEZHUO_THROW<InvariantViolation>(_1) << fulu << ": Not a chi.";
  }

  std::vector<Pai> pais = fulu.getPais();
  pais.erase(std::find(pais.begin(), pais.end(), fulu.getCalledPai()));
  for (Pai const &pai : pais) {
    removePai_(pai);
  }

  kuikae_values_.clear();
  if (forbid_kuikae) {
    kuikae_values_ = calculateKuikaeValues(fulu);
  }

  fulu_list_.push_back(std::move(fulu));
}

void PlayerState::onPeng(Fulu fulu, bool const forbid_kuikae)
{
  if (fulu.getType() != FuluType::peng) {
    QUEZHUO_THROW<InvariantViolation>(_1) << fulu << ": Not a peng.";
  }

  std::vector<Pai> pais = fulu.getPais();
  pais.erase(std::find(pais.begin(), pais.end(), fulu.getCalledPai()));
  for (Pai const &pai : pais) {
    removePai_(pai);
  }

  kuikae_values_.clear();
  if (forbid_kuikae) {
    kuikae_values_ = calculateKuikaeValues(fulu);
  }

  fulu_list_.push_back(std::move(fulu));
}

void PlayerState::onDaminggang(Fulu fulu)
{
  if (fulu.getType() != FuluType::daminggang) {
    QUEZHUO_THROW<InvariantViolation>(_1) << fulu << ": Not a daminggang.";
  }

  std::vector<Pai> pais = fulu.getPais();
  pais.erase(std::find(pais.begin(), pais.end(), fulu.getCalledPai()));
  for (Pai const &pai : pais) {
    removePai_(pai);
  }
  fulu_list_.push_back(std::move(fulu));
  updateHupaiList_();
}

void PlayerState::onAngang(Fulu fulu)
{
  if (fulu.getType() != FuluType::angang) {
    QUEZHUO_THROW<InvariantViolation>(_1) << fulu << ": Not an angang.";
  }

  mergeZimoPai_();
  for (Pai const &pai : fulu.getPais()) {
    removePai_(pai);
  }
  fulu_list_.push_back(std::move(fulu));
  updateHupaiList_();
}

void PlayerState::onJiagang(Pai const pai)
{
  auto const found = std::find_if(
    fulu_list_.begin(), fulu_list_.end(),
    [pai](Fulu const &f) {
      return f.getType() == FuluType::peng && f.getFirstValue() == pai.getValue();
    });
  if (found == fulu_list_.end()) {
    QUEZHUO_THROW<InvariantViolation>(_1)
      << "seat " << static_cast<unsigned>(seat_) << ": " << pai << ": No peng to upgrade.";
  }

  mergeZimoPai_();
  removePai_(pai);
  *found = found->toJiagang(pai);
  updateHupaiList_();
}

} // namespace Quezhuo
