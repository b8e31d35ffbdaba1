#include "engine/paishan.hpp"

#include "engine/rule_config.hpp"
#include "engine/pai.hpp"
#include "common/assert.hpp"
#include "common/throw.hpp"
#include <random>
#include <algorithm>
#include <optional>
#include <vector>
#include <functional>
#include <utility>
#include <stdexcept>
#include <cstdint>


namespace{

using std::placeholders::_1;

} // namespace `anonymous`

namespace Quezhuo{

void swap(Paishan &lhs, Paishan &rhs) noexcept
{
  lhs.swap(rhs);
}

Paishan::Paishan(std::mt19937 &urng, Quezhuo::RuleConfig const &config)
  : pais_()
{
  pais_.reserve(136u);
  for (std::uint_fast8_t value = 0u; value < num_pai_values; ++value) {
    for (std::uint_fast8_t i = 0u; i < 4u; ++i) {
      bool const red = !isZipai(value) && getNumber(value) == 5u
        && i < config.num_red_fives[getSuit(value)];
      pais_.emplace_back(value, red);
    }
  }
  std::shuffle(pais_.begin(), pais_.end(), urng);
}

Paishan::Paishan(std::vector<Pai> pais)
  : pais_(std::move(pais))
{
  if (pais_.size() < num_wangpai) {
    QUEZHUO_THROW<std::invalid_argument>(_1)
      << "paishan: " << pais_.size() << ": Shorter than the dead wall.";
  }
  if (pais_.size() > 136u) {
    QUEZHUO_THROW<std::invalid_argument>(_1)
      << "paishan: " << pais_.size() << ": A wrong length.";
  }
  PaiCounts const counts = countPais(pais_);
  for (std::uint_fast8_t value = 0u; value < num_pai_values; ++value) {
    if (counts[value] > 4u) {
      QUEZHUO_THROW<std::invalid_argument>(_1)
        << "paishan: " << Pai(value) << ": More than four copies.";
    }
  }
}

void Paishan::swap(Paishan &rhs) noexcept
{
  using std::swap;
  swap(pais_, rhs.pais_);
  swap(zimo_index_, rhs.zimo_index_);
  swap(lingshang_zimo_count_, rhs.lingshang_zimo_count_);
  swap(num_dora_indicators_, rhs.num_dora_indicators_);
}

Paishan &Paishan::operator=(Paishan const &rhs)
{
  Paishan(rhs).swap(*this);
  return *this;
}

Paishan &Paishan::operator=(Paishan &&rhs) noexcept
{
  Paishan(std::move(rhs)).swap(*this);
  return *this;
}

std::uint_fast8_t Paishan::getWangpaiOffset_() const noexcept
{
  return pais_.size() - num_wangpai;
}

std::uint_fast8_t Paishan::getNumPais() const noexcept
{
  return pais_.size();
}

std::uint_fast8_t Paishan::getNumLeftPais() const
{
  QUEZHUO_ASSERT((zimo_index_ + lingshang_zimo_count_ <= getWangpaiOffset_()));
  return getWangpaiOffset_() - zimo_index_ - lingshang_zimo_count_;
}

std::uint_fast8_t Paishan::getNumLeftLingshangPais() const noexcept
{
  return num_lingshang_pais - lingshang_zimo_count_;
}

std::uint_fast8_t Paishan::getNumDoraIndicators() const noexcept
{
  return num_dora_indicators_;
}

std::vector<Pai> Paishan::getDoraIndicators() const
{
  std::vector<Pai> result;
  for (std::uint_fast8_t i = 0u; i < num_dora_indicators_; ++i) {
    result.push_back(pais_[getWangpaiOffset_() + num_lingshang_pais + 2u * i]);
  }
  return result;
}

std::vector<Pai> Paishan::getUraDoraIndicators() const
{
  std::vector<Pai> result;
  for (std::uint_fast8_t i = 0u; i < num_dora_indicators_; ++i) {
    result.push_back(pais_[getWangpaiOffset_() + num_lingshang_pais + 2u * i + 1u]);
  }
  return result;
}

Pai Paishan::operator[](std::uint_fast8_t const index) const
{
  if (index >= pais_.size()) {
    QUEZHUO_THROW<std::out_of_range>(_1) << static_cast<unsigned>(index);
  }
  return pais_[index];
}

std::optional<Pai> Paishan::drawPai()
{
  if (getNumLeftPais() == 0u) {
    return std::nullopt;
  }
  return pais_[zimo_index_++];
}

std::optional<Pai> Paishan::drawLingshangPai()
{
  if (lingshang_zimo_count_ == num_lingshang_pais || getNumLeftPais() == 0u) {
    return std::nullopt;
  }
  return pais_[getWangpaiOffset_() + lingshang_zimo_count_++];
}

bool Paishan::revealNewDora()
{
  if (num_dora_indicators_ == max_dora_indicators) {
    return false;
  }
  ++num_dora_indicators_;
  return true;
}

} // namespace Quezhuo
