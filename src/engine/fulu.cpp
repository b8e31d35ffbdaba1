#include "engine/fulu.hpp"

#include "engine/pai.hpp"
#include "common/throw.hpp"
#include <algorithm>
#include <ostream>
#include <string>
#include <vector>
#include <functional>
#include <utility>
#include <stdexcept>
#include <cstdint>


namespace{

using std::placeholders::_1;

} // namespace `anonymous`

namespace Quezhuo{

char const *getName(FuluType const type) noexcept
{
  switch (type) {
  case FuluType::chi:
    return "chi";
  case FuluType::peng:
    return "peng";
  case FuluType::angang:
    return "angang";
  case FuluType::jiagang:
    return "jiagang";
  case FuluType::daminggang:
    return "daminggang";
  }
  return "unknown";
}

Fulu::Fulu(
  FuluType const type, std::vector<Pai> pais, Pai const called_pai,
  std::uint_fast8_t const from_seat)
  : type_(type),
    pais_(std::move(pais)),
    called_pai_(called_pai),
    from_seat_(from_seat)
{
  std::sort(pais_.begin(), pais_.end());

  std::size_t const expected_size = isGang() ? 4u : 3u;
  if (pais_.size() != expected_size) {
    QUEZHUO_THROW<std::invalid_argument>(_1)
      << getName(type_) << ": " << pais_.size() << ": A wrong number of tiles.";
  }
  if (std::find(pais_.cbegin(), pais_.cend(), called_pai_) == pais_.cend()) {
    QUEZHUO_THROW<std::invalid_argument>(_1)
      << getName(type_) << ": " << called_pai_ << " is not part of the meld.";
  }
  if ((type_ == FuluType::angang) != (from_seat_ == no_seat) || from_seat_ > no_seat) {
    QUEZHUO_THROW<std::invalid_argument>(_1)
      << getName(type_) << ": " << static_cast<unsigned>(from_seat_) << ": A wrong source seat.";
  }

  std::uint_fast8_t const first = pais_.front().getValue();
  if (type_ == FuluType::chi) {
    if (isZipai(first) || getNumber(first) > 7u
        || pais_[1u].getValue() != first + 1u || pais_[2u].getValue() != first + 2u) {
      QUEZHUO_THROW<std::invalid_argument>(_1) << toString() << ": Not a run.";
    }
  }
  else {
    for (Pai const &pai : pais_) {
      if (pai.getValue() != first) {
        QUEZHUO_THROW<std::invalid_argument>(_1) << toString() << ": Not a set of the same tile.";
      }
    }
  }
}

std::uint_fast8_t Fulu::getFirstValue() const noexcept
{
  return pais_.front().getValue();
}

bool Fulu::isGang() const noexcept
{
  return type_ == FuluType::angang || type_ == FuluType::jiagang
    || type_ == FuluType::daminggang;
}

Fulu Fulu::toJiagang(Pai const pai) const
{
  if (type_ != FuluType::peng) {
    QUEZHUO_THROW<std::invalid_argument>(_1) << toString() << ": Only a peng can be upgraded.";
  }
  std::vector<Pai> pais = pais_;
  pais.push_back(pai);
  return Fulu(FuluType::jiagang, std::move(pais), called_pai_, from_seat_);
}

std::string Fulu::toString() const
{
  return std::string(getName(type_)) + '(' + Quezhuo::toString(pais_) + ')';
}

std::ostream &operator<<(std::ostream &os, Fulu const &fulu)
{
  return os << fulu.toString();
}

} // namespace Quezhuo
