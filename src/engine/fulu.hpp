#if !defined(QUEZHUO_ENGINE_FULU_HPP_INCLUDE_GUARD)
#define QUEZHUO_ENGINE_FULU_HPP_INCLUDE_GUARD

#include "engine/pai.hpp"
#include <iosfwd>
#include <string>
#include <vector>
#include <cstdint>


namespace Quezhuo{

enum struct FuluType : std::uint_fast8_t
{
  chi = 0u,
  peng = 1u,
  angang = 2u,
  jiagang = 3u,
  daminggang = 4u,
}; // enum struct FuluType

char const *getName(FuluType type) noexcept;

// 副露．暗槓も含む．
class Fulu
{
public:
  static constexpr std::uint_fast8_t no_seat = 4u;

  // `pais` holds every tile of the meld including the claimed one.
  // `from_seat` is `no_seat` for an angang.
  Fulu(FuluType type, std::vector<Pai> pais, Pai called_pai, std::uint_fast8_t from_seat);

  Fulu(Fulu const &) = default;

  Fulu(Fulu &&) = default;

  Fulu &operator=(Fulu const &) = default;

  Fulu &operator=(Fulu &&) = default;

public:
  FuluType getType() const noexcept
  {
    return type_;
  }

  std::vector<Pai> const &getPais() const noexcept
  {
    return pais_;
  }

  Pai getCalledPai() const noexcept
  {
    return called_pai_;
  }

  std::uint_fast8_t getFromSeat() const noexcept
  {
    return from_seat_;
  }

  // The smallest tile value of the meld.
  std::uint_fast8_t getFirstValue() const noexcept;

  bool isGang() const noexcept;

  bool isOpen() const noexcept
  {
    return type_ != FuluType::angang;
  }

  // A jiagang upgraded from this peng by `pai`.
  Fulu toJiagang(Pai pai) const;

  std::string toString() const;

  bool operator==(Fulu const &) const = default;

private:
  FuluType type_;
  std::vector<Pai> pais_;
  Pai called_pai_;
  std::uint_fast8_t from_seat_;
}; // class Fulu

std::ostream &operator<<(std::ostream &os, Fulu const &fulu);

} // namespace Quezhuo

#endif // !defined(QUEZHUO_ENGINE_FULU_HPP_INCLUDE_GUARD)
