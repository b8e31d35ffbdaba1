#if !defined(QUEZHUO_ENGINE_PAISHAN_HPP_INCLUDE_GUARD)
#define QUEZHUO_ENGINE_PAISHAN_HPP_INCLUDE_GUARD

#include "engine/rule_config.hpp"
#include "engine/pai.hpp"
#include <random>
#include <optional>
#include <vector>
#include <cstdint>


namespace Quezhuo{

class Paishan;

void swap(Paishan &lhs, Paishan &rhs) noexcept;

// 牌山．末尾の 14 枚が王牌で，その先頭 4 枚が嶺上牌，残りが
// (ドラ表示牌, 裏ドラ表示牌) の 5 組である．嶺上牌を 1 枚引くたびに
// 海底が 1 枚繰り上がり，王牌は常に 14 枚に保たれる．
class Paishan
{
public:
  static constexpr std::uint_fast8_t num_wangpai = 14u;
  static constexpr std::uint_fast8_t num_lingshang_pais = 4u;
  static constexpr std::uint_fast8_t max_dora_indicators = 5u;

  Paishan(std::mt19937 &urng, Quezhuo::RuleConfig const &config);

  // A wall in dealing order, the dead wall last. Fewer than 136 tiles are
  // accepted so that short scenarios can be set up.
  explicit Paishan(std::vector<Pai> pais);

  Paishan(Paishan const &rhs) = default;

  Paishan(Paishan &&rhs) = default;

  void swap(Paishan &rhs) noexcept;

  Paishan &operator=(Paishan const &rhs);

  Paishan &operator=(Paishan &&rhs) noexcept;

public:
  std::uint_fast8_t getNumPais() const noexcept;

  // Tiles that can still be drawn from the live wall.
  std::uint_fast8_t getNumLeftPais() const;

  std::uint_fast8_t getNumLeftLingshangPais() const noexcept;

  std::uint_fast8_t getNumDoraIndicators() const noexcept;

  std::vector<Pai> getDoraIndicators() const;

  std::vector<Pai> getUraDoraIndicators() const;

  Pai operator[](std::uint_fast8_t index) const;

public:
  // Empty once the live wall is exhausted.
  std::optional<Pai> drawPai();

  // Empty once the replacement tiles are exhausted or the live wall cannot
  // replenish the dead wall.
  std::optional<Pai> drawLingshangPai();

  // No-op returning `false` past the fifth indicator.
  bool revealNewDora();

private:
  std::uint_fast8_t getWangpaiOffset_() const noexcept;

private:
  std::vector<Pai> pais_;
  std::uint_fast8_t zimo_index_ = 0u;
  std::uint_fast8_t lingshang_zimo_count_ = 0u;
  std::uint_fast8_t num_dora_indicators_ = 1u;
}; // class Paishan

} // namespace Quezhuo

#endif // !defined(QUEZHUO_ENGINE_PAISHAN_HPP_INCLUDE_GUARD)
