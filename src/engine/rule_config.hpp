#if !defined(QUEZHUO_ENGINE_RULE_CONFIG_HPP_INCLUDE_GUARD)
#define QUEZHUO_ENGINE_RULE_CONFIG_HPP_INCLUDE_GUARD

#include <optional>
#include <array>
#include <cstdint>


namespace Quezhuo{

enum struct GameLength : std::uint_fast8_t
{
  dongfeng_zhan = 0u, // 東風戦
  banzhuang = 1u,     // 半荘戦
  yizhuang = 2u,      // 一荘戦
}; // enum struct GameLength

// When the new dora indicator of a kan is revealed.
enum struct GangDoraTiming : std::uint_fast8_t
{
  // Before the replacement draw, for every kan.
  immediate = 0u,
  // At the next discard or kan of the player, for every kan.
  after_lingshang = 1u,
  // Immediate for an angang, deferred for a daminggang or a jiagang.
  angang_immediate = 2u,
}; // enum struct GangDoraTiming

struct RuleConfig
{
  std::int_fast32_t initial_score = 25000;
  std::array<std::uint_fast8_t, 3u> num_red_fives{ 1u, 1u, 1u };
  bool allow_kuitan = false;
  bool forbid_kuikae = true;
  GameLength game_length = GameLength::banzhuang;
  std::int_fast32_t min_game_end_score = 0;
  std::optional<std::int_fast32_t> target_score{};
  GangDoraTiming gang_dora_timing = GangDoraTiming::angang_immediate;
  // 四風連打
  bool sifeng_lianda = true;
  // 四家立直
  bool sijia_lizhi = true;

  // Throws `std::invalid_argument` on an inconsistent configuration.
  void validate() const;

  // The last round wind (0: East, ..., 3: North) of the game.
  std::uint_fast8_t getLastChang() const noexcept;
}; // struct RuleConfig

} // namespace Quezhuo

#endif // !defined(QUEZHUO_ENGINE_RULE_CONFIG_HPP_INCLUDE_GUARD)
