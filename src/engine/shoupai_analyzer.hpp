#if !defined(QUEZHUO_ENGINE_SHOUPAI_ANALYZER_HPP_INCLUDE_GUARD)
#define QUEZHUO_ENGINE_SHOUPAI_ANALYZER_HPP_INCLUDE_GUARD

#include "engine/hule_form.hpp"
#include "engine/fulu.hpp"
#include "engine/pai.hpp"
#include <vector>
#include <cstdint>


namespace Quezhuo{

// Every decomposition of the concealed tiles `pais` (the winning tile
// included) together with `fulu_list`. Empty when there is none or when the
// number of tiles does not match the number of fulu.
std::vector<HuleForm> decomposeHule(
  std::vector<Pai> const &pais, std::vector<Fulu> const &fulu_list);

// Same as above, returning as soon as a single decomposition is found.
bool isHuleShape(PaiCounts const &counts, std::vector<Fulu> const &fulu_list);

// 聴牌判定．`pais` are the concealed tiles without a drawn tile.
bool isTingpai(std::vector<Pai> const &pais, std::vector<Fulu> const &fulu_list);

// 待ち牌．Sorted tile values; a value the hand already holds four of is not
// a wait.
std::vector<std::uint_fast8_t> calculateHupaiList(
  std::vector<Pai> const &pais, std::vector<Fulu> const &fulu_list);

// The number of distinct terminal and honor tiles, for 九種九牌.
std::uint_fast8_t countYaojiuKinds(std::vector<Pai> const &pais);

} // namespace Quezhuo

#endif // !defined(QUEZHUO_ENGINE_SHOUPAI_ANALYZER_HPP_INCLUDE_GUARD)
