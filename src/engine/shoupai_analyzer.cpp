#include "engine/shoupai_analyzer.hpp"

#include "engine/hule_form.hpp"
#include "engine/fulu.hpp"
#include "engine/pai.hpp"
#include <vector>
#include <cstdint>
#include <cstddef>


namespace{

using Quezhuo::PaiCounts;
using Quezhuo::Mianzi;
using Quezhuo::MianziType;
using Quezhuo::num_pai_values;

std::uint_fast8_t findFirst(PaiCounts const &counts, std::uint_fast8_t i) noexcept
{
  while (i < num_pai_values && counts[i] == 0u) {
    ++i;
  }
  return i;
}

bool canMakeShunzi(PaiCounts const &counts, std::uint_fast8_t const i) noexcept
{
  return !Quezhuo::isZipai(i) && Quezhuo::getNumber(i) <= 7u
    && counts[i + 1u] >= 1u && counts[i + 2u] >= 1u;
}

// Consumes the smallest remaining value as a kezi or as the head of a shunzi.
void decomposeMianzi(
  PaiCounts &counts, std::uint_fast8_t const start, std::vector<Mianzi> &stack,
  std::vector<std::vector<Mianzi>> &results)
{
  std::uint_fast8_t const i = findFirst(counts, start);
  if (i == num_pai_values) {
    results.push_back(stack);
    return;
  }

  if (counts[i] >= 3u) {
    counts[i] -= 3u;
    stack.push_back({ MianziType::kezi, i, false });
    decomposeMianzi(counts, i, stack, results);
    stack.pop_back();
    counts[i] += 3u;
  }

  if (canMakeShunzi(counts, i)) {
    --counts[i];
    --counts[i + 1u];
    --counts[i + 2u];
    stack.push_back({ MianziType::shunzi, i, false });
    decomposeMianzi(counts, i, stack, results);
    stack.pop_back();
    ++counts[i];
    ++counts[i + 1u];
    ++counts[i + 2u];
  }
}

bool canDecomposeMianzi(PaiCounts &counts, std::uint_fast8_t const start)
{
  std::uint_fast8_t const i = findFirst(counts, start);
  if (i == num_pai_values) {
    return true;
  }

  if (counts[i] >= 3u) {
    counts[i] -= 3u;
    bool const result = canDecomposeMianzi(counts, i);
    counts[i] += 3u;
    if (result) {
      return true;
    }
  }

  if (canMakeShunzi(counts, i)) {
    --counts[i];
    --counts[i + 1u];
    --counts[i + 2u];
    bool const result = canDecomposeMianzi(counts, i);
    ++counts[i];
    ++counts[i + 1u];
    ++counts[i + 2u];
    return result;
  }

  return false;
}

std::size_t countTotal(PaiCounts const &counts) noexcept
{
  std::size_t n = 0u;
  for (std::uint_fast8_t const c : counts) {
    n += c;
  }
  return n;
}

bool isQidui(PaiCounts const &counts) noexcept
{
  std::uint_fast8_t num_duizi = 0u;
  for (std::uint_fast8_t const c : counts) {
    if (c == 2u) {
      ++num_duizi;
    }
    else if (c != 0u) {
      return false;
    }
  }
  return num_duizi == 7u;
}

// Returns the doubled tile of a 国士無双, or `num_pai_values` if the hand is
// not one.
std::uint_fast8_t findGuoshiJiangpai(PaiCounts const &counts) noexcept
{
  std::uint_fast8_t jiangpai = num_pai_values;
  for (std::uint_fast8_t i = 0u; i < num_pai_values; ++i) {
    if (!Quezhuo::isYaojiu(i)) {
      if (counts[i] != 0u) {
        return num_pai_values;
      }
      continue;
    }
    if (counts[i] == 0u || counts[i] > 2u) {
      return num_pai_values;
    }
    if (counts[i] == 2u) {
      if (jiangpai != num_pai_values) {
        return num_pai_values;
      }
      jiangpai = i;
    }
  }
  return jiangpai;
}

std::size_t getRequiredSize(std::vector<Quezhuo::Fulu> const &fulu_list) noexcept
{
  return 14u - 3u * fulu_list.size();
}

} // namespace `anonymous`

namespace Quezhuo{

std::vector<HuleForm> decomposeHule(
  std::vector<Pai> const &pais, std::vector<Fulu> const &fulu_list)
{
  std::vector<HuleForm> result;
  if (fulu_list.size() > 4u || pais.size() != getRequiredSize(fulu_list)) {
    return result;
  }

  PaiCounts counts = countPais(pais);

  std::vector<Mianzi> fulu_mianzi;
  for (Fulu const &fulu : fulu_list) {
    fulu_mianzi.push_back(toMianzi(fulu));
  }

  for (std::uint_fast8_t jiangpai = 0u; jiangpai < num_pai_values; ++jiangpai) {
    if (counts[jiangpai] < 2u) {
      continue;
    }
    counts[jiangpai] -= 2u;
    std::vector<Mianzi> stack;
    std::vector<std::vector<Mianzi>> decompositions;
    decomposeMianzi(counts, 0u, stack, decompositions);
    counts[jiangpai] += 2u;

    for (std::vector<Mianzi> &concealed : decompositions) {
      HuleForm form{ HuleShape::standard, fulu_mianzi };
      form.mianzi_list.insert(form.mianzi_list.end(), concealed.cbegin(), concealed.cend());
      form.mianzi_list.push_back({ MianziType::duizi, jiangpai, false });
      result.push_back(std::move(form));
    }
  }

  if (fulu_list.empty()) {
    if (isQidui(counts)) {
      HuleForm form{ HuleShape::qidui, {} };
      for (std::uint_fast8_t i = 0u; i < num_pai_values; ++i) {
        if (counts[i] == 2u) {
          form.mianzi_list.push_back({ MianziType::duizi, i, false });
        }
      }
      result.push_back(std::move(form));
    }

    std::uint_fast8_t const jiangpai = findGuoshiJiangpai(counts);
    if (jiangpai != num_pai_values) {
      result.push_back({ HuleShape::guoshi, { { MianziType::duizi, jiangpai, false } } });
    }
  }

  return result;
}

bool isHuleShape(PaiCounts const &counts, std::vector<Fulu> const &fulu_list)
{
  if (fulu_list.size() > 4u || countTotal(counts) != getRequiredSize(fulu_list)) {
    return false;
  }

  if (fulu_list.empty()) {
    if (isQidui(counts) || findGuoshiJiangpai(counts) != num_pai_values) {
      return true;
    }
  }

  PaiCounts counts_ = counts;
  for (std::uint_fast8_t jiangpai = 0u; jiangpai < num_pai_values; ++jiangpai) {
    if (counts_[jiangpai] < 2u) {
      continue;
    }
    counts_[jiangpai] -= 2u;
    bool const result = canDecomposeMianzi(counts_, 0u);
    counts_[jiangpai] += 2u;
    if (result) {
      return true;
    }
  }
  return false;
}

bool isTingpai(std::vector<Pai> const &pais, std::vector<Fulu> const &fulu_list)
{
  return !calculateHupaiList(pais, fulu_list).empty();
}

std::vector<std::uint_fast8_t> calculateHupaiList(
  std::vector<Pai> const &pais, std::vector<Fulu> const &fulu_list)
{
  std::vector<std::uint_fast8_t> result;
  if (fulu_list.size() > 4u || pais.size() + 1u != getRequiredSize(fulu_list)) {
    return result;
  }

  PaiCounts counts = countPais(pais);
  PaiCounts held = counts;
  for (Fulu const &fulu : fulu_list) {
    for (Pai const &pai : fulu.getPais()) {
      ++held[pai.getValue()];
    }
  }

  for (std::uint_fast8_t value = 0u; value < num_pai_values; ++value) {
    if (held[value] >= 4u) {
      continue;
    }
    ++counts[value];
    if (isHuleShape(counts, fulu_list)) {
      result.push_back(value);
    }
    --counts[value];
  }
  return result;
}

std::uint_fast8_t countYaojiuKinds(std::vector<Pai> const &pais)
{
  PaiCounts const counts = countPais(pais);
  std::uint_fast8_t result = 0u;
  for (std::uint_fast8_t i = 0u; i < num_pai_values; ++i) {
    if (isYaojiu(i) && counts[i] >= 1u) {
      ++result;
    }
  }
  return result;
}

} // namespace Quezhuo
