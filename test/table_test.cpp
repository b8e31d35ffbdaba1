#include "engine/table.hpp"

#include "engine/round_state.hpp"
#include "engine/game_state.hpp"
#include "engine/round_result.hpp"
#include "engine/player_state.hpp"
#include "engine/rule_config.hpp"
#include "engine/hule.hpp"
#include "engine/yaku.hpp"
#include "engine/action.hpp"
#include "engine/pingju.hpp"
#include "engine/paishan.hpp"
#include "engine/fulu.hpp"
#include "engine/pai.hpp"
#include "test_utility.hpp"
#include <gtest/gtest.h>
#include <random>
#include <algorithm>
#include <optional>
#include <variant>
#include <string_view>
#include <vector>
#include <array>
#include <stdexcept>
#include <cstdint>


namespace Quezhuo{

namespace{

using Scores = std::array<std::int_fast32_t, 4u>;

Pai p(std::string_view const s)
{
  return Pai::fromString(s);
}

// 親は 5p 待ち，南家は 3s 待ち，西家と北家はノーテン．
constexpr std::array<std::string_view, 4u> tingpai_shoupais{
  "123456789m46p11z", "123456789p12s99s", "369m369p369s1144z", "889m889p88s22335z"
};

// 嶺上牌は 7s，ドラ表示牌と裏ドラ表示牌は 3s．
constexpr std::string_view wangpai = "777733s";

void discardZimoPai(Table &table)
{
  std::uint_fast8_t const seat = table.getCurrentSeat();
  ApplyResult const result = table.apply(seat, Dapai{ Testing::getZimoPai(table) });
  ASSERT_EQ(result.status, ApplyStatus::accepted);
}

bool hasYaku(HuleDetails const &details, Yaku const yaku)
{
  return std::any_of(
    details.yaku_list.cbegin(), details.yaku_list.cend(),
    [yaku](YakuEntry const &e) { return e.yaku == yaku; });
}

// 親が北家の 2s をポンし，2s をツモって加槓するまで．対面は 2s の嵌張待ちで
// 役が無い．
constexpr std::array<std::string_view, 4u> jiagang_shoupais{
  "1479m147p22s5567z", "568m23p5689s1234z", "123789m45699p13s", "3669m258p468s667z"
};

constexpr std::string_view jiagang_zimo_pais = "4z3z2z2s1z6s8p2s";

void declareJiagang(Table &table)
{
  for (std::uint_fast8_t i = 0u; i < 4u; ++i) {
    discardZimoPai(table);
  }
  ASSERT_EQ(table.getPhase(), Phase::waiting_for_response);
  ASSERT_EQ(table.getCurrentSeat(), 0u);
  ASSERT_EQ(table.apply(0u, Peng{ p("2s"), { p("2s"), p("2s") } }).status, ApplyStatus::accepted);
  ASSERT_EQ(table.apply(0u, Dapai{ p("1m") }).status, ApplyStatus::accepted);
  for (std::uint_fast8_t i = 1u; i < 4u; ++i) {
    ASSERT_EQ(table.getCurrentSeat(), i);
    discardZimoPai(table);
  }
  ASSERT_EQ(table.getCurrentSeat(), 0u);
  ASSERT_EQ(Testing::getZimoPai(table), p("2s"));
  ApplyResult const result = table.apply(0u, Gang{ FuluType::jiagang, p("2s") });
  ASSERT_EQ(result.status, ApplyStatus::accepted);
  EXPECT_FALSE(result.round_result.has_value());
}

} // namespace `anonymous`

TEST(TableTest, BeforeTheFirstDeal)
{
  Table const table{ RuleConfig{} };
  EXPECT_EQ(table.getPhase(), Phase::game_start);
  EXPECT_EQ(table.getCurrentSeat(), RoundState::no_seat);
  EXPECT_TRUE(table.getCandidates(0u).empty());
  EXPECT_FALSE(table.hasRoundState());
  EXPECT_THROW(table.getRoundState(), std::logic_error);
}

TEST(TableTest, DealerZimo)
{
  Table table{ RuleConfig{} };
  table.setTestPaishans({
      Testing::createPaishan(
        { "123456789m46p11z", "234m258p258s5677z", "369m369p369s1144z", "889m889p88s22335z" },
        "6z6z6z5z5p", wangpai)
    });
  table.resetGame({ 1u });
  ASSERT_EQ(table.getCurrentSeat(), 0u);
  EXPECT_EQ(table.getRoundState().getPaishan().getNumLeftPais(), 69u);

  for (std::uint_fast8_t i = 0u; i < 4u; ++i) {
    ASSERT_EQ(table.getCurrentSeat(), i);
    discardZimoPai(table);
  }

  ASSERT_EQ(table.getCurrentSeat(), 0u);
  ASSERT_EQ(Testing::getZimoPai(table), p("5p"));
  ApplyResult const result = table.apply(0u, Zimohu{});
  ASSERT_EQ(result.status, ApplyStatus::accepted);
  ASSERT_TRUE(result.round_result.has_value());

  RoundResult const &round_result = *result.round_result;
  EXPECT_EQ(round_result.type, RoundEndType::zimo);
  EXPECT_EQ(round_result.winner, 0u);
  EXPECT_EQ(round_result.loser, RoundResult::no_seat);
  ASSERT_TRUE(round_result.hule.has_value());
  EXPECT_EQ(round_result.hule->han, 3u);
  EXPECT_EQ(round_result.hule->fu, 30u);
  EXPECT_EQ(round_result.delta_scores, (Scores{ 6000, -2000, -2000, -2000 }));
  EXPECT_EQ(round_result.parameters, (RoundParameters{ 0u, 0u, 0u, 0u }));

  // 連荘
  GameState const &game_state = table.getGameState();
  EXPECT_EQ(game_state.getScores(), (Scores{ 31000, 23000, 23000, 23000 }));
  EXPECT_EQ(game_state.getRoundParameters(), (RoundParameters{ 0u, 0u, 1u, 0u }));
  ASSERT_TRUE(table.getLastRoundResult().has_value());
  EXPECT_EQ(table.getLastRoundResult()->delta_scores, round_result.delta_scores);
  EXPECT_EQ(result.phase, Phase::player_discard);
  EXPECT_EQ(table.getCurrentSeat(), 0u);
}

TEST(TableTest, HuangpaiPingju)
{
  Table table{ RuleConfig{} };
  table.setTestPaishans({ Testing::createPaishan(tingpai_shoupais, "6z7z6z7z", "", 0u, false) });
  table.resetGame({ 1u });
  EXPECT_EQ(table.getRoundState().getPaishan().getNumLeftPais(), 3u);

  std::optional<RoundResult> const round_result = Testing::playMoqiUntilRoundEnd(table);
  ASSERT_TRUE(round_result.has_value());
  EXPECT_EQ(round_result->type, RoundEndType::huangpai_pingju);
  EXPECT_EQ(round_result->tingpai, (std::array<bool, 4u>{ true, true, false, false }));
  EXPECT_EQ(round_result->delta_scores, (Scores{ 1500, 1500, -1500, -1500 }));

  // The dealer is tenpai and keeps the seat.
  GameState const &game_state = table.getGameState();
  EXPECT_EQ(game_state.getScores(), (Scores{ 26500, 26500, 23500, 23500 }));
  EXPECT_EQ(game_state.getRoundParameters(), (RoundParameters{ 0u, 0u, 1u, 0u }));
}

TEST(TableTest, LizhiTakesEffectWhenTheDiscardPasses)
{
  Table table{ RuleConfig{} };
  table.setTestPaishans({ Testing::createPaishan(tingpai_shoupais, "9s5p", wangpai) });
  table.resetGame({ 1u });

  ASSERT_EQ(table.apply(0u, Lizhi{ p("9s") }).status, ApplyStatus::accepted);
  // 南家は 9s をポンできる．
  ASSERT_EQ(table.getPhase(), Phase::waiting_for_response);
  ASSERT_EQ(table.getCurrentSeat(), 1u);
  EXPECT_EQ(table.getGameState().getNumLizhiDeposits(), 0u);
  EXPECT_EQ(table.getGameState().getPlayerScore(0u), 25000);
  EXPECT_TRUE(table.getRoundState().getDelayedLizhi().has_value());

  ASSERT_EQ(table.apply(1u, Skip{}).status, ApplyStatus::accepted);
  EXPECT_EQ(table.getGameState().getNumLizhiDeposits(), 1u);
  EXPECT_EQ(table.getGameState().getPlayerScore(0u), 24000);
  // 親の第一打牌でのダブル立直
  EXPECT_EQ(table.getRoundState().getPlayer(0u).getLizhi(), 2u);
  EXPECT_TRUE(table.getRoundState().getPlayer(0u).isYifa());
  EXPECT_TRUE(table.getRoundState().getPlayer(0u).getHe().front().lizhi);

  // 一発で放銃
  ASSERT_EQ(table.getCurrentSeat(), 1u);
  ASSERT_EQ(Testing::getZimoPai(table), p("5p"));
  discardZimoPai(table);
  ASSERT_EQ(table.getCurrentSeat(), 0u);
  std::vector<Action> const candidates = table.getCandidates(0u);
  ASSERT_EQ(candidates, (std::vector<Action>{ Rong{}, Skip{} }));

  ApplyResult const result = table.apply(0u, Rong{});
  ASSERT_EQ(result.status, ApplyStatus::accepted);
  ASSERT_TRUE(result.round_result.has_value());
  RoundResult const &round_result = *result.round_result;
  EXPECT_EQ(round_result.type, RoundEndType::rong);
  EXPECT_EQ(round_result.winner, 0u);
  EXPECT_EQ(round_result.loser, 1u);
  ASSERT_TRUE(round_result.hule.has_value());
  EXPECT_TRUE(hasYaku(*round_result.hule, Yaku::double_lizhi));
  EXPECT_TRUE(hasYaku(*round_result.hule, Yaku::yifa));
  EXPECT_TRUE(hasYaku(*round_result.hule, Yaku::yiqi_tongguan));
  EXPECT_EQ(round_result.hule->points, 12000);
  // The winner takes the deposit.
  EXPECT_EQ(round_result.delta_scores, (Scores{ 13000, -12000, 0, 0 }));

  GameState const &game_state = table.getGameState();
  EXPECT_EQ(game_state.getScores(), (Scores{ 37000, 13000, 25000, 25000 }));
  EXPECT_EQ(game_state.getPlayerRanking(0u), 0u);
  EXPECT_EQ(game_state.getPlayerRanking(1u), 3u);
  EXPECT_EQ(game_state.getPlayerRanking(2u), 1u);
  EXPECT_EQ(game_state.getPlayerRanking(3u), 2u);
  EXPECT_EQ(game_state.getNumLizhiDeposits(), 0u);
  EXPECT_EQ(game_state.getRoundParameters(), (RoundParameters{ 0u, 0u, 1u, 0u }));
}

TEST(TableTest, IllegalActionChangesNothing)
{
  Table table{ RuleConfig{} };
  table.setTestPaishans({ Testing::createPaishan(tingpai_shoupais, "9s", wangpai) });
  table.resetGame({ 1u });

  std::vector<Pai> const concealed = table.getRoundState().getPlayer(0u).getConcealedPais();
  std::vector<Action> const illegal_actions{
    Dapai{ p("5s") }, Skip{}, Rong{}, Zimohu{}, Lizhi{ p("1m") }, JiuzhongJiupai{}
  };
  for (Action const &action : illegal_actions) {
    ApplyResult const result = table.apply(0u, action);
    EXPECT_EQ(result.status, ApplyStatus::illegal_action) << action;
    EXPECT_EQ(result.phase, Phase::player_discard);
    EXPECT_FALSE(result.round_result.has_value());
  }
  // Out of turn.
  EXPECT_EQ(table.apply(1u, Dapai{ p("1p") }).status, ApplyStatus::illegal_action);
  EXPECT_EQ(table.apply(4u, Skip{}).status, ApplyStatus::illegal_action);

  EXPECT_EQ(table.getCurrentSeat(), 0u);
  EXPECT_EQ(table.getRoundState().getPlayer(0u).getConcealedPais(), concealed);
  EXPECT_TRUE(table.getRoundState().getPlayer(0u).getHe().empty());
  EXPECT_EQ(table.getRoundState().getPaishan().getNumLeftPais(), 69u);
}

TEST(TableTest, JiuzhongJiupai)
{
  Table table{ RuleConfig{} };
  table.setTestPaishans({
      Testing::createPaishan(
        { "1569m19p19s12345z", "234m258p258s5677z", "369m369p369s1144z", "889m889p88s22335z" },
        "9s", wangpai)
    });
  table.resetGame({ 1u });

  ApplyResult const result = table.apply(0u, JiuzhongJiupai{});
  ASSERT_EQ(result.status, ApplyStatus::accepted);
  ASSERT_TRUE(result.round_result.has_value());
  EXPECT_EQ(result.round_result->type, RoundEndType::liuju);
  EXPECT_EQ(result.round_result->liuju, LiujuType::jiuzhong_jiupai);
  EXPECT_EQ(result.round_result->delta_scores, Scores{});
  EXPECT_EQ(table.getGameState().getRoundParameters(), (RoundParameters{ 0u, 0u, 1u, 0u }));
}

TEST(TableTest, SifengLianda)
{
  Table table{ RuleConfig{} };
  table.setTestPaishans({
      Testing::createPaishan(
        { "147m147p147s1234z", "234m258p258s5677z", "369m369p369s5566z", "889m889p88s22335z" },
        "9s1z1z1z", "")
    });
  table.resetGame({ 1u });

  ASSERT_EQ(table.apply(0u, Dapai{ p("1z") }).status, ApplyStatus::accepted);
  for (std::uint_fast8_t i = 1u; i < 3u; ++i) {
    discardZimoPai(table);
    ASSERT_EQ(table.getCurrentSeat(), i + 1u);
  }
  ApplyResult const result = table.apply(3u, Dapai{ p("1z") });
  ASSERT_EQ(result.status, ApplyStatus::accepted);
  ASSERT_TRUE(result.round_result.has_value());
  EXPECT_EQ(result.round_result->type, RoundEndType::liuju);
  EXPECT_EQ(result.round_result->liuju, LiujuType::sifeng_lianda);
  EXPECT_EQ(table.getGameState().getBenChang(), 1u);
  EXPECT_EQ(table.getGameState().getZhuangjia(), 0u);
}

TEST(TableTest, SifengLiandaDisabled)
{
  RuleConfig config;
  config.sifeng_lianda = false;
  Table table(config);
  table.setTestPaishans({
      Testing::createPaishan(
        { "147m147p147s1234z", "234m258p258s5677z", "369m369p369s5566z", "889m889p88s22335z" },
        "9s1z1z1z", "")
    });
  table.resetGame({ 1u });

  ASSERT_EQ(table.apply(0u, Dapai{ p("1z") }).status, ApplyStatus::accepted);
  for (std::uint_fast8_t i = 1u; i < 4u; ++i) {
    discardZimoPai(table);
  }
  EXPECT_FALSE(table.getLastRoundResult().has_value());
  EXPECT_EQ(table.getPhase(), Phase::player_discard);
  EXPECT_EQ(table.getCurrentSeat(), 0u);
}

TEST(TableTest, ResetRound)
{
  Table table{ RuleConfig{} };
  table.resetGame({ 1u, 2u, 3u });
  discardZimoPai(table);
  table.resetRound();
  EXPECT_EQ(table.getPhase(), Phase::player_discard);
  EXPECT_EQ(table.getCurrentSeat(), 0u);
  EXPECT_EQ(table.getRoundState().getPaishan().getNumLeftPais(), 69u);
  EXPECT_EQ(table.getGameState().getScores(), (Scores{ 25000, 25000, 25000, 25000 }));
  for (std::uint_fast8_t seat = 0u; seat < 4u; ++seat) {
    EXPECT_TRUE(table.getRoundState().getPlayer(seat).getHe().empty());
  }
}

TEST(TableTest, SameSeedSameGame)
{
  Table table0{ RuleConfig{} };
  Table table1{ RuleConfig{} };
  table0.resetGame({ 42u });
  table1.resetGame({ 42u });
  for (std::uint_fast8_t seat = 0u; seat < 4u; ++seat) {
    EXPECT_EQ(
      table0.getRoundState().getPlayer(seat).getConcealedPais(),
      table1.getRoundState().getPlayer(seat).getConcealedPais());
  }
  std::optional<RoundResult> const result0 = Testing::playMoqiUntilRoundEnd(table0);
  std::optional<RoundResult> const result1 = Testing::playMoqiUntilRoundEnd(table1);
  ASSERT_EQ(result0.has_value(), result1.has_value());
  if (result0) {
    EXPECT_EQ(result0->type, result1->type);
    EXPECT_EQ(result0->delta_scores, result1->delta_scores);
  }
}

TEST(TableTest, RandomPlayKeepsEveryTile)
{
  RuleConfig config;
  config.game_length = GameLength::dongfeng_zhan;
  config.allow_kuitan = true;

  for (std::uint_least32_t seed = 0u; seed < 8u; ++seed) {
    Table table(config);
    table.resetGame({ seed });
    std::mt19937 urng(seed);

    std::int_fast32_t num_steps = 0;
    for (; num_steps < 100000 && !table.isGameOver(); ++num_steps) {
      std::uint_fast8_t const seat = table.getCurrentSeat();
      ASSERT_LT(seat, 4u) << "seed " << seed << ": " << getName(table.getPhase());
      std::vector<Action> const candidates = table.getCandidates(seat);
      ASSERT_FALSE(candidates.empty());
      std::uniform_int_distribution<std::size_t> dist(0u, candidates.size() - 1u);
      Action const action = candidates[dist(urng)];

      ApplyResult const result = table.apply(seat, action);
      ASSERT_EQ(result.status, ApplyStatus::accepted) << action;
      for (std::uint_fast8_t count : Testing::countTableTiles(table)) {
        ASSERT_EQ(count, 4u) << "seed " << seed << ": after " << action;
      }
      if (result.round_result) {
        std::int_fast32_t sum = 0;
        for (std::int_fast32_t delta : result.round_result->delta_scores) {
          sum += delta;
        }
        // Only the lizhi deposits taken by a winner break the zero sum.
        EXPECT_EQ(sum % 1000, 0);
        EXPECT_GE(sum, 0);
      }
    }
    EXPECT_TRUE(table.isGameOver()) << "seed " << seed;
    EXPECT_EQ(table.getPhase(), Phase::game_over);
    EXPECT_EQ(table.getCurrentSeat(), RoundState::no_seat);
    EXPECT_TRUE(table.getCandidates(0u).empty());
  }
}

TEST(TableTest, SkippedRongIsZhentingUntilTheNextDiscard)
{
  Table table{ RuleConfig{} };
  table.setTestPaishans({ Testing::createPaishan(tingpai_shoupais, "7z5p5p7z6z0p", wangpai) });
  table.resetGame({ 1u });

  discardZimoPai(table);
  discardZimoPai(table);
  ASSERT_EQ(table.getCurrentSeat(), 0u);
  ASSERT_EQ(table.getCandidates(0u), (std::vector<Action>{ Rong{}, Skip{} }));
  ASSERT_EQ(table.apply(0u, Skip{}).status, ApplyStatus::accepted);
  PlayerState const &zhuangjia = table.getRoundState().getPlayer(0u);
  EXPECT_TRUE(zhuangjia.isTongxunZhenting());
  EXPECT_TRUE(zhuangjia.isZhenting());
  EXPECT_FALSE(zhuangjia.isLizhiZhenting());

  // 同巡内の 5p には和了れない．
  ASSERT_EQ(table.getCurrentSeat(), 2u);
  ASSERT_EQ(Testing::getZimoPai(table), p("5p"));
  discardZimoPai(table);
  EXPECT_EQ(table.getPhase(), Phase::player_discard);
  EXPECT_EQ(table.getCurrentSeat(), 3u);

  discardZimoPai(table);
  ASSERT_EQ(table.getCurrentSeat(), 0u);
  EXPECT_TRUE(table.getRoundState().getPlayer(0u).isTongxunZhenting());
  discardZimoPai(table);
  EXPECT_FALSE(table.getRoundState().getPlayer(0u).isTongxunZhenting());
  EXPECT_FALSE(table.getRoundState().getPlayer(0u).isZhenting());

  ASSERT_EQ(Testing::getZimoPai(table), p("0p"));
  discardZimoPai(table);
  ASSERT_EQ(table.getPhase(), Phase::waiting_for_response);
  ASSERT_EQ(table.getCurrentSeat(), 0u);
  EXPECT_EQ(table.getCandidates(0u), (std::vector<Action>{ Rong{}, Skip{} }));
}

TEST(TableTest, SkippedRongAfterLizhiIsZhentingForGood)
{
  Table table{ RuleConfig{} };
  table.setTestPaishans({ Testing::createPaishan(tingpai_shoupais, "9s5p7z7z6z0p", wangpai) });
  table.resetGame({ 1u });

  ASSERT_EQ(table.apply(0u, Lizhi{ p("9s") }).status, ApplyStatus::accepted);
  ASSERT_EQ(table.apply(1u, Skip{}).status, ApplyStatus::accepted);
  ASSERT_EQ(table.getRoundState().getPlayer(0u).getLizhi(), 2u);

  discardZimoPai(table);
  ASSERT_EQ(table.getCandidates(0u), (std::vector<Action>{ Rong{}, Skip{} }));
  ASSERT_EQ(table.apply(0u, Skip{}).status, ApplyStatus::accepted);
  EXPECT_TRUE(table.getRoundState().getPlayer(0u).isLizhiZhenting());

  for (std::uint_fast8_t i = 2u; i < 4u; ++i) {
    ASSERT_EQ(table.getCurrentSeat(), i);
    discardZimoPai(table);
  }
  ASSERT_EQ(table.getCurrentSeat(), 0u);
  EXPECT_EQ(table.getCandidates(0u), (std::vector<Action>{ Dapai{ p("6z") } }));
  discardZimoPai(table);
  PlayerState const &zhuangjia = table.getRoundState().getPlayer(0u);
  EXPECT_FALSE(zhuangjia.isTongxunZhenting());
  EXPECT_TRUE(zhuangjia.isLizhiZhenting());
  EXPECT_TRUE(zhuangjia.isZhenting());

  // 次巡の 5p にも和了れない．
  ASSERT_EQ(table.getCurrentSeat(), 1u);
  ASSERT_EQ(Testing::getZimoPai(table), p("0p"));
  discardZimoPai(table);
  EXPECT_EQ(table.getPhase(), Phase::player_discard);
  EXPECT_EQ(table.getCurrentSeat(), 2u);
}

TEST(TableTest, Angang)
{
  Table table{ RuleConfig{} };
  table.setTestPaishans({
      Testing::createPaishan(
        { "1479m147p258s666z", "123456789p12s99s", "369m369p369s1144z", "889m889p88s22335z" },
        "6z", wangpai)
    });
  table.resetGame({ 1u });
  RoundState const &round_state = table.getRoundState();
  ASSERT_EQ(round_state.getPaishan().getNumDoraIndicators(), 1u);
  ASSERT_EQ(round_state.getPaishan().getNumLeftPais(), 69u);

  ApplyResult const result = table.apply(0u, Gang{ FuluType::angang, p("6z") });
  ASSERT_EQ(result.status, ApplyStatus::accepted);
  EXPECT_EQ(result.phase, Phase::player_discard);
  EXPECT_EQ(table.getCurrentSeat(), 0u);

  // 暗槓の新ドラは即めくり．
  EXPECT_EQ(round_state.getPaishan().getNumDoraIndicators(), 2u);
  EXPECT_EQ(round_state.getPaishan().getNumLeftPais(), 68u);
  EXPECT_EQ(round_state.getPaishan().getNumLeftLingshangPais(), 3u);
  EXPECT_EQ(Testing::getZimoPai(table), p("7s"));
  EXPECT_TRUE(round_state.isLingshang());

  PlayerState const &player = round_state.getPlayer(0u);
  ASSERT_EQ(player.getFuluList().size(), 1u);
  EXPECT_EQ(player.getFuluList().front().getType(), FuluType::angang);
  EXPECT_TRUE(player.isMenqian());
  EXPECT_EQ(player.getConcealedPais().size(), 11u);

  discardZimoPai(table);
  EXPECT_FALSE(round_state.isLingshang());
  EXPECT_EQ(round_state.getPaishan().getNumDoraIndicators(), 2u);
}

TEST(TableTest, Daminggang)
{
  Table table{ RuleConfig{} };
  table.setTestPaishans({
      Testing::createPaishan(
        { "1479m147p25s1234z", "123456789p12s99s", "369m369p369s1666z", "889m889p88s22335z" },
        "6z", wangpai)
    });
  table.resetGame({ 1u });

  discardZimoPai(table);
  ASSERT_EQ(table.getPhase(), Phase::waiting_for_response);
  ASSERT_EQ(table.getCurrentSeat(), 2u);
  ASSERT_EQ(
    table.getCandidates(2u),
    (std::vector<Action>{
      Peng{ p("6z"), { p("6z"), p("6z") } }, Gang{ FuluType::daminggang, p("6z") }, Skip{}
    }));

  ApplyResult const result = table.apply(2u, Gang{ FuluType::daminggang, p("6z") });
  ASSERT_EQ(result.status, ApplyStatus::accepted);
  EXPECT_EQ(result.phase, Phase::player_discard);
  ASSERT_EQ(table.getCurrentSeat(), 2u);

  RoundState const &round_state = table.getRoundState();
  EXPECT_TRUE(round_state.getPlayer(0u).getHe().back().called);
  PlayerState const &player = round_state.getPlayer(2u);
  ASSERT_EQ(player.getFuluList().size(), 1u);
  EXPECT_EQ(player.getFuluList().front().getType(), FuluType::daminggang);
  EXPECT_EQ(player.getFuluList().front().getFromSeat(), 0u);
  EXPECT_FALSE(player.isMenqian());
  EXPECT_EQ(Testing::getZimoPai(table), p("7s"));
  EXPECT_TRUE(round_state.isLingshang());
  EXPECT_EQ(round_state.getPaishan().getNumLeftPais(), 68u);

  // 明槓の新ドラは打牌の後．
  EXPECT_EQ(round_state.getPaishan().getNumDoraIndicators(), 1u);
  discardZimoPai(table);
  EXPECT_EQ(round_state.getPaishan().getNumDoraIndicators(), 2u);
  EXPECT_EQ(table.getCurrentSeat(), 3u);
}

TEST(TableTest, Qianggang)
{
  Table table{ RuleConfig{} };
  table.setTestPaishans({ Testing::createPaishan(jiagang_shoupais, jiagang_zimo_pais, wangpai) });
  table.resetGame({ 1u });
  declareJiagang(table);

  // 槍槓には和了か見送りのみ．
  ASSERT_EQ(table.getPhase(), Phase::waiting_for_response);
  ASSERT_EQ(table.getCurrentSeat(), 2u);
  EXPECT_TRUE(table.getRoundState().isQianggang());
  ASSERT_EQ(table.getCandidates(2u), (std::vector<Action>{ Rong{}, Skip{} }));

  ApplyResult const result = table.apply(2u, Rong{});
  ASSERT_EQ(result.status, ApplyStatus::accepted);
  ASSERT_TRUE(result.round_result.has_value());
  RoundResult const &round_result = *result.round_result;
  EXPECT_EQ(round_result.type, RoundEndType::rong);
  EXPECT_EQ(round_result.winner, 2u);
  EXPECT_EQ(round_result.loser, 0u);
  ASSERT_TRUE(round_result.hule.has_value());
  EXPECT_TRUE(hasYaku(*round_result.hule, Yaku::qianggang));
  EXPECT_EQ(round_result.hule->han, 1u);
  EXPECT_EQ(round_result.hule->fu, 40u);
  EXPECT_EQ(round_result.delta_scores, (Scores{ -1300, 0, 1300, 0 }));
}

TEST(TableTest, SkippedQianggangCompletesTheJiagang)
{
  Table table{ RuleConfig{} };
  table.setTestPaishans({ Testing::createPaishan(jiagang_shoupais, jiagang_zimo_pais, wangpai) });
  table.resetGame({ 1u });
  declareJiagang(table);
  ASSERT_EQ(table.getCurrentSeat(), 2u);

  ApplyResult const result = table.apply(2u, Skip{});
  ASSERT_EQ(result.status, ApplyStatus::accepted);
  EXPECT_EQ(result.phase, Phase::player_discard);
  ASSERT_EQ(table.getCurrentSeat(), 0u);

  RoundState const &round_state = table.getRoundState();
  EXPECT_FALSE(round_state.isQianggang());
  EXPECT_TRUE(round_state.isLingshang());
  EXPECT_EQ(Testing::getZimoPai(table), p("7s"));
  ASSERT_EQ(round_state.getPlayer(0u).getFuluList().size(), 1u);
  EXPECT_EQ(round_state.getPlayer(0u).getFuluList().front().getType(), FuluType::jiagang);
  EXPECT_TRUE(round_state.getPlayer(2u).isTongxunZhenting());

  EXPECT_EQ(round_state.getPaishan().getNumDoraIndicators(), 1u);
  ASSERT_EQ(table.apply(0u, Dapai{ p("9m") }).status, ApplyStatus::accepted);
  EXPECT_EQ(round_state.getPaishan().getNumDoraIndicators(), 2u);
  EXPECT_EQ(table.getCurrentSeat(), 1u);
}

TEST(TableTest, SijiaLizhi)
{
  Table table{ RuleConfig{} };
  table.setTestPaishans({
      Testing::createPaishan(
        { "123456789m46p11z", "123456789p12s99s", "456m123456s1122z", "789m789p456s3344z" },
        "5z6z7z5z", wangpai)
    });
  table.resetGame({ 1u });

  std::optional<RoundResult> round_result;
  for (std::uint_fast8_t seat = 0u; seat < 4u; ++seat) {
    ASSERT_EQ(table.getCurrentSeat(), seat);
    ApplyResult const result = table.apply(seat, Lizhi{ Testing::getZimoPai(table) });
    ASSERT_EQ(result.status, ApplyStatus::accepted);
    round_result = result.round_result;
    if (seat < 3u) {
      ASSERT_FALSE(round_result.has_value());
    }
  }
  ASSERT_TRUE(round_result.has_value());
  EXPECT_EQ(round_result->type, RoundEndType::liuju);
  EXPECT_EQ(round_result->liuju, LiujuType::sijia_lizhi);
  EXPECT_EQ(round_result->delta_scores, Scores{});

  // 供託は次局へ持ち越し．
  GameState const &game_state = table.getGameState();
  EXPECT_EQ(game_state.getScores(), (Scores{ 24000, 24000, 24000, 24000 }));
  EXPECT_EQ(game_state.getNumLizhiDeposits(), 4u);
  EXPECT_EQ(game_state.getBenChang(), 1u);
  EXPECT_EQ(game_state.getZhuangjia(), 0u);
}

TEST(TableTest, SijiaLizhiDisabled)
{
  RuleConfig config;
  config.sijia_lizhi = false;
  Table table(config);
  table.setTestPaishans({
      Testing::createPaishan(
        { "123456789m46p11z", "123456789p12s99s", "456m123456s1122z", "789m789p456s3344z" },
        "5z6z7z5z", wangpai)
    });
  table.resetGame({ 1u });

  for (std::uint_fast8_t seat = 0u; seat < 4u; ++seat) {
    ASSERT_EQ(table.apply(seat, Lizhi{ Testing::getZimoPai(table) }).status, ApplyStatus::accepted);
  }
  EXPECT_FALSE(table.getLastRoundResult().has_value());
  EXPECT_EQ(table.getGameState().getNumLizhiDeposits(), 4u);
  EXPECT_EQ(table.getCurrentSeat(), 0u);
}

TEST(TableTest, FourKansUseUpTheReplacementTiles)
{
  Table table{ RuleConfig{} };
  table.setTestPaishans({
      Testing::createPaishan(
        { "111122223333z4z", "123456789p12s99s", "369m369p369s5566z", "889m889p88s66777z" },
        "4z", "44z19m")
    });
  table.resetGame({ 1u });
  RoundState const &round_state = table.getRoundState();

  for (std::string_view const pai : { "1z", "2z", "3z", "4z" }) {
    ApplyResult const result = table.apply(0u, Gang{ FuluType::angang, p(pai) });
    ASSERT_EQ(result.status, ApplyStatus::accepted) << pai;
    ASSERT_EQ(table.getCurrentSeat(), 0u);
  }
  EXPECT_EQ(round_state.getPlayer(0u).getFuluList().size(), 4u);
  EXPECT_EQ(Testing::getZimoPai(table), p("9m"));
  EXPECT_EQ(round_state.getPaishan().getNumLeftLingshangPais(), 0u);
  EXPECT_EQ(round_state.getPaishan().getNumDoraIndicators(), 5u);
  EXPECT_EQ(round_state.getPaishan().getNumLeftPais(), 65u);

  // 嶺上牌が尽きたので五つ目の槓は無い．
  for (Action const &action : table.getCandidates(0u)) {
    EXPECT_FALSE(std::holds_alternative<Gang>(action)) << action;
  }
}

TEST(TableTest, NoKanOnTheLastTile)
{
  Table table{ RuleConfig{} };
  table.setTestPaishans({
      Testing::createPaishan(
        { "111122223333z4z", "123456789p12s99s", "369m369p369s5566z", "889m889p88s66777z" },
        "4z", "", 0u, false)
    });
  table.resetGame({ 1u });
  ASSERT_EQ(table.getRoundState().getPaishan().getNumLeftPais(), 0u);
  for (Action const &action : table.getCandidates(0u)) {
    EXPECT_FALSE(std::holds_alternative<Gang>(action)) << action;
  }
}

TEST(RoundStateTest, NoReplacementTileFromAnEmptyLiveWall)
{
  RoundState round_state(
    RoundParameters{}, RuleConfig{},
    Testing::createPaishan(
      { "111122223333z4z", "123456789p12s99s", "369m369p369s5566z", "889m889p88s66777z" },
      "4z", "", 0u, false));
  ASSERT_TRUE(round_state.deal());
  ASSERT_EQ(round_state.getPaishan().getNumLeftPais(), 0u);

  round_state.onAngang(p("1z"));
  EXPECT_EQ(round_state.getPhase(), Phase::action_processing);
  // Table はこれを嶺上牌切れの流局とする．
  EXPECT_FALSE(round_state.onLingshangZimo());
  EXPECT_EQ(round_state.getPaishan().getNumLeftLingshangPais(), 4u);
}

} // namespace Quezhuo
