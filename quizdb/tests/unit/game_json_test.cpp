#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "quizdb/game.hpp"
#include "quizdb/validation_error.hpp"

namespace {

nlohmann::json SampleGameJson() {
  return nlohmann::json::parse(R"({
    "date": "2024-01-15",
    "teams": [
      {"name": "Alpha", "rounds": {
        "selection": {"points": 10},
        "numbers": {"tasks": [1, 2, 3, 4, 5], "total": "15.00"},
        "pairs": {"points": "17.5"}
      }},
      {"name": "  Beta   Team ", "rounds": {
        "moment_of_truth": {"tasks": [10, 12, 15], "total": 37}
      }}
    ]
  })");
}

}  // namespace

TEST(GameJsonTest, ParsesSubmission) {
  auto game = quizdb::GameFromJson(SampleGameJson());
  EXPECT_FALSE(game.game_id.has_value());
  EXPECT_EQ(game.date.ToString(), "2024-01-15");
  ASSERT_EQ(game.teams.size(), 2u);
  EXPECT_EQ(game.teams[0].name, "Alpha");
  EXPECT_EQ(game.teams[0].rounds.size(), 3u);
  EXPECT_EQ(game.teams[1].name, "Beta Team");
}

TEST(GameJsonTest, ScoreVectorSumsRoundSubtotals) {
  auto game = quizdb::GameFromJson(SampleGameJson());
  auto alpha = quizdb::ScoreVectorOf(game.teams[0]);
  EXPECT_EQ(alpha.rounds[static_cast<std::size_t>(quizdb::RoundKind::kSelection)].cents(), 1000);
  EXPECT_EQ(alpha.rounds[static_cast<std::size_t>(quizdb::RoundKind::kPreference)].cents(), 0);
  EXPECT_EQ(alpha.total.ToString(), "42.50");

  auto beta = quizdb::ScoreVectorOf(game.teams[1]);
  EXPECT_EQ(beta.total.ToString(), "37.00");
}

TEST(GameJsonTest, SerializesBackToEquivalentJson) {
  auto game = quizdb::GameFromJson(SampleGameJson());
  auto json = quizdb::GameToJson(game);
  EXPECT_TRUE(json["game_id"].is_null());
  EXPECT_EQ(json["teams"][0]["rounds"]["pairs"]["points"], "17.50");

  auto reparsed = quizdb::GameFromJson(json);
  ASSERT_EQ(reparsed.teams.size(), game.teams.size());
  for (std::size_t i = 0; i < game.teams.size(); ++i) {
    EXPECT_EQ(reparsed.teams[i].name, game.teams[i].name);
    EXPECT_EQ(reparsed.teams[i].rounds, game.teams[i].rounds);
  }
}

TEST(GameJsonTest, RejectsGameWithoutTeams) {
  nlohmann::json doc{{"date", "2024-01-15"}, {"teams", nlohmann::json::array()}};
  EXPECT_THROW(quizdb::GameFromJson(doc), quizdb::ValidationError);
}

TEST(GameJsonTest, RejectsUnknownRound) {
  auto doc = SampleGameJson();
  doc["teams"][0]["rounds"]["lightning"] = {{"points", 1}};
  EXPECT_THROW(quizdb::GameFromJson(doc), quizdb::ValidationError);
}

TEST(GameJsonTest, RejectsRepeatedTeamAfterNormalization) {
  auto doc = SampleGameJson();
  doc["teams"][1]["name"] = " Alpha";
  EXPECT_THROW(quizdb::GameFromJson(doc), quizdb::ValidationError);
}

TEST(GameJsonTest, RejectsBadDate) {
  auto doc = SampleGameJson();
  doc["date"] = "2024-02-30";
  EXPECT_THROW(quizdb::GameFromJson(doc), quizdb::ValidationError);
}

TEST(GameValidationTest, RejectsMismatchedRoundKey) {
  quizdb::GameRecord game;
  game.date = quizdb::GameDate::Parse("2024-01-15");
  quizdb::TeamEntry team{"Alpha", {}};
  team.rounds.emplace(quizdb::RoundKind::kPairs, quizdb::SelectionScore{quizdb::Points::FromCents(100)});
  game.teams.push_back(team);
  EXPECT_THROW(quizdb::ValidateGame(game), quizdb::ValidationError);
}

TEST(GameValidationTest, RejectsEmptyTeamName) {
  quizdb::GameRecord game;
  game.teams.push_back(quizdb::TeamEntry{"", {}});
  EXPECT_THROW(quizdb::ValidateGame(game), quizdb::ValidationError);
}

TEST(GameValidationTest, RejectsOutOfColumnRangeValue) {
  quizdb::GameRecord game;
  quizdb::TeamEntry team{"Alpha", {}};
  team.rounds.emplace(quizdb::RoundKind::kSelection,
                      quizdb::SelectionScore{quizdb::Points::FromCents(quizdb::Points::kMaxCents + 1)});
  game.teams.push_back(team);
  EXPECT_THROW(quizdb::ValidateGame(game), quizdb::ValidationError);
}

TEST(TeamNameTest, NormalizesWhitespaceOnly) {
  EXPECT_EQ(quizdb::NormalizeTeamName("  Alpha \t Omega  "), "Alpha Omega");
  EXPECT_EQ(quizdb::NormalizeTeamName("alpha"), "alpha");
  EXPECT_EQ(quizdb::NormalizeTeamName("   "), "");
}

TEST(GameJsonTest, RejectsNonIntegerGameId) {
  auto doc = SampleGameJson();
  doc["game_id"] = "12";
  EXPECT_THROW(quizdb::GameFromJson(doc), quizdb::ValidationError);
  doc["game_id"] = 1.5;
  EXPECT_THROW(quizdb::GameFromJson(doc), quizdb::ValidationError);
  doc["game_id"] = nlohmann::json::parse("4294967296");
  EXPECT_THROW(quizdb::GameFromJson(doc), quizdb::ValidationError);
  doc["game_id"] = 12;
  EXPECT_EQ(quizdb::GameFromJson(doc).game_id, std::optional<int>(12));
}

TEST(GameValidationTest, TeamNameLengthCountsCharacters) {
  quizdb::GameRecord game;
  game.teams.push_back(quizdb::TeamEntry{std::string(257, 'a'), {}});
  EXPECT_THROW(quizdb::ValidateGame(game), quizdb::ValidationError);

  // 키릴 문자 256자는 1바이트 기준으로는 512바이트다.
  std::string cyrillic;
  for (int i = 0; i < 256; ++i) {
    cyrillic += "Ж";
  }
  game.teams[0].name = cyrillic;
  EXPECT_NO_THROW(quizdb::ValidateGame(game));
  game.teams[0].name += "Ж";
  EXPECT_THROW(quizdb::ValidateGame(game), quizdb::ValidationError);
}
