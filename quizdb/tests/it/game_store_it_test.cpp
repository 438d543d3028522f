#include <algorithm>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

#include <gtest/gtest.h>
#include <mariadb/mysql.h>

#include "quizdb/game_repository.hpp"
#include "quizdb/game_store.hpp"
#include "quizdb/score_repository.hpp"
#include "quizdb/validation_error.hpp"

namespace {

quizdb::DbConfig TestDbConfig() {
  quizdb::DbConfig cfg;
  const char* host = std::getenv("DB_HOST");
  const char* port = std::getenv("DB_PORT");
  const char* user = std::getenv("DB_USER");
  const char* pass = std::getenv("DB_PASSWORD");
  const char* name = std::getenv("DB_NAME");
  cfg.host = host ? host : "127.0.0.1";
  cfg.port = port ? static_cast<unsigned short>(std::stoi(port)) : 3306;
  cfg.user = user ? user : "app";
  cfg.password = pass ? pass : "app_pass";
  cfg.database = name ? name : "quiz_db";
  return cfg;
}

quizdb::Points P(const char* text) { return quizdb::Points::Parse(text); }

// 일곱 라운드를 모두 채운 팀. 총점은 selection 값에 따라 달라진다.
quizdb::TeamEntry FullTeam(const std::string& name, const char* selection) {
  quizdb::TeamEntry team{name, {}};
  team.rounds.emplace(quizdb::RoundKind::kSelection, quizdb::SelectionScore{P(selection)});

  quizdb::NumbersScore numbers;
  numbers.tasks = {P("1"), P("2"), P("0"), P("3.5"), P("1")};
  numbers.total = P("7.50");
  team.rounds.emplace(quizdb::RoundKind::kNumbers, numbers);

  quizdb::PreferenceScore pref;
  pref.tasks = {P("1"), P("1"), P("1"), P("1"), P("1"), P("1"), P("1")};
  pref.points = P("7");
  pref.penalty = P("-2");
  pref.bonus = P("1");
  pref.total = P("6");
  team.rounds.emplace(quizdb::RoundKind::kPreference, pref);

  team.rounds.emplace(quizdb::RoundKind::kPairs, quizdb::PairsScore{P("4.25")});

  quizdb::ExposureScore exposure;
  exposure.tasks = {P("2"), P("2"), P("0"), P("1")};
  exposure.total = P("5");
  team.rounds.emplace(quizdb::RoundKind::kExposure, exposure);

  quizdb::AuctionScore auction;
  auction.tasks[0] = {P("10"), P("20"), P("2")};
  auction.tasks[1] = {P("5"), P("-5"), std::nullopt};
  auction.tasks[2] = {P("0"), P("0"), std::nullopt};
  auction.tasks[3] = {P("3"), P("4.5"), P("1.5")};
  auction.total = P("19.50");
  team.rounds.emplace(quizdb::RoundKind::kAuction, auction);

  quizdb::MomentOfTruthScore mot;
  mot.tasks = {P("3"), P("0"), P("-1")};
  mot.total = P("2");
  team.rounds.emplace(quizdb::RoundKind::kMomentOfTruth, mot);
  return team;
}

quizdb::TeamEntry SelectionOnly(const std::string& name, const char* points) {
  quizdb::TeamEntry team{name, {}};
  team.rounds.emplace(quizdb::RoundKind::kSelection, quizdb::SelectionScore{P(points)});
  return team;
}

quizdb::GameRecord MakeGame(const char* date, std::vector<quizdb::TeamEntry> teams) {
  quizdb::GameRecord game;
  game.date = quizdb::GameDate::Parse(date);
  game.teams = std::move(teams);
  return game;
}

class GameStoreItTest : public ::testing::Test {
 protected:
  void SetUp() override {
    db_client_ = std::make_shared<quizdb::MariaDbClient>(TestDbConfig());
    observability_ = std::make_shared<quizdb::Observability>(quizdb::LogLevel::kDebug, log_);
    store_ = std::make_unique<quizdb::GameStore>(db_client_, observability_);
    store_->ClearDatabase(true);
  }

  std::size_t OrphanRows(int game_id) {
    quizdb::GameRepository games(db_client_);
    quizdb::ScoreRepository scores(db_client_);
    std::size_t count = 0;
    db_client_->WithConnection([&](MYSQL* conn) {
      count = games.CountMemberships(conn, game_id) + scores.CountForGame(conn, game_id);
    });
    return count;
  }

  std::ostringstream log_;
  std::shared_ptr<quizdb::MariaDbClient> db_client_;
  std::shared_ptr<quizdb::Observability> observability_;
  std::unique_ptr<quizdb::GameStore> store_;
};

TEST_F(GameStoreItTest, AddThenGetReproducesEveryRound) {
  auto game = MakeGame("2024-01-15", {FullTeam("Alpha", "12.00"), FullTeam("Beta", "0.50")});
  int game_id = store_->AddGame(game);

  auto loaded = store_->GetGameData(game_id);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->game_id, std::optional<int>(game_id));
  EXPECT_EQ(loaded->date, game.date);
  ASSERT_EQ(loaded->teams.size(), game.teams.size());
  for (const auto& team : game.teams) {
    const auto* stored = loaded->FindTeam(team.name);
    ASSERT_NE(stored, nullptr) << team.name;
    EXPECT_EQ(stored->rounds, team.rounds) << team.name;
  }
}

TEST_F(GameStoreItTest, PartialRoundsRoundTripWithoutZeroFilling) {
  auto game = MakeGame("2024-02-01", {SelectionOnly("Alpha", "3.00")});
  int game_id = store_->AddGame(game);

  auto loaded = store_->GetGameData(game_id);
  ASSERT_TRUE(loaded.has_value());
  ASSERT_EQ(loaded->teams.size(), 1u);
  EXPECT_EQ(loaded->teams[0].rounds.size(), 1u);
  EXPECT_EQ(loaded->teams[0].rounds, game.teams[0].rounds);
}

TEST_F(GameStoreItTest, ResubmittedGameIsDetectedAsIdentical) {
  auto game = MakeGame("2024-01-15", {SelectionOnly("Alpha", "42.50"), SelectionOnly("Beta", "37.00")});
  int g1 = store_->AddGame(game);

  EXPECT_EQ(store_->GetGameIdsByDate(quizdb::GameDate::Parse("2024-01-15")), std::vector<int>({g1}));

  auto resubmitted = MakeGame("2024-01-15", {SelectionOnly("Beta", "37.00"), SelectionOnly("Alpha", "42.50")});
  EXPECT_EQ(store_->FindIdenticalGame(resubmitted), std::optional<int>(g1));

  auto outcome = store_->SaveGameIfNew(resubmitted);
  EXPECT_EQ(outcome.status, quizdb::SaveStatus::kDuplicate);
  EXPECT_EQ(outcome.game_id, std::optional<int>(g1));
  EXPECT_EQ(store_->GetAllGames().size(), 1u);
  EXPECT_EQ(observability_->Snapshot().duplicates_skipped, 1u);
}

TEST_F(GameStoreItTest, DifferentTotalIsNotIdentical) {
  store_->AddGame(MakeGame("2024-01-15", {SelectionOnly("Alpha", "42.50"), SelectionOnly("Beta", "37.00")}));

  auto changed = MakeGame("2024-01-15", {SelectionOnly("Alpha", "42.50"), SelectionOnly("Beta", "37.01")});
  EXPECT_FALSE(store_->FindIdenticalGame(changed).has_value());

  auto other_day = MakeGame("2024-01-16", {SelectionOnly("Alpha", "42.50"), SelectionOnly("Beta", "37.00")});
  EXPECT_FALSE(store_->FindIdenticalGame(other_day).has_value());

  auto outcome = store_->SaveGameIfNew(changed);
  EXPECT_EQ(outcome.status, quizdb::SaveStatus::kSaved);
  EXPECT_EQ(store_->GetGameIdsByDate(quizdb::GameDate::Parse("2024-01-15")).size(), 2u);
}

TEST_F(GameStoreItTest, StoredTotalAboveColumnRangeKeepsDetectionWorking) {
  quizdb::TeamEntry big{"Alpha", {}};
  big.rounds.emplace(quizdb::RoundKind::kSelection, quizdb::SelectionScore{P("60000000.00")});
  big.rounds.emplace(quizdb::RoundKind::kPairs, quizdb::PairsScore{P("60000000.00")});
  int g1 = store_->AddGame(MakeGame("2024-07-01", {big}));

  EXPECT_EQ(store_->FindIdenticalGame(MakeGame("2024-07-01", {big})), std::optional<int>(g1));
  auto standings = store_->GetStandings(g1);
  ASSERT_EQ(standings.size(), 1u);
  EXPECT_EQ(standings[0].scores.total.ToString(), "120000000.00");

  auto outcome = store_->SaveGameIfNew(MakeGame("2024-07-01", {SelectionOnly("Beta", "1")}));
  EXPECT_EQ(outcome.status, quizdb::SaveStatus::kSaved);
}

TEST_F(GameStoreItTest, IdenticalDetectionUsesEveryRoundSubtotal) {
  int g1 = store_->AddGame(MakeGame("2024-05-05", {FullTeam("Alpha", "12.00"), FullTeam("Beta", "0.50")}));
  EXPECT_EQ(store_->FindIdenticalGame(MakeGame("2024-05-05", {FullTeam("Beta", "0.50"), FullTeam("Alpha", "12.00")})),
            std::optional<int>(g1));

  // 총점은 같지만 라운드 분배가 다르다.
  auto shifted = FullTeam("Alpha", "13.00");
  std::get<quizdb::PairsScore>(shifted.rounds[quizdb::RoundKind::kPairs]).points = P("3.25");
  ASSERT_EQ(quizdb::ScoreVectorOf(shifted).total, quizdb::ScoreVectorOf(FullTeam("Alpha", "12.00")).total);
  EXPECT_FALSE(store_->FindIdenticalGame(MakeGame("2024-05-05", {shifted, FullTeam("Beta", "0.50")})).has_value());
}

TEST_F(GameStoreItTest, RemoveGameCascadesButKeepsTeams) {
  int g1 = store_->AddGame(MakeGame("2024-01-15", {FullTeam("Alpha", "42.50"), FullTeam("Beta", "37.00")}));
  auto alpha = store_->GetTeamRepository()->FindByName("Alpha");
  ASSERT_TRUE(alpha.has_value());

  EXPECT_TRUE(store_->RemoveGame(g1));
  EXPECT_FALSE(store_->GetGameData(g1).has_value());
  EXPECT_EQ(OrphanRows(g1), 0u);
  auto all = store_->GetAllGames();
  EXPECT_TRUE(std::none_of(all.begin(), all.end(), [&](const quizdb::GameSummary& g) { return g.game_id == g1; }));

  auto still_there = store_->GetTeamRepository()->FindByName("Alpha");
  ASSERT_TRUE(still_there.has_value());
  EXPECT_EQ(still_there->team_id, alpha->team_id);

  int g2 = store_->AddGame(MakeGame("2024-01-22", {SelectionOnly("Alpha", "1.00")}));
  EXPECT_NE(g2, g1);
  EXPECT_EQ(store_->GetTeamRepository()->FindByName("Alpha")->team_id, alpha->team_id);
  EXPECT_EQ(store_->GetTeamRepository()->Count(), 2u);
}

TEST_F(GameStoreItTest, RemovingMissingGameReportsNotFound) {
  EXPECT_FALSE(store_->RemoveGame(987654));
  EXPECT_EQ(observability_->Snapshot().games_removed, 0u);
}

TEST_F(GameStoreItTest, GetAllGamesOrdersByDateThenId) {
  int march_a = store_->AddGame(MakeGame("2024-03-01", {SelectionOnly("Alpha", "1")}));
  int january = store_->AddGame(MakeGame("2024-01-01", {SelectionOnly("Alpha", "2")}));
  int march_b = store_->AddGame(MakeGame("2024-03-01", {SelectionOnly("Beta", "3")}));

  auto games = store_->GetAllGames();
  ASSERT_EQ(games.size(), 3u);
  EXPECT_EQ(games[0].game_id, january);
  EXPECT_EQ(games[1].game_id, march_a);
  EXPECT_EQ(games[2].game_id, march_b);
  EXPECT_EQ(games[0].game_date.ToString(), "2024-01-01");
}

TEST_F(GameStoreItTest, GameIdsByDateRangeIsInclusive) {
  int d1 = store_->AddGame(MakeGame("2024-01-10", {SelectionOnly("Alpha", "1")}));
  int d2 = store_->AddGame(MakeGame("2024-01-20", {SelectionOnly("Alpha", "1")}));
  store_->AddGame(MakeGame("2024-01-21", {SelectionOnly("Alpha", "1")}));

  auto start = quizdb::GameDate::Parse("2024-01-10");
  auto end = quizdb::GameDate::Parse("2024-01-20");
  EXPECT_EQ(store_->GetGameIdsByDate(start, end), std::vector<int>({d1, d2}));
  EXPECT_EQ(store_->GetGameIdsByDate(end), std::vector<int>({d2}));
  EXPECT_TRUE(store_->GetGameIdsByDate(end, start).empty());
  EXPECT_TRUE(store_->GetGameIdsByDate(quizdb::GameDate::Parse("2023-12-31")).empty());
}

TEST_F(GameStoreItTest, InvalidSubmissionWritesNothing) {
  EXPECT_THROW(store_->AddGame(MakeGame("2024-01-15", {})), quizdb::ValidationError);
  EXPECT_THROW(store_->AddGame(MakeGame("2024-01-15", {SelectionOnly("Alpha", "1"), SelectionOnly("Alpha", "2")})),
               quizdb::ValidationError);
  EXPECT_TRUE(store_->GetAllGames().empty());
  EXPECT_EQ(store_->GetTeamRepository()->Count(), 0u);
  EXPECT_EQ(observability_->Snapshot().failures, 2u);
}

TEST_F(GameStoreItTest, FailureMidTransactionRollsBackEverything) {
  quizdb::GameRepository games(db_client_);
  quizdb::TeamRepository teams(db_client_);
  EXPECT_THROW(db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) -> bool {
    int game_id = games.InsertGameInTx(conn, quizdb::GameDate::Parse("2024-01-15"));
    int team_id = teams.GetOrCreateInTx(conn, "Ghost");
    games.InsertMembershipInTx(conn, game_id, team_id);
    throw std::runtime_error("중간 실패");
  }),
               std::runtime_error);

  EXPECT_TRUE(store_->GetAllGames().empty());
  EXPECT_FALSE(teams.FindByName("Ghost").has_value());
}

TEST_F(GameStoreItTest, ScoreWithoutMembershipIsRejected) {
  quizdb::GameRepository games(db_client_);
  quizdb::ScoreRepository scores(db_client_);
  quizdb::TeamRepository teams(db_client_);
  EXPECT_THROW(db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    int game_id = games.InsertGameInTx(conn, quizdb::GameDate::Parse("2024-01-15"));
    int team_id = teams.GetOrCreateInTx(conn, "Loner");
    scores.InsertInTx(conn, game_id, team_id, quizdb::SelectionScore{P("1")});
    return true;
  }),
               quizdb::DbException);
  EXPECT_TRUE(store_->GetAllGames().empty());
}

TEST_F(GameStoreItTest, TransientFailureRetriesTransaction) {
  db_client_->SetTransientInjector([](std::size_t attempt) { return attempt == 1; });
  int game_id = store_->AddGame(MakeGame("2024-01-15", {FullTeam("Alpha", "1")}));
  db_client_->SetTransientInjector(nullptr);

  EXPECT_TRUE(store_->GetGameData(game_id).has_value());
  EXPECT_EQ(store_->GetAllGames().size(), 1u);
}

TEST_F(GameStoreItTest, ConcurrentSaveOfSameGameStoresOnce) {
  auto game = MakeGame("2024-06-01", {FullTeam("Alpha", "5"), FullTeam("Beta", "6")});
  quizdb::SaveOutcome first{quizdb::SaveStatus::kFailed, std::nullopt, ""};
  quizdb::SaveOutcome second{quizdb::SaveStatus::kFailed, std::nullopt, ""};
  std::thread t1([&]() { first = store_->SaveGameIfNew(game); });
  std::thread t2([&]() { second = store_->SaveGameIfNew(game); });
  t1.join();
  t2.join();

  EXPECT_EQ(store_->GetAllGames().size(), 1u);
  std::vector<quizdb::SaveStatus> statuses{first.status, second.status};
  EXPECT_EQ(std::count(statuses.begin(), statuses.end(), quizdb::SaveStatus::kSaved), 1);
  EXPECT_EQ(std::count(statuses.begin(), statuses.end(), quizdb::SaveStatus::kDuplicate), 1);
}

TEST_F(GameStoreItTest, StandingsAndTeamHistoryComeFromAggregatedView) {
  int g1 = store_->AddGame(MakeGame("2024-01-15", {SelectionOnly("Alpha", "10"), FullTeam("Beta", "1")}));
  int g2 = store_->AddGame(MakeGame("2024-02-15", {SelectionOnly("Alpha", "20")}));

  auto standings = store_->GetStandings(g1);
  ASSERT_EQ(standings.size(), 2u);
  EXPECT_EQ(standings[0].team_name, "Beta");
  EXPECT_EQ(standings[0].scores, quizdb::ScoreVectorOf(FullTeam("Beta", "1")));
  EXPECT_EQ(standings[1].team_name, "Alpha");
  EXPECT_EQ(standings[1].scores.total, P("10"));
  EXPECT_EQ(standings[1].scores.rounds[static_cast<std::size_t>(quizdb::RoundKind::kAuction)], P("0"));

  auto history = store_->GetTeamHistory("Alpha", quizdb::GameDate::Parse("2024-01-01"));
  ASSERT_EQ(history.size(), 2u);
  EXPECT_EQ(history[0].game_id, g1);
  EXPECT_EQ(history[1].game_id, g2);
  EXPECT_EQ(store_->GetTeamHistory("Alpha", quizdb::GameDate::Parse("2024-02-01")).size(), 1u);
}

TEST_F(GameStoreItTest, ClearDatabaseRemovesGamesAndOptionallyTeams) {
  store_->AddGame(MakeGame("2024-01-15", {SelectionOnly("Alpha", "1")}));
  store_->AddGame(MakeGame("2024-01-16", {SelectionOnly("Beta", "1")}));

  auto games_only = store_->ClearDatabase(false);
  EXPECT_EQ(games_only.games_deleted, 2u);
  EXPECT_EQ(games_only.teams_deleted, 0u);
  EXPECT_EQ(store_->GetTeamRepository()->Count(), 2u);

  auto with_teams = store_->ClearDatabase(true);
  EXPECT_EQ(with_teams.games_deleted, 0u);
  EXPECT_EQ(with_teams.teams_deleted, 2u);
  EXPECT_EQ(store_->GetTeamRepository()->Count(), 0u);
}

}  // namespace
