/*
 * 설명: 게임 기록 저장/삭제 트랜잭션과 조회, 중복 판정을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: quizdb/tests/it/game_store_it_test.cpp
 */
#include "quizdb/game_store.hpp"

#include "quizdb/duplicate_detection.hpp"

namespace quizdb {

GameStore::GameStore(std::shared_ptr<MariaDbClient> db_client, std::shared_ptr<Observability> observability)
    : db_client_(std::move(db_client)),
      observability_(observability ? std::move(observability) : std::make_shared<Observability>()),
      teams_(std::make_shared<TeamRepository>(db_client_)),
      games_(std::make_shared<GameRepository>(db_client_)),
      scores_(std::make_shared<ScoreRepository>(db_client_)),
      view_(std::make_shared<TeamGameScoresView>(db_client_)) {}

int GameStore::InsertGameInTx(MYSQL* conn, const GameRecord& game) {
  int game_id = games_->InsertGameInTx(conn, game.date);
  for (const auto& team : game.teams) {
    int team_id = teams_->GetOrCreateInTx(conn, team.name);
    games_->InsertMembershipInTx(conn, game_id, team_id);
    for (const auto& [kind, score] : team.rounds) {
      scores_->InsertInTx(conn, game_id, team_id, score);
    }
  }
  return game_id;
}

int GameStore::AddGame(const GameRecord& game) {
  auto started = std::chrono::steady_clock::now();
  std::string trace_id = observability_->NextTraceId();
  try {
    ValidateGame(game);
    int game_id = 0;
    db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
      game_id = InsertGameInTx(conn, game);
      return true;
    });
    observability_->IncrementAdded();
    LogEvent({trace_id, "gameAdded", LogLevel::kInfo, game_id, game.date.ToString(), std::nullopt}, started);
    return game_id;
  } catch (const std::exception& ex) {
    observability_->IncrementFailure();
    LogEvent({trace_id, "gameAddFailed", LogLevel::kError, std::nullopt, game.date.ToString(), ex.what()}, started);
    throw;
  }
}

bool GameStore::RemoveGame(int game_id) {
  auto started = std::chrono::steady_clock::now();
  std::string trace_id = observability_->NextTraceId();
  bool removed = db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    if (!games_->LockGameInTx(conn, game_id)) {
      return false;
    }
    scores_->DeleteForGameInTx(conn, game_id);
    games_->DeleteMembershipsInTx(conn, game_id);
    games_->DeleteGameRowInTx(conn, game_id);
    return true;
  });
  if (removed) {
    observability_->IncrementRemoved();
    LogEvent({trace_id, "gameRemoved", LogLevel::kInfo, game_id, std::nullopt, std::nullopt}, started);
  } else {
    LogEvent({trace_id, "gameNotFound", LogLevel::kWarn, game_id, std::nullopt, std::nullopt}, started);
  }
  return removed;
}

std::optional<GameRecord> GameStore::GetGameData(int game_id) const {
  std::optional<GameRecord> result;
  db_client_->WithReadSnapshot([&](MYSQL* conn) {
    auto summary = games_->Find(conn, game_id);
    if (!summary) {
      return;
    }
    GameRecord game;
    game.game_id = summary->game_id;
    game.date = summary->game_date;

    auto members = games_->LoadMembers(conn, game_id);
    std::map<int, std::map<RoundKind, RoundScore>> rounds_by_team;
    for (RoundKind kind : kAllRoundKinds) {
      for (auto& [team_id, score] : scores_->LoadForGame(conn, game_id, kind)) {
        rounds_by_team[team_id].emplace(kind, std::move(score));
      }
    }
    for (const auto& member : members) {
      game.teams.push_back(TeamEntry{member.team_name, std::move(rounds_by_team[member.team_id])});
    }
    result = std::move(game);
  });
  return result;
}

std::vector<GameSummary> GameStore::GetAllGames() const {
  std::vector<GameSummary> games;
  db_client_->WithConnection([&](MYSQL* conn) { games = games_->ListAll(conn); });
  return games;
}

std::vector<int> GameStore::GetGameIdsByDate(const GameDate& start, const std::optional<GameDate>& end) const {
  GameDate last = end.value_or(start);
  std::vector<int> ids;
  if (last < start) {
    return ids;
  }
  db_client_->WithConnection([&](MYSQL* conn) { ids = games_->FindIdsByDateRange(conn, start, last); });
  return ids;
}

std::optional<int> GameStore::FindIdenticalGame(const GameRecord& candidate) const {
  ValidateGame(candidate);
  std::vector<AggregatedRow> rows;
  db_client_->WithConnection([&](MYSQL* conn) { rows = view_->LoadByDate(conn, candidate.date); });
  return FindIdenticalAmong(candidate, rows);
}

SaveOutcome GameStore::SaveGameIfNew(const GameRecord& game) {
  auto started = std::chrono::steady_clock::now();
  std::string trace_id = observability_->NextTraceId();
  try {
    ValidateGame(game);
    std::optional<int> existing;
    int game_id = 0;
    // 같은 트랜잭션에서 판정하고 저장해야 동시에 들어온 같은 게임이 둘 다 저장되지 않는다.
    bool saved = db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
      existing = FindIdenticalAmong(game, view_->LoadByDate(conn, game.date));
      if (existing) {
        return false;
      }
      game_id = InsertGameInTx(conn, game);
      return true;
    });
    if (!saved) {
      observability_->IncrementDuplicate();
      LogEvent({trace_id, "gameDuplicateSkipped", LogLevel::kInfo, existing, game.date.ToString(), std::nullopt},
               started);
      return SaveOutcome{SaveStatus::kDuplicate, existing, ""};
    }
    observability_->IncrementAdded();
    LogEvent({trace_id, "gameAdded", LogLevel::kInfo, game_id, game.date.ToString(), std::nullopt}, started);
    return SaveOutcome{SaveStatus::kSaved, game_id, ""};
  } catch (const std::exception& ex) {
    observability_->IncrementFailure();
    LogEvent({trace_id, "gameSaveFailed", LogLevel::kError, std::nullopt, game.date.ToString(), ex.what()}, started);
    return SaveOutcome{SaveStatus::kFailed, std::nullopt, ex.what()};
  }
}

ClearSummary GameStore::ClearDatabase(bool clear_teams) {
  ClearSummary summary;
  for (const auto& game : GetAllGames()) {
    try {
      if (RemoveGame(game.game_id)) {
        ++summary.games_deleted;
      }
    } catch (const DbException& ex) {
      ++summary.games_failed;
      observability_->IncrementFailure();
      observability_->Log({observability_->NextTraceId(), "gameRemoveFailed", LogLevel::kError, game.game_id,
                           game.game_date.ToString(), ex.what()});
    }
  }
  if (clear_teams) {
    db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
      summary.teams_deleted = teams_->DeleteAllInTx(conn);
      return true;
    });
  }
  return summary;
}

std::vector<AggregatedRow> GameStore::GetStandings(int game_id) const {
  std::vector<AggregatedRow> rows;
  db_client_->WithConnection([&](MYSQL* conn) { rows = view_->LoadByGame(conn, game_id); });
  return rows;
}

std::vector<AggregatedRow> GameStore::GetTeamHistory(const std::string& team_name, const GameDate& since) const {
  std::vector<AggregatedRow> rows;
  db_client_->WithConnection([&](MYSQL* conn) { rows = view_->LoadByTeamSince(conn, team_name, since); });
  return rows;
}

void GameStore::LogEvent(LogContext ctx, std::chrono::steady_clock::time_point started) const {
  ctx.latency_ms = static_cast<long>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count());
  observability_->Log(ctx);
}

}  // namespace quizdb
