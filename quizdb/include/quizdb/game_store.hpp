/*
 * 설명: 게임 전체 기록의 원자적 저장/삭제, 조회, 중복 게임 판정을 묶는 저장소 파사드.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: quizdb/tests/it/game_store_it_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "quizdb/db_client.hpp"
#include "quizdb/game.hpp"
#include "quizdb/game_repository.hpp"
#include "quizdb/observability.hpp"
#include "quizdb/score_repository.hpp"
#include "quizdb/team_game_scores.hpp"
#include "quizdb/team_repository.hpp"

namespace quizdb {

enum class SaveStatus { kSaved, kDuplicate, kFailed };

struct SaveOutcome {
  SaveStatus status;
  std::optional<int> game_id;
  std::string error;
};

struct ClearSummary {
  std::size_t games_deleted{0};
  std::size_t games_failed{0};
  std::size_t teams_deleted{0};
};

class GameStore {
 public:
  GameStore(std::shared_ptr<MariaDbClient> db_client, std::shared_ptr<Observability> observability);

  // 게임, 소속, 점수를 한 트랜잭션으로 저장하고 새 game_id를 반환한다.
  // 검증 실패는 ValidationError, 저장 실패는 DbException이며 어느 경우에도 부분 기록은 남지 않는다.
  int AddGame(const GameRecord& game);
  // 없는 게임이면 false.
  bool RemoveGame(int game_id);

  std::optional<GameRecord> GetGameData(int game_id) const;
  std::vector<GameSummary> GetAllGames() const;
  // [start, end] 포함. end가 없으면 start 하루.
  std::vector<int> GetGameIdsByDate(const GameDate& start, const std::optional<GameDate>& end = std::nullopt) const;
  std::optional<int> FindIdenticalGame(const GameRecord& candidate) const;

  SaveOutcome SaveGameIfNew(const GameRecord& game);
  ClearSummary ClearDatabase(bool clear_teams);

  std::vector<AggregatedRow> GetStandings(int game_id) const;
  std::vector<AggregatedRow> GetTeamHistory(const std::string& team_name, const GameDate& since) const;

  std::shared_ptr<TeamRepository> GetTeamRepository() { return teams_; }

 private:
  int InsertGameInTx(MYSQL* conn, const GameRecord& game);
  void LogEvent(LogContext ctx, std::chrono::steady_clock::time_point started) const;

  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<TeamRepository> teams_;
  std::shared_ptr<GameRepository> games_;
  std::shared_ptr<ScoreRepository> scores_;
  std::shared_ptr<TeamGameScoresView> view_;
};

}  // namespace quizdb
