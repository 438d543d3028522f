/*
 * 설명: games / game_teams 테이블의 저장, 조회, 삭제를 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, quizdb/sql/001_core_tables.sql
 * 테스트: quizdb/tests/it/game_store_it_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <mariadb/mysql.h>

#include "quizdb/db_client.hpp"
#include "quizdb/game_date.hpp"
#include "quizdb/team_repository.hpp"

namespace quizdb {

struct GameSummary {
  int game_id;
  GameDate game_date;
  std::chrono::system_clock::time_point created_at;
};

class GameRepository {
 public:
  explicit GameRepository(std::shared_ptr<MariaDbClient> db_client);

  int InsertGameInTx(MYSQL* conn, const GameDate& date);
  void InsertMembershipInTx(MYSQL* conn, int game_id, int team_id);
  // 행 잠금까지 건다. 없으면 false.
  bool LockGameInTx(MYSQL* conn, int game_id);
  void DeleteMembershipsInTx(MYSQL* conn, int game_id);
  void DeleteGameRowInTx(MYSQL* conn, int game_id);

  std::optional<GameSummary> Find(MYSQL* conn, int game_id) const;
  std::vector<TeamRecord> LoadMembers(MYSQL* conn, int game_id) const;
  std::vector<GameSummary> ListAll(MYSQL* conn) const;
  std::vector<int> FindIdsByDateRange(MYSQL* conn, const GameDate& start, const GameDate& end) const;
  std::size_t CountMemberships(MYSQL* conn, int game_id) const;

 private:
  GameSummary BuildSummary(MYSQL_ROW row) const;

  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace quizdb
