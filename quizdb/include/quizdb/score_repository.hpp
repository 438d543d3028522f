/*
 * 설명: 일곱 라운드 점수 테이블의 (게임, 팀) 단위 저장/조회/삭제를 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, quizdb/sql/001_core_tables.sql
 * 테스트: quizdb/tests/it/game_store_it_test.cpp
 */
#pragma once

#include <map>
#include <memory>

#include <mariadb/mysql.h>

#include "quizdb/db_client.hpp"
#include "quizdb/round_scores.hpp"

namespace quizdb {

class ScoreRepository {
 public:
  explicit ScoreRepository(std::shared_ptr<MariaDbClient> db_client);

  void InsertInTx(MYSQL* conn, int game_id, int team_id, const RoundScore& score);
  // team_id -> 점수. 기록이 없는 팀은 결과에 없다.
  std::map<int, RoundScore> LoadForGame(MYSQL* conn, int game_id, RoundKind kind) const;
  void DeleteForGameInTx(MYSQL* conn, int game_id);
  std::size_t CountForGame(MYSQL* conn, int game_id) const;

 private:
  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace quizdb
