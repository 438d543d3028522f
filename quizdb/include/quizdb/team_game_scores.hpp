/*
 * 설명: team_game_scores 집계 뷰를 (게임, 팀) 단위 행으로 읽는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, quizdb/sql/002_team_game_scores_view.sql
 * 테스트: quizdb/tests/it/game_store_it_test.cpp
 */
#pragma once

#include <memory>
#include <string>
#include <vector>

#include <mariadb/mysql.h>

#include "quizdb/db_client.hpp"
#include "quizdb/game.hpp"
#include "quizdb/game_date.hpp"

namespace quizdb {

struct AggregatedRow {
  int game_id;
  GameDate game_date;
  int team_id;
  std::string team_name;
  ScoreVector scores;
};

class TeamGameScoresView {
 public:
  explicit TeamGameScoresView(std::shared_ptr<MariaDbClient> db_client);

  // game_id, team_name 순.
  std::vector<AggregatedRow> LoadByDate(MYSQL* conn, const GameDate& date) const;
  // 순위표: total_points 내림차순, 동점이면 team_name 순.
  std::vector<AggregatedRow> LoadByGame(MYSQL* conn, int game_id) const;
  std::vector<AggregatedRow> LoadByTeamSince(MYSQL* conn, const std::string& team_name, const GameDate& since) const;

 private:
  std::vector<AggregatedRow> Load(MYSQL* conn, const std::string& where, const std::string& order_by) const;

  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace quizdb
