/*
 * 설명: 집계 뷰 조회를 구현한다. NULL 소계는 0으로 읽는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, quizdb/sql/002_team_game_scores_view.sql
 * 테스트: quizdb/tests/it/game_store_it_test.cpp
 */
#include "quizdb/team_game_scores.hpp"

#include <sstream>

namespace quizdb {
namespace {
int ToInt(const char* value) { return value ? std::stoi(value) : 0; }
// 총점은 일곱 컬럼의 합이라 컬럼 범위를 넘을 수 있다.
Points ToPoints(const char* value) { return value ? Points::ParseUnbounded(value) : Points(); }

// RoundKind 순서와 동일.
constexpr const char* kSubtotalColumns =
    "vybor_points, chisla_points, pref_points, pairs_points, razobl_points, auction_points, mot_points";
}  // namespace

TeamGameScoresView::TeamGameScoresView(std::shared_ptr<MariaDbClient> db_client) : db_client_(std::move(db_client)) {}

std::vector<AggregatedRow> TeamGameScoresView::LoadByDate(MYSQL* conn, const GameDate& date) const {
  return Load(conn, "game_date='" + date.ToString() + "'", "game_id ASC, team_name ASC");
}

std::vector<AggregatedRow> TeamGameScoresView::LoadByGame(MYSQL* conn, int game_id) const {
  return Load(conn, "game_id=" + std::to_string(game_id), "total_points DESC, team_name ASC");
}

std::vector<AggregatedRow> TeamGameScoresView::LoadByTeamSince(MYSQL* conn, const std::string& team_name,
                                                               const GameDate& since) const {
  std::string where = "team_name='" + db_client_->Escape(conn, team_name) + "' AND game_date >= '" +
                      since.ToString() + "'";
  return Load(conn, where, "game_date ASC, game_id ASC");
}

std::vector<AggregatedRow> TeamGameScoresView::Load(MYSQL* conn, const std::string& where,
                                                    const std::string& order_by) const {
  std::ostringstream oss;
  oss << "SELECT game_id, game_date, team_id, team_name, " << kSubtotalColumns
      << ", total_points FROM team_game_scores WHERE " << where << " ORDER BY " << order_by << ";";
  MYSQL_RES* res = db_client_->Query(conn, oss.str(), "집계 뷰 조회 실패");
  std::vector<AggregatedRow> rows;
  MYSQL_ROW row;
  while ((row = mysql_fetch_row(res)) != nullptr) {
    AggregatedRow aggregated{ToInt(row[0]), GameDate::Parse(row[1] ? row[1] : "1970-01-01"), ToInt(row[2]),
                             row[3] ? row[3] : "", ScoreVector{}};
    for (std::size_t i = 0; i < kAllRoundKinds.size(); ++i) {
      aggregated.scores.rounds[i] = ToPoints(row[4 + i]);
    }
    aggregated.scores.total = ToPoints(row[4 + kAllRoundKinds.size()]);
    rows.push_back(std::move(aggregated));
  }
  mysql_free_result(res);
  return rows;
}

}  // namespace quizdb
