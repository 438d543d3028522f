/*
 * 설명: 라운드 점수 테이블 INSERT/SELECT/DELETE 문을 생성하고 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, quizdb/sql/001_core_tables.sql
 * 테스트: quizdb/tests/it/game_store_it_test.cpp
 */
#include "quizdb/score_repository.hpp"

#include <sstream>

namespace quizdb {
namespace {
int ToInt(const char* value) { return value ? std::stoi(value) : 0; }

std::string ToLiteral(const std::optional<Points>& value) { return value ? value->ToString() : "NULL"; }
}  // namespace

ScoreRepository::ScoreRepository(std::shared_ptr<MariaDbClient> db_client) : db_client_(std::move(db_client)) {}

void ScoreRepository::InsertInTx(MYSQL* conn, int game_id, int team_id, const RoundScore& score) {
  RoundKind kind = KindOf(score);
  const auto& columns = ColumnNames(kind);
  auto values = FieldValues(score);

  std::ostringstream oss;
  oss << "INSERT INTO " << TableName(kind) << "(game_id, team_id";
  for (const auto& column : columns) {
    oss << ", " << column;
  }
  oss << ") VALUES(" << game_id << ", " << team_id;
  for (const auto& value : values) {
    oss << ", " << ToLiteral(value);
  }
  oss << ");";
  db_client_->Execute(conn, oss.str(), std::string("점수 저장 실패: ") + TableName(kind));
}

std::map<int, RoundScore> ScoreRepository::LoadForGame(MYSQL* conn, int game_id, RoundKind kind) const {
  const auto& columns = ColumnNames(kind);
  std::ostringstream oss;
  oss << "SELECT team_id";
  for (const auto& column : columns) {
    oss << ", " << column;
  }
  oss << " FROM " << TableName(kind) << " WHERE game_id=" << game_id << ";";

  MYSQL_RES* res = db_client_->Query(conn, oss.str(), std::string("점수 조회 실패: ") + TableName(kind));
  std::map<int, RoundScore> scores;
  MYSQL_ROW row;
  while ((row = mysql_fetch_row(res)) != nullptr) {
    std::vector<std::optional<Points>> values;
    for (std::size_t i = 0; i < columns.size(); ++i) {
      const char* cell = row[i + 1];
      values.push_back(cell ? std::optional<Points>(Points::Parse(cell)) : std::nullopt);
    }
    scores.emplace(ToInt(row[0]), FromFieldValues(kind, values));
  }
  mysql_free_result(res);
  return scores;
}

void ScoreRepository::DeleteForGameInTx(MYSQL* conn, int game_id) {
  for (RoundKind kind : kAllRoundKinds) {
    std::ostringstream oss;
    oss << "DELETE FROM " << TableName(kind) << " WHERE game_id=" << game_id << ";";
    db_client_->Execute(conn, oss.str(), std::string("점수 삭제 실패: ") + TableName(kind));
  }
}

std::size_t ScoreRepository::CountForGame(MYSQL* conn, int game_id) const {
  std::size_t count = 0;
  for (RoundKind kind : kAllRoundKinds) {
    std::ostringstream oss;
    oss << "SELECT COUNT(*) FROM " << TableName(kind) << " WHERE game_id=" << game_id << ";";
    MYSQL_RES* res = db_client_->Query(conn, oss.str(), "점수 카운트 실패");
    MYSQL_ROW row = mysql_fetch_row(res);
    if (row && row[0]) {
      count += static_cast<std::size_t>(std::stoull(row[0]));
    }
    mysql_free_result(res);
  }
  return count;
}

}  // namespace quizdb
