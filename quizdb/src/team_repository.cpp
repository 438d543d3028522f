/*
 * 설명: 팀 조회/생성과 이름 유일 제약 경합 처리를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, quizdb/sql/001_core_tables.sql
 * 테스트: quizdb/tests/it/team_registry_it_test.cpp
 */
#include "quizdb/team_repository.hpp"

#include <sstream>

namespace quizdb {
namespace {
int ToInt(const char* value) { return value ? std::stoi(value) : 0; }
constexpr int kLookupAttempts = 2;
}  // namespace

TeamRepository::TeamRepository(std::shared_ptr<MariaDbClient> db_client) : db_client_(std::move(db_client)) {}

int TeamRepository::GetOrCreate(const std::string& team_name) {
  int team_id = 0;
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    team_id = GetOrCreateInTx(conn, team_name);
    return true;
  });
  return team_id;
}

int TeamRepository::GetOrCreateInTx(MYSQL* conn, const std::string& team_name) {
  for (int attempt = 1; attempt <= kLookupAttempts; ++attempt) {
    auto existing = FindByNameInTx(conn, team_name);
    if (existing) {
      return existing->team_id;
    }

    std::ostringstream oss;
    oss << "INSERT INTO teams(team_name) VALUES('" << db_client_->Escape(conn, team_name) << "');";
    std::string sql = oss.str();
    if (mysql_real_query(conn, sql.c_str(), sql.size()) == 0) {
      return static_cast<int>(mysql_insert_id(conn));
    }
    // 같은 이름을 먼저 넣은 쪽이 이긴다. 진 쪽은 다시 읽는다.
    if (mysql_errno(conn) != MariaDbClient::kDuplicateEntry) {
      db_client_->RaiseError(conn, "팀 생성 실패");
    }
  }
  throw DbException("팀 재조회 실패: " + team_name, MariaDbClient::kDuplicateEntry, true);
}

std::optional<TeamRecord> TeamRepository::FindByName(const std::string& team_name) const {
  std::optional<TeamRecord> result;
  db_client_->WithConnection([&](MYSQL* conn) { result = FindByNameInTx(conn, team_name); });
  return result;
}

std::optional<TeamRecord> TeamRepository::FindByNameInTx(MYSQL* conn, const std::string& team_name) const {
  std::ostringstream oss;
  oss << "SELECT team_id, team_name FROM teams WHERE team_name='" << db_client_->Escape(conn, team_name) << "';";
  MYSQL_RES* res = db_client_->Query(conn, oss.str(), "팀 조회 실패");
  std::optional<TeamRecord> result;
  MYSQL_ROW row = mysql_fetch_row(res);
  if (row) {
    result = TeamRecord{ToInt(row[0]), row[1] ? row[1] : ""};
  }
  mysql_free_result(res);
  return result;
}

std::size_t TeamRepository::Count() const {
  std::size_t count = 0;
  db_client_->WithConnection([&](MYSQL* conn) {
    MYSQL_RES* res = db_client_->Query(conn, "SELECT COUNT(*) FROM teams;", "팀 카운트 실패");
    MYSQL_ROW row = mysql_fetch_row(res);
    if (row && row[0]) {
      count = static_cast<std::size_t>(std::stoull(row[0]));
    }
    mysql_free_result(res);
  });
  return count;
}

std::size_t TeamRepository::DeleteAllInTx(MYSQL* conn) {
  db_client_->Execute(conn, "DELETE FROM teams;", "팀 전체 삭제 실패");
  return static_cast<std::size_t>(mysql_affected_rows(conn));
}

}  // namespace quizdb
