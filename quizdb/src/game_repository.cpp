/*
 * 설명: 게임과 게임-팀 소속 정보를 MariaDB에 저장/조회한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, quizdb/sql/001_core_tables.sql
 * 테스트: quizdb/tests/it/game_store_it_test.cpp
 */
#include "quizdb/game_repository.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace quizdb {
namespace {
int ToInt(const char* value) { return value ? std::stoi(value) : 0; }
std::chrono::system_clock::time_point ParseTimestamp(const std::string& text) {
  std::tm tm{};
  std::istringstream iss(text);
  iss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
  tm.tm_isdst = -1;
  auto tp = std::chrono::system_clock::from_time_t(std::mktime(&tm));
  return tp;
}
}  // namespace

GameRepository::GameRepository(std::shared_ptr<MariaDbClient> db_client) : db_client_(std::move(db_client)) {}

int GameRepository::InsertGameInTx(MYSQL* conn, const GameDate& date) {
  std::ostringstream oss;
  oss << "INSERT INTO games(game_date, created_at) VALUES('" << date.ToString() << "', NOW());";
  db_client_->Execute(conn, oss.str(), "게임 저장 실패");
  return static_cast<int>(mysql_insert_id(conn));
}

void GameRepository::InsertMembershipInTx(MYSQL* conn, int game_id, int team_id) {
  std::ostringstream oss;
  oss << "INSERT INTO game_teams(game_id, team_id) VALUES(" << game_id << ", " << team_id << ");";
  db_client_->Execute(conn, oss.str(), "게임-팀 저장 실패");
}

bool GameRepository::LockGameInTx(MYSQL* conn, int game_id) {
  std::ostringstream oss;
  oss << "SELECT game_id FROM games WHERE game_id=" << game_id << " FOR UPDATE;";
  MYSQL_RES* res = db_client_->Query(conn, oss.str(), "게임 잠금 실패");
  bool found = mysql_fetch_row(res) != nullptr;
  mysql_free_result(res);
  return found;
}

void GameRepository::DeleteMembershipsInTx(MYSQL* conn, int game_id) {
  std::ostringstream oss;
  oss << "DELETE FROM game_teams WHERE game_id=" << game_id << ";";
  db_client_->Execute(conn, oss.str(), "게임-팀 삭제 실패");
}

void GameRepository::DeleteGameRowInTx(MYSQL* conn, int game_id) {
  std::ostringstream oss;
  oss << "DELETE FROM games WHERE game_id=" << game_id << ";";
  db_client_->Execute(conn, oss.str(), "게임 삭제 실패");
}

std::optional<GameSummary> GameRepository::Find(MYSQL* conn, int game_id) const {
  std::ostringstream oss;
  oss << "SELECT game_id, game_date, created_at FROM games WHERE game_id=" << game_id << ";";
  MYSQL_RES* res = db_client_->Query(conn, oss.str(), "게임 조회 실패");
  std::optional<GameSummary> result;
  MYSQL_ROW row = mysql_fetch_row(res);
  if (row) {
    result = BuildSummary(row);
  }
  mysql_free_result(res);
  return result;
}

std::vector<TeamRecord> GameRepository::LoadMembers(MYSQL* conn, int game_id) const {
  std::ostringstream oss;
  oss << "SELECT teams.team_id, teams.team_name FROM game_teams JOIN teams ON game_teams.team_id = teams.team_id "
         "WHERE game_teams.game_id="
      << game_id << " ORDER BY teams.team_id;";
  MYSQL_RES* res = db_client_->Query(conn, oss.str(), "게임 참가 팀 조회 실패");
  std::vector<TeamRecord> members;
  MYSQL_ROW row;
  while ((row = mysql_fetch_row(res)) != nullptr) {
    members.push_back(TeamRecord{ToInt(row[0]), row[1] ? row[1] : ""});
  }
  mysql_free_result(res);
  return members;
}

std::vector<GameSummary> GameRepository::ListAll(MYSQL* conn) const {
  MYSQL_RES* res = db_client_->Query(
      conn, "SELECT game_id, game_date, created_at FROM games ORDER BY game_date ASC, game_id ASC;", "게임 목록 조회 실패");
  std::vector<GameSummary> games;
  MYSQL_ROW row;
  while ((row = mysql_fetch_row(res)) != nullptr) {
    games.push_back(BuildSummary(row));
  }
  mysql_free_result(res);
  return games;
}

std::vector<int> GameRepository::FindIdsByDateRange(MYSQL* conn, const GameDate& start, const GameDate& end) const {
  std::ostringstream oss;
  oss << "SELECT game_id FROM games WHERE game_date BETWEEN '" << start.ToString() << "' AND '" << end.ToString()
      << "' ORDER BY game_date ASC, game_id ASC;";
  MYSQL_RES* res = db_client_->Query(conn, oss.str(), "날짜별 게임 조회 실패");
  std::vector<int> ids;
  MYSQL_ROW row;
  while ((row = mysql_fetch_row(res)) != nullptr) {
    ids.push_back(ToInt(row[0]));
  }
  mysql_free_result(res);
  return ids;
}

std::size_t GameRepository::CountMemberships(MYSQL* conn, int game_id) const {
  std::ostringstream oss;
  oss << "SELECT COUNT(*) FROM game_teams WHERE game_id=" << game_id << ";";
  MYSQL_RES* res = db_client_->Query(conn, oss.str(), "게임-팀 카운트 실패");
  std::size_t count = 0;
  MYSQL_ROW row = mysql_fetch_row(res);
  if (row && row[0]) {
    count = static_cast<std::size_t>(std::stoull(row[0]));
  }
  mysql_free_result(res);
  return count;
}

GameSummary GameRepository::BuildSummary(MYSQL_ROW row) const {
  return GameSummary{ToInt(row[0]), GameDate::Parse(row[1] ? row[1] : "1970-01-01"),
                     ParseTimestamp(row[2] ? row[2] : "1970-01-01 00:00:00")};
}

}  // namespace quizdb
