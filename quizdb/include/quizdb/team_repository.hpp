/*
 * 설명: 이름으로 유일한 팀 목록을 조회/생성한다. 이름 경합은 유일 제약으로 판정한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, quizdb/sql/001_core_tables.sql
 * 테스트: quizdb/tests/it/team_registry_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include <mariadb/mysql.h>

#include "quizdb/db_client.hpp"

namespace quizdb {

struct TeamRecord {
  int team_id;
  std::string team_name;
};

class TeamRepository {
 public:
  explicit TeamRepository(std::shared_ptr<MariaDbClient> db_client);

  int GetOrCreate(const std::string& team_name);
  int GetOrCreateInTx(MYSQL* conn, const std::string& team_name);
  std::optional<TeamRecord> FindByName(const std::string& team_name) const;
  std::optional<TeamRecord> FindByNameInTx(MYSQL* conn, const std::string& team_name) const;
  std::size_t Count() const;
  std::size_t DeleteAllInTx(MYSQL* conn);

 private:
  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace quizdb
