/*
 * 설명: MariaDB 연결과 트랜잭션 재시도 정책을 캡슐화한다.
 * 버전: v1.2.0
 * 관련 문서: DESIGN.md
 * 테스트: quizdb/tests/unit/db_client_test.cpp, quizdb/tests/it/game_store_it_test.cpp
 */
#pragma once

#include <functional>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>

#include <mariadb/mysql.h>

namespace quizdb {

struct DbConfig {
  std::string host;
  unsigned short port;
  std::string user;
  std::string password;
  std::string database;
};

class DbException : public std::runtime_error {
 public:
  DbException(const std::string& message, unsigned int code, bool retryable)
      : std::runtime_error(message), code(code), retryable(retryable) {}
  unsigned int code;
  bool retryable;
};

class MariaDbClient {
 public:
  static constexpr unsigned int kDuplicateEntry = 1062;

  explicit MariaDbClient(const DbConfig& config);

  // work가 true를 반환하면 커밋, false 또는 예외면 롤백한다. 반환값은 커밋 여부.
  // 교착/락 대기 타임아웃만 트랜잭션 전체를 다시 실행하고, 연결 유실은 재시도하지 않는다.
  bool ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work) const;
  void WithConnection(const std::function<void(MYSQL*)>& work) const;
  // 여러 SELECT를 하나의 일관된 스냅샷에서 읽는다.
  void WithReadSnapshot(const std::function<void(MYSQL*)>& work) const;

  [[noreturn]] void RaiseError(MYSQL* conn, const std::string& ctx) const;
  void Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const;
  MYSQL_RES* Query(MYSQL* conn, const std::string& sql, const std::string& ctx) const;

  // 시도 번호(1부터)를 받아 true면 그 시도를 재시도 가능한 교착으로 실패시킨다.
  void SetTransientInjector(const std::function<bool(std::size_t)>& injector);

  std::string Escape(MYSQL* conn, const std::string& value) const;

 private:
  MYSQL* Connect() const;
  bool IsRetryable(unsigned int code) const;
  void Backoff(std::size_t attempt) const;

  DbConfig config_;
  unsigned int connect_timeout_seconds_ = 2;
  unsigned int query_timeout_seconds_ = 5;
  std::function<bool(std::size_t)> transient_injector_;
};

}  // namespace quizdb
