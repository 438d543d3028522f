/*
 * 설명: MariaDB 연결과 트랜잭션 재시도 로직을 구현한다.
 * 버전: v1.2.0
 * 관련 문서: DESIGN.md
 * 테스트: quizdb/tests/unit/db_client_test.cpp, quizdb/tests/it/game_store_it_test.cpp
 */
#include "quizdb/db_client.hpp"

#include <chrono>
#include <thread>

namespace quizdb {
namespace {
constexpr std::size_t kMaxAttempts = 3;
constexpr unsigned int kDeadlock = 1213;
constexpr unsigned int kLockWaitTimeout = 1205;
}  // namespace

MariaDbClient::MariaDbClient(const DbConfig& config) : config_(config) {}

MYSQL* MariaDbClient::Connect() const {
  MYSQL* conn = mysql_init(nullptr);
  if (!conn) {
    throw DbException("MariaDB 초기화 실패", 0, false);
  }
  mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &connect_timeout_seconds_);
  mysql_options(conn, MYSQL_OPT_READ_TIMEOUT, &query_timeout_seconds_);
  mysql_options(conn, MYSQL_OPT_WRITE_TIMEOUT, &query_timeout_seconds_);
  if (!mysql_real_connect(conn, config_.host.c_str(), config_.user.c_str(), config_.password.c_str(),
                          config_.database.c_str(), config_.port, nullptr, 0)) {
    unsigned int code = mysql_errno(conn);
    std::string message = std::string("연결 실패: ") + mysql_error(conn);
    mysql_close(conn);
    throw DbException(message, code, false);
  }
  try {
    if (mysql_set_character_set(conn, "utf8mb4") != 0) {
      RaiseError(conn, "문자셋 설정 실패");
    }
    Execute(conn, "SET SESSION innodb_lock_wait_timeout=2;", "락 대기 타임아웃 설정 실패");
  } catch (...) {
    mysql_close(conn);
    throw;
  }
  return conn;
}

bool MariaDbClient::ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work) const {
  for (std::size_t attempt = 1; attempt <= kMaxAttempts; ++attempt) {
    MYSQL* conn = nullptr;
    try {
      // 주입기는 시도마다 연결 전에 한 번 불린다.
      if (transient_injector_ && transient_injector_(attempt)) {
        throw DbException("주입된 일시 오류", kDeadlock, true);
      }
      conn = Connect();
      Execute(conn, "SET SESSION TRANSACTION ISOLATION LEVEL SERIALIZABLE;", "격리 수준 설정 실패");
      mysql_autocommit(conn, 0);
      bool commit = work(conn);
      if (commit) {
        if (mysql_commit(conn) != 0) {
          RaiseError(conn, "커밋 실패");
        }
      } else {
        mysql_rollback(conn);
      }
      mysql_close(conn);
      return commit;
    } catch (const DbException& ex) {
      if (conn) {
        mysql_rollback(conn);
        mysql_close(conn);
      }
      if (ex.retryable && attempt < kMaxAttempts) {
        Backoff(attempt);
        continue;
      }
      throw;
    } catch (...) {
      if (conn) {
        mysql_rollback(conn);
        mysql_close(conn);
      }
      throw;
    }
  }
  return false;
}

void MariaDbClient::WithConnection(const std::function<void(MYSQL*)>& work) const {
  MYSQL* conn = Connect();
  try {
    work(conn);
  } catch (...) {
    mysql_close(conn);
    throw;
  }
  mysql_close(conn);
}

void MariaDbClient::WithReadSnapshot(const std::function<void(MYSQL*)>& work) const {
  WithConnection([&](MYSQL* conn) {
    Execute(conn, "START TRANSACTION WITH CONSISTENT SNAPSHOT, READ ONLY;", "읽기 트랜잭션 시작 실패");
    work(conn);
    Execute(conn, "COMMIT;", "읽기 트랜잭션 종료 실패");
  });
}

void MariaDbClient::Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const {
  if (mysql_real_query(conn, sql.c_str(), sql.size()) != 0) {
    RaiseError(conn, ctx);
  }
}

MYSQL_RES* MariaDbClient::Query(MYSQL* conn, const std::string& sql, const std::string& ctx) const {
  Execute(conn, sql, ctx);
  MYSQL_RES* res = mysql_store_result(conn);
  if (!res) {
    RaiseError(conn, ctx + " (결과 없음)");
  }
  return res;
}

std::string MariaDbClient::Escape(MYSQL* conn, const std::string& value) const {
  std::string escaped;
  escaped.resize(value.size() * 2 + 1);
  auto len = mysql_real_escape_string(conn, escaped.data(), value.c_str(), value.size());
  escaped.resize(len);
  return escaped;
}

void MariaDbClient::RaiseError(MYSQL* conn, const std::string& ctx) const {
  unsigned int code = mysql_errno(conn);
  bool retryable = IsRetryable(code);
  std::string message = ctx + ": " + mysql_error(conn);
  throw DbException(message, code, retryable);
}

bool MariaDbClient::IsRetryable(unsigned int code) const { return code == kDeadlock || code == kLockWaitTimeout; }

void MariaDbClient::Backoff(std::size_t attempt) const {
  std::size_t base_ms = 50 * (1u << (attempt - 1));
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<int> dist(0, 25);
  std::size_t delay_ms = base_ms + static_cast<std::size_t>(dist(gen));
  std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
}

void MariaDbClient::SetTransientInjector(const std::function<bool(std::size_t)>& injector) {
  transient_injector_ = injector;
}

}  // namespace quizdb
