/*
 * 설명: 구조화 로그와 저장 작업 카운터를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: quizdb/tests/unit/observability_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace quizdb {

enum class LogLevel { kDebug = 0, kInfo, kWarn, kError };

LogLevel ParseLogLevel(const std::string& text);
const char* LogLevelName(LogLevel level);

struct LogContext {
  std::string trace_id;
  std::string name;
  LogLevel level{LogLevel::kInfo};
  std::optional<int> game_id;
  std::optional<std::string> game_date;
  std::optional<std::string> detail;
  long latency_ms{0};
};

struct MetricsSnapshot {
  std::uint64_t games_added{0};
  std::uint64_t games_removed{0};
  std::uint64_t duplicates_skipped{0};
  std::uint64_t failures{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo, std::ostream& out = std::cout);

  std::string NextTraceId();
  void IncrementAdded() { games_added_.fetch_add(1); }
  void IncrementRemoved() { games_removed_.fetch_add(1); }
  void IncrementDuplicate() { duplicates_skipped_.fetch_add(1); }
  void IncrementFailure() { failures_.fetch_add(1); }
  MetricsSnapshot Snapshot() const;
  void Log(const LogContext& ctx) const;

 private:
  LogLevel min_level_;
  std::ostream& out_;
  mutable std::mutex out_mutex_;
  std::atomic<std::uint64_t> games_added_{0};
  std::atomic<std::uint64_t> games_removed_{0};
  std::atomic<std::uint64_t> duplicates_skipped_{0};
  std::atomic<std::uint64_t> failures_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace quizdb
