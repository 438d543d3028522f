/*
 * 설명: 구조화 로그와 저장 작업 카운터를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: quizdb/tests/unit/observability_test.cpp
 */
#include "quizdb/observability.hpp"

#include <chrono>
#include <sstream>

namespace quizdb {

LogLevel ParseLogLevel(const std::string& text) {
  if (text == "debug") {
    return LogLevel::kDebug;
  }
  if (text == "warn" || text == "warning") {
    return LogLevel::kWarn;
  }
  if (text == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

Observability::Observability(LogLevel min_level, std::ostream& out) : min_level_(min_level), out_(out) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.games_added = games_added_.load();
  snapshot.games_removed = games_removed_.load();
  snapshot.duplicates_skipped = duplicates_skipped_.load();
  snapshot.failures = failures_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (ctx.level < min_level_) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = LogLevelName(ctx.level);
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.game_id) {
    log_json["gameId"] = *ctx.game_id;
  }
  if (ctx.game_date) {
    log_json["gameDate"] = *ctx.game_date;
  }
  if (ctx.detail) {
    log_json["detail"] = *ctx.detail;
  }
  std::lock_guard<std::mutex> lock(out_mutex_);
  out_ << log_json.dump() << std::endl;
}

}  // namespace quizdb
