/*
 * 설명: 한 게임의 메모리 표현(날짜, 팀 목록, 팀별 라운드 점수)과 검증, JSON 변환을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: quizdb/tests/unit/game_json_test.cpp
 */
#pragma once

#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "quizdb/game_date.hpp"
#include "quizdb/points.hpp"
#include "quizdb/round_scores.hpp"

namespace quizdb {

struct TeamEntry {
  std::string name;
  std::map<RoundKind, RoundScore> rounds;
};

struct GameRecord {
  std::optional<int> game_id;
  GameDate date;
  std::vector<TeamEntry> teams;

  const TeamEntry* FindTeam(const std::string& name) const;
};

// 라운드별 소계와 총점. 라운드 기록이 없으면 0.
struct ScoreVector {
  std::array<Points, kAllRoundKinds.size()> rounds{};
  Points total;

  bool operator==(const ScoreVector& other) const { return rounds == other.rounds && total == other.total; }
  bool operator!=(const ScoreVector& other) const { return !(*this == other); }
};

ScoreVector ScoreVectorOf(const TeamEntry& entry);

// 쓰기 전 검증. 실패 시 ValidationError.
void ValidateGame(const GameRecord& game);

std::string NormalizeTeamName(const std::string& name);

GameRecord GameFromJson(const nlohmann::json& value);
nlohmann::json GameToJson(const GameRecord& game);

}  // namespace quizdb
