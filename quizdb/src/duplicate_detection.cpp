/*
 * 설명: 집계 행 기반 동일 게임 판정을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: quizdb/tests/unit/duplicate_detection_test.cpp
 */
#include "quizdb/duplicate_detection.hpp"

#include <map>
#include <string>

namespace quizdb {
namespace {
using TeamScores = std::map<std::string, ScoreVector>;

bool SameTeamsAndScores(const TeamScores& stored, const TeamScores& candidate) {
  if (stored.size() != candidate.size()) {
    return false;
  }
  for (const auto& [name, scores] : candidate) {
    auto it = stored.find(name);
    if (it == stored.end() || it->second != scores) {
      return false;
    }
  }
  return true;
}
}  // namespace

std::optional<int> FindIdenticalAmong(const GameRecord& candidate, const std::vector<AggregatedRow>& rows) {
  TeamScores expected;
  for (const auto& team : candidate.teams) {
    expected[team.name] = ScoreVectorOf(team);
  }

  std::map<int, TeamScores> by_game;
  for (const auto& row : rows) {
    if (row.game_date != candidate.date) {
      continue;
    }
    by_game[row.game_id][row.team_name] = row.scores;
  }

  for (const auto& [game_id, stored] : by_game) {
    if (SameTeamsAndScores(stored, expected)) {
      return game_id;
    }
  }
  return std::nullopt;
}

}  // namespace quizdb
