/*
 * 설명: 같은 날짜의 집계 행과 후보 게임을 비교해 동일 게임을 찾는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: quizdb/tests/unit/duplicate_detection_test.cpp
 */
#pragma once

#include <optional>
#include <vector>

#include "quizdb/game.hpp"
#include "quizdb/team_game_scores.hpp"

namespace quizdb {

// 팀 이름 집합이 같고 모든 팀의 라운드별 소계와 총점이 정확히 같으면 동일 게임이다.
// 여러 개가 일치하면 가장 작은 game_id.
std::optional<int> FindIdenticalAmong(const GameRecord& candidate, const std::vector<AggregatedRow>& rows);

}  // namespace quizdb
