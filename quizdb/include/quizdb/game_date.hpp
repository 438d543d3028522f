/*
 * 설명: 게임 날짜(달력 날짜)의 파싱과 비교를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: quizdb/tests/unit/points_test.cpp
 */
#pragma once

#include <string>
#include <tuple>

namespace quizdb {

struct GameDate {
  int year{1970};
  int month{1};
  int day{1};

  // YYYY-MM-DD. 존재하지 않는 날짜는 ValidationError.
  static GameDate Parse(const std::string& text);
  std::string ToString() const;

  bool operator==(const GameDate& other) const {
    return std::tie(year, month, day) == std::tie(other.year, other.month, other.day);
  }
  bool operator!=(const GameDate& other) const { return !(*this == other); }
  bool operator<(const GameDate& other) const {
    return std::tie(year, month, day) < std::tie(other.year, other.month, other.day);
  }
  bool operator<=(const GameDate& other) const { return !(other < *this); }
};

}  // namespace quizdb
