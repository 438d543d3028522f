/*
 * 설명: 게임 날짜 파싱/포맷을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: quizdb/tests/unit/points_test.cpp
 */
#include "quizdb/game_date.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

#include "quizdb/validation_error.hpp"

namespace quizdb {
namespace {
bool IsLeap(int year) { return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0; }

int DaysInMonth(int year, int month) {
  static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && IsLeap(year)) {
    return 29;
  }
  return kDays[month - 1];
}

int ParseDigits(const std::string& text, std::size_t offset, std::size_t count) {
  int value = 0;
  for (std::size_t i = offset; i < offset + count; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
      throw ValidationError("날짜 형식 오류: '" + text + "'");
    }
    value = value * 10 + (text[i] - '0');
  }
  return value;
}
}  // namespace

GameDate GameDate::Parse(const std::string& text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
    throw ValidationError("날짜 형식 오류: '" + text + "'");
  }
  GameDate date{ParseDigits(text, 0, 4), ParseDigits(text, 5, 2), ParseDigits(text, 8, 2)};
  if (date.year < 1000 || date.month < 1 || date.month > 12 || date.day < 1 ||
      date.day > DaysInMonth(date.year, date.month)) {
    throw ValidationError("존재하지 않는 날짜: '" + text + "'");
  }
  return date;
}

std::string GameDate::ToString() const {
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << year << '-' << std::setw(2) << month << '-' << std::setw(2) << day;
  return oss.str();
}

}  // namespace quizdb
