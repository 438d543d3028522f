/*
 * 설명: 고정소수점 점수의 파싱과 포맷을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: quizdb/tests/unit/points_test.cpp
 */
#include "quizdb/points.hpp"

#include <cctype>
#include <cmath>
#include <sstream>

#include "quizdb/validation_error.hpp"

namespace quizdb {
namespace {
constexpr std::size_t kMaxIntegerDigits = 12;

Points CheckRange(Points value, const std::string& source) {
  if (!value.InColumnRange()) {
    throw ValidationError("점수 범위 초과: " + source);
  }
  return value;
}
}  // namespace

Points Points::Parse(const std::string& text) { return CheckRange(ParseUnbounded(text), text); }

Points Points::ParseUnbounded(const std::string& text) {
  std::size_t pos = 0;
  bool negative = false;
  if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
    negative = text[pos] == '-';
    ++pos;
  }

  std::int64_t whole = 0;
  std::size_t whole_digits = 0;
  while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
    if (++whole_digits > kMaxIntegerDigits) {
      throw ValidationError("점수 범위 초과: " + text);
    }
    whole = whole * 10 + (text[pos] - '0');
    ++pos;
  }

  std::int64_t fraction = 0;
  std::size_t fraction_digits = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
      if (++fraction_digits > 2) {
        throw ValidationError("소수점 이하 두 자리까지만 허용: " + text);
      }
      fraction = fraction * 10 + (text[pos] - '0');
      ++pos;
    }
  }
  if (fraction_digits == 1) {
    fraction *= 10;
  }

  if (pos != text.size() || (whole_digits == 0 && fraction_digits == 0)) {
    throw ValidationError("점수 형식 오류: '" + text + "'");
  }

  std::int64_t cents = whole * 100 + fraction;
  return Points(negative ? -cents : cents);
}

Points Points::FromJson(const nlohmann::json& value) {
  if (value.is_string()) {
    return Parse(value.get<std::string>());
  }
  if (value.is_number_unsigned()) {
    auto whole = value.get<std::uint64_t>();
    if (whole > static_cast<std::uint64_t>(kMaxCents / 100)) {
      throw ValidationError("점수 범위 초과: " + value.dump());
    }
    return Points(static_cast<std::int64_t>(whole) * 100);
  }
  if (value.is_number_integer()) {
    auto whole = value.get<std::int64_t>();
    if (whole > kMaxCents / 100 || whole < -(kMaxCents / 100)) {
      throw ValidationError("점수 범위 초과: " + value.dump());
    }
    return Points(whole * 100);
  }
  if (value.is_number_float()) {
    double scaled = value.get<double>() * 100.0;
    if (!std::isfinite(scaled) || std::fabs(scaled) > static_cast<double>(kMaxCents)) {
      throw ValidationError("점수 범위 초과: " + value.dump());
    }
    return Points(static_cast<std::int64_t>(std::llround(scaled)));
  }
  throw ValidationError("점수는 숫자 또는 문자열이어야 한다: " + value.dump());
}

std::string Points::ToString() const {
  std::int64_t magnitude = cents_ < 0 ? -cents_ : cents_;
  std::ostringstream oss;
  if (cents_ < 0) {
    oss << '-';
  }
  oss << magnitude / 100 << '.';
  std::int64_t fraction = magnitude % 100;
  if (fraction < 10) {
    oss << '0';
  }
  oss << fraction;
  return oss.str();
}

}  // namespace quizdb
