/*
 * 설명: 소수점 둘째 자리까지의 고정소수점 점수 값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: quizdb/tests/unit/points_test.cpp
 */
#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace quizdb {

// DECIMAL(10,2) 컬럼과 1:1로 대응한다. 내부 값은 1/100 단위 정수.
class Points {
 public:
  static constexpr std::int64_t kMaxCents = 9'999'999'999;

  constexpr Points() = default;

  static constexpr Points FromCents(std::int64_t cents) { return Points(cents); }
  static Points Parse(const std::string& text);
  // 컬럼 범위를 검사하지 않는다. 여러 컬럼의 합(집계 뷰의 총점)을 읽을 때 쓴다.
  static Points ParseUnbounded(const std::string& text);
  static Points FromJson(const nlohmann::json& value);

  constexpr std::int64_t cents() const { return cents_; }
  constexpr bool InColumnRange() const { return cents_ <= kMaxCents && cents_ >= -kMaxCents; }
  std::string ToString() const;
  nlohmann::json ToJson() const { return ToString(); }

  constexpr Points operator+(Points other) const { return Points(cents_ + other.cents_); }
  Points& operator+=(Points other) {
    cents_ += other.cents_;
    return *this;
  }
  constexpr bool operator==(Points other) const { return cents_ == other.cents_; }
  constexpr bool operator!=(Points other) const { return cents_ != other.cents_; }
  constexpr bool operator<(Points other) const { return cents_ < other.cents_; }

 private:
  explicit constexpr Points(std::int64_t cents) : cents_(cents) {}

  std::int64_t cents_{0};
};

}  // namespace quizdb
