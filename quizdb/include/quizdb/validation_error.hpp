/*
 * 설명: 쓰기 전에 거부되는 잘못된 입력을 나타내는 예외를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: quizdb/tests/unit/game_json_test.cpp
 */
#pragma once

#include <stdexcept>
#include <string>

namespace quizdb {

class ValidationError : public std::invalid_argument {
 public:
  explicit ValidationError(const std::string& message) : std::invalid_argument(message) {}
};

}  // namespace quizdb
