/*
 * 설명: 일곱 가지 라운드 점수표를 라운드 종류별 고정 스키마의 variant로 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, quizdb/sql/001_core_tables.sql
 * 테스트: quizdb/tests/unit/round_scores_test.cpp
 */
#pragma once

#include <array>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "quizdb/points.hpp"

namespace quizdb {

// variant 대안의 순서와 동일해야 한다.
enum class RoundKind {
  kSelection = 0,
  kNumbers,
  kPreference,
  kPairs,
  kExposure,
  kAuction,
  kMomentOfTruth,
};

constexpr std::array<RoundKind, 7> kAllRoundKinds{RoundKind::kSelection, RoundKind::kNumbers,
                                                  RoundKind::kPreference, RoundKind::kPairs,
                                                  RoundKind::kExposure, RoundKind::kAuction,
                                                  RoundKind::kMomentOfTruth};

struct SelectionScore {
  Points points;
};

struct NumbersScore {
  std::array<Points, 5> tasks{};
  Points total;
};

struct PreferenceScore {
  std::array<Points, 7> tasks{};
  Points points;
  Points penalty;
  Points bonus;
  Points total;
};

struct PairsScore {
  Points points;
};

struct ExposureScore {
  std::array<Points, 4> tasks{};
  Points total;
};

struct AuctionTask {
  Points bid;
  Points points;
  std::optional<Points> rate;
};

struct AuctionScore {
  std::array<AuctionTask, 4> tasks{};
  Points total;
};

struct MomentOfTruthScore {
  std::array<Points, 3> tasks{};
  Points total;
};

bool operator==(const SelectionScore& a, const SelectionScore& b);
bool operator==(const NumbersScore& a, const NumbersScore& b);
bool operator==(const PreferenceScore& a, const PreferenceScore& b);
bool operator==(const PairsScore& a, const PairsScore& b);
bool operator==(const ExposureScore& a, const ExposureScore& b);
bool operator==(const AuctionTask& a, const AuctionTask& b);
bool operator==(const AuctionScore& a, const AuctionScore& b);
bool operator==(const MomentOfTruthScore& a, const MomentOfTruthScore& b);

using RoundScore = std::variant<SelectionScore, NumbersScore, PreferenceScore, PairsScore, ExposureScore,
                                AuctionScore, MomentOfTruthScore>;

RoundKind KindOf(const RoundScore& score);

// 집계 뷰(team_game_scores)가 라운드별 소계로 쓰는 값.
Points Subtotal(const RoundScore& score);

const char* TableName(RoundKind kind);
const char* RoundKeyName(RoundKind kind);
std::optional<RoundKind> RoundKindFromKey(const std::string& key);

// 점수 테이블의 데이터 컬럼(game_id, team_id 제외). FieldValues/FromFieldValues와 순서가 같다.
const std::vector<std::string>& ColumnNames(RoundKind kind);
std::vector<std::optional<Points>> FieldValues(const RoundScore& score);
RoundScore FromFieldValues(RoundKind kind, const std::vector<std::optional<Points>>& values);

nlohmann::json RoundScoreToJson(const RoundScore& score);
RoundScore RoundScoreFromJson(RoundKind kind, const nlohmann::json& value);

}  // namespace quizdb
