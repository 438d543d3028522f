/*
 * 설명: 게임 제출 데이터의 검증과 JSON 변환을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: quizdb/tests/unit/game_json_test.cpp
 */
#include "quizdb/game.hpp"

#include <cctype>
#include <cstdint>
#include <limits>
#include <set>

#include "quizdb/validation_error.hpp"

namespace quizdb {
namespace {
// teams.team_name VARCHAR(256), 문자 단위.
constexpr std::size_t kMaxTeamNameLength = 256;

std::size_t Utf8Length(const std::string& text) {
  std::size_t count = 0;
  for (char ch : text) {
    if ((static_cast<unsigned char>(ch) & 0xC0) != 0x80) {
      ++count;
    }
  }
  return count;
}

int ParseGameId(const nlohmann::json& value) {
  bool in_range = false;
  if (value.is_number_unsigned()) {
    in_range = value.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max());
  } else if (value.is_number_integer()) {
    auto id = value.get<std::int64_t>();
    in_range = id >= 0 && id <= std::numeric_limits<int>::max();
  }
  if (!in_range) {
    throw ValidationError("game_id는 0 이상의 정수여야 한다: " + value.dump());
  }
  return static_cast<int>(value.get<std::int64_t>());
}
}  // namespace

const TeamEntry* GameRecord::FindTeam(const std::string& name) const {
  for (const auto& team : teams) {
    if (team.name == name) {
      return &team;
    }
  }
  return nullptr;
}

ScoreVector ScoreVectorOf(const TeamEntry& entry) {
  ScoreVector scores;
  for (const auto& [kind, score] : entry.rounds) {
    Points subtotal = Subtotal(score);
    scores.rounds[static_cast<std::size_t>(kind)] = subtotal;
    scores.total += subtotal;
  }
  return scores;
}

void ValidateGame(const GameRecord& game) {
  if (game.teams.empty()) {
    throw ValidationError("팀이 하나 이상 필요하다");
  }
  std::set<std::string> names;
  for (const auto& team : game.teams) {
    if (team.name.empty()) {
      throw ValidationError("팀 이름이 비어 있다");
    }
    if (Utf8Length(team.name) > kMaxTeamNameLength) {
      throw ValidationError("팀 이름이 너무 길다: " + team.name.substr(0, 32) + "...");
    }
    if (!names.insert(team.name).second) {
      throw ValidationError("같은 게임에 팀이 중복됨: " + team.name);
    }
    for (const auto& [kind, score] : team.rounds) {
      if (KindOf(score) != kind) {
        throw ValidationError(std::string("라운드 종류 불일치: ") + RoundKeyName(kind) + " (" + team.name + ")");
      }
      for (const auto& value : FieldValues(score)) {
        if (value && !value->InColumnRange()) {
          throw ValidationError(std::string("점수 범위 초과: ") + RoundKeyName(kind) + " (" + team.name + ")");
        }
      }
    }
  }
}

std::string NormalizeTeamName(const std::string& name) {
  std::string normalized;
  bool pending_space = false;
  for (char ch : name) {
    if (std::isspace(static_cast<unsigned char>(ch))) {
      pending_space = !normalized.empty();
      continue;
    }
    if (pending_space) {
      normalized.push_back(' ');
      pending_space = false;
    }
    normalized.push_back(ch);
  }
  return normalized;
}

GameRecord GameFromJson(const nlohmann::json& value) {
  if (!value.is_object()) {
    throw ValidationError("게임 데이터는 JSON 객체여야 한다");
  }
  if (!value.contains("date") || !value.at("date").is_string()) {
    throw ValidationError("date 필드가 필요하다");
  }
  if (!value.contains("teams") || !value.at("teams").is_array()) {
    throw ValidationError("teams 배열이 필요하다");
  }

  GameRecord game;
  if (value.contains("game_id") && !value.at("game_id").is_null()) {
    game.game_id = ParseGameId(value.at("game_id"));
  }
  game.date = GameDate::Parse(value.at("date").get<std::string>());

  for (const auto& team_json : value.at("teams")) {
    if (!team_json.is_object() || !team_json.contains("name") || !team_json.at("name").is_string()) {
      throw ValidationError("팀 항목에는 name 문자열이 필요하다");
    }
    TeamEntry entry;
    entry.name = NormalizeTeamName(team_json.at("name").get<std::string>());
    if (team_json.contains("rounds")) {
      const auto& rounds = team_json.at("rounds");
      if (!rounds.is_object()) {
        throw ValidationError("rounds는 객체여야 한다: " + entry.name);
      }
      for (auto it = rounds.begin(); it != rounds.end(); ++it) {
        auto kind = RoundKindFromKey(it.key());
        if (!kind) {
          throw ValidationError("알 수 없는 라운드: " + it.key());
        }
        entry.rounds.emplace(*kind, RoundScoreFromJson(*kind, it.value()));
      }
    }
    game.teams.push_back(std::move(entry));
  }

  ValidateGame(game);
  return game;
}

nlohmann::json GameToJson(const GameRecord& game) {
  nlohmann::json j;
  j["game_id"] = game.game_id ? nlohmann::json(*game.game_id) : nlohmann::json(nullptr);
  j["date"] = game.date.ToString();
  j["teams"] = nlohmann::json::array();
  for (const auto& team : game.teams) {
    nlohmann::json rounds = nlohmann::json::object();
    for (const auto& [kind, score] : team.rounds) {
      rounds[RoundKeyName(kind)] = RoundScoreToJson(score);
    }
    j["teams"].push_back({{"name", team.name}, {"rounds", rounds}});
  }
  return j;
}

}  // namespace quizdb
