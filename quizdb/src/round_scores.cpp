/*
 * 설명: 라운드별 점수표의 컬럼 매핑, 소계 계산, JSON 변환을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, quizdb/sql/001_core_tables.sql
 * 테스트: quizdb/tests/unit/round_scores_test.cpp
 */
#include "quizdb/round_scores.hpp"

#include <type_traits>

#include "quizdb/validation_error.hpp"

namespace quizdb {
namespace {
std::vector<std::string> TaskColumns(int count) {
  std::vector<std::string> columns;
  for (int i = 1; i <= count; ++i) {
    columns.push_back("task_" + std::to_string(i));
  }
  return columns;
}

std::vector<std::string> BuildColumns(RoundKind kind) {
  std::vector<std::string> columns;
  switch (kind) {
    case RoundKind::kSelection:
    case RoundKind::kPairs:
      return {"points"};
    case RoundKind::kNumbers:
      columns = TaskColumns(5);
      break;
    case RoundKind::kPreference:
      columns = TaskColumns(7);
      columns.insert(columns.end(), {"points", "penalty", "bonus"});
      break;
    case RoundKind::kExposure:
      columns = TaskColumns(4);
      break;
    case RoundKind::kAuction:
      for (int i = 1; i <= 4; ++i) {
        std::string prefix = "task_" + std::to_string(i);
        columns.insert(columns.end(), {prefix + "_bid", prefix + "_points", prefix + "_rate"});
      }
      break;
    case RoundKind::kMomentOfTruth:
      columns = TaskColumns(3);
      break;
  }
  columns.push_back("total_sum");
  return columns;
}

template <std::size_t N>
void AppendTasks(std::vector<std::optional<Points>>& out, const std::array<Points, N>& tasks) {
  out.insert(out.end(), tasks.begin(), tasks.end());
}

class FieldReader {
 public:
  FieldReader(RoundKind kind, const std::vector<std::optional<Points>>& values) : kind_(kind), values_(values) {
    if (values_.size() != ColumnNames(kind).size()) {
      throw ValidationError(std::string("컬럼 수 불일치: ") + TableName(kind));
    }
  }

  Points Required() {
    const auto& value = values_[pos_];
    if (!value) {
      throw ValidationError(std::string("필수 점수 누락: ") + TableName(kind_) + "." + ColumnNames(kind_)[pos_]);
    }
    ++pos_;
    return *value;
  }

  std::optional<Points> Optional() { return values_[pos_++]; }

  template <std::size_t N>
  void Tasks(std::array<Points, N>& tasks) {
    for (auto& task : tasks) {
      task = Required();
    }
  }

 private:
  RoundKind kind_;
  const std::vector<std::optional<Points>>& values_;
  std::size_t pos_{0};
};

// JSON 객체에서 허용된 키만 있는지 확인하면서 값을 꺼낸다.
class JsonReader {
 public:
  JsonReader(RoundKind kind, const nlohmann::json& value, std::initializer_list<const char*> allowed)
      : kind_(kind), value_(value) {
    if (!value_.is_object()) {
      throw ValidationError(Context() + " 라운드는 객체여야 한다");
    }
    for (auto it = value_.begin(); it != value_.end(); ++it) {
      bool known = false;
      for (const char* key : allowed) {
        known = known || it.key() == key;
      }
      if (!known) {
        throw ValidationError(Context() + " 라운드에 알 수 없는 필드: " + it.key());
      }
    }
  }

  Points Required(const char* key) const {
    if (!value_.contains(key)) {
      throw ValidationError(Context() + " 라운드 필드 누락: " + key);
    }
    return Points::FromJson(value_.at(key));
  }

  const nlohmann::json& TaskArray(std::size_t expected) const {
    if (!value_.contains("tasks") || !value_.at("tasks").is_array() || value_.at("tasks").size() != expected) {
      throw ValidationError(Context() + " 라운드는 과제 " + std::to_string(expected) + "개가 필요하다");
    }
    return value_.at("tasks");
  }

  template <std::size_t N>
  void Tasks(std::array<Points, N>& tasks) const {
    const auto& array = TaskArray(N);
    for (std::size_t i = 0; i < N; ++i) {
      tasks[i] = Points::FromJson(array[i]);
    }
  }

  std::string Context() const { return RoundKeyName(kind_); }

 private:
  RoundKind kind_;
  const nlohmann::json& value_;
};

template <std::size_t N>
nlohmann::json TasksToJson(const std::array<Points, N>& tasks) {
  nlohmann::json array = nlohmann::json::array();
  for (const auto& task : tasks) {
    array.push_back(task.ToJson());
  }
  return array;
}
}  // namespace

bool operator==(const SelectionScore& a, const SelectionScore& b) { return a.points == b.points; }
bool operator==(const NumbersScore& a, const NumbersScore& b) { return a.tasks == b.tasks && a.total == b.total; }
bool operator==(const PreferenceScore& a, const PreferenceScore& b) {
  return a.tasks == b.tasks && a.points == b.points && a.penalty == b.penalty && a.bonus == b.bonus &&
         a.total == b.total;
}
bool operator==(const PairsScore& a, const PairsScore& b) { return a.points == b.points; }
bool operator==(const ExposureScore& a, const ExposureScore& b) { return a.tasks == b.tasks && a.total == b.total; }
bool operator==(const AuctionTask& a, const AuctionTask& b) {
  return a.bid == b.bid && a.points == b.points && a.rate == b.rate;
}
bool operator==(const AuctionScore& a, const AuctionScore& b) { return a.tasks == b.tasks && a.total == b.total; }
bool operator==(const MomentOfTruthScore& a, const MomentOfTruthScore& b) {
  return a.tasks == b.tasks && a.total == b.total;
}

RoundKind KindOf(const RoundScore& score) { return static_cast<RoundKind>(score.index()); }

Points Subtotal(const RoundScore& score) {
  return std::visit(
      [](const auto& s) -> Points {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, SelectionScore> || std::is_same_v<T, PairsScore>) {
          return s.points;
        } else {
          return s.total;
        }
      },
      score);
}

const char* TableName(RoundKind kind) {
  switch (kind) {
    case RoundKind::kSelection:
      return "vybor";
    case RoundKind::kNumbers:
      return "chisla";
    case RoundKind::kPreference:
      return "pref";
    case RoundKind::kPairs:
      return "pairs";
    case RoundKind::kExposure:
      return "razobl";
    case RoundKind::kAuction:
      return "auction";
    case RoundKind::kMomentOfTruth:
      return "mot";
  }
  return "";
}

const char* RoundKeyName(RoundKind kind) {
  switch (kind) {
    case RoundKind::kSelection:
      return "selection";
    case RoundKind::kNumbers:
      return "numbers";
    case RoundKind::kPreference:
      return "preference";
    case RoundKind::kPairs:
      return "pairs";
    case RoundKind::kExposure:
      return "exposure";
    case RoundKind::kAuction:
      return "auction";
    case RoundKind::kMomentOfTruth:
      return "moment_of_truth";
  }
  return "";
}

std::optional<RoundKind> RoundKindFromKey(const std::string& key) {
  for (RoundKind kind : kAllRoundKinds) {
    if (key == RoundKeyName(kind)) {
      return kind;
    }
  }
  return std::nullopt;
}

const std::vector<std::string>& ColumnNames(RoundKind kind) {
  static const std::array<std::vector<std::string>, 7> kColumns{
      BuildColumns(RoundKind::kSelection), BuildColumns(RoundKind::kNumbers),
      BuildColumns(RoundKind::kPreference), BuildColumns(RoundKind::kPairs),
      BuildColumns(RoundKind::kExposure), BuildColumns(RoundKind::kAuction),
      BuildColumns(RoundKind::kMomentOfTruth)};
  return kColumns[static_cast<std::size_t>(kind)];
}

std::vector<std::optional<Points>> FieldValues(const RoundScore& score) {
  std::vector<std::optional<Points>> out;
  std::visit(
      [&out](const auto& s) {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, SelectionScore> || std::is_same_v<T, PairsScore>) {
          out.push_back(s.points);
        } else if constexpr (std::is_same_v<T, PreferenceScore>) {
          AppendTasks(out, s.tasks);
          out.insert(out.end(), {s.points, s.penalty, s.bonus, s.total});
        } else if constexpr (std::is_same_v<T, AuctionScore>) {
          for (const auto& task : s.tasks) {
            out.insert(out.end(), {task.bid, task.points, task.rate});
          }
          out.push_back(s.total);
        } else {
          AppendTasks(out, s.tasks);
          out.push_back(s.total);
        }
      },
      score);
  return out;
}

RoundScore FromFieldValues(RoundKind kind, const std::vector<std::optional<Points>>& values) {
  FieldReader reader(kind, values);
  switch (kind) {
    case RoundKind::kSelection:
      return SelectionScore{reader.Required()};
    case RoundKind::kPairs:
      return PairsScore{reader.Required()};
    case RoundKind::kNumbers: {
      NumbersScore score;
      reader.Tasks(score.tasks);
      score.total = reader.Required();
      return score;
    }
    case RoundKind::kPreference: {
      PreferenceScore score;
      reader.Tasks(score.tasks);
      score.points = reader.Required();
      score.penalty = reader.Required();
      score.bonus = reader.Required();
      score.total = reader.Required();
      return score;
    }
    case RoundKind::kExposure: {
      ExposureScore score;
      reader.Tasks(score.tasks);
      score.total = reader.Required();
      return score;
    }
    case RoundKind::kAuction: {
      AuctionScore score;
      for (auto& task : score.tasks) {
        task.bid = reader.Required();
        task.points = reader.Required();
        task.rate = reader.Optional();
      }
      score.total = reader.Required();
      return score;
    }
    case RoundKind::kMomentOfTruth: {
      MomentOfTruthScore score;
      reader.Tasks(score.tasks);
      score.total = reader.Required();
      return score;
    }
  }
  throw ValidationError("알 수 없는 라운드 종류");
}

nlohmann::json RoundScoreToJson(const RoundScore& score) {
  return std::visit(
      [](const auto& s) -> nlohmann::json {
        using T = std::decay_t<decltype(s)>;
        nlohmann::json j;
        if constexpr (std::is_same_v<T, SelectionScore> || std::is_same_v<T, PairsScore>) {
          j["points"] = s.points.ToJson();
        } else if constexpr (std::is_same_v<T, AuctionScore>) {
          j["tasks"] = nlohmann::json::array();
          for (const auto& task : s.tasks) {
            nlohmann::json t{{"bid", task.bid.ToJson()}, {"points", task.points.ToJson()}};
            t["rate"] = task.rate ? task.rate->ToJson() : nlohmann::json(nullptr);
            j["tasks"].push_back(t);
          }
          j["total"] = s.total.ToJson();
        } else {
          j["tasks"] = TasksToJson(s.tasks);
          if constexpr (std::is_same_v<T, PreferenceScore>) {
            j["points"] = s.points.ToJson();
            j["penalty"] = s.penalty.ToJson();
            j["bonus"] = s.bonus.ToJson();
          }
          j["total"] = s.total.ToJson();
        }
        return j;
      },
      score);
}

RoundScore RoundScoreFromJson(RoundKind kind, const nlohmann::json& value) {
  switch (kind) {
    case RoundKind::kSelection:
      return SelectionScore{JsonReader(kind, value, {"points"}).Required("points")};
    case RoundKind::kPairs:
      return PairsScore{JsonReader(kind, value, {"points"}).Required("points")};
    case RoundKind::kNumbers: {
      JsonReader reader(kind, value, {"tasks", "total"});
      NumbersScore score;
      reader.Tasks(score.tasks);
      score.total = reader.Required("total");
      return score;
    }
    case RoundKind::kPreference: {
      JsonReader reader(kind, value, {"tasks", "points", "penalty", "bonus", "total"});
      PreferenceScore score;
      reader.Tasks(score.tasks);
      score.points = reader.Required("points");
      score.penalty = reader.Required("penalty");
      score.bonus = reader.Required("bonus");
      score.total = reader.Required("total");
      return score;
    }
    case RoundKind::kExposure: {
      JsonReader reader(kind, value, {"tasks", "total"});
      ExposureScore score;
      reader.Tasks(score.tasks);
      score.total = reader.Required("total");
      return score;
    }
    case RoundKind::kAuction: {
      JsonReader reader(kind, value, {"tasks", "total"});
      AuctionScore score;
      const auto& tasks = reader.TaskArray(score.tasks.size());
      for (std::size_t i = 0; i < score.tasks.size(); ++i) {
        JsonReader task_reader(kind, tasks[i], {"bid", "points", "rate"});
        score.tasks[i].bid = task_reader.Required("bid");
        score.tasks[i].points = task_reader.Required("points");
        if (tasks[i].contains("rate") && !tasks[i].at("rate").is_null()) {
          score.tasks[i].rate = Points::FromJson(tasks[i].at("rate"));
        }
      }
      score.total = reader.Required("total");
      return score;
    }
    case RoundKind::kMomentOfTruth: {
      JsonReader reader(kind, value, {"tasks", "total"});
      MomentOfTruthScore score;
      reader.Tasks(score.tasks);
      score.total = reader.Required("total");
      return score;
    }
  }
  throw ValidationError("알 수 없는 라운드 종류");
}

}  // namespace quizdb
