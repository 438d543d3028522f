/*
 * 설명: 게임 JSON 파일 적재와 저장소 관리 명령을 제공하는 진입점.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: quizdb/tests/unit/command_line_test.cpp, quizdb/tests/it/game_store_it_test.cpp
 */
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "quizdb/command_line.hpp"
#include "quizdb/config.hpp"
#include "quizdb/game_store.hpp"
#include "quizdb/observability.hpp"
#include "quizdb/validation_error.hpp"

namespace {

void PrintUsage() {
  std::cerr << "사용법: quizdb_tool <명령> [인자]\n"
               "  ingest [--dry-run] [-v] <game.json>...  게임 파일을 검증하고 중복이 아니면 저장\n"
               "  list                                   저장된 게임 목록\n"
               "  show <game_id>                         게임 기록과 순위표\n"
               "  remove <game_id>                       게임 삭제 (팀은 유지)\n"
               "  clear [--teams]                        모든 게임 삭제, --teams면 팀도 삭제\n";
}

quizdb::GameRecord LoadGameFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw quizdb::ValidationError("파일을 열 수 없음: " + path);
  }
  nlohmann::json doc;
  try {
    in >> doc;
  } catch (const nlohmann::json::parse_error& ex) {
    throw quizdb::ValidationError(std::string("JSON 파싱 실패: ") + ex.what());
  }
  return quizdb::GameFromJson(doc);
}

int RunIngest(quizdb::GameStore* store, const quizdb::CommandLine& cmd) {
  std::size_t parsed = 0;
  std::size_t saved = 0;
  std::size_t duplicates = 0;
  std::size_t failed = 0;
  for (const auto& file : cmd.files) {
    std::cout << "\n처리 중: " << file << "\n";
    quizdb::GameRecord game;
    try {
      game = LoadGameFile(file);
    } catch (const std::exception& ex) {
      std::cout << "파싱 실패: " << ex.what() << "\n";
      ++failed;
      continue;
    }
    ++parsed;
    if (cmd.verbose) {
      std::cout << quizdb::GameToJson(game).dump(2) << "\n";
    }
    if (cmd.dry_run) {
      continue;
    }
    auto outcome = store->SaveGameIfNew(game);
    switch (outcome.status) {
      case quizdb::SaveStatus::kSaved:
        std::cout << game.date.ToString() << " 게임 저장 완료 (id " << *outcome.game_id << ")\n";
        ++saved;
        break;
      case quizdb::SaveStatus::kDuplicate:
        std::cout << game.date.ToString() << " 동일한 게임이 이미 있음 (id " << *outcome.game_id << "), 건너뜀\n";
        ++duplicates;
        break;
      case quizdb::SaveStatus::kFailed:
        std::cout << game.date.ToString() << " 게임 저장 실패: " << outcome.error << "\n";
        ++failed;
        break;
    }
  }

  std::cout << "\n처리한 파일: " << cmd.files.size() << "\n파싱 성공: " << parsed << "\n";
  if (!cmd.dry_run) {
    std::cout << "저장: " << saved << "\n중복 건너뜀: " << duplicates << "\n";
  }
  std::cout << "실패: " << failed << "\n";
  return failed == 0 ? 0 : 1;
}

int RunList(quizdb::GameStore* store) {
  auto games = store->GetAllGames();
  if (games.empty()) {
    std::cout << "저장된 게임이 없다\n";
    return 0;
  }
  for (const auto& game : games) {
    std::cout << game.game_id << "\t" << game.game_date.ToString() << "\n";
  }
  return 0;
}

int RunShow(quizdb::GameStore* store, int game_id) {
  auto game = store->GetGameData(game_id);
  if (!game) {
    std::cout << "게임 없음: " << game_id << "\n";
    return 1;
  }
  std::cout << quizdb::GameToJson(*game).dump(2) << "\n\n";
  int place = 0;
  for (const auto& row : store->GetStandings(game_id)) {
    std::cout << ++place << "\t" << row.team_name << "\t" << row.scores.total.ToString() << "\n";
  }
  return 0;
}

int RunRemove(quizdb::GameStore* store, int game_id) {
  if (!store->RemoveGame(game_id)) {
    std::cout << "게임 없음: " << game_id << "\n";
    return 1;
  }
  std::cout << "게임 삭제 완료: " << game_id << "\n";
  return 0;
}

int RunClear(quizdb::GameStore* store, bool clear_teams) {
  auto summary = store->ClearDatabase(clear_teams);
  std::cout << "삭제한 게임: " << summary.games_deleted << "\n";
  if (summary.games_failed > 0) {
    std::cout << "삭제 실패: " << summary.games_failed << "\n";
  }
  if (clear_teams) {
    std::cout << "삭제한 팀: " << summary.teams_deleted << "\n";
  }
  return summary.games_failed == 0 ? 0 : 1;
}

}  // namespace

int main(int argc, char** argv) {
  using namespace quizdb;
  auto cmd = ParseCommandLine(std::vector<std::string>(argv + 1, argv + argc));
  if (!cmd) {
    PrintUsage();
    return 2;
  }

  try {
    AppConfig config = LoadConfigFromEnv();
    auto db_client = std::make_shared<MariaDbClient>(ParseDatabaseUrl(config.database_url));
    auto observability = std::make_shared<Observability>(ParseLogLevel(config.log_level));
    GameStore store(db_client, observability);

    switch (cmd->kind) {
      case CommandKind::kIngest:
        return RunIngest(&store, *cmd);
      case CommandKind::kList:
        return RunList(&store);
      case CommandKind::kShow:
        return RunShow(&store, cmd->game_id);
      case CommandKind::kRemove:
        return RunRemove(&store, cmd->game_id);
      case CommandKind::kClear:
        return RunClear(&store, cmd->clear_teams);
    }
    return 2;
  } catch (const std::exception& ex) {
    std::cerr << "실행 중 예외: " << ex.what() << "\n";
    return 1;
  }
}
