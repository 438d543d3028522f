/*
 * 설명: quizdb_tool 명령행 인자 해석을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: quizdb/tests/unit/command_line_test.cpp
 */
#include "quizdb/command_line.hpp"

#include <stdexcept>

namespace quizdb {
namespace {
std::optional<int> ParseGameId(const std::string& text) {
  try {
    std::size_t pos = 0;
    int game_id = std::stoi(text, &pos);
    if (pos == text.size() && game_id > 0) {
      return game_id;
    }
    return std::nullopt;
  } catch (const std::logic_error&) {
    return std::nullopt;
  }
}
}  // namespace

std::optional<CommandLine> ParseCommandLine(const std::vector<std::string>& args) {
  if (args.empty()) {
    return std::nullopt;
  }
  const std::string& command = args[0];
  std::vector<std::string> rest(args.begin() + 1, args.end());
  CommandLine cmd;

  if (command == "ingest") {
    cmd.kind = CommandKind::kIngest;
    for (const auto& arg : rest) {
      if (arg == "--dry-run") {
        cmd.dry_run = true;
      } else if (arg == "-v" || arg == "--verbose") {
        cmd.verbose = true;
      } else if (!arg.empty() && arg[0] == '-') {
        return std::nullopt;
      } else {
        cmd.files.push_back(arg);
      }
    }
    if (cmd.files.empty()) {
      return std::nullopt;
    }
    return cmd;
  }
  if (command == "list") {
    cmd.kind = CommandKind::kList;
    return rest.empty() ? std::optional<CommandLine>(cmd) : std::nullopt;
  }
  if (command == "clear") {
    cmd.kind = CommandKind::kClear;
    if (rest.empty()) {
      return cmd;
    }
    if (rest.size() == 1 && (rest[0] == "--teams" || rest[0] == "-t")) {
      cmd.clear_teams = true;
      return cmd;
    }
    return std::nullopt;
  }
  if (command == "show" || command == "remove") {
    cmd.kind = command == "show" ? CommandKind::kShow : CommandKind::kRemove;
    if (rest.size() != 1) {
      return std::nullopt;
    }
    auto game_id = ParseGameId(rest[0]);
    if (!game_id) {
      return std::nullopt;
    }
    cmd.game_id = *game_id;
    return cmd;
  }
  return std::nullopt;
}

}  // namespace quizdb
