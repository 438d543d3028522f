/*
 * 설명: quizdb_tool 명령행 인자를 해석한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: quizdb/tests/unit/command_line_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <vector>

namespace quizdb {

enum class CommandKind { kIngest, kList, kShow, kRemove, kClear };

struct CommandLine {
  CommandKind kind{CommandKind::kList};
  bool dry_run{false};
  bool verbose{false};
  bool clear_teams{false};
  int game_id{0};
  std::vector<std::string> files;
};

// args[0]은 명령 이름. 알 수 없는 명령, 옵션, 남는 인자는 모두 사용법 오류(std::nullopt)다.
std::optional<CommandLine> ParseCommandLine(const std::vector<std::string>& args);

}  // namespace quizdb
