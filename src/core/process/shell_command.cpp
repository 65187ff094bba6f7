#include "core/process/shell_command.hpp"

#include <cstdio>
#include <deque>
#include <utility>

#if !defined(_WIN32)
#include <sys/wait.h>
#endif

namespace binpost::core::process {

namespace {

class TailBuffer {
public:
  void Push(std::string line) {
    lines_.push_back(std::move(line));
    if (lines_.size() > kOutputTailLines) {
      lines_.pop_front();
    }
  }

  std::vector<std::string> Take() {
    return std::vector<std::string>(lines_.begin(), lines_.end());
  }

private:
  std::deque<std::string> lines_;
};

int DecodeWaitStatus(int raw_status) {
  if (raw_status == -1) {
    return -1;
  }
#if defined(_WIN32)
  return raw_status;
#else
  if (WIFEXITED(raw_status)) {
    return WEXITSTATUS(raw_status);
  }
  if (WIFSIGNALED(raw_status)) {
    return 128 + WTERMSIG(raw_status);
  }
  return raw_status;
#endif
}

} // namespace

bool RunShellCommand(const std::string& command, const LineCallback& on_line,
                     CommandResult& result, std::string& error) {
  result = CommandResult{};
  error.clear();

  if (command.empty()) {
    error = "command cannot be empty";
    return false;
  }

  const std::string wrapped = command + " 2>&1";
#if defined(_WIN32)
  FILE* pipe = _popen(wrapped.c_str(), "r");
#else
  FILE* pipe = popen(wrapped.c_str(), "r");
#endif
  if (pipe == nullptr) {
    error = "failed to execute command: " + command;
    return false;
  }

  TailBuffer tail;
  std::string pending;
  auto flush_line = [&]() {
    if (pending.empty()) {
      return;
    }
    if (on_line) {
      on_line(pending);
    }
    tail.Push(std::move(pending));
    pending.clear();
  };

  char buffer[4096];
  std::size_t read_count = 0;
  while ((read_count = std::fread(buffer, 1, sizeof(buffer), pipe)) > 0U) {
    for (std::size_t i = 0; i < read_count; ++i) {
      const char c = buffer[i];
      if (c == '\n' || c == '\r') {
        flush_line();
      } else {
        pending.push_back(c);
      }
    }
  }
  flush_line();

#if defined(_WIN32)
  const int raw_status = _pclose(pipe);
#else
  const int raw_status = pclose(pipe);
#endif
  result.exit_code = DecodeWaitStatus(raw_status);
  result.output_tail = tail.Take();
  return true;
}

std::string ShellQuote(std::string_view argument) {
  std::string quoted = "'";
  for (const char c : argument) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted.push_back(c);
    }
  }
  quoted += "'";
  return quoted;
}

std::string JoinShellCommand(const std::vector<std::string>& argv) {
  std::string command;
  for (const auto& arg : argv) {
    if (!command.empty()) {
      command.push_back(' ');
    }
    command += ShellQuote(arg);
  }
  return command;
}

bool IsCommandAvailable(const std::string& command_name) {
  if (command_name.empty()) {
    return false;
  }

  CommandResult result;
  std::string error;
#if defined(_WIN32)
  const std::string command = "where " + command_name;
#else
  const std::string command = "command -v " + ShellQuote(command_name) + " >/dev/null";
#endif
  if (!RunShellCommand(command, nullptr, result, error)) {
    return false;
  }
  return result.exit_code == 0;
}

std::string SummarizeOutputTail(const std::vector<std::string>& tail, std::size_t max_lines) {
  if (tail.empty() || max_lines == 0U) {
    return "";
  }

  const std::size_t first = tail.size() > max_lines ? tail.size() - max_lines : 0U;
  std::string summary;
  for (std::size_t i = first; i < tail.size(); ++i) {
    if (!summary.empty()) {
      summary += " | ";
    }
    summary += tail[i];
  }
  return summary;
}

} // namespace binpost::core::process
