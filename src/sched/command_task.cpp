#include "sched/command_task.hpp"

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cmath>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

extern char** environ;

namespace joule_gate::sched {

namespace {

std::string last_non_empty_line(const std::string& output) {
  std::size_t end = output.size();
  while (end > 0) {
    while (end > 0 && (output[end - 1] == '\n' || output[end - 1] == '\r' || output[end - 1] == ' ')) {
      --end;
    }
    if (end == 0) {
      break;
    }
    const auto start = output.rfind('\n', end - 1);
    const std::size_t begin = start == std::string::npos ? 0 : start + 1;
    return output.substr(begin, end - begin);
  }
  return {};
}

double number_or(const nlohmann::json& object, const char* key, const double fallback) {
  const auto it = object.find(key);
  if (it == object.end() || !it->is_number()) {
    return fallback;
  }
  return it->get<double>();
}

}  // namespace

ParsedTaskOutput parse_task_output(const std::string& output) {
  const std::string line = last_non_empty_line(output);
  if (line.empty()) {
    throw TaskError("payload produced no result line");
  }

  nlohmann::json parsed;
  try {
    parsed = nlohmann::json::parse(line);
  } catch (const nlohmann::json::parse_error& ex) {
    throw TaskError(std::string("payload result is not JSON: ") + ex.what());
  }
  if (!parsed.is_object()) {
    throw TaskError("payload result must be a JSON object");
  }

  ParsedTaskOutput out{};
  out.result.ok = parsed.value("ok", false);
  out.result.delta = number_or(parsed, "delta", 0.0);
  out.result.loss = number_or(parsed, "loss", 0.0);
  out.result.content_hash = parsed.value("hash", std::string{});
  out.result.metadata = parsed.value("meta", nlohmann::json::object());

  const auto candidate_it = parsed.find("candidate");
  if (candidate_it != parsed.end() && candidate_it->is_object()) {
    merge::MergeCandidate candidate{};
    candidate.location = candidate_it->value("path", std::string{});
    candidate.identity = candidate_it->value("identity", candidate.location.string());
    candidate.delta = number_or(*candidate_it, "delta", out.result.delta);
    const auto secondary_it = candidate_it->find("secondary_gain");
    if (secondary_it != candidate_it->end() && secondary_it->is_number()) {
      candidate.secondary_gain = secondary_it->get<double>();
    }
    if (candidate.identity.empty()) {
      throw TaskError("candidate needs a path or an identity");
    }
    out.candidate = std::move(candidate);
  }

  return out;
}

CommandTask::CommandTask(CommandTaskOptions options, merge::MergeGate* gate)
    : options_(std::move(options)), gate_(gate) {}

model::task_result CommandTask::run() {
  ParsedTaskOutput parsed = parse_task_output(execute_command());
  if (gate_ == nullptr || !parsed.candidate.has_value()) {
    return std::move(parsed.result);
  }

  const model::merge_decision decision = gate_->evaluate(*parsed.candidate);
  model::task_result result = std::move(parsed.result);
  result.ok = decision.accepted;
  result.delta = decision.delta;
  result.content_hash = decision.decision_hash;
  if (!result.metadata.is_object()) {
    result.metadata = nlohmann::json::object();
  }
  result.metadata["merge"] = model::to_json(decision);
  result.metadata["candidate"] = parsed.candidate->identity;
  return result;
}

std::string CommandTask::execute_command() const {
  std::vector<std::string> env_storage;
  for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
    const std::string value = *entry;
    if (value.rfind("JOULE_TASK_NAME=", 0) == 0 || value.rfind("JOULE_CANDIDATES_DIR=", 0) == 0) {
      continue;
    }
    env_storage.push_back(value);
  }
  env_storage.push_back("JOULE_TASK_NAME=" + options_.name);
  env_storage.push_back("JOULE_CANDIDATES_DIR=" + options_.candidates_dir);

  std::vector<char*> envp;
  envp.reserve(env_storage.size() + 1);
  for (auto& value : env_storage) {
    envp.push_back(value.data());
  }
  envp.push_back(nullptr);

  std::string shell = "/bin/sh";
  std::string flag = "-c";
  std::string command = options_.command;
  char* argv[] = {shell.data(), flag.data(), command.data(), nullptr};

  int pipe_fds[2]{};
  if (::pipe2(pipe_fds, O_CLOEXEC) != 0) {
    throw TaskError(std::string("pipe failed: ") + std::strerror(errno));
  }

  const pid_t pid = ::fork();
  if (pid < 0) {
    const int fork_errno = errno;
    ::close(pipe_fds[0]);
    ::close(pipe_fds[1]);
    throw TaskError(std::string("fork failed: ") + std::strerror(fork_errno));
  }

  if (pid == 0) {
    ::dup2(pipe_fds[1], STDOUT_FILENO);
    ::execve(shell.c_str(), argv, envp.data());
    _exit(127);
  }

  ::close(pipe_fds[1]);

  std::string output;
  char chunk[4096]{};
  while (true) {
    const ssize_t bytes_read = ::read(pipe_fds[0], chunk, sizeof(chunk));
    if (bytes_read > 0) {
      output.append(chunk, static_cast<std::size_t>(bytes_read));
      continue;
    }
    if (bytes_read < 0 && errno == EINTR) {
      continue;
    }
    break;
  }
  ::close(pipe_fds[0]);

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw TaskError(std::string("waitpid failed: ") + std::strerror(errno));
    }
  }

  if (WIFSIGNALED(status)) {
    throw TaskError(options_.name + " terminated by signal " + std::to_string(WTERMSIG(status)));
  }
  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    throw TaskError(options_.name + " exited with status " + std::to_string(WEXITSTATUS(status)));
  }

  return output;
}

}  // namespace joule_gate::sched
