#include <boxrunner/job.h>

#include <stdexcept>

#include <spdlog/spdlog.h>

namespace {

using nlohmann::json;

uint64_t GetUnsigned(const json& obj, const char* key) {
  const json& val = obj.at(key);
  if (val.is_number_unsigned()) return val.get<uint64_t>();
  if (val.is_number()) {
    throw std::invalid_argument(std::string(key) + " must be a non-negative integer");
  }
  // let json report the type mismatch
  return val.get<uint64_t>();
}

void CheckObject(const json& obj, const char* what) {
  if (!obj.is_object()) throw std::invalid_argument(std::string(what) + " must be an object");
}

void CheckArray(const json& arr, const char* what) {
  if (!arr.is_array()) throw std::invalid_argument(std::string(what) + " must be an array");
}

json BudgetToJSON(const Budget& budget) {
  return {
    {"time_limit", budget.time_limit},
    {"time_reserved", budget.time_reserved},
    {"memory_limit", budget.memory_limit},
    {"memory_reserved", budget.memory_reserved},
    {"large_stack", budget.large_stack},
    {"output_limit", budget.output_limit},
    {"process_limit", budget.process_limit},
  };
}

Budget BudgetFromJSON(const json& obj) {
  CheckObject(obj, "config");
  Budget budget;
  budget.time_limit = GetUnsigned(obj, "time_limit");
  budget.time_reserved = GetUnsigned(obj, "time_reserved");
  budget.memory_limit = GetUnsigned(obj, "memory_limit");
  budget.memory_reserved = GetUnsigned(obj, "memory_reserved");
  budget.large_stack = obj.at("large_stack").get<bool>();
  budget.output_limit = GetUnsigned(obj, "output_limit");
  budget.process_limit = GetUnsigned(obj, "process_limit");
  return budget;
}

json CommandToJSON(const Command& cmd) {
  return {
    {"command", cmd.command},
    {"args", cmd.args},
    {"input", cmd.input},
    {"config", BudgetToJSON(cmd.budget)},
  };
}

Command CommandFromJSON(const json& obj) {
  CheckObject(obj, "command");
  Command cmd;
  cmd.command = obj.at("command").get<std::string>();
  if (cmd.command.empty()) throw std::invalid_argument("command must not be empty");
  CheckArray(obj.at("args"), "args");
  cmd.args = obj.at("args").get<std::vector<std::string>>();
  cmd.input = obj.at("input").get<std::string>();
  cmd.budget = BudgetFromJSON(obj.at("config"));
  return cmd;
}

json ResultToJSON(const CommandResult& res) {
  return {
    {"state", OutcomeName(res.outcome)},
    {"stdout", res.stdout_text},
    {"stderr", res.stderr_text},
    {"time", res.time},
    {"memory", res.memory},
  };
}

CommandResult ResultFromJSON(const json& obj) {
  CheckObject(obj, "result");
  CommandResult res;
  std::string state = obj.at("state").get<std::string>();
  if (!NameToOutcome(state, res.outcome)) {
    throw std::invalid_argument("unknown state " + state);
  }
  res.stdout_text = obj.at("stdout").get<std::string>();
  res.stderr_text = obj.at("stderr").get<std::string>();
  res.time = GetUnsigned(obj, "time");
  res.memory = GetUnsigned(obj, "memory");
  return res;
}

const char* kOutcomeNameTable[] = {
#define X(name, wire) wire,
  ENUM_OUTCOME_
#undef X
};

} // namespace

const char* OutcomeName(Outcome outcome) {
  return kOutcomeNameTable[(int)outcome];
}

bool NameToOutcome(const std::string& str, Outcome& outcome) {
  for (size_t i = 0; i < sizeof(kOutcomeNameTable) / sizeof(kOutcomeNameTable[0]); i++) {
    if (str == kOutcomeNameTable[i]) {
      outcome = (Outcome)i;
      return true;
    }
  }
  return false;
}

nlohmann::json CommandsToJSON(const std::vector<Command>& commands) {
  json ret = json::array();
  for (auto& i : commands) ret.push_back(CommandToJSON(i));
  return ret;
}

std::vector<Command> CommandsFromJSON(const nlohmann::json& arr) {
  CheckArray(arr, "commands");
  std::vector<Command> ret;
  ret.reserve(arr.size());
  for (auto& i : arr) ret.push_back(CommandFromJSON(i));
  return ret;
}

nlohmann::json JobToJSON(const Job& job) {
  return {
    {"commands", CommandsToJSON(job.commands)},
    {"image", job.profile},
    {"submit_id", job.submit_id},
  };
}

Job JobFromJSON(const nlohmann::json& obj) {
  CheckObject(obj, "job");
  Job job;
  job.commands = CommandsFromJSON(obj.at("commands"));
  job.profile = obj.at("image").get<std::string>();
  if (job.profile.empty()) throw std::invalid_argument("image must not be empty");
  job.submit_id = obj.at("submit_id").get<std::string>();
  return job;
}

nlohmann::json ResultsToJSON(const std::vector<CommandResult>& results) {
  json ret = json::array();
  for (auto& i : results) ret.push_back(ResultToJSON(i));
  return ret;
}

std::vector<CommandResult> ResultsFromJSON(const nlohmann::json& arr) {
  CheckArray(arr, "results");
  std::vector<CommandResult> ret;
  ret.reserve(arr.size());
  for (auto& i : arr) ret.push_back(ResultFromJSON(i));
  return ret;
}

nlohmann::json JobResultToJSON(const JobResult& res) {
  return {
    {"sandbox_results", ResultsToJSON(res.results)},
    {"submit_id", res.submit_id},
  };
}

JobResult JobResultFromJSON(const nlohmann::json& obj) {
  CheckObject(obj, "job result");
  JobResult res;
  res.results = ResultsFromJSON(obj.at("sandbox_results"));
  res.submit_id = obj.at("submit_id").get<std::string>();
  return res;
}

bool ParseJob(const std::string& body, Job& job) {
  try {
    job = JobFromJSON(json::parse(body));
  } catch (json::exception& err) {
    spdlog::warn("Job decoding error: {}", err.what());
    return false;
  } catch (std::invalid_argument& err) {
    spdlog::warn("Invalid job: {}", err.what());
    return false;
  }
  return true;
}

std::string SerializeJobResult(const JobResult& res) {
  // captured output is arbitrary bytes; do not throw on invalid UTF-8
  return JobResultToJSON(res).dump(-1, ' ', false, json::error_handler_t::replace);
}
