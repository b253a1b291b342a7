#ifndef INCLUDE_BOXRUNNER_JOB_H_
#define INCLUDE_BOXRUNNER_JOB_H_

#include <tuple>
#include <string>
#include <vector>
#include <cstdint>

#include <nlohmann/json.hpp>

#define ENUM_OUTCOME_ \
  X(SUCCESS, "Success") \
  X(RUNTIME_ERROR, "RuntimeError") \
  X(TIME_LIMIT_EXCEEDED, "TimeLimitExceeded") \
  X(MEMORY_LIMIT_EXCEEDED, "MemoryLimitExceeded") \
  X(OTHER_ERROR, "OtherError") /* the isolation runtime failed to run the command */
enum class Outcome {
#define X(name, wire) name,
  ENUM_OUTCOME_
#undef X
};

// Units are whatever the submitter uses (seconds, KiB); they are only forwarded
struct Budget {
  uint64_t time_limit;
  uint64_t time_reserved; // scheduling hint
  uint64_t memory_limit;
  uint64_t memory_reserved;
  bool large_stack;
  uint64_t output_limit; // 0 = unlimited
  uint64_t process_limit; // 0 = unlimited

  Budget() :
      time_limit(0), time_reserved(0),
      memory_limit(0), memory_reserved(0),
      large_stack(false),
      output_limit(0), process_limit(0) {}
  bool operator==(const Budget& x) const {
    return std::make_tuple(time_limit, time_reserved, memory_limit, memory_reserved,
                           large_stack, output_limit, process_limit) ==
           std::make_tuple(x.time_limit, x.time_reserved, x.memory_limit, x.memory_reserved,
                           x.large_stack, x.output_limit, x.process_limit);
  }
  bool operator!=(const Budget& x) const { return !(*this == x); }
};

struct Command {
  std::string command;
  std::vector<std::string> args;
  std::string input; // stdin
  Budget budget;

  bool operator==(const Command& x) const {
    return command == x.command && args == x.args && input == x.input && budget == x.budget;
  }
  bool operator!=(const Command& x) const { return !(*this == x); }
};

class Job {
 public:
  // executed in order; later commands see the files left by earlier ones
  std::vector<Command> commands;
  // selects the baseline image of the isolation runtime
  std::string profile;
  // opaque, only echoed back in the result
  std::string submit_id;

  bool operator==(const Job& x) const {
    return commands == x.commands && profile == x.profile && submit_id == x.submit_id;
  }
  bool operator!=(const Job& x) const { return !(*this == x); }
};

struct CommandResult {
  Outcome outcome;
  std::string stdout_text, stderr_text;
  uint64_t time;
  uint64_t memory;

  CommandResult() : outcome(Outcome::OTHER_ERROR), time(0), memory(0) {}
  bool operator==(const CommandResult& x) const {
    return outcome == x.outcome && stdout_text == x.stdout_text &&
           stderr_text == x.stderr_text && time == x.time && memory == x.memory;
  }
};

class JobResult {
 public:
  // one per command, same order
  std::vector<CommandResult> results;
  std::string submit_id;
};

const char* OutcomeName(Outcome);
// return false if the name is not one of the five outcomes
bool NameToOutcome(const std::string&, Outcome&);

// Serialization; the From* functions throw nlohmann::json::exception on missing
//   fields or wrong types, and std::invalid_argument on values out of range
nlohmann::json CommandsToJSON(const std::vector<Command>&);
std::vector<Command> CommandsFromJSON(const nlohmann::json&);
nlohmann::json JobToJSON(const Job&);
Job JobFromJSON(const nlohmann::json&);
nlohmann::json ResultsToJSON(const std::vector<CommandResult>&);
std::vector<CommandResult> ResultsFromJSON(const nlohmann::json&);
nlohmann::json JobResultToJSON(const JobResult&);
JobResult JobResultFromJSON(const nlohmann::json&);

// Parse a message body; return false and log on failure
bool ParseJob(const std::string& body, Job&);
std::string SerializeJobResult(const JobResult&);

#endif  // INCLUDE_BOXRUNNER_JOB_H_
