#pragma once

#include "taskwarden/executor/process.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace taskwarden {

struct WorkerRequest {
  std::string instruction;
  std::string mode;
  std::string model;
  std::optional<nlohmann::json> output_schema;
  EnvPolicy env_policy{EnvPolicy::InheritNone};
  std::vector<std::string> env_allow_list;
  std::vector<std::string> extra_args;
};

// Argument vector for a non-interactive worker run:
//   exec --json [--sandbox=M] [--model=M] [--output-schema=J]
//        [-c shell_environment_policy...] [extra...] <instruction>
// The instruction is always a single trailing argument.
[[nodiscard]] auto build_worker_args(const WorkerRequest& request)
    -> std::vector<std::string>;

}  // namespace taskwarden
