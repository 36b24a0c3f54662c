#include "taskwarden/executor/worker_command.hpp"

#include <format>

namespace taskwarden {

auto build_worker_args(const WorkerRequest& request)
    -> std::vector<std::string> {
  std::vector<std::string> args{"exec", "--json"};

  if (!request.mode.empty()) {
    args.push_back(std::format("--sandbox={}", request.mode));
  }
  if (!request.model.empty()) {
    args.push_back(std::format("--model={}", request.model));
  }
  if (request.output_schema) {
    args.push_back(
        std::format("--output-schema={}", request.output_schema->dump()));
  }

  // inherit-none is the worker's own default and needs no flag.
  if (request.env_policy == EnvPolicy::InheritAll) {
    args.emplace_back("-c");
    args.emplace_back("shell_environment_policy.inherit=all");
  } else if (request.env_policy == EnvPolicy::AllowList &&
             !request.env_allow_list.empty()) {
    args.emplace_back("-c");
    args.push_back(std::format("shell_environment_policy.allow={}",
                               nlohmann::json(request.env_allow_list).dump()));
  }

  args.insert(args.end(), request.extra_args.begin(), request.extra_args.end());
  args.push_back(request.instruction);
  return args;
}

}  // namespace taskwarden
