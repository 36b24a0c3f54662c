#include "taskwarden/security/input_validator.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <utility>

namespace taskwarden {

namespace {

auto invalid(std::string_view field, std::string message) -> Validation {
  return std::unexpected(ValidationError{std::string{field}, std::move(message)});
}

auto is_blank(std::string_view s) -> bool {
  return std::ranges::all_of(
      s, [](unsigned char c) { return std::isspace(c) != 0; });
}

}  // namespace

auto InputValidator::validate_instruction(std::string_view instruction)
    -> Validation {
  if (instruction.empty() || is_blank(instruction)) {
    return invalid("instruction", "Instruction cannot be empty");
  }
  if (instruction.size() > kMaxInstructionChars) {
    return invalid("instruction",
                   std::format("Instruction too long ({} characters, max {})",
                               instruction.size(), kMaxInstructionChars));
  }
  return {};
}

auto InputValidator::validate_mode(std::string_view mode) -> Validation {
  if (mode.empty() || std::ranges::find(kSandboxModes, mode) !=
                          kSandboxModes.end()) {
    return {};
  }
  return invalid("mode",
                 std::format("Invalid mode: {}. Must be one of: {}, {}, {}",
                             mode, kSandboxModes[0], kSandboxModes[1],
                             kSandboxModes[2]));
}

auto InputValidator::validate_model(std::string_view model) -> Validation {
  if (model.empty()) {
    return {};
  }
  if (model.size() > 128) {
    return invalid("model", "Model name too long");
  }
  auto allowed = [](unsigned char c) {
    return std::isalnum(c) != 0 || c == '-' || c == '_' || c == '.' ||
           c == ':' || c == '/';
  };
  if (!std::ranges::all_of(model, allowed)) {
    return invalid("model", std::format("Invalid model name: {}", model));
  }
  return {};
}

auto InputValidator::validate_working_dir(std::string_view dir)
    -> Validation {
  if (dir.empty()) {
    return {};
  }
  if (dir.find("..") != std::string_view::npos) {
    return invalid("working_dir",
                   "Path traversal not allowed in working directory");
  }
  if (!dir.starts_with('/')) {
    return invalid("working_dir", "Working directory must be an absolute path");
  }
  if (dir.find('\0') != std::string_view::npos) {
    return invalid("working_dir", "Working directory contains a NUL byte");
  }
  return {};
}

auto InputValidator::validate_output_schema(
    const std::optional<nlohmann::json>& schema) -> Validation {
  if (!schema || schema->is_null()) {
    return {};
  }
  if (!schema->is_object()) {
    return invalid("output_schema", "Output schema must be a JSON object");
  }
  if (auto it = schema->find("type"); it != schema->end() && !it->is_string()) {
    return invalid("output_schema", "Output schema type must be a string");
  }
  return {};
}

auto InputValidator::validate_all(std::string_view instruction,
                                  std::string_view mode,
                                  std::string_view model,
                                  std::string_view working_dir,
                                  const std::optional<nlohmann::json>& schema)
    -> Validation {
  if (auto r = validate_instruction(instruction); !r) {
    return r;
  }
  if (auto r = validate_mode(mode); !r) {
    return r;
  }
  if (auto r = validate_model(model); !r) {
    return r;
  }
  if (auto r = validate_working_dir(working_dir); !r) {
    return r;
  }
  return validate_output_schema(schema);
}

}  // namespace taskwarden
