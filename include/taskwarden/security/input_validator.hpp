#pragma once

#include <nlohmann/json.hpp>

#include <array>
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace taskwarden {

inline constexpr std::size_t kMaxInstructionChars = 10000;

inline constexpr std::array<std::string_view, 3> kSandboxModes = {
    "read-only",
    "workspace-write",
    "danger-full-access",
};

struct ValidationError {
  std::string field;
  std::string message;
};

using Validation = std::expected<void, ValidationError>;

class InputValidator {
public:
  [[nodiscard]] static auto validate_instruction(std::string_view instruction)
      -> Validation;
  // Empty means the worker default.
  [[nodiscard]] static auto validate_mode(std::string_view mode) -> Validation;
  [[nodiscard]] static auto validate_model(std::string_view model)
      -> Validation;
  // Empty means the orchestrator's current directory.
  [[nodiscard]] static auto validate_working_dir(std::string_view dir)
      -> Validation;
  [[nodiscard]] static auto validate_output_schema(
      const std::optional<nlohmann::json>& schema) -> Validation;

  // First failure across every field, in declaration order.
  [[nodiscard]] static auto validate_all(
      std::string_view instruction, std::string_view mode,
      std::string_view model, std::string_view working_dir,
      const std::optional<nlohmann::json>& schema) -> Validation;
};

}  // namespace taskwarden
