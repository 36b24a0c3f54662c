#pragma once

#include <nlohmann/json.hpp>

#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace taskwarden {

struct RedactionPattern {
  std::string name;
  std::regex pattern;
  std::string replacement;
};

// Masks credentials in worker output before it is persisted or printed.
// Patterns are applied in order; replacements may use $1-style groups.
class Redactor {
public:
  Redactor();
  explicit Redactor(std::vector<RedactionPattern> extra);

  [[nodiscard]] auto redact(std::string_view text) const -> std::string;
  // Redacts every string value, recursing into arrays and objects. Keys are
  // left as they are.
  [[nodiscard]] auto redact(const nlohmann::json& value) const
      -> nlohmann::json;

  [[nodiscard]] auto contains_secrets(std::string_view text) const -> bool;
  [[nodiscard]] auto matches(std::string_view text) const
      -> std::vector<std::string>;

  [[nodiscard]] auto patterns() const noexcept
      -> const std::vector<RedactionPattern>& {
    return patterns_;
  }

  static auto default_patterns() -> std::vector<RedactionPattern>;

private:
  std::vector<RedactionPattern> patterns_;
};

}  // namespace taskwarden
