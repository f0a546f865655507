// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace mcpvisor
{

/// @brief Working state of one workflow execution: step results and variables.
///
/// Argument values are resolved against it before a step runs:
///  - "${name}" is replaced by the variable @c name (variables are seeded from the inputs),
///  - "${steps.<id>}" by the result of step @c id,
///  - "${steps.<id>.a.b}" by a nested field of that result (numeric segments index arrays).
/// A string consisting of exactly one reference takes the referenced value with its JSON
/// type; references embedded in longer strings are substituted textually.
class ExecutionContext
{
  public:
    explicit ExecutionContext(nlohmann::json inputs = nlohmann::json::object());

    void setVariable(const std::string& name, nlohmann::json value);
    void setStepResult(const std::string& stepId, nlohmann::json result);

    [[nodiscard]] auto hasStepResult(std::string_view stepId) const -> bool;
    [[nodiscard]] auto variables() const -> const nlohmann::json& { return _variables; }
    [[nodiscard]] auto stepResults() const -> const nlohmann::json& { return _stepResults; }

    /// @brief Looks up a reference such as "query" or "steps.fetch.content".
    /// @return The referenced value or a WorkflowError naming the reference.
    [[nodiscard]] auto lookup(std::string_view reference) const -> Result<nlohmann::json>;

    /// @brief Returns a copy of @p value with every ${...} reference replaced.
    [[nodiscard]] auto resolve(const nlohmann::json& value) const -> Result<nlohmann::json>;

  private:
    nlohmann::json _variables;
    nlohmann::json _stepResults = nlohmann::json::object();

    [[nodiscard]] auto resolveString(const std::string& text) const -> Result<nlohmann::json>;
};

} // namespace mcpvisor
