// SPDX-License-Identifier: Apache-2.0
#include "Workflow.hpp"

namespace mcpvisor
{

auto failurePolicyFromString(std::string_view name) -> std::optional<FailurePolicy>
{
    if (name == "stop")
        return FailurePolicy::Stop;
    if (name == "continue")
        return FailurePolicy::Continue;
    if (name == "retry")
        return FailurePolicy::Retry;
    return std::nullopt;
}

} // namespace mcpvisor
