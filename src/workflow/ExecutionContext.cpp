// SPDX-License-Identifier: Apache-2.0
#include "ExecutionContext.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <optional>
#include <utility>
#include <vector>

namespace mcpvisor
{

namespace
{

    auto splitPath(std::string_view reference) -> std::vector<std::string>
    {
        auto segments = std::vector<std::string> {};
        auto start = size_t { 0 };
        while (true)
        {
            auto const dot = reference.find('.', start);
            segments.emplace_back(reference.substr(start, dot - start));
            if (dot == std::string_view::npos)
                break;
            start = dot + 1;
        }
        return segments;
    }

    auto isIndex(std::string_view segment) -> bool
    {
        return !segment.empty()
               && std::ranges::all_of(segment, [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
    }

    /// Parses an array index segment. Returns nullopt for anything that is not a size_t.
    auto parseIndex(std::string_view segment) -> std::optional<size_t>
    {
        if (!isIndex(segment))
            return std::nullopt;
        auto index = size_t { 0 };
        auto const [end, ec] = std::from_chars(segment.data(), segment.data() + segment.size(), index);
        if (ec != std::errc {} || end != segment.data() + segment.size())
            return std::nullopt;
        return index;
    }

    auto unresolved(std::string_view reference) -> std::unexpected<Error>
    {
        return makeError(ErrorCode::WorkflowError, std::format("Unresolved reference '${{{}}}'", reference));
    }

} // namespace

ExecutionContext::ExecutionContext(nlohmann::json inputs):
    _variables(inputs.is_object() ? std::move(inputs) : nlohmann::json::object())
{
}

void ExecutionContext::setVariable(const std::string& name, nlohmann::json value)
{
    _variables[name] = std::move(value);
}

void ExecutionContext::setStepResult(const std::string& stepId, nlohmann::json result)
{
    _stepResults[stepId] = std::move(result);
}

auto ExecutionContext::hasStepResult(std::string_view stepId) const -> bool
{
    return _stepResults.contains(std::string(stepId));
}

auto ExecutionContext::lookup(std::string_view reference) const -> Result<nlohmann::json>
{
    auto const segments = splitPath(reference);
    if (std::ranges::any_of(segments, [](const std::string& s) { return s.empty(); }))
        return unresolved(reference);

    auto first = segments.begin();
    const nlohmann::json* node = &_variables;
    if (*first == "steps")
    {
        if (segments.size() < 2)
            return unresolved(reference);
        node = &_stepResults;
        ++first;
    }

    for (auto it = first; it != segments.end(); ++it)
    {
        if (node->is_object() && node->contains(*it))
        {
            node = &(*node)[*it];
            continue;
        }

        auto const index = node->is_array() ? parseIndex(*it) : std::nullopt;
        if (!index || *index >= node->size())
            return unresolved(reference);
        node = &(*node)[*index];
    }

    return *node;
}

auto ExecutionContext::resolve(const nlohmann::json& value) const -> Result<nlohmann::json>
{
    if (value.is_string())
        return resolveString(value.get<std::string>());

    if (value.is_object())
    {
        auto out = nlohmann::json::object();
        for (const auto& [key, item]: value.items())
        {
            auto resolved = resolve(item);
            if (!resolved)
                return std::unexpected(resolved.error());
            out[key] = std::move(*resolved);
        }
        return out;
    }

    if (value.is_array())
    {
        auto out = nlohmann::json::array();
        for (const auto& item: value)
        {
            auto resolved = resolve(item);
            if (!resolved)
                return std::unexpected(resolved.error());
            out.push_back(std::move(*resolved));
        }
        return out;
    }

    return value;
}

auto ExecutionContext::resolveString(const std::string& text) const -> Result<nlohmann::json>
{
    if (text.find("${") == std::string::npos)
        return text;

    // Exactly one reference: keep the referenced value's type.
    if (text.starts_with("${") && text.find('}') == text.size() - 1)
        return lookup(std::string_view(text).substr(2, text.size() - 3));

    auto out = std::string {};
    auto pos = size_t { 0 };
    while (pos < text.size())
    {
        auto const open = text.find("${", pos);
        if (open == std::string::npos)
            break;
        auto const close = text.find('}', open + 2);
        if (close == std::string::npos)
            break;

        out.append(text, pos, open - pos);

        auto value = lookup(std::string_view(text).substr(open + 2, close - open - 2));
        if (!value)
            return std::unexpected(value.error());
        out += value->is_string() ? value->get<std::string>() : value->dump();

        pos = close + 1;
    }
    out.append(text, pos);
    return out;
}

} // namespace mcpvisor
